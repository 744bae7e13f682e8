/*
 * ctxkeep C++ - Markdown Vault Sink
 *
 * Writes each archive entry as a standalone markdown note
 * (context_<consumer>_<stamp>.md) with YAML front matter, suitable for a
 * knowledge-base vault. Files are created exclusively and never rewritten.
 */
#ifndef ctxkeep_ARCHIVE_VAULT_SINK_HPP
#define ctxkeep_ARCHIVE_VAULT_SINK_HPP

#include <ctxkeep/archive/sink.hpp>
#include <mutex>
#include <string>
#include <vector>

namespace ctxkeep {

class VaultSink : public ArchivalSink {
public:
    explicit VaultSink(const std::string& directory);

    const char* name() const override { return "vault"; }

    // Reference is the path of the written file
    ArchiveResult write(const std::string& consumer_id,
                        const std::vector<ContextItem>& items,
                        ArchiveReason reason) override;

    const std::string& directory() const { return directory_; }

    // Note body for one entry (exposed for tests)
    static std::string render_note(const std::string& consumer_id,
                                   const std::vector<ContextItem>& items,
                                   ArchiveReason reason,
                                   int64_t archived_at);

    // Consumer id reduced to [A-Za-z0-9_-] for use in file names
    static std::string sanitize(const std::string& consumer_id);

private:
    std::string directory_;
    std::mutex mutex_;
};

} // namespace ctxkeep

#endif // ctxkeep_ARCHIVE_VAULT_SINK_HPP
