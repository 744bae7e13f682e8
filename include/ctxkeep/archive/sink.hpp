/*
 * ctxkeep C++ - Archival Sink
 *
 * Append-only destination for context items before they leave the active
 * store (compaction or clear). The core never reads archives back; it only
 * keeps the returned reference for traceability.
 */
#ifndef ctxkeep_ARCHIVE_SINK_HPP
#define ctxkeep_ARCHIVE_SINK_HPP

#include <ctxkeep/context/types.hpp>
#include <string>
#include <vector>

namespace ctxkeep {

enum class ArchiveReason {
    COMPACTION,     // low-priority items replaced by a summary
    CLEAR           // consumer context explicitly cleared
};

const char* archive_reason_to_string(ArchiveReason reason);

struct ArchiveResult {
    bool success;
    std::string reference;      // sink-specific handle of the written entry
    std::string error;

    ArchiveResult() : success(false) {}

    static ArchiveResult ok(const std::string& reference) {
        ArchiveResult r;
        r.success = true;
        r.reference = reference;
        return r;
    }

    static ArchiveResult fail(const std::string& error) {
        ArchiveResult r;
        r.error = error;
        return r;
    }
};

class ArchivalSink {
public:
    virtual ~ArchivalSink() {}

    virtual const char* name() const = 0;

    // Write the items verbatim as one immutable entry. Must not throw.
    virtual ArchiveResult write(const std::string& consumer_id,
                                const std::vector<ContextItem>& items,
                                ArchiveReason reason) = 0;
};

} // namespace ctxkeep

#endif // ctxkeep_ARCHIVE_SINK_HPP
