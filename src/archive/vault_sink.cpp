/*
 * ctxkeep C++ - Markdown Vault Sink Implementation
 */
#include <ctxkeep/archive/vault_sink.hpp>
#include <ctxkeep/core/logger.hpp>
#include <ctxkeep/core/utils.hpp>

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <sstream>

namespace ctxkeep {

namespace {

const int MAX_NAME_ATTEMPTS = 100;

} // anonymous namespace

VaultSink::VaultSink(const std::string& directory) : directory_(directory) {}

std::string VaultSink::sanitize(const std::string& consumer_id) {
    std::string out;
    out.reserve(consumer_id.size());
    for (size_t i = 0; i < consumer_id.size(); ++i) {
        char c = consumer_id[i];
        if ((c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') ||
            c == '_' || c == '-') {
            out += c;
        } else {
            out += '_';
        }
    }
    return out.empty() ? "consumer" : out;
}

std::string VaultSink::render_note(const std::string& consumer_id,
                                   const std::vector<ContextItem>& items,
                                   ArchiveReason reason,
                                   int64_t archived_at) {
    size_t total_tokens = 0;
    for (size_t i = 0; i < items.size(); ++i) {
        total_tokens += items[i].token_count;
    }

    std::ostringstream md;
    md << "---\n";
    md << "type: context_archive\n";
    md << "consumer: " << consumer_id << "\n";
    md << "reason: " << archive_reason_to_string(reason) << "\n";
    md << "timestamp: " << format_timestamp_ms(archived_at) << "\n";
    md << "items_count: " << items.size() << "\n";
    md << "total_tokens: " << total_tokens << "\n";
    md << "tags:\n";
    md << "  - context\n";
    md << "  - archive\n";
    md << "  - " << sanitize(consumer_id) << "\n";
    md << "---\n\n";

    md << "# Context Archive: " << consumer_id << "\n\n";
    md << "Archived: " << format_timestamp_ms(archived_at) << "\n\n";
    md << "## Full Context Items\n\n";

    for (size_t i = 0; i < items.size(); ++i) {
        const ContextItem& item = items[i];
        std::string kind = item_kind_to_string(item.kind);
        for (size_t k = 0; k < kind.size(); ++k) {
            if (kind[k] >= 'a' && kind[k] <= 'z') kind[k] = static_cast<char>(kind[k] - 'a' + 'A');
        }

        md << "### " << kind << " (" << format_timestamp_ms(item.created_at) << ")\n";
        md << "Id: " << item.id
           << " | Priority: " << priority_to_string(item.priority)
           << " | Tokens: " << item.token_count << "\n";
        for (ItemMetadata::Entries::const_iterator it = item.metadata.entries().begin();
             it != item.metadata.entries().end(); ++it) {
            md << "- " << meta_key_to_string(it->first) << ": " << it->second << "\n";
        }
        md << "\n" << item.content << "\n\n---\n\n";
    }

    return md.str();
}

ArchiveResult VaultSink::write(const std::string& consumer_id,
                               const std::vector<ContextItem>& items,
                               ArchiveReason reason) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (!create_directories(directory_)) {
        return ArchiveResult::fail("cannot create vault directory '" + directory_ + "'");
    }

    int64_t now = current_timestamp_ms();
    std::string base = "context_" + sanitize(consumer_id) + "_" + format_file_stamp(now);
    std::string note = render_note(consumer_id, items, reason, now);

    for (int attempt = 0; attempt < MAX_NAME_ATTEMPTS; ++attempt) {
        std::string filename = attempt == 0
            ? base + ".md"
            : base + "_" + std::to_string(attempt) + ".md";
        std::string path = join_path(directory_, filename);

        // "x": fail instead of truncating an existing note
        FILE* fp = fopen(path.c_str(), "wx");
        if (!fp) {
            if (errno == EEXIST) continue;
            std::string error = "cannot create '" + path + "': " + strerror(errno);
            LOG_ERROR("[VaultSink] %s", error.c_str());
            return ArchiveResult::fail(error);
        }

        size_t written = fwrite(note.data(), 1, note.size(), fp);
        int closed = fclose(fp);
        if (written != note.size() || closed != 0) {
            std::string error = "short write to '" + path + "'";
            // A truncated note must not pass for an archive entry
            if (remove(path.c_str()) != 0) {
                error += "; partial file left behind: " + std::string(strerror(errno));
            }
            LOG_ERROR("[VaultSink] %s", error.c_str());
            return ArchiveResult::fail(error);
        }

        LOG_DEBUG("[VaultSink] Archived %zu items for %s to %s",
                  items.size(), consumer_id.c_str(), path.c_str());
        return ArchiveResult::ok(path);
    }

    return ArchiveResult::fail("no free file name for '" + base + "' in " + directory_);
}

} // namespace ctxkeep
