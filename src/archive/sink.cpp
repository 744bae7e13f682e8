#include <ctxkeep/archive/sink.hpp>

namespace ctxkeep {

const char* archive_reason_to_string(ArchiveReason reason) {
    switch (reason) {
        case ArchiveReason::COMPACTION: return "compaction";
        case ArchiveReason::CLEAR: return "clear";
    }
    return "unknown";
}

} // namespace ctxkeep
