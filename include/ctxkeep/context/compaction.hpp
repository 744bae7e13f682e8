/*
 * ctxkeep C++ - Compaction Engine
 *
 * Brings one consumer's store back under its target once usage crosses the
 * threshold:
 *   1. rank items (priority desc, newest first)
 *   2. KEEP = priority >= high, CANDIDATE = the rest
 *   3. archive CANDIDATE verbatim through the ArchivalSink
 *   4. summarize CANDIDATE into the room left next to KEEP
 *   5. replace CANDIDATE with one medium-priority summary item
 *
 * When KEEP alone leaves no room, the summary gets the configured reserve
 * instead and the store is flagged over budget.
 */
#ifndef ctxkeep_CONTEXT_COMPACTION_HPP
#define ctxkeep_CONTEXT_COMPACTION_HPP

#include <ctxkeep/archive/sink.hpp>
#include <ctxkeep/context/clock.hpp>
#include <ctxkeep/context/context_store.hpp>
#include <ctxkeep/context/summarizer.hpp>
#include <string>
#include <vector>

namespace ctxkeep {

enum class CompactionStatus {
    COMPACTED,              // usage is at or below the target
    COMPACTED_OVER_BUDGET,  // summarized, but KEEP alone exceeds the target
    NOT_NEEDED,             // usage below threshold
    NO_CANDIDATES,          // everything is high/critical; caller must act
    ALREADY_COMPACT         // the only candidate is an earlier summary that still fits
};

const char* compaction_status_to_string(CompactionStatus status);

struct CompactionReport {
    CompactionStatus status;
    size_t tokens_before;
    size_t tokens_after;
    size_t kept_tokens;
    size_t summary_budget;      // tokens granted to the summary
    size_t candidate_count;
    SummaryOutcome outcome;
    bool archive_failed;
    std::string archive_error;
    ContextItem summary_item;
    std::vector<ContextItem> superseded;    // candidates, flagged and referenced

    CompactionReport()
        : status(CompactionStatus::NOT_NEEDED)
        , tokens_before(0)
        , tokens_after(0)
        , kept_tokens(0)
        , summary_budget(0)
        , candidate_count(0)
        , archive_failed(false) {}

    bool performed() const {
        return status == CompactionStatus::COMPACTED ||
               status == CompactionStatus::COMPACTED_OVER_BUDGET;
    }
};

class CompactionEngine {
public:
    // `sink` may be null; compaction then proceeds without an archive entry
    // and records the failure on the store.
    CompactionEngine(const ExtractiveSummarizer& summarizer,
                     ArchivalSink* sink,
                     Clock& clock,
                     IdSource& ids);

    // Caller must hold the consumer's exclusive lock.
    CompactionReport compact(ContextStore& store) const;

    // Split ranked items into KEEP (priority >= high) and CANDIDATE
    static void partition(const std::vector<ContextItem>& ranked,
                          std::vector<ContextItem>& keep,
                          std::vector<ContextItem>& candidates);

    // Room for the summary next to `kept_tokens`
    static size_t summary_budget(const ContextConfig& config, size_t kept_tokens);

    ArchivalSink* sink() const { return sink_; }

private:
    const ExtractiveSummarizer& summarizer_;
    ArchivalSink* sink_;
    Clock& clock_;
    IdSource& ids_;
};

} // namespace ctxkeep

#endif // ctxkeep_CONTEXT_COMPACTION_HPP
