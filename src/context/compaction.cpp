/*
 * ctxkeep C++ - Compaction Engine Implementation
 *
 * Instead of dropping old messages, low-priority material is archived
 * verbatim and replaced by an extractive digest that fits the remaining
 * budget.
 */
#include <ctxkeep/context/compaction.hpp>
#include <ctxkeep/core/logger.hpp>

#include <algorithm>

namespace ctxkeep {

const char* compaction_status_to_string(CompactionStatus status) {
    switch (status) {
        case CompactionStatus::COMPACTED: return "compacted";
        case CompactionStatus::COMPACTED_OVER_BUDGET: return "compacted_over_budget";
        case CompactionStatus::NOT_NEEDED: return "not_needed";
        case CompactionStatus::NO_CANDIDATES: return "no_candidates";
        case CompactionStatus::ALREADY_COMPACT: return "already_compact";
    }
    return "unknown";
}

CompactionEngine::CompactionEngine(const ExtractiveSummarizer& summarizer,
                                   ArchivalSink* sink,
                                   Clock& clock,
                                   IdSource& ids)
    : summarizer_(summarizer)
    , sink_(sink)
    , clock_(clock)
    , ids_(ids)
{}

void CompactionEngine::partition(const std::vector<ContextItem>& ranked,
                                 std::vector<ContextItem>& keep,
                                 std::vector<ContextItem>& candidates) {
    for (size_t i = 0; i < ranked.size(); ++i) {
        if (static_cast<int>(ranked[i].priority) >= static_cast<int>(Priority::HIGH)) {
            keep.push_back(ranked[i]);
        } else {
            candidates.push_back(ranked[i]);
        }
    }
}

size_t CompactionEngine::summary_budget(const ContextConfig& config, size_t kept_tokens) {
    size_t target = config.target_tokens();
    if (target > kept_tokens) {
        return target - kept_tokens;
    }
    // KEEP already fills the target; fall back to the reserve so the digest
    // still has room.
    return config.reserve_tokens();
}

CompactionReport CompactionEngine::compact(ContextStore& store) const {
    CompactionReport report;
    report.tokens_before = store.total_tokens();
    report.tokens_after = report.tokens_before;

    const std::string& consumer = store.consumer_id();
    const ContextConfig& config = store.config();
    size_t target = config.target_tokens();

    if (!store.needs_compaction()) {
        LOG_DEBUG("[Compaction] %s at %.1f%%, below threshold",
                  consumer.c_str(), store.usage_ratio() * 100.0);
        return report;
    }

    std::vector<ContextItem> keep;
    std::vector<ContextItem> candidates;
    partition(store.ordered_items(), keep, candidates);

    report.kept_tokens = TokenEstimator::total(keep);
    report.candidate_count = candidates.size();

    if (candidates.empty()) {
        store.set_over_budget(report.tokens_before > target);
        report.status = CompactionStatus::NO_CANDIDATES;
        LOG_WARN("[Compaction] %s needs compaction but all %zu items are high/critical "
                 "(%zu/%lld tokens); raise the limit or reclassify items",
                 consumer.c_str(), keep.size(), report.tokens_before,
                 static_cast<long long>(config.limit_tokens));
        return report;
    }

    report.summary_budget = summary_budget(config, report.kept_tokens);

    // A lone earlier summary is left alone while it fits next to KEEP. Once
    // new high-priority items shrink that room it is re-summarized below.
    if (candidates.size() == 1 && candidates[0].summarized &&
        candidates[0].token_count <= report.summary_budget) {
        store.set_over_budget(report.tokens_before > target);
        report.status = CompactionStatus::ALREADY_COMPACT;
        LOG_DEBUG("[Compaction] %s only holds an earlier summary below high priority (%zu/%zu tokens)",
                  consumer.c_str(), candidates[0].token_count, report.summary_budget);
        return report;
    }

    // Chronological order for the archive entry and the digest
    std::sort(candidates.begin(), candidates.end(),
        [](const ContextItem& a, const ContextItem& b) { return a.sequence < b.sequence; });

    size_t original_tokens = TokenEstimator::total(candidates);

    LOG_INFO("[Compaction] ═══════════════════════════════════════");
    LOG_INFO("[Compaction] %s: %.1f%% usage (%zu/%lld tokens, %zu items)",
             consumer.c_str(), store.usage_ratio() * 100.0, report.tokens_before,
             static_cast<long long>(config.limit_tokens), store.item_count());
    LOG_INFO("[Compaction] Keeping %zu items (%zu tokens), compacting %zu items (%zu tokens) into %zu tokens",
             keep.size(), report.kept_tokens, candidates.size(), original_tokens, report.summary_budget);

    // Step 1: archive the untouched originals
    ArchiveResult archived;
    if (sink_) {
        archived = sink_->write(consumer, candidates, ArchiveReason::COMPACTION);
    } else {
        archived = ArchiveResult::fail("no archival sink configured");
    }

    int64_t now = clock_.now_ms();
    if (archived.success) {
        LOG_INFO("[Compaction] Step 1: archived %zu items to %s (%s)",
                 candidates.size(), sink_->name(), archived.reference.c_str());
    } else {
        report.archive_failed = true;
        report.archive_error = archived.error;
        store.record_archive_failure(archived.error, now);
        LOG_ERROR("[Compaction] Step 1: archive write failed for %s: %s (continuing with in-memory summary)",
                  consumer.c_str(), archived.error.c_str());
    }

    // Step 2: digest
    std::string summary = summarizer_.summarize_items(candidates, report.summary_budget, store.estimator());

    ContextItem summary_item;
    summary_item.id = ids_.next_id(consumer, summary, now);
    summary_item.content = summary;
    summary_item.kind = ItemKind::SUMMARY;
    summary_item.priority = Priority::MEDIUM;
    summary_item.created_at = now;
    summary_item.summarized = true;
    summary_item.archive_ref = archived.success ? archived.reference : "";
    summary_item.metadata.set(MetaKey::SOURCE, "compaction");

    // Step 3: swap candidates for the digest
    std::vector<std::string> ids;
    ids.reserve(candidates.size());
    for (size_t i = 0; i < candidates.size(); ++i) {
        ids.push_back(candidates[i].id);
        candidates[i].summarized = true;
        candidates[i].archive_ref = summary_item.archive_ref;
    }
    store.replace(ids, summary_item);

    report.summary_item = store.items().back();
    report.superseded = candidates;
    report.tokens_after = store.total_tokens();

    report.outcome.original_tokens = original_tokens;
    report.outcome.summarized_tokens = report.summary_item.token_count;
    report.outcome.compression_ratio = original_tokens > 0
        ? static_cast<double>(report.outcome.summarized_tokens) / static_cast<double>(original_tokens)
        : 1.0;
    report.outcome.summary = summary;
    report.outcome.preserved_in_archive = archived.success;
    report.outcome.archive_ref = summary_item.archive_ref;

    bool over = report.tokens_after > target;
    store.set_over_budget(over);
    store.record_compaction(report.outcome);
    report.status = over ? CompactionStatus::COMPACTED_OVER_BUDGET : CompactionStatus::COMPACTED;

    LOG_INFO("[Compaction] Summarized %s context: %zu -> %zu tokens (%.1f%% compression), usage now %zu/%lld",
             consumer.c_str(), original_tokens, report.outcome.summarized_tokens,
             report.outcome.compression_ratio * 100.0, report.tokens_after,
             static_cast<long long>(config.limit_tokens));
    if (over) {
        LOG_WARN("[Compaction] %s remains over its %zu-token target: high/critical items alone hold %zu tokens",
                 consumer.c_str(), target, report.kept_tokens);
    }
    LOG_INFO("[Compaction] ═══════════════════════════════════════");

    return report;
}

} // namespace ctxkeep
