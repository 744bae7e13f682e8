/*
 * ctxkeep C++ - Context Store Implementation
 */
#include <ctxkeep/context/context_store.hpp>
#include <ctxkeep/core/logger.hpp>

#include <algorithm>
#include <set>
#include <sstream>

namespace ctxkeep {

bool ranks_before(const ContextItem& a, const ContextItem& b) {
    if (a.priority != b.priority) {
        return static_cast<int>(a.priority) > static_cast<int>(b.priority);
    }
    if (a.created_at != b.created_at) {
        return a.created_at > b.created_at;
    }
    return a.sequence > b.sequence;
}

std::string render_item(const ContextItem& item) {
    if (item.summarized || item.kind == ItemKind::SUMMARY) {
        return "[Summary] " + item.content;
    }
    switch (item.kind) {
        case ItemKind::INPUT: return "User: " + item.content;
        case ItemKind::REPLY: return "Assistant: " + item.content;
        case ItemKind::SYSTEM_NOTE: return "[System] " + item.content;
        default: return item.content;
    }
}

// ============================================================================
// ContextStore
// ============================================================================

ContextStore::ContextStore(const std::string& consumer_id, const ContextConfig& config)
    : consumer_id_(consumer_id)
    , config_(config)
    , estimator_(config.chars_per_token)
    , total_tokens_(0)
    , next_sequence_(1)
    , over_budget_(false)
    , compactions_(0)
    , has_last_compaction_(false)
{}

void ContextStore::set_config(const ContextConfig& config) {
    config_ = config;
    estimator_ = TokenEstimator(config.chars_per_token);

    total_tokens_ = 0;
    for (size_t i = 0; i < items_.size(); ++i) {
        items_[i].token_count = estimator_.estimate(items_[i].content);
        total_tokens_ += items_[i].token_count;
    }
    LOG_DEBUG("[ContextStore] %s reconfigured: limit=%lld tokens, %zu tokens in use",
              consumer_id_.c_str(), static_cast<long long>(config_.limit_tokens), total_tokens_);
}

const ContextItem& ContextStore::append(ContextItem item) {
    item.token_count = estimator_.estimate(item.content);
    item.sequence = next_sequence_++;
    total_tokens_ += item.token_count;
    items_.push_back(item);
    return items_.back();
}

size_t ContextStore::replace(const std::vector<std::string>& ids, ContextItem replacement) {
    std::set<std::string> doomed(ids.begin(), ids.end());
    size_t removed = 0;

    std::vector<ContextItem> remaining;
    remaining.reserve(items_.size());
    for (size_t i = 0; i < items_.size(); ++i) {
        if (doomed.count(items_[i].id)) {
            total_tokens_ -= items_[i].token_count;
            ++removed;
        } else {
            remaining.push_back(items_[i]);
        }
    }
    items_.swap(remaining);

    append(replacement);
    return removed;
}

std::vector<ContextItem> ContextStore::take_all() {
    std::vector<ContextItem> taken;
    taken.swap(items_);
    total_tokens_ = 0;
    over_budget_ = false;
    return taken;
}

std::vector<ContextItem> ContextStore::ordered_items() const {
    std::vector<ContextItem> ordered = items_;
    std::sort(ordered.begin(), ordered.end(), ranks_before);
    return ordered;
}

double ContextStore::usage_ratio() const {
    if (config_.limit_tokens <= 0) return 1.0;
    return static_cast<double>(total_tokens_) / static_cast<double>(config_.limit_tokens);
}

bool ContextStore::needs_compaction() const {
    return usage_ratio() >= config_.threshold_ratio;
}

ContextState ContextStore::state() const {
    ContextState state;
    state.total_tokens = total_tokens_;
    state.limit = config_.limit_tokens > 0 ? static_cast<size_t>(config_.limit_tokens) : 0;
    state.target_tokens = config_.target_tokens();
    state.usage_ratio = usage_ratio();
    state.item_count = items_.size();
    for (size_t i = 0; i < items_.size(); ++i) {
        ++state.items_by_priority[items_[i].priority];
    }
    state.needs_compaction = needs_compaction();
    state.over_budget = over_budget_;
    state.compactions = compactions_;
    state.has_last_compaction = has_last_compaction_;
    state.last_compaction = last_compaction_;
    state.last_archive_failure = last_archive_failure_;
    return state;
}

std::string ContextStore::render() const {
    std::vector<ContextItem> ordered = ordered_items();
    std::ostringstream oss;
    for (size_t i = 0; i < ordered.size(); ++i) {
        if (i > 0) oss << "\n";
        oss << render_item(ordered[i]);
    }
    return oss.str();
}

void ContextStore::record_compaction(const SummaryOutcome& outcome) {
    ++compactions_;
    has_last_compaction_ = true;
    last_compaction_ = outcome;
}

void ContextStore::record_archive_failure(const std::string& message, int64_t timestamp_ms) {
    last_archive_failure_.occurred = true;
    last_archive_failure_.message = message;
    last_archive_failure_.timestamp = timestamp_ms;
}

} // namespace ctxkeep
