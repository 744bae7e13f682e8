/*
 * ctxkeep C++ - Summary Engine Implementation
 */
#include <ctxkeep/context/summary_engine.hpp>
#include <ctxkeep/core/logger.hpp>

#include <cstdio>

namespace ctxkeep {

const char* const SummaryEngine::VERSION = "1.0.0";

namespace {

struct BuiltinLimit {
    const char* consumer;
    int64_t limit_tokens;
};

const BuiltinLimit BUILTIN_LIMITS[] = {
    { "helper_ai", 8000 },
    { "accessibility_ai", 8000 },
    { "orchestration_ai", 16000 },
    { "guardian_ai", 4000 },
};

int64_t int_member(const Json& node, const char* key, int64_t default_val) {
    Json::const_iterator it = node.find(key);
    if (it == node.end()) return default_val;
    if (it->is_number_integer()) return it->get<int64_t>();
    if (it->is_number_float()) return static_cast<int64_t>(it->get<double>());
    return default_val;
}

double double_member(const Json& node, const char* key, double default_val) {
    Json::const_iterator it = node.find(key);
    if (it != node.end() && it->is_number()) return it->get<double>();
    return default_val;
}

// Budget fields of one config object. Consumer ids are used as plain member
// names, so ids containing '.' resolve like any other.
ContextConfig read_context_config(const Json& node, const ContextConfig& base) {
    ContextConfig out = base;
    if (!node.is_object()) return out;
    out.limit_tokens = int_member(node, "limit_tokens", base.limit_tokens);
    out.threshold_ratio = double_member(node, "threshold_ratio", base.threshold_ratio);
    out.target_ratio = double_member(node, "target_ratio", base.target_ratio);
    out.chars_per_token = static_cast<int>(int_member(node, "chars_per_token", base.chars_per_token));
    out.reserve_ratio = double_member(node, "reserve_ratio", base.reserve_ratio);
    return out;
}

const Json& object_member(const Json& node, const std::string& key) {
    static const Json empty = Json::object();
    if (!node.is_object()) return empty;
    Json::const_iterator it = node.find(key);
    return it != node.end() ? *it : empty;
}

std::string format_percent(double ratio) {
    char buf[32];
    snprintf(buf, sizeof(buf), "%.1f%%", ratio * 100.0);
    return std::string(buf);
}

} // anonymous namespace

int64_t builtin_limit_for(const std::string& consumer_id, int64_t fallback) {
    for (size_t i = 0; i < sizeof(BUILTIN_LIMITS) / sizeof(BUILTIN_LIMITS[0]); ++i) {
        if (consumer_id == BUILTIN_LIMITS[i].consumer) {
            return BUILTIN_LIMITS[i].limit_tokens;
        }
    }
    return fallback;
}

// ============================================================================
// Construction
// ============================================================================

SummaryEngine::SummaryEngine(ArchivalSink* sink,
                             Clock* clock,
                             IdSource* ids,
                             const SummarizerOptions& options)
    : owned_clock_(clock ? nullptr : new SystemClock())
    , owned_ids_(ids ? nullptr : new HashIdSource())
    , sink_(sink)
    , clock_(clock ? clock : owned_clock_.get())
    , ids_(ids ? ids : owned_ids_.get())
    , summarizer_(options)
    , compactor_(summarizer_, sink_, *clock_, *ids_)
    , summaries_created_(0)
    , tokens_saved_(0)
    , contexts_cleared_(0)
    , archive_failures_(0)
{
    LOG_INFO("[SummaryEngine] Initialized v%s (archive: %s)", VERSION, sink_ ? sink_->name() : "none");
}

SummaryEngine::~SummaryEngine() {}

// ============================================================================
// Configuration
// ============================================================================

bool SummaryEngine::set_default_config(const ContextConfig& config, std::string* error) {
    std::string why;
    if (!config.validate(why)) {
        LOG_ERROR("[SummaryEngine] Rejected default configuration: %s", why.c_str());
        if (error) *error = why;
        return false;
    }

    std::vector<SlotPtr> affected;
    {
        std::lock_guard<std::mutex> lock(slots_mutex_);
        defaults_ = config;
        for (std::map<std::string, SlotPtr>::const_iterator it = slots_.begin(); it != slots_.end(); ++it) {
            if (overrides_.find(it->first) == overrides_.end()) {
                affected.push_back(it->second);
            }
        }
    }

    for (size_t i = 0; i < affected.size(); ++i) {
        apply_config(affected[i]);
    }
    return true;
}

ContextConfig SummaryEngine::default_config() const {
    std::lock_guard<std::mutex> lock(slots_mutex_);
    return defaults_;
}

bool SummaryEngine::configure(const std::string& consumer_id, const ContextConfig& config,
                              std::string* error) {
    std::string why;
    if (!config.validate(why)) {
        LOG_ERROR("[SummaryEngine] Rejected configuration for %s: %s", consumer_id.c_str(), why.c_str());
        if (error) *error = why;
        return false;
    }

    SlotPtr slot;
    {
        std::lock_guard<std::mutex> lock(slots_mutex_);
        overrides_[consumer_id] = config;
        std::map<std::string, SlotPtr>::const_iterator it = slots_.find(consumer_id);
        if (it != slots_.end()) slot = it->second;
    }

    if (slot) {
        apply_config(slot);
    }

    LOG_INFO("[SummaryEngine] %s: limit=%lld tokens, threshold=%.2f, target=%.2f, chars/token=%d",
             consumer_id.c_str(), static_cast<long long>(config.limit_tokens),
             config.threshold_ratio, config.target_ratio, config.chars_per_token);
    return true;
}

bool SummaryEngine::configure_from(const Config& config) {
    bool ok = true;

    ContextConfig defaults = read_context_config(object_member(config.root(), "defaults"), default_config());
    if (!set_default_config(defaults)) {
        ok = false;
    }

    const Json& consumers = object_member(config.root(), "consumers");
    std::vector<std::string> ids = config.child_keys("consumers");
    for (size_t i = 0; i < ids.size(); ++i) {
        ContextConfig base = default_config();
        base.limit_tokens = builtin_limit_for(ids[i], base.limit_tokens);
        ContextConfig cfg = read_context_config(object_member(consumers, ids[i]), base);
        if (!configure(ids[i], cfg)) {
            ok = false;
        }
    }
    return ok;
}

ContextConfig SummaryEngine::config_for_locked(const std::string& consumer_id) const {
    std::map<std::string, ContextConfig>::const_iterator it = overrides_.find(consumer_id);
    if (it != overrides_.end()) {
        return it->second;
    }
    ContextConfig cfg = defaults_;
    cfg.limit_tokens = builtin_limit_for(consumer_id, defaults_.limit_tokens);
    return cfg;
}

ContextConfig SummaryEngine::config_for(const std::string& consumer_id) const {
    std::lock_guard<std::mutex> lock(slots_mutex_);
    return config_for_locked(consumer_id);
}

// The configuration is resolved again under the slot lock, so a configure()
// racing with set_default_config() cannot be overwritten by stale defaults.
// Lock order is slot mutex, then slots_mutex_.
void SummaryEngine::apply_config(const SlotPtr& slot) {
    std::unique_lock<std::shared_mutex> lock(slot->mutex);
    slot->store.set_config(config_for(slot->store.consumer_id()));
}

// ============================================================================
// Slots
// ============================================================================

SummaryEngine::SlotPtr SummaryEngine::find_slot(const std::string& consumer_id) const {
    std::lock_guard<std::mutex> lock(slots_mutex_);
    std::map<std::string, SlotPtr>::const_iterator it = slots_.find(consumer_id);
    return it != slots_.end() ? it->second : SlotPtr();
}

SummaryEngine::SlotPtr SummaryEngine::get_or_create_slot(const std::string& consumer_id) {
    std::lock_guard<std::mutex> lock(slots_mutex_);
    std::map<std::string, SlotPtr>::iterator it = slots_.find(consumer_id);
    if (it != slots_.end()) {
        return it->second;
    }

    SlotPtr slot = std::make_shared<ConsumerSlot>(consumer_id, config_for_locked(consumer_id));
    slots_[consumer_id] = slot;
    LOG_DEBUG("[SummaryEngine] Tracking new consumer %s", consumer_id.c_str());
    return slot;
}

void SummaryEngine::account(const CompactionReport& report) {
    if (report.archive_failed) {
        ++archive_failures_;
    }
    if (!report.performed()) {
        return;
    }
    ++summaries_created_;
    if (report.outcome.original_tokens > report.outcome.summarized_tokens) {
        tokens_saved_ += report.outcome.original_tokens - report.outcome.summarized_tokens;
    }
}

// ============================================================================
// Context operations
// ============================================================================

ContextItem SummaryEngine::add_to_context(const std::string& consumer_id,
                                          const std::string& content,
                                          ItemKind kind,
                                          Priority priority,
                                          const ItemMetadata& metadata) {
    SlotPtr slot = get_or_create_slot(consumer_id);

    ContextItem item;
    item.content = content;
    item.kind = kind;
    item.priority = priority;
    item.metadata = metadata;

    size_t dropped = item.metadata.restrict_to(kind);
    if (dropped > 0) {
        LOG_WARN("[SummaryEngine] Dropped %zu metadata key(s) not recognized for %s items",
                 dropped, item_kind_to_string(kind));
    }

    std::unique_lock<std::shared_mutex> lock(slot->mutex);

    item.created_at = clock_->now_ms();
    item.id = ids_->next_id(consumer_id, content, item.created_at);

    ContextItem added = slot->store.append(item);
    LOG_DEBUG("[SummaryEngine] %s += %s/%s item %s (%zu tokens, usage %.1f%%)",
              consumer_id.c_str(), item_kind_to_string(kind), priority_to_string(priority),
              added.id.c_str(), added.token_count, slot->store.usage_ratio() * 100.0);

    if (slot->store.needs_compaction()) {
        account(compactor_.compact(slot->store));
    }

    return added;
}

ContextState SummaryEngine::get_context_state(const std::string& consumer_id) const {
    SlotPtr slot = find_slot(consumer_id);
    if (!slot) {
        return ContextStore(consumer_id, config_for(consumer_id)).state();
    }

    std::shared_lock<std::shared_mutex> lock(slot->mutex);
    return slot->store.state();
}

std::string SummaryEngine::get_optimized_context(const std::string& consumer_id) const {
    SlotPtr slot = find_slot(consumer_id);
    if (!slot) {
        return "";
    }

    std::shared_lock<std::shared_mutex> lock(slot->mutex);
    return slot->store.render();
}

ArchiveResult SummaryEngine::clear_context(const std::string& consumer_id) {
    SlotPtr slot = find_slot(consumer_id);
    if (!slot) {
        return ArchiveResult::ok("");
    }

    std::unique_lock<std::shared_mutex> lock(slot->mutex);

    ArchiveResult result = ArchiveResult::ok("");
    const std::vector<ContextItem>& live = slot->store.items();
    if (!live.empty()) {
        if (sink_) {
            result = sink_->write(consumer_id, live, ArchiveReason::CLEAR);
        } else {
            result = ArchiveResult::fail("no archival sink configured");
        }

        if (!result.success) {
            ++archive_failures_;
            slot->store.record_archive_failure(result.error, clock_->now_ms());
            LOG_ERROR("[SummaryEngine] Archive before clear failed for %s: %s",
                      consumer_id.c_str(), result.error.c_str());
        }
    }

    std::vector<ContextItem> removed = slot->store.take_all();
    ++contexts_cleared_;

    LOG_INFO("[SummaryEngine] Cleared %s: %zu items%s%s", consumer_id.c_str(), removed.size(),
             result.reference.empty() ? "" : " archived to ",
             result.reference.c_str());
    return result;
}

CompactionReport SummaryEngine::compact(const std::string& consumer_id) {
    SlotPtr slot = find_slot(consumer_id);
    if (!slot) {
        return CompactionReport();
    }

    std::unique_lock<std::shared_mutex> lock(slot->mutex);
    CompactionReport report = compactor_.compact(slot->store);
    account(report);
    return report;
}

// ============================================================================
// Introspection
// ============================================================================

std::vector<std::string> SummaryEngine::consumers() const {
    std::vector<std::string> ids;
    std::lock_guard<std::mutex> lock(slots_mutex_);
    for (std::map<std::string, SlotPtr>::const_iterator it = slots_.begin(); it != slots_.end(); ++it) {
        ids.push_back(it->first);
    }
    return ids;
}

EngineStatistics SummaryEngine::statistics() const {
    EngineStatistics stats;
    stats.summaries_created = summaries_created_.load();
    stats.tokens_saved = tokens_saved_.load();
    stats.contexts_cleared = contexts_cleared_.load();
    stats.archive_failures = archive_failures_.load();
    return stats;
}

Json SummaryEngine::statistics_json() const {
    EngineStatistics stats = statistics();

    Json out = Json::object();
    out["summaries_created"] = stats.summaries_created;
    out["tokens_saved"] = stats.tokens_saved;
    out["contexts_cleared"] = stats.contexts_cleared;
    out["archive_failures"] = stats.archive_failures;
    out["version"] = VERSION;

    Json contexts = Json::object();
    std::vector<std::string> ids = consumers();
    for (size_t i = 0; i < ids.size(); ++i) {
        ContextState state = get_context_state(ids[i]);
        Json entry = Json::object();
        entry["tokens"] = state.total_tokens;
        entry["limit"] = state.limit;
        entry["usage"] = format_percent(state.usage_ratio);
        entry["items"] = state.item_count;
        entry["needs_compaction"] = state.needs_compaction;
        entry["over_budget"] = state.over_budget;
        entry["compactions"] = state.compactions;
        contexts[ids[i]] = entry;
    }
    out["contexts"] = contexts;
    return out;
}

} // namespace ctxkeep
