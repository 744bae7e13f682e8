/*
 * ctxkeep C++ - Summary Engine
 *
 * Service object holding every consumer's context store. Constructed
 * explicitly with its collaborators (archival sink, clock, id source) and
 * passed around by reference.
 *
 * Locking: one shared_mutex per consumer. add/compact/clear take it
 * exclusively, so threshold detection, archival and summary substitution
 * for a consumer happen as one unit. State and context reads take it
 * shared. Different consumers never block each other beyond the short
 * lookup in the consumer map.
 */
#ifndef ctxkeep_CONTEXT_SUMMARY_ENGINE_HPP
#define ctxkeep_CONTEXT_SUMMARY_ENGINE_HPP

#include <ctxkeep/archive/sink.hpp>
#include <ctxkeep/context/clock.hpp>
#include <ctxkeep/context/compaction.hpp>
#include <ctxkeep/context/context_store.hpp>
#include <ctxkeep/context/summarizer.hpp>
#include <ctxkeep/core/config.hpp>

#include <atomic>
#include <map>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <vector>

namespace ctxkeep {

struct EngineStatistics {
    uint64_t summaries_created;
    uint64_t tokens_saved;
    uint64_t contexts_cleared;
    uint64_t archive_failures;

    EngineStatistics()
        : summaries_created(0)
        , tokens_saved(0)
        , contexts_cleared(0)
        , archive_failures(0) {}
};

// Built-in token limit for well-known consumers ("helper_ai",
// "orchestration_ai", ...); `fallback` for any other id.
int64_t builtin_limit_for(const std::string& consumer_id, int64_t fallback);

class SummaryEngine {
public:
    static const char* const VERSION;

    // Null clock / ids select SystemClock / HashIdSource owned by the engine.
    explicit SummaryEngine(ArchivalSink* sink,
                           Clock* clock = nullptr,
                           IdSource* ids = nullptr,
                           const SummarizerOptions& options = SummarizerOptions());
    ~SummaryEngine();

    // ------------------------------------------------------------------
    // Configuration
    // ------------------------------------------------------------------

    // Budget used for consumers without an explicit configuration
    bool set_default_config(const ContextConfig& config, std::string* error = nullptr);
    ContextConfig default_config() const;

    // Rejects invalid configurations (the consumer keeps its previous one)
    bool configure(const std::string& consumer_id, const ContextConfig& config,
                   std::string* error = nullptr);

    // Read "defaults.*" and "consumers.<id>.*". Returns false if any entry
    // was rejected; valid entries are still applied.
    bool configure_from(const Config& config);

    ContextConfig config_for(const std::string& consumer_id) const;

    // ------------------------------------------------------------------
    // Context operations
    // ------------------------------------------------------------------

    // Append an item; compacts before returning if the threshold is crossed.
    // Metadata keys the kind does not recognize are dropped.
    ContextItem add_to_context(const std::string& consumer_id,
                               const std::string& content,
                               ItemKind kind,
                               Priority priority,
                               const ItemMetadata& metadata = ItemMetadata());

    ContextState get_context_state(const std::string& consumer_id) const;

    std::string get_optimized_context(const std::string& consumer_id) const;

    // Archive every live item, then empty the store. The store is emptied
    // even if the archive write fails; the failure is recorded in its state.
    ArchiveResult clear_context(const std::string& consumer_id);

    // Run compaction now (no-op unless the consumer needs it)
    CompactionReport compact(const std::string& consumer_id);

    // ------------------------------------------------------------------
    // Introspection
    // ------------------------------------------------------------------

    std::vector<std::string> consumers() const;
    EngineStatistics statistics() const;
    Json statistics_json() const;

    const ExtractiveSummarizer& summarizer() const { return summarizer_; }

private:
    struct ConsumerSlot {
        mutable std::shared_mutex mutex;
        ContextStore store;

        ConsumerSlot(const std::string& id, const ContextConfig& config) : store(id, config) {}
    };

    typedef std::shared_ptr<ConsumerSlot> SlotPtr;

    std::unique_ptr<Clock> owned_clock_;
    std::unique_ptr<IdSource> owned_ids_;
    ArchivalSink* sink_;
    Clock* clock_;
    IdSource* ids_;
    ExtractiveSummarizer summarizer_;
    CompactionEngine compactor_;

    mutable std::mutex slots_mutex_;
    std::map<std::string, SlotPtr> slots_;
    std::map<std::string, ContextConfig> overrides_;
    ContextConfig defaults_;

    std::atomic<uint64_t> summaries_created_;
    std::atomic<uint64_t> tokens_saved_;
    std::atomic<uint64_t> contexts_cleared_;
    std::atomic<uint64_t> archive_failures_;

    SlotPtr find_slot(const std::string& consumer_id) const;
    SlotPtr get_or_create_slot(const std::string& consumer_id);
    ContextConfig config_for_locked(const std::string& consumer_id) const;
    void apply_config(const SlotPtr& slot);
    void account(const CompactionReport& report);
};

} // namespace ctxkeep

#endif // ctxkeep_CONTEXT_SUMMARY_ENGINE_HPP
