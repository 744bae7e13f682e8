/*
 * ctxkeep C++ - Context Store
 *
 * One consumer's ordered collection of context items plus its budget
 * bookkeeping. Not synchronized: SummaryEngine guards each store with the
 * consumer's lock.
 */
#ifndef ctxkeep_CONTEXT_CONTEXT_STORE_HPP
#define ctxkeep_CONTEXT_CONTEXT_STORE_HPP

#include <ctxkeep/context/types.hpp>
#include <ctxkeep/context/token_estimator.hpp>
#include <string>
#include <vector>

namespace ctxkeep {

// Priority descending, then newest first (created_at, then insertion sequence)
bool ranks_before(const ContextItem& a, const ContextItem& b);

// "User: ...", "Assistant: ...", "[System] ...", "[Summary] ..." or plain text
std::string render_item(const ContextItem& item);

class ContextStore {
public:
    ContextStore(const std::string& consumer_id, const ContextConfig& config);

    const std::string& consumer_id() const { return consumer_id_; }
    const ContextConfig& config() const { return config_; }
    const TokenEstimator& estimator() const { return estimator_; }

    // Replace the budget configuration and re-estimate every item
    void set_config(const ContextConfig& config);

    // Append an item. Token count and sequence are assigned by the store.
    const ContextItem& append(ContextItem item);

    // Remove the items with the given ids and append `replacement`.
    // Returns how many items were removed.
    size_t replace(const std::vector<std::string>& ids, ContextItem replacement);

    // Remove and return every item (insertion order)
    std::vector<ContextItem> take_all();

    // Insertion order
    const std::vector<ContextItem>& items() const { return items_; }

    // Retrieval order (see ranks_before)
    std::vector<ContextItem> ordered_items() const;

    size_t total_tokens() const { return total_tokens_; }
    size_t item_count() const { return items_.size(); }
    bool empty() const { return items_.empty(); }
    double usage_ratio() const;
    bool needs_compaction() const;

    ContextState state() const;

    // Ordered, prefixed, newline-joined text for the downstream model
    std::string render() const;

    // Compaction bookkeeping
    void record_compaction(const SummaryOutcome& outcome);
    void set_over_budget(bool over) { over_budget_ = over; }
    bool over_budget() const { return over_budget_; }
    void record_archive_failure(const std::string& message, int64_t timestamp_ms);

private:
    std::string consumer_id_;
    ContextConfig config_;
    TokenEstimator estimator_;
    std::vector<ContextItem> items_;
    size_t total_tokens_;
    uint64_t next_sequence_;
    bool over_budget_;
    size_t compactions_;
    bool has_last_compaction_;
    SummaryOutcome last_compaction_;
    ArchiveFailure last_archive_failure_;
};

} // namespace ctxkeep

#endif // ctxkeep_CONTEXT_CONTEXT_STORE_HPP
