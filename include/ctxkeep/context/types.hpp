/*
 * ctxkeep C++ - Context Data Model
 *
 * Context items, per-consumer state, summary outcomes and the per-consumer
 * budget configuration shared by the store, the compaction engine and the
 * archival sinks.
 */
#ifndef ctxkeep_CONTEXT_TYPES_HPP
#define ctxkeep_CONTEXT_TYPES_HPP

#include <cstddef>
#include <cstdint>
#include <map>
#include <string>

namespace ctxkeep {

// ============================================================================
// Enumerations
// ============================================================================

enum class ItemKind {
    INPUT,          // user input
    REPLY,          // assistant reply
    SYSTEM_NOTE,    // system / orchestration note
    KNOWLEDGE,      // background knowledge
    SUMMARY         // synthetic compaction digest
};

// Ordered scale; a larger value ranks higher.
enum class Priority {
    ARCHIVE = 1,    // may leave the active context entirely
    LOW = 2,
    MEDIUM = 3,
    HIGH = 4,
    CRITICAL = 5    // current user intent, never compacted
};

const char* item_kind_to_string(ItemKind kind);
bool item_kind_from_string(const std::string& name, ItemKind& out);

const char* priority_to_string(Priority priority);
// Accepts tier names ("high") or their numeric value ("4")
bool priority_from_string(const std::string& name, Priority& out);

// ============================================================================
// Item Metadata
//
// Closed key set. Each kind recognizes a fixed subset:
//   input        source, intent, language
//   reply        source, model, language
//   system-note  source, component
//   knowledge    source, document, language
//   summary      source
// ============================================================================

enum class MetaKey {
    SOURCE,         // producing subsystem ("voice", "keyboard", "router", ...)
    INTENT,         // intent label assigned by the upstream classifier
    MODEL,          // model that produced a reply
    DOCUMENT,       // document path or title a knowledge item came from
    COMPONENT,      // component that emitted a system note
    LANGUAGE        // BCP-47 language tag
};

const char* meta_key_to_string(MetaKey key);
bool meta_key_from_string(const std::string& name, MetaKey& out);

class ItemMetadata {
public:
    typedef std::map<MetaKey, std::string> Entries;

    void set(MetaKey key, const std::string& value) { entries_[key] = value; }
    bool has(MetaKey key) const { return entries_.find(key) != entries_.end(); }
    std::string get(MetaKey key, const std::string& default_val = "") const;
    void erase(MetaKey key) { entries_.erase(key); }

    bool empty() const { return entries_.empty(); }
    size_t size() const { return entries_.size(); }
    const Entries& entries() const { return entries_; }

    static bool is_recognized(ItemKind kind, MetaKey key);

    // Drop keys the kind does not recognize; returns how many were dropped
    size_t restrict_to(ItemKind kind);

    bool operator==(const ItemMetadata& other) const { return entries_ == other.entries_; }
    bool operator!=(const ItemMetadata& other) const { return !(*this == other); }

private:
    Entries entries_;
};

// ============================================================================
// Context Item
// ============================================================================

struct ContextItem {
    std::string id;             // unique per consumer
    std::string content;
    ItemKind kind;
    Priority priority;
    int64_t created_at;         // unix ms
    uint64_t sequence;          // insertion order within the consumer's store
    size_t token_count;         // derived from content by the store's estimator
    bool summarized;            // true for synthetic summary items
    std::string archive_ref;    // empty when no archive entry backs this item
    ItemMetadata metadata;

    ContextItem()
        : kind(ItemKind::INPUT)
        , priority(Priority::MEDIUM)
        , created_at(0)
        , sequence(0)
        , token_count(0)
        , summarized(false) {}
};

// ============================================================================
// Budget Configuration
// ============================================================================

struct ContextConfig {
    int64_t limit_tokens;       // hard context budget
    double threshold_ratio;     // compaction fires at usage >= this
    double target_ratio;        // usage aimed for after compaction
    int chars_per_token;        // token approximation constant
    double reserve_ratio;       // summary room when KEEP alone exceeds target

    ContextConfig()
        : limit_tokens(8000)
        , threshold_ratio(0.75)
        , target_ratio(0.5)
        , chars_per_token(4)
        , reserve_ratio(0.3) {}

    // Rejects non-positive limits, ratios outside (0,1] and threshold <= target
    bool validate(std::string& error) const;

    size_t threshold_tokens() const;
    size_t target_tokens() const;
    size_t reserve_tokens() const;
};

// ============================================================================
// State / Outcome
// ============================================================================

struct ArchiveFailure {
    bool occurred;
    std::string message;
    int64_t timestamp;          // unix ms

    ArchiveFailure() : occurred(false), timestamp(0) {}
};

struct SummaryOutcome {
    size_t original_tokens;
    size_t summarized_tokens;
    double compression_ratio;   // summarized / original
    std::string summary;
    bool preserved_in_archive;
    std::string archive_ref;

    SummaryOutcome()
        : original_tokens(0)
        , summarized_tokens(0)
        , compression_ratio(1.0)
        , preserved_in_archive(false) {}
};

struct ContextState {
    size_t total_tokens;
    size_t limit;
    size_t target_tokens;
    double usage_ratio;
    size_t item_count;
    std::map<Priority, size_t> items_by_priority;
    bool needs_compaction;
    bool over_budget;           // last compaction could not reach the target
    size_t compactions;
    bool has_last_compaction;
    SummaryOutcome last_compaction;
    ArchiveFailure last_archive_failure;

    ContextState()
        : total_tokens(0)
        , limit(0)
        , target_tokens(0)
        , usage_ratio(0.0)
        , item_count(0)
        , needs_compaction(false)
        , over_budget(false)
        , compactions(0)
        , has_last_compaction(false) {}
};

} // namespace ctxkeep

#endif // ctxkeep_CONTEXT_TYPES_HPP
