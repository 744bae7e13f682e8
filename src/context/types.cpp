#include <ctxkeep/context/types.hpp>
#include <ctxkeep/core/utils.hpp>

#include <cmath>
#include <cstdlib>
#include <sstream>

namespace ctxkeep {

// ============================================================================
// Enum names
// ============================================================================

const char* item_kind_to_string(ItemKind kind) {
    switch (kind) {
        case ItemKind::INPUT: return "input";
        case ItemKind::REPLY: return "reply";
        case ItemKind::SYSTEM_NOTE: return "system";
        case ItemKind::KNOWLEDGE: return "knowledge";
        case ItemKind::SUMMARY: return "summary";
    }
    return "unknown";
}

bool item_kind_from_string(const std::string& name, ItemKind& out) {
    std::string n = to_lower(trim(name));
    if (n == "input" || n == "user" || n == "user_input") {
        out = ItemKind::INPUT;
    } else if (n == "reply" || n == "assistant" || n == "ai_response") {
        out = ItemKind::REPLY;
    } else if (n == "system" || n == "system-note" || n == "system_note") {
        out = ItemKind::SYSTEM_NOTE;
    } else if (n == "knowledge") {
        out = ItemKind::KNOWLEDGE;
    } else if (n == "summary") {
        out = ItemKind::SUMMARY;
    } else {
        return false;
    }
    return true;
}

const char* priority_to_string(Priority priority) {
    switch (priority) {
        case Priority::ARCHIVE: return "archive";
        case Priority::LOW: return "low";
        case Priority::MEDIUM: return "medium";
        case Priority::HIGH: return "high";
        case Priority::CRITICAL: return "critical";
    }
    return "unknown";
}

bool priority_from_string(const std::string& name, Priority& out) {
    std::string n = to_lower(trim(name));
    if (n == "critical" || n == "5") {
        out = Priority::CRITICAL;
    } else if (n == "high" || n == "4") {
        out = Priority::HIGH;
    } else if (n == "medium" || n == "3") {
        out = Priority::MEDIUM;
    } else if (n == "low" || n == "2") {
        out = Priority::LOW;
    } else if (n == "archive" || n == "1") {
        out = Priority::ARCHIVE;
    } else {
        return false;
    }
    return true;
}

const char* meta_key_to_string(MetaKey key) {
    switch (key) {
        case MetaKey::SOURCE: return "source";
        case MetaKey::INTENT: return "intent";
        case MetaKey::MODEL: return "model";
        case MetaKey::DOCUMENT: return "document";
        case MetaKey::COMPONENT: return "component";
        case MetaKey::LANGUAGE: return "language";
    }
    return "unknown";
}

bool meta_key_from_string(const std::string& name, MetaKey& out) {
    std::string n = to_lower(trim(name));
    if (n == "source") out = MetaKey::SOURCE;
    else if (n == "intent") out = MetaKey::INTENT;
    else if (n == "model") out = MetaKey::MODEL;
    else if (n == "document") out = MetaKey::DOCUMENT;
    else if (n == "component") out = MetaKey::COMPONENT;
    else if (n == "language") out = MetaKey::LANGUAGE;
    else return false;
    return true;
}

// ============================================================================
// ItemMetadata
// ============================================================================

std::string ItemMetadata::get(MetaKey key, const std::string& default_val) const {
    Entries::const_iterator it = entries_.find(key);
    return it != entries_.end() ? it->second : default_val;
}

bool ItemMetadata::is_recognized(ItemKind kind, MetaKey key) {
    if (key == MetaKey::SOURCE) return true;

    switch (kind) {
        case ItemKind::INPUT:
            return key == MetaKey::INTENT || key == MetaKey::LANGUAGE;
        case ItemKind::REPLY:
            return key == MetaKey::MODEL || key == MetaKey::LANGUAGE;
        case ItemKind::SYSTEM_NOTE:
            return key == MetaKey::COMPONENT;
        case ItemKind::KNOWLEDGE:
            return key == MetaKey::DOCUMENT || key == MetaKey::LANGUAGE;
        case ItemKind::SUMMARY:
            return false;
    }
    return false;
}

size_t ItemMetadata::restrict_to(ItemKind kind) {
    size_t dropped = 0;
    for (Entries::iterator it = entries_.begin(); it != entries_.end(); ) {
        if (!is_recognized(kind, it->first)) {
            it = entries_.erase(it);
            ++dropped;
        } else {
            ++it;
        }
    }
    return dropped;
}

// ============================================================================
// ContextConfig
// ============================================================================

static bool ratio_in_range(double value) {
    // NaN fails both comparisons
    return value > 0.0 && value <= 1.0;
}

bool ContextConfig::validate(std::string& error) const {
    std::ostringstream oss;
    if (limit_tokens <= 0) {
        oss << "limit_tokens must be positive (got " << limit_tokens << ")";
    } else if (chars_per_token <= 0) {
        oss << "chars_per_token must be positive (got " << chars_per_token << ")";
    } else if (!ratio_in_range(threshold_ratio)) {
        oss << "threshold_ratio must be in (0, 1] (got " << threshold_ratio << ")";
    } else if (!ratio_in_range(target_ratio)) {
        oss << "target_ratio must be in (0, 1] (got " << target_ratio << ")";
    } else if (!ratio_in_range(reserve_ratio)) {
        oss << "reserve_ratio must be in (0, 1] (got " << reserve_ratio << ")";
    } else if (threshold_ratio <= target_ratio) {
        oss << "threshold_ratio (" << threshold_ratio
            << ") must be greater than target_ratio (" << target_ratio << ")";
    }

    error = oss.str();
    return error.empty();
}

size_t ContextConfig::threshold_tokens() const {
    if (limit_tokens <= 0) return 0;
    return static_cast<size_t>(std::ceil(static_cast<double>(limit_tokens) * threshold_ratio));
}

size_t ContextConfig::target_tokens() const {
    if (limit_tokens <= 0) return 0;
    return static_cast<size_t>(std::floor(static_cast<double>(limit_tokens) * target_ratio));
}

size_t ContextConfig::reserve_tokens() const {
    if (limit_tokens <= 0) return 1;
    size_t reserve = static_cast<size_t>(std::floor(static_cast<double>(limit_tokens) * reserve_ratio));
    return reserve > 0 ? reserve : 1;
}

} // namespace ctxkeep
