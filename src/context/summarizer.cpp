/*
 * ctxkeep C++ - Extractive Summarizer Implementation
 */
#include <ctxkeep/context/summarizer.hpp>
#include <ctxkeep/core/logger.hpp>
#include <ctxkeep/core/utils.hpp>

#include <algorithm>
#include <cctype>
#include <cmath>

namespace ctxkeep {

const char* const ExtractiveSummarizer::TRUNCATION_MARKER = "...";

namespace {

const char* const STOP_WORDS[] = {
    "the", "a", "an", "is", "are", "was", "were", "be", "been",
    "being", "have", "has", "had", "do", "does", "did", "will",
    "would", "could", "should", "may", "might", "must", "shall",
    "can", "need", "dare", "ought", "used", "to", "of", "in",
    "for", "on", "with", "at", "by", "from", "as", "into",
    "through", "during", "before", "after", "above", "below",
    "between", "under", "again", "further", "then", "once",
    "here", "there", "when", "where", "why", "how", "all",
    "each", "few", "more", "most", "other", "some", "such",
    "no", "nor", "not", "only", "own", "same", "so", "than",
    "too", "very", "s", "t", "just", "don", "now",
};

const char* const PRESERVE_PATTERNS[] = {
    "\\b(?:user|you|i|we)\\b",                                  // personal pronouns
    "\\b(?:save|open|close|search|help|create|delete)\\b",      // actions
    "\\b(?:error|warning|success|failed)\\b",                   // status
    "\\b(?:please|want|need|would like)\\b",                    // intent
};

bool is_word_byte(unsigned char c) {
    return std::isalnum(c) || c == '_' || c >= 0x80;
}

bool is_sentence_end(char c) {
    return c == '.' || c == '!' || c == '?';
}

bool is_space(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

// Chronological order; sequence breaks timestamp ties
bool older_first(const ContextItem& a, const ContextItem& b) {
    if (a.created_at != b.created_at) return a.created_at < b.created_at;
    return a.sequence < b.sequence;
}

std::string join_contents(const std::vector<const ContextItem*>& items) {
    std::vector<std::string> parts;
    for (size_t i = 0; i < items.size(); ++i) {
        std::string text = trim(items[i]->content);
        if (!text.empty()) parts.push_back(text);
    }
    return join(parts, " ");
}

} // anonymous namespace

// ============================================================================
// Construction
// ============================================================================

ExtractiveSummarizer::ExtractiveSummarizer() {
    init_vocabulary();
}

ExtractiveSummarizer::ExtractiveSummarizer(const SummarizerOptions& options)
    : options_(options)
{
    init_vocabulary();
}

void ExtractiveSummarizer::init_vocabulary() {
    for (size_t i = 0; i < sizeof(STOP_WORDS) / sizeof(STOP_WORDS[0]); ++i) {
        stop_words_.insert(STOP_WORDS[i]);
    }
    for (size_t i = 0; i < sizeof(PRESERVE_PATTERNS) / sizeof(PRESERVE_PATTERNS[0]); ++i) {
        preserve_patterns_.push_back(
            std::regex(PRESERVE_PATTERNS[i], std::regex::ECMAScript | std::regex::icase));
    }
}

// ============================================================================
// Segmentation
// ============================================================================

std::vector<std::string> ExtractiveSummarizer::split_sentences(const std::string& text) {
    std::vector<std::string> sentences;
    size_t start = 0;
    size_t i = 0;

    while (i < text.size()) {
        if (is_sentence_end(text[i]) && i + 1 < text.size() && is_space(text[i + 1])) {
            std::string sentence = trim(text.substr(start, i + 1 - start));
            if (!sentence.empty()) sentences.push_back(sentence);

            i += 1;
            while (i < text.size() && is_space(text[i])) ++i;
            start = i;
            continue;
        }
        ++i;
    }

    if (start < text.size()) {
        std::string sentence = trim(text.substr(start));
        if (!sentence.empty()) sentences.push_back(sentence);
    }

    return sentences;
}

std::vector<std::string> ExtractiveSummarizer::tokenize(const std::string& text) {
    std::vector<std::string> words;
    std::string current;

    for (size_t i = 0; i < text.size(); ++i) {
        unsigned char c = static_cast<unsigned char>(text[i]);
        if (is_word_byte(c)) {
            current += static_cast<char>(c < 0x80 ? std::tolower(c) : c);
        } else if (!current.empty()) {
            words.push_back(current);
            current.clear();
        }
    }
    if (!current.empty()) words.push_back(current);

    return words;
}

// ============================================================================
// Scoring
// ============================================================================

bool ExtractiveSummarizer::is_stop_word(const std::string& word) const {
    return stop_words_.find(word) != stop_words_.end();
}

bool ExtractiveSummarizer::matches_preserve_pattern(const std::string& sentence) const {
    for (size_t i = 0; i < preserve_patterns_.size(); ++i) {
        if (std::regex_search(sentence, preserve_patterns_[i])) {
            return true;
        }
    }
    return false;
}

double ExtractiveSummarizer::score_sentence(const std::string& sentence,
                                            const std::map<std::string, size_t>& word_freq,
                                            size_t position, size_t total) const {
    std::vector<std::string> words = tokenize(sentence);
    if (words.empty()) return 0.0;

    size_t freq_sum = 0;
    for (size_t i = 0; i < words.size(); ++i) {
        if (is_stop_word(words[i])) continue;
        std::map<std::string, size_t>::const_iterator it = word_freq.find(words[i]);
        if (it != word_freq.end()) freq_sum += it->second;
    }
    double score = static_cast<double>(freq_sum) / static_cast<double>(words.size());

    // Position bonuses are exclusive: first, else last, else early
    if (position == 0) {
        score *= 1.5;
    } else if (position == total - 1) {
        score *= 1.3;
    } else if (static_cast<double>(position) < static_cast<double>(total) * 0.2) {
        score *= 1.2;
    }

    if (words.size() >= 10 && words.size() <= 30) {
        score *= 1.1;
    }

    if (matches_preserve_pattern(sentence)) {
        score *= 1.3;
    }

    return score;
}

std::vector<ScoredSentence> ExtractiveSummarizer::score_sentences(
    const std::vector<std::string>& sentences) const
{
    std::map<std::string, size_t> word_freq;
    for (size_t i = 0; i < sentences.size(); ++i) {
        std::vector<std::string> words = tokenize(sentences[i]);
        for (size_t j = 0; j < words.size(); ++j) {
            if (!is_stop_word(words[j])) {
                ++word_freq[words[j]];
            }
        }
    }

    std::vector<ScoredSentence> scored;
    scored.reserve(sentences.size());
    for (size_t i = 0; i < sentences.size(); ++i) {
        ScoredSentence s;
        s.text = sentences[i];
        s.index = i;
        s.score = score_sentence(sentences[i], word_freq, i, sentences.size());
        scored.push_back(s);
    }
    return scored;
}

// ============================================================================
// Summarization
// ============================================================================

std::string ExtractiveSummarizer::summarize(const std::string& text, double target_ratio) const {
    if (text.empty() || utf8_length(text) < options_.min_chars) {
        return text;
    }

    std::vector<std::string> sentences = split_sentences(text);
    if (sentences.size() < options_.min_sentences) {
        return text;
    }

    if (!(target_ratio > 0.0)) {
        target_ratio = compression::MODERATE;
    }

    // The epsilon keeps 5 * 0.4 at 2 despite binary rounding
    double wanted = std::ceil(static_cast<double>(sentences.size()) * target_ratio - 1e-9);
    size_t keep = static_cast<size_t>(std::max(1.0, wanted));
    if (keep > sentences.size()) keep = sentences.size();

    std::vector<ScoredSentence> scored = score_sentences(sentences);

    std::stable_sort(scored.begin(), scored.end(),
        [](const ScoredSentence& a, const ScoredSentence& b) { return a.score > b.score; });
    scored.resize(keep);

    std::sort(scored.begin(), scored.end(),
        [](const ScoredSentence& a, const ScoredSentence& b) { return a.index < b.index; });

    std::vector<std::string> selected;
    selected.reserve(scored.size());
    for (size_t i = 0; i < scored.size(); ++i) {
        selected.push_back(scored[i].text);
    }

    LOG_DEBUG("[Summarizer] Kept %zu of %zu sentences (ratio %.2f)", keep, sentences.size(), target_ratio);
    return join(selected, " ");
}

std::string ExtractiveSummarizer::summarize_items(const std::vector<ContextItem>& items,
                                                  size_t target_tokens,
                                                  const TokenEstimator& estimator) const
{
    if (items.empty()) return "";

    std::vector<ContextItem> sorted = items;
    std::stable_sort(sorted.begin(), sorted.end(), older_first);

    std::vector<const ContextItem*> earlier;
    std::vector<const ContextItem*> system_notes;
    std::vector<const ContextItem*> knowledge;
    std::vector<bool> recent_mask(sorted.size(), false);

    size_t inputs_taken = 0;
    size_t replies_taken = 0;
    for (size_t i = sorted.size(); i-- > 0;) {
        const ContextItem& item = sorted[i];
        if (item.kind == ItemKind::INPUT && inputs_taken < options_.recent_items) {
            recent_mask[i] = true;
            ++inputs_taken;
        } else if (item.kind == ItemKind::REPLY && replies_taken < options_.recent_items) {
            recent_mask[i] = true;
            ++replies_taken;
        }
    }

    std::vector<const ContextItem*> recent;
    for (size_t i = 0; i < sorted.size(); ++i) {
        const ContextItem& item = sorted[i];
        if (recent_mask[i]) {
            recent.push_back(&item);
        } else if (item.kind == ItemKind::SUMMARY || item.summarized) {
            earlier.push_back(&item);
        } else if (item.kind == ItemKind::SYSTEM_NOTE) {
            system_notes.push_back(&item);
        } else if (item.kind == ItemKind::KNOWLEDGE) {
            knowledge.push_back(&item);
        }
    }

    if (system_notes.size() > options_.system_items) {
        system_notes.erase(system_notes.begin(),
                           system_notes.end() - static_cast<std::ptrdiff_t>(options_.system_items));
    }

    std::vector<std::string> parts;

    std::string earlier_text = summarize(join_contents(earlier), options_.recent_ratio);
    if (!earlier_text.empty()) parts.push_back("Earlier: " + earlier_text);

    std::string recent_text = summarize(join_contents(recent), options_.recent_ratio);
    if (!recent_text.empty()) parts.push_back("Recent: " + recent_text);

    std::string system_text = join_contents(system_notes);
    if (!system_text.empty()) parts.push_back("Context: " + system_text);

    std::string knowledge_text = summarize(join_contents(knowledge), options_.knowledge_ratio);
    if (!knowledge_text.empty()) parts.push_back("Knowledge: " + knowledge_text);

    std::string summary = join(parts, " | ");
    size_t heuristic_tokens = estimator.estimate(summary);
    summary = truncate_to_tokens(summary, target_tokens, estimator);

    if (heuristic_tokens > target_tokens) {
        LOG_DEBUG("[Summarizer] Digest truncated from %zu to %zu tokens", heuristic_tokens, estimator.estimate(summary));
    }
    return summary;
}

std::string ExtractiveSummarizer::truncate_to_tokens(const std::string& text,
                                                     size_t target_tokens,
                                                     const TokenEstimator& estimator)
{
    if (estimator.estimate(text) <= target_tokens) {
        return text;
    }

    size_t max_chars = estimator.max_chars_for(target_tokens);
    size_t marker_chars = utf8_length(TRUNCATION_MARKER);
    if (max_chars <= marker_chars) {
        return utf8_prefix(text, max_chars);
    }
    return rtrim(utf8_prefix(text, max_chars - marker_chars)) + TRUNCATION_MARKER;
}

} // namespace ctxkeep
