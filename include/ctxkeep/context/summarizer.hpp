/*
 * ctxkeep C++ - Extractive Summarizer
 *
 * Reduces text by selecting verbatim sentences. Nothing is paraphrased, so a
 * summary never contains wording that was not in the source.
 *
 * Scoring per sentence:
 *   sum(frequency of non-stop words) / word count
 *   x1.5 first sentence, else x1.3 last, else x1.2 within the first 20%
 *   x1.1 for 10..30 words
 *   x1.3 if any preserve pattern matches (pronouns, actions, status, intent)
 *
 * The top ceil(n * ratio) sentences are emitted in their original order.
 */
#ifndef ctxkeep_CONTEXT_SUMMARIZER_HPP
#define ctxkeep_CONTEXT_SUMMARIZER_HPP

#include <ctxkeep/context/types.hpp>
#include <ctxkeep/context/token_estimator.hpp>
#include <map>
#include <regex>
#include <set>
#include <string>
#include <vector>

namespace ctxkeep {

// Named compression ratios (fraction of sentences kept)
namespace compression {
    constexpr double AGGRESSIVE = 0.2;  // very long content
    constexpr double MODERATE = 0.4;    // default
    constexpr double LIGHT = 0.6;       // important content
    constexpr double MINIMAL = 0.8;     // near-critical content
}

struct SummarizerOptions {
    size_t min_chars;           // shorter input is returned unchanged
    size_t min_sentences;       // fewer sentences are returned unchanged
    size_t recent_items;        // input and reply items each taken into "Recent:"
    double recent_ratio;
    size_t system_items;        // system notes copied verbatim into "Context:"
    double knowledge_ratio;

    SummarizerOptions()
        : min_chars(100)
        , min_sentences(3)
        , recent_items(3)
        , recent_ratio(0.5)
        , system_items(2)
        , knowledge_ratio(0.3) {}
};

struct ScoredSentence {
    std::string text;
    double score;
    size_t index;               // position in the source

    ScoredSentence() : score(0.0), index(0) {}
};

class ExtractiveSummarizer {
public:
    static const char* const TRUNCATION_MARKER;

    ExtractiveSummarizer();
    explicit ExtractiveSummarizer(const SummarizerOptions& options);

    // Single text. Short or malformed input comes back unchanged.
    std::string summarize(const std::string& text, double target_ratio = compression::MODERATE) const;

    // Several items into one labeled digest ("Earlier:", "Recent:", "Context:",
    // "Knowledge:" joined by " | "). The result never estimates above
    // target_tokens; it is hard-truncated with TRUNCATION_MARKER if needed.
    std::string summarize_items(const std::vector<ContextItem>& items,
                                size_t target_tokens,
                                const TokenEstimator& estimator) const;

    // Split after '.', '!' or '?' when followed by whitespace
    static std::vector<std::string> split_sentences(const std::string& text);

    // Lowercased word runs ([A-Za-z0-9_] and any non-ASCII byte)
    static std::vector<std::string> tokenize(const std::string& text);

    std::vector<ScoredSentence> score_sentences(const std::vector<std::string>& sentences) const;

    bool is_stop_word(const std::string& word) const;
    bool matches_preserve_pattern(const std::string& sentence) const;

    // Cut text so that its estimate is <= target_tokens
    static std::string truncate_to_tokens(const std::string& text,
                                          size_t target_tokens,
                                          const TokenEstimator& estimator);

    const SummarizerOptions& options() const { return options_; }

private:
    SummarizerOptions options_;
    std::set<std::string> stop_words_;
    std::vector<std::regex> preserve_patterns_;

    void init_vocabulary();
    double score_sentence(const std::string& sentence,
                          const std::map<std::string, size_t>& word_freq,
                          size_t position, size_t total) const;
};

} // namespace ctxkeep

#endif // ctxkeep_CONTEXT_SUMMARIZER_HPP
