#ifndef ctxkeep_CONTEXT_TOKEN_ESTIMATOR_HPP
#define ctxkeep_CONTEXT_TOKEN_ESTIMATOR_HPP

#include <ctxkeep/context/types.hpp>
#include <string>
#include <vector>

namespace ctxkeep {

// Deterministic token approximation: ceil(code points / chars_per_token),
// 0 for empty text and at least 1 otherwise.
class TokenEstimator {
public:
    static constexpr int DEFAULT_CHARS_PER_TOKEN = 4;

    explicit TokenEstimator(int chars_per_token = DEFAULT_CHARS_PER_TOKEN);

    size_t estimate(const std::string& text) const;

    // Sum of the items' token_count fields
    static size_t total(const std::vector<ContextItem>& items);

    // Longest text (in code points) whose estimate stays within `tokens`
    size_t max_chars_for(size_t tokens) const;

    int chars_per_token() const { return chars_per_token_; }

private:
    int chars_per_token_;
};

} // namespace ctxkeep

#endif // ctxkeep_CONTEXT_TOKEN_ESTIMATOR_HPP
