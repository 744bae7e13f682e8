#include <ctxkeep/context/token_estimator.hpp>
#include <ctxkeep/core/utils.hpp>

namespace ctxkeep {

TokenEstimator::TokenEstimator(int chars_per_token)
    : chars_per_token_(chars_per_token > 0 ? chars_per_token : DEFAULT_CHARS_PER_TOKEN)
{}

size_t TokenEstimator::estimate(const std::string& text) const {
    if (text.empty()) return 0;
    size_t chars = utf8_length(text);
    size_t per = static_cast<size_t>(chars_per_token_);
    size_t tokens = (chars + per - 1) / per;
    return tokens > 0 ? tokens : 1;
}

size_t TokenEstimator::total(const std::vector<ContextItem>& items) {
    size_t sum = 0;
    for (size_t i = 0; i < items.size(); ++i) {
        sum += items[i].token_count;
    }
    return sum;
}

size_t TokenEstimator::max_chars_for(size_t tokens) const {
    return tokens * static_cast<size_t>(chars_per_token_);
}

} // namespace ctxkeep
