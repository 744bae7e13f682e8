#include <ctxkeep/context/clock.hpp>
#include <ctxkeep/core/utils.hpp>

#include <sstream>

namespace ctxkeep {

int64_t SystemClock::now_ms() {
    return current_timestamp_ms();
}

std::string HashIdSource::next_id(const std::string& consumer_id,
                                  const std::string& content,
                                  int64_t timestamp_ms) {
    uint64_t n = ++counter_;
    std::ostringstream seed;
    seed << consumer_id << ':' << content << ':' << timestamp_ms << ':' << n;
    return sha256_hex(seed.str()).substr(0, 16);
}

std::string SequentialIdSource::next_id(const std::string& /*consumer_id*/,
                                        const std::string& /*content*/,
                                        int64_t /*timestamp_ms*/) {
    return prefix_ + std::to_string(++counter_);
}

} // namespace ctxkeep
