/*
 * ctxkeep C++ - Clock and identifier sources
 *
 * Injected into SummaryEngine so timestamps and item ids are reproducible
 * in tests and replays.
 */
#ifndef ctxkeep_CONTEXT_CLOCK_HPP
#define ctxkeep_CONTEXT_CLOCK_HPP

#include <atomic>
#include <cstdint>
#include <string>

namespace ctxkeep {

class Clock {
public:
    virtual ~Clock() {}
    virtual int64_t now_ms() = 0;   // unix ms
};

class SystemClock : public Clock {
public:
    int64_t now_ms() override;
};

// Manually advanced clock; each read returns the current value.
class ManualClock : public Clock {
public:
    explicit ManualClock(int64_t start_ms = 1700000000000LL) : now_(start_ms) {}

    int64_t now_ms() override { return now_.load(); }
    void set(int64_t ms) { now_.store(ms); }
    void advance(int64_t ms) { now_.fetch_add(ms); }

private:
    std::atomic<int64_t> now_;
};

class IdSource {
public:
    virtual ~IdSource() {}
    virtual std::string next_id(const std::string& consumer_id,
                                const std::string& content,
                                int64_t timestamp_ms) = 0;
};

// 16 hex digits of SHA-256(consumer:content:timestamp:counter)
class HashIdSource : public IdSource {
public:
    HashIdSource() : counter_(0) {}
    std::string next_id(const std::string& consumer_id,
                        const std::string& content,
                        int64_t timestamp_ms) override;

private:
    std::atomic<uint64_t> counter_;
};

// "<prefix>1", "<prefix>2", ...
class SequentialIdSource : public IdSource {
public:
    explicit SequentialIdSource(const std::string& prefix = "item-") : prefix_(prefix), counter_(0) {}
    std::string next_id(const std::string& consumer_id,
                        const std::string& content,
                        int64_t timestamp_ms) override;

private:
    std::string prefix_;
    std::atomic<uint64_t> counter_;
};

} // namespace ctxkeep

#endif // ctxkeep_CONTEXT_CLOCK_HPP
