#ifndef BENCH_CLOCK_HPP
#define BENCH_CLOCK_HPP

#include <cstdint>

// Monotonic millisecond time source and blocking delay.
// Sequences take all settle and dwell waits through this interface
class Clock {
public:
    virtual ~Clock() = default;

    virtual uint32_t now_ms() = 0;
    virtual void sleep_ms(uint32_t ms) = 0;
};

#endif // BENCH_CLOCK_HPP
