#ifndef HIPOT_SEQUENCE_HPP
#define HIPOT_SEQUENCE_HPP

#include <cstdint>
#include <string>
#include "ar3865.hpp"

class RelayBoard;
class Clock;

namespace HIPOT_TIMING {
    constexpr uint32_t PRE_TEST_OPEN_MS = 100;
    constexpr uint32_t POST_RESET_MS = 200;
    constexpr uint32_t CLOSE_RELAY_MS = 200;
    constexpr uint32_t OPEN_RELAY_MS = 100;
    constexpr uint32_t DEFAULT_TEST_DURATION_MS = 5000;
}

struct HipotRunOptions {
    int32_t file_index = 1;
    bool keep_relay_closed = false;   // leave the path closed for a retry
    bool reset_after_test = true;
    uint32_t test_duration_ms = HIPOT_TIMING::DEFAULT_TEST_DURATION_MS;
};

struct HipotRunResult {
    bool completed = false;   // instrument ran and returned a record
    bool passed = false;
    std::string message;
    HipotResult detail;
};

// Hipot attempt: routes the HV path through the relay matrix around one
// instrument run
class HipotSequence {
public:
    HipotSequence(RelayBoard& relays, Ar3865& hipot, Clock& clock);

    void set_hipot(Ar3865& hipot) { hipot_ = &hipot; }

    HipotRunResult run(const HipotRunOptions& options);

    // Close the return relay ahead of a series of retries
    bool close_relay();

    // Open both hipot relays
    bool open_relays();

private:
    RelayBoard& relays_;
    Ar3865* hipot_;
    Clock& clock_;

    void release_path();
};

#endif // HIPOT_SEQUENCE_HPP
