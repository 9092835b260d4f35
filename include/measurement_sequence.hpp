#ifndef MEASUREMENT_SEQUENCE_HPP
#define MEASUREMENT_SEQUENCE_HPP

#include <cstdint>
#include <string>
#include "relay_map.hpp"
#include "element_config.hpp"

class RelayBoard;
class Multimeter;
class Clock;

namespace MEAS_TIMING {
    constexpr uint32_t PRE_SEQUENCE_SETTLE_MS = 200;
    constexpr uint32_t CLOSE_DELAY_MS = 200;
    constexpr uint32_t RELAY_SETTLE_MS = 2000;
    constexpr uint32_t READ_RETRY_DELAY_MS = 500;
    constexpr uint8_t MAX_READ_ATTEMPTS = 10;
    constexpr uint8_t READ_RETRIES = 3;
    constexpr uint8_t COMM_TEST_RETRIES = 2;
    constexpr uint32_t OPEN_DELAY_MS = 100;
    constexpr uint32_t INTER_POSITION_MS = 1000;
    constexpr uint32_t SIM_READ_MS = 500;
    constexpr uint32_t DEFAULT_POSITION_TIMEOUT_MS = 10000;

    constexpr float SIM_VALUES[RELAY_MAP::NUM_POSITIONS] = {6.8f, 7.2f, 6.5f};
}

struct PositionReading {
    float value = 0.0f;     // ohms, rounded to 0.1; 0.0 when no reading
    bool valid = false;
    bool attempted = false;
};

// One measurement pass. Left and right legs share each position's value
struct MeasurementResult {
    bool passed = false;
    bool timeout = false;
    bool hardware_error = false;
    std::string message;
    PositionReading readings[RELAY_MAP::NUM_POSITIONS];

    // "LP1to6", "RP3to4", ...
    static std::string reading_key(char side, size_t index);
    bool any_attempted() const;
};

class MeasurementSequence {
public:
    MeasurementSequence(RelayBoard& relays, Multimeter* meter, Clock& clock);

    void set_meter(Multimeter* meter) { meter_ = meter; }
    void set_simulate(bool simulate) { simulate_ = simulate; }
    bool simulate() const { return simulate_; }
    void set_simulated_values(const float values[RELAY_MAP::NUM_POSITIONS]);
    const float* simulated_values() const { return sim_values_; }

    // Walk every position, read the meter and grade against range
    MeasurementResult run(const ResistanceRange& range,
                          uint32_t timeout_per_position_ms = MEAS_TIMING::DEFAULT_POSITION_TIMEOUT_MS);

    // Fill passed and message from the readings
    static void evaluate(MeasurementResult& result, const ResistanceRange& range);

private:
    RelayBoard& relays_;
    Multimeter* meter_;
    Clock& clock_;
    bool simulate_ = false;
    float sim_values_[RELAY_MAP::NUM_POSITIONS] = {
        MEAS_TIMING::SIM_VALUES[0], MEAS_TIMING::SIM_VALUES[1], MEAS_TIMING::SIM_VALUES[2]};

    bool read_position(size_t index, uint32_t timeout_ms, float& value);
};

#endif // MEASUREMENT_SEQUENCE_HPP
