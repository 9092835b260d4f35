#include "measurement_sequence.hpp"
#include "relay_board.hpp"
#include "multimeter.hpp"
#include "bench_clock.hpp"
#include "utils.hpp"
#include <cstdio>

std::string MeasurementResult::reading_key(char side, size_t index) {
    std::string key;
    key += side;
    key += 'P';
    if (index < RELAY_MAP::NUM_POSITIONS) {
        key += RELAY_MAP::POSITIONS[index].key;
    }
    return key;
}

bool MeasurementResult::any_attempted() const {
    for (const auto& r : readings) {
        if (r.attempted) {
            return true;
        }
    }
    return false;
}

MeasurementSequence::MeasurementSequence(RelayBoard& relays, Multimeter* meter, Clock& clock)
    : relays_(relays), meter_(meter), clock_(clock) {}

void MeasurementSequence::set_simulated_values(const float values[RELAY_MAP::NUM_POSITIONS]) {
    for (size_t i = 0; i < RELAY_MAP::NUM_POSITIONS; i++) {
        sim_values_[i] = values[i];
    }
}

bool MeasurementSequence::read_position(size_t index, uint32_t timeout_ms, float& value) {
    if (simulate_) {
        clock_.sleep_ms(MEAS_TIMING::SIM_READ_MS);
        value = utils::round_tenths(sim_values_[index]);
        return true;
    }

    uint32_t start = clock_.now_ms();
    for (uint8_t attempt = 0; attempt < MEAS_TIMING::MAX_READ_ATTEMPTS; attempt++) {
        if (clock_.now_ms() - start >= timeout_ms) {
            break;
        }

        MeterReading reading;
        if (meter_->read_value(reading, MEAS_TIMING::READ_RETRIES) && reading.has_value) {
            value = utils::round_tenths(reading.value);
            return true;
        }

        clock_.sleep_ms(MEAS_TIMING::READ_RETRY_DELAY_MS);
    }
    return false;
}

MeasurementResult MeasurementSequence::run(const ResistanceRange& range,
                                           uint32_t timeout_per_position_ms) {
    MeasurementResult result;

    if (!simulate_) {
        if (!meter_) {
            result.hardware_error = true;
            result.message = "No meter configured";
            return result;
        }
        MeterReading check;
        if (!meter_->read_value(check, MEAS_TIMING::COMM_TEST_RETRIES)) {
            printf("[MEAS] Warning: %s did not answer the communication check\r\n",
                   meter_->get_type_name());
        }
    }

    relays_.all_off();
    clock_.sleep_ms(MEAS_TIMING::PRE_SEQUENCE_SETTLE_MS);
    if (!simulate_) {
        meter_->flush_buffer();
    }

    for (size_t i = 0; i < RELAY_MAP::NUM_POSITIONS; i++) {
        const MeasurementPosition& pos = RELAY_MAP::POSITIONS[i];
        PositionReading& reading = result.readings[i];
        reading.attempted = true;

        if (!relays_.is_ready()) {
            printf("[MEAS] %s: relay board not ready\r\n", pos.name);
            result.hardware_error = true;
            reading.value = 0.0f;
            relays_.all_off();
            continue;
        }

        RELAY_MAP::close_position(relays_, clock_, pos, MEAS_TIMING::CLOSE_DELAY_MS);
        clock_.sleep_ms(MEAS_TIMING::RELAY_SETTLE_MS);
        if (!simulate_) {
            meter_->flush_buffer();
        }

        float value = 0.0f;
        if (read_position(i, timeout_per_position_ms, value)) {
            reading.value = value;
            reading.valid = true;
            printf("[MEAS] %s: %.1f ohm\r\n", pos.name, static_cast<double>(value));
        } else {
            reading.value = 0.0f;
            result.timeout = true;
            printf("[MEAS] %s: no valid reading\r\n", pos.name);
        }

        RELAY_MAP::open_position(relays_, clock_, MEAS_TIMING::OPEN_DELAY_MS);
        clock_.sleep_ms(MEAS_TIMING::INTER_POSITION_MS);
    }

    evaluate(result, range);
    printf("[MEAS] %s: %s\r\n", result.passed ? "PASS" : "FAIL", result.message.c_str());
    return result;
}

void MeasurementSequence::evaluate(MeasurementResult& result, const ResistanceRange& range) {
    result.passed = false;

    if (result.hardware_error) {
        result.message = "Relay or meter hardware error during measurement";
        return;
    }
    if (result.timeout) {
        result.message = "Meter reading timed out - check meter connection and mode";
        return;
    }
    if (!result.any_attempted()) {
        result.message = "No measurements were completed - check hardware and connections";
        return;
    }

    if (!range.configured()) {
        result.passed = true;
        result.message = "Measurements recorded (no range configured)";
        return;
    }

    std::string failures;
    const char sides[2] = {'L', 'R'};
    for (char side : sides) {
        for (size_t i = 0; i < RELAY_MAP::NUM_POSITIONS; i++) {
            const PositionReading& r = result.readings[i];
            char buf[96];
            if (r.value == 0.0f) {
                snprintf(buf, sizeof(buf), "%s (failed/timeout)",
                         MeasurementResult::reading_key(side, i).c_str());
            } else if (!range.contains(r.value)) {
                snprintf(buf, sizeof(buf), "%s (%.1f ohm out of %g-%g ohm)",
                         MeasurementResult::reading_key(side, i).c_str(),
                         static_cast<double>(r.value), static_cast<double>(range.min_ohm),
                         static_cast<double>(range.max_ohm));
            } else {
                continue;
            }
            if (!failures.empty()) {
                failures += ", ";
            }
            failures += buf;
        }
    }

    if (failures.empty()) {
        result.passed = true;
        result.message = "All measurements within limits";
    } else {
        result.message = "Failed: " + failures;
    }
}
