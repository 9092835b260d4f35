#include "hipot_sequence.hpp"
#include "relay_board.hpp"
#include "relay_map.hpp"
#include "bench_clock.hpp"
#include <cstdio>

HipotSequence::HipotSequence(RelayBoard& relays, Ar3865& hipot, Clock& clock)
    : relays_(relays), hipot_(&hipot), clock_(clock) {}

void HipotSequence::release_path() {
    if (!relays_.set_relay(RELAY_MAP::HIPOT_HV_RELAY, false)) {
        relays_.all_off();
    }
    relays_.set_relay(RELAY_MAP::HIPOT_RETURN_RELAY, false);
    clock_.sleep_ms(HIPOT_TIMING::OPEN_RELAY_MS);
}

HipotRunResult HipotSequence::run(const HipotRunOptions& options) {
    HipotRunResult result;

    if (!relays_.is_ready()) {
        printf("[HIPOT] Warning: relay board not ready before test\r\n");
    }
    relays_.all_off();
    clock_.sleep_ms(HIPOT_TIMING::PRE_TEST_OPEN_MS);

    if (!hipot_->reset()) {
        result.message = "Hipot tester not responding";
        printf("[HIPOT] %s\r\n", result.message.c_str());
        return result;
    }
    clock_.sleep_ms(HIPOT_TIMING::POST_RESET_MS);

    std::string idn;
    if (!hipot_->identify(idn)) {
        printf("[HIPOT] Warning: *IDN? unanswered after reset\r\n");
    }

    if (!relays_.is_ready()) {
        result.message = "Relay board not ready";
        return result;
    }
    RELAY_MAP::close_hipot_path(relays_, clock_);

    if (!hipot_->run_from_file(options.file_index, options.test_duration_ms, result.detail)) {
        result.message = "No result from hipot tester";
        printf("[HIPOT] %s, opening relays\r\n", result.message.c_str());
        if (!options.keep_relay_closed) {
            relays_.all_off();
        }
        return result;
    }

    if (options.reset_after_test && !hipot_->reset()) {
        printf("[HIPOT] Warning: reset after test failed\r\n");
    }

    if (!options.keep_relay_closed) {
        release_path();
    }

    result.completed = true;
    result.passed = result.detail.passed;
    if (result.passed) {
        result.message = "Hipot passed";
    } else if (result.detail.has_fields) {
        result.message = "Hipot failed: " + result.detail.status;
    } else {
        result.message = "Hipot failed";
    }
    return result;
}

bool HipotSequence::close_relay() {
    if (!relays_.set_relay(RELAY_MAP::HIPOT_RETURN_RELAY, true)) {
        return false;
    }
    clock_.sleep_ms(HIPOT_TIMING::CLOSE_RELAY_MS);
    return true;
}

bool HipotSequence::open_relays() {
    bool ok = relays_.set_relay(RELAY_MAP::HIPOT_RETURN_RELAY, false);
    if (!relays_.set_relay(RELAY_MAP::HIPOT_HV_RELAY, false) || !ok) {
        relays_.all_off();
    }
    clock_.sleep_ms(HIPOT_TIMING::OPEN_RELAY_MS);
    return true;
}
