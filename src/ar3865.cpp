#include "ar3865.hpp"
#include "serial_port.hpp"
#include "bench_clock.hpp"
#include "utils.hpp"
#include <cstdio>
#include <vector>

void Ar3865::setup(SerialPort* port, Clock* clock, uint32_t baudrate, uint32_t timeout_ms) {
    port_ = port;
    clock_ = clock;
    baudrate_ = baudrate;
    timeout_ms_ = timeout_ms;
    initialized_ = false;
}

bool Ar3865::ensure_open() {
    if (!port_) {
        return false;
    }
    if (port_->is_open()) {
        return true;
    }
    SerialConfig config;
    config.baudrate = baudrate_;
    return port_->open(config);
}

bool Ar3865::init() {
    initialized_ = false;
    if (!ensure_open()) {
        printf("[HIPOT] Port open failed\r\n");
        return false;
    }

    write("RESET");
    write("*CLS");
    clear_faults();

    std::string idn;
    if (!identify(idn)) {
        printf("[HIPOT] No response to *IDN?\r\n");
        return false;
    }

    initialized_ = true;
    printf("[HIPOT] Connected: %s\r\n", idn.c_str());
    return true;
}

void Ar3865::close() {
    if (port_ && port_->is_open()) {
        port_->close();
    }
    initialized_ = false;
}

bool Ar3865::write(const std::string& command) {
    if (!ensure_open()) {
        return false;
    }
    port_->write_line(command, AR3865::LINE_TERMINATOR);
    return true;
}

bool Ar3865::query(const std::string& command, std::string& response) {
    response.clear();
    if (!write(command)) {
        return false;
    }
    std::string line;
    if (!port_->read_until(line, AR3865::RESPONSE_TERMINATOR, timeout_ms_)) {
        return false;
    }
    response = utils::trim(line);
    return true;
}

bool Ar3865::reset() {
    if (!initialized_ && !init()) {
        return false;
    }
    bool ok = write("RESET") && write("*CLS");
    return clear_faults() && ok;
}

bool Ar3865::clear_faults() {
    return write("SYST:CLE");
}

bool Ar3865::identify(std::string& idn) {
    return query("*IDN?", idn) && !idn.empty();
}

bool Ar3865::configure(const HipotConfig& config) {
    bool ok = true;

    if (config.has_voltage) {
        ok = write("VOLT " + utils::format_float(config.voltage_v)) && ok;
    }
    if (config.has_current_trip) {
        ok = write("CURR:TRIP " + utils::format_float(config.current_trip_ma) + "mA") && ok;
    }
    if (config.has_timing()) {
        float ramp = config.has_ramp ? config.ramp_s : AR3865::DEFAULT_RAMP_S;
        float dwell = config.has_dwell ? config.dwell_s : AR3865::DEFAULT_DWELL_S;
        float fall = config.has_fall ? config.fall_s : AR3865::DEFAULT_FALL_S;
        ok = write("RAMP " + utils::format_float(ramp)) && ok;
        ok = write("DWEL " + utils::format_float(dwell)) && ok;
        ok = write("FALL " + utils::format_float(fall)) && ok;
    }
    if (config.has_polarity) {
        std::string pol = utils::to_upper(utils::trim(config.polarity));
        if (pol == "POS" || pol == "NEG") {
            ok = write("POL " + pol) && ok;
        }
    }

    return ok;
}

bool Ar3865::read_config(HipotConfig& config) {
    config = HipotConfig();
    std::string response;
    bool any = false;

    if (query("VOLT?", response) && utils::parse_float(response, config.voltage_v)) {
        config.has_voltage = true;
        any = true;
    }

    if (query("CURR:TRIP?", response)) {
        std::string value = response;
        if (value.size() >= 2 && utils::iequals(value.substr(value.size() - 2), "mA")) {
            value = utils::trim(value.substr(0, value.size() - 2));
        }
        if (utils::parse_float(value, config.current_trip_ma)) {
            config.has_current_trip = true;
            any = true;
        }
    }

    return any;
}

HipotConfig Ar3865::merge_config(const HipotConfig& base, const HipotConfig& overrides) {
    HipotConfig merged = base;
    if (overrides.has_voltage) {
        merged.voltage_v = overrides.voltage_v;
        merged.has_voltage = true;
    }
    if (overrides.has_current_trip) {
        merged.current_trip_ma = overrides.current_trip_ma;
        merged.has_current_trip = true;
    }
    if (overrides.has_ramp) {
        merged.ramp_s = overrides.ramp_s;
        merged.has_ramp = true;
    }
    if (overrides.has_dwell) {
        merged.dwell_s = overrides.dwell_s;
        merged.has_dwell = true;
    }
    if (overrides.has_fall) {
        merged.fall_s = overrides.fall_s;
        merged.has_fall = true;
    }
    if (overrides.has_polarity) {
        merged.polarity = overrides.polarity;
        merged.has_polarity = true;
    }
    return merged;
}

bool Ar3865::select_file(int32_t index) {
    if (index < 1) {
        index = 1;
    }
    return write("FL " + std::to_string(index));
}

bool Ar3865::query_selected_file(int32_t& index) {
    std::string response;
    return query("FL?", response) && utils::parse_int(response, index);
}

bool Ar3865::start_test() {
    return write("TEST");
}

bool Ar3865::stop_test() {
    return write("RESET");
}

bool Ar3865::get_result(std::string& raw) {
    if (!ensure_open()) {
        return false;
    }
    port_->flush_input();
    return query("RD 1?", raw);
}

void Ar3865::parse_result(const std::string& raw, HipotResult& result) {
    result.raw = utils::trim(raw);
    result.passed = utils::icontains(result.raw, "PASS");

    std::vector<std::string> fields = utils::split(result.raw, ',', true);
    result.has_fields = false;
    if (fields.size() != AR3865::RESULT_FIELDS) {
        return;
    }

    int32_t step = 0;
    float volts = 0.0f;
    float current = 0.0f;
    float time_s = 0.0f;
    if (!utils::parse_int(utils::trim(fields[0]), step) ||
        !utils::parse_float(utils::trim(fields[3]), volts) ||
        !utils::parse_float(utils::trim(fields[4]), current) ||
        !utils::parse_float(utils::trim(fields[5]), time_s)) {
        return;
    }

    result.step = step;
    result.test_type = utils::trim(fields[1]);
    result.status = utils::trim(fields[2]);
    result.voltage = volts;
    result.current = current;
    result.time_s = time_s;
    result.has_fields = true;
}

bool Ar3865::wait_and_collect(uint32_t duration_ms, HipotResult& result) {
    clock_->sleep_ms(duration_ms + AR3865::PROCESSING_MARGIN_MS);

    std::string raw;
    bool ok = get_result(raw);
    parse_result(raw, result);

    clock_->sleep_ms(AR3865::DISCHARGE_MS);

    if (!ok) {
        printf("[HIPOT] No result from RD 1?\r\n");
    } else {
        printf("[HIPOT] Result: %s (%s)\r\n", result.raw.c_str(), result.passed ? "PASS" : "FAIL");
    }
    return ok;
}

bool Ar3865::run_from_file(int32_t file_index, uint32_t duration_ms, HipotResult& result) {
    result = HipotResult();
    if (!select_file(file_index)) {
        return false;
    }
    result.start_ms = clock_->now_ms();
    if (!start_test()) {
        return false;
    }
    printf("[HIPOT] Test started from file %ld\r\n", static_cast<long>(file_index < 1 ? 1 : file_index));
    return wait_and_collect(duration_ms, result);
}

bool Ar3865::run_once(const HipotConfig& config, uint32_t duration_ms, HipotResult& result) {
    result = HipotResult();
    if (!configure(config)) {
        return false;
    }
    result.start_ms = clock_->now_ms();
    if (!start_test()) {
        return false;
    }
    return wait_and_collect(duration_ms, result);
}

bool Ar3865::save_to_slot(int32_t slot) {
    return write("*SAV " + std::to_string(slot));
}

bool Ar3865::recall_from_slot(int32_t slot) {
    return write("*RCL " + std::to_string(slot));
}
