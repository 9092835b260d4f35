#include "multimeter.hpp"
#include "serial_port.hpp"
#include "bench_clock.hpp"
#include "utils.hpp"

const char* meter_type_name(MeterType type) {
    switch (type) {
        case MeterType::FLUKE287:
            return "FLUKE287";
        case MeterType::UT61E_PLUS:
            return "UT61E+";
    }
    return "UNKNOWN";
}

bool parse_meter_type(const std::string& name, MeterType& out) {
    std::string n = utils::to_upper(utils::trim(name));
    if (n == "FLUKE287" || n == "FLUKE" || n == "287") {
        out = MeterType::FLUKE287;
        return true;
    }
    if (n == "UT61E" || n == "UT61E+" || n == "UT61EP" || n == "UT61EPLUS") {
        out = MeterType::UT61E_PLUS;
        return true;
    }
    return false;
}

void Multimeter::setup(SerialPort* port, Clock* clock, uint32_t baudrate, uint32_t timeout_ms) {
    port_ = port;
    clock_ = clock;
    baudrate_ = baudrate;
    timeout_ms_ = timeout_ms;
    connected_ = false;
}

bool Multimeter::open_port() {
    if (!port_) {
        return false;
    }
    SerialConfig config;
    config.baudrate = baudrate_;
    return port_->open(config);
}

void Multimeter::flush_buffer() {
    if (port_ && port_->is_open()) {
        port_->flush_input();
    }
}

bool Multimeter::read_resistance(float& ohms, uint8_t average_count) {
    if (average_count == 0) {
        average_count = 1;
    }

    float sum = 0.0f;
    uint8_t taken = 0;
    for (uint8_t i = 0; i < average_count; i++) {
        MeterReading reading;
        if (!read_value(reading) || !reading.has_value) {
            continue;
        }
        sum += reading.value;
        taken++;
    }

    if (taken == 0) {
        return false;
    }
    ohms = sum / taken;
    return true;
}
