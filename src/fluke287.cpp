#include "fluke287.hpp"
#include "serial_port.hpp"
#include "bench_clock.hpp"
#include "utils.hpp"
#include <cstdio>
#include <vector>

bool Fluke287::init() {
    connected_ = false;
    if (!open_port()) {
        printf("[METER] Fluke 287 port open failed\r\n");
        return false;
    }

    MeterReading reading;
    if (!read_value(reading, 2)) {
        printf("[METER] Fluke 287 not responding at %lu baud\r\n",
               static_cast<unsigned long>(baudrate_));
        return false;
    }

    connected_ = true;
    printf("[METER] Fluke 287 connected (%s %s)\r\n",
           reading.raw.c_str(), reading.unit.c_str());
    return true;
}

bool Fluke287::send_command(const std::string& command, std::string& response) {
    response.clear();
    if (!port_ || !port_->is_open()) {
        return false;
    }

    port_->flush_input();
    port_->write_line(command, "\r");

    // Reply ends at the second CR (ack line + data line)
    uint8_t cr_count = 0;
    uint8_t c;
    while (cr_count < 2 && response.size() < 128) {
        if (!port_->read_byte(c, timeout_ms_)) {
            break;
        }
        response += static_cast<char>(c);
        if (c == '\r') {
            cr_count++;
        }
    }

    return !response.empty();
}

bool Fluke287::parse_qm_response(const std::string& response, Fluke287Measurement& out,
                                 std::string& error) {
    if (response.empty()) {
        error = "Empty response";
        return false;
    }

    std::vector<std::string> parts = utils::split(response, '\r', true);
    if (parts.size() != 3) {
        error = "Expected ack and data line";
        return false;
    }

    out.ack = utils::trim(parts[0]);
    if (out.ack.empty() || out.ack[0] != FLUKE287::ACK_OK) {
        error = "Meter ack " + out.ack;
        return false;
    }

    std::vector<std::string> fields = utils::split(utils::trim(parts[1]), ',', true);
    if (fields.size() != 4) {
        error = "Expected 4 fields in measurement";
        return false;
    }

    if (!utils::parse_float(utils::trim(fields[0]), out.value)) {
        error = "Invalid value: " + fields[0];
        return false;
    }
    out.unit = utils::trim(fields[1]);
    out.state = utils::trim(fields[2]);
    out.attribute = utils::trim(fields[3]);
    return true;
}

bool Fluke287::read_value(MeterReading& reading, uint8_t max_retries) {
    if (max_retries == 0) {
        max_retries = 1;
    }

    for (uint8_t attempt = 0; attempt < max_retries; attempt++) {
        std::string response;
        if (send_command(FLUKE287::CMD_QUERY_MEASUREMENT, response)) {
            Fluke287Measurement m;
            std::string error;
            if (parse_qm_response(response, m, error)) {
                reading.raw = utils::trim(utils::split(response, '\r', true)[1]);
                reading.unit = m.unit;
                reading.mode = m.state;
                reading.is_overload = m.value >= FLUKE287::OVERLOAD_THRESHOLD ||
                                      m.value <= -FLUKE287::OVERLOAD_THRESHOLD;
                reading.has_value = !reading.is_overload;
                reading.value = reading.has_value ? m.value : 0.0f;
                return true;
            }
            printf("[METER] Fluke 287 parse error (attempt %u): %s\r\n",
                   attempt + 1, error.c_str());
        }

        if (attempt + 1 < max_retries) {
            clock_->sleep_ms(METER_CONFIG::RETRY_DELAY_MS);
        }
    }

    return false;
}
