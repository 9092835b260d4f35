#include "sim_devices.hpp"
#include "ut61e_plus.hpp"
#include "utils.hpp"
#include <cstdio>
#include <cstring>

bool SimSerialPort::open(const SerialConfig& config) {
    config_ = config;
    open_ = true;
    tx_.clear();
    rx_.clear();
    return true;
}

void SimSerialPort::write(const uint8_t* data, size_t len) {
    if (!open_) {
        return;
    }
    tx_.append(reinterpret_cast<const char*>(data), len);
    handle_tx(tx_);
}

bool SimSerialPort::read_byte(uint8_t& out, uint32_t timeout_ms) {
    (void)timeout_ms;
    if (rx_.empty()) {
        return false;
    }
    out = rx_.front();
    rx_.pop_front();
    return true;
}

void SimSerialPort::respond(const std::string& bytes) {
    for (char c : bytes) {
        rx_.push_back(static_cast<uint8_t>(c));
    }
}

void SimHipotPort::handle_tx(std::string& tx) {
    size_t pos;
    while ((pos = tx.find('\n')) != std::string::npos) {
        std::string line = utils::trim(tx.substr(0, pos));
        tx.erase(0, pos + 1);
        if (!line.empty()) {
            handle_line(line);
        }
    }
}

void SimHipotPort::handle_line(const std::string& line) {
    printf("[SIM] hipot <- %s\r\n", line.c_str());
    std::string upper = utils::to_upper(line);

    if (upper == "*IDN?") {
        respond(std::string(IDN) + "\r\n");
    } else if (upper == "RD 1?") {
        respond(std::string(force_fail_ ? FAIL_RESULT : PASS_RESULT) + "\r\n");
    } else if (upper == "VOLT?") {
        respond(voltage_ + "\r\n");
    } else if (upper == "CURR:TRIP?") {
        respond(current_trip_ + "mA\r\n");
    } else if (upper == "FL?") {
        respond(file_ + "\r\n");
    } else if (upper.compare(0, 5, "VOLT ") == 0) {
        voltage_ = utils::trim(line.substr(5));
    } else if (upper.compare(0, 10, "CURR:TRIP ") == 0) {
        std::string value = utils::trim(line.substr(10));
        if (value.size() >= 2 && utils::iequals(value.substr(value.size() - 2), "mA")) {
            value = value.substr(0, value.size() - 2);
        }
        current_trip_ = value;
    } else if (upper.compare(0, 3, "FL ") == 0) {
        file_ = utils::trim(line.substr(3));
    } else if (!upper.empty() && upper.back() == '?') {
        respond("0\r\n");
    }
}

void SimMeterPort::set_position_values(const float values[RELAY_MAP::NUM_POSITIONS]) {
    for (size_t i = 0; i < RELAY_MAP::NUM_POSITIONS; i++) {
        position_values_[i] = values[i];
    }
}

float SimMeterPort::current_reading() const {
    if (relays_ && relays_->state() != 0) {
        for (size_t i = 0; i < RELAY_MAP::NUM_POSITIONS; i++) {
            if (relays_->state() == RELAY_MAP::position_mask(RELAY_MAP::POSITIONS[i])) {
                return position_values_[i];
            }
        }
    }
    return DEFAULT_RESISTANCE;
}

void SimMeterPort::handle_tx(std::string& tx) {
    // UT61E+ binary request
    const std::string request(reinterpret_cast<const char*>(UT61E_PLUS::REQUEST_MEASUREMENT),
                              sizeof(UT61E_PLUS::REQUEST_MEASUREMENT));
    size_t found = tx.find(request);
    if (found != std::string::npos) {
        tx.erase(0, found + request.size());
        uint8_t frame[UT61E_PLUS::FRAME_LEN];
        build_ut61e_resistance_frame(current_reading(), frame);
        respond(std::string(reinterpret_cast<const char*>(frame), sizeof(frame)));
        return;
    }

    // Fluke 287 text commands end in CR
    size_t pos;
    while ((pos = tx.find('\r')) != std::string::npos) {
        std::string command = utils::to_upper(utils::trim(tx.substr(0, pos)));
        tx.erase(0, pos + 1);
        if (command == "QM") {
            char buf[64];
            snprintf(buf, sizeof(buf), "0\r%.4E,OHM,NORMAL,NONE\r",
                     static_cast<double>(current_reading()));
            respond(buf);
        } else if (!command.empty()) {
            respond("1\r");
        }
    }
}

void SimRelayPort::write_port(uint8_t value) {
    if (value != value_) {
        printf("[SIM] relay port <- 0x%02X\r\n", value);
    }
    value_ = value;
}

void build_ut61e_resistance_frame(float ohms, uint8_t* frame) {
    using namespace UT61E_PLUS;

    std::memset(frame, 0, FRAME_LEN);
    frame[0] = HEADER_0;
    frame[1] = HEADER_1;
    frame[OFS_LENGTH] = MEASUREMENT_PAYLOAD_LEN;
    frame[OFS_MODE] = MODE_RESISTANCE;
    frame[OFS_RANGE] = '0';

    char display[DISPLAY_LEN + 1];
    snprintf(display, sizeof(display), "%7.2f", static_cast<double>(ohms));
    std::memcpy(&frame[OFS_DISPLAY], display, DISPLAY_LEN);

    uint16_t sum = Ut61ePlus::checksum(frame, OFS_CHECKSUM);
    frame[OFS_CHECKSUM] = static_cast<uint8_t>(sum >> 8);
    frame[OFS_CHECKSUM + 1] = static_cast<uint8_t>(sum & 0xFF);
}
