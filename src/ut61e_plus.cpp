#include "ut61e_plus.hpp"
#include "serial_port.hpp"
#include "bench_clock.hpp"
#include "utils.hpp"
#include <cstdio>
#include <cstring>

namespace {

const Ut61eModeInfo MODE_TABLE[] = {
    {0x00, "AC Voltage", "V"},
    {0x01, "AC mV", "mV"},
    {0x02, "DC Voltage", "V"},
    {0x03, "DC mV", "mV"},
    {0x04, "Frequency", "Hz"},
    {0x05, "Duty Cycle", "%"},
    {0x06, "Resistance", "OHM"},
    {0x07, "Continuity", "OHM"},
    {0x08, "Diode", "V"},
    {0x09, "Capacitance", "nF"},
    {0x0A, "Temperature C", "C"},
    {0x0B, "Temperature F", "F"},
    {0x0C, "DC uA", "uA"},
    {0x0D, "AC uA", "uA"},
    {0x0E, "DC mA", "mA"},
    {0x0F, "AC mA", "mA"},
    {0x10, "DC A", "A"},
    {0x11, "AC A", "A"},
};

// 220, 2.2k, 22k, 220k, 2.2M, 22M, 220M ohm ranges
const float RESISTANCE_SCALE[] = {1.0f, 1e3f, 1e3f, 1e3f, 1e6f, 1e6f, 1e6f};

} // namespace

uint16_t Ut61ePlus::checksum(const uint8_t* data, size_t len) {
    uint16_t sum = 0;
    for (size_t i = 0; i < len; i++) {
        sum = static_cast<uint16_t>(sum + data[i]);
    }
    return sum;
}

const Ut61eModeInfo* Ut61ePlus::find_mode(uint8_t code) {
    for (const auto& info : MODE_TABLE) {
        if (info.code == code) {
            return &info;
        }
    }
    return nullptr;
}

float Ut61ePlus::resistance_scale(uint8_t range) {
    if (range >= sizeof(RESISTANCE_SCALE) / sizeof(RESISTANCE_SCALE[0])) {
        return 1.0f;
    }
    return RESISTANCE_SCALE[range];
}

bool Ut61ePlus::decode_frame(const uint8_t* frame, size_t len, Ut61eFrame& out,
                             std::string& error) {
    using namespace UT61E_PLUS;

    if (len < FRAME_LEN) {
        error = "Short frame";
        return false;
    }
    if (frame[0] != HEADER_0 || frame[1] != HEADER_1) {
        error = "Bad header";
        return false;
    }
    if (frame[OFS_LENGTH] != MEASUREMENT_PAYLOAD_LEN) {
        error = "Unexpected payload length";
        return false;
    }

    uint16_t expected = checksum(frame, OFS_CHECKSUM);
    uint16_t received = static_cast<uint16_t>((frame[OFS_CHECKSUM] << 8) | frame[OFS_CHECKSUM + 1]);
    if (expected != received) {
        error = "Checksum mismatch";
        return false;
    }

    out.mode = frame[OFS_MODE];
    // Range is sent as an ASCII digit ('1' = 0x31) by current firmware
    uint8_t range = frame[OFS_RANGE];
    out.range = (range >= '0') ? static_cast<uint8_t>(range - '0') : range;
    std::memcpy(out.display, &frame[OFS_DISPLAY], DISPLAY_LEN);
    out.display[DISPLAY_LEN] = '\0';
    out.bar = static_cast<uint16_t>((frame[OFS_BAR] << 8) | frame[OFS_BAR + 1]);
    std::memcpy(out.flags, &frame[OFS_FLAGS], sizeof(out.flags));
    return true;
}

void Ut61ePlus::frame_to_reading(const Ut61eFrame& frame, MeterReading& reading) {
    const Ut61eModeInfo* info = find_mode(frame.mode);
    reading.mode = info ? info->name : "Unknown";
    reading.unit = info ? info->unit : "";
    reading.raw = frame.display;

    std::string text = utils::trim(frame.display);
    if (utils::icontains(text, "OL")) {
        reading.is_overload = true;
        reading.has_value = false;
        reading.value = 0.0f;
        return;
    }

    reading.is_overload = false;
    float value = 0.0f;
    reading.has_value = utils::parse_float(text, value);
    if (reading.has_value && frame.mode == UT61E_PLUS::MODE_RESISTANCE) {
        value *= resistance_scale(frame.range);
    }
    reading.value = reading.has_value ? value : 0.0f;
}

bool Ut61ePlus::init() {
    connected_ = false;
    if (!open_port()) {
        printf("[METER] UT61E+ port open failed\r\n");
        return false;
    }

    MeterReading reading;
    if (!read_value(reading, 2)) {
        printf("[METER] UT61E+ not responding\r\n");
        return false;
    }

    connected_ = true;
    printf("[METER] UT61E+ connected (%s)\r\n", reading.mode.c_str());
    return true;
}

bool Ut61ePlus::request_frame(uint8_t* frame, size_t frame_size) {
    using namespace UT61E_PLUS;

    if (!port_ || !port_->is_open() || frame_size < FRAME_LEN) {
        return false;
    }

    port_->write(REQUEST_MEASUREMENT, sizeof(REQUEST_MEASUREMENT));

    uint32_t start = clock_->now_ms();
    size_t pos = 0;
    uint8_t c;
    while (pos < FRAME_LEN) {
        uint32_t elapsed = clock_->now_ms() - start;
        if (elapsed >= timeout_ms_) {
            return false;
        }
        if (!port_->read_byte(c, timeout_ms_ - elapsed)) {
            return false;
        }

        // Resync on the two header bytes
        if (pos == 0 && c != HEADER_0) {
            continue;
        }
        if (pos == 1 && c != HEADER_1) {
            pos = (c == HEADER_0) ? 1 : 0;
            continue;
        }
        frame[pos++] = c;
    }
    return true;
}

bool Ut61ePlus::read_value(MeterReading& reading, uint8_t max_retries) {
    if (max_retries == 0) {
        max_retries = 1;
    }

    for (uint8_t attempt = 0; attempt < max_retries; attempt++) {
        uint8_t frame[UT61E_PLUS::FRAME_LEN];
        if (request_frame(frame, sizeof(frame))) {
            Ut61eFrame decoded;
            std::string error;
            if (decode_frame(frame, sizeof(frame), decoded, error)) {
                frame_to_reading(decoded, reading);
                return true;
            }
            printf("[METER] UT61E+ frame error (attempt %u): %s\r\n",
                   attempt + 1, error.c_str());
        }

        if (attempt + 1 < max_retries) {
            clock_->sleep_ms(METER_CONFIG::RETRY_DELAY_MS);
        }
    }

    return false;
}
