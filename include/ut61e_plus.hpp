#ifndef UT61E_PLUS_HPP
#define UT61E_PLUS_HPP

#include <cstdint>
#include <cstddef>
#include <string>
#include "multimeter.hpp"

// UNI-T UT61E+ measurement protocol.
// Request: AB CD 03 5E 01 D9
// Reply:   AB CD 10 <mode> <range> <display x7> <bar x2> <flags x3> <chk hi> <chk lo>
// chk is the 16-bit sum of every byte before it
namespace UT61E_PLUS {
    constexpr uint32_t DEFAULT_BAUDRATE = 9600;
    constexpr uint32_t DEFAULT_TIMEOUT_MS = 1000;

    constexpr uint8_t HEADER_0 = 0xAB;
    constexpr uint8_t HEADER_1 = 0xCD;
    constexpr uint8_t MEASUREMENT_PAYLOAD_LEN = 0x10;
    constexpr size_t FRAME_LEN = 19;
    constexpr size_t DISPLAY_LEN = 7;

    constexpr uint8_t REQUEST_MEASUREMENT[] = {0xAB, 0xCD, 0x03, 0x5E, 0x01, 0xD9};

    // Byte offsets within a frame
    constexpr size_t OFS_LENGTH = 2;
    constexpr size_t OFS_MODE = 3;
    constexpr size_t OFS_RANGE = 4;
    constexpr size_t OFS_DISPLAY = 5;
    constexpr size_t OFS_BAR = 12;
    constexpr size_t OFS_FLAGS = 14;
    constexpr size_t OFS_CHECKSUM = 17;

    constexpr uint8_t MODE_RESISTANCE = 0x06;
    constexpr uint8_t MODE_CONTINUITY = 0x07;
}

struct Ut61eModeInfo {
    uint8_t code;
    const char* name;
    const char* unit;
};

struct Ut61eFrame {
    uint8_t mode = 0;
    uint8_t range = 0;
    char display[UT61E_PLUS::DISPLAY_LEN + 1] = {0};
    uint16_t bar = 0;
    uint8_t flags[3] = {0, 0, 0};
};

class Ut61ePlus : public Multimeter {
public:
    bool init() override;
    bool read_value(MeterReading& reading,
                    uint8_t max_retries = METER_CONFIG::DEFAULT_MAX_RETRIES) override;
    MeterType get_type() const override { return MeterType::UT61E_PLUS; }
    const char* get_type_name() const override { return "UT61E+"; }

    // Send the request and wait for one complete frame
    bool request_frame(uint8_t* frame, size_t frame_size);

    static uint16_t checksum(const uint8_t* data, size_t len);

    // Validate header, length and checksum and split the frame into fields
    static bool decode_frame(const uint8_t* frame, size_t len, Ut61eFrame& out,
                             std::string& error);

    // Turn a decoded frame into a reading (scaled to base units)
    static void frame_to_reading(const Ut61eFrame& frame, MeterReading& reading);

    // nullptr for unknown mode codes
    static const Ut61eModeInfo* find_mode(uint8_t code);

    // Multiplier applied to the display for a resistance range index
    static float resistance_scale(uint8_t range);
};

#endif // UT61E_PLUS_HPP
