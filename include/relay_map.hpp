#ifndef RELAY_MAP_HPP
#define RELAY_MAP_HPP

#include <cstdint>
#include <cstddef>
#include <string>

class RelayBoard;
class Clock;

// One resistance measurement across the element connector.
// Relays are closed in the listed order
struct MeasurementPosition {
    const char* name;         // "Pin 1 to 6"
    const char* key;          // "1to6"
    uint8_t relays[3];
    uint8_t num_relays;
    uint16_t pre_close_ms;    // wait after all-off before closing
    uint16_t extra_settle_ms; // added to the caller's close delay
};

namespace RELAY_MAP {
    constexpr size_t NUM_POSITIONS = 3;

    inline constexpr MeasurementPosition POSITIONS[NUM_POSITIONS] = {
        {"Pin 1 to 6", "1to6", {4, 0, 0}, 1, 100, 3000},
        {"Pin 2 to 5", "2to5", {0, 4, 1}, 3, 50, 0},
        {"Pin 3 to 4", "3to4", {2, 3, 0}, 2, 50, 0},
    };

    // Hipot path: the return relay closes first, then the HV relay
    constexpr uint8_t HIPOT_RETURN_RELAY = 7;
    constexpr uint8_t HIPOT_HV_RELAY = 6;
    constexpr uint32_t HIPOT_RETURN_SETTLE_MS = 500;
    constexpr uint32_t HIPOT_HV_SETTLE_MS = 3000;

    constexpr uint32_t DEFAULT_CLOSE_DELAY_MS = 200;
    constexpr uint32_t DEFAULT_OPEN_DELAY_MS = 100;

    // Logical mask of a position's relays
    uint8_t position_mask(const MeasurementPosition& pos);

    // Case-insensitive lookup by key ("1to6", "PIN1TO6"). nullptr if unknown
    const MeasurementPosition* find_position(const std::string& key);

    // all-off, pre-close wait, close relays in order, wait extra settle + delay
    void close_position(RelayBoard& relays, Clock& clock, const MeasurementPosition& pos,
                        uint32_t delay_ms = DEFAULT_CLOSE_DELAY_MS);

    // all-off, wait delay
    void open_position(RelayBoard& relays, Clock& clock,
                       uint32_t delay_ms = DEFAULT_OPEN_DELAY_MS);

    // Close the hipot return and HV relays with their settle times
    void close_hipot_path(RelayBoard& relays, Clock& clock);
}

#endif // RELAY_MAP_HPP
