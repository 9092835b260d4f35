#include "relay_map.hpp"
#include "relay_board.hpp"
#include "bench_clock.hpp"
#include "utils.hpp"
#include <cstdio>

namespace RELAY_MAP {

uint8_t position_mask(const MeasurementPosition& pos) {
    uint8_t mask = 0;
    for (uint8_t i = 0; i < pos.num_relays; i++) {
        mask |= (1u << pos.relays[i]);
    }
    return mask;
}

const MeasurementPosition* find_position(const std::string& key) {
    std::string k = utils::to_upper(utils::trim(key));
    if (k.compare(0, 3, "PIN") == 0) {
        k = k.substr(3);
    }
    for (size_t i = 0; i < NUM_POSITIONS; i++) {
        if (utils::iequals(k, POSITIONS[i].key)) {
            return &POSITIONS[i];
        }
    }
    return nullptr;
}

void close_position(RelayBoard& relays, Clock& clock, const MeasurementPosition& pos,
                    uint32_t delay_ms) {
    relays.all_off();
    clock.sleep_ms(pos.pre_close_ms);

    for (uint8_t i = 0; i < pos.num_relays; i++) {
        relays.set_relay(pos.relays[i], true);
    }

    clock.sleep_ms(pos.extra_settle_ms + delay_ms);
    printf("[RELAY] %s closed (mask 0x%02X)\r\n", pos.name, relays.state());
}

void open_position(RelayBoard& relays, Clock& clock, uint32_t delay_ms) {
    relays.all_off();
    clock.sleep_ms(delay_ms);
}

void close_hipot_path(RelayBoard& relays, Clock& clock) {
    relays.set_relay(HIPOT_RETURN_RELAY, true);
    clock.sleep_ms(HIPOT_RETURN_SETTLE_MS);
    relays.set_relay(HIPOT_HV_RELAY, true);
    clock.sleep_ms(HIPOT_HV_SETTLE_MS);
    printf("[RELAY] Hipot path closed (mask 0x%02X)\r\n", relays.state());
}

} // namespace RELAY_MAP
