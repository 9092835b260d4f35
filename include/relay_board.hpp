#ifndef RELAY_BOARD_HPP
#define RELAY_BOARD_HPP

#include <cstdint>
#include <cstddef>
#include <string>

class Clock;

namespace RELAY_CONFIG {
    constexpr uint8_t NUM_RELAYS = 8;
    constexpr uint32_t DEFAULT_PULSE_MS = 100;
    constexpr uint32_t DEFAULT_WALK_DELAY_MS = 100;
    constexpr size_t MAX_NAMED_MAPPINGS = 8;
}

// Abstract 8-bit relay output port (one bit per relay coil driver)
class RelayPort {
public:
    virtual ~RelayPort() = default;

    // Configure the port hardware. Returns false if the device does not respond
    virtual bool init() = 0;

    // Write all eight device bits at once
    virtual void write_port(uint8_t value) = 0;
    virtual uint8_t read_port() = 0;

    virtual const char* get_type_name() const = 0;
};

// On/off masks applied in one step (off first, then on)
struct RelayMapping {
    uint8_t on_mask = 0;
    uint8_t off_mask = 0;
};

struct NamedRelayMapping {
    std::string name;       // empty = unused
    RelayMapping mapping;
};

// Logical relay control on top of a RelayPort.
// Logical state bit 1 = relay energized; active_high selects how that maps
// onto the device bit
class RelayBoard {
public:
    void setup(RelayPort* port, Clock* clock, bool active_high = true);

    // Initialize the port and drive every relay off
    bool init();
    void shutdown();

    bool set_relay(uint8_t relay, bool on);

    // Off list is applied before the on list; indices outside 0-7 are skipped
    void set_many(const uint8_t* on, size_t on_count,
                  const uint8_t* off, size_t off_count);
    void apply_mapping(const RelayMapping& mapping);
    void set_state(uint8_t logical_mask);

    // Named mappings survive setup(). Defining an existing name (any case)
    // replaces it; false when the table is full
    bool add_named_mapping(const std::string& name, const RelayMapping& mapping);
    bool find_named_mapping(const std::string& name, RelayMapping& mapping) const;
    bool apply_named_mapping(const std::string& name);

    void all_off();
    void all_on();

    bool pulse(uint8_t relay, uint32_t on_ms = RELAY_CONFIG::DEFAULT_PULSE_MS);

    // Energize each relay in turn for delay_ms
    void self_test_walk(uint32_t delay_ms = RELAY_CONFIG::DEFAULT_WALK_DELAY_MS);

    bool is_on(uint8_t relay) const;
    uint8_t state() const { return state_; }
    bool is_ready() const { return port_ != nullptr && initialized_; }
    bool is_active_high() const { return active_high_; }
    const char* port_name() const;

private:
    RelayPort* port_ = nullptr;
    Clock* clock_ = nullptr;
    bool active_high_ = true;
    bool initialized_ = false;
    uint8_t state_ = 0;  // logical cache
    NamedRelayMapping named_[RELAY_CONFIG::MAX_NAMED_MAPPINGS];

    void write_state();
};

#endif // RELAY_BOARD_HPP
