#include "relay_board.hpp"
#include "bench_clock.hpp"
#include "utils.hpp"
#include <cstdio>

void RelayBoard::setup(RelayPort* port, Clock* clock, bool active_high) {
    port_ = port;
    clock_ = clock;
    active_high_ = active_high;
    initialized_ = false;
    state_ = 0;
}

bool RelayBoard::init() {
    if (!port_) {
        return false;
    }
    if (!port_->init()) {
        printf("[RELAY] %s did not respond\r\n", port_->get_type_name());
        initialized_ = false;
        return false;
    }
    initialized_ = true;
    all_off();
    printf("[RELAY] %s ready (%s)\r\n", port_->get_type_name(),
           active_high_ ? "active-high" : "active-low");
    return true;
}

void RelayBoard::shutdown() {
    if (initialized_) {
        all_off();
    }
}

void RelayBoard::write_state() {
    if (!port_) {
        return;
    }
    uint8_t device_bits = active_high_ ? state_ : static_cast<uint8_t>(~state_);
    port_->write_port(device_bits);
}

bool RelayBoard::set_relay(uint8_t relay, bool on) {
    if (relay >= RELAY_CONFIG::NUM_RELAYS) {
        return false;
    }
    if (on) {
        state_ |= (1u << relay);
    } else {
        state_ &= ~(1u << relay);
    }
    write_state();
    return true;
}

void RelayBoard::set_many(const uint8_t* on, size_t on_count,
                          const uint8_t* off, size_t off_count) {
    for (size_t i = 0; i < off_count; i++) {
        if (off[i] < RELAY_CONFIG::NUM_RELAYS) {
            state_ &= ~(1u << off[i]);
        }
    }
    write_state();

    for (size_t i = 0; i < on_count; i++) {
        if (on[i] < RELAY_CONFIG::NUM_RELAYS) {
            state_ |= (1u << on[i]);
        }
    }
    write_state();
}

void RelayBoard::apply_mapping(const RelayMapping& mapping) {
    state_ &= ~mapping.off_mask;
    write_state();
    state_ |= mapping.on_mask;
    write_state();
}

bool RelayBoard::add_named_mapping(const std::string& name, const RelayMapping& mapping) {
    NamedRelayMapping* slot = nullptr;
    for (NamedRelayMapping& entry : named_) {
        if (!entry.name.empty() && utils::iequals(entry.name, name)) {
            slot = &entry;
            break;
        }
        if (!slot && entry.name.empty()) {
            slot = &entry;
        }
    }
    if (!slot || name.empty()) {
        return false;
    }
    slot->name = name;
    slot->mapping = mapping;
    return true;
}

bool RelayBoard::find_named_mapping(const std::string& name, RelayMapping& mapping) const {
    for (const NamedRelayMapping& entry : named_) {
        if (!entry.name.empty() && utils::iequals(entry.name, name)) {
            mapping = entry.mapping;
            return true;
        }
    }
    return false;
}

bool RelayBoard::apply_named_mapping(const std::string& name) {
    RelayMapping mapping;
    if (!find_named_mapping(name, mapping)) {
        printf("[RELAY] No mapping named '%s'\r\n", name.c_str());
        return false;
    }
    apply_mapping(mapping);
    return true;
}

void RelayBoard::set_state(uint8_t logical_mask) {
    state_ = logical_mask;
    write_state();
}

void RelayBoard::all_off() {
    state_ = 0x00;
    write_state();
}

void RelayBoard::all_on() {
    state_ = 0xFF;
    write_state();
}

bool RelayBoard::pulse(uint8_t relay, uint32_t on_ms) {
    if (!set_relay(relay, true)) {
        return false;
    }
    clock_->sleep_ms(on_ms);
    return set_relay(relay, false);
}

void RelayBoard::self_test_walk(uint32_t delay_ms) {
    all_off();
    for (uint8_t relay = 0; relay < RELAY_CONFIG::NUM_RELAYS; relay++) {
        set_relay(relay, true);
        clock_->sleep_ms(delay_ms);
        set_relay(relay, false);
    }
    all_off();
}

bool RelayBoard::is_on(uint8_t relay) const {
    if (relay >= RELAY_CONFIG::NUM_RELAYS) {
        return false;
    }
    return (state_ >> relay) & 0x01;
}

const char* RelayBoard::port_name() const {
    return port_ ? port_->get_type_name() : "none";
}
