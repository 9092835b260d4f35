#ifndef SIM_DEVICES_HPP
#define SIM_DEVICES_HPP

#include <cstdint>
#include <deque>
#include <string>
#include "serial_port.hpp"
#include "relay_board.hpp"
#include "multimeter.hpp"
#include "relay_map.hpp"
#include "measurement_sequence.hpp"

// In-memory stand-ins bound in place of instruments that are absent.
// They answer the same byte protocols as the real devices

// Serial port with a local responder instead of a wire
class SimSerialPort : public SerialPort {
public:
    bool open(const SerialConfig& config) override;
    void close() override { open_ = false; }
    bool is_open() const override { return open_; }
    void write(const uint8_t* data, size_t len) override;
    bool read_byte(uint8_t& out, uint32_t timeout_ms) override;
    void flush_input() override { rx_.clear(); }

    const SerialConfig& config() const { return config_; }

protected:
    // Consume complete requests from tx and queue replies with respond()
    virtual void handle_tx(std::string& tx) = 0;
    void respond(const std::string& bytes);

private:
    SerialConfig config_;
    bool open_ = false;
    std::string tx_;
    std::deque<uint8_t> rx_;
};

// Answers the AR3865 commands used by the test sequence
class SimHipotPort : public SimSerialPort {
public:
    void set_force_fail(bool fail) { force_fail_ = fail; }
    bool force_fail() const { return force_fail_; }

    static constexpr const char* IDN = "Associated Research,3865,Sim,1.0";
    static constexpr const char* PASS_RESULT = "01,ACW,PASS,1.24,0.003,2.0";
    static constexpr const char* FAIL_RESULT = "01,ACW,HI-LIMIT,1.24,5.210,0.4";

protected:
    void handle_tx(std::string& tx) override;

private:
    bool force_fail_ = false;
    std::string voltage_ = "1240";
    std::string current_trip_ = "5";
    std::string file_ = "1";

    void handle_line(const std::string& line);
};

// Answers Fluke 287 QM and UT61E+ measurement requests. While an observed
// relay board has exactly one measurement position closed the reading is
// that position's value, otherwise the open-route resistance
class SimMeterPort : public SimSerialPort {
public:
    void observe(const RelayBoard* relays) { relays_ = relays; }
    void set_position_values(const float values[RELAY_MAP::NUM_POSITIONS]);

    float current_reading() const;

    static constexpr float DEFAULT_RESISTANCE = 6.5f;

protected:
    void handle_tx(std::string& tx) override;

private:
    const RelayBoard* relays_ = nullptr;
    float position_values_[RELAY_MAP::NUM_POSITIONS] = {
        MEAS_TIMING::SIM_VALUES[0], MEAS_TIMING::SIM_VALUES[1], MEAS_TIMING::SIM_VALUES[2]};
};

// Relay port that only remembers what was written
class SimRelayPort : public RelayPort {
public:
    bool init() override { return true; }
    void write_port(uint8_t value) override;
    uint8_t read_port() override { return value_; }
    const char* get_type_name() const override { return "SIM"; }

private:
    uint8_t value_ = 0;
};

// Build a valid UT61E+ resistance frame for the given value (220 ohm range)
void build_ut61e_resistance_frame(float ohms, uint8_t* frame);

#endif // SIM_DEVICES_HPP
