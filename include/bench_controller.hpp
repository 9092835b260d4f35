#ifndef BENCH_CONTROLLER_HPP
#define BENCH_CONTROLLER_HPP

#include <cstdint>
#include <string>

#include "scpi_parser.hpp"
#include "relay_board.hpp"
#include "ar3865.hpp"
#include "fluke287.hpp"
#include "ut61e_plus.hpp"
#include "sim_devices.hpp"
#include "bench_settings.hpp"
#include "test_session.hpp"
#include "test_runner.hpp"
#include "error_queue.hpp"

class Clock;

namespace BENCH_INFO {
    constexpr const char* IDN = "ElementTester,Bench Controller,001,1.0";
}

// Physical links supplied by the platform layer. Any of the device links
// may be nullptr; the matching simulator is bound instead
struct BenchHardware {
    RelayPort* relay_port = nullptr;
    SerialPort* hipot_port = nullptr;
    SerialPort* meter_port = nullptr;
    Clock* clock = nullptr;
    SettingsStore* settings_store = nullptr;
};

// High-level bench: owns every instrument driver and executes host commands
class BenchController {
public:
    explicit BenchController(const BenchHardware& hardware);

    // Load settings, identify every instrument and fall back to simulation
    // for any that do not answer
    void init_all();

    // Execute a parsed SCPI command and return response string
    std::string execute(const ScpiCommand& cmd);

    const BenchSettings& settings() const { return settings_; }
    TestSession& session() { return session_; }
    TestRunner& runner() { return runner_; }
    ErrorQueue& errors() { return errors_; }
    RelayBoard& relays() { return relay_board_; }

    bool relay_simulated() const { return relay_simulated_; }
    bool hipot_simulated() const { return hipot_simulated_; }
    bool meter_simulated() const { return meter_simulated_; }

private:
    BenchHardware hw_;
    Clock& clock_;
    BenchSettings settings_;
    BenchSettings persisted_;   // last image written to or read from the store

    // Hardware device set (bound to simulators when hardware is silent)
    RelayBoard relay_board_;
    Ar3865 hipot_;
    Fluke287 fluke_;
    Ut61ePlus ut61e_;
    Multimeter* meter_ = nullptr;
    bool relay_simulated_ = false;
    bool hipot_simulated_ = false;
    bool meter_simulated_ = false;

    // Simulated device set
    SimRelayPort sim_relay_port_;
    SimHipotPort sim_hipot_port_;
    SimMeterPort sim_meter_port_;
    SimMeterPort standin_meter_port_;   // hardware set meter when none answers
    RelayBoard sim_relay_board_;
    Ar3865 sim_hipot_;
    Fluke287 sim_fluke_;
    Ut61ePlus sim_ut61e_;

    TestSession session_;
    TestRunner runner_;
    ErrorQueue errors_;
    HipotConfig pending_hipot_config_;

    void init_relays();
    void init_hipot();
    void init_meter();
    void init_simulators();
    void bind_devices();
    void apply_settings();

    // Next persistent session number (saved before use)
    uint16_t next_session_sequence();

    std::string error(int16_t code, const std::string& message);

    std::string execute_idn();
    std::string execute_reset();
    std::string execute_status();
    std::string execute_relay(const ScpiCommand& cmd);
    std::string execute_relay_map(const ScpiCommand& cmd);
    std::string execute_route(const ScpiCommand& cmd);
    std::string execute_meter_read();
    std::string execute_config(const ScpiCommand& cmd);
    std::string execute_conf_param(const ScpiCommand& cmd);
    std::string execute_hipot(const ScpiCommand& cmd);
    std::string execute_hipot_config(const ScpiCommand& cmd);
    std::string execute_hipot_preset(const ScpiCommand& cmd);
    std::string execute_session(const ScpiCommand& cmd);
    std::string execute_test(const ScpiCommand& cmd);
    std::string execute_sim(const ScpiCommand& cmd);

    static std::string format_measurement(const MeasurementResult& result);
    static std::string quote(const std::string& text);
    static std::string format_hipot_config(const HipotConfig& config);

    // Line count followed by the lines, CRLF separated
    static std::string frame_lines(const std::string& text);
};

#endif // BENCH_CONTROLLER_HPP
