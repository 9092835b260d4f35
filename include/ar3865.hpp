#ifndef AR3865_HPP
#define AR3865_HPP

#include <cstdint>
#include <string>

class SerialPort;
class Clock;

namespace AR3865 {
    constexpr uint32_t DEFAULT_BAUDRATE = 38400;
    constexpr uint32_t DEFAULT_TIMEOUT_MS = 5000;
    constexpr const char* LINE_TERMINATOR = "\r\n";
    constexpr char RESPONSE_TERMINATOR = '\n';

    // Applied to unset timing fields once any timing field is configured
    constexpr float DEFAULT_RAMP_S = 1.0f;
    constexpr float DEFAULT_DWELL_S = 1.0f;
    constexpr float DEFAULT_FALL_S = 0.5f;

    constexpr uint32_t PROCESSING_MARGIN_MS = 1000;  // after dwell, before RD 1?
    constexpr uint32_t DISCHARGE_MS = 500;
    constexpr uint8_t RESULT_FIELDS = 6;
}

// Hipot parameters. Only fields with their has_ flag set are sent
struct HipotConfig {
    float voltage_v = 0.0f;
    bool has_voltage = false;
    float current_trip_ma = 0.0f;
    bool has_current_trip = false;
    float ramp_s = 0.0f;
    bool has_ramp = false;
    float dwell_s = 0.0f;
    bool has_dwell = false;
    float fall_s = 0.0f;
    bool has_fall = false;
    std::string polarity;       // "POS" or "NEG"
    bool has_polarity = false;

    bool has_timing() const { return has_ramp || has_dwell || has_fall; }
    bool empty() const {
        return !has_voltage && !has_current_trip && !has_timing() && !has_polarity;
    }
};

// Decoded "RD 1?" record: <step>,<type>,<status>,<volts>,<current>,<time>
struct HipotResult {
    bool passed = false;
    std::string raw;
    bool has_fields = false;
    int32_t step = 0;
    std::string test_type;
    std::string status;
    float voltage = 0.0f;
    float current = 0.0f;
    float time_s = 0.0f;
    uint32_t start_ms = 0;
};

// Associated Research 3865 hipot tester, SCPI over RS-232.
// Commands are passed through as text; this class only knows the handful
// of commands the test sequence needs
class Ar3865 {
public:
    void setup(SerialPort* port, Clock* clock,
               uint32_t baudrate = AR3865::DEFAULT_BAUDRATE,
               uint32_t timeout_ms = AR3865::DEFAULT_TIMEOUT_MS);

    // Open, reset, clear faults and identify. False if the instrument is silent
    bool init();
    void close();
    bool is_ready() const { return initialized_; }

    // Raw pass-through
    bool write(const std::string& command);
    bool query(const std::string& command, std::string& response);

    bool reset();
    bool clear_faults();
    bool identify(std::string& idn);

    bool configure(const HipotConfig& config);
    bool read_config(HipotConfig& config);
    static HipotConfig merge_config(const HipotConfig& base, const HipotConfig& overrides);

    bool select_file(int32_t index);
    bool query_selected_file(int32_t& index);

    bool start_test();
    bool stop_test();

    // Flushes input then queries RD 1?
    bool get_result(std::string& raw);

    // Select a stored file, run it and read back the verdict
    bool run_from_file(int32_t file_index, uint32_t duration_ms, HipotResult& result);

    // Apply config, run, read back the verdict
    bool run_once(const HipotConfig& config, uint32_t duration_ms, HipotResult& result);

    bool save_to_slot(int32_t slot);
    bool recall_from_slot(int32_t slot);

    // PASS detection plus field split of an RD 1? record
    static void parse_result(const std::string& raw, HipotResult& result);

private:
    SerialPort* port_ = nullptr;
    Clock* clock_ = nullptr;
    uint32_t baudrate_ = AR3865::DEFAULT_BAUDRATE;
    uint32_t timeout_ms_ = AR3865::DEFAULT_TIMEOUT_MS;
    bool initialized_ = false;

    bool ensure_open();
    bool wait_and_collect(uint32_t duration_ms, HipotResult& result);
};

#endif // AR3865_HPP
