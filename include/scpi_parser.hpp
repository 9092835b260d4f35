#ifndef SCPI_PARSER_HPP
#define SCPI_PARSER_HPP

#include <string>
#include <vector>
#include <cstdint>
#include <cstddef>

// SCPI command types
enum class ScpiCommandType {
    UNKNOWN,
    // IEEE 488.2 common commands
    IDN_QUERY,          // *IDN?
    RST,                // *RST
    CLS,                // *CLS
    // System
    SYST_ERR_QUERY,     // SYST:ERR?
    SYST_SIM,           // SYST:SIM <0|1>
    SYST_SIM_QUERY,     // SYST:SIM?
    SYST_STAT_QUERY,    // SYST:STAT?
    // Relay matrix
    RELAY_SET,          // RELAY<n>:STATE <0|1>
    RELAY_GET,          // RELAY<n>:STATE?
    RELAY_PULSE,        // RELAY<n>:PULSE [ms]
    RELAY_ALL_OFF,      // RELAY:ALL:OFF
    RELAY_ALL_ON,       // RELAY:ALL:ON
    RELAY_MASK,         // RELAY:MASK <value>
    RELAY_MASK_QUERY,   // RELAY:MASK?
    RELAY_WALK,         // RELAY:WALK [ms]
    RELAY_MAP_DEF,      // RELAY:MAP:DEF <name>,<on mask>[,<off mask>]
    RELAY_MAP_APPLY,    // RELAY:MAP <name>
    RELAY_MAP_QUERY,    // RELAY:MAP? <name>
    ROUTE_CLOSE,        // ROUTE:CLOSE <1TO6|2TO5|3TO4|HIPOT>
    ROUTE_OPEN,         // ROUTE:OPEN
    // Meter
    MEAS_READ_QUERY,    // MEAS:READ?
    MEAS_FLUSH,         // MEAS:FLUSH
    // Configuration
    CONF_METER,         // CONF:METER <FLUKE287|UT61E>
    CONF_METER_QUERY,   // CONF:METER?
    CONF_ELEM,          // CONF:ELEM <V>,<W>
    CONF_ELEM_QUERY,    // CONF:ELEM?
    CONF_RANGE,         // CONF:RANGE <min>,<max>
    CONF_RANGE_QUERY,   // CONF:RANGE?
    CONF_HIPOT_DUR,     // CONF:HIPOT:DUR <s>
    CONF_HIPOT_DUR_QUERY, // CONF:HIPOT:DUR?
    CONF_RELAY_POL,     // CONF:RELAY:POL <HIGH|LOW>
    CONF_RELAY_POL_QUERY, // CONF:RELAY:POL?
    CONF_PARAM,         // CONF:TIMEOUT:<POS|METER|HIPOT> <ms>, CONF:BAUD:<HIPOT|FLUKE|UT61E> <baud>
    CONF_PARAM_QUERY,   // CONF:TIMEOUT:<...>?, CONF:BAUD:<...>?
    CONF_SAVE,          // CONF:SAVE
    CONF_LOAD,          // CONF:LOAD
    CONF_DEFAULT,       // CONF:DEF
    // Hipot tester
    HIPOT_IDN_QUERY,    // HIPOT:IDN?
    HIPOT_RESET,        // HIPOT:RESET
    HIPOT_FILE,         // HIPOT:FILE <n>
    HIPOT_FILE_QUERY,   // HIPOT:FILE?
    HIPOT_CONF_SET,     // HIPOT:CONF:<VOLT|TRIP|RAMP|DWEL|FALL|POL> <value>
    HIPOT_CONF_APPLY,   // HIPOT:CONF:APPLY
    HIPOT_CONF_QUERY,   // HIPOT:CONF?
    HIPOT_SAVE_SLOT,    // HIPOT:SAV <n>
    HIPOT_RECALL_SLOT,  // HIPOT:RCL <n>
    HIPOT_RESULT_QUERY, // HIPOT:RES?
    HIPOT_RAW,          // HIPOT:RAW <text>
    HIPOT_RAW_QUERY,    // HIPOT:RAW? <text>
    HIPOT_PRESET_SAVE,  // HIPOT:PRES:SAVE <name>
    HIPOT_PRESET_APPLY, // HIPOT:PRES:APPLY <name>
    HIPOT_PRESET_QUERY, // HIPOT:PRES? <name>
    HIPOT_RUN_QUERY,    // HIPOT:RUN?
    HIPOT_ABORT,        // HIPOT:ABORT
    // Sessions and test runs
    SESS_START,         // SESS:START <WO>,<PN>
    SESS_END,           // SESS:END <0|1>
    SESS_ID_QUERY,      // SESS:ID?
    SESS_LOG_QUERY,     // SESS:LOG?
    TEST_MEAS_QUERY,    // TEST:MEAS?
    TEST_HIPOT_QUERY,   // TEST:HIPOT? [keep_closed]
    TEST_FULL_QUERY,    // TEST:FULL? <WO>,<PN>
    // Simulation
    SIM_VALUES,         // SIM:VAL <r1>,<r2>,<r3>
    SIM_HIPOT,          // SIM:HIPOT <PASS|FAIL>
};

// Field targeted by HIPOT:CONF:<field>
enum class HipotField : uint8_t {
    NONE,
    VOLTAGE,
    CURRENT_TRIP,
    RAMP,
    DWELL,
    FALL,
    POLARITY,
};

// Setting targeted by CONF:TIMEOUT:<param> / CONF:BAUD:<param>
enum class ConfParam : uint8_t {
    NONE,
    POSITION_TIMEOUT,
    METER_TIMEOUT,
    HIPOT_TIMEOUT,
    HIPOT_BAUD,
    FLUKE_BAUD,
    UT61E_BAUD,
};

// Bounds enforced while parsing
namespace SCPI_LIMITS {
    constexpr float MAX_HIPOT_DURATION_S = 3600.0f;
    constexpr float MAX_HIPOT_VALUE = 99999.0f;  // volts, mA or seconds
    constexpr int32_t MIN_TIMEOUT_MS = 100;
    constexpr int32_t MAX_TIMEOUT_MS = 600000;
    constexpr int32_t MAX_PULSE_MS = 60000;
    constexpr int32_t MAX_WALK_DELAY_MS = 10000;
    constexpr size_t MAX_NAME_LEN = 15;

    constexpr int32_t BAUD_RATES[] = {1200, 2400, 4800, 9600, 19200, 38400, 57600, 115200};
}

// Parsed SCPI command structure
struct ScpiCommand {
    ScpiCommandType type = ScpiCommandType::UNKNOWN;
    bool is_query = false;

    // Addressing (for relay commands)
    int8_t relay_id = -1;     // 0-7, -1 if not specified

    // Value (for set commands)
    float float_value = 0.0f;
    int32_t int_value = 0;
    bool has_float = false;
    bool has_int = false;

    // Comma separated numeric lists (CONF:RANGE, SIM:VAL)
    float float_values[3] = {0.0f, 0.0f, 0.0f};
    uint8_t num_floats = 0;

    // Comma separated integer lists (CONF:ELEM, RELAY:MAP:DEF masks)
    int32_t int_values[3] = {0, 0, 0};
    uint8_t num_ints = 0;

    // String arguments (work order / part number, pass-through text)
    std::string string_value;
    std::string string_value2;
    bool has_string = false;

    HipotField hipot_field = HipotField::NONE;
    ConfParam conf_param = ConfParam::NONE;

    // Error state
    bool valid = false;
    std::string error_msg;
};

// SCPI Parser - parses incoming commands and produces structured command objects
class ScpiParser {
public:
    // Parse a single SCPI command line
    ScpiCommand parse(const char* line);
    ScpiCommand parse(const std::string& line);

private:
    // Parse helpers, one per command subsystem
    bool parse_common_command(const char* cmd, ScpiCommand& result);
    bool parse_system_command(const char* cmd, ScpiCommand& result);
    bool parse_relay_command(const char* cmd, ScpiCommand& result);
    bool parse_meter_command(const char* cmd, ScpiCommand& result);
    bool parse_config_command(const char* cmd, ScpiCommand& result);
    bool parse_hipot_command(const char* cmd, ScpiCommand& result);
    bool parse_session_command(const char* cmd, ScpiCommand& result);

    // Extract numeric index from string like "RELAY3" -> 3
    int extract_index(const char* str, const char* prefix);

    // Skip whitespace and return pointer to next non-whitespace
    const char* skip_whitespace(const char* str);

    // Parse numeric value. The number must be the whole remaining text
    // (trailing whitespace allowed); floats must be finite and ints fit int32
    bool parse_float(const char* str, float& value);
    bool parse_int(const char* str, int32_t& value);

    // Up to max comma separated values; false if any entry is not numeric
    bool parse_float_list(const char* str, float* values, uint8_t max, uint8_t& count);
    bool parse_int_list(const char* str, int32_t* values, uint8_t max, uint8_t& count);

    // Preset or mapping name: 1-15 chars, no comma
    bool parse_name(const char* str, ScpiCommand& result);

    // Remainder of the line, whitespace trimmed
    std::string rest_of_line(const char* str);

    // "<a>,<b>" into string_value / string_value2
    bool parse_string_pair(const char* str, ScpiCommand& result, const char* what);
};

#endif // SCPI_PARSER_HPP
