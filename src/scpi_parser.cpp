#include "scpi_parser.hpp"
#include "utils.hpp"
#include <cstring>
#include <cctype>
#include <cstdlib>
#include <cerrno>
#include <climits>
#include <cmath>

// Case-insensitive string comparison (portable replacement for strncasecmp)
static int strncasecmp_local(const char* s1, const char* s2, size_t n) {
    for (size_t i = 0; i < n; i++) {
        int c1 = std::toupper(static_cast<unsigned char>(s1[i]));
        int c2 = std::toupper(static_cast<unsigned char>(s2[i]));
        if (c1 != c2) return c1 - c2;
        if (c1 == '\0') return 0;
    }
    return 0;
}

// Match a whole header node ("ALL" must not match "ALLX") and step past it
static bool match_node(const char*& p, const char* keyword) {
    size_t n = std::strlen(keyword);
    if (strncasecmp_local(p, keyword, n) != 0) return false;
    char next = p[n];
    if (next != '\0' && next != ':' && next != '?' &&
        !std::isspace(static_cast<unsigned char>(next))) {
        return false;
    }
    p += n;
    return true;
}

// Step past a ':' separator
static bool take_colon(const char*& p) {
    if (*p != ':') return false;
    p++;
    return true;
}

// Step past a '?' query marker
static bool take_query(const char*& p) {
    if (*p != '?') return false;
    p++;
    return true;
}

static bool accept(ScpiCommand& result, ScpiCommandType type, bool query = false) {
    result.type = type;
    result.is_query = query;
    result.valid = true;
    return true;
}

const char* ScpiParser::skip_whitespace(const char* str) {
    while (*str && std::isspace(static_cast<unsigned char>(*str))) str++;
    return str;
}

bool ScpiParser::parse_float(const char* str, float& value) {
    str = skip_whitespace(str);
    char* end;
    errno = 0;
    float v = std::strtof(str, &end);
    if (end == str || errno == ERANGE || !std::isfinite(v)) return false;
    if (*skip_whitespace(end) != '\0') return false;
    value = v;
    return true;
}

bool ScpiParser::parse_int(const char* str, int32_t& value) {
    str = skip_whitespace(str);
    char* end;
    errno = 0;
    long long v = std::strtoll(str, &end, 0);  // Auto-detect hex (0x) or decimal
    if (end == str || errno == ERANGE) return false;
    if (v < INT32_MIN || v > INT32_MAX) return false;
    if (*skip_whitespace(end) != '\0') return false;
    value = static_cast<int32_t>(v);
    return true;
}

bool ScpiParser::parse_float_list(const char* str, float* values, uint8_t max, uint8_t& count) {
    count = 0;
    std::vector<std::string> items = utils::split(rest_of_line(str), ',', true);
    if (items.empty() || items.size() > max) {
        return false;
    }
    for (const auto& item : items) {
        if (!parse_float(item.c_str(), values[count])) {
            return false;
        }
        count++;
    }
    return true;
}

bool ScpiParser::parse_int_list(const char* str, int32_t* values, uint8_t max, uint8_t& count) {
    count = 0;
    std::vector<std::string> items = utils::split(rest_of_line(str), ',', true);
    if (items.empty() || items.size() > max) {
        return false;
    }
    for (const auto& item : items) {
        if (!parse_int(item.c_str(), values[count])) {
            return false;
        }
        count++;
    }
    return true;
}

bool ScpiParser::parse_name(const char* str, ScpiCommand& result) {
    std::string name = rest_of_line(str);
    if (name.empty() || name.size() > SCPI_LIMITS::MAX_NAME_LEN ||
        name.find(',') != std::string::npos) {
        result.error_msg = "Name must be 1-15 characters without commas";
        return false;
    }
    result.string_value = name;
    result.has_string = true;
    return true;
}

std::string ScpiParser::rest_of_line(const char* str) {
    std::string out;
    str = skip_whitespace(str);
    while (*str && *str != '\n' && *str != '\r') {
        out += *str++;
    }
    return utils::trim(out);
}

bool ScpiParser::parse_string_pair(const char* str, ScpiCommand& result, const char* what) {
    std::vector<std::string> items = utils::split(rest_of_line(str), ',', true);
    if (items.size() != 2 || utils::trim(items[0]).empty() || utils::trim(items[1]).empty()) {
        result.error_msg = std::string("Expected ") + what;
        return false;
    }
    result.string_value = utils::trim(items[0]);
    result.string_value2 = utils::trim(items[1]);
    result.has_string = true;
    return true;
}

int ScpiParser::extract_index(const char* str, const char* prefix) {
    size_t prefix_len = std::strlen(prefix);

    // Case-insensitive prefix match
    if (strncasecmp_local(str, prefix, prefix_len) != 0) {
        return -1;
    }

    // Extract digit after prefix
    if (!std::isdigit(static_cast<unsigned char>(str[prefix_len]))) {
        return -1;
    }

    return str[prefix_len] - '0';
}

bool ScpiParser::parse_common_command(const char* cmd, ScpiCommand& result) {
    // IEEE 488.2 common commands start with *
    if (cmd[0] != '*') return false;

    cmd++;  // Skip *

    if (strncasecmp_local(cmd, "IDN?", 4) == 0) {
        return accept(result, ScpiCommandType::IDN_QUERY, true);
    }

    if (strncasecmp_local(cmd, "RST", 3) == 0) {
        return accept(result, ScpiCommandType::RST);
    }

    if (strncasecmp_local(cmd, "CLS", 3) == 0) {
        return accept(result, ScpiCommandType::CLS);
    }

    return false;
}

bool ScpiParser::parse_system_command(const char* cmd, ScpiCommand& result) {
    const char* p = cmd;

    // SIM:VAL / SIM:HIPOT
    if (match_node(p, "SIM")) {
        if (!take_colon(p)) {
            result.error_msg = "Expected SIM:VAL or SIM:HIPOT";
            return false;
        }

        if (match_node(p, "VAL")) {
            result.type = ScpiCommandType::SIM_VALUES;
            if (!parse_float_list(p, result.float_values, 3, result.num_floats) ||
                result.num_floats != 3) {
                result.error_msg = "Expected 3 resistance values";
                return false;
            }
            return accept(result, ScpiCommandType::SIM_VALUES);
        }

        if (match_node(p, "HIPOT")) {
            std::string verdict = utils::to_upper(rest_of_line(p));
            if (verdict != "PASS" && verdict != "FAIL") {
                result.error_msg = "Expected PASS or FAIL";
                return false;
            }
            result.string_value = verdict;
            result.has_string = true;
            return accept(result, ScpiCommandType::SIM_HIPOT);
        }

        result.error_msg = "Unknown SIM command";
        return false;
    }

    if (!match_node(p, "SYST")) {
        return false;
    }
    if (!take_colon(p)) {
        result.error_msg = "Expected SYST:<command>";
        return false;
    }

    // SYST:ERR?
    if (match_node(p, "ERR")) {
        if (!take_query(p)) {
            result.error_msg = "SYST:ERR is query only";
            return false;
        }
        return accept(result, ScpiCommandType::SYST_ERR_QUERY, true);
    }

    // SYST:STAT?
    if (match_node(p, "STAT")) {
        if (!take_query(p)) {
            result.error_msg = "SYST:STAT is query only";
            return false;
        }
        return accept(result, ScpiCommandType::SYST_STAT_QUERY, true);
    }

    // SYST:SIM <0|1> / SYST:SIM?
    if (match_node(p, "SIM")) {
        if (take_query(p)) {
            return accept(result, ScpiCommandType::SYST_SIM_QUERY, true);
        }
        if (!parse_int(p, result.int_value) || result.int_value < 0 || result.int_value > 1) {
            result.error_msg = "Invalid simulate value (0 or 1)";
            return false;
        }
        result.has_int = true;
        return accept(result, ScpiCommandType::SYST_SIM);
    }

    result.error_msg = "Unknown SYST command";
    return false;
}

bool ScpiParser::parse_relay_command(const char* cmd, ScpiCommand& result) {
    const char* p = cmd;

    // ROUTE:CLOSE <position> / ROUTE:OPEN
    if (match_node(p, "ROUTE")) {
        if (!take_colon(p)) {
            result.error_msg = "Expected ROUTE:CLOSE or ROUTE:OPEN";
            return false;
        }
        if (match_node(p, "CLOSE")) {
            result.string_value = rest_of_line(p);
            if (result.string_value.empty()) {
                result.error_msg = "Route name required";
                return false;
            }
            result.has_string = true;
            return accept(result, ScpiCommandType::ROUTE_CLOSE);
        }
        if (match_node(p, "OPEN")) {
            return accept(result, ScpiCommandType::ROUTE_OPEN);
        }
        result.error_msg = "Unknown ROUTE command";
        return false;
    }

    if (strncasecmp_local(cmd, "RELAY", 5) != 0) {
        return false;
    }

    // RELAY:ALL:OFF, RELAY:ALL:ON, RELAY:MASK, RELAY:WALK
    if (cmd[5] == ':') {
        p = cmd + 6;

        if (match_node(p, "ALL")) {
            if (!take_colon(p)) {
                result.error_msg = "Expected RELAY:ALL:OFF or RELAY:ALL:ON";
                return false;
            }
            if (match_node(p, "OFF")) {
                return accept(result, ScpiCommandType::RELAY_ALL_OFF);
            }
            if (match_node(p, "ON")) {
                return accept(result, ScpiCommandType::RELAY_ALL_ON);
            }
            result.error_msg = "Expected OFF or ON";
            return false;
        }

        if (match_node(p, "MASK")) {
            if (take_query(p)) {
                return accept(result, ScpiCommandType::RELAY_MASK_QUERY, true);
            }
            if (!parse_int(p, result.int_value) || result.int_value < 0 || result.int_value > 0xFF) {
                result.error_msg = "Invalid relay mask (0-255)";
                return false;
            }
            result.has_int = true;
            return accept(result, ScpiCommandType::RELAY_MASK);
        }

        if (match_node(p, "WALK")) {
            if (!rest_of_line(p).empty()) {
                if (!parse_int(p, result.int_value) || result.int_value < 0 ||
                    result.int_value > SCPI_LIMITS::MAX_WALK_DELAY_MS) {
                    result.error_msg = "Invalid walk delay";
                    return false;
                }
                result.has_int = true;
            }
            return accept(result, ScpiCommandType::RELAY_WALK);
        }

        // RELAY:MAP:DEF <name>,<on>[,<off>] / RELAY:MAP <name> / RELAY:MAP? <name>
        if (match_node(p, "MAP")) {
            if (take_query(p)) {
                if (!parse_name(p, result)) return false;
                return accept(result, ScpiCommandType::RELAY_MAP_QUERY, true);
            }
            if (take_colon(p)) {
                if (!match_node(p, "DEF")) {
                    result.error_msg = "Expected RELAY:MAP:DEF";
                    return false;
                }
                std::string line = rest_of_line(p);
                size_t comma = line.find(',');
                if (comma == std::string::npos) {
                    result.error_msg = "Expected <name>,<on mask>[,<off mask>]";
                    return false;
                }
                if (!parse_name(line.substr(0, comma).c_str(), result)) return false;
                std::string masks = line.substr(comma + 1);
                if (!parse_int_list(masks.c_str(), result.int_values, 2, result.num_ints)) {
                    result.error_msg = "Expected <name>,<on mask>[,<off mask>]";
                    return false;
                }
                for (uint8_t i = 0; i < result.num_ints; i++) {
                    if (result.int_values[i] < 0 || result.int_values[i] > 0xFF) {
                        result.error_msg = "Invalid relay mask (0-255)";
                        return false;
                    }
                }
                return accept(result, ScpiCommandType::RELAY_MAP_DEF);
            }
            if (!parse_name(p, result)) return false;
            return accept(result, ScpiCommandType::RELAY_MAP_APPLY);
        }

        result.error_msg = "Unknown RELAY command";
        return false;
    }

    // RELAY<n>:...
    int relay = extract_index(cmd, "RELAY");
    if (relay < 0 || relay > 7) {
        result.error_msg = "Invalid relay number (0-7)";
        return false;
    }
    result.relay_id = static_cast<int8_t>(relay);

    p = cmd + 6;
    if (!take_colon(p)) {
        result.error_msg = "Expected :STATE or :PULSE after RELAY";
        return false;
    }

    if (match_node(p, "STATE")) {
        if (take_query(p)) {
            return accept(result, ScpiCommandType::RELAY_GET, true);
        }
        if (!parse_int(p, result.int_value) || result.int_value < 0 || result.int_value > 1) {
            result.error_msg = "Invalid relay state (0 or 1)";
            return false;
        }
        result.has_int = true;
        return accept(result, ScpiCommandType::RELAY_SET);
    }

    if (match_node(p, "PULSE")) {
        if (!rest_of_line(p).empty()) {
            if (!parse_int(p, result.int_value) || result.int_value <= 0 ||
                result.int_value > SCPI_LIMITS::MAX_PULSE_MS) {
                result.error_msg = "Invalid pulse width";
                return false;
            }
            result.has_int = true;
        }
        return accept(result, ScpiCommandType::RELAY_PULSE);
    }

    result.error_msg = "Unknown relay command";
    return false;
}

bool ScpiParser::parse_meter_command(const char* cmd, ScpiCommand& result) {
    const char* p = cmd;
    if (!match_node(p, "MEAS")) {
        return false;
    }
    if (!take_colon(p)) {
        result.error_msg = "Expected MEAS:READ? or MEAS:FLUSH";
        return false;
    }

    if (match_node(p, "READ")) {
        if (!take_query(p)) {
            result.error_msg = "MEAS:READ is query only";
            return false;
        }
        return accept(result, ScpiCommandType::MEAS_READ_QUERY, true);
    }

    if (match_node(p, "FLUSH")) {
        return accept(result, ScpiCommandType::MEAS_FLUSH);
    }

    result.error_msg = "Unknown MEAS command";
    return false;
}

bool ScpiParser::parse_config_command(const char* cmd, ScpiCommand& result) {
    const char* p = cmd;
    if (!match_node(p, "CONF")) {
        return false;
    }
    if (!take_colon(p)) {
        result.error_msg = "Expected CONF:<setting>";
        return false;
    }

    // CONF:METER
    if (match_node(p, "METER")) {
        if (take_query(p)) {
            return accept(result, ScpiCommandType::CONF_METER_QUERY, true);
        }
        result.string_value = rest_of_line(p);
        if (result.string_value.empty()) {
            result.error_msg = "Meter type required";
            return false;
        }
        result.has_string = true;
        return accept(result, ScpiCommandType::CONF_METER);
    }

    // CONF:ELEM <V>,<W>
    if (match_node(p, "ELEM")) {
        if (take_query(p)) {
            return accept(result, ScpiCommandType::CONF_ELEM_QUERY, true);
        }
        if (!parse_int_list(p, result.int_values, 2, result.num_ints) ||
            result.num_ints != 2) {
            result.error_msg = "Expected integer <voltage>,<wattage>";
            return false;
        }
        for (uint8_t i = 0; i < 2; i++) {
            if (result.int_values[i] < 0 || result.int_values[i] > 65535) {
                result.error_msg = "Element ratings must be 0-65535";
                return false;
            }
        }
        return accept(result, ScpiCommandType::CONF_ELEM);
    }

    // CONF:RANGE <min>,<max>
    if (match_node(p, "RANGE")) {
        if (take_query(p)) {
            return accept(result, ScpiCommandType::CONF_RANGE_QUERY, true);
        }
        if (!parse_float_list(p, result.float_values, 2, result.num_floats) ||
            result.num_floats != 2) {
            result.error_msg = "Expected <min>,<max>";
            return false;
        }
        return accept(result, ScpiCommandType::CONF_RANGE);
    }

    // CONF:HIPOT:DUR <seconds>
    if (match_node(p, "HIPOT")) {
        if (!take_colon(p) || !match_node(p, "DUR")) {
            result.error_msg = "Expected CONF:HIPOT:DUR";
            return false;
        }
        if (take_query(p)) {
            return accept(result, ScpiCommandType::CONF_HIPOT_DUR_QUERY, true);
        }
        if (!parse_float(p, result.float_value) || result.float_value <= 0.0f ||
            result.float_value > SCPI_LIMITS::MAX_HIPOT_DURATION_S) {
            result.error_msg = "Invalid duration (0-3600 s)";
            return false;
        }
        result.has_float = true;
        return accept(result, ScpiCommandType::CONF_HIPOT_DUR);
    }

    // CONF:RELAY:POL <HIGH|LOW>
    if (match_node(p, "RELAY")) {
        if (!take_colon(p) || !match_node(p, "POL")) {
            result.error_msg = "Expected CONF:RELAY:POL";
            return false;
        }
        if (take_query(p)) {
            return accept(result, ScpiCommandType::CONF_RELAY_POL_QUERY, true);
        }
        std::string pol = utils::to_upper(rest_of_line(p));
        if (pol != "HIGH" && pol != "LOW") {
            result.error_msg = "Relay polarity must be HIGH or LOW";
            return false;
        }
        result.string_value = pol;
        result.has_string = true;
        return accept(result, ScpiCommandType::CONF_RELAY_POL);
    }

    // CONF:TIMEOUT:<POS|METER|HIPOT> <ms>
    if (match_node(p, "TIMEOUT")) {
        if (!take_colon(p)) {
            result.error_msg = "Expected CONF:TIMEOUT:<POS|METER|HIPOT>";
            return false;
        }
        if (match_node(p, "POS")) {
            result.conf_param = ConfParam::POSITION_TIMEOUT;
        } else if (match_node(p, "METER")) {
            result.conf_param = ConfParam::METER_TIMEOUT;
        } else if (match_node(p, "HIPOT")) {
            result.conf_param = ConfParam::HIPOT_TIMEOUT;
        } else {
            result.error_msg = "Unknown timeout (POS, METER, HIPOT)";
            return false;
        }
        if (take_query(p)) {
            return accept(result, ScpiCommandType::CONF_PARAM_QUERY, true);
        }
        if (!parse_int(p, result.int_value) || result.int_value < SCPI_LIMITS::MIN_TIMEOUT_MS ||
            result.int_value > SCPI_LIMITS::MAX_TIMEOUT_MS) {
            result.error_msg = "Invalid timeout (100-600000 ms)";
            return false;
        }
        result.has_int = true;
        return accept(result, ScpiCommandType::CONF_PARAM);
    }

    // CONF:BAUD:<HIPOT|FLUKE|UT61E> <baud>
    if (match_node(p, "BAUD")) {
        if (!take_colon(p)) {
            result.error_msg = "Expected CONF:BAUD:<HIPOT|FLUKE|UT61E>";
            return false;
        }
        if (match_node(p, "HIPOT")) {
            result.conf_param = ConfParam::HIPOT_BAUD;
        } else if (match_node(p, "FLUKE")) {
            result.conf_param = ConfParam::FLUKE_BAUD;
        } else if (match_node(p, "UT61E")) {
            result.conf_param = ConfParam::UT61E_BAUD;
        } else {
            result.error_msg = "Unknown port (HIPOT, FLUKE, UT61E)";
            return false;
        }
        if (take_query(p)) {
            return accept(result, ScpiCommandType::CONF_PARAM_QUERY, true);
        }
        bool known = false;
        if (parse_int(p, result.int_value)) {
            for (int32_t baud : SCPI_LIMITS::BAUD_RATES) {
                if (baud == result.int_value) known = true;
            }
        }
        if (!known) {
            result.error_msg = "Unsupported baud rate";
            return false;
        }
        result.has_int = true;
        return accept(result, ScpiCommandType::CONF_PARAM);
    }

    if (match_node(p, "SAVE")) {
        return accept(result, ScpiCommandType::CONF_SAVE);
    }

    if (match_node(p, "LOAD")) {
        return accept(result, ScpiCommandType::CONF_LOAD);
    }

    if (match_node(p, "DEF")) {
        return accept(result, ScpiCommandType::CONF_DEFAULT);
    }

    result.error_msg = "Unknown CONF command";
    return false;
}

bool ScpiParser::parse_hipot_command(const char* cmd, ScpiCommand& result) {
    const char* p = cmd;
    if (!match_node(p, "HIPOT")) {
        return false;
    }
    if (!take_colon(p)) {
        result.error_msg = "Expected HIPOT:<command>";
        return false;
    }

    if (match_node(p, "IDN")) {
        if (!take_query(p)) {
            result.error_msg = "HIPOT:IDN is query only";
            return false;
        }
        return accept(result, ScpiCommandType::HIPOT_IDN_QUERY, true);
    }

    if (match_node(p, "RESET")) {
        return accept(result, ScpiCommandType::HIPOT_RESET);
    }

    if (match_node(p, "FILE")) {
        if (take_query(p)) {
            return accept(result, ScpiCommandType::HIPOT_FILE_QUERY, true);
        }
        if (!parse_int(p, result.int_value)) {
            result.error_msg = "Invalid file number";
            return false;
        }
        result.has_int = true;
        return accept(result, ScpiCommandType::HIPOT_FILE);
    }

    // HIPOT:PRES:SAVE <name> / HIPOT:PRES:APPLY <name> / HIPOT:PRES? <name>
    if (match_node(p, "PRES")) {
        if (take_query(p)) {
            if (!parse_name(p, result)) return false;
            return accept(result, ScpiCommandType::HIPOT_PRESET_QUERY, true);
        }
        if (!take_colon(p)) {
            result.error_msg = "Expected HIPOT:PRES:SAVE or HIPOT:PRES:APPLY";
            return false;
        }
        ScpiCommandType type;
        if (match_node(p, "SAVE")) {
            type = ScpiCommandType::HIPOT_PRESET_SAVE;
        } else if (match_node(p, "APPLY")) {
            type = ScpiCommandType::HIPOT_PRESET_APPLY;
        } else {
            result.error_msg = "Expected HIPOT:PRES:SAVE or HIPOT:PRES:APPLY";
            return false;
        }
        if (!parse_name(p, result)) return false;
        return accept(result, type);
    }

    if (match_node(p, "RUN")) {
        if (!take_query(p)) {
            result.error_msg = "HIPOT:RUN is query only";
            return false;
        }
        return accept(result, ScpiCommandType::HIPOT_RUN_QUERY, true);
    }

    if (match_node(p, "ABORT")) {
        return accept(result, ScpiCommandType::HIPOT_ABORT);
    }

    if (match_node(p, "SAV") || match_node(p, "RCL")) {
        bool save = std::toupper(static_cast<unsigned char>(cmd[6])) == 'S';
        if (!parse_int(p, result.int_value) || result.int_value < 0) {
            result.error_msg = "Invalid memory slot";
            return false;
        }
        result.has_int = true;
        return accept(result, save ? ScpiCommandType::HIPOT_SAVE_SLOT
                                   : ScpiCommandType::HIPOT_RECALL_SLOT);
    }

    if (match_node(p, "RES")) {
        if (!take_query(p)) {
            result.error_msg = "HIPOT:RES is query only";
            return false;
        }
        return accept(result, ScpiCommandType::HIPOT_RESULT_QUERY, true);
    }

    // HIPOT:RAW <text> / HIPOT:RAW? <text>
    if (match_node(p, "RAW")) {
        bool query = take_query(p);
        result.string_value = rest_of_line(p);
        if (result.string_value.empty()) {
            result.error_msg = "Instrument command required";
            return false;
        }
        result.has_string = true;
        return accept(result, query ? ScpiCommandType::HIPOT_RAW_QUERY
                                    : ScpiCommandType::HIPOT_RAW, query);
    }

    if (match_node(p, "CONF")) {
        if (take_query(p)) {
            return accept(result, ScpiCommandType::HIPOT_CONF_QUERY, true);
        }
        if (!take_colon(p)) {
            result.error_msg = "Expected HIPOT:CONF:<field>";
            return false;
        }

        if (match_node(p, "APPLY")) {
            return accept(result, ScpiCommandType::HIPOT_CONF_APPLY);
        }

        if (match_node(p, "POL")) {
            std::string pol = utils::to_upper(rest_of_line(p));
            if (pol != "POS" && pol != "NEG") {
                result.error_msg = "Polarity must be POS or NEG";
                return false;
            }
            result.hipot_field = HipotField::POLARITY;
            result.string_value = pol;
            result.has_string = true;
            return accept(result, ScpiCommandType::HIPOT_CONF_SET);
        }

        if (match_node(p, "VOLT")) {
            result.hipot_field = HipotField::VOLTAGE;
        } else if (match_node(p, "TRIP")) {
            result.hipot_field = HipotField::CURRENT_TRIP;
        } else if (match_node(p, "RAMP")) {
            result.hipot_field = HipotField::RAMP;
        } else if (match_node(p, "DWEL")) {
            result.hipot_field = HipotField::DWELL;
        } else if (match_node(p, "FALL")) {
            result.hipot_field = HipotField::FALL;
        } else {
            result.error_msg = "Unknown hipot field (VOLT, TRIP, RAMP, DWEL, FALL, POL)";
            return false;
        }

        if (!parse_float(p, result.float_value) || result.float_value < 0.0f ||
            result.float_value > SCPI_LIMITS::MAX_HIPOT_VALUE) {
            result.error_msg = "Invalid hipot value";
            return false;
        }
        result.has_float = true;
        return accept(result, ScpiCommandType::HIPOT_CONF_SET);
    }

    result.error_msg = "Unknown HIPOT command";
    return false;
}

bool ScpiParser::parse_session_command(const char* cmd, ScpiCommand& result) {
    const char* p = cmd;

    if (match_node(p, "SESS")) {
        if (!take_colon(p)) {
            result.error_msg = "Expected SESS:<command>";
            return false;
        }
        if (match_node(p, "START")) {
            if (!parse_string_pair(p, result, "<work order>,<part number>")) {
                return false;
            }
            return accept(result, ScpiCommandType::SESS_START);
        }
        if (match_node(p, "END")) {
            if (!parse_int(p, result.int_value) || result.int_value < 0 || result.int_value > 1) {
                result.error_msg = "Expected final result (0 = FAIL, 1 = PASS)";
                return false;
            }
            result.has_int = true;
            return accept(result, ScpiCommandType::SESS_END);
        }
        if (match_node(p, "ID")) {
            if (!take_query(p)) {
                result.error_msg = "SESS:ID is query only";
                return false;
            }
            return accept(result, ScpiCommandType::SESS_ID_QUERY, true);
        }
        if (match_node(p, "LOG")) {
            if (!take_query(p)) {
                result.error_msg = "SESS:LOG is query only";
                return false;
            }
            return accept(result, ScpiCommandType::SESS_LOG_QUERY, true);
        }
        result.error_msg = "Unknown SESS command";
        return false;
    }

    if (!match_node(p, "TEST")) {
        return false;
    }
    if (!take_colon(p)) {
        result.error_msg = "Expected TEST:<command>";
        return false;
    }

    if (match_node(p, "MEAS")) {
        if (!take_query(p)) {
            result.error_msg = "TEST:MEAS is query only";
            return false;
        }
        return accept(result, ScpiCommandType::TEST_MEAS_QUERY, true);
    }

    if (match_node(p, "HIPOT")) {
        if (!take_query(p)) {
            result.error_msg = "TEST:HIPOT is query only";
            return false;
        }
        if (parse_int(p, result.int_value)) {
            result.has_int = true;
        }
        return accept(result, ScpiCommandType::TEST_HIPOT_QUERY, true);
    }

    if (match_node(p, "FULL")) {
        if (!take_query(p)) {
            result.error_msg = "TEST:FULL is query only";
            return false;
        }
        if (!parse_string_pair(p, result, "<work order>,<part number>")) {
            return false;
        }
        return accept(result, ScpiCommandType::TEST_FULL_QUERY, true);
    }

    result.error_msg = "Unknown TEST command";
    return false;
}

ScpiCommand ScpiParser::parse(const std::string& line) {
    return parse(line.c_str());
}

ScpiCommand ScpiParser::parse(const char* line) {
    ScpiCommand result;

    // Skip leading whitespace
    line = skip_whitespace(line);

    if (*line == '\0') {
        result.error_msg = "Empty command";
        return result;
    }

    // Each subsystem parser returns false without touching error_msg when
    // the header is not its own
    if (parse_common_command(line, result)) {
        return result;
    }

    if (parse_system_command(line, result) || !result.error_msg.empty()) {
        return result;
    }

    if (parse_relay_command(line, result) || !result.error_msg.empty()) {
        return result;
    }

    if (parse_meter_command(line, result) || !result.error_msg.empty()) {
        return result;
    }

    if (parse_config_command(line, result) || !result.error_msg.empty()) {
        return result;
    }

    if (parse_hipot_command(line, result) || !result.error_msg.empty()) {
        return result;
    }

    if (parse_session_command(line, result) || !result.error_msg.empty()) {
        return result;
    }

    result.error_msg = "Unknown command";
    return result;
}
