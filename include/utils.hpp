#ifndef UTILS_HPP
#define UTILS_HPP

#include <vector>
#include <string>
#include <sstream>
#include <cstdint>

// helper funcs like string split, trim, number parsing
namespace utils {
    // Split on delim. Empty tokens are dropped unless keep_empty is set
    std::vector<std::string> split(const std::string &s, char delim, bool keep_empty = false);
    std::string trim(const std::string &s);
    std::string to_upper(const std::string &s);
    bool iequals(const std::string &a, const std::string &b);
    // Case-insensitive substring search
    bool icontains(const std::string &haystack, const std::string &needle);
    // Decimal only; false on overflow of int32
    bool parse_int(const std::string &s, int32_t &out);
    // Accepts an optional exponent ("6.512E0", "9.99999999E+37")
    bool parse_float(const std::string &s, float &out);
    // Round to one decimal place (resistance readings are kept at 0.1 ohm)
    float round_tenths(float value);
    // printf-style float formatting, "%g" by default
    std::string format_float(float value, const char* fmt = "%g");
}

#endif // UTILS_HPP
