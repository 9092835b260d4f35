#include "utils.hpp"
#include <cctype>
#include <cmath>
#include <cstdio>

namespace utils {

std::vector<std::string> split(const std::string &s, char delim, bool keep_empty) {
    std::vector<std::string> tokens;
    std::stringstream ss(s);
    std::string token;

    while (std::getline(ss, token, delim)) {
        if (keep_empty || !token.empty()) {
            tokens.push_back(token);
        }
    }

    // getline drops a trailing empty field ("a,b," -> 2 tokens)
    if (keep_empty && !s.empty() && s.back() == delim) {
        tokens.push_back("");
    }

    return tokens;
}

std::string trim(const std::string &s) {
    size_t start = 0;
    while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) {
        start++;
    }
    size_t end = s.size();
    while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) {
        end--;
    }
    return s.substr(start, end - start);
}

std::string to_upper(const std::string &s) {
    std::string out = s;
    for (char &c : out) {
        c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    }
    return out;
}

bool iequals(const std::string &a, const std::string &b) {
    return to_upper(a) == to_upper(b);
}

bool icontains(const std::string &haystack, const std::string &needle) {
    return to_upper(haystack).find(to_upper(needle)) != std::string::npos;
}

bool parse_int(const std::string &s, int32_t &out) {
    if (s.empty()) {
        return false;
    }

    size_t i = 0;
    bool negative = false;

    // Handle sign
    if (s[0] == '-') {
        negative = true;
        i = 1;
    } else if (s[0] == '+') {
        i = 1;
    }

    if (i >= s.size()) {
        return false;
    }

    // One past INT32_MAX is allowed for the negative side
    const int64_t limit = negative ? 2147483648LL : 2147483647LL;
    int64_t result = 0;
    for (; i < s.size(); ++i) {
        char c = s[i];
        if (c < '0' || c > '9') {
            return false;
        }
        result = result * 10 + (c - '0');
        if (result > limit) {
            return false;
        }
    }

    out = static_cast<int32_t>(negative ? -result : result);
    return true;
}

bool parse_float(const std::string &s, float &out) {
    if (s.empty()) {
        return false;
    }

    size_t i = 0;
    bool negative = false;

    // Handle sign
    if (s[0] == '-') {
        negative = true;
        i = 1;
    } else if (s[0] == '+') {
        i = 1;
    }

    if (i >= s.size()) {
        return false;
    }

    double result = 0.0;
    bool has_decimal = false;
    bool has_digit = false;
    double decimal_place = 0.1;

    for (; i < s.size(); ++i) {
        char c = s[i];

        if (c == '.') {
            if (has_decimal) {
                return false;  // Multiple decimal points
            }
            has_decimal = true;
            continue;
        }

        if (c == 'e' || c == 'E') {
            break;
        }

        if (c < '0' || c > '9') {
            return false;
        }

        has_digit = true;
        if (has_decimal) {
            result += (c - '0') * decimal_place;
            decimal_place *= 0.1;
        } else {
            result = result * 10.0 + (c - '0');
        }
    }

    if (!has_digit) {
        return false;
    }

    // Exponent part
    if (i < s.size()) {
        int32_t exponent = 0;
        if (!parse_int(s.substr(i + 1), exponent)) {
            return false;
        }
        result *= std::pow(10.0, exponent);
    }

    if (!std::isfinite(static_cast<float>(result))) {
        return false;
    }
    out = static_cast<float>(negative ? -result : result);
    return true;
}

float round_tenths(float value) {
    return std::round(value * 10.0f) / 10.0f;
}

std::string format_float(float value, const char* fmt) {
    char buf[32];
    snprintf(buf, sizeof(buf), fmt, static_cast<double>(value));
    return buf;
}

} // namespace utils
