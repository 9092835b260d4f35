#include "serial_port.hpp"
#include <cstring>

void SerialPort::write_string(const std::string& text) {
    write(reinterpret_cast<const uint8_t*>(text.data()), text.size());
}

void SerialPort::write_line(const std::string& text, const char* terminator) {
    std::string line = text;
    line += terminator;
    write_string(line);
}

bool SerialPort::read_until(std::string& out, char terminator, uint32_t timeout_ms,
                            size_t max_len) {
    out.clear();
    uint8_t c;
    while (out.size() < max_len) {
        if (!read_byte(c, timeout_ms)) {
            return false;
        }
        if (static_cast<char>(c) == terminator) {
            return true;
        }
        out += static_cast<char>(c);
    }
    return false;
}
