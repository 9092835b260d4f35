#ifndef SERIAL_PORT_HPP
#define SERIAL_PORT_HPP

#include <cstdint>
#include <cstddef>
#include <string>

// Line settings for an instrument serial link
struct SerialConfig {
    uint32_t baudrate = 9600;
    uint8_t data_bits = 8;
    char parity = 'N';      // 'N', 'E' or 'O'
    uint8_t stop_bits = 1;
};

// Abstract byte stream to an instrument: one instance per physical link
class SerialPort {
public:
    virtual ~SerialPort() = default;

    // Open (or re-open with new settings). Returns false if the link is unusable
    virtual bool open(const SerialConfig& config) = 0;
    virtual void close() = 0;
    virtual bool is_open() const = 0;

    virtual void write(const uint8_t* data, size_t len) = 0;

    // Wait up to timeout_ms for one byte. Returns false on timeout
    virtual bool read_byte(uint8_t& out, uint32_t timeout_ms) = 0;

    // Discard anything pending in the receive path
    virtual void flush_input() = 0;

    // Helpers built on the primitives above
    void write_string(const std::string& text);
    void write_line(const std::string& text, const char* terminator);

    // Read until terminator (not stored) or until a byte wait times out.
    // Returns true only if the terminator was seen
    bool read_until(std::string& out, char terminator, uint32_t timeout_ms,
                    size_t max_len = 256);
};

#endif // SERIAL_PORT_HPP
