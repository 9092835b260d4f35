#ifndef MULTIMETER_HPP
#define MULTIMETER_HPP

#include <cstdint>
#include <string>

class SerialPort;
class Clock;

// One decoded meter reading
struct MeterReading {
    float value = 0.0f;
    bool has_value = false;     // false for overload or unparseable displays
    bool is_overload = false;
    std::string unit;           // "OHM", "V", ...
    std::string mode;           // meter function, backend specific
    std::string raw;            // undecoded response, for logs
};

enum class MeterType : uint8_t {
    FLUKE287 = 0,
    UT61E_PLUS = 1,
};

namespace METER_CONFIG {
    constexpr uint8_t DEFAULT_MAX_RETRIES = 3;
    constexpr uint32_t RETRY_DELAY_MS = 200;
}

const char* meter_type_name(MeterType type);
// Accepts "FLUKE287", "FLUKE", "UT61E", "UT61E+", "UT61EP" (any case)
bool parse_meter_type(const std::string& name, MeterType& out);

// Abstract meter backend: one instance per supported meter model
class Multimeter {
public:
    virtual ~Multimeter() = default;

    void setup(SerialPort* port, Clock* clock, uint32_t baudrate, uint32_t timeout_ms);

    // Open the link and take one test reading. Returns false if the meter is silent
    virtual bool init() = 0;

    // Take one reading, retrying up to max_retries times
    virtual bool read_value(MeterReading& reading,
                            uint8_t max_retries = METER_CONFIG::DEFAULT_MAX_RETRIES) = 0;

    virtual MeterType get_type() const = 0;
    virtual const char* get_type_name() const = 0;

    // Drop stale bytes, required after relay switching
    void flush_buffer();

    // Average of average_count successful readings
    bool read_resistance(float& ohms, uint8_t average_count = 1);

    bool is_connected() const { return connected_; }
    SerialPort* port() const { return port_; }

protected:
    SerialPort* port_ = nullptr;
    Clock* clock_ = nullptr;
    uint32_t baudrate_ = 9600;
    uint32_t timeout_ms_ = 2000;
    bool connected_ = false;

    // Open the port with this backend's line settings
    bool open_port();
};

#endif // MULTIMETER_HPP
