#ifndef FLUKE287_HPP
#define FLUKE287_HPP

#include <cstdint>
#include <string>
#include "multimeter.hpp"

// Fluke 287 remote interface over the IR serial cable.
// QM (query measurement) answers "<ack>\r<value>,<unit>,<state>,<attribute>\r"
namespace FLUKE287 {
    constexpr uint32_t DEFAULT_BAUDRATE = 115200;
    constexpr uint32_t DEFAULT_TIMEOUT_MS = 1000;
    constexpr const char* CMD_QUERY_MEASUREMENT = "QM";

    // Readings at or above this are the meter's overload marker (9.99999999E+37)
    constexpr float OVERLOAD_THRESHOLD = 9.9e37f;

    // Ack codes
    constexpr char ACK_OK = '0';
    constexpr char ACK_SYNTAX_ERROR = '1';
    constexpr char ACK_EXECUTION_ERROR = '2';
    constexpr char ACK_NO_DATA = '5';
}

struct Fluke287Measurement {
    std::string ack;
    float value = 0.0f;
    std::string unit;
    std::string state;
    std::string attribute;
};

class Fluke287 : public Multimeter {
public:
    bool init() override;
    bool read_value(MeterReading& reading,
                    uint8_t max_retries = METER_CONFIG::DEFAULT_MAX_RETRIES) override;
    MeterType get_type() const override { return MeterType::FLUKE287; }
    const char* get_type_name() const override { return "FLUKE287"; }

    // Send a command and collect the reply up to the second CR
    bool send_command(const std::string& command, std::string& response);

    // Decode a QM reply. error is set when false is returned
    static bool parse_qm_response(const std::string& response, Fluke287Measurement& out,
                                  std::string& error);
};

#endif // FLUKE287_HPP
