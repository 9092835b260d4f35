#ifndef IO_EXPANDER_HPP
#define IO_EXPANDER_HPP

#include <cstdint>
#include "hardware/spi.h"
#include "pico/stdlib.h"
#include "relay_board.hpp"

// MCP23S17 registers used by the relay board (BANK=0 addressing)
namespace MCP23S17 {
    constexpr uint8_t REG_IODIRA   = 0x00;  // 1=input, 0=output
    constexpr uint8_t REG_IODIRB   = 0x01;
    constexpr uint8_t REG_IOCON    = 0x0A;
    constexpr uint8_t REG_GPPUB    = 0x0D;  // port B pull-ups
    constexpr uint8_t REG_OLATA    = 0x14;  // port A output latch (relay coils)

    // IOCON Register Bits
    constexpr uint8_t IOCON_HAEN   = 0x08;  // Hardware address enable

    // Control byte construction
    constexpr uint8_t OPCODE_BASE  = 0x40;  // Fixed bits [7:4] = 0100

    inline constexpr uint8_t write_opcode(uint8_t hw_addr) {
        return OPCODE_BASE | ((hw_addr & 0x07) << 1);
    }

    inline constexpr uint8_t read_opcode(uint8_t hw_addr) {
        return OPCODE_BASE | ((hw_addr & 0x07) << 1) | 0x01;
    }
}

// MCP23S17 Hardware Addresses
namespace EXPANDER_ADDR {
    constexpr uint8_t RELAY_EXPANDER = 0;  // A2=0, A1=0, A0=0
}

// MCP23S17 driving the relay coil drivers: port A bit n = relay n,
// port B unused (inputs with pull-ups)
class IoExpander : public RelayPort {
public:
    // Must be called after the SPI peripheral is initialized
    void attach(spi_inst_t* spi, uint8_t hw_addr = EXPANDER_ADDR::RELAY_EXPANDER);

    // Configure directions and verify by reading them back
    bool init() override;
    void write_port(uint8_t value) override;
    uint8_t read_port() override;
    const char* get_type_name() const override { return "MCP23S17"; }

    // Low-level register access
    void write_register(uint8_t reg, uint8_t value);
    uint8_t read_register(uint8_t reg);

private:
    spi_inst_t* spi_ = nullptr;
    uint8_t hw_addr_ = EXPANDER_ADDR::RELAY_EXPANDER;

    // Assert/release CS for IO expander communication
    void cs_assert();
    void cs_release();
};

#endif // IO_EXPANDER_HPP
