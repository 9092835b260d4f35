#ifndef HW_CONFIG_HPP
#define HW_CONFIG_HPP

#include "pico/stdlib.h"
#include "hardware/spi.h"
#include "hardware/uart.h"

// Hardware GPIO pin assignments (bench controller board)
namespace HW_PINS {
    // Hipot tester RS-232 (through the level converter)
    constexpr uint HIPOT_UART_TX = 0;
    constexpr uint HIPOT_UART_RX = 1;

    // Multimeter serial cable
    constexpr uint METER_UART_TX = 4;
    constexpr uint METER_UART_RX = 5;

    // Relay IO expander
    constexpr uint SPI_MISO = 16;
    constexpr uint SPI_CS   = 17;
    constexpr uint SPI_CLK  = 18;
    constexpr uint SPI_MOSI = 19;
    constexpr uint RELAY_OE = 20;        // relay driver enable, active high
    constexpr uint LEVEL_SHIFT_OE = 21;
    constexpr uint EXPANDER_RESET = 22;
}

namespace UART_CONFIG {
    // uart0/uart1 are macros, not constexpr-compatible
    inline uart_inst_t* hipot_uart() { return uart0; }
    inline uart_inst_t* meter_uart() { return uart1; }
}

// SPI Configuration Constants
namespace SPI_CONFIG {
    inline spi_inst_t* get_spi_instance() { return spi0; }

    // MCP23S17 is rated to 10 MHz
    constexpr uint32_t BAUDRATE = 10 * 1000 * 1000;

    constexpr uint32_t RESET_PULSE_US = 10;    // IO expander reset pulse duration
    constexpr uint32_t RESET_SETTLE_US = 100;  // Settle time after reset release
}

#endif // HW_CONFIG_HPP
