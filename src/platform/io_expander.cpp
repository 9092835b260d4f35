#include "platform/io_expander.hpp"
#include "platform/hw_config.hpp"
#include "hardware/gpio.h"

void IoExpander::cs_assert() {
    gpio_put(HW_PINS::SPI_CS, 0);
}

void IoExpander::cs_release() {
    gpio_put(HW_PINS::SPI_CS, 1);
}

void IoExpander::attach(spi_inst_t* spi, uint8_t hw_addr) {
    spi_ = spi;
    hw_addr_ = hw_addr;
}

void IoExpander::write_register(uint8_t reg, uint8_t value) {
    uint8_t tx_buf[3] = {
        MCP23S17::write_opcode(hw_addr_),
        reg,
        value
    };

    cs_assert();
    spi_write_blocking(spi_, tx_buf, 3);
    cs_release();
}

uint8_t IoExpander::read_register(uint8_t reg) {
    uint8_t tx_buf[3] = {
        MCP23S17::read_opcode(hw_addr_),
        reg,
        0x00  // Dummy byte to clock out data
    };
    uint8_t rx_buf[3] = {0};

    cs_assert();
    spi_write_read_blocking(spi_, tx_buf, rx_buf, 3);
    cs_release();

    return rx_buf[2];  // Data is in third byte
}

bool IoExpander::init() {
    if (!spi_) {
        return false;
    }

    // Before HAEN is set the expander answers on address 0 only
    write_register(MCP23S17::REG_IOCON, MCP23S17::IOCON_HAEN);
    sleep_us(10);

    // Latch all coils off before switching port A to outputs
    write_register(MCP23S17::REG_OLATA, 0x00);
    write_register(MCP23S17::REG_IODIRA, 0x00);
    write_register(MCP23S17::REG_IODIRB, 0xFF);
    write_register(MCP23S17::REG_GPPUB, 0xFF);

    // A missing chip reads back all zeros or all ones on a floating MISO
    uint8_t iodira = read_register(MCP23S17::REG_IODIRA);
    uint8_t iodirb = read_register(MCP23S17::REG_IODIRB);
    uint8_t iocon = read_register(MCP23S17::REG_IOCON);
    return iodira == 0x00 && iodirb == 0xFF && (iocon & MCP23S17::IOCON_HAEN) != 0;
}

void IoExpander::write_port(uint8_t value) {
    write_register(MCP23S17::REG_OLATA, value);
}

uint8_t IoExpander::read_port() {
    return read_register(MCP23S17::REG_OLATA);
}
