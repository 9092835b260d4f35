#include "platform/spi_manager.hpp"
#include "platform/hw_config.hpp"
#include "pico/stdlib.h"
#include "hardware/gpio.h"

static void output_pin(uint pin, bool level) {
    gpio_init(pin);
    gpio_set_dir(pin, GPIO_OUT);
    gpio_put(pin, level);
}

void SpiManager::init_gpio() {
    // Relay coils stay unpowered until the expander latch holds a known state
    output_pin(HW_PINS::RELAY_OE, false);
    output_pin(HW_PINS::LEVEL_SHIFT_OE, true);
    output_pin(HW_PINS::EXPANDER_RESET, true);
    // Chip select is driven by software, idle high
    output_pin(HW_PINS::SPI_CS, true);
}

void SpiManager::reset_io_expander() {
    // Clears the latch, so all relay outputs read back as inputs until init()
    gpio_put(HW_PINS::EXPANDER_RESET, 0);
    sleep_us(SPI_CONFIG::RESET_PULSE_US);
    gpio_put(HW_PINS::EXPANDER_RESET, 1);
    sleep_us(SPI_CONFIG::RESET_SETTLE_US);
}

void SpiManager::init_spi() {
    spi_inst_t* spi = SPI_CONFIG::get_spi_instance();
    spi_init(spi, SPI_CONFIG::BAUDRATE);

    gpio_set_function(HW_PINS::SPI_MISO, GPIO_FUNC_SPI);
    gpio_set_function(HW_PINS::SPI_CLK, GPIO_FUNC_SPI);
    gpio_set_function(HW_PINS::SPI_MOSI, GPIO_FUNC_SPI);

    // MCP23S17 accepts mode 0,0 and 1,1; use 0,0
    spi_set_format(spi, 8, SPI_CPOL_0, SPI_CPHA_0, SPI_MSB_FIRST);
}

void SpiManager::init() {
    init_gpio();
    init_spi();
    reset_io_expander();

    // Register setup happens in IoExpander::init() via the relay board
    io_expander_.attach(SPI_CONFIG::get_spi_instance());

    initialized_ = true;
}

void SpiManager::enable_relay_outputs(bool enable) {
    if (!initialized_) {
        return;
    }
    gpio_put(HW_PINS::RELAY_OE, enable ? 1 : 0);
    outputs_enabled_ = enable;
}
