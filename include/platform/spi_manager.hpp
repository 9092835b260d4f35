#ifndef SPI_MANAGER_HPP
#define SPI_MANAGER_HPP

#include <cstdint>
#include <cstddef>

#include "hardware/spi.h"
#include "platform/io_expander.hpp"

// SPI peripheral, level shifter and relay driver enable for the relay
// expander. Relay coils stay disabled until enable_relay_outputs(true)
class SpiManager {
public:
    // Initialize GPIO pins, SPI peripheral and reset the IO expander
    void init();

    // Drive the relay driver output-enable line
    void enable_relay_outputs(bool enable);
    bool relay_outputs_enabled() const { return outputs_enabled_; }

    IoExpander& io_expander() { return io_expander_; }

private:
    IoExpander io_expander_;
    bool initialized_ = false;
    bool outputs_enabled_ = false;

    // Internal helpers
    void init_gpio();          // Configure GPIO pins
    void reset_io_expander();  // Pulse reset line
    void init_spi();           // Configure SPI peripheral
};

#endif // SPI_MANAGER_HPP
