#ifndef PICO_SERIAL_HPP
#define PICO_SERIAL_HPP

#include <cstdint>
#include "pico/stdlib.h"
#include "hardware/uart.h"
#include "serial_port.hpp"
#include "bench_clock.hpp"

// Instrument link on one of the RP2040 hardware UARTs
class PicoUartPort : public SerialPort {
public:
    PicoUartPort(uart_inst_t* uart, uint tx_pin, uint rx_pin);

    bool open(const SerialConfig& config) override;
    void close() override;
    bool is_open() const override { return open_; }
    void write(const uint8_t* data, size_t len) override;
    bool read_byte(uint8_t& out, uint32_t timeout_ms) override;
    void flush_input() override;

private:
    uart_inst_t* uart_;
    uint tx_pin_;
    uint rx_pin_;
    bool open_ = false;
};

// Clock on the SDK's microsecond timer
class PicoClock : public Clock {
public:
    uint32_t now_ms() override;
    void sleep_ms(uint32_t ms) override;
};

#endif // PICO_SERIAL_HPP
