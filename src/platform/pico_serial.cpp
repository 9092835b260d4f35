#include "platform/pico_serial.hpp"
#include "hardware/gpio.h"

PicoUartPort::PicoUartPort(uart_inst_t* uart, uint tx_pin, uint rx_pin)
    : uart_(uart), tx_pin_(tx_pin), rx_pin_(rx_pin) {}

bool PicoUartPort::open(const SerialConfig& config) {
    if (open_) {
        uart_deinit(uart_);
    }

    uint actual = uart_init(uart_, config.baudrate);
    if (actual == 0) {
        open_ = false;
        return false;
    }

    gpio_set_function(tx_pin_, GPIO_FUNC_UART);
    gpio_set_function(rx_pin_, GPIO_FUNC_UART);

    uart_parity_t parity = UART_PARITY_NONE;
    if (config.parity == 'E') {
        parity = UART_PARITY_EVEN;
    } else if (config.parity == 'O') {
        parity = UART_PARITY_ODD;
    }
    uart_set_format(uart_, config.data_bits, config.stop_bits, parity);
    uart_set_hw_flow(uart_, false, false);
    uart_set_fifo_enabled(uart_, true);

    open_ = true;
    flush_input();
    return true;
}

void PicoUartPort::close() {
    if (open_) {
        uart_deinit(uart_);
        open_ = false;
    }
}

void PicoUartPort::write(const uint8_t* data, size_t len) {
    if (!open_) {
        return;
    }
    uart_write_blocking(uart_, data, len);
}

bool PicoUartPort::read_byte(uint8_t& out, uint32_t timeout_ms) {
    if (!open_) {
        return false;
    }
    if (!uart_is_readable_within_us(uart_, timeout_ms * 1000u)) {
        return false;
    }
    out = static_cast<uint8_t>(uart_getc(uart_));
    return true;
}

void PicoUartPort::flush_input() {
    while (open_ && uart_is_readable(uart_)) {
        (void)uart_getc(uart_);
    }
}

uint32_t PicoClock::now_ms() {
    return to_ms_since_boot(get_absolute_time());
}

void PicoClock::sleep_ms(uint32_t ms) {
    ::sleep_ms(ms);
}
