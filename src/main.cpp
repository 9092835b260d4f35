// main loop: initialize bench peripherals and instruments, enter command parsing loop
#include <stdio.h>
#include <cstring>
#include <string>
#include "pico/stdlib.h"
#include "tusb.h" // tinyusb, for usb serial

#include "scpi_parser.hpp"
#include "bench_controller.hpp"
#include "platform/hw_config.hpp"
#include "platform/spi_manager.hpp"
#include "platform/pico_serial.hpp"
#include "platform/flash_settings_store.hpp"

// Line buffer for serial input
static constexpr size_t LINE_BUFFER_SIZE = 256;
static char line_buffer[LINE_BUFFER_SIZE];
static size_t line_pos = 0;

// Global instances
static SpiManager spi_manager;
static PicoUartPort hipot_port(UART_CONFIG::hipot_uart(), HW_PINS::HIPOT_UART_TX, HW_PINS::HIPOT_UART_RX);
static PicoUartPort meter_port(UART_CONFIG::meter_uart(), HW_PINS::METER_UART_TX, HW_PINS::METER_UART_RX);
static PicoClock bench_clock;
static FlashSettingsStore settings_store;
static ScpiParser parser;

// Read a line from USB serial (non-blocking)
// Returns true if a complete line was read
static bool read_line() {
    while (true) {
        int c = getchar_timeout_us(0);
        if (c == PICO_ERROR_TIMEOUT) {
            return false;
        }

        if (c == '\r' || c == '\n') {
            if (line_pos > 0) {
                line_buffer[line_pos] = '\0';
                line_pos = 0;
                return true;
            }
            continue;
        }

        if (c == '\b' || c == 127) {
            if (line_pos > 0) {
                line_pos--;
                printf("\b \b");
            }
            continue;
        }

        // Printable ASCII only
        if (c >= 0x20 && c <= 0x7E && line_pos < LINE_BUFFER_SIZE - 1) {
            line_buffer[line_pos++] = static_cast<char>(c);
            putchar(c);
        }
    }
}

int main() {
    stdio_init_all();

    // Wait for the host to open the USB port
    while (!tud_cdc_connected()) {
        sleep_ms(100);
    }
    sleep_ms(100);

    printf("\r\n");
    printf("Element Tester Bench Controller v1.0\r\n");
    printf("Hipot link: uart0 (GP%u/GP%u), meter link: uart1 (GP%u/GP%u)\r\n",
           HW_PINS::HIPOT_UART_TX, HW_PINS::HIPOT_UART_RX, HW_PINS::METER_UART_TX, HW_PINS::METER_UART_RX);
    printf("Initializing...\r\n");

    // Relay driver outputs stay disabled until the expander is verified
    spi_manager.init();

    BenchHardware hardware;
    hardware.relay_port = &spi_manager.io_expander();
    hardware.hipot_port = &hipot_port;
    hardware.meter_port = &meter_port;
    hardware.clock = &bench_clock;
    hardware.settings_store = &settings_store;

    static BenchController controller(hardware);
    controller.init_all();

    spi_manager.enable_relay_outputs(!controller.relay_simulated());
    if (controller.relay_simulated()) {
        printf("WARNING: relay board not detected, relay commands are simulated\r\n");
    }
    if (controller.hipot_simulated() || controller.meter_simulated()) {
        printf("WARNING: instrument(s) not detected, see SYST:STAT?\r\n");
    }

    // Flush any garbage from USB buffer before accepting commands
    while (getchar_timeout_us(0) != PICO_ERROR_TIMEOUT) {}

    printf("Ready. Enter SCPI commands:\r\n");
    printf("> ");

    while (true) {
        if (read_line()) {
            printf("\r\n");

            ScpiCommand cmd = parser.parse(line_buffer);
            std::string response = controller.execute(cmd);

            printf("%s\r\n", response.c_str());
            printf("> ");
        }

        // Yield to USB processing
        tud_task();
    }

    return 0;
}
