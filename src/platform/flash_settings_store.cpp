#include "platform/flash_settings_store.hpp"
#include <cstring>
#include <cstdio>

// Pico SDK includes for flash operations
#include "hardware/flash.h"
#include "hardware/sync.h"
#include "pico/stdlib.h"

using namespace SettingsStorage;

// Flash is memory-mapped at XIP_BASE
static const FlashSettingsData* flash_image() {
    return reinterpret_cast<const FlashSettingsData*>(XIP_BASE + SETTINGS_FLASH_OFFSET);
}

static bool image_valid() {
    BenchSettings scratch;
    return decode(*flash_image(), scratch);
}

bool FlashSettingsStore::save(const BenchSettings& settings) {
    FlashSettingsData data;
    encode(settings, data);

    // Round up to page size
    constexpr size_t pages = (sizeof(FlashSettingsData) + SETTINGS_PAGE_SIZE - 1) / SETTINGS_PAGE_SIZE;
    constexpr size_t write_size = pages * SETTINGS_PAGE_SIZE;

    // Page-aligned buffer padded with the erased state
    static uint8_t write_buffer[write_size];
    memset(write_buffer, 0xFF, write_size);
    memcpy(write_buffer, &data, sizeof(FlashSettingsData));

    // Disable interrupts during flash operations
    uint32_t interrupts = save_and_disable_interrupts();
    flash_range_erase(SETTINGS_FLASH_OFFSET, SETTINGS_SECTOR_SIZE);
    flash_range_program(SETTINGS_FLASH_OFFSET, write_buffer, write_size);
    restore_interrupts(interrupts);

    // Verify write by checking CRC
    return image_valid();
}

bool FlashSettingsStore::load(BenchSettings& settings) {
    if (!decode(*flash_image(), settings)) {
        printf("[CONF] No valid settings in flash\r\n");
        return false;
    }
    return true;
}
