#ifndef FLASH_SETTINGS_STORE_HPP
#define FLASH_SETTINGS_STORE_HPP

#include "bench_settings.hpp"

// BenchSettings in the last 4KB sector of on-board flash
class FlashSettingsStore : public SettingsStore {
public:
    // Returns true once the written image reads back with a valid CRC
    bool save(const BenchSettings& settings) override;
    bool load(BenchSettings& settings) override;
};

#endif // FLASH_SETTINGS_STORE_HPP
