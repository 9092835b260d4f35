#ifndef BENCH_SETTINGS_HPP
#define BENCH_SETTINGS_HPP

#include <cstdint>
#include <cstddef>
#include <string>
#include "multimeter.hpp"
#include "element_config.hpp"
#include "ar3865.hpp"

namespace HIPOT_PRESETS {
    constexpr size_t MAX_PRESETS = 4;
    constexpr size_t MAX_NAME_LEN = 15;
}

// Named hipot profile, applied on top of whatever the instrument holds
struct HipotPreset {
    std::string name;       // empty = unused slot
    HipotConfig config;

    bool in_use() const { return !name.empty(); }
};

// Runtime configuration of the bench, persisted across power cycles
struct BenchSettings {
    MeterType meter_type = MeterType::FLUKE287;
    bool relay_active_high = true;
    bool force_simulate = false;

    uint32_t hipot_baudrate = 38400;
    uint32_t fluke_baudrate = 115200;
    uint32_t ut61e_baudrate = 9600;
    uint32_t hipot_timeout_ms = 5000;
    uint32_t meter_timeout_ms = 1000;
    uint32_t hipot_duration_ms = 5000;
    uint32_t position_timeout_ms = 10000;

    ElementConfig element;

    // Last session number handed out
    uint16_t session_sequence = 0;

    HipotPreset hipot_presets[HIPOT_PRESETS::MAX_PRESETS];

    uint32_t meter_baudrate() const {
        return meter_type == MeterType::UT61E_PLUS ? ut61e_baudrate : fluke_baudrate;
    }

    // Case-insensitive. nullptr if no preset has that name
    const HipotPreset* find_preset(const std::string& name) const;

    // Replaces a preset of the same name, else takes a free slot.
    // False when every slot is taken
    bool store_preset(const std::string& name, const HipotConfig& config);
};

// Flash image layout, versioning and integrity check for BenchSettings
namespace SettingsStorage {

// Flash configuration for RP2040 / RP2350 (2 MB parts)
constexpr uint32_t FLASH_TOTAL_SIZE = 2 * 1024 * 1024;
constexpr uint32_t SETTINGS_SECTOR_SIZE = 4096;      // 4KB erase sector
constexpr uint32_t SETTINGS_PAGE_SIZE = 256;        // 256-byte write page

// Last sector, clear of program code
constexpr uint32_t SETTINGS_FLASH_OFFSET = FLASH_TOTAL_SIZE - SETTINGS_SECTOR_SIZE;

constexpr uint32_t SETTINGS_MAGIC = 0x45545343;  // "ETSC" (element tester settings)
constexpr uint16_t SETTINGS_VERSION = 2;

// HipotConfig field flags in FlashHipotPreset::fields
namespace PRESET_FIELD {
    constexpr uint8_t VOLTAGE  = 0x01;
    constexpr uint8_t TRIP     = 0x02;
    constexpr uint8_t RAMP     = 0x04;
    constexpr uint8_t DWELL    = 0x08;
    constexpr uint8_t FALL     = 0x10;
    constexpr uint8_t POLARITY = 0x20;
}

struct __attribute__((packed)) FlashHipotPreset {
    char name[HIPOT_PRESETS::MAX_NAME_LEN + 1];  // NUL padded, empty = unused
    uint8_t fields;
    uint8_t negative_polarity;
    uint8_t pad[2];
    float voltage_v;
    float current_trip_ma;
    float ramp_s;
    float dwell_s;
    float fall_s;
};

struct __attribute__((packed)) FlashSettingsData {
    // Header (8 bytes)
    uint32_t magic;
    uint16_t version;
    uint16_t checksum;           // CRC-16 of everything after the header

    uint8_t meter_type;
    uint8_t relay_active_high;
    uint8_t force_simulate;
    uint8_t pad;

    uint32_t hipot_baudrate;
    uint32_t fluke_baudrate;
    uint32_t ut61e_baudrate;
    uint32_t hipot_timeout_ms;
    uint32_t meter_timeout_ms;
    uint32_t hipot_duration_ms;
    uint32_t position_timeout_ms;

    uint16_t element_voltage;
    uint16_t element_wattage;
    float range_min_ohm;
    float range_max_ohm;

    uint16_t session_sequence;

    FlashHipotPreset hipot_presets[HIPOT_PRESETS::MAX_PRESETS];

    uint8_t reserved[64];
};

static_assert(sizeof(FlashSettingsData) <= SETTINGS_SECTOR_SIZE,
              "Settings data exceeds flash sector size");

// CRC-16 (CCITT polynomial 0x1021, init 0xFFFF)
uint16_t calculate_crc16(const uint8_t* data, size_t length);

void encode(const BenchSettings& settings, FlashSettingsData& out);

// Returns false (and leaves settings untouched) on bad magic, version or CRC
bool decode(const FlashSettingsData& data, BenchSettings& settings);

// Replace out-of-range fields with defaults. Returns true if anything changed
bool sanitize(BenchSettings& settings);

}  // namespace SettingsStorage

// Persistent home for BenchSettings
class SettingsStore {
public:
    virtual ~SettingsStore() = default;

    virtual bool save(const BenchSettings& settings) = 0;
    // Returns true if valid data was found and loaded
    virtual bool load(BenchSettings& settings) = 0;
};

// RAM-backed store holding the same image a flash sector would
class MemorySettingsStore : public SettingsStore {
public:
    bool save(const BenchSettings& settings) override;
    bool load(BenchSettings& settings) override;

    uint32_t save_count() const { return save_count_; }
    SettingsStorage::FlashSettingsData& image() { return image_; }

private:
    SettingsStorage::FlashSettingsData image_ = {};
    uint32_t save_count_ = 0;
};

#endif // BENCH_SETTINGS_HPP
