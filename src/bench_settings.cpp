#include "bench_settings.hpp"
#include "utils.hpp"
#include <cmath>
#include <cstring>
#include <cstddef>
#include <cstdio>

const HipotPreset* BenchSettings::find_preset(const std::string& name) const {
    for (const HipotPreset& preset : hipot_presets) {
        if (preset.in_use() && utils::iequals(preset.name, name)) {
            return &preset;
        }
    }
    return nullptr;
}

bool BenchSettings::store_preset(const std::string& full_name, const HipotConfig& config) {
    std::string name = full_name.substr(0, HIPOT_PRESETS::MAX_NAME_LEN);
    if (name.empty()) {
        return false;
    }
    HipotPreset* slot = nullptr;
    for (HipotPreset& preset : hipot_presets) {
        if (preset.in_use() && utils::iequals(preset.name, name)) {
            slot = &preset;
            break;
        }
        if (!slot && !preset.in_use()) {
            slot = &preset;
        }
    }
    if (!slot) {
        return false;
    }
    slot->name = name;
    slot->config = config;
    return true;
}

namespace SettingsStorage {

uint16_t calculate_crc16(const uint8_t* data, size_t length) {
    uint16_t crc = 0xFFFF;

    for (size_t i = 0; i < length; i++) {
        crc ^= (static_cast<uint16_t>(data[i]) << 8);
        for (int j = 0; j < 8; j++) {
            if (crc & 0x8000) {
                crc = (crc << 1) ^ 0x1021;
            } else {
                crc <<= 1;
            }
        }
    }

    return crc;
}

static void encode_preset(const HipotPreset& preset, FlashHipotPreset& out) {
    memset(&out, 0, sizeof(out));
    if (!preset.in_use()) {
        return;
    }
    memcpy(out.name, preset.name.data(),
           preset.name.size() < HIPOT_PRESETS::MAX_NAME_LEN ? preset.name.size()
                                                            : HIPOT_PRESETS::MAX_NAME_LEN);

    const HipotConfig& c = preset.config;
    if (c.has_voltage) { out.fields |= PRESET_FIELD::VOLTAGE; out.voltage_v = c.voltage_v; }
    if (c.has_current_trip) { out.fields |= PRESET_FIELD::TRIP; out.current_trip_ma = c.current_trip_ma; }
    if (c.has_ramp) { out.fields |= PRESET_FIELD::RAMP; out.ramp_s = c.ramp_s; }
    if (c.has_dwell) { out.fields |= PRESET_FIELD::DWELL; out.dwell_s = c.dwell_s; }
    if (c.has_fall) { out.fields |= PRESET_FIELD::FALL; out.fall_s = c.fall_s; }
    if (c.has_polarity) {
        out.fields |= PRESET_FIELD::POLARITY;
        out.negative_polarity = utils::iequals(c.polarity, "NEG") ? 1 : 0;
    }
}

// Fields holding a non-finite value are dropped
static void decode_preset(const FlashHipotPreset& in, HipotPreset& preset) {
    preset = HipotPreset();
    size_t len = 0;
    while (len < sizeof(in.name) && in.name[len] != '\0') {
        len++;
    }
    if (len == 0 || len > HIPOT_PRESETS::MAX_NAME_LEN) {
        return;
    }
    preset.name.assign(in.name, len);

    HipotConfig& c = preset.config;
    auto take = [&in](uint8_t flag, float value, float& field, bool& has) {
        if ((in.fields & flag) && std::isfinite(value)) {
            field = value;
            has = true;
        }
    };
    take(PRESET_FIELD::VOLTAGE, in.voltage_v, c.voltage_v, c.has_voltage);
    take(PRESET_FIELD::TRIP, in.current_trip_ma, c.current_trip_ma, c.has_current_trip);
    take(PRESET_FIELD::RAMP, in.ramp_s, c.ramp_s, c.has_ramp);
    take(PRESET_FIELD::DWELL, in.dwell_s, c.dwell_s, c.has_dwell);
    take(PRESET_FIELD::FALL, in.fall_s, c.fall_s, c.has_fall);
    if (in.fields & PRESET_FIELD::POLARITY) {
        c.polarity = in.negative_polarity ? "NEG" : "POS";
        c.has_polarity = true;
    }
}

static uint16_t payload_crc(const FlashSettingsData& data) {
    const uint8_t* data_start = reinterpret_cast<const uint8_t*>(&data.meter_type);
    size_t data_size = sizeof(FlashSettingsData) - offsetof(FlashSettingsData, meter_type);
    return calculate_crc16(data_start, data_size);
}

void encode(const BenchSettings& settings, FlashSettingsData& out) {
    memset(&out, 0xFF, sizeof(out));  // erased flash state

    out.magic = SETTINGS_MAGIC;
    out.version = SETTINGS_VERSION;

    out.meter_type = static_cast<uint8_t>(settings.meter_type);
    out.relay_active_high = settings.relay_active_high ? 1 : 0;
    out.force_simulate = settings.force_simulate ? 1 : 0;
    out.pad = 0;

    out.hipot_baudrate = settings.hipot_baudrate;
    out.fluke_baudrate = settings.fluke_baudrate;
    out.ut61e_baudrate = settings.ut61e_baudrate;
    out.hipot_timeout_ms = settings.hipot_timeout_ms;
    out.meter_timeout_ms = settings.meter_timeout_ms;
    out.hipot_duration_ms = settings.hipot_duration_ms;
    out.position_timeout_ms = settings.position_timeout_ms;

    out.element_voltage = settings.element.voltage;
    out.element_wattage = settings.element.wattage;
    out.range_min_ohm = settings.element.range.min_ohm;
    out.range_max_ohm = settings.element.range.max_ohm;

    out.session_sequence = settings.session_sequence;

    for (size_t i = 0; i < HIPOT_PRESETS::MAX_PRESETS; i++) {
        encode_preset(settings.hipot_presets[i], out.hipot_presets[i]);
    }

    out.checksum = payload_crc(out);
}

bool decode(const FlashSettingsData& data, BenchSettings& settings) {
    if (data.magic != SETTINGS_MAGIC) {
        return false;
    }
    if (data.version != SETTINGS_VERSION) {
        return false;
    }
    if (payload_crc(data) != data.checksum) {
        return false;
    }

    BenchSettings loaded;
    loaded.meter_type = (data.meter_type == static_cast<uint8_t>(MeterType::UT61E_PLUS))
                            ? MeterType::UT61E_PLUS
                            : MeterType::FLUKE287;
    loaded.relay_active_high = data.relay_active_high != 0;
    loaded.force_simulate = data.force_simulate != 0;

    loaded.hipot_baudrate = data.hipot_baudrate;
    loaded.fluke_baudrate = data.fluke_baudrate;
    loaded.ut61e_baudrate = data.ut61e_baudrate;
    loaded.hipot_timeout_ms = data.hipot_timeout_ms;
    loaded.meter_timeout_ms = data.meter_timeout_ms;
    loaded.hipot_duration_ms = data.hipot_duration_ms;
    loaded.position_timeout_ms = data.position_timeout_ms;

    loaded.element.voltage = data.element_voltage;
    loaded.element.wattage = data.element_wattage;
    loaded.element.range.min_ohm = data.range_min_ohm;
    loaded.element.range.max_ohm = data.range_max_ohm;

    loaded.session_sequence = data.session_sequence;

    for (size_t i = 0; i < HIPOT_PRESETS::MAX_PRESETS; i++) {
        decode_preset(data.hipot_presets[i], loaded.hipot_presets[i]);
    }

    sanitize(loaded);
    settings = loaded;
    return true;
}

bool sanitize(BenchSettings& settings) {
    const BenchSettings defaults;
    bool changed = false;

    auto fix = [&changed](uint32_t& value, uint32_t fallback) {
        if (value == 0 || value == 0xFFFFFFFF) {
            value = fallback;
            changed = true;
        }
    };
    fix(settings.hipot_baudrate, defaults.hipot_baudrate);
    fix(settings.fluke_baudrate, defaults.fluke_baudrate);
    fix(settings.ut61e_baudrate, defaults.ut61e_baudrate);
    fix(settings.hipot_timeout_ms, defaults.hipot_timeout_ms);
    fix(settings.meter_timeout_ms, defaults.meter_timeout_ms);
    fix(settings.hipot_duration_ms, defaults.hipot_duration_ms);
    fix(settings.position_timeout_ms, defaults.position_timeout_ms);

    ResistanceRange& range = settings.element.range;
    if (!(range.min_ohm >= 0.0f) || !(range.max_ohm >= range.min_ohm)) {
        range = ResistanceRange();
        changed = true;
    }

    return changed;
}

}  // namespace SettingsStorage

bool MemorySettingsStore::save(const BenchSettings& settings) {
    SettingsStorage::encode(settings, image_);
    save_count_++;
    return true;
}

bool MemorySettingsStore::load(BenchSettings& settings) {
    return SettingsStorage::decode(image_, settings);
}
