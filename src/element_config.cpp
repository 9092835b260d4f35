#include "element_config.hpp"
#include "utils.hpp"

namespace ELEMENT_TABLE {

bool is_valid_voltage(uint16_t voltage) {
    for (uint16_t v : VOLTAGE_OPTIONS) {
        if (v == voltage) {
            return true;
        }
    }
    return false;
}

bool is_valid_wattage(uint16_t wattage) {
    for (uint16_t w : WATTAGE_OPTIONS) {
        if (w == wattage) {
            return true;
        }
    }
    return false;
}

bool lookup_range(uint16_t voltage, uint16_t wattage, ResistanceRange& out) {
    for (const auto& entry : RESISTANCE_TABLE) {
        if (entry.voltage == voltage && entry.wattage == wattage) {
            out.min_ohm = entry.min_ohm;
            out.max_ohm = entry.max_ohm;
            return true;
        }
    }
    return false;
}

ElementConfig make_config(uint16_t voltage, uint16_t wattage) {
    ElementConfig config;
    config.voltage = voltage;
    config.wattage = wattage;
    if (!lookup_range(voltage, wattage, config.range)) {
        config.range = ResistanceRange();
    }
    return config;
}

uint8_t hipot_file_for(uint16_t voltage) {
    if (voltage == 440 || voltage == 480) {
        return HIPOT_FILE_HIGH_VOLTAGE;
    }
    return HIPOT_FILE_STANDARD;
}

bool is_simulation_order(const std::string& work_order, const std::string& part_number) {
    std::string wo = utils::to_upper(utils::trim(work_order));
    std::string pn = utils::to_upper(utils::trim(part_number));
    return (wo == "TEST" && pn == "TEST") || (wo == "DEMO" && pn == "DEMO");
}

} // namespace ELEMENT_TABLE
