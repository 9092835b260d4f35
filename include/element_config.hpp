#ifndef ELEMENT_CONFIG_HPP
#define ELEMENT_CONFIG_HPP

#include <cstdint>
#include <cstddef>
#include <string>

// Acceptable per-leg resistance. min == max == 0 means no limits configured
struct ResistanceRange {
    float min_ohm = 0.0f;
    float max_ohm = 0.0f;

    bool configured() const { return !(min_ohm == 0.0f && max_ohm == 0.0f); }
    bool contains(float ohms) const { return ohms >= min_ohm && ohms <= max_ohm; }
};

// Rated voltage and wattage of the element under test
struct ElementConfig {
    uint16_t voltage = 0;
    uint16_t wattage = 0;
    ResistanceRange range;
};

struct ResistanceTableEntry {
    uint16_t voltage;
    uint16_t wattage;
    float min_ohm;
    float max_ohm;
};

namespace ELEMENT_TABLE {
    constexpr uint16_t VOLTAGE_OPTIONS[] = {208, 220, 230, 240, 440, 480};
    constexpr uint16_t WATTAGE_OPTIONS[] = {7000, 7500, 8000, 8500, 9000, 11000, 12800, 14000};

    // Per leg: each measurement sees half of the element
    constexpr ResistanceTableEntry RESISTANCE_TABLE[] = {
        {208, 7000, 9.1f, 9.8f},
        {208, 8500, 7.5f, 8.3f},
        {230, 7000, 11.0f, 11.75f},
        {230, 8500, 9.0f, 9.8f},
        {240, 7000, 11.95f, 12.3f},
        {240, 8500, 9.75f, 10.75f},
        {480, 7000, 45.1f, 45.6f},
        {480, 8500, 39.9f, 41.25f},
    };

    constexpr uint8_t HIPOT_FILE_STANDARD = 1;
    constexpr uint8_t HIPOT_FILE_HIGH_VOLTAGE = 2;  // 440 V and 480 V elements

    bool is_valid_voltage(uint16_t voltage);
    bool is_valid_wattage(uint16_t wattage);

    // False when the combination is not in the table
    bool lookup_range(uint16_t voltage, uint16_t wattage, ResistanceRange& out);

    // Fill voltage/wattage and the table range (unconfigured if not listed)
    ElementConfig make_config(uint16_t voltage, uint16_t wattage);

    uint8_t hipot_file_for(uint16_t voltage);

    // Work order / part number pairs reserved for bench demos
    bool is_simulation_order(const std::string& work_order, const std::string& part_number);
}

#endif // ELEMENT_CONFIG_HPP
