#include "test.h"

#include "element_config.hpp"

TEST_CASE("Element rating options") {
    CHECK(ELEMENT_TABLE::is_valid_voltage(240));
    CHECK(ELEMENT_TABLE::is_valid_voltage(480));
    CHECK_FALSE(ELEMENT_TABLE::is_valid_voltage(110));
    CHECK(ELEMENT_TABLE::is_valid_wattage(12800));
    CHECK_FALSE(ELEMENT_TABLE::is_valid_wattage(5000));
}

TEST_CASE("Resistance table lookup") {
    ResistanceRange range;
    REQUIRE(ELEMENT_TABLE::lookup_range(240, 7000, range));
    CHECK(range.min_ohm == 11.95f);
    CHECK(range.max_ohm == 12.3f);
    CHECK(range.configured());

    CHECK_FALSE(ELEMENT_TABLE::lookup_range(220, 7000, range));
}

TEST_CASE("make_config leaves unlisted ratings without limits") {
    ElementConfig listed = ELEMENT_TABLE::make_config(480, 8500);
    CHECK(listed.voltage == 480);
    CHECK(listed.wattage == 8500);
    CHECK(listed.range.configured());
    CHECK(listed.range.min_ohm == 39.9f);

    ElementConfig unlisted = ELEMENT_TABLE::make_config(208, 9000);
    CHECK(unlisted.voltage == 208);
    CHECK_FALSE(unlisted.range.configured());
}

TEST_CASE("Range bounds are inclusive") {
    ResistanceRange range;
    range.min_ohm = 9.0f;
    range.max_ohm = 9.8f;
    CHECK(range.contains(9.0f));
    CHECK(range.contains(9.8f));
    CHECK_FALSE(range.contains(8.9f));
    CHECK_FALSE(range.contains(9.9f));
    CHECK_FALSE(ResistanceRange().configured());
}

TEST_CASE("Hipot file follows the element voltage") {
    CHECK(ELEMENT_TABLE::hipot_file_for(240) == ELEMENT_TABLE::HIPOT_FILE_STANDARD);
    CHECK(ELEMENT_TABLE::hipot_file_for(208) == 1);
    CHECK(ELEMENT_TABLE::hipot_file_for(440) == 2);
    CHECK(ELEMENT_TABLE::hipot_file_for(480) == ELEMENT_TABLE::HIPOT_FILE_HIGH_VOLTAGE);
}

TEST_CASE("Demo work orders run simulated") {
    CHECK(ELEMENT_TABLE::is_simulation_order("test", "TEST"));
    CHECK(ELEMENT_TABLE::is_simulation_order(" Demo ", "demo"));
    CHECK_FALSE(ELEMENT_TABLE::is_simulation_order("TEST", "DEMO"));
    CHECK_FALSE(ELEMENT_TABLE::is_simulation_order("WO-1001", "TEST"));
}
