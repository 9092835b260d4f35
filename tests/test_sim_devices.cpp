#include "test.h"
#include "fakes.hpp"

#include "ar3865.hpp"
#include "fluke287.hpp"
#include "relay_board.hpp"
#include "sim_devices.hpp"
#include "ut61e_plus.hpp"

TEST_CASE("Simulated hipot answers the instrument protocol") {
    SimHipotPort port;
    FakeClock clock;
    Ar3865 hipot;
    hipot.setup(&port, &clock);

    REQUIRE(hipot.init());
    std::string idn;
    REQUIRE(hipot.identify(idn));
    CHECK(idn == SimHipotPort::IDN);

    std::string raw;
    REQUIRE(hipot.get_result(raw));
    CHECK(raw == SimHipotPort::PASS_RESULT);

    port.set_force_fail(true);
    HipotResult result;
    REQUIRE(hipot.run_from_file(1, 1000, result));
    CHECK_FALSE(result.passed);
    CHECK(result.status == "HI-LIMIT");
}

TEST_CASE("Simulated hipot remembers configuration") {
    SimHipotPort port;
    FakeClock clock;
    Ar3865 hipot;
    hipot.setup(&port, &clock);
    REQUIRE(hipot.init());

    HipotConfig config;
    config.voltage_v = 1500.0f;
    config.has_voltage = true;
    config.current_trip_ma = 7.0f;
    config.has_current_trip = true;
    REQUIRE(hipot.configure(config));

    HipotConfig readback;
    REQUIRE(hipot.read_config(readback));
    CHECK(readback.voltage_v == 1500.0f);
    CHECK(readback.current_trip_ma == 7.0f);

    REQUIRE(hipot.select_file(2));
    int32_t file = 0;
    REQUIRE(hipot.query_selected_file(file));
    CHECK(file == 2);
}

TEST_CASE("Simulated meter serves both meter protocols") {
    SimMeterPort port;
    FakeClock clock;
    SimRelayPort relay_port;
    RelayBoard relays;
    relays.setup(&relay_port, &clock);
    REQUIRE(relays.init());
    port.observe(&relays);

    const float values[RELAY_MAP::NUM_POSITIONS] = {12.3f, 45.4f, 6.5f};
    port.set_position_values(values);

    SUBCASE("Fluke 287") {
        Fluke287 meter;
        meter.setup(&port, &clock, FLUKE287::DEFAULT_BAUDRATE, FLUKE287::DEFAULT_TIMEOUT_MS);
        REQUIRE(meter.init());

        MeterReading reading;
        REQUIRE(meter.read_value(reading));
        CHECK_CLOSE(reading.value, SimMeterPort::DEFAULT_RESISTANCE, 1e-4f);

        relays.set_state(RELAY_MAP::position_mask(RELAY_MAP::POSITIONS[0]));
        REQUIRE(meter.read_value(reading));
        CHECK_CLOSE(reading.value, 12.3f, 1e-3f);
    }

    SUBCASE("UT61E+") {
        Ut61ePlus meter;
        meter.setup(&port, &clock, UT61E_PLUS::DEFAULT_BAUDRATE, UT61E_PLUS::DEFAULT_TIMEOUT_MS);
        REQUIRE(meter.init());

        relays.set_state(RELAY_MAP::position_mask(RELAY_MAP::POSITIONS[1]));
        MeterReading reading;
        REQUIRE(meter.read_value(reading));
        CHECK_CLOSE(reading.value, 45.4f, 1e-3f);
        CHECK(reading.unit == "OHM");
        CHECK(port.config().baudrate == 9600);
    }
}

TEST_CASE("Simulated relay port keeps the last value") {
    SimRelayPort port;
    FakeClock clock;
    RelayBoard board;
    board.setup(&port, &clock, false);
    REQUIRE(board.init());
    CHECK(port.read_port() == 0xFF);

    board.set_relay(7, true);
    CHECK(port.read_port() == 0x7F);
    CHECK(std::string(board.port_name()) == "SIM");
}

TEST_CASE("Simulated meter reads the value of the closed position") {
    SimMeterPort port;
    SimRelayPort relay_port;
    FakeClock clock;
    RelayBoard relays;
    relays.setup(&relay_port, &clock);
    REQUIRE(relays.init());

    const float values[RELAY_MAP::NUM_POSITIONS] = {11.1f, 12.2f, 13.3f};
    port.set_position_values(values);
    CHECK_CLOSE(port.current_reading(), SimMeterPort::DEFAULT_RESISTANCE, 1e-5f);

    port.observe(&relays);
    CHECK_CLOSE(port.current_reading(), SimMeterPort::DEFAULT_RESISTANCE, 1e-5f);

    for (size_t i = 0; i < RELAY_MAP::NUM_POSITIONS; i++) {
        relays.set_state(RELAY_MAP::position_mask(RELAY_MAP::POSITIONS[i]));
        CHECK_CLOSE(port.current_reading(), values[i], 1e-5f);
    }

    // Anything other than exactly one position reads the open-route value
    relays.set_state(0xC0);
    CHECK_CLOSE(port.current_reading(), SimMeterPort::DEFAULT_RESISTANCE, 1e-5f);

    Fluke287 meter;
    meter.setup(&port, &clock, FLUKE287::DEFAULT_BAUDRATE, FLUKE287::DEFAULT_TIMEOUT_MS);
    REQUIRE(meter.init());
    relays.set_state(RELAY_MAP::position_mask(RELAY_MAP::POSITIONS[1]));
    MeterReading reading;
    REQUIRE(meter.read_value(reading));
    CHECK_CLOSE(reading.value, 12.2f, 1e-3f);
}
