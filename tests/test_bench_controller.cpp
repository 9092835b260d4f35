#include "test.h"
#include "fakes.hpp"

#include "bench_controller.hpp"
#include "scpi_parser.hpp"
#include "utils.hpp"

namespace {

BenchHardware bare_hardware(Clock* clock, SettingsStore* store) {
    BenchHardware hw;
    hw.clock = clock;
    hw.settings_store = store;
    return hw;
}

// Controller with no instruments attached: every device falls back to its simulator
struct SimBench {
    FakeClock clock;
    MemorySettingsStore store;
    ScpiParser parser;
    BenchController controller{bare_hardware(&clock, &store)};

    SimBench() { controller.init_all(); }

    std::string cmd(const std::string& line) {
        return controller.execute(parser.parse(line));
    }
};

} // namespace

TEST_CASE("Missing instruments are replaced by simulators") {
    SimBench bench;
    CHECK(bench.controller.relay_simulated());
    CHECK(bench.controller.hipot_simulated());
    CHECK(bench.controller.meter_simulated());

    CHECK(bench.cmd("*IDN?") == BENCH_INFO::IDN);
    CHECK(bench.cmd("SYST:STAT?") ==
          "RELAY:SIM,HIPOT:SIM,METER:FLUKE287:SIM,MODE:NORMAL,SESSION:NONE");
}

TEST_CASE("Attached hardware is used when it answers") {
    FakeClock clock;
    MemorySettingsStore store;
    FakeRelayPort relay_port;
    FakeSerialPort hipot_port;
    hipot_port.replies["*IDN?"] = "Associated Research,3865,1,1\r\n";
    FakeSerialPort meter_port;

    BenchHardware hw = bare_hardware(&clock, &store);
    hw.relay_port = &relay_port;
    hw.hipot_port = &hipot_port;
    hw.meter_port = &meter_port;

    BenchController controller(hw);
    controller.init_all();
    CHECK_FALSE(controller.relay_simulated());
    CHECK_FALSE(controller.hipot_simulated());
    CHECK(controller.meter_simulated());

    ScpiParser parser;
    CHECK(controller.execute(parser.parse("RELAY5:STATE 1")) == "OK");
    CHECK(relay_port.value == 0x20);
    CHECK(controller.execute(parser.parse("HIPOT:IDN?")) == "Associated Research,3865,1,1");
}

TEST_CASE("Silent relay expander falls back to simulation") {
    FakeClock clock;
    FakeRelayPort relay_port;
    relay_port.init_result = false;

    BenchHardware hw = bare_hardware(&clock, nullptr);
    hw.relay_port = &relay_port;
    BenchController controller(hw);
    controller.init_all();
    CHECK(controller.relay_simulated());
}

TEST_CASE("Relay and route commands") {
    SimBench bench;
    CHECK(bench.cmd("RELAY3:STATE 1") == "OK");
    CHECK(bench.cmd("RELAY3:STATE?") == "1");
    CHECK(bench.cmd("RELAY:MASK?") == "8");
    CHECK(bench.cmd("RELAY:ALL:OFF") == "OK");
    CHECK(bench.cmd("RELAY:MASK?") == "0");

    CHECK(bench.cmd("ROUTE:CLOSE 2to5") == "OK");
    CHECK(bench.cmd("RELAY:MASK?") == "19");
    CHECK(bench.cmd("ROUTE:CLOSE HIPOT") == "OK");
    CHECK(bench.cmd("RELAY:MASK?") == "192");
    CHECK(bench.cmd("ROUTE:OPEN") == "OK");
    CHECK(bench.cmd("RELAY:MASK?") == "0");

    CHECK(contains(bench.cmd("ROUTE:CLOSE 9to9"), "ERROR:Unknown route"));
}

TEST_CASE("Errors are queued for SYST:ERR?") {
    SimBench bench;
    CHECK(bench.cmd("FOO") == "ERROR:Unknown command");
    CHECK(bench.cmd("CONF:ELEM 110,7000") == "ERROR:Unsupported voltage");

    CHECK(bench.cmd("SYST:ERR?") == "-113,\"Unknown command\"");
    CHECK(bench.cmd("SYST:ERR?") == "-222,\"Unsupported voltage\"");
    CHECK(bench.cmd("SYST:ERR?") == "0,\"No error\"");

    bench.cmd("BAR");
    CHECK(bench.cmd("*CLS") == "OK");
    CHECK(bench.cmd("SYST:ERR?") == "0,\"No error\"");
}

TEST_CASE("Meter selection and reading") {
    SimBench bench;
    CHECK(bench.cmd("CONF:METER?") == "FLUKE287");
    CHECK(bench.cmd("MEAS:READ?") == "6.5,OHM");

    CHECK(bench.cmd("CONF:METER UT61E") == "OK");
    CHECK(bench.cmd("CONF:METER?") == "UT61E+");
    CHECK(bench.cmd("MEAS:READ?") == "6.5,OHM");
    CHECK(bench.cmd("MEAS:FLUSH") == "OK");

    CHECK(contains(bench.cmd("CONF:METER 34401A"), "ERROR:Unknown meter"));
}

TEST_CASE("Element configuration") {
    SimBench bench;
    CHECK(bench.cmd("CONF:ELEM 240,7000") == "OK");
    CHECK(bench.cmd("CONF:ELEM?") == "240,7000");
    CHECK(bench.cmd("CONF:RANGE?") == "11.95,12.3");

    CHECK(bench.cmd("CONF:RANGE 6,7") == "OK");
    CHECK(bench.cmd("CONF:RANGE?") == "6,7");
    CHECK(contains(bench.cmd("CONF:RANGE 7,6"), "ERROR:"));

    CHECK(bench.cmd("CONF:ELEM 240,9999") == "ERROR:Unsupported wattage");

    CHECK(bench.cmd("CONF:HIPOT:DUR 3") == "OK");
    CHECK(bench.cmd("CONF:HIPOT:DUR?") == "3");

    SUBCASE("element ratings must be whole numbers within 16 bits") {
        // 65744 would wrap to 208 and 208.9 would truncate to 208
        CHECK(contains(bench.cmd("CONF:ELEM 65744,7000"), "ERROR:"));
        CHECK(contains(bench.cmd("CONF:ELEM 208.9,7000"), "ERROR:"));
        CHECK(contains(bench.cmd("CONF:ELEM 240,-1"), "ERROR:"));
        CHECK(bench.cmd("CONF:ELEM?") == "240,7000");
    }

    SUBCASE("non-finite and oversized values are rejected") {
        CHECK(contains(bench.cmd("CONF:HIPOT:DUR nan"), "ERROR:"));
        CHECK(contains(bench.cmd("CONF:HIPOT:DUR inf"), "ERROR:"));
        CHECK(contains(bench.cmd("CONF:HIPOT:DUR 5000000"), "ERROR:"));
        CHECK(contains(bench.cmd("CONF:HIPOT:DUR 3601"), "ERROR:"));
        CHECK(bench.cmd("CONF:HIPOT:DUR?") == "3");
        CHECK(bench.cmd("CONF:HIPOT:DUR 3600") == "OK");

        CHECK(contains(bench.cmd("CONF:RANGE nan,7"), "ERROR:"));
        CHECK(contains(bench.cmd("CONF:RANGE 6,inf"), "ERROR:"));
        CHECK(bench.cmd("CONF:RANGE?") == "6,7");

        CHECK(contains(bench.cmd("SIM:VAL 6.8,nan,6.5"), "ERROR:"));
        CHECK(contains(bench.cmd("HIPOT:CONF:VOLT inf"), "ERROR:"));
        CHECK(contains(bench.cmd("HIPOT:CONF:DWEL 1e30"), "ERROR:"));
    }
}

TEST_CASE("Relay polarity") {
    SimBench bench;
    CHECK(bench.cmd("CONF:RELAY:POL?") == "HIGH");
    CHECK(bench.cmd("CONF:RELAY:POL LOW") == "OK");
    CHECK(bench.cmd("CONF:RELAY:POL?") == "LOW");
    CHECK_FALSE(bench.controller.relays().is_active_high());
    CHECK(bench.cmd("RELAY:MASK?") == "0");
}

TEST_CASE("Settings persist through the store") {
    SimBench bench;
    CHECK(bench.cmd("CONF:METER UT61E") == "OK");
    CHECK(bench.cmd("CONF:ELEM 480,8500") == "OK");
    CHECK(bench.cmd("CONF:SAVE") == "OK");

    CHECK(bench.cmd("CONF:DEF") == "OK");
    CHECK(bench.cmd("CONF:METER?") == "FLUKE287");
    CHECK(bench.cmd("CONF:ELEM?") == "0,0");

    CHECK(bench.cmd("CONF:LOAD") == "OK");
    CHECK(bench.cmd("CONF:METER?") == "UT61E+");
    CHECK(bench.cmd("CONF:ELEM?") == "480,8500");

    SUBCASE("a new controller starts from the saved settings") {
        BenchController second(bare_hardware(&bench.clock, &bench.store));
        second.init_all();
        CHECK(second.settings().meter_type == MeterType::UT61E_PLUS);
        CHECK(second.settings().element.wattage == 8500);
    }
}

TEST_CASE("Session numbering does not persist unsaved settings") {
    SimBench bench;
    CHECK(bench.cmd("CONF:ELEM 240,7000") == "OK");
    CHECK(bench.cmd("CONF:SAVE") == "OK");

    CHECK(bench.cmd("CONF:ELEM 480,8500") == "OK");
    CHECK(bench.cmd("CONF:RANGE 1,2") == "OK");
    CHECK(bench.cmd("SYST:SIM 1") == "OK");
    CHECK(bench.cmd("SESS:START WO,PN") == "ET_ELOV0001");

    BenchSettings stored;
    REQUIRE(bench.store.load(stored));
    CHECK(stored.session_sequence == 1);
    CHECK(stored.element.voltage == 240);
    CHECK(stored.element.wattage == 7000);
    CHECK_FALSE(stored.force_simulate);

    CHECK(bench.cmd("CONF:LOAD") == "OK");
    CHECK(bench.cmd("CONF:ELEM?") == "240,7000");
    CHECK(bench.cmd("CONF:RANGE?") == "11.95,12.3");
    CHECK(bench.cmd("SYST:SIM?") == "0");

    // Numbering continues from the counter, not from the reload
    CHECK(bench.cmd("SESS:START WO,PN") == "ET_ELOV0002");

    SUBCASE("a new controller does not come up simulating") {
        CHECK(bench.cmd("SYST:SIM 1") == "OK");
        CHECK(bench.cmd("SESS:START WO,PN") == "ET_ELOV0003");

        BenchController second(bare_hardware(&bench.clock, &bench.store));
        second.init_all();
        CHECK_FALSE(second.settings().force_simulate);
        CHECK(second.settings().session_sequence == 3);
        CHECK(second.settings().element.voltage == 240);
    }
}

TEST_CASE("Without a store settings cannot be saved") {
    FakeClock clock;
    BenchController controller(bare_hardware(&clock, nullptr));
    controller.init_all();

    ScpiParser parser;
    CHECK(controller.execute(parser.parse("CONF:SAVE")) == "ERROR:Failed to save settings");
    CHECK(controller.execute(parser.parse("CONF:LOAD")) == "ERROR:No valid settings in flash");
}

TEST_CASE("Hipot commands on the simulated tester") {
    SimBench bench;
    CHECK(bench.cmd("HIPOT:IDN?") == "Associated Research,3865,Sim,1.0");

    CHECK(bench.cmd("HIPOT:CONF:APPLY") == "ERROR:No hipot settings staged");
    CHECK(bench.cmd("HIPOT:CONF:VOLT 1500") == "OK");
    CHECK(bench.cmd("HIPOT:CONF:TRIP 7") == "OK");
    CHECK(bench.cmd("HIPOT:CONF:APPLY") == "OK");
    CHECK(bench.cmd("HIPOT:CONF?") == "VOLT=1500,TRIP=7");

    CHECK(bench.cmd("HIPOT:FILE 2") == "OK");
    CHECK(bench.cmd("HIPOT:FILE?") == "2");
    CHECK(bench.cmd("HIPOT:RES?") == "01,ACW,PASS,1.24,0.003,2.0");
    CHECK(bench.cmd("HIPOT:RAW? VOLT?") == "1500");
    CHECK(bench.cmd("HIPOT:RAW *CLS") == "OK");
    CHECK(bench.cmd("HIPOT:SAV 1") == "OK");
    CHECK(bench.cmd("HIPOT:RESET") == "OK");
}

TEST_CASE("Hipot presets") {
    SimBench bench;
    CHECK(bench.cmd("HIPOT:PRES:SAVE ELEM240") == "ERROR:No hipot settings staged");
    CHECK(bench.cmd("HIPOT:CONF:VOLT 1240") == "OK");
    CHECK(bench.cmd("HIPOT:CONF:TRIP 5") == "OK");
    CHECK(bench.cmd("HIPOT:CONF:DWEL 2") == "OK");
    CHECK(bench.cmd("HIPOT:PRES:SAVE ELEM240") == "OK");
    CHECK(bench.cmd("HIPOT:PRES? elem240") == "VOLT=1240,TRIP=5,RAMP=---,DWEL=2,FALL=---,POL=---");
    CHECK(contains(bench.cmd("HIPOT:PRES? NOPE"), "ERROR:Unknown preset"));
    CHECK(bench.cmd("HIPOT:RESET") == "OK");

    // Staged fields override the preset
    CHECK(bench.cmd("HIPOT:CONF:VOLT 1500") == "OK");
    CHECK(bench.cmd("HIPOT:PRES:APPLY ELEM240") == "OK");
    CHECK(bench.cmd("HIPOT:CONF?") == "VOLT=1500,TRIP=5");
    CHECK(bench.cmd("HIPOT:CONF:APPLY") == "ERROR:No hipot settings staged");

    CHECK(bench.cmd("HIPOT:PRES:APPLY ELEM240") == "OK");
    CHECK(bench.cmd("HIPOT:CONF?") == "VOLT=1240,TRIP=5");

    SUBCASE("presets are saved with the settings") {
        CHECK(bench.cmd("CONF:SAVE") == "OK");
        BenchController second(bare_hardware(&bench.clock, &bench.store));
        second.init_all();
        const HipotPreset* preset = second.settings().find_preset("ELEM240");
        REQUIRE(preset != nullptr);
        CHECK(preset->config.has_dwell);
        CHECK_CLOSE(preset->config.dwell_s, 2.0f, 1e-5f);
    }

    SUBCASE("the table holds four presets") {
        CHECK(bench.cmd("HIPOT:CONF:VOLT 100") == "OK");
        CHECK(bench.cmd("HIPOT:PRES:SAVE B") == "OK");
        CHECK(bench.cmd("HIPOT:PRES:SAVE C") == "OK");
        CHECK(bench.cmd("HIPOT:PRES:SAVE D") == "OK");
        CHECK(bench.cmd("HIPOT:PRES:SAVE E") == "ERROR:Preset table full");
        CHECK(bench.cmd("HIPOT:PRES:SAVE elem240") == "OK");
    }
}

TEST_CASE("Instrument level hipot run and abort") {
    SimBench bench;
    CHECK(bench.cmd("CONF:HIPOT:DUR 2") == "OK");
    CHECK(bench.cmd("HIPOT:CONF:VOLT 1500") == "OK");
    uint32_t before = bench.clock.slept();
    CHECK(bench.cmd("HIPOT:RUN?") == "PASS,\"01,ACW,PASS,1.24,0.003,2.0\"");
    CHECK(bench.clock.slept() - before == 2000 + AR3865::PROCESSING_MARGIN_MS + AR3865::DISCHARGE_MS);
    CHECK(bench.cmd("HIPOT:RAW? VOLT?") == "1500");

    CHECK(bench.cmd("SIM:HIPOT FAIL") == "OK");
    CHECK(bench.cmd("HIPOT:RUN?") == "FAIL,\"01,ACW,HI-LIMIT,1.24,5.210,0.4\"");
    CHECK(bench.cmd("HIPOT:ABORT") == "OK");

    // Not a session attempt
    CHECK(bench.cmd("SESS:ID?") == "NONE");
}

TEST_CASE("Hipot abort reaches the instrument") {
    FakeClock clock;
    FakeSerialPort hipot_port;
    hipot_port.replies["*IDN?"] = "Associated Research,3865,1,1\r\n";
    BenchHardware hw = bare_hardware(&clock, nullptr);
    hw.hipot_port = &hipot_port;
    BenchController controller(hw);
    controller.init_all();
    REQUIRE_FALSE(controller.hipot_simulated());

    ScpiParser parser;
    hipot_port.lines.clear();
    CHECK(controller.execute(parser.parse("HIPOT:ABORT")) == "OK");
    REQUIRE(hipot_port.lines.size() == 1);
    CHECK(hipot_port.lines[0] == "RESET");
}

TEST_CASE("Named relay mappings") {
    SimBench bench;
    CHECK(bench.cmd("RELAY:MAP:DEF LEAK,0x81,0x7E") == "OK");
    CHECK(bench.cmd("RELAY:MAP? leak") == "129,126");
    CHECK(bench.cmd("RELAY:MASK 0x7E") == "OK");
    CHECK(bench.cmd("RELAY:MAP LEAK") == "OK");
    CHECK(bench.cmd("RELAY:MASK?") == "129");
    CHECK(contains(bench.cmd("RELAY:MAP NONE"), "ERROR:Unknown relay mapping"));
    CHECK(contains(bench.cmd("RELAY:MAP:DEF BAD,256"), "ERROR:"));

    SUBCASE("mappings work in simulate mode and survive a polarity change") {
        CHECK(bench.cmd("CONF:RELAY:POL LOW") == "OK");
        CHECK(bench.cmd("SYST:SIM 1") == "OK");
        CHECK(bench.cmd("RELAY:MAP LEAK") == "OK");
        CHECK(bench.cmd("RELAY:MASK?") == "129");
    }
}

TEST_CASE("Timeouts and baud rates") {
    SimBench bench;
    CHECK(bench.cmd("CONF:TIMEOUT:POS?") == "10000");
    CHECK(bench.cmd("CONF:TIMEOUT:POS 20000") == "OK");
    CHECK(bench.cmd("CONF:TIMEOUT:POS?") == "20000");
    CHECK(bench.cmd("CONF:TIMEOUT:METER 1500") == "OK");
    CHECK(bench.cmd("CONF:TIMEOUT:METER?") == "1500");
    CHECK(bench.cmd("CONF:TIMEOUT:HIPOT 8000") == "OK");
    CHECK(bench.cmd("CONF:TIMEOUT:HIPOT?") == "8000");
    CHECK(contains(bench.cmd("CONF:TIMEOUT:POS 5"), "ERROR:"));

    CHECK(bench.cmd("CONF:BAUD:FLUKE?") == "115200");
    CHECK(bench.cmd("CONF:BAUD:UT61E 19200") == "OK");
    CHECK(bench.cmd("CONF:BAUD:UT61E?") == "19200");
    CHECK(contains(bench.cmd("CONF:BAUD:HIPOT 12345"), "ERROR:Unsupported baud rate"));

    // Devices still answer after being reopened
    CHECK(bench.cmd("HIPOT:IDN?") == "Associated Research,3865,Sim,1.0");
    CHECK(bench.cmd("MEAS:READ?") == "6.5,OHM");

    CHECK(bench.cmd("CONF:SAVE") == "OK");
    BenchSettings stored;
    REQUIRE(bench.store.load(stored));
    CHECK(stored.position_timeout_ms == 20000);
    CHECK(stored.ut61e_baudrate == 19200);
}

TEST_CASE("Hipot baud change reopens the instrument link") {
    FakeClock clock;
    FakeSerialPort hipot_port;
    hipot_port.replies["*IDN?"] = "Associated Research,3865,1,1\r\n";
    BenchHardware hw = bare_hardware(&clock, nullptr);
    hw.hipot_port = &hipot_port;
    BenchController controller(hw);
    controller.init_all();
    CHECK(hipot_port.config.baudrate == AR3865::DEFAULT_BAUDRATE);

    ScpiParser parser;
    CHECK(controller.execute(parser.parse("CONF:BAUD:HIPOT 9600")) == "OK");
    CHECK(hipot_port.config.baudrate == 9600);
    CHECK_FALSE(controller.hipot_simulated());
}

TEST_CASE("Simulated meter follows the closed position") {
    SimBench bench;
    CHECK(bench.cmd("SIM:VAL 11.1,12.2,13.3") == "OK");
    CHECK(bench.cmd("MEAS:READ?") == "6.5,OHM");
    CHECK(bench.cmd("ROUTE:CLOSE 1TO6") == "OK");
    CHECK(bench.cmd("MEAS:READ?") == "11.1,OHM");
    CHECK(bench.cmd("ROUTE:CLOSE 2TO5") == "OK");
    CHECK(bench.cmd("MEAS:READ?") == "12.2,OHM");
    CHECK(bench.cmd("ROUTE:CLOSE 3TO4") == "OK");
    CHECK(bench.cmd("MEAS:READ?") == "13.3,OHM");

    CHECK(bench.cmd("ROUTE:OPEN") == "OK");
    CHECK(bench.cmd("CONF:RANGE 10,14") == "OK");
    CHECK(contains(bench.cmd("TEST:MEAS?"), "PASS,11.1,12.2,13.3,11.1,12.2,13.3,"));
}

TEST_CASE("Session with individual attempts") {
    SimBench bench;
    CHECK(bench.cmd("SESS:ID?") == "NONE");
    CHECK(bench.cmd("SESS:START WO-1001,PN-77") == "ET_ELOV0001");
    CHECK(bench.cmd("SESS:ID?") == "ET_ELOV0001");
    CHECK(bench.store.save_count() == 1);

    CHECK(bench.cmd("TEST:MEAS?") ==
          "PASS,6.8,7.2,6.5,6.8,7.2,6.5,\"Measurements recorded (no range configured)\"");
    CHECK(bench.cmd("TEST:HIPOT?") == "PASS,\"01,ACW,PASS,1.24,0.003,2.0\"");

    CHECK(bench.cmd("SIM:HIPOT FAIL") == "OK");
    CHECK(bench.cmd("TEST:HIPOT?") == "FAIL,\"01,ACW,HI-LIMIT,1.24,5.210,0.4\"");

    CHECK(bench.cmd("SESS:END 0") == "OK");
    std::string log = bench.cmd("SESS:LOG?");
    CHECK(contains(log, "Work Order: WO-1001"));
    CHECK(contains(log, "HIPOT TEST - Attempt #2"));
    CHECK(contains(log, "FINAL RESULT: FAIL"));

    // First line is the count of lines that follow
    size_t first_break = log.find("\r\n");
    REQUIRE(first_break != std::string::npos);
    int32_t count = 0;
    REQUIRE(utils::parse_int(log.substr(0, first_break), count));
    size_t breaks = 0;
    for (size_t pos = log.find("\r\n"); pos != std::string::npos; pos = log.find("\r\n", pos + 2)) {
        breaks++;
    }
    CHECK(static_cast<size_t>(count) == breaks);
    CHECK(log.find('\n') == first_break + 1);
    CHECK_FALSE(contains(log, "\n\n"));

    CHECK(bench.cmd("SESS:END 1") == "ERROR:No active session");
}

TEST_CASE("Full run in demo mode") {
    SimBench bench;
    CHECK(bench.cmd("TEST:FULL? TEST,TEST") ==
          "PASS,ET_ELOV0001,\"Hipot + Measuring completed successfully\"");
    CHECK(bench.cmd("TEST:FULL? DEMO,DEMO") ==
          "PASS,ET_ELOV0002,\"Hipot + Measuring completed successfully\"");

    BenchSettings saved;
    REQUIRE(bench.store.load(saved));
    CHECK(saved.session_sequence == 2);
    CHECK(contains(bench.cmd("SYST:STAT?"), "MODE:NORMAL"));
}

TEST_CASE("Forced simulation with custom values") {
    SimBench bench;
    CHECK(bench.cmd("SYST:SIM 1") == "OK");
    CHECK(bench.cmd("SYST:SIM?") == "1");
    CHECK(contains(bench.cmd("SYST:STAT?"), "MODE:SIMULATE"));

    CHECK(bench.cmd("SIM:VAL 6.8,20,6.5") == "OK");
    CHECK(bench.cmd("CONF:RANGE 6,7") == "OK");
    std::string result = bench.cmd("TEST:MEAS?");
    CHECK(contains(result, "FAIL,6.8,20.0,6.5,6.8,20.0,6.5,"));
    CHECK(contains(result, "LP2to5 (20.0 ohm out of 6-7 ohm)"));

    CHECK(bench.cmd("SYST:SIM 0") == "OK");
    CHECK(bench.cmd("SYST:SIM?") == "0");
}

TEST_CASE("Session numbers wrap after 9999") {
    SimBench bench;
    BenchSettings settings;
    settings.session_sequence = 9999;
    REQUIRE(bench.store.save(settings));
    CHECK(bench.cmd("CONF:LOAD") == "OK");
    CHECK(bench.cmd("SESS:START WO,PN") == "ET_ELOV0001");
}

TEST_CASE("Reset leaves every relay open") {
    SimBench bench;
    bench.cmd("RELAY:ALL:ON");
    CHECK(bench.cmd("*RST") == "OK");
    CHECK(bench.cmd("RELAY:MASK?") == "0");
}
