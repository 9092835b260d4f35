#include "test.h"

#include "scpi_parser.hpp"

TEST_CASE("Common commands") {
    ScpiParser parser;
    ScpiCommand cmd = parser.parse("*IDN?");
    CHECK(cmd.valid);
    CHECK(cmd.type == ScpiCommandType::IDN_QUERY);
    CHECK(cmd.is_query);

    CHECK(parser.parse("*rst").type == ScpiCommandType::RST);
    CHECK(parser.parse("  *CLS").type == ScpiCommandType::CLS);
}

TEST_CASE("Empty and unknown lines") {
    ScpiParser parser;
    ScpiCommand cmd = parser.parse("");
    CHECK_FALSE(cmd.valid);
    CHECK(cmd.error_msg == "Empty command");

    cmd = parser.parse("VOLT 5");
    CHECK_FALSE(cmd.valid);
    CHECK(cmd.error_msg == "Unknown command");

    cmd = parser.parse("*TRG");
    CHECK_FALSE(cmd.valid);
}

TEST_CASE("System commands") {
    ScpiParser parser;
    CHECK(parser.parse("SYST:ERR?").type == ScpiCommandType::SYST_ERR_QUERY);
    CHECK(parser.parse("syst:stat?").type == ScpiCommandType::SYST_STAT_QUERY);
    CHECK(parser.parse("SYST:SIM?").type == ScpiCommandType::SYST_SIM_QUERY);

    ScpiCommand cmd = parser.parse("SYST:SIM 1");
    CHECK(cmd.valid);
    CHECK(cmd.type == ScpiCommandType::SYST_SIM);
    CHECK(cmd.int_value == 1);

    CHECK_FALSE(parser.parse("SYST:SIM 2").valid);
    CHECK_FALSE(parser.parse("SYST:ERR").valid);
}

TEST_CASE("Relay commands") {
    ScpiParser parser;

    ScpiCommand cmd = parser.parse("relay3:state 1");
    CHECK(cmd.valid);
    CHECK(cmd.type == ScpiCommandType::RELAY_SET);
    CHECK(cmd.relay_id == 3);
    CHECK(cmd.int_value == 1);

    cmd = parser.parse("RELAY3:STATE?");
    CHECK(cmd.type == ScpiCommandType::RELAY_GET);
    CHECK(cmd.is_query);

    cmd = parser.parse("RELAY9:STATE 1");
    CHECK_FALSE(cmd.valid);
    CHECK(cmd.error_msg == "Invalid relay number (0-7)");

    CHECK_FALSE(parser.parse("RELAY2:STATE 5").valid);

    cmd = parser.parse("RELAY1:PULSE");
    CHECK(cmd.type == ScpiCommandType::RELAY_PULSE);
    CHECK_FALSE(cmd.has_int);
    cmd = parser.parse("RELAY1:PULSE 250");
    CHECK(cmd.has_int);
    CHECK(cmd.int_value == 250);

    CHECK(parser.parse("RELAY:ALL:OFF").type == ScpiCommandType::RELAY_ALL_OFF);
    CHECK(parser.parse("RELAY:ALL:ON").type == ScpiCommandType::RELAY_ALL_ON);
    CHECK_FALSE(parser.parse("RELAY:ALLX:OFF").valid);

    cmd = parser.parse("RELAY:MASK 0x13");
    CHECK(cmd.type == ScpiCommandType::RELAY_MASK);
    CHECK(cmd.int_value == 0x13);
    CHECK_FALSE(parser.parse("RELAY:MASK 300").valid);
    CHECK(parser.parse("RELAY:MASK?").type == ScpiCommandType::RELAY_MASK_QUERY);

    cmd = parser.parse("RELAY:WALK 50");
    CHECK(cmd.type == ScpiCommandType::RELAY_WALK);
    CHECK(cmd.int_value == 50);
    CHECK_FALSE(parser.parse("RELAY:WALK fast").valid);
}

TEST_CASE("Integer arguments must fit and stand alone") {
    ScpiParser parser;
    // 4294967297 would wrap to 1
    CHECK_FALSE(parser.parse("RELAY0:PULSE 4294967297").valid);
    CHECK_FALSE(parser.parse("SYST:SIM 4294967297").valid);
    CHECK_FALSE(parser.parse("RELAY:MASK 0x100000013").valid);
    CHECK_FALSE(parser.parse("HIPOT:FILE 99999999999").valid);
    CHECK_FALSE(parser.parse("RELAY0:PULSE 100000").valid);
    CHECK_FALSE(parser.parse("SESS:END 1x").valid);
    CHECK_FALSE(parser.parse("RELAY3:STATE 1.5").valid);

    ScpiCommand cmd = parser.parse("RELAY0:PULSE 60000");
    CHECK(cmd.valid);
    CHECK(cmd.int_value == 60000);
}

TEST_CASE("Float arguments must be finite") {
    ScpiParser parser;
    CHECK_FALSE(parser.parse("CONF:HIPOT:DUR nan").valid);
    CHECK_FALSE(parser.parse("CONF:HIPOT:DUR inf").valid);
    CHECK_FALSE(parser.parse("CONF:HIPOT:DUR 1e40").valid);
    CHECK_FALSE(parser.parse("CONF:HIPOT:DUR 5000000").valid);
    CHECK(parser.parse("CONF:HIPOT:DUR 3600").valid);
    CHECK_FALSE(parser.parse("CONF:RANGE -inf,7").valid);
    CHECK_FALSE(parser.parse("SIM:VAL 1,NAN,3").valid);
    CHECK_FALSE(parser.parse("HIPOT:CONF:VOLT infinity").valid);
    CHECK_FALSE(parser.parse("HIPOT:CONF:RAMP 100000").valid);
    CHECK_FALSE(parser.parse("HIPOT:CONF:VOLT 1500V").valid);
}

TEST_CASE("Relay mapping commands") {
    ScpiParser parser;
    ScpiCommand cmd = parser.parse("RELAY:MAP:DEF leak, 0x81, 0x7E");
    CHECK(cmd.valid);
    CHECK(cmd.type == ScpiCommandType::RELAY_MAP_DEF);
    CHECK(cmd.string_value == "leak");
    CHECK(cmd.num_ints == 2);
    CHECK(cmd.int_values[0] == 0x81);
    CHECK(cmd.int_values[1] == 0x7E);

    cmd = parser.parse("RELAY:MAP:DEF ONLY,3");
    CHECK(cmd.valid);
    CHECK(cmd.num_ints == 1);

    CHECK_FALSE(parser.parse("RELAY:MAP:DEF leak").valid);
    CHECK_FALSE(parser.parse("RELAY:MAP:DEF leak,1,2,3").valid);
    CHECK_FALSE(parser.parse("RELAY:MAP:DEF leak,-1").valid);
    CHECK_FALSE(parser.parse("RELAY:MAP:DEF ABCDEFGHIJKLMNOP,1").valid);

    cmd = parser.parse("RELAY:MAP leak");
    CHECK(cmd.type == ScpiCommandType::RELAY_MAP_APPLY);
    CHECK(cmd.string_value == "leak");
    cmd = parser.parse("RELAY:MAP? leak");
    CHECK(cmd.type == ScpiCommandType::RELAY_MAP_QUERY);
    CHECK(cmd.is_query);
    CHECK_FALSE(parser.parse("RELAY:MAP").valid);
}

TEST_CASE("Route commands") {
    ScpiParser parser;
    ScpiCommand cmd = parser.parse("ROUTE:CLOSE 2to5");
    CHECK(cmd.valid);
    CHECK(cmd.type == ScpiCommandType::ROUTE_CLOSE);
    CHECK(cmd.string_value == "2to5");

    CHECK(parser.parse("ROUTE:OPEN").type == ScpiCommandType::ROUTE_OPEN);
    CHECK_FALSE(parser.parse("ROUTE:CLOSE").valid);
}

TEST_CASE("Meter and configuration commands") {
    ScpiParser parser;
    CHECK(parser.parse("MEAS:READ?").type == ScpiCommandType::MEAS_READ_QUERY);
    CHECK(parser.parse("MEAS:FLUSH").type == ScpiCommandType::MEAS_FLUSH);

    ScpiCommand cmd = parser.parse("CONF:METER ut61e");
    CHECK(cmd.type == ScpiCommandType::CONF_METER);
    CHECK(cmd.string_value == "ut61e");

    cmd = parser.parse("CONF:ELEM 240,7000");
    CHECK(cmd.valid);
    CHECK(cmd.type == ScpiCommandType::CONF_ELEM);
    CHECK(cmd.num_ints == 2);
    CHECK(cmd.int_values[0] == 240);
    CHECK(cmd.int_values[1] == 7000);
    CHECK_FALSE(parser.parse("CONF:ELEM 208.9,7000").valid);
    CHECK_FALSE(parser.parse("CONF:ELEM 65744,7000").valid);
    CHECK_FALSE(parser.parse("CONF:ELEM 240,70000").valid);
    CHECK(parser.parse("CONF:ELEM 65535,0").valid);

    cmd = parser.parse("CONF:RANGE 11.95, 12.3");
    CHECK(cmd.type == ScpiCommandType::CONF_RANGE);
    CHECK_CLOSE(cmd.float_values[0], 11.95f, 1e-5f);
    CHECK_CLOSE(cmd.float_values[1], 12.3f, 1e-5f);
    CHECK_FALSE(parser.parse("CONF:RANGE 1").valid);
    CHECK_FALSE(parser.parse("CONF:RANGE 1,2,3").valid);

    cmd = parser.parse("CONF:HIPOT:DUR 3");
    CHECK(cmd.type == ScpiCommandType::CONF_HIPOT_DUR);
    CHECK(cmd.float_value == 3.0f);
    CHECK_FALSE(parser.parse("CONF:HIPOT:DUR 0").valid);

    cmd = parser.parse("CONF:RELAY:POL low");
    CHECK(cmd.type == ScpiCommandType::CONF_RELAY_POL);
    CHECK(cmd.string_value == "LOW");

    cmd = parser.parse("CONF:TIMEOUT:METER 1500");
    CHECK(cmd.type == ScpiCommandType::CONF_PARAM);
    CHECK(cmd.conf_param == ConfParam::METER_TIMEOUT);
    CHECK(cmd.int_value == 1500);
    cmd = parser.parse("CONF:TIMEOUT:POS?");
    CHECK(cmd.type == ScpiCommandType::CONF_PARAM_QUERY);
    CHECK(cmd.conf_param == ConfParam::POSITION_TIMEOUT);
    CHECK_FALSE(parser.parse("CONF:TIMEOUT:HIPOT 50").valid);
    CHECK_FALSE(parser.parse("CONF:TIMEOUT:HIPOT 700000").valid);
    CHECK_FALSE(parser.parse("CONF:TIMEOUT:LAMP 500").valid);

    cmd = parser.parse("CONF:BAUD:fluke 57600");
    CHECK(cmd.type == ScpiCommandType::CONF_PARAM);
    CHECK(cmd.conf_param == ConfParam::FLUKE_BAUD);
    CHECK(cmd.int_value == 57600);
    CHECK(parser.parse("CONF:BAUD:UT61E?").conf_param == ConfParam::UT61E_BAUD);
    CHECK_FALSE(parser.parse("CONF:BAUD:HIPOT 14400").valid);
    CHECK_FALSE(parser.parse("CONF:BAUD:HIPOT").valid);

    CHECK(parser.parse("CONF:SAVE").type == ScpiCommandType::CONF_SAVE);
    CHECK(parser.parse("CONF:LOAD").type == ScpiCommandType::CONF_LOAD);
    CHECK(parser.parse("CONF:DEF").type == ScpiCommandType::CONF_DEFAULT);
}

TEST_CASE("Hipot commands") {
    ScpiParser parser;
    CHECK(parser.parse("HIPOT:IDN?").type == ScpiCommandType::HIPOT_IDN_QUERY);
    CHECK(parser.parse("HIPOT:RESET").type == ScpiCommandType::HIPOT_RESET);
    CHECK(parser.parse("HIPOT:RES?").type == ScpiCommandType::HIPOT_RESULT_QUERY);

    ScpiCommand cmd = parser.parse("HIPOT:FILE 2");
    CHECK(cmd.type == ScpiCommandType::HIPOT_FILE);
    CHECK(cmd.int_value == 2);
    CHECK(parser.parse("HIPOT:FILE?").type == ScpiCommandType::HIPOT_FILE_QUERY);

    cmd = parser.parse("HIPOT:SAV 3");
    CHECK(cmd.type == ScpiCommandType::HIPOT_SAVE_SLOT);
    CHECK(cmd.int_value == 3);
    cmd = parser.parse("HIPOT:RCL 3");
    CHECK(cmd.type == ScpiCommandType::HIPOT_RECALL_SLOT);

    cmd = parser.parse("HIPOT:CONF:VOLT 1500");
    CHECK(cmd.type == ScpiCommandType::HIPOT_CONF_SET);
    CHECK(cmd.hipot_field == HipotField::VOLTAGE);
    CHECK(cmd.float_value == 1500.0f);

    cmd = parser.parse("HIPOT:CONF:TRIP 5");
    CHECK(cmd.hipot_field == HipotField::CURRENT_TRIP);

    cmd = parser.parse("HIPOT:CONF:POL neg");
    CHECK(cmd.hipot_field == HipotField::POLARITY);
    CHECK(cmd.string_value == "NEG");
    CHECK_FALSE(parser.parse("HIPOT:CONF:POL up").valid);
    CHECK_FALSE(parser.parse("HIPOT:CONF:AMPS 3").valid);

    CHECK(parser.parse("HIPOT:CONF:APPLY").type == ScpiCommandType::HIPOT_CONF_APPLY);
    CHECK(parser.parse("HIPOT:CONF?").type == ScpiCommandType::HIPOT_CONF_QUERY);

    cmd = parser.parse("HIPOT:RAW? VOLT?");
    CHECK(cmd.type == ScpiCommandType::HIPOT_RAW_QUERY);
    CHECK(cmd.string_value == "VOLT?");
    cmd = parser.parse("HIPOT:RAW RAMP 0.5");
    CHECK(cmd.type == ScpiCommandType::HIPOT_RAW);
    CHECK(cmd.string_value == "RAMP 0.5");

    CHECK(parser.parse("HIPOT:RUN?").type == ScpiCommandType::HIPOT_RUN_QUERY);
    CHECK_FALSE(parser.parse("HIPOT:RUN").valid);
    CHECK(parser.parse("HIPOT:ABORT").type == ScpiCommandType::HIPOT_ABORT);
}

TEST_CASE("Hipot preset commands") {
    ScpiParser parser;
    ScpiCommand cmd = parser.parse("HIPOT:PRES:SAVE elem240");
    CHECK(cmd.valid);
    CHECK(cmd.type == ScpiCommandType::HIPOT_PRESET_SAVE);
    CHECK(cmd.string_value == "elem240");

    cmd = parser.parse("HIPOT:PRES:APPLY elem240");
    CHECK(cmd.type == ScpiCommandType::HIPOT_PRESET_APPLY);
    cmd = parser.parse("HIPOT:PRES? elem240");
    CHECK(cmd.type == ScpiCommandType::HIPOT_PRESET_QUERY);
    CHECK(cmd.is_query);

    CHECK_FALSE(parser.parse("HIPOT:PRES:SAVE").valid);
    CHECK_FALSE(parser.parse("HIPOT:PRES:SAVE a,b").valid);
    CHECK_FALSE(parser.parse("HIPOT:PRES:SAVE SIXTEEN_CHARS_XX").valid);
    CHECK_FALSE(parser.parse("HIPOT:PRES:DROP x").valid);

    // Slot commands still parse next to the preset ones
    CHECK(parser.parse("HIPOT:SAV 2").type == ScpiCommandType::HIPOT_SAVE_SLOT);
}

TEST_CASE("Session and test commands") {
    ScpiParser parser;

    ScpiCommand cmd = parser.parse("SESS:START WO123, PN-9");
    CHECK(cmd.valid);
    CHECK(cmd.type == ScpiCommandType::SESS_START);
    CHECK(cmd.string_value == "WO123");
    CHECK(cmd.string_value2 == "PN-9");

    cmd = parser.parse("SESS:START WO123");
    CHECK_FALSE(cmd.valid);
    CHECK(contains(cmd.error_msg, "work order"));

    cmd = parser.parse("SESS:END 1");
    CHECK(cmd.type == ScpiCommandType::SESS_END);
    CHECK(cmd.int_value == 1);
    CHECK_FALSE(parser.parse("SESS:END").valid);

    CHECK(parser.parse("SESS:ID?").type == ScpiCommandType::SESS_ID_QUERY);
    CHECK(parser.parse("SESS:LOG?").type == ScpiCommandType::SESS_LOG_QUERY);

    CHECK(parser.parse("TEST:MEAS?").type == ScpiCommandType::TEST_MEAS_QUERY);

    cmd = parser.parse("TEST:HIPOT?");
    CHECK(cmd.type == ScpiCommandType::TEST_HIPOT_QUERY);
    CHECK_FALSE(cmd.has_int);
    cmd = parser.parse("TEST:HIPOT? 1");
    CHECK(cmd.has_int);
    CHECK(cmd.int_value == 1);

    cmd = parser.parse("TEST:FULL? TEST,TEST");
    CHECK(cmd.type == ScpiCommandType::TEST_FULL_QUERY);
    CHECK(cmd.string_value == "TEST");
    CHECK_FALSE(parser.parse("TEST:FULL").valid);
}

TEST_CASE("Simulation commands") {
    ScpiParser parser;

    ScpiCommand cmd = parser.parse("SIM:VAL 6.8,7.2,6.5");
    CHECK(cmd.valid);
    CHECK(cmd.type == ScpiCommandType::SIM_VALUES);
    CHECK(cmd.num_floats == 3);
    CHECK_CLOSE(cmd.float_values[1], 7.2f, 1e-5f);
    CHECK_FALSE(parser.parse("SIM:VAL 6.8,7.2").valid);

    cmd = parser.parse("SIM:HIPOT fail");
    CHECK(cmd.type == ScpiCommandType::SIM_HIPOT);
    CHECK(cmd.string_value == "FAIL");
    CHECK_FALSE(parser.parse("SIM:HIPOT maybe").valid);
}
