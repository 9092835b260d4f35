#include "bench_controller.hpp"
#include "relay_map.hpp"
#include "bench_clock.hpp"
#include "utils.hpp"
#include <cstdio>

BenchController::BenchController(const BenchHardware& hardware)
    : hw_(hardware), clock_(*hardware.clock), session_(clock_), runner_(clock_, session_) {}

void BenchController::init_all() {
    if (hw_.settings_store && hw_.settings_store->load(settings_)) {
        printf("[CONF] Loaded settings from flash (last session %u)\r\n",
               settings_.session_sequence);
    } else {
        printf("[CONF] No valid settings in flash, using defaults\r\n");
        settings_ = BenchSettings();
    }
    persisted_ = settings_;

    init_simulators();
    init_relays();
    init_hipot();
    init_meter();
    bind_devices();
    runner_.set_force_simulate(settings_.force_simulate);
}

void BenchController::init_simulators() {
    sim_relay_board_.setup(&sim_relay_port_, &clock_, settings_.relay_active_high);
    sim_relay_board_.init();

    sim_hipot_.setup(&sim_hipot_port_, &clock_, settings_.hipot_baudrate, settings_.hipot_timeout_ms);
    sim_hipot_.init();

    sim_meter_port_.observe(&sim_relay_board_);
    standin_meter_port_.observe(&relay_board_);

    sim_fluke_.setup(&sim_meter_port_, &clock_, settings_.fluke_baudrate, settings_.meter_timeout_ms);
    sim_ut61e_.setup(&sim_meter_port_, &clock_, settings_.ut61e_baudrate, settings_.meter_timeout_ms);
}

void BenchController::init_relays() {
    relay_simulated_ = false;
    if (hw_.relay_port) {
        relay_board_.setup(hw_.relay_port, &clock_, settings_.relay_active_high);
        if (relay_board_.init()) {
            return;
        }
    }
    printf("[RELAY] Relay board unavailable, simulating\r\n");
    relay_board_.setup(&sim_relay_port_, &clock_, settings_.relay_active_high);
    relay_board_.init();
    relay_simulated_ = true;
}

void BenchController::init_hipot() {
    hipot_simulated_ = false;
    if (hw_.hipot_port) {
        hipot_.setup(hw_.hipot_port, &clock_, settings_.hipot_baudrate, settings_.hipot_timeout_ms);
        if (hipot_.init()) {
            return;
        }
        hipot_.close();
    }
    printf("[HIPOT] Hipot tester unavailable, simulating\r\n");
    hipot_.setup(&sim_hipot_port_, &clock_, settings_.hipot_baudrate, settings_.hipot_timeout_ms);
    hipot_.init();
    hipot_simulated_ = true;
}

void BenchController::init_meter() {
    meter_simulated_ = false;
    bool ut61e = settings_.meter_type == MeterType::UT61E_PLUS;
    meter_ = ut61e ? static_cast<Multimeter*>(&ut61e_) : static_cast<Multimeter*>(&fluke_);

    if (hw_.meter_port) {
        meter_->setup(hw_.meter_port, &clock_, settings_.meter_baudrate(), settings_.meter_timeout_ms);
        if (meter_->init()) {
            return;
        }
    }
    printf("[METER] %s unavailable, simulating\r\n", meter_type_name(settings_.meter_type));
    meter_->setup(&standin_meter_port_, &clock_, settings_.meter_baudrate(), settings_.meter_timeout_ms);
    meter_->init();
    meter_simulated_ = true;
}

void BenchController::bind_devices() {
    BenchDevices hardware;
    hardware.relays = &relay_board_;
    hardware.hipot = &hipot_;
    hardware.meter = meter_;

    Multimeter* sim_meter = (settings_.meter_type == MeterType::UT61E_PLUS)
                                ? static_cast<Multimeter*>(&sim_ut61e_)
                                : static_cast<Multimeter*>(&sim_fluke_);
    sim_meter->init();

    BenchDevices simulated;
    simulated.relays = &sim_relay_board_;
    simulated.hipot = &sim_hipot_;
    simulated.meter = sim_meter;

    runner_.set_devices(hardware, simulated);
}

void BenchController::apply_settings() {
    runner_.set_force_simulate(settings_.force_simulate);
    relay_board_.shutdown();
    sim_relay_board_.shutdown();
    init_simulators();
    init_relays();
    init_meter();
    bind_devices();
}

// Only the counter is written; unsaved runtime changes stay out of flash
uint16_t BenchController::next_session_sequence() {
    uint16_t next = settings_.session_sequence + 1;
    if (next > 9999) {
        next = 1;
    }
    settings_.session_sequence = next;
    persisted_.session_sequence = next;
    if (!hw_.settings_store || !hw_.settings_store->save(persisted_)) {
        printf("[CONF] Warning: session number not persisted\r\n");
    }
    return next;
}

std::string BenchController::error(int16_t code, const std::string& message) {
    errors_.push(code, message);
    return "ERROR:" + message;
}

std::string BenchController::quote(const std::string& text) {
    return "\"" + text + "\"";
}

std::string BenchController::format_hipot_config(const HipotConfig& config) {
    std::string out = "VOLT=";
    out += config.has_voltage ? utils::format_float(config.voltage_v) : "---";
    out += ",TRIP=";
    out += config.has_current_trip ? utils::format_float(config.current_trip_ma) : "---";
    out += ",RAMP=";
    out += config.has_ramp ? utils::format_float(config.ramp_s) : "---";
    out += ",DWEL=";
    out += config.has_dwell ? utils::format_float(config.dwell_s) : "---";
    out += ",FALL=";
    out += config.has_fall ? utils::format_float(config.fall_s) : "---";
    out += ",POL=";
    out += config.has_polarity ? config.polarity : "---";
    return out;
}

std::string BenchController::frame_lines(const std::string& text) {
    size_t count = 0;
    std::string body;
    size_t start = 0;
    while (start < text.size()) {
        size_t end = text.find('\n', start);
        if (end == std::string::npos) {
            end = text.size();
        }
        if (count > 0) {
            body += "\r\n";
        }
        body += text.substr(start, end - start);
        count++;
        start = end + 1;
    }
    if (count == 0) {
        return "0";
    }
    return std::to_string(count) + "\r\n" + body;
}

std::string BenchController::format_measurement(const MeasurementResult& result) {
    std::string out = result.passed ? "PASS" : "FAIL";
    for (int side = 0; side < 2; side++) {
        for (size_t i = 0; i < RELAY_MAP::NUM_POSITIONS; i++) {
            out += "," + utils::format_float(result.readings[i].value, "%.1f");
        }
    }
    out += "," + quote(result.message);
    return out;
}

std::string BenchController::execute_idn() {
    return BENCH_INFO::IDN;
}

std::string BenchController::execute_reset() {
    relay_board_.all_off();
    sim_relay_board_.all_off();
    if (!runner_.active_devices().hipot->reset()) {
        return error(SCPI_ERR::HARDWARE_ERROR, "Hipot reset failed");
    }
    pending_hipot_config_ = HipotConfig();
    errors_.clear();
    return "OK";
}

std::string BenchController::execute_status() {
    std::string out;
    out += std::string("RELAY:") + (relay_simulated_ ? "SIM" : "HW");
    out += std::string(",HIPOT:") + (hipot_simulated_ ? "SIM" : "HW");
    out += std::string(",METER:") + meter_type_name(settings_.meter_type) + ":" +
           (meter_simulated_ ? "SIM" : "HW");
    out += std::string(",MODE:") + (runner_.simulating() ? "SIMULATE" : "NORMAL");
    out += ",SESSION:" + (session_.is_active() ? session_.session_id() : std::string("NONE"));
    return out;
}

std::string BenchController::execute_relay(const ScpiCommand& cmd) {
    RelayBoard& relays = *runner_.active_devices().relays;

    switch (cmd.type) {
        case ScpiCommandType::RELAY_SET:
            if (!relays.set_relay(cmd.relay_id, cmd.int_value != 0)) {
                return error(SCPI_ERR::DATA_OUT_OF_RANGE, "Invalid relay");
            }
            return "OK";

        case ScpiCommandType::RELAY_GET:
            return relays.is_on(cmd.relay_id) ? "1" : "0";

        case ScpiCommandType::RELAY_PULSE:
            if (!relays.pulse(cmd.relay_id, cmd.has_int ? cmd.int_value
                                                        : RELAY_CONFIG::DEFAULT_PULSE_MS)) {
                return error(SCPI_ERR::DATA_OUT_OF_RANGE, "Invalid relay");
            }
            return "OK";

        case ScpiCommandType::RELAY_ALL_OFF:
            relays.all_off();
            return "OK";

        case ScpiCommandType::RELAY_ALL_ON:
            relays.all_on();
            return "OK";

        case ScpiCommandType::RELAY_MASK:
            relays.set_state(static_cast<uint8_t>(cmd.int_value));
            return "OK";

        case ScpiCommandType::RELAY_MASK_QUERY:
            return std::to_string(relays.state());

        case ScpiCommandType::RELAY_WALK:
            relays.self_test_walk(cmd.has_int ? cmd.int_value
                                              : RELAY_CONFIG::DEFAULT_WALK_DELAY_MS);
            return "OK";

        default:
            return error(SCPI_ERR::UNDEFINED_HEADER, "Unknown command");
    }
}

std::string BenchController::execute_relay_map(const ScpiCommand& cmd) {
    switch (cmd.type) {
        case ScpiCommandType::RELAY_MAP_DEF: {
            RelayMapping mapping;
            mapping.on_mask = static_cast<uint8_t>(cmd.int_values[0]);
            mapping.off_mask = cmd.num_ints > 1 ? static_cast<uint8_t>(cmd.int_values[1]) : 0;
            // Both sets carry the table so a mapping works in either mode
            if (!relay_board_.add_named_mapping(cmd.string_value, mapping) ||
                !sim_relay_board_.add_named_mapping(cmd.string_value, mapping)) {
                return error(SCPI_ERR::SETTINGS_CONFLICT, "Relay mapping table full");
            }
            return "OK";
        }

        case ScpiCommandType::RELAY_MAP_APPLY:
            if (!runner_.active_devices().relays->apply_named_mapping(cmd.string_value)) {
                return error(SCPI_ERR::DATA_OUT_OF_RANGE, "Unknown relay mapping");
            }
            return "OK";

        case ScpiCommandType::RELAY_MAP_QUERY: {
            RelayMapping mapping;
            if (!relay_board_.find_named_mapping(cmd.string_value, mapping)) {
                return error(SCPI_ERR::DATA_OUT_OF_RANGE, "Unknown relay mapping");
            }
            return std::to_string(mapping.on_mask) + "," + std::to_string(mapping.off_mask);
        }

        default:
            return error(SCPI_ERR::UNDEFINED_HEADER, "Unknown command");
    }
}

std::string BenchController::execute_route(const ScpiCommand& cmd) {
    const BenchDevices& devices = runner_.active_devices();

    if (cmd.type == ScpiCommandType::ROUTE_OPEN) {
        RELAY_MAP::open_position(*devices.relays, clock_);
        return "OK";
    }

    if (utils::iequals(cmd.string_value, "HIPOT")) {
        devices.relays->all_off();
        RELAY_MAP::close_hipot_path(*devices.relays, clock_);
        return "OK";
    }

    const MeasurementPosition* pos = RELAY_MAP::find_position(cmd.string_value);
    if (!pos) {
        return error(SCPI_ERR::DATA_OUT_OF_RANGE, "Unknown route (1TO6, 2TO5, 3TO4, HIPOT)");
    }
    RELAY_MAP::close_position(*devices.relays, clock_, *pos);
    return "OK";
}

std::string BenchController::execute_meter_read() {
    Multimeter* meter = runner_.active_devices().meter;
    MeterReading reading;
    if (!meter || !meter->read_value(reading)) {
        return error(SCPI_ERR::HARDWARE_ERROR, "Meter not responding");
    }
    if (reading.is_overload) {
        return "OL," + reading.unit;
    }
    if (!reading.has_value) {
        return error(SCPI_ERR::EXECUTION_ERROR, "Unreadable display: " + reading.raw);
    }
    return utils::format_float(reading.value) + "," + reading.unit;
}

std::string BenchController::execute_config(const ScpiCommand& cmd) {
    switch (cmd.type) {
        case ScpiCommandType::CONF_METER: {
            MeterType type;
            if (!parse_meter_type(cmd.string_value, type)) {
                return error(SCPI_ERR::DATA_OUT_OF_RANGE, "Unknown meter (FLUKE287, UT61E)");
            }
            settings_.meter_type = type;
            init_meter();
            bind_devices();
            return "OK";
        }

        case ScpiCommandType::CONF_METER_QUERY:
            return meter_type_name(settings_.meter_type);

        case ScpiCommandType::CONF_ELEM: {
            uint16_t voltage = static_cast<uint16_t>(cmd.int_values[0]);
            uint16_t wattage = static_cast<uint16_t>(cmd.int_values[1]);
            if (!ELEMENT_TABLE::is_valid_voltage(voltage)) {
                return error(SCPI_ERR::DATA_OUT_OF_RANGE, "Unsupported voltage");
            }
            if (!ELEMENT_TABLE::is_valid_wattage(wattage)) {
                return error(SCPI_ERR::DATA_OUT_OF_RANGE, "Unsupported wattage");
            }
            settings_.element = ELEMENT_TABLE::make_config(voltage, wattage);
            if (!settings_.element.range.configured()) {
                printf("[CONF] No resistance range for %u V / %u W\r\n", voltage, wattage);
            }
            return "OK";
        }

        case ScpiCommandType::CONF_ELEM_QUERY:
            return std::to_string(settings_.element.voltage) + "," +
                   std::to_string(settings_.element.wattage);

        case ScpiCommandType::CONF_RANGE: {
            float min_ohm = cmd.float_values[0];
            float max_ohm = cmd.float_values[1];
            if (min_ohm < 0.0f || max_ohm < min_ohm) {
                return error(SCPI_ERR::DATA_OUT_OF_RANGE, "Range must satisfy 0 <= min <= max");
            }
            settings_.element.range.min_ohm = min_ohm;
            settings_.element.range.max_ohm = max_ohm;
            return "OK";
        }

        case ScpiCommandType::CONF_RANGE_QUERY:
            return utils::format_float(settings_.element.range.min_ohm) + "," +
                   utils::format_float(settings_.element.range.max_ohm);

        case ScpiCommandType::CONF_HIPOT_DUR: {
            uint32_t ms = static_cast<uint32_t>(cmd.float_value * 1000.0f + 0.5f);
            if (ms == 0) {
                return error(SCPI_ERR::DATA_OUT_OF_RANGE, "Duration too short");
            }
            settings_.hipot_duration_ms = ms;
            return "OK";
        }

        case ScpiCommandType::CONF_HIPOT_DUR_QUERY:
            return utils::format_float(settings_.hipot_duration_ms / 1000.0f);

        case ScpiCommandType::CONF_RELAY_POL:
            relay_board_.shutdown();
            sim_relay_board_.shutdown();
            settings_.relay_active_high = cmd.string_value == "HIGH";
            init_simulators();
            init_relays();
            bind_devices();
            return "OK";

        case ScpiCommandType::CONF_RELAY_POL_QUERY:
            return settings_.relay_active_high ? "HIGH" : "LOW";

        case ScpiCommandType::CONF_SAVE:
            if (!hw_.settings_store || !hw_.settings_store->save(settings_)) {
                return error(SCPI_ERR::MASS_STORAGE_ERROR, "Failed to save settings");
            }
            persisted_ = settings_;
            printf("[CONF] Settings saved\r\n");
            return "OK";

        case ScpiCommandType::CONF_LOAD: {
            BenchSettings loaded;
            if (!hw_.settings_store || !hw_.settings_store->load(loaded)) {
                return error(SCPI_ERR::MASS_STORAGE_ERROR, "No valid settings in flash");
            }
            settings_ = loaded;
            persisted_ = loaded;
            apply_settings();
            return "OK";
        }

        case ScpiCommandType::CONF_DEFAULT: {
            uint16_t sequence = settings_.session_sequence;
            settings_ = BenchSettings();
            settings_.session_sequence = sequence;
            apply_settings();
            return "OK";
        }

        default:
            return error(SCPI_ERR::UNDEFINED_HEADER, "Unknown command");
    }
}

std::string BenchController::execute_conf_param(const ScpiCommand& cmd) {
    uint32_t* value = nullptr;
    switch (cmd.conf_param) {
        case ConfParam::POSITION_TIMEOUT: value = &settings_.position_timeout_ms; break;
        case ConfParam::METER_TIMEOUT:    value = &settings_.meter_timeout_ms; break;
        case ConfParam::HIPOT_TIMEOUT:    value = &settings_.hipot_timeout_ms; break;
        case ConfParam::HIPOT_BAUD:       value = &settings_.hipot_baudrate; break;
        case ConfParam::FLUKE_BAUD:       value = &settings_.fluke_baudrate; break;
        case ConfParam::UT61E_BAUD:       value = &settings_.ut61e_baudrate; break;
        default:
            return error(SCPI_ERR::COMMAND_ERROR, "Unknown setting");
    }

    if (cmd.type == ScpiCommandType::CONF_PARAM_QUERY) {
        return std::to_string(*value);
    }
    *value = static_cast<uint32_t>(cmd.int_value);

    // Reopen the affected links with the new line settings
    switch (cmd.conf_param) {
        case ConfParam::HIPOT_TIMEOUT:
        case ConfParam::HIPOT_BAUD:
            hipot_.close();
            sim_hipot_.close();
            init_simulators();
            init_hipot();
            bind_devices();
            break;
        case ConfParam::METER_TIMEOUT:
        case ConfParam::FLUKE_BAUD:
        case ConfParam::UT61E_BAUD:
            init_simulators();
            init_meter();
            bind_devices();
            break;
        default:
            break;
    }
    return "OK";
}

std::string BenchController::execute_hipot_preset(const ScpiCommand& cmd) {
    if (cmd.type == ScpiCommandType::HIPOT_PRESET_SAVE) {
        if (pending_hipot_config_.empty()) {
            return error(SCPI_ERR::SETTINGS_CONFLICT, "No hipot settings staged");
        }
        if (!settings_.store_preset(cmd.string_value, pending_hipot_config_)) {
            return error(SCPI_ERR::SETTINGS_CONFLICT, "Preset table full");
        }
        return "OK";
    }

    const HipotPreset* preset = settings_.find_preset(cmd.string_value);
    if (!preset) {
        return error(SCPI_ERR::DATA_OUT_OF_RANGE, "Unknown preset");
    }

    if (cmd.type == ScpiCommandType::HIPOT_PRESET_QUERY) {
        return format_hipot_config(preset->config);
    }

    // Staged fields override the preset
    HipotConfig config = Ar3865::merge_config(preset->config, pending_hipot_config_);
    if (!runner_.active_devices().hipot->configure(config)) {
        return error(SCPI_ERR::HARDWARE_ERROR, "Hipot configuration failed");
    }
    pending_hipot_config_ = HipotConfig();
    return "OK";
}

std::string BenchController::execute_hipot_config(const ScpiCommand& cmd) {
    Ar3865& hipot = *runner_.active_devices().hipot;

    switch (cmd.type) {
        case ScpiCommandType::HIPOT_CONF_SET:
            switch (cmd.hipot_field) {
                case HipotField::VOLTAGE:
                    pending_hipot_config_.voltage_v = cmd.float_value;
                    pending_hipot_config_.has_voltage = true;
                    break;
                case HipotField::CURRENT_TRIP:
                    pending_hipot_config_.current_trip_ma = cmd.float_value;
                    pending_hipot_config_.has_current_trip = true;
                    break;
                case HipotField::RAMP:
                    pending_hipot_config_.ramp_s = cmd.float_value;
                    pending_hipot_config_.has_ramp = true;
                    break;
                case HipotField::DWELL:
                    pending_hipot_config_.dwell_s = cmd.float_value;
                    pending_hipot_config_.has_dwell = true;
                    break;
                case HipotField::FALL:
                    pending_hipot_config_.fall_s = cmd.float_value;
                    pending_hipot_config_.has_fall = true;
                    break;
                case HipotField::POLARITY:
                    pending_hipot_config_.polarity = cmd.string_value;
                    pending_hipot_config_.has_polarity = true;
                    break;
                default:
                    return error(SCPI_ERR::COMMAND_ERROR, "Unknown hipot field");
            }
            return "OK";

        case ScpiCommandType::HIPOT_CONF_APPLY:
            if (pending_hipot_config_.empty()) {
                return error(SCPI_ERR::SETTINGS_CONFLICT, "No hipot settings staged");
            }
            if (!hipot.configure(pending_hipot_config_)) {
                return error(SCPI_ERR::HARDWARE_ERROR, "Hipot configuration failed");
            }
            pending_hipot_config_ = HipotConfig();
            return "OK";

        case ScpiCommandType::HIPOT_CONF_QUERY: {
            HipotConfig config;
            if (!hipot.read_config(config)) {
                return error(SCPI_ERR::HARDWARE_ERROR, "Hipot tester not responding");
            }
            std::string out = "VOLT=";
            out += config.has_voltage ? utils::format_float(config.voltage_v) : "---";
            out += ",TRIP=";
            out += config.has_current_trip ? utils::format_float(config.current_trip_ma) : "---";
            return out;
        }

        default:
            return error(SCPI_ERR::UNDEFINED_HEADER, "Unknown command");
    }
}

std::string BenchController::execute_hipot(const ScpiCommand& cmd) {
    Ar3865& hipot = *runner_.active_devices().hipot;
    std::string response;

    switch (cmd.type) {
        case ScpiCommandType::HIPOT_IDN_QUERY:
            if (!hipot.identify(response)) {
                return error(SCPI_ERR::HARDWARE_ERROR, "Hipot tester not responding");
            }
            return response;

        case ScpiCommandType::HIPOT_RESET:
            if (!hipot.reset()) {
                return error(SCPI_ERR::HARDWARE_ERROR, "Hipot reset failed");
            }
            return "OK";

        case ScpiCommandType::HIPOT_FILE:
            if (!hipot.select_file(cmd.int_value)) {
                return error(SCPI_ERR::HARDWARE_ERROR, "Hipot tester not responding");
            }
            return "OK";

        case ScpiCommandType::HIPOT_FILE_QUERY: {
            int32_t index = 0;
            if (!hipot.query_selected_file(index)) {
                return error(SCPI_ERR::HARDWARE_ERROR, "Hipot tester not responding");
            }
            return std::to_string(index);
        }

        case ScpiCommandType::HIPOT_SAVE_SLOT:
            if (!hipot.save_to_slot(cmd.int_value)) {
                return error(SCPI_ERR::HARDWARE_ERROR, "Hipot tester not responding");
            }
            return "OK";

        case ScpiCommandType::HIPOT_RECALL_SLOT:
            if (!hipot.recall_from_slot(cmd.int_value)) {
                return error(SCPI_ERR::HARDWARE_ERROR, "Hipot tester not responding");
            }
            return "OK";

        case ScpiCommandType::HIPOT_RESULT_QUERY:
            if (!hipot.get_result(response)) {
                return error(SCPI_ERR::HARDWARE_ERROR, "Hipot tester not responding");
            }
            return response;

        case ScpiCommandType::HIPOT_RAW:
            if (!hipot.write(cmd.string_value)) {
                return error(SCPI_ERR::HARDWARE_ERROR, "Hipot port unavailable");
            }
            return "OK";

        case ScpiCommandType::HIPOT_RAW_QUERY:
            if (!hipot.query(cmd.string_value, response)) {
                return error(SCPI_ERR::HARDWARE_ERROR, "No response from hipot tester");
            }
            return response;

        // Instrument level run: no routing and no session record
        case ScpiCommandType::HIPOT_RUN_QUERY: {
            HipotResult result;
            if (!hipot.run_once(pending_hipot_config_, settings_.hipot_duration_ms, result)) {
                return error(SCPI_ERR::HARDWARE_ERROR, "No result from hipot tester");
            }
            pending_hipot_config_ = HipotConfig();
            return std::string(result.passed ? "PASS" : "FAIL") + "," + quote(result.raw);
        }

        case ScpiCommandType::HIPOT_ABORT:
            if (!hipot.stop_test()) {
                return error(SCPI_ERR::HARDWARE_ERROR, "Hipot port unavailable");
            }
            return "OK";

        case ScpiCommandType::HIPOT_PRESET_SAVE:
        case ScpiCommandType::HIPOT_PRESET_APPLY:
        case ScpiCommandType::HIPOT_PRESET_QUERY:
            return execute_hipot_preset(cmd);

        default:
            return execute_hipot_config(cmd);
    }
}

std::string BenchController::execute_session(const ScpiCommand& cmd) {
    switch (cmd.type) {
        case ScpiCommandType::SESS_START:
            runner_.start_session(next_session_sequence(), cmd.string_value,
                                  cmd.string_value2, settings_.element);
            return session_.session_id();

        case ScpiCommandType::SESS_END:
            if (!session_.is_active()) {
                return error(SCPI_ERR::SETTINGS_CONFLICT, "No active session");
            }
            // Reset while the session's device set is still selected
            runner_.reset_hardware();
            runner_.end_session(cmd.int_value == 1, "Ended by host");
            return "OK";

        case ScpiCommandType::SESS_ID_QUERY:
            return session_.has_session() ? session_.session_id() : "NONE";

        case ScpiCommandType::SESS_LOG_QUERY:
            if (!session_.has_session()) {
                return error(SCPI_ERR::SETTINGS_CONFLICT, "No session");
            }
            return frame_lines(session_.text());

        default:
            return error(SCPI_ERR::UNDEFINED_HEADER, "Unknown command");
    }
}

std::string BenchController::execute_test(const ScpiCommand& cmd) {
    switch (cmd.type) {
        case ScpiCommandType::TEST_MEAS_QUERY: {
            MeasurementResult result =
                runner_.run_measurement(settings_.element, settings_.position_timeout_ms);
            return format_measurement(result);
        }

        case ScpiCommandType::TEST_HIPOT_QUERY: {
            bool keep_closed = cmd.has_int && cmd.int_value != 0;
            HipotRunResult result =
                runner_.run_hipot(settings_.element, settings_.hipot_duration_ms, keep_closed);
            if (!result.completed) {
                return error(SCPI_ERR::HARDWARE_ERROR, result.message);
            }
            return std::string(result.passed ? "PASS" : "FAIL") + "," + quote(result.detail.raw);
        }

        case ScpiCommandType::TEST_FULL_QUERY: {
            FullRunResult result = runner_.run_full(
                next_session_sequence(), cmd.string_value, cmd.string_value2, settings_.element,
                settings_.hipot_duration_ms, settings_.position_timeout_ms);
            return std::string(result.passed ? "PASS" : "FAIL") + "," +
                   session_.session_id() + "," + quote(result.message);
        }

        default:
            return error(SCPI_ERR::UNDEFINED_HEADER, "Unknown command");
    }
}

std::string BenchController::execute_sim(const ScpiCommand& cmd) {
    switch (cmd.type) {
        case ScpiCommandType::SIM_VALUES:
            for (uint8_t i = 0; i < 3; i++) {
                if (cmd.float_values[i] < 0.0f) {
                    return error(SCPI_ERR::DATA_OUT_OF_RANGE, "Resistance must be positive");
                }
            }
            runner_.set_simulated_values(cmd.float_values);
            sim_meter_port_.set_position_values(cmd.float_values);
            standin_meter_port_.set_position_values(cmd.float_values);
            return "OK";

        case ScpiCommandType::SIM_HIPOT:
            sim_hipot_port_.set_force_fail(cmd.string_value == "FAIL");
            return "OK";

        case ScpiCommandType::SYST_SIM:
            settings_.force_simulate = cmd.int_value != 0;
            runner_.set_force_simulate(settings_.force_simulate);
            return "OK";

        case ScpiCommandType::SYST_SIM_QUERY:
            return settings_.force_simulate ? "1" : "0";

        default:
            return error(SCPI_ERR::UNDEFINED_HEADER, "Unknown command");
    }
}

std::string BenchController::execute(const ScpiCommand& cmd) {
    if (!cmd.valid) {
        int16_t code = (cmd.error_msg.compare(0, 7, "Unknown") == 0)
                           ? SCPI_ERR::UNDEFINED_HEADER
                           : SCPI_ERR::COMMAND_ERROR;
        return error(code, cmd.error_msg);
    }

    switch (cmd.type) {
        case ScpiCommandType::IDN_QUERY:
            return execute_idn();

        case ScpiCommandType::RST:
            return execute_reset();

        case ScpiCommandType::CLS:
            errors_.clear();
            return "OK";

        case ScpiCommandType::SYST_ERR_QUERY:
            return errors_.pop();

        case ScpiCommandType::SYST_STAT_QUERY:
            return execute_status();

        case ScpiCommandType::SYST_SIM:
        case ScpiCommandType::SYST_SIM_QUERY:
        case ScpiCommandType::SIM_VALUES:
        case ScpiCommandType::SIM_HIPOT:
            return execute_sim(cmd);

        case ScpiCommandType::RELAY_SET:
        case ScpiCommandType::RELAY_GET:
        case ScpiCommandType::RELAY_PULSE:
        case ScpiCommandType::RELAY_ALL_OFF:
        case ScpiCommandType::RELAY_ALL_ON:
        case ScpiCommandType::RELAY_MASK:
        case ScpiCommandType::RELAY_MASK_QUERY:
        case ScpiCommandType::RELAY_WALK:
            return execute_relay(cmd);

        case ScpiCommandType::RELAY_MAP_DEF:
        case ScpiCommandType::RELAY_MAP_APPLY:
        case ScpiCommandType::RELAY_MAP_QUERY:
            return execute_relay_map(cmd);

        case ScpiCommandType::ROUTE_CLOSE:
        case ScpiCommandType::ROUTE_OPEN:
            return execute_route(cmd);

        case ScpiCommandType::MEAS_READ_QUERY:
            return execute_meter_read();

        case ScpiCommandType::MEAS_FLUSH:
            runner_.active_devices().meter->flush_buffer();
            return "OK";

        case ScpiCommandType::CONF_METER:
        case ScpiCommandType::CONF_METER_QUERY:
        case ScpiCommandType::CONF_ELEM:
        case ScpiCommandType::CONF_ELEM_QUERY:
        case ScpiCommandType::CONF_RANGE:
        case ScpiCommandType::CONF_RANGE_QUERY:
        case ScpiCommandType::CONF_HIPOT_DUR:
        case ScpiCommandType::CONF_HIPOT_DUR_QUERY:
        case ScpiCommandType::CONF_RELAY_POL:
        case ScpiCommandType::CONF_RELAY_POL_QUERY:
        case ScpiCommandType::CONF_SAVE:
        case ScpiCommandType::CONF_LOAD:
        case ScpiCommandType::CONF_DEFAULT:
            return execute_config(cmd);

        case ScpiCommandType::CONF_PARAM:
        case ScpiCommandType::CONF_PARAM_QUERY:
            return execute_conf_param(cmd);

        case ScpiCommandType::HIPOT_IDN_QUERY:
        case ScpiCommandType::HIPOT_RESET:
        case ScpiCommandType::HIPOT_FILE:
        case ScpiCommandType::HIPOT_FILE_QUERY:
        case ScpiCommandType::HIPOT_CONF_SET:
        case ScpiCommandType::HIPOT_CONF_APPLY:
        case ScpiCommandType::HIPOT_CONF_QUERY:
        case ScpiCommandType::HIPOT_SAVE_SLOT:
        case ScpiCommandType::HIPOT_RECALL_SLOT:
        case ScpiCommandType::HIPOT_RESULT_QUERY:
        case ScpiCommandType::HIPOT_RAW:
        case ScpiCommandType::HIPOT_RAW_QUERY:
        case ScpiCommandType::HIPOT_PRESET_SAVE:
        case ScpiCommandType::HIPOT_PRESET_APPLY:
        case ScpiCommandType::HIPOT_PRESET_QUERY:
        case ScpiCommandType::HIPOT_RUN_QUERY:
        case ScpiCommandType::HIPOT_ABORT:
            return execute_hipot(cmd);

        case ScpiCommandType::SESS_START:
        case ScpiCommandType::SESS_END:
        case ScpiCommandType::SESS_ID_QUERY:
        case ScpiCommandType::SESS_LOG_QUERY:
            return execute_session(cmd);

        case ScpiCommandType::TEST_MEAS_QUERY:
        case ScpiCommandType::TEST_HIPOT_QUERY:
        case ScpiCommandType::TEST_FULL_QUERY:
            return execute_test(cmd);

        default:
            return error(SCPI_ERR::UNDEFINED_HEADER, "Unknown command");
    }
}
