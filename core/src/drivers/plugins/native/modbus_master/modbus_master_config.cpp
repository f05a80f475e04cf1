/**
 * @file modbus_master_config.cpp
 * @brief Modbus Master configuration loader and validator (jsoncpp)
 */

#include "modbus_master_config.h"

#include <cctype>
#include <fstream>
#include <set>
#include <sstream>

#include <json/json.h>

#include "iec_address.h"
#include "poll_schedule.h"
#include "register_codec.h"

namespace modbus_master {

static void add_message(std::vector<std::string> *messages, const std::string &message)
{
    if (messages != NULL) {
        messages->push_back(message);
    }
}

static std::string device_label(const device_config_t &device, size_t index)
{
    if (device.name.empty()) {
        return "device #" + std::to_string(index);
    }
    return "device '" + device.name + "'";
}

static std::string point_label(const device_config_t &device, size_t device_index, size_t point_index)
{
    return device_label(device, device_index) + " point #" + std::to_string(point_index);
}

/*
 * =============================================================================
 * Offset Parsing
 * =============================================================================
 */

bool parse_modbus_offset(const std::string &text, uint16_t *address, std::string *error)
{
    size_t first = 0;
    size_t last = text.size();
    while (first < last && isspace(static_cast<unsigned char>(text[first]))) {
        first++;
    }
    while (last > first && isspace(static_cast<unsigned char>(text[last - 1]))) {
        last--;
    }
    std::string value = text.substr(first, last - first);

    int base = 10;
    size_t pos = 0;
    if (value.size() > 2 && value[0] == '0' && (value[1] == 'x' || value[1] == 'X')) {
        base = 16;
        pos = 2;
    }

    if (pos >= value.size()) {
        if (error != NULL) {
            *error = "invalid Modbus offset '" + text + "'";
        }
        return false;
    }

    long result = 0;
    for (; pos < value.size(); pos++) {
        int c = static_cast<unsigned char>(value[pos]);
        int digit;
        if (isdigit(c)) {
            digit = c - '0';
        } else if (base == 16 && isxdigit(c)) {
            digit = tolower(c) - 'a' + 10;
        } else {
            if (error != NULL) {
                *error = "invalid Modbus offset '" + text + "'";
            }
            return false;
        }
        result = result * base + digit;
        if (result > 65535) {
            if (error != NULL) {
                *error = "Modbus offset '" + text + "' out of range (0-65535)";
            }
            return false;
        }
    }

    *address = static_cast<uint16_t>(result);
    return true;
}

long long io_point_transfer_count(const io_point_t &point)
{
    long long length = point.length;
    if (modbus_is_bit_function(point.function_code)) {
        return length;
    }
    return length * codec_registers_needed(point.location.size);
}

int io_point_transfer_limit(int function_code)
{
    switch (function_code) {
        case FC_READ_COILS:
        case FC_READ_DISCRETE_INPUTS:
            return MODBUS_MASTER_MAX_READ_BITS;
        case FC_READ_HOLDING_REGISTERS:
        case FC_READ_INPUT_REGISTERS:
            return MODBUS_MASTER_MAX_READ_REGISTERS;
        case FC_WRITE_MULTIPLE_COILS:
            return MODBUS_MASTER_MAX_WRITE_BITS;
        case FC_WRITE_MULTIPLE_REGISTERS:
            return MODBUS_MASTER_MAX_WRITE_REGISTERS;
        default:
            break;
    }
    return 0;
}

/*
 * =============================================================================
 * JSON Extraction
 * =============================================================================
 */

static bool get_string(const Json::Value &object, const char *key, bool required, std::string *out,
                       const std::string &label, std::vector<std::string> *errors)
{
    if (!object.isMember(key)) {
        if (required) {
            add_message(errors, label + ": missing '" + key + "'");
            return false;
        }
        return true;
    }
    const Json::Value &value = object[key];
    if (!value.isString()) {
        add_message(errors, label + ": '" + key + "' must be a string");
        return false;
    }
    *out = value.asString();
    return true;
}

static bool get_int(const Json::Value &object, const char *key, bool required, int *out, const std::string &label,
                    std::vector<std::string> *errors)
{
    if (!object.isMember(key)) {
        if (required) {
            add_message(errors, label + ": missing '" + key + "'");
            return false;
        }
        return true;
    }
    const Json::Value &value = object[key];
    if (!value.isInt()) {
        add_message(errors, label + ": '" + key + "' must be an integer");
        return false;
    }
    *out = value.asInt();
    return true;
}

static void parse_io_point(const Json::Value &node, const device_config_t &device, const std::string &label,
                           io_point_t *point, std::vector<std::string> *errors)
{
    if (!node.isObject()) {
        add_message(errors, label + ": must be an object");
        return;
    }

    get_int(node, "fc", true, &point->function_code, label, errors);
    get_int(node, "len", true, &point->length, label, errors);
    get_string(node, "name", false, &point->name, label, errors);

    point->cycle_time_ms = device.cycle_time_ms;
    get_int(node, "cycle_time_ms", false, &point->cycle_time_ms, label, errors);

    if (get_string(node, "offset", true, &point->offset_text, label, errors)) {
        std::string error;
        if (!parse_modbus_offset(point->offset_text, &point->address, &error)) {
            add_message(errors, label + ": " + error);
        }
    }

    if (get_string(node, "iec_location", true, &point->location_text, label, errors)) {
        std::string error;
        if (iec_address_parse(point->location_text, &point->location, &error) != IEC_STATUS_OK) {
            add_message(errors, label + ": " + error);
        }
    }
}

static void parse_device(const Json::Value &node, size_t index, device_config_t *device,
                         std::vector<std::string> *errors)
{
    std::string label = "device #" + std::to_string(index);
    if (!node.isObject()) {
        add_message(errors, label + ": must be an object");
        return;
    }

    get_string(node, "name", true, &device->name, label, errors);
    label = device_label(*device, index);
    get_string(node, "protocol", true, &device->protocol, label, errors);

    if (!node.isMember("config") || !node["config"].isObject()) {
        add_message(errors, label + ": missing 'config' object");
        return;
    }
    const Json::Value &config = node["config"];

    get_string(config, "type", false, &device->type, label, errors);
    get_string(config, "host", true, &device->host, label, errors);
    get_int(config, "port", true, &device->port, label, errors);
    get_int(config, "cycle_time_ms", true, &device->cycle_time_ms, label, errors);
    get_int(config, "timeout_ms", true, &device->timeout_ms, label, errors);
    get_int(config, "slave_id", false, &device->slave_id, label, errors);
    get_int(config, "retry_delay_ms", false, &device->retry_delay_ms, label, errors);
    get_int(config, "retry_max_delay_ms", false, &device->retry_max_delay_ms, label, errors);

    std::string word_order;
    if (get_string(config, "word_order", false, &word_order, label, errors) && !word_order.empty()) {
        if (word_order == "little") {
            device->word_order = WORD_ORDER_LITTLE;
        } else if (word_order == "big") {
            device->word_order = WORD_ORDER_BIG;
        } else {
            add_message(errors, label + ": 'word_order' must be \"little\" or \"big\"");
        }
    }

    if (!config.isMember("io_points")) {
        return;
    }
    const Json::Value &points = config["io_points"];
    if (!points.isArray()) {
        add_message(errors, label + ": 'io_points' must be an array");
        return;
    }

    for (Json::ArrayIndex i = 0; i < points.size(); i++) {
        io_point_t point;
        parse_io_point(points[i], *device, point_label(*device, index, i), &point, errors);
        device->io_points.push_back(point);
    }
}

static config_status_t parse_root(std::istream &input, modbus_master_config_t *config,
                                  std::vector<std::string> *errors, std::vector<std::string> *warnings)
{
    std::vector<std::string> local_errors;
    if (errors == NULL) {
        errors = &local_errors;
    }

    Json::CharReaderBuilder builder;
    Json::Value root;
    std::string parse_errors;
    if (!Json::parseFromStream(builder, input, &root, &parse_errors)) {
        add_message(errors, "JSON parse error: " + parse_errors);
        return CONFIG_ERROR_PARSE;
    }

    if (!root.isArray()) {
        add_message(errors, "configuration root must be an array of devices");
        return CONFIG_ERROR_INVALID;
    }

    modbus_master_config_t parsed;
    size_t error_count = errors->size();

    for (Json::ArrayIndex i = 0; i < root.size(); i++) {
        device_config_t device;
        parse_device(root[i], i, &device, errors);
        parsed.devices.push_back(device);
    }

    if (errors->size() > error_count) {
        return CONFIG_ERROR_INVALID;
    }

    if (modbus_master_config_validate(parsed, errors, warnings) != CONFIG_OK) {
        return CONFIG_ERROR_INVALID;
    }

    *config = parsed;
    return CONFIG_OK;
}

config_status_t modbus_master_config_parse_file(const std::string &config_path, modbus_master_config_t *config,
                                                std::vector<std::string> *errors,
                                                std::vector<std::string> *warnings)
{
    std::ifstream file(config_path.c_str());
    if (!file) {
        add_message(errors, "cannot open configuration file '" + config_path + "'");
        return CONFIG_ERROR_FILE;
    }
    return parse_root(file, config, errors, warnings);
}

config_status_t modbus_master_config_parse_string(const std::string &json_text, modbus_master_config_t *config,
                                                  std::vector<std::string> *errors,
                                                  std::vector<std::string> *warnings)
{
    std::istringstream input(json_text);
    return parse_root(input, config, errors, warnings);
}

/*
 * =============================================================================
 * Validation
 * =============================================================================
 */

static void validate_point(const device_config_t &device, size_t device_index, size_t point_index,
                           int base_tick_ms, std::vector<std::string> *errors, std::vector<std::string> *warnings)
{
    const io_point_t &point = device.io_points[point_index];
    std::string label = point_label(device, device_index, point_index);
    int fc = point.function_code;

    if (!modbus_is_read_function(fc) && !modbus_is_write_function(fc)) {
        add_message(errors, label + ": unsupported function code " + std::to_string(fc));
        return;
    }

    if (point.length <= 0) {
        add_message(errors, label + ": 'len' must be a positive integer");
        return;
    }

    bool bit_location = point.location.size == IEC_SIZE_BIT;
    if (modbus_is_bit_function(fc) && !bit_location) {
        add_message(errors, label + ": FC" + std::to_string(fc) + " needs a bit location (%IX/%QX), got " +
                                point.location_text);
        return;
    }
    if (!modbus_is_bit_function(fc) && bit_location) {
        add_message(errors, label + ": FC" + std::to_string(fc) + " needs a byte, word, dword or lword location, got " +
                                point.location_text);
        return;
    }

    buffer_access_descriptor_t target;
    std::string error;
    transfer_direction_t direction = modbus_is_write_function(fc) ? TRANSFER_WRITE : TRANSFER_READ;
    if (iec_address_resolve(point.location, direction, &target, &error) != IEC_STATUS_OK) {
        add_message(errors, label + ": " + error);
        return;
    }

    long long count = io_point_transfer_count(point);
    int limit = io_point_transfer_limit(fc);
    const char *unit = modbus_is_bit_function(fc) ? "coils" : "registers";
    if (limit > 0 && count > limit) {
        add_message(errors, label + ": transfers " + std::to_string(count) + " " + unit + ", more than the " +
                                std::to_string(limit) + " allowed by FC" + std::to_string(fc));
    }

    if ((fc == FC_WRITE_SINGLE_COIL || fc == FC_WRITE_SINGLE_REGISTER) && count > 1) {
        add_message(warnings, label + ": FC" + std::to_string(fc) + " writes a single value, only the first of " +
                                  std::to_string(count) + " " + unit + " is sent");
    }

    if (point.cycle_time_ms <= 0) {
        add_message(errors, label + ": 'cycle_time_ms' must be a positive integer");
    } else if (point.cycle_time_ms % base_tick_ms != 0) {
        add_message(errors, label + ": cycle time " + std::to_string(point.cycle_time_ms) +
                                " ms is not a multiple of the device base tick (" + std::to_string(base_tick_ms) +
                                " ms)");
    }
}

config_status_t modbus_master_config_validate(const modbus_master_config_t &config,
                                              std::vector<std::string> *errors,
                                              std::vector<std::string> *warnings)
{
    std::vector<std::string> local_errors;
    std::vector<std::string> *sink = errors != NULL ? errors : &local_errors;
    size_t initial = sink->size();

    std::set<std::string> names;
    std::set<std::string> endpoints;

    for (size_t i = 0; i < config.devices.size(); i++) {
        const device_config_t &device = config.devices[i];
        std::string label = device_label(device, i);

        if (device.name.empty()) {
            add_message(sink, label + ": name must not be empty");
        } else if (!names.insert(device.name).second) {
            add_message(sink, label + ": duplicate device name");
        }

        if (device.protocol != "MODBUS") {
            add_message(sink, label + ": protocol '" + device.protocol + "' is not supported (expected MODBUS)");
        }

        if (device.host.empty()) {
            add_message(sink, label + ": host must not be empty");
        }
        if (device.port <= 0 || device.port > 65535) {
            add_message(sink, label + ": port " + std::to_string(device.port) + " out of range (1-65535)");
        }
        if (!device.host.empty() && !endpoints.insert(device.host + ":" + std::to_string(device.port)).second) {
            add_message(sink, label + ": endpoint " + device.host + ":" + std::to_string(device.port) +
                                  " already used by another device");
        }

        if (device.cycle_time_ms <= 0) {
            add_message(sink, label + ": 'cycle_time_ms' must be a positive integer");
        }
        if (device.timeout_ms <= 0) {
            add_message(sink, label + ": 'timeout_ms' must be a positive integer");
        }
        if (device.slave_id < 0 || device.slave_id > 255) {
            add_message(sink, label + ": 'slave_id' must be in 0-255");
        }
        if (device.retry_delay_ms <= 0 || device.retry_max_delay_ms <= 0) {
            add_message(sink, label + ": retry delays must be positive");
        } else if (device.retry_max_delay_ms < device.retry_delay_ms) {
            add_message(sink, label + ": 'retry_max_delay_ms' is smaller than 'retry_delay_ms'");
        }

        if (device.io_points.empty()) {
            add_message(warnings, label + ": no I/O points configured");
            continue;
        }

        int base_tick_ms = compute_base_tick_ms(device.io_points);
        for (size_t p = 0; p < device.io_points.size(); p++) {
            validate_point(device, i, p, base_tick_ms, sink, warnings);
        }
    }

    return sink->size() > initial ? CONFIG_ERROR_INVALID : CONFIG_OK;
}

const char *config_status_name(config_status_t status)
{
    switch (status) {
        case CONFIG_OK:
            return "OK";
        case CONFIG_ERROR_FILE:
            return "ERROR_FILE";
        case CONFIG_ERROR_PARSE:
            return "ERROR_PARSE";
        case CONFIG_ERROR_INVALID:
            return "ERROR_INVALID";
    }
    return "UNKNOWN";
}

} // namespace modbus_master
