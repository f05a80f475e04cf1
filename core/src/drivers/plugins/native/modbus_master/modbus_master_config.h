/**
 * @file modbus_master_config.h
 * @brief Modbus Master configuration loader and validator
 *
 * The plugin configuration file is a JSON array of device objects:
 *
 *     [
 *       {
 *         "name": "boiler",
 *         "protocol": "MODBUS",
 *         "config": {
 *           "type": "SLAVE",
 *           "host": "10.0.0.7",
 *           "port": 502,
 *           "cycle_time_ms": 500,
 *           "timeout_ms": 1000,
 *           "slave_id": 1,
 *           "word_order": "little",
 *           "io_points": [
 *             {"fc": 3, "offset": "0x10", "iec_location": "%IW0", "len": 4},
 *             {"fc": 15, "offset": "0", "iec_location": "%QX0.0", "len": 8,
 *              "cycle_time_ms": 1000}
 *           ]
 *         }
 *       }
 *     ]
 *
 * Parsing builds device_config_t values with offsets and IEC locations
 * already parsed; validation checks the semantic rules and collects every
 * problem found rather than stopping at the first one.
 */

#ifndef MODBUS_MASTER_CONFIG_H
#define MODBUS_MASTER_CONFIG_H

#include <stdint.h>

#include <string>
#include <vector>

#include "modbus_master_types.h"

namespace modbus_master {

typedef enum {
    CONFIG_OK = 0,
    CONFIG_ERROR_FILE,          /* File missing or unreadable */
    CONFIG_ERROR_PARSE,         /* Not valid JSON */
    CONFIG_ERROR_INVALID        /* Valid JSON, invalid configuration */
} config_status_t;

typedef struct {
    std::vector<device_config_t> devices;
} modbus_master_config_t;

/**
 * @brief Load, parse and validate a configuration file
 *
 * @param config_path Path to the JSON file
 * @param config Receives the devices (only meaningful on CONFIG_OK)
 * @param errors Receives one message per problem
 * @param warnings Receives non-fatal remarks, may be NULL
 */
config_status_t modbus_master_config_parse_file(const std::string &config_path, modbus_master_config_t *config,
                                                std::vector<std::string> *errors,
                                                std::vector<std::string> *warnings);

/**
 * @brief Same as modbus_master_config_parse_file, from JSON text
 */
config_status_t modbus_master_config_parse_string(const std::string &json_text, modbus_master_config_t *config,
                                                  std::vector<std::string> *errors,
                                                  std::vector<std::string> *warnings);

/**
 * @brief Check a configuration against the Modbus Master rules
 *
 * Unique names and endpoints, supported function codes matching the
 * location size, resolvable locations, Modbus transfer limits, and cycle
 * times that are multiples of the device base tick.
 *
 * @return CONFIG_OK or CONFIG_ERROR_INVALID
 */
config_status_t modbus_master_config_validate(const modbus_master_config_t &config,
                                              std::vector<std::string> *errors,
                                              std::vector<std::string> *warnings);

/**
 * @brief Parse a Modbus protocol address ("40", " 0x1F ", "0X00ff")
 * @return false (with error set) if not a decimal or hex number in 0..65535
 */
bool parse_modbus_offset(const std::string &text, uint16_t *address, std::string *error);

/**
 * @brief Number of coils or registers one point transfers per request
 *
 * Computed in 64 bits: the length is only known to be positive before
 * validation.
 */
long long io_point_transfer_count(const io_point_t &point);

/**
 * @brief Largest quantity one request of this function code may carry
 * @return 0 for the single-write codes, which send one value
 */
int io_point_transfer_limit(int function_code);

const char *config_status_name(config_status_t status);

} // namespace modbus_master

#endif /* MODBUS_MASTER_CONFIG_H */
