#include <gtest/gtest.h>

#include <stdio.h>
#include <unistd.h>

#include <fstream>
#include <string>
#include <vector>

#include "modbus_master/modbus_master_config.h"

using namespace modbus_master;

namespace {

const char *kValidConfig = R"([
  {
    "name": "boiler",
    "protocol": "MODBUS",
    "config": {
      "type": "SLAVE",
      "host": "10.0.0.7",
      "port": 502,
      "cycle_time_ms": 500,
      "timeout_ms": 1000,
      "slave_id": 3,
      "word_order": "big",
      "retry_delay_ms": 500,
      "retry_max_delay_ms": 4000,
      "io_points": [
        {"fc": 3, "offset": "0x10", "iec_location": "%IW0", "len": 4, "name": "temperatures"},
        {"fc": 15, "offset": "8", "iec_location": "%QX0.0", "len": 8, "cycle_time_ms": 1000},
        {"fc": 16, "offset": " 100 ", "iec_location": "%QD8", "len": 2}
      ]
    }
  },
  {
    "name": "pump",
    "protocol": "MODBUS",
    "config": {
      "host": "10.0.0.8",
      "port": 502,
      "cycle_time_ms": 200,
      "timeout_ms": 300,
      "io_points": [
        {"fc": 2, "offset": "0", "iec_location": "%IX1.0", "len": 16}
      ]
    }
  }
])";

/* One device with a single point described by point_json */
std::string single_point_config(const std::string &point_json)
{
    return std::string(R"([{"name": "dev", "protocol": "MODBUS", "config": {"host": "127.0.0.1", "port": 5020,
        "cycle_time_ms": 100, "timeout_ms": 100, "io_points": [)") +
           point_json + "]}}]";
}

config_status_t parse(const std::string &json, modbus_master_config_t *config, std::vector<std::string> *errors,
                      std::vector<std::string> *warnings = NULL)
{
    return modbus_master_config_parse_string(json, config, errors, warnings);
}

bool any_contains(const std::vector<std::string> &messages, const std::string &needle)
{
    for (size_t i = 0; i < messages.size(); i++) {
        if (messages[i].find(needle) != std::string::npos) {
            return true;
        }
    }
    return false;
}

} // namespace

TEST(ModbusMasterConfig, ParsesDevicesAndPoints)
{
    modbus_master_config_t config;
    std::vector<std::string> errors;
    ASSERT_EQ(CONFIG_OK, parse(kValidConfig, &config, &errors)) << (errors.empty() ? "" : errors[0]);
    ASSERT_EQ(2u, config.devices.size());

    const device_config_t &boiler = config.devices[0];
    EXPECT_EQ("boiler", boiler.name);
    EXPECT_EQ("SLAVE", boiler.type);
    EXPECT_EQ("10.0.0.7", boiler.host);
    EXPECT_EQ(502, boiler.port);
    EXPECT_EQ(500, boiler.cycle_time_ms);
    EXPECT_EQ(1000, boiler.timeout_ms);
    EXPECT_EQ(3, boiler.slave_id);
    EXPECT_EQ(WORD_ORDER_BIG, boiler.word_order);
    EXPECT_EQ(500, boiler.retry_delay_ms);
    EXPECT_EQ(4000, boiler.retry_max_delay_ms);
    ASSERT_EQ(3u, boiler.io_points.size());

    const io_point_t &temperatures = boiler.io_points[0];
    EXPECT_EQ("temperatures", temperatures.name);
    EXPECT_EQ(3, temperatures.function_code);
    EXPECT_EQ(0x10, temperatures.address);
    EXPECT_EQ(IEC_AREA_INPUT, temperatures.location.area);
    EXPECT_EQ(IEC_SIZE_WORD, temperatures.location.size);
    EXPECT_EQ(4, temperatures.length);
    EXPECT_EQ(500, temperatures.cycle_time_ms);

    EXPECT_EQ(1000, boiler.io_points[1].cycle_time_ms);
    EXPECT_EQ(100, boiler.io_points[2].address);
}

TEST(ModbusMasterConfig, AppliesDefaults)
{
    modbus_master_config_t config;
    std::vector<std::string> errors;
    ASSERT_EQ(CONFIG_OK, parse(kValidConfig, &config, &errors));

    const device_config_t &pump = config.devices[1];
    EXPECT_EQ(MODBUS_MASTER_DEFAULT_SLAVE_ID, pump.slave_id);
    EXPECT_EQ(WORD_ORDER_LITTLE, pump.word_order);
    EXPECT_EQ(MODBUS_MASTER_DEFAULT_RETRY_DELAY_MS, pump.retry_delay_ms);
    EXPECT_EQ(MODBUS_MASTER_DEFAULT_RETRY_MAX_MS, pump.retry_max_delay_ms);
    EXPECT_EQ(200, pump.io_points[0].cycle_time_ms);
}

TEST(ModbusMasterConfig, ParsesFile)
{
    char path[] = "/tmp/modbus_master_config_XXXXXX";
    int fd = mkstemp(path);
    ASSERT_NE(-1, fd);
    close(fd);
    {
        std::ofstream out(path);
        out << kValidConfig;
    }

    modbus_master_config_t config;
    std::vector<std::string> errors;
    EXPECT_EQ(CONFIG_OK, modbus_master_config_parse_file(path, &config, &errors, NULL));
    EXPECT_EQ(2u, config.devices.size());
    unlink(path);
}

TEST(ModbusMasterConfig, MissingFile)
{
    modbus_master_config_t config;
    std::vector<std::string> errors;
    EXPECT_EQ(CONFIG_ERROR_FILE,
              modbus_master_config_parse_file("/nonexistent/modbus_master.json", &config, &errors, NULL));
    EXPECT_EQ(1u, errors.size());
}

TEST(ModbusMasterConfig, RejectsMalformedJson)
{
    modbus_master_config_t config;
    std::vector<std::string> errors;
    EXPECT_EQ(CONFIG_ERROR_PARSE, parse("[{\"name\": ", &config, &errors));
    EXPECT_FALSE(errors.empty());
}

TEST(ModbusMasterConfig, RootMustBeArray)
{
    modbus_master_config_t config;
    std::vector<std::string> errors;
    EXPECT_EQ(CONFIG_ERROR_INVALID, parse("{\"name\": \"dev\"}", &config, &errors));
}

TEST(ModbusMasterConfig, RejectsDuplicateNamesAndEndpoints)
{
    const char *json = R"([
      {"name": "a", "protocol": "MODBUS",
       "config": {"host": "h", "port": 502, "cycle_time_ms": 100, "timeout_ms": 100, "io_points": []}},
      {"name": "a", "protocol": "MODBUS",
       "config": {"host": "h", "port": 502, "cycle_time_ms": 100, "timeout_ms": 100, "io_points": []}}
    ])";

    modbus_master_config_t config;
    std::vector<std::string> errors;
    EXPECT_EQ(CONFIG_ERROR_INVALID, parse(json, &config, &errors));
    EXPECT_TRUE(any_contains(errors, "duplicate device name"));
    EXPECT_TRUE(any_contains(errors, "already used"));
}

TEST(ModbusMasterConfig, RejectsBadDeviceFields)
{
    const char *json = R"([
      {"name": "", "protocol": "S7",
       "config": {"host": "h", "port": 70000, "cycle_time_ms": 0, "timeout_ms": -1, "word_order": "middle"}}
    ])";

    modbus_master_config_t config;
    std::vector<std::string> errors;
    EXPECT_EQ(CONFIG_ERROR_INVALID, parse(json, &config, &errors));
    EXPECT_TRUE(any_contains(errors, "word_order"));
}

TEST(ModbusMasterConfig, ValidateReportsEveryDeviceProblem)
{
    modbus_master_config_t config;
    device_config_t device;
    device.name = "";
    device.protocol = "S7";
    device.host = "h";
    device.port = 70000;
    device.cycle_time_ms = 0;
    device.timeout_ms = -1;
    device.slave_id = 300;
    config.devices.push_back(device);

    std::vector<std::string> errors;
    EXPECT_EQ(CONFIG_ERROR_INVALID, modbus_master_config_validate(config, &errors, NULL));
    EXPECT_TRUE(any_contains(errors, "name must not be empty"));
    EXPECT_TRUE(any_contains(errors, "protocol"));
    EXPECT_TRUE(any_contains(errors, "port"));
    EXPECT_TRUE(any_contains(errors, "cycle_time_ms"));
    EXPECT_TRUE(any_contains(errors, "timeout_ms"));
    EXPECT_TRUE(any_contains(errors, "slave_id"));
}

TEST(ModbusMasterConfig, RejectsMissingPointFields)
{
    modbus_master_config_t config;
    std::vector<std::string> errors;
    EXPECT_EQ(CONFIG_ERROR_INVALID, parse(single_point_config(R"({"fc": 3, "iec_location": "%IW0"})"), &config,
                                          &errors));
    EXPECT_TRUE(any_contains(errors, "'offset'"));
    EXPECT_TRUE(any_contains(errors, "'len'"));
}

TEST(ModbusMasterConfig, RejectsUnknownFunctionCode)
{
    modbus_master_config_t config;
    std::vector<std::string> errors;
    EXPECT_EQ(CONFIG_ERROR_INVALID,
              parse(single_point_config(R"({"fc": 7, "offset": "0", "iec_location": "%IW0", "len": 1})"), &config,
                    &errors));
    EXPECT_TRUE(any_contains(errors, "unsupported function code 7"));
}

TEST(ModbusMasterConfig, FunctionCodeMustMatchLocationSize)
{
    modbus_master_config_t config;
    std::vector<std::string> errors;
    EXPECT_EQ(CONFIG_ERROR_INVALID,
              parse(single_point_config(R"({"fc": 1, "offset": "0", "iec_location": "%IW0", "len": 1})"), &config,
                    &errors));
    errors.clear();
    EXPECT_EQ(CONFIG_ERROR_INVALID,
              parse(single_point_config(R"({"fc": 3, "offset": "0", "iec_location": "%IX0.0", "len": 1})"),
                    &config, &errors));
}

TEST(ModbusMasterConfig, RejectsUnresolvableLocation)
{
    modbus_master_config_t config;
    std::vector<std::string> errors;
    EXPECT_EQ(CONFIG_ERROR_INVALID,
              parse(single_point_config(R"({"fc": 1, "offset": "0", "iec_location": "%MX0.0", "len": 1})"),
                    &config, &errors));
    errors.clear();
    EXPECT_EQ(CONFIG_ERROR_INVALID,
              parse(single_point_config(R"({"fc": 1, "offset": "0", "iec_location": "%IX0.9", "len": 1})"),
                    &config, &errors));
}

TEST(ModbusMasterConfig, EnforcesTransferLimits)
{
    modbus_master_config_t config;
    std::vector<std::string> errors;

    /* 63 dwords = 126 registers */
    EXPECT_EQ(CONFIG_ERROR_INVALID,
              parse(single_point_config(R"({"fc": 3, "offset": "0", "iec_location": "%ID0", "len": 63})"), &config,
                    &errors));
    EXPECT_TRUE(any_contains(errors, "126 registers"));

    errors.clear();
    EXPECT_EQ(CONFIG_OK,
              parse(single_point_config(R"({"fc": 4, "offset": "0", "iec_location": "%IW0", "len": 125})"), &config,
                    &errors));

    errors.clear();
    EXPECT_EQ(CONFIG_ERROR_INVALID,
              parse(single_point_config(R"({"fc": 15, "offset": "0", "iec_location": "%QX0.0", "len": 1969})"),
                    &config, &errors));

    errors.clear();
    EXPECT_EQ(CONFIG_ERROR_INVALID,
              parse(single_point_config(R"({"fc": 16, "offset": "0", "iec_location": "%QL0", "len": 31})"),
                    &config, &errors));
}

TEST(ModbusMasterConfig, HugeLengthCannotWrapPastTransferLimit)
{
    modbus_master_config_t config;
    std::vector<std::string> errors;

    /* 1073741824 lwords = 2^32 registers */
    EXPECT_EQ(CONFIG_ERROR_INVALID,
              parse(single_point_config(R"({"fc": 3, "offset": "0", "iec_location": "%IL0", "len": 1073741824})"),
                    &config, &errors));
    EXPECT_TRUE(any_contains(errors, "4294967296 registers"));

    errors.clear();
    EXPECT_EQ(CONFIG_ERROR_INVALID,
              parse(single_point_config(R"({"fc": 16, "offset": "0", "iec_location": "%QD0", "len": 2147483647})"),
                    &config, &errors));
    EXPECT_TRUE(any_contains(errors, "more than the 123"));
}

TEST(ModbusMasterConfig, WarnsWhenSingleWriteCarriesSeveralValues)
{
    modbus_master_config_t config;
    std::vector<std::string> errors;
    std::vector<std::string> warnings;
    EXPECT_EQ(CONFIG_OK,
              parse(single_point_config(R"({"fc": 6, "offset": "0", "iec_location": "%QD0", "len": 1})"), &config,
                    &errors, &warnings));
    EXPECT_TRUE(any_contains(warnings, "only the first"));
}

TEST(ModbusMasterConfig, CycleTimesMustBePositive)
{
    modbus_master_config_t config;
    std::vector<std::string> errors;
    EXPECT_EQ(CONFIG_ERROR_INVALID,
              parse(single_point_config(
                        R"({"fc": 3, "offset": "0", "iec_location": "%IW0", "len": 1, "cycle_time_ms": 0})"),
                    &config, &errors));
}

TEST(ModbusMasterConfig, ParsesOffsets)
{
    uint16_t address = 0;
    std::string error;
    EXPECT_TRUE(parse_modbus_offset("40", &address, &error));
    EXPECT_EQ(40, address);
    EXPECT_TRUE(parse_modbus_offset(" 0x1F ", &address, &error));
    EXPECT_EQ(0x1F, address);
    EXPECT_TRUE(parse_modbus_offset("0XfFfF", &address, &error));
    EXPECT_EQ(65535, address);
    EXPECT_TRUE(parse_modbus_offset("0", &address, &error));
    EXPECT_EQ(0, address);

    EXPECT_FALSE(parse_modbus_offset("", &address, &error));
    EXPECT_FALSE(parse_modbus_offset("0x", &address, &error));
    EXPECT_FALSE(parse_modbus_offset("-1", &address, &error));
    EXPECT_FALSE(parse_modbus_offset("12a", &address, &error));
    EXPECT_FALSE(parse_modbus_offset("65536", &address, &error));
    EXPECT_FALSE(error.empty());
}

TEST(ModbusMasterConfig, TransferCount)
{
    io_point_t point;
    point.function_code = FC_READ_HOLDING_REGISTERS;
    point.location.size = IEC_SIZE_LWORD;
    point.length = 3;
    EXPECT_EQ(12, io_point_transfer_count(point));

    point.length = 1073741824;
    EXPECT_EQ(4294967296LL, io_point_transfer_count(point));
    point.length = 3;

    point.function_code = FC_READ_COILS;
    point.location.size = IEC_SIZE_BIT;
    EXPECT_EQ(3, io_point_transfer_count(point));
}

TEST(ModbusMasterConfig, TransferLimits)
{
    EXPECT_EQ(2000, io_point_transfer_limit(FC_READ_DISCRETE_INPUTS));
    EXPECT_EQ(125, io_point_transfer_limit(FC_READ_INPUT_REGISTERS));
    EXPECT_EQ(1968, io_point_transfer_limit(FC_WRITE_MULTIPLE_COILS));
    EXPECT_EQ(123, io_point_transfer_limit(FC_WRITE_MULTIPLE_REGISTERS));
    EXPECT_EQ(0, io_point_transfer_limit(FC_WRITE_SINGLE_REGISTER));
}
