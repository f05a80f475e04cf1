/**
 * @file modbus_transport.h
 * @brief Modbus TCP client interface used by the connection managers
 *
 * PDU framing is delegated to a Modbus client library; the engine only needs
 * connect/close and one request per function code. Every request reports a
 * transport_status_t, and any non-OK status means the transaction failed.
 */

#ifndef MODBUS_MASTER_TRANSPORT_H
#define MODBUS_MASTER_TRANSPORT_H

#include <stdint.h>

#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace modbus_master {

typedef enum {
    TRANSPORT_STATUS_OK = 0,
    TRANSPORT_STATUS_NOT_CONNECTED,
    TRANSPORT_STATUS_IO_ERROR,              /* Socket error or timeout */
    TRANSPORT_STATUS_EXCEPTION_RESPONSE,    /* Device answered with a Modbus exception */
    TRANSPORT_STATUS_INVALID_REQUEST        /* Request or response data rejected */
} transport_status_t;

struct transport_result_t {
    transport_status_t status;
    std::string message;

    transport_result_t() : status(TRANSPORT_STATUS_NOT_CONNECTED) {}

    bool ok() const { return status == TRANSPORT_STATUS_OK; }
};

inline transport_result_t transport_result(transport_status_t status, const std::string &message = "")
{
    transport_result_t result;
    result.status = status;
    result.message = message;
    return result;
}

const char *transport_status_name(transport_status_t status);

/**
 * @brief Where and how to reach one slave device
 */
struct transport_params_t {
    std::string host;
    int port;
    int timeout_ms;
    int slave_id;

    transport_params_t() : port(502), timeout_ms(1000), slave_id(1) {}
};

class ModbusTransport
{
public:
    virtual ~ModbusTransport() {}

    virtual bool connect() = 0;
    virtual bool is_connected() const = 0;
    virtual void close() = 0;

    /* Description of the most recent failure, for logging */
    virtual std::string last_error() const = 0;

    /* Bit reads fill one byte (0 or 1) per coil / input */
    virtual transport_result_t read_coils(uint16_t address, int count, std::vector<uint8_t> *bits) = 0;
    virtual transport_result_t read_discrete_inputs(uint16_t address, int count, std::vector<uint8_t> *bits) = 0;
    virtual transport_result_t read_holding_registers(uint16_t address, int count,
                                                      std::vector<uint16_t> *registers) = 0;
    virtual transport_result_t read_input_registers(uint16_t address, int count,
                                                    std::vector<uint16_t> *registers) = 0;

    virtual transport_result_t write_single_coil(uint16_t address, bool value) = 0;
    virtual transport_result_t write_single_register(uint16_t address, uint16_t value) = 0;
    virtual transport_result_t write_multiple_coils(uint16_t address, const std::vector<uint8_t> &bits) = 0;
    virtual transport_result_t write_multiple_registers(uint16_t address, const std::vector<uint16_t> &registers) = 0;
};

/**
 * @brief Creates a new, unconnected transport for every connection attempt
 */
typedef std::function<std::unique_ptr<ModbusTransport>()> transport_factory_t;

/**
 * @brief Factory of libmodbus-backed transports for one device
 *
 * Defined in libmodbus_transport.cpp, which is only linked into the plugin.
 */
transport_factory_t make_libmodbus_transport_factory(const transport_params_t &params);

} // namespace modbus_master

#endif /* MODBUS_MASTER_TRANSPORT_H */
