/**
 * @file libmodbus_transport.cpp
 * @brief ModbusTransport backed by libmodbus
 */

#include <errno.h>

#include <modbus.h>

#include "modbus_transport.h"

namespace modbus_master {

namespace {

class LibmodbusTransport : public ModbusTransport
{
public:
    explicit LibmodbusTransport(const transport_params_t &params)
        : params_(params), ctx_(NULL), connected_(false)
    {
    }

    ~LibmodbusTransport()
    {
        close();
    }

    bool connect()
    {
        close();

        ctx_ = modbus_new_tcp(params_.host.c_str(), params_.port);
        if (ctx_ == NULL) {
            last_error_ = std::string("modbus_new_tcp failed: ") + modbus_strerror(errno);
            return false;
        }

        if (modbus_set_slave(ctx_, params_.slave_id) < 0) {
            last_error_ = std::string("modbus_set_slave failed: ") + modbus_strerror(errno);
            release_context();
            return false;
        }

        if (params_.timeout_ms > 0) {
            uint32_t sec = static_cast<uint32_t>(params_.timeout_ms / 1000);
            uint32_t usec = static_cast<uint32_t>((params_.timeout_ms % 1000) * 1000);
            modbus_set_response_timeout(ctx_, sec, usec);
        }

        if (modbus_connect(ctx_) < 0) {
            last_error_ = std::string("modbus_connect failed: ") + modbus_strerror(errno);
            release_context();
            return false;
        }

        connected_ = true;
        last_error_.clear();
        return true;
    }

    bool is_connected() const
    {
        return connected_ && ctx_ != NULL && modbus_get_socket(ctx_) >= 0;
    }

    void close()
    {
        if (ctx_ != NULL && connected_) {
            modbus_close(ctx_);
        }
        release_context();
    }

    std::string last_error() const
    {
        return last_error_;
    }

    transport_result_t read_coils(uint16_t address, int count, std::vector<uint8_t> *bits)
    {
        if (!is_connected()) {
            return not_connected();
        }
        bits->assign(count, 0);
        int rc = modbus_read_bits(ctx_, address, count, bits->data());
        return check_count(rc, count, "read coils", bits);
    }

    transport_result_t read_discrete_inputs(uint16_t address, int count, std::vector<uint8_t> *bits)
    {
        if (!is_connected()) {
            return not_connected();
        }
        bits->assign(count, 0);
        int rc = modbus_read_input_bits(ctx_, address, count, bits->data());
        return check_count(rc, count, "read discrete inputs", bits);
    }

    transport_result_t read_holding_registers(uint16_t address, int count, std::vector<uint16_t> *registers)
    {
        if (!is_connected()) {
            return not_connected();
        }
        registers->assign(count, 0);
        int rc = modbus_read_registers(ctx_, address, count, registers->data());
        return check_count(rc, count, "read holding registers", registers);
    }

    transport_result_t read_input_registers(uint16_t address, int count, std::vector<uint16_t> *registers)
    {
        if (!is_connected()) {
            return not_connected();
        }
        registers->assign(count, 0);
        int rc = modbus_read_input_registers(ctx_, address, count, registers->data());
        return check_count(rc, count, "read input registers", registers);
    }

    transport_result_t write_single_coil(uint16_t address, bool value)
    {
        if (!is_connected()) {
            return not_connected();
        }
        int rc = modbus_write_bit(ctx_, address, value ? 1 : 0);
        return check_count(rc, 1, "write single coil");
    }

    transport_result_t write_single_register(uint16_t address, uint16_t value)
    {
        if (!is_connected()) {
            return not_connected();
        }
        int rc = modbus_write_register(ctx_, address, value);
        return check_count(rc, 1, "write single register");
    }

    transport_result_t write_multiple_coils(uint16_t address, const std::vector<uint8_t> &bits)
    {
        if (!is_connected()) {
            return not_connected();
        }
        int count = static_cast<int>(bits.size());
        int rc = modbus_write_bits(ctx_, address, count, bits.data());
        return check_count(rc, count, "write multiple coils");
    }

    transport_result_t write_multiple_registers(uint16_t address, const std::vector<uint16_t> &registers)
    {
        if (!is_connected()) {
            return not_connected();
        }
        int count = static_cast<int>(registers.size());
        int rc = modbus_write_registers(ctx_, address, count, registers.data());
        return check_count(rc, count, "write multiple registers");
    }

private:
    void release_context()
    {
        if (ctx_ != NULL) {
            modbus_free(ctx_);
            ctx_ = NULL;
        }
        connected_ = false;
    }

    transport_result_t not_connected()
    {
        last_error_ = "not connected";
        return transport_result(TRANSPORT_STATUS_NOT_CONNECTED, last_error_);
    }

    /* Classify a libmodbus failure from errno */
    transport_result_t failure(const char *operation)
    {
        int err = errno;
        last_error_ = std::string(operation) + " failed: " + modbus_strerror(err);

        if (err >= EMBXILFUN && err <= EMBXGTAR) {
            return transport_result(TRANSPORT_STATUS_EXCEPTION_RESPONSE, last_error_);
        }
        if (err == EMBBADDATA || err == EMBMDATA || err == EINVAL) {
            return transport_result(TRANSPORT_STATUS_INVALID_REQUEST, last_error_);
        }
        return transport_result(TRANSPORT_STATUS_IO_ERROR, last_error_);
    }

    template <typename T>
    transport_result_t check_count(int rc, int expected, const char *operation, std::vector<T> *data)
    {
        if (rc < 0) {
            data->clear();
            return failure(operation);
        }
        if (rc < expected) {
            /* Keep what arrived; the caller stops at the missing elements */
            data->resize(rc);
        }
        return transport_result(TRANSPORT_STATUS_OK);
    }

    transport_result_t check_count(int rc, int expected, const char *operation)
    {
        if (rc < 0) {
            return failure(operation);
        }
        if (rc != expected) {
            last_error_ = std::string(operation) + ": device acknowledged an unexpected quantity";
            return transport_result(TRANSPORT_STATUS_INVALID_REQUEST, last_error_);
        }
        return transport_result(TRANSPORT_STATUS_OK);
    }

    transport_params_t params_;
    modbus_t *ctx_;
    bool connected_;
    std::string last_error_;
};

} // namespace

transport_factory_t make_libmodbus_transport_factory(const transport_params_t &params)
{
    return [params]() -> std::unique_ptr<ModbusTransport> {
        return std::unique_ptr<ModbusTransport>(new LibmodbusTransport(params));
    };
}

} // namespace modbus_master
