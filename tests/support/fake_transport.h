/**
 * @file fake_transport.h
 * @brief Scriptable in-memory Modbus slave behind the ModbusTransport interface
 *
 * A FakeSlave outlives the transports the connection manager creates and
 * destroys, so tests can script it and inspect every request afterwards.
 */

#ifndef MODBUS_MASTER_TESTS_FAKE_TRANSPORT_H
#define MODBUS_MASTER_TESTS_FAKE_TRANSPORT_H

#include <stdint.h>

#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "modbus_master/modbus_transport.h"

namespace modbus_master {
namespace fakes {

struct fake_request_t {
    int function_code;
    uint16_t address;
    int count;
    std::vector<uint8_t> bits;
    std::vector<uint16_t> registers;
};

class FakeSlave
{
public:
    FakeSlave()
        : transports_created(0),
          connect_attempts(0),
          close_count(0),
          connect_failures(0),
          refuse_connections(false),
          report_connected(true),
          throw_on_request(false),
          request_delay_ms(0)
    {
    }

    std::mutex mutex;

    int transports_created;
    int connect_attempts;
    int close_count;

    /* The first connect_failures attempts fail */
    int connect_failures;
    bool refuse_connections;
    /* What is_connected() answers once connected */
    bool report_connected;
    bool throw_on_request;
    /* Every request blocks this long, like a slow or unreachable device */
    int request_delay_ms;

    std::map<uint16_t, uint8_t> coils;
    std::map<uint16_t, uint8_t> discrete_inputs;
    std::map<uint16_t, uint16_t> holding_registers;
    std::map<uint16_t, uint16_t> input_registers;

    /* Requests starting at these addresses get an exception response */
    std::set<uint16_t> exception_addresses;
    /* Reads starting at these addresses return only half of the data */
    std::set<uint16_t> short_read_addresses;

    std::vector<fake_request_t> requests;

    std::vector<fake_request_t> requests_copy()
    {
        std::lock_guard<std::mutex> lock(mutex);
        return requests;
    }

    size_t request_count()
    {
        std::lock_guard<std::mutex> lock(mutex);
        return requests.size();
    }

    int attempts()
    {
        std::lock_guard<std::mutex> lock(mutex);
        return connect_attempts;
    }
};

class FakeTransport : public ModbusTransport
{
public:
    explicit FakeTransport(const std::shared_ptr<FakeSlave> &slave) : slave_(slave), connected_(false) {}

    bool connect()
    {
        std::lock_guard<std::mutex> lock(slave_->mutex);
        slave_->connect_attempts++;
        if (slave_->refuse_connections || slave_->connect_attempts <= slave_->connect_failures) {
            last_error_ = "connection refused";
            return false;
        }
        connected_ = true;
        return true;
    }

    bool is_connected() const
    {
        std::lock_guard<std::mutex> lock(slave_->mutex);
        return connected_ && slave_->report_connected;
    }

    void close()
    {
        std::lock_guard<std::mutex> lock(slave_->mutex);
        if (connected_) {
            slave_->close_count++;
        }
        connected_ = false;
    }

    std::string last_error() const { return last_error_; }

    transport_result_t read_coils(uint16_t address, int count, std::vector<uint8_t> *bits)
    {
        return read_bits(FC_READ_COILS, slave_->coils, address, count, bits);
    }

    transport_result_t read_discrete_inputs(uint16_t address, int count, std::vector<uint8_t> *bits)
    {
        return read_bits(FC_READ_DISCRETE_INPUTS, slave_->discrete_inputs, address, count, bits);
    }

    transport_result_t read_holding_registers(uint16_t address, int count, std::vector<uint16_t> *registers)
    {
        return read_registers(FC_READ_HOLDING_REGISTERS, slave_->holding_registers, address, count, registers);
    }

    transport_result_t read_input_registers(uint16_t address, int count, std::vector<uint16_t> *registers)
    {
        return read_registers(FC_READ_INPUT_REGISTERS, slave_->input_registers, address, count, registers);
    }

    transport_result_t write_single_coil(uint16_t address, bool value)
    {
        return write_bits(FC_WRITE_SINGLE_COIL, address, std::vector<uint8_t>(1, value ? 1 : 0));
    }

    transport_result_t write_single_register(uint16_t address, uint16_t value)
    {
        return write_registers(FC_WRITE_SINGLE_REGISTER, address, std::vector<uint16_t>(1, value));
    }

    transport_result_t write_multiple_coils(uint16_t address, const std::vector<uint8_t> &bits)
    {
        return write_bits(FC_WRITE_MULTIPLE_COILS, address, bits);
    }

    transport_result_t write_multiple_registers(uint16_t address, const std::vector<uint16_t> &registers)
    {
        return write_registers(FC_WRITE_MULTIPLE_REGISTERS, address, registers);
    }

private:
    void pause()
    {
        int delay_ms = 0;
        {
            std::lock_guard<std::mutex> lock(slave_->mutex);
            delay_ms = slave_->request_delay_ms;
        }
        if (delay_ms > 0) {
            std::this_thread::sleep_for(std::chrono::milliseconds(delay_ms));
        }
    }

    /* Called with the slave mutex held */
    transport_result_t begin(int function_code, uint16_t address, int count, fake_request_t *request)
    {
        request->function_code = function_code;
        request->address = address;
        request->count = count;

        if (slave_->throw_on_request) {
            throw std::runtime_error("transport exploded");
        }
        if (!connected_) {
            return transport_result(TRANSPORT_STATUS_NOT_CONNECTED, "not connected");
        }
        if (slave_->exception_addresses.count(address) != 0) {
            return transport_result(TRANSPORT_STATUS_EXCEPTION_RESPONSE, "Illegal data address");
        }
        return transport_result(TRANSPORT_STATUS_OK);
    }

    transport_result_t read_bits(int function_code, std::map<uint16_t, uint8_t> &table, uint16_t address, int count,
                                 std::vector<uint8_t> *bits)
    {
        pause();
        std::lock_guard<std::mutex> lock(slave_->mutex);
        fake_request_t request;
        transport_result_t result = begin(function_code, address, count, &request);
        slave_->requests.push_back(request);
        if (!result.ok()) {
            return result;
        }
        int available = slave_->short_read_addresses.count(address) != 0 ? count / 2 : count;
        bits->clear();
        for (int i = 0; i < available; i++) {
            bits->push_back(table[static_cast<uint16_t>(address + i)]);
        }
        return result;
    }

    transport_result_t read_registers(int function_code, std::map<uint16_t, uint16_t> &table, uint16_t address,
                                      int count, std::vector<uint16_t> *registers)
    {
        pause();
        std::lock_guard<std::mutex> lock(slave_->mutex);
        fake_request_t request;
        transport_result_t result = begin(function_code, address, count, &request);
        slave_->requests.push_back(request);
        if (!result.ok()) {
            return result;
        }
        int available = slave_->short_read_addresses.count(address) != 0 ? count / 2 : count;
        registers->clear();
        for (int i = 0; i < available; i++) {
            registers->push_back(table[static_cast<uint16_t>(address + i)]);
        }
        return result;
    }

    transport_result_t write_bits(int function_code, uint16_t address, const std::vector<uint8_t> &bits)
    {
        pause();
        std::lock_guard<std::mutex> lock(slave_->mutex);
        fake_request_t request;
        transport_result_t result = begin(function_code, address, static_cast<int>(bits.size()), &request);
        request.bits = bits;
        slave_->requests.push_back(request);
        if (!result.ok()) {
            return result;
        }
        for (size_t i = 0; i < bits.size(); i++) {
            slave_->coils[static_cast<uint16_t>(address + i)] = bits[i];
        }
        return result;
    }

    transport_result_t write_registers(int function_code, uint16_t address, const std::vector<uint16_t> &registers)
    {
        pause();
        std::lock_guard<std::mutex> lock(slave_->mutex);
        fake_request_t request;
        transport_result_t result = begin(function_code, address, static_cast<int>(registers.size()), &request);
        request.registers = registers;
        slave_->requests.push_back(request);
        if (!result.ok()) {
            return result;
        }
        for (size_t i = 0; i < registers.size(); i++) {
            slave_->holding_registers[static_cast<uint16_t>(address + i)] = registers[i];
        }
        return result;
    }

    std::shared_ptr<FakeSlave> slave_;
    bool connected_;
    std::string last_error_;
};

inline transport_factory_t make_fake_factory(const std::shared_ptr<FakeSlave> &slave)
{
    return [slave]() -> std::unique_ptr<ModbusTransport> {
        {
            std::lock_guard<std::mutex> lock(slave->mutex);
            slave->transports_created++;
        }
        return std::unique_ptr<ModbusTransport>(new FakeTransport(slave));
    };
}

} // namespace fakes
} // namespace modbus_master

#endif /* MODBUS_MASTER_TESTS_FAKE_TRANSPORT_H */
