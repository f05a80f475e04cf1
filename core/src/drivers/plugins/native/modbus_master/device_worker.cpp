/**
 * @file device_worker.cpp
 * @brief Polling thread of one Modbus slave device
 */

#include "device_worker.h"

#include <errno.h>
#include <string.h>
#include <time.h>

#include <chrono>
#include <exception>

#include "iec_address.h"
#include "modbus_master_config.h"
#include "poll_schedule.h"
#include "register_codec.h"

namespace modbus_master {

static std::string make_endpoint(const device_config_t &device)
{
    return device.host + ":" + std::to_string(device.port);
}

DeviceWorker::DeviceWorker(const device_config_t &device, BufferAccess &buffers, const transport_factory_t &factory,
                           const PluginLogger &logger, int sleep_increment_ms)
    : device_(device),
      buffers_(buffers),
      logger_(logger),
      sleep_increment_ms_(sleep_increment_ms > 0 ? sleep_increment_ms : MODBUS_MASTER_SLEEP_INCREMENT_MS),
      big_endian_(device.word_order == WORD_ORDER_BIG),
      base_tick_ms_(compute_base_tick_ms(device.io_points)),
      connection_(make_endpoint(device), factory, logger, device.retry_delay_ms, device.retry_max_delay_ms,
                  sleep_increment_ms_),
      thread_(),
      thread_started_(false),
      running_(false),
      ticks_completed_(0)
{
    prepare_points();
}

DeviceWorker::~DeviceWorker()
{
    request_stop();
    if (thread_started_) {
        pthread_join(thread_, NULL);
        thread_started_ = false;
    }
}

void DeviceWorker::prepare_points()
{
    for (size_t i = 0; i < device_.io_points.size(); i++) {
        const io_point_t &point = device_.io_points[i];

        prepared_point_t prepared;
        prepared.point = point;
        prepared.registers_per_element = codec_registers_needed(point.location.size);

        transfer_direction_t direction = modbus_is_write_function(point.function_code) ? TRANSFER_WRITE
                                                                                       : TRANSFER_READ;
        std::string error;
        if (iec_address_resolve(point.location, direction, &prepared.target, &error) != IEC_STATUS_OK) {
            logger_.error("Skipping point %s: %s", point.location_text.c_str(), error.c_str());
            continue;
        }

        if (!modbus_is_read_function(point.function_code) && !modbus_is_write_function(point.function_code)) {
            logger_.error("Skipping point %s: unsupported function code %d", point.location_text.c_str(),
                          point.function_code);
            continue;
        }

        if (modbus_is_bit_function(point.function_code) != prepared.target.is_boolean) {
            logger_.error("Skipping point %s: FC%d does not match the location size", point.location_text.c_str(),
                          point.function_code);
            continue;
        }

        int limit = io_point_transfer_limit(point.function_code);
        if (limit > 0 && io_point_transfer_count(point) > limit) {
            logger_.error("Skipping point %s: more than %d items for FC%d", point.location_text.c_str(), limit,
                          point.function_code);
            continue;
        }

        points_.push_back(prepared);
    }
}

/*
 * =============================================================================
 * Thread Lifecycle
 * =============================================================================
 */

bool DeviceWorker::start()
{
    if (thread_started_) {
        logger_.warn("Worker already started");
        return false;
    }

    cancel_.reset();
    running_.store(true);

    int rc = pthread_create(&thread_, NULL, &DeviceWorker::thread_main, this);
    if (rc != 0) {
        running_.store(false);
        logger_.error("Failed to create worker thread: %s", strerror(rc));
        return false;
    }

    thread_started_ = true;
    return true;
}

void DeviceWorker::request_stop()
{
    cancel_.set();
}

bool DeviceWorker::join(int timeout_ms)
{
    if (!thread_started_) {
        return true;
    }

    struct timespec deadline;
    clock_gettime(CLOCK_REALTIME, &deadline);
    deadline.tv_sec += timeout_ms / 1000;
    deadline.tv_nsec += static_cast<long>(timeout_ms % 1000) * 1000000L;
    if (deadline.tv_nsec >= 1000000000L) {
        deadline.tv_sec += 1;
        deadline.tv_nsec -= 1000000000L;
    }

    int rc = pthread_timedjoin_np(thread_, NULL, &deadline);
    if (rc == 0) {
        thread_started_ = false;
        return true;
    }
    if (rc != ETIMEDOUT) {
        logger_.error("Failed to join worker thread: %s", strerror(rc));
    }
    return false;
}

void *DeviceWorker::thread_main(void *arg)
{
    DeviceWorker *worker = static_cast<DeviceWorker *>(arg);
    try {
        worker->run();
    } catch (const std::exception &e) {
        worker->logger_.error("Worker terminated by exception: %s", e.what());
    }
    worker->running_.store(false);
    return NULL;
}

void DeviceWorker::run()
{
    if (points_.empty()) {
        logger_.info("No I/O points configured, nothing to poll");
        return;
    }

    logger_.info("Polling %s with %zu point(s), base tick %d ms", make_endpoint(device_).c_str(), points_.size(),
                 base_tick_ms_);

    uint64_t tick = 0;
    while (!cancel_.is_set()) {
        std::chrono::steady_clock::time_point tick_start = std::chrono::steady_clock::now();

        if (!connection_.ensure_connection(cancel_)) {
            break;
        }

        try {
            run_tick(tick);
        } catch (const std::exception &e) {
            connection_.mark_unhealthy();
            logger_.error("Polling cycle %llu failed: %s", static_cast<unsigned long long>(tick), e.what());
        }

        long elapsed = static_cast<long>(std::chrono::duration_cast<std::chrono::milliseconds>(
                                             std::chrono::steady_clock::now() - tick_start)
                                             .count());
        long remaining = base_tick_ms_ - elapsed;
        if (remaining > 0 && !cancel_.sleep_for(static_cast<int>(remaining), sleep_increment_ms_)) {
            break;
        }

        tick++;
    }

    connection_.disconnect();
    logger_.info("Worker stopped");
}

/*
 * =============================================================================
 * Polling Cycle
 * =============================================================================
 */

void DeviceWorker::run_tick(uint64_t tick)
{
    ModbusTransport *transport = connection_.transport();
    if (transport == NULL) {
        connection_.mark_unhealthy();
        return;
    }

    read_phase(*transport, tick);
    write_phase(*transport, tick);
    ticks_completed_++;
}

void DeviceWorker::read_phase(ModbusTransport &transport, uint64_t tick)
{
    std::vector<staged_read_t> staged;

    for (size_t i = 0; i < points_.size(); i++) {
        if (cancel_.is_set()) {
            break;
        }
        const prepared_point_t &prepared = points_[i];
        if (!modbus_is_read_function(prepared.point.function_code) ||
            !is_point_due(prepared.point, base_tick_ms_, tick)) {
            continue;
        }

        staged_read_t data;
        data.point = &prepared;

        transport_result_t result;
        try {
            result = request_read(transport, prepared, &data);
        } catch (const std::exception &e) {
            result = transport_result(TRANSPORT_STATUS_IO_ERROR, e.what());
        }

        if (!result.ok()) {
            logger_.warn("Read %s failed (%s): %s", describe(prepared).c_str(), transport_status_name(result.status),
                         result.message.c_str());
            connection_.mark_unhealthy();
            continue;
        }

        staged.push_back(data);
    }

    if (staged.empty()) {
        return;
    }

    std::vector<std::string> failures;
    {
        BufferLock lock(buffers_);
        if (!lock.locked()) {
            logger_.error("Failed to acquire buffer mutex, dropping %zu read result(s)", staged.size());
            return;
        }
        for (size_t i = 0; i < staged.size(); i++) {
            apply_read(staged[i], &failures);
        }
    }

    for (size_t i = 0; i < failures.size(); i++) {
        logger_.warn("%s", failures[i].c_str());
    }
}

void DeviceWorker::write_phase(ModbusTransport &transport, uint64_t tick)
{
    std::vector<const prepared_point_t *> due;
    for (size_t i = 0; i < points_.size(); i++) {
        const prepared_point_t &prepared = points_[i];
        if (modbus_is_write_function(prepared.point.function_code) &&
            is_point_due(prepared.point, base_tick_ms_, tick)) {
            due.push_back(&prepared);
        }
    }

    if (due.empty()) {
        return;
    }

    std::vector<pending_write_t> pending;
    std::vector<std::string> failures;
    {
        BufferLock lock(buffers_);
        if (!lock.locked()) {
            logger_.error("Failed to acquire buffer mutex, skipping %zu write(s)", due.size());
            return;
        }
        for (size_t i = 0; i < due.size(); i++) {
            pending_write_t values;
            values.point = due[i];
            std::string failure;
            if (capture_write(*due[i], &values, &failure)) {
                pending.push_back(values);
            } else {
                failures.push_back(failure);
            }
        }
    }

    for (size_t i = 0; i < failures.size(); i++) {
        logger_.warn("%s", failures[i].c_str());
    }

    for (size_t i = 0; i < pending.size(); i++) {
        if (cancel_.is_set()) {
            logger_.debug("Stop requested, %zu write(s) not sent", pending.size() - i);
            break;
        }
        transport_result_t result;
        try {
            result = request_write(transport, pending[i]);
        } catch (const std::exception &e) {
            result = transport_result(TRANSPORT_STATUS_IO_ERROR, e.what());
        }

        if (!result.ok()) {
            logger_.warn("Write %s failed (%s): %s", describe(*pending[i].point).c_str(),
                         transport_status_name(result.status), result.message.c_str());
            connection_.mark_unhealthy();
        }
    }
}

transport_result_t DeviceWorker::request_read(ModbusTransport &transport, const prepared_point_t &prepared,
                                              staged_read_t *staged)
{
    const io_point_t &point = prepared.point;
    int count = static_cast<int>(io_point_transfer_count(point));

    switch (point.function_code) {
        case FC_READ_COILS:
            return transport.read_coils(point.address, count, &staged->bits);
        case FC_READ_DISCRETE_INPUTS:
            return transport.read_discrete_inputs(point.address, count, &staged->bits);
        case FC_READ_HOLDING_REGISTERS:
            return transport.read_holding_registers(point.address, count, &staged->registers);
        case FC_READ_INPUT_REGISTERS:
            return transport.read_input_registers(point.address, count, &staged->registers);
        default:
            break;
    }
    return transport_result(TRANSPORT_STATUS_INVALID_REQUEST, "not a read function code");
}

transport_result_t DeviceWorker::request_write(ModbusTransport &transport, const pending_write_t &pending)
{
    const io_point_t &point = pending.point->point;

    switch (point.function_code) {
        case FC_WRITE_SINGLE_COIL:
            if (pending.bits.empty()) {
                break;
            }
            return transport.write_single_coil(point.address, pending.bits[0] != 0);
        case FC_WRITE_SINGLE_REGISTER:
            if (pending.registers.empty()) {
                break;
            }
            return transport.write_single_register(point.address, pending.registers[0]);
        case FC_WRITE_MULTIPLE_COILS:
            return transport.write_multiple_coils(point.address, pending.bits);
        case FC_WRITE_MULTIPLE_REGISTERS:
            return transport.write_multiple_registers(point.address, pending.registers);
        default:
            return transport_result(TRANSPORT_STATUS_INVALID_REQUEST, "not a write function code");
    }
    return transport_result(TRANSPORT_STATUS_INVALID_REQUEST, "no value to write");
}

/*
 * =============================================================================
 * Buffer Transfer (called with the buffer mutex held)
 * =============================================================================
 */

void DeviceWorker::apply_read(const staged_read_t &staged, std::vector<std::string> *failures)
{
    const prepared_point_t &prepared = *staged.point;
    const buffer_access_descriptor_t &target = prepared.target;
    int length = prepared.point.length;

    if (target.is_boolean) {
        int available = static_cast<int>(staged.bits.size());
        for (int i = 0; i < length && i < available; i++) {
            int bit = target.bit + i;
            int index = target.index + bit / 8;
            buffer_status_t status = buffers_.write_bit(target.kind, index, bit % 8, staged.bits[i] != 0, true);
            if (status != BUFFER_STATUS_OK) {
                failures->push_back("Buffer write " + std::string(buffer_kind_name(target.kind)) + "[" +
                                    std::to_string(index) + "." + std::to_string(bit % 8) + "] for " +
                                    describe(prepared) + " failed: " + buffer_status_name(status));
            }
        }
        return;
    }

    size_t per_element = static_cast<size_t>(prepared.registers_per_element);
    for (int i = 0; i < length; i++) {
        size_t first = static_cast<size_t>(i) * per_element;
        if (first + per_element > staged.registers.size()) {
            break;
        }

        uint64_t value = 0;
        codec_status_t decoded = codec_decode(&staged.registers[first], per_element, prepared.point.location.size,
                                              big_endian_, &value);
        if (decoded != CODEC_STATUS_OK) {
            failures->push_back("Decode for " + describe(prepared) + " failed: " + codec_status_name(decoded));
            break;
        }

        int index = target.index + i;
        buffer_status_t status = buffer_write_value(buffers_, target.kind, index, value, true);
        if (status != BUFFER_STATUS_OK) {
            failures->push_back("Buffer write " + std::string(buffer_kind_name(target.kind)) + "[" +
                                std::to_string(index) + "] for " + describe(prepared) +
                                " failed: " + buffer_status_name(status));
        }
    }
}

bool DeviceWorker::capture_write(const prepared_point_t &prepared, pending_write_t *pending, std::string *failure)
{
    const buffer_access_descriptor_t &target = prepared.target;
    int length = prepared.point.length;

    if (target.is_boolean) {
        for (int i = 0; i < length; i++) {
            int bit = target.bit + i;
            int index = target.index + bit / 8;
            buffer_result_t<bool> value = buffers_.read_bit(target.kind, index, bit % 8, true);
            if (!value.ok()) {
                *failure = "Buffer read " + std::string(buffer_kind_name(target.kind)) + "[" +
                           std::to_string(index) + "." + std::to_string(bit % 8) + "] for " + describe(prepared) +
                           " failed: " + buffer_status_name(value.status);
                return false;
            }
            pending->bits.push_back(value.value ? 1 : 0);
        }
        return true;
    }

    for (int i = 0; i < length; i++) {
        int index = target.index + i;
        buffer_result_t<uint64_t> value = buffer_read_value(buffers_, target.kind, index, true);
        if (!value.ok()) {
            *failure = "Buffer read " + std::string(buffer_kind_name(target.kind)) + "[" + std::to_string(index) +
                       "] for " + describe(prepared) + " failed: " + buffer_status_name(value.status);
            return false;
        }

        codec_status_t encoded = codec_encode(value.value, prepared.point.location.size, big_endian_,
                                              &pending->registers);
        if (encoded != CODEC_STATUS_OK) {
            *failure = "Encode for " + describe(prepared) + " failed: " + codec_status_name(encoded);
            return false;
        }
    }
    return true;
}

std::string DeviceWorker::describe(const prepared_point_t &prepared) const
{
    const io_point_t &point = prepared.point;
    std::string text = "FC" + std::to_string(point.function_code) + " @" + std::to_string(point.address) + " -> " +
                       point.location_text;
    if (!point.name.empty()) {
        text = point.name + " (" + text + ")";
    }
    return text;
}

} // namespace modbus_master
