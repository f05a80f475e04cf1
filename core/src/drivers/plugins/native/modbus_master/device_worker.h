/**
 * @file device_worker.h
 * @brief Polling thread of one Modbus slave device
 *
 * Each tick runs a read phase (device -> PLC buffers) and then a write
 * phase (PLC buffers -> device) over the points due on that tick. The
 * buffer mutex is taken once per phase and never held across network I/O:
 * reads are received first and applied under one lock, writes snapshot
 * their source values under one lock and are sent afterwards.
 */

#ifndef MODBUS_MASTER_DEVICE_WORKER_H
#define MODBUS_MASTER_DEVICE_WORKER_H

#include <pthread.h>
#include <stdint.h>

#include <atomic>
#include <string>
#include <vector>

#include "../plugin_logger.h"
#include "buffer_access.h"
#include "cancel_signal.h"
#include "connection_manager.h"
#include "modbus_master_types.h"
#include "modbus_transport.h"

namespace modbus_master {

class DeviceWorker
{
public:
    DeviceWorker(const device_config_t &device, BufferAccess &buffers, const transport_factory_t &factory,
                 const PluginLogger &logger, int sleep_increment_ms = MODBUS_MASTER_SLEEP_INCREMENT_MS);

    /* Signals the thread and waits for it to finish */
    ~DeviceWorker();

    /**
     * @brief Spawn the polling thread
     * @return false if the thread could not be created or is already running
     */
    bool start();

    void request_stop();

    /**
     * @brief Wait up to timeout_ms for the thread to finish
     * @return true if the thread has finished (or was never started)
     */
    bool join(int timeout_ms);

    bool is_running() const { return running_.load(); }

    /**
     * @brief Thread body: connect, poll every base tick until stopped
     */
    void run();

    /**
     * @brief One read phase followed by one write phase
     *
     * Requires an established connection; failed transactions mark the
     * connection unhealthy and the remaining points are still processed.
     * Once a stop is requested no further request is issued.
     */
    void run_tick(uint64_t tick);

    const std::string &name() const { return device_.name; }
    int base_tick_ms() const { return base_tick_ms_; }
    size_t point_count() const { return points_.size(); }
    uint64_t ticks_completed() const { return ticks_completed_.load(); }

    ConnectionManager &connection() { return connection_; }
    const CancelSignal &cancel_signal() const { return cancel_; }

private:
    DeviceWorker(const DeviceWorker &);
    DeviceWorker &operator=(const DeviceWorker &);

    /* I/O point with its buffer target resolved at construction */
    struct prepared_point_t {
        io_point_t point;
        buffer_access_descriptor_t target;
        int registers_per_element;
    };

    /* Data received for one read point, waiting to be copied into the buffers */
    struct staged_read_t {
        const prepared_point_t *point;
        std::vector<uint8_t> bits;
        std::vector<uint16_t> registers;
    };

    /* Source values of one write point, captured under the buffer lock */
    struct pending_write_t {
        const prepared_point_t *point;
        std::vector<uint8_t> bits;
        std::vector<uint16_t> registers;
    };

    static void *thread_main(void *arg);

    void prepare_points();
    void read_phase(ModbusTransport &transport, uint64_t tick);
    void write_phase(ModbusTransport &transport, uint64_t tick);

    transport_result_t request_read(ModbusTransport &transport, const prepared_point_t &prepared,
                                    staged_read_t *staged);
    transport_result_t request_write(ModbusTransport &transport, const pending_write_t &pending);

    void apply_read(const staged_read_t &staged, std::vector<std::string> *failures);
    bool capture_write(const prepared_point_t &prepared, pending_write_t *pending, std::string *failure);

    std::string describe(const prepared_point_t &prepared) const;

    device_config_t device_;
    BufferAccess &buffers_;
    PluginLogger logger_;
    int sleep_increment_ms_;
    bool big_endian_;
    int base_tick_ms_;

    std::vector<prepared_point_t> points_;
    ConnectionManager connection_;
    CancelSignal cancel_;

    pthread_t thread_;
    bool thread_started_;
    std::atomic<bool> running_;
    std::atomic<uint64_t> ticks_completed_;
};

} // namespace modbus_master

#endif /* MODBUS_MASTER_DEVICE_WORKER_H */
