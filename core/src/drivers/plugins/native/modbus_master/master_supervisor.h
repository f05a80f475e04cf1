/**
 * @file master_supervisor.h
 * @brief Starts and stops one DeviceWorker per configured device
 */

#ifndef MODBUS_MASTER_SUPERVISOR_H
#define MODBUS_MASTER_SUPERVISOR_H

#include <functional>
#include <memory>
#include <vector>

#include "../plugin_logger.h"
#include "buffer_access.h"
#include "device_worker.h"
#include "modbus_master_types.h"
#include "modbus_transport.h"

namespace modbus_master {

/**
 * @brief Builds the transport factory of one device
 */
typedef std::function<transport_factory_t(const device_config_t &)> transport_factory_builder_t;

class MasterSupervisor
{
public:
    MasterSupervisor(BufferAccess &buffers, const transport_factory_builder_t &factory_builder,
                     const PluginLogger &logger, int sleep_increment_ms = MODBUS_MASTER_SLEEP_INCREMENT_MS);

    /* Stops every worker, waiting for each without a deadline */
    ~MasterSupervisor();

    /**
     * @brief Spawn one worker per device
     *
     * A device that fails to start is logged and skipped.
     *
     * @return Number of workers started; the start counts as successful
     *         when it is at least one
     */
    int start(const std::vector<device_config_t> &devices);

    /**
     * @brief Signal every worker, then join each for up to timeout_ms
     *
     * Workers missing the deadline are logged and kept until destruction.
     * Always succeeds.
     */
    bool stop(int timeout_ms = MODBUS_MASTER_STOP_TIMEOUT_MS);

    bool is_running() const { return running_; }
    size_t worker_count() const { return workers_.size(); }

private:
    MasterSupervisor(const MasterSupervisor &);
    MasterSupervisor &operator=(const MasterSupervisor &);

    BufferAccess &buffers_;
    transport_factory_builder_t factory_builder_;
    PluginLogger logger_;
    int sleep_increment_ms_;
    bool running_;

    std::vector<std::unique_ptr<DeviceWorker> > workers_;
    std::vector<std::unique_ptr<DeviceWorker> > stragglers_;
};

} // namespace modbus_master

#endif /* MODBUS_MASTER_SUPERVISOR_H */
