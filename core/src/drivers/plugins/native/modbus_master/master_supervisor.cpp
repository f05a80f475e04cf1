/**
 * @file master_supervisor.cpp
 * @brief Starts and stops one DeviceWorker per configured device
 */

#include "master_supervisor.h"

#include <exception>

namespace modbus_master {

MasterSupervisor::MasterSupervisor(BufferAccess &buffers, const transport_factory_builder_t &factory_builder,
                                   const PluginLogger &logger, int sleep_increment_ms)
    : buffers_(buffers),
      factory_builder_(factory_builder),
      logger_(logger),
      sleep_increment_ms_(sleep_increment_ms),
      running_(false)
{
}

MasterSupervisor::~MasterSupervisor()
{
    stop();
    /* Worker destructors block until their threads have exited */
    workers_.clear();
    stragglers_.clear();
}

int MasterSupervisor::start(const std::vector<device_config_t> &devices)
{
    if (running_) {
        logger_.warn("Already running with %zu worker(s)", workers_.size());
        return static_cast<int>(workers_.size());
    }

    int started = 0;
    for (size_t i = 0; i < devices.size(); i++) {
        const device_config_t &device = devices[i];
        PluginLogger device_logger = logger_.with_tag(device.name);

        try {
            transport_factory_t factory = factory_builder_(device);
            std::unique_ptr<DeviceWorker> worker(
                new DeviceWorker(device, buffers_, factory, device_logger, sleep_increment_ms_));
            if (!worker->start()) {
                logger_.error("Failed to start worker for device '%s'", device.name.c_str());
                continue;
            }
            workers_.push_back(std::move(worker));
            started++;
        } catch (const std::exception &e) {
            logger_.error("Failed to start worker for device '%s': %s", device.name.c_str(), e.what());
        }
    }

    running_ = started > 0;
    if (started > 0) {
        logger_.info("Started %d of %zu device worker(s)", started, devices.size());
    } else {
        logger_.error("No device worker could be started");
    }
    return started;
}

bool MasterSupervisor::stop(int timeout_ms)
{
    if (workers_.empty()) {
        running_ = false;
        return true;
    }

    logger_.info("Stopping %zu device worker(s)...", workers_.size());

    for (size_t i = 0; i < workers_.size(); i++) {
        workers_[i]->request_stop();
    }

    int stopped = 0;
    for (size_t i = 0; i < workers_.size(); i++) {
        if (workers_[i]->join(timeout_ms)) {
            stopped++;
        } else {
            logger_.warn("Worker for device '%s' did not stop within %d ms", workers_[i]->name().c_str(),
                         timeout_ms);
            stragglers_.push_back(std::move(workers_[i]));
        }
    }

    logger_.info("Stopped %d of %zu device worker(s)", stopped, workers_.size());
    workers_.clear();
    running_ = false;
    return true;
}

} // namespace modbus_master
