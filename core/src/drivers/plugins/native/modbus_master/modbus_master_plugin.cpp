/**
 * @file modbus_master_plugin.cpp
 * @brief Modbus TCP Master Plugin Implementation for OpenPLC Runtime v4
 *
 * Lifecycle:
 * - init: copy runtime args, load config, build the supervisor
 * - start_loop: spawn one polling thread per device
 * - stop_loop: signal and join the polling threads
 * - cleanup: stop and release everything
 *
 * Device workers take the runtime buffer mutex themselves, once per read
 * phase and once per write phase, and never while a request is in flight.
 */

#include <cstring>
#include <exception>
#include <memory>
#include <string>
#include <vector>

#include "../../../plugin_types.h"
#include "../plugin_logger.h"
#include "buffer_access.h"
#include "master_supervisor.h"
#include "modbus_master_config.h"
#include "modbus_master_plugin.h"
#include "modbus_transport.h"

using namespace modbus_master;

/*
 * =============================================================================
 * Plugin State
 * =============================================================================
 */
namespace {

struct plugin_state_t {
    plugin_runtime_args_t runtime_args;
    PluginLogger logger;
    modbus_master_config_t config;
    std::unique_ptr<RuntimeBufferAccess> buffers;
    std::unique_ptr<MasterSupervisor> supervisor;
    bool running;

    plugin_state_t() : runtime_args(), running(false) {}
};

std::unique_ptr<plugin_state_t> g_plugin;

transport_factory_t libmodbus_factory_for(const device_config_t &device)
{
    transport_params_t params;
    params.host = device.host;
    params.port = device.port;
    params.timeout_ms = device.timeout_ms;
    params.slave_id = device.slave_id;
    return make_libmodbus_transport_factory(params);
}

void log_device_summary(const PluginLogger &logger, const device_config_t &device)
{
    logger.info("Device '%s': %s:%d, slave %d, cycle %d ms, timeout %d ms, %zu point(s), %s word order",
                device.name.c_str(), device.host.c_str(), device.port, device.slave_id, device.cycle_time_ms,
                device.timeout_ms, device.io_points.size(),
                device.word_order == WORD_ORDER_BIG ? "big" : "little");
}

} // namespace

/*
 * =============================================================================
 * Plugin Lifecycle Functions
 * =============================================================================
 */

/**
 * @brief Initialize the Modbus Master plugin
 */
extern "C" int init(void *args)
{
    PluginLogger logger;
    logger.info("Initializing Modbus Master plugin...");

    if (!args) {
        logger.error("init args is NULL");
        return -1;
    }

    if (g_plugin) {
        logger.warn("Plugin already initialized, reinitializing");
        cleanup();
    }

    try {
        std::unique_ptr<plugin_state_t> plugin(new plugin_state_t());

        /* Copy runtime args (the pointer is freed after init returns) */
        memcpy(&plugin->runtime_args, args, sizeof(plugin_runtime_args_t));
        plugin->logger.attach(&plugin->runtime_args);

        const char *config_path = plugin->runtime_args.plugin_specific_config_file_path;
        if (config_path[0] == '\0') {
            plugin->logger.error("No configuration file specified");
            return -1;
        }

        plugin->logger.info("Loading config: %s", config_path);

        std::vector<std::string> errors;
        std::vector<std::string> warnings;
        config_status_t status = modbus_master_config_parse_file(config_path, &plugin->config, &errors, &warnings);

        for (size_t i = 0; i < warnings.size(); i++) {
            plugin->logger.warn("%s", warnings[i].c_str());
        }
        if (status != CONFIG_OK) {
            for (size_t i = 0; i < errors.size(); i++) {
                plugin->logger.error("%s", errors[i].c_str());
            }
            plugin->logger.error("Failed to load configuration (%s)", config_status_name(status));
            return -1;
        }

        plugin->logger.info("Configuration loaded: %zu device(s)", plugin->config.devices.size());
        for (size_t i = 0; i < plugin->config.devices.size(); i++) {
            log_device_summary(plugin->logger, plugin->config.devices[i]);
        }

        plugin->buffers.reset(new RuntimeBufferAccess(&plugin->runtime_args));
        plugin->supervisor.reset(new MasterSupervisor(*plugin->buffers, libmodbus_factory_for, plugin->logger));

        g_plugin = std::move(plugin);
        g_plugin->logger.info("Modbus Master plugin initialized successfully");
        return 0;
    } catch (const std::exception &e) {
        logger.error("Initialization failed: %s", e.what());
        return -1;
    }
}

/**
 * @brief Start polling all configured devices
 */
extern "C" void start_loop(void)
{
    if (!g_plugin) {
        PluginLogger().error("Cannot start - plugin not initialized");
        return;
    }

    if (g_plugin->running) {
        g_plugin->logger.warn("Already running");
        return;
    }

    if (g_plugin->config.devices.empty()) {
        g_plugin->logger.info("No devices configured, nothing to start");
        return;
    }

    try {
        int started = g_plugin->supervisor->start(g_plugin->config.devices);
        g_plugin->running = started > 0;
        if (started == 0) {
            g_plugin->logger.error("Failed to start any device worker");
        }
    } catch (const std::exception &e) {
        g_plugin->logger.error("Failed to start device workers: %s", e.what());
    }
}

/**
 * @brief Stop all device workers
 */
extern "C" void stop_loop(void)
{
    if (!g_plugin || !g_plugin->running) {
        if (g_plugin) {
            g_plugin->logger.debug("Already stopped");
        }
        return;
    }

    try {
        g_plugin->supervisor->stop(MODBUS_MASTER_STOP_TIMEOUT_MS);
    } catch (const std::exception &e) {
        g_plugin->logger.error("Error while stopping device workers: %s", e.what());
    }
    g_plugin->running = false;
    g_plugin->logger.info("Modbus Master stopped");
}

/**
 * @brief Stop polling and release all plugin resources
 */
extern "C" void cleanup(void)
{
    if (!g_plugin) {
        return;
    }

    g_plugin->logger.info("Cleaning up Modbus Master plugin...");

    if (g_plugin->running) {
        stop_loop();
    }

    PluginLogger logger = g_plugin->logger;
    try {
        /* Joins any worker that missed the stop deadline */
        g_plugin->supervisor.reset();
        g_plugin->buffers.reset();
    } catch (const std::exception &e) {
        logger.error("Error during cleanup: %s", e.what());
    }
    g_plugin.reset();

    logger.info("Modbus Master plugin cleanup complete");
}

/**
 * @brief No-op: devices are polled on their own schedule
 */
extern "C" void cycle_start(void)
{
}

/**
 * @brief No-op: devices are polled on their own schedule
 */
extern "C" void cycle_end(void)
{
}
