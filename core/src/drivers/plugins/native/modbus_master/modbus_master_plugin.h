/**
 * @file modbus_master_plugin.h
 * @brief Modbus TCP Master Plugin for OpenPLC Runtime v4
 *
 * Polls remote Modbus TCP slave devices and keeps the OpenPLC located
 * variables in sync with their coils and registers. Every configured device
 * is served by its own thread at its own polling rate; the plugin does not
 * follow the PLC scan cycle.
 */

#ifndef MODBUS_MASTER_PLUGIN_H
#define MODBUS_MASTER_PLUGIN_H

#ifdef __cplusplus
extern "C" {
#endif

/**
 * @brief Initialize the Modbus Master plugin
 *
 * Copies the runtime args, loads and validates the JSON configuration
 * named by plugin_specific_config_file_path and prepares one worker per
 * device.
 *
 * @param args Pointer to plugin_runtime_args_t containing runtime buffers,
 *             mutex functions, and logging function pointers
 * @return 0 on success, -1 on failure
 */
int init(void *args);

/**
 * @brief Start polling all configured devices
 */
void start_loop(void);

/**
 * @brief Stop all device workers
 *
 * Each worker is given 5 seconds to finish its current transaction.
 */
void stop_loop(void);

/**
 * @brief Stop polling and release all plugin resources
 */
void cleanup(void);

/**
 * @brief Called at the start of each PLC scan cycle (unused)
 */
void cycle_start(void);

/**
 * @brief Called at the end of each PLC scan cycle (unused)
 */
void cycle_end(void);

#ifdef __cplusplus
}
#endif

#endif /* MODBUS_MASTER_PLUGIN_H */
