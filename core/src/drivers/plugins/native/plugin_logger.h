/**
 * @file plugin_logger.h
 * @brief Tagged logger routed through the runtime's central log functions
 *
 * Messages go to the log function pointers found in plugin_runtime_args_t,
 * so they show up in the OpenPLC Editor's log viewer. Every message carries
 * the plugin name, and optionally a tag naming the device it concerns:
 *
 *     [MODBUS_MASTER] Configuration loaded: 2 device(s)
 *     [MODBUS_MASTER] [boiler] Connected to 10.0.0.7:502 (attempt 1)
 *
 * Until runtime args are attached (or when a pointer is NULL) messages are
 * printed to stdout/stderr instead.
 */

#ifndef PLUGIN_LOGGER_H
#define PLUGIN_LOGGER_H

#include <cstdarg>
#include <string>

#include "../../plugin_types.h"

#if defined(__GNUC__)
#define PLUGIN_LOGGER_PRINTF(fmt_idx, args_idx) __attribute__((format(printf, fmt_idx, args_idx)))
#else
#define PLUGIN_LOGGER_PRINTF(fmt_idx, args_idx)
#endif

namespace modbus_master {

typedef enum {
    PLUGIN_LOG_DEBUG,
    PLUGIN_LOG_INFO,
    PLUGIN_LOG_WARN,
    PLUGIN_LOG_ERROR
} plugin_log_level_t;

class PluginLogger
{
public:
    explicit PluginLogger(const std::string &plugin_name = "MODBUS_MASTER");

    /**
     * @brief Route subsequent messages through the runtime log functions
     *
     * @param runtime_args Pointer to plugin_runtime_args_t, may be NULL to
     *                     fall back to stdio
     * @return true if at least one runtime log function was attached
     */
    bool attach(const plugin_runtime_args_t *runtime_args);

    /**
     * @brief Create a logger sharing this one's sinks with an extra tag
     */
    PluginLogger with_tag(const std::string &tag) const;

    void info(const char *fmt, ...) const PLUGIN_LOGGER_PRINTF(2, 3);
    void debug(const char *fmt, ...) const PLUGIN_LOGGER_PRINTF(2, 3);
    void warn(const char *fmt, ...) const PLUGIN_LOGGER_PRINTF(2, 3);
    void error(const char *fmt, ...) const PLUGIN_LOGGER_PRINTF(2, 3);

    const std::string &prefix() const { return prefix_; }

private:
    void emit(plugin_log_level_t level, const char *fmt, va_list args) const;

    std::string plugin_name_;
    std::string prefix_;
    plugin_log_info_func_t log_info_;
    plugin_log_debug_func_t log_debug_;
    plugin_log_warn_func_t log_warn_;
    plugin_log_error_func_t log_error_;
};

} // namespace modbus_master

#endif /* PLUGIN_LOGGER_H */
