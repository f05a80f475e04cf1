/**
 * @file plugin_logger.cpp
 * @brief Tagged plugin logger implementation
 */

#include "plugin_logger.h"

#include <cstdio>

namespace modbus_master {

/* Longest single message forwarded to the runtime log server */
static const size_t PLUGIN_LOG_MESSAGE_MAX = 1024;

PluginLogger::PluginLogger(const std::string &plugin_name)
    : plugin_name_(plugin_name),
      prefix_("[" + plugin_name + "]"),
      log_info_(NULL),
      log_debug_(NULL),
      log_warn_(NULL),
      log_error_(NULL)
{
}

bool PluginLogger::attach(const plugin_runtime_args_t *runtime_args)
{
    if (runtime_args == NULL) {
        log_info_ = NULL;
        log_debug_ = NULL;
        log_warn_ = NULL;
        log_error_ = NULL;
        return false;
    }

    log_info_ = runtime_args->log_info;
    log_debug_ = runtime_args->log_debug;
    log_warn_ = runtime_args->log_warn;
    log_error_ = runtime_args->log_error;

    return log_info_ != NULL || log_debug_ != NULL || log_warn_ != NULL || log_error_ != NULL;
}

PluginLogger PluginLogger::with_tag(const std::string &tag) const
{
    PluginLogger tagged(*this);
    tagged.prefix_ = prefix_ + " [" + tag + "]";
    return tagged;
}

void PluginLogger::info(const char *fmt, ...) const
{
    va_list args;
    va_start(args, fmt);
    emit(PLUGIN_LOG_INFO, fmt, args);
    va_end(args);
}

void PluginLogger::debug(const char *fmt, ...) const
{
    va_list args;
    va_start(args, fmt);
    emit(PLUGIN_LOG_DEBUG, fmt, args);
    va_end(args);
}

void PluginLogger::warn(const char *fmt, ...) const
{
    va_list args;
    va_start(args, fmt);
    emit(PLUGIN_LOG_WARN, fmt, args);
    va_end(args);
}

void PluginLogger::error(const char *fmt, ...) const
{
    va_list args;
    va_start(args, fmt);
    emit(PLUGIN_LOG_ERROR, fmt, args);
    va_end(args);
}

void PluginLogger::emit(plugin_log_level_t level, const char *fmt, va_list args) const
{
    char message[PLUGIN_LOG_MESSAGE_MAX];
    vsnprintf(message, sizeof(message), fmt, args);

    plugin_log_info_func_t sink = NULL;
    const char *level_name = "INFO";

    switch (level) {
        case PLUGIN_LOG_DEBUG:
            sink = log_debug_;
            level_name = "DEBUG";
            break;
        case PLUGIN_LOG_INFO:
            sink = log_info_;
            level_name = "INFO";
            break;
        case PLUGIN_LOG_WARN:
            sink = log_warn_;
            level_name = "WARN";
            break;
        case PLUGIN_LOG_ERROR:
            sink = log_error_;
            level_name = "ERROR";
            break;
    }

    if (sink != NULL) {
        sink("%s %s", prefix_.c_str(), message);
        return;
    }

    /* Runtime not attached yet: warnings and errors go to stderr */
    FILE *stream = (level >= PLUGIN_LOG_WARN) ? stderr : stdout;
    fprintf(stream, "[%s] %s %s\n", level_name, prefix_.c_str(), message);
    fflush(stream);
}

} // namespace modbus_master
