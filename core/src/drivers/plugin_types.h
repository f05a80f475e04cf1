/**
 * @file plugin_types.h
 * @brief Host runtime interface consumed by the Modbus Master plugin
 *
 * The OpenPLC runtime passes a pointer to plugin_runtime_args_t to the
 * plugin's init() entry point. The layout below must stay identical to the
 * runtime's definition: the plugin copies the structure by value during
 * init() and then uses:
 * - the located-variable buffers (arrays of pointers, NULL when a PLC
 *   variable is not bound to the location)
 * - mutex_take/mutex_give on buffer_mutex to serialise access with the
 *   PLC scan cycle
 * - the plugin config path and the buffer dimensions
 * - the central log functions
 */

#ifndef PLUGIN_TYPES_H
#define PLUGIN_TYPES_H

#include <pthread.h>
#include <stdint.h>

/*
 * IEC elementary types as laid out by the runtime (iec_types.h)
 */
typedef uint8_t IEC_BOOL;
typedef uint8_t IEC_BYTE;
typedef uint16_t IEC_UINT;
typedef uint32_t IEC_UDINT;
typedef uint64_t IEC_ULINT;

typedef void (*plugin_log_info_func_t)(const char *fmt, ...);
typedef void (*plugin_log_debug_func_t)(const char *fmt, ...);
typedef void (*plugin_log_warn_func_t)(const char *fmt, ...);
typedef void (*plugin_log_error_func_t)(const char *fmt, ...);

/* Journal writers are part of the runtime ABI; this plugin does not use them. */
typedef int (*plugin_journal_write_bool_func_t)(int type, int index, int bit, int value);
typedef int (*plugin_journal_write_byte_func_t)(int type, int index, int value);
typedef int (*plugin_journal_write_int_func_t)(int type, int index, int value);
typedef int (*plugin_journal_write_dint_func_t)(int type, int index, unsigned int value);
typedef int (*plugin_journal_write_lint_func_t)(int type, int index, unsigned long long value);

typedef struct
{
    /* Located variable buffers, indexed [buffer_size] (bool: [buffer_size][8]) */
    IEC_BOOL *(*bool_input)[8];
    IEC_BOOL *(*bool_output)[8];
    IEC_BYTE **byte_input;
    IEC_BYTE **byte_output;
    IEC_UINT **int_input;
    IEC_UINT **int_output;
    IEC_UDINT **dint_input;
    IEC_UDINT **dint_output;
    IEC_ULINT **lint_input;
    IEC_ULINT **lint_output;
    IEC_UINT **int_memory;
    IEC_UDINT **dint_memory;
    IEC_ULINT **lint_memory;
    IEC_BOOL *(*bool_memory)[8];

    /* Return 0 on success */
    int (*mutex_take)(pthread_mutex_t *mutex);
    int (*mutex_give)(pthread_mutex_t *mutex);
    pthread_mutex_t *buffer_mutex;

    char plugin_specific_config_file_path[256];

    int buffer_size;
    int bits_per_buffer;

    plugin_log_info_func_t log_info;
    plugin_log_debug_func_t log_debug;
    plugin_log_warn_func_t log_warn;
    plugin_log_error_func_t log_error;

    plugin_journal_write_bool_func_t journal_write_bool;
    plugin_journal_write_byte_func_t journal_write_byte;
    plugin_journal_write_int_func_t journal_write_int;
    plugin_journal_write_dint_func_t journal_write_dint;
    plugin_journal_write_lint_func_t journal_write_lint;
} plugin_runtime_args_t;

#endif /* PLUGIN_TYPES_H */
