/**
 * @file modbus_master_types.h
 * @brief Shared data model of the Modbus Master plugin
 *
 * IEC symbolic addresses, the closed set of OpenPLC buffer kinds they map
 * to, Modbus function codes, and the immutable per-device polling tables
 * produced by the configuration loader.
 */

#ifndef MODBUS_MASTER_TYPES_H
#define MODBUS_MASTER_TYPES_H

#include <stdint.h>

#include <string>
#include <vector>

/* Default values */
#define MODBUS_MASTER_DEFAULT_SLAVE_ID          1
#define MODBUS_MASTER_DEFAULT_BASE_TICK_MS      1000
#define MODBUS_MASTER_DEFAULT_RETRY_DELAY_MS    2000
#define MODBUS_MASTER_DEFAULT_RETRY_MAX_MS      30000
#define MODBUS_MASTER_SLEEP_INCREMENT_MS        100
#define MODBUS_MASTER_STOP_TIMEOUT_MS           5000

/* Modbus application protocol transfer limits */
#define MODBUS_MASTER_MAX_READ_BITS             2000
#define MODBUS_MASTER_MAX_READ_REGISTERS        125
#define MODBUS_MASTER_MAX_WRITE_BITS            1968
#define MODBUS_MASTER_MAX_WRITE_REGISTERS       123

namespace modbus_master {

/**
 * @brief PLC memory area of a symbolic address (%I, %Q, %M)
 */
typedef enum {
    IEC_AREA_INPUT,
    IEC_AREA_OUTPUT,
    IEC_AREA_MEMORY
} iec_area_t;

/**
 * @brief Element width of a symbolic address, in bits (X, B, W, D, L)
 */
typedef enum {
    IEC_SIZE_BIT = 1,
    IEC_SIZE_BYTE = 8,
    IEC_SIZE_WORD = 16,
    IEC_SIZE_DWORD = 32,
    IEC_SIZE_LWORD = 64
} iec_size_t;

/**
 * @brief Parsed symbolic address such as %QW10 or %IX0.3
 *
 * bit_offset is meaningful only when has_bit is set, which happens exactly
 * when size is IEC_SIZE_BIT.
 */
typedef struct {
    iec_area_t area;
    iec_size_t size;
    int byte_offset;
    bool has_bit;
    int bit_offset;
} iec_address_t;

/**
 * @brief OpenPLC buffer kinds a symbolic address can resolve to
 */
typedef enum {
    BUFFER_KIND_BOOL_INPUT,
    BUFFER_KIND_BOOL_OUTPUT,
    BUFFER_KIND_BYTE_INPUT,
    BUFFER_KIND_BYTE_OUTPUT,
    BUFFER_KIND_BYTE_MEMORY,
    BUFFER_KIND_INT_INPUT,
    BUFFER_KIND_INT_OUTPUT,
    BUFFER_KIND_INT_MEMORY,
    BUFFER_KIND_DINT_INPUT,
    BUFFER_KIND_DINT_OUTPUT,
    BUFFER_KIND_DINT_MEMORY,
    BUFFER_KIND_LINT_INPUT,
    BUFFER_KIND_LINT_OUTPUT,
    BUFFER_KIND_LINT_MEMORY
} buffer_kind_t;

/**
 * @brief Concrete buffer target of one I/O point at one polling tick
 */
typedef struct {
    buffer_kind_t kind;
    int index;
    bool has_bit;
    int bit;
    int element_size_bytes;
    bool is_boolean;
} buffer_access_descriptor_t;

/**
 * @brief Direction of a transfer as seen from the PLC buffers
 */
typedef enum {
    TRANSFER_READ,      /* Modbus read: device -> PLC buffer */
    TRANSFER_WRITE      /* Modbus write: PLC buffer -> device */
} transfer_direction_t;

/* libmodbus already defines MODBUS_FC_* as macros */
typedef enum {
    FC_READ_COILS = 1,
    FC_READ_DISCRETE_INPUTS = 2,
    FC_READ_HOLDING_REGISTERS = 3,
    FC_READ_INPUT_REGISTERS = 4,
    FC_WRITE_SINGLE_COIL = 5,
    FC_WRITE_SINGLE_REGISTER = 6,
    FC_WRITE_MULTIPLE_COILS = 15,
    FC_WRITE_MULTIPLE_REGISTERS = 16
} modbus_function_t;

/**
 * @brief Order of the 16-bit registers composing a 32/64-bit value
 *
 * Little: the register at the highest index holds the most significant word.
 * Big: the first register holds the most significant word.
 */
typedef enum {
    WORD_ORDER_LITTLE,
    WORD_ORDER_BIG
} word_order_t;

/**
 * @brief One row of a device's polling table
 */
struct io_point_t {
    std::string name;
    int function_code;
    std::string offset_text;
    uint16_t address;
    std::string location_text;
    iec_address_t location;
    int length;
    int cycle_time_ms;

    io_point_t()
        : function_code(0), address(0), location(), length(1), cycle_time_ms(0)
    {
    }
};

/**
 * @brief One remote Modbus TCP slave and its polling table
 */
struct device_config_t {
    std::string name;
    std::string protocol;
    std::string type;
    std::string host;
    int port;
    int cycle_time_ms;
    int timeout_ms;
    int slave_id;
    word_order_t word_order;
    int retry_delay_ms;
    int retry_max_delay_ms;
    std::vector<io_point_t> io_points;

    device_config_t()
        : port(502),
          cycle_time_ms(MODBUS_MASTER_DEFAULT_BASE_TICK_MS),
          timeout_ms(1000),
          slave_id(MODBUS_MASTER_DEFAULT_SLAVE_ID),
          word_order(WORD_ORDER_LITTLE),
          retry_delay_ms(MODBUS_MASTER_DEFAULT_RETRY_DELAY_MS),
          retry_max_delay_ms(MODBUS_MASTER_DEFAULT_RETRY_MAX_MS)
    {
    }
};

inline bool modbus_is_read_function(int function_code)
{
    return function_code == FC_READ_COILS ||
           function_code == FC_READ_DISCRETE_INPUTS ||
           function_code == FC_READ_HOLDING_REGISTERS ||
           function_code == FC_READ_INPUT_REGISTERS;
}

inline bool modbus_is_write_function(int function_code)
{
    return function_code == FC_WRITE_SINGLE_COIL ||
           function_code == FC_WRITE_SINGLE_REGISTER ||
           function_code == FC_WRITE_MULTIPLE_COILS ||
           function_code == FC_WRITE_MULTIPLE_REGISTERS;
}

/* Coil / discrete input codes, transferring one bit per IEC element */
inline bool modbus_is_bit_function(int function_code)
{
    return function_code == FC_READ_COILS ||
           function_code == FC_READ_DISCRETE_INPUTS ||
           function_code == FC_WRITE_SINGLE_COIL ||
           function_code == FC_WRITE_MULTIPLE_COILS;
}

} // namespace modbus_master

#endif /* MODBUS_MASTER_TYPES_H */
