/**
 * @file register_codec.h
 * @brief Conversion between PLC values and 16-bit Modbus registers
 *
 * Byte and word values occupy one register (bytes use the low 8 bits),
 * double words two registers and long words four. The word order selects
 * which register carries the most significant 16 bits.
 */

#ifndef MODBUS_MASTER_REGISTER_CODEC_H
#define MODBUS_MASTER_REGISTER_CODEC_H

#include <stddef.h>
#include <stdint.h>

#include <vector>

#include "modbus_master_types.h"

namespace modbus_master {

typedef enum {
    CODEC_STATUS_OK = 0,
    CODEC_STATUS_INSUFFICIENT_REGISTERS,
    CODEC_STATUS_INVALID_SIZE
} codec_status_t;

/**
 * @brief Registers needed for one IEC element (0 for bits, 1, 1, 2, 4)
 */
int codec_registers_needed(iec_size_t size);

/**
 * @brief Combine registers into one value
 *
 * @param registers First register of the element
 * @param count Number of registers available from registers[0]
 * @param size Element size (bit-sized elements are rejected)
 * @param big_endian true when registers[0] holds the most significant word
 * @param value Receives the decoded value
 */
codec_status_t codec_decode(const uint16_t *registers, size_t count, iec_size_t size, bool big_endian,
                            uint64_t *value);

/**
 * @brief Split a value into registers, appending them to registers
 *
 * Exact inverse of codec_decode for the same size and word order; bits of
 * value beyond the element width are dropped.
 */
codec_status_t codec_encode(uint64_t value, iec_size_t size, bool big_endian, std::vector<uint16_t> *registers);

const char *codec_status_name(codec_status_t status);

} // namespace modbus_master

#endif /* MODBUS_MASTER_REGISTER_CODEC_H */
