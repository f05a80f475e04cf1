/**
 * @file iec_address.h
 * @brief IEC symbolic address parser and buffer resolver
 *
 * Grammar: %<Area><Size><Byte>[.<Bit>]
 *   Area: I (input), Q (output), M (memory)
 *   Size: X (bit), B (byte), W (word), D (double word), L (long word)
 *   Bit:  0-7, required for X and forbidden otherwise
 *
 * The byte field is taken as a byte offset; resolving divides it by the
 * element width to obtain the buffer index (%MD4 -> dint_memory[1]).
 */

#ifndef MODBUS_MASTER_IEC_ADDRESS_H
#define MODBUS_MASTER_IEC_ADDRESS_H

#include <string>

#include "modbus_master_types.h"

namespace modbus_master {

typedef enum {
    IEC_STATUS_OK = 0,
    IEC_STATUS_INVALID_ADDRESS,     /* Malformed symbolic address */
    IEC_STATUS_UNSUPPORTED          /* Well-formed, no buffer for this area/size */
} iec_status_t;

/**
 * @brief Parse a symbolic address string
 *
 * @param text Address such as "%QW10" or "%IX0.3" (surrounding blanks ignored)
 * @param address Receives the parsed address on success
 * @param error Optional, receives a description on failure
 * @return IEC_STATUS_OK or IEC_STATUS_INVALID_ADDRESS
 */
iec_status_t iec_address_parse(const std::string &text, iec_address_t *address, std::string *error);

/**
 * @brief Map a parsed address onto an OpenPLC buffer
 *
 * Total over every (area, size) pair: returns IEC_STATUS_OK with the
 * descriptor filled, or IEC_STATUS_UNSUPPORTED for bit-sized memory
 * addresses. The mapping does not depend on the direction; it is part of
 * the signature so callers state which side of the transfer they resolve.
 */
iec_status_t iec_address_resolve(const iec_address_t &address, transfer_direction_t direction,
                                 buffer_access_descriptor_t *descriptor, std::string *error);

/**
 * @brief Format an address back to its canonical text form
 */
std::string iec_address_to_string(const iec_address_t &address);

/**
 * @brief Element width in bytes (1 for bits and bytes, 2, 4 or 8)
 */
int iec_size_bytes(iec_size_t size);

const char *iec_status_name(iec_status_t status);

/**
 * @brief Human-readable name of a buffer kind, e.g. "dint_memory"
 */
const char *buffer_kind_name(buffer_kind_t kind);

/**
 * @brief Element size in bytes of a buffer kind (1, 2, 4 or 8)
 */
int buffer_kind_size(buffer_kind_t kind);

} // namespace modbus_master

#endif /* MODBUS_MASTER_IEC_ADDRESS_H */
