/**
 * @file register_codec.cpp
 * @brief Conversion between PLC values and 16-bit Modbus registers
 */

#include "register_codec.h"

namespace modbus_master {

int codec_registers_needed(iec_size_t size)
{
    switch (size) {
        case IEC_SIZE_BIT:
            return 0;
        case IEC_SIZE_BYTE:
        case IEC_SIZE_WORD:
            return 1;
        case IEC_SIZE_DWORD:
            return 2;
        case IEC_SIZE_LWORD:
            return 4;
    }
    return 0;
}

codec_status_t codec_decode(const uint16_t *registers, size_t count, iec_size_t size, bool big_endian,
                            uint64_t *value)
{
    int needed = codec_registers_needed(size);
    if (needed == 0) {
        return CODEC_STATUS_INVALID_SIZE;
    }
    if (registers == NULL || count < static_cast<size_t>(needed)) {
        return CODEC_STATUS_INSUFFICIENT_REGISTERS;
    }

    if (size == IEC_SIZE_BYTE) {
        *value = registers[0] & 0xFF;
        return CODEC_STATUS_OK;
    }

    uint64_t result = 0;
    for (int i = 0; i < needed; i++) {
        /* Walk from the most significant register to the least */
        int reg_idx = big_endian ? i : (needed - 1 - i);
        result = (result << 16) | registers[reg_idx];
    }

    *value = result;
    return CODEC_STATUS_OK;
}

codec_status_t codec_encode(uint64_t value, iec_size_t size, bool big_endian, std::vector<uint16_t> *registers)
{
    int needed = codec_registers_needed(size);
    if (needed == 0) {
        return CODEC_STATUS_INVALID_SIZE;
    }

    if (size == IEC_SIZE_BYTE) {
        registers->push_back(static_cast<uint16_t>(value & 0xFF));
        return CODEC_STATUS_OK;
    }

    for (int i = 0; i < needed; i++) {
        /* i-th register emitted; word_idx 0 is the least significant word */
        int word_idx = big_endian ? (needed - 1 - i) : i;
        registers->push_back(static_cast<uint16_t>((value >> (16 * word_idx)) & 0xFFFF));
    }

    return CODEC_STATUS_OK;
}

const char *codec_status_name(codec_status_t status)
{
    switch (status) {
        case CODEC_STATUS_OK:
            return "OK";
        case CODEC_STATUS_INSUFFICIENT_REGISTERS:
            return "INSUFFICIENT_REGISTERS";
        case CODEC_STATUS_INVALID_SIZE:
            return "INVALID_SIZE";
    }
    return "UNKNOWN";
}

} // namespace modbus_master
