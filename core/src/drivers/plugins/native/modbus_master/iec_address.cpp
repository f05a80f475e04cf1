/**
 * @file iec_address.cpp
 * @brief IEC symbolic address parser and buffer resolver
 */

#include "iec_address.h"

#include <cctype>
#include <climits>
#include <cstdio>

namespace modbus_master {

/* Byte offsets above this are refused rather than risking overflow */
static const long IEC_MAX_BYTE_OFFSET = INT_MAX / 8;

static void set_error(std::string *error, const std::string &message)
{
    if (error != NULL) {
        *error = message;
    }
}

static std::string trim(const std::string &text)
{
    size_t first = 0;
    size_t last = text.size();
    while (first < last && isspace(static_cast<unsigned char>(text[first]))) {
        first++;
    }
    while (last > first && isspace(static_cast<unsigned char>(text[last - 1]))) {
        last--;
    }
    return text.substr(first, last - first);
}

static bool parse_area(char c, iec_area_t *area)
{
    switch (toupper(static_cast<unsigned char>(c))) {
        case 'I':
            *area = IEC_AREA_INPUT;
            return true;
        case 'Q':
            *area = IEC_AREA_OUTPUT;
            return true;
        case 'M':
            *area = IEC_AREA_MEMORY;
            return true;
        default:
            return false;
    }
}

static bool parse_size(char c, iec_size_t *size)
{
    switch (toupper(static_cast<unsigned char>(c))) {
        case 'X':
            *size = IEC_SIZE_BIT;
            return true;
        case 'B':
            *size = IEC_SIZE_BYTE;
            return true;
        case 'W':
            *size = IEC_SIZE_WORD;
            return true;
        case 'D':
            *size = IEC_SIZE_DWORD;
            return true;
        case 'L':
            *size = IEC_SIZE_LWORD;
            return true;
        default:
            return false;
    }
}

/* Consume a run of decimal digits starting at pos; false if none or too large */
static bool parse_number(const std::string &text, size_t *pos, long limit, long *value)
{
    size_t start = *pos;
    long result = 0;

    while (*pos < text.size() && isdigit(static_cast<unsigned char>(text[*pos]))) {
        result = result * 10 + (text[*pos] - '0');
        if (result > limit) {
            return false;
        }
        (*pos)++;
    }

    if (*pos == start) {
        return false;
    }

    *value = result;
    return true;
}

iec_status_t iec_address_parse(const std::string &text, iec_address_t *address, std::string *error)
{
    const std::string input = trim(text);

    if (input.size() < 4 || input[0] != '%') {
        set_error(error, "invalid IEC address '" + text + "': expected %<area><size><offset>");
        return IEC_STATUS_INVALID_ADDRESS;
    }

    iec_address_t parsed;
    parsed.has_bit = false;
    parsed.bit_offset = 0;

    if (!parse_area(input[1], &parsed.area)) {
        set_error(error, "invalid IEC address '" + text + "': unknown area '" + input.substr(1, 1) +
                             "' (expected I, Q or M)");
        return IEC_STATUS_INVALID_ADDRESS;
    }

    if (!parse_size(input[2], &parsed.size)) {
        set_error(error, "invalid IEC address '" + text + "': unknown size '" + input.substr(2, 1) +
                             "' (expected X, B, W, D or L)");
        return IEC_STATUS_INVALID_ADDRESS;
    }

    size_t pos = 3;
    long byte_offset = 0;
    if (!parse_number(input, &pos, IEC_MAX_BYTE_OFFSET, &byte_offset)) {
        set_error(error, "invalid IEC address '" + text + "': missing or out of range offset");
        return IEC_STATUS_INVALID_ADDRESS;
    }
    parsed.byte_offset = static_cast<int>(byte_offset);

    if (pos < input.size() && input[pos] == '.') {
        if (parsed.size != IEC_SIZE_BIT) {
            set_error(error, "invalid IEC address '" + text + "': bit index only allowed for X size");
            return IEC_STATUS_INVALID_ADDRESS;
        }
        pos++;
        long bit = 0;
        if (!parse_number(input, &pos, 99, &bit) || bit > 7) {
            set_error(error, "invalid IEC address '" + text + "': bit index must be 0-7");
            return IEC_STATUS_INVALID_ADDRESS;
        }
        parsed.has_bit = true;
        parsed.bit_offset = static_cast<int>(bit);
    }

    if (pos != input.size()) {
        set_error(error, "invalid IEC address '" + text + "': unexpected trailing characters");
        return IEC_STATUS_INVALID_ADDRESS;
    }

    if (parsed.size == IEC_SIZE_BIT && !parsed.has_bit) {
        set_error(error, "invalid IEC address '" + text + "': bit-sized address requires .<bit>");
        return IEC_STATUS_INVALID_ADDRESS;
    }

    *address = parsed;
    return IEC_STATUS_OK;
}

iec_status_t iec_address_resolve(const iec_address_t &address, transfer_direction_t direction,
                                 buffer_access_descriptor_t *descriptor, std::string *error)
{
    (void)direction;

    buffer_access_descriptor_t result;
    result.kind = BUFFER_KIND_BOOL_INPUT;
    result.index = 0;
    result.has_bit = false;
    result.bit = 0;
    result.is_boolean = false;
    result.element_size_bytes = iec_size_bytes(address.size);

    if (address.size == IEC_SIZE_BIT) {
        switch (address.area) {
            case IEC_AREA_INPUT:
                result.kind = BUFFER_KIND_BOOL_INPUT;
                break;
            case IEC_AREA_OUTPUT:
                result.kind = BUFFER_KIND_BOOL_OUTPUT;
                break;
            case IEC_AREA_MEMORY:
                set_error(error, "unsupported IEC address " + iec_address_to_string(address) +
                                     ": memory area has no bit buffer");
                return IEC_STATUS_UNSUPPORTED;
        }
        result.index = address.byte_offset;
        result.has_bit = true;
        result.bit = address.bit_offset;
        result.is_boolean = true;
        *descriptor = result;
        return IEC_STATUS_OK;
    }

    /* Rows: byte, int, dint, lint. Columns: input, output, memory. */
    static const buffer_kind_t kinds[4][3] = {
        {BUFFER_KIND_BYTE_INPUT, BUFFER_KIND_BYTE_OUTPUT, BUFFER_KIND_BYTE_MEMORY},
        {BUFFER_KIND_INT_INPUT, BUFFER_KIND_INT_OUTPUT, BUFFER_KIND_INT_MEMORY},
        {BUFFER_KIND_DINT_INPUT, BUFFER_KIND_DINT_OUTPUT, BUFFER_KIND_DINT_MEMORY},
        {BUFFER_KIND_LINT_INPUT, BUFFER_KIND_LINT_OUTPUT, BUFFER_KIND_LINT_MEMORY},
    };

    int row = 0;
    switch (address.size) {
        case IEC_SIZE_BYTE:
            row = 0;
            break;
        case IEC_SIZE_WORD:
            row = 1;
            break;
        case IEC_SIZE_DWORD:
            row = 2;
            break;
        case IEC_SIZE_LWORD:
            row = 3;
            break;
        case IEC_SIZE_BIT:
            break;
    }

    int column = 0;
    switch (address.area) {
        case IEC_AREA_INPUT:
            column = 0;
            break;
        case IEC_AREA_OUTPUT:
            column = 1;
            break;
        case IEC_AREA_MEMORY:
            column = 2;
            break;
    }

    result.kind = kinds[row][column];
    result.index = address.byte_offset / result.element_size_bytes;
    *descriptor = result;
    return IEC_STATUS_OK;
}

std::string iec_address_to_string(const iec_address_t &address)
{
    char area = 'I';
    switch (address.area) {
        case IEC_AREA_INPUT:
            area = 'I';
            break;
        case IEC_AREA_OUTPUT:
            area = 'Q';
            break;
        case IEC_AREA_MEMORY:
            area = 'M';
            break;
    }

    char size = 'X';
    switch (address.size) {
        case IEC_SIZE_BIT:
            size = 'X';
            break;
        case IEC_SIZE_BYTE:
            size = 'B';
            break;
        case IEC_SIZE_WORD:
            size = 'W';
            break;
        case IEC_SIZE_DWORD:
            size = 'D';
            break;
        case IEC_SIZE_LWORD:
            size = 'L';
            break;
    }

    char buffer[32];
    if (address.has_bit) {
        snprintf(buffer, sizeof(buffer), "%%%c%c%d.%d", area, size, address.byte_offset, address.bit_offset);
    } else {
        snprintf(buffer, sizeof(buffer), "%%%c%c%d", area, size, address.byte_offset);
    }
    return buffer;
}

int iec_size_bytes(iec_size_t size)
{
    switch (size) {
        case IEC_SIZE_BIT:
        case IEC_SIZE_BYTE:
            return 1;
        case IEC_SIZE_WORD:
            return 2;
        case IEC_SIZE_DWORD:
            return 4;
        case IEC_SIZE_LWORD:
            return 8;
    }
    return 1;
}

const char *iec_status_name(iec_status_t status)
{
    switch (status) {
        case IEC_STATUS_OK:
            return "OK";
        case IEC_STATUS_INVALID_ADDRESS:
            return "INVALID_ADDRESS";
        case IEC_STATUS_UNSUPPORTED:
            return "UNSUPPORTED";
    }
    return "UNKNOWN";
}

const char *buffer_kind_name(buffer_kind_t kind)
{
    switch (kind) {
        case BUFFER_KIND_BOOL_INPUT:  return "bool_input";
        case BUFFER_KIND_BOOL_OUTPUT: return "bool_output";
        case BUFFER_KIND_BYTE_INPUT:  return "byte_input";
        case BUFFER_KIND_BYTE_OUTPUT: return "byte_output";
        case BUFFER_KIND_BYTE_MEMORY: return "byte_memory";
        case BUFFER_KIND_INT_INPUT:   return "int_input";
        case BUFFER_KIND_INT_OUTPUT:  return "int_output";
        case BUFFER_KIND_INT_MEMORY:  return "int_memory";
        case BUFFER_KIND_DINT_INPUT:  return "dint_input";
        case BUFFER_KIND_DINT_OUTPUT: return "dint_output";
        case BUFFER_KIND_DINT_MEMORY: return "dint_memory";
        case BUFFER_KIND_LINT_INPUT:  return "lint_input";
        case BUFFER_KIND_LINT_OUTPUT: return "lint_output";
        case BUFFER_KIND_LINT_MEMORY: return "lint_memory";
    }
    return "unknown";
}

int buffer_kind_size(buffer_kind_t kind)
{
    switch (kind) {
        case BUFFER_KIND_BOOL_INPUT:
        case BUFFER_KIND_BOOL_OUTPUT:
        case BUFFER_KIND_BYTE_INPUT:
        case BUFFER_KIND_BYTE_OUTPUT:
        case BUFFER_KIND_BYTE_MEMORY:
            return 1;
        case BUFFER_KIND_INT_INPUT:
        case BUFFER_KIND_INT_OUTPUT:
        case BUFFER_KIND_INT_MEMORY:
            return 2;
        case BUFFER_KIND_DINT_INPUT:
        case BUFFER_KIND_DINT_OUTPUT:
        case BUFFER_KIND_DINT_MEMORY:
            return 4;
        case BUFFER_KIND_LINT_INPUT:
        case BUFFER_KIND_LINT_OUTPUT:
        case BUFFER_KIND_LINT_MEMORY:
            return 8;
    }
    return 0;
}

} // namespace modbus_master
