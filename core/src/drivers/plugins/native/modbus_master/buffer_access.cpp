/**
 * @file buffer_access.cpp
 * @brief Runtime buffer access implementation
 */

#include "buffer_access.h"

namespace modbus_master {

const char *buffer_status_name(buffer_status_t status)
{
    switch (status) {
        case BUFFER_STATUS_OK:
            return "OK";
        case BUFFER_STATUS_NO_RUNTIME:
            return "NO_RUNTIME";
        case BUFFER_STATUS_UNSUPPORTED:
            return "UNSUPPORTED";
        case BUFFER_STATUS_OUT_OF_RANGE:
            return "OUT_OF_RANGE";
        case BUFFER_STATUS_INVALID_BIT:
            return "INVALID_BIT";
        case BUFFER_STATUS_NULL_LOCATION:
            return "NULL_LOCATION";
        case BUFFER_STATUS_LOCK_FAILED:
            return "LOCK_FAILED";
    }
    return "UNKNOWN";
}

buffer_result_t<uint64_t> buffer_read_value(BufferAccess &buffers, buffer_kind_t kind, int index,
                                            bool already_locked)
{
    switch (kind) {
        case BUFFER_KIND_BYTE_INPUT:
        case BUFFER_KIND_BYTE_OUTPUT:
        case BUFFER_KIND_BYTE_MEMORY: {
            buffer_result_t<uint8_t> r = buffers.read_byte(kind, index, already_locked);
            return buffer_result<uint64_t>(r.value, r.status);
        }
        case BUFFER_KIND_INT_INPUT:
        case BUFFER_KIND_INT_OUTPUT:
        case BUFFER_KIND_INT_MEMORY: {
            buffer_result_t<uint16_t> r = buffers.read_word(kind, index, already_locked);
            return buffer_result<uint64_t>(r.value, r.status);
        }
        case BUFFER_KIND_DINT_INPUT:
        case BUFFER_KIND_DINT_OUTPUT:
        case BUFFER_KIND_DINT_MEMORY: {
            buffer_result_t<uint32_t> r = buffers.read_dword(kind, index, already_locked);
            return buffer_result<uint64_t>(r.value, r.status);
        }
        case BUFFER_KIND_LINT_INPUT:
        case BUFFER_KIND_LINT_OUTPUT:
        case BUFFER_KIND_LINT_MEMORY:
            return buffers.read_lword(kind, index, already_locked);
        case BUFFER_KIND_BOOL_INPUT:
        case BUFFER_KIND_BOOL_OUTPUT:
            break;
    }
    return buffer_result<uint64_t>(0, BUFFER_STATUS_UNSUPPORTED);
}

buffer_status_t buffer_write_value(BufferAccess &buffers, buffer_kind_t kind, int index, uint64_t value,
                                   bool already_locked)
{
    switch (kind) {
        case BUFFER_KIND_BYTE_INPUT:
        case BUFFER_KIND_BYTE_OUTPUT:
        case BUFFER_KIND_BYTE_MEMORY:
            return buffers.write_byte(kind, index, static_cast<uint8_t>(value), already_locked);
        case BUFFER_KIND_INT_INPUT:
        case BUFFER_KIND_INT_OUTPUT:
        case BUFFER_KIND_INT_MEMORY:
            return buffers.write_word(kind, index, static_cast<uint16_t>(value), already_locked);
        case BUFFER_KIND_DINT_INPUT:
        case BUFFER_KIND_DINT_OUTPUT:
        case BUFFER_KIND_DINT_MEMORY:
            return buffers.write_dword(kind, index, static_cast<uint32_t>(value), already_locked);
        case BUFFER_KIND_LINT_INPUT:
        case BUFFER_KIND_LINT_OUTPUT:
        case BUFFER_KIND_LINT_MEMORY:
            return buffers.write_lword(kind, index, value, already_locked);
        case BUFFER_KIND_BOOL_INPUT:
        case BUFFER_KIND_BOOL_OUTPUT:
            break;
    }
    return BUFFER_STATUS_UNSUPPORTED;
}

/*
 * =============================================================================
 * RuntimeBufferAccess
 * =============================================================================
 */

RuntimeBufferAccess::RuntimeBufferAccess(const plugin_runtime_args_t *args) : args_(args) {}

bool RuntimeBufferAccess::acquire()
{
    if (args_ == NULL || args_->mutex_take == NULL || args_->buffer_mutex == NULL) {
        return false;
    }
    return args_->mutex_take(args_->buffer_mutex) == 0;
}

void RuntimeBufferAccess::release()
{
    if (args_ == NULL || args_->mutex_give == NULL || args_->buffer_mutex == NULL) {
        return;
    }
    args_->mutex_give(args_->buffer_mutex);
}

RuntimeBufferAccess::bool_row_t *RuntimeBufferAccess::bool_buffer(buffer_kind_t kind) const
{
    switch (kind) {
        case BUFFER_KIND_BOOL_INPUT:
            return args_->bool_input;
        case BUFFER_KIND_BOOL_OUTPUT:
            return args_->bool_output;
        default:
            return NULL;
    }
}

IEC_BYTE **RuntimeBufferAccess::byte_buffer(buffer_kind_t kind) const
{
    switch (kind) {
        case BUFFER_KIND_BYTE_INPUT:
            return args_->byte_input;
        case BUFFER_KIND_BYTE_OUTPUT:
            return args_->byte_output;
        default:
            /* The runtime exposes no byte memory buffer */
            return NULL;
    }
}

IEC_UINT **RuntimeBufferAccess::int_buffer(buffer_kind_t kind) const
{
    switch (kind) {
        case BUFFER_KIND_INT_INPUT:
            return args_->int_input;
        case BUFFER_KIND_INT_OUTPUT:
            return args_->int_output;
        case BUFFER_KIND_INT_MEMORY:
            return args_->int_memory;
        default:
            return NULL;
    }
}

IEC_UDINT **RuntimeBufferAccess::dint_buffer(buffer_kind_t kind) const
{
    switch (kind) {
        case BUFFER_KIND_DINT_INPUT:
            return args_->dint_input;
        case BUFFER_KIND_DINT_OUTPUT:
            return args_->dint_output;
        case BUFFER_KIND_DINT_MEMORY:
            return args_->dint_memory;
        default:
            return NULL;
    }
}

IEC_ULINT **RuntimeBufferAccess::lint_buffer(buffer_kind_t kind) const
{
    switch (kind) {
        case BUFFER_KIND_LINT_INPUT:
            return args_->lint_input;
        case BUFFER_KIND_LINT_OUTPUT:
            return args_->lint_output;
        case BUFFER_KIND_LINT_MEMORY:
            return args_->lint_memory;
        default:
            return NULL;
    }
}

buffer_status_t RuntimeBufferAccess::check_index(int index) const
{
    if (args_ == NULL) {
        return BUFFER_STATUS_NO_RUNTIME;
    }
    if (index < 0 || index >= args_->buffer_size) {
        return BUFFER_STATUS_OUT_OF_RANGE;
    }
    return BUFFER_STATUS_OK;
}

template <typename T>
buffer_result_t<T> RuntimeBufferAccess::read_element(T **buffer, int index, bool already_locked)
{
    buffer_status_t status = check_index(index);
    if (status != BUFFER_STATUS_OK) {
        return buffer_result<T>(0, status);
    }
    if (buffer == NULL) {
        return buffer_result<T>(0, BUFFER_STATUS_UNSUPPORTED);
    }

    if (!already_locked && !acquire()) {
        return buffer_result<T>(0, BUFFER_STATUS_LOCK_FAILED);
    }

    buffer_result_t<T> result = buffer_result<T>(0, BUFFER_STATUS_NULL_LOCATION);
    T *ptr = buffer[index];
    if (ptr != NULL) {
        result = buffer_result<T>(*ptr, BUFFER_STATUS_OK);
    }

    if (!already_locked) {
        release();
    }
    return result;
}

template <typename T>
buffer_status_t RuntimeBufferAccess::write_element(T **buffer, int index, T value, bool already_locked)
{
    buffer_status_t status = check_index(index);
    if (status != BUFFER_STATUS_OK) {
        return status;
    }
    if (buffer == NULL) {
        return BUFFER_STATUS_UNSUPPORTED;
    }

    if (!already_locked && !acquire()) {
        return BUFFER_STATUS_LOCK_FAILED;
    }

    status = BUFFER_STATUS_NULL_LOCATION;
    T *ptr = buffer[index];
    if (ptr != NULL) {
        *ptr = value;
        status = BUFFER_STATUS_OK;
    }

    if (!already_locked) {
        release();
    }
    return status;
}

buffer_result_t<bool> RuntimeBufferAccess::read_bit(buffer_kind_t kind, int index, int bit, bool already_locked)
{
    buffer_status_t status = check_index(index);
    if (status != BUFFER_STATUS_OK) {
        return buffer_result<bool>(false, status);
    }
    if (bit < 0 || bit > 7) {
        return buffer_result<bool>(false, BUFFER_STATUS_INVALID_BIT);
    }

    bool_row_t *buffer = bool_buffer(kind);
    if (buffer == NULL) {
        return buffer_result<bool>(false, BUFFER_STATUS_UNSUPPORTED);
    }

    if (!already_locked && !acquire()) {
        return buffer_result<bool>(false, BUFFER_STATUS_LOCK_FAILED);
    }

    buffer_result_t<bool> result = buffer_result<bool>(false, BUFFER_STATUS_NULL_LOCATION);
    IEC_BOOL *ptr = buffer[index][bit];
    if (ptr != NULL) {
        result = buffer_result<bool>(*ptr != 0, BUFFER_STATUS_OK);
    }

    if (!already_locked) {
        release();
    }
    return result;
}

buffer_status_t RuntimeBufferAccess::write_bit(buffer_kind_t kind, int index, int bit, bool value,
                                               bool already_locked)
{
    buffer_status_t status = check_index(index);
    if (status != BUFFER_STATUS_OK) {
        return status;
    }
    if (bit < 0 || bit > 7) {
        return BUFFER_STATUS_INVALID_BIT;
    }

    bool_row_t *buffer = bool_buffer(kind);
    if (buffer == NULL) {
        return BUFFER_STATUS_UNSUPPORTED;
    }

    if (!already_locked && !acquire()) {
        return BUFFER_STATUS_LOCK_FAILED;
    }

    status = BUFFER_STATUS_NULL_LOCATION;
    IEC_BOOL *ptr = buffer[index][bit];
    if (ptr != NULL) {
        *ptr = value ? 1 : 0;
        status = BUFFER_STATUS_OK;
    }

    if (!already_locked) {
        release();
    }
    return status;
}

buffer_result_t<uint8_t> RuntimeBufferAccess::read_byte(buffer_kind_t kind, int index, bool already_locked)
{
    if (args_ == NULL) {
        return buffer_result<uint8_t>(0, BUFFER_STATUS_NO_RUNTIME);
    }
    return read_element<IEC_BYTE>(byte_buffer(kind), index, already_locked);
}

buffer_status_t RuntimeBufferAccess::write_byte(buffer_kind_t kind, int index, uint8_t value, bool already_locked)
{
    if (args_ == NULL) {
        return BUFFER_STATUS_NO_RUNTIME;
    }
    return write_element<IEC_BYTE>(byte_buffer(kind), index, value, already_locked);
}

buffer_result_t<uint16_t> RuntimeBufferAccess::read_word(buffer_kind_t kind, int index, bool already_locked)
{
    if (args_ == NULL) {
        return buffer_result<uint16_t>(0, BUFFER_STATUS_NO_RUNTIME);
    }
    return read_element<IEC_UINT>(int_buffer(kind), index, already_locked);
}

buffer_status_t RuntimeBufferAccess::write_word(buffer_kind_t kind, int index, uint16_t value, bool already_locked)
{
    if (args_ == NULL) {
        return BUFFER_STATUS_NO_RUNTIME;
    }
    return write_element<IEC_UINT>(int_buffer(kind), index, value, already_locked);
}

buffer_result_t<uint32_t> RuntimeBufferAccess::read_dword(buffer_kind_t kind, int index, bool already_locked)
{
    if (args_ == NULL) {
        return buffer_result<uint32_t>(0, BUFFER_STATUS_NO_RUNTIME);
    }
    return read_element<IEC_UDINT>(dint_buffer(kind), index, already_locked);
}

buffer_status_t RuntimeBufferAccess::write_dword(buffer_kind_t kind, int index, uint32_t value, bool already_locked)
{
    if (args_ == NULL) {
        return BUFFER_STATUS_NO_RUNTIME;
    }
    return write_element<IEC_UDINT>(dint_buffer(kind), index, value, already_locked);
}

buffer_result_t<uint64_t> RuntimeBufferAccess::read_lword(buffer_kind_t kind, int index, bool already_locked)
{
    if (args_ == NULL) {
        return buffer_result<uint64_t>(0, BUFFER_STATUS_NO_RUNTIME);
    }
    return read_element<IEC_ULINT>(lint_buffer(kind), index, already_locked);
}

buffer_status_t RuntimeBufferAccess::write_lword(buffer_kind_t kind, int index, uint64_t value, bool already_locked)
{
    if (args_ == NULL) {
        return BUFFER_STATUS_NO_RUNTIME;
    }
    return write_element<IEC_ULINT>(lint_buffer(kind), index, value, already_locked);
}

} // namespace modbus_master
