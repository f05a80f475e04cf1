/**
 * @file buffer_access.h
 * @brief Mutex-protected access to the runtime's located-variable buffers
 *
 * BufferAccess is the contract the device workers use; RuntimeBufferAccess
 * implements it on top of plugin_runtime_args_t. Every accessor takes an
 * already_locked flag: batch operations acquire the buffer mutex once and
 * pass true, single accesses pass false and lock around themselves.
 */

#ifndef MODBUS_MASTER_BUFFER_ACCESS_H
#define MODBUS_MASTER_BUFFER_ACCESS_H

#include <stdint.h>

#include "../../../plugin_types.h"
#include "modbus_master_types.h"

namespace modbus_master {

typedef enum {
    BUFFER_STATUS_OK = 0,
    BUFFER_STATUS_NO_RUNTIME,       /* Runtime buffers not attached */
    BUFFER_STATUS_UNSUPPORTED,      /* Runtime has no buffer of this kind/width */
    BUFFER_STATUS_OUT_OF_RANGE,     /* Index outside [0, buffer_size) */
    BUFFER_STATUS_INVALID_BIT,      /* Bit outside 0-7 */
    BUFFER_STATUS_NULL_LOCATION,    /* No PLC variable bound to this location */
    BUFFER_STATUS_LOCK_FAILED       /* Could not take the buffer mutex */
} buffer_status_t;

/**
 * @brief Value read from a buffer together with the access status
 */
template <typename T>
struct buffer_result_t {
    T value;
    buffer_status_t status;

    bool ok() const { return status == BUFFER_STATUS_OK; }
};

template <typename T>
inline buffer_result_t<T> buffer_result(T value, buffer_status_t status)
{
    buffer_result_t<T> result;
    result.value = value;
    result.status = status;
    return result;
}

const char *buffer_status_name(buffer_status_t status);

class BufferAccess
{
public:
    virtual ~BufferAccess() {}

    /**
     * @brief Take the buffer mutex
     * @return false if the mutex could not be taken; the caller must then
     *         abandon the operation it meant to guard
     */
    virtual bool acquire() = 0;
    virtual void release() = 0;

    virtual buffer_result_t<bool> read_bit(buffer_kind_t kind, int index, int bit, bool already_locked) = 0;
    virtual buffer_status_t write_bit(buffer_kind_t kind, int index, int bit, bool value, bool already_locked) = 0;

    virtual buffer_result_t<uint8_t> read_byte(buffer_kind_t kind, int index, bool already_locked) = 0;
    virtual buffer_status_t write_byte(buffer_kind_t kind, int index, uint8_t value, bool already_locked) = 0;

    virtual buffer_result_t<uint16_t> read_word(buffer_kind_t kind, int index, bool already_locked) = 0;
    virtual buffer_status_t write_word(buffer_kind_t kind, int index, uint16_t value, bool already_locked) = 0;

    virtual buffer_result_t<uint32_t> read_dword(buffer_kind_t kind, int index, bool already_locked) = 0;
    virtual buffer_status_t write_dword(buffer_kind_t kind, int index, uint32_t value, bool already_locked) = 0;

    virtual buffer_result_t<uint64_t> read_lword(buffer_kind_t kind, int index, bool already_locked) = 0;
    virtual buffer_status_t write_lword(buffer_kind_t kind, int index, uint64_t value, bool already_locked) = 0;
};

/**
 * @brief Holds the buffer mutex for the lifetime of the object
 */
class BufferLock
{
public:
    explicit BufferLock(BufferAccess &buffers) : buffers_(buffers), locked_(buffers.acquire()) {}
    ~BufferLock()
    {
        if (locked_) {
            buffers_.release();
        }
    }

    bool locked() const { return locked_; }

private:
    BufferLock(const BufferLock &);
    BufferLock &operator=(const BufferLock &);

    BufferAccess &buffers_;
    bool locked_;
};

/**
 * @brief Read a non-boolean element, dispatching on the kind's width
 */
buffer_result_t<uint64_t> buffer_read_value(BufferAccess &buffers, buffer_kind_t kind, int index,
                                            bool already_locked);

/**
 * @brief Write a non-boolean element, truncating value to the kind's width
 */
buffer_status_t buffer_write_value(BufferAccess &buffers, buffer_kind_t kind, int index, uint64_t value,
                                   bool already_locked);

/**
 * @brief BufferAccess over the buffers handed to the plugin by the runtime
 */
class RuntimeBufferAccess : public BufferAccess
{
public:
    /**
     * @param args Runtime args; the caller keeps them alive (the plugin
     *             holds its own copy for its whole lifetime)
     */
    explicit RuntimeBufferAccess(const plugin_runtime_args_t *args);

    bool acquire();
    void release();

    buffer_result_t<bool> read_bit(buffer_kind_t kind, int index, int bit, bool already_locked);
    buffer_status_t write_bit(buffer_kind_t kind, int index, int bit, bool value, bool already_locked);

    buffer_result_t<uint8_t> read_byte(buffer_kind_t kind, int index, bool already_locked);
    buffer_status_t write_byte(buffer_kind_t kind, int index, uint8_t value, bool already_locked);

    buffer_result_t<uint16_t> read_word(buffer_kind_t kind, int index, bool already_locked);
    buffer_status_t write_word(buffer_kind_t kind, int index, uint16_t value, bool already_locked);

    buffer_result_t<uint32_t> read_dword(buffer_kind_t kind, int index, bool already_locked);
    buffer_status_t write_dword(buffer_kind_t kind, int index, uint32_t value, bool already_locked);

    buffer_result_t<uint64_t> read_lword(buffer_kind_t kind, int index, bool already_locked);
    buffer_status_t write_lword(buffer_kind_t kind, int index, uint64_t value, bool already_locked);

private:
    typedef IEC_BOOL *bool_row_t[8];

    bool_row_t *bool_buffer(buffer_kind_t kind) const;
    IEC_BYTE **byte_buffer(buffer_kind_t kind) const;
    IEC_UINT **int_buffer(buffer_kind_t kind) const;
    IEC_UDINT **dint_buffer(buffer_kind_t kind) const;
    IEC_ULINT **lint_buffer(buffer_kind_t kind) const;

    buffer_status_t check_index(int index) const;

    template <typename T>
    buffer_result_t<T> read_element(T **buffer, int index, bool already_locked);
    template <typename T>
    buffer_status_t write_element(T **buffer, int index, T value, bool already_locked);

    const plugin_runtime_args_t *args_;
};

} // namespace modbus_master

#endif /* MODBUS_MASTER_BUFFER_ACCESS_H */
