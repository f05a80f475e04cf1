/**
 * @file modbus_transport.cpp
 * @brief Transport status helpers
 */

#include "modbus_transport.h"

namespace modbus_master {

const char *transport_status_name(transport_status_t status)
{
    switch (status) {
        case TRANSPORT_STATUS_OK:
            return "OK";
        case TRANSPORT_STATUS_NOT_CONNECTED:
            return "NOT_CONNECTED";
        case TRANSPORT_STATUS_IO_ERROR:
            return "IO_ERROR";
        case TRANSPORT_STATUS_EXCEPTION_RESPONSE:
            return "EXCEPTION_RESPONSE";
        case TRANSPORT_STATUS_INVALID_REQUEST:
            return "INVALID_REQUEST";
    }
    return "UNKNOWN";
}

} // namespace modbus_master
