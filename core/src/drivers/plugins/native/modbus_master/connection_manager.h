/**
 * @file connection_manager.h
 * @brief One TCP connection to one slave device, with infinite retry
 *
 * The manager only reports a usable connection when the transport says it
 * is connected AND the last transaction did not fail. A half-open socket
 * still looks connected to the transport, so a failed transaction marks the
 * connection unhealthy and the next ensure_connection() reconnects.
 */

#ifndef MODBUS_MASTER_CONNECTION_MANAGER_H
#define MODBUS_MASTER_CONNECTION_MANAGER_H

#include <atomic>
#include <memory>
#include <string>

#include "../plugin_logger.h"
#include "cancel_signal.h"
#include "modbus_master_types.h"
#include "modbus_transport.h"

namespace modbus_master {

typedef enum {
    CONNECTION_DISCONNECTED,
    CONNECTION_CONNECTING,
    CONNECTION_CONNECTED
} connection_state_t;

const char *connection_state_name(connection_state_t state);

/* Connection attempts are logged on the first try and every Nth after it */
#define MODBUS_MASTER_CONNECT_LOG_EVERY 10

class ConnectionManager
{
public:
    /**
     * @param endpoint "host:port", used in log messages only
     * @param factory Creates a fresh transport for every attempt
     * @param logger Device-tagged logger
     * @param retry_delay_ms Initial backoff delay
     * @param retry_max_delay_ms Backoff ceiling
     * @param sleep_increment_ms Granularity at which cancellation is observed
     */
    ConnectionManager(const std::string &endpoint, const transport_factory_t &factory, const PluginLogger &logger,
                      int retry_delay_ms = MODBUS_MASTER_DEFAULT_RETRY_DELAY_MS,
                      int retry_max_delay_ms = MODBUS_MASTER_DEFAULT_RETRY_MAX_MS,
                      int sleep_increment_ms = MODBUS_MASTER_SLEEP_INCREMENT_MS);
    ~ConnectionManager();

    /**
     * @brief Connect, retrying with exponential backoff until success
     * @return true once connected, false only if cancel was set
     */
    bool connect_with_retry(const CancelSignal &cancel);

    /**
     * @brief Return a usable connection, reconnecting if needed
     * @return false only if cancel was set while reconnecting
     */
    bool ensure_connection(const CancelSignal &cancel);

    /**
     * @brief Flag the connection as broken without closing it
     */
    void mark_unhealthy();

    /**
     * @brief Close the transport and forget it; never fails
     */
    void disconnect();

    bool is_healthy() const { return healthy_.load(); }
    connection_state_t state() const { return state_; }
    int current_retry_delay_ms() const { return current_delay_ms_; }

    /**
     * @brief Transport of the current connection, NULL when disconnected
     */
    ModbusTransport *transport() { return transport_.get(); }

private:
    ConnectionManager(const ConnectionManager &);
    ConnectionManager &operator=(const ConnectionManager &);

    void teardown();

    std::string endpoint_;
    transport_factory_t factory_;
    PluginLogger logger_;
    int base_delay_ms_;
    int max_delay_ms_;
    int sleep_increment_ms_;

    std::unique_ptr<ModbusTransport> transport_;
    std::atomic<bool> healthy_;
    connection_state_t state_;
    int current_delay_ms_;
};

} // namespace modbus_master

#endif /* MODBUS_MASTER_CONNECTION_MANAGER_H */
