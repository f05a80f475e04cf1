/**
 * @file connection_manager.cpp
 * @brief Connection lifecycle with exponential backoff
 */

#include "connection_manager.h"

#include <exception>

namespace modbus_master {

const char *connection_state_name(connection_state_t state)
{
    switch (state) {
        case CONNECTION_DISCONNECTED:
            return "DISCONNECTED";
        case CONNECTION_CONNECTING:
            return "CONNECTING";
        case CONNECTION_CONNECTED:
            return "CONNECTED";
    }
    return "UNKNOWN";
}

ConnectionManager::ConnectionManager(const std::string &endpoint, const transport_factory_t &factory,
                                     const PluginLogger &logger, int retry_delay_ms, int retry_max_delay_ms,
                                     int sleep_increment_ms)
    : endpoint_(endpoint),
      factory_(factory),
      logger_(logger),
      base_delay_ms_(retry_delay_ms > 0 ? retry_delay_ms : MODBUS_MASTER_DEFAULT_RETRY_DELAY_MS),
      max_delay_ms_(retry_max_delay_ms),
      sleep_increment_ms_(sleep_increment_ms > 0 ? sleep_increment_ms : MODBUS_MASTER_SLEEP_INCREMENT_MS),
      healthy_(false),
      state_(CONNECTION_DISCONNECTED),
      current_delay_ms_(0)
{
    if (max_delay_ms_ < base_delay_ms_) {
        max_delay_ms_ = base_delay_ms_;
    }
    current_delay_ms_ = base_delay_ms_;
}

ConnectionManager::~ConnectionManager()
{
    teardown();
}

bool ConnectionManager::connect_with_retry(const CancelSignal &cancel)
{
    int attempt = 0;

    while (!cancel.is_set()) {
        teardown();
        state_ = CONNECTION_CONNECTING;
        attempt++;

        bool connected = false;
        std::string reason;
        try {
            if (factory_) {
                transport_ = factory_();
            }
            if (transport_ == NULL) {
                reason = "no transport available";
            } else {
                connected = transport_->connect();
                if (!connected) {
                    reason = transport_->last_error();
                }
            }
        } catch (const std::exception &e) {
            connected = false;
            reason = e.what();
        }

        if (connected) {
            healthy_.store(true);
            state_ = CONNECTION_CONNECTED;
            current_delay_ms_ = base_delay_ms_;
            logger_.info("Connected to %s (attempt %d)", endpoint_.c_str(), attempt);
            return true;
        }

        teardown();

        int delay = current_delay_ms_ < max_delay_ms_ ? current_delay_ms_ : max_delay_ms_;
        if (attempt == 1 || attempt % MODBUS_MASTER_CONNECT_LOG_EVERY == 0) {
            logger_.warn("Connection to %s failed (attempt %d): %s; retrying in %d ms", endpoint_.c_str(), attempt,
                         reason.empty() ? "unknown error" : reason.c_str(), delay);
        }

        if (!cancel.sleep_for(delay, sleep_increment_ms_)) {
            break;
        }

        long next = static_cast<long>(current_delay_ms_) * 3 / 2;
        current_delay_ms_ = next < max_delay_ms_ ? static_cast<int>(next) : max_delay_ms_;
    }

    logger_.debug("Connection to %s cancelled after %d attempt(s)", endpoint_.c_str(), attempt);
    return false;
}

bool ConnectionManager::ensure_connection(const CancelSignal &cancel)
{
    if (transport_ != NULL && healthy_.load()) {
        bool connected = false;
        try {
            connected = transport_->is_connected();
        } catch (const std::exception &e) {
            logger_.warn("Connection state check failed: %s", e.what());
        }
        if (connected) {
            return true;
        }
    }

    if (transport_ != NULL) {
        logger_.info("Reconnecting to %s (%s, %s)", endpoint_.c_str(), connection_state_name(state_),
                     healthy_.load() ? "transport closed" : "unhealthy");
    }
    teardown();
    return connect_with_retry(cancel);
}

void ConnectionManager::mark_unhealthy()
{
    healthy_.store(false);
}

void ConnectionManager::disconnect()
{
    bool had_transport = transport_ != NULL;
    teardown();
    if (had_transport) {
        logger_.debug("Disconnected from %s", endpoint_.c_str());
    }
}

void ConnectionManager::teardown()
{
    if (transport_ != NULL) {
        try {
            transport_->close();
        } catch (const std::exception &e) {
            logger_.debug("Ignoring error while closing %s: %s", endpoint_.c_str(), e.what());
        }
        transport_.reset();
    }
    healthy_.store(false);
    state_ = CONNECTION_DISCONNECTED;
}

} // namespace modbus_master
