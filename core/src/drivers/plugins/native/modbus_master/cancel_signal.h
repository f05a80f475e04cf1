/**
 * @file cancel_signal.h
 * @brief Per-worker stop flag with interruptible sleeps
 */

#ifndef MODBUS_MASTER_CANCEL_SIGNAL_H
#define MODBUS_MASTER_CANCEL_SIGNAL_H

#include <atomic>
#include <chrono>
#include <thread>

#include "modbus_master_types.h"

namespace modbus_master {

class CancelSignal
{
public:
    CancelSignal() : cancelled_(false) {}

    void set() { cancelled_.store(true); }
    void reset() { cancelled_.store(false); }
    bool is_set() const { return cancelled_.load(); }

    /**
     * @brief Sleep for duration_ms, waking every increment_ms to check the flag
     * @return false if cancelled before the full duration elapsed
     */
    bool sleep_for(int duration_ms, int increment_ms = MODBUS_MASTER_SLEEP_INCREMENT_MS) const
    {
        if (increment_ms <= 0) {
            increment_ms = MODBUS_MASTER_SLEEP_INCREMENT_MS;
        }

        int remaining = duration_ms;
        while (remaining > 0) {
            if (is_set()) {
                return false;
            }
            int chunk = remaining < increment_ms ? remaining : increment_ms;
            std::this_thread::sleep_for(std::chrono::milliseconds(chunk));
            remaining -= chunk;
        }
        return !is_set();
    }

private:
    CancelSignal(const CancelSignal &);
    CancelSignal &operator=(const CancelSignal &);

    std::atomic<bool> cancelled_;
};

} // namespace modbus_master

#endif /* MODBUS_MASTER_CANCEL_SIGNAL_H */
