/**
 * @file poll_schedule.h
 * @brief Multi-rate polling schedule of one device
 *
 * A device loops at its base tick, the GCD of its points' cycle times.
 * A point whose cycle time is k base ticks is due on tick counters
 * 0, k, 2k, ...
 */

#ifndef MODBUS_MASTER_POLL_SCHEDULE_H
#define MODBUS_MASTER_POLL_SCHEDULE_H

#include <stdint.h>

#include <vector>

#include "modbus_master_types.h"

namespace modbus_master {

/**
 * @brief GCD of the positive cycle times of points
 * @return MODBUS_MASTER_DEFAULT_BASE_TICK_MS when no point has one
 */
int compute_base_tick_ms(const std::vector<io_point_t> &points);

/**
 * @brief Number of base ticks between two polls of a point (at least 1)
 */
int cycle_multiple(int cycle_time_ms, int base_tick_ms);

bool is_point_due(const io_point_t &point, int base_tick_ms, uint64_t tick);

} // namespace modbus_master

#endif /* MODBUS_MASTER_POLL_SCHEDULE_H */
