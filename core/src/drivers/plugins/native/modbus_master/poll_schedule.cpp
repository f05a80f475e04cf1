/**
 * @file poll_schedule.cpp
 * @brief Multi-rate polling schedule of one device
 */

#include "poll_schedule.h"

namespace modbus_master {

static int gcd(int a, int b)
{
    while (b != 0) {
        int t = a % b;
        a = b;
        b = t;
    }
    return a;
}

int compute_base_tick_ms(const std::vector<io_point_t> &points)
{
    int base = 0;
    for (size_t i = 0; i < points.size(); i++) {
        if (points[i].cycle_time_ms > 0) {
            base = gcd(base, points[i].cycle_time_ms);
        }
    }
    return base > 0 ? base : MODBUS_MASTER_DEFAULT_BASE_TICK_MS;
}

int cycle_multiple(int cycle_time_ms, int base_tick_ms)
{
    if (base_tick_ms <= 0 || cycle_time_ms <= 0) {
        return 1;
    }
    /* Truncates when cycle_time_ms is not a multiple; the loader rejects that */
    int multiple = cycle_time_ms / base_tick_ms;
    return multiple < 1 ? 1 : multiple;
}

bool is_point_due(const io_point_t &point, int base_tick_ms, uint64_t tick)
{
    int multiple = cycle_multiple(point.cycle_time_ms, base_tick_ms);
    return tick % static_cast<uint64_t>(multiple) == 0;
}

} // namespace modbus_master
