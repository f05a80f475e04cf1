#include <gtest/gtest.h>

#include <vector>

#include "modbus_master/poll_schedule.h"

using namespace modbus_master;

namespace {

io_point_t point_with_cycle(int cycle_time_ms)
{
    io_point_t point;
    point.cycle_time_ms = cycle_time_ms;
    return point;
}

} // namespace

TEST(PollSchedule, BaseTickIsGcdOfCycleTimes)
{
    std::vector<io_point_t> points;
    points.push_back(point_with_cycle(200));
    points.push_back(point_with_cycle(400));
    points.push_back(point_with_cycle(1000));
    EXPECT_EQ(200, compute_base_tick_ms(points));
}

TEST(PollSchedule, DefaultsWhenNoCycleTime)
{
    std::vector<io_point_t> points;
    EXPECT_EQ(MODBUS_MASTER_DEFAULT_BASE_TICK_MS, compute_base_tick_ms(points));

    points.push_back(point_with_cycle(0));
    points.push_back(point_with_cycle(-5));
    EXPECT_EQ(1000, compute_base_tick_ms(points));
}

TEST(PollSchedule, IgnoresInvalidCycleTimesInGcd)
{
    std::vector<io_point_t> points;
    points.push_back(point_with_cycle(0));
    points.push_back(point_with_cycle(300));
    points.push_back(point_with_cycle(450));
    EXPECT_EQ(150, compute_base_tick_ms(points));
}

TEST(PollSchedule, PointDueEveryMultipleOfBaseTick)
{
    io_point_t point = point_with_cycle(400);
    for (uint64_t tick = 0; tick < 10; tick++) {
        EXPECT_EQ(tick % 2 == 0, is_point_due(point, 200, tick)) << "tick " << tick;
    }

    io_point_t slow = point_with_cycle(1000);
    EXPECT_TRUE(is_point_due(slow, 200, 0));
    EXPECT_FALSE(is_point_due(slow, 200, 4));
    EXPECT_TRUE(is_point_due(slow, 200, 5));
}

TEST(PollSchedule, CycleMultipleIsAtLeastOne)
{
    EXPECT_EQ(1, cycle_multiple(100, 200));
    EXPECT_EQ(1, cycle_multiple(0, 200));
    EXPECT_EQ(3, cycle_multiple(600, 200));
    /* Not a multiple: truncated, the loader rejects such configurations */
    EXPECT_EQ(2, cycle_multiple(500, 200));
}
