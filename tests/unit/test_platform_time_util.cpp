#include "src/PlatformTimeUtil.h"

#include "tests/unit/test_helpers.h"

using namespace DroidFrame;

TEST_SUITE_BEGIN("droidframe.time.util");

DF_TEST("droidframe.time.util", "monotonic event time") {
  using std::chrono::nanoseconds;
  DF_CHECK(monotonicEventTime(nanoseconds{200}, nanoseconds{100}) == nanoseconds{200});
  DF_CHECK(monotonicEventTime(nanoseconds{50}, nanoseconds{100}) == nanoseconds{100});
  DF_CHECK(monotonicEventTime(nanoseconds{0}, nanoseconds{100}) == nanoseconds{100});
  DF_CHECK(monotonicEventTime(nanoseconds{-5}, nanoseconds{0}) == nanoseconds{0});
  DF_CHECK(monotonicEventTime(nanoseconds{100}, nanoseconds{100}) == nanoseconds{100});
}

DF_TEST("droidframe.time.util", "steady time from uptime") {
  auto origin = std::chrono::steady_clock::time_point{};
  auto now = origin + std::chrono::seconds(100);
  auto expected = origin + std::chrono::seconds(90);
  std::chrono::nanoseconds uptime = std::chrono::seconds(500);

  DF_CHECK(steadyTimeFromUptime(uptime - std::chrono::seconds(10), uptime, now) == expected);
  DF_CHECK(steadyTimeFromUptime(uptime + std::chrono::seconds(10), uptime, now) == now);
  DF_CHECK(steadyTimeFromUptime(std::chrono::nanoseconds{-1}, uptime, now) == now);
  DF_CHECK(steadyTimeFromUptime(uptime, std::chrono::nanoseconds{-1}, now) == now);
}

TEST_SUITE_END();
