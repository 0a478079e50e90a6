#include "src/PlatformDisplayUtil.h"

#include "tests/unit/test_helpers.h"

#include <limits>

using namespace DroidFrame;

TEST_SUITE_BEGIN("droidframe.display.util");

DF_TEST("droidframe.display.util", "interval from refresh rate") {
  auto interval60 = intervalFromRefreshRate(60.0);
  DF_REQUIRE(interval60.has_value());
  DF_CHECK(interval60->count() == 16666666);

  auto interval120 = intervalFromRefreshRate(120.0);
  DF_REQUIRE(interval120.has_value());
  DF_CHECK(interval120->count() == 8333333);

  DF_CHECK(!intervalFromRefreshRate(0.0).has_value());
  DF_CHECK(!intervalFromRefreshRate(-60.0).has_value());
  DF_CHECK(!intervalFromRefreshRate(std::numeric_limits<double>::quiet_NaN()).has_value());
}

DF_TEST("droidframe.display.util", "pixels per point from density") {
  auto xxhdpi = pixelsPerPointFromDensity(480, 120.0f);
  DF_REQUIRE(xxhdpi.has_value());
  DF_CHECK(*xxhdpi == doctest::Approx(4.0f));

  auto mdpi = pixelsPerPointFromDensity(160, 160.0f);
  DF_REQUIRE(mdpi.has_value());
  DF_CHECK(*mdpi == doctest::Approx(1.0f));

  DF_CHECK(!pixelsPerPointFromDensity(0, 120.0f).has_value());
  DF_CHECK(!pixelsPerPointFromDensity(320, 0.0f).has_value());
  DF_CHECK(!pixelsPerPointFromDensity(320, std::numeric_limits<float>::infinity()).has_value());
}

DF_TEST("droidframe.display.util", "sanitized scale") {
  DF_CHECK(sanitizedPixelsPerPoint(2.5f, 1.0f) == doctest::Approx(2.5f));
  DF_CHECK(sanitizedPixelsPerPoint(0.0f, 3.0f) == doctest::Approx(3.0f));
  DF_CHECK(sanitizedPixelsPerPoint(std::numeric_limits<float>::quiet_NaN(), 2.0f) == doctest::Approx(2.0f));
  DF_CHECK(sanitizedPixelsPerPoint(-1.0f, -1.0f) == doctest::Approx(1.0f));
}

DF_TEST("droidframe.display.util", "logical size") {
  auto size = logicalSizeFromPixels(PixelSize{1080u, 2400u}, 3.0f);
  DF_CHECK(size.width == doctest::Approx(360.0f));
  DF_CHECK(size.height == doctest::Approx(800.0f));

  auto fallback = logicalSizeFromPixels(PixelSize{100u, 50u}, 0.0f);
  DF_CHECK(fallback.width == doctest::Approx(100.0f));
  DF_CHECK(fallback.height == doctest::Approx(50.0f));
}

TEST_SUITE_END();
