#pragma once

#include <doctest/doctest.h>

#define DF_TEST(suite, name) TEST_CASE(name)
#define DF_CHECK(...) CHECK(__VA_ARGS__)
#define DF_REQUIRE(...) REQUIRE(__VA_ARGS__)
#define DF_CHECK_THROWS_AS(expr, type) CHECK_THROWS_AS(expr, type)
#define DF_CHECK_NOTHROW(...) CHECK_NOTHROW(__VA_ARGS__)
