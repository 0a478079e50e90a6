#include "DroidFrame/Backend.h"

#include "tests/unit/test_fakes.h"
#include "tests/unit/test_helpers.h"

using namespace DroidFrame;
using namespace DroidFrame::Test;

TEST_SUITE_BEGIN("droidframe.log");

DF_TEST("droidframe.log", "set and clear callback") {
  Logger logger;
  DF_CHECK(!logger.hasCallback());
  logger.info("dropped");

  LogCapture capture;
  logger.setCallback(capture.callback());
  DF_CHECK(logger.hasCallback());
  logger.debug("one");
  logger.info("two");
  logger.warning("three");
  logger.error("four");
  logger.log(LogLevel::Warning, "five");
  DF_CHECK(capture.count(LogLevel::Debug) == 1u);
  DF_CHECK(capture.count(LogLevel::Info) == 1u);
  DF_CHECK(capture.count(LogLevel::Warning) == 2u);
  DF_CHECK(capture.count(LogLevel::Error) == 1u);
  DF_CHECK(!capture.contains("dropped"));

  logger.setCallback({});
  DF_CHECK(!logger.hasCallback());
  logger.error("after clear");
  DF_CHECK(!capture.contains("after clear"));
}

DF_TEST("droidframe.log", "callback may replace itself") {
  Logger logger;
  int calls = 0;
  logger.setCallback([&](LogLevel, Utf8TextView) {
    ++calls;
    logger.setCallback({});
  });
  logger.info("first");
  logger.info("second");
  DF_CHECK(calls == 1);
}

DF_TEST("droidframe.log", "backend routes diagnostics") {
  BackendHarness h;
  DF_CHECK(h.backend->logger().hasCallback());
  DF_CHECK(!h.backend->onStart().has_value());
  DF_CHECK(h.logs.count(LogLevel::Warning) == 1u);

  h.backend->setLogCallback({});
  DF_CHECK(!h.backend->logger().hasCallback());
}

DF_TEST("droidframe.log", "level labels") {
  DF_CHECK(logLevelLabel(LogLevel::Debug) == "debug");
  DF_CHECK(logLevelLabel(LogLevel::Error) == "error");
}

TEST_SUITE_END();
