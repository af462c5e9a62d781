#include <gtest/gtest.h>

#include <stdexcept>
#include <string>

#include <courier/error.hpp>
#include <courier/log.hpp>

#include "test_support.hpp"

using namespace courier;

TEST(Log, CaptureSeesEveryLevel) {
  test::LogCapture capture;
  log::debug("unit", "d");
  log::warning("unit", "w");
  log::error(std::runtime_error{"boom"}, "unit");

  const auto entries = capture.entries();
  ASSERT_EQ(entries.size(), 3U);
  EXPECT_EQ(entries[0].level, log::Level::debug);
  EXPECT_EQ(entries[1].level, log::Level::warning);
  EXPECT_EQ(entries[2].level, log::Level::error);
  EXPECT_EQ(entries[2].message, "boom");
}

TEST(Log, ErrorRecordsCarryTheException) {
  const std::exception* seen = nullptr;
  log::set_sink([&seen](const log::Record& r) { seen = r.error; });
  const BackendError error{"record not found", RequestContext{}};
  log::error(error, "backend");
  log::reset_sink();

  ASSERT_NE(seen, nullptr);
  EXPECT_NE(dynamic_cast<const BackendError*>(seen), nullptr);
}

TEST(Log, ThrowingSinkIsContained) {
  log::set_sink([](const log::Record&) { throw std::runtime_error{"sink exploded"}; });
  EXPECT_NO_THROW(log::warning("unit", "message"));
  EXPECT_NO_THROW(log::error(std::runtime_error{"x"}, "unit"));
  log::reset_sink();
}

TEST(Log, DefaultSinkDropsErrors) {
  log::reset_sink();
  testing::internal::CaptureStderr();
  log::error(std::runtime_error{"hidden"}, "unit");
  log::warning("unit", "shown");
  const auto err = testing::internal::GetCapturedStderr();
  EXPECT_EQ(err.find("hidden"), std::string::npos);
  EXPECT_NE(err.find("[courier:unit] warning: shown"), std::string::npos);
}

TEST(Log, LevelNames) {
  EXPECT_EQ(log::to_string(log::Level::debug), "debug");
  EXPECT_EQ(log::to_string(log::Level::warning), "warning");
  EXPECT_EQ(log::to_string(log::Level::error), "error");
}
