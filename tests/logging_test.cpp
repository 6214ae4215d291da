#include <surveyor/logging.h>

#include <gtest/gtest.h>

#include <iostream>
#include <memory>
#include <sstream>
#include <stdexcept>

namespace {

TEST(LoggingTest, RespectsLogLevelThreshold) {
  std::stringstream stream;
  surveyor::StructuredLogger logger(stream, {surveyor::LogLevel::kInfo});

  logger.Log(surveyor::LogLevel::kDebug, "driver.root.files", {});
  logger.Log(surveyor::LogLevel::kInfo, "driver.root.start", {});

  const auto output = stream.str();
  EXPECT_EQ(std::string::npos, output.find("driver.root.files"));
  EXPECT_NE(std::string::npos, output.find("level=info"));
  EXPECT_NE(std::string::npos, output.find("driver.root.start"));
}

TEST(LoggingTest, DefaultsToWarnings) {
  std::stringstream stream;
  auto logger = surveyor::MakeLogger(surveyor::LoggingConfig{}, stream);

  logger->Log(surveyor::LogLevel::kInfo, "driver.start");
  logger->Log(surveyor::LogLevel::kWarn, "discovery.error");

  EXPECT_EQ(std::string::npos, stream.str().find("driver.start"));
  EXPECT_NE(std::string::npos, stream.str().find("level=warn"));
}

TEST(LoggingTest, FormatsFieldsAsStructuredPairs) {
  std::stringstream stream;
  surveyor::StructuredLogger logger(stream, {surveyor::LogLevel::kDebug});

  logger.Log(surveyor::LogLevel::kDebug, "driver.root.complete",
             {{"root", "tools/lint"}, {"duration_ms", "42"}});

  const auto output = stream.str();
  EXPECT_NE(std::string::npos, output.find("fields={\"root\": \"tools/lint\""));
  EXPECT_NE(std::string::npos, output.find("\"duration_ms\": \"42\"}"));
  EXPECT_NE(std::string::npos,
            output.find("message=\"driver.root.complete\""));
}

TEST(LoggingTest, ParsesLevelNames) {
  EXPECT_EQ(surveyor::ParseLogLevel(" DEBUG "), surveyor::LogLevel::kDebug);
  EXPECT_EQ(surveyor::ParseLogLevel("warning"), surveyor::LogLevel::kWarn);
  EXPECT_EQ(surveyor::LogLevelName(surveyor::LogLevel::kError), "error");
  EXPECT_THROW(surveyor::ParseLogLevel("loud"), std::invalid_argument);
}

TEST(LoggingTest, EnsureLoggerProvidesDefault) {
  auto provided = surveyor::EnsureLogger(nullptr);
  EXPECT_NE(nullptr, provided);
  EXPECT_NE(nullptr,
            std::dynamic_pointer_cast<surveyor::NullLogger>(provided));

  auto custom = std::make_shared<surveyor::StructuredLogger>(
      std::cout, surveyor::LoggingConfig{});
  EXPECT_EQ(custom, surveyor::EnsureLogger(custom));
}

} // namespace
