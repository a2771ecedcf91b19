#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "../libniclean/include/logger.hpp"

namespace {

struct Entry {
  LogLevel level;
  std::string message;
  std::string tag;
};

class RecordingSink final : public ILogSink {
 public:
  explicit RecordingSink(std::vector<Entry>& entries) : entries_(entries) {}

  void log(const LogLevel level, const std::string_view message, const std::string_view tag) override {
    entries_.push_back({level, std::string(message), std::string(tag)});
  }

 private:
  std::vector<Entry>& entries_;
};

}  // namespace

class LoggerTest : public ::testing::Test {
 protected:
  void TearDown() override { Logger::clear_sinks(); }
};

TEST_F(LoggerTest, FansOutToEverySink) {
  std::vector<Entry> first;
  std::vector<Entry> second;
  Logger::add_sink(std::make_unique<RecordingSink>(first));
  Logger::add_sink(std::make_unique<RecordingSink>(second));

  Logger::log(LogLevel::Warning, "ffmpeg not found", "resolver");

  ASSERT_EQ(first.size(), 1u);
  ASSERT_EQ(second.size(), 1u);
  EXPECT_EQ(first[0].level, LogLevel::Warning);
  EXPECT_EQ(first[0].message, "ffmpeg not found");
  EXPECT_EQ(first[0].tag, "resolver");
}

TEST_F(LoggerTest, DefaultTag) {
  std::vector<Entry> entries;
  Logger::add_sink(std::make_unique<RecordingSink>(entries));

  Logger::log(LogLevel::Info, "hello");

  ASSERT_EQ(entries.size(), 1u);
  EXPECT_EQ(entries[0].tag, "niclean");
}

TEST_F(LoggerTest, ClearSinksDropsMessages) {
  std::vector<Entry> entries;
  Logger::add_sink(std::make_unique<RecordingSink>(entries));
  Logger::clear_sinks();

  Logger::log(LogLevel::Error, "lost");
  EXPECT_TRUE(entries.empty());
}

TEST_F(LoggerTest, StringToLevel) {
  EXPECT_EQ(Logger::string_to_level("debug"), LogLevel::Debug);
  EXPECT_EQ(Logger::string_to_level("INFO"), LogLevel::Info);
  EXPECT_EQ(Logger::string_to_level("Warning"), LogLevel::Warning);
  EXPECT_EQ(Logger::string_to_level("WARN"), LogLevel::Warning);
  EXPECT_EQ(Logger::string_to_level("error"), LogLevel::Error);
  EXPECT_FALSE(Logger::string_to_level("NONE").has_value());
  EXPECT_FALSE(Logger::string_to_level("loud").has_value());
  EXPECT_STREQ(Logger::level_to_string(LogLevel::Warning), "WARN");
}
