// tests/level_test.cpp
#include "fsink/core/dispatch/level.hpp"

#include <gtest/gtest.h>

namespace fsink {
namespace {

TEST(Level, ParsesCanonicalNames) {
  const char* names[] = {"debug", "info", "notice", "warning",
                         "error", "critical", "alert", "emergency"};
  for (int i = 0; i < 8; ++i) {
    auto l = parse_level(names[i]);
    ASSERT_TRUE(l.ok()) << names[i];
    EXPECT_EQ(static_cast<int>(*l), i);
    EXPECT_STREQ(to_string(*l), names[i]);
  }
}

TEST(Level, ParsesAliasesAndNumbers) {
  EXPECT_EQ(*parse_level("warn"), Level::kWarning);
  EXPECT_EQ(*parse_level("err"), Level::kError);
  EXPECT_EQ(*parse_level("crit"), Level::kCritical);
  EXPECT_EQ(*parse_level("emerg"), Level::kEmergency);
  EXPECT_EQ(*parse_level("0"), Level::kDebug);
  EXPECT_EQ(*parse_level("7"), Level::kEmergency);
}

TEST(Level, RejectsUnknown) {
  for (const char* s : {"", "8", "verbose", "INFO", "10"}) {
    auto l = parse_level(s);
    EXPECT_FALSE(l.ok()) << s;
    EXPECT_EQ(l.status().code(), Status::Code::kInvalidArgument);
  }
}

TEST(Level, Ordering) {
  EXPECT_LT(Level::kDebug, Level::kInfo);
  EXPECT_LT(Level::kWarning, Level::kError);
  EXPECT_LT(Level::kAlert, Level::kEmergency);
}

}  // namespace
}  // namespace fsink
