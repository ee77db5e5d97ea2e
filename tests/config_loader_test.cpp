// tests/config_loader_test.cpp
#include "fsink/core/util/config_loader.hpp"

#include <string>

#include <gtest/gtest.h>

#include "test_util.hpp"

namespace fsink {
namespace {

using ConfigLoaderTest = test_util::TempDirTest;
using test_util::write_file;

TEST_F(ConfigLoaderTest, AppliesDefaults) {
  const auto p = path("min.yaml");
  write_file(p,
             "name: file1\n"
             "file:\n"
             "  filename: /tmp/x.log\n");

  auto r = load_config(p);
  ASSERT_TRUE(r.ok()) << r.status().message();
  const AppConfig& c = *r;
  EXPECT_EQ(c.output.name, "file1");
  EXPECT_EQ(c.output.min_level, Level::kDebug);
  EXPECT_FALSE(c.output.max_level.has_value());
  EXPECT_EQ(c.default_level, Level::kInfo);
  EXPECT_EQ(c.output.sink.filename, "/tmp/x.log");
  EXPECT_FALSE(c.output.sink.mode.has_value());
  EXPECT_TRUE(c.output.sink.autoflush);
  EXPECT_FALSE(c.output.sink.close_after_write);
}

TEST_F(ConfigLoaderTest, ReadsAllFields) {
  const auto p = path("full.yaml");
  write_file(p,
             "name: file1\n"
             "min_level: info\n"
             "max_level: crit\n"
             "default_level: warning\n"
             "file:\n"
             "  filename: out.log\n"
             "  mode: '>>'\n"
             "  autoflush: 0\n"
             "  close_after_write: true\n");

  auto r = load_config(p);
  ASSERT_TRUE(r.ok()) << r.status().message();
  const AppConfig& c = *r;
  EXPECT_EQ(c.output.min_level, Level::kInfo);
  ASSERT_TRUE(c.output.max_level.has_value());
  EXPECT_EQ(*c.output.max_level, Level::kCritical);
  EXPECT_EQ(c.default_level, Level::kWarning);
  ASSERT_TRUE(c.output.sink.mode.has_value());
  EXPECT_EQ(*c.output.sink.mode, ">>");
  EXPECT_FALSE(c.output.sink.autoflush);
  EXPECT_TRUE(c.output.sink.close_after_write);
}

TEST_F(ConfigLoaderTest, NumericModeKeptAsText) {
  const auto p = path("num.yaml");
  write_file(p,
             "name: file1\n"
             "file:\n"
             "  filename: out.log\n"
             "  mode: 1024\n");

  auto r = load_config(p);
  ASSERT_TRUE(r.ok()) << r.status().message();
  ASSERT_TRUE(r->output.sink.mode.has_value());
  EXPECT_EQ(*r->output.sink.mode, "1024");
}

TEST_F(ConfigLoaderTest, QuotedArrowModesLoad) {
  const auto p = path("arrow.yaml");
  write_file(p,
             "name: file1\n"
             "file:\n"
             "  filename: out.log\n"
             "  mode: '>'\n");

  auto r = load_config(p);
  ASSERT_TRUE(r.ok()) << r.status().message();
  EXPECT_EQ(*r->output.sink.mode, ">");
}

TEST_F(ConfigLoaderTest, BareAppendArrowIsParseError) {
  const auto p = path("bare.yaml");
  write_file(p,
             "name: file1\n"
             "file:\n"
             "  filename: out.log\n"
             "  mode: >>\n");

  auto r = load_config(p);
  ASSERT_FALSE(r.ok());
  EXPECT_EQ(r.status().code(), Status::Code::kParseError);
}

TEST_F(ConfigLoaderTest, BareTruncateArrowIsRejected) {
  const auto p = path("bare.yaml");
  write_file(p,
             "name: file1\n"
             "file:\n"
             "  filename: out.log\n"
             "  mode: >\n");

  auto r = load_config(p);
  ASSERT_FALSE(r.ok());
  EXPECT_EQ(r.status().code(), Status::Code::kInvalidArgument);
  EXPECT_NE(r.status().message().find("file.mode"), std::string::npos);
}

TEST_F(ConfigLoaderTest, UnknownKeysIgnored) {
  const auto p = path("extra.yaml");
  write_file(p,
             "name: file1\n"
             "colour: blue\n"
             "file:\n"
             "  filename: out.log\n"
             "  permissions: 0600\n");

  auto r = load_config(p);
  ASSERT_TRUE(r.ok()) << r.status().message();
}

TEST_F(ConfigLoaderTest, IncludesAreLayered) {
  write_file(path("base.yaml"),
             "name: base\n"
             "min_level: debug\n"
             "file:\n"
             "  filename: base.log\n"
             "  autoflush: false\n");
  const auto p = path("main.yaml");
  write_file(p,
             "includes: [base.yaml]\n"
             "name: main\n"
             "file:\n"
             "  mode: append\n");

  auto r = load_config(p);
  ASSERT_TRUE(r.ok()) << r.status().message();
  EXPECT_EQ(r->output.name, "main");
  EXPECT_EQ(r->output.sink.filename, "base.log");
  EXPECT_FALSE(r->output.sink.autoflush);
  EXPECT_EQ(*r->output.sink.mode, "append");
}

TEST_F(ConfigLoaderTest, MissingFileIsNotFound) {
  auto r = load_config(path("nope.yaml"));
  ASSERT_FALSE(r.ok());
  EXPECT_EQ(r.status().code(), Status::Code::kNotFound);
}

TEST_F(ConfigLoaderTest, SyntaxErrorIsParseError) {
  const auto p = path("bad.yaml");
  write_file(p, "name: [unterminated\n");
  auto r = load_config(p);
  ASSERT_FALSE(r.ok());
  EXPECT_EQ(r.status().code(), Status::Code::kParseError);
}

TEST_F(ConfigLoaderTest, BadLevelIsInvalidArgument) {
  const auto p = path("lvl.yaml");
  write_file(p,
             "name: file1\n"
             "min_level: loud\n"
             "file:\n"
             "  filename: out.log\n");
  auto r = load_config(p);
  ASSERT_FALSE(r.ok());
  EXPECT_EQ(r.status().code(), Status::Code::kInvalidArgument);
}

TEST_F(ConfigLoaderTest, BadBoolIsInvalidArgument) {
  const auto p = path("bool.yaml");
  write_file(p,
             "name: file1\n"
             "file:\n"
             "  filename: out.log\n"
             "  autoflush: sometimes\n");
  auto r = load_config(p);
  ASSERT_FALSE(r.ok());
  EXPECT_EQ(r.status().code(), Status::Code::kInvalidArgument);
}

TEST_F(ConfigLoaderTest, MissingFilenameFailsValidation) {
  const auto p = path("nofile.yaml");
  write_file(p, "name: file1\n");
  auto r = load_config(p);
  ASSERT_FALSE(r.ok());
  EXPECT_EQ(r.status().code(), Status::Code::kInvalidArgument);
}

}  // namespace
}  // namespace fsink
