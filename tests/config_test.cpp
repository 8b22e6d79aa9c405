/*
  config_test.cpp

  This file is part of lk

  MIT License

  Copyright (c) 2026 Caden Finley

  Permission is hereby granted, free of charge, to any person obtaining a copy
  of this software and associated documentation files (the "Software"), to deal
  in the Software without restriction, including without limitation the rights
  to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
  copies of the Software, and to permit persons to whom the Software is
  furnished to do so, subject to the following conditions:

  The above copyright notice and this permission notice shall be included in all
  copies or substantial portions of the Software.

  THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
  IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
  FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
  AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
  LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
  OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
  SOFTWARE.
*/

#include <gtest/gtest.h>

#include "config/lk_config.h"
#include "test_helpers.h"

TEST(ConfigParse, DefaultsWhenKeysAreMissing) {
    auto parsed = lk_config::parse("{}");
    ASSERT_TRUE(parsed.is_ok());
    const auto& settings = parsed.value();
    EXPECT_EQ(settings.default_mode, lk_config::Mode::LIST);
    EXPECT_EQ(settings.roots, std::vector<std::string>{"."});
    EXPECT_TRUE(settings.ignore.empty());
    EXPECT_EQ(settings.fuzzy_lines, lk_config::kDefaultFuzzyLines);
    EXPECT_FALSE(settings.include_private_functions);
    EXPECT_FALSE(settings.require_executable);
    EXPECT_FALSE(settings.write_history);
}

TEST(ConfigParse, ReadsEveryKey) {
    auto parsed = lk_config::parse(R"({
        "default_mode": "fuzzy",
        "roots": ["~/bin", "/opt/scripts"],
        "ignore": ["old"],
        "temp_dir": "/var/tmp",
        "shell": "/bin/zsh",
        "fuzzy_lines": 12,
        "include_private_functions": true,
        "require_executable": true,
        "write_history": true
    })");
    ASSERT_TRUE(parsed.is_ok());
    const auto& settings = parsed.value();
    EXPECT_EQ(settings.default_mode, lk_config::Mode::FUZZY);
    EXPECT_EQ(settings.roots.size(), 2u);
    EXPECT_EQ(settings.ignore, std::vector<std::string>{"old"});
    EXPECT_EQ(settings.temp_dir, "/var/tmp");
    EXPECT_EQ(settings.shell, "/bin/zsh");
    EXPECT_EQ(settings.fuzzy_lines, 12);
    EXPECT_TRUE(settings.include_private_functions);
    EXPECT_TRUE(settings.require_executable);
    EXPECT_TRUE(settings.write_history);
}

TEST(ConfigParse, RejectsWrongTypes) {
    EXPECT_TRUE(lk_config::parse(R"({"default_mode": "tree"})").is_error());
    EXPECT_TRUE(lk_config::parse(R"({"roots": "not-a-list"})").is_error());
    EXPECT_TRUE(lk_config::parse(R"({"fuzzy_lines": 0})").is_error());
    EXPECT_TRUE(lk_config::parse(R"({"write_history": "yes"})").is_error());
    EXPECT_TRUE(lk_config::parse("[]").is_error());
}

TEST(ConfigParse, CorruptJsonIsConfigurationError) {
    auto parsed = lk_config::parse("{ not json");
    ASSERT_TRUE(parsed.is_error());
    EXPECT_EQ(parsed.error().type, ErrorType::CONFIGURATION_ERROR);
}

TEST(ConfigJson, UnknownKeysSurviveRoundTrip) {
    auto parsed = lk_config::parse(R"({"theme": {"accent": "blue"}, "fuzzy_lines": 3})");
    ASSERT_TRUE(parsed.is_ok());
    auto document = lk_config::to_json(parsed.value());
    EXPECT_EQ(document["theme"]["accent"], "blue");
    EXPECT_EQ(document["fuzzy_lines"], 3);
    EXPECT_EQ(document["default_mode"], "list");
}

TEST(ConfigLoad, MissingFileIsCreatedWithDefaults) {
    lk_test::TempDir dir;
    auto path = dir.path() / "nested" / "config.json";

    auto settings = lk_config::load(path);
    EXPECT_EQ(settings.default_mode, lk_config::Mode::LIST);
    ASSERT_TRUE(std::filesystem::exists(path));

    auto reparsed = lk_config::parse(lk_test::read_file(path));
    ASSERT_TRUE(reparsed.is_ok());
    EXPECT_EQ(reparsed.value().fuzzy_lines, lk_config::kDefaultFuzzyLines);
}

TEST(ConfigLoad, CorruptFileFallsBackToDefaultsAndIsKept) {
    lk_test::TempDir dir;
    auto path = dir.write("config.json", "{ broken");

    auto settings = lk_config::load(path);
    EXPECT_EQ(settings.default_mode, lk_config::Mode::LIST);
    EXPECT_EQ(lk_test::read_file(path), "{ broken");
}

TEST(ConfigSave, PersistsDefaultMode) {
    lk_test::TempDir dir;
    auto path = dir.path() / "config.json";

    lk_config::Settings settings;
    settings.default_mode = lk_config::Mode::FUZZY;
    ASSERT_TRUE(lk_config::save(settings, path).is_ok());

    EXPECT_EQ(lk_config::load(path).default_mode, lk_config::Mode::FUZZY);
}

TEST(ConfigPath, HonoursLkConfigVariable) {
    lk_test::ScopedEnv env("LK_CONFIG", "/tmp/custom/lk.json");
    EXPECT_EQ(lk_config::config_file_path(), std::filesystem::path("/tmp/custom/lk.json"));
}

TEST(ConfigMode, ParsesAndNamesModes) {
    EXPECT_EQ(lk_config::parse_mode("list"), lk_config::Mode::LIST);
    EXPECT_EQ(lk_config::parse_mode("fuzzy"), lk_config::Mode::FUZZY);
    EXPECT_FALSE(lk_config::parse_mode("Fuzzy"));
    EXPECT_STREQ(lk_config::mode_name(lk_config::Mode::FUZZY), "fuzzy");
}
