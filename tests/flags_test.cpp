/*
  flags_test.cpp

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

#include <string>
#include <vector>

#include "flags.h"

namespace {

flags::ParseResult parse(std::vector<std::string> args) {
    args.insert(args.begin(), "lk");
    std::vector<char*> argv;
    for (auto& arg : args) {
        argv.push_back(arg.data());
    }
    argv.push_back(nullptr);
    return flags::parse_arguments(static_cast<int>(args.size()), argv.data());
}

}  // namespace

TEST(FlagsParse, NoArgumentsUsesConfiguredMode) {
    auto result = parse({});
    EXPECT_FALSE(result.should_exit);
    EXPECT_EQ(flags::select_mode(result.options, lk_config::Mode::LIST), flags::RunMode::LIST);
    EXPECT_EQ(flags::select_mode(result.options, lk_config::Mode::FUZZY), flags::RunMode::FUZZY);
}

TEST(FlagsParse, PositionalImpliesListMode) {
    auto result = parse({"deploy.sh", "deploy", "staging"});
    std::vector<std::string> expected = {"deploy.sh", "deploy", "staging"};
    EXPECT_EQ(result.options.positionals, expected);
    EXPECT_EQ(flags::select_mode(result.options, lk_config::Mode::FUZZY), flags::RunMode::LIST);
}

TEST(FlagsParse, FuzzyWinsOverList) {
    auto result = parse({"-l", "-f", "dep"});
    EXPECT_EQ(flags::select_mode(result.options, lk_config::Mode::LIST), flags::RunMode::FUZZY);
}

TEST(FlagsParse, DefaultWinsOverEverything) {
    auto result = parse({"--fuzzy", "--default", "fuzzy"});
    ASSERT_TRUE(result.options.set_default_mode);
    EXPECT_EQ(*result.options.set_default_mode, lk_config::Mode::FUZZY);
    EXPECT_EQ(flags::select_mode(result.options, lk_config::Mode::LIST),
              flags::RunMode::SET_DEFAULT);
}

TEST(FlagsParse, FunctionArgumentsAreNotParsedAsOptions) {
    auto result = parse({"-f", "dep", "-x", "--json"});
    EXPECT_FALSE(result.options.json);
    std::vector<std::string> expected = {"dep", "-x", "--json"};
    EXPECT_EQ(result.options.positionals, expected);
}

TEST(FlagsParse, RepeatableRootsAndIgnores) {
    auto result = parse({"-r", "one", "--root", "two", "-i", "old", "--ignore=tmp"});
    EXPECT_EQ(result.options.roots, (std::vector<std::string>{"one", "two"}));
    EXPECT_EQ(result.options.ignore, (std::vector<std::string>{"old", "tmp"}));
}

TEST(FlagsParse, OutputFlags) {
    auto result = parse({"-j", "-D", "-C", "-n", "3"});
    EXPECT_TRUE(result.options.json);
    EXPECT_TRUE(result.options.diagnostics);
    EXPECT_TRUE(result.options.no_colors);
    ASSERT_TRUE(result.options.number);
    EXPECT_EQ(*result.options.number, 3);
}

TEST(FlagsParse, InvalidNumberExits) {
    auto result = parse({"-n", "zero"});
    EXPECT_TRUE(result.should_exit);
    EXPECT_NE(result.exit_code, 0);
}

TEST(FlagsParse, InvalidDefaultModeExits) {
    auto result = parse({"--default", "tree"});
    EXPECT_TRUE(result.should_exit);
    EXPECT_NE(result.exit_code, 0);
}

TEST(FlagsParse, HelpAndVersion) {
    EXPECT_TRUE(parse({"-h"}).options.show_help);
    EXPECT_TRUE(parse({"--version"}).options.show_version);
}
