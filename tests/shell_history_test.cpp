/*
  shell_history_test.cpp

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

#include "history/shell_history.h"
#include "test_helpers.h"

using shell_history::ShellKind;

TEST(ShellHistory, DetectsShellFromPath) {
    EXPECT_EQ(shell_history::detect_shell("/bin/bash"), ShellKind::BASH);
    EXPECT_EQ(shell_history::detect_shell("/usr/local/bin/zsh"), ShellKind::ZSH);
    EXPECT_EQ(shell_history::detect_shell("/usr/bin/fish"), ShellKind::UNKNOWN);
    EXPECT_EQ(shell_history::detect_shell(""), ShellKind::UNKNOWN);
}

TEST(ShellHistory, FormatsRerunnableCommand) {
    EXPECT_EQ(shell_history::format_command("ops/deploy.sh", "deploy", {"staging"}),
              "lk ops/deploy.sh deploy staging");
    EXPECT_EQ(shell_history::format_command("a.sh", "say", {"hello world", "it's", ""}),
              "lk a.sh say 'hello world' 'it'\\''s' ''");
}

TEST(ShellHistory, ZshUsesExtendedFormat) {
    EXPECT_EQ(shell_history::format_entry(ShellKind::ZSH, "lk a.sh b", 1700000000),
              ": 1700000000:0;lk a.sh b\n");
    EXPECT_EQ(shell_history::format_entry(ShellKind::BASH, "lk a.sh b", 1700000000),
              "lk a.sh b\n");
}

TEST(ShellHistory, HistfileOverridesDefault) {
    lk_test::ScopedEnv env("HISTFILE", "/tmp/custom_history");
    auto file = shell_history::history_file(ShellKind::BASH);
    ASSERT_TRUE(file);
    EXPECT_EQ(*file, std::filesystem::path("/tmp/custom_history"));
}

TEST(ShellHistory, RecordAppendsToHistoryFile) {
    lk_test::TempDir dir;
    auto history = dir.write("history", "echo earlier\n");
    lk_test::ScopedEnv histfile("HISTFILE", history.string());
    lk_test::ScopedEnv shell("SHELL", "/bin/bash");

    shell_history::record("deploy.sh", "deploy", {"staging"});

    EXPECT_EQ(lk_test::read_file(history), "echo earlier\nlk deploy.sh deploy staging\n");
}

TEST(ShellHistory, UnknownShellIsSkipped) {
    lk_test::TempDir dir;
    auto history = dir.path() / "history";
    lk_test::ScopedEnv histfile("HISTFILE", history.string());
    lk_test::ScopedEnv shell("SHELL", "/usr/bin/fish");

    shell_history::record("deploy.sh", "deploy", {});

    EXPECT_FALSE(std::filesystem::exists(history));
}
