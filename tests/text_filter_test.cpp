/*
  text_filter_test.cpp

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

#include "catalog/text_filter.h"
#include "test_helpers.h"

using catalog::DiagnosticKind;

TEST(TextFilterInspect, PlainTextIsText) {
    EXPECT_EQ(text_filter::inspect("#!/bin/bash\necho hi\n"), text_filter::ContentType::TEXT);
}

TEST(TextFilterInspect, NulByteIsBinary) {
    std::string sample("abc\0def", 7);
    EXPECT_EQ(text_filter::inspect(sample), text_filter::ContentType::BINARY);
}

TEST(TextFilterInspect, ElfMagicIsBinary) {
    std::string sample = "\x7f" "ELF rest of header";
    EXPECT_EQ(text_filter::inspect(sample), text_filter::ContentType::BINARY);
}

TEST(TextFilterInspect, MachOMagicIsBinary) {
    std::string sample("\xcf\xfa\xed\xfe" "abcd", 8);
    EXPECT_EQ(text_filter::inspect(sample), text_filter::ContentType::BINARY);
}

TEST(TextFilterCheckFile, ScriptIsEligible) {
    lk_test::TempDir dir;
    auto file = dir.write("tool.sh", "hello() { echo hi; }\n");
    auto verdict = text_filter::check_file(file);
    EXPECT_TRUE(verdict.eligible);
    EXPECT_FALSE(verdict.kind.has_value());
}

TEST(TextFilterCheckFile, EmptyFileIsReported) {
    lk_test::TempDir dir;
    auto file = dir.write("empty.sh", "");
    auto verdict = text_filter::check_file(file);
    EXPECT_FALSE(verdict.eligible);
    ASSERT_TRUE(verdict.kind.has_value());
    EXPECT_EQ(*verdict.kind, DiagnosticKind::EMPTY_FILE);
}

TEST(TextFilterCheckFile, BinaryFileIsReported) {
    lk_test::TempDir dir;
    auto file = dir.write("blob", std::string("\x00\x01\x02", 3));
    auto verdict = text_filter::check_file(file);
    EXPECT_FALSE(verdict.eligible);
    ASSERT_TRUE(verdict.kind.has_value());
    EXPECT_EQ(*verdict.kind, DiagnosticKind::BINARY_FILE);
}

TEST(TextFilterCheckFile, MissingFileIsUnreadable) {
    lk_test::TempDir dir;
    auto verdict = text_filter::check_file(dir.path() / "missing.sh");
    EXPECT_FALSE(verdict.eligible);
    ASSERT_TRUE(verdict.kind.has_value());
    EXPECT_EQ(*verdict.kind, DiagnosticKind::UNREADABLE_FILE);
    EXPECT_FALSE(verdict.skip_reason.empty());
}

TEST(TextFilterCheckFile, DirectoryIsNeverEligible) {
    lk_test::TempDir dir;
    auto sub = dir.mkdir("scripts");
    auto verdict = text_filter::check_file(sub);
    EXPECT_FALSE(verdict.eligible);
    EXPECT_FALSE(verdict.kind.has_value());
}

TEST(TextFilterCheckFile, RequireExecutableSkipsPlainFiles) {
    lk_test::TempDir dir;
    auto plain = dir.write("plain.sh", "a() { :; }\n", 0644);
    auto runnable = dir.write("runnable.sh", "a() { :; }\n", 0755);

    text_filter::FilterOptions options;
    options.require_executable = true;

    auto skipped = text_filter::check_file(plain, options);
    EXPECT_FALSE(skipped.eligible);
    EXPECT_FALSE(skipped.kind.has_value());
    EXPECT_TRUE(text_filter::check_file(runnable, options).eligible);
}

TEST(TextFilterIgnoredNames, DefaultsCoverVcsAndBuildDirs) {
    EXPECT_TRUE(text_filter::is_ignored_directory_name(".git"));
    EXPECT_TRUE(text_filter::is_ignored_directory_name("node_modules"));
    EXPECT_TRUE(text_filter::is_ignored_directory_name("target"));
    EXPECT_FALSE(text_filter::is_ignored_directory_name("scripts"));
}
