/*
  fuzzy_resolver_test.cpp

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

#include "catalog/catalog.h"
#include "resolver/fuzzy_resolver.h"
#include "test_helpers.h"

namespace {

catalog::Catalog build_catalog(const lk_test::TempDir& dir) {
    catalog::BuildOptions options;
    options.roots.push_back(dir.path());
    auto built = catalog::build(options);
    EXPECT_TRUE(built.is_ok());
    return built.is_ok() ? built.value() : catalog::Catalog{};
}

std::vector<std::string> names(const std::vector<fuzzy_resolver::Candidate>& candidates) {
    std::vector<std::string> result;
    for (const auto& candidate : candidates) {
        result.push_back(candidate.function->name);
    }
    return result;
}

}  // namespace

TEST(FuzzyScore, SubsequenceIsRequired) {
    EXPECT_TRUE(fuzzy_resolver::score("dep", "deploy").has_value());
    EXPECT_TRUE(fuzzy_resolver::score("dpy", "deploy").has_value());
    EXPECT_FALSE(fuzzy_resolver::score("xyz", "deploy").has_value());
    EXPECT_FALSE(fuzzy_resolver::score("deployment", "deploy").has_value());
}

TEST(FuzzyScore, EmptyQueryScoresZero) {
    EXPECT_EQ(fuzzy_resolver::score("", "anything"), 0);
}

TEST(FuzzyScore, CaseInsensitive) {
    EXPECT_EQ(fuzzy_resolver::score("DEP", "deploy"), fuzzy_resolver::score("dep", "deploy"));
}

TEST(FuzzyScore, ContiguousBeatsScattered) {
    auto contiguous = fuzzy_resolver::score("dep", "deploy");
    auto scattered = fuzzy_resolver::score("dep", "d_e_p");
    auto gapped = fuzzy_resolver::score("dep", "dxexp");
    ASSERT_TRUE(contiguous && scattered && gapped);
    EXPECT_GT(*contiguous, *scattered);
    EXPECT_GT(*scattered, *gapped);
}

TEST(FuzzyScore, WordStartBeatsMidWord) {
    auto word_start = fuzzy_resolver::score("log", "tail_logs");
    auto mid_word = fuzzy_resolver::score("log", "catalogs");
    ASSERT_TRUE(word_start && mid_word);
    EXPECT_GT(*word_start, *mid_word);
}

TEST(FuzzyScore, StringStartBeatsLaterMatch) {
    auto start = fuzzy_resolver::score("dep", "deploy");
    auto later = fuzzy_resolver::score("dep", "undeploy");
    ASSERT_TRUE(start && later);
    EXPECT_GT(*start, *later);
}

TEST(FuzzyRank, EmptyQueryReturnsDiscoveryOrder) {
    lk_test::TempDir dir;
    dir.write("a.sh", "zulu() { :; }\nalpha() { :; }\n");
    dir.write("b.sh", "mike() { :; }\n");
    auto catalog = build_catalog(dir);

    auto ranked = fuzzy_resolver::rank(catalog, "");
    std::vector<std::string> expected = {"zulu", "alpha", "mike"};
    EXPECT_EQ(names(ranked), expected);
}

TEST(FuzzyRank, ExactNameRanksFirst) {
    lk_test::TempDir dir;
    dir.write("a.sh", "deploy_all() { :; }\nredeploy() { :; }\ndeploy() { :; }\n");
    auto catalog = build_catalog(dir);

    auto ranked = fuzzy_resolver::rank(catalog, "deploy");
    ASSERT_EQ(ranked.size(), 3u);
    EXPECT_EQ(ranked[0].function->name, "deploy");
    EXPECT_TRUE(ranked[0].exact_name);
    EXPECT_FALSE(ranked[1].exact_name);
}

TEST(FuzzyRank, BetterMatchesComeFirst) {
    lk_test::TempDir dir;
    dir.write("a.sh", "undeploy() { :; }\ndxexp() { :; }\ndeploy() { :; }\n");
    auto catalog = build_catalog(dir);

    auto ranked = fuzzy_resolver::rank(catalog, "dep");
    std::vector<std::string> expected = {"deploy", "undeploy", "dxexp"};
    EXPECT_EQ(names(ranked), expected);
}

TEST(FuzzyRank, ShorterNameBreaksScoreTies) {
    lk_test::TempDir dir;
    dir.write("a.sh", "abc() { :; }\nab() { :; }\n");
    auto catalog = build_catalog(dir);

    auto ranked = fuzzy_resolver::rank(catalog, "a");
    std::vector<std::string> expected = {"ab", "abc"};
    EXPECT_EQ(names(ranked), expected);
}

TEST(FuzzyRank, SameNamedFunctionsAreBothRankedInDiscoveryOrder) {
    lk_test::TempDir dir;
    dir.write("one.sh", "setup() { :; }\n");
    dir.write("two.sh", "setup() { :; }\n");
    auto catalog = build_catalog(dir);

    auto ranked = fuzzy_resolver::rank(catalog, "setup");
    ASSERT_EQ(ranked.size(), 2u);
    EXPECT_EQ(ranked[0].function->id, "one.sh:setup");
    EXPECT_EQ(ranked[1].function->id, "two.sh:setup");
}

TEST(FuzzyRank, MatchesDescriptionsAndFileNames) {
    lk_test::TempDir dir;
    dir.write("backup.sh", "# Copy data to the servers\nsync_now() { :; }\nother() { :; }\n");
    auto catalog = build_catalog(dir);

    auto by_description = fuzzy_resolver::rank(catalog, "servers");
    ASSERT_EQ(by_description.size(), 1u);
    EXPECT_EQ(by_description[0].function->name, "sync_now");

    auto by_file = fuzzy_resolver::rank(catalog, "backup");
    EXPECT_EQ(by_file.size(), 2u);
}

TEST(FuzzyRank, NoMatchIsEmpty) {
    lk_test::TempDir dir;
    dir.write("a.sh", "alpha() { :; }\n");
    auto catalog = build_catalog(dir);
    EXPECT_TRUE(fuzzy_resolver::rank(catalog, "qqq").empty());
}

TEST(FuzzyLookup, FindsByIdExactNameAndScript) {
    lk_test::TempDir dir;
    dir.write("one.sh", "setup() { :; }\nbuild() { :; }\n");
    dir.write("two.sh", "setup() { :; }\n");
    auto catalog = build_catalog(dir);

    const auto* by_id = fuzzy_resolver::find_by_id(catalog, "two.sh:setup");
    ASSERT_NE(by_id, nullptr);
    EXPECT_EQ(catalog.script_of(*by_id).relative_path, "two.sh");
    EXPECT_EQ(fuzzy_resolver::find_by_id(catalog, "three.sh:setup"), nullptr);

    EXPECT_EQ(fuzzy_resolver::find_exact(catalog, "setup").size(), 2u);
    EXPECT_EQ(fuzzy_resolver::find_exact(catalog, "build").size(), 1u);
    EXPECT_TRUE(fuzzy_resolver::find_exact(catalog, "bui").empty());

    auto scripts = catalog.find_scripts("one.sh");
    ASSERT_EQ(scripts.size(), 1u);
    const auto* script = scripts[0];
    ASSERT_NE(fuzzy_resolver::find_in_script(*script, "build"), nullptr);
    EXPECT_EQ(fuzzy_resolver::find_in_script(*script, "missing"), nullptr);
}
