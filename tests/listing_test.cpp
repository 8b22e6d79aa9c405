/*
  listing_test.cpp

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
#include "picker/function_picker.h"
#include "resolver/fuzzy_resolver.h"
#include "test_helpers.h"
#include "ui/listing.h"

namespace {

catalog::Catalog build_catalog(const lk_test::TempDir& dir) {
    catalog::BuildOptions options;
    options.roots.push_back(dir.path());
    auto built = catalog::build(options);
    EXPECT_TRUE(built.is_ok());
    return built.is_ok() ? built.value() : catalog::Catalog{};
}

}  // namespace

TEST(Listing, PadsByDisplayWidth) {
    EXPECT_EQ(listing::pad_to_width("ab", 4), "ab  ");
    EXPECT_EQ(listing::pad_to_width("abcdef", 4), "abcdef");
    EXPECT_EQ(listing::pad_to_width("\xC3\xA9t\xC3\xA9", 5), "\xC3\xA9t\xC3\xA9  ");
}

TEST(Listing, FunctionsAreAligned) {
    lk_test::TempDir dir;
    dir.write("ops.sh",
              "# Operations\n\n# Ship it\ndeploy() { :; }\n# Look around\nst() { :; }\nbare() { :; }\n");
    auto catalog = build_catalog(dir);
    ASSERT_EQ(catalog.scripts().size(), 1u);

    std::string out = listing::format_functions(catalog.scripts()[0], false);
    EXPECT_NE(out.find("ops.sh\n  Operations\n"), std::string::npos);
    EXPECT_NE(out.find("  deploy  Ship it\n"), std::string::npos);
    EXPECT_NE(out.find("  st      Look around\n"), std::string::npos);
    EXPECT_NE(out.find("  bare\n"), std::string::npos);
}

TEST(Listing, ScriptsListOrEmptyMessage) {
    lk_test::TempDir empty;
    EXPECT_EQ(listing::format_scripts(build_catalog(empty), false), "No scripts found.\n");

    lk_test::TempDir dir;
    dir.write("a.sh", "# Alpha\n\nx() { :; }\n");
    dir.write("longer.sh", "y() { :; }\n");
    std::string out = listing::format_scripts(build_catalog(dir), false);
    EXPECT_EQ(out, "  a.sh       Alpha\n  longer.sh\n");
}

TEST(Listing, CandidatesAreNumberedAndLimited) {
    lk_test::TempDir dir;
    dir.write("a.sh", "one() { :; }\ntwo() { :; }\nthree() { :; }\n");
    auto catalog = build_catalog(dir);

    auto ranked = fuzzy_resolver::rank(catalog, "");
    std::string out = listing::format_candidates(ranked, 2, false);
    EXPECT_EQ(out, "1) a.sh:one\n2) a.sh:two\n");
}

TEST(Listing, JsonHasScriptsAndDiagnostics) {
    lk_test::TempDir dir;
    dir.write("a.sh", "# Says hi\nhi() { echo hi; }\n");
    dir.write("empty.sh", "");
    auto json = listing::catalog_to_json(build_catalog(dir));

    ASSERT_EQ(json["scripts"].size(), 1u);
    const auto& script = json["scripts"][0];
    EXPECT_EQ(script["name"], "a.sh");
    EXPECT_TRUE(script["description"].is_null());
    ASSERT_EQ(script["functions"].size(), 1u);
    EXPECT_EQ(script["functions"][0]["id"], "a.sh:hi");
    EXPECT_EQ(script["functions"][0]["description"], "Says hi");
    EXPECT_EQ(script["functions"][0]["start_line"], 2);
    EXPECT_EQ(script["functions"][0]["end_line"], 2);

    ASSERT_EQ(json["diagnostics"].size(), 1u);
    EXPECT_EQ(json["diagnostics"][0]["kind"], "empty file");
}

TEST(Listing, JsonSurvivesLatin1Descriptions) {
    lk_test::TempDir dir;
    dir.write("ship.sh", "# D\xe9ploie l'app\nship() { :; }\n");
    auto catalog = build_catalog(dir);
    ASSERT_EQ(catalog.function_count(), 1u);

    std::string text;
    ASSERT_NO_THROW(text = listing::format_json(catalog));
    EXPECT_EQ(text.back(), '\n');

    nlohmann::json parsed;
    ASSERT_NO_THROW(parsed = nlohmann::json::parse(text));
    std::string description = parsed["scripts"][0]["functions"][0]["description"];
    EXPECT_EQ(description.rfind("D\xEF\xBF\xBD", 0), 0u);
    EXPECT_NE(description.find("ploie l'app"), std::string::npos);
}

TEST(PickerInput, ResolvesNumbersIdsAndText) {
    lk_test::TempDir dir;
    dir.write("a.sh", "deploy() { :; }\nstatus() { :; }\n");
    dir.write("b.sh", "deploy() { :; }\n");
    auto catalog = build_catalog(dir);
    auto shown = fuzzy_resolver::rank(catalog, "");

    auto by_number = function_picker::resolve_input(" 2 ", shown, catalog);
    ASSERT_EQ(by_number.status, function_picker::PickStatus::SELECTED);
    EXPECT_EQ(by_number.function->id, "a.sh:status");

    auto by_id = function_picker::resolve_input("b.sh:deploy", shown, catalog);
    ASSERT_EQ(by_id.status, function_picker::PickStatus::SELECTED);
    EXPECT_EQ(by_id.function->id, "b.sh:deploy");

    auto by_text = function_picker::resolve_input("stat", shown, catalog);
    ASSERT_EQ(by_text.status, function_picker::PickStatus::SELECTED);
    EXPECT_EQ(by_text.function->name, "status");

    EXPECT_EQ(function_picker::resolve_input("   ", shown, catalog).status,
              function_picker::PickStatus::CANCELLED);
    EXPECT_EQ(function_picker::resolve_input("zzzz", shown, catalog).status,
              function_picker::PickStatus::NO_MATCH);
}
