/*
  end_to_end_test.cpp

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

#include "catalog/catalog.h"
#include "exec/execution_bridge.h"
#include "lk.h"
#include "resolver/fuzzy_resolver.h"
#include "test_helpers.h"

namespace {

const char* const kDeployScript =
    "# Deploys the app\n"
    "deploy() { echo \"deploying $1\"; }\n";

int run_lk(std::vector<std::string> args) {
    args.insert(args.begin(), "lk");
    std::vector<char*> argv;
    for (auto& arg : args) {
        argv.push_back(arg.data());
    }
    argv.push_back(nullptr);
    return lk::run(static_cast<int>(args.size()), argv.data());
}

class EndToEnd : public ::testing::Test {
   protected:
    void SetUp() override {
        script_ = scripts_.write("deploy.sh", kDeployScript);
    }

    lk_test::TempDir scripts_;
    lk_test::TempDir state_;
    lk_test::TempDir temp_;
    lk_test::ScopedEnv config_{"LK_CONFIG", (state_.path() / "config.json").string()};
    lk_test::ScopedEnv tmpdir_{"TMPDIR", temp_.path().string()};
    std::filesystem::path script_;
};

}  // namespace

TEST_F(EndToEnd, QueryResolvesAndRunsWithArgument) {
    catalog::BuildOptions options;
    options.roots.push_back(scripts_.path());
    auto built = catalog::build(options);
    ASSERT_TRUE(built.is_ok());

    auto ranked = fuzzy_resolver::rank(built.value(), "dep");
    ASSERT_FALSE(ranked.empty());
    const catalog::Function& function = *ranked.front().function;
    EXPECT_EQ(function.name, "deploy");
    ASSERT_TRUE(function.description);
    EXPECT_EQ(*function.description, "Deploys the app");

    execution_bridge::ExecutionOptions exec_options;
    exec_options.temp_dir = temp_.path();

    lk_test::StdoutCapture capture(state_.path() / "stdout.txt");
    auto result = execution_bridge::run(built.value().script_of(function), function, {"staging"},
                                        exec_options);
    std::string out = capture.finish();

    EXPECT_EQ(result.exit_code, 0);
    EXPECT_EQ(out, "deploying staging\n");
    EXPECT_EQ(temp_.entry_count(), 0u);
}

TEST_F(EndToEnd, FuzzyModeRunsSingleCandidate) {
    lk_test::StdoutCapture capture(state_.path() / "stdout.txt");
    int code = run_lk({"--root", scripts_.path().string(), "--fuzzy", "dep", "staging"});
    std::string out = capture.finish();

    EXPECT_EQ(code, 0);
    EXPECT_EQ(out, "deploying staging\n");
    EXPECT_TRUE(std::filesystem::exists(state_.path() / "config.json"));
}

TEST_F(EndToEnd, ListModeRunsScriptAndFunction) {
    lk_test::StdoutCapture capture(state_.path() / "stdout.txt");
    int code = run_lk({"-r", scripts_.path().string(), "deploy.sh", "deploy", "prod"});
    std::string out = capture.finish();

    EXPECT_EQ(code, 0);
    EXPECT_EQ(out, "deploying prod\n");
}

TEST_F(EndToEnd, SharedScriptNameIsRejectedUntilPathIsGiven) {
    scripts_.write("api/build.sh", "build() { echo api; }\n");
    scripts_.write("web/build.sh", "build() { echo web; }\n");

    lk_test::StdoutCapture ambiguous(state_.path() / "ambiguous.txt");
    EXPECT_EQ(run_lk({"-r", scripts_.path().string(), "build.sh", "build"}), 1);
    EXPECT_EQ(ambiguous.finish(), "");

    lk_test::StdoutCapture exact(state_.path() / "exact.txt");
    EXPECT_EQ(run_lk({"-r", scripts_.path().string(), "web/build.sh", "build"}), 0);
    EXPECT_EQ(exact.finish(), "web\n");
}

TEST_F(EndToEnd, ExitCodeOfFunctionIsReturned) {
    scripts_.write("fail.sh", "fail() { exit 3; }\n");
    int code = run_lk({"-r", scripts_.path().string(), "fail.sh", "fail"});
    EXPECT_EQ(code, 3);
    EXPECT_EQ(temp_.entry_count(), 0u);
}

TEST_F(EndToEnd, ListModeShowsScriptsAndFunctions) {
    lk_test::StdoutCapture scripts_capture(state_.path() / "scripts.txt");
    EXPECT_EQ(run_lk({"-C", "-r", scripts_.path().string()}), 0);
    EXPECT_EQ(scripts_capture.finish(), "  deploy.sh\n");

    lk_test::StdoutCapture functions_capture(state_.path() / "functions.txt");
    EXPECT_EQ(run_lk({"-C", "-r", scripts_.path().string(), "deploy"}), 0);
    std::string out = functions_capture.finish();
    EXPECT_NE(out.find("deploy  Deploys the app"), std::string::npos);
}

TEST_F(EndToEnd, UnknownScriptOrFunctionFails) {
    lk_test::StdoutCapture capture(state_.path() / "stdout.txt");
    EXPECT_EQ(run_lk({"-r", scripts_.path().string(), "missing.sh"}), 1);
    EXPECT_EQ(run_lk({"-r", scripts_.path().string(), "deploy.sh", "rollback"}), 1);
    capture.finish();
}

TEST_F(EndToEnd, MissingRootFailsBeforeAnythingRuns) {
    EXPECT_EQ(run_lk({"-r", (scripts_.path() / "absent").string(), "-f", "dep"}), 1);
}

TEST_F(EndToEnd, DefaultModeIsPersisted) {
    EXPECT_EQ(run_lk({"--default", "fuzzy"}), 0);
    std::string saved = lk_test::read_file(state_.path() / "config.json");
    EXPECT_NE(saved.find("\"default_mode\": \"fuzzy\""), std::string::npos);
}

TEST_F(EndToEnd, JsonOutputDescribesCatalog) {
    lk_test::StdoutCapture capture(state_.path() / "stdout.txt");
    EXPECT_EQ(run_lk({"-j", "-r", scripts_.path().string()}), 0);
    std::string out = capture.finish();
    EXPECT_NE(out.find("\"id\": \"deploy.sh:deploy\""), std::string::npos);
    EXPECT_NE(out.find("\"description\": \"Deploys the app\""), std::string::npos);
}
