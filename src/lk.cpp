/*
  lk.cpp

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

#include "lk.h"

#include <unistd.h>

#include <algorithm>
#include <iostream>
#include <set>

#include "error_out.h"
#include "exec/execution_bridge.h"
#include "history/shell_history.h"
#include "picker/function_picker.h"
#include "resolver/fuzzy_resolver.h"
#include "ui/listing.h"
#include "usage.h"
#include "utils/colors.h"
#include "utils/debug.h"

namespace lk {

namespace {

constexpr std::size_t kMaxSuggestions = 3;

template <typename Names>
std::vector<std::string> suggest(const std::string& wanted, const Names& names) {
    std::vector<std::pair<int, std::string>> scored;
    for (const std::string& name : names) {
        if (auto score = fuzzy_resolver::score(wanted, name)) {
            scored.emplace_back(*score, name);
        }
    }
    std::stable_sort(scored.begin(), scored.end(),
                     [](const auto& a, const auto& b) { return a.first > b.first; });

    std::vector<std::string> suggestions;
    for (std::size_t i = 0; i < scored.size() && i < kMaxSuggestions; ++i) {
        suggestions.push_back("Did you mean '" + scored[i].second + "'?");
    }
    return suggestions;
}

int save_default_mode(lk_config::Settings settings, lk_config::Mode mode) {
    settings.default_mode = mode;
    auto path = lk_config::config_file_path();
    auto saved = lk_config::save(settings, path);
    if (saved.is_error()) {
        print_error(ErrorInfo(ErrorType::CONFIGURATION_ERROR, "--default", saved.error()));
        return 1;
    }
    std::cout << "Default mode set to " << lk_config::mode_name(mode) << "\n";
    return 0;
}

}  // namespace

catalog::BuildOptions make_build_options(const lk_config::Settings& settings,
                                         const flags::Options& options) {
    catalog::BuildOptions build;
    const auto& roots = options.roots.empty() ? settings.roots : options.roots;
    for (const auto& root : roots) {
        build.roots.emplace_back(root);
    }
    build.ignore = settings.ignore;
    build.ignore.insert(build.ignore.end(), options.ignore.begin(), options.ignore.end());
    build.include_private_functions = settings.include_private_functions;
    build.require_executable = settings.require_executable;
    return build;
}

int execute_function(const Invocation& invocation, const catalog::Function& function,
                     const std::vector<std::string>& args, bool record_history) {
    const catalog::ScriptFile& script = invocation.catalog.script_of(function);
    const bool color = colors::stderr_colors_enabled();

    std::cerr << colors::paint("lk:", colors::DIM, color) << " " << script.path.string() << " -> "
              << colors::paint(function.name, colors::BOLD, color) << "\n";

    if (record_history && invocation.settings.write_history) {
        shell_history::record(script.relative_path, function.name, args);
    }

    execution_bridge::ExecutionOptions exec_options;
    exec_options.interpreter = invocation.settings.shell;
    exec_options.temp_dir = invocation.settings.temp_dir;

    auto result = execution_bridge::run(script, function, args, exec_options);
    if (result.error) {
        print_error(*result.error);
    }
    lk_debug_msg("run: %s finished in state '%s' with %d", function.id.c_str(),
                 execution_bridge::execution_state_name(result.state), result.exit_code);
    return result.exit_code;
}

int run_list_mode(const Invocation& invocation) {
    const auto& positionals = invocation.options.positionals;
    const auto& catalog = invocation.catalog;
    const bool color = colors::stdout_colors_enabled();

    if (positionals.empty()) {
        std::cout << listing::format_scripts(catalog, color);
        return 0;
    }

    std::vector<const catalog::ScriptFile*> matches = catalog.find_scripts(positionals[0]);
    if (matches.size() > 1) {
        std::set<std::string> relative_paths;
        for (const auto* match : matches) {
            relative_paths.insert(match->relative_path);
        }
        // Same relative path under two roots: only the absolute paths differ.
        const bool use_absolute = relative_paths.size() < matches.size();
        std::vector<std::string> paths;
        for (const auto* match : matches) {
            paths.push_back("Did you mean '" +
                            (use_absolute ? match->path.string() : match->relative_path) + "'?");
        }
        print_error(ErrorInfo(ErrorType::INVALID_ARGUMENT, positionals[0],
                              "matches " + std::to_string(matches.size()) +
                                  " scripts, give its path relative to the root",
                              paths));
        return 1;
    }

    const catalog::ScriptFile* script = matches.empty() ? nullptr : matches[0];
    if (script == nullptr) {
        std::vector<std::string> names;
        for (const auto& candidate : catalog.scripts()) {
            names.push_back(candidate.relative_path);
        }
        print_error(ErrorInfo(ErrorType::SCRIPT_NOT_FOUND, positionals[0],
                              "no script with that name under the search roots",
                              suggest(positionals[0], names)));
        std::cout << listing::format_scripts(catalog, color);
        return 1;
    }

    if (positionals.size() == 1) {
        std::cout << listing::format_functions(*script, color);
        return 0;
    }

    const catalog::Function* function = fuzzy_resolver::find_in_script(*script, positionals[1]);
    if (function == nullptr) {
        std::vector<std::string> names;
        for (const auto& candidate : script->functions) {
            names.push_back(candidate.name);
        }
        print_error(ErrorInfo(ErrorType::FUNCTION_NOT_FOUND, positionals[1],
                              "not defined in " + script->relative_path,
                              suggest(positionals[1], names)));
        std::cout << listing::format_functions(*script, color);
        return 1;
    }

    std::vector<std::string> args(positionals.begin() + 2, positionals.end());
    return execute_function(invocation, *function, args, false);
}

int run_fuzzy_mode(const Invocation& invocation) {
    const auto& positionals = invocation.options.positionals;
    const auto& catalog = invocation.catalog;
    const std::string query = positionals.empty() ? std::string() : positionals[0];
    const std::vector<std::string> args =
        positionals.empty() ? std::vector<std::string>()
                            : std::vector<std::string>(positionals.begin() + 1, positionals.end());

    if (!query.empty()) {
        if (const catalog::Function* by_id = fuzzy_resolver::find_by_id(catalog, query)) {
            return execute_function(invocation, *by_id, args, true);
        }
        auto exact = fuzzy_resolver::find_exact(catalog, query);
        if (exact.size() == 1) {
            return execute_function(invocation, *exact.front(), args, true);
        }
    }

    auto ranked = fuzzy_resolver::rank(catalog, query);
    if (ranked.empty()) {
        print_error(ErrorInfo(ErrorType::NO_MATCH, query.empty() ? "lk" : query,
                              catalog.function_count() == 0 ? "no functions found"
                                                            : "no function matches the query"));
        return 1;
    }

    if (ranked.size() == 1) {
        return execute_function(invocation, *ranked.front().function, args, true);
    }

    std::size_t lines = static_cast<std::size_t>(
        invocation.options.number.value_or(invocation.settings.fuzzy_lines));

    if (isatty(STDIN_FILENO) == 0) {
        std::cout << listing::format_candidates(ranked, lines, colors::stdout_colors_enabled());
        print_error(ErrorInfo(ErrorType::NO_MATCH, ErrorSeverity::WARNING,
                              query.empty() ? "lk" : query,
                              std::to_string(ranked.size()) +
                                  " functions match; narrow the query or pass an id"));
        return 1;
    }

    auto picked = function_picker::pick(catalog, query, lines);
    switch (picked.status) {
        case function_picker::PickStatus::SELECTED:
            return execute_function(invocation, *picked.function, args, true);
        case function_picker::PickStatus::NO_MATCH:
            print_error(ErrorInfo(ErrorType::NO_MATCH, "picker", "no function matches the input"));
            return 1;
        case function_picker::PickStatus::CANCELLED:
            break;
    }
    return 1;
}

int run(int argc, char* argv[]) {
    auto parsed = flags::parse_arguments(argc, argv);
    if (parsed.should_exit) {
        return parsed.exit_code;
    }
    const flags::Options& options = parsed.options;

    if (options.show_help) {
        print_usage();
        return 0;
    }
    if (options.show_version) {
        print_version();
        return 0;
    }
    if (options.no_colors) {
        colors::set_colors_enabled(false);
    }

    lk_config::Settings settings = lk_config::load(lk_config::config_file_path());

    flags::RunMode mode = flags::select_mode(options, settings.default_mode);
    if (mode == flags::RunMode::SET_DEFAULT) {
        return save_default_mode(settings, *options.set_default_mode);
    }

    auto built = catalog::build(make_build_options(settings, options));
    if (built.is_error()) {
        print_error(built.error());
        return 1;
    }
    const catalog::Catalog& catalog = built.value();

    if (options.diagnostics) {
        std::cerr << listing::format_diagnostics(catalog, colors::stderr_colors_enabled());
    }

    if (options.json) {
        std::cout << listing::format_json(catalog);
        return 0;
    }

    Invocation invocation{settings, options, catalog};
    return mode == flags::RunMode::FUZZY ? run_fuzzy_mode(invocation) : run_list_mode(invocation);
}

}  // namespace lk
