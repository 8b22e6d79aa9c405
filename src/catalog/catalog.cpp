/*
  catalog.cpp

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

#include "catalog/catalog.h"

#include <algorithm>
#include <map>
#include <set>
#include <system_error>
#include <unordered_map>
#include <utility>

#include "catalog/function_extractor.h"
#include "catalog/text_filter.h"
#include "utils/debug.h"
#include "utils/lk_filesystem.h"

namespace catalog {

namespace fs = std::filesystem;

namespace {

std::string normalize_ignore_entry(std::string entry) {
    while (entry.size() >= 2 && entry.compare(0, 2, "./") == 0) {
        entry.erase(0, 2);
    }
    while (entry.size() > 1 && entry.back() == '/') {
        entry.pop_back();
    }
    return entry;
}

std::string strip_extension(const std::string& name) {
    auto dot = name.rfind('.');
    if (dot == std::string::npos || dot == 0) {
        return name;
    }
    return name.substr(0, dot);
}

}  // namespace

class CatalogBuilder {
   public:
    explicit CatalogBuilder(const BuildOptions& options) : options_(options) {
        for (const auto& entry : options.ignore) {
            std::string normalized = normalize_ignore_entry(entry);
            if (!normalized.empty()) {
                ignored_paths_.insert(normalized);
            }
        }
        filter_options_.require_executable = options.require_executable;
    }

    ErrorOr<Catalog> run() {
        if (options_.roots.empty()) {
            return ErrorOr<Catalog>::error(
                ErrorInfo(ErrorType::CONFIGURATION_ERROR, "catalog", "no search roots configured",
                          {"Pass --root DIR or set \"roots\" in the config file"}));
        }

        std::vector<fs::path> resolved_roots;
        for (const auto& root : options_.roots) {
            std::error_code ec;
            fs::file_status status = fs::status(root, ec);
            if (ec || !fs::exists(status)) {
                return ErrorOr<Catalog>::error(ErrorInfo(
                    ErrorType::CONFIGURATION_ERROR, "catalog",
                    "root '" + root.string() + "' does not exist" +
                        (ec && ec != std::errc::no_such_file_or_directory ? ": " + ec.message()
                                                                          : "")));
            }
            if (!fs::is_directory(status)) {
                return ErrorOr<Catalog>::error(
                    ErrorInfo(ErrorType::CONFIGURATION_ERROR, "catalog",
                              "root '" + root.string() + "' is not a directory"));
            }
            fs::path absolute = fs::absolute(root, ec);
            resolved_roots.push_back(ec ? root : absolute.lexically_normal());
        }

        for (std::size_t i = 0; i < resolved_roots.size(); ++i) {
            lk_debug_msg("catalog: walking root %s", resolved_roots[i].c_str());
            walk_directory(i, resolved_roots[i], "");
        }

        assign_identifiers();
        report_name_collisions();

        lk_debug_msg("catalog: %zu scripts, %zu functions, %zu diagnostics",
                     catalog_.scripts_.size(), catalog_.function_count(),
                     catalog_.diagnostics_.size());
        return ErrorOr<Catalog>::ok(std::move(catalog_));
    }

   private:
    void diagnose(DiagnosticKind kind, const std::string& path, std::size_t line,
                  const std::string& detail) {
        Diagnostic diagnostic{kind, path, line, detail};
        lk_debug_msg("diagnostic: %s", format_diagnostic(diagnostic).c_str());
        catalog_.diagnostics_.push_back(std::move(diagnostic));
    }

    void walk_directory(std::size_t root_index, const fs::path& directory,
                        const std::string& relative_prefix) {
        auto identity = lk_filesystem::directory_identity(directory);
        if (identity) {
            if (!visited_.insert(*identity).second) {
                diagnose(DiagnosticKind::SYMLINK_CYCLE, directory.string(), 0,
                         "directory already visited, not descending again");
                return;
            }
        }

        std::error_code ec;
        std::vector<fs::path> entries;
        for (fs::directory_iterator it(directory, ec), end; !ec && it != end; it.increment(ec)) {
            entries.push_back(it->path());
        }
        if (ec) {
            diagnose(DiagnosticKind::UNREADABLE_FILE, directory.string(), 0,
                     "cannot list directory: " + ec.message());
        }
        std::sort(entries.begin(), entries.end());

        for (const auto& entry : entries) {
            std::string name = entry.filename().string();
            std::string relative = relative_prefix.empty() ? name : relative_prefix + "/" + name;

            if (ignored_paths_.count(relative) != 0) {
                lk_debug_msg("catalog: ignoring %s", relative.c_str());
                continue;
            }

            std::error_code status_ec;
            if (fs::is_directory(entry, status_ec)) {
                if (text_filter::is_ignored_directory_name(name)) {
                    continue;
                }
                walk_directory(root_index, entry, relative);
                continue;
            }

            add_file(root_index, entry, relative);
        }
    }

    void add_file(std::size_t root_index, const fs::path& path, const std::string& relative) {
        text_filter::Verdict verdict = text_filter::check_file(path, filter_options_);
        if (!verdict.eligible) {
            if (verdict.kind) {
                diagnose(*verdict.kind, path.string(), 0, verdict.skip_reason);
            } else {
                lk_debug_msg("catalog: skipping %s: %s", path.c_str(),
                             verdict.skip_reason.c_str());
            }
            return;
        }

        auto content = lk_filesystem::read_file_content(path.string());
        if (content.is_error()) {
            diagnose(DiagnosticKind::UNREADABLE_FILE, path.string(), 0, content.error());
            return;
        }

        function_extractor::ExtractionResult extracted =
            function_extractor::extract(content.value(), path.string());
        for (auto& diagnostic : extracted.diagnostics) {
            lk_debug_msg("diagnostic: %s", format_diagnostic(diagnostic).c_str());
            catalog_.diagnostics_.push_back(std::move(diagnostic));
        }

        if (extracted.functions.empty() && !has_shell_shebang(content.value())) {
            return;
        }

        ScriptFile script;
        script.path = path;
        script.relative_path = relative;
        script.display_name = path.filename().string();
        script.description = std::move(extracted.description);
        script.root_index = root_index;

        const std::size_t script_index = catalog_.scripts_.size();
        for (auto& parsed : extracted.functions) {
            if (!options_.include_private_functions && !parsed.name.empty() &&
                parsed.name.front() == '_') {
                continue;
            }
            Function function;
            function.name = std::move(parsed.name);
            function.script_index = script_index;
            function.description = std::move(parsed.description);
            function.start_line = parsed.start_line;
            function.end_line = parsed.end_line;
            function.discovery_index = next_discovery_index_++;
            script.functions.push_back(std::move(function));
        }

        catalog_.scripts_.push_back(std::move(script));
    }

    void assign_identifiers() {
        std::map<std::string, std::size_t> relative_path_counts;
        for (const auto& script : catalog_.scripts_) {
            ++relative_path_counts[script.relative_path];
        }
        for (auto& script : catalog_.scripts_) {
            bool ambiguous = relative_path_counts[script.relative_path] > 1;
            for (auto& function : script.functions) {
                function.id = script.relative_path + ":" + function.name;
                if (ambiguous) {
                    function.id += "@" + std::to_string(script.root_index);
                }
            }
        }
    }

    void report_name_collisions() {
        std::unordered_map<std::string, const ScriptFile*> first_seen;
        for (const auto& script : catalog_.scripts_) {
            for (const auto& function : script.functions) {
                auto inserted = first_seen.emplace(function.name, &script);
                if (!inserted.second && inserted.first->second != &script) {
                    diagnose(DiagnosticKind::NAME_COLLISION, script.path.string(),
                             function.start_line,
                             "'" + function.name + "' is also defined in " +
                                 inserted.first->second->relative_path);
                }
            }
        }
    }

    const BuildOptions& options_;
    text_filter::FilterOptions filter_options_;
    std::set<std::string> ignored_paths_;
    std::set<lk_filesystem::DirectoryIdentity> visited_;
    std::size_t next_discovery_index_ = 0;
    Catalog catalog_;
};

std::vector<const Function*> Catalog::functions() const {
    std::vector<const Function*> result;
    result.reserve(function_count());
    for (const auto& script : scripts_) {
        for (const auto& function : script.functions) {
            result.push_back(&function);
        }
    }
    return result;
}

std::size_t Catalog::function_count() const {
    std::size_t count = 0;
    for (const auto& script : scripts_) {
        count += script.functions.size();
    }
    return count;
}

const ScriptFile& Catalog::script_of(const Function& function) const {
    return scripts_.at(function.script_index);
}

std::vector<const ScriptFile*> Catalog::find_scripts(const std::string& name) const {
    using Key = std::string (*)(const ScriptFile&);
    const Key keys[] = {
        [](const ScriptFile& script) { return script.relative_path; },
        [](const ScriptFile& script) { return script.display_name; },
        [](const ScriptFile& script) { return strip_extension(script.display_name); },
    };

    std::vector<const ScriptFile*> matches;
    for (Key key : keys) {
        for (const auto& script : scripts_) {
            if (key(script) == name) {
                matches.push_back(&script);
            }
        }
        if (!matches.empty()) {
            break;
        }
    }
    return matches;
}

ErrorOr<Catalog> build(const BuildOptions& options) {
    PerformanceTracker tracker("catalog build");
    CatalogBuilder builder(options);
    return builder.run();
}

bool has_shell_shebang(const std::string& text) {
    if (text.compare(0, 2, "#!") != 0) {
        return false;
    }
    std::string line = text.substr(2, text.find('\n') == std::string::npos
                                          ? std::string::npos
                                          : text.find('\n') - 2);

    std::vector<std::string> words;
    std::string current;
    for (char c : line) {
        if (c == ' ' || c == '\t' || c == '\r') {
            if (!current.empty()) {
                words.push_back(std::move(current));
                current.clear();
            }
        } else {
            current += c;
        }
    }
    if (!current.empty()) {
        words.push_back(std::move(current));
    }
    if (words.empty()) {
        return false;
    }

    std::string interpreter = fs::path(words.front()).filename().string();
    if (interpreter == "env") {
        interpreter.clear();
        for (std::size_t i = 1; i < words.size(); ++i) {
            if (words[i].front() != '-') {
                interpreter = fs::path(words[i]).filename().string();
                break;
            }
        }
    }

    static const std::set<std::string> kShells = {"sh",  "bash", "zsh", "dash",
                                                  "ksh", "mksh", "ash"};
    return kShells.count(interpreter) != 0;
}

}  // namespace catalog
