/*
  listing.cpp

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

#include "ui/listing.h"

#include <algorithm>

#include "utils/colors.h"
#include "utils/utf8_utils.h"

namespace listing {

namespace {

constexpr const char* kIndent = "  ";
constexpr std::size_t kColumnGap = 2;

std::string describe(const std::optional<std::string>& description) {
    return description ? *description : std::string();
}

nlohmann::json optional_string(const std::optional<std::string>& value) {
    if (value) {
        return *value;
    }
    return nullptr;
}

}  // namespace

std::string pad_to_width(const std::string& text, std::size_t width) {
    std::size_t current = utf8_utils::calculate_display_width(text);
    if (current >= width) {
        return text;
    }
    return text + std::string(width - current, ' ');
}

std::string format_scripts(const catalog::Catalog& catalog, bool color) {
    if (catalog.empty()) {
        return "No scripts found.\n";
    }

    std::size_t width = 0;
    for (const auto& script : catalog.scripts()) {
        width = std::max(width, utf8_utils::calculate_display_width(script.relative_path));
    }

    std::string out;
    for (const auto& script : catalog.scripts()) {
        out += kIndent;
        std::string description = describe(script.description);
        if (description.empty()) {
            out += colors::paint(script.relative_path, colors::GREEN, color);
        } else {
            out += colors::paint(pad_to_width(script.relative_path, width + kColumnGap),
                                 colors::GREEN, color);
            out += colors::paint(description, colors::DIM, color);
        }
        out += '\n';
    }
    return out;
}

std::string format_functions(const catalog::ScriptFile& script, bool color) {
    std::string out;
    out += colors::paint(script.relative_path, colors::BOLD, color);
    out += '\n';
    if (script.description) {
        out += kIndent;
        out += *script.description;
        out += '\n';
    }
    out += '\n';

    if (script.functions.empty()) {
        out += kIndent;
        out += "(no functions)\n";
        return out;
    }

    std::size_t width = 0;
    for (const auto& function : script.functions) {
        width = std::max(width, utf8_utils::calculate_display_width(function.name));
    }

    for (const auto& function : script.functions) {
        out += kIndent;
        std::string description = describe(function.description);
        if (description.empty()) {
            out += colors::paint(function.name, colors::CYAN, color);
        } else {
            out += colors::paint(pad_to_width(function.name, width + kColumnGap), colors::CYAN,
                                 color);
            out += description;
        }
        out += '\n';
    }
    return out;
}

std::string format_candidates(const std::vector<fuzzy_resolver::Candidate>& candidates,
                              std::size_t limit, bool color) {
    std::size_t shown = std::min(limit, candidates.size());
    std::size_t id_width = 0;
    for (std::size_t i = 0; i < shown; ++i) {
        id_width = std::max(id_width, utf8_utils::calculate_display_width(candidates[i].function->id));
    }
    std::size_t number_width = std::to_string(shown).size();

    std::string out;
    for (std::size_t i = 0; i < shown; ++i) {
        const auto& candidate = candidates[i];
        std::string number = std::to_string(i + 1);
        out += std::string(number_width - number.size(), ' ');
        out += colors::paint(number + ")", colors::YELLOW, color);
        out += ' ';
        std::string description = describe(candidate.function->description);
        if (description.empty()) {
            out += colors::paint(candidate.function->id, colors::CYAN, color);
        } else {
            out += colors::paint(pad_to_width(candidate.function->id, id_width + kColumnGap),
                                 colors::CYAN, color);
            out += colors::paint(description, colors::DIM, color);
        }
        out += '\n';
    }
    return out;
}

std::string format_diagnostics(const catalog::Catalog& catalog, bool color) {
    std::string out;
    for (const auto& diagnostic : catalog.diagnostics()) {
        out += colors::paint("warning:", colors::YELLOW, color);
        out += ' ';
        out += catalog::format_diagnostic(diagnostic);
        out += '\n';
    }
    return out;
}

nlohmann::json catalog_to_json(const catalog::Catalog& catalog) {
    nlohmann::json scripts = nlohmann::json::array();
    for (const auto& script : catalog.scripts()) {
        nlohmann::json functions = nlohmann::json::array();
        for (const auto& function : script.functions) {
            functions.push_back({{"id", function.id},
                                 {"name", function.name},
                                 {"description", optional_string(function.description)},
                                 {"start_line", function.start_line},
                                 {"end_line", function.end_line}});
        }
        scripts.push_back({{"path", script.path.string()},
                           {"name", script.display_name},
                           {"description", optional_string(script.description)},
                           {"functions", functions}});
    }

    nlohmann::json diagnostics = nlohmann::json::array();
    for (const auto& diagnostic : catalog.diagnostics()) {
        diagnostics.push_back({{"kind", catalog::diagnostic_kind_name(diagnostic.kind)},
                               {"path", diagnostic.path},
                               {"line", diagnostic.line},
                               {"detail", diagnostic.detail}});
    }

    return {{"scripts", scripts}, {"diagnostics", diagnostics}};
}

std::string format_json(const catalog::Catalog& catalog) {
    return catalog_to_json(catalog).dump(2, ' ', false,
                                         nlohmann::json::error_handler_t::replace) +
           "\n";
}

}  // namespace listing
