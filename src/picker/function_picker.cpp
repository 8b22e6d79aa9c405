/*
  function_picker.cpp

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

#include "picker/function_picker.h"

#include <isocline.h>

#include <algorithm>
#include <cctype>
#include <iostream>

#include "ui/listing.h"
#include "utils/colors.h"
#include "utils/debug.h"

namespace function_picker {

namespace {

struct CompletionContext {
    const catalog::Catalog* catalog = nullptr;
};

std::string trim(const std::string& text) {
    std::size_t start = 0;
    while (start < text.size() && std::isspace(static_cast<unsigned char>(text[start]))) {
        ++start;
    }
    std::size_t end = text.size();
    while (end > start && std::isspace(static_cast<unsigned char>(text[end - 1]))) {
        --end;
    }
    return text.substr(start, end - start);
}

bool is_number(const std::string& text) {
    return !text.empty() && std::all_of(text.begin(), text.end(), [](char c) {
        return std::isdigit(static_cast<unsigned char>(c)) != 0;
    });
}

void function_completer(ic_completion_env_t* cenv, const char* prefix) {
    auto* context = static_cast<CompletionContext*>(ic_completion_arg(cenv));
    if (context == nullptr || context->catalog == nullptr || prefix == nullptr) {
        return;
    }

    std::string query(prefix);
    auto ranked = fuzzy_resolver::rank(*context->catalog, trim(query));
    std::size_t offered = 0;
    for (const auto& candidate : ranked) {
        if (offered >= kMaxCompletions || ic_stop_completing(cenv)) {
            break;
        }
        const std::string& id = candidate.function->id;
        const char* help =
            candidate.function->description ? candidate.function->description->c_str() : nullptr;
        if (!ic_add_completion_prim(cenv, id.c_str(), nullptr, help,
                                    static_cast<long>(query.size()), 0)) {
            break;
        }
        ++offered;
    }
}

}  // namespace

PickResult resolve_input(const std::string& input,
                         const std::vector<fuzzy_resolver::Candidate>& shown,
                         const catalog::Catalog& catalog) {
    PickResult result;
    std::string text = trim(input);
    if (text.empty()) {
        result.status = PickStatus::CANCELLED;
        return result;
    }

    if (is_number(text) && text.size() < 10) {
        std::size_t choice = std::stoul(text);
        if (choice >= 1 && choice <= shown.size()) {
            result.status = PickStatus::SELECTED;
            result.function = shown[choice - 1].function;
            return result;
        }
    }

    if (const catalog::Function* by_id = fuzzy_resolver::find_by_id(catalog, text)) {
        result.status = PickStatus::SELECTED;
        result.function = by_id;
        return result;
    }

    auto ranked = fuzzy_resolver::rank(catalog, text);
    if (ranked.empty()) {
        result.status = PickStatus::NO_MATCH;
        return result;
    }
    result.status = PickStatus::SELECTED;
    result.function = ranked.front().function;
    return result;
}

PickResult pick(const catalog::Catalog& catalog, const std::string& query, std::size_t lines) {
    auto ranked = fuzzy_resolver::rank(catalog, query);
    std::vector<fuzzy_resolver::Candidate> shown(
        ranked.begin(), ranked.begin() + static_cast<std::ptrdiff_t>(std::min(lines, ranked.size())));

    std::cerr << listing::format_candidates(shown, shown.size(), colors::stderr_colors_enabled());

    CompletionContext context;
    context.catalog = &catalog;

    ic_enable_hint(true);
    ic_enable_completion_preview(true);

    char* line = ic_readline_ex("pick", function_completer, &context, nullptr, nullptr);
    if (line == nullptr) {
        lk_debug_msg("picker: input closed or interrupted");
        PickResult cancelled;
        cancelled.status = PickStatus::CANCELLED;
        return cancelled;
    }

    std::string input(line);
    ic_free(line);
    return resolve_input(input, shown, catalog);
}

}  // namespace function_picker
