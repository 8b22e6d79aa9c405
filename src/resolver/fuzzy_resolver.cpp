/*
  fuzzy_resolver.cpp

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

#include "resolver/fuzzy_resolver.h"

#include <algorithm>
#include <cstdint>
#include <limits>

#include "utils/utf8_utils.h"

namespace fuzzy_resolver {

namespace {

constexpr int kUnreachable = std::numeric_limits<int>::min() / 2;

std::vector<int> position_bonuses(const std::vector<std::int32_t>& text) {
    std::vector<int> bonuses(text.size(), 0);
    for (std::size_t j = 0; j < text.size(); ++j) {
        if (j == 0) {
            bonuses[j] = kStartBonus;
            continue;
        }
        std::int32_t previous = text[j - 1];
        std::int32_t current = text[j];
        if (!utf8_utils::is_alphanumeric(previous) && utf8_utils::is_alphanumeric(current)) {
            bonuses[j] = kBoundaryBonus;
        } else if (utf8_utils::is_alphanumeric(previous) && !utf8_utils::is_uppercase(previous) &&
                   utf8_utils::is_uppercase(current)) {
            bonuses[j] = kCamelCaseBonus;
        }
    }
    return bonuses;
}

std::string corpus_for(const catalog::Function& function, const catalog::ScriptFile& script) {
    std::string corpus = function.name;
    if (function.description) {
        corpus += ' ';
        corpus += *function.description;
    }
    corpus += ' ';
    corpus += script.display_name;
    return corpus;
}

}  // namespace

std::optional<int> score(const std::string& query, const std::string& text) {
    const std::vector<std::int32_t> needle = utf8_utils::decode_lowercase(query);
    if (needle.empty()) {
        return 0;
    }

    const std::vector<std::int32_t> original = utf8_utils::decode(text);
    const std::vector<std::int32_t> haystack = utf8_utils::decode_lowercase(text);
    const std::size_t n = haystack.size();
    if (n < needle.size() || original.size() != n) {
        return std::nullopt;
    }

    const std::vector<int> bonuses = position_bonuses(original);

    // previous[j]: best score with the previous query character matched at j.
    // run[j]: bonus carried by the contiguous run ending at j, so a run that
    // starts on a word boundary keeps that bonus for every character.
    std::vector<int> previous(n, kUnreachable);
    std::vector<int> current(n, kUnreachable);
    std::vector<int> previous_run(n, 0);
    std::vector<int> current_run(n, 0);

    for (std::size_t j = 0; j < n; ++j) {
        if (haystack[j] == needle[0]) {
            previous[j] = kMatchScore + bonuses[j];
            previous_run[j] = bonuses[j];
        }
    }

    for (std::size_t i = 1; i < needle.size(); ++i) {
        std::fill(current.begin(), current.end(), kUnreachable);
        std::fill(current_run.begin(), current_run.end(), 0);
        int gap_best = kUnreachable;
        for (std::size_t j = 1; j < n; ++j) {
            if (j >= 2) {
                int extended = gap_best == kUnreachable ? kUnreachable
                                                        : gap_best + kGapExtensionPenalty;
                int opened = previous[j - 2] == kUnreachable ? kUnreachable
                                                             : previous[j - 2] + kGapStartPenalty;
                gap_best = std::max(extended, opened);
            }
            if (haystack[j] != needle[i]) {
                continue;
            }

            int best = kUnreachable;
            int run_bonus = 0;
            if (previous[j - 1] != kUnreachable) {
                run_bonus = std::max({previous_run[j - 1], bonuses[j], kConsecutiveBonus});
                best = previous[j - 1] + kMatchScore + run_bonus;
            }
            if (gap_best != kUnreachable && gap_best + kMatchScore + bonuses[j] > best) {
                best = gap_best + kMatchScore + bonuses[j];
                run_bonus = bonuses[j];
            }
            current[j] = best;
            current_run[j] = run_bonus;
        }
        std::swap(previous, current);
        std::swap(previous_run, current_run);
    }

    int best = *std::max_element(previous.begin(), previous.end());
    if (best == kUnreachable) {
        return std::nullopt;
    }
    return best;
}

std::vector<Candidate> rank(const catalog::Catalog& catalog, const std::string& query) {
    std::vector<Candidate> candidates;
    const std::string lowered_query = utf8_utils::to_lowercase(query);

    for (const catalog::Function* function : catalog.functions()) {
        const catalog::ScriptFile& script = catalog.script_of(*function);
        Candidate candidate;
        candidate.function = function;
        candidate.script = &script;

        if (query.empty()) {
            candidates.push_back(candidate);
            continue;
        }

        auto name_score = score(query, function->name);
        auto corpus_score = score(query, corpus_for(*function, script));
        if (!name_score && !corpus_score) {
            continue;
        }

        int total = corpus_score.value_or(0);
        if (name_score) {
            total = std::max(total, *name_score + kNameMatchBonus);
        }
        candidate.score = total;
        candidate.exact_name = utf8_utils::to_lowercase(function->name) == lowered_query;
        candidates.push_back(candidate);
    }

    if (query.empty()) {
        return candidates;
    }

    std::stable_sort(candidates.begin(), candidates.end(),
                     [](const Candidate& a, const Candidate& b) {
                         if (a.exact_name != b.exact_name) {
                             return a.exact_name;
                         }
                         if (a.score != b.score) {
                             return a.score > b.score;
                         }
                         if (a.function->name.size() != b.function->name.size()) {
                             return a.function->name.size() < b.function->name.size();
                         }
                         return a.function->discovery_index < b.function->discovery_index;
                     });
    return candidates;
}

const catalog::Function* find_by_id(const catalog::Catalog& catalog, const std::string& id) {
    for (const catalog::Function* function : catalog.functions()) {
        if (function->id == id) {
            return function;
        }
    }
    return nullptr;
}

std::vector<const catalog::Function*> find_exact(const catalog::Catalog& catalog,
                                                 const std::string& name) {
    std::vector<const catalog::Function*> matches;
    for (const catalog::Function* function : catalog.functions()) {
        if (function->name == name) {
            matches.push_back(function);
        }
    }
    return matches;
}

const catalog::Function* find_in_script(const catalog::ScriptFile& script,
                                        const std::string& name) {
    for (const auto& function : script.functions) {
        if (function.name == name) {
            return &function;
        }
    }
    return nullptr;
}

}  // namespace fuzzy_resolver
