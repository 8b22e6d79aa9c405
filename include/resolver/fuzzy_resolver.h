/*
  fuzzy_resolver.h

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

#pragma once

#include <optional>
#include <string>
#include <vector>

#include "catalog/catalog.h"

namespace fuzzy_resolver {

// Scoring weights. Any change must keep the scheme deterministic.
constexpr int kMatchScore = 16;
constexpr int kGapStartPenalty = -3;
constexpr int kGapExtensionPenalty = -1;
constexpr int kStartBonus = 10;
constexpr int kBoundaryBonus = 8;
constexpr int kCamelCaseBonus = 7;
constexpr int kConsecutiveBonus = 4;
constexpr int kNameMatchBonus = 24;

struct Candidate {
    const catalog::Function* function = nullptr;
    const catalog::ScriptFile* script = nullptr;
    int score = 0;
    bool exact_name = false;
};

// Best case-insensitive subsequence alignment of `query` within `text`, or
// nullopt when `query` is not a subsequence. An empty query scores 0.
std::optional<int> score(const std::string& query, const std::string& text);

// Candidates ordered by exact name, score, name length and discovery order.
// An empty query returns every function in discovery order.
std::vector<Candidate> rank(const catalog::Catalog& catalog, const std::string& query);

const catalog::Function* find_by_id(const catalog::Catalog& catalog, const std::string& id);

std::vector<const catalog::Function*> find_exact(const catalog::Catalog& catalog,
                                                 const std::string& name);

const catalog::Function* find_in_script(const catalog::ScriptFile& script,
                                        const std::string& name);

}  // namespace fuzzy_resolver
