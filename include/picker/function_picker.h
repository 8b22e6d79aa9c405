/*
  function_picker.h

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

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "catalog/catalog.h"
#include "resolver/fuzzy_resolver.h"

namespace function_picker {

enum class PickStatus : std::uint8_t {
    SELECTED,
    CANCELLED,
    NO_MATCH
};

struct PickResult {
    PickStatus status = PickStatus::CANCELLED;
    const catalog::Function* function = nullptr;
};

constexpr std::size_t kMaxCompletions = 20;

// Interprets one line typed at the picker prompt: a number picks from the
// `shown` list (1-based), an identifier picks that function, anything else
// picks the best match for the text. Empty input cancels.
PickResult resolve_input(const std::string& input,
                         const std::vector<fuzzy_resolver::Candidate>& shown,
                         const catalog::Catalog& catalog);

// Prints the top `lines` candidates for `query` to stderr and reads a choice
// with completion over the whole catalog.
PickResult pick(const catalog::Catalog& catalog, const std::string& query, std::size_t lines);

}  // namespace function_picker
