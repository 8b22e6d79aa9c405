/*
  listing.h

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
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "catalog/catalog.h"
#include "resolver/fuzzy_resolver.h"

namespace listing {

// Pads with spaces to `width` terminal columns.
std::string pad_to_width(const std::string& text, std::size_t width);

std::string format_scripts(const catalog::Catalog& catalog, bool color);

std::string format_functions(const catalog::ScriptFile& script, bool color);

// Numbered candidate lines, at most `limit` of them, starting at 1.
std::string format_candidates(const std::vector<fuzzy_resolver::Candidate>& candidates,
                              std::size_t limit, bool color);

std::string format_diagnostics(const catalog::Catalog& catalog, bool color);

nlohmann::json catalog_to_json(const catalog::Catalog& catalog);

// Pretty-printed catalog_to_json. Bytes that are not valid UTF-8 (scripts
// written in Latin-1, odd file names) become U+FFFD instead of throwing.
std::string format_json(const catalog::Catalog& catalog);

}  // namespace listing
