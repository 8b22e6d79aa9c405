/*
  text_filter.h

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

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "catalog/diagnostic.h"

namespace text_filter {

enum class ContentType : std::uint8_t {
    TEXT,
    BINARY
};

struct FilterOptions {
    bool require_executable = false;
};

struct Verdict {
    bool eligible = false;
    // Set when the entry was rejected for a reason worth reporting.
    std::optional<catalog::DiagnosticKind> kind;
    std::string skip_reason;
};

constexpr std::size_t kInspectBytes = 1024;

ContentType inspect(std::string_view sample);

Verdict check_file(const std::filesystem::path& path, const FilterOptions& options = {});

const std::vector<std::string>& default_ignored_directory_names();
bool is_ignored_directory_name(const std::string& name);

}  // namespace text_filter
