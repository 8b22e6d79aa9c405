/*
  diagnostic.h

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

namespace catalog {

enum class DiagnosticKind : std::uint8_t {
    UNREADABLE_FILE,
    BINARY_FILE,
    EMPTY_FILE,
    MALFORMED_FUNCTION,
    INVALID_FUNCTION_NAME,
    DUPLICATE_FUNCTION,
    NAME_COLLISION,
    SYMLINK_CYCLE
};

// Non-fatal problem found while building a catalog. `line` is 1-based, 0 when
// the problem concerns the whole file.
struct Diagnostic {
    DiagnosticKind kind;
    std::string path;
    std::size_t line = 0;
    std::string detail;
};

const char* diagnostic_kind_name(DiagnosticKind kind);

std::string format_diagnostic(const Diagnostic& diagnostic);

}  // namespace catalog
