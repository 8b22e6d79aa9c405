/*
  diagnostic.cpp

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

#include "catalog/diagnostic.h"

namespace catalog {

const char* diagnostic_kind_name(DiagnosticKind kind) {
    switch (kind) {
        case DiagnosticKind::UNREADABLE_FILE:
            return "unreadable file";
        case DiagnosticKind::BINARY_FILE:
            return "binary file";
        case DiagnosticKind::EMPTY_FILE:
            return "empty file";
        case DiagnosticKind::MALFORMED_FUNCTION:
            return "malformed function";
        case DiagnosticKind::INVALID_FUNCTION_NAME:
            return "invalid function name";
        case DiagnosticKind::DUPLICATE_FUNCTION:
            return "duplicate function";
        case DiagnosticKind::NAME_COLLISION:
            return "name collision";
        case DiagnosticKind::SYMLINK_CYCLE:
            return "symlink cycle";
    }
    return "unknown";
}

std::string format_diagnostic(const Diagnostic& diagnostic) {
    std::string result = diagnostic.path;
    if (diagnostic.line > 0) {
        result += ":" + std::to_string(diagnostic.line);
    }
    result += ": ";
    result += diagnostic_kind_name(diagnostic.kind);
    if (!diagnostic.detail.empty()) {
        result += ": " + diagnostic.detail;
    }
    return result;
}

}  // namespace catalog
