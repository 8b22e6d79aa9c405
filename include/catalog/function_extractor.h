/*
  function_extractor.h

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
#include <deque>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "catalog/diagnostic.h"

namespace function_extractor {

enum class LexState : std::uint8_t {
    NORMAL,
    IN_SINGLE_QUOTE,
    IN_ANSI_C_QUOTE,
    IN_DOUBLE_QUOTE,
    IN_COMMENT,
    IN_HEREDOC
};

struct LineScan {
    // Brace depth went from 0 to 1 somewhere on the line.
    bool opened = false;
    // Brace depth came back to 0 from 1 somewhere on the line.
    bool closed = false;
};

// Tracks quoting, comments, here-documents and brace depth across the lines
// of one shell script. Here-document bodies and quoted text never affect the
// brace depth.
class ShellLexer {
   public:
    LineScan scan_line(std::string_view line);

    LexState state() const {
        return state_;
    }
    int depth() const {
        return depth_;
    }
    void reset_depth() {
        depth_ = 0;
    }

    // True when the next line starts as ordinary shell code.
    bool at_code_boundary() const {
        return state_ == LexState::NORMAL;
    }

   private:
    struct HereDoc {
        std::string delimiter;
        bool strip_tabs = false;
    };

    void scan_heredoc_line(std::string_view line);
    std::size_t read_heredoc_operator(std::string_view line, std::size_t pos);
    void open(LineScan& scan);
    void close(LineScan& scan);

    LexState state_ = LexState::NORMAL;
    int depth_ = 0;
    int arith_depth_ = 0;
    std::deque<HereDoc> pending_heredocs_;
    HereDoc active_heredoc_;
};

struct Declaration {
    std::string name;
    bool has_brace = false;
    bool name_valid = false;
};

struct ParsedFunction {
    std::string name;
    std::optional<std::string> description;
    std::size_t start_line = 0;
    std::size_t end_line = 0;
};

struct ExtractionResult {
    std::optional<std::string> description;
    std::vector<ParsedFunction> functions;
    std::vector<catalog::Diagnostic> diagnostics;
};

// Recognises `name() {`, `function name {` and `function name() {` on a line
// with leading whitespace already removed. The brace may be missing, in which
// case it must open the next non-blank line.
std::optional<Declaration> parse_declaration(std::string_view trimmed_line);

bool is_valid_function_name(std::string_view name);

// Removes the leading `#` markers and exactly one following space.
std::string strip_comment_marker(std::string_view trimmed_line);

ExtractionResult extract(const std::string& text, const std::string& path = "");

}  // namespace function_extractor
