/*
  function_extractor.cpp

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

#include "catalog/function_extractor.h"

#include <algorithm>
#include <cctype>
#include <cstring>
#include <unordered_map>
#include <utility>

#include "utils/debug.h"

namespace function_extractor {

namespace {

bool is_blank_char(char c) {
    return c == ' ' || c == '\t';
}

std::string_view trim_left(std::string_view text) {
    std::size_t pos = 0;
    while (pos < text.size() && is_blank_char(text[pos])) {
        ++pos;
    }
    return text.substr(pos);
}

std::string_view trim_right(std::string_view text) {
    std::size_t end = text.size();
    while (end > 0 && (is_blank_char(text[end - 1]) || text[end - 1] == '\r')) {
        --end;
    }
    return text.substr(0, end);
}

bool starts_with(std::string_view text, std::string_view prefix) {
    return text.size() >= prefix.size() && text.compare(0, prefix.size(), prefix) == 0;
}

// `#` starts a comment only at the beginning of a word.
bool is_comment_boundary(char previous) {
    return is_blank_char(previous) || previous == ';' || previous == '&' || previous == '|' ||
           previous == '(' || previous == ')';
}

// Characters that can never be part of a function name token. A token that
// contains one of them is an ordinary command, not a declaration.
bool is_name_breaking_char(char c) {
    return std::strchr("\"'$`=;|&<>(){}[]*?!\\,", c) != nullptr;
}

std::vector<std::string> split_lines(const std::string& text) {
    std::vector<std::string> lines;
    std::size_t start = 0;
    while (start <= text.size()) {
        std::size_t end = text.find('\n', start);
        if (end == std::string::npos) {
            if (start < text.size()) {
                lines.push_back(text.substr(start));
            }
            break;
        }
        std::string line = text.substr(start, end - start);
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        lines.push_back(std::move(line));
        start = end + 1;
    }
    if (!lines.empty() && !lines.back().empty() && lines.back().back() == '\r') {
        lines.back().pop_back();
    }
    return lines;
}

struct CommentRun {
    std::vector<std::string> lines;

    bool empty() const {
        return lines.empty();
    }

    void clear() {
        lines.clear();
    }

    std::optional<std::string> joined() const {
        std::string description;
        for (const auto& line : lines) {
            if (line.empty()) {
                continue;
            }
            if (!description.empty()) {
                description += ' ';
            }
            description += line;
        }
        if (description.empty()) {
            return std::nullopt;
        }
        return description;
    }
};

struct OpenFunction {
    Declaration declaration;
    std::optional<std::string> description;
    std::size_t start_line = 0;
};

struct PassOutcome {
    bool unterminated = false;
    std::size_t declaration_index = 0;
};

PassOutcome run_pass(const std::vector<std::string>& lines, std::size_t start,
                     bool capture_file_description, const std::string& path,
                     ExtractionResult& result) {
    ShellLexer lexer;
    CommentRun comments;
    std::optional<OpenFunction> current;
    bool awaiting_brace = false;
    bool looking_for_file_description = capture_file_description;

    auto flush_comment_run = [&]() {
        if (looking_for_file_description && !comments.empty()) {
            result.description = comments.joined();
            if (result.description) {
                looking_for_file_description = false;
            }
        }
        comments.clear();
    };

    auto finish_function = [&](std::size_t end_index) {
        if (current->declaration.name_valid) {
            ParsedFunction function;
            function.name = current->declaration.name;
            function.description = current->description;
            function.start_line = current->start_line;
            function.end_line = end_index + 1;
            result.functions.push_back(std::move(function));
        } else {
            result.diagnostics.push_back(
                {catalog::DiagnosticKind::INVALID_FUNCTION_NAME, path, current->start_line,
                 "'" + current->declaration.name + "' is not a valid shell identifier"});
        }
        current.reset();
        awaiting_brace = false;
        lexer.reset_depth();
    };

    for (std::size_t i = start; i < lines.size(); ++i) {
        std::string_view line = lines[i];

        if (current && !awaiting_brace) {
            LineScan scan = lexer.scan_line(line);
            if (scan.closed) {
                finish_function(i);
            }
            continue;
        }

        if (!lexer.at_code_boundary()) {
            flush_comment_run();
            lexer.scan_line(line);
            continue;
        }

        std::string_view trimmed = trim_left(line);

        if (awaiting_brace) {
            if (trimmed.empty() || trimmed.front() == '#') {
                continue;
            }
            if (trimmed.front() == '{') {
                awaiting_brace = false;
                lexer.reset_depth();
                LineScan scan = lexer.scan_line(line);
                if (scan.closed) {
                    finish_function(i);
                }
                continue;
            }
            result.diagnostics.push_back(
                {catalog::DiagnosticKind::MALFORMED_FUNCTION, path, current->start_line,
                 "'" + current->declaration.name + "' has no '{' body"});
            current.reset();
            awaiting_brace = false;
        }

        if (trimmed.empty()) {
            flush_comment_run();
            lexer.scan_line(line);
            continue;
        }

        if (i == 0 && starts_with(trimmed, "#!")) {
            lexer.scan_line(line);
            continue;
        }

        if (trimmed.front() == '#') {
            comments.lines.push_back(strip_comment_marker(trimmed));
            lexer.scan_line(line);
            continue;
        }

        auto declaration = parse_declaration(trimmed);
        if (declaration) {
            OpenFunction function;
            function.declaration = *declaration;
            function.description = comments.joined();
            function.start_line = i + 1;
            comments.clear();
            looking_for_file_description = false;
            current = std::move(function);
            lexer.reset_depth();

            LineScan scan = lexer.scan_line(line);
            if (declaration->has_brace) {
                if (scan.closed) {
                    finish_function(i);
                }
            } else {
                awaiting_brace = true;
            }
            continue;
        }

        flush_comment_run();
        lexer.scan_line(line);
    }

    PassOutcome outcome;
    if (current && !awaiting_brace) {
        outcome.unterminated = true;
        outcome.declaration_index = current->start_line - 1;
        result.diagnostics.push_back({catalog::DiagnosticKind::MALFORMED_FUNCTION, path,
                                      current->start_line,
                                      "'" + current->declaration.name +
                                          "' has no closing brace before end of file"});
    } else {
        flush_comment_run();
    }
    return outcome;
}

void drop_redefinitions(const std::string& path, ExtractionResult& result) {
    std::unordered_map<std::string, std::size_t> last_definition;
    for (std::size_t i = 0; i < result.functions.size(); ++i) {
        last_definition[result.functions[i].name] = i;
    }

    std::vector<ParsedFunction> kept;
    kept.reserve(last_definition.size());
    for (std::size_t i = 0; i < result.functions.size(); ++i) {
        auto& function = result.functions[i];
        std::size_t winner = last_definition[function.name];
        if (winner != i) {
            result.diagnostics.push_back(
                {catalog::DiagnosticKind::DUPLICATE_FUNCTION, path, function.start_line,
                 "'" + function.name + "' is redefined on line " +
                     std::to_string(result.functions[winner].start_line)});
            continue;
        }
        kept.push_back(std::move(function));
    }
    result.functions = std::move(kept);
}

}  // namespace

LineScan ShellLexer::scan_line(std::string_view line) {
    LineScan scan;

    if (state_ == LexState::IN_HEREDOC) {
        scan_heredoc_line(line);
        return scan;
    }

    if (state_ == LexState::IN_COMMENT) {
        state_ = LexState::NORMAL;
    }

    bool escaped = false;
    const std::size_t size = line.size();

    for (std::size_t i = 0; i < size; ++i) {
        char c = line[i];

        if (state_ == LexState::IN_COMMENT) {
            break;
        }

        if (state_ == LexState::IN_SINGLE_QUOTE) {
            if (c == '\'') {
                state_ = LexState::NORMAL;
            }
            continue;
        }

        if (state_ == LexState::IN_ANSI_C_QUOTE || state_ == LexState::IN_DOUBLE_QUOTE) {
            char terminator = state_ == LexState::IN_DOUBLE_QUOTE ? '"' : '\'';
            if (escaped) {
                escaped = false;
            } else if (c == '\\') {
                escaped = true;
            } else if (c == terminator) {
                state_ = LexState::NORMAL;
            }
            continue;
        }

        if (escaped) {
            escaped = false;
            continue;
        }

        switch (c) {
            case '\\':
                escaped = true;
                break;
            case '\'':
                state_ = (i > 0 && line[i - 1] == '$') ? LexState::IN_ANSI_C_QUOTE
                                                       : LexState::IN_SINGLE_QUOTE;
                break;
            case '"':
                state_ = LexState::IN_DOUBLE_QUOTE;
                break;
            case '#':
                if (i == 0 || is_comment_boundary(line[i - 1])) {
                    state_ = LexState::IN_COMMENT;
                }
                break;
            case '(':
                if (i + 1 < size && line[i + 1] == '(') {
                    ++arith_depth_;
                    ++i;
                }
                break;
            case ')':
                if (arith_depth_ > 0 && i + 1 < size && line[i + 1] == ')') {
                    --arith_depth_;
                    ++i;
                }
                break;
            case '<':
                if (i + 1 < size && line[i + 1] == '<') {
                    if (i + 2 < size && line[i + 2] == '<') {
                        i += 2;
                    } else if (arith_depth_ > 0) {
                        ++i;
                    } else {
                        i = read_heredoc_operator(line, i + 2) - 1;
                    }
                }
                break;
            case '{':
                open(scan);
                break;
            case '}':
                close(scan);
                break;
            default:
                break;
        }
    }

    if (state_ == LexState::IN_COMMENT) {
        state_ = LexState::NORMAL;
    }
    arith_depth_ = 0;

    if (state_ == LexState::NORMAL && !pending_heredocs_.empty()) {
        active_heredoc_ = pending_heredocs_.front();
        pending_heredocs_.pop_front();
        state_ = LexState::IN_HEREDOC;
    }

    return scan;
}

void ShellLexer::scan_heredoc_line(std::string_view line) {
    std::string_view candidate = line;
    if (active_heredoc_.strip_tabs) {
        std::size_t pos = 0;
        while (pos < candidate.size() && candidate[pos] == '\t') {
            ++pos;
        }
        candidate = candidate.substr(pos);
    }

    if (candidate != active_heredoc_.delimiter) {
        return;
    }

    if (!pending_heredocs_.empty()) {
        active_heredoc_ = pending_heredocs_.front();
        pending_heredocs_.pop_front();
    } else {
        state_ = LexState::NORMAL;
    }
}

std::size_t ShellLexer::read_heredoc_operator(std::string_view line, std::size_t pos) {
    HereDoc heredoc;

    if (pos < line.size() && line[pos] == '-') {
        heredoc.strip_tabs = true;
        ++pos;
    }

    while (pos < line.size() && is_blank_char(line[pos])) {
        ++pos;
    }

    while (pos < line.size()) {
        char c = line[pos];
        if (c == '\'' || c == '"') {
            ++pos;
            while (pos < line.size() && line[pos] != c) {
                heredoc.delimiter += line[pos++];
            }
            if (pos < line.size()) {
                ++pos;
            }
            continue;
        }
        if (c == '\\') {
            ++pos;
            if (pos < line.size()) {
                heredoc.delimiter += line[pos++];
            }
            continue;
        }
        if (is_blank_char(c) || std::strchr(";|&<>()", c) != nullptr) {
            break;
        }
        heredoc.delimiter += c;
        ++pos;
    }

    if (!heredoc.delimiter.empty()) {
        pending_heredocs_.push_back(std::move(heredoc));
    }

    return pos;
}

void ShellLexer::open(LineScan& scan) {
    if (depth_ == 0) {
        scan.opened = true;
    }
    ++depth_;
}

void ShellLexer::close(LineScan& scan) {
    if (depth_ == 0) {
        return;
    }
    --depth_;
    if (depth_ == 0) {
        scan.closed = true;
    }
}

bool is_valid_function_name(std::string_view name) {
    if (name.empty()) {
        return false;
    }
    unsigned char first = static_cast<unsigned char>(name.front());
    if (!(std::isalpha(first) || first == '_')) {
        return false;
    }
    return std::all_of(name.begin() + 1, name.end(), [](char c) {
        unsigned char uc = static_cast<unsigned char>(c);
        return std::isalnum(uc) || uc == '_';
    });
}

std::optional<Declaration> parse_declaration(std::string_view trimmed_line) {
    std::string_view rest = trim_right(trimmed_line);
    bool keyword_form = false;

    if (starts_with(rest, "function") && rest.size() > 8 && is_blank_char(rest[8])) {
        keyword_form = true;
        rest = trim_left(rest.substr(8));
    }

    std::size_t name_end = 0;
    while (name_end < rest.size() && !is_blank_char(rest[name_end]) && rest[name_end] != '(') {
        if (is_name_breaking_char(rest[name_end])) {
            if (keyword_form && rest[name_end] == '{') {
                break;
            }
            return std::nullopt;
        }
        ++name_end;
    }

    if (name_end == 0) {
        return std::nullopt;
    }

    Declaration declaration;
    declaration.name = std::string(rest.substr(0, name_end));
    rest = trim_left(rest.substr(name_end));

    bool has_parens = false;
    if (!rest.empty() && rest.front() == '(') {
        rest = trim_left(rest.substr(1));
        if (rest.empty() || rest.front() != ')') {
            return std::nullopt;
        }
        rest = trim_left(rest.substr(1));
        has_parens = true;
    }

    if (!keyword_form && !has_parens) {
        return std::nullopt;
    }

    if (rest.empty() || rest.front() == '#') {
        declaration.has_brace = false;
    } else if (rest.front() == '{') {
        declaration.has_brace = true;
    } else {
        return std::nullopt;
    }

    declaration.name_valid = is_valid_function_name(declaration.name);
    return declaration;
}

std::string strip_comment_marker(std::string_view trimmed_line) {
    std::size_t pos = 0;
    while (pos < trimmed_line.size() && trimmed_line[pos] == '#') {
        ++pos;
    }
    if (pos < trimmed_line.size() && trimmed_line[pos] == ' ') {
        ++pos;
    }
    return std::string(trim_right(trimmed_line.substr(pos)));
}

ExtractionResult extract(const std::string& text, const std::string& path) {
    ExtractionResult result;
    const std::vector<std::string> lines = split_lines(text);

    std::size_t start = 0;
    bool first_pass = true;
    while (start < lines.size()) {
        PassOutcome outcome = run_pass(lines, start, first_pass, path, result);
        first_pass = false;
        if (!outcome.unterminated) {
            break;
        }
        lk_debug_msg("extractor: %s: unterminated function on line %zu, rescanning",
                     path.c_str(), outcome.declaration_index + 1);
        start = outcome.declaration_index + 1;
    }

    std::stable_sort(result.functions.begin(), result.functions.end(),
                     [](const ParsedFunction& a, const ParsedFunction& b) {
                         return a.start_line < b.start_line;
                     });
    drop_redefinitions(path, result);
    return result;
}

}  // namespace function_extractor
