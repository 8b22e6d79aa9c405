/*
  utf8_utils.cpp

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

#include "utils/utf8_utils.h"

#include <utf8proc.h>

namespace utf8_utils {

namespace {

constexpr std::int32_t kReplacementCharacter = 0xFFFD;

template <typename Transform>
std::vector<std::int32_t> decode_with(const std::string& str, Transform&& transform) {
    std::vector<std::int32_t> codepoints;
    codepoints.reserve(str.size());

    const auto* data = reinterpret_cast<const utf8proc_uint8_t*>(str.data());
    utf8proc_ssize_t len = static_cast<utf8proc_ssize_t>(str.size());
    utf8proc_ssize_t pos = 0;

    while (pos < len) {
        utf8proc_int32_t codepoint = 0;
        utf8proc_ssize_t bytes_read = utf8proc_iterate(data + pos, len - pos, &codepoint);
        if (bytes_read <= 0) {
            codepoints.push_back(kReplacementCharacter);
            pos += 1;
            continue;
        }
        codepoints.push_back(transform(codepoint));
        pos += bytes_read;
    }

    return codepoints;
}

}  // namespace

std::vector<std::int32_t> decode(const std::string& str) {
    return decode_with(str, [](utf8proc_int32_t codepoint) { return codepoint; });
}

std::vector<std::int32_t> decode_lowercase(const std::string& str) {
    return decode_with(str,
                       [](utf8proc_int32_t codepoint) { return utf8proc_tolower(codepoint); });
}

std::string to_lowercase(const std::string& str) {
    std::string result;
    result.reserve(str.size());
    for (std::int32_t codepoint : decode_lowercase(str)) {
        utf8proc_uint8_t buffer[4] = {0};
        utf8proc_ssize_t written = utf8proc_encode_char(codepoint, buffer);
        result.append(reinterpret_cast<const char*>(buffer), static_cast<size_t>(written));
    }
    return result;
}

size_t calculate_display_width(const std::string& str) {
    size_t width = 0;
    for (std::int32_t codepoint : decode(str)) {
        int char_width = utf8proc_charwidth(codepoint);
        if (char_width > 0) {
            width += static_cast<size_t>(char_width);
        }
    }
    return width;
}

bool is_alphanumeric(std::int32_t codepoint) {
    switch (utf8proc_category(codepoint)) {
        case UTF8PROC_CATEGORY_LU:
        case UTF8PROC_CATEGORY_LL:
        case UTF8PROC_CATEGORY_LT:
        case UTF8PROC_CATEGORY_LM:
        case UTF8PROC_CATEGORY_LO:
        case UTF8PROC_CATEGORY_ND:
            return true;
        default:
            return false;
    }
}

bool is_uppercase(std::int32_t codepoint) {
    return utf8proc_category(codepoint) == UTF8PROC_CATEGORY_LU;
}

}  // namespace utf8_utils
