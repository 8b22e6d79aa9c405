/*
  colors.cpp

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

#include "utils/colors.h"

#include <unistd.h>

#include <algorithm>
#include <cctype>
#include <cstdlib>

namespace colors {

namespace {
bool g_colors_enabled = true;
}  // namespace

ColorCapability detect_color_capability() {
    const char* no_color = std::getenv("NO_COLOR");
    const char* force_color = std::getenv("FORCE_COLOR");
    const char* colorterm = std::getenv("COLORTERM");
    const char* term = std::getenv("TERM");

    if (no_color != nullptr && no_color[0] != '\0') {
        return ColorCapability::NO_COLOR;
    }

    if (force_color != nullptr && std::string(force_color) == "true") {
        return ColorCapability::TRUE_COLOR;
    }

    if (colorterm != nullptr) {
        std::string colorterm_str = colorterm;
        std::transform(colorterm_str.begin(), colorterm_str.end(), colorterm_str.begin(),
                       [](unsigned char c) { return std::tolower(c); });

        if (colorterm_str.find("truecolor") != std::string::npos ||
            colorterm_str.find("24bit") != std::string::npos) {
            return ColorCapability::TRUE_COLOR;
        }
    }

    if (term != nullptr) {
        std::string term_str = term;
        if (term_str == "dumb") {
            return ColorCapability::NO_COLOR;
        }
        if (term_str.find("256") != std::string::npos ||
            term_str.find("xterm") != std::string::npos) {
            return ColorCapability::XTERM_256_COLOR;
        }
    }

    return ColorCapability::BASIC_COLOR;
}

void set_colors_enabled(bool enabled) {
    g_colors_enabled = enabled;
}

bool colors_enabled() {
    return g_colors_enabled && detect_color_capability() != ColorCapability::NO_COLOR;
}

bool stdout_colors_enabled() {
    return colors_enabled() && isatty(STDOUT_FILENO) != 0;
}

bool stderr_colors_enabled() {
    return colors_enabled() && isatty(STDERR_FILENO) != 0;
}

std::string paint(const std::string& text, const char* color, bool enabled) {
    if (!enabled) {
        return text;
    }
    return std::string(color) + text + RESET;
}

}  // namespace colors
