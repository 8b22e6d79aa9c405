/*
  lk_config.h

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
#include <vector>

#include <nlohmann/json.hpp>

#include "error_out.h"
#include "utils/lk_filesystem.h"

namespace lk_config {

enum class Mode : std::uint8_t {
    LIST,
    FUZZY
};

const char* mode_name(Mode mode);
std::optional<Mode> parse_mode(const std::string& text);

constexpr int kDefaultFuzzyLines = 7;

struct Settings {
    Mode default_mode = Mode::LIST;
    std::vector<std::string> roots = {"."};
    std::vector<std::string> ignore;
    std::string temp_dir;
    std::string shell;
    int fuzzy_lines = kDefaultFuzzyLines;
    bool include_private_functions = false;
    bool require_executable = false;
    bool write_history = false;

    // Keys this version does not know about, written back unchanged on save.
    nlohmann::json extra = nlohmann::json::object();
};

// $LK_CONFIG, else <config dir>/lk/config.json.
std::filesystem::path config_file_path();

ErrorOr<Settings> from_json(const nlohmann::json& document);
nlohmann::json to_json(const Settings& settings);

ErrorOr<Settings> parse(const std::string& text);

// A missing file is created with defaults. A corrupt file is reported and
// the defaults are used without overwriting it.
Settings load(const std::filesystem::path& path);

lk_filesystem::Result<void> save(const Settings& settings, const std::filesystem::path& path);

}  // namespace lk_config
