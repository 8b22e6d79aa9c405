/*
  lk_config.cpp

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

#include "config/lk_config.h"

#include <cstdlib>
#include <system_error>

#include "utils/debug.h"

namespace lk_config {

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

ErrorOr<Settings> invalid(const std::string& key, const std::string& expected) {
    return ErrorOr<Settings>::error(ErrorInfo(ErrorType::CONFIGURATION_ERROR, "config",
                                              "'" + key + "' must be " + expected));
}

bool read_string_list(const json& value, std::vector<std::string>& out) {
    if (!value.is_array()) {
        return false;
    }
    out.clear();
    for (const auto& item : value) {
        if (!item.is_string()) {
            return false;
        }
        out.push_back(item.get<std::string>());
    }
    return true;
}

}  // namespace

const char* mode_name(Mode mode) {
    switch (mode) {
        case Mode::LIST:
            return "list";
        case Mode::FUZZY:
            return "fuzzy";
    }
    return "list";
}

std::optional<Mode> parse_mode(const std::string& text) {
    if (text == "list") {
        return Mode::LIST;
    }
    if (text == "fuzzy") {
        return Mode::FUZZY;
    }
    return std::nullopt;
}

fs::path config_file_path() {
    const char* explicit_path = std::getenv("LK_CONFIG");
    if (explicit_path != nullptr && explicit_path[0] != '\0') {
        return fs::path(explicit_path);
    }
    return lk_filesystem::g_lk_config_path() / "config.json";
}

ErrorOr<Settings> from_json(const json& document) {
    if (!document.is_object()) {
        return ErrorOr<Settings>::error(ErrorInfo(ErrorType::CONFIGURATION_ERROR, "config",
                                                  "top level must be a JSON object"));
    }

    Settings settings;
    for (auto it = document.begin(); it != document.end(); ++it) {
        const std::string& key = it.key();
        const json& value = it.value();

        if (key == "default_mode") {
            auto mode = value.is_string() ? parse_mode(value.get<std::string>()) : std::nullopt;
            if (!mode) {
                return invalid(key, "\"list\" or \"fuzzy\"");
            }
            settings.default_mode = *mode;
        } else if (key == "roots") {
            if (!read_string_list(value, settings.roots)) {
                return invalid(key, "an array of strings");
            }
        } else if (key == "ignore") {
            if (!read_string_list(value, settings.ignore)) {
                return invalid(key, "an array of strings");
            }
        } else if (key == "temp_dir" || key == "shell") {
            if (!value.is_string()) {
                return invalid(key, "a string");
            }
            (key == "shell" ? settings.shell : settings.temp_dir) = value.get<std::string>();
        } else if (key == "fuzzy_lines") {
            if (!value.is_number_integer() || value.get<int>() < 1) {
                return invalid(key, "a positive integer");
            }
            settings.fuzzy_lines = value.get<int>();
        } else if (key == "include_private_functions" || key == "require_executable" ||
                   key == "write_history") {
            if (!value.is_boolean()) {
                return invalid(key, "true or false");
            }
            bool flag = value.get<bool>();
            if (key == "include_private_functions") {
                settings.include_private_functions = flag;
            } else if (key == "require_executable") {
                settings.require_executable = flag;
            } else {
                settings.write_history = flag;
            }
        } else {
            settings.extra[key] = value;
        }
    }
    return ErrorOr<Settings>::ok(std::move(settings));
}

json to_json(const Settings& settings) {
    json document = settings.extra.is_object() ? settings.extra : json::object();
    document["default_mode"] = mode_name(settings.default_mode);
    document["roots"] = settings.roots;
    document["ignore"] = settings.ignore;
    document["temp_dir"] = settings.temp_dir;
    document["shell"] = settings.shell;
    document["fuzzy_lines"] = settings.fuzzy_lines;
    document["include_private_functions"] = settings.include_private_functions;
    document["require_executable"] = settings.require_executable;
    document["write_history"] = settings.write_history;
    return document;
}

ErrorOr<Settings> parse(const std::string& text) {
    try {
        return from_json(json::parse(text));
    } catch (const json::exception& e) {
        return ErrorOr<Settings>::error(
            ErrorInfo(ErrorType::CONFIGURATION_ERROR, "config",
                      std::string("invalid JSON: ") + e.what()));
    }
}

Settings load(const fs::path& path) {
    std::error_code ec;
    if (!fs::exists(path, ec)) {
        Settings defaults;
        auto saved = save(defaults, path);
        if (saved.is_error()) {
            lk_debug_msg("config: could not create %s: %s", path.c_str(), saved.error().c_str());
        } else {
            lk_debug_msg("config: created %s with defaults", path.c_str());
        }
        return defaults;
    }

    auto content = lk_filesystem::read_file_content(path.string());
    if (content.is_error()) {
        print_error(ErrorInfo(ErrorType::CONFIGURATION_ERROR, ErrorSeverity::WARNING, "config",
                              content.error() + "; using defaults"));
        return Settings{};
    }

    auto parsed = parse(content.value());
    if (parsed.is_error()) {
        ErrorInfo error = parsed.error();
        error.severity = ErrorSeverity::WARNING;
        error.message = path.string() + ": " + error.message + "; using defaults";
        print_error(error);
        return Settings{};
    }

    lk_debug_msg("config: loaded %s", path.c_str());
    return parsed.value();
}

lk_filesystem::Result<void> save(const Settings& settings, const fs::path& path) {
    std::error_code ec;
    if (path.has_parent_path()) {
        fs::create_directories(path.parent_path(), ec);
        if (ec) {
            return lk_filesystem::Result<void>::error("Failed to create directory '" +
                                                      path.parent_path().string() +
                                                      "': " + ec.message());
        }
    }
    return lk_filesystem::write_file_content(path.string(), to_json(settings).dump(2) + "\n");
}

}  // namespace lk_config
