/*
  catalog.h

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
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "catalog/diagnostic.h"
#include "error_out.h"

namespace catalog {

struct Function {
    std::string name;
    // Index of the owning script in Catalog::scripts().
    std::size_t script_index = 0;
    std::optional<std::string> description;
    std::size_t start_line = 0;
    std::size_t end_line = 0;
    // `<root-relative path>:<name>`, suffixed with `@<root>` when two roots
    // contain the same relative path.
    std::string id;
    std::size_t discovery_index = 0;
};

struct ScriptFile {
    std::filesystem::path path;
    std::string relative_path;
    std::string display_name;
    std::optional<std::string> description;
    std::vector<Function> functions;
    std::size_t root_index = 0;
};

struct BuildOptions {
    std::vector<std::filesystem::path> roots;
    // Paths relative to each root that are skipped entirely.
    std::vector<std::string> ignore;
    bool include_private_functions = false;
    bool require_executable = false;
};

class Catalog {
   public:
    const std::vector<ScriptFile>& scripts() const {
        return scripts_;
    }
    const std::vector<Diagnostic>& diagnostics() const {
        return diagnostics_;
    }

    // All functions in discovery order.
    std::vector<const Function*> functions() const;
    std::size_t function_count() const;
    bool empty() const {
        return scripts_.empty();
    }

    const ScriptFile& script_of(const Function& function) const;

    // Looks scripts up by relative path, file name, or file name without
    // its extension, in that order of preference. Returns every match of the
    // first kind that matches anything; more than one means `name` is ambiguous.
    std::vector<const ScriptFile*> find_scripts(const std::string& name) const;

   private:
    friend class CatalogBuilder;

    std::vector<ScriptFile> scripts_;
    std::vector<Diagnostic> diagnostics_;
};

// Validates every root before walking any of them. A missing root is a
// CONFIGURATION_ERROR; problems with individual files become diagnostics.
ErrorOr<Catalog> build(const BuildOptions& options);

bool has_shell_shebang(const std::string& text);

}  // namespace catalog
