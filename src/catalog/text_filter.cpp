/*
  text_filter.cpp

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

#include "catalog/text_filter.h"

#include <sys/stat.h>

#include <algorithm>
#include <cerrno>

#include "utils/lk_filesystem.h"

namespace text_filter {

namespace {

bool starts_with_bytes(std::string_view sample, std::string_view magic) {
    return sample.size() >= magic.size() && sample.compare(0, magic.size(), magic) == 0;
}

Verdict rejected(std::optional<catalog::DiagnosticKind> kind, std::string reason) {
    Verdict verdict;
    verdict.eligible = false;
    verdict.kind = kind;
    verdict.skip_reason = std::move(reason);
    return verdict;
}

}  // namespace

ContentType inspect(std::string_view sample) {
    static const std::string_view kElfMagic("\x7f" "ELF", 4);
    static const std::string_view kMachO64("\xcf\xfa\xed\xfe", 4);
    static const std::string_view kMachO32("\xce\xfa\xed\xfe", 4);
    static const std::string_view kMachOFat("\xca\xfe\xba\xbe", 4);

    if (starts_with_bytes(sample, kElfMagic) || starts_with_bytes(sample, kMachO64) ||
        starts_with_bytes(sample, kMachO32) || starts_with_bytes(sample, kMachOFat)) {
        return ContentType::BINARY;
    }

    if (sample.find('\0') != std::string_view::npos) {
        return ContentType::BINARY;
    }

    return ContentType::TEXT;
}

Verdict check_file(const std::filesystem::path& path, const FilterOptions& options) {
    struct stat info{};
    if (::stat(path.c_str(), &info) != 0) {
        return rejected(catalog::DiagnosticKind::UNREADABLE_FILE,
                        "cannot stat: " + lk_filesystem::describe_errno(errno));
    }

    if (S_ISDIR(info.st_mode)) {
        return rejected(std::nullopt, "directory");
    }

    // FIFOs and devices would block or never end when read.
    if (!S_ISREG(info.st_mode)) {
        return rejected(std::nullopt, "not a regular file");
    }

    if (info.st_size == 0) {
        return rejected(catalog::DiagnosticKind::EMPTY_FILE, "empty file");
    }

    if (options.require_executable && (info.st_mode & (S_IXUSR | S_IXGRP | S_IXOTH)) == 0) {
        return rejected(std::nullopt, "not executable");
    }

    auto sample = lk_filesystem::read_file_prefix(path.string(), kInspectBytes);
    if (sample.is_error()) {
        return rejected(catalog::DiagnosticKind::UNREADABLE_FILE, sample.error());
    }

    if (inspect(sample.value()) == ContentType::BINARY) {
        return rejected(catalog::DiagnosticKind::BINARY_FILE, "binary content");
    }

    Verdict verdict;
    verdict.eligible = true;
    return verdict;
}

const std::vector<std::string>& default_ignored_directory_names() {
    static const std::vector<std::string> names = {
        ".git", ".hg", ".svn", ".github", ".vscode", ".idea", "target", "node_modules"};
    return names;
}

bool is_ignored_directory_name(const std::string& name) {
    const auto& names = default_ignored_directory_names();
    return std::find(names.begin(), names.end(), name) != names.end();
}

}  // namespace text_filter
