/*
  lk_filesystem.h

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

#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>

#include <cstdint>
#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace lk_filesystem {

struct Error {
    std::string message;
    explicit Error(const std::string& msg) : message(msg) {
    }
};

template <typename T>
class Result {
   public:
    explicit Result(T value) : value_(std::move(value)), has_value_(true) {
    }
    explicit Result(const Error& error) : error_(error.message), has_value_(false) {
    }

    static Result<T> ok(T value) {
        return Result<T>(std::move(value));
    }
    static Result<T> error(const std::string& message) {
        return Result<T>(Error(message));
    }

    bool is_ok() const {
        return has_value_;
    }
    bool is_error() const {
        return !has_value_;
    }

    const T& value() const {
        if (!has_value_)
            throw std::runtime_error("Attempted to access value of error Result");
        return value_;
    }

    T& value() {
        if (!has_value_)
            throw std::runtime_error("Attempted to access value of error Result");
        return value_;
    }

    const std::string& error() const {
        if (has_value_)
            throw std::runtime_error("Attempted to access error of ok Result");
        return error_;
    }

   private:
    T value_{};
    std::string error_;
    bool has_value_;
};

template <>
class Result<void> {
   public:
    Result() : has_value_(true) {
    }
    explicit Result(const Error& error) : error_(error.message), has_value_(false) {
    }

    static Result<void> ok() {
        return Result<void>();
    }
    static Result<void> error(const std::string& message) {
        return Result<void>(Error(message));
    }

    bool is_ok() const {
        return has_value_;
    }
    bool is_error() const {
        return !has_value_;
    }

    const std::string& error() const {
        if (has_value_)
            throw std::runtime_error("Attempted to access error of ok Result");
        return error_;
    }

   private:
    std::string error_;
    bool has_value_;
};

std::string describe_errno(int err);

Result<int> safe_open(const std::string& path, int flags, mode_t mode = 0644);
void safe_close(int fd);
Result<void> create_pipe_cloexec(int pipe_fds[2]);
void close_pipe(int pipe_fds[2]);

Result<void> write_all(int fd, std::string_view data);
Result<std::string> read_file_content(const std::string& path);
Result<std::string> read_file_prefix(const std::string& path, std::size_t max_bytes);
Result<void> write_file_content(const std::string& path, const std::string& content);

// Creates `<directory>/<prefix><random><suffix>` with O_EXCL and the given mode.
// The returned descriptor is open for writing; the caller owns both it and the file.
struct UniqueFile {
    std::string path;
    int fd = -1;
};
Result<UniqueFile> create_unique_file(const std::filesystem::path& directory,
                                      const std::string& prefix, const std::string& suffix,
                                      mode_t mode = 0600);
std::string random_suffix(std::size_t length = 10);

// Identity of a directory after symlink resolution, used for cycle detection.
struct DirectoryIdentity {
    std::uint64_t device = 0;
    std::uint64_t inode = 0;

    bool operator<(const DirectoryIdentity& other) const {
        return device != other.device ? device < other.device : inode < other.inode;
    }
};
std::optional<DirectoryIdentity> directory_identity(const std::filesystem::path& path);

bool is_executable_file(const std::filesystem::path& path);
std::string find_executable_in_path(const std::string& name);

const std::filesystem::path& g_user_home_path();
const std::filesystem::path& g_lk_config_path();
const std::filesystem::path& g_lk_cache_path();
std::filesystem::path default_temp_directory();

bool initialize_lk_directories();

}  // namespace lk_filesystem
