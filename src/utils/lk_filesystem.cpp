/*
  lk_filesystem.cpp

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

#include "utils/lk_filesystem.h"

#include <fcntl.h>

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <random>
#include <sstream>
#include <system_error>

namespace lk_filesystem {

namespace fs = std::filesystem;

namespace {

constexpr int kMaxUniqueFileAttempts = 16;

fs::path resolve_config_root() {
    const char* lk_config = std::getenv("LK_CONFIG");
    if (lk_config != nullptr && lk_config[0] != '\0') {
        return fs::path(lk_config).parent_path();
    }
    const char* xdg = std::getenv("XDG_CONFIG_HOME");
    if (xdg != nullptr && xdg[0] != '\0') {
        return fs::path(xdg) / "lk";
    }
    return g_user_home_path() / ".config" / "lk";
}

}  // namespace

std::string describe_errno(int err) {
    return std::system_category().message(err);
}

Result<int> safe_open(const std::string& path, int flags, mode_t mode) {
    int fd = ::open(path.c_str(), flags, mode);
    if (fd == -1) {
        return Result<int>::error("Failed to open file '" + path + "': " + describe_errno(errno));
    }
    return Result<int>::ok(fd);
}

void safe_close(int fd) {
    if (fd >= 0) {
        ::close(fd);
    }
}

Result<void> create_pipe_cloexec(int pipe_fds[2]) {
#ifdef O_CLOEXEC
    if (::pipe2(pipe_fds, O_CLOEXEC) == 0) {
        return Result<void>::ok();
    }
    if (errno != ENOSYS && errno != EINVAL) {
        return Result<void>::error("Failed to create pipe: " + describe_errno(errno));
    }
#endif
    if (::pipe(pipe_fds) == -1) {
        return Result<void>::error("Failed to create pipe: " + describe_errno(errno));
    }
    for (int i = 0; i < 2; ++i) {
        int flags = ::fcntl(pipe_fds[i], F_GETFD);
        if (flags == -1 || ::fcntl(pipe_fds[i], F_SETFD, flags | FD_CLOEXEC) == -1) {
            int saved_errno = errno;
            close_pipe(pipe_fds);
            return Result<void>::error("Failed to set close-on-exec on pipe: " +
                                       describe_errno(saved_errno));
        }
    }
    return Result<void>::ok();
}

void close_pipe(int pipe_fds[2]) {
    safe_close(pipe_fds[0]);
    safe_close(pipe_fds[1]);
    pipe_fds[0] = -1;
    pipe_fds[1] = -1;
}

Result<void> write_all(int fd, std::string_view data) {
    const char* cursor = data.data();
    std::size_t remaining = data.size();

    while (remaining > 0) {
        ssize_t written = ::write(fd, cursor, remaining);
        if (written == -1) {
            if (errno == EINTR) {
                continue;
            }
            return Result<void>::error("Failed to write to file descriptor " + std::to_string(fd) +
                                       ": " + describe_errno(errno));
        }
        if (written == 0) {
            return Result<void>::error("Short write to file descriptor " + std::to_string(fd));
        }
        cursor += written;
        remaining -= static_cast<std::size_t>(written);
    }

    return Result<void>::ok();
}

Result<std::string> read_file_content(const std::string& path) {
    auto open_result = safe_open(path, O_RDONLY);
    if (open_result.is_error()) {
        return Result<std::string>::error(open_result.error());
    }

    int fd = open_result.value();
    std::string content;
    char buffer[4096];
    ssize_t bytes_read;

    while ((bytes_read = ::read(fd, buffer, sizeof(buffer))) != 0) {
        if (bytes_read < 0) {
            if (errno == EINTR) {
                continue;
            }
            int saved_errno = errno;
            safe_close(fd);
            return Result<std::string>::error("Failed to read from file '" + path +
                                              "': " + describe_errno(saved_errno));
        }
        content.append(buffer, static_cast<std::size_t>(bytes_read));
    }

    safe_close(fd);
    return Result<std::string>::ok(content);
}

Result<std::string> read_file_prefix(const std::string& path, std::size_t max_bytes) {
    auto open_result = safe_open(path, O_RDONLY);
    if (open_result.is_error()) {
        return Result<std::string>::error(open_result.error());
    }

    int fd = open_result.value();
    std::string content(max_bytes, '\0');
    std::size_t filled = 0;

    while (filled < max_bytes) {
        ssize_t bytes_read = ::read(fd, &content[filled], max_bytes - filled);
        if (bytes_read == 0) {
            break;
        }
        if (bytes_read < 0) {
            if (errno == EINTR) {
                continue;
            }
            int saved_errno = errno;
            safe_close(fd);
            return Result<std::string>::error("Failed to read from file '" + path +
                                              "': " + describe_errno(saved_errno));
        }
        filled += static_cast<std::size_t>(bytes_read);
    }

    safe_close(fd);
    content.resize(filled);
    return Result<std::string>::ok(content);
}

Result<void> write_file_content(const std::string& path, const std::string& content) {
    auto open_result = safe_open(path, O_WRONLY | O_CREAT | O_TRUNC, 0644);
    if (open_result.is_error()) {
        return Result<void>::error(open_result.error());
    }

    int fd = open_result.value();
    auto write_result = write_all(fd, std::string_view{content});
    safe_close(fd);

    if (write_result.is_error()) {
        return Result<void>::error("Failed to write file '" + path + "': " + write_result.error());
    }

    return Result<void>::ok();
}

std::string random_suffix(std::size_t length) {
    static const char kAlphabet[] =
        "abcdefghijklmnopqrstuvwxyzABCDEFGHIJKLMNOPQRSTUVWXYZ0123456789_-";
    static thread_local std::mt19937_64 engine{std::random_device{}()};
    std::uniform_int_distribution<std::size_t> pick(0, sizeof(kAlphabet) - 2);

    std::string suffix;
    suffix.reserve(length);
    for (std::size_t i = 0; i < length; ++i) {
        suffix.push_back(kAlphabet[pick(engine)]);
    }
    return suffix;
}

Result<UniqueFile> create_unique_file(const fs::path& directory, const std::string& prefix,
                                      const std::string& suffix, mode_t mode) {
    std::string last_error;
    for (int attempt = 0; attempt < kMaxUniqueFileAttempts; ++attempt) {
        std::string candidate = (directory / (prefix + random_suffix() + suffix)).string();
        int fd = ::open(candidate.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, mode);
        if (fd != -1) {
            UniqueFile file;
            file.path = candidate;
            file.fd = fd;
            return Result<UniqueFile>::ok(file);
        }
        if (errno != EEXIST) {
            return Result<UniqueFile>::error("Failed to create file '" + candidate +
                                             "': " + describe_errno(errno));
        }
        last_error = candidate;
    }
    return Result<UniqueFile>::error("Failed to find an unused file name in '" +
                                     directory.string() + "' (last tried '" + last_error + "')");
}

std::optional<DirectoryIdentity> directory_identity(const fs::path& path) {
    struct stat info{};
    if (::stat(path.c_str(), &info) != 0 || !S_ISDIR(info.st_mode)) {
        return std::nullopt;
    }
    DirectoryIdentity identity;
    identity.device = static_cast<std::uint64_t>(info.st_dev);
    identity.inode = static_cast<std::uint64_t>(info.st_ino);
    return identity;
}

bool is_executable_file(const fs::path& path) {
    struct stat info{};
    if (::stat(path.c_str(), &info) != 0 || !S_ISREG(info.st_mode)) {
        return false;
    }
    return (info.st_mode & (S_IXUSR | S_IXGRP | S_IXOTH)) != 0;
}

std::string find_executable_in_path(const std::string& name) {
    if (name.find('/') != std::string::npos) {
        return is_executable_file(name) ? name : std::string();
    }

    const char* path_env = std::getenv("PATH");
    if (path_env == nullptr) {
        return {};
    }

    std::stringstream ss(path_env);
    std::string dir;
    while (std::getline(ss, dir, ':')) {
        if (dir.empty()) {
            continue;
        }
        fs::path candidate = fs::path(dir) / name;
        if (is_executable_file(candidate)) {
            return candidate.string();
        }
    }
    return {};
}

const fs::path& g_user_home_path() {
    static const fs::path home = []() {
        const char* value = std::getenv("HOME");
        if (value == nullptr || value[0] == '\0') {
            return fs::path("/tmp");
        }
        return fs::path(value);
    }();
    return home;
}

const fs::path& g_lk_config_path() {
    static const fs::path path = resolve_config_root();
    return path;
}

const fs::path& g_lk_cache_path() {
    static const fs::path path = []() {
        const char* xdg = std::getenv("XDG_CACHE_HOME");
        if (xdg != nullptr && xdg[0] != '\0') {
            return fs::path(xdg) / "lk";
        }
        return g_user_home_path() / ".cache" / "lk";
    }();
    return path;
}

fs::path default_temp_directory() {
    std::error_code ec;
    fs::path temp = fs::temp_directory_path(ec);
    if (ec || temp.empty()) {
        return fs::path("/tmp");
    }
    return temp;
}

bool initialize_lk_directories() {
    std::error_code ec;
    fs::create_directories(g_lk_config_path(), ec);
    if (ec) {
        return false;
    }
    fs::create_directories(g_lk_cache_path(), ec);
    return !ec;
}

}  // namespace lk_filesystem
