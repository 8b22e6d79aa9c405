/*
  debug.cpp

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

#include "utils/debug.h"

#ifdef LK_ENABLE_DEBUG

#include <stdarg.h>
#include <stdio.h>
#include <stdlib.h>
#include <time.h>
#include <unistd.h>

#include <mutex>

#include "utils/lk_filesystem.h"

namespace {

std::chrono::steady_clock::time_point process_start() {
    static const auto start = std::chrono::steady_clock::now();
    return start;
}

bool env_is_one(const char* name) {
    const char* value = getenv(name);
    return value != nullptr && value[0] == '1' && value[1] == '\0';
}

// The open log file. Reopened when LK_DEBUG_FILE points somewhere else.
class LogSink {
   public:
    ~LogSink() {
        close();
    }

    void write(const std::string& path, const std::string& line) {
        std::lock_guard<std::mutex> lock(mutex_);
        FILE* out = stderr;
        if (!path.empty()) {
            if (path != path_) {
                close();
                path_ = path;
                file_ = fopen(path.c_str(), "a");
            }
            if (file_ != nullptr) {
                out = file_;
            }
        }
        (void)fputs(line.c_str(), out);
        (void)fflush(out);
    }

   private:
    void close() {
        if (file_ != nullptr) {
            (void)fclose(file_);
            file_ = nullptr;
        }
        path_.clear();
    }

    std::mutex mutex_;
    std::string path_;
    FILE* file_ = nullptr;
};

LogSink& sink() {
    static LogSink instance;
    return instance;
}

}  // namespace

bool lk_debug_enabled() {
    return env_is_one("LK_DEBUG");
}

std::string lk_debug_log_path() {
    const char* value = getenv("LK_DEBUG_FILE");
    if (value == nullptr || value[0] == '\0') {
        return std::string();
    }
    if (!env_is_one("LK_DEBUG_FILE")) {
        return value;
    }

    static const std::string cache_log = []() {
        if (!lk_filesystem::initialize_lk_directories()) {
            return std::string();
        }
        char filename[64];
        long long timestamp = static_cast<long long>(time(nullptr));
        if (snprintf(filename, sizeof(filename), "lk_debug_%lld.log", timestamp) < 0) {
            return std::string();
        }
        return (lk_filesystem::g_lk_cache_path() / filename).string();
    }();
    return cache_log;
}

void lk_debug_msg(const char* fmt, ...) {
    if (!lk_debug_enabled()) {
        return;
    }

    auto since_start = std::chrono::duration_cast<std::chrono::microseconds>(
                           std::chrono::steady_clock::now() - process_start())
                           .count();
    char prefix[64];
    (void)snprintf(prefix, sizeof(prefix), "[lk %ld +%.1fms] ", static_cast<long>(getpid()),
                   static_cast<double>(since_start) / 1000.0);

    va_list args;
    va_start(args, fmt);
    va_list measure;
    va_copy(measure, args);
    int length = vsnprintf(nullptr, 0, fmt, measure);
    va_end(measure);

    std::string message;
    if (length > 0) {
        message.resize(static_cast<std::size_t>(length) + 1);
        (void)vsnprintf(&message[0], message.size(), fmt, args);
        message.resize(static_cast<std::size_t>(length));
    }
    va_end(args);

    sink().write(lk_debug_log_path(), prefix + message + "\n");
}

PerformanceTracker::PerformanceTracker(const char* label)
    : label_(label), enabled_(lk_debug_enabled()) {
    if (enabled_) {
        start_time_ = std::chrono::steady_clock::now();
    }
}

PerformanceTracker::~PerformanceTracker() {
    if (!enabled_) {
        return;
    }
    auto microseconds = std::chrono::duration_cast<std::chrono::microseconds>(
                            std::chrono::steady_clock::now() - start_time_)
                            .count();
    lk_debug_msg("%s took %.3f ms", label_, static_cast<double>(microseconds) / 1000.0);
}

#endif
