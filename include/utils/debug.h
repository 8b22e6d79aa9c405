/*
  debug.h

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

#ifdef LK_ENABLE_DEBUG

#include <chrono>
#include <string>

// LK_DEBUG=1 turns logging on. Lines go to stderr unless LK_DEBUG_FILE is
// set: "1" selects ~/.cache/lk/lk_debug_<timestamp>.log, any other value is
// used as the log file path. Both variables are read on every call.
bool lk_debug_enabled();

// Empty when logging goes to stderr.
std::string lk_debug_log_path();

// printf-style. Each line is prefixed with "[lk <pid> +<ms>ms]", the time
// since the first debug call in this process.
void lk_debug_msg(const char* fmt, ...) __attribute__((format(printf, 1, 2)));

// Logs how long the enclosing scope took.
class PerformanceTracker {
   public:
    explicit PerformanceTracker(const char* label);
    ~PerformanceTracker();

    PerformanceTracker(const PerformanceTracker&) = delete;
    PerformanceTracker& operator=(const PerformanceTracker&) = delete;

   private:
    const char* label_;
    bool enabled_;
    std::chrono::steady_clock::time_point start_time_;
};

#else

#include <string>

inline bool lk_debug_enabled() {
    return false;
}

inline std::string lk_debug_log_path() {
    return std::string();
}

inline void lk_debug_msg(const char* fmt, ...) {
    (void)fmt;
}

class PerformanceTracker {
   public:
    explicit PerformanceTracker(const char* label) {
        (void)label;
    }
};

#endif
