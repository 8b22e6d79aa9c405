/*
  signal_handler.h

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

#include <signal.h>
#include <sys/types.h>

#include <atomic>

// Restores default dispositions and clears the signal mask in a forked child
// before it execs the interpreter.
void reset_child_signals();

// WEXITSTATUS for normal exits, 128 + signal number for signal deaths.
int extract_exit_code(int status);

// While alive, SIGINT and SIGQUIT are ignored by this process and SIGTERM and
// SIGHUP are forwarded to the registered child. Previous dispositions are
// restored on destruction. Only one instance may exist at a time.
// SIGTERM and SIGHUP stay blocked from construction until set_child, so the
// scope must be created before fork.
class ForwardingSignalScope {
   public:
    ForwardingSignalScope();
    ~ForwardingSignalScope();

    ForwardingSignalScope(const ForwardingSignalScope&) = delete;
    ForwardingSignalScope& operator=(const ForwardingSignalScope&) = delete;

    void set_child(pid_t pid);

   private:
    void release_forwarded_signals();

    sigset_t old_mask_{};
    struct sigaction old_int_{};
    struct sigaction old_quit_{};
    struct sigaction old_term_{};
    struct sigaction old_hup_{};
    bool active_ = false;
    bool forwarded_blocked_ = false;
};
