/*
  signal_handler.cpp

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

#include "exec/signal_handler.h"

#include <sys/wait.h>

#include "utils/debug.h"

namespace {

std::atomic<pid_t> g_forward_target{0};
std::atomic<bool> g_scope_active{false};

void forward_signal(int signum) {
    pid_t target = g_forward_target.load(std::memory_order_acquire);
    if (target > 0) {
        (void)kill(target, signum);
    }
}

bool install(int signum, void (*handler)(int), struct sigaction* old_action) {
    struct sigaction sa{};
    sa.sa_handler = handler;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = SA_RESTART;
    return sigaction(signum, &sa, old_action) == 0;
}

}  // namespace

void reset_child_signals() {
    (void)signal(SIGINT, SIG_DFL);
    (void)signal(SIGQUIT, SIG_DFL);
    (void)signal(SIGTSTP, SIG_DFL);
    (void)signal(SIGTTIN, SIG_DFL);
    (void)signal(SIGTTOU, SIG_DFL);
    (void)signal(SIGCHLD, SIG_DFL);
    (void)signal(SIGTERM, SIG_DFL);
    (void)signal(SIGHUP, SIG_DFL);
    (void)signal(SIGPIPE, SIG_DFL);

    sigset_t set{};
    sigemptyset(&set);
    sigprocmask(SIG_SETMASK, &set, nullptr);
}

int extract_exit_code(int status) {
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
        return 128 + WTERMSIG(status);
    }
    return 1;
}

ForwardingSignalScope::ForwardingSignalScope() {
    if (g_scope_active.exchange(true)) {
        lk_debug_msg("signal scope already active, not installing handlers");
        return;
    }
    g_forward_target.store(0, std::memory_order_release);

    bool ok = install(SIGINT, SIG_IGN, &old_int_);
    ok = install(SIGQUIT, SIG_IGN, &old_quit_) && ok;
    ok = install(SIGTERM, forward_signal, &old_term_) && ok;
    ok = install(SIGHUP, forward_signal, &old_hup_) && ok;
    if (!ok) {
        lk_debug_msg("failed to install one or more forwarding signal handlers");
    }

    // Held until set_child so a signal arriving before fork still reaches the child.
    sigset_t forwarded;
    sigemptyset(&forwarded);
    sigaddset(&forwarded, SIGTERM);
    sigaddset(&forwarded, SIGHUP);
    forwarded_blocked_ = sigprocmask(SIG_BLOCK, &forwarded, &old_mask_) == 0;
    active_ = true;
}

ForwardingSignalScope::~ForwardingSignalScope() {
    if (!active_) {
        return;
    }
    release_forwarded_signals();
    (void)sigaction(SIGINT, &old_int_, nullptr);
    (void)sigaction(SIGQUIT, &old_quit_, nullptr);
    (void)sigaction(SIGTERM, &old_term_, nullptr);
    (void)sigaction(SIGHUP, &old_hup_, nullptr);
    g_forward_target.store(0, std::memory_order_release);
    g_scope_active.store(false);
}

void ForwardingSignalScope::set_child(pid_t pid) {
    if (active_) {
        g_forward_target.store(pid, std::memory_order_release);
        release_forwarded_signals();
    }
}

void ForwardingSignalScope::release_forwarded_signals() {
    if (forwarded_blocked_) {
        (void)sigprocmask(SIG_SETMASK, &old_mask_, nullptr);
        forwarded_blocked_ = false;
    }
}
