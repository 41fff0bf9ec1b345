#pragma once

#include <execinfo.h>
#include <unistd.h>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <cstring>

namespace rowfeed {

// stdout carries batches, so diagnostics go to stderr
inline void printBacktrace(int signo, [[maybe_unused]] siginfo_t* si, [[maybe_unused]] void* context) {
    void* frames[64];

    char message[256];
    ::snprintf(message, sizeof(message), "rowfeed: process %d received signal %d (%s). Backtrace:\n",
               static_cast<int>(::getpid()), signo, ::strsignal(signo));
    ::write(STDERR_FILENO, message, ::strnlen(message, sizeof(message)));
    // not async-signal-safe, acceptable on the way out
    auto size = ::backtrace(frames, 64);
    ::backtrace_symbols_fd(frames, size, STDERR_FILENO);
    _exit(EXIT_FAILURE);
}

// consumer closed the pipe, nothing left to report
inline void exitOnBrokenPipe(int) {
    _exit(EXIT_SUCCESS);
}

inline void initializeSignalHandlers() {
    struct sigaction action;
    std::memset(&action, 0, sizeof(action));
    action.sa_sigaction = printBacktrace;
    action.sa_flags = SA_SIGINFO | SA_RESETHAND;
    sigemptyset(&action.sa_mask);
    ::sigaction(SIGSEGV, &action, nullptr);
    ::sigaction(SIGABRT, &action, nullptr);
    ::sigaction(SIGILL, &action, nullptr);
    ::sigaction(SIGFPE, &action, nullptr);
    ::sigaction(SIGBUS, &action, nullptr);

    struct sigaction pipeAction;
    std::memset(&pipeAction, 0, sizeof(pipeAction));
    pipeAction.sa_handler = exitOnBrokenPipe;
    sigemptyset(&pipeAction.sa_mask);
    ::sigaction(SIGPIPE, &pipeAction, nullptr);
}

}  // namespace rowfeed
