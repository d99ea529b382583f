#pragma once
#include <chrono>
#include <climits>
#include <string>
#include <iostream>
#include <stdexcept>

#if defined(_WIN32)
  #include <windows.h>
#else
  #include <cerrno>
  #include <poll.h>
  #include <termios.h>
  #include <unistd.h>
#endif

#if !defined(_WIN32)
// True once fd has data (or EOF) to read, false if timeout elapsed first.
inline bool wait_readable(int fd, std::chrono::milliseconds timeout) {
    using Clock = std::chrono::steady_clock;
    const auto start = Clock::now();
    for (;;) {
        auto left = timeout - std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - start);
        if (left < std::chrono::milliseconds::zero()) left = std::chrono::milliseconds::zero();
        const int ms = left.count() > INT_MAX ? INT_MAX : static_cast<int>(left.count());

        pollfd pfd{};
        pfd.fd = fd;
        pfd.events = POLLIN;
        int rc = ::poll(&pfd, 1, ms);
        if (rc > 0) return true;
        if (rc == 0) {
            if (ms == INT_MAX) continue; // clamped wait, more time remains
            return false;
        }
        if (errno != EINTR) throw std::runtime_error("poll on input failed");
    }
}
#endif

// Wait for the user to type something. Returns false when the timeout
// passes with no input. Non-interactive stdin is always reported ready
// since buffered data may already sit in std::cin.
inline bool wait_for_input(std::chrono::milliseconds timeout) {
#if defined(_WIN32)
    HANDLE hStdin = GetStdHandle(STD_INPUT_HANDLE);
    DWORD mode = 0;
    if (!GetConsoleMode(hStdin, &mode)) return true;
    if (std::cin.rdbuf()->in_avail() > 0) return true;
    const DWORD ms = timeout.count() >= static_cast<long long>(INFINITE)
                         ? INFINITE - 1 : static_cast<DWORD>(timeout.count());
    return WaitForSingleObject(hStdin, ms) == WAIT_OBJECT_0;
#else
    if (!isatty(STDIN_FILENO)) return true;
    if (std::cin.rdbuf()->in_avail() > 0) return true;
    return wait_readable(STDIN_FILENO, timeout);
#endif
}

// Read one line; stdin closing is treated as the user quitting.
inline std::string prompt_line(const std::string& message) {
    std::cout << message << std::flush;
    std::string out;
    if (!std::getline(std::cin, out)) {
        throw std::runtime_error("input closed");
    }
    return out;
}

// Echo-free line read for the master secret. Falls back to a plain read
// when stdin is not a terminal (pipes, tests).
inline std::string prompt_hidden(const std::string& message) {
#if defined(_WIN32)
    HANDLE hStdin = GetStdHandle(STD_INPUT_HANDLE);
    DWORD mode = 0;
    if (!GetConsoleMode(hStdin, &mode)) {
        return prompt_line(message);
    }
    SetConsoleMode(hStdin, mode & ~ENABLE_ECHO_INPUT);
    std::string out;
    bool ok = true;
    try { out = prompt_line(message); } catch (const std::runtime_error&) { ok = false; }
    SetConsoleMode(hStdin, mode);
#else
    termios oldt{};
    if (tcgetattr(STDIN_FILENO, &oldt) != 0) {
        return prompt_line(message);
    }
    termios newt = oldt;
    newt.c_lflag &= ~static_cast<tcflag_t>(ECHO);
    tcsetattr(STDIN_FILENO, TCSANOW, &newt);
    std::string out;
    bool ok = true;
    try { out = prompt_line(message); } catch (const std::runtime_error&) { ok = false; }
    tcsetattr(STDIN_FILENO, TCSANOW, &oldt);
#endif

    std::cout << "\n";
    if (!ok) throw std::runtime_error("input closed");
    return out;
}

inline bool prompt_yes_no(const std::string& message) {
    std::string answer = prompt_line(message);
    return !answer.empty() && (answer[0] == 'y' || answer[0] == 'Y');
}
