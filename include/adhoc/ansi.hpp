#pragma once
#include <cstdio>
#include <cstdlib>
#include <iostream>
#if defined(_WIN32)
#include <io.h>
#include <windows.h>
#else
#include <unistd.h>
#endif

namespace adhoc::ansi
{
    inline constexpr const char *reset = "\x1b[0m";

    inline constexpr const char *ok = "\x1b[38;5;82m";
    inline constexpr const char *warn = "\x1b[38;5;214m";
    inline constexpr const char *err = "\x1b[38;5;196m";
    inline constexpr const char *info = "\x1b[38;5;45m";
    inline constexpr const char *muted = "\x1b[90m";

    // Return to column 0 and wipe the current line (progress redraw).
    inline constexpr const char *erase_line = "\r\x1b[2K";

    inline void enable_virtual_terminal_on_windows()
    {
#if defined(_WIN32)
        HANDLE hOut = GetStdHandle(STD_OUTPUT_HANDLE);
        if (hOut == INVALID_HANDLE_VALUE)
            return;
        DWORD mode = 0;
        if (!GetConsoleMode(hOut, &mode))
            return;
        mode |= ENABLE_VIRTUAL_TERMINAL_PROCESSING;
        SetConsoleMode(hOut, mode);
#endif
    }

    // Colour is used only when stdout is a terminal and NO_COLOR is not set
    // at all; an empty NO_COLOR still counts as set.
    inline bool stdout_supports_color()
    {
        if (std::getenv("NO_COLOR"))
            return false;
#if defined(_WIN32)
        return _isatty(_fileno(stdout)) != 0;
#else
        return ::isatty(STDOUT_FILENO) != 0;
#endif
    }

    // Small helper so call sites can write `os << paint(on, ansi::warn)`.
    inline const char *paint(bool enabled, const char *code)
    {
        return enabled ? code : "";
    }
}
