#include "brstitch/cli_colors.hpp"

#include "brstitch/env.hpp"

#include <cstdio>
#include <iostream>

#if defined(_WIN32) || defined(_WIN64)
    #include <io.h>
    #include <windows.h>
    #define isatty _isatty
    #define fileno _fileno

    #ifndef ENABLE_VIRTUAL_TERMINAL_PROCESSING
        #define ENABLE_VIRTUAL_TERMINAL_PROCESSING 0x0004
    #endif
#else
    #include <unistd.h>
#endif

namespace brstitch::cli {

namespace {
    struct ColorState {
        bool forced = false;
        bool forced_value = false;
        bool stdout_checked = false;
        bool stdout_tty = false;
        bool stderr_checked = false;
        bool stderr_tty = false;
    };

    ColorState g_state;

#if defined(_WIN32) || defined(_WIN64)
    bool EnableWindowsAnsiColors(DWORD handle_id) {
        HANDLE handle = GetStdHandle(handle_id);
        if (handle == INVALID_HANDLE_VALUE) {
            return false;
        }
        DWORD mode = 0;
        if (!GetConsoleMode(handle, &mode)) {
            return false;
        }
        mode |= ENABLE_VIRTUAL_TERMINAL_PROCESSING;
        return SetConsoleMode(handle, mode) != 0;
    }
#endif

    bool DetectTty(FILE* stream) {
        bool is_tty = isatty(fileno(stream)) != 0;
#if defined(_WIN32) || defined(_WIN64)
        if (is_tty) {
            is_tty = EnableWindowsAnsiColors(stream == stdout ? STD_OUTPUT_HANDLE : STD_ERROR_HANDLE);
        }
#endif
        return is_tty;
    }

    bool DisabledByEnvironment() {
        return !brstitch::env::Get("NO_COLOR").empty()
               || brstitch::env::IsEnabled("BRSTITCH_NO_COLOR");
    }
}

bool ColorsEnabled(std::ostream& os) {
    if (g_state.forced) {
        return g_state.forced_value;
    }
    if (&os == &std::cout) {
        if (!g_state.stdout_checked) {
            g_state.stdout_tty = !DisabledByEnvironment() && DetectTty(stdout);
            g_state.stdout_checked = true;
        }
        return g_state.stdout_tty;
    }
    if (&os == &std::cerr) {
        if (!g_state.stderr_checked) {
            g_state.stderr_tty = !DisabledByEnvironment() && DetectTty(stderr);
            g_state.stderr_checked = true;
        }
        return g_state.stderr_tty;
    }
    return false;
}

void SetColorsEnabled(bool enabled) {
    g_state.forced = true;
    g_state.forced_value = enabled;
}

std::string Colorize(const std::string& text, const char* color, std::ostream& os) {
    if (!ColorsEnabled(os)) {
        return text;
    }
    return std::string(color) + text + color::RESET;
}

}  // namespace brstitch::cli
