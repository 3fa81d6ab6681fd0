#pragma once

#include <iostream>
#include <ostream>
#include <string>

namespace brstitch::cli {

// ANSI color codes
namespace color {
    constexpr const char* RESET = "\033[0m";

    constexpr const char* GREEN = "\033[0;32m";
    constexpr const char* YELLOW = "\033[0;33m";

    constexpr const char* BOLD_RED = "\033[1;31m";
    constexpr const char* BOLD_YELLOW = "\033[1;33m";
}

// Colors are on only when the stream is a TTY and neither NO_COLOR nor
// BRSTITCH_NO_COLOR is set, unless overridden by SetColorsEnabled.
bool ColorsEnabled(std::ostream& os = std::cout);

void SetColorsEnabled(bool enabled);

std::string Colorize(const std::string& text, const char* color, std::ostream& os = std::cout);

inline std::string Green(const std::string& text) { return Colorize(text, color::GREEN); }
inline std::string Yellow(const std::string& text) { return Colorize(text, color::YELLOW); }

}  // namespace brstitch::cli
