#include "brstitch/log.hpp"

#include "brstitch/cli_colors.hpp"

#include <iostream>

namespace brstitch::log {

namespace {

bool g_quiet = false;
std::ostream* g_out = nullptr;
std::ostream* g_err = nullptr;

std::ostream& Out() {
    return g_out ? *g_out : std::cout;
}

std::ostream& Err() {
    return g_err ? *g_err : std::cerr;
}

}  // namespace

void SetQuiet(bool quiet) {
    g_quiet = quiet;
}

bool IsQuiet() {
    return g_quiet;
}

void SetStreams(std::ostream* out, std::ostream* err) {
    g_out = out;
    g_err = err;
}

void Info(const std::string& message) {
    if (g_quiet) {
        return;
    }
    Out() << message << "\n";
}

void Warn(const std::string& message) {
    std::ostream& os = Err();
    os << cli::Colorize("Warning: ", cli::color::BOLD_YELLOW, os) << message << "\n";
}

void Error(const std::string& message) {
    std::ostream& os = Err();
    os << cli::Colorize("Error: ", cli::color::BOLD_RED, os) << message << "\n";
}

std::string Quote(const std::string& text) {
    std::string out = "'";
    for (char ch : text) {
        if (ch == '\'') {
            out += "''";
        } else {
            out.push_back(ch);
        }
    }
    out.push_back('\'');
    return out;
}

}  // namespace brstitch::log
