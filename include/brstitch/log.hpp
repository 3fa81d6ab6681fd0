#pragma once

#include <ostream>
#include <string>

namespace brstitch::log {

// Quiet mode silences Info; warnings and errors always go to stderr.
void SetQuiet(bool quiet);
bool IsQuiet();

// Redirects output, used by tests to capture messages. Passing nullptr restores the defaults.
void SetStreams(std::ostream* out, std::ostream* err);

void Info(const std::string& message);
void Warn(const std::string& message);
void Error(const std::string& message);

// Single-quotes a path or name for messages, doubling embedded quotes.
std::string Quote(const std::string& text);

}  // namespace brstitch::log
