#include "brstitch/env.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <limits>
#include <stdexcept>

namespace brstitch::env {

namespace {

std::string ToLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
    return value;
}

}  // namespace

std::string Get(std::string_view name) {
    std::string key(name);
    const char* value = std::getenv(key.c_str());
    if (!value) {
        return {};
    }
    return std::string(value);
}

bool IsEnabled(std::string_view name, bool default_value) {
    std::string value = ToLower(Get(name));
    if (value.empty()) {
        return default_value;
    }
    if (value == "1" || value == "true" || value == "yes" || value == "on") {
        return true;
    }
    if (value == "0" || value == "false" || value == "no" || value == "off") {
        return false;
    }
    return default_value;
}

std::size_t GetSize(std::string_view name, std::size_t fallback) {
    std::string raw = Get(name);
    if (raw.empty()) {
        return fallback;
    }
    try {
        unsigned long long parsed = std::stoull(raw);
        if (parsed == 0) {
            return fallback;
        }
        if (parsed > std::numeric_limits<std::size_t>::max()) {
            return std::numeric_limits<std::size_t>::max();
        }
        return static_cast<std::size_t>(parsed);
    } catch (const std::exception&) {
        return fallback;
    }
}

}  // namespace brstitch::env
