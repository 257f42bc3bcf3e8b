#pragma once

#include <format>
#include <string>
#include <string_view>
#include <utility>
#include "Colors.hpp"

// "<colored mark> message", the format is checked at compile time
template <typename... Args>
std::string statusString(std::string_view mark, std::string_view color, std::format_string<Args...> fmt, Args&&... args) {
    return std::format("{}{}{} {}", color, mark, Colors::RESET, std::format(fmt, std::forward<Args>(args)...));
}

template <typename... Args>
std::string successString(std::format_string<Args...> fmt, Args&&... args) {
    return statusString<Args...>("✔", Colors::GREEN, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
std::string failureString(std::format_string<Args...> fmt, Args&&... args) {
    return statusString<Args...>("✖", Colors::RED, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
std::string warningString(std::format_string<Args...> fmt, Args&&... args) {
    return statusString<Args...>("⚠", Colors::YELLOW, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
std::string infoString(std::format_string<Args...> fmt, Args&&... args) {
    return statusString<Args...>("→", Colors::RESET, fmt, std::forward<Args>(args)...);
}

// step banner for the multi-step flows
template <typename... Args>
std::string headerString(std::format_string<Args...> fmt, Args&&... args) {
    return std::format("\n{}==={} {} {}==={}", Colors::CYAN, Colors::RESET, std::format(fmt, std::forward<Args>(args)...), Colors::CYAN, Colors::RESET);
}
