#pragma once

#include <cstdio>
#include <cstdlib>
#include <format>
#include <print>

#include "StringUtils.hpp"
#include "../debug/log/Logger.hpp"

// startup failures only, nothing may be half-written when this runs
// NOLINTNEXTLINE
namespace Debug {
    template <typename... Args>
    [[noreturn]] void die(std::format_string<Args...> fmt, Args&&... args) {
        const std::string MSG = std::vformat(fmt.get(), std::make_format_args(args...));

        Log::logger->log(Log::DEBUG, "die: {}", MSG);
        std::println(stderr, "{}", failureString("{}", MSG));

        std::exit(1);
    }
};
