#pragma once

#include <hyprutils/cli/Logger.hpp>

#include "../../helpers/memory/Memory.hpp"

namespace Log {
    // the root logger owns the sinks, everything in mmconf logs through the named connection
    inline UP<Hyprutils::CLI::CLogger>           loggerMain = makeUnique<Hyprutils::CLI::CLogger>();
    inline UP<Hyprutils::CLI::CLoggerConnection> logger     = makeUnique<Hyprutils::CLI::CLoggerConnection>(*loggerMain);

    void                                         init(bool verbose);

    //
    inline constexpr const Hyprutils::CLI::eLogLevel DEBUG = Hyprutils::CLI::LOG_DEBUG;
    inline constexpr const Hyprutils::CLI::eLogLevel WARN  = Hyprutils::CLI::LOG_WARN;
    inline constexpr const Hyprutils::CLI::eLogLevel ERR   = Hyprutils::CLI::LOG_ERR;
    inline constexpr const Hyprutils::CLI::eLogLevel CRIT  = Hyprutils::CLI::LOG_CRIT;
    inline constexpr const Hyprutils::CLI::eLogLevel TRACE = Hyprutils::CLI::LOG_TRACE;
};
