#include "Logger.hpp"

void Log::init(bool verbose) {
    const auto LEVEL = verbose ? Hyprutils::CLI::LOG_DEBUG : Hyprutils::CLI::LOG_WARN;

    loggerMain->setLogLevel(LEVEL);
    loggerMain->setEnableStdout(true);
    loggerMain->setEnableColor(true);
    loggerMain->setTime(false);

    logger->setName("mmconf");
    logger->setLogLevel(LEVEL);
}
