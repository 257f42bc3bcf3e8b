#include "Pm2.hpp"
#include "Settings.hpp"
#include "../helpers/ProcessHelper.hpp"
#include "../debug/log/Logger.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <chrono>
#include <format>
#include <ranges>
#include <thread>

#include <glaze/glaze.hpp>

inline constexpr std::array<std::string_view, 3> KNOWN_PROCESS_NAMES = {
    "magicmirror",
    "mm",
    "magic-mirror",
};

static std::string toLower(std::string s) {
    std::ranges::transform(s, s.begin(), [](unsigned char c) { return std::tolower(c); });
    return s;
}

static std::string stringField(glz::generic& obj, const std::string& key) {
    if (!obj.is_object() || !obj.contains(key) || !obj[key].is_string())
        return "";

    return obj[key].get_string();
}

// pm2 may print daemon chatter before the json, which is always a single line
static std::string_view jsonLine(const std::string& jlist) {
    std::string_view last = jlist;
    for (const auto& l : std::views::split(std::string_view{jlist}, '\n')) {
        const std::string_view LINE{l.begin(), l.end()};
        if (LINE.starts_with("[{") || LINE.starts_with("[]"))
            last = LINE;
    }

    return last;
}

static std::optional<glz::generic> parseJlist(const std::string& jlist) {
    auto json = glz::read_json<glz::generic>(std::string{jsonLine(jlist)});
    if (!json) {
        Log::logger->log(Log::WARN, "pm2: jlist output is not json");
        return std::nullopt;
    }

    if (!json->is_array()) {
        Log::logger->log(Log::WARN, "pm2: jlist output is not an array");
        return std::nullopt;
    }

    return std::move(*json);
}

const char* verifyResultToString(eVerifyResult result) {
    switch (result) {
        case VERIFY_OK: return "ok";
        case VERIFY_FAILED: return "failed";
        case VERIFY_TIMEOUT: return "timed out";
        case VERIFY_UNREACHABLE: return "unreachable";
    }

    return "?";
}

std::optional<std::string> NPm2::pickProcess(const std::string& jlist) {
    auto json = parseJlist(jlist);
    if (!json)
        return std::nullopt;

    for (auto& proc : json->get_array()) {
        if (!proc.is_object())
            continue;

        const auto NAME = stringField(proc, "name");
        if (NAME.empty())
            continue;

        std::string execPath;
        if (proc.contains("pm2_env"))
            execPath = stringField(proc["pm2_env"], "pm_exec_path");

        if (toLower(execPath).contains("magicmirror"))
            return NAME;

        if (std::ranges::find(KNOWN_PROCESS_NAMES, toLower(NAME)) != KNOWN_PROCESS_NAMES.end())
            return NAME;
    }

    return std::nullopt;
}

std::optional<std::string> NPm2::processStatus(const std::string& jlist, const std::string& name) {
    auto json = parseJlist(jlist);
    if (!json)
        return std::nullopt;

    for (auto& proc : json->get_array()) {
        if (stringField(proc, "name") != name || !proc.contains("pm2_env"))
            continue;

        const auto STATUS = stringField(proc["pm2_env"], "status");
        if (STATUS.empty())
            return std::nullopt;

        return STATUS;
    }

    return std::nullopt;
}

CPm2ProcessResolver::CPm2ProcessResolver(const SSettings& settings) :
    m_pm2(settings.verify.pm2), m_fallback(settings.verify.fallbackProcess), m_timeoutSecs(settings.verify.timeoutSecs) {
    ;
}

std::string CPm2ProcessResolver::resolve() {
    const auto RESULT = CProcessHelper::exec(m_pm2, {"jlist"}, m_timeoutSecs);

    if (!RESULT.spawned || RESULT.timedOut || RESULT.exitCode != 0) {
        Log::logger->log(Log::WARN, "pm2: couldn't query {}, using '{}'", m_pm2, m_fallback);
        return m_fallback;
    }

    const auto NAME = NPm2::pickProcess(RESULT.output);
    if (!NAME) {
        Log::logger->log(Log::WARN, "pm2: couldn't detect the MagicMirror process, using '{}'", m_fallback);
        return m_fallback;
    }

    Log::logger->log(Log::DEBUG, "pm2: detected process {}", *NAME);
    return *NAME;
}

CPm2Verifier::CPm2Verifier(IProcessResolver& resolver, const SSettings& settings) :
    m_resolver(resolver), m_pm2(settings.verify.pm2), m_timeoutSecs(settings.verify.timeoutSecs), m_checkOnline(settings.verify.checkOnline),
    m_settleMs(settings.verify.settleMs) {
    ;
}

SVerifyReport CPm2Verifier::verify() {
    const auto NAME    = m_resolver.resolve();
    const auto RESTART = CProcessHelper::exec(m_pm2, {"restart", NAME}, m_timeoutSecs);

    if (!RESTART.spawned || RESTART.exitCode == CProcessHelper::EXIT_NOT_FOUND)
        return {VERIFY_UNREACHABLE, std::format("couldn't run {}", m_pm2)};

    if (RESTART.timedOut)
        return {VERIFY_TIMEOUT, std::format("{} restart {} didn't finish within {}s", m_pm2, NAME, m_timeoutSecs)};

    if (RESTART.exitCode != 0)
        return {VERIFY_FAILED, std::format("{} restart {} exited with {}:\n{}", m_pm2, NAME, RESTART.exitCode, RESTART.output)};

    if (!m_checkOnline)
        return {VERIFY_OK, std::format("restarted {}", NAME)};

    // a broken config usually takes the process down within a moment
    std::this_thread::sleep_for(std::chrono::milliseconds(m_settleMs));

    const auto LIST = CProcessHelper::exec(m_pm2, {"jlist"}, m_timeoutSecs);
    if (LIST.timedOut)
        return {VERIFY_TIMEOUT, std::format("{} jlist didn't finish within {}s", m_pm2, m_timeoutSecs)};

    if (LIST.exitCode != 0)
        return {VERIFY_UNREACHABLE, std::format("{} jlist exited with {}", m_pm2, LIST.exitCode)};

    const auto STATUS = NPm2::processStatus(LIST.output, NAME);
    if (!STATUS)
        return {VERIFY_FAILED, std::format("{} is not known to {} after restart", NAME, m_pm2)};

    if (*STATUS != "online")
        return {VERIFY_FAILED, std::format("{} is {} after restart", NAME, *STATUS)};

    return {VERIFY_OK, std::format("restarted {}, online", NAME)};
}
