#pragma once

#include "Verifier.hpp"

#include <optional>
#include <string>

struct SSettings;

namespace NPm2 {
    // picks the MagicMirror process out of `pm2 jlist` output: exec path
    // mentioning MagicMirror first, then one of the usual names
    std::optional<std::string> pickProcess(const std::string& jlist);

    // pm2_env.status of the named process
    std::optional<std::string> processStatus(const std::string& jlist, const std::string& name);
};

class CPm2ProcessResolver : public IProcessResolver {
  public:
    explicit CPm2ProcessResolver(const SSettings& settings);
    virtual ~CPm2ProcessResolver() = default;

    // never empty, falls back to the configured name
    virtual std::string resolve();

  private:
    std::string m_pm2;
    std::string m_fallback;
    int         m_timeoutSecs = 30;
};

class CPm2Verifier : public IVerifier {
  public:
    CPm2Verifier(IProcessResolver& resolver, const SSettings& settings);
    virtual ~CPm2Verifier() = default;

    virtual SVerifyReport verify();

  private:
    IProcessResolver& m_resolver;
    std::string       m_pm2;
    int               m_timeoutSecs = 30;
    bool              m_checkOnline = true;
    int               m_settleMs    = 1500;
};
