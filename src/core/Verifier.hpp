#pragma once

#include <cstdint>
#include <string>

enum eVerifyResult : uint8_t {
    VERIFY_OK = 0,
    VERIFY_FAILED,
    VERIFY_TIMEOUT,
    VERIFY_UNREACHABLE,
};

struct SVerifyReport {
    eVerifyResult result = VERIFY_FAILED;
    std::string   message;
};

// Reloads the running instance with the applied config and reports back.
class IVerifier {
  public:
    virtual ~IVerifier() = default;

    virtual SVerifyReport verify() = 0;
};

// Names the process a verifier should act on.
class IProcessResolver {
  public:
    virtual ~IProcessResolver() = default;

    virtual std::string resolve() = 0;
};

// --no-verify
class CNullVerifier : public IVerifier {
  public:
    virtual ~CNullVerifier() = default;

    virtual SVerifyReport verify() {
        return {VERIFY_OK, "verification skipped"};
    }
};

const char* verifyResultToString(eVerifyResult result);
