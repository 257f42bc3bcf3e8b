#pragma once

#include <string>
#include <vector>

class CProcessHelper {
  public:
    struct SProcessResult {
        int         exitCode = -1;
        std::string output;
        bool        timedOut = false;
        bool        spawned  = false;
    };

    // Runs binary (looked up in PATH) with args, stdout and stderr merged.
    // No shell is involved, args are passed as-is.
    static SProcessResult exec(const std::string& binary, const std::vector<std::string>& args, int timeoutSecs = 30);

    // exit code execvp reports when the binary can't be started
    static constexpr int EXIT_NOT_FOUND = 127;
};
