#include "ProcessHelper.hpp"
#include "../debug/log/Logger.hpp"

#include <unistd.h>
#include <sys/wait.h>
#include <sys/types.h>
#include <signal.h>
#include <cerrno>
#include <cstring>
#include <chrono>
#include <thread>
#include <fcntl.h>

#include <hyprutils/os/FileDescriptor.hpp>

using namespace Hyprutils::OS;

static void drain(int fd, std::string& out) {
    char buffer[4096];
    while (true) {
        ssize_t bytesRead = read(fd, buffer, sizeof(buffer));
        if (bytesRead <= 0)
            break;
        out.append(buffer, bytesRead);
    }
}

CProcessHelper::SProcessResult CProcessHelper::exec(const std::string& binary, const std::vector<std::string>& args, int timeoutSecs) {
    SProcessResult result;

    int            pipefd[2];
    if (pipe(pipefd) == -1) {
        result.output = "Error: pipe() failed";
        return result;
    }

    CFileDescriptor readEnd{pipefd[0]};

    // build argv before forking, the child must not allocate
    std::vector<char*> argv;
    argv.reserve(args.size() + 2);
    argv.emplace_back(const_cast<char*>(binary.c_str()));
    for (const auto& a : args) {
        argv.emplace_back(const_cast<char*>(a.c_str()));
    }
    argv.emplace_back(nullptr);

    pid_t pid = fork();

    if (pid == -1) {
        close(pipefd[1]);
        result.output = "Error: fork() failed";
        return result;
    }

    if (pid == 0) {
        close(pipefd[0]);

        dup2(pipefd[1], STDOUT_FILENO);
        dup2(pipefd[1], STDERR_FILENO);
        close(pipefd[1]);

        execvp(binary.c_str(), argv.data());

        _exit(EXIT_NOT_FOUND);
    }

    close(pipefd[1]);
    result.spawned = true;

    int flags = fcntl(readEnd.get(), F_GETFL, 0);
    fcntl(readEnd.get(), F_SETFL, flags | O_NONBLOCK);

    const auto START = std::chrono::steady_clock::now();

    while (true) {
        const auto ELAPSED = std::chrono::duration_cast<std::chrono::seconds>(std::chrono::steady_clock::now() - START).count();

        if (ELAPSED >= timeoutSecs) {
            kill(pid, SIGTERM);
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
            kill(pid, SIGKILL);
            result.timedOut = true;
            Log::logger->log(Log::WARN, "ProcessHelper: {} timed out after {}s", binary, timeoutSecs);
            break;
        }

        int   status = 0;
        pid_t wpid   = waitpid(pid, &status, WNOHANG);

        if (wpid == pid) {
            if (WIFEXITED(status))
                result.exitCode = WEXITSTATUS(status);
            else if (WIFSIGNALED(status))
                result.exitCode = -WTERMSIG(status);

            drain(readEnd.get(), result.output);
            break;
        }

        if (wpid == -1) {
            Log::logger->log(Log::ERR, "ProcessHelper: waitpid failed for {}: {}", binary, strerror(errno));
            break;
        }

        drain(readEnd.get(), result.output);

        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }

    // reap if we bailed out early
    if (result.timedOut) {
        int status = 0;
        waitpid(pid, &status, 0);
    }

    Log::logger->log(Log::DEBUG, "ProcessHelper: {} exited with {}", binary, result.exitCode);

    return result;
}
