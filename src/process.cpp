#include "process.hpp"
#include "utils.hpp"

#include <iostream>
#include <stdexcept>
#include <system_error>

// Required Linux/Unix Headers
#include <sys/types.h> // pid_t
#include <sys/wait.h>  // waitpid
#include <unistd.h>    // fork, execvp, pipe, dup2, _exit
#include <errno.h>
#include <cstdio>      // perror
#include <cstdlib>     // _exit codes

namespace HhdInstall {
namespace Process {

namespace {

    // Exit status used by the child when execvp fails, as the shell does
    constexpr int kExecFailed = 127;

    // Replaces the current (child) process image. Never returns.
    [[noreturn]] void execChild(const std::vector<std::string>& args)
    {
        std::vector<char*> argv;
        for (const auto& arg : args) {
            argv.push_back(const_cast<char*>(arg.c_str()));
        }
        argv.push_back(nullptr); // Null terminator

        execvp(argv[0], argv.data());

        // If execvp returns, an error occurred
        perror(("execvp failed for command: " + args[0]).c_str());
        _exit(kExecFailed);
    }

    int waitForChild(pid_t pid, const std::string& program)
    {
        int status = 0;
        pid_t waited;
        do {
            waited = waitpid(pid, &status, 0);
        } while (waited < 0 && errno == EINTR);

        if (waited < 0) {
            throw std::system_error(errno, std::system_category(),
                                    "waitpid failed for " + program);
        }

        if (WIFEXITED(status)) {
            return WEXITSTATUS(status);
        }
        if (WIFSIGNALED(status)) {
            std::cerr << "Process " << program << " terminated by signal: "
                      << WTERMSIG(status) << std::endl;
        }
        return -1;
    }

    void checkArgs(const std::vector<std::string>& args)
    {
        if (args.empty() || args[0].empty()) {
            throw std::invalid_argument("Empty command line");
        }
    }

} // namespace

int run(const std::vector<std::string>& args)
{
    checkArgs(args);
    log_debug("Running: " + describeCommand(args));

    // Flush so our output is not interleaved with the child's
    std::cout.flush();
    std::cerr.flush();

    pid_t pid = fork();
    if (pid < 0) {
        throw std::system_error(errno, std::system_category(), "Fork failed");
    }
    if (pid == 0) {
        execChild(args);
    }

    return waitForChild(pid, args[0]);
}

CommandResult capture(const std::vector<std::string>& args)
{
    checkArgs(args);
    log_debug("Running: " + describeCommand(args));

    int fds[2];
    if (pipe(fds) != 0) {
        throw std::system_error(errno, std::system_category(), "pipe failed");
    }

    std::cout.flush();
    std::cerr.flush();

    pid_t pid = fork();
    if (pid < 0) {
        int err = errno;
        close(fds[0]);
        close(fds[1]);
        throw std::system_error(err, std::system_category(), "Fork failed");
    }

    // --- Child Process ---
    if (pid == 0) {
        close(fds[0]);
        if (dup2(fds[1], STDOUT_FILENO) < 0) {
            perror("dup2 failed");
            _exit(kExecFailed);
        }
        close(fds[1]);
        execChild(args);
    }

    // --- Parent Process ---
    close(fds[1]);

    CommandResult result;
    char buffer[256];
    ssize_t n;
    while (true) {
        n = read(fds[0], buffer, sizeof(buffer));
        if (n > 0) {
            result.output.append(buffer, static_cast<size_t>(n));
        } else if (n == 0) {
            break;
        } else if (errno != EINTR) {
            std::cerr << "Error reading output of " << args[0] << std::endl;
            break;
        }
    }
    close(fds[0]);

    result.exitCode = waitForChild(pid, args[0]);

    while (!result.output.empty() &&
           (result.output.back() == '\n' || result.output.back() == '\r')) {
        result.output.pop_back();
    }
    return result;
}

std::vector<std::string> escalated(const std::vector<std::string>& prefix,
                                   const std::vector<std::string>& args)
{
    std::vector<std::string> full(prefix);
    full.insert(full.end(), args.begin(), args.end());
    return full;
}

} // namespace Process
} // namespace HhdInstall
