#ifndef PROCESS_HPP
#define PROCESS_HPP

#include <string>
#include <vector>

namespace HhdInstall {
namespace Process {

/**
 * @brief Outcome of a command whose standard output was captured.
 */
struct CommandResult
{
    int exitCode = -1;  // -1 if the child was killed by a signal
    std::string output; // captured stdout, trailing newlines removed
};

/**
 * @brief Runs a command and waits for it, inheriting stdin/stdout/stderr.
 *
 * args[0] is resolved through PATH (execvp semantics).
 *
 * @param args Program followed by its arguments. Must not be empty.
 * @return The child's exit status; 127 if the program could not be
 *         executed, -1 if it was terminated by a signal.
 * @throws std::system_error if the child process cannot be created.
 */
int run(const std::vector<std::string>& args);

/**
 * @brief Runs a command and captures its standard output.
 *
 * Standard error is inherited so diagnostics still reach the user.
 *
 * @throws std::system_error if the pipe or the child cannot be created.
 */
CommandResult capture(const std::vector<std::string>& args);

/**
 * @brief Prepends a privilege escalation prefix (e.g. {"sudo"}) to a command.
 *
 * An empty prefix returns the command unchanged.
 */
std::vector<std::string> escalated(const std::vector<std::string>& prefix,
                                   const std::vector<std::string>& args);

} // namespace Process
} // namespace HhdInstall

#endif // PROCESS_HPP
