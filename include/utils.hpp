#ifndef UTILS_HPP
#define UTILS_HPP

#include <string>
#include <vector>
#include <ostream>
#include <iostream>
#include <filesystem>

// ANSI color codes for console output.
#define HHDI_COLOR_RESET "\033[0m"
#define HHDI_COLOR_INFO  "\033[32m"
#define HHDI_COLOR_WARN  "\033[33m"
#define HHDI_COLOR_ERROR "\033[31m"
#define HHDI_COLOR_DEBUG "\033[36m"

namespace HhdInstall {

/**
 * @brief Enables or disables debug output (set by --verbose).
 */
void setVerbose(bool enabled);

/**
 * @return True if debug output is enabled.
 */
bool isVerbose();

/**
 * @brief Logs an informational message to standard error with green coloring.
 *
 * @param message The message to log.
 */
inline void log_message(const std::string &message)
{
    std::cerr << HHDI_COLOR_INFO << "[INFO] " << HHDI_COLOR_RESET << message << std::endl;
}

/**
 * @brief Logs a warning message to standard error with yellow coloring.
 *
 * @param message The warning message to log.
 */
inline void log_warning(const std::string &message)
{
    std::cerr << HHDI_COLOR_WARN << "[WARN] " << HHDI_COLOR_RESET << message << std::endl;
}

/**
 * @brief Logs an error message to standard error with red coloring.
 *
 * @param message The error message to log.
 */
inline void log_error(const std::string &message)
{
    std::cerr << HHDI_COLOR_ERROR << "[ERROR] " << HHDI_COLOR_RESET << message << std::endl;
}

/**
 * @brief Logs a debug message to standard error, only in verbose mode.
 *
 * @param message The message to log.
 */
inline void log_debug(const std::string &message)
{
    if (isVerbose()) {
        std::cerr << HHDI_COLOR_DEBUG << "[DEBUG] " << HHDI_COLOR_RESET << message << std::endl;
    }
}

// ---------------------------------------------------------------------------
// Other utility function declarations
// ---------------------------------------------------------------------------

/**
 * @brief libcurl write callback function.
 *
 * Writes data received from a libcurl request to a std::ofstream.
 *
 * @param contents Pointer to the received data.
 * @param size Size of each element.
 * @param nmemb Number of elements.
 * @param userp Pointer to the std::ofstream to write data to.
 * @return The total number of bytes processed, or 0 to abort the transfer.
 */
size_t writeCallback(void* contents, size_t size, size_t nmemb, void* userp);

/**
 * @brief Removes leading and trailing whitespace from the given string.
 */
void trim(std::string& s);

/**
 * @brief Expands a leading "~" or "~/" in a path to the given home directory.
 *
 * Paths that do not start with "~" are returned unchanged.
 */
std::string expandHome(const std::string& path, const std::string& home);

/**
 * @brief Renders an argument vector as a single shell-like line for logs.
 *
 * Arguments containing whitespace or quotes are single-quoted.
 */
std::string describeCommand(const std::vector<std::string>& args);

/**
 * @brief True if `path` is `dir` or lies underneath it.
 *
 * Both paths are made absolute and normalized lexically; symlinks are not
 * followed.
 */
bool isWithin(const std::filesystem::path& path, const std::filesystem::path& dir);

} // namespace HhdInstall

#endif // UTILS_HPP
