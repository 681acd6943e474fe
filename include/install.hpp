#ifndef INSTALL_HPP
#define INSTALL_HPP

#include <string>            // For std::string
#include <vector>            // For std::vector
#include <functional>        // For std::function
#include <filesystem>        // For std::filesystem::path
#include <ostream>           // For report printing

#include "config.hpp"
#include "identity.hpp"

namespace HhdInstall {

enum class StepStatus
{
    Completed,
    Failed,
    Skipped
};

/**
 * @brief Returns "done", "FAILED" or "skipped".
 */
const char* toString(StepStatus status);

/**
 * @struct StepResult
 * @brief Outcome of one step of an install or uninstall run.
 */
struct StepResult
{
    std::string step;
    StepStatus status = StepStatus::Skipped;
    std::string message; // Failure reason; empty otherwise
};

/**
 * @struct Step
 * @brief A named unit of work. The action throws to signal failure.
 */
struct Step
{
    std::string name;
    std::function<void()> action;
};

/**
 * @class InstallReport
 * @brief Ordered record of which steps completed, failed or were skipped.
 */
class InstallReport
{
public:
    /**
     * @brief True when the run was refused by the superuser guard before
     *        any step was attempted.
     */
    bool refused = false;

    void add(StepResult result);

    const std::vector<StepResult>& steps() const { return steps_; }

    /**
     * @return True if not refused and no step failed.
     */
    bool succeeded() const;

    /**
     * @return The failing step, or nullptr if none failed.
     */
    const StepResult* failedStep() const;

    size_t count(StepStatus status) const;

    /**
     * @brief Prints one line per step with its status.
     */
    void print(std::ostream& out) const;

private:
    std::vector<StepResult> steps_;
};

/**
 * @brief Runs steps in order, stopping at the first failure.
 *
 * A step fails when its action throws; the exception message becomes the
 * step's message and every later step is recorded as skipped.
 */
InstallReport runSteps(const std::vector<Step>& steps);

/**
 * @brief File the installer writes into the install directory it creates.
 *
 * Uninstall only deletes an install directory that carries this marker
 * (or a virtual environment), never an arbitrary directory.
 */
std::filesystem::path installMarker(const std::filesystem::path& installDir);

/**
 * @brief Prints the message shown when the installer is started as root.
 */
void printRootAdvisory(std::ostream& out);

/**
 * @class Installer
 * @brief Installs Handheld Daemon for one user: virtual environment,
 *        package, udev rule, unit template, PATH symlink and service.
 *
 * All paths and commands come from the Config; the user from the Identity.
 * Every mutating step can be re-run and replaces what a previous run left.
 */
class Installer
{
public:
    /**
     * @param config   Configuration; "~" is expanded for identity.
     * @param identity The user the installation belongs to.
     * @throws std::runtime_error if the resolved paths are unsafe (see
     *         Config::resolvedFor).
     */
    Installer(const Config& config, Identity identity);

    /**
     * @brief Runs the full installation.
     *
     * Refuses to do anything (report.refused) when identity is the
     * superuser. Prints the completion banner on success.
     */
    InstallReport run() const;

    /**
     * @brief The ordered install steps (identity guard excluded).
     */
    std::vector<Step> steps() const;

    const Config& config() const { return config_; }

    /**
     * @brief Creates or replaces a symlink at `link` pointing to `target`.
     *
     * An existing link with the same target is left alone. An existing link
     * to anything else is replaced atomically. A regular file or directory
     * at `link` is never clobbered.
     *
     * @return True if the link was created or changed.
     * @throws std::runtime_error if a non-link file occupies `link`.
     * @throws std::filesystem::filesystem_error on I/O failure.
     */
    static bool ensureSymlink(const std::filesystem::path& target,
                              const std::filesystem::path& link);

    /**
     * @brief Prints the post-install notice (HandyGCCS warning, reboot hint).
     */
    static void printBanner(std::ostream& out);

private:
    Config config_;
    Identity identity_;
};

} // namespace HhdInstall

#endif // INSTALL_HPP
