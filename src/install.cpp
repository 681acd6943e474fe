//============================================================================
// Includes
//============================================================================

#include "install.hpp"         // Class definition and public methods
#include "environment.hpp"     // VirtualEnv handle
#include "assets.hpp"          // Privileged static files
#include "service.hpp"         // systemctl wrapper
#include "utils.hpp"           // Logging

#include <iostream>            // Standard I/O (cout, cerr)
#include <fstream>             // Install marker
#include <filesystem>          // Modern C++ filesystem operations
#include <stdexcept>           // Standard exceptions (runtime_error, etc.)
#include <string>
#include <utility>             // std::move

// Alias for easier filesystem usage
namespace fs = std::filesystem;

namespace HhdInstall {

    namespace {

        // Width of the "!!!" frame around the HandyGCCS warning
        constexpr size_t kBannerWidth = 84;

        fs::path venvRoot(const Config& config)
        {
            return fs::path(config.installDir) / "venv";
        }

    } // namespace

    //========================================================================
    // Reporting
    //========================================================================

    const char* toString(StepStatus status)
    {
        switch (status) {
            case StepStatus::Completed: return "done";
            case StepStatus::Failed:    return "FAILED";
            case StepStatus::Skipped:   return "skipped";
        }
        return "unknown";
    }

    void InstallReport::add(StepResult result)
    {
        steps_.push_back(std::move(result));
    }

    bool InstallReport::succeeded() const
    {
        return !refused && failedStep() == nullptr;
    }

    const StepResult* InstallReport::failedStep() const
    {
        for (const auto& result : steps_) {
            if (result.status == StepStatus::Failed) {
                return &result;
            }
        }
        return nullptr;
    }

    size_t InstallReport::count(StepStatus status) const
    {
        size_t n = 0;
        for (const auto& result : steps_) {
            if (result.status == status) {
                ++n;
            }
        }
        return n;
    }

    void InstallReport::print(std::ostream& out) const
    {
        for (const auto& result : steps_) {
            out << "  [" << toString(result.status) << "] " << result.step;
            if (!result.message.empty()) {
                out << ": " << result.message;
            }
            out << "\n";
        }
    }

    InstallReport runSteps(const std::vector<Step>& steps)
    {
        InstallReport report;
        bool failed = false;

        for (const auto& step : steps) {
            if (failed) {
                report.add({step.name, StepStatus::Skipped, ""});
                continue;
            }

            log_debug("Step: " + step.name);
            try {
                step.action();
                report.add({step.name, StepStatus::Completed, ""});
            } catch (const std::exception& e) {
                log_error(step.name + " failed: " + e.what());
                report.add({step.name, StepStatus::Failed, e.what()});
                failed = true;
            }
        }

        return report;
    }

    fs::path installMarker(const fs::path& installDir)
    {
        return installDir / ".hhd-install";
    }

    void printRootAdvisory(std::ostream& out)
    {
        out << "You should run this script as your user, not root (sudo)." << std::endl;
    }

    //========================================================================
    // Installer
    //========================================================================

    Installer::Installer(const Config& config, Identity identity)
        : config_(config.resolvedFor(identity)),
          identity_(std::move(identity))
    {
    }

    std::vector<Step> Installer::steps() const
    {
        std::vector<Step> steps;
        const fs::path installDir = config_.installDir;
        const VirtualEnv venv(venvRoot(config_));

        steps.push_back({"Create " + installDir.string(), [installDir]() {
            fs::create_directories(installDir);
            std::ofstream marker(installMarker(installDir), std::ios::trunc);
            marker << "Created by hhd-install; removed by 'hhd-install uninstall'.\n";
            if (!marker) {
                throw std::runtime_error("Unable to write " + installMarker(installDir).string());
            }
        }});

        steps.push_back({"Create virtual environment", [this, venv]() {
            venv.create(config_.python);
        }});

        steps.push_back({"Install " + config_.package, [this, venv]() {
            venv.installPackage(config_.package, config_.indexUrl);
        }});

        for (const auto& asset : config_.assets) {
            steps.push_back({"Install " + asset.name, [this, installDir, asset]() {
                AssetInstaller(config_, installDir / "cache").install(asset);
            }});
        }

        if (config_.reloadUnits && !config_.assets.empty()) {
            steps.push_back({"Reload units and udev rules", [this, installDir]() {
                if (!AssetInstaller(config_, installDir / "cache").reload()) {
                    throw std::runtime_error("Reload command failed");
                }
            }});
        }

        const fs::path link = fs::path(config_.binDir) / config_.executable;
        steps.push_back({"Link " + link.string(), [this, venv, link]() {
            fs::path target = venv.executable(config_.executable);
            std::error_code ec;
            if (!fs::exists(target, ec)) {
                throw std::runtime_error(target.string() + " was not installed by " + config_.package);
            }
            fs::create_directories(link.parent_path());
            if (ensureSymlink(target, link)) {
                log_message("Linked " + link.string() + " -> " + target.string());
            } else {
                log_message(link.string() + " already points to " + target.string());
            }
        }});

        steps.push_back({"Enable service for " + identity_.username, [this]() {
            const std::string unit = ServiceManager::instanceName(config_.serviceTemplate,
                                                                  identity_.username);
            ServiceManager services(config_.systemctl, config_.escalate);
            if (!services.enable(unit)) {
                throw std::runtime_error("systemctl enable " + unit + " failed");
            }
        }});

        return steps;
    }

    InstallReport Installer::run() const
    {
        if (identity_.isSuperuser()) {
            printRootAdvisory(std::cout);
            InstallReport report;
            report.refused = true;
            return report;
        }

        log_message("Installing Handheld Daemon to " + config_.installDir);
        InstallReport report = runSteps(steps());

        std::cout << "\nSummary:\n";
        report.print(std::cout);
        if (report.succeeded()) {
            printBanner(std::cout);
        }
        return report;
    }

    bool Installer::ensureSymlink(const fs::path& target, const fs::path& link)
    {
        std::error_code ec;
        fs::file_status status = fs::symlink_status(link, ec);

        if (!ec && fs::exists(status)) {
            if (!fs::is_symlink(status)) {
                throw std::runtime_error(link.string() +
                                         " exists and is not a symlink; refusing to replace it");
            }
            if (fs::read_symlink(link) == target) {
                return false;
            }

            // Swap in a new link with rename(2) so the path never disappears
            fs::path temp = link;
            temp += ".hhd-install.tmp";
            fs::remove(temp);
            fs::create_symlink(target, temp);
            fs::rename(temp, link);
            return true;
        }

        fs::create_symlink(target, link);
        return true;
    }

    void Installer::printBanner(std::ostream& out)
    {
        const std::string frame(kBannerWidth, '!');
        out << "\n"
            << frame << "\n"
            << "!!! Do not forget to remove HandyGCCS/Bundled HHD if your distro preinstalls it. !!!\n"
            << frame << "\n"
            << "\n"
            << "Reboot to start Handheld Daemon!" << std::endl;
    }

} // namespace HhdInstall
