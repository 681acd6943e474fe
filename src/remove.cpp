#include "remove.hpp"      // Class definition
#include "assets.hpp"
#include "environment.hpp"
#include "service.hpp"
#include "utils.hpp"

#include <iostream>
#include <filesystem>
#include <vector>
#include <string>
#include <stdexcept>
#include <cstdint>
#include <utility>

namespace fs = std::filesystem;

// ============================================================================
// HhdInstall Namespace
// ============================================================================
namespace HhdInstall {

Uninstaller::Uninstaller(const Config& config, Identity identity)
    : config_(config.resolvedFor(identity)),
      identity_(std::move(identity))
{
}

bool Uninstaller::removeOwnedSymlink(const fs::path& link, const fs::path& ownedDir)
{
    std::error_code ec;
    fs::file_status status = fs::symlink_status(link, ec);
    if (ec || !fs::exists(status)) {
        return false;
    }

    if (!fs::is_symlink(status)) {
        log_warning(link.string() + " is not a symlink; leaving it in place");
        return false;
    }

    fs::path target = fs::read_symlink(link);
    if (target.is_relative()) {
        target = link.parent_path() / target;
    }
    if (!isWithin(target, ownedDir)) {
        log_warning(link.string() + " points to " + target.string() +
                    ", not into " + ownedDir.string() + "; leaving it in place");
        return false;
    }

    fs::remove(link);
    log_message("Removed " + link.string());
    return true;
}

std::vector<Step> Uninstaller::steps() const
{
    std::vector<Step> steps;
    const fs::path installDir = config_.installDir;

    // Disabling is best effort: the unit may never have been enabled
    steps.push_back({"Disable service for " + identity_.username, [this]() {
        const std::string unit = ServiceManager::instanceName(config_.serviceTemplate,
                                                              identity_.username);
        ServiceManager(config_.systemctl, config_.escalate).disable(unit);
    }});

    const fs::path link = fs::path(config_.binDir) / config_.executable;
    steps.push_back({"Remove " + link.string(), [link, installDir]() {
        removeOwnedSymlink(link, installDir);
    }});

    for (const auto& asset : config_.assets) {
        steps.push_back({"Remove " + asset.destination, [this, installDir, asset]() {
            if (!AssetInstaller(config_, installDir / "cache").remove(asset)) {
                throw std::runtime_error("Could not remove " + asset.destination);
            }
        }});
    }

    if (config_.reloadUnits && !config_.assets.empty()) {
        steps.push_back({"Reload units and udev rules", [this, installDir]() {
            if (!AssetInstaller(config_, installDir / "cache").reload()) {
                throw std::runtime_error("Reload command failed");
            }
        }});
    }

    steps.push_back({"Remove " + installDir.string(), [installDir]() {
        std::error_code ec;
        if (!fs::exists(installDir, ec)) {
            return;
        }
        if (!fs::exists(installMarker(installDir), ec) &&
            !VirtualEnv(installDir / "venv").exists()) {
            log_warning(installDir.string() + " was not created by hhd-install; leaving it in place");
            return;
        }

        std::uintmax_t removed = fs::remove_all(installDir);
        if (removed > 0) {
            log_message("Removed " + installDir.string() + " (" +
                        std::to_string(removed) + " entries)");
        }
    }});

    return steps;
}

InstallReport Uninstaller::run() const
{
    if (identity_.isSuperuser()) {
        printRootAdvisory(std::cout);
        InstallReport report;
        report.refused = true;
        return report;
    }

    log_message("Removing Handheld Daemon from " + config_.installDir);
    InstallReport report = runSteps(steps());

    std::cout << "\nSummary:\n";
    report.print(std::cout);
    return report;
}

} // namespace HhdInstall
