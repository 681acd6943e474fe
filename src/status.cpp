#include "status.hpp"
#include "download.hpp"
#include "environment.hpp"
#include "service.hpp"

#include <iostream>
#include <filesystem>
#include <stdexcept>
#include <unistd.h> // access

namespace fs = std::filesystem;

namespace HhdInstall {

std::vector<StatusCheck> Status::inspect(const Config& rawConfig, const Identity& identity)
{
    const Config config = rawConfig.resolvedFor(identity);
    std::vector<StatusCheck> checks;
    std::error_code ec;

    const fs::path installDir = config.installDir;
    checks.push_back({"Install directory " + installDir.string(),
                      fs::is_directory(installDir, ec), ""});

    const VirtualEnv venv(installDir / "venv");
    checks.push_back({"Virtual environment " + venv.root().string(), venv.exists(), ""});

    // Symlink must resolve to an executable inside the environment
    {
        const fs::path link = fs::path(config.binDir) / config.executable;
        const fs::path expected = venv.executable(config.executable);
        StatusCheck check{"Entry point " + link.string(), false, ""};

        if (!fs::is_symlink(fs::symlink_status(link, ec))) {
            check.detail = "missing or not a symlink";
        } else if (fs::read_symlink(link, ec) != expected) {
            check.detail = "points to " + fs::read_symlink(link, ec).string();
        } else if (access(link.c_str(), X_OK) != 0) {
            check.detail = "target is not executable";
        } else {
            check.ok = true;
        }
        checks.push_back(check);
    }

    for (const auto& asset : config.assets) {
        StatusCheck check{asset.name + " " + asset.destination, false, ""};
        if (!fs::is_regular_file(asset.destination, ec)) {
            check.detail = "missing";
        } else if (asset.sha256.empty()) {
            check.ok = true;
            check.detail = "present (unverified)";
        } else {
            try {
                check.ok = Download::digestMatches(asset.destination, asset.sha256);
                if (!check.ok) {
                    check.detail = "sha256 mismatch";
                }
            } catch (const std::exception& e) {
                check.detail = e.what();
            }
        }
        checks.push_back(check);
    }

    {
        StatusCheck check{"Service", false, ""};
        try {
            const std::string unit = ServiceManager::instanceName(config.serviceTemplate,
                                                                  identity.username);
            check.name = "Service " + unit;
            check.ok = ServiceManager(config.systemctl, config.escalate).isEnabled(unit);
            if (!check.ok) {
                check.detail = "not enabled";
            }
        } catch (const std::exception& e) {
            check.detail = e.what();
        }
        checks.push_back(check);
    }

    return checks;
}

bool Status::print(const std::vector<StatusCheck>& checks, std::ostream& out)
{
    bool allOk = true;
    for (const auto& check : checks) {
        out << (check.ok ? "[ OK ] " : "[FAIL] ") << check.name;
        if (!check.detail.empty()) {
            out << " (" << check.detail << ")";
        }
        out << "\n";
        allOk = allOk && check.ok;
    }
    return allOk;
}

} // namespace HhdInstall
