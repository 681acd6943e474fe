#include "assets.hpp"
#include "download.hpp"
#include "process.hpp"
#include "service.hpp"
#include "utils.hpp"

#include <stdexcept>
#include <utility>

namespace fs = std::filesystem;

namespace HhdInstall {

namespace {

    bool isOctalMode(const std::string& mode)
    {
        if (mode.empty() || mode.size() > 4) {
            return false;
        }
        for (char c : mode) {
            if (c < '0' || c > '7') {
                return false;
            }
        }
        return true;
    }

    // Removes a staged file on scope exit
    class StagedFile
    {
    public:
        explicit StagedFile(fs::path path) : path_(std::move(path)) {}
        ~StagedFile()
        {
            std::error_code ec;
            fs::remove(path_, ec);
        }

        StagedFile(const StagedFile&) = delete;
        StagedFile& operator=(const StagedFile&) = delete;

    private:
        fs::path path_;
    };

} // namespace

AssetInstaller::AssetInstaller(const Config& config, fs::path stagingDir)
    : config_(config),
      stagingDir_(std::move(stagingDir))
{
}

fs::path AssetInstaller::stagingPath(const SystemAsset& asset) const
{
    return stagingDir_ / fs::path(asset.destination).filename();
}

void AssetInstaller::verify(const SystemAsset& asset, const fs::path& staged) const
{
    std::error_code ec;
    auto size = fs::file_size(staged, ec);
    if (ec) {
        throw std::runtime_error("Cannot stat downloaded " + asset.name + ": " + ec.message());
    }
    if (size == 0) {
        throw std::runtime_error("Downloaded " + asset.name + " from " + asset.url + " is empty");
    }

    if (asset.sha256.empty()) {
        if (config_.requireChecksums) {
            throw std::runtime_error("No sha256 pinned for " + asset.name +
                                     " and require_checksums is set");
        }
        log_warning("Installing " + asset.name + " without integrity verification (no sha256 pinned)");
        return;
    }

    if (!Download::digestMatches(staged.string(), asset.sha256)) {
        throw std::runtime_error("Checksum mismatch for " + asset.name + ": expected " +
                                 asset.sha256 + ", got " + Download::sha256File(staged.string()));
    }
    log_message("Verified sha256 of " + asset.name);
}

void AssetInstaller::install(const SystemAsset& asset) const
{
    if (!isOctalMode(asset.mode)) {
        throw std::runtime_error("Invalid file mode '" + asset.mode + "' for " + asset.name);
    }

    fs::path staged = stagingPath(asset);
    if (!Download::toFile(asset.url, staged.string())) {
        throw std::runtime_error("Failed to download " + asset.name + " from " + asset.url);
    }
    StagedFile cleanup(staged);

    verify(asset, staged);

    // install(1) writes the destination in one step and creates parents
    const std::vector<std::string> args = Process::escalated(
        config_.escalate,
        {"install", "-D", "-m", asset.mode, staged.string(), asset.destination});

    log_message("Installing " + asset.name + " to " + asset.destination);
    int rc = Process::run(args);
    if (rc != 0) {
        throw std::runtime_error("'" + describeCommand(args) + "' exited with status " +
                                 std::to_string(rc));
    }
}

bool AssetInstaller::remove(const SystemAsset& asset) const
{
    std::error_code ec;
    if (!fs::exists(fs::symlink_status(asset.destination, ec))) {
        log_debug(asset.destination + " is not present");
        return true;
    }

    log_message("Removing " + asset.destination);
    int rc = Process::run(Process::escalated(config_.escalate,
                                             {"rm", "-f", asset.destination}));
    if (rc != 0) {
        log_error("Failed to remove " + asset.destination + " (exit status " +
                  std::to_string(rc) + ")");
        return false;
    }
    return true;
}

bool AssetInstaller::reload() const
{
    bool ok = ServiceManager(config_.systemctl, config_.escalate).daemonReload();

    int rc = Process::run(Process::escalated(config_.escalate,
                                             {config_.udevadm, "control", "--reload-rules"}));
    if (rc != 0) {
        log_error("udevadm control --reload-rules exited with status " + std::to_string(rc));
        ok = false;
    }
    return ok;
}

} // namespace HhdInstall
