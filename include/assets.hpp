#ifndef ASSETS_HPP
#define ASSETS_HPP

#include <string>
#include <vector>
#include <filesystem>

#include "config.hpp"

namespace HhdInstall {

/**
 * @class AssetInstaller
 * @brief Fetches static system-integration files and installs them to
 *        privileged paths.
 *
 * Each asset is downloaded to a staging directory owned by the user,
 * checked, and only then copied into place with the escalation prefix.
 * A rejected download never touches the destination.
 */
class AssetInstaller
{
public:
    AssetInstaller(const Config& config, std::filesystem::path stagingDir);

    /**
     * @brief Downloads, verifies and installs one asset (create-or-replace).
     * @throws std::runtime_error on download, verification or install failure.
     */
    void install(const SystemAsset& asset) const;

    /**
     * @brief Checks a staged download against the asset's pinned digest.
     *
     * Empty files are rejected. An asset without a digest is accepted with
     * a warning, unless checksums are required.
     *
     * @throws std::runtime_error describing why the file was rejected.
     */
    void verify(const SystemAsset& asset, const std::filesystem::path& staged) const;

    /**
     * @brief Removes an installed asset. A missing file is not an error.
     * @return False if the removal command failed.
     */
    bool remove(const SystemAsset& asset) const;

    /**
     * @brief Reloads systemd units and udev rules so new files take effect.
     * @return False if either reload command failed.
     */
    bool reload() const;

    /**
     * @return Staging path used for an asset's download.
     */
    std::filesystem::path stagingPath(const SystemAsset& asset) const;

private:
    const Config& config_;
    std::filesystem::path stagingDir_;
};

} // namespace HhdInstall

#endif // ASSETS_HPP
