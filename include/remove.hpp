#ifndef REMOVE_HPP
#define REMOVE_HPP

#include <string>
#include <filesystem>

#include "config.hpp"
#include "identity.hpp"
#include "install.hpp" // InstallReport, Step

namespace HhdInstall {

/**
 * @class Uninstaller
 * @brief Reverses an installation: disables the service, removes the PATH
 *        symlink, the privileged assets and the install directory.
 *
 * Missing artifacts are not errors, so running it twice is harmless.
 */
class Uninstaller
{
public:
    /**
     * @throws std::runtime_error if the resolved paths are unsafe (see
     *         Config::resolvedFor).
     */
    Uninstaller(const Config& config, Identity identity);

    /**
     * @brief Runs the removal. Refuses (report.refused) for the superuser.
     */
    InstallReport run() const;

    std::vector<Step> steps() const;

    /**
     * @brief Removes `link` only if it is a symlink pointing inside `ownedDir`.
     *
     * @return True if the link was removed; false if it was absent or left
     *         alone because it belongs to something else.
     */
    static bool removeOwnedSymlink(const std::filesystem::path& link,
                                   const std::filesystem::path& ownedDir);

private:
    Config config_;
    Identity identity_;
};

} // namespace HhdInstall

#endif // REMOVE_HPP
