#ifndef ENVIRONMENT_HPP
#define ENVIRONMENT_HPP

#include <string>
#include <filesystem>

namespace HhdInstall {

/**
 * @class VirtualEnv
 * @brief Handle to a Python virtual environment.
 *
 * The environment is never "activated"; its tools are invoked by
 * absolute path instead.
 */
class VirtualEnv
{
public:
    explicit VirtualEnv(std::filesystem::path root);

    const std::filesystem::path& root() const { return root_; }

    std::filesystem::path binDir() const;

    /**
     * @return Path of an executable installed into the environment.
     */
    std::filesystem::path executable(const std::string& name) const;

    /**
     * @return True if the environment has been created (pyvenv.cfg present).
     */
    bool exists() const;

    /**
     * @brief Creates the environment with access to system site packages.
     *        Does nothing if it already exists.
     *
     * @param python Interpreter used to create the environment.
     * @throws std::runtime_error if the interpreter fails.
     */
    void create(const std::string& python) const;

    /**
     * @brief Installs or upgrades a package with the environment's pip.
     *
     * @param package  Distribution name on the package index.
     * @param indexUrl Optional alternative index; empty for the default.
     * @throws std::runtime_error if pip is missing or fails.
     */
    void installPackage(const std::string& package, const std::string& indexUrl) const;

private:
    std::filesystem::path root_;
};

} // namespace HhdInstall

#endif // ENVIRONMENT_HPP
