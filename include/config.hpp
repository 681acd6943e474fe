#ifndef CONFIG_HPP
#define CONFIG_HPP

#include <string>
#include <vector>
#include <ostream>

namespace HhdInstall {

struct Identity;

/**
 * @struct SystemAsset
 * @brief A static file fetched over HTTPS and installed to a privileged path.
 */
struct SystemAsset
{
    std::string name;        // Human readable label used in logs
    std::string url;         // Source URL
    std::string destination; // Absolute install path
    std::string sha256;      // Expected hex digest; empty means unverified
    std::string mode = "0644";
};

class Config
{
public:
    /**
     * @brief Directory holding the virtual environment ("~" is expanded).
     */
    std::string installDir = "~/.local/share/hhd";

    /**
     * @brief Directory receiving the entry point symlink.
     */
    std::string binDir = "~/.local/bin";

    std::string python = "python";
    std::string package = "hhd";
    std::string executable = "hhd";

    /**
     * @brief Optional package index passed to pip as --index-url.
     */
    std::string indexUrl;

    /**
     * @brief Prefix used for commands that need elevated privilege.
     */
    std::vector<std::string> escalate = {"sudo"};

    std::string systemctl = "systemctl";
    std::string udevadm = "udevadm";

    /**
     * @brief Templated unit name; the instance is this plus the user name.
     */
    std::string serviceTemplate = "hhd_local@";

    /**
     * @brief Run daemon-reload and udev rule reload after installing assets.
     */
    bool reloadUnits = false;

    /**
     * @brief Refuse to install assets that have no pinned sha256.
     */
    bool requireChecksums = false;

    std::vector<SystemAsset> assets = defaultAssets();

    /**
     * @brief The udev rule and systemd unit template fetched from upstream.
     */
    static std::vector<SystemAsset> defaultAssets();

    /**
     * @brief Loads configuration from a YAML file on disk. Keys missing
     *        from the file keep their default values.
     *
     * @param path Path to the configuration file.
     * @return A fully populated Config instance.
     * @throws std::runtime_error if the file is unreadable or malformed.
     */
    static Config loadFromFile(const std::string& path);

    /**
     * @brief Finds the configuration file to use.
     *
     * Order: explicitPath, $XDG_CONFIG_HOME/hhd-install/config.yaml
     * (or ~/.config/hhd-install/config.yaml), /etc/hhd-install/config.yaml.
     *
     * @return The first existing path, explicitPath if given, or an empty
     *         string when the built-in defaults should be used.
     */
    static std::string locate(const std::string& explicitPath, const Identity& identity);

    /**
     * @brief Saves the current configuration to a file.
     * @param path Path to the file where configuration should be saved.
     * @throws std::runtime_error if the file cannot be written.
     */
    void saveToFile(const std::string& path) const;

    /**
     * @brief Prints the configuration as YAML.
     */
    void print(std::ostream& out) const;

    /**
     * @brief Returns a copy with "~" expanded in every path for the given user.
     *
     * @throws std::runtime_error if install_dir or bin_dir is empty or not
     *         absolute after expansion, or if install_dir is "/", the home
     *         directory or one of its parents.
     */
    Config resolvedFor(const Identity& identity) const;
};

} // namespace HhdInstall

#endif // CONFIG_HPP
