#include "config.hpp"
#include "identity.hpp"
#include "utils.hpp"

#include <iostream>
#include <fstream>
#include <filesystem>
#include <vector>
#include <set>
#include <cstdlib>
#include <stdexcept>
#include <yaml-cpp/yaml.h>

namespace fs = std::filesystem;

namespace HhdInstall {

namespace {

    const char* const kUpstreamBase = "https://raw.githubusercontent.com/hhd-dev/hhd/master";

    const std::set<std::string> knownKeys = {
        "install_dir", "bin_dir", "python", "package", "executable", "index_url",
        "escalate", "systemctl", "udevadm", "service_template", "reload_units",
        "require_checksums", "assets"
    };

    template <typename T>
    void readScalar(const YAML::Node& root, const char* key, T& out)
    {
        if (root[key]) {
            out = root[key].as<T>();
        }
    }

    SystemAsset parseAsset(const YAML::Node& node, size_t index)
    {
        if (!node.IsMap()) {
            throw std::runtime_error("assets[" + std::to_string(index) + "] must be a mapping");
        }

        SystemAsset asset;
        readScalar(node, "name", asset.name);
        readScalar(node, "url", asset.url);
        readScalar(node, "destination", asset.destination);
        readScalar(node, "sha256", asset.sha256);
        readScalar(node, "mode", asset.mode);

        if (asset.url.empty() || asset.destination.empty()) {
            throw std::runtime_error("assets[" + std::to_string(index) +
                                     "] requires both 'url' and 'destination'");
        }
        if (asset.name.empty()) {
            asset.name = fs::path(asset.destination).filename().string();
        }
        return asset;
    }

    YAML::Node toYaml(const Config& config)
    {
        YAML::Node root;
        root["install_dir"] = config.installDir;
        root["bin_dir"] = config.binDir;
        root["python"] = config.python;
        root["package"] = config.package;
        root["executable"] = config.executable;
        root["index_url"] = config.indexUrl;
        root["escalate"] = config.escalate;
        root["systemctl"] = config.systemctl;
        root["udevadm"] = config.udevadm;
        root["service_template"] = config.serviceTemplate;
        root["reload_units"] = config.reloadUnits;
        root["require_checksums"] = config.requireChecksums;

        YAML::Node assets(YAML::NodeType::Sequence);
        for (const auto& asset : config.assets) {
            YAML::Node a;
            a["name"] = asset.name;
            a["url"] = asset.url;
            a["destination"] = asset.destination;
            a["sha256"] = asset.sha256;
            a["mode"] = asset.mode;
            assets.push_back(a);
        }
        root["assets"] = assets;
        return root;
    }

    void requireAbsolute(const char* key, const std::string& value)
    {
        if (value.empty()) {
            throw std::runtime_error(std::string("'") + key + "' must not be empty");
        }
        if (!fs::path(value).is_absolute()) {
            throw std::runtime_error(std::string("'") + key + "' must be an absolute path or start with ~/ (got '" +
                                     value + "')");
        }
    }

} // namespace

std::vector<SystemAsset> Config::defaultAssets()
{
    const std::string base = kUpstreamBase;
    return {
        {"udev rule",
         base + "/usr/lib/udev/rules.d/83-hhd.rules",
         "/etc/udev/rules.d/83-hhd.rules",
         "",
         "0644"},
        {"systemd unit template",
         base + "/usr/lib/systemd/system/hhd_local%40.service",
         "/etc/systemd/system/hhd_local@.service",
         "",
         "0644"},
    };
}

Config Config::loadFromFile(const std::string& path)
{
    Config config;

    if (!fs::exists(path)) {
        throw std::runtime_error("Configuration file not found: " + path);
    }

    YAML::Node root;
    try {
        root = YAML::LoadFile(path);
    } catch (const YAML::Exception& e) {
        throw std::runtime_error("Unable to parse configuration file " + path + ": " + e.what());
    }

    // An empty file means "all defaults"
    if (root.IsNull()) {
        return config;
    }
    if (!root.IsMap()) {
        throw std::runtime_error("Configuration file " + path + " must contain a mapping");
    }

    for (const auto& entry : root) {
        const std::string key = entry.first.as<std::string>();
        if (knownKeys.find(key) == knownKeys.end()) {
            log_warning("Unknown configuration key '" + key + "' in " + path);
        }
    }

    try {
        readScalar(root, "install_dir", config.installDir);
        readScalar(root, "bin_dir", config.binDir);
        readScalar(root, "python", config.python);
        readScalar(root, "package", config.package);
        readScalar(root, "executable", config.executable);
        readScalar(root, "index_url", config.indexUrl);
        readScalar(root, "systemctl", config.systemctl);
        readScalar(root, "udevadm", config.udevadm);
        readScalar(root, "service_template", config.serviceTemplate);
        readScalar(root, "reload_units", config.reloadUnits);
        readScalar(root, "require_checksums", config.requireChecksums);

        if (root["escalate"]) {
            const YAML::Node& escalate = root["escalate"];
            if (escalate.IsNull()) {
                config.escalate.clear();
            } else if (escalate.IsScalar()) {
                config.escalate = {escalate.as<std::string>()};
            } else {
                config.escalate = escalate.as<std::vector<std::string>>();
            }
        }

        if (root["assets"]) {
            const YAML::Node& assets = root["assets"];
            if (!assets.IsSequence()) {
                throw std::runtime_error("'assets' must be a list");
            }
            config.assets.clear();
            for (size_t i = 0; i < assets.size(); ++i) {
                config.assets.push_back(parseAsset(assets[i], i));
            }
        }
    } catch (const YAML::Exception& e) {
        throw std::runtime_error("Invalid value in configuration file " + path + ": " + e.what());
    } catch (const std::runtime_error& e) {
        throw std::runtime_error("Invalid configuration file " + path + ": " + e.what());
    }

    if (config.package.empty() || config.executable.empty() || config.python.empty()) {
        throw std::runtime_error("Invalid configuration file " + path +
                                 ": 'python', 'package' and 'executable' must not be empty");
    }
    if (config.installDir.empty() || config.binDir.empty()) {
        throw std::runtime_error("Invalid configuration file " + path +
                                 ": 'install_dir' and 'bin_dir' must not be empty");
    }

    return config;
}

std::string Config::locate(const std::string& explicitPath, const Identity& identity)
{
    if (!explicitPath.empty()) {
        return explicitPath;
    }

    std::vector<fs::path> candidates;
    const char* xdg = std::getenv("XDG_CONFIG_HOME");
    if (xdg && *xdg) {
        candidates.push_back(fs::path(xdg) / "hhd-install" / "config.yaml");
    } else {
        candidates.push_back(fs::path(identity.home) / ".config" / "hhd-install" / "config.yaml");
    }
    candidates.push_back("/etc/hhd-install/config.yaml");

    for (const auto& candidate : candidates) {
        std::error_code ec;
        if (fs::is_regular_file(candidate, ec)) {
            return candidate.string();
        }
    }
    return {};
}

void Config::saveToFile(const std::string& path) const
{
    fs::path parent = fs::path(path).parent_path();
    if (!parent.empty()) {
        fs::create_directories(parent);
    }

    std::ofstream file(path, std::ios::trunc); // Truncate file to overwrite
    if (!file.is_open()) {
        throw std::runtime_error("Unable to open configuration file for writing: " + path);
    }

    // Adds a comment header
    file << "# hhd-install configuration\n";
    file << "# Paths may start with ~ for the invoking user's home directory.\n\n";
    print(file);

    if (!file) {
        throw std::runtime_error("Failed writing configuration file: " + path);
    }
}

void Config::print(std::ostream& out) const
{
    YAML::Emitter emitter;
    emitter << toYaml(*this);
    out << emitter.c_str() << "\n";
}

Config Config::resolvedFor(const Identity& identity) const
{
    Config resolved = *this;
    resolved.installDir = expandHome(installDir, identity.home);
    resolved.binDir = expandHome(binDir, identity.home);
    resolved.python = expandHome(python, identity.home);
    for (auto& asset : resolved.assets) {
        asset.destination = expandHome(asset.destination, identity.home);
    }

    // Uninstall deletes install_dir recursively, so it must be a directory of its own
    requireAbsolute("install_dir", resolved.installDir);
    requireAbsolute("bin_dir", resolved.binDir);
    const fs::path installDir(resolved.installDir);
    if (installDir.lexically_normal() == installDir.root_path() ||
        (!identity.home.empty() && isWithin(identity.home, installDir))) {
        throw std::runtime_error("'install_dir' must be a dedicated directory, not the home directory "
                                 "or one of its parents (got '" + resolved.installDir + "')");
    }
    return resolved;
}

} // namespace HhdInstall
