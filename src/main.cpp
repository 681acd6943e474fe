#include <iostream>
#include <string>
#include <vector>
#include <cstdlib>
#include <filesystem>
#include <memory>

#include "config.hpp"
#include "download.hpp"
#include "identity.hpp"
#include "install.hpp"
#include "remove.hpp"
#include "status.hpp"
#include "utils.hpp"

namespace {

    // Exit status for usage and configuration errors
    constexpr int kUsageError = 2;

    void printHelp()
    {
        std::cout << "hhd-install\n"
                  << "Usage: hhd-install [command] [--config <file>] [--verbose]\n\n"
                  << "Installs Handheld Daemon into ~/.local/share/hhd for the current user,\n"
                  << "adds its udev rule and service template, and enables the service.\n"
                  << "Run it as your user; it uses sudo for the privileged steps.\n\n"
                  << "Commands:\n"
                  << "  install      - Install or upgrade Handheld Daemon (default)\n"
                  << "  uninstall    - Remove everything install created\n"
                  << "  status       - Check the current installation\n"
                  << "  config       - Print the effective configuration\n"
                  << "  config init  - Write the default configuration to ~/.config/hhd-install\n"
                  << "  help         - Show this message\n";
    }

} // namespace

int main(int argc, char* argv[])
{
    std::string command = "install";
    std::string subCommand;
    std::string configPath;
    bool commandSeen = false;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--config") {
            if (i + 1 < argc) {
                configPath = argv[++i];
            } else {
                std::cerr << "Error: --config requires a file argument.\n";
                return kUsageError;
            }
        }
        else if (arg == "--verbose" || arg == "-v") {
            HhdInstall::setVerbose(true);
        }
        else if (arg == "--help" || arg == "-h") {
            command = "help";
            commandSeen = true;
        }
        else if (!arg.empty() && arg[0] == '-') {
            std::cerr << "Error: Unknown option '" << arg << "'.\n";
            return kUsageError;
        }
        else if (!commandSeen) {
            command = arg;
            commandSeen = true;
        }
        else if (command == "config" && subCommand.empty()) {
            subCommand = arg;
        }
        else {
            std::cerr << "Error: Unexpected argument '" << arg << "'.\n";
            return kUsageError;
        }
    }

    if (command == "help") {
        printHelp();
        return EXIT_SUCCESS;
    }
    if (command != "install" && command != "uninstall" &&
        command != "status"  && command != "config") {
        std::cerr << "Unknown command '" << command << "'.\n";
        printHelp();
        return kUsageError;
    }
    if (command == "config" && !subCommand.empty() && subCommand != "init") {
        std::cerr << "Unknown subcommand for 'config': " << subCommand << "\n";
        return kUsageError;
    }

    HhdInstall::Identity identity;
    try {
        identity = HhdInstall::Identity::current();
    } catch (const std::exception& e) {
        HhdInstall::log_error(e.what());
        return EXIT_FAILURE;
    }

    // Refuse before touching anything, including the configuration
    if ((command == "install" || command == "uninstall") && identity.isSuperuser()) {
        HhdInstall::printRootAdvisory(std::cout);
        return EXIT_FAILURE;
    }

    // "config init" writes the file, so there is nothing to load yet
    const bool initConfig = command == "config" && subCommand == "init";

    HhdInstall::Config config;
    const std::string located = initConfig ? std::string()
                                           : HhdInstall::Config::locate(configPath, identity);
    if (!located.empty()) {
        try {
            config = HhdInstall::Config::loadFromFile(located);
            HhdInstall::log_debug("Loaded configuration from " + located);
        } catch (const std::exception& e) {
            HhdInstall::log_error(e.what());
            return kUsageError;
        }
    }

    // -------------------------------------------------------------
    // Config Command
    // -------------------------------------------------------------
    if (command == "config") {
        if (initConfig) {
            namespace fs = std::filesystem;
            fs::path target = configPath.empty()
                ? fs::path(identity.home) / ".config" / "hhd-install" / "config.yaml"
                : fs::path(configPath);
            if (fs::exists(target)) {
                std::cerr << "Error: " << target.string() << " already exists.\n";
                return EXIT_FAILURE;
            }
            try {
                HhdInstall::Config().saveToFile(target.string());
            } catch (const std::exception& e) {
                HhdInstall::log_error(e.what());
                return EXIT_FAILURE;
            }
            std::cout << "Wrote " << target.string() << "\n";
            return EXIT_SUCCESS;
        }
        config.print(std::cout);
        return EXIT_SUCCESS;
    }

    try {
        config.resolvedFor(identity);
    } catch (const std::exception& e) {
        HhdInstall::log_error("Invalid configuration" +
                              (located.empty() ? std::string() : " in " + located) + ": " + e.what());
        return kUsageError;
    }

    // -------------------------------------------------------------
    // Status Command
    // -------------------------------------------------------------
    if (command == "status") {
        auto checks = HhdInstall::Status::inspect(config, identity);
        return HhdInstall::Status::print(checks, std::cout) ? EXIT_SUCCESS : EXIT_FAILURE;
    }

    // -------------------------------------------------------------
    // Install / Uninstall Commands
    // -------------------------------------------------------------
    HhdInstall::InstallReport report;
    if (command == "uninstall") {
        report = HhdInstall::Uninstaller(config, identity).run();
    } else {
        std::unique_ptr<HhdInstall::CurlGlobal> curl;
        try {
            curl = std::make_unique<HhdInstall::CurlGlobal>();
        } catch (const std::exception& e) {
            HhdInstall::log_error(e.what());
            return EXIT_FAILURE;
        }
        report = HhdInstall::Installer(config, identity).run();
    }

    if (report.refused) {
        return EXIT_FAILURE;
    }

    if (const HhdInstall::StepResult* failed = report.failedStep()) {
        HhdInstall::log_error("Stopped at '" + failed->step + "'; " +
                              std::to_string(report.count(HhdInstall::StepStatus::Completed)) +
                              " step(s) completed, " +
                              std::to_string(report.count(HhdInstall::StepStatus::Skipped)) +
                              " skipped.");
        return EXIT_FAILURE;
    }
    return EXIT_SUCCESS;
}
