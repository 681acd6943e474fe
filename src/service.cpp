#include "service.hpp"
#include "process.hpp"
#include "utils.hpp"

#include <stdexcept>
#include <utility>

namespace HhdInstall {

ServiceManager::ServiceManager(std::string systemctl, std::vector<std::string> escalate)
    : systemctl_(std::move(systemctl)),
      escalate_(std::move(escalate))
{
}

std::string ServiceManager::instanceName(const std::string& unitTemplate,
                                         const std::string& username)
{
    std::string base = unitTemplate;
    const std::string suffix = ".service";
    if (base.size() > suffix.size() &&
        base.compare(base.size() - suffix.size(), suffix.size(), suffix) == 0) {
        base.erase(base.size() - suffix.size());
    }

    if (base.empty() || base.back() != '@') {
        throw std::invalid_argument("Service template '" + unitTemplate +
                                    "' is not a template unit (must end in '@')");
    }
    if (username.empty()) {
        throw std::invalid_argument("Cannot instantiate " + unitTemplate +
                                    " for an empty user name");
    }
    return base + username;
}

bool ServiceManager::enable(const std::string& unit) const
{
    log_message("Enabling " + unit);
    int rc = Process::run(Process::escalated(escalate_, {systemctl_, "enable", unit}));
    if (rc != 0) {
        log_error("systemctl enable " + unit + " exited with status " + std::to_string(rc));
        return false;
    }
    return true;
}

bool ServiceManager::disable(const std::string& unit) const
{
    log_message("Disabling " + unit);
    int rc = Process::run(Process::escalated(escalate_, {systemctl_, "disable", unit}));
    if (rc != 0) {
        log_warning("systemctl disable " + unit + " exited with status " + std::to_string(rc));
        return false;
    }
    return true;
}

bool ServiceManager::isEnabled(const std::string& unit) const
{
    // is-enabled exits non-zero for disabled units; only the output matters
    Process::CommandResult result = Process::capture({systemctl_, "is-enabled", unit});
    std::string state = result.output;
    trim(state);
    return state == "enabled";
}

bool ServiceManager::daemonReload() const
{
    int rc = Process::run(Process::escalated(escalate_, {systemctl_, "daemon-reload"}));
    if (rc != 0) {
        log_error("systemctl daemon-reload exited with status " + std::to_string(rc));
        return false;
    }
    return true;
}

} // namespace HhdInstall
