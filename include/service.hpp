#ifndef SERVICE_HPP
#define SERVICE_HPP

#include <string>
#include <vector>

namespace HhdInstall {

/**
 * @class ServiceManager
 * @brief Thin wrapper over systemctl for the templated hhd service.
 *
 * State-changing calls go through the escalation prefix; queries do not.
 */
class ServiceManager
{
public:
    ServiceManager(std::string systemctl, std::vector<std::string> escalate);

    /**
     * @brief Builds the instance unit name for a user, e.g.
     *        ("hhd_local@", "alice") -> "hhd_local@alice".
     *
     * A trailing ".service" on the template is accepted and dropped.
     *
     * @throws std::invalid_argument if the template has no '@' or the
     *         user name is empty.
     */
    static std::string instanceName(const std::string& unitTemplate,
                                    const std::string& username);

    /**
     * @brief Enables a unit without starting it.
     * @return True if systemctl exited with status 0.
     */
    bool enable(const std::string& unit) const;

    bool disable(const std::string& unit) const;

    /**
     * @return True if `systemctl is-enabled <unit>` reports "enabled".
     */
    bool isEnabled(const std::string& unit) const;

    bool daemonReload() const;

private:
    std::string systemctl_;
    std::vector<std::string> escalate_;
};

} // namespace HhdInstall

#endif // SERVICE_HPP
