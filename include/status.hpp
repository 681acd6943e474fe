#ifndef STATUS_HPP
#define STATUS_HPP

#include <string>
#include <vector>
#include <ostream>

#include "config.hpp"
#include "identity.hpp"

namespace HhdInstall {

/**
 * @struct StatusCheck
 * @brief One post-install condition and whether it currently holds.
 */
struct StatusCheck
{
    std::string name;
    bool ok = false;
    std::string detail;
};

/**
 * @class Status
 * @brief Read-only inspection of an installation.
 */
class Status
{
public:
    /**
     * @brief Checks the install directory, virtual environment, PATH symlink,
     *        installed assets (against pinned digests) and the service state.
     */
    static std::vector<StatusCheck> inspect(const Config& config, const Identity& identity);

    /**
     * @brief Prints one "[ OK ]" / "[FAIL]" line per check.
     * @return True if every check passed.
     */
    static bool print(const std::vector<StatusCheck>& checks, std::ostream& out);
};

} // namespace HhdInstall

#endif // STATUS_HPP
