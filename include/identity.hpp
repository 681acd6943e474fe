#ifndef IDENTITY_HPP
#define IDENTITY_HPP

#include <string>
#include <sys/types.h>

namespace HhdInstall {

/**
 * @struct Identity
 * @brief The user on whose behalf the installer runs.
 *
 * Every step receives the identity explicitly; nothing reads the
 * process environment after startup.
 */
struct Identity
{
    uid_t uid = 0;
    std::string username;
    std::string home;

    /**
     * @return True if this is the superuser (uid 0).
     */
    bool isSuperuser() const { return uid == 0; }

    /**
     * @brief Builds the identity of the calling process from the effective
     *        user id, the password database, and $HOME.
     *
     * @throws std::runtime_error if no user name can be determined.
     */
    static Identity current();
};

} // namespace HhdInstall

#endif // IDENTITY_HPP
