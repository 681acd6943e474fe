#include "identity.hpp"

#include <cstdlib>
#include <stdexcept>
#include <pwd.h>
#include <unistd.h>

namespace HhdInstall {

Identity Identity::current()
{
    Identity identity;
    identity.uid = geteuid();

    // getpwuid points into static storage; copy out immediately
    const struct passwd* pw = getpwuid(identity.uid);
    if (pw) {
        if (pw->pw_name) identity.username = pw->pw_name;
        if (pw->pw_dir)  identity.home     = pw->pw_dir;
    }

    if (identity.username.empty()) {
        const char* user = std::getenv("USER");
        if (!user || !*user) {
            user = std::getenv("LOGNAME");
        }
        if (user && *user) {
            identity.username = user;
        }
    }
    if (identity.username.empty()) {
        throw std::runtime_error("Unable to determine user name for uid " +
                                 std::to_string(identity.uid));
    }

    // "~" in the shell follows $HOME, so prefer it over the passwd entry
    const char* home = std::getenv("HOME");
    if (home && *home) {
        identity.home = home;
    }
    if (identity.home.empty()) {
        throw std::runtime_error("Unable to determine home directory for user " +
                                 identity.username);
    }

    return identity;
}

} // namespace HhdInstall
