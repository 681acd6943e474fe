/*
Shared helpers for the hhd-install test programs: temporary directories,
fake python/pip/systemctl/udevadm scripts, and a sandboxed Config/Identity
that never touches the real system or network.
*/
#ifndef TEST_SUPPORT_HPP
#define TEST_SUPPORT_HPP

#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <string>
#include <filesystem>
#include <stdexcept>

#include <sys/stat.h>

#include "config.hpp"
#include "identity.hpp"

#define EXPECT(cond, msg) do { \
    if (!(cond)) { \
        std::fprintf(stderr, "FAIL: %s (%s:%d)\n", msg, __FILE__, __LINE__); \
        return 1; \
    } \
} while (0)

namespace TestSupport {

namespace fs = std::filesystem;

class TempDir
{
public:
    TempDir()
    {
        std::string pattern = (fs::temp_directory_path() / "hhdinstall-test-XXXXXX").string();
        if (!mkdtemp(pattern.data())) {
            throw std::runtime_error("mkdtemp failed for " + pattern);
        }
        path_ = pattern;
    }

    ~TempDir()
    {
        std::error_code ec;
        fs::remove_all(path_, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const fs::path& path() const { return path_; }

private:
    fs::path path_;
};

inline void writeFile(const fs::path& path, const std::string& content)
{
    fs::create_directories(path.parent_path());
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out << content;
    if (!out) {
        throw std::runtime_error("Cannot write " + path.string());
    }
}

inline std::string readFile(const fs::path& path)
{
    std::ifstream in(path, std::ios::binary);
    std::ostringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

inline void writeScript(const fs::path& path, const std::string& body)
{
    writeFile(path, "#!/bin/sh\n" + body);
    fs::permissions(path, fs::perms::owner_all | fs::perms::group_read |
                          fs::perms::group_exec | fs::perms::others_read |
                          fs::perms::others_exec);
}

inline bool isExecutable(const fs::path& path)
{
    struct stat st;
    return stat(path.c_str(), &st) == 0 && (st.st_mode & S_IXUSR);
}

// Files whose upstream copies the sandboxed installer fetches over file://
const char* const kRulesContent =
    "# Handheld Daemon udev rules\n"
    "KERNEL==\"uinput\", SUBSYSTEM==\"misc\", TAG+=\"uaccess\"\n";
const char* const kUnitContent =
    "[Unit]\nDescription=Handheld Daemon for %i\n\n"
    "[Service]\nExecStart=/home/%i/.local/bin/hhd --user %i\n\n"
    "[Install]\nWantedBy=multi-user.target\n";

/**
 * A throwaway home directory plus fake tools. config installs into
 * <root>/home/alice and writes "privileged" files under <root>/etc.
 */
class Sandbox
{
public:
    Sandbox()
        : home(dir.path() / "home" / "alice"),
          tools(dir.path() / "tools"),
          upstream(dir.path() / "upstream"),
          etc(dir.path() / "etc")
    {
        fs::create_directories(home);

        identity.uid = 1000;
        identity.username = "alice";
        identity.home = home.string();

        writeFile(upstream / "83-hhd.rules", kRulesContent);
        writeFile(upstream / "hhd_local-template.service", kUnitContent);

        writeScript(tools / "python",
            "if [ \"$1\" != \"-m\" ] || [ \"$2\" != \"venv\" ] || [ \"$3\" != \"--system-site-packages\" ]; then\n"
            "    echo \"unexpected arguments: $*\" >&2\n"
            "    exit 2\n"
            "fi\n"
            "dir=\"$4\"\n"
            "mkdir -p \"$dir/bin\" || exit 1\n"
            "echo \"include-system-site-packages = true\" > \"$dir/pyvenv.cfg\"\n"
            "cat > \"$dir/bin/pip\" <<'PIP'\n"
            "#!/bin/sh\n"
            "bindir=$(dirname \"$0\")\n"
            "echo \"$*\" >> \"$bindir/../pip.log\"\n"
            "case \"$*\" in *no-such-package*) echo \"ERROR: No matching distribution\" >&2; exit 1;; esac\n"
            "printf '#!/bin/sh\\necho hhd\\n' > \"$bindir/hhd\"\n"
            "chmod 755 \"$bindir/hhd\"\n"
            "PIP\n"
            "chmod 755 \"$dir/bin/pip\"\n"
            "echo \"$dir\" >> \"" + (tools / "python.log").string() + "\"\n");

        const std::string state = (tools / "enabled-units").string();
        writeScript(tools / "systemctl",
            "state=\"" + state + "\"\n"
            "touch \"$state\"\n"
            "case \"$1\" in\n"
            "  enable) grep -qx \"$2\" \"$state\" || echo \"$2\" >> \"$state\" ;;\n"
            "  disable) grep -vx \"$2\" \"$state\" > \"$state.tmp\"; mv \"$state.tmp\" \"$state\" ;;\n"
            "  is-enabled) if grep -qx \"$2\" \"$state\"; then echo enabled; else echo disabled; exit 1; fi ;;\n"
            "  daemon-reload) echo daemon-reload >> \"" + (tools / "reloads.log").string() + "\" ;;\n"
            "  *) exit 1 ;;\n"
            "esac\n");

        writeScript(tools / "udevadm",
            "echo \"$*\" >> \"" + (tools / "reloads.log").string() + "\"\n");

        config.python = (tools / "python").string();
        config.systemctl = (tools / "systemctl").string();
        config.udevadm = (tools / "udevadm").string();
        config.escalate.clear();
        config.assets = {
            {"udev rule",
             "file://" + (upstream / "83-hhd.rules").string(),
             (etc / "udev" / "rules.d" / "83-hhd.rules").string(),
             "",
             "0644"},
            {"systemd unit template",
             "file://" + (upstream / "hhd_local-template.service").string(),
             (etc / "systemd" / "system" / "hhd_local@.service").string(),
             "",
             "0644"},
        };
    }

    fs::path installDir() const { return home / ".local" / "share" / "hhd"; }
    fs::path venv() const { return installDir() / "venv"; }
    fs::path link() const { return home / ".local" / "bin" / "hhd"; }
    fs::path rulesDest() const { return config.assets[0].destination; }
    fs::path unitDest() const { return config.assets[1].destination; }

    std::string enabledUnits() const { return readFile(tools / "enabled-units"); }

    TempDir dir;
    fs::path home;
    fs::path tools;
    fs::path upstream;
    fs::path etc;
    HhdInstall::Identity identity;
    HhdInstall::Config config;
};

} // namespace TestSupport

#endif // TEST_SUPPORT_HPP
