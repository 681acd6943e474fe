#include "environment.hpp"
#include "process.hpp"
#include "utils.hpp"

#include <stdexcept>
#include <utility>
#include <vector>

namespace fs = std::filesystem;

namespace HhdInstall {

VirtualEnv::VirtualEnv(fs::path root)
    : root_(std::move(root))
{
}

fs::path VirtualEnv::binDir() const
{
    return root_ / "bin";
}

fs::path VirtualEnv::executable(const std::string& name) const
{
    return binDir() / name;
}

bool VirtualEnv::exists() const
{
    std::error_code ec;
    return fs::is_regular_file(root_ / "pyvenv.cfg", ec);
}

void VirtualEnv::create(const std::string& python) const
{
    if (exists()) {
        log_message("Reusing virtual environment at " + root_.string());
        return;
    }

    log_message("Creating virtual environment at " + root_.string());
    const std::vector<std::string> args = {
        python, "-m", "venv", "--system-site-packages", root_.string()
    };

    int rc = Process::run(args);
    if (rc != 0) {
        throw std::runtime_error("'" + describeCommand(args) + "' exited with status " +
                                 std::to_string(rc));
    }
    if (!exists()) {
        throw std::runtime_error("Interpreter " + python + " did not create " +
                                 (root_ / "pyvenv.cfg").string());
    }
}

void VirtualEnv::installPackage(const std::string& package, const std::string& indexUrl) const
{
    fs::path pip = executable("pip");
    std::error_code ec;
    if (!fs::exists(pip, ec)) {
        throw std::runtime_error("pip not found in virtual environment: " + pip.string());
    }

    std::vector<std::string> args = {pip.string(), "install", "--upgrade"};
    if (!indexUrl.empty()) {
        args.push_back("--index-url");
        args.push_back(indexUrl);
    }
    args.push_back(package);

    log_message("Installing " + package + " into " + root_.string());
    int rc = Process::run(args);
    if (rc != 0) {
        throw std::runtime_error("'" + describeCommand(args) + "' exited with status " +
                                 std::to_string(rc));
    }
}

} // namespace HhdInstall
