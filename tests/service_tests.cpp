/*
Service tests: template instance naming and systemctl calls against a fake
systemctl that records enabled units in a file.
*/
#include "test_support.hpp"

#include "service.hpp"

#include <stdexcept>
#include <string>

using namespace TestSupport;
using HhdInstall::ServiceManager;

namespace {

bool instanceThrows(const std::string& tmpl, const std::string& user)
{
    try {
        ServiceManager::instanceName(tmpl, user);
    } catch (const std::invalid_argument&) {
        return true;
    }
    return false;
}

int test_instance_names()
{
    EXPECT(ServiceManager::instanceName("hhd_local@", "alice") == "hhd_local@alice",
           "template plus user");
    EXPECT(ServiceManager::instanceName("hhd_local@.service", "alice") == "hhd_local@alice",
           ".service suffix dropped");
    EXPECT(instanceThrows("hhd_local", "alice"), "non-template unit rejected");
    EXPECT(instanceThrows("hhd_local.service", "alice"), "plain service rejected");
    EXPECT(instanceThrows("hhd_local@", ""), "empty user rejected");
    return 0;
}

int test_enable_disable_cycle()
{
    Sandbox box;
    ServiceManager services(box.config.systemctl, box.config.escalate);

    EXPECT(!services.isEnabled("hhd_local@alice"), "initially disabled");
    EXPECT(services.enable("hhd_local@alice"), "enable succeeds");
    EXPECT(services.isEnabled("hhd_local@alice"), "enabled after enable");
    EXPECT(!services.isEnabled("hhd_local@bob"), "other instance still disabled");

    EXPECT(services.enable("hhd_local@alice"), "enabling twice succeeds");
    EXPECT(box.enabledUnits() == "hhd_local@alice\n", "enabled once");

    EXPECT(services.disable("hhd_local@alice"), "disable succeeds");
    EXPECT(!services.isEnabled("hhd_local@alice"), "disabled after disable");
    EXPECT(services.daemonReload(), "daemon-reload succeeds");
    return 0;
}

int test_escalation_is_used_for_changes_only()
{
    Sandbox box;
    fs::path log = box.tools / "escalate.log";
    writeScript(box.tools / "fake-sudo",
        "echo \"$*\" >> \"" + log.string() + "\"\n"
        "exec \"$@\"\n");

    ServiceManager services(box.config.systemctl, {(box.tools / "fake-sudo").string()});
    EXPECT(services.enable("hhd_local@alice"), "escalated enable");
    EXPECT(services.isEnabled("hhd_local@alice"), "query works");

    std::string calls = readFile(log);
    EXPECT(calls == box.config.systemctl + " enable hhd_local@alice\n",
           "only enable went through the escalation prefix");
    return 0;
}

int test_failing_systemctl()
{
    ServiceManager services("false", {});
    EXPECT(!services.enable("hhd_local@alice"), "enable reports failure");
    EXPECT(!services.disable("hhd_local@alice"), "disable reports failure");
    EXPECT(!services.isEnabled("hhd_local@alice"), "not enabled");

    ServiceManager missing("hhd-install-no-such-systemctl", {});
    EXPECT(!missing.isEnabled("hhd_local@alice"), "missing systemctl means not enabled");
    return 0;
}

} // namespace

int main(void)
{
    if (test_instance_names() != 0) return 1;
    if (test_enable_disable_cycle() != 0) return 1;
    if (test_escalation_is_used_for_changes_only() != 0) return 1;
    if (test_failing_systemctl() != 0) return 1;
    std::printf("service tests passed\n");
    return 0;
}
