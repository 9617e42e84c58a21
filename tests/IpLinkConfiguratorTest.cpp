#include "infra/IpLinkConfigurator.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <sstream>
#include <system_error>

namespace {
const MacAddress kMac = MacAddress::parse("02:AB:CD:EF:01:23");

// Stand-in for ip(8): records its arguments, fails when asked to.
std::filesystem::path fakeIp(const std::string& name, int failOn) {
    auto dir = std::filesystem::path(::testing::TempDir());
    auto script = dir / name;
    auto log = dir / (name + ".log");
    std::filesystem::remove(log);
    std::ofstream(script) << "#!/bin/sh\n"
                          << "echo \"$@\" >> '" << log.string() << "'\n"
                          << "n=$(wc -l < '" << log.string() << "')\n"
                          << "[ \"$n\" -eq " << failOn << " ] && { echo 'RTNETLINK answers: Operation not permitted'; exit 2; }\n"
                          << "exit 0\n";
    std::filesystem::permissions(script, std::filesystem::perms::owner_all);
    return script;
}

std::string readAll(const std::filesystem::path& p) {
    std::ifstream in(p);
    std::ostringstream oss;
    oss << in.rdbuf();
    return oss.str();
}
}  // namespace

TEST(IpLinkConfiguratorTest, PrefixesPrivilegeCommandUnlessRoot) {
    IpLinkConfigurator user("ip", "sudo", false);
    EXPECT_EQ(user.linkCommand("eth0", {"down"}),
              (std::vector<std::string>{"sudo", "ip", "link", "set", "dev", "eth0", "down"}));

    IpLinkConfigurator root("/sbin/ip", "sudo", true);
    EXPECT_EQ(root.linkCommand("eth0", {"address", "02:00:00:00:00:01"}),
              (std::vector<std::string>{"/sbin/ip", "link", "set", "dev", "eth0", "address", "02:00:00:00:00:01"}));

    IpLinkConfigurator noPrefix("ip", "", false);
    EXPECT_EQ(noPrefix.linkCommand("wlan0", {"up"}).front(), "ip");

    IpLinkConfigurator blank("ip", "   ", false);
    EXPECT_EQ(blank.linkCommand("wlan0", {"up"}).front(), "ip");
}

TEST(IpLinkConfiguratorTest, SplitsPrivilegePrefixIntoWords) {
    IpLinkConfigurator link("ip", "  doas   -n ", false);
    EXPECT_EQ(link.linkCommand("eth0", {"down"}),
              (std::vector<std::string>{"doas", "-n", "ip", "link", "set", "dev", "eth0", "down"}));
}

TEST(IpLinkConfiguratorTest, RunsThroughMultiWordPrefix) {
    auto ip = fakeIp("macctl_fake_ip_env", 0);
    std::ostringstream log;
    IpLinkConfigurator link(ip.string(), "env MACCTL_VIA_PREFIX=1", false, log);

    EXPECT_TRUE(link.applyMac("eth0", kMac));
    EXPECT_EQ(readAll(ip.string() + ".log"),
              "link set dev eth0 down\n"
              "link set dev eth0 address 02:AB:CD:EF:01:23\n"
              "link set dev eth0 up\n");
}

TEST(IpLinkConfiguratorTest, RunsDownAddressUpInOrder) {
    auto ip = fakeIp("macctl_fake_ip_ok", 0);
    std::ostringstream log;
    IpLinkConfigurator link(ip.string(), "", false, log);

    EXPECT_TRUE(link.applyMac("eth0", kMac));

    EXPECT_EQ(readAll(ip.string() + ".log"),
              "link set dev eth0 down\n"
              "link set dev eth0 address 02:AB:CD:EF:01:23\n"
              "link set dev eth0 up\n");
    EXPECT_EQ(log.str().find("⚠️"), std::string::npos);
}

TEST(IpLinkConfiguratorTest, FailedStepStillBringsInterfaceUp) {
    auto ip = fakeIp("macctl_fake_ip_fail", 2);
    std::ostringstream log;
    IpLinkConfigurator link(ip.string(), "", false, log);

    bool ok = true;
    EXPECT_NO_THROW(ok = link.applyMac("eth0", kMac));
    EXPECT_FALSE(ok);

    auto calls = readAll(ip.string() + ".log");
    EXPECT_NE(calls.find("link set dev eth0 up"), std::string::npos);
    EXPECT_NE(log.str().find("RTNETLINK answers"), std::string::npos);
}

TEST(IpLinkConfiguratorTest, MissingBinaryIsAnIoError) {
    std::ostringstream log;
    IpLinkConfigurator noIp("macctl-no-such-ip", "", false, log);
    EXPECT_THROW(noIp.applyMac("eth0", kMac), std::system_error);

    auto ip = fakeIp("macctl_fake_ip_priv", 0);
    IpLinkConfigurator noPriv(ip.string(), "macctl-no-such-sudo", false, log);
    EXPECT_THROW(noPriv.applyMac("eth0", kMac), std::system_error);
}
