#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <system_error>
#include <unistd.h>

#include "app/CommandLine.hpp"
#include "app/MacService.hpp"
#include "app/SelectionPolicy.hpp"
#include "domain/InterfaceDirectory.hpp"
#include "infra/IfaddrsInterfaceTable.hpp"
#include "infra/IpLinkConfigurator.hpp"
#include "util/Env.hpp"
#include "util/Process.hpp"

#ifndef MACCTL_VERSION
#define MACCTL_VERSION "0.0.0"
#endif

namespace {
constexpr int kExitUsage = 2;
constexpr int kExitSoftware = 70;

std::filesystem::path exeDir() {
    char buf[4096];
    ssize_t len = readlink("/proc/self/exe", buf, sizeof(buf) - 1);
    if (len <= 0) return std::filesystem::current_path();
    buf[len] = '\0';
    return std::filesystem::path(buf).parent_path();
}
}  // namespace

int main(int argc, char** argv) {
    std::string prog = std::filesystem::path(argv[0]).filename().string();

    loadDotenv(std::filesystem::current_path() / ".env");
    loadDotenv(exeDir() / ".env");

    Args args;
    try {
        args = parseArgs(argc, argv);
    } catch (const UsageError& e) {
        std::cerr << "❌ " << e.what() << "\n\n" << usageText(prog);
        return kExitUsage;
    }

    if (args.help) {
        std::cout << usageText(prog);
        return 0;
    }
    if (args.version) {
        std::cout << prog << " " << MACCTL_VERSION << "\n";
        return 0;
    }
    if (!args.command) {
        std::cerr << usageText(prog);
        return kExitUsage;
    }

    bool elevated = geteuid() == 0;
    std::string privCmd = getenvOr("MACCTL_PRIV_CMD", "sudo");
    if (std::holds_alternative<SetAddress>(*args.command) && !elevated && splitWords(privCmd).empty())
        std::cerr << "⚠️  Not running as root and MACCTL_PRIV_CMD is empty; ip link may refuse the change.\n";

    auto table = std::make_shared<IfaddrsInterfaceTable>();
    auto dir = std::make_shared<InterfaceDirectory>(table);
    auto link = std::make_shared<IpLinkConfigurator>(getenvOr("MACCTL_IP_BIN", "ip"), privCmd, elevated);

    MacServiceOptions opt;
    opt.json = args.json || getenvFlag("MACCTL_JSON", false);

    MacService svc(SelectionPolicy(dir), link, opt);

    try {
        Report report = svc.run(*args.command);
        if (opt.json) std::cout << report.toJson().dump(2) << "\n";
        return report.exitCode;
    } catch (const FatalInvariantViolation& e) {
        std::cerr << "❌ Internal error: " << e.what() << "\n";
        return kExitSoftware;
    } catch (const std::system_error& e) {
        std::cerr << "❌ " << e.what() << "\n";
        return 1;
    }
}
