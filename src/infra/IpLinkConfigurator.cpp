#include "infra/IpLinkConfigurator.hpp"

#include <cerrno>
#include <system_error>

std::vector<std::string> IpLinkConfigurator::linkCommand(const std::string& iface,
                                                         const std::vector<std::string>& args) const {
    std::vector<std::string> argv;
    if (!elevated_) argv = privCmd_;
    argv.insert(argv.end(), {ipBin_, "link", "set", "dev", iface});
    argv.insert(argv.end(), args.begin(), args.end());
    return argv;
}

bool IpLinkConfigurator::runStep(const std::string& iface, const std::vector<std::string>& args) {
    std::string out;
    auto argv = linkCommand(iface, args);
    int rc = runCmdCapture(argv, out);
    if (rc != 0) log_ << "⚠️  " << joinCommand(argv) << " failed (" << rc << "): " << out << "\n";
    return rc == 0;
}

bool IpLinkConfigurator::applyMac(const std::string& iface, const MacAddress& mac) {
    if (!hasCmd(ipBin_)) throw std::system_error(ENOENT, std::generic_category(), ipBin_ + " not found");
    if (!elevated_ && !privCmd_.empty() && !hasCmd(privCmd_.front()))
        throw std::system_error(ENOENT, std::generic_category(), privCmd_.front() + " not found");

    log_ << "🔁 Setting MAC of " << iface << " to " << mac << " ...\n";
    bool down = runStep(iface, {"down"});
    bool set = runStep(iface, {"address", mac.toString()});
    bool up = runStep(iface, {"up"});
    return down && set && up;
}
