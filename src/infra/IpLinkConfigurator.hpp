#pragma once

#include "domain/LinkConfigurator.hpp"
#include "util/Process.hpp"

#include <iostream>
#include <string>
#include <vector>

class IpLinkConfigurator : public LinkConfigurator {
public:
    IpLinkConfigurator(std::string ipBin, std::string privCmd, bool elevated, std::ostream& log = std::cerr)
        : ipBin_(std::move(ipBin)), privCmd_(splitWords(privCmd)), elevated_(elevated), log_(log) {}

    bool applyMac(const std::string& iface, const MacAddress& mac) override;

    // `<priv> <ip> link set dev <iface> <args...>`; no prefix when already root.
    std::vector<std::string> linkCommand(const std::string& iface, const std::vector<std::string>& args) const;

private:
    std::string ipBin_;
    std::vector<std::string> privCmd_;  // e.g. {"sudo", "-n"}
    bool elevated_;
    std::ostream& log_;

    bool runStep(const std::string& iface, const std::vector<std::string>& args);
};
