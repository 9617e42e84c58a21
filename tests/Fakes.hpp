#pragma once

#include "domain/InterfaceTable.hpp"
#include "domain/LinkConfigurator.hpp"

#include <cerrno>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

inline MacAddress mac(const std::string& text) { return MacAddress::parse(text); }

class FakeInterfaceTable : public InterfaceTable {
public:
    FakeInterfaceTable() = default;
    explicit FakeInterfaceTable(std::vector<InterfaceEntry> rows) : rows_(std::move(rows)) {}

    std::vector<InterfaceEntry> snapshot() override {
        ++snapshots;
        if (fail) throw std::system_error(EACCES, std::generic_category(), "getifaddrs");
        return rows_;
    }

    int snapshots = 0;
    bool fail = false;

private:
    std::vector<InterfaceEntry> rows_;
};

class RecordingLinkConfigurator : public LinkConfigurator {
public:
    bool applyMac(const std::string& iface, const MacAddress& addr) override {
        calls.emplace_back(iface, addr);
        return succeed;
    }

    std::vector<std::pair<std::string, MacAddress>> calls;
    bool succeed = true;
};

// Typical Linux table: lo first with an all-zero MAC, inet rows without one.
inline std::vector<InterfaceEntry> typicalRows() {
    return {
        {"lo", mac("00:00:00:00:00:00")},
        {"eth0", mac("52:54:00:12:34:56")},
        {"wlan0", mac("A4:5E:60:01:02:03")},
        {"lo", std::nullopt},
        {"eth0", std::nullopt},
    };
}
