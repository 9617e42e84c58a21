#pragma once

#include "domain/InterfaceTable.hpp"

#include <memory>
#include <optional>
#include <string>

struct InterfaceInfo {
    std::string name;
    MacAddress mac;
};

class InterfaceDirectory {
public:
    explicit InterfaceDirectory(std::shared_ptr<InterfaceTable> table) : table_(std::move(table)) {}

    bool exists(const std::string& name);

    // With a name: that interface's link-layer address, even if all zero.
    // Without: the first link-layer row whose address is not all zero.
    std::optional<InterfaceInfo> lookup(const std::optional<std::string>& name = std::nullopt);

private:
    std::shared_ptr<InterfaceTable> table_;
};
