#pragma once

#include "domain/MacAddress.hpp"

#include <optional>
#include <string>
#include <vector>

// One row of the OS interface-address table. `link` is set only for
// link-layer family rows.
struct InterfaceEntry {
    std::string name;
    std::optional<MacAddress> link;
};

struct InterfaceTable {
    virtual ~InterfaceTable() = default;
    // Rows in OS enumeration order; throws std::system_error when the
    // table cannot be read.
    virtual std::vector<InterfaceEntry> snapshot() = 0;
};
