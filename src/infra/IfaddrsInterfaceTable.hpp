#pragma once

#include "domain/InterfaceTable.hpp"

// Reads the table with getifaddrs(3); AF_PACKET rows carry the MAC.
class IfaddrsInterfaceTable : public InterfaceTable {
public:
    std::vector<InterfaceEntry> snapshot() override;
};
