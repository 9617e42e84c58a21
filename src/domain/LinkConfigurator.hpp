#pragma once

#include "domain/MacAddress.hpp"

#include <string>

struct LinkConfigurator {
    virtual ~LinkConfigurator() = default;
    // down, set link-layer address, up; every step is attempted. Returns
    // false if any step reported failure. Throws std::system_error only
    // when a step cannot be invoked at all.
    virtual bool applyMac(const std::string& iface, const MacAddress& mac) = 0;
};
