#pragma once

#include "domain/MacAddress.hpp"

#include <stdexcept>
#include <string>
#include <variant>
#include <vector>

// Non-terminal notices emitted while resolving a command.
enum class Advisory { RandomOverridesAddress, UsingFirstInterface };

const char* describe(Advisory advisory);

struct CurrentAddress {
    std::string iface;
    MacAddress mac;
};

struct CurrentNotFound {};

struct RandomAddress {
    MacAddress mac;
};

struct ApplyAddress {
    std::string iface;
    MacAddress mac;
    bool generated = false;
};

// `set -i <iface>` without -a or -r.
struct InterfaceOnly {
    std::string iface;
};

// `set` with no option at all.
struct NothingToSet {};

struct InterfaceMissing {
    std::string iface;
};

struct InvalidAddress {
    std::string input;
    MacParseError::Kind kind;
};

using Action = std::variant<CurrentAddress,
                            CurrentNotFound,
                            RandomAddress,
                            ApplyAddress,
                            InterfaceOnly,
                            NothingToSet,
                            InterfaceMissing,
                            InvalidAddress>;

struct Resolution {
    std::vector<Advisory> advisories;
    Action action;
};

// The set fallback found no interface with a usable link-layer address.
class FatalInvariantViolation : public std::logic_error {
public:
    using std::logic_error::logic_error;
};
