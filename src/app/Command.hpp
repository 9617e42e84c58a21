#pragma once

#include <optional>
#include <string>
#include <variant>

struct ShowCurrent {};

struct ShowRandom {};

struct SetAddress {
    std::optional<std::string> address;
    std::optional<std::string> iface;
    bool random = false;
};

using Command = std::variant<ShowCurrent, ShowRandom, SetAddress>;
