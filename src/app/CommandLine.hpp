#pragma once

#include "app/Command.hpp"

#include <optional>
#include <stdexcept>
#include <string>

struct Args {
    std::optional<Command> command;  // empty when nothing was asked for
    bool json = false;
    bool help = false;
    bool version = false;
};

class UsageError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Top-level --current wins over --random, which wins over `set`.
Args parseArgs(int argc, const char* const* argv);
std::string usageText(const std::string& prog);
