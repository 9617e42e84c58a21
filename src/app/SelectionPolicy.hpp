#pragma once

#include "app/Command.hpp"
#include "app/Resolution.hpp"
#include "domain/InterfaceDirectory.hpp"

#include <functional>
#include <memory>

// Decides what a command does. Queries the interface table but never
// changes anything; first matching branch wins.
class SelectionPolicy {
public:
    using MacGenerator = std::function<MacAddress()>;
    // Called for each advisory as soon as it is raised, before any later
    // lookup that may throw.
    using AdvisorySink = std::function<void(Advisory)>;

    explicit SelectionPolicy(std::shared_ptr<InterfaceDirectory> dir,
                             MacGenerator generate = [] { return MacAddress::random(); })
        : dir_(std::move(dir)), generate_(std::move(generate)) {}

    Resolution resolve(const Command& cmd, const AdvisorySink& onAdvisory = {}) const;

private:
    std::shared_ptr<InterfaceDirectory> dir_;
    MacGenerator generate_;

    Resolution resolveSet(const SetAddress& set, const AdvisorySink& onAdvisory) const;
    void target(const SetAddress& set,
                const MacAddress& mac,
                bool generated,
                Resolution& out,
                const AdvisorySink& onAdvisory) const;
};
