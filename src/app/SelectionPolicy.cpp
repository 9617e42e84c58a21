#include "app/SelectionPolicy.hpp"

const char* describe(Advisory advisory) {
    switch (advisory) {
        case Advisory::RandomOverridesAddress:
            return "Using a random MAC address even though --address was specified";
        case Advisory::UsingFirstInterface:
            return "No interface provided, using the first valid interface";
    }
    return "";
}

namespace {
void notify(Resolution& r, Advisory a, const SelectionPolicy::AdvisorySink& onAdvisory) {
    r.advisories.push_back(a);
    if (onAdvisory) onAdvisory(a);
}
}  // namespace

Resolution SelectionPolicy::resolve(const Command& cmd, const AdvisorySink& onAdvisory) const {
    if (std::holds_alternative<ShowCurrent>(cmd)) {
        if (auto found = dir_->lookup()) return {{}, CurrentAddress{found->name, found->mac}};
        return {{}, CurrentNotFound{}};
    }
    if (std::holds_alternative<ShowRandom>(cmd)) return {{}, RandomAddress{generate_()}};
    return resolveSet(std::get<SetAddress>(cmd), onAdvisory);
}

Resolution SelectionPolicy::resolveSet(const SetAddress& set, const AdvisorySink& onAdvisory) const {
    Resolution r{{}, NothingToSet{}};

    if (set.iface && !set.address && !set.random) {
        r.action = InterfaceOnly{*set.iface};
        return r;
    }

    if (set.random) {
        MacAddress mac = generate_();
        if (set.address) notify(r, Advisory::RandomOverridesAddress, onAdvisory);
        target(set, mac, true, r, onAdvisory);
    } else if (set.address) {
        MacAddress mac;
        try {
            mac = MacAddress::parse(*set.address);
        } catch (const MacParseError& e) {
            r.action = InvalidAddress{*set.address, e.kind()};
            return r;
        }
        target(set, mac, false, r, onAdvisory);
    }
    return r;
}

void SelectionPolicy::target(const SetAddress& set,
                             const MacAddress& mac,
                             bool generated,
                             Resolution& out,
                             const AdvisorySink& onAdvisory) const {
    if (set.iface) {
        if (dir_->exists(*set.iface))
            out.action = ApplyAddress{*set.iface, mac, generated};
        else
            out.action = InterfaceMissing{*set.iface};
        return;
    }

    notify(out, Advisory::UsingFirstInterface, onAdvisory);
    auto found = dir_->lookup();
    if (!found) throw FatalInvariantViolation("no network interface with a link-layer address to fall back to");
    out.action = ApplyAddress{found->name, mac, generated};
}
