#include "app/MacService.hpp"

#include "util/Time.hpp"

#include <string>
#include <variant>

namespace {
template <class... Ts>
struct overloaded : Ts... {
    using Ts::operator()...;
};
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;
}  // namespace

Report MacService::run(const Command& cmd) {
    Report r;
    r.timestamp = nowStr();

    Resolution res = policy_.resolve(cmd, [&](Advisory a) {
        r.advisories.push_back(describe(a));
        if (!opt_.json) err_ << "⚠️  " << describe(a) << "\n";
    });

    auto say = [&](std::ostream& os, const std::string& line) {
        if (!opt_.json) os << line << "\n";
    };

    std::visit(overloaded{
                   [&](const CurrentAddress& a) {
                       r.action = "current";
                       r.iface = a.iface;
                       r.mac = a.mac.toString();
                       say(out_, "📡 Current MAC address (" + a.iface + "): " + a.mac.toString());
                   },
                   [&](const CurrentNotFound&) {
                       r.action = "current";
                       r.error = "No MAC address found";
                       say(out_, "❌ No MAC address found");
                   },
                   [&](const RandomAddress& a) {
                       r.action = "random";
                       r.mac = a.mac.toString();
                       r.generated = true;
                       say(out_, "🎲 Random MAC address: " + a.mac.toString());
                   },
                   [&](const ApplyAddress& a) {
                       r.action = "set";
                       r.iface = a.iface;
                       r.mac = a.mac.toString();
                       r.generated = a.generated;
                       if (link_->applyMac(a.iface, a.mac)) {
                           say(out_, "✅ MAC address of " + a.iface + " set to " + a.mac.toString());
                       } else {
                           r.error = "ip link reported errors while setting " + a.iface + " to " + a.mac.toString();
                           r.exitCode = 1;
                           say(err_, "⚠️  " + *r.error);
                       }
                   },
                   [&](const InterfaceOnly& a) {
                       r.action = "set";
                       r.iface = a.iface;
                       r.error = "You can't just pass an interface, use -r for a random address or -a to specify an address";
                       r.exitCode = 1;
                       say(err_, "❌ " + *r.error);
                   },
                   [&](const NothingToSet&) {
                       r.action = "set";
                       r.error = "Nothing to set, use -r for a random address or -a to specify an address";
                       r.exitCode = 1;
                       say(err_, "❌ " + *r.error);
                   },
                   [&](const InterfaceMissing& a) {
                       r.action = "set";
                       r.iface = a.iface;
                       r.error = "Interface doesn't exist: '" + a.iface + "'";
                       r.exitCode = 1;
                       say(err_, "❌ " + *r.error);
                   },
                   [&](const InvalidAddress& a) {
                       r.action = "set";
                       r.error = "Not a valid MAC address: '" + a.input + "' (" + describe(a.kind) + ")";
                       r.exitCode = 1;
                       say(err_, "❌ " + *r.error);
                   },
               },
               res.action);
    return r;
}
