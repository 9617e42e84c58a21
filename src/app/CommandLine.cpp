#include "app/CommandLine.hpp"

#include <sstream>

namespace {
// Splits `--opt=value` in place.
std::optional<std::string> splitInline(std::string& s) {
    if (s.compare(0, 2, "--") != 0) return std::nullopt;
    auto eq = s.find('=');
    if (eq == std::string::npos) return std::nullopt;
    std::string v = s.substr(eq + 1);
    s.erase(eq);
    return v;
}
}  // namespace

Args parseArgs(int argc, const char* const* argv) {
    Args a;
    bool current = false;
    bool random = false;
    bool inSet = false;
    SetAddress set;

    for (int i = 1; i < argc; i++) {
        std::string s = argv[i];
        auto inlineVal = splitInline(s);

        auto value = [&](const std::string& opt) -> std::string {
            if (inlineVal) return *inlineVal;
            if (i + 1 >= argc) throw UsageError("missing value for " + opt);
            return argv[++i];
        };
        auto noValue = [&](const std::string& opt) {
            if (inlineVal) throw UsageError(opt + " does not take a value");
        };

        if (s == "-h" || s == "--help") {
            noValue(s);
            a.help = true;
        } else if (s == "--json") {
            noValue(s);
            a.json = true;
        } else if (!inSet && (s == "-V" || s == "--version")) {
            noValue(s);
            a.version = true;
        } else if (!inSet && (s == "-c" || s == "--current")) {
            noValue(s);
            current = true;
        } else if (!inSet && (s == "-r" || s == "--random")) {
            noValue(s);
            random = true;
        } else if (!inSet && s == "set") {
            inSet = true;
        } else if (inSet && (s == "-a" || s == "--address")) {
            set.address = value(s);
        } else if (inSet && (s == "-i" || s == "--interface")) {
            set.iface = value(s);
        } else if (inSet && (s == "-r" || s == "--random")) {
            noValue(s);
            set.random = true;
        } else {
            throw UsageError("unknown argument: " + std::string(argv[i]));
        }
    }

    if (current)
        a.command = ShowCurrent{};
    else if (random)
        a.command = ShowRandom{};
    else if (inSet)
        a.command = set;
    return a;
}

std::string usageText(const std::string& prog) {
    std::ostringstream oss;
    oss << "A simple MAC address utility\n\n"
        << "Usage: " << prog << " [OPTIONS] [COMMAND]\n\n"
        << "Commands:\n"
        << "  set                    Set the MAC address of an interface\n"
        << "    -a, --address <MAC>  New MAC address to use\n"
        << "    -i, --interface <IF> Interface to use (name)\n"
        << "    -r, --random         Use a random MAC address\n\n"
        << "Options:\n"
        << "  -c, --current          Print current MAC address\n"
        << "  -r, --random           Generate a random MAC address\n"
        << "      --json             Print the result as JSON\n"
        << "  -h, --help             Print help\n"
        << "  -V, --version          Print version\n\n"
        << "Environment (also read from .env):\n"
        << "  MACCTL_IP_BIN          iproute2 binary (default: ip)\n"
        << "  MACCTL_PRIV_CMD        privilege prefix when not root (default: sudo)\n"
        << "  MACCTL_JSON            1 to always print JSON\n";
    return oss.str();
}
