#include "domain/MacAddress.hpp"

#include <algorithm>
#include <cctype>
#include <cstdio>

namespace {
bool isSeparator(char c) { return c == ':' || c == '-'; }

int hexValue(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    return -1;
}

// 1 or 2 hex digits, nothing else (no sign, no whitespace).
bool parseOctet(const std::string& field, std::uint8_t& out) {
    if (field.empty() || field.size() > 2) return false;
    unsigned v = 0;
    for (char c : field) {
        int d = hexValue(c);
        if (d < 0) return false;
        v = v * 16 + static_cast<unsigned>(d);
    }
    out = static_cast<std::uint8_t>(v);
    return true;
}
}  // namespace

MacParseError::MacParseError(Kind kind, std::string input)
    : std::invalid_argument(describe(kind)), kind_(kind), input_(std::move(input)) {}

const char* describe(MacParseError::Kind kind) {
    switch (kind) {
        case MacParseError::Kind::InvalidDigit:
            return "invalid digit";
        case MacParseError::Kind::InvalidLength:
            return "invalid length";
    }
    return "invalid address";
}

MacAddress MacAddress::parse(const std::string& text) {
    Bytes bytes{};
    std::size_t nth = 0;
    std::size_t start = 0;
    while (true) {
        auto end = std::find_if(text.begin() + static_cast<std::ptrdiff_t>(start), text.end(), isSeparator);
        auto stop = static_cast<std::size_t>(end - text.begin());

        if (nth == kLength) throw MacParseError(MacParseError::Kind::InvalidLength, text);
        if (!parseOctet(text.substr(start, stop - start), bytes[nth]))
            throw MacParseError(MacParseError::Kind::InvalidDigit, text);
        ++nth;

        if (end == text.end()) break;
        start = stop + 1;
    }

    if (nth != kLength) throw MacParseError(MacParseError::Kind::InvalidLength, text);
    return MacAddress(bytes);
}

MacAddress MacAddress::random() {
    static std::mt19937 rng{std::random_device{}()};
    return random(rng);
}

std::string MacAddress::toString() const {
    char buf[18];
    std::snprintf(buf, sizeof buf, "%02X:%02X:%02X:%02X:%02X:%02X",
                  bytes_[0], bytes_[1], bytes_[2], bytes_[3], bytes_[4], bytes_[5]);
    return std::string(buf);
}

bool MacAddress::isZero() const {
    return std::all_of(bytes_.begin(), bytes_.end(), [](std::uint8_t b) { return b == 0; });
}

std::ostream& operator<<(std::ostream& os, const MacAddress& mac) { return os << mac.toString(); }
