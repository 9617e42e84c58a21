#pragma once

#include <array>
#include <cstdint>
#include <ostream>
#include <random>
#include <stdexcept>
#include <string>

class MacParseError : public std::invalid_argument {
public:
    enum class Kind { InvalidDigit, InvalidLength };

    MacParseError(Kind kind, std::string input);

    Kind kind() const { return kind_; }
    const std::string& input() const { return input_; }

private:
    Kind kind_;
    std::string input_;
};

const char* describe(MacParseError::Kind kind);

class MacAddress {
public:
    static constexpr std::size_t kLength = 6;
    using Bytes = std::array<std::uint8_t, kLength>;

    MacAddress() = default;
    explicit MacAddress(const Bytes& bytes) : bytes_(bytes) {}

    // Accepts six 1-2 digit hex fields separated by ':' or '-'.
    static MacAddress parse(const std::string& text);

    // Unicast, locally administered address (IEEE 802): bit 0 of the
    // first octet cleared, bit 1 set. Only the raw octets are random.
    template <class Engine>
    static MacAddress random(Engine& rng) {
        std::uniform_int_distribution<unsigned> octet(0, 0xff);
        Bytes b{};
        for (auto& o : b) o = static_cast<std::uint8_t>(octet(rng));
        b[0] &= 0xfe;
        b[0] |= 0x02;
        return MacAddress(b);
    }
    static MacAddress random();

    std::string toString() const;
    const Bytes& bytes() const { return bytes_; }

    bool isZero() const;
    bool isMulticast() const { return (bytes_[0] & 0x01) != 0; }
    bool isLocallyAdministered() const { return (bytes_[0] & 0x02) != 0; }

    bool operator==(const MacAddress& other) const { return bytes_ == other.bytes_; }
    bool operator!=(const MacAddress& other) const { return bytes_ != other.bytes_; }

private:
    Bytes bytes_{};
};

std::ostream& operator<<(std::ostream& os, const MacAddress& mac);
