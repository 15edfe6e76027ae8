#pragma once

#include <cstdint>
#include <optional>
#include <ostream>
#include <string>

namespace supervisor_cpp {

class IPv4Address {
public:
    constexpr IPv4Address() = default;
    constexpr explicit IPv4Address(uint32_t value) : value_(value) {}

    // Dotted quad, e.g. "172.30.32.2"
    static std::optional<IPv4Address> parse(const std::string& text);

    constexpr uint32_t toUint() const
    {
        return value_;
    }

    std::string toString() const;

    constexpr bool operator==(const IPv4Address& other) const
    {
        return value_ == other.value_;
    }
    constexpr bool operator!=(const IPv4Address& other) const
    {
        return value_ != other.value_;
    }
    constexpr bool operator<(const IPv4Address& other) const
    {
        return value_ < other.value_;
    }

private:
    uint32_t value_ = 0;
};

// CIDR network, e.g. "172.30.32.0/23"
class IPv4Network {
public:
    IPv4Network(IPv4Address address, uint8_t prefix_length);

    static std::optional<IPv4Network> parse(const std::string& cidr);

    IPv4Address networkAddress() const
    {
        return network_;
    }

    uint8_t prefixLength() const
    {
        return prefix_length_;
    }

    uint64_t size() const;

    // index-th address of the network; index 0 is the network address
    IPv4Address at(uint64_t index) const;

    bool contains(IPv4Address address) const;

    std::string toString() const;

private:
    uint32_t mask() const;

    IPv4Address network_;
    uint8_t prefix_length_;
};

std::ostream& operator<<(std::ostream& os, const IPv4Address& address);
std::ostream& operator<<(std::ostream& os, const IPv4Network& network);

} // namespace supervisor_cpp
