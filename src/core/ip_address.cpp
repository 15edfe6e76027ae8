#include <arpa/inet.h>
#include <stdexcept>
#include <supervisor-cpp/core/ip_address.hpp>

namespace supervisor_cpp {

std::optional<IPv4Address> IPv4Address::parse(const std::string& text)
{
    in_addr addr{};
    if (inet_pton(AF_INET, text.c_str(), &addr) != 1) {
        return std::nullopt;
    }
    return IPv4Address(ntohl(addr.s_addr));
}

std::string IPv4Address::toString() const
{
    in_addr addr{};
    addr.s_addr = htonl(value_);

    char buffer[INET_ADDRSTRLEN];
    if (inet_ntop(AF_INET, &addr, buffer, sizeof(buffer)) == nullptr) {
        return {};
    }
    return buffer;
}

IPv4Network::IPv4Network(IPv4Address address, uint8_t prefix_length)
    : network_(address), prefix_length_(prefix_length)
{
    if (prefix_length_ > 32) {
        throw std::invalid_argument("IPv4 prefix length out of range: "
                                    + std::to_string(prefix_length_));
    }
    network_ = IPv4Address(address.toUint() & mask());
}

std::optional<IPv4Network> IPv4Network::parse(const std::string& cidr)
{
    size_t slash = cidr.find('/');
    if (slash == std::string::npos) {
        return std::nullopt;
    }

    auto address = IPv4Address::parse(cidr.substr(0, slash));
    if (!address) {
        return std::nullopt;
    }

    std::string prefix = cidr.substr(slash + 1);
    if (prefix.empty() || prefix.size() > 2
        || prefix.find_first_not_of("0123456789") != std::string::npos) {
        return std::nullopt;
    }

    int length = std::stoi(prefix);
    if (length > 32) {
        return std::nullopt;
    }

    return IPv4Network(*address, static_cast<uint8_t>(length));
}

uint64_t IPv4Network::size() const
{
    return uint64_t{1} << (32 - prefix_length_);
}

IPv4Address IPv4Network::at(uint64_t index) const
{
    if (index >= size()) {
        throw std::out_of_range("Address index " + std::to_string(index) + " outside "
                                + toString());
    }
    return IPv4Address(network_.toUint() + static_cast<uint32_t>(index));
}

bool IPv4Network::contains(IPv4Address address) const
{
    return (address.toUint() & mask()) == network_.toUint();
}

std::string IPv4Network::toString() const
{
    return network_.toString() + "/" + std::to_string(prefix_length_);
}

uint32_t IPv4Network::mask() const
{
    return prefix_length_ == 0 ? 0 : ~uint32_t{0} << (32 - prefix_length_);
}

std::ostream& operator<<(std::ostream& os, const IPv4Address& address)
{
    return os << address.toString();
}

std::ostream& operator<<(std::ostream& os, const IPv4Network& network)
{
    return os << network.toString();
}

} // namespace supervisor_cpp
