#pragma once
/**
 * @file cidr.hpp
 * @brief IPv4 address blocks and the subnet address planner.
 *
 * Addresses are held in host byte order. A block is always normalised:
 * parse() rejects text whose host bits are set, so `network` is the real
 * network address.
 */

#include <cstdint>
#include <string>
#include <string_view>

#include "vpcctl/error.hpp"

namespace vpcctl::net {

/**
 * @brief IPv4 CIDR block, e.g. 10.0.1.0/24.
 */
struct Ipv4Block final {
    std::uint32_t network{0}; ///< Network address (host order)
    std::uint8_t  prefix{0};  ///< Prefix length 0..32

    /// Parse "a.b.c.d/p". ValidationFailure on bad syntax or host bits set.
    static Result<Ipv4Block> parse(std::string_view text);

    [[nodiscard]] std::uint32_t netmask() const noexcept;
    [[nodiscard]] std::uint32_t broadcast() const noexcept;

    [[nodiscard]] bool contains(std::uint32_t addr) const noexcept;
    [[nodiscard]] bool contains(const Ipv4Block& inner) const noexcept;
    [[nodiscard]] bool overlaps(const Ipv4Block& other) const noexcept;

    /// Canonical "a.b.c.d/p" text.
    [[nodiscard]] std::string to_string() const;

    bool operator==(const Ipv4Block&) const = default;
};

/// Parse a dotted-quad IPv4 literal into host order.
Result<std::uint32_t> parse_address(std::string_view text);

/// Format a host-order IPv4 address as dotted quad.
std::string format_address(std::uint32_t addr);

/**
 * @brief Gateway and host addresses derived for one subnet.
 *
 * gateway = first usable host (network + 1), assigned to the VPC bridge.
 * host    = second usable host (network + 2), assigned inside the namespace.
 */
struct AddressPlan {
    std::string gateway;      ///< "a.b.c.d"
    std::string host;         ///< "a.b.c.d"
    std::string gateway_cidr; ///< gateway with the block's prefix
    std::string host_cidr;    ///< host with the block's prefix

    bool operator==(const AddressPlan&) const = default;
};

/// First usable host address. ValidationFailure for /31 and /32.
Result<std::uint32_t> gateway_address(const Ipv4Block& block);

/// Second usable host address. ValidationFailure for /31 and /32.
Result<std::uint32_t> host_address(const Ipv4Block& block);

/// Derive the full AddressPlan for a subnet block.
Result<AddressPlan> plan_subnet(const Ipv4Block& block);

} // namespace vpcctl::net
