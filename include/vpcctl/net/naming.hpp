#pragma once
/**
 * @file naming.hpp
 * @brief Deterministic names for bridges, namespaces and link pairs.
 *
 * Link names must be stable across re-invocations (so an existing pair is
 * recognised) and fit the 15-character interface-name limit.
 *
 * Collision domain: link ids are 8 hex digits of a 64-bit FNV-1a hash folded
 * to 32 bits, so the output space is 2^32. For n distinct keys the chance of
 * any collision is about n^2 / 2^33 (below 1e-6 for 90 subnets, about 0.1%
 * for 3000). Widen LINK_ID_HEX_DIGITS if that stops being acceptable; the
 * derived names ("v" + 8 + "n") leave 5 characters of headroom.
 */

#include <cstdint>
#include <string>
#include <string_view>

namespace vpcctl::net {

/// "br-<vpc>"
std::string bridge_name(std::string_view vpc);

/// "ns-<vpc>-<subnet>"
std::string namespace_id(std::string_view vpc, std::string_view subnet);

/// 64-bit FNV-1a folded to 32 bits (xor of the two halves).
std::uint32_t short_hash(std::string_view key) noexcept;

/// short_hash rendered as LINK_ID_HEX_DIGITS lowercase hex digits.
std::string short_id(std::string_view key);

/**
 * @brief The two ends of a subnet's link pair.
 */
struct SubnetLinkNames {
    std::string ns_end;     ///< "v<id>n", moved into the namespace
    std::string bridge_end; ///< "v<id>b", attached to the VPC bridge
};

/// Link names for (vpc, subnet); id is short_id(vpc + "/" + subnet).
SubnetLinkNames subnet_link_names(std::string_view vpc, std::string_view subnet);

/**
 * @brief The two ends of a peering link pair, in caller argument order.
 */
struct PeeringLinkNames {
    std::string a_end; ///< Attached to the first VPC's bridge
    std::string b_end; ///< Attached to the second VPC's bridge
};

/**
 * @brief Link names for a peering between @p vpc_a and @p vpc_b.
 * @details The id hashes the lexicographically sorted pair and the
 *          "...a" end always belongs to the smaller name, so swapping the
 *          arguments swaps a_end/b_end but yields the same two interfaces.
 */
PeeringLinkNames peering_link_names(std::string_view vpc_a, std::string_view vpc_b);

/// VPC names: [A-Za-z0-9_-], 1..VPC_NAME_MAX_LEN.
bool valid_vpc_name(std::string_view name) noexcept;

/// Subnet names: [A-Za-z0-9_-], 1..SUBNET_NAME_MAX_LEN.
bool valid_subnet_name(std::string_view name) noexcept;

/// Interface names: non-empty, at most IFNAME_MAX_LEN, no '/' or whitespace.
bool valid_interface_name(std::string_view name) noexcept;

} // namespace vpcctl::net
