/**
 * @file naming.cpp
 * @brief Name derivation and validation.
 */
#include "vpcctl/net/naming.hpp"

#include <cstdio>

#include "vpcctl/config/constants.hpp"

namespace vpcctl::net {

using namespace vpcctl::config::constants;

std::string bridge_name(std::string_view vpc) {
    return "br-" + std::string(vpc);
}

std::string namespace_id(std::string_view vpc, std::string_view subnet) {
    std::string id = "ns-";
    id.append(vpc).append("-").append(subnet);
    return id;
}

std::uint32_t short_hash(std::string_view key) noexcept {
    // FNV-1a 64 parameters
    constexpr std::uint64_t OFFSET = 0xcbf29ce484222325ULL;
    constexpr std::uint64_t PRIME  = 0x100000001b3ULL;

    std::uint64_t h = OFFSET;
    for (unsigned char c : key) {
        h ^= c;
        h *= PRIME;
    }
    return static_cast<std::uint32_t>(h ^ (h >> 32));
}

std::string short_id(std::string_view key) {
    char buf[LINK_ID_HEX_DIGITS + 1] = {};
    std::snprintf(buf, sizeof(buf), "%08x", static_cast<unsigned>(short_hash(key)));
    return std::string(buf, LINK_ID_HEX_DIGITS);
}

SubnetLinkNames subnet_link_names(std::string_view vpc, std::string_view subnet) {
    std::string key(vpc);
    key.append("/").append(subnet);
    const auto id = short_id(key);
    return SubnetLinkNames{.ns_end = "v" + id + "n", .bridge_end = "v" + id + "b"};
}

PeeringLinkNames peering_link_names(std::string_view vpc_a, std::string_view vpc_b) {
    const bool a_first = vpc_a <= vpc_b;
    const auto lo = a_first ? vpc_a : vpc_b;
    const auto hi = a_first ? vpc_b : vpc_a;

    std::string key(lo);
    key.append("|").append(hi);
    const auto id = short_id(key);
    std::string lo_end = "p" + id + "a";
    std::string hi_end = "p" + id + "b";
    if (a_first) return PeeringLinkNames{.a_end = std::move(lo_end), .b_end = std::move(hi_end)};
    return PeeringLinkNames{.a_end = std::move(hi_end), .b_end = std::move(lo_end)};
}

static bool valid_token(std::string_view s, std::size_t max_len) noexcept {
    if (s.empty() || s.size() > max_len) return false;
    for (char c : s) {
        const bool ok = (c == '_' || c == '-' ||
                         (c >= '0' && c <= '9') ||
                         (c >= 'A' && c <= 'Z') ||
                         (c >= 'a' && c <= 'z'));
        if (!ok) return false;
    }
    return true;
}

bool valid_vpc_name(std::string_view name) noexcept {
    return valid_token(name, VPC_NAME_MAX_LEN);
}

bool valid_subnet_name(std::string_view name) noexcept {
    return valid_token(name, SUBNET_NAME_MAX_LEN);
}

bool valid_interface_name(std::string_view name) noexcept {
    if (name.empty() || name.size() > IFNAME_MAX_LEN) return false;
    for (char c : name) {
        if (c == '/' || c == ' ' || c == '\t' || c == '\n' || c == ':') return false;
    }
    return true;
}

} // namespace vpcctl::net
