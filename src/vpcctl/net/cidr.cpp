/**
 * @file cidr.cpp
 * @brief IPv4 block parsing and the first/second-usable-host planner.
 */
#include "vpcctl/net/cidr.hpp"

#include <arpa/inet.h>

#include <charconv>

namespace vpcctl::net {

Result<std::uint32_t> parse_address(std::string_view text) {
    in_addr a{};
    if (text.empty() || inet_pton(AF_INET, std::string(text).c_str(), &a) != 1) {
        return fail(ErrorCode::ValidationFailure, "invalid IPv4 address '" + std::string(text) + "'");
    }
    return ntohl(a.s_addr);
}

std::string format_address(std::uint32_t addr) {
    in_addr a{};
    a.s_addr = htonl(addr);
    char buf[INET_ADDRSTRLEN] = {};
    if (inet_ntop(AF_INET, &a, buf, sizeof(buf)) == nullptr) return {};
    return buf;
}

Result<Ipv4Block> Ipv4Block::parse(std::string_view text) {
    const auto slash = text.find('/');
    if (slash == std::string_view::npos) {
        return fail(ErrorCode::ValidationFailure, "CIDR '" + std::string(text) + "' has no prefix length");
    }
    auto addr = parse_address(text.substr(0, slash));
    if (!addr) return fail(addr.error());

    const auto plen = text.substr(slash + 1);
    unsigned prefix = 0;
    const auto [ptr, ec] = std::from_chars(plen.data(), plen.data() + plen.size(), prefix);
    if (plen.empty() || ec != std::errc{} || ptr != plen.data() + plen.size() || prefix > 32) {
        return fail(ErrorCode::ValidationFailure, "CIDR '" + std::string(text) + "' has an invalid prefix length");
    }

    Ipv4Block b;
    b.prefix  = static_cast<std::uint8_t>(prefix);
    b.network = *addr;
    if ((b.network & ~b.netmask()) != 0) {
        return fail(ErrorCode::ValidationFailure, "CIDR '" + std::string(text) + "' has host bits set");
    }
    return b;
}

std::uint32_t Ipv4Block::netmask() const noexcept {
    return prefix == 0 ? 0u : ~std::uint32_t{0} << (32 - prefix);
}

std::uint32_t Ipv4Block::broadcast() const noexcept {
    return network | ~netmask();
}

bool Ipv4Block::contains(std::uint32_t addr) const noexcept {
    return (addr & netmask()) == network;
}

bool Ipv4Block::contains(const Ipv4Block& inner) const noexcept {
    return inner.prefix >= prefix && contains(inner.network);
}

bool Ipv4Block::overlaps(const Ipv4Block& other) const noexcept {
    // Aligned blocks either nest or are disjoint.
    return contains(other) || other.contains(*this);
}

std::string Ipv4Block::to_string() const {
    return format_address(network) + "/" + std::to_string(prefix);
}

//------------------------------- Planner --------------------------------------

static Result<void> require_two_hosts(const Ipv4Block& block) {
    if (block.prefix > 30) {
        return fail(ErrorCode::ValidationFailure,
                    "block " + block.to_string() + " has fewer than two usable host addresses");
    }
    return {};
}

Result<std::uint32_t> gateway_address(const Ipv4Block& block) {
    if (auto r = require_two_hosts(block); !r) return fail(r.error());
    return block.network + 1;
}

Result<std::uint32_t> host_address(const Ipv4Block& block) {
    if (auto r = require_two_hosts(block); !r) return fail(r.error());
    return block.network + 2;
}

Result<AddressPlan> plan_subnet(const Ipv4Block& block) {
    auto gw = gateway_address(block);
    if (!gw) return fail(gw.error());
    auto host = host_address(block);
    if (!host) return fail(host.error());

    const auto suffix = "/" + std::to_string(block.prefix);
    AddressPlan p;
    p.gateway      = format_address(*gw);
    p.host         = format_address(*host);
    p.gateway_cidr = p.gateway + suffix;
    p.host_cidr    = p.host + suffix;
    return p;
}

} // namespace vpcctl::net
