/**
 * @file model.hpp
 * @brief Topology records: VPC (with embedded subnets) and Peering.
 *
 * Records are plain values. The store hands out copies; callers mutate the
 * copy and save it back (whole-record overwrite guarded by `revision`).
 */
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "vpcctl/error.hpp"

namespace vpcctl::topology {

/**
 * @brief Subnet exposure.
 *  - Public:  eligible for NAT egress when the VPC enables NAT.
 *  - Private: never NATed.
 */
enum class SubnetKind : std::uint8_t {
  Public = 0,
  Private = 1
};

std::string_view to_string(SubnetKind k) noexcept;
Result<SubnetKind> parse_subnet_kind(std::string_view text);

/**
 * @brief A subnet, realised as a namespace wired to the VPC bridge.
 */
struct Subnet final {
  std::string name;         ///< Unique within the VPC
  std::string cidr;         ///< Canonical block, e.g. "10.0.1.0/24"
  SubnetKind  kind{SubnetKind::Private};
  std::string namespace_id; ///< "ns-<vpc>-<subnet>"
  std::string veth_ns;      ///< Link end inside the namespace
  std::string veth_br;      ///< Link end attached to the bridge
  std::string gateway;      ///< First usable host, on the bridge
  std::string host;         ///< Second usable host, inside the namespace

  bool operator==(const Subnet&) const = default;
};

/**
 * @brief A VPC record.
 *
 * @note `nat_public_cidrs` is a snapshot taken when NAT was enabled and is
 *       the only input to NAT cleanup, even if subnets changed since.
 */
struct Vpc final {
  std::string                name;
  std::string                cidr;
  std::string                bridge;           ///< "br-<name>"
  std::vector<Subnet>        subnets;          ///< Creation order
  bool                       nat_enabled{false};
  std::optional<std::string> internet_interface;
  std::vector<std::string>   nat_public_cidrs;
  std::string                created_at;       ///< ISO 8601, UTC
  std::uint64_t              revision{0};      ///< 0 = never stored

  [[nodiscard]] const Subnet* find_subnet(std::string_view subnet_name) const noexcept;
  [[nodiscard]] const Subnet* find_subnet_by_cidr(std::string_view block) const noexcept;
  /// Blocks of all public subnets, in subnet order.
  [[nodiscard]] std::vector<std::string> public_cidrs() const;

  bool operator==(const Vpc&) const = default;
};

/**
 * @brief Peering between two VPCs, identified as "<vpc_a>-<vpc_b>".
 *
 * VPC names may contain '-', so the id alone does not name a unique pair
 * ("a-b" + "c" and "a" + "b-c" share "a-b-c"). Records are stored under
 * key() instead, which joins the names with '.', a character VPC names
 * cannot contain.
 */
struct Peering final {
  std::string   vpc_a;
  std::string   vpc_b;
  std::string   veth_a;      ///< Link end on vpc_a's bridge
  std::string   veth_b;      ///< Link end on vpc_b's bridge
  std::uint64_t revision{0};

  [[nodiscard]] std::string id() const;
  [[nodiscard]] std::string key() const;
  /// True when this record joins @p x and @p y, in either order.
  [[nodiscard]] bool joins(std::string_view x, std::string_view y) const noexcept;

  bool operator==(const Peering&) const = default;
};

/// Display id for an ordered pair: "<a>-<b>".
std::string peering_id(std::string_view vpc_a, std::string_view vpc_b);

/// Storage key for an ordered pair: "<a>.<b>".
std::string peering_key(std::string_view vpc_a, std::string_view vpc_b);

/// Current UTC time as "YYYY-MM-DDTHH:MM:SSZ".
std::string now_iso8601();

} // namespace vpcctl::topology
