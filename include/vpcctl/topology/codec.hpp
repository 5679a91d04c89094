#pragma once
/**
 * @file codec.hpp
 * @brief JSON documents for persisted VPC and Peering records.
 *
 * VPC document:
 *   { "name", "cidr", "bridge", "subnets": [ { "name", "cidr", "type",
 *     "namespace", "veth_ns", "veth_br", "gateway", "ip" } ],
 *     "nat_enabled", "internet_interface"?, "nat_public_cidrs": [...],
 *     "created_at", "revision" }
 * Peering document:
 *   { "vpc_a", "vpc_b", "veth_a", "veth_b", "revision" }
 */

#include <string>
#include <string_view>

#include "vpcctl/topology/model.hpp"

namespace vpcctl::topology {

std::string encode(const Vpc& vpc);
std::string encode(const Peering& peering);

/// PersistenceFailure on malformed JSON or missing fields.
Result<Vpc> decode_vpc(std::string_view text);
Result<Peering> decode_peering(std::string_view text);

} // namespace vpcctl::topology
