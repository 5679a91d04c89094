/**
 * @file store.cpp
 * @brief Lock key naming shared by all store backends.
 */
#include "vpcctl/topology/store.hpp"

namespace vpcctl::topology {

std::string vpc_lock_key(std::string_view vpc) {
  std::string key = "vpc.";
  key.append(vpc);
  return key;
}

std::string peering_lock_key(std::string_view vpc_a, std::string_view vpc_b) {
  const auto lo = vpc_a <= vpc_b ? vpc_a : vpc_b;
  const auto hi = vpc_a <= vpc_b ? vpc_b : vpc_a;
  std::string key = "peering.";
  key.append(lo).append(".").append(hi);
  return key;
}

} // namespace vpcctl::topology
