/**
 * @file model.cpp
 * @brief Record helpers.
 */
#include "vpcctl/topology/model.hpp"

#include <chrono>
#include <ctime>

namespace vpcctl::topology {

std::string_view to_string(SubnetKind k) noexcept {
  return k == SubnetKind::Public ? "public" : "private";
}

Result<SubnetKind> parse_subnet_kind(std::string_view text) {
  if (text == "public") return SubnetKind::Public;
  if (text == "private") return SubnetKind::Private;
  return fail(ErrorCode::ValidationFailure,
              "subnet type must be 'public' or 'private', got '" + std::string(text) + "'");
}

const Subnet* Vpc::find_subnet(std::string_view subnet_name) const noexcept {
  for (const auto& s : subnets) if (s.name == subnet_name) return &s;
  return nullptr;
}

const Subnet* Vpc::find_subnet_by_cidr(std::string_view block) const noexcept {
  for (const auto& s : subnets) if (s.cidr == block) return &s;
  return nullptr;
}

std::vector<std::string> Vpc::public_cidrs() const {
  std::vector<std::string> out;
  for (const auto& s : subnets) {
    if (s.kind == SubnetKind::Public) out.push_back(s.cidr);
  }
  return out;
}

std::string Peering::id() const {
  return peering_id(vpc_a, vpc_b);
}

std::string Peering::key() const {
  return peering_key(vpc_a, vpc_b);
}

bool Peering::joins(std::string_view x, std::string_view y) const noexcept {
  return (vpc_a == x && vpc_b == y) || (vpc_a == y && vpc_b == x);
}

std::string peering_key(std::string_view vpc_a, std::string_view vpc_b) {
  std::string key(vpc_a);
  key.append(".").append(vpc_b);
  return key;
}

std::string peering_id(std::string_view vpc_a, std::string_view vpc_b) {
  std::string id(vpc_a);
  id.append("-").append(vpc_b);
  return id;
}

std::string now_iso8601() {
  const std::time_t t = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
  std::tm tm{};
  gmtime_r(&t, &tm);
  char buf[32] = {};
  std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm);
  return buf;
}

} // namespace vpcctl::topology
