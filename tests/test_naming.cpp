/**
 * @file test_naming.cpp
 * @brief Tests for derived bridge/namespace/link names and their collision domain.
 *
 * Validates:
 *  - Deterministic derivation (same inputs -> same names)
 *  - Interface-name length limit for every derived link end
 *  - Peering names are order-independent as a pair
 *  - No collisions across a realistic population of (vpc, subnet) keys
 */

#include <gtest/gtest.h>

#include <set>
#include <string>

#include "vpcctl/config/constants.hpp"
#include "vpcctl/net/naming.hpp"

using namespace vpcctl::net;
using vpcctl::config::constants::IFNAME_MAX_LEN;

// --------------------------- Fixed names ------------------------------------

/**
 * @test Bridge_And_Namespace
 * @brief Bridge and namespace ids follow the "br-" / "ns-<vpc>-<subnet>" scheme.
 */
TEST(Naming, Bridge_And_Namespace) {
  EXPECT_EQ(bridge_name("prod"), "br-prod");
  EXPECT_EQ(namespace_id("prod", "web"), "ns-prod-web");
  // Longest valid VPC name still fits a bridge name.
  EXPECT_LE(bridge_name("abcdefghijkl").size(), IFNAME_MAX_LEN);
}

/**
 * @test ShortHash_KnownVectors
 * @brief FNV-1a 64 folded to 32 bits matches precomputed values.
 */
TEST(Naming, ShortHash_KnownVectors) {
  EXPECT_EQ(short_id(""), "4fd0bfc1");
  EXPECT_EQ(short_id("a"), "296230c0");
  EXPECT_EQ(short_id("prod/web"), "efeb07ae");
}

// --------------------------- Link names -------------------------------------

/**
 * @test SubnetLinks_Deterministic
 * @brief Repeated derivation yields identical names; ends differ only by suffix.
 */
TEST(Naming, SubnetLinks_Deterministic) {
  const auto a = subnet_link_names("prod", "web");
  const auto b = subnet_link_names("prod", "web");
  EXPECT_EQ(a.ns_end, b.ns_end);
  EXPECT_EQ(a.bridge_end, b.bridge_end);
  EXPECT_EQ(a.ns_end, "vefeb07aen");
  EXPECT_EQ(a.bridge_end, "vefeb07aeb");
  EXPECT_LE(a.ns_end.size(), IFNAME_MAX_LEN);
}

/**
 * @test SubnetLinks_KeyIsScoped
 * @brief ("a", "bc") and ("ab", "c") must not share names.
 */
TEST(Naming, SubnetLinks_KeyIsScoped) {
  EXPECT_NE(subnet_link_names("a", "bc").ns_end, subnet_link_names("ab", "c").ns_end);
  EXPECT_NE(subnet_link_names("prod", "web").ns_end, subnet_link_names("dev", "web").ns_end);
}

/**
 * @test PeeringLinks_OrderIndependent
 * @brief Swapping arguments swaps the ends but names the same two interfaces.
 */
TEST(Naming, PeeringLinks_OrderIndependent) {
  const auto ab = peering_link_names("dev", "prod");
  const auto ba = peering_link_names("prod", "dev");
  EXPECT_EQ(ab.a_end, "p323b07c6a");
  EXPECT_EQ(ab.b_end, "p323b07c6b");
  EXPECT_EQ(ab.a_end, ba.b_end);
  EXPECT_EQ(ab.b_end, ba.a_end);
  EXPECT_LE(ab.a_end.size(), IFNAME_MAX_LEN);
}

/**
 * @test LinkNames_NoCollisions_Population
 * @brief 50 VPCs x 40 subnets plus all peering pairs produce distinct names.
 * @details With 2000 subnet keys the expected number of colliding pairs in a
 *          2^32 space is about 4.7e-4, so a collision here signals a broken
 *          derivation rather than bad luck.
 */
TEST(Naming, LinkNames_NoCollisions_Population) {
  std::set<std::string> seen;
  std::size_t keys = 0;
  for (int v = 0; v < 50; ++v) {
    for (int s = 0; s < 40; ++s) {
      const auto n = subnet_link_names("vpc" + std::to_string(v), "sub" + std::to_string(s));
      EXPECT_TRUE(seen.insert(n.ns_end).second) << n.ns_end;
      EXPECT_TRUE(seen.insert(n.bridge_end).second) << n.bridge_end;
      ++keys;
    }
  }
  for (int a = 0; a < 50; ++a) {
    for (int b = a + 1; b < 50; ++b) {
      const auto n = peering_link_names("vpc" + std::to_string(a), "vpc" + std::to_string(b));
      EXPECT_TRUE(seen.insert(n.a_end).second) << n.a_end;
      EXPECT_TRUE(seen.insert(n.b_end).second) << n.b_end;
    }
  }
  EXPECT_EQ(keys, 2000u);
}

// --------------------------- Validation -------------------------------------

/**
 * @test Validation_Names
 * @brief Allowed alphabet and length limits for VPC, subnet and interface names.
 */
TEST(Naming, Validation_Names) {
  EXPECT_TRUE(valid_vpc_name("prod_1-a"));
  EXPECT_FALSE(valid_vpc_name(""));
  EXPECT_FALSE(valid_vpc_name("abcdefghijklm")); // 13 chars
  EXPECT_FALSE(valid_vpc_name("bad/name"));
  EXPECT_FALSE(valid_vpc_name("with space"));

  EXPECT_TRUE(valid_subnet_name(std::string(32, 's')));
  EXPECT_FALSE(valid_subnet_name(std::string(33, 's')));

  EXPECT_TRUE(valid_interface_name("eth0"));
  EXPECT_TRUE(valid_interface_name("enp0s31f6"));
  EXPECT_FALSE(valid_interface_name(""));
  EXPECT_FALSE(valid_interface_name("a-very-long-ifname0"));
}
