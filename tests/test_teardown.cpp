/**
 * @file test_teardown.cpp
 * @brief Tests for full-topology teardown.
 *
 * Validates:
 *  - Peerings go first (with their link pairs), then every VPC
 *  - A failing VPC does not stop the others; the first error is returned
 */

#include <gtest/gtest.h>

#include "support/fake_primitives.hpp"
#include "vpcctl/lifecycle/peering_manager.hpp"
#include "vpcctl/lifecycle/subnet_manager.hpp"
#include "vpcctl/lifecycle/teardown.hpp"
#include "vpcctl/lifecycle/vpc_manager.hpp"
#include "vpcctl/topology/memory_store.hpp"

using vpcctl::ErrorCode;
using vpcctl::lifecycle::PeeringManager;
using vpcctl::lifecycle::SubnetManager;
using vpcctl::lifecycle::Teardown;
using vpcctl::lifecycle::VpcManager;
using vpcctl::test_support::FakePrimitives;
using vpcctl::test_support::RecordingObserver;
using vpcctl::topology::MemoryTopologyStore;
using vpcctl::topology::SubnetKind;

namespace {

class TeardownTest : public ::testing::Test {
protected:
  void SetUp() override {
    ASSERT_TRUE(vpcs.create("A", "10.0.0.0/16"));
    ASSERT_TRUE(vpcs.create("B", "10.1.0.0/16"));
    ASSERT_TRUE(vpcs.create("C", "10.2.0.0/16"));
    ASSERT_TRUE(subnets.create("A", "web", "10.0.1.0/24", SubnetKind::Public));
    ASSERT_TRUE(subnets.create("B", "app", "10.1.1.0/24", SubnetKind::Private));
    ASSERT_TRUE(peerings.create("A", "B"));
    prims.clear_calls();
  }

  MemoryTopologyStore store;
  FakePrimitives      prims;
  RecordingObserver   obs;
  VpcManager          vpcs{store, prims, obs};
  SubnetManager       subnets{store, prims, obs};
  PeeringManager      peerings{store, prims, obs};
  Teardown            teardown{store, prims, obs, vpcs, peerings};
};

} // namespace

/**
 * @test Run_RemovesEverything
 * @brief Every peering and VPC record is gone; the peering link pair is reclaimed first.
 */
TEST_F(TeardownTest, Run_RemovesEverything) {
  const auto veth = store.get_peering("A.B")->veth_a;

  auto r = teardown.run();
  ASSERT_TRUE(r) << r.error().message;
  EXPECT_EQ(r->peerings, 1u);
  EXPECT_EQ(r->vpcs, 3u);
  EXPECT_TRUE(store.list_vpcs()->empty());
  EXPECT_TRUE(store.list_peerings()->empty());

  const auto link = prims.index_of("delete_link_pair " + veth);
  ASSERT_NE(link, FakePrimitives::npos);
  EXPECT_LT(link, prims.index_of("delete_bridge"));
  EXPECT_EQ(prims.count("delete_bridge"), 3u);
}

/**
 * @test Run_ContinuesPastFailure
 * @brief One VPC failing to delete leaves it stored; the others are removed.
 */
TEST_F(TeardownTest, Run_ContinuesPastFailure) {
  prims.fail_on("delete_bridge br-B");

  auto r = teardown.run();
  ASSERT_FALSE(r);
  EXPECT_EQ(r.error().code, ErrorCode::PrimitiveExecutionFailure);

  auto left = store.list_vpcs();
  ASSERT_TRUE(left);
  ASSERT_EQ(left->size(), 1u);
  EXPECT_EQ(left->front().name, "B");
  EXPECT_TRUE(store.list_peerings()->empty());
}

/**
 * @test Run_Empty
 * @brief Nothing stored: success with zero counts and no primitive calls.
 */
TEST(TeardownEmpty, Run_Empty) {
  MemoryTopologyStore store;
  FakePrimitives      prims;
  RecordingObserver   obs;
  VpcManager          vpcs{store, prims, obs};
  PeeringManager      peerings{store, prims, obs};
  Teardown            teardown{store, prims, obs, vpcs, peerings};

  auto r = teardown.run();
  ASSERT_TRUE(r);
  EXPECT_EQ(r->peerings, 0u);
  EXPECT_EQ(r->vpcs, 0u);
  EXPECT_TRUE(prims.calls().empty());
}
