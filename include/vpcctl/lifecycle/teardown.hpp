#pragma once
/**
 * @file teardown.hpp
 * @brief Remove every peering and every VPC known to the store.
 */

#include <cstddef>

#include "vpcctl/error.hpp"
#include "vpcctl/lifecycle/peering_manager.hpp"
#include "vpcctl/lifecycle/vpc_manager.hpp"

namespace vpcctl::lifecycle {

/** @struct TeardownSummary
 *  @brief Records removed by a teardown pass.
 */
struct TeardownSummary {
    std::size_t peerings{0};
    std::size_t vpcs{0};
};

class Teardown {
public:
    Teardown(topology::TopologyStore& store, net::NetworkPrimitives& prims, obs::Observer& observer,
             VpcManager& vpcs, PeeringManager& peerings)
        : store_(store), prims_(prims), observer_(observer), vpcs_(vpcs), peerings_(peerings) {}

    /**
     * @brief Delete all peerings (and their link pairs), then all VPCs.
     * @details Keeps going after a failed item; the first error is returned
     *          once everything else has been attempted.
     */
    Result<TeardownSummary> run();

private:
    topology::TopologyStore& store_;
    net::NetworkPrimitives&  prims_;
    obs::Observer&           observer_;
    VpcManager&              vpcs_;
    PeeringManager&          peerings_;
};

} // namespace vpcctl::lifecycle
