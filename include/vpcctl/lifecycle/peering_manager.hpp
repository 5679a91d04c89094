#pragma once
/**
 * @file peering_manager.hpp
 * @brief Bidirectional connectivity between two VPC bridges.
 *
 * A peering is unique per unordered pair: lookups test both orderings of
 * the pair before declaring absence, and a record is only accepted when its
 * own vpc_a/vpc_b are that pair.
 *
 * @note remove() erases only the record. The link pair, the lifted
 *       isolation rule and the host routes installed by create() stay in
 *       place; a later create() reuses the existing link pair.
 */

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "vpcctl/error.hpp"
#include "vpcctl/net/primitives.hpp"
#include "vpcctl/obs/observability.hpp"
#include "vpcctl/topology/store.hpp"

namespace vpcctl::lifecycle {

class PeeringManager {
public:
    PeeringManager(topology::TopologyStore& store, net::NetworkPrimitives& prims, obs::Observer& observer)
        : store_(store), prims_(prims), observer_(observer) {}

    /**
     * @brief Peer VPCs @p vpc_a and @p vpc_b.
     * @details Link pair, one end per bridge, isolation lifted; then host
     *          routes toward each side's subnets (best-effort, never fails
     *          the operation); then the record "<vpc_a>-<vpc_b>".
     */
    Result<topology::Peering> create(const std::string& vpc_a, const std::string& vpc_b);

    /// Erase the peering record stored under either ordering.
    Result<void> remove(const std::string& vpc_a, const std::string& vpc_b);

    Result<std::vector<topology::Peering>> list() const;

    /// Record for the pair under either ordering; nullopt if none.
    /// Conflict if the key holds a record for a different pair.
    Result<std::optional<topology::Peering>> find(const std::string& vpc_a, const std::string& vpc_b) const;

private:
    Result<topology::Peering> do_create(const std::string& vpc_a, const std::string& vpc_b);
    Result<void> do_remove(const std::string& vpc_a, const std::string& vpc_b);

    /// Routes on the host toward every subnet of @p to, via its first gateway.
    /// Returns how many were installed; failures are soft.
    std::size_t install_routes(const topology::Vpc& to);

    topology::TopologyStore& store_;
    net::NetworkPrimitives&  prims_;
    obs::Observer&           observer_;
};

} // namespace vpcctl::lifecycle
