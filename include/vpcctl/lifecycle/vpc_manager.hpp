#pragma once
/**
 * @file vpc_manager.hpp
 * @brief VPC create/delete, inter-VPC isolation and NAT gateway state.
 *
 * Isolation rules are never stored: create installs a bidirectional drop
 * against every bridge in the current VPC set, and delete removes them
 * against the then-current set. The two passes are symmetric only if no
 * other VPC is created or deleted in between.
 */

#include <string>
#include <vector>

#include "vpcctl/error.hpp"
#include "vpcctl/net/primitives.hpp"
#include "vpcctl/obs/observability.hpp"
#include "vpcctl/topology/store.hpp"

namespace vpcctl::lifecycle {

class VpcManager {
public:
    VpcManager(topology::TopologyStore& store, net::NetworkPrimitives& prims, obs::Observer& observer)
        : store_(store), prims_(prims), observer_(observer) {}

    /**
     * @brief Create VPC @p name with address block @p cidr.
     * @details Bridge, then isolation against every existing bridge, then
     *          the record. Completed steps are undone if a later one fails.
     * @return The stored record; AlreadyExists if @p name is taken.
     */
    Result<topology::Vpc> create(const std::string& name, const std::string& cidr);

    /**
     * @brief Delete VPC @p name and everything it realised on the host.
     * @details Order: isolation rules, NAT rules (from the stored snapshot),
     *          subnet namespaces, bridge, record. Forward-only: a failing
     *          step stops the sequence and nothing is compensated.
     */
    Result<void> remove(const std::string& name);

    /**
     * @brief Enable outbound NAT for the VPC's public subnets via @p internet_iface.
     * @return The updated record. ValidationFailure if NAT is already on or
     *         the VPC has no public subnet.
     */
    Result<topology::Vpc> enable_nat(const std::string& name, const std::string& internet_iface);

    Result<std::vector<topology::Vpc>> list() const;
    Result<topology::Vpc> details(const std::string& name) const;

private:
    Result<topology::Vpc> do_create(const std::string& name, const std::string& cidr);
    Result<void> do_remove(const std::string& name);
    Result<topology::Vpc> do_enable_nat(const std::string& name, const std::string& internet_iface);

    topology::TopologyStore& store_;
    net::NetworkPrimitives&  prims_;
    obs::Observer&           observer_;
};

} // namespace vpcctl::lifecycle
