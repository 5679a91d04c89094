#pragma once
/**
 * @file subnet_manager.hpp
 * @brief Subnet creation inside an existing VPC, and command execution in it.
 */

#include <string>

#include "vpcctl/error.hpp"
#include "vpcctl/net/primitives.hpp"
#include "vpcctl/obs/observability.hpp"
#include "vpcctl/topology/store.hpp"

namespace vpcctl::lifecycle {

class SubnetManager {
public:
    SubnetManager(topology::TopologyStore& store, net::NetworkPrimitives& prims, obs::Observer& observer)
        : store_(store), prims_(prims), observer_(observer) {}

    /**
     * @brief Realise subnet @p subnet (@p cidr, @p kind) in VPC @p vpc.
     * @details Namespace, link pair, bridge attach, move into namespace,
     *          host address, gateway address on the bridge, default route,
     *          loopback up. The record is appended only after every step
     *          succeeded; otherwise completed steps are undone newest-first.
     * @return The stored subnet.
     */
    Result<topology::Subnet> create(const std::string& vpc, const std::string& subnet,
                                    const std::string& cidr, topology::SubnetKind kind);

    /// Run @p command in the namespace of a stored subnet; returns its stdout.
    Result<std::string> exec(const std::string& vpc, const std::string& subnet, const std::string& command);

private:
    Result<topology::Subnet> do_create(const std::string& vpc, const std::string& subnet,
                                       const std::string& cidr, topology::SubnetKind kind);

    topology::TopologyStore& store_;
    net::NetworkPrimitives&  prims_;
    obs::Observer&           observer_;
};

} // namespace vpcctl::lifecycle
