#pragma once
/**
 * @file primitives.hpp
 * @brief Contract of the stateless layer that mutates host network state.
 * @details Lifecycle managers only talk to this interface. Each call either
 *          succeeds or fails with ErrorCode::PrimitiveExecutionFailure.
 *          Calls documented as "tolerant" succeed when the object is
 *          already absent (or, for addresses, already present).
 */

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "vpcctl/error.hpp"

namespace vpcctl::net {

/// Namespace id meaning "the host namespace", where bridges live.
inline constexpr const char* kHostNamespace = "";

/** @struct FirewallDirective
 *  @brief One inbound filter rule scoped to a namespace.
 */
struct FirewallDirective {
    std::string                  protocol; ///< e.g. "tcp", "udp", "icmp"
    std::optional<std::uint16_t> port;     ///< Absent: all ports of the protocol
    std::string                  target;   ///< e.g. "ACCEPT", "DROP", or a literal token

    bool operator==(const FirewallDirective&) const = default;
};

/** @class NetworkPrimitives
 *  @brief Bridge/namespace/link/address/route/NAT/filter primitives.
 */
class NetworkPrimitives {
public:
    virtual ~NetworkPrimitives() = default;

    // ----- bridges & namespaces -----
    virtual Result<void> create_bridge(const std::string& bridge) = 0;
    /// Tolerant of absence.
    virtual Result<void> delete_bridge(const std::string& bridge) = 0;
    virtual Result<void> create_namespace(const std::string& ns) = 0;
    /// Tolerant of absence.
    virtual Result<void> delete_namespace(const std::string& ns) = 0;

    // ----- links -----
    /// Idempotent: an existing pair with these names is reused.
    virtual Result<void> create_link_pair(const std::string& end_a, const std::string& end_b) = 0;
    /// Deletes the pair one of whose ends is @p end. Tolerant of absence.
    virtual Result<void> delete_link_pair(const std::string& end) = 0;
    virtual Result<void> attach_to_bridge(const std::string& bridge, const std::string& end) = 0;
    virtual Result<void> move_to_namespace(const std::string& end, const std::string& ns) = 0;

    // ----- addressing & routing -----
    virtual Result<void> assign_address(const std::string& ns, const std::string& end,
                                        const std::string& cidr_address) = 0;
    /// Tolerant of a duplicate address (bridges carry one per subnet).
    virtual Result<void> assign_bridge_address(const std::string& bridge, const std::string& cidr_address) = 0;
    /// Tolerant of absence.
    virtual Result<void> remove_bridge_address(const std::string& bridge, const std::string& cidr_address) = 0;
    /// Replaces any existing default route in @p ns.
    virtual Result<void> add_default_route(const std::string& ns, const std::string& gateway) = 0;
    /// @p ns == kHostNamespace targets the host namespace.
    virtual Result<void> add_route(const std::string& ns, const std::string& destination,
                                   const std::string& gateway) = 0;

    // ----- forwarding, NAT, isolation -----
    /// Process-wide and idempotent.
    virtual Result<void> enable_forwarding() = 0;
    virtual Result<void> setup_nat(const std::string& bridge, const std::string& internet_iface,
                                   const std::vector<std::string>& public_blocks) = 0;
    /// Tolerant of absence.
    virtual Result<void> cleanup_nat(const std::string& bridge, const std::string& internet_iface,
                                     const std::vector<std::string>& public_blocks) = 0;
    /// Drop forwarded traffic between two bridges, both directions.
    virtual Result<void> isolate_bridges(const std::string& bridge_a, const std::string& bridge_b) = 0;
    /// Tolerant of absence.
    virtual Result<void> remove_isolation(const std::string& bridge_a, const std::string& bridge_b) = 0;

    // ----- filtering & execution -----
    virtual Result<void> apply_firewall_directive(const std::string& ns, const FirewallDirective& d) = 0;
    /// Run a shell command inside @p ns and return its stdout.
    virtual Result<std::string> run_in_namespace(const std::string& ns, const std::string& command) = 0;
};

} // namespace vpcctl::net
