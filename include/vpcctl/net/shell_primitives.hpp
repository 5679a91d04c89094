#pragma once
/**
 * @file shell_primitives.hpp
 * @brief NetworkPrimitives implemented with ip(8), iptables(8) and sysctl(8).
 * @details Every primitive is an ordered list of argv commands run through a
 *          CommandRunner. Tolerant primitives log a non-zero exit at debug and
 *          report success.
 */

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

#include "vpcctl/net/command_runner.hpp"
#include "vpcctl/net/primitives.hpp"

namespace vpcctl::net {

/** @struct Binaries
 *  @brief Executable names (or paths) for the host tools.
 */
struct Binaries {
    std::string ip{"ip"};
    std::string iptables{"iptables"};
    std::string sysctl{"sysctl"};
};

class ShellPrimitives final : public NetworkPrimitives {
public:
    explicit ShellPrimitives(CommandRunner& runner, Binaries bins = {}) noexcept
        : runner_(runner), bins_(std::move(bins)) {}

    Result<void> create_bridge(const std::string& bridge) override;
    Result<void> delete_bridge(const std::string& bridge) override;
    Result<void> create_namespace(const std::string& ns) override;
    Result<void> delete_namespace(const std::string& ns) override;

    Result<void> create_link_pair(const std::string& end_a, const std::string& end_b) override;
    Result<void> delete_link_pair(const std::string& end) override;
    Result<void> attach_to_bridge(const std::string& bridge, const std::string& end) override;
    Result<void> move_to_namespace(const std::string& end, const std::string& ns) override;

    Result<void> assign_address(const std::string& ns, const std::string& end,
                                const std::string& cidr_address) override;
    Result<void> assign_bridge_address(const std::string& bridge, const std::string& cidr_address) override;
    Result<void> remove_bridge_address(const std::string& bridge, const std::string& cidr_address) override;
    Result<void> add_default_route(const std::string& ns, const std::string& gateway) override;
    Result<void> add_route(const std::string& ns, const std::string& destination,
                           const std::string& gateway) override;

    Result<void> enable_forwarding() override;
    Result<void> setup_nat(const std::string& bridge, const std::string& internet_iface,
                           const std::vector<std::string>& public_blocks) override;
    Result<void> cleanup_nat(const std::string& bridge, const std::string& internet_iface,
                             const std::vector<std::string>& public_blocks) override;
    Result<void> isolate_bridges(const std::string& bridge_a, const std::string& bridge_b) override;
    Result<void> remove_isolation(const std::string& bridge_a, const std::string& bridge_b) override;

    Result<void> apply_firewall_directive(const std::string& ns, const FirewallDirective& d) override;
    Result<std::string> run_in_namespace(const std::string& ns, const std::string& command) override;

private:
    /// iptables rule operation: append, insert or delete.
    enum class RuleOp : std::uint8_t { Append, Insert, Delete };

    /// Run and require exit 0.
    Result<CommandResult> checked(const std::vector<std::string>& argv);
    /// Run; a non-zero exit is logged and ignored.
    Result<void> tolerant(const std::vector<std::string>& argv);
    /// True when the interface exists in the host namespace.
    bool link_exists(const std::string& name);

    /// Prefix argv with "ip netns exec <ns>" unless ns is the host namespace.
    std::vector<std::string> in_ns(const std::string& ns, std::vector<std::string> argv) const;

    std::vector<std::string> iptables(RuleOp op, const std::string& table, const std::string& chain,
                                      std::vector<std::string> rule) const;

    /// NAT rule bodies for one public block (POSTROUTING + two FORWARD rules).
    struct NatRules {
        std::vector<std::string> masquerade;
        std::vector<std::string> egress;
        std::vector<std::string> ingress;
    };
    static NatRules nat_rules(const std::string& bridge, const std::string& iface, const std::string& block);

    CommandRunner& runner_;
    Binaries       bins_;
};

} // namespace vpcctl::net
