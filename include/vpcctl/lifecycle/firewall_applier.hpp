#pragma once
/**
 * @file firewall_applier.hpp
 * @brief Declarative ingress rules to per-namespace firewall directives.
 *
 * Rule-set document:
 * @code
 * { "subnet": "10.0.1.0/24",
 *   "ingress": [ { "protocol": "tcp", "port": 22, "action": "allow" } ] }
 * @endcode
 *
 * Application is append-only: every call issues one directive per rule,
 * in document order, and never clears what an earlier call installed.
 * Applying the same rule set twice leaves two copies of each directive.
 */

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <vector>

#include "vpcctl/config/constants.hpp"
#include "vpcctl/error.hpp"
#include "vpcctl/net/primitives.hpp"
#include "vpcctl/obs/observability.hpp"
#include "vpcctl/topology/store.hpp"

namespace vpcctl::lifecycle {

/** @struct IngressRule
 *  @brief One inbound rule. A missing port means every port of @c protocol.
 */
struct IngressRule {
    std::string                  protocol{config::constants::FIREWALL_DEFAULT_PROTOCOL};
    std::optional<std::uint16_t> port;
    std::string                  action{config::constants::FIREWALL_DEFAULT_ACTION};

    bool operator==(const IngressRule&) const = default;
};

/** @struct RuleSet
 *  @brief Rules targeted at the subnet whose block is @c subnet.
 */
struct RuleSet {
    std::string              subnet;
    std::vector<IngressRule> ingress;
};

/// Parse a rule-set document. ValidationFailure on schema violations.
Result<RuleSet> parse_rule_set(const std::string& text);

/// Read and parse a rule-set file. NotFound if @p path does not exist.
Result<RuleSet> load_rule_set(const std::string& path);

/// allow -> ACCEPT, deny -> DROP (case-insensitive); any other token as given.
net::FirewallDirective translate(const IngressRule& rule);

class FirewallApplier {
public:
    FirewallApplier(topology::TopologyStore& store, net::NetworkPrimitives& prims, obs::Observer& observer)
        : store_(store), prims_(prims), observer_(observer) {}

    /// Load @p rules_path and apply it to VPC @p vpc. Returns directives issued.
    Result<std::size_t> apply_from_rule_set(const std::string& vpc, const std::string& rules_path);

    /// Apply @p rules, resolving the target subnet by its block.
    Result<std::size_t> apply_rule_set(const std::string& vpc, const RuleSet& rules);

    /// Apply @p rules to the subnet named @p subnet.
    Result<std::size_t> apply_direct(const std::string& vpc, const std::string& subnet,
                                     std::span<const IngressRule> rules);

private:
    Result<std::size_t> apply_to(const topology::Subnet& target, std::span<const IngressRule> rules);

    topology::TopologyStore& store_;
    net::NetworkPrimitives&  prims_;
    obs::Observer&           observer_;
};

} // namespace vpcctl::lifecycle
