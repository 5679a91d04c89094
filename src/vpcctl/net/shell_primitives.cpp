/**
 * @file shell_primitives.cpp
 * @brief ip/iptables/sysctl command sequences behind NetworkPrimitives.
 */
#include "vpcctl/net/shell_primitives.hpp"

#include "vpcctl/obs/observability.hpp"

namespace vpcctl::net {

//------------------------------- Helpers --------------------------------------

Result<CommandResult> ShellPrimitives::checked(const std::vector<std::string>& argv) {
    obs::logger()->debug("run: {}", join_argv(argv));
    auto res = runner_.run(argv);
    if (!res) return res;
    if (res->exit_code != 0) {
        auto detail = res->err.empty() ? res->out : res->err;
        while (!detail.empty() && (detail.back() == '\n' || detail.back() == ' ')) detail.pop_back();
        return fail(ErrorCode::PrimitiveExecutionFailure,
                    "'" + join_argv(argv) + "' exited with " + std::to_string(res->exit_code) +
                    (detail.empty() ? std::string{} : ": " + detail));
    }
    return res;
}

Result<void> ShellPrimitives::tolerant(const std::vector<std::string>& argv) {
    obs::logger()->debug("run (tolerant): {}", join_argv(argv));
    auto res = runner_.run(argv);
    if (!res) return fail(res.error());
    if (res->exit_code != 0) {
        obs::logger()->debug("ignored exit {} from '{}'", res->exit_code, join_argv(argv));
    }
    return {};
}

bool ShellPrimitives::link_exists(const std::string& name) {
    auto res = runner_.run({bins_.ip, "link", "show", name});
    return res && res->exit_code == 0;
}

std::vector<std::string> ShellPrimitives::in_ns(const std::string& ns, std::vector<std::string> argv) const {
    if (ns.empty()) return argv;
    std::vector<std::string> full{bins_.ip, "netns", "exec", ns};
    full.insert(full.end(), argv.begin(), argv.end());
    return full;
}

std::vector<std::string> ShellPrimitives::iptables(RuleOp op, const std::string& table,
                                                   const std::string& chain,
                                                   std::vector<std::string> rule) const {
    std::vector<std::string> argv{bins_.iptables};
    if (!table.empty()) { argv.push_back("-t"); argv.push_back(table); }
    switch (op) {
        case RuleOp::Append: argv.push_back("-A"); break;
        case RuleOp::Insert: argv.push_back("-I"); break;
        case RuleOp::Delete: argv.push_back("-D"); break;
    }
    argv.push_back(chain);
    argv.insert(argv.end(), rule.begin(), rule.end());
    return argv;
}

ShellPrimitives::NatRules ShellPrimitives::nat_rules(const std::string& bridge, const std::string& iface,
                                                     const std::string& block) {
    return NatRules{
        .masquerade = {"-s", block, "-o", iface, "-j", "MASQUERADE"},
        .egress     = {"-i", bridge, "-o", iface, "-s", block, "-j", "ACCEPT"},
        .ingress    = {"-i", iface, "-o", bridge, "-d", block,
                       "-m", "state", "--state", "RELATED,ESTABLISHED", "-j", "ACCEPT"},
    };
}

//------------------------------- Bridges & namespaces -------------------------

Result<void> ShellPrimitives::create_bridge(const std::string& bridge) {
    if (auto r = checked({bins_.ip, "link", "add", bridge, "type", "bridge"}); !r) return fail(r.error());
    if (auto r = checked({bins_.ip, "link", "set", bridge, "up"}); !r) return fail(r.error());
    return {};
}

Result<void> ShellPrimitives::delete_bridge(const std::string& bridge) {
    if (auto r = tolerant({bins_.ip, "link", "set", bridge, "down"}); !r) return r;
    return tolerant({bins_.ip, "link", "delete", bridge});
}

Result<void> ShellPrimitives::create_namespace(const std::string& ns) {
    if (auto r = checked({bins_.ip, "netns", "add", ns}); !r) return fail(r.error());
    return {};
}

Result<void> ShellPrimitives::delete_namespace(const std::string& ns) {
    return tolerant({bins_.ip, "netns", "delete", ns});
}

//------------------------------- Links ----------------------------------------

Result<void> ShellPrimitives::create_link_pair(const std::string& end_a, const std::string& end_b) {
    // Either end may already have been moved into a namespace, so try both.
    if (link_exists(end_a) || link_exists(end_b)) {
        obs::logger()->debug("link pair {}/{} already present, reusing", end_a, end_b);
        if (auto r = tolerant({bins_.ip, "link", "set", end_a, "up"}); !r) return r;
        return tolerant({bins_.ip, "link", "set", end_b, "up"});
    }
    if (auto r = checked({bins_.ip, "link", "add", end_a, "type", "veth", "peer", "name", end_b}); !r) {
        return fail(r.error());
    }
    if (auto r = checked({bins_.ip, "link", "set", end_a, "up"}); !r) return fail(r.error());
    if (auto r = checked({bins_.ip, "link", "set", end_b, "up"}); !r) return fail(r.error());
    return {};
}

Result<void> ShellPrimitives::delete_link_pair(const std::string& end) {
    return tolerant({bins_.ip, "link", "delete", end});
}

Result<void> ShellPrimitives::attach_to_bridge(const std::string& bridge, const std::string& end) {
    if (auto r = checked({bins_.ip, "link", "set", end, "master", bridge}); !r) return fail(r.error());
    return {};
}

Result<void> ShellPrimitives::move_to_namespace(const std::string& end, const std::string& ns) {
    if (auto r = checked({bins_.ip, "link", "set", end, "netns", ns}); !r) return fail(r.error());
    return {};
}

//------------------------------- Addressing & routing -------------------------

Result<void> ShellPrimitives::assign_address(const std::string& ns, const std::string& end,
                                             const std::string& cidr_address) {
    if (auto r = checked(in_ns(ns, {bins_.ip, "addr", "add", cidr_address, "dev", end})); !r) {
        return fail(r.error());
    }
    if (auto r = checked(in_ns(ns, {bins_.ip, "link", "set", end, "up"})); !r) return fail(r.error());
    return {};
}

Result<void> ShellPrimitives::assign_bridge_address(const std::string& bridge, const std::string& cidr_address) {
    const std::vector<std::string> argv{bins_.ip, "addr", "add", cidr_address, "dev", bridge};
    auto res = runner_.run(argv);
    if (!res) return fail(res.error());
    if (res->exit_code != 0) {
        // A second subnet re-adding an address the bridge already carries.
        if (res->err.find("exists") != std::string::npos) {
            obs::logger()->debug("{} already on {}", cidr_address, bridge);
            return {};
        }
        return fail(ErrorCode::PrimitiveExecutionFailure,
                    "'" + join_argv(argv) + "' exited with " + std::to_string(res->exit_code));
    }
    return {};
}

Result<void> ShellPrimitives::remove_bridge_address(const std::string& bridge, const std::string& cidr_address) {
    return tolerant({bins_.ip, "addr", "del", cidr_address, "dev", bridge});
}

Result<void> ShellPrimitives::add_default_route(const std::string& ns, const std::string& gateway) {
    if (auto r = checked(in_ns(ns, {bins_.ip, "route", "replace", "default", "via", gateway})); !r) {
        return fail(r.error());
    }
    return {};
}

Result<void> ShellPrimitives::add_route(const std::string& ns, const std::string& destination,
                                        const std::string& gateway) {
    if (auto r = checked(in_ns(ns, {bins_.ip, "route", "add", destination, "via", gateway})); !r) {
        return fail(r.error());
    }
    return {};
}

//------------------------------- Forwarding, NAT, isolation -------------------

Result<void> ShellPrimitives::enable_forwarding() {
    if (auto r = checked({bins_.sysctl, "-w", "net.ipv4.ip_forward=1"}); !r) return fail(r.error());
    return {};
}

Result<void> ShellPrimitives::setup_nat(const std::string& bridge, const std::string& internet_iface,
                                        const std::vector<std::string>& public_blocks) {
    for (const auto& block : public_blocks) {
        const auto rules = nat_rules(bridge, internet_iface, block);
        if (auto r = checked(iptables(RuleOp::Append, "nat", "POSTROUTING", rules.masquerade)); !r) return fail(r.error());
        if (auto r = checked(iptables(RuleOp::Append, "", "FORWARD", rules.egress)); !r) return fail(r.error());
        if (auto r = checked(iptables(RuleOp::Append, "", "FORWARD", rules.ingress)); !r) return fail(r.error());
    }
    return {};
}

Result<void> ShellPrimitives::cleanup_nat(const std::string& bridge, const std::string& internet_iface,
                                          const std::vector<std::string>& public_blocks) {
    for (const auto& block : public_blocks) {
        const auto rules = nat_rules(bridge, internet_iface, block);
        if (auto r = tolerant(iptables(RuleOp::Delete, "nat", "POSTROUTING", rules.masquerade)); !r) return r;
        if (auto r = tolerant(iptables(RuleOp::Delete, "", "FORWARD", rules.egress)); !r) return r;
        if (auto r = tolerant(iptables(RuleOp::Delete, "", "FORWARD", rules.ingress)); !r) return r;
    }
    return {};
}

Result<void> ShellPrimitives::isolate_bridges(const std::string& bridge_a, const std::string& bridge_b) {
    if (auto r = checked(iptables(RuleOp::Insert, "", "FORWARD", {"-i", bridge_a, "-o", bridge_b, "-j", "DROP"})); !r) {
        return fail(r.error());
    }
    if (auto r = checked(iptables(RuleOp::Insert, "", "FORWARD", {"-i", bridge_b, "-o", bridge_a, "-j", "DROP"})); !r) {
        return fail(r.error());
    }
    return {};
}

Result<void> ShellPrimitives::remove_isolation(const std::string& bridge_a, const std::string& bridge_b) {
    if (auto r = tolerant(iptables(RuleOp::Delete, "", "FORWARD", {"-i", bridge_a, "-o", bridge_b, "-j", "DROP"})); !r) {
        return r;
    }
    return tolerant(iptables(RuleOp::Delete, "", "FORWARD", {"-i", bridge_b, "-o", bridge_a, "-j", "DROP"}));
}

//------------------------------- Filtering & execution ------------------------

Result<void> ShellPrimitives::apply_firewall_directive(const std::string& ns, const FirewallDirective& d) {
    std::vector<std::string> rule{"-p", d.protocol};
    if (d.port) {
        rule.push_back("--dport");
        rule.push_back(std::to_string(*d.port));
    }
    rule.push_back("-j");
    rule.push_back(d.target);
    if (auto r = checked(in_ns(ns, iptables(RuleOp::Append, "", "INPUT", std::move(rule)))); !r) {
        return fail(r.error());
    }
    return {};
}

Result<std::string> ShellPrimitives::run_in_namespace(const std::string& ns, const std::string& command) {
    auto r = checked(in_ns(ns, {"sh", "-c", command}));
    if (!r) return fail(r.error());
    return std::move(r->out);
}

} // namespace vpcctl::net
