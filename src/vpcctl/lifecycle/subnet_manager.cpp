/**
 * @file subnet_manager.cpp
 * @brief Subnet wiring sequence with staged compensation.
 */
#include "vpcctl/lifecycle/subnet_manager.hpp"

#include "vpcctl/config/constants.hpp"
#include "vpcctl/lifecycle/transaction.hpp"
#include "vpcctl/net/cidr.hpp"
#include "vpcctl/net/naming.hpp"

namespace vpcctl::lifecycle {

using topology::Subnet;
using topology::SubnetKind;

namespace {

/// Block checks against the VPC: prefix, containment, sibling overlap.
Result<net::Ipv4Block> check_block(const topology::Vpc& vpc, const std::string& cidr) {
    auto block = net::Ipv4Block::parse(cidr);
    if (!block) return fail(block.error());

    if (block->prefix > config::constants::SUBNET_MAX_PREFIX) {
        return fail(ErrorCode::ValidationFailure,
                    "subnet block " + block->to_string() + " has fewer than two usable hosts");
    }
    auto outer = net::Ipv4Block::parse(vpc.cidr);
    if (!outer) return fail(outer.error());
    if (!outer->contains(*block)) {
        return fail(ErrorCode::ValidationFailure,
                    "subnet block " + block->to_string() + " is outside VPC block " + vpc.cidr);
    }
    for (const auto& s : vpc.subnets) {
        auto sibling = net::Ipv4Block::parse(s.cidr);
        if (!sibling) return fail(sibling.error());
        if (sibling->overlaps(*block)) {
            return fail(ErrorCode::ValidationFailure,
                        "subnet block " + block->to_string() + " overlaps subnet '" + s.name +
                        "' (" + s.cidr + ")");
        }
    }
    return block;
}

} // namespace

Result<Subnet> SubnetManager::create(const std::string& vpc, const std::string& subnet,
                                     const std::string& cidr, SubnetKind kind) {
    return obs::report(observer_, "add-subnet", vpc + "/" + subnet, do_create(vpc, subnet, cidr, kind));
}

Result<Subnet> SubnetManager::do_create(const std::string& vpc_name, const std::string& subnet_name,
                                        const std::string& cidr, SubnetKind kind) {
    if (!net::valid_subnet_name(subnet_name)) {
        return fail(ErrorCode::ValidationFailure,
                    "invalid subnet name '" + subnet_name + "' (use [A-Za-z0-9_-], at most 32 characters)");
    }

    auto guard = store_.lock(topology::vpc_lock_key(vpc_name));
    if (!guard) return fail(guard.error());

    auto vpc = store_.get_vpc(vpc_name);
    if (!vpc) return fail(vpc.error());
    if (vpc->find_subnet(subnet_name) != nullptr) {
        return fail(ErrorCode::AlreadyExists,
                    "subnet '" + subnet_name + "' already exists in VPC '" + vpc_name + "'");
    }

    auto block = check_block(*vpc, cidr);
    if (!block) return fail(block.error());
    auto plan = net::plan_subnet(*block);
    if (!plan) return fail(plan.error());

    const auto links = net::subnet_link_names(vpc_name, subnet_name);
    Subnet sn{
        .name         = subnet_name,
        .cidr         = block->to_string(),
        .kind         = kind,
        .namespace_id = net::namespace_id(vpc_name, subnet_name),
        .veth_ns      = links.ns_end,
        .veth_br      = links.bridge_end,
        .gateway      = plan->gateway,
        .host         = plan->host,
    };
    const std::string bridge = vpc->bridge;

    Transaction tx("add-subnet", vpc_name + "/" + subnet_name, observer_);
    Result<void> r = tx.apply("create namespace " + sn.namespace_id,
                              [&] { return prims_.create_namespace(sn.namespace_id); },
                              [this, ns = sn.namespace_id] { return prims_.delete_namespace(ns); });
    if (r) r = tx.apply("create link pair " + sn.veth_ns + "/" + sn.veth_br,
                        [&] { return prims_.create_link_pair(sn.veth_ns, sn.veth_br); },
                        [this, end = sn.veth_br] { return prims_.delete_link_pair(end); });
    if (r) r = tx.apply("attach " + sn.veth_br + " to " + bridge,
                        [&] { return prims_.attach_to_bridge(bridge, sn.veth_br); });
    if (r) r = tx.apply("move " + sn.veth_ns + " into " + sn.namespace_id,
                        [&] { return prims_.move_to_namespace(sn.veth_ns, sn.namespace_id); });
    if (r) r = tx.apply("assign host address " + plan->host_cidr,
                        [&] { return prims_.assign_address(sn.namespace_id, sn.veth_ns, plan->host_cidr); });
    if (r) r = tx.apply("assign gateway address " + plan->gateway_cidr,
                        [&] { return prims_.assign_bridge_address(bridge, plan->gateway_cidr); },
                        [this, bridge, gw = plan->gateway_cidr] { return prims_.remove_bridge_address(bridge, gw); });
    if (r) r = tx.apply("default route via " + sn.gateway,
                        [&] { return prims_.add_default_route(sn.namespace_id, sn.gateway); });
    if (r) r = tx.apply("loopback up",
                        [&]() -> Result<void> {
                            auto out = prims_.run_in_namespace(sn.namespace_id, config::constants::LOOPBACK_UP_COMMAND);
                            if (!out) return fail(out.error());
                            return {};
                        });
    if (!r) return fail(r.error());

    vpc->subnets.push_back(sn);
    if (auto s = store_.save_vpc(*vpc); !s) return fail(s.error());
    tx.commit();
    return sn;
}

Result<std::string> SubnetManager::exec(const std::string& vpc_name, const std::string& subnet_name,
                                        const std::string& command) {
    auto vpc = store_.get_vpc(vpc_name);
    if (!vpc) return fail(vpc.error());
    const Subnet* sn = vpc->find_subnet(subnet_name);
    if (sn == nullptr) {
        return fail(ErrorCode::NotFound,
                    "subnet '" + subnet_name + "' not found in VPC '" + vpc_name + "'");
    }
    return prims_.run_in_namespace(sn->namespace_id, command);
}

} // namespace vpcctl::lifecycle
