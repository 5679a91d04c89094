/**
 * @file vpc_manager.cpp
 * @brief VPC lifecycle: bridge, isolation, NAT and teardown sequencing.
 */
#include "vpcctl/lifecycle/vpc_manager.hpp"

#include "vpcctl/lifecycle/transaction.hpp"
#include "vpcctl/net/cidr.hpp"
#include "vpcctl/net/naming.hpp"

namespace vpcctl::lifecycle {

using topology::Vpc;

Result<Vpc> VpcManager::create(const std::string& name, const std::string& cidr) {
    return obs::report(observer_, "create-vpc", name, do_create(name, cidr));
}

Result<void> VpcManager::remove(const std::string& name) {
    return obs::report(observer_, "delete-vpc", name, do_remove(name));
}

Result<Vpc> VpcManager::enable_nat(const std::string& name, const std::string& internet_iface) {
    return obs::report(observer_, "enable-nat", name, do_enable_nat(name, internet_iface));
}

Result<std::vector<Vpc>> VpcManager::list() const {
    return store_.list_vpcs();
}

Result<Vpc> VpcManager::details(const std::string& name) const {
    return store_.get_vpc(name);
}

//------------------------------- create ---------------------------------------

Result<Vpc> VpcManager::do_create(const std::string& name, const std::string& cidr) {
    if (!net::valid_vpc_name(name)) {
        return fail(ErrorCode::ValidationFailure,
                    "invalid VPC name '" + name + "' (use [A-Za-z0-9_-], at most 12 characters)");
    }
    auto block = net::Ipv4Block::parse(cidr);
    if (!block) return fail(block.error());

    // The VPC set is read below to derive isolation rules.
    auto set_lock = store_.lock(topology::kTopologyLockKey);
    if (!set_lock) return fail(set_lock.error());
    auto vpc_lock = store_.lock(topology::vpc_lock_key(name));
    if (!vpc_lock) return fail(vpc_lock.error());

    if (auto existing = store_.get_vpc(name); existing) {
        return fail(ErrorCode::AlreadyExists, "VPC '" + name + "' already exists");
    } else if (existing.error().code != ErrorCode::NotFound) {
        return fail(existing.error());
    }

    auto others = store_.list_vpcs();
    if (!others) return fail(others.error());

    Vpc vpc{
        .name       = name,
        .cidr       = block->to_string(),
        .bridge     = net::bridge_name(name),
        .created_at = topology::now_iso8601(),
    };

    Transaction tx("create-vpc", name, observer_);
    if (auto r = tx.apply("create bridge " + vpc.bridge,
                          [&] { return prims_.create_bridge(vpc.bridge); },
                          [this, br = vpc.bridge] { return prims_.delete_bridge(br); });
        !r) {
        return fail(r.error());
    }

    for (const auto& other : *others) {
        if (other.name == name) continue;
        const std::string peer = other.bridge;
        if (auto r = tx.apply("isolate from " + peer,
                              [&] { return prims_.isolate_bridges(vpc.bridge, peer); },
                              [this, br = vpc.bridge, peer] { return prims_.remove_isolation(br, peer); });
            !r) {
            return fail(r.error());
        }
    }

    if (auto s = store_.save_vpc(vpc); !s) {
        return fail(s.error()); // tx unwinds on scope exit
    }
    tx.commit();
    return vpc;
}

//------------------------------- delete ---------------------------------------

Result<void> VpcManager::do_remove(const std::string& name) {
    auto set_lock = store_.lock(topology::kTopologyLockKey);
    if (!set_lock) return fail(set_lock.error());
    auto vpc_lock = store_.lock(topology::vpc_lock_key(name));
    if (!vpc_lock) return fail(vpc_lock.error());

    auto vpc = store_.get_vpc(name);
    if (!vpc) return fail(vpc.error());

    auto others = store_.list_vpcs();
    if (!others) return fail(others.error());

    for (const auto& other : *others) {
        if (other.name == name) continue;
        if (auto r = prims_.remove_isolation(vpc->bridge, other.bridge); !r) return r;
    }

    if (vpc->nat_enabled) {
        // Symmetric with enable: same interface, same frozen block set.
        const std::string iface = vpc->internet_interface.value_or("");
        if (auto r = prims_.cleanup_nat(vpc->bridge, iface, vpc->nat_public_cidrs); !r) return r;
    }

    for (const auto& s : vpc->subnets) {
        if (auto r = prims_.delete_namespace(s.namespace_id); !r) return r;
    }

    if (auto r = prims_.delete_bridge(vpc->bridge); !r) return r;
    if (auto r = store_.remove_vpc(name); !r) return r;

    // Peering records are not cascaded.
    if (auto peerings = store_.list_peerings(); peerings) {
        for (const auto& p : *peerings) {
            if (p.vpc_a == name || p.vpc_b == name) {
                obs::logger()->warn("peering '{}' still references deleted VPC '{}'", p.id(), name);
            }
        }
    }
    return {};
}

//------------------------------- NAT ------------------------------------------

Result<Vpc> VpcManager::do_enable_nat(const std::string& name, const std::string& internet_iface) {
    if (!net::valid_interface_name(internet_iface)) {
        return fail(ErrorCode::ValidationFailure, "invalid interface name '" + internet_iface + "'");
    }

    auto vpc_lock = store_.lock(topology::vpc_lock_key(name));
    if (!vpc_lock) return fail(vpc_lock.error());

    auto vpc = store_.get_vpc(name);
    if (!vpc) return fail(vpc.error());

    if (vpc->nat_enabled) {
        return fail(ErrorCode::ValidationFailure,
                    "NAT is already enabled for VPC '" + name + "' via " +
                    vpc->internet_interface.value_or("?"));
    }
    const auto blocks = vpc->public_cidrs();
    if (blocks.empty()) {
        return fail(ErrorCode::ValidationFailure, "VPC '" + name + "' has no public subnets");
    }

    Transaction tx("enable-nat", name, observer_);
    if (auto r = tx.apply("enable forwarding", [&] { return prims_.enable_forwarding(); }); !r) {
        return fail(r.error());
    }
    if (auto r = tx.apply("install NAT rules",
                          [&] { return prims_.setup_nat(vpc->bridge, internet_iface, blocks); },
                          [this, br = vpc->bridge, internet_iface, blocks] {
                              return prims_.cleanup_nat(br, internet_iface, blocks);
                          });
        !r) {
        return fail(r.error());
    }

    vpc->nat_enabled        = true;
    vpc->internet_interface = internet_iface;
    vpc->nat_public_cidrs   = blocks;
    if (auto s = store_.save_vpc(*vpc); !s) return fail(s.error());
    tx.commit();
    return *vpc;
}

} // namespace vpcctl::lifecycle
