/**
 * @file peering_manager.cpp
 * @brief Peering link wiring, isolation lift and convenience routes.
 */
#include "vpcctl/lifecycle/peering_manager.hpp"

#include "vpcctl/lifecycle/transaction.hpp"
#include "vpcctl/net/naming.hpp"

namespace vpcctl::lifecycle {

using topology::Peering;
using topology::Vpc;

namespace {

std::string pair_label(const std::string& a, const std::string& b) {
    return a + "<->" + b;
}

} // namespace

Result<Peering> PeeringManager::create(const std::string& vpc_a, const std::string& vpc_b) {
    return obs::report(observer_, "create-peering", pair_label(vpc_a, vpc_b), do_create(vpc_a, vpc_b));
}

Result<void> PeeringManager::remove(const std::string& vpc_a, const std::string& vpc_b) {
    return obs::report(observer_, "delete-peering", pair_label(vpc_a, vpc_b), do_remove(vpc_a, vpc_b));
}

Result<std::vector<Peering>> PeeringManager::list() const {
    return store_.list_peerings();
}

Result<std::optional<Peering>> PeeringManager::find(const std::string& vpc_a, const std::string& vpc_b) const {
    for (const auto& key : {topology::peering_key(vpc_a, vpc_b), topology::peering_key(vpc_b, vpc_a)}) {
        auto p = store_.get_peering(key);
        if (!p) {
            if (p.error().code != ErrorCode::NotFound) return fail(p.error());
            continue;
        }
        if (!p->joins(vpc_a, vpc_b)) {
            return fail(ErrorCode::Conflict,
                        "peering record '" + key + "' joins '" + p->vpc_a + "' and '" + p->vpc_b +
                        "', not '" + vpc_a + "' and '" + vpc_b + "'");
        }
        return std::optional<Peering>(std::move(*p));
    }
    return std::optional<Peering>{};
}

std::size_t PeeringManager::install_routes(const Vpc& to) {
    if (to.subnets.empty()) {
        obs::best_effort(fail(ErrorCode::NotFound, "VPC '" + to.name + "' has no subnets"),
                         observer_, "create-peering", "routes toward " + to.name);
        return 0;
    }
    const std::string& via = to.subnets.front().gateway;
    std::size_t installed = 0;
    for (const auto& s : to.subnets) {
        if (obs::best_effort(prims_.add_route(net::kHostNamespace, s.cidr, via),
                             observer_, "create-peering", "route " + s.cidr + " via " + via) ==
            Disposition::Applied) {
            ++installed;
        }
    }
    obs::logger()->debug("{} of {} route(s) toward {} installed", installed, to.subnets.size(), to.name);
    return installed;
}

Result<Peering> PeeringManager::do_create(const std::string& vpc_a, const std::string& vpc_b) {
    if (vpc_a == vpc_b) {
        return fail(ErrorCode::ValidationFailure, "cannot peer VPC '" + vpc_a + "' with itself");
    }

    auto guard = store_.lock(topology::peering_lock_key(vpc_a, vpc_b));
    if (!guard) return fail(guard.error());

    auto existing = find(vpc_a, vpc_b);
    if (!existing) return fail(existing.error());
    if (existing->has_value()) {
        return fail(ErrorCode::AlreadyExists,
                    "peering between '" + vpc_a + "' and '" + vpc_b + "' already exists");
    }

    auto a = store_.get_vpc(vpc_a);
    if (!a) return fail(a.error());
    auto b = store_.get_vpc(vpc_b);
    if (!b) return fail(b.error());

    const auto links = net::peering_link_names(vpc_a, vpc_b);

    Transaction tx("create-peering", pair_label(vpc_a, vpc_b), observer_);
    Result<void> r = tx.apply("create link pair " + links.a_end + "/" + links.b_end,
                              [&] { return prims_.create_link_pair(links.a_end, links.b_end); },
                              [this, end = links.a_end] { return prims_.delete_link_pair(end); });
    if (r) r = tx.apply("attach " + links.a_end + " to " + a->bridge,
                        [&] { return prims_.attach_to_bridge(a->bridge, links.a_end); });
    if (r) r = tx.apply("attach " + links.b_end + " to " + b->bridge,
                        [&] { return prims_.attach_to_bridge(b->bridge, links.b_end); });
    if (r) r = tx.apply("lift isolation",
                        [&] { return prims_.remove_isolation(a->bridge, b->bridge); },
                        [this, x = a->bridge, y = b->bridge] { return prims_.isolate_bridges(x, y); });
    if (!r) return fail(r.error());

    std::size_t routes = install_routes(*b);
    routes += install_routes(*a);
    if (routes == 0) {
        obs::logger()->warn("peering {}: no convenience routes installed", pair_label(vpc_a, vpc_b));
    }

    Peering p{
        .vpc_a  = vpc_a,
        .vpc_b  = vpc_b,
        .veth_a = links.a_end,
        .veth_b = links.b_end,
    };
    if (auto s = store_.save_peering(p); !s) return fail(s.error());
    tx.commit();
    return p;
}

Result<void> PeeringManager::do_remove(const std::string& vpc_a, const std::string& vpc_b) {
    auto guard = store_.lock(topology::peering_lock_key(vpc_a, vpc_b));
    if (!guard) return fail(guard.error());

    auto existing = find(vpc_a, vpc_b);
    if (!existing) return fail(existing.error());
    if (!existing->has_value()) {
        return fail(ErrorCode::NotFound,
                    "no peering between '" + vpc_a + "' and '" + vpc_b + "'");
    }
    const Peering& p = **existing;

    if (auto r = store_.remove_peering(p.key()); !r) return r;
    obs::logger()->warn("peering '{}' removed from the topology; link pair {}/{} and its routes are left in place",
                        p.id(), p.veth_a, p.veth_b);
    return {};
}

} // namespace vpcctl::lifecycle
