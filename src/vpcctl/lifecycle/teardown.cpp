/**
 * @file teardown.cpp
 * @brief Full-topology removal through the regular delete paths.
 */
#include "vpcctl/lifecycle/teardown.hpp"

#include <optional>

namespace vpcctl::lifecycle {

Result<TeardownSummary> Teardown::run() {
    TeardownSummary done;
    std::optional<Error> first;
    auto note = [&first](const Error& e) {
        if (!first) first = e;
    };

    auto peerings = store_.list_peerings();
    if (!peerings) return fail(peerings.error());
    for (const auto& p : *peerings) {
        // Peering delete keeps the link pair; a full teardown reclaims it.
        obs::best_effort(prims_.delete_link_pair(p.veth_a), observer_, "teardown-all", "delete link " + p.veth_a);
        if (auto r = peerings_.remove(p.vpc_a, p.vpc_b); r) {
            ++done.peerings;
        } else {
            note(r.error());
        }
    }

    auto vpcs = store_.list_vpcs();
    if (!vpcs) return fail(vpcs.error());
    for (const auto& v : *vpcs) {
        if (auto r = vpcs_.remove(v.name); r) {
            ++done.vpcs;
        } else {
            note(r.error());
        }
    }

    obs::logger()->info("teardown: {} peering(s), {} VPC(s) removed", done.peerings, done.vpcs);
    if (first) return fail(*first);
    return done;
}

} // namespace vpcctl::lifecycle
