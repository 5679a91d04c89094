/**
 * @file firewall_applier.cpp
 * @brief Rule-set parsing (nlohmann::json) and directive issuance.
 */
#include "vpcctl/lifecycle/firewall_applier.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <sstream>

#include <nlohmann/json.hpp>

#include "vpcctl/net/cidr.hpp"

namespace vpcctl::lifecycle {

namespace {

using json = nlohmann::json;

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

Result<void> check_rule(const IngressRule& rule, std::size_t index) {
    const std::string where = "ingress rule #" + std::to_string(index + 1);
    if (rule.protocol.empty()) {
        return fail(ErrorCode::ValidationFailure, where + ": protocol must not be empty");
    }
    if (rule.port && *rule.port == 0) {
        return fail(ErrorCode::ValidationFailure, where + ": port must be in 1..65535");
    }
    if (rule.action.empty()) {
        return fail(ErrorCode::ValidationFailure, where + ": action must not be empty");
    }
    return {};
}

Result<IngressRule> parse_rule(const json& j, std::size_t index) {
    const std::string where = "ingress rule #" + std::to_string(index + 1);
    if (!j.is_object()) {
        return fail(ErrorCode::ValidationFailure, where + " must be an object");
    }
    IngressRule rule;
    if (auto it = j.find("protocol"); it != j.end()) {
        if (!it->is_string()) return fail(ErrorCode::ValidationFailure, where + ": protocol must be a string");
        rule.protocol = it->get<std::string>();
    }
    if (auto it = j.find("port"); it != j.end() && !it->is_null()) {
        if (!it->is_number_integer()) {
            return fail(ErrorCode::ValidationFailure, where + ": port must be an integer");
        }
        const auto port = it->get<std::int64_t>();
        if (port < 1 || port > 65535) {
            return fail(ErrorCode::ValidationFailure, where + ": port " + std::to_string(port) + " out of range");
        }
        rule.port = static_cast<std::uint16_t>(port);
    }
    if (auto it = j.find("action"); it != j.end()) {
        if (!it->is_string()) return fail(ErrorCode::ValidationFailure, where + ": action must be a string");
        rule.action = it->get<std::string>();
    }
    if (auto r = check_rule(rule, index); !r) return fail(r.error());
    return rule;
}

} // namespace

Result<RuleSet> parse_rule_set(const std::string& text) {
    json doc;
    try {
        doc = json::parse(text);
    } catch (const json::parse_error& e) {
        return fail(ErrorCode::ValidationFailure, std::string("rule set is not valid JSON: ") + e.what());
    }
    if (!doc.is_object()) {
        return fail(ErrorCode::ValidationFailure, "rule set root must be a JSON object");
    }

    RuleSet rs;
    auto subnet = doc.find("subnet");
    if (subnet == doc.end() || !subnet->is_string()) {
        return fail(ErrorCode::ValidationFailure, "rule set needs a \"subnet\" block string");
    }
    rs.subnet = subnet->get<std::string>();

    if (auto ingress = doc.find("ingress"); ingress != doc.end()) {
        if (!ingress->is_array()) {
            return fail(ErrorCode::ValidationFailure, "\"ingress\" must be an array");
        }
        rs.ingress.reserve(ingress->size());
        for (std::size_t i = 0; i < ingress->size(); ++i) {
            auto rule = parse_rule((*ingress)[i], i);
            if (!rule) return fail(rule.error());
            rs.ingress.push_back(std::move(*rule));
        }
    }
    return rs;
}

Result<RuleSet> load_rule_set(const std::string& path) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        return fail(ErrorCode::NotFound, "rule set file " + path + " does not exist");
    }
    std::ifstream in(path);
    if (!in) {
        return fail(ErrorCode::PersistenceFailure, "cannot read rule set file " + path);
    }
    std::ostringstream buf;
    buf << in.rdbuf();
    return parse_rule_set(buf.str());
}

net::FirewallDirective translate(const IngressRule& rule) {
    net::FirewallDirective d;
    d.protocol = rule.protocol;
    d.port     = rule.port;
    const auto action = lower(rule.action);
    if (action == "allow") {
        d.target = "ACCEPT";
    } else if (action == "deny") {
        d.target = "DROP";
    } else {
        d.target = rule.action;
    }
    return d;
}

Result<std::size_t> FirewallApplier::apply_from_rule_set(const std::string& vpc, const std::string& rules_path) {
    auto rs = load_rule_set(rules_path);
    if (!rs) return obs::report(observer_, "apply-firewall", vpc, Result<std::size_t>(fail(rs.error())));
    return apply_rule_set(vpc, *rs);
}

Result<std::size_t> FirewallApplier::apply_rule_set(const std::string& vpc_name, const RuleSet& rules) {
    auto run = [&]() -> Result<std::size_t> {
        auto guard = store_.lock(topology::vpc_lock_key(vpc_name));
        if (!guard) return fail(guard.error());
        auto vpc = store_.get_vpc(vpc_name);
        if (!vpc) return fail(vpc.error());

        // Compare canonical forms so "10.0.1.0/24" matches however it was written.
        auto block = net::Ipv4Block::parse(rules.subnet);
        if (!block) return fail(block.error());
        const topology::Subnet* target = vpc->find_subnet_by_cidr(block->to_string());
        if (target == nullptr) {
            return fail(ErrorCode::NotFound,
                        "no subnet with block " + rules.subnet + " in VPC '" + vpc_name + "'");
        }
        return apply_to(*target, rules.ingress);
    };
    return obs::report(observer_, "apply-firewall", vpc_name, run());
}

Result<std::size_t> FirewallApplier::apply_direct(const std::string& vpc_name, const std::string& subnet_name,
                                                  std::span<const IngressRule> rules) {
    auto run = [&]() -> Result<std::size_t> {
        auto guard = store_.lock(topology::vpc_lock_key(vpc_name));
        if (!guard) return fail(guard.error());
        auto vpc = store_.get_vpc(vpc_name);
        if (!vpc) return fail(vpc.error());
        const topology::Subnet* target = vpc->find_subnet(subnet_name);
        if (target == nullptr) {
            return fail(ErrorCode::NotFound,
                        "subnet '" + subnet_name + "' not found in VPC '" + vpc_name + "'");
        }
        return apply_to(*target, rules);
    };
    return obs::report(observer_, "apply-firewall", vpc_name + "/" + subnet_name, run());
}

Result<std::size_t> FirewallApplier::apply_to(const topology::Subnet& target, std::span<const IngressRule> rules) {
    // Reject the whole list before the first directive goes out.
    for (std::size_t i = 0; i < rules.size(); ++i) {
        if (auto r = check_rule(rules[i], i); !r) return fail(r.error());
    }
    std::size_t issued = 0;
    for (const auto& rule : rules) {
        const auto d = translate(rule);
        if (auto r = prims_.apply_firewall_directive(target.namespace_id, d); !r) return fail(r.error());
        ++issued;
    }
    obs::logger()->info("{}: {} firewall directive(s) appended in {}", target.name, issued, target.namespace_id);
    return issued;
}

} // namespace vpcctl::lifecycle
