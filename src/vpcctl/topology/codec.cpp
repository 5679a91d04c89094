/**
 * @file codec.cpp
 * @brief nlohmann::json mapping for topology records.
 */
#include "vpcctl/topology/codec.hpp"

#include <stdexcept>

#include <nlohmann/json.hpp>

namespace vpcctl::topology {

using json = nlohmann::json;

// ADL hooks picked up by nlohmann::json. from_json throws json::exception on
// missing/mistyped fields and std::invalid_argument on a bad subnet type;
// decode() converts both into a Result.

void to_json(json& j, const Subnet& s) {
    j = json{{"name", s.name},
             {"cidr", s.cidr},
             {"type", std::string(to_string(s.kind))},
             {"namespace", s.namespace_id},
             {"veth_ns", s.veth_ns},
             {"veth_br", s.veth_br},
             {"gateway", s.gateway},
             {"ip", s.host}};
}

void from_json(const json& j, Subnet& s) {
    j.at("name").get_to(s.name);
    j.at("cidr").get_to(s.cidr);
    auto kind = parse_subnet_kind(j.at("type").get<std::string>());
    if (!kind) throw std::invalid_argument(kind.error().message);
    s.kind = *kind;
    j.at("namespace").get_to(s.namespace_id);
    j.at("veth_ns").get_to(s.veth_ns);
    j.at("veth_br").get_to(s.veth_br);
    j.at("gateway").get_to(s.gateway);
    j.at("ip").get_to(s.host);
}

void to_json(json& j, const Vpc& v) {
    j = json{{"name", v.name},
             {"cidr", v.cidr},
             {"bridge", v.bridge},
             {"subnets", v.subnets},
             {"nat_enabled", v.nat_enabled},
             {"nat_public_cidrs", v.nat_public_cidrs},
             {"created_at", v.created_at},
             {"revision", v.revision}};
    if (v.internet_interface) j["internet_interface"] = *v.internet_interface;
}

void from_json(const json& j, Vpc& v) {
    j.at("name").get_to(v.name);
    j.at("cidr").get_to(v.cidr);
    j.at("bridge").get_to(v.bridge);
    v.subnets = j.value("subnets", std::vector<Subnet>{});
    v.nat_enabled = j.value("nat_enabled", false);
    if (auto it = j.find("internet_interface"); it != j.end() && !it->is_null()) {
        v.internet_interface = it->get<std::string>();
    } else {
        v.internet_interface.reset();
    }
    v.nat_public_cidrs = j.value("nat_public_cidrs", std::vector<std::string>{});
    v.created_at = j.value("created_at", std::string{});
    v.revision = j.value("revision", std::uint64_t{0});
}

void to_json(json& j, const Peering& p) {
    j = json{{"vpc_a", p.vpc_a},
             {"vpc_b", p.vpc_b},
             {"veth_a", p.veth_a},
             {"veth_b", p.veth_b},
             {"revision", p.revision}};
}

void from_json(const json& j, Peering& p) {
    j.at("vpc_a").get_to(p.vpc_a);
    j.at("vpc_b").get_to(p.vpc_b);
    j.at("veth_a").get_to(p.veth_a);
    j.at("veth_b").get_to(p.veth_b);
    p.revision = j.value("revision", std::uint64_t{0});
}

std::string encode(const Vpc& vpc) {
    return json(vpc).dump(2);
}

std::string encode(const Peering& peering) {
    return json(peering).dump(2);
}

template <class T>
static Result<T> decode(std::string_view text, const char* what) {
    try {
        return json::parse(text).get<T>();
    } catch (const json::exception& e) {
        return fail(ErrorCode::PersistenceFailure, std::string("malformed ") + what + " record: " + e.what());
    } catch (const std::invalid_argument& e) {
        return fail(ErrorCode::PersistenceFailure, std::string("malformed ") + what + " record: " + e.what());
    }
}

Result<Vpc> decode_vpc(std::string_view text) {
    return decode<Vpc>(text, "VPC");
}

Result<Peering> decode_peering(std::string_view text) {
    return decode<Peering>(text, "peering");
}

} // namespace vpcctl::topology
