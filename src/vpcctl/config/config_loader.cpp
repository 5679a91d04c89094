/**
 * @file config_loader.cpp
 * @brief JSON-backed loader; absent keys keep their named defaults.
 */
#include "vpcctl/config/config_loader.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>
#include <utility>

#include <nlohmann/json.hpp>

namespace vpcctl::config {

    namespace {

    using json = nlohmann::json;

    /// Copy a string field if present; reject non-string values.
    Result<void> read_string(const json& doc, const char* key, std::string& out) {
        auto it = doc.find(key);
        if (it == doc.end() || it->is_null()) return {};
        if (!it->is_string()) {
            return fail(ErrorCode::ValidationFailure,
                        std::string("config key '") + key + "' must be a string");
        }
        out = it->get<std::string>();
        if (out.empty()) {
            return fail(ErrorCode::ValidationFailure,
                        std::string("config key '") + key + "' must not be empty");
        }
        return {};
    }

    } // namespace

    Result<CtlConfig> Loader::load_from_string(const std::string& text) {
        json doc;
        try {
            doc = json::parse(text);
        } catch (const json::parse_error& e) {
            return fail(ErrorCode::ValidationFailure, std::string("config is not valid JSON: ") + e.what());
        }
        if (!doc.is_object()) {
            return fail(ErrorCode::ValidationFailure, "config root must be a JSON object");
        }

        CtlConfig cfg;
        const std::pair<const char*, std::string*> fields[] = {
            {"state_dir",                  &cfg.state_dir},
            {"peering_dir",                &cfg.peering_dir},
            {"lock_dir",                   &cfg.lock_dir},
            {"default_internet_interface", &cfg.default_internet_interface},
            {"log_level",                  &cfg.log_level},
            {"ip_binary",                  &cfg.ip_binary},
            {"iptables_binary",            &cfg.iptables_binary},
            {"sysctl_binary",              &cfg.sysctl_binary},
        };
        for (const auto& [key, dst] : fields) {
            if (auto r = read_string(doc, key, *dst); !r) return fail(r.error());
        }
        return cfg;
    }

    void relocate_state(CtlConfig& cfg, const std::string& root) {
        const std::filesystem::path base(root);
        cfg.state_dir   = base.string();
        cfg.peering_dir = (base / constants::STATE_PEERING_SUBDIR).string();
        cfg.lock_dir    = (base / constants::STATE_LOCK_SUBDIR).string();
    }

    Result<CtlConfig> Loader::load_from_file(const std::string& path) {
        std::error_code ec;
        if (!std::filesystem::exists(path, ec)) {
            return CtlConfig{}; // no file: named defaults
        }
        std::ifstream in(path);
        if (!in) {
            return fail(ErrorCode::PersistenceFailure, "cannot read config file " + path);
        }
        std::ostringstream buf;
        buf << in.rdbuf();
        return load_from_string(buf.str());
    }

} // namespace vpcctl::config
