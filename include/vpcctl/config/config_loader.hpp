#pragma once
/**
 * @file config_loader.hpp
 * @brief Loader facade: named defaults, optionally overridden by a JSON file.
 * @details All defaults reference named constants to avoid magic strings.
 */

#include <string>

#include "vpcctl/config/constants.hpp"
#include "vpcctl/error.hpp"

namespace vpcctl::config {

    /** @struct CtlConfig
     *  @brief Everything the CLI needs to wire store, primitives and logging.
     */
    struct CtlConfig {
        std::string state_dir{constants::DEFAULT_STATE_DIR};     ///< VPC records
        std::string peering_dir{constants::DEFAULT_PEERING_DIR}; ///< Peering records
        std::string lock_dir{constants::DEFAULT_LOCK_DIR};       ///< Per-key lock files
        std::string default_internet_interface{constants::DEFAULT_INTERNET_INTERFACE};
        std::string log_level{constants::DEFAULT_LOG_LEVEL};     ///< spdlog level name
        std::string ip_binary{constants::DEFAULT_IP_BINARY};
        std::string iptables_binary{constants::DEFAULT_IPTABLES_BINARY};
        std::string sysctl_binary{constants::DEFAULT_SYSCTL_BINARY};

        bool operator==(const CtlConfig&) const = default;
    };

    /**
     * @brief Move all persistent state under @p root.
     * @details VPC records go in @p root itself, peerings and lock files in
     *          its STATE_PEERING_SUBDIR and STATE_LOCK_SUBDIR children, so
     *          two roots never share a record or a lock.
     */
    void relocate_state(CtlConfig& cfg, const std::string& root);

    /** @class Loader
     *  @brief Source of vpcctl configuration (defaults or a parsed file).
     */
    class Loader {
    public:
        /**
         * @brief Load configuration from @p path.
         * @param path JSON file; a missing file yields the defaults.
         * @return CtlConfig, or ValidationFailure for malformed content.
         */
        static Result<CtlConfig> load_from_file(const std::string& path);

        /**
         * @brief Parse configuration from JSON text, starting from defaults.
         * @details Unknown keys are ignored; known keys must be strings.
         */
        static Result<CtlConfig> load_from_string(const std::string& text);
    };

} // namespace vpcctl::config
