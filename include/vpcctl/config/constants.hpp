#pragma once
/**
 * @file constants.hpp
 * @brief Centralized named defaults for vpcctl.
 * @details These values eliminate magic strings/numbers from the codebase.
 *          Override via the Config Loader (JSON) in real deployments.
 */

#include <cstddef>
#include <cstdint>

namespace vpcctl::config::constants {

// =====================
// Filesystem layout
// =====================
inline constexpr const char* DEFAULT_CONFIG_PATH = "/etc/vpcctl/config.json"; ///< Optional config file
inline constexpr const char* DEFAULT_STATE_DIR   = "/tmp/vpc_config";         ///< One JSON per VPC
inline constexpr const char* DEFAULT_PEERING_DIR = "/tmp/vpc_peering";        ///< One JSON per peering
inline constexpr const char* DEFAULT_LOCK_DIR    = "/tmp/vpc_locks";          ///< flock(2) files per key
inline constexpr const char* STATE_PEERING_SUBDIR = "peerings";               ///< Under a --state-dir root
inline constexpr const char* STATE_LOCK_SUBDIR    = "locks";                  ///< Under a --state-dir root

// =====================
// Host integration
// =====================
inline constexpr const char* DEFAULT_INTERNET_INTERFACE = "eth0";
inline constexpr const char* DEFAULT_LOG_LEVEL          = "info";
inline constexpr const char* DEFAULT_IP_BINARY          = "ip";
inline constexpr const char* DEFAULT_IPTABLES_BINARY    = "iptables";
inline constexpr const char* DEFAULT_SYSCTL_BINARY      = "sysctl";

/// Command run inside a fresh subnet namespace to bring loopback up.
inline constexpr const char* LOOPBACK_UP_COMMAND = "ip link set lo up";

// =====================
// Naming limits
// =====================
inline constexpr std::size_t IFNAME_MAX_LEN      = 15; ///< IFNAMSIZ - 1 on Linux
inline constexpr std::size_t VPC_NAME_MAX_LEN    = 12; ///< "br-" + name must fit IFNAME_MAX_LEN
inline constexpr std::size_t SUBNET_NAME_MAX_LEN = 32;

/// Hex digits of the folded hash used in derived link names (32-bit space).
inline constexpr std::size_t LINK_ID_HEX_DIGITS = 8;

// =====================
// Addressing
// =====================
inline constexpr std::uint8_t SUBNET_MAX_PREFIX = 30; ///< Smallest block with two usable hosts

// =====================
// Firewall defaults (rule fields left out of a rule-set document)
// =====================
inline constexpr const char* FIREWALL_DEFAULT_PROTOCOL = "tcp";
inline constexpr const char* FIREWALL_DEFAULT_ACTION   = "allow";

} // namespace vpcctl::config::constants
