#pragma once
/**
 * @file file_store.hpp
 * @brief TopologyStore over one JSON document per record.
 *
 * Layout:
 *  - <state_dir>/<vpc>.json          VPC record with embedded subnets
 *  - <peering_dir>/<a>.<b>.json      Peering record
 *  - <lock_dir>/<key>.lock           flock(2) target for lock(key)
 *
 * Writes go to a temporary sibling and are renamed over the record, so a
 * reader never observes a half-written document.
 */

#include <filesystem>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

#include "vpcctl/topology/store.hpp"

namespace vpcctl::topology {

/** @struct StorePaths
 *  @brief Directories used by FileTopologyStore.
 */
struct StorePaths {
  std::filesystem::path state_dir;
  std::filesystem::path peering_dir;
  std::filesystem::path lock_dir;
};

class FileTopologyStore final : public TopologyStore {
public:
  explicit FileTopologyStore(StorePaths paths) : paths_(std::move(paths)) {}

  /// Create all three directories if missing. PersistenceFailure otherwise.
  Result<void> prepare() const;

  [[nodiscard]] const StorePaths& paths() const noexcept { return paths_; }

  Result<Vpc> get_vpc(std::string_view name) const override;
  Result<void> save_vpc(Vpc& vpc) override;
  Result<void> remove_vpc(std::string_view name) override;
  Result<std::vector<Vpc>> list_vpcs() const override;

  Result<Peering> get_peering(std::string_view key) const override;
  Result<void> save_peering(Peering& peering) override;
  Result<void> remove_peering(std::string_view key) override;
  Result<std::vector<Peering>> list_peerings() const override;

  /// Exclusive flock on <lock_dir>/<key>.lock; blocks until granted.
  Result<KeyLock> lock(std::string_view key) override;

private:
  Result<std::filesystem::path> record_path(const std::filesystem::path& dir, std::string_view key) const;

  StorePaths paths_;
  std::mutex write_mu_; ///< Orders CAS check + rename within this process
};

} // namespace vpcctl::topology
