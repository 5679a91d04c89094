#pragma once
/**
 * @file store.hpp
 * @brief Keyed persistence of VPC and Peering records (no business logic).
 *
 * Concurrency model:
 *  - Writes are compare-and-swap on `revision`: a record saved with
 *    revision r succeeds only if the stored revision is r (0 = absent), and
 *    the store then sets it to r + 1. A lost race returns ErrorCode::Conflict
 *    instead of silently overwriting.
 *  - lock(key) serialises whole load-mutate-save spans across processes
 *    (file store) or threads (memory store). Lifecycle managers hold it for
 *    the duration of an operation so primitive calls are not duplicated.
 */

#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "vpcctl/error.hpp"
#include "vpcctl/topology/model.hpp"

namespace vpcctl::topology {

/**
 * @brief Move-only RAII handle for an exclusive per-key lock.
 */
class KeyLock final {
public:
  /// Backend-specific lock ownership; released in its destructor.
  class Lease {
  public:
    virtual ~Lease() = default;
  };

  KeyLock() noexcept = default;
  explicit KeyLock(std::unique_ptr<Lease> lease) noexcept : lease_(std::move(lease)) {}

  KeyLock(const KeyLock&)            = delete;
  KeyLock& operator=(const KeyLock&) = delete;
  KeyLock(KeyLock&&) noexcept            = default;
  KeyLock& operator=(KeyLock&&) noexcept = default;

  [[nodiscard]] bool held() const noexcept { return lease_ != nullptr; }
  void release() noexcept { lease_.reset(); }

private:
  std::unique_ptr<Lease> lease_;
};

/// Lock key guarding the set of VPCs (create/delete read the whole set).
inline constexpr const char* kTopologyLockKey = "topology";

/// Lock key for one VPC record: "vpc.<name>".
std::string vpc_lock_key(std::string_view vpc);

/// Lock key for the unordered pair {a, b}: "peering.<min>.<max>".
std::string peering_lock_key(std::string_view vpc_a, std::string_view vpc_b);

/**
 * @brief Topology persistence interface.
 */
class TopologyStore {
public:
  virtual ~TopologyStore() = default;

  // ----- VPC records -----
  /// NotFound if absent.
  virtual Result<Vpc> get_vpc(std::string_view name) const = 0;
  /// CAS on vpc.revision; bumps vpc.revision on success.
  virtual Result<void> save_vpc(Vpc& vpc) = 0;
  /// NotFound if absent.
  virtual Result<void> remove_vpc(std::string_view name) = 0;
  /// All VPC records; order immaterial.
  virtual Result<std::vector<Vpc>> list_vpcs() const = 0;

  // ----- Peering records (keyed by Peering::key()) -----
  virtual Result<Peering> get_peering(std::string_view key) const = 0;
  virtual Result<void> save_peering(Peering& peering) = 0;
  virtual Result<void> remove_peering(std::string_view key) = 0;
  virtual Result<std::vector<Peering>> list_peerings() const = 0;

  // ----- mutual exclusion -----
  /// Block until the exclusive lock for @p key is held.
  virtual Result<KeyLock> lock(std::string_view key) = 0;
};

} // namespace vpcctl::topology
