#pragma once
// vpcctl MemoryTopologyStore
// Concurrency Model: RCU (Read-Copy-Update) via atomic shared_ptr snapshot swap.
//   • Readers take a snapshot (shared_ptr copy) with ACQUIRE semantics.
//   • Writers serialise on a mutex, copy the whole state, apply the CAS
//     check and atomically publish with RELEASE semantics.
//   • Readers never block writers; writers never block readers.
// Used by tests and by embedders that do not need files.

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>

#include "vpcctl/topology/store.hpp"

namespace vpcctl::topology {

class MemoryTopologyStore final : public TopologyStore {
public:
    // Transparent hash/equal functors enable heterogeneous lookup with string_view.
    struct SKeyHash {
        using is_transparent = void;
        std::size_t operator()(std::string_view s) const noexcept {
            return std::hash<std::string_view>{}(s);
        }
    };
    struct SKeyEq {
        using is_transparent = void;
        bool operator()(std::string_view a, std::string_view b) const noexcept {
            return a == b;
        }
    };

    /// Immutable published state.
    struct State {
        std::unordered_map<std::string, Vpc, SKeyHash, SKeyEq>     vpcs;
        std::unordered_map<std::string, Peering, SKeyHash, SKeyEq> peerings;
    };

    /// Return a consistent snapshot of the whole topology.
    std::shared_ptr<const State> snapshot() const noexcept;

    Result<Vpc> get_vpc(std::string_view name) const override;
    Result<void> save_vpc(Vpc& vpc) override;
    Result<void> remove_vpc(std::string_view name) override;
    Result<std::vector<Vpc>> list_vpcs() const override;

    Result<Peering> get_peering(std::string_view key) const override;
    Result<void> save_peering(Peering& peering) override;
    Result<void> remove_peering(std::string_view key) override;
    Result<std::vector<Peering>> list_peerings() const override;

    Result<KeyLock> lock(std::string_view key) override;

    /// Monotonic version counter. Increments on every successful mutation.
    [[nodiscard]] uint64_t version() const noexcept { return version_.load(std::memory_order_relaxed); }

    /// Stats counters (cumulative since construction).
    struct Stats {
        uint64_t saves{0}, removes{0}, conflicts{0};
    };
    [[nodiscard]] Stats stats() const noexcept;

private:
    void publish(std::shared_ptr<State> next) noexcept;

    template <class Map, class Rec>
    Result<void> cas_save(Map State::*map, const std::string& key, Rec& rec, const char* what);

    template <class Map>
    Result<void> erase(Map State::*map, std::string_view key, const char* what);

    std::shared_ptr<const State> state_{std::make_shared<State>()};
    std::atomic<uint64_t> version_{0};
    std::mutex write_mu_; ///< Serialises writers (CAS check + publish)

    std::mutex locks_mu_; ///< Guards key_locks_
    std::unordered_map<std::string, std::shared_ptr<std::mutex>> key_locks_;

    std::atomic<uint64_t> saves_{0}, removes_{0}, conflicts_{0};
};

} // namespace vpcctl::topology
