/**
 * @file memory_store.cpp
 * @brief Copy-on-write topology snapshots.
 *
 * Readers atomic_load the current State and never block. A save copies the
 * State, checks the record revision, mutates the copy and atomic_stores it.
 * Snapshots handed to readers stay valid until their last reference drops.
 */
#include "vpcctl/topology/memory_store.hpp"

#include <memory>   // atomic_load/atomic_store for shared_ptr

namespace vpcctl::topology {

namespace {

/// Lease holding a per-key mutex; the shared_ptr keeps the mutex alive.
class MutexLease final : public KeyLock::Lease {
public:
    explicit MutexLease(std::shared_ptr<std::mutex> mu)
        : mu_(std::move(mu)), lk_(*mu_) {}
private:
    std::shared_ptr<std::mutex>  mu_;
    std::unique_lock<std::mutex> lk_;
};

} // namespace

//------------------------------- Reads ----------------------------------------

std::shared_ptr<const MemoryTopologyStore::State>
MemoryTopologyStore::snapshot() const noexcept {
    // RCU read: acquire pairs with the writer's release in publish().
    return std::atomic_load_explicit(&state_, std::memory_order_acquire);
}

Result<Vpc> MemoryTopologyStore::get_vpc(std::string_view name) const {
    auto snap = snapshot();
    auto it = snap->vpcs.find(name);
    if (it == snap->vpcs.end()) {
        return fail(ErrorCode::NotFound, "VPC '" + std::string(name) + "' does not exist");
    }
    return it->second; // copy
}

Result<std::vector<Vpc>> MemoryTopologyStore::list_vpcs() const {
    auto snap = snapshot();
    std::vector<Vpc> out;
    out.reserve(snap->vpcs.size());
    for (const auto& kv : snap->vpcs) out.push_back(kv.second);
    return out;
}

Result<Peering> MemoryTopologyStore::get_peering(std::string_view key) const {
    auto snap = snapshot();
    auto it = snap->peerings.find(key);
    if (it == snap->peerings.end()) {
        return fail(ErrorCode::NotFound, "peering '" + std::string(key) + "' does not exist");
    }
    return it->second;
}

Result<std::vector<Peering>> MemoryTopologyStore::list_peerings() const {
    auto snap = snapshot();
    std::vector<Peering> out;
    out.reserve(snap->peerings.size());
    for (const auto& kv : snap->peerings) out.push_back(kv.second);
    return out;
}

//------------------------------- Mutation Core --------------------------------

void MemoryTopologyStore::publish(std::shared_ptr<State> next) noexcept {
    // RCU update: RELEASE pairs with reader ACQUIRE so that all prior writes
    // to *next are visible to readers that load it.
    std::shared_ptr<const State> cnext = std::move(next);
    std::atomic_store_explicit(&state_, std::move(cnext), std::memory_order_release);
    version_.fetch_add(1, std::memory_order_relaxed);
}

template <class Map, class Rec>
Result<void> MemoryTopologyStore::cas_save(Map State::*map, const std::string& key, Rec& rec, const char* what) {
    std::lock_guard<std::mutex> lk(write_mu_);
    auto snap = snapshot();
    const auto& current = (*snap).*map;

    auto it = current.find(key);
    const std::uint64_t stored = (it == current.end()) ? 0 : it->second.revision;
    if (stored != rec.revision) {
        conflicts_.fetch_add(1, std::memory_order_relaxed);
        return fail(ErrorCode::Conflict,
                    std::string(what) + " '" + key + "' changed concurrently (stored revision " +
                    std::to_string(stored) + ", expected " + std::to_string(rec.revision) + ")");
    }

    auto next = std::make_shared<State>(*snap); // copy-on-write
    Rec stored_rec = rec;
    stored_rec.revision = rec.revision + 1;
    ((*next).*map).insert_or_assign(key, stored_rec);
    publish(std::move(next));

    rec.revision = stored_rec.revision;
    saves_.fetch_add(1, std::memory_order_relaxed);
    return {};
}

template <class Map>
Result<void> MemoryTopologyStore::erase(Map State::*map, std::string_view key, const char* what) {
    std::lock_guard<std::mutex> lk(write_mu_);
    auto snap = snapshot();
    if (((*snap).*map).find(key) == ((*snap).*map).end()) {
        return fail(ErrorCode::NotFound, std::string(what) + " '" + std::string(key) + "' does not exist");
    }
    auto next = std::make_shared<State>(*snap);
    auto& m = (*next).*map;
    m.erase(m.find(key));
    publish(std::move(next));
    removes_.fetch_add(1, std::memory_order_relaxed);
    return {};
}

Result<void> MemoryTopologyStore::save_vpc(Vpc& vpc) {
    return cas_save(&State::vpcs, vpc.name, vpc, "VPC");
}

Result<void> MemoryTopologyStore::remove_vpc(std::string_view name) {
    return erase(&State::vpcs, name, "VPC");
}

Result<void> MemoryTopologyStore::save_peering(Peering& peering) {
    return cas_save(&State::peerings, peering.key(), peering, "peering");
}

Result<void> MemoryTopologyStore::remove_peering(std::string_view key) {
    return erase(&State::peerings, key, "peering");
}

//------------------------------- Locks & stats --------------------------------

Result<KeyLock> MemoryTopologyStore::lock(std::string_view key) {
    std::shared_ptr<std::mutex> mu;
    {
        std::lock_guard<std::mutex> lk(locks_mu_);
        auto& slot = key_locks_[std::string(key)];
        if (!slot) slot = std::make_shared<std::mutex>();
        mu = slot;
    }
    return KeyLock(std::make_unique<MutexLease>(std::move(mu)));
}

MemoryTopologyStore::Stats MemoryTopologyStore::stats() const noexcept {
    return Stats{
        .saves     = saves_.load(std::memory_order_relaxed),
        .removes   = removes_.load(std::memory_order_relaxed),
        .conflicts = conflicts_.load(std::memory_order_relaxed),
    };
}

} // namespace vpcctl::topology
