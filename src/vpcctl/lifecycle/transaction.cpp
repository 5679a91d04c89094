/**
 * @file transaction.cpp
 * @brief Step runner with newest-first compensation.
 */
#include "vpcctl/lifecycle/transaction.hpp"

#include <exception>

namespace vpcctl::lifecycle {

Transaction::~Transaction() {
    if (committed_) return;
    try {
        rollback();
    } catch (const std::exception& e) {
        obs::logger()->error("{} {}: rollback aborted: {}", operation_, target_, e.what());
    }
}

Result<void> Transaction::apply(const std::string& step, const Action& apply, Action undo) {
    obs::logger()->debug("{} {}: {}", operation_, target_, step);
    auto r = apply();
    if (!r) {
        obs::logger()->error("{} {}: step '{}' failed: {}", operation_, target_, step, r.error().message);
        rollback();
        return r;
    }
    done_.push_back(Step{step, std::move(undo)});
    return {};
}

void Transaction::commit() noexcept {
    committed_ = true;
    done_.clear();
}

void Transaction::rollback() {
    if (committed_ || done_.empty()) return;

    std::size_t undone = 0;
    std::size_t failed = 0;
    while (!done_.empty()) {
        Step s = std::move(done_.back());
        done_.pop_back();
        if (!s.undo) continue;
        Result<void> r;
        try {
            r = s.undo();
        } catch (const std::exception& ex) {
            r = fail(ErrorCode::PrimitiveExecutionFailure, "undo " + s.name + " threw: " + ex.what());
        }
        if (obs::best_effort(r, observer_, operation_, "undo " + s.name) == Disposition::SoftFailed) {
            ++failed;
        }
        ++undone;
    }

    obs::OperationEvent e;
    e.operation = operation_;
    e.target    = target_;
    e.outcome   = obs::Outcome::RolledBack;
    e.reason    = std::to_string(undone) + " step(s) undone";
    if (failed > 0) e.reason += ", " + std::to_string(failed) + " failed";
    observer_.record(e);
}

std::vector<std::string> Transaction::completed() const {
    std::vector<std::string> names;
    names.reserve(done_.size());
    for (const auto& s : done_) names.push_back(s.name);
    return names;
}

} // namespace vpcctl::lifecycle
