#pragma once
/**
 * @file transaction.hpp
 * @brief Ordered primitive steps with reverse-order compensation.
 *
 * A Transaction runs steps one at a time. Each completed step may register
 * an undo action. If a step fails, or the transaction is destroyed without
 * commit(), the registered undos run newest-first under the soft-failure
 * policy: an undo that fails (or throws) is logged and skipped, the rest
 * still run.
 */

#include <functional>
#include <string>
#include <vector>

#include "vpcctl/error.hpp"
#include "vpcctl/obs/observability.hpp"

namespace vpcctl::lifecycle {

class Transaction final {
public:
    using Action = std::function<Result<void>()>;

    Transaction(std::string operation, std::string target, obs::Observer& observer)
        : operation_(std::move(operation)), target_(std::move(target)), observer_(observer) {}

    /// Rolls back unless committed; never throws.
    ~Transaction();

    Transaction(const Transaction&)            = delete;
    Transaction& operator=(const Transaction&) = delete;

    /**
     * @brief Run @p apply; on success remember @p undo (may be empty).
     * @return The step's error after rolling back all earlier steps.
     */
    Result<void> apply(const std::string& step, const Action& apply, Action undo = {});

    /// Keep every applied step; later destruction is a no-op.
    void commit() noexcept;

    /// Undo all completed steps now (idempotent).
    void rollback();

    /// Names of steps applied so far, oldest first.
    [[nodiscard]] std::vector<std::string> completed() const;

    [[nodiscard]] bool committed() const noexcept { return committed_; }

private:
    struct Step {
        std::string name;
        Action      undo;
    };

    std::string       operation_;
    std::string       target_;
    obs::Observer&    observer_;
    std::vector<Step> done_;
    bool              committed_{false};
};

} // namespace vpcctl::lifecycle
