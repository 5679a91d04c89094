#pragma once
/**
 * @file observability.hpp
 * @brief Operation events, counters and the spdlog-backed logger.
 * @details Every lifecycle operation reports exactly one OperationEvent;
 *          soft failures are reported separately and never change the
 *          caller's result.
 */

#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>

#include <spdlog/spdlog.h>

#include "vpcctl/error.hpp"

namespace vpcctl::obs {

    /** @enum Outcome
     *  @brief How an operation (or a soft step) ended.
     */
    enum class Outcome : std::uint8_t {
        Succeeded,  ///< Operation completed and persisted
        Failed,     ///< Operation returned an error to its caller
        SoftFailed, ///< A best-effort step failed; the operation continued
        RolledBack  ///< Completed steps were unwound after a hard failure
    };

    /** @struct Counters
     *  @brief Process-level counters for lifecycle operations.
     */
    struct Counters {
        uint64_t operations{0};    ///< Succeeded + Failed events
        uint64_t failures{0};      ///< Failed events
        uint64_t soft_failures{0}; ///< SoftFailed events
        uint64_t rollbacks{0};     ///< RolledBack events
    };

    /** @struct OperationEvent
     *  @brief Payload describing one operation outcome.
     */
    struct OperationEvent {
        std::string operation; ///< e.g. "create-vpc"
        std::string target;    ///< e.g. VPC name or "a<->b"
        Outcome     outcome{Outcome::Succeeded};
        std::string reason;    ///< Error message or step description
    };

    /** @class Observer
     *  @brief Observability sink interface.
     */
    class Observer {
    public:
        virtual ~Observer() = default;
        /// Record a single event.
        virtual void record(const OperationEvent& e) = 0;
        /// Return a snapshot of counters.
        virtual Counters snapshot() const = 0;
    };

    /** @class LogObserver
     *  @brief Observer that counts events and writes them to the vpcctl logger.
     */
    class LogObserver final : public Observer {
    public:
        void record(const OperationEvent& e) override;
        Counters snapshot() const override;
    private:
        mutable std::mutex mu_;
        Counters ctr_;
    };

    /// Process-wide LogObserver used by the CLI.
    Observer* make_log_observer();

    /// The named "vpcctl" logger (stderr, created on first use).
    std::shared_ptr<spdlog::logger> logger();

    /**
     * @brief Set the logger level from a name ("debug", "info", "warn", ...).
     * @return ValidationFailure for an unknown level name.
     */
    Result<void> init_logging(std::string_view level);

    /**
     * @brief Apply the soft-failure policy to a finished call.
     * @details On error: logs a warning, records a SoftFailed event and
     *          returns Disposition::SoftFailed. Never propagates.
     */
    Disposition best_effort(const Result<void>& r, Observer& o,
                            std::string_view operation, std::string_view step);

    /**
     * @brief Record the final outcome of an operation and pass the result through.
     */
    template <class T>
    const Result<T>& report(Observer& o, std::string_view operation,
                            std::string_view target, const Result<T>& r) {
        OperationEvent e;
        e.operation = std::string(operation);
        e.target    = std::string(target);
        if (r) {
            e.outcome = Outcome::Succeeded;
        } else {
            e.outcome = Outcome::Failed;
            e.reason  = r.error().message;
        }
        o.record(e);
        return r;
    }

} // namespace vpcctl::obs
