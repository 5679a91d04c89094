/**
* @file observability.cpp
 * @brief spdlog-backed Observer and logger bootstrap.
 */
#include "vpcctl/obs/observability.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

#include "vpcctl/version.hpp"

namespace vpcctl::obs {

    std::shared_ptr<spdlog::logger> logger() {
        static std::shared_ptr<spdlog::logger> log = [] {
            if (auto existing = spdlog::get(program_name)) return existing;
            auto l = spdlog::stderr_color_mt(program_name);
            l->set_pattern("%Y-%m-%d %H:%M:%S - %n - %l - %v");
            l->set_level(spdlog::level::info);
            return l;
        }();
        return log;
    }

    Result<void> init_logging(std::string_view level) {
        const auto lvl = spdlog::level::from_str(std::string(level));
        // from_str maps unknown names to "off"; only accept an explicit "off".
        if (lvl == spdlog::level::off && level != "off") {
            return fail(ErrorCode::ValidationFailure, "unknown log level '" + std::string(level) + "'");
        }
        logger()->set_level(lvl);
        return {};
    }

    void LogObserver::record(const OperationEvent& e) {
        {
            std::lock_guard<std::mutex> lk(mu_);
            switch (e.outcome) {
                case Outcome::Succeeded:  ctr_.operations++; break;
                case Outcome::Failed:     ctr_.operations++; ctr_.failures++; break;
                case Outcome::SoftFailed: ctr_.soft_failures++; break;
                case Outcome::RolledBack: ctr_.rollbacks++; break;
            }
        }
        auto log = logger();
        switch (e.outcome) {
            case Outcome::Succeeded:
                log->info("{} {}: ok", e.operation, e.target);
                break;
            case Outcome::Failed:
                log->error("{} {}: {}", e.operation, e.target, e.reason);
                break;
            case Outcome::SoftFailed:
                log->warn("{} {}: ignored failure: {}", e.operation, e.target, e.reason);
                break;
            case Outcome::RolledBack:
                log->warn("{} {}: rolled back ({})", e.operation, e.target, e.reason);
                break;
        }
    }

    Counters LogObserver::snapshot() const {
        std::lock_guard<std::mutex> lk(mu_);
        return ctr_;
    }

    Observer* make_log_observer() {
        static LogObserver obs; // process-wide singleton
        return &obs;
    }

    Disposition best_effort(const Result<void>& r, Observer& o,
                            std::string_view operation, std::string_view step) {
        if (r) return Disposition::Applied;
        o.record(OperationEvent{
            .operation = std::string(operation),
            .target    = std::string(step),
            .outcome   = Outcome::SoftFailed,
            .reason    = r.error().message,
        });
        return Disposition::SoftFailed;
    }

} // namespace vpcctl::obs
