#pragma once
/**
 * @file fake_primitives.hpp
 * @brief Test doubles: recording NetworkPrimitives with failure injection,
 *        and an Observer that keeps every event.
 *
 * Each call is recorded as "<operation> <arg> <arg>...". A call fails with
 * PrimitiveExecutionFailure when its record starts with any prefix passed to
 * fail_on(); failed calls are recorded too.
 */

#include <algorithm>
#include <cstddef>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

#include "vpcctl/net/primitives.hpp"
#include "vpcctl/obs/observability.hpp"

namespace vpcctl::test_support {

class FakePrimitives final : public net::NetworkPrimitives {
public:
    struct AppliedDirective {
        std::string            ns;
        net::FirewallDirective directive;
    };

    void fail_on(std::string prefix) { fail_prefixes_.push_back(std::move(prefix)); }
    void clear_failures() { fail_prefixes_.clear(); }
    void clear_calls() { calls_.clear(); }

    [[nodiscard]] const std::vector<std::string>& calls() const noexcept { return calls_; }
    [[nodiscard]] const std::vector<AppliedDirective>& directives() const noexcept { return directives_; }

    /// Number of recorded calls starting with @p prefix.
    [[nodiscard]] std::size_t count(const std::string& prefix) const {
        return static_cast<std::size_t>(std::count_if(calls_.begin(), calls_.end(),
            [&](const std::string& c) { return c.rfind(prefix, 0) == 0; }));
    }

    /// Index of the first call starting with @p prefix, or npos.
    [[nodiscard]] std::size_t index_of(const std::string& prefix) const {
        for (std::size_t i = 0; i < calls_.size(); ++i) {
            if (calls_[i].rfind(prefix, 0) == 0) return i;
        }
        return npos;
    }

    static constexpr std::size_t npos = static_cast<std::size_t>(-1);

    Result<void> create_bridge(const std::string& b) override { return call("create_bridge " + b); }
    Result<void> delete_bridge(const std::string& b) override { return call("delete_bridge " + b); }
    Result<void> create_namespace(const std::string& ns) override { return call("create_namespace " + ns); }
    Result<void> delete_namespace(const std::string& ns) override { return call("delete_namespace " + ns); }
    Result<void> create_link_pair(const std::string& a, const std::string& b) override {
        return call("create_link_pair " + a + " " + b);
    }
    Result<void> delete_link_pair(const std::string& end) override { return call("delete_link_pair " + end); }
    Result<void> attach_to_bridge(const std::string& b, const std::string& end) override {
        return call("attach_to_bridge " + b + " " + end);
    }
    Result<void> move_to_namespace(const std::string& end, const std::string& ns) override {
        return call("move_to_namespace " + end + " " + ns);
    }
    Result<void> assign_address(const std::string& ns, const std::string& end, const std::string& cidr) override {
        return call("assign_address " + ns + " " + end + " " + cidr);
    }
    Result<void> assign_bridge_address(const std::string& b, const std::string& cidr) override {
        return call("assign_bridge_address " + b + " " + cidr);
    }
    Result<void> remove_bridge_address(const std::string& b, const std::string& cidr) override {
        return call("remove_bridge_address " + b + " " + cidr);
    }
    Result<void> add_default_route(const std::string& ns, const std::string& gw) override {
        return call("add_default_route " + ns + " " + gw);
    }
    Result<void> add_route(const std::string& ns, const std::string& dest, const std::string& gw) override {
        return call("add_route " + (ns.empty() ? std::string("host") : ns) + " " + dest + " " + gw);
    }
    Result<void> enable_forwarding() override { return call("enable_forwarding"); }
    Result<void> setup_nat(const std::string& b, const std::string& iface,
                           const std::vector<std::string>& blocks) override {
        return call("setup_nat " + b + " " + iface + join(blocks));
    }
    Result<void> cleanup_nat(const std::string& b, const std::string& iface,
                             const std::vector<std::string>& blocks) override {
        return call("cleanup_nat " + b + " " + iface + join(blocks));
    }
    Result<void> isolate_bridges(const std::string& a, const std::string& b) override {
        return call("isolate_bridges " + a + " " + b);
    }
    Result<void> remove_isolation(const std::string& a, const std::string& b) override {
        return call("remove_isolation " + a + " " + b);
    }
    Result<void> apply_firewall_directive(const std::string& ns, const net::FirewallDirective& d) override {
        const std::string port = d.port ? std::to_string(*d.port) : std::string("*");
        auto r = call("apply_firewall_directive " + ns + " " + d.protocol + " " + port + " " + d.target);
        if (r) directives_.push_back(AppliedDirective{ns, d});
        return r;
    }
    Result<std::string> run_in_namespace(const std::string& ns, const std::string& command) override {
        auto r = call("run_in_namespace " + ns + " " + command);
        if (!r) return fail(r.error());
        return "ran: " + command + "\n";
    }

private:
    static std::string join(const std::vector<std::string>& v) {
        std::string s;
        for (const auto& x : v) s += " " + x;
        return s;
    }

    Result<void> call(std::string record) {
        const bool failing = std::any_of(fail_prefixes_.begin(), fail_prefixes_.end(),
            [&](const std::string& p) { return record.rfind(p, 0) == 0; });
        calls_.push_back(record);
        if (failing) {
            return fail(ErrorCode::PrimitiveExecutionFailure, "injected failure: " + record);
        }
        return {};
    }

    std::vector<std::string>      calls_;
    std::vector<std::string>      fail_prefixes_;
    std::vector<AppliedDirective> directives_;
};

/** @class RecordingObserver
 *  @brief Keeps every event and counts like LogObserver, without output.
 */
class RecordingObserver final : public obs::Observer {
public:
    void record(const obs::OperationEvent& e) override {
        std::lock_guard<std::mutex> lk(mu_);
        events_.push_back(e);
        switch (e.outcome) {
            case obs::Outcome::Succeeded:  ctr_.operations++; break;
            case obs::Outcome::Failed:     ctr_.operations++; ctr_.failures++; break;
            case obs::Outcome::SoftFailed: ctr_.soft_failures++; break;
            case obs::Outcome::RolledBack: ctr_.rollbacks++; break;
        }
    }
    obs::Counters snapshot() const override {
        std::lock_guard<std::mutex> lk(mu_);
        return ctr_;
    }
    std::vector<obs::OperationEvent> events() const {
        std::lock_guard<std::mutex> lk(mu_);
        return events_;
    }
private:
    mutable std::mutex               mu_;
    obs::Counters                    ctr_;
    std::vector<obs::OperationEvent> events_;
};

} // namespace vpcctl::test_support
