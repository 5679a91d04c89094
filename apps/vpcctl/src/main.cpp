/**
 * @file main.cpp
 * @brief vpcctl command-line entry point.
 *
 * **Bootstrap**
 * - Parse global flags; load config (file, then flag overrides); set log level.
 * - Construct ProcessRunner -> ShellPrimitives, FileTopologyStore, managers.
 *
 * **Dispatch**
 * - One handler per command; each maps its Result to exit status 0 or 1 and
 *   prints the error message on failure.
 *
 * Usage:
 *   vpcctl [-v] [--config PATH] [--state-dir DIR] <command> [args...]
 */

#include <functional>
#include <iomanip>
#include <iostream>
#include <iterator>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "vpcctl/config/config_loader.hpp"
#include "vpcctl/lifecycle/firewall_applier.hpp"
#include "vpcctl/lifecycle/peering_manager.hpp"
#include "vpcctl/lifecycle/subnet_manager.hpp"
#include "vpcctl/lifecycle/teardown.hpp"
#include "vpcctl/lifecycle/vpc_manager.hpp"
#include "vpcctl/net/command_runner.hpp"
#include "vpcctl/net/shell_primitives.hpp"
#include "vpcctl/obs/observability.hpp"
#include "vpcctl/topology/file_store.hpp"
#include "vpcctl/version.hpp"

namespace {

using namespace vpcctl;

struct Options {
    bool                       verbose{false};
    bool                       help{false};
    bool                       version{false};
    std::optional<std::string> config_path;
    std::optional<std::string> state_dir;
    std::vector<std::string>   args; ///< Command name followed by its arguments
};

void print_usage(std::ostream& os) {
    os << "Usage: " << program_name << " [-v] [--config PATH] [--state-dir DIR] <command> [args]\n"
       << "\n"
       << "Commands:\n"
       << "  create-vpc <name> <cidr>                     Create a VPC\n"
       << "  delete-vpc <name>                            Delete a VPC\n"
       << "  list-vpcs                                    List all VPCs\n"
       << "  show-vpc <name>                              Show VPC details\n"
       << "  add-subnet <vpc> <name> <cidr> [--type T]    Add a subnet (T: public|private, default private)\n"
       << "  enable-nat <vpc> [--interface IF]            Enable the NAT gateway for public subnets\n"
       << "  create-peering <vpc1> <vpc2>                 Peer two VPCs\n"
       << "  delete-peering <vpc1> <vpc2>                 Delete a peering record\n"
       << "  list-peerings                                List all peerings\n"
       << "  apply-firewall <vpc> <rules.json>            Append firewall rules to a subnet\n"
       << "  exec <vpc> <subnet> <command...>             Run a command in a subnet namespace\n"
       << "  teardown-all                                 Delete every peering and VPC\n";
}

Result<Options> parse_options(int argc, char** argv) {
    Options o;
    int i = 1;
    for (; i < argc; ++i) {
        const std::string a = argv[i];
        if (a == "-v" || a == "--verbose") {
            o.verbose = true;
        } else if (a == "-h" || a == "--help") {
            o.help = true;
        } else if (a == "--version") {
            o.version = true;
        } else if (a == "--config" || a == "--state-dir") {
            if (i + 1 >= argc) return fail(ErrorCode::ValidationFailure, a + " needs a value");
            (a == "--config" ? o.config_path : o.state_dir) = argv[++i];
        } else if (!a.empty() && a[0] == '-') {
            return fail(ErrorCode::ValidationFailure, "unknown option " + a);
        } else {
            break;
        }
    }
    for (; i < argc; ++i) o.args.emplace_back(argv[i]);
    return o;
}

/// Remove "--flag VALUE" from @p args; returns VALUE if present.
Result<std::optional<std::string>> take_flag(std::vector<std::string>& args, const std::string& flag) {
    for (auto it = args.begin(); it != args.end(); ++it) {
        if (*it != flag) continue;
        if (std::next(it) == args.end()) {
            return fail(ErrorCode::ValidationFailure, flag + " needs a value");
        }
        std::string value = *std::next(it);
        args.erase(it, it + 2);
        return std::optional<std::string>(std::move(value));
    }
    return std::optional<std::string>{};
}

/// Everything a command handler needs, wired once per invocation.
struct App {
    config::CtlConfig           cfg;
    obs::Observer&              observer;
    net::ProcessRunner          runner;
    net::ShellPrimitives        prims;
    topology::FileTopologyStore store;
    lifecycle::VpcManager       vpcs;
    lifecycle::SubnetManager    subnets;
    lifecycle::PeeringManager   peerings;
    lifecycle::FirewallApplier  firewall;
    lifecycle::Teardown         teardown;

    App(config::CtlConfig c, obs::Observer& o)
        : cfg(std::move(c)),
          observer(o),
          prims(runner, net::Binaries{cfg.ip_binary, cfg.iptables_binary, cfg.sysctl_binary}),
          store(topology::StorePaths{cfg.state_dir, cfg.peering_dir, cfg.lock_dir}),
          vpcs(store, prims, observer),
          subnets(store, prims, observer),
          peerings(store, prims, observer),
          firewall(store, prims, observer),
          teardown(store, prims, observer, vpcs, peerings) {}
};

using Args    = std::vector<std::string>;
using Handler = std::function<int(App&, Args&)>;

int report_error(const Error& e) {
    std::cerr << "Error: " << e.message << " [" << to_string(e.code) << "]\n";
    return 1;
}

int usage_error(const std::string& command, const std::string& synopsis) {
    std::cerr << "Usage: " << program_name << " " << command << " " << synopsis << "\n";
    return 1;
}

int cmd_create_vpc(App& app, Args& a) {
    if (a.size() != 2) return usage_error("create-vpc", "<name> <cidr>");
    auto r = app.vpcs.create(a[0], a[1]);
    if (!r) return report_error(r.error());
    std::cout << "VPC '" << r->name << "' created with CIDR " << r->cidr << "\n";
    return 0;
}

int cmd_delete_vpc(App& app, Args& a) {
    if (a.size() != 1) return usage_error("delete-vpc", "<name>");
    if (auto r = app.vpcs.remove(a[0]); !r) return report_error(r.error());
    std::cout << "VPC '" << a[0] << "' deleted\n";
    return 0;
}

int cmd_list_vpcs(App& app, Args& a) {
    if (!a.empty()) return usage_error("list-vpcs", "");
    auto r = app.vpcs.list();
    if (!r) return report_error(r.error());
    if (r->empty()) {
        std::cout << "No VPCs found\n";
        return 0;
    }
    std::cout << std::left << "\n"
              << std::setw(20) << "VPC Name" << " " << std::setw(20) << "CIDR" << " "
              << std::setw(10) << "Subnets" << " " << "NAT" << "\n"
              << std::string(60, '-') << "\n";
    for (const auto& v : *r) {
        std::cout << std::setw(20) << v.name << " " << std::setw(20) << v.cidr << " "
                  << std::setw(10) << v.subnets.size() << " "
                  << (v.nat_enabled ? "Enabled" : "Disabled") << "\n";
    }
    return 0;
}

int cmd_show_vpc(App& app, Args& a) {
    if (a.size() != 1) return usage_error("show-vpc", "<name>");
    auto r = app.vpcs.details(a[0]);
    if (!r) return report_error(r.error());
    const auto& v = *r;
    std::cout << "\nVPC: " << v.name << "\n"
              << "CIDR: " << v.cidr << "\n"
              << "Bridge: " << v.bridge << "\n"
              << "Created: " << v.created_at << "\n"
              << "NAT: " << (v.nat_enabled ? "Enabled via " + v.internet_interface.value_or("?") : "Disabled") << "\n"
              << "\nSubnets (" << v.subnets.size() << "):\n";
    for (const auto& s : v.subnets) {
        std::cout << "  - " << s.name << " (" << s.cidr << ") - " << topology::to_string(s.kind)
                  << ", gateway " << s.gateway << ", host " << s.host << ", namespace " << s.namespace_id << "\n";
    }
    return 0;
}

int cmd_add_subnet(App& app, Args& a) {
    auto type = take_flag(a, "--type");
    if (!type) return report_error(type.error());
    if (a.size() != 3) return usage_error("add-subnet", "<vpc> <name> <cidr> [--type public|private]");
    auto kind = topology::parse_subnet_kind(type->value_or("private"));
    if (!kind) return report_error(kind.error());
    auto r = app.subnets.create(a[0], a[1], a[2], *kind);
    if (!r) return report_error(r.error());
    std::cout << "Subnet '" << r->name << "' (" << r->cidr << ", " << topology::to_string(r->kind)
              << ") added to VPC '" << a[0] << "'\n";
    return 0;
}

int cmd_enable_nat(App& app, Args& a) {
    auto iface = take_flag(a, "--interface");
    if (!iface) return report_error(iface.error());
    if (a.size() != 1) return usage_error("enable-nat", "<vpc> [--interface IF]");
    const std::string out_if = iface->value_or(app.cfg.default_internet_interface);
    auto r = app.vpcs.enable_nat(a[0], out_if);
    if (!r) return report_error(r.error());
    std::cout << "NAT gateway enabled for VPC '" << a[0] << "' via " << out_if << "\n";
    return 0;
}

int cmd_create_peering(App& app, Args& a) {
    if (a.size() != 2) return usage_error("create-peering", "<vpc1> <vpc2>");
    if (auto r = app.peerings.create(a[0], a[1]); !r) return report_error(r.error());
    std::cout << "Peering created between '" << a[0] << "' and '" << a[1] << "'\n";
    return 0;
}

int cmd_delete_peering(App& app, Args& a) {
    if (a.size() != 2) return usage_error("delete-peering", "<vpc1> <vpc2>");
    if (auto r = app.peerings.remove(a[0], a[1]); !r) return report_error(r.error());
    std::cout << "Peering deleted between '" << a[0] << "' and '" << a[1] << "'\n";
    return 0;
}

int cmd_list_peerings(App& app, Args& a) {
    if (!a.empty()) return usage_error("list-peerings", "");
    auto r = app.peerings.list();
    if (!r) return report_error(r.error());
    if (r->empty()) {
        std::cout << "No peerings found\n";
        return 0;
    }
    for (const auto& p : *r) {
        std::cout << p.vpc_a << " <-> " << p.vpc_b << " (" << p.veth_a << "/" << p.veth_b << ")\n";
    }
    return 0;
}

int cmd_apply_firewall(App& app, Args& a) {
    if (a.size() != 2) return usage_error("apply-firewall", "<vpc> <rules.json>");
    auto r = app.firewall.apply_from_rule_set(a[0], a[1]);
    if (!r) return report_error(r.error());
    std::cout << "Firewall rules applied to VPC '" << a[0] << "' (" << *r << " directive(s))\n";
    return 0;
}

int cmd_exec(App& app, Args& a) {
    if (a.size() < 3) return usage_error("exec", "<vpc> <subnet> <command...>");
    std::string command;
    for (std::size_t i = 2; i < a.size(); ++i) {
        if (!command.empty()) command += ' ';
        command += a[i];
    }
    auto r = app.subnets.exec(a[0], a[1], command);
    if (!r) return report_error(r.error());
    std::cout << *r;
    return 0;
}

int cmd_teardown_all(App& app, Args& a) {
    if (!a.empty()) return usage_error("teardown-all", "");
    auto r = app.teardown.run();
    if (!r) return report_error(r.error());
    std::cout << "Removed " << r->peerings << " peering(s) and " << r->vpcs << " VPC(s)\n";
    return 0;
}

const std::map<std::string, Handler>& commands() {
    static const std::map<std::string, Handler> table{
        {"create-vpc",     cmd_create_vpc},
        {"delete-vpc",     cmd_delete_vpc},
        {"list-vpcs",      cmd_list_vpcs},
        {"show-vpc",       cmd_show_vpc},
        {"add-subnet",     cmd_add_subnet},
        {"enable-nat",     cmd_enable_nat},
        {"create-peering", cmd_create_peering},
        {"delete-peering", cmd_delete_peering},
        {"list-peerings",  cmd_list_peerings},
        {"apply-firewall", cmd_apply_firewall},
        {"exec",           cmd_exec},
        {"teardown-all",   cmd_teardown_all},
    };
    return table;
}

} // namespace

int main(int argc, char** argv) {
    auto opts = parse_options(argc, argv);
    if (!opts) {
        std::cerr << "Error: " << opts.error().message << "\n";
        print_usage(std::cerr);
        return 1;
    }
    if (opts->version) {
        std::cout << program_name << " " << version_string << "\n";
        return 0;
    }
    if (opts->help || opts->args.empty()) {
        print_usage(opts->help ? std::cout : std::cerr);
        return opts->help ? 0 : 1;
    }

    const auto handler = commands().find(opts->args.front());
    if (handler == commands().end()) {
        std::cerr << "Error: unknown command '" << opts->args.front() << "'\n";
        print_usage(std::cerr);
        return 1;
    }

    auto cfg = config::Loader::load_from_file(opts->config_path.value_or(config::constants::DEFAULT_CONFIG_PATH));
    if (!cfg) return report_error(cfg.error());
    if (opts->state_dir) config::relocate_state(*cfg, *opts->state_dir);

    if (auto r = obs::init_logging(opts->verbose ? "debug" : cfg->log_level); !r) return report_error(r.error());

    App app(std::move(*cfg), *obs::make_log_observer());
    if (auto r = app.store.prepare(); !r) return report_error(r.error());

    Args args(opts->args.begin() + 1, opts->args.end());
    return handler->second(app, args);
}
