/**
 * @file test_shell_primitives.cpp
 * @brief Tests for the ip/iptables/sysctl command sequences.
 *
 * Validates:
 *  - argv issued for bridges, links, addressing, NAT, isolation, firewall
 *  - Namespace-scoped commands go through "ip netns exec"
 *  - Non-zero exit is a PrimitiveExecutionFailure for checked calls and
 *    ignored for tolerant ones
 *  - Existing link pairs are reused; duplicate bridge addresses tolerated
 */

#include <gtest/gtest.h>

#include <map>
#include <string>
#include <utility>
#include <vector>

#include "vpcctl/net/command_runner.hpp"
#include "vpcctl/net/shell_primitives.hpp"

using vpcctl::ErrorCode;
using vpcctl::Result;
using vpcctl::net::CommandResult;
using vpcctl::net::CommandRunner;
using vpcctl::net::FirewallDirective;
using vpcctl::net::ShellPrimitives;
using vpcctl::net::join_argv;

namespace {

/// Records every command line; answers from a table of exact command lines.
class RecordingRunner final : public CommandRunner {
public:
  Result<CommandResult> run(const std::vector<std::string>& argv) override {
    const auto line = join_argv(argv);
    lines.push_back(line);
    if (auto it = replies.find(line); it != replies.end()) return it->second;
    return CommandResult{.exit_code = 0, .out = "", .err = ""};
  }

  std::vector<std::string>             lines;
  std::map<std::string, CommandResult> replies;
};

CommandResult exit_with(int code, std::string err = {}) {
  return CommandResult{.exit_code = code, .out = "", .err = std::move(err)};
}

class ShellPrimitivesTest : public ::testing::Test {
protected:
  RecordingRunner runner;
  ShellPrimitives prims{runner};
};

} // namespace

/**
 * @test Bridge_CreateDelete
 * @brief Create adds and raises the bridge; delete is tolerant of absence.
 */
TEST_F(ShellPrimitivesTest, Bridge_CreateDelete) {
  ASSERT_TRUE(prims.create_bridge("br-a"));
  runner.replies["ip link set br-a down"] = exit_with(1, "Cannot find device");
  runner.replies["ip link delete br-a"]   = exit_with(1, "Cannot find device");
  ASSERT_TRUE(prims.delete_bridge("br-a"));
  EXPECT_EQ(runner.lines, (std::vector<std::string>{
      "ip link add br-a type bridge",
      "ip link set br-a up",
      "ip link set br-a down",
      "ip link delete br-a"}));
}

/**
 * @test Checked_Failure_CarriesStderr
 * @brief A checked call with a non-zero exit reports the command and stderr.
 */
TEST_F(ShellPrimitivesTest, Checked_Failure_CarriesStderr) {
  runner.replies["ip netns add ns-a-web"] = exit_with(1, "File exists\n");
  auto r = prims.create_namespace("ns-a-web");
  ASSERT_FALSE(r);
  EXPECT_EQ(r.error().code, ErrorCode::PrimitiveExecutionFailure);
  EXPECT_NE(r.error().message.find("ip netns add ns-a-web"), std::string::npos);
  EXPECT_NE(r.error().message.find("File exists"), std::string::npos);
}

/**
 * @test LinkPair_CreateOrReuse
 * @brief Absent pair is created; an existing end means the pair is reused.
 */
TEST_F(ShellPrimitivesTest, LinkPair_CreateOrReuse) {
  runner.replies["ip link show v1n"] = exit_with(1);
  runner.replies["ip link show v1b"] = exit_with(1);
  ASSERT_TRUE(prims.create_link_pair("v1n", "v1b"));
  EXPECT_EQ(runner.lines, (std::vector<std::string>{
      "ip link show v1n", "ip link show v1b",
      "ip link add v1n type veth peer name v1b",
      "ip link set v1n up", "ip link set v1b up"}));

  runner.lines.clear();
  runner.replies.erase("ip link show v1b"); // bridge end still present
  ASSERT_TRUE(prims.create_link_pair("v1n", "v1b"));
  for (const auto& l : runner.lines) {
    EXPECT_EQ(l.find("type veth"), std::string::npos) << l;
  }
}

/**
 * @test Addressing_InNamespace
 * @brief Namespace-side commands are wrapped in "ip netns exec".
 */
TEST_F(ShellPrimitivesTest, Addressing_InNamespace) {
  ASSERT_TRUE(prims.assign_address("ns-a-web", "v1n", "10.0.1.2/24"));
  ASSERT_TRUE(prims.add_default_route("ns-a-web", "10.0.1.1"));
  ASSERT_TRUE(prims.add_route("", "10.1.1.0/24", "10.1.1.1"));
  EXPECT_EQ(runner.lines, (std::vector<std::string>{
      "ip netns exec ns-a-web ip addr add 10.0.1.2/24 dev v1n",
      "ip netns exec ns-a-web ip link set v1n up",
      "ip netns exec ns-a-web ip route replace default via 10.0.1.1",
      "ip route add 10.1.1.0/24 via 10.1.1.1"}));
}

/**
 * @test BridgeAddress_DuplicateTolerated
 * @brief "File exists" on the bridge is success; other errors are not.
 */
TEST_F(ShellPrimitivesTest, BridgeAddress_DuplicateTolerated) {
  runner.replies["ip addr add 10.0.1.1/24 dev br-a"] = exit_with(2, "RTNETLINK answers: File exists");
  EXPECT_TRUE(prims.assign_bridge_address("br-a", "10.0.1.1/24"));

  runner.replies["ip addr add 10.0.2.1/24 dev br-a"] = exit_with(1, "Cannot find device \"br-a\"");
  auto r = prims.assign_bridge_address("br-a", "10.0.2.1/24");
  ASSERT_FALSE(r);
  EXPECT_EQ(r.error().code, ErrorCode::PrimitiveExecutionFailure);
}

/**
 * @test Nat_SetupAndCleanup_Symmetric
 * @brief Each block gets MASQUERADE plus two FORWARD rules; cleanup deletes the same rules.
 */
TEST_F(ShellPrimitivesTest, Nat_SetupAndCleanup_Symmetric) {
  ASSERT_TRUE(prims.enable_forwarding());
  ASSERT_TRUE(prims.setup_nat("br-a", "eth0", {"10.0.1.0/24"}));
  const std::vector<std::string> setup{
      "sysctl -w net.ipv4.ip_forward=1",
      "iptables -t nat -A POSTROUTING -s 10.0.1.0/24 -o eth0 -j MASQUERADE",
      "iptables -A FORWARD -i br-a -o eth0 -s 10.0.1.0/24 -j ACCEPT",
      "iptables -A FORWARD -i eth0 -o br-a -d 10.0.1.0/24 -m state --state RELATED,ESTABLISHED -j ACCEPT"};
  EXPECT_EQ(runner.lines, setup);

  runner.lines.clear();
  runner.replies["iptables -t nat -D POSTROUTING -s 10.0.1.0/24 -o eth0 -j MASQUERADE"] = exit_with(1);
  ASSERT_TRUE(prims.cleanup_nat("br-a", "eth0", {"10.0.1.0/24"}));
  ASSERT_EQ(runner.lines.size(), 3u);
  EXPECT_EQ(runner.lines[0], "iptables -t nat -D POSTROUTING -s 10.0.1.0/24 -o eth0 -j MASQUERADE");
  EXPECT_EQ(runner.lines[1], "iptables -D FORWARD -i br-a -o eth0 -s 10.0.1.0/24 -j ACCEPT");
}

/**
 * @test Isolation_Bidirectional
 * @brief Drop rules are inserted both ways and deleted both ways.
 */
TEST_F(ShellPrimitivesTest, Isolation_Bidirectional) {
  ASSERT_TRUE(prims.isolate_bridges("br-a", "br-b"));
  ASSERT_TRUE(prims.remove_isolation("br-a", "br-b"));
  EXPECT_EQ(runner.lines, (std::vector<std::string>{
      "iptables -I FORWARD -i br-a -o br-b -j DROP",
      "iptables -I FORWARD -i br-b -o br-a -j DROP",
      "iptables -D FORWARD -i br-a -o br-b -j DROP",
      "iptables -D FORWARD -i br-b -o br-a -j DROP"}));
}

/**
 * @test Firewall_Directive
 * @brief INPUT rule appended inside the namespace; port optional.
 */
TEST_F(ShellPrimitivesTest, Firewall_Directive) {
  ASSERT_TRUE(prims.apply_firewall_directive("ns-a-web", FirewallDirective{"tcp", 22, "ACCEPT"}));
  ASSERT_TRUE(prims.apply_firewall_directive("ns-a-web", FirewallDirective{"icmp", std::nullopt, "DROP"}));
  EXPECT_EQ(runner.lines, (std::vector<std::string>{
      "ip netns exec ns-a-web iptables -A INPUT -p tcp --dport 22 -j ACCEPT",
      "ip netns exec ns-a-web iptables -A INPUT -p icmp -j DROP"}));
}

/**
 * @test RunInNamespace_ReturnsStdout
 * @brief Output of the command is returned verbatim.
 */
TEST_F(ShellPrimitivesTest, RunInNamespace_ReturnsStdout) {
  runner.replies["ip netns exec ns-a-web sh -c ip addr"] = CommandResult{.exit_code = 0, .out = "inet 10.0.1.2\n", .err = ""};
  auto out = prims.run_in_namespace("ns-a-web", "ip addr");
  ASSERT_TRUE(out);
  EXPECT_EQ(*out, "inet 10.0.1.2\n");
}

/**
 * @test Binaries_Configurable
 * @brief Configured binary paths replace the defaults.
 */
TEST(ShellPrimitivesBinaries, Binaries_Configurable) {
  RecordingRunner runner;
  ShellPrimitives prims(runner, vpcctl::net::Binaries{"/sbin/ip", "/usr/sbin/iptables", "/sbin/sysctl"});
  ASSERT_TRUE(prims.create_namespace("ns-x"));
  ASSERT_TRUE(prims.isolate_bridges("br-a", "br-b"));
  ASSERT_TRUE(prims.enable_forwarding());
  EXPECT_EQ(runner.lines[0], "/sbin/ip netns add ns-x");
  EXPECT_EQ(runner.lines[1], "/usr/sbin/iptables -I FORWARD -i br-a -o br-b -j DROP");
  EXPECT_EQ(runner.lines.back(), "/sbin/sysctl -w net.ipv4.ip_forward=1");
}
