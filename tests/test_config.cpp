/**
 * @file test_config.cpp
 * @brief Tests for the JSON config loader and logging bootstrap.
 */

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <unistd.h>

#include <nlohmann/json.hpp>

#include "vpcctl/config/config_loader.hpp"
#include "vpcctl/obs/observability.hpp"

using vpcctl::ErrorCode;
using vpcctl::config::CtlConfig;
using vpcctl::config::Loader;

/**
 * @test Defaults_WhenFileMissing
 * @brief A missing config file yields the named defaults.
 */
TEST(Config, Defaults_WhenFileMissing) {
  auto cfg = Loader::load_from_file("/nonexistent/vpcctl/config.json");
  ASSERT_TRUE(cfg);
  EXPECT_EQ(*cfg, CtlConfig{});
  EXPECT_EQ(cfg->state_dir, "/tmp/vpc_config");
  EXPECT_EQ(cfg->peering_dir, "/tmp/vpc_peering");
  EXPECT_EQ(cfg->default_internet_interface, "eth0");
  EXPECT_EQ(cfg->iptables_binary, "iptables");
}

/**
 * @test Overrides_And_UnknownKeys
 * @brief Known keys override defaults; unknown keys are ignored.
 */
TEST(Config, Overrides_And_UnknownKeys) {
  nlohmann::json doc{
      {"state_dir", "/var/lib/vpcctl/vpcs"},
      {"default_internet_interface", "wan0"},
      {"log_level", "debug"},
      {"future_option", 7},
  };
  auto cfg = Loader::load_from_string(doc.dump());
  ASSERT_TRUE(cfg) << cfg.error().message;
  EXPECT_EQ(cfg->state_dir, "/var/lib/vpcctl/vpcs");
  EXPECT_EQ(cfg->default_internet_interface, "wan0");
  EXPECT_EQ(cfg->log_level, "debug");
  EXPECT_EQ(cfg->peering_dir, "/tmp/vpc_peering");
}

/**
 * @test Rejects_Malformed
 * @brief Bad JSON, non-object root, and non-string or empty values fail.
 */
TEST(Config, Rejects_Malformed) {
  for (const char* text : {"{", "[1,2]", R"({"state_dir": 5})", R"({"ip_binary": ""})"}) {
    auto cfg = Loader::load_from_string(text);
    ASSERT_FALSE(cfg) << text;
    EXPECT_EQ(cfg.error().code, ErrorCode::ValidationFailure) << text;
  }
}

/**
 * @test LoadFromFile_Reads
 * @brief A config file on disk is parsed.
 */
TEST(Config, LoadFromFile_Reads) {
  const auto path = std::filesystem::temp_directory_path() /
                    ("vpcctl-config-" + std::to_string(::getpid()) + ".json");
  std::ofstream(path) << R"({"lock_dir": "/run/vpcctl"})";
  auto cfg = Loader::load_from_file(path.string());
  std::filesystem::remove(path);
  ASSERT_TRUE(cfg);
  EXPECT_EQ(cfg->lock_dir, "/run/vpcctl");
}

/**
 * @test RelocateState_MovesEveryDirectory
 * @brief A state root moves VPC records, peering records and locks together;
 *        the other settings are untouched.
 */
TEST(Config, RelocateState_MovesEveryDirectory) {
  auto cfg = Loader::load_from_string(R"({"log_level": "warn", "peering_dir": "/srv/peer"})");
  ASSERT_TRUE(cfg);
  vpcctl::config::relocate_state(*cfg, "/var/lib/vpcctl");
  EXPECT_EQ(cfg->state_dir, "/var/lib/vpcctl");
  EXPECT_EQ(cfg->peering_dir, "/var/lib/vpcctl/peerings");
  EXPECT_EQ(cfg->lock_dir, "/var/lib/vpcctl/locks");
  EXPECT_EQ(cfg->log_level, "warn");

  CtlConfig other;
  vpcctl::config::relocate_state(other, "/tmp/other");
  EXPECT_NE(other.peering_dir, cfg->peering_dir);
  EXPECT_NE(other.lock_dir, cfg->lock_dir);
}

/**
 * @test Logging_Levels
 * @brief Known level names are accepted; unknown names are rejected.
 */
TEST(Logging, Logging_Levels) {
  EXPECT_TRUE(vpcctl::obs::init_logging("debug"));
  EXPECT_TRUE(vpcctl::obs::init_logging("off"));
  EXPECT_TRUE(vpcctl::obs::init_logging("info"));
  auto bad = vpcctl::obs::init_logging("chatty");
  ASSERT_FALSE(bad);
  EXPECT_EQ(bad.error().code, ErrorCode::ValidationFailure);
  EXPECT_EQ(vpcctl::obs::logger()->name(), "vpcctl");
}
