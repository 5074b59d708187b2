#include "mcp-hub/Config.hpp"
#include "mcp-hub/server/ProcessRegistry.hpp"
#include "TestFixtures.hpp"

#include <fstream>
#include <gtest/gtest.h>
#include <map>
#include <yaml-cpp/yaml.h>

using namespace mcphub;

namespace {

HubConfig::EnvLookup env_from(std::map<std::string, std::string> values) {
  return [values](const std::string &name) -> std::optional<std::string> {
    auto it = values.find(name);
    if (it == values.end()) {
      return std::nullopt;
    }
    return it->second;
  };
}

} // namespace

TEST(HubConfig, Defaults) {
  HubConfig config = HubConfig::load("", env_from({}));
  EXPECT_EQ(config.port, 4000);
  EXPECT_EQ(config.bind_address, "0.0.0.0");
  EXPECT_EQ(config.default_ttl, std::chrono::minutes(15));
  EXPECT_EQ(config.sweep_interval, std::chrono::minutes(1));
  EXPECT_EQ(config.heartbeat_interval, std::chrono::minutes(5));
  EXPECT_EQ(config.response_timeout, std::chrono::milliseconds(3000));
  EXPECT_EQ(config.run_timeout, std::chrono::milliseconds(5000));
  EXPECT_EQ(config.max_request_size, 10u * 1024 * 1024);
  EXPECT_EQ(config.rate_limit.max_requests, 100);
  EXPECT_EQ(config.strict_rate_limit.max_requests, 20);
  EXPECT_TRUE(config.cors_enabled);
  ASSERT_EQ(config.allowed_origins.size(), 1u);
  EXPECT_EQ(config.allowed_origins[0], "*");
}

TEST(HubConfig, YamlOverridesDefaults) {
  YAML::Node root = YAML::Load(R"(
server:
  port: 5050
  bind_address: 127.0.0.1
processes:
  default_ttl_minutes: 30
  handshake_timeout_ms: 1500
api:
  max_request_size: 512kb
cors:
  enabled: false
  allowed_origins: [https://a.example, https://b.example]
)");
  HubConfig config;
  config.apply_yaml(root);
  EXPECT_EQ(config.port, 5050);
  EXPECT_EQ(config.bind_address, "127.0.0.1");
  EXPECT_EQ(config.default_ttl, std::chrono::minutes(30));
  EXPECT_EQ(config.handshake_timeout, std::chrono::milliseconds(1500));
  EXPECT_EQ(config.max_request_size, 512u * 1024);
  EXPECT_FALSE(config.cors_enabled);
  ASSERT_EQ(config.allowed_origins.size(), 2u);
  EXPECT_EQ(config.allowed_origins[1], "https://b.example");
}

TEST(HubConfig, EnvironmentOverridesYamlFile) {
  test::TempFile file("mcp_hub_config");
  {
    std::ofstream out(file.path());
    out << "server:\n  port: 5050\nauth:\n  token: from-yaml\n";
  }
  HubConfig config = HubConfig::load(
      file.path(), env_from({{"PORT", "6060"},
                             {"ALLOWED_ORIGINS", "https://x.io, https://y.io"},
                             {"STRICT_RATE_LIMIT_MAX", "5"}}));
  EXPECT_EQ(config.port, 6060);
  EXPECT_EQ(config.auth_token, "from-yaml");
  EXPECT_EQ(config.strict_rate_limit.max_requests, 5);
  ASSERT_EQ(config.allowed_origins.size(), 2u);
  EXPECT_EQ(config.allowed_origins[0], "https://x.io");
  EXPECT_EQ(config.allowed_origins[1], "https://y.io");
}

TEST(HubConfig, InvalidNumberThrows) {
  EXPECT_THROW(HubConfig::load("", env_from({{"PORT", "forty"}})),
               ConfigError);
  EXPECT_THROW(HubConfig::load("", env_from({{"DEFAULT_TTL_MINUTES", "-3"}})),
               ConfigError);
}

TEST(HubConfig, OutOfRangePortThrows) {
  EXPECT_THROW(HubConfig::load("", env_from({{"PORT", "70000"}})),
               ConfigError);
}

TEST(HubConfig, OversizedIntegersDoNotWrap) {
  // 2^32 + 4000 would truncate to a valid-looking 4000
  EXPECT_THROW(HubConfig::load("", env_from({{"PORT", "4294971296"}})),
               ConfigError);
  EXPECT_THROW(
      HubConfig::load("", env_from({{"RATE_LIMIT_MAX", "4294967396"}})),
      ConfigError);
  EXPECT_THROW(
      HubConfig::load("", env_from({{"STRICT_RATE_LIMIT_MAX", "4294967316"}})),
      ConfigError);

  test::TempFile file("mcp_hub_wide_port");
  {
    std::ofstream out(file.path());
    out << "server:\n  port: 4294971296\n";
  }
  EXPECT_THROW(HubConfig::load(file.path(), env_from({})), ConfigError);
}

TEST(HubConfig, MissingFileThrows) {
  EXPECT_THROW(HubConfig::load("/nonexistent/mcp-hub.yaml", env_from({})),
               ConfigError);
}

TEST(HubConfig, MalformedYamlThrows) {
  test::TempFile file("mcp_hub_bad_config");
  {
    std::ofstream out(file.path());
    out << "server: [unterminated\n";
  }
  EXPECT_THROW(HubConfig::load(file.path(), env_from({})), ConfigError);
}

TEST(HubConfig, RegistryOptionsCarryTimeouts) {
  HubConfig config;
  config.default_ttl = std::chrono::minutes(2);
  config.handshake_timeout = std::chrono::milliseconds(1234);
  config.termination_grace = std::chrono::milliseconds(900);
  auto options = config.registry_options();
  EXPECT_EQ(options.default_ttl, std::chrono::minutes(2));
  EXPECT_EQ(options.handshake_timeout, std::chrono::milliseconds(1234));
  EXPECT_EQ(options.termination_grace, std::chrono::milliseconds(900));
}

TEST(ParseSize, Suffixes) {
  EXPECT_EQ(parse_size("10mb"), 10u * 1024 * 1024);
  EXPECT_EQ(parse_size("1GB"), 1024u * 1024 * 1024);
  EXPECT_EQ(parse_size("64kb"), 64u * 1024);
  EXPECT_EQ(parse_size("2048"), 2048u);
  EXPECT_EQ(parse_size("100b"), 100u);
  EXPECT_THROW(parse_size("lots"), ConfigError);
  EXPECT_THROW(parse_size("mb"), ConfigError);
}
