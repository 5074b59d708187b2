#include "mcp-hub/Redaction.hpp"

#include <gtest/gtest.h>

using namespace mcphub;

TEST(Redaction, SensitiveNames) {
  EXPECT_TRUE(is_sensitive_name("API_KEY"));
  EXPECT_TRUE(is_sensitive_name("GITHUB_TOKEN"));
  EXPECT_TRUE(is_sensitive_name("db_password"));
  EXPECT_TRUE(is_sensitive_name("--client-secret"));
  EXPECT_TRUE(is_sensitive_name("Authorization"));
  EXPECT_FALSE(is_sensitive_name("PATH"));
  EXPECT_FALSE(is_sensitive_name("--verbose"));
}

TEST(Redaction, MasksSensitiveEnvValues) {
  LaunchConfig config;
  config.command = "npx";
  config.env = {{"GITHUB_TOKEN", "ghp_abc"}, {"LOG_LEVEL", "debug"}};

  LaunchConfig masked = redact(config);
  EXPECT_EQ(masked.env["GITHUB_TOKEN"], kRedactedMarker);
  EXPECT_EQ(masked.env["LOG_LEVEL"], "debug");
  // Input untouched
  EXPECT_EQ(config.env["GITHUB_TOKEN"], "ghp_abc");
}

TEST(Redaction, MasksFlagValuePairs) {
  LaunchConfig config;
  config.command = "server";
  config.args = {"--api-key", "sk-123", "--port", "8080"};

  LaunchConfig masked = redact(config);
  ASSERT_EQ(masked.args.size(), 4u);
  EXPECT_EQ(masked.args[0], "--api-key");
  EXPECT_EQ(masked.args[1], kRedactedMarker);
  EXPECT_EQ(masked.args[2], "--port");
  EXPECT_EQ(masked.args[3], "8080");
}

TEST(Redaction, MasksInlineFlagValues) {
  LaunchConfig config;
  config.command = "server";
  config.args = {"--token=abc123", "--name=demo"};

  LaunchConfig masked = redact(config);
  EXPECT_EQ(masked.args[0], std::string("--token=") + kRedactedMarker);
  EXPECT_EQ(masked.args[1], "--name=demo");
}

TEST(Redaction, SensitiveFlagFollowedByFlagKeepsNeighbor) {
  LaunchConfig config;
  config.command = "server";
  config.args = {"--use-auth", "--verbose"};

  LaunchConfig masked = redact(config);
  EXPECT_EQ(masked.args[0], "--use-auth");
  EXPECT_EQ(masked.args[1], "--verbose");
}

TEST(Redaction, CommandLineNeverShowsSecrets) {
  LaunchConfig config;
  config.command = "npx";
  config.args = {"-y", "@acme/server", "--secret", "hunter2"};

  std::string line = redacted_command_line(config);
  EXPECT_EQ(line.find("hunter2"), std::string::npos);
  EXPECT_NE(line.find("@acme/server"), std::string::npos);
  EXPECT_NE(line.find(kRedactedMarker), std::string::npos);
}
