#include "mcp-hub/ipc/ProcessManager.hpp"

#include <gtest/gtest.h>

using namespace mcphub;
using ipc::ProcessManager;

TEST(ProcessEnvironment, OnlyAllowListedHostVariablesSurvive) {
  ProcessManager::Environment host = {{"PATH", "/usr/bin:/bin"},
                                      {"HOME", "/home/op"},
                                      {"AWS_SECRET_ACCESS_KEY", "s3cr3t"},
                                      {"DATABASE_URL", "postgres://x"},
                                      {"HTTPS_PROXY", "http://proxy:3128"}};

  auto env = ProcessManager::build_child_environment(host, {});
  EXPECT_EQ(env["PATH"], "/usr/bin:/bin");
  EXPECT_EQ(env["HOME"], "/home/op");
  EXPECT_EQ(env["HTTPS_PROXY"], "http://proxy:3128");
  EXPECT_EQ(env.count("AWS_SECRET_ACCESS_KEY"), 0u);
  EXPECT_EQ(env.count("DATABASE_URL"), 0u);
}

TEST(ProcessEnvironment, OverridesWin) {
  ProcessManager::Environment host = {{"PATH", "/usr/bin"}};
  auto env = ProcessManager::build_child_environment(
      host, {{"PATH", "/opt/tools/bin"}, {"GITHUB_TOKEN", "ghp_x"}});
  EXPECT_EQ(env["PATH"], "/opt/tools/bin");
  EXPECT_EQ(env["GITHUB_TOKEN"], "ghp_x");
}

TEST(ProcessEnvironment, PackageRunnersRewrittenOnWindowsOnly) {
  LaunchConfig config;
  config.command = "npx";
  config.args = {"-y", "@modelcontextprotocol/server-github"};

  LaunchConfig unix_config = ProcessManager::rewrite_for_platform(config, false);
  EXPECT_EQ(unix_config.command, "npx");
  EXPECT_EQ(unix_config.args, config.args);

  LaunchConfig win = ProcessManager::rewrite_for_platform(config, true);
  EXPECT_EQ(win.command, "cmd");
  ASSERT_EQ(win.args.size(), 4u);
  EXPECT_EQ(win.args[0], "/c");
  EXPECT_EQ(win.args[1], "npx");
  EXPECT_EQ(win.args[2], "-y");
  EXPECT_EQ(win.args[3], "@modelcontextprotocol/server-github");
}

TEST(ProcessEnvironment, OtherCommandsNotRewritten) {
  LaunchConfig config;
  config.command = "python";
  config.args = {"server.py"};
  LaunchConfig win = ProcessManager::rewrite_for_platform(config, true);
  EXPECT_EQ(win.command, "python");
  EXPECT_EQ(win.args, config.args);
}

TEST(ProcessEnvironment, FindExecutableSearchesPath) {
  auto sh = ProcessManager::find_executable("sh", "/nonexistent:/bin:/usr/bin");
  ASSERT_TRUE(sh.has_value());
  EXPECT_NE(sh->find("/sh"), std::string::npos);

  EXPECT_FALSE(ProcessManager::find_executable("definitely-not-a-command-xyz",
                                               "/bin:/usr/bin")
                   .has_value());
}

TEST(LaunchConfig, FingerprintIgnoresEnvOrder) {
  LaunchConfig a;
  a.command = "node";
  a.args = {"index.js"};
  a.env = {{"A", "1"}, {"B", "2"}};
  LaunchConfig b = a;
  b.env = {{"B", "2"}, {"A", "1"}};
  EXPECT_EQ(a.fingerprint(), b.fingerprint());

  b.args.push_back("--verbose");
  EXPECT_NE(a.fingerprint(), b.fingerprint());
}

TEST(LaunchConfig, FromJsonValidates) {
  using json = nlohmann::json;
  EXPECT_THROW(LaunchConfig::from_json(json()), std::invalid_argument);
  EXPECT_THROW(LaunchConfig::from_json(json{{"command", "x"}}),
               std::invalid_argument);
  EXPECT_THROW(LaunchConfig::from_json(json{{"command", ""}, {"args", json::array()}}),
               std::invalid_argument);
  EXPECT_THROW(LaunchConfig::from_json(json{{"command", "x"}, {"args", {1, 2}}}),
               std::invalid_argument);

  LaunchConfig config = LaunchConfig::from_json(
      json{{"command", "node"},
           {"args", {"index.js"}},
           {"env", {{"TOKEN", "t"}}}});
  EXPECT_EQ(config.command, "node");
  ASSERT_EQ(config.args.size(), 1u);
  EXPECT_EQ(config.env["TOKEN"], "t");
}
