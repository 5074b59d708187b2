#include "mcp-hub/Redaction.hpp"
#include "mcp-hub/server/LifecycleEvents.hpp"
#include "mcp-hub/server/ProcessRegistry.hpp"
#include "TestFixtures.hpp"

#include <gtest/gtest.h>

#include <future>
#include <mutex>
#include <thread>

using namespace mcphub;
using namespace mcphub::test;
using namespace std::chrono_literals;
using server::LifecycleEvent;
using server::LifecycleEventType;

namespace {

// Thread-safe record of everything a registry published
class EventLog {
public:
  void record(const LifecycleEvent &event) {
    std::lock_guard lock(mutex_);
    events_.push_back(event);
  }

  size_t count(LifecycleEventType type) {
    std::lock_guard lock(mutex_);
    size_t n = 0;
    for (const auto &event : events_) {
      if (event.type == type) {
        ++n;
      }
    }
    return n;
  }

  std::optional<LifecycleEvent> last(LifecycleEventType type) {
    std::lock_guard lock(mutex_);
    for (auto it = events_.rbegin(); it != events_.rend(); ++it) {
      if (it->type == type) {
        return *it;
      }
    }
    return std::nullopt;
  }

private:
  std::mutex mutex_;
  std::vector<LifecycleEvent> events_;
};

} // namespace

class ProcessRegistryTest : public RegistryTest {
protected:
  void SetUp() override {
    RegistryTest::SetUp();
    subscribe();
  }

  void subscribe() {
    auto events = events_;
    registry_->subscribe(
        [events](const LifecycleEvent &event) { events->record(event); });
  }

  void recreate(server::RegistryOptions options) {
    registry_ = std::make_unique<server::ProcessRegistry>(options);
    subscribe();
  }

  std::shared_ptr<EventLog> events_ = std::make_shared<EventLog>();
};

TEST_F(ProcessRegistryTest, StartsAndInitializes) {
  auto result = registry_->ensure_process("client-a", "weather",
                                          fake_server_config());
  ASSERT_TRUE(result.process);
  EXPECT_FALSE(result.was_already_running);
  EXPECT_TRUE(result.initialized);
  EXPECT_EQ(result.key, "client-a:weather");

  EXPECT_TRUE(registry_->has_process("client-a", "weather"));
  EXPECT_TRUE(registry_->is_initialized("client-a", "weather"));
  EXPECT_EQ(registry_->size(), 1u);
  EXPECT_EQ(events_->count(LifecycleEventType::Initialized), 1u);
}

TEST_F(ProcessRegistryTest, ReusesLiveProcessWithSameConfig) {
  auto first = registry_->ensure_process("c", "s", fake_server_config());
  auto second = registry_->ensure_process("c", "s", fake_server_config());

  EXPECT_TRUE(second.was_already_running);
  EXPECT_TRUE(second.initialized);
  EXPECT_EQ(first.process->pid(), second.process->pid());
  EXPECT_EQ(registry_->size(), 1u);
}

TEST_F(ProcessRegistryTest, ConcurrentStartsShareOneProcess) {
  auto config = fake_server_config("normal", {"--init-delay-ms", "300"});
  auto start = [&] { return registry_->ensure_process("c", "slow", config); };

  auto a = std::async(std::launch::async, start);
  auto b = std::async(std::launch::async, start);
  auto ra = a.get();
  auto rb = b.get();

  EXPECT_EQ(ra.process->pid(), rb.process->pid());
  EXPECT_NE(ra.was_already_running, rb.was_already_running);
  EXPECT_TRUE(ra.initialized);
  EXPECT_TRUE(rb.initialized);
  EXPECT_EQ(registry_->size(), 1u);
}

TEST_F(ProcessRegistryTest, ConfigChangeReplacesProcess) {
  auto first = registry_->ensure_process("c", "s", fake_server_config());
  auto old_process = first.process;

  auto changed = fake_server_config("normal", {"--init-delay-ms", "1"});
  auto second = registry_->ensure_process("c", "s", changed);

  EXPECT_FALSE(second.was_already_running);
  EXPECT_NE(old_process->pid(), second.process->pid());
  EXPECT_FALSE(old_process->is_alive());
  EXPECT_TRUE(second.process->is_alive());
  EXPECT_EQ(registry_->size(), 1u);

  // The retired process's exit must not evict its replacement
  ASSERT_TRUE(wait_until(
      [&] { return events_->count(LifecycleEventType::Exited) >= 1; }, 2s));
  EXPECT_TRUE(registry_->has_process("c", "s"));
}

TEST_F(ProcessRegistryTest, ClientsAreIsolated) {
  auto a = registry_->ensure_process("alice", "s", fake_server_config());
  auto b = registry_->ensure_process("bob", "s", fake_server_config());
  EXPECT_NE(a.process->pid(), b.process->pid());
  EXPECT_EQ(registry_->list_for_client("alice").size(), 1u);
  EXPECT_EQ(registry_->list_for_client("bob").size(), 1u);
  EXPECT_EQ(registry_->list_all().size(), 2u);
  EXPECT_TRUE(registry_->list_for_client("carol").empty());
}

TEST_F(ProcessRegistryTest, IdleEntriesAreSwept) {
  auto result =
      registry_->ensure_process("c", "idle", fake_server_config(), 50ms);
  std::this_thread::sleep_for(120ms);

  EXPECT_EQ(registry_->sweep_expired(), 1u);
  EXPECT_FALSE(registry_->has_process("c", "idle"));
  EXPECT_EQ(registry_->size(), 0u);

  auto event = events_->last(LifecycleEventType::IdleTimeout);
  ASSERT_TRUE(event.has_value());
  EXPECT_EQ(event->key, "c:idle");
  EXPECT_EQ(event->client_id, "c");
  EXPECT_EQ(event->server_name, "idle");
  EXPECT_TRUE(result.process->wait_for_exit(2s));
}

TEST_F(ProcessRegistryTest, LongTtlSurvivesSweep) {
  // A year of minutes is far beyond what nanosecond clock math can hold
  registry_->ensure_process("c", "long", fake_server_config(),
                            std::chrono::minutes(525600));
  EXPECT_EQ(registry_->sweep_expired(), 0u);
  EXPECT_TRUE(registry_->has_process("c", "long"));
}

TEST_F(ProcessRegistryTest, ReuseKeepsCustomTtl) {
  auto first = registry_->ensure_process("c", "s", fake_server_config(),
                                         std::chrono::minutes(60));
  auto second = registry_->ensure_process("c", "s", fake_server_config());
  EXPECT_TRUE(second.was_already_running);
  EXPECT_EQ(first.process->pid(), second.process->pid());

  auto listed = registry_->list_for_client("c");
  ASSERT_EQ(listed.size(), 1u);
  EXPECT_EQ(listed[0].ttl, std::chrono::minutes(60));
}

TEST_F(ProcessRegistryTest, AccessRefreshesIdleTimer) {
  registry_->ensure_process("c", "busy", fake_server_config(), 300ms);
  for (int i = 0; i < 4; ++i) {
    std::this_thread::sleep_for(100ms);
    ASSERT_TRUE(registry_->get_process("c", "busy"));
  }
  EXPECT_EQ(registry_->sweep_expired(), 0u);
  EXPECT_TRUE(registry_->has_process("c", "busy"));
}

TEST_F(ProcessRegistryTest, BackgroundSweepEvicts) {
  registry_->start_background_tasks();
  registry_->ensure_process("c", "idle", fake_server_config(), 50ms);
  EXPECT_TRUE(wait_until(
      [&] { return events_->count(LifecycleEventType::IdleTimeout) == 1; },
      3s));
  EXPECT_EQ(registry_->size(), 0u);
  registry_->stop_background_tasks();
}

TEST_F(ProcessRegistryTest, HealthReportsNotFound) {
  auto health = registry_->is_healthy("c", "missing");
  EXPECT_FALSE(health.healthy);
  EXPECT_EQ(health.reason, HealthReason::NotFound);
}

TEST_F(ProcessRegistryTest, HealthReportsHealthy) {
  registry_->ensure_process("c", "s", fake_server_config());
  auto health = registry_->is_healthy("c", "s");
  EXPECT_TRUE(health.healthy);
  EXPECT_EQ(health.reason, HealthReason::None);
}

TEST_F(ProcessRegistryTest, HealthReportsNotInitialized) {
  auto options = fast_registry_options();
  options.handshake_timeout = 200ms;
  recreate(options);

  auto result = registry_->ensure_process("c", "mute", fake_server_config("silent"));
  EXPECT_FALSE(result.initialized);
  EXPECT_TRUE(result.process->is_alive());
  EXPECT_EQ(events_->count(LifecycleEventType::InitializationFailed), 1u);

  auto health = registry_->is_healthy("c", "mute");
  EXPECT_FALSE(health.healthy);
  EXPECT_EQ(health.reason, HealthReason::NotInitialized);

  // A second start retries the handshake on the same process
  auto retry = registry_->ensure_process("c", "mute", fake_server_config("silent"));
  EXPECT_TRUE(retry.was_already_running);
  EXPECT_FALSE(retry.initialized);
  EXPECT_EQ(retry.process->pid(), result.process->pid());

  registry_->mark_initialized("c", "mute");
  EXPECT_TRUE(registry_->is_initialized("c", "mute"));
}

TEST_F(ProcessRegistryTest, HealthDuringHandshakeIsNotInitialized) {
  auto config = fake_server_config("normal", {"--init-delay-ms", "800"});
  auto pending = std::async(std::launch::async, [&] {
    return registry_->ensure_process("c", "warming", config);
  });

  ASSERT_TRUE(wait_until([&] { return registry_->has_process("c", "warming"); },
                         3s));
  EXPECT_EQ(registry_->is_healthy("c", "warming").reason,
            HealthReason::NotInitialized);
  EXPECT_FALSE(registry_->is_initialized("c", "warming"));

  auto result = pending.get();
  EXPECT_TRUE(result.initialized);
  EXPECT_TRUE(registry_->is_healthy("c", "warming").healthy);
}

TEST_F(ProcessRegistryTest, KillTerminatesAndLeavesTombstone) {
  auto result = registry_->ensure_process("c", "s", fake_server_config());
  EXPECT_TRUE(registry_->kill_process("c", "s"));
  EXPECT_FALSE(registry_->has_process("c", "s"));
  EXPECT_TRUE(result.process->wait_for_exit(2s));

  auto health = registry_->is_healthy("c", "s");
  EXPECT_FALSE(health.healthy);
  EXPECT_EQ(health.reason, HealthReason::Killed);

  EXPECT_FALSE(registry_->kill_process("c", "s"));
  EXPECT_FALSE(registry_->kill_process("c", "never-started"));

  // Starting again clears the tombstone
  auto again = registry_->ensure_process("c", "s", fake_server_config());
  EXPECT_FALSE(again.was_already_running);
  EXPECT_TRUE(registry_->is_healthy("c", "s").healthy);
}

TEST_F(ProcessRegistryTest, ExitRemovesEntry) {
  auto result = registry_->ensure_process("c", "fragile",
                                          fake_server_config("exit-on-call"));
  auto call = registry_->call_tool(result.process, "echo", nullptr, 2s);
  EXPECT_EQ(call.outcome, CallResult::Outcome::ProcessDied);

  ASSERT_TRUE(wait_until([&] { return registry_->size() == 0; }, 2s));
  EXPECT_FALSE(registry_->has_process("c", "fragile"));
  EXPECT_EQ(registry_->is_healthy("c", "fragile").reason, HealthReason::NotFound);

  auto event = events_->last(LifecycleEventType::Exited);
  ASSERT_TRUE(event && event->exit_status && event->exit_status->code);
  EXPECT_EQ(*event->exit_status->code, 7);
}

TEST_F(ProcessRegistryTest, BrokenPipeMarksProcessKilled) {
  TempFile record("closed_stdin_record");
  auto config = fake_server_config("close-stdin", {"--record", record.path()});
  auto first = registry_->ensure_process("c", "deaf", config);
  ASSERT_TRUE(first.initialized);
  ASSERT_TRUE(wait_until(
      [&] {
        for (const auto &line : record.read_lines()) {
          if (line == "stdin closed") {
            return true;
          }
        }
        return false;
      },
      2s));

  // The child is alive but nobody reads its stdin any more
  auto call = registry_->call_tool(first.process, "echo", nullptr, 2s);
  EXPECT_EQ(call.outcome, CallResult::Outcome::CommunicationError);
  EXPECT_TRUE(first.process->is_alive());

  EXPECT_EQ(registry_->is_healthy("c", "deaf").reason, HealthReason::Killed);
  EXPECT_FALSE(registry_->has_process("c", "deaf"));

  auto second = registry_->ensure_process("c", "deaf", config);
  EXPECT_FALSE(second.was_already_running);
  EXPECT_NE(first.process->pid(), second.process->pid());
  EXPECT_TRUE(first.process->wait_for_exit(2s));
}

TEST_F(ProcessRegistryTest, DeadProcessIsReplacedOnNextStart) {
  auto first = registry_->ensure_process("c", "s", fake_server_config());
  registry_->process_manager().terminate_and_wait(first.process);

  auto second = registry_->ensure_process("c", "s", fake_server_config());
  EXPECT_FALSE(second.was_already_running);
  EXPECT_NE(first.process->pid(), second.process->pid());
  EXPECT_TRUE(second.initialized);
}

TEST_F(ProcessRegistryTest, SpawnFailurePropagates) {
  LaunchConfig config;
  config.command = "no-such-mcp-server-binary";

  EXPECT_THROW(registry_->ensure_process("c", "broken", config), SpawnError);
  EXPECT_FALSE(registry_->has_process("c", "broken"));
  EXPECT_EQ(events_->count(LifecycleEventType::Error), 1u);

  // The failed attempt leaves nothing in flight
  auto result = registry_->ensure_process("c", "broken", fake_server_config());
  EXPECT_TRUE(result.initialized);
}

TEST_F(ProcessRegistryTest, ListingsAreRedacted) {
  auto config = fake_server_config("normal", {"--api-key", "sk-live-123"});
  config.env["API_TOKEN"] = "tok-456";
  config.env["REGION"] = "eu";
  registry_->ensure_process("c", "secret", config);

  auto listed = registry_->list_for_client("c");
  ASSERT_EQ(listed.size(), 1u);
  const auto &summary = listed[0];
  EXPECT_EQ(summary.command_line.find("sk-live-123"), std::string::npos);
  EXPECT_NE(summary.command_line.find(kRedactedMarker), std::string::npos);
  EXPECT_EQ(summary.config["env"]["API_TOKEN"], kRedactedMarker);
  EXPECT_EQ(summary.config["env"]["REGION"], "eu");
  EXPECT_EQ(summary.pid, registry_->get_process("c", "secret")->pid());

  auto j = summary.to_json();
  EXPECT_EQ(j["uniqueKey"], "c:secret");
  EXPECT_EQ(j["MCPServerName"], "secret");
  EXPECT_EQ(j.dump().find("tok-456"), std::string::npos);
}

TEST_F(ProcessRegistryTest, HeartbeatsPingInitializedProcesses) {
  TempFile record("heartbeat_record");
  registry_->ensure_process("c", "s",
                            fake_server_config("normal", {"--record", record.path()}));

  EXPECT_EQ(registry_->send_heartbeats(), 1u);
  // Pinged moments ago, so this pass skips it
  EXPECT_EQ(registry_->send_heartbeats(), 0u);

  ASSERT_TRUE(wait_until(
      [&] {
        for (const auto &line : record.read_lines()) {
          if (line.find("\"ping\"") != std::string::npos) {
            return true;
          }
        }
        return false;
      },
      2s));
  auto listed = registry_->list_for_client("c");
  ASSERT_EQ(listed.size(), 1u);
  EXPECT_TRUE(listed[0].last_heartbeat_at.has_value());
}

TEST_F(ProcessRegistryTest, HeartbeatsSkipUninitialized) {
  auto options = fast_registry_options();
  options.handshake_timeout = 100ms;
  recreate(options);
  registry_->ensure_process("c", "mute", fake_server_config("silent"));
  EXPECT_EQ(registry_->send_heartbeats(), 0u);
}

TEST_F(ProcessRegistryTest, DetailsAndCallsGoThroughRegistry) {
  auto result = registry_->ensure_process("c", "s", fake_server_config());
  auto details = registry_->fetch_details(result.process, 5s);
  ASSERT_TRUE(details.parsed_response.has_value());
  EXPECT_TRUE((*details.parsed_response)["result"]["tools"].is_array());

  auto call = registry_->call_tool(result.process, "echo", {{"q", 1}}, 300ms);
  EXPECT_TRUE(call.ok());
  EXPECT_TRUE(call.parsed_response.has_value());
}

TEST_F(ProcessRegistryTest, ShutdownTerminatesEverything) {
  auto a = registry_->ensure_process("c", "one", fake_server_config());
  auto b = registry_->ensure_process("c", "two", fake_server_config("ignore-term"));

  registry_->shutdown_all();
  EXPECT_EQ(registry_->size(), 0u);
  EXPECT_FALSE(a.process->is_alive());
  EXPECT_FALSE(b.process->is_alive());
}

TEST_F(ProcessRegistryTest, ObserverFailureDoesNotBreakPublishing) {
  registry_->subscribe([](const LifecycleEvent &) {
    throw std::runtime_error("observer exploded");
  });
  auto result = registry_->ensure_process("c", "s", fake_server_config());
  EXPECT_TRUE(result.initialized);
  EXPECT_EQ(events_->count(LifecycleEventType::Initialized), 1u);
}
