#include "mcp-hub/Config.hpp"
#include "mcp-hub/Logger.hpp"
#include "mcp-hub/server/AuthGuard.hpp"
#include "mcp-hub/server/HttpRpcServer.hpp"
#include "mcp-hub/server/LifecycleEvents.hpp"
#include "mcp-hub/server/ProcessRegistry.hpp"
#include "mcp-hub/version.hpp"
#include <chrono>
#include <csignal>
#include <iostream>
#include <string>
#include <thread>

using namespace mcphub;

static volatile std::sig_atomic_t g_running = 1;

void signal_handler(int sig) {
  (void)sig;
  g_running = 0;
}

void print_usage() {
  std::cout << "Usage: mcp-hub <command> [options]\n\n";
  std::cout << "Commands:\n";
  std::cout << "  serve                    Run the HTTP service\n";
  std::cout << "  token                    Print a random 32-character token\n";
  std::cout << "\nServe options:\n";
  std::cout << "  --config <file>          YAML configuration file\n";
  std::cout << "  --port <n>               Listen port (overrides config)\n";
  std::cout << "  --log-level <level>      trace|debug|info|warn|error\n";
  std::cout << "\nEnvironment:\n";
  std::cout << "  PORT, BIND_ADDRESS, AUTH_TOKEN, DEFAULT_TTL_MINUTES,\n";
  std::cout << "  HANDSHAKE_TIMEOUT_MS, API_RUN_TIMEOUT_MS, LOG_LEVEL, ...\n";
}

void log_lifecycle_event(const server::LifecycleEvent &event) {
  using server::LifecycleEventType;
  switch (event.type) {
  case LifecycleEventType::IdleTimeout:
    LOG_INFO("MCP", event.key, "Server {} for client {} stopped after inactivity",
             event.server_name, event.client_id);
    break;
  case LifecycleEventType::Exited:
    LOG_INFO("MCP", event.key, "Server {} for client {} exited ({})",
             event.server_name, event.client_id, event.message);
    break;
  case LifecycleEventType::Error:
    LOG_ERROR("MCP", event.key, "Server {} for client {} failed: {}",
              event.server_name, event.client_id, event.message);
    break;
  case LifecycleEventType::Initialized:
    LOG_INFO("MCP", event.key, "Server {} for client {} initialized",
             event.server_name, event.client_id);
    break;
  case LifecycleEventType::InitializationFailed:
    LOG_WARN("MCP", event.key, "Server {} for client {} not initialized: {}",
             event.server_name, event.client_id, event.message);
    break;
  }
}

int cmd_serve(int argc, char **argv) {
  std::string config_path;
  std::string log_level;
  int port = -1;

  for (int i = 0; i < argc; i++) {
    std::string arg = argv[i];
    if (arg == "--config" && i + 1 < argc) {
      config_path = argv[++i];
    } else if (arg == "--port" && i + 1 < argc) {
      try {
        port = std::stoi(argv[++i]);
      } catch (const std::logic_error &) {
        std::cerr << "Invalid port: " << argv[i] << "\n";
        return 1;
      }
    } else if (arg == "--log-level" && i + 1 < argc) {
      log_level = argv[++i];
    } else {
      std::cerr << "Unknown option: " << arg << "\n\n";
      print_usage();
      return 1;
    }
  }

  HubConfig config;
  try {
    config = HubConfig::load(config_path);
    if (port >= 0) {
      config.port = port;
    }
    if (!log_level.empty()) {
      config.log_level = log_level;
    }
    config.validate();
  } catch (const ConfigError &e) {
    std::cerr << "Configuration error: " << e.what() << "\n";
    return 1;
  }

  HubLogger::instance().init(config.log_file,
                             HubLogger::parse_level(config.log_level));
  LOG_INFO("MAIN", "START", "{} {} starting", SERVICE_NAME, VERSION);

  std::signal(SIGINT, signal_handler);
  std::signal(SIGTERM, signal_handler);

  server::ProcessRegistry registry(config.registry_options());
  registry.subscribe(log_lifecycle_event);
  registry.start_background_tasks();

  server::HttpRpcServer http(registry, config);
  if (!http.start(static_cast<uint16_t>(config.port))) {
    LOG_ERROR("MAIN", "START", "Failed to start HTTP server on port {}",
              config.port);
    registry.stop_background_tasks();
    registry.shutdown_all();
    HubLogger::instance().shutdown();
    return 1;
  }

  server::AuthGuard guard(config.auth_token);
  LOG_INFO("MAIN", "START", "Auth token prefix: {}", guard.token_prefix());
  if (config.auth_token == HubConfig().auth_token) {
    LOG_WARN("MAIN", "START",
             "Using the demo token; set AUTH_TOKEN before exposing this host");
  }
  LOG_INFO("MAIN", "START",
           "Rate limits: {} req / {} ms, {} req / {} ms for /api/run",
           config.rate_limit.max_requests, config.rate_limit.window.count(),
           config.strict_rate_limit.max_requests,
           config.strict_rate_limit.window.count());

  while (g_running) {
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
  }

  LOG_INFO("MAIN", "STOP", "Shutting down");
  http.stop();
  registry.stop_background_tasks();
  registry.shutdown_all();
  LOG_INFO("MAIN", "STOP", "All managed processes terminated");
  HubLogger::instance().shutdown();
  return 0;
}

int main(int argc, char **argv) {
  if (argc < 2) {
    print_usage();
    return 1;
  }

  std::string command = argv[1];

  if (command == "serve") {
    return cmd_serve(argc - 2, argv + 2);
  } else if (command == "token") {
    std::cout << server::AuthGuard::generate_token() << "\n";
    return 0;
  } else if (command == "--help" || command == "-h") {
    print_usage();
    return 0;
  } else {
    std::cerr << "Unknown command: " << command << "\n\n";
    print_usage();
    return 1;
  }
}
