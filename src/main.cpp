#include <mcp_bridge/config/config_loader.hpp>
#include <mcp_bridge/core/log.hpp>
#include <mcp_bridge/core/terminal.hpp>
#include <mcp_bridge/core/version.hpp>
#include <mcp_bridge/mcp/builtin_items.hpp>
#include <mcp_bridge/mcp/http_transport.hpp>
#include <mcp_bridge/mcp/mcp_server.hpp>
#include <mcp_bridge/mcp/registry.hpp>
#include <mcp_bridge/mcp/signal_channel.hpp>
#include <mcp_bridge/mcp/task_dispatcher.hpp>

#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

using namespace mcp_bridge;

namespace {

constexpr const char* kComponent = "main";
constexpr int kExitSuccess = 0;

volatile std::sig_atomic_t g_shutdown_requested = 0;

void OnShutdownSignal(int /*signal*/) {
    g_shutdown_requested = 1;
}

Result<AppConfig, Error> LoadConfig(int argc, const char* const* argv) {
    std::string config_path;
    return LoadFromCli(argc, argv, &config_path)
        .AndThen([&config_path](AppConfig cli) -> Result<AppConfig, Error> {
            if (config_path.empty()) {
                return Result<AppConfig, Error>::Ok(std::move(cli));
            }
            return LoadFromYaml(config_path).Map([&cli](const AppConfig& yaml) {
                return MergeConfigs(yaml, cli);
            });
        })
        .AndThen([](AppConfig config) -> Result<AppConfig, Error> {
            auto valid = ValidateConfig(config);
            if (valid.IsErr()) {
                return Result<AppConfig, Error>::Err(valid.Error());
            }
            return Result<AppConfig, Error>::Ok(std::move(config));
        });
}

// Returns false when the log file cannot be opened.
bool InitLogging(const AppConfig& config) {
    auto level = LogLevel::Info;
    if (config.logging.verbose) {
        level = LogLevel::Debug;
    } else if (config.logging.quiet) {
        level = LogLevel::Warn;
    }

    if (config.logging.file) {
        auto sink = std::make_unique<JsonFileSink>(*config.logging.file);
        if (!sink->IsOpen()) {
            return false;
        }
        InitGlobalLogger(std::move(sink), level);
    } else if (config.logging.json) {
        InitGlobalLogger(std::make_unique<JsonSink>(std::cerr), level);
    } else {
        InitGlobalLogger(
            std::make_unique<ColorConsoleSink>(UseColorOnStderr(config.logging.color)),
            level);
    }
    return true;
}

// Startup failures after logging is up. JSON log consumers get the error
// object on its own line.
int Fail(const AppConfig& config, const Error& error) {
    if (config.logging.json) {
        std::cerr << error.ToJson() << "\n";
    } else {
        LogError(kComponent, error.ToString());
    }
    return error.ExitCode();
}

} // anonymous namespace

int main(int argc, const char* argv[]) {
    auto loaded = LoadConfig(argc, argv);
    if (loaded.IsErr()) {
        std::cerr << "Error: " << loaded.Error().ToString() << "\n";
        return loaded.Error().ExitCode();
    }
    const auto& config = loaded.Value();

    if (!InitLogging(config)) {
        std::cerr << "Error: cannot open log file " << *config.logging.file << "\n";
        return Error{"main", "", ErrorCategory::Config}.ExitCode();
    }
    LogInfo(kComponent, std::string("mcp-bridge ") + kVersion + " starting");

    Registry registry;
    auto registered = RegisterBuiltinItems(registry, config);
    if (registered.IsErr()) {
        return Fail(config, registered.Error());
    }

    // This thread is the execution thread: it drains the channel below.
    QueueSignalChannel channel;
    TaskDispatcher dispatcher(channel, config.dispatch.app_name);
    auto started = dispatcher.Start();
    if (started.IsErr()) {
        return Fail(config, started.Error());
    }

    McpServerOptions server_options;
    server_options.name = config.server.name;
    server_options.version = kVersion;
    server_options.main_thread_timeout =
        std::chrono::milliseconds(config.dispatch.main_thread_timeout_ms);
    McpServer server(registry, dispatcher, server_options);

    HttpTransportOptions http_options;
    http_options.host = config.server.host;
    http_options.port = config.server.port;
    http_options.worker_threads = static_cast<std::size_t>(config.server.worker_threads);
    HttpTransport transport(server, http_options);
    auto listening = transport.Start();
    if (listening.IsErr()) {
        auto stopped = dispatcher.Stop();
        if (stopped.IsErr()) {
            LogWarn(kComponent, stopped.Error().ToString());
        }
        return Fail(config, listening.Error());
    }

    std::signal(SIGINT, OnShutdownSignal);
    std::signal(SIGTERM, OnShutdownSignal);

    LogInfo(kComponent, "Serving " + std::to_string(registry.Count()) +
                            " item(s); press Ctrl+C to stop");
    while (g_shutdown_requested == 0) {
        channel.WaitAndDispatch(std::chrono::milliseconds(100));
    }

    LogInfo(kComponent, "Shutting down");
    // In-flight requests may still wait on this thread; keep draining until
    // the listener has finished them.
    std::atomic<bool> transport_stopped{false};
    std::thread stopper([&] {
        transport.Stop();
        transport_stopped = true;
        channel.Wake();
    });
    while (!transport_stopped) {
        channel.WaitAndDispatch(std::chrono::milliseconds(50));
    }
    stopper.join();
    auto stopped = dispatcher.Stop();
    if (stopped.IsErr()) {
        LogWarn(kComponent, stopped.Error().ToString());
    }
    LogInfo(kComponent, "Stopped");
    return kExitSuccess;
}
