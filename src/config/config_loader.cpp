#include <mcp_bridge/config/config_loader.hpp>

#include <mcp_bridge/core/version.hpp>

#include <argparse/argparse.hpp>
#include <yaml-cpp/yaml.h>

#include <limits>

namespace mcp_bridge {

namespace {

const AppConfig kDefaults{};

Error MakeConfigError(const std::string& message) {
    return Error{"ConfigLoader", message, ErrorCategory::Config};
}

Result<uint16_t, Error> ToPort(long long value, const std::string& source) {
    if (value < 0 || value > std::numeric_limits<uint16_t>::max()) {
        return Result<uint16_t, Error>::Err(MakeConfigError(
            "Invalid " + source + ": " + std::to_string(value)));
    }
    return Result<uint16_t, Error>::Ok(static_cast<uint16_t>(value));
}

// Copies node[key] into target when present; yaml-cpp throws on a bad type.
template <typename T>
void ReadKey(const YAML::Node& node, const char* key, T& target) {
    if (const auto value = node[key]) {
        target = value.as<T>();
    }
}

void ReadKey(const YAML::Node& node, const char* key, std::optional<std::string>& target) {
    if (const auto value = node[key]) {
        target = value.as<std::string>();
    }
}

template <typename T>
void Override(T& target, const T& cli_value, const T& default_value) {
    if (cli_value != default_value) {
        target = cli_value;
    }
}

Result<void, Error> ReadServer(const YAML::Node& node, ServerConfig& server) {
    ReadKey(node, "host", server.host);
    ReadKey(node, "workers", server.worker_threads);
    ReadKey(node, "name", server.name);
    if (const auto port_node = node["port"]) {
        auto port = ToPort(port_node.as<long long>(), "server.port");
        if (port.IsErr()) {
            return Result<void, Error>::Err(port.Error());
        }
        server.port = port.Value();
    }
    return Result<void, Error>::Ok();
}

Result<void, Error> ReadLogging(const YAML::Node& node, LoggingConfig& logging) {
    ReadKey(node, "file", logging.file);
    ReadKey(node, "json", logging.json);
    ReadKey(node, "verbose", logging.verbose);
    ReadKey(node, "quiet", logging.quiet);
    if (const auto color_node = node["color"]) {
        auto color = ParseColorChoice(color_node.as<std::string>());
        if (color.IsErr()) {
            return Result<void, Error>::Err(color.Error());
        }
        logging.color = color.Value();
    }
    return Result<void, Error>::Ok();
}

} // anonymous namespace

Result<ColorChoice, Error> ParseColorChoice(std::string_view text) {
    if (text == "auto") {
        return Result<ColorChoice, Error>::Ok(ColorChoice::Auto);
    }
    if (text == "always") {
        return Result<ColorChoice, Error>::Ok(ColorChoice::Always);
    }
    if (text == "never") {
        return Result<ColorChoice, Error>::Ok(ColorChoice::Never);
    }
    return Result<ColorChoice, Error>::Err(MakeConfigError(
        "Invalid logging.color: " + std::string(text) + " (expected auto, always or never)"));
}

// ---------------------------------------------------------------------------
// LoadFromYaml
// ---------------------------------------------------------------------------
Result<AppConfig, Error> LoadFromYaml(std::string_view file_path) {
    YAML::Node root;
    try {
        root = YAML::LoadFile(std::string(file_path));
    } catch (const YAML::Exception& e) {
        return Result<AppConfig, Error>::Err(
            MakeConfigError("Failed to parse YAML file: " + std::string(e.what())));
    }

    AppConfig config;
    try {
        if (const auto server = root["server"]) {
            auto read = ReadServer(server, config.server);
            if (read.IsErr()) {
                return Result<AppConfig, Error>::Err(read.Error());
            }
        }
        if (const auto dispatch = root["dispatch"]) {
            ReadKey(dispatch, "app_name", config.dispatch.app_name);
            ReadKey(dispatch, "main_thread_timeout_ms", config.dispatch.main_thread_timeout_ms);
        }
        if (const auto logging = root["logging"]) {
            auto read = ReadLogging(logging, config.logging);
            if (read.IsErr()) {
                return Result<AppConfig, Error>::Err(read.Error());
            }
        }
    } catch (const YAML::Exception& e) {
        return Result<AppConfig, Error>::Err(
            MakeConfigError("Invalid value in " + std::string(file_path) + ": " + e.what()));
    }

    return Result<AppConfig, Error>::Ok(std::move(config));
}

// ---------------------------------------------------------------------------
// LoadFromCli
// ---------------------------------------------------------------------------
Result<AppConfig, Error> LoadFromCli(int argc, const char* const* argv,
                                     std::string* config_path) {
    argparse::ArgumentParser program("mcp-bridge", kVersion);

    program.add_argument("--host").help("Address to listen on");
    program.add_argument("--port").help("Port to listen on").scan<'i', int>();
    program.add_argument("--workers").help("HTTP worker threads").scan<'i', int>();
    program.add_argument("--name").help("Server name reported by initialize");
    program.add_argument("--app-name").help("Prefix of the dispatcher signal channel");
    program.add_argument("--timeout-ms")
        .help("Budget for one main-thread call in milliseconds")
        .scan<'i', int>();
    program.add_argument("-c", "--config").help("Path to YAML config file");
    program.add_argument("--log-file").help("Append JSON log lines to this file");

    program.add_argument("--json-logs").help("JSON log lines on stderr")
        .default_value(false).implicit_value(true);
    program.add_argument("--color").help("Force colored log output")
        .default_value(false).implicit_value(true);
    program.add_argument("--no-color").help("Disable colored log output")
        .default_value(false).implicit_value(true);
    program.add_argument("-v", "--verbose").help("Debug logging")
        .default_value(false).implicit_value(true);
    program.add_argument("-q", "--quiet").help("Warnings and errors only")
        .default_value(false).implicit_value(true);

    try {
        program.parse_args(argc, argv);
    } catch (const std::exception& e) {
        return Result<AppConfig, Error>::Err(
            MakeConfigError("CLI parse error: " + std::string(e.what())));
    }

    AppConfig config;
    if (auto port = program.present<int>("--port")) {
        auto checked = ToPort(*port, "--port");
        if (checked.IsErr()) {
            return Result<AppConfig, Error>::Err(checked.Error());
        }
        config.server.port = checked.Value();
    }
    config.server.host = program.present("--host").value_or(config.server.host);
    config.server.worker_threads =
        program.present<int>("--workers").value_or(config.server.worker_threads);
    config.server.name = program.present("--name").value_or(config.server.name);

    config.dispatch.app_name = program.present("--app-name").value_or(config.dispatch.app_name);
    config.dispatch.main_thread_timeout_ms =
        program.present<int>("--timeout-ms").value_or(config.dispatch.main_thread_timeout_ms);

    config.logging.file = program.present("--log-file");
    config.logging.json = program.get<bool>("--json-logs");
    config.logging.verbose = program.get<bool>("--verbose");
    config.logging.quiet = program.get<bool>("--quiet");
    config.logging.color = ColorChoiceFromFlags(program.get<bool>("--color"),
                                                program.get<bool>("--no-color"));

    if (config_path != nullptr) {
        *config_path = program.present("--config").value_or("");
    }
    return Result<AppConfig, Error>::Ok(std::move(config));
}

// ---------------------------------------------------------------------------
// MergeConfigs
// ---------------------------------------------------------------------------
AppConfig MergeConfigs(const AppConfig& yaml_base, const AppConfig& cli_overrides) {
    AppConfig merged = yaml_base;
    const auto& cli = cli_overrides;

    Override(merged.server.host, cli.server.host, kDefaults.server.host);
    Override(merged.server.port, cli.server.port, kDefaults.server.port);
    Override(merged.server.worker_threads, cli.server.worker_threads,
             kDefaults.server.worker_threads);
    Override(merged.server.name, cli.server.name, kDefaults.server.name);

    Override(merged.dispatch.app_name, cli.dispatch.app_name, kDefaults.dispatch.app_name);
    Override(merged.dispatch.main_thread_timeout_ms, cli.dispatch.main_thread_timeout_ms,
             kDefaults.dispatch.main_thread_timeout_ms);

    Override(merged.logging.file, cli.logging.file, kDefaults.logging.file);
    Override(merged.logging.json, cli.logging.json, kDefaults.logging.json);
    Override(merged.logging.verbose, cli.logging.verbose, kDefaults.logging.verbose);
    Override(merged.logging.quiet, cli.logging.quiet, kDefaults.logging.quiet);
    Override(merged.logging.color, cli.logging.color, kDefaults.logging.color);
    return merged;
}

// ---------------------------------------------------------------------------
// ValidateConfig
// ---------------------------------------------------------------------------
Result<void, Error> ValidateConfig(const AppConfig& config) {
    auto fail = [](const std::string& message) {
        return Result<void, Error>::Err(MakeConfigError(message));
    };

    if (config.server.host.empty()) {
        return fail("Missing required field: host");
    }
    if (config.server.port == 0) {
        return fail("Invalid port: 0");
    }
    if (config.server.worker_threads < 1) {
        return fail("Worker threads must be at least 1, got " +
                    std::to_string(config.server.worker_threads));
    }
    if (config.dispatch.app_name.empty()) {
        return fail("Missing required field: app_name");
    }
    if (config.dispatch.main_thread_timeout_ms <= 0) {
        return fail("Main-thread timeout must be positive, got " +
                    std::to_string(config.dispatch.main_thread_timeout_ms));
    }
    if (config.logging.verbose && config.logging.quiet) {
        return fail("Cannot use both --verbose and --quiet");
    }
    return Result<void, Error>::Ok();
}

} // namespace mcp_bridge
