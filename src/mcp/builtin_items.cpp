#include <mcp_bridge/mcp/builtin_items.hpp>

#include <mcp_bridge/core/version.hpp>

#include <chrono>
#include <stdexcept>
#include <string>

namespace mcp_bridge {

namespace {

const char* PlatformName() {
#if defined(_WIN32)
    return "windows";
#elif defined(__APPLE__)
    return "darwin";
#elif defined(__linux__)
    return "linux";
#else
    return "unknown";
#endif
}

// Integer or floating-point argument; throws when absent or not a number.
double NumberParam(const ParamMap& params, const std::string& key) {
    if (const auto* i = FindParam<std::int64_t>(params, key)) {
        return static_cast<double>(*i);
    }
    if (const auto* d = FindParam<double>(params, key)) {
        return *d;
    }
    throw std::invalid_argument("Parameter '" + key + "' must be a number");
}

Result<void, Error> Add(Registry& registry, Result<Item, Error> item) {
    if (item.IsErr()) {
        return Result<void, Error>::Err(item.Error());
    }
    return registry.Register(std::move(item).Value());
}

ItemCategory ParseCategory(const std::string& name) {
    if (name == "tools" || name == "tool") return ItemCategory::Tool;
    if (name == "resources" || name == "resource") return ItemCategory::Resource;
    if (name == "prompts" || name == "prompt") return ItemCategory::Prompt;
    throw std::invalid_argument("Unknown category: " + name);
}

Result<void, Error> RegisterTools(Registry& registry, const AppConfig& config) {
    auto hello = ToolDescriptor::Simple("hello_world", "Greets the caller by name");
    hello.AddInputProperty("name", {{"type", "string"},
                                    {"description", "Name to greet"},
                                    {"default", "World"}});
    auto added = Add(registry, Item::Tool(hello, [](const ParamMap& params) {
        const auto* name = FindParam<std::string>(params, "name");
        return nlohmann::json("Hello, " + (name ? *name : std::string("World")) + "!");
    }, ThreadAffinity::AnyThread));
    if (added.IsErr()) return added;

    auto add = ToolDescriptor::Simple("add_numbers", "Adds two numbers");
    add.AddInputProperty("a", {{"type", "number"}, {"description", "First number"}})
        .AddInputProperty("b", {{"type", "number"}, {"description", "Second number"}})
        .AddRequiredInput("a")
        .AddRequiredInput("b")
        .Strict();
    added = Add(registry, Item::Tool(add, [](const ParamMap& params) {
        auto a = NumberParam(params, "a");
        auto b = NumberParam(params, "b");
        return nlohmann::json{{"result", a + b}};
    }));
    if (added.IsErr()) return added;

    auto started = std::chrono::steady_clock::now();
    auto name = config.server.name;
    return Add(registry, Item::Tool(
        ToolDescriptor::Simple("get_system_info", "Reports the server platform and version"),
        [started, name](const ParamMap&) {
            auto uptime = std::chrono::duration_cast<std::chrono::seconds>(
                std::chrono::steady_clock::now() - started);
            return nlohmann::json{
                {"platform", PlatformName()},
                {"version", kVersion},
                {"server", name},
                {"uptime_seconds", uptime.count()},
            };
        }));
}

Result<void, Error> RegisterResources(Registry& registry, const AppConfig& config) {
    auto added = Add(registry, Item::Resource(
        ResourceDescriptor::Json("server://status", "Server status",
                                 "Item counts of the running server"),
        [&registry](const ParamMap&) {
            auto counts = registry.CountByCategory();
            return nlohmann::json{
                {"status", "running"},
                {"tools", counts[ItemCategory::Tool]},
                {"resources", counts[ItemCategory::Resource]},
                {"prompts", counts[ItemCategory::Prompt]},
            };
        }));
    if (added.IsErr()) return added;

    nlohmann::json snapshot = {
        {"host", config.server.host},
        {"port", config.server.port},
        {"worker_threads", config.server.worker_threads},
        {"app_name", config.dispatch.app_name},
        {"main_thread_timeout_ms", config.dispatch.main_thread_timeout_ms},
    };
    added = Add(registry, Item::Resource(
        ResourceDescriptor::Json("server://config", "Server configuration",
                                 "Effective listener settings"),
        [snapshot](const ParamMap&) { return snapshot; },
        ThreadAffinity::AnyThread));
    if (added.IsErr()) return added;

    added = Add(registry, Item::Resource(
        ResourceDescriptor::Template("server://items/{category}", "Registered items",
                                     "Names registered in one category"),
        [&registry](const ParamMap& params) {
            const auto* category = FindParam<std::string>(params, "category");
            if (category == nullptr) {
                throw std::invalid_argument("Missing category");
            }
            return nlohmann::json{
                {"category", *category},
                {"names", registry.Names(ParseCategory(*category))},
            };
        },
        ThreadAffinity::AnyThread));
    if (added.IsErr()) return added;

    auto echo = ResourceDescriptor::Template("server://echo{?text}", "Echo",
                                             "Returns the text query parameter");
    echo.mime_type = "text/plain";
    return Add(registry, Item::Resource(echo, [](const ParamMap& params) {
        const auto* text = FindParam<std::string>(params, "text");
        return nlohmann::json(text ? *text : std::string());
    }));
}

Result<void, Error> RegisterPrompts(Registry& registry) {
    PromptDescriptor prompt;
    prompt.name = "describe_server";
    prompt.description = "Asks for a summary of the server's tools and resources";
    prompt.AddArgument({"detail", "brief or full", false, std::string("string")});
    return Add(registry, Item::Prompt(prompt, [](const ParamMap& params) {
        const auto* detail = FindParam<std::string>(params, "detail");
        return nlohmann::json("Describe the available tools and resources" +
                              std::string(detail && *detail == "full" ? " in detail." : "."));
    }));
}

} // anonymous namespace

Result<void, Error> RegisterBuiltinItems(Registry& registry, const AppConfig& config) {
    auto registered = RegisterTools(registry, config);
    if (registered.IsErr()) return registered;
    registered = RegisterResources(registry, config);
    if (registered.IsErr()) return registered;
    return RegisterPrompts(registry);
}

} // namespace mcp_bridge
