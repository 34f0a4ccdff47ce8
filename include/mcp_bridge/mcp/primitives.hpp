#pragma once

#include <mcp_bridge/core/result.hpp>

#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include <nlohmann/json.hpp>

namespace mcp_bridge {

// ---------------------------------------------------------------------------
// Handler parameters.
//
// Arguments reach a handler as a name -> value map. Scalars keep the type the
// JSON decoder produced (no coercion: "100" stays a string, 100 stays an
// integer); arrays, objects and null are passed through as JSON.
// ---------------------------------------------------------------------------
using ParamValue = std::variant<std::string, std::int64_t, double, bool,
                                nlohmann::json>;
using ParamMap = std::map<std::string, ParamValue>;

// Convert a JSON object into a ParamMap. Fails with InvalidArgument when the
// value is neither an object nor null.
Result<ParamMap, Error> ParamsFromJson(const nlohmann::json& arguments);

nlohmann::json ParamToJson(const ParamValue& value);
nlohmann::json ParamsToJson(const ParamMap& params);

// Typed lookup: nullptr when the key is absent or holds another type.
template <typename T>
const T* FindParam(const ParamMap& params, const std::string& key) {
    auto it = params.find(key);
    if (it == params.end()) {
        return nullptr;
    }
    return std::get_if<T>(&it->second);
}

// A handler receives the call arguments and returns any JSON value.
// Throwing is the way to report failure; the dispatcher converts it.
using ItemHandler = std::function<nlohmann::json(const ParamMap& params)>;

// ---------------------------------------------------------------------------
// ItemCategory / ThreadAffinity
// ---------------------------------------------------------------------------
enum class ItemCategory {
    Tool,
    Resource,
    Prompt,
};

const char* CategoryName(ItemCategory category);

enum class ThreadAffinity {
    MainThread,  // must run on the host's execution thread
    AnyThread,   // may run on the request thread
};

// ---------------------------------------------------------------------------
// ToolDescriptor: MCP tool metadata.
// ---------------------------------------------------------------------------
struct ToolDescriptor {
    std::string name;
    std::optional<std::string> title;
    std::optional<std::string> description;
    nlohmann::json input_schema = nlohmann::json::object();
    std::optional<nlohmann::json> output_schema;
    std::optional<nlohmann::json> annotations;
    std::optional<bool> additional_properties;

    // {"type": "object", "properties": {}, "required": []}
    static ToolDescriptor Simple(std::string name, std::string description);

    ToolDescriptor& AddInputProperty(const std::string& property,
                                     nlohmann::json property_schema);
    ToolDescriptor& AddRequiredInput(const std::string& property);

    // additionalProperties: false
    ToolDescriptor& Strict();

    [[nodiscard]] nlohmann::json ToJson() const;
};

// ---------------------------------------------------------------------------
// ResourceDescriptor: MCP resource metadata. Exactly one of `uri` and
// `uri_template` is set; Item::Resource enforces it.
// ---------------------------------------------------------------------------
struct ResourceDescriptor {
    std::string uri;
    std::string uri_template;
    std::string name;
    std::optional<std::string> title;
    std::optional<std::string> description;
    std::optional<std::string> mime_type;
    std::optional<std::int64_t> size;

    static ResourceDescriptor Json(std::string uri, std::string name,
                                   std::string description);
    static ResourceDescriptor Template(std::string uri_template,
                                       std::string name,
                                       std::string description);

    [[nodiscard]] bool IsTemplate() const { return !uri_template.empty(); }

    [[nodiscard]] nlohmann::json ToJson() const;
};

// ---------------------------------------------------------------------------
// PromptDescriptor: MCP prompt metadata. Prompts are catalogued only; no
// protocol method serves them.
// ---------------------------------------------------------------------------
struct PromptArgument {
    std::string name;
    std::string description;
    bool required = false;
    std::optional<std::string> type;
};

struct PromptDescriptor {
    std::string name;
    std::optional<std::string> title;
    std::optional<std::string> description;
    std::vector<PromptArgument> arguments;

    PromptDescriptor& AddArgument(PromptArgument argument);

    [[nodiscard]] nlohmann::json ToJson() const;
};

// ---------------------------------------------------------------------------
// Item: one primitive bound to its handler and thread affinity.
// Immutable once created.
// ---------------------------------------------------------------------------
class Item {
public:
    static Result<Item, Error> Tool(
        ToolDescriptor descriptor, ItemHandler handler,
        ThreadAffinity affinity = ThreadAffinity::MainThread);

    static Result<Item, Error> Resource(
        ResourceDescriptor descriptor, ItemHandler handler,
        ThreadAffinity affinity = ThreadAffinity::MainThread);

    static Result<Item, Error> Prompt(
        PromptDescriptor descriptor, ItemHandler handler,
        ThreadAffinity affinity = ThreadAffinity::MainThread);

    [[nodiscard]] const std::string& Name() const noexcept { return name_; }
    [[nodiscard]] ItemCategory Category() const noexcept { return category_; }
    [[nodiscard]] ThreadAffinity Affinity() const noexcept { return affinity_; }
    [[nodiscard]] bool RunsOnMainThread() const noexcept {
        return affinity_ == ThreadAffinity::MainThread;
    }
    [[nodiscard]] const ItemHandler& Handler() const noexcept { return handler_; }

    // Descriptor access; the category must match.
    [[nodiscard]] const ToolDescriptor& AsTool() const;
    [[nodiscard]] const ResourceDescriptor& AsResource() const;
    [[nodiscard]] const PromptDescriptor& AsPrompt() const;

    // Protocol projection of the descriptor.
    [[nodiscard]] nlohmann::json Describe() const;

private:
    using Descriptor =
        std::variant<ToolDescriptor, ResourceDescriptor, PromptDescriptor>;

    Item(std::string name, ItemCategory category, Descriptor descriptor,
         ItemHandler handler, ThreadAffinity affinity);

    std::string name_;
    ItemCategory category_;
    Descriptor descriptor_;
    ItemHandler handler_;
    ThreadAffinity affinity_;
};

} // namespace mcp_bridge
