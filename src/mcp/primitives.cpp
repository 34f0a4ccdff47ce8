#include <mcp_bridge/mcp/primitives.hpp>

#include <algorithm>

namespace mcp_bridge {

namespace {

Error MakeItemError(const std::string& message) {
    return Error{"Item", message, ErrorCategory::InvalidArgument};
}

Result<void, Error> CheckCommon(const std::string& name,
                                const ItemHandler& handler) {
    if (name.empty()) {
        return Result<void, Error>::Err(MakeItemError("Item name must not be empty"));
    }
    if (!handler) {
        return Result<void, Error>::Err(
            MakeItemError("Handler for '" + name + "' must be callable"));
    }
    return Result<void, Error>::Ok();
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// Parameters
// ---------------------------------------------------------------------------
Result<ParamMap, Error> ParamsFromJson(const nlohmann::json& arguments) {
    ParamMap params;
    if (arguments.is_null()) {
        return Result<ParamMap, Error>::Ok(std::move(params));
    }
    if (!arguments.is_object()) {
        return Result<ParamMap, Error>::Err(
            Error{"Params", "Arguments must be an object, got " +
                                std::string(arguments.type_name()),
                  ErrorCategory::InvalidArgument});
    }

    for (const auto& [key, value] : arguments.items()) {
        switch (value.type()) {
            case nlohmann::json::value_t::string:
                params.emplace(key, value.get<std::string>());
                break;
            case nlohmann::json::value_t::boolean:
                params.emplace(key, value.get<bool>());
                break;
            case nlohmann::json::value_t::number_integer:
            case nlohmann::json::value_t::number_unsigned:
                params.emplace(key, value.get<std::int64_t>());
                break;
            case nlohmann::json::value_t::number_float:
                params.emplace(key, value.get<double>());
                break;
            default:
                params.emplace(key, value);
                break;
        }
    }
    return Result<ParamMap, Error>::Ok(std::move(params));
}

nlohmann::json ParamToJson(const ParamValue& value) {
    return std::visit([](const auto& v) { return nlohmann::json(v); }, value);
}

nlohmann::json ParamsToJson(const ParamMap& params) {
    auto object = nlohmann::json::object();
    for (const auto& [key, value] : params) {
        object[key] = ParamToJson(value);
    }
    return object;
}

const char* CategoryName(ItemCategory category) {
    switch (category) {
        case ItemCategory::Tool:     return "tool";
        case ItemCategory::Resource: return "resource";
        case ItemCategory::Prompt:   return "prompt";
    }
    return "unknown";
}

// ---------------------------------------------------------------------------
// ToolDescriptor
// ---------------------------------------------------------------------------
ToolDescriptor ToolDescriptor::Simple(std::string name, std::string description) {
    ToolDescriptor tool;
    tool.name = std::move(name);
    tool.description = std::move(description);
    tool.input_schema = {
        {"type", "object"},
        {"properties", nlohmann::json::object()},
        {"required", nlohmann::json::array()},
    };
    return tool;
}

ToolDescriptor& ToolDescriptor::AddInputProperty(const std::string& property,
                                                 nlohmann::json property_schema) {
    input_schema["properties"][property] = std::move(property_schema);
    return *this;
}

ToolDescriptor& ToolDescriptor::AddRequiredInput(const std::string& property) {
    auto& required = input_schema["required"];
    if (!required.is_array()) {
        required = nlohmann::json::array();
    }
    nlohmann::json entry = property;
    if (std::find(required.begin(), required.end(), entry) == required.end()) {
        required.push_back(std::move(entry));
    }
    return *this;
}

ToolDescriptor& ToolDescriptor::Strict() {
    additional_properties = false;
    return *this;
}

nlohmann::json ToolDescriptor::ToJson() const {
    nlohmann::json j = {{"name", name}};
    if (title) j["title"] = *title;
    if (description) j["description"] = *description;

    auto schema = input_schema.is_null() ? nlohmann::json::object() : input_schema;
    if (additional_properties.has_value()) {
        schema["additionalProperties"] = *additional_properties;
    }
    j["inputSchema"] = std::move(schema);

    if (output_schema) j["outputSchema"] = *output_schema;
    if (annotations) j["annotations"] = *annotations;
    return j;
}

// ---------------------------------------------------------------------------
// ResourceDescriptor
// ---------------------------------------------------------------------------
ResourceDescriptor ResourceDescriptor::Json(std::string uri, std::string name,
                                            std::string description) {
    ResourceDescriptor resource;
    resource.uri = std::move(uri);
    resource.name = std::move(name);
    resource.description = std::move(description);
    resource.mime_type = "application/json";
    return resource;
}

ResourceDescriptor ResourceDescriptor::Template(std::string uri_template,
                                                std::string name,
                                                std::string description) {
    ResourceDescriptor resource;
    resource.uri_template = std::move(uri_template);
    resource.name = std::move(name);
    resource.description = std::move(description);
    resource.mime_type = "application/json";
    return resource;
}

nlohmann::json ResourceDescriptor::ToJson() const {
    nlohmann::json j = nlohmann::json::object();
    if (!uri.empty()) {
        j["uri"] = uri;
    } else {
        j["uriTemplate"] = uri_template;
    }
    if (!name.empty()) j["name"] = name;
    if (title) j["title"] = *title;
    if (description) j["description"] = *description;
    if (mime_type) j["mimeType"] = *mime_type;
    if (size) j["size"] = *size;
    return j;
}

// ---------------------------------------------------------------------------
// PromptDescriptor
// ---------------------------------------------------------------------------
PromptDescriptor& PromptDescriptor::AddArgument(PromptArgument argument) {
    arguments.push_back(std::move(argument));
    return *this;
}

nlohmann::json PromptDescriptor::ToJson() const {
    nlohmann::json j = {{"name", name}};
    if (title) j["title"] = *title;
    if (description) j["description"] = *description;
    if (!arguments.empty()) {
        auto args = nlohmann::json::array();
        for (const auto& arg : arguments) {
            nlohmann::json a = {
                {"name", arg.name},
                {"description", arg.description},
                {"required", arg.required},
            };
            if (arg.type) a["type"] = *arg.type;
            args.push_back(std::move(a));
        }
        j["arguments"] = std::move(args);
    }
    return j;
}

// ---------------------------------------------------------------------------
// Item
// ---------------------------------------------------------------------------
Item::Item(std::string name, ItemCategory category, Descriptor descriptor,
           ItemHandler handler, ThreadAffinity affinity)
    : name_(std::move(name)),
      category_(category),
      descriptor_(std::move(descriptor)),
      handler_(std::move(handler)),
      affinity_(affinity) {}

Result<Item, Error> Item::Tool(ToolDescriptor descriptor, ItemHandler handler,
                               ThreadAffinity affinity) {
    auto check = CheckCommon(descriptor.name, handler);
    if (check.IsErr()) {
        return Result<Item, Error>::Err(std::move(check).Error());
    }
    auto name = descriptor.name;
    return Result<Item, Error>::Ok(Item(std::move(name), ItemCategory::Tool,
                                        std::move(descriptor),
                                        std::move(handler), affinity));
}

Result<Item, Error> Item::Resource(ResourceDescriptor descriptor,
                                   ItemHandler handler,
                                   ThreadAffinity affinity) {
    auto check = CheckCommon(descriptor.name, handler);
    if (check.IsErr()) {
        return Result<Item, Error>::Err(std::move(check).Error());
    }
    if (descriptor.uri.empty() == descriptor.uri_template.empty()) {
        return Result<Item, Error>::Err(MakeItemError(
            "Resource '" + descriptor.name +
            "' needs exactly one of uri and uriTemplate"));
    }
    if (descriptor.size.has_value() && *descriptor.size < 0) {
        return Result<Item, Error>::Err(MakeItemError(
            "Resource '" + descriptor.name + "' size must be non-negative"));
    }
    auto name = descriptor.name;
    return Result<Item, Error>::Ok(Item(std::move(name), ItemCategory::Resource,
                                        std::move(descriptor),
                                        std::move(handler), affinity));
}

Result<Item, Error> Item::Prompt(PromptDescriptor descriptor,
                                 ItemHandler handler,
                                 ThreadAffinity affinity) {
    auto check = CheckCommon(descriptor.name, handler);
    if (check.IsErr()) {
        return Result<Item, Error>::Err(std::move(check).Error());
    }
    auto name = descriptor.name;
    return Result<Item, Error>::Ok(Item(std::move(name), ItemCategory::Prompt,
                                        std::move(descriptor),
                                        std::move(handler), affinity));
}

const ToolDescriptor& Item::AsTool() const {
    return std::get<ToolDescriptor>(descriptor_);
}

const ResourceDescriptor& Item::AsResource() const {
    return std::get<ResourceDescriptor>(descriptor_);
}

const PromptDescriptor& Item::AsPrompt() const {
    return std::get<PromptDescriptor>(descriptor_);
}

nlohmann::json Item::Describe() const {
    return std::visit([](const auto& d) { return d.ToJson(); }, descriptor_);
}

} // namespace mcp_bridge
