#include <catch2/catch_test_macros.hpp>

#include <mcp_bridge/mcp/primitives.hpp>

#include <string>

using namespace mcp_bridge;

namespace {

nlohmann::json Noop(const ParamMap&) { return nullptr; }

} // anonymous namespace

// ===========================================================================
// ParamsFromJson
// ===========================================================================

TEST_CASE("ParamsFromJson: keeps decoded scalar types", "[mcp][params]") {
    auto params = ParamsFromJson(
        {{"s", "100"}, {"i", 100}, {"d", 1.5}, {"b", true}});
    REQUIRE(params.IsOk());
    const auto& p = params.Value();

    REQUIRE(FindParam<std::string>(p, "s") != nullptr);
    CHECK(*FindParam<std::string>(p, "s") == "100");
    CHECK(FindParam<std::int64_t>(p, "s") == nullptr);

    REQUIRE(FindParam<std::int64_t>(p, "i") != nullptr);
    CHECK(*FindParam<std::int64_t>(p, "i") == 100);

    REQUIRE(FindParam<double>(p, "d") != nullptr);
    CHECK(*FindParam<double>(p, "d") == 1.5);

    REQUIRE(FindParam<bool>(p, "b") != nullptr);
    CHECK(*FindParam<bool>(p, "b") == true);
}

TEST_CASE("ParamsFromJson: structured values stay JSON", "[mcp][params]") {
    auto params = ParamsFromJson({{"list", {1, 2, 3}}, {"obj", {{"k", "v"}}}});
    REQUIRE(params.IsOk());
    const auto* list = FindParam<nlohmann::json>(params.Value(), "list");
    REQUIRE(list != nullptr);
    CHECK(list->size() == 3);
    const auto* obj = FindParam<nlohmann::json>(params.Value(), "obj");
    REQUIRE(obj != nullptr);
    CHECK((*obj)["k"] == "v");
}

TEST_CASE("ParamsFromJson: null is an empty map", "[mcp][params]") {
    auto params = ParamsFromJson(nullptr);
    REQUIRE(params.IsOk());
    CHECK(params.Value().empty());
}

TEST_CASE("ParamsFromJson: non-object rejected", "[mcp][params]") {
    auto params = ParamsFromJson(nlohmann::json::array({1, 2}));
    REQUIRE(params.IsErr());
    CHECK(params.Error().category == ErrorCategory::InvalidArgument);
    CHECK(params.Error().message.find("array") != std::string::npos);
}

TEST_CASE("ParamsToJson: inverse of ParamsFromJson", "[mcp][params]") {
    nlohmann::json args = {{"a", 1}, {"b", "two"}, {"c", false}};
    auto params = ParamsFromJson(args);
    REQUIRE(params.IsOk());
    CHECK(ParamsToJson(params.Value()) == args);
}

// ===========================================================================
// ToolDescriptor
// ===========================================================================

TEST_CASE("ToolDescriptor: Simple builds an empty object schema", "[mcp][primitives]") {
    auto tool = ToolDescriptor::Simple("t", "does things");
    CHECK(tool.input_schema["type"] == "object");
    CHECK(tool.input_schema["properties"].empty());
    CHECK(tool.input_schema["required"].empty());
}

TEST_CASE("ToolDescriptor: required inputs are not duplicated", "[mcp][primitives]") {
    auto tool = ToolDescriptor::Simple("t", "d");
    tool.AddInputProperty("a", {{"type", "number"}})
        .AddRequiredInput("a")
        .AddRequiredInput("a");
    CHECK(tool.input_schema["required"].size() == 1);
    CHECK(tool.input_schema["properties"]["a"]["type"] == "number");
}

TEST_CASE("ToolDescriptor: ToJson merges additionalProperties", "[mcp][primitives]") {
    auto tool = ToolDescriptor::Simple("t", "d");
    tool.Strict();
    tool.title = "Title";
    auto j = tool.ToJson();
    CHECK(j["name"] == "t");
    CHECK(j["title"] == "Title");
    CHECK(j["description"] == "d");
    CHECK(j["inputSchema"]["additionalProperties"] == false);
    CHECK_FALSE(j.contains("outputSchema"));
    CHECK_FALSE(j.contains("annotations"));
}

TEST_CASE("ToolDescriptor: optional fields appear when set", "[mcp][primitives]") {
    auto tool = ToolDescriptor::Simple("t", "d");
    tool.output_schema = nlohmann::json{{"type", "object"}};
    tool.annotations = nlohmann::json{{"readOnlyHint", true}};
    auto j = tool.ToJson();
    CHECK(j["outputSchema"]["type"] == "object");
    CHECK(j["annotations"]["readOnlyHint"] == true);
}

// ===========================================================================
// ResourceDescriptor / PromptDescriptor
// ===========================================================================

TEST_CASE("ResourceDescriptor: concrete projection", "[mcp][primitives]") {
    auto j = ResourceDescriptor::Json("res://a", "A", "first").ToJson();
    CHECK(j["uri"] == "res://a");
    CHECK_FALSE(j.contains("uriTemplate"));
    CHECK(j["name"] == "A");
    CHECK(j["mimeType"] == "application/json");
}

TEST_CASE("ResourceDescriptor: template projection", "[mcp][primitives]") {
    auto descriptor = ResourceDescriptor::Template("res://shot{?view}", "Shot", "d");
    CHECK(descriptor.IsTemplate());
    auto j = descriptor.ToJson();
    CHECK(j["uriTemplate"] == "res://shot{?view}");
    CHECK_FALSE(j.contains("uri"));
}

TEST_CASE("PromptDescriptor: arguments projection", "[mcp][primitives]") {
    PromptDescriptor prompt;
    prompt.name = "p";
    prompt.AddArgument({"detail", "how much", true, std::string("string")});
    auto j = prompt.ToJson();
    REQUIRE(j["arguments"].size() == 1);
    CHECK(j["arguments"][0]["name"] == "detail");
    CHECK(j["arguments"][0]["required"] == true);
    CHECK(j["arguments"][0]["type"] == "string");
}

// ===========================================================================
// Item construction
// ===========================================================================

TEST_CASE("Item: tool defaults to main-thread affinity", "[mcp][item]") {
    auto item = Item::Tool(ToolDescriptor::Simple("t", "d"), Noop);
    REQUIRE(item.IsOk());
    CHECK(item.Value().Name() == "t");
    CHECK(item.Value().Category() == ItemCategory::Tool);
    CHECK(item.Value().RunsOnMainThread());
    CHECK(item.Value().Describe()["name"] == "t");
}

TEST_CASE("Item: any-thread affinity is kept", "[mcp][item]") {
    auto item = Item::Tool(ToolDescriptor::Simple("t", "d"), Noop,
                           ThreadAffinity::AnyThread);
    REQUIRE(item.IsOk());
    CHECK_FALSE(item.Value().RunsOnMainThread());
}

TEST_CASE("Item: empty name rejected", "[mcp][item]") {
    auto item = Item::Tool(ToolDescriptor::Simple("", "d"), Noop);
    REQUIRE(item.IsErr());
    CHECK(item.Error().category == ErrorCategory::InvalidArgument);
}

TEST_CASE("Item: empty handler rejected", "[mcp][item]") {
    auto item = Item::Tool(ToolDescriptor::Simple("t", "d"), ItemHandler{});
    REQUIRE(item.IsErr());
    CHECK(item.Error().message.find("callable") != std::string::npos);
}

TEST_CASE("Item: resource needs exactly one address", "[mcp][item]") {
    ResourceDescriptor neither;
    neither.name = "r";
    CHECK(Item::Resource(neither, Noop).IsErr());

    auto both = ResourceDescriptor::Json("res://a", "r", "d");
    both.uri_template = "res://a/{x}";
    CHECK(Item::Resource(both, Noop).IsErr());

    CHECK(Item::Resource(ResourceDescriptor::Json("res://a", "r", "d"), Noop).IsOk());
}

TEST_CASE("Item: negative resource size rejected", "[mcp][item]") {
    auto descriptor = ResourceDescriptor::Json("res://a", "r", "d");
    descriptor.size = -1;
    CHECK(Item::Resource(descriptor, Noop).IsErr());
    descriptor.size = 0;
    CHECK(Item::Resource(descriptor, Noop).IsOk());
}

TEST_CASE("CategoryName: lower-case names", "[mcp][item]") {
    CHECK(std::string(CategoryName(ItemCategory::Tool)) == "tool");
    CHECK(std::string(CategoryName(ItemCategory::Resource)) == "resource");
    CHECK(std::string(CategoryName(ItemCategory::Prompt)) == "prompt");
}
