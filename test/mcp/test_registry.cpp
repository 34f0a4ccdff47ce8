#include <catch2/catch_test_macros.hpp>

#include <mcp_bridge/mcp/registry.hpp>

#include <string>
#include <thread>
#include <vector>

using namespace mcp_bridge;

namespace {

Item MakeTool(const std::string& name) {
    return Item::Tool(ToolDescriptor::Simple(name, "Test tool " + name),
                      [name](const ParamMap&) { return nlohmann::json(name); })
        .Value();
}

Item MakeResource(const std::string& name, const std::string& uri) {
    return Item::Resource(ResourceDescriptor::Json(uri, name, "Test resource"),
                          [](const ParamMap&) { return nlohmann::json::object(); })
        .Value();
}

Item MakeTemplate(const std::string& name, const std::string& uri_template) {
    return Item::Resource(ResourceDescriptor::Template(uri_template, name, "Test template"),
                          [](const ParamMap&) { return nlohmann::json::object(); })
        .Value();
}

} // anonymous namespace

// ===========================================================================
// Register / Get
// ===========================================================================

TEST_CASE("Registry: register and get a tool", "[mcp][registry]") {
    Registry registry;
    REQUIRE(registry.Register(MakeTool("echo")).IsOk());

    auto item = registry.Get(ItemCategory::Tool, "echo");
    REQUIRE(item.IsOk());
    CHECK(item.Value()->Name() == "echo");
    CHECK(item.Value()->Handler()({}) == "echo");
}

TEST_CASE("Registry: duplicate name in a category rejected", "[mcp][registry]") {
    Registry registry;
    REQUIRE(registry.Register(MakeTool("echo")).IsOk());

    auto second = registry.Register(MakeTool("echo"));
    REQUIRE(second.IsErr());
    CHECK(second.Error().category == ErrorCategory::DuplicateName);
    CHECK(second.Error().message == "Tool with name 'echo' already registered");
    CHECK(registry.Count() == 1);
}

TEST_CASE("Registry: same name allowed across categories", "[mcp][registry]") {
    Registry registry;
    REQUIRE(registry.Register(MakeTool("status")).IsOk());
    REQUIRE(registry.Register(MakeResource("status", "res://status")).IsOk());

    CHECK(registry.Has(ItemCategory::Tool, "status"));
    CHECK(registry.Has(ItemCategory::Resource, "status"));
    CHECK_FALSE(registry.Has(ItemCategory::Prompt, "status"));
}

TEST_CASE("Registry: get missing item is NotFound", "[mcp][registry]") {
    Registry registry;
    auto item = registry.Get(ItemCategory::Tool, "nope");
    REQUIRE(item.IsErr());
    CHECK(item.Error().category == ErrorCategory::NotFound);
    CHECK(item.Error().message == "Tool with name 'nope' not found");
}

// ===========================================================================
// Unregister
// ===========================================================================

TEST_CASE("Registry: unregister returns the removed item", "[mcp][registry]") {
    Registry registry;
    REQUIRE(registry.Register(MakeTool("a")).IsOk());

    auto removed = registry.Unregister(ItemCategory::Tool, "a");
    REQUIRE(removed.IsOk());
    CHECK(removed.Value()->Name() == "a");
    CHECK_FALSE(registry.Has(ItemCategory::Tool, "a"));

    // Name is free again.
    CHECK(registry.Register(MakeTool("a")).IsOk());
}

TEST_CASE("Registry: unregister missing item is NotFound", "[mcp][registry]") {
    Registry registry;
    auto removed = registry.Unregister(ItemCategory::Resource, "ghost");
    REQUIRE(removed.IsErr());
    CHECK(removed.Error().category == ErrorCategory::NotFound);
}

TEST_CASE("Registry: handle outlives unregister", "[mcp][registry]") {
    Registry registry;
    REQUIRE(registry.Register(MakeTool("kept")).IsOk());
    auto handle = registry.Get(ItemCategory::Tool, "kept").Value();
    REQUIRE(registry.Unregister(ItemCategory::Tool, "kept").IsOk());
    CHECK(handle->Handler()({}) == "kept");
}

// ===========================================================================
// Enumeration
// ===========================================================================

TEST_CASE("Registry: list preserves insertion order", "[mcp][registry]") {
    Registry registry;
    for (const auto* name : {"zeta", "alpha", "mid"}) {
        REQUIRE(registry.Register(MakeTool(name)).IsOk());
    }
    auto names = registry.Names(ItemCategory::Tool);
    REQUIRE(names.size() == 3);
    CHECK(names[0] == "zeta");
    CHECK(names[1] == "alpha");
    CHECK(names[2] == "mid");
    CHECK(registry.List(ItemCategory::Tool).size() == 3);
}

TEST_CASE("Registry: counts by category", "[mcp][registry]") {
    Registry registry;
    REQUIRE(registry.Register(MakeTool("t1")).IsOk());
    REQUIRE(registry.Register(MakeTool("t2")).IsOk());
    REQUIRE(registry.Register(MakeResource("r1", "res://r1")).IsOk());

    auto counts = registry.CountByCategory();
    CHECK(counts[ItemCategory::Tool] == 2);
    CHECK(counts[ItemCategory::Resource] == 1);
    CHECK(counts[ItemCategory::Prompt] == 0);
    CHECK(registry.Count() == 3);
}

TEST_CASE("Registry: clear empties every category", "[mcp][registry]") {
    Registry registry;
    REQUIRE(registry.Register(MakeTool("t")).IsOk());
    REQUIRE(registry.Register(MakeResource("r", "res://r")).IsOk());
    registry.Clear();
    CHECK(registry.Count() == 0);
    CHECK(registry.List(ItemCategory::Tool).empty());
}

// ===========================================================================
// FindResourceByUri
// ===========================================================================

TEST_CASE("Registry: find resource by concrete URI", "[mcp][registry]") {
    Registry registry;
    REQUIRE(registry.Register(MakeResource("status", "server://status")).IsOk());
    REQUIRE(registry.Register(MakeTemplate("items", "server://items/{category}")).IsOk());

    auto found = registry.FindResourceByUri("server://status");
    REQUIRE(found != nullptr);
    CHECK(found->Name() == "status");

    CHECK(registry.FindResourceByUri("server://items/{category}") == nullptr);
    CHECK(registry.FindResourceByUri("server://missing") == nullptr);
}

// ===========================================================================
// Concurrency
// ===========================================================================

TEST_CASE("Registry: concurrent registration keeps names unique", "[mcp][registry]") {
    Registry registry;
    constexpr int kThreads = 8;

    std::vector<std::thread> threads;
    std::vector<int> successes(kThreads, 0);
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([&registry, &successes, t]() {
            for (int i = 0; i < 20; ++i) {
                if (registry.Register(MakeTool("tool-" + std::to_string(i))).IsOk()) {
                    ++successes[t];
                }
            }
        });
    }
    for (auto& th : threads) {
        th.join();
    }

    int total = 0;
    for (int s : successes) total += s;
    CHECK(total == 20);
    CHECK(registry.Count() == 20);
}
