#include <catch2/catch_test_macros.hpp>

#include <mcp_bridge/mcp/uri_template.hpp>

using namespace mcp_bridge;

// ===========================================================================
// Query-style templates
// ===========================================================================

TEST_CASE("UriTemplate: query template base", "[mcp][uri_template]") {
    UriTemplate tpl("res://shot{?view,width}");
    CHECK(tpl.GetKind() == UriTemplate::Kind::Query);
    CHECK(tpl.QueryBase() == "res://shot");
    REQUIRE(tpl.VariableNames().size() == 2);
    CHECK(tpl.VariableNames()[0] == "view");
    CHECK(tpl.VariableNames()[1] == "width");
}

TEST_CASE("UriTemplate: query template matches with and without query", "[mcp][uri_template]") {
    UriTemplate tpl("res://shot{?view,width}");
    CHECK(tpl.Match("res://shot?view=top&width=100").has_value());
    CHECK(tpl.Match("res://shot").has_value());
    CHECK(tpl.Match("res://shot#frag").has_value());
}

TEST_CASE("UriTemplate: query template ignores undeclared variables", "[mcp][uri_template]") {
    UriTemplate tpl("res://shot{?view}");
    CHECK(tpl.Match("res://shot?other=1").has_value());
}

TEST_CASE("UriTemplate: query template rejects other bases", "[mcp][uri_template]") {
    UriTemplate tpl("res://shot{?view}");
    CHECK_FALSE(tpl.Match("res://shots?view=top").has_value());
    CHECK_FALSE(tpl.Match("res://shot/extra?view=top").has_value());
    CHECK_FALSE(tpl.Match("other://shot?view=top").has_value());
}

TEST_CASE("UriTemplate: trailing slash before query group is dropped", "[mcp][uri_template]") {
    UriTemplate tpl("res://docs/{?q}");
    CHECK(tpl.QueryBase() == "res://docs");
    CHECK(tpl.Match("res://docs?q=x").has_value());
}

TEST_CASE("UriTemplate: query match has no captures", "[mcp][uri_template]") {
    UriTemplate tpl("server://echo{?text}");
    auto match = tpl.Match("server://echo?text=hi");
    REQUIRE(match.has_value());
    CHECK(match->empty());
}

// ===========================================================================
// Path-variable templates
// ===========================================================================

TEST_CASE("UriTemplate: single path variable", "[mcp][uri_template]") {
    UriTemplate tpl("server://items/{category}");
    CHECK(tpl.GetKind() == UriTemplate::Kind::Path);
    auto match = tpl.Match("server://items/tools");
    REQUIRE(match.has_value());
    CHECK(match->at("category") == "tools");
}

TEST_CASE("UriTemplate: several path variables", "[mcp][uri_template]") {
    UriTemplate tpl("res://docs/{section}/{page}.md");
    auto match = tpl.Match("res://docs/api/intro.md");
    REQUIRE(match.has_value());
    CHECK(match->at("section") == "api");
    CHECK(match->at("page") == "intro");
}

TEST_CASE("UriTemplate: variable does not span segments", "[mcp][uri_template]") {
    UriTemplate tpl("server://items/{category}");
    CHECK_FALSE(tpl.Match("server://items/tools/extra").has_value());
}

TEST_CASE("UriTemplate: variable must be non-empty", "[mcp][uri_template]") {
    UriTemplate tpl("server://items/{category}");
    CHECK_FALSE(tpl.Match("server://items/").has_value());
}

TEST_CASE("UriTemplate: match is anchored", "[mcp][uri_template]") {
    UriTemplate tpl("server://items/{category}");
    CHECK_FALSE(tpl.Match("xserver://items/tools").has_value());
    CHECK_FALSE(tpl.Match("server://items").has_value());
}

TEST_CASE("UriTemplate: path match ignores the query string", "[mcp][uri_template]") {
    UriTemplate tpl("server://items/{category}");
    auto match = tpl.Match("server://items/tools?verbose=1");
    REQUIRE(match.has_value());
    CHECK(match->at("category") == "tools");
}

TEST_CASE("UriTemplate: literal text around variables", "[mcp][uri_template]") {
    UriTemplate tpl("res://v{major}.{minor}");
    auto match = tpl.Match("res://v1.25");
    REQUIRE(match.has_value());
    CHECK(match->at("major") == "1");
    CHECK(match->at("minor") == "25");
}

TEST_CASE("UriTemplate: template without variables is literal", "[mcp][uri_template]") {
    UriTemplate tpl("res://fixed");
    CHECK(tpl.Match("res://fixed").has_value());
    CHECK_FALSE(tpl.Match("res://fixed2").has_value());
}

// ===========================================================================
// QueryArguments
// ===========================================================================

TEST_CASE("QueryArguments: decoded, first wins, blanks dropped", "[mcp][uri_template]") {
    auto args = QueryArguments("res://shot?view=top&width=100&view=side&empty=");
    CHECK(args.size() == 2);
    CHECK(args["view"] == "top");
    CHECK(args["width"] == "100");
}

TEST_CASE("QueryArguments: no query", "[mcp][uri_template]") {
    CHECK(QueryArguments("res://shot").empty());
}
