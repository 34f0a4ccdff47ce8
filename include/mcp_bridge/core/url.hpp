#pragma once

#include <map>
#include <string>
#include <string_view>

namespace mcp_bridge {

// ---------------------------------------------------------------------------
// UriParts: the RFC 3986 components of a URI, split without validation.
// `scheme://authority/path?query#fragment`
// ---------------------------------------------------------------------------
struct UriParts {
    std::string scheme;
    std::string authority;
    std::string path;
    std::string query;
    std::string fragment;
    bool has_authority = false;

    // scheme://authority/path with query and fragment dropped.
    [[nodiscard]] std::string Base() const;
};

UriParts SplitUri(std::string_view uri);

// Percent-decode a string. '+' decodes to a space (form encoding); malformed
// escapes are kept verbatim.
std::string UrlDecode(std::string_view value);

// Parse "a=1&b=two" into a map. Keys and values are percent-decoded, the
// first occurrence of a repeated key wins, and pairs with an empty value are
// dropped.
std::map<std::string, std::string> ParseQueryString(std::string_view query);

} // namespace mcp_bridge
