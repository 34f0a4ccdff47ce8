#include <mcp_bridge/core/url.hpp>

namespace mcp_bridge {

namespace {

int HexValue(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

} // anonymous namespace

std::string UriParts::Base() const {
    std::string base;
    if (!scheme.empty()) {
        base += scheme + ":";
    }
    if (has_authority) {
        base += "//" + authority;
    }
    base += path;
    return base;
}

UriParts SplitUri(std::string_view uri) {
    UriParts parts;

    auto hash = uri.find('#');
    if (hash != std::string_view::npos) {
        parts.fragment = std::string(uri.substr(hash + 1));
        uri = uri.substr(0, hash);
    }

    auto question = uri.find('?');
    if (question != std::string_view::npos) {
        parts.query = std::string(uri.substr(question + 1));
        uri = uri.substr(0, question);
    }

    // A scheme is letters/digits/+/-/. terminated by ':' before any '/'.
    auto colon = uri.find(':');
    auto slash = uri.find('/');
    if (colon != std::string_view::npos && colon > 0 &&
        (slash == std::string_view::npos || colon < slash)) {
        parts.scheme = std::string(uri.substr(0, colon));
        uri = uri.substr(colon + 1);
    }

    if (uri.substr(0, 2) == "//") {
        parts.has_authority = true;
        uri = uri.substr(2);
        auto path_start = uri.find('/');
        if (path_start == std::string_view::npos) {
            parts.authority = std::string(uri);
            uri = {};
        } else {
            parts.authority = std::string(uri.substr(0, path_start));
            uri = uri.substr(path_start);
        }
    }

    parts.path = std::string(uri);
    return parts;
}

std::string UrlDecode(std::string_view value) {
    std::string decoded;
    decoded.reserve(value.size());
    for (size_t i = 0; i < value.size(); ++i) {
        char c = value[i];
        if (c == '+') {
            decoded += ' ';
        } else if (c == '%' && i + 2 < value.size() &&
                   HexValue(value[i + 1]) >= 0 && HexValue(value[i + 2]) >= 0) {
            decoded += static_cast<char>(HexValue(value[i + 1]) * 16 +
                                         HexValue(value[i + 2]));
            i += 2;
        } else {
            decoded += c;
        }
    }
    return decoded;
}

std::map<std::string, std::string> ParseQueryString(std::string_view query) {
    std::map<std::string, std::string> params;
    while (!query.empty()) {
        auto amp = query.find('&');
        auto pair = query.substr(0, amp);
        query = (amp == std::string_view::npos) ? std::string_view{}
                                                : query.substr(amp + 1);
        if (pair.empty()) continue;

        auto eq = pair.find('=');
        if (eq == std::string_view::npos) continue;  // no value: blank

        auto key = UrlDecode(pair.substr(0, eq));
        auto value = UrlDecode(pair.substr(eq + 1));
        if (value.empty()) continue;
        params.emplace(std::move(key), std::move(value));  // first wins
    }
    return params;
}

} // namespace mcp_bridge
