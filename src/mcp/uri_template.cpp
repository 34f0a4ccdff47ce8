#include <mcp_bridge/mcp/uri_template.hpp>

#include <mcp_bridge/core/url.hpp>

#include <cctype>

namespace mcp_bridge {

namespace {

bool IsIdentifier(std::string_view s) {
    if (s.empty()) return false;
    for (char c : s) {
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '_') {
            return false;
        }
    }
    return true;
}

// Split "a,b , c" into trimmed names.
std::vector<std::string> SplitNames(std::string_view list) {
    std::vector<std::string> names;
    while (!list.empty()) {
        auto comma = list.find(',');
        auto name = list.substr(0, comma);
        while (!name.empty() && name.front() == ' ') name.remove_prefix(1);
        while (!name.empty() && name.back() == ' ') name.remove_suffix(1);
        if (!name.empty()) names.emplace_back(name);
        if (comma == std::string_view::npos) break;
        list = list.substr(comma + 1);
    }
    return names;
}

} // anonymous namespace

UriTemplate::UriTemplate(std::string pattern) : pattern_(std::move(pattern)) {
    kind_ = pattern_.find("{?") != std::string::npos ? Kind::Query : Kind::Path;

    if (kind_ == Kind::Query) {
        // Drop every {...} group, then trailing slashes.
        std::string base;
        size_t pos = 0;
        while (pos < pattern_.size()) {
            auto open = pattern_.find('{', pos);
            if (open == std::string::npos) {
                base += pattern_.substr(pos);
                break;
            }
            auto close = pattern_.find('}', open);
            if (close == std::string::npos) {
                base += pattern_.substr(pos);
                break;
            }
            base += pattern_.substr(pos, open - pos);
            std::string_view group(pattern_.data() + open + 1, close - open - 1);
            if (!group.empty() && group.front() == '?') {
                for (auto& name : SplitNames(group.substr(1))) {
                    variable_names_.push_back(std::move(name));
                }
            }
            pos = close + 1;
        }
        while (!base.empty() && base.back() == '/') {
            base.pop_back();
        }
        query_base_ = std::move(base);
        return;
    }

    // Path template: only {identifier} groups are variables.
    std::string literal;
    size_t pos = 0;
    while (pos < pattern_.size()) {
        auto open = pattern_.find('{', pos);
        auto close = open == std::string::npos ? std::string::npos
                                               : pattern_.find('}', open);
        if (open == std::string::npos || close == std::string::npos) {
            literal += pattern_.substr(pos);
            break;
        }
        std::string_view name(pattern_.data() + open + 1, close - open - 1);
        literal += pattern_.substr(pos, open - pos);
        if (IsIdentifier(name)) {
            if (!literal.empty()) {
                tokens_.push_back({false, std::move(literal)});
                literal.clear();
            }
            tokens_.push_back({true, std::string(name)});
            variable_names_.emplace_back(name);
        } else {
            literal += pattern_.substr(open, close - open + 1);
        }
        pos = close + 1;
    }
    if (!literal.empty()) {
        tokens_.push_back({false, std::move(literal)});
    }
}

std::optional<std::map<std::string, std::string>> UriTemplate::Match(
    std::string_view uri) const {
    auto parts = SplitUri(uri);

    if (kind_ == Kind::Query) {
        if (parts.Base() == query_base_) {
            return std::map<std::string, std::string>{};
        }
        return std::nullopt;
    }

    std::map<std::string, std::string> captures;
    auto base = parts.Base();
    if (MatchFrom(0, base, captures)) {
        return captures;
    }
    return std::nullopt;
}

bool UriTemplate::MatchFrom(std::size_t index, std::string_view rest,
                            std::map<std::string, std::string>& captures) const {
    if (index == tokens_.size()) {
        return rest.empty();
    }

    const auto& token = tokens_[index];
    if (!token.is_variable) {
        if (rest.substr(0, token.text.size()) != token.text) {
            return false;
        }
        return MatchFrom(index + 1, rest.substr(token.text.size()), captures);
    }

    // Longest segment first, backtracking towards one character.
    auto limit = rest.find('/');
    if (limit == std::string_view::npos) {
        limit = rest.size();
    }
    for (auto len = limit; len > 0; --len) {
        captures[token.text] = std::string(rest.substr(0, len));
        if (MatchFrom(index + 1, rest.substr(len), captures)) {
            return true;
        }
    }
    captures.erase(token.text);
    return false;
}

std::map<std::string, std::string> QueryArguments(std::string_view uri) {
    return ParseQueryString(SplitUri(uri).query);
}

} // namespace mcp_bridge
