#pragma once

#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace mcp_bridge {

// ---------------------------------------------------------------------------
// UriTemplate: the subset of RFC 6570 used by resource templates.
//
// Two forms are recognised:
//   - Query style, e.g. "res://shot{?view,width}". The template matches any
//     URI whose scheme://authority/path equals the template with every {...}
//     group and trailing '/' removed. Query variables are not checked
//     against the declaration.
//   - Path style, e.g. "res://items/{category}/{name}". Every {identifier}
//     matches one non-empty run of characters without '/'; everything else
//     is literal and the whole path must match.
// ---------------------------------------------------------------------------
class UriTemplate {
public:
    enum class Kind {
        Query,
        Path,
    };

    explicit UriTemplate(std::string pattern);

    [[nodiscard]] const std::string& Pattern() const noexcept { return pattern_; }
    [[nodiscard]] Kind GetKind() const noexcept { return kind_; }

    // Names declared in the template: path variables for Path templates,
    // the {?a,b} list for Query templates.
    [[nodiscard]] const std::vector<std::string>& VariableNames() const noexcept {
        return variable_names_;
    }

    // Literal prefix a Query template compares against; empty for Path.
    [[nodiscard]] const std::string& QueryBase() const noexcept { return query_base_; }

    // nullopt when the URI does not match. On a match, the path-variable
    // captures (always empty for Query templates).
    [[nodiscard]] std::optional<std::map<std::string, std::string>> Match(
        std::string_view uri) const;

private:
    struct Token {
        bool is_variable = false;
        std::string text;  // literal text or variable name
    };

    bool MatchFrom(std::size_t index, std::string_view rest,
                   std::map<std::string, std::string>& captures) const;

    std::string pattern_;
    Kind kind_ = Kind::Path;
    std::string query_base_;
    std::vector<Token> tokens_;
    std::vector<std::string> variable_names_;
};

// Query parameters of `uri`, decoded (see ParseQueryString).
std::map<std::string, std::string> QueryArguments(std::string_view uri);

} // namespace mcp_bridge
