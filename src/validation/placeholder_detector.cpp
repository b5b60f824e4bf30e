#include "validation/placeholder_detector.hpp"

#include <cctype>
#include <regex>
#include <vector>

namespace planloop::validation {

namespace {

bool is_identifier_char(const char c) {
    return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '_';
}

bool is_token_char(const char c) {
    return is_identifier_char(c) || c == '-';
}

// True when the '<' at `open` is the header of an #include/#import line.
bool follows_include_directive(const std::string& value, const std::size_t open) {
    const auto line_start = value.rfind('\n', open);
    const std::size_t begin = line_start == std::string::npos ? 0 : line_start + 1;
    std::size_t pos = begin;
    while (pos < open && std::isspace(static_cast<unsigned char>(value[pos])) != 0) {
        ++pos;
    }
    const std::string prefix = value.substr(pos, open - pos);
    return prefix.rfind("#include", 0) == 0 || prefix.rfind("#import", 0) == 0;
}

std::optional<PlaceholderMatch> find_angle_token(const std::string& value) {
    std::size_t open = value.find('<');
    while (open != std::string::npos) {
        const bool glued_to_word = open > 0 && (is_identifier_char(value[open - 1]) ||
                                                value[open - 1] == '<');
        std::size_t pos = open + 1;
        bool well_formed = !glued_to_word && pos < value.size() &&
                           std::isalpha(static_cast<unsigned char>(value[pos])) != 0;
        std::string name;
        while (well_formed && pos < value.size() && value[pos] != '>') {
            const char c = value[pos];
            if (is_token_char(c)) {
                name.push_back(c);
            } else if (c == ' ' && !name.empty() && name.back() != ' ' &&
                       pos + 1 < value.size() && is_token_char(value[pos + 1])) {
                name.push_back(c);
            } else {
                well_formed = false;
            }
            ++pos;
        }
        well_formed = well_formed && pos < value.size() && value[pos] == '>';

        if (well_formed && !follows_include_directive(value, open)) {
            const std::string closing = "</" + name.substr(0, name.find(' ')) + ">";
            if (value.find(closing, pos) == std::string::npos) {
                return PlaceholderMatch{value.substr(open, pos - open + 1), open};
            }
        }
        open = value.find('<', open + 1);
    }
    return std::nullopt;
}

const std::vector<std::regex>& pattern_set() {
    static const std::vector<std::regex> patterns = {
        std::regex(R"(\$(?:output|outputs|step|steps|result)\[[^\]]*\])"),
        std::regex(R"(\$(?:output|outputs)\.[A-Za-z_]\w*)"),
        std::regex(R"(\{\{\s*[A-Za-z_][\w.\-]*\s*\}\})"),
        std::regex(R"(\b(?:YOUR|INSERT|REPLACE)_[A-Z0-9_]+\b)"),
    };
    return patterns;
}

}  // namespace

std::optional<PlaceholderMatch> find_placeholder(const std::string& value) {
    std::optional<PlaceholderMatch> best = find_angle_token(value);

    for (const auto& pattern : pattern_set()) {
        std::smatch match;
        if (!std::regex_search(value, match, pattern)) {
            continue;
        }
        const auto position = static_cast<std::size_t>(match.position(0));
        if (!best.has_value() || position < best->position) {
            best = PlaceholderMatch{match.str(0), position};
        }
    }
    return best;
}

}  // namespace planloop::validation
