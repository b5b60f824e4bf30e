#include "planning/plan_extractor.hpp"

#include <algorithm>
#include <cctype>
#include <optional>

namespace planloop::planning {

using core::errors::ErrorCategory;
using core::errors::LifecycleError;
using nlohmann::json;

namespace {

constexpr const char* kReasoningTags[] = {"think", "thinking", "reasoning", "thought"};

std::string lowercase(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](const unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

// Index one past the '}' that closes the '{' at `open`, honouring JSON
// string literals.
std::optional<std::size_t> find_object_end(const std::string& text, const std::size_t open) {
    int depth = 0;
    bool in_string = false;
    bool escaped = false;
    for (std::size_t pos = open; pos < text.size(); ++pos) {
        const char c = text[pos];
        if (in_string) {
            if (escaped) {
                escaped = false;
            } else if (c == '\\') {
                escaped = true;
            } else if (c == '"') {
                in_string = false;
            }
            continue;
        }
        if (c == '"') {
            in_string = true;
        } else if (c == '{') {
            ++depth;
        } else if (c == '}') {
            --depth;
            if (depth == 0) {
                return pos + 1;
            }
        }
    }
    return std::nullopt;
}

bool is_plan_shaped(const json& value) {
    return value.is_object() && value.contains("plan") && value.at("plan").is_array();
}

}  // namespace

std::string strip_reasoning_blocks(const std::string& raw_text) {
    std::string text = raw_text;
    for (const char* tag : kReasoningTags) {
        const std::string open_tag = std::string("<") + tag + ">";
        const std::string close_tag = std::string("</") + tag + ">";
        while (true) {
            const std::string lowered = lowercase(text);
            const auto start = lowered.find(open_tag);
            if (start == std::string::npos) {
                break;
            }
            const auto end = lowered.find(close_tag, start + open_tag.size());
            if (end == std::string::npos) {
                text.erase(start);
                break;
            }
            text.erase(start, end + close_tag.size() - start);
        }
    }
    return text;
}

core::errors::Result<json> extract_plan_payload(const std::string& raw_text) {
    const std::string text = strip_reasoning_blocks(raw_text);
    const bool blank = std::all_of(text.begin(), text.end(), [](const unsigned char c) {
        return std::isspace(c) != 0;
    });
    if (blank) {
        return LifecycleError{ErrorCategory::Parse, "Planner returned an empty response.",
                              "empty_response"};
    }

    std::size_t open = text.find('{');
    while (open != std::string::npos) {
        const auto end = find_object_end(text, open);
        if (end.has_value()) {
            json candidate = json::parse(text.substr(open, end.value() - open), nullptr, false);
            if (!candidate.is_discarded() && is_plan_shaped(candidate)) {
                return candidate;
            }
        }
        open = text.find('{', open + 1);
    }

    return LifecycleError{ErrorCategory::Parse,
                          "Planner response contains no object with a 'plan' array.",
                          "no_plan_payload",
                          "Expected {\"plan\": [{\"type\": \"tool\", ...}, ...]}"};
}

}  // namespace planloop::planning
