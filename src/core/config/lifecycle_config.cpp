#include "core/config/lifecycle_config.hpp"

#include <fstream>
#include <random>
#include <sstream>
#include <nlohmann/json.hpp>

namespace planloop::core::config {

using errors::ErrorCategory;
using errors::LifecycleError;
using nlohmann::json;

namespace {

LifecycleError invalid_value(const std::string& key, const std::string& why) {
    return LifecycleError{ErrorCategory::Input,
                          "Invalid value for config key '" + key + "': " + why,
                          "invalid_config_value"};
}

errors::Result<std::uint32_t> read_uint(const json& value, const std::string& key,
                                        const std::uint32_t min_value,
                                        const std::uint32_t max_value) {
    if (!value.is_number_integer()) {
        return invalid_value(key, "expected an integer");
    }
    const auto raw = value.get<std::int64_t>();
    if (raw < static_cast<std::int64_t>(min_value) ||
        raw > static_cast<std::int64_t>(max_value)) {
        return invalid_value(key, "must be between " + std::to_string(min_value) +
                                      " and " + std::to_string(max_value));
    }
    return static_cast<std::uint32_t>(raw);
}

}  // namespace

errors::Result<LifecycleConfig> config_from_json_text(const std::string& text) {
    const json document = json::parse(text, nullptr, false);
    if (document.is_discarded()) {
        return LifecycleError{ErrorCategory::Input, "Config is not valid JSON.",
                              "invalid_config_json"};
    }
    if (!document.is_object()) {
        return LifecycleError{ErrorCategory::Input,
                              "Config must be a JSON object.",
                              "invalid_config_json"};
    }

    LifecycleConfig config;
    for (const auto& item : document.items()) {
        const std::string& key = item.key();
        const json& value = item.value();
        errors::Result<std::uint32_t> number = std::uint32_t{0};
        if (key == "max_attempts") {
            number = read_uint(value, key, 1, kMaxAttemptsUpperBound);
            if (!errors::is_error(number)) config.max_attempts = errors::get_value(number);
        } else if (key == "max_consecutive_parse_failures") {
            number = read_uint(value, key, 1, kMaxAttemptsUpperBound);
            if (!errors::is_error(number)) {
                config.max_consecutive_parse_failures = errors::get_value(number);
            }
        } else if (key == "planner_timeout_ms") {
            number = read_uint(value, key, 1, UINT32_MAX);
            if (!errors::is_error(number)) config.planner_timeout_ms = errors::get_value(number);
        } else if (key == "step_timeout_ms") {
            number = read_uint(value, key, 1, UINT32_MAX);
            if (!errors::is_error(number)) config.step_timeout_ms = errors::get_value(number);
        } else if (key == "attempt_timeout_ms") {
            number = read_uint(value, key, 1, UINT32_MAX);
            if (!errors::is_error(number)) config.attempt_timeout_ms = errors::get_value(number);
        } else if (key == "artifact_subdir") {
            if (!value.is_string() || value.get<std::string>().empty()) {
                return invalid_value(key, "expected a non-empty string");
            }
            config.artifact_subdir = value.get<std::string>();
        } else if (key == "log_level") {
            if (!value.is_string() ||
                !logging::Logger::parse_level(value.get<std::string>(), config.log_level)) {
                return invalid_value(key, "expected one of debug, info, warn, error");
            }
        } else {
            return LifecycleError{ErrorCategory::Input,
                                  "Unknown config key: " + key,
                                  "unknown_config_key"};
        }
        if (errors::is_error(number)) {
            return errors::get_error(number);
        }
    }
    return config;
}

errors::Result<LifecycleConfig> load_config(const std::filesystem::path& path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        return LifecycleError{ErrorCategory::Input,
                              "Unable to open config file: " + path.string(),
                              "config_open_failed"};
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    return config_from_json_text(buffer.str());
}

std::string generate_run_id() {
    std::random_device rd;
    std::mt19937 gen(rd());
    std::uniform_int_distribution<> dis(0, 15);

    std::stringstream ss;
    ss << "run-";
    for (int i = 0; i < 8; ++i) {
        ss << std::hex << dis(gen);
    }
    return ss.str();
}

}  // namespace planloop::core::config
