#include "core/config/lab_config.hpp"

#include <fstream>
#include <system_error>
#include <utility>
#include <nlohmann/json.hpp>

namespace simlab::core::config {

using core::errors::ErrorCategory;
using core::errors::LabError;
using nlohmann::json;

namespace {

template <typename T>
core::errors::Result<T> read_unsigned(const json& doc, const char* key, const T fallback) {
    if (!doc.contains(key)) {
        return fallback;
    }
    const auto& value = doc.at(key);
    if (!value.is_number_unsigned()) {
        return LabError{ErrorCategory::Input,
                        std::string("Config key '") + key +
                            "' must be a non-negative integer.",
                        "invalid_config"};
    }
    return value.get<T>();
}

core::errors::Result<std::string> read_string(const json& doc, const char* key,
                                              const std::string& fallback) {
    if (!doc.contains(key)) {
        return fallback;
    }
    const auto& value = doc.at(key);
    if (!value.is_string()) {
        return LabError{ErrorCategory::Input,
                        std::string("Config key '") + key + "' must be a string.",
                        "invalid_config"};
    }
    return value.get<std::string>();
}

LabError bounds_error(const std::string& key, const std::string& bounds) {
    return LabError{ErrorCategory::Input, "Config value out of bounds: " + key,
                    "invalid_config", "Must be " + bounds + "."};
}

}  // namespace

std::filesystem::path LabConfig::resolve(const std::filesystem::path& path) const {
    if (path.is_absolute()) {
        return path;
    }
    return workspace / path;
}

core::errors::Result<LabConfig> load_config(const std::filesystem::path& path,
                                            LabConfig base) {
    std::ifstream in(path);
    if (!in.is_open()) {
        return LabError{ErrorCategory::Input,
                        "Unable to open config file: " + path.string(),
                        "config_not_found"};
    }

    json doc;
    try {
        in >> doc;
    } catch (const json::parse_error& e) {
        return LabError{ErrorCategory::Input,
                        "Config file is not valid JSON: " + std::string(e.what()),
                        "invalid_config"};
    }
    if (!doc.is_object()) {
        return LabError{ErrorCategory::Input, "Config root must be a JSON object.",
                        "invalid_config"};
    }

    LabConfig cfg = std::move(base);

    const std::pair<const char*, std::filesystem::path*> paths[] = {
        {"workspace", &cfg.workspace},
        {"models_dir", &cfg.models_dir},
        {"artifacts_dir", &cfg.artifacts_dir},
        {"scratch_dir", &cfg.scratch_dir},
        {"reports_file", &cfg.reports_file}};
    for (const auto& [key, target] : paths) {
        auto value = read_string(doc, key, target->string());
        if (core::errors::is_error(value)) {
            return core::errors::get_error(value);
        }
        *target = core::errors::get_value(value);
    }

    const std::pair<const char*, std::string*> strings[] = {
        {"interpreter", &cfg.interpreter},
        {"entry_point", &cfg.entry_point},
        {"model_name", &cfg.model_name}};
    for (const auto& [key, target] : strings) {
        auto value = read_string(doc, key, *target);
        if (core::errors::is_error(value)) {
            return core::errors::get_error(value);
        }
        *target = core::errors::get_value(value);
    }

    const std::pair<const char*, std::uint32_t*> numbers[] = {
        {"max_attempts", &cfg.max_attempts},
        {"smoke_timeout_ms", &cfg.smoke_timeout_ms},
        {"tool_timeout_ms", &cfg.tool_timeout_ms},
        {"model_timeout_ms", &cfg.model_timeout_ms},
        {"step_budget", &cfg.step_budget},
        {"history_window", &cfg.history_window},
        {"memory_limit_mb", &cfg.memory_limit_mb}};
    for (const auto& [key, target] : numbers) {
        auto value = read_unsigned<std::uint32_t>(doc, key, *target);
        if (core::errors::is_error(value)) {
            return core::errors::get_error(value);
        }
        *target = core::errors::get_value(value);
    }

    auto output_cap = read_unsigned<std::size_t>(doc, "max_output_bytes", cfg.max_output_bytes);
    if (core::errors::is_error(output_cap)) {
        return core::errors::get_error(output_cap);
    }
    cfg.max_output_bytes = core::errors::get_value(output_cap);

    if (doc.contains("model_command")) {
        const auto& command = doc.at("model_command");
        if (!command.is_array()) {
            return LabError{ErrorCategory::Input,
                            "Config key 'model_command' must be an array of strings.",
                            "invalid_config"};
        }
        cfg.model_command.clear();
        for (const auto& part : command) {
            if (!part.is_string()) {
                return LabError{ErrorCategory::Input,
                                "Config key 'model_command' must be an array of strings.",
                                "invalid_config"};
            }
            cfg.model_command.push_back(part.get<std::string>());
        }
    }

    return validate_config(std::move(cfg));
}

core::errors::Result<LabConfig> validate_config(LabConfig config) {
    if (config.max_attempts == 0 || config.max_attempts > 50) {
        return bounds_error("max_attempts", "between 1 and 50");
    }
    if (config.step_budget == 0 || config.step_budget > 1000) {
        return bounds_error("step_budget", "between 1 and 1000");
    }
    if (config.smoke_timeout_ms == 0 || config.tool_timeout_ms == 0 ||
        config.model_timeout_ms == 0) {
        return bounds_error("*_timeout_ms", "greater than zero");
    }
    if (config.history_window < 2) {
        return bounds_error("history_window", "at least 2");
    }
    if (config.memory_limit_mb < 16) {
        return bounds_error("memory_limit_mb", "at least 16");
    }
    if (config.max_output_bytes < 1024) {
        return bounds_error("max_output_bytes", "at least 1024");
    }
    if (config.interpreter.empty()) {
        return bounds_error("interpreter", "a non-empty program name");
    }
    if (config.entry_point.empty()) {
        return bounds_error("entry_point", "a non-empty identifier");
    }

    std::error_code ec;
    const auto canonical = std::filesystem::weakly_canonical(config.workspace, ec);
    if (ec) {
        return LabError{ErrorCategory::Input,
                        "Unable to resolve workspace: " + config.workspace.string(),
                        "invalid_path"};
    }
    config.workspace = canonical;
    return config;
}

}  // namespace simlab::core::config
