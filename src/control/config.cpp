/*
 * Copyright 2025 Lattice Contributors
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *     http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

// Lattice Configuration - Implementation

#include "config.hpp"

#include <atomic>
#include <cstdio>
#include <fstream>
#include <nlohmann/json.hpp>
#include <sstream>

#include "config_validator.hpp"

namespace lattice::control {

// ConfigLoader implementation

std::optional<Config> ConfigLoader::load_from_file(std::string_view path) {
    std::string path_str{path};
    std::ifstream file{path_str};
    if (!file.is_open()) {
        fprintf(stderr, "Cannot open configuration file: %s\n", path_str.c_str());
        return std::nullopt;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    std::string json = buffer.str();

    return load_from_json(json);
}

std::optional<Config> ConfigLoader::load_from_json(std::string_view json) {
    Config config;

    try {
        auto j = nlohmann::json::parse(json);
        config = j.get<Config>();
    } catch (const nlohmann::json::exception& e) {
        fprintf(stderr, "JSON parsing error: %s\n", e.what());
        return std::nullopt;
    }

    auto validation = validate(config);

    if (validation.has_errors()) {
        for (const auto& error : validation.errors) {
            fprintf(stderr, "Configuration error: %s\n", error.c_str());
        }
        return std::nullopt;
    }

    return config;
}

ValidationResult ConfigLoader::validate(const Config& config) {
    ValidationResult result;

    // Regex bounds
    if (config.dag.max_regex_program_size == 0) {
        result.add_error("dag.max_regex_program_size must be > 0");
    }
    if (config.dag.regex_program_size_warning > config.dag.max_regex_program_size) {
        result.add_warning("dag.regex_program_size_warning (" +
                           std::to_string(config.dag.regex_program_size_warning) +
                           ") is above dag.max_regex_program_size (" +
                           std::to_string(config.dag.max_regex_program_size) +
                           "); no warnings will be reported");
    }

    // Fallback certificate reference
    const auto& fallback = config.dag.fallback_certificate;
    if (!fallback.empty()) {
        auto slash = fallback.find('/');
        if (slash == std::string::npos || slash == 0 || slash + 1 == fallback.size() ||
            fallback.find('/', slash + 1) != std::string::npos) {
            result.add_error("dag.fallback_certificate '" + fallback +
                             "' must be of the form namespace/name");
        }
    }

    // Rebuild holdoff
    if (config.rebuild.holdoff_max_delay_ms < config.rebuild.holdoff_delay_ms) {
        result.add_error("rebuild.holdoff_max_delay_ms must be >= rebuild.holdoff_delay_ms");
    }

    // Status write-back
    if (config.status.initial_backoff_ms == 0) {
        result.add_error("status.initial_backoff_ms must be > 0");
    }
    if (config.status.max_backoff_ms < config.status.initial_backoff_ms) {
        result.add_error("status.max_backoff_ms must be >= status.initial_backoff_ms");
    }

    // External services
    if (config.policy.global_external_auth &&
        config.policy.global_external_auth->extension_service.find('/') == std::string::npos) {
        result.add_error("policy.global_external_auth.extension_service must be namespace/name");
    }
    if (config.policy.global_rate_limit &&
        config.policy.global_rate_limit->extension_service.find('/') == std::string::npos) {
        result.add_error("policy.global_rate_limit.extension_service must be namespace/name");
    }

    if (config.gateway.controller_name.empty()) {
        result.add_warning("gateway.controller_name is empty; Gateway API objects are ignored");
    }

    // Enumerated fields with typo suggestions
    result.merge(ConfigValidator::validate(config));

    return result;
}

std::string ConfigLoader::to_json(const Config& config) {
    try {
        nlohmann::json j = config;
        return j.dump(2);  // 2-space indentation
    } catch (const nlohmann::json::exception& e) {
        fprintf(stderr, "JSON serialization error: %s\n", e.what());
        return "";
    }
}

// ConfigManager implementation

bool ConfigManager::load(std::string_view path) {
    config_path_ = path;

    auto maybe_config = ConfigLoader::load_from_file(path);
    if (!maybe_config.has_value()) {
        return false;
    }

    last_validation_ = ConfigLoader::validate(*maybe_config);
    if (last_validation_.has_errors()) {
        return false;
    }

    std::atomic_store(&current_config_, std::make_shared<const Config>(std::move(*maybe_config)));

    return true;
}

bool ConfigManager::reload() {
    if (config_path_.empty()) {
        return false;
    }

    auto maybe_config = ConfigLoader::load_from_file(config_path_);
    if (!maybe_config.has_value()) {
        return false;
    }

    last_validation_ = ConfigLoader::validate(*maybe_config);
    if (last_validation_.has_errors()) {
        return false;
    }

    // RCU pattern: readers holding the old config keep it alive until they release it
    auto new_config = std::make_shared<const Config>(std::move(*maybe_config));
    std::atomic_store(&current_config_, new_config);

    return true;
}

std::shared_ptr<const Config> ConfigManager::get() const noexcept {
    return std::atomic_load(&current_config_);
}

}  // namespace lattice::control
