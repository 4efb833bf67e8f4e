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

// Lattice Configuration - Header
// JSON configuration schema using nlohmann/json for serialization

#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace lattice::control {

/// Graph builder settings
struct DagConfig {
    bool disable_route_sorting = false;  // Default when a root object does not say

    // Regex program size bounds (PCRE2 compiled size in bytes)
    uint32_t max_regex_program_size = 4096;      // Larger programs reject the route
    uint32_t regex_program_size_warning = 1024;  // Larger programs warn on the owning object

    std::vector<std::string> root_namespaces;     // Empty = root proxies allowed anywhere
    std::vector<std::string> watched_namespaces;  // Empty = all namespaces
    std::string fallback_certificate;             // "namespace/name", empty = none
    bool enable_external_name_service = false;

    // Route collisions between different schemas on the same listener + host
    std::string cross_schema_conflict_policy = "oldest-wins";  // oldest-wins, schema-precedence
    std::vector<std::string> schema_precedence = {"HTTPProxy", "HTTPRoute", "GRPCRoute",
                                                  "TLSRoute",  "TCPRoute",  "Ingress"};
};

/// Header mutation applied at the default level
struct HeaderPolicyConfig {
    std::map<std::string, std::string> set;
    std::vector<std::string> remove;
};

/// Default authorization policy for routes of proxies without their own
struct AuthPolicyConfig {
    bool disabled = false;
    std::map<std::string, std::string> context;
};

/// Global external authorization server
struct ExternalAuthConfig {
    std::string extension_service;  // "namespace/name"
    AuthPolicyConfig auth_policy;
    bool fail_open = false;
    uint32_t response_timeout_ms = 0;  // 0 = server default
};

/// Global rate limit service
struct GlobalRateLimitConfig {
    std::string extension_service;  // "namespace/name"
    std::string domain = "lattice";
    bool fail_open = false;
};

/// Default policy levels and filter ordering
struct PolicyConfig {
    bool auth_before_rate_limit = false;  // External auth runs after rate limiting by default
    std::optional<ExternalAuthConfig> global_external_auth;
    std::optional<GlobalRateLimitConfig> global_rate_limit;
    HeaderPolicyConfig request_headers;
    HeaderPolicyConfig response_headers;
};

/// Gateway API settings
struct GatewayConfig {
    std::string controller_name = "projectcontour.io/gateway-controller";
};

/// Rebuild debouncing
struct RebuildConfig {
    uint32_t holdoff_delay_ms = 100;      // Quiet period after the last change
    uint32_t holdoff_max_delay_ms = 500;  // Upper bound since the previous rebuild
};

/// Status write-back
struct StatusConfig {
    uint32_t max_retries = 5;
    uint32_t initial_backoff_ms = 100;
    uint32_t max_backoff_ms = 5000;
    std::string output;  // Directory for the file sink (empty = log only)
};

/// Logging configuration
struct LogConfig {
    std::string level = "info";               // debug, info, warning, error
    std::string format = "json";              // json, text
    std::string output = "/var/log/lattice";  // Log directory, or "stdout"

    struct RotationConfig {
        uint32_t max_size_mb = 100;
        uint32_t max_files = 10;
    } rotation;
};

/// Full Lattice configuration
struct Config {
    DagConfig dag;
    PolicyConfig policy;
    GatewayConfig gateway;
    RebuildConfig rebuild;
    StatusConfig status;

    // Observability
    LogConfig logging;

    // Metadata
    std::string version = "1.0";
    std::optional<std::string> description;
};

// All config types use custom from_json/to_json (no macros - avoids conflicts)

inline void from_json(const nlohmann::json& j, DagConfig& d) {
    d.disable_route_sorting = j.value("disable_route_sorting", false);
    d.max_regex_program_size = j.value("max_regex_program_size", 4096u);
    d.regex_program_size_warning = j.value("regex_program_size_warning", 1024u);
    d.root_namespaces = j.value("root_namespaces", std::vector<std::string>{});
    d.watched_namespaces = j.value("watched_namespaces", std::vector<std::string>{});
    d.fallback_certificate = j.value("fallback_certificate", std::string());
    d.enable_external_name_service = j.value("enable_external_name_service", false);
    d.cross_schema_conflict_policy =
        j.value("cross_schema_conflict_policy", std::string("oldest-wins"));
    if (j.contains("schema_precedence")) {
        j.at("schema_precedence").get_to(d.schema_precedence);
    }
}

inline void to_json(nlohmann::json& j, const DagConfig& d) {
    j["disable_route_sorting"] = d.disable_route_sorting;
    j["max_regex_program_size"] = d.max_regex_program_size;
    j["regex_program_size_warning"] = d.regex_program_size_warning;
    j["root_namespaces"] = d.root_namespaces;
    j["watched_namespaces"] = d.watched_namespaces;
    j["fallback_certificate"] = d.fallback_certificate;
    j["enable_external_name_service"] = d.enable_external_name_service;
    j["cross_schema_conflict_policy"] = d.cross_schema_conflict_policy;
    j["schema_precedence"] = d.schema_precedence;
}

inline void from_json(const nlohmann::json& j, HeaderPolicyConfig& h) {
    h.set = j.value("set", std::map<std::string, std::string>{});
    h.remove = j.value("remove", std::vector<std::string>{});
}

inline void to_json(nlohmann::json& j, const HeaderPolicyConfig& h) {
    j = nlohmann::json{{"set", h.set}, {"remove", h.remove}};
}

inline void from_json(const nlohmann::json& j, AuthPolicyConfig& a) {
    a.disabled = j.value("disabled", false);
    a.context = j.value("context", std::map<std::string, std::string>{});
}

inline void to_json(nlohmann::json& j, const AuthPolicyConfig& a) {
    j = nlohmann::json{{"disabled", a.disabled}, {"context", a.context}};
}

inline void from_json(const nlohmann::json& j, ExternalAuthConfig& a) {
    j.at("extension_service").get_to(a.extension_service);  // required
    a.auth_policy = j.value("auth_policy", AuthPolicyConfig{});
    a.fail_open = j.value("fail_open", false);
    a.response_timeout_ms = j.value("response_timeout_ms", 0u);
}

inline void to_json(nlohmann::json& j, const ExternalAuthConfig& a) {
    j = nlohmann::json{{"extension_service", a.extension_service},
                       {"auth_policy", a.auth_policy},
                       {"fail_open", a.fail_open},
                       {"response_timeout_ms", a.response_timeout_ms}};
}

inline void from_json(const nlohmann::json& j, GlobalRateLimitConfig& r) {
    j.at("extension_service").get_to(r.extension_service);  // required
    r.domain = j.value("domain", std::string("lattice"));
    r.fail_open = j.value("fail_open", false);
}

inline void to_json(nlohmann::json& j, const GlobalRateLimitConfig& r) {
    j = nlohmann::json{
        {"extension_service", r.extension_service}, {"domain", r.domain}, {"fail_open", r.fail_open}};
}

inline void from_json(const nlohmann::json& j, PolicyConfig& p) {
    p.auth_before_rate_limit = j.value("auth_before_rate_limit", false);

    // Optional fields with complex types - must use contains() to avoid triggering to_json()
    if (j.contains("global_external_auth")) {
        p.global_external_auth = j.at("global_external_auth").get<ExternalAuthConfig>();
    }
    if (j.contains("global_rate_limit")) {
        p.global_rate_limit = j.at("global_rate_limit").get<GlobalRateLimitConfig>();
    }
    if (j.contains("request_headers")) {
        j.at("request_headers").get_to(p.request_headers);
    }
    if (j.contains("response_headers")) {
        j.at("response_headers").get_to(p.response_headers);
    }
}

inline void to_json(nlohmann::json& j, const PolicyConfig& p) {
    j["auth_before_rate_limit"] = p.auth_before_rate_limit;
    if (p.global_external_auth) {
        j["global_external_auth"] = *p.global_external_auth;
    }
    if (p.global_rate_limit) {
        j["global_rate_limit"] = *p.global_rate_limit;
    }
    j["request_headers"] = p.request_headers;
    j["response_headers"] = p.response_headers;
}

inline void from_json(const nlohmann::json& j, GatewayConfig& g) {
    g.controller_name =
        j.value("controller_name", std::string("projectcontour.io/gateway-controller"));
}

inline void to_json(nlohmann::json& j, const GatewayConfig& g) {
    j = nlohmann::json{{"controller_name", g.controller_name}};
}

inline void from_json(const nlohmann::json& j, RebuildConfig& r) {
    r.holdoff_delay_ms = j.value("holdoff_delay_ms", 100u);
    r.holdoff_max_delay_ms = j.value("holdoff_max_delay_ms", 500u);
}

inline void to_json(nlohmann::json& j, const RebuildConfig& r) {
    j = nlohmann::json{{"holdoff_delay_ms", r.holdoff_delay_ms},
                       {"holdoff_max_delay_ms", r.holdoff_max_delay_ms}};
}

inline void from_json(const nlohmann::json& j, StatusConfig& s) {
    s.max_retries = j.value("max_retries", 5u);
    s.initial_backoff_ms = j.value("initial_backoff_ms", 100u);
    s.max_backoff_ms = j.value("max_backoff_ms", 5000u);
    s.output = j.value("output", std::string());
}

inline void to_json(nlohmann::json& j, const StatusConfig& s) {
    j = nlohmann::json{{"max_retries", s.max_retries},
                       {"initial_backoff_ms", s.initial_backoff_ms},
                       {"max_backoff_ms", s.max_backoff_ms},
                       {"output", s.output}};
}

inline void from_json(const nlohmann::json& j, LogConfig::RotationConfig& r) {
    r.max_size_mb = j.value("max_size_mb", 100u);
    r.max_files = j.value("max_files", 10u);
}

inline void to_json(nlohmann::json& j, const LogConfig::RotationConfig& r) {
    j = nlohmann::json{{"max_size_mb", r.max_size_mb}, {"max_files", r.max_files}};
}

inline void from_json(const nlohmann::json& j, LogConfig& l) {
    l.level = j.value("level", std::string("info"));
    l.format = j.value("format", std::string("json"));
    l.output = j.value("output", std::string("/var/log/lattice"));
    if (j.contains("rotation")) {
        j.at("rotation").get_to(l.rotation);
    }
}

inline void to_json(nlohmann::json& j, const LogConfig& l) {
    j["level"] = l.level;
    j["format"] = l.format;
    j["output"] = l.output;
    j["rotation"] = l.rotation;
}

inline void from_json(const nlohmann::json& j, Config& c) {
    if (j.contains("dag")) {
        j.at("dag").get_to(c.dag);
    }
    if (j.contains("policy")) {
        j.at("policy").get_to(c.policy);
    }
    if (j.contains("gateway")) {
        j.at("gateway").get_to(c.gateway);
    }
    if (j.contains("rebuild")) {
        j.at("rebuild").get_to(c.rebuild);
    }
    if (j.contains("status")) {
        j.at("status").get_to(c.status);
    }
    if (j.contains("logging")) {
        j.at("logging").get_to(c.logging);
    }
    c.version = j.value("version", std::string("1.0"));
    if (j.contains("description")) {
        c.description = j.at("description").get<std::string>();
    }
}

inline void to_json(nlohmann::json& j, const Config& c) {
    j["dag"] = c.dag;
    j["policy"] = c.policy;
    j["gateway"] = c.gateway;
    j["rebuild"] = c.rebuild;
    j["status"] = c.status;
    j["logging"] = c.logging;
    j["version"] = c.version;
    if (c.description) {
        j["description"] = *c.description;
    }
}

/// Configuration validation result
struct ValidationResult {
    bool valid = true;
    std::vector<std::string> errors;
    std::vector<std::string> warnings;

    void add_error(std::string error) {
        valid = false;
        errors.push_back(std::move(error));
    }

    void add_warning(std::string warning) { warnings.push_back(std::move(warning)); }

    void merge(const ValidationResult& other) {
        for (const auto& e : other.errors) {
            add_error(e);
        }
        for (const auto& w : other.warnings) {
            add_warning(w);
        }
    }

    [[nodiscard]] bool has_errors() const noexcept { return !valid || !errors.empty(); }
};

/// Configuration loader
class ConfigLoader {
public:
    /// Load configuration from JSON file
    [[nodiscard]] static std::optional<Config> load_from_file(std::string_view path);

    /// Load configuration from JSON string
    [[nodiscard]] static std::optional<Config> load_from_json(std::string_view json);

    /// Validate configuration
    [[nodiscard]] static ValidationResult validate(const Config& config);

    /// Convert configuration to JSON string
    [[nodiscard]] static std::string to_json(const Config& config);
};

/// Configuration manager with hot-reload support (RCU pattern)
class ConfigManager {
public:
    ConfigManager() = default;
    ~ConfigManager() = default;

    // Non-copyable, non-movable
    ConfigManager(const ConfigManager&) = delete;
    ConfigManager& operator=(const ConfigManager&) = delete;

    /// Load initial configuration
    [[nodiscard]] bool load(std::string_view path);

    /// Reload configuration (hot-reload with RCU)
    [[nodiscard]] bool reload();

    /// Get current configuration (thread-safe read)
    [[nodiscard]] std::shared_ptr<const Config> get() const noexcept;

    /// Get configuration file path
    [[nodiscard]] std::string_view config_path() const noexcept { return config_path_; }

    /// Check if configuration is loaded
    [[nodiscard]] bool is_loaded() const noexcept { return get() != nullptr; }

    /// Get last validation result
    [[nodiscard]] const ValidationResult& last_validation() const noexcept {
        return last_validation_;
    }

private:
    std::string config_path_;
    std::shared_ptr<const Config> current_config_;
    ValidationResult last_validation_;
};

}  // namespace lattice::control
