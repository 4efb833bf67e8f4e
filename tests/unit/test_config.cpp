// Lattice Configuration Layer Unit Tests

#include <catch2/catch_test_macros.hpp>
#include <filesystem>
#include <fstream>

#include "../../src/control/config.hpp"
#include "../../src/control/config_validator.hpp"

using namespace lattice::control;

namespace {

bool contains_message(const std::vector<std::string>& messages, std::string_view needle) {
    for (const auto& m : messages) {
        if (m.find(needle) != std::string::npos) {
            return true;
        }
    }
    return false;
}

}  // namespace

TEST_CASE("Config JSON serialization", "[control][config]") {
    Config config;
    config.dag.disable_route_sorting = true;
    config.rebuild.holdoff_delay_ms = 50;

    std::string json = ConfigLoader::to_json(config);
    REQUIRE_FALSE(json.empty());

    auto parsed = nlohmann::json::parse(json);
    REQUIRE(parsed["dag"]["disable_route_sorting"] == true);
    REQUIRE(parsed["rebuild"]["holdoff_delay_ms"] == 50);
    REQUIRE(parsed["dag"]["cross_schema_conflict_policy"] == "oldest-wins");
}

TEST_CASE("Config JSON deserialization", "[control][config]") {
    const char* json = R"({
        "version": "1.0",
        "dag": {
            "root_namespaces": ["roots"],
            "max_regex_program_size": 2048,
            "cross_schema_conflict_policy": "schema-precedence",
            "schema_precedence": ["Ingress", "HTTPProxy", "HTTPRoute",
                                  "GRPCRoute", "TLSRoute", "TCPRoute"]
        },
        "gateway": {"controller_name": "example.com/gateway"},
        "status": {"max_retries": 2},
        "policy": {
            "global_external_auth": {
                "extension_service": "auth/extauth",
                "auth_policy": {"disabled": true, "context": {"tier": "global"}}
            }
        }
    })";

    auto maybe_config = ConfigLoader::load_from_json(json);
    REQUIRE(maybe_config.has_value());

    const auto& config = *maybe_config;
    REQUIRE(config.dag.root_namespaces == std::vector<std::string>{"roots"});
    REQUIRE(config.dag.max_regex_program_size == 2048);
    REQUIRE(config.dag.schema_precedence.front() == "Ingress");
    REQUIRE(config.gateway.controller_name == "example.com/gateway");
    REQUIRE(config.status.max_retries == 2);
    REQUIRE(config.policy.global_external_auth->auth_policy.disabled);
    REQUIRE(config.policy.global_external_auth->auth_policy.context.at("tier") == "global");
    // Unset sections keep their defaults
    REQUIRE(config.rebuild.holdoff_delay_ms == 100);
    REQUIRE(config.rebuild.holdoff_max_delay_ms == 500);
    REQUIRE(config.dag.regex_program_size_warning == 1024);
}

TEST_CASE("Config defaults are valid", "[control][config]") {
    Config config;
    auto validation = ConfigLoader::validate(config);
    REQUIRE(validation.valid);
    REQUIRE_FALSE(validation.has_errors());
}

TEST_CASE("Config validation - malformed JSON", "[control][config]") {
    REQUIRE_FALSE(ConfigLoader::load_from_json("{ not json").has_value());
}

TEST_CASE("Config validation - numeric bounds", "[control][config]") {
    SECTION("Holdoff max below holdoff delay") {
        Config config;
        config.rebuild.holdoff_delay_ms = 500;
        config.rebuild.holdoff_max_delay_ms = 100;
        auto validation = ConfigLoader::validate(config);
        REQUIRE(validation.has_errors());
        REQUIRE(contains_message(validation.errors, "holdoff_max_delay_ms"));
    }

    SECTION("Zero regex program size") {
        Config config;
        config.dag.max_regex_program_size = 0;
        REQUIRE(ConfigLoader::validate(config).has_errors());
    }

    SECTION("Warning threshold above maximum is a warning only") {
        Config config;
        config.dag.regex_program_size_warning = 8192;
        auto validation = ConfigLoader::validate(config);
        REQUIRE_FALSE(validation.has_errors());
        REQUIRE_FALSE(validation.warnings.empty());
    }

    SECTION("Backoff bounds") {
        Config config;
        config.status.initial_backoff_ms = 1000;
        config.status.max_backoff_ms = 10;
        REQUIRE(ConfigLoader::validate(config).has_errors());
    }

    SECTION("Fallback certificate must be namespace/name") {
        Config config;
        config.dag.fallback_certificate = "just-a-name";
        REQUIRE(ConfigLoader::validate(config).has_errors());
        config.dag.fallback_certificate = "certs/fallback";
        REQUIRE_FALSE(ConfigLoader::validate(config).has_errors());
    }
}

TEST_CASE("Config validation - typo suggestions", "[control][config][validator]") {
    SECTION("Unknown conflict policy suggests the closest") {
        Config config;
        config.dag.cross_schema_conflict_policy = "oldest-win";
        auto validation = ConfigValidator::validate(config);
        REQUIRE(validation.has_errors());
        REQUIRE(contains_message(validation.errors, "did you mean 'oldest-wins'"));
    }

    SECTION("Unknown kind in precedence list") {
        Config config;
        config.dag.schema_precedence = {"HTTPProxy", "HTTPRoutes"};
        auto validation = ConfigValidator::validate(config);
        REQUIRE(contains_message(validation.errors, "did you mean 'HTTPRoute'"));
    }

    SECTION("Duplicate kind in precedence list") {
        Config config;
        config.dag.schema_precedence = {"HTTPProxy", "HTTPProxy"};
        REQUIRE(contains_message(ConfigValidator::validate(config).errors, "Duplicate kind"));
    }

    SECTION("Incomplete precedence list warns under schema-precedence") {
        Config config;
        config.dag.cross_schema_conflict_policy = "schema-precedence";
        config.dag.schema_precedence = {"Ingress"};
        auto validation = ConfigValidator::validate(config);
        REQUIRE_FALSE(validation.has_errors());
        REQUIRE(contains_message(validation.warnings, "ranks last"));
    }
}

TEST_CASE("Config validation - namespaces", "[control][config][validator]") {
    Config config;
    config.dag.root_namespaces = {"Bad_Namespace"};
    REQUIRE(ConfigValidator::validate(config).has_errors());

    config.dag.root_namespaces = {"roots"};
    config.dag.watched_namespaces = {"apps"};
    auto validation = ConfigValidator::validate(config);
    REQUIRE_FALSE(validation.has_errors());
    REQUIRE(contains_message(validation.warnings, "not watched"));
}

TEST_CASE("Config validation - logging", "[control][config][validator]") {
    Config config;
    config.logging.format = "xml";
    REQUIRE(ConfigValidator::validate(config).has_errors());

    config.logging.format = "text";
    config.logging.level = "verbose";
    auto validation = ConfigValidator::validate(config);
    REQUIRE_FALSE(validation.has_errors());
    REQUIRE_FALSE(validation.warnings.empty());
}

TEST_CASE("ConfigManager load and reload", "[control][config][manager]") {
    auto path = std::filesystem::temp_directory_path() / "lattice_config_manager_test.json";
    {
        std::ofstream out(path);
        out << R"({"dag": {"disable_route_sorting": false}})";
    }

    ConfigManager manager;
    REQUIRE_FALSE(manager.is_loaded());
    REQUIRE(manager.load(path.string()));
    auto first = manager.get();
    REQUIRE(first);
    REQUIRE_FALSE(first->dag.disable_route_sorting);

    {
        std::ofstream out(path);
        out << R"({"dag": {"disable_route_sorting": true}})";
    }
    REQUIRE(manager.reload());
    REQUIRE(manager.get()->dag.disable_route_sorting);
    // Readers holding the old snapshot keep it
    REQUIRE_FALSE(first->dag.disable_route_sorting);

    SECTION("Invalid reload keeps the current config") {
        {
            std::ofstream out(path);
            out << R"({"rebuild": {"holdoff_delay_ms": 900, "holdoff_max_delay_ms": 1}})";
        }
        REQUIRE_FALSE(manager.reload());
        REQUIRE(manager.get()->dag.disable_route_sorting);
    }

    std::filesystem::remove(path);
}

TEST_CASE("ConfigManager rejects a missing file", "[control][config][manager]") {
    ConfigManager manager;
    REQUIRE_FALSE(manager.load("/nonexistent/lattice.json"));
    REQUIRE_FALSE(manager.is_loaded());
}
