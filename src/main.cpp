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


// Lattice - Main Entry Point
#include <atomic>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <memory>
#include <string>

#include "control/config.hpp"
#include "core/logging.hpp"
#include "core/tls.hpp"
#include "runtime/orchestrator.hpp"

namespace {

void signal_handler(int signal) {
    if (signal == SIGINT || signal == SIGTERM) {
        lattice::runtime::g_running = false;
    } else if (signal == SIGHUP) {
        lattice::runtime::g_reload_requested = true;
    }
}

void print_usage(const char* program) {
    fprintf(stderr,
            "Usage: %s --config <config.json> --objects <objects.json> [--output <snapshot.json>] "
            "[--watch]\n",
            program);
}

}  // namespace

int main(int argc, char* argv[]) {
    std::string config_path;
    lattice::runtime::RunOptions options;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            config_path = argv[++i];
        } else if (arg == "--objects" && i + 1 < argc) {
            options.objects_path = argv[++i];
        } else if (arg == "--output" && i + 1 < argc) {
            options.output_path = argv[++i];
        } else if (arg == "--watch") {
            options.watch = true;
        } else if (arg == "--help" || arg == "-h") {
            print_usage(argv[0]);
            return EXIT_SUCCESS;
        } else {
            fprintf(stderr, "Unknown argument: %s\n", arg.c_str());
            print_usage(argv[0]);
            return EXIT_FAILURE;
        }
    }
    if (config_path.empty() || options.objects_path.empty()) {
        print_usage(argv[0]);
        return EXIT_FAILURE;
    }

    lattice::core::initialize_openssl();

    auto config_manager = std::make_unique<lattice::control::ConfigManager>();
    if (!config_manager->load(config_path)) {
        fprintf(stderr, "Failed to load configuration from %s\n", config_path.c_str());

        const auto& validation = config_manager->last_validation();
        if (!validation.errors.empty()) {
            fprintf(stderr, "Configuration validation errors:\n");
            for (const auto& error : validation.errors) {
                fprintf(stderr, "  - %s\n", error.c_str());
            }
        }
        lattice::core::cleanup_openssl();
        return EXIT_FAILURE;
    }
    auto config = config_manager->get();

    lattice::logging::init_logging_system();
    auto* logger = lattice::logging::init_logger("lattice", config->logging);
    for (const auto& warning : config_manager->last_validation().warnings) {
        LOG_WARNING(logger, "Configuration: {}", warning);
    }

    std::error_code ec;
    if (options.watch) {
        std::signal(SIGINT, signal_handler);
        std::signal(SIGTERM, signal_handler);
        std::signal(SIGHUP, signal_handler);
        LOG_INFO(logger, "Watching {} (SIGHUP reloads, SIGINT stops)", options.objects_path);
        ec = lattice::runtime::run_watch(*config_manager, options);
    } else {
        ec = lattice::runtime::run_once(*config, options);
    }

    if (ec) {
        LOG_ERROR(logger, "Lattice failed: {}", ec.message());
    }
    lattice::logging::shutdown_logging();
    lattice::core::cleanup_openssl();
    return ec ? EXIT_FAILURE : EXIT_SUCCESS;
}
