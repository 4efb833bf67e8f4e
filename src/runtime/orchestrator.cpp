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


// Lattice Runtime Orchestrator - Implementation

#include "orchestrator.hpp"

#include <chrono>
#include <cstdio>
#include <fstream>
#include <thread>
#include <utility>

#include "../core/logging.hpp"
#include "../dag/builder.hpp"
#include "../dag/json.hpp"
#include "../source/json.hpp"
#include "event_handler.hpp"

namespace lattice::runtime {

std::atomic<bool> g_running{true};
std::atomic<bool> g_reload_requested{false};

namespace {

/// Decode the objects file, logging entries that fail to decode
source::LoadResult load_objects(std::string_view path, quill::Logger* logger) {
    auto result = source::load_objects_from_file(path);
    for (const auto& error : result.errors) {
        LOG_WARNING(logger, "Objects file {}: {}", path, error);
    }
    return result;
}

}  // namespace

std::shared_ptr<StatusSink> make_status_sink(const control::StatusConfig& config) {
    if (config.output.empty()) {
        return std::make_shared<LogStatusSink>(logging::get_current_logger());
    }
    return std::make_shared<FileStatusSink>(config.output);
}

std::error_code write_output(std::string_view path, std::string_view text) {
    if (path.empty()) {
        std::fwrite(text.data(), 1, text.size(), stdout);
        std::fputc('\n', stdout);
        std::fflush(stdout);
        return {};
    }
    std::ofstream out{std::string(path), std::ios::trunc};
    if (!out.is_open()) {
        return std::make_error_code(std::errc::permission_denied);
    }
    out << text << '\n';
    if (!out) {
        return std::make_error_code(std::errc::io_error);
    }
    return {};
}

std::error_code run_once(const control::Config& config, const RunOptions& options) {
    auto* logger = logging::get_current_logger();

    auto loaded = load_objects(options.objects_path, logger);
    if (loaded.objects.empty() && !loaded.ok()) {
        return std::make_error_code(std::errc::invalid_argument);
    }

    source::ObjectCache cache(config.dag.watched_namespaces);
    for (auto& object : loaded.objects) {
        cache.insert(std::move(object));
    }
    cache.mark_synced();

    dag::Builder builder(logger);
    auto result = builder.build(cache, config, 1);
    LOG_INFO(logger, "Built snapshot: listeners={}, routes={}, clusters={}, statuses={}",
             result.snapshot->listeners.size(), result.snapshot->route_count(),
             result.snapshot->clusters.size(), result.statuses.size());

    if (!config.status.output.empty()) {
        FileStatusSink sink(config.status.output);
        for (const auto& status : result.statuses) {
            if (auto ec = sink.write(status)) {
                LOG_ERROR(logger, "Status write for {} failed: {}", status.object.str(),
                          ec.message());
            }
        }
    }

    return write_output(options.output_path,
                        dag::to_json(*result.snapshot, result.statuses).dump(2));
}

std::error_code run_watch(control::ConfigManager& manager, const RunOptions& options) {
    auto config = manager.get();
    if (!config) {
        return std::make_error_code(std::errc::invalid_argument);
    }
    auto* logger = logging::get_current_logger();

    StatusWriter writer(make_status_sink(config->status), config->status, logger);
    writer.start();

    EventHandler handler(config, logger);
    handler.set_status_writer(&writer);
    handler.set_observer([&options, logger](const dag::Snapshot& snapshot) {
        if (auto ec = write_output(options.output_path, dag::to_json(*snapshot).dump(2))) {
            LOG_ERROR(logger, "Writing snapshot {} failed: {}", snapshot->sequence, ec.message());
        }
    });
    handler.start();

    handler.on_replace_all(load_objects(options.objects_path, logger).objects);
    handler.mark_synced();

    while (g_running.load()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        if (!g_reload_requested.exchange(false)) {
            continue;
        }

        LOG_INFO(logger, "Reload requested");
        if (manager.reload()) {
            for (const auto& warning : manager.last_validation().warnings) {
                LOG_WARNING(logger, "Configuration: {}", warning);
            }
            handler.on_config(manager.get());
        } else {
            for (const auto& error : manager.last_validation().errors) {
                LOG_ERROR(logger, "Configuration: {}", error);
            }
            LOG_ERROR(logger, "Configuration reload failed, keeping the current configuration");
        }
        handler.on_replace_all(load_objects(options.objects_path, logger).objects);
    }

    handler.stop();
    if (!writer.wait_idle(std::chrono::seconds(2))) {
        LOG_WARNING(logger, "Stopping with status updates still pending");
    }
    writer.stop();
    return {};
}

}  // namespace lattice::runtime
