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


// Lattice Runtime Orchestrator - Header
// One-shot builds and the watch loop behind the command line

#pragma once

#include <atomic>
#include <memory>
#include <string>
#include <string_view>
#include <system_error>

#include "../control/config.hpp"
#include "status_writer.hpp"

namespace lattice::runtime {

// Set by the signal handlers in main
extern std::atomic<bool> g_running;
extern std::atomic<bool> g_reload_requested;

struct RunOptions {
    std::string objects_path;
    std::string output_path;  // Empty = stdout
    bool watch = false;
};

/// Status sink for the configuration: files under status.output, else the log
[[nodiscard]] std::shared_ptr<StatusSink> make_status_sink(const control::StatusConfig& config);

/// Write text to path, or to stdout when path is empty
[[nodiscard]] std::error_code write_output(std::string_view path, std::string_view text);

/// Build once from the objects file and write the snapshot with every status
[[nodiscard]] std::error_code run_once(const control::Config& config, const RunOptions& options);

/// Run the rebuild loop until g_running clears. A reload request re-reads the
/// configuration and the objects file.
[[nodiscard]] std::error_code run_watch(control::ConfigManager& manager,
                                        const RunOptions& options);

}  // namespace lattice::runtime
