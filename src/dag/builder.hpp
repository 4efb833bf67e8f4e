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


// Lattice Graph Builder - Header
// Runs the schema processors and assembles their fragments into one snapshot

#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string_view>
#include <vector>

#include <quill/Logger.h>

#include "../control/config.hpp"
#include "../source/cache.hpp"
#include "dag.hpp"
#include "processor.hpp"
#include "status.hpp"

namespace lattice::dag {

/// Outcome of one build
struct BuildResult {
    Snapshot snapshot;
    std::vector<ObjectStatus> statuses;  // Ordered by object identity
    size_t secrets_validated = 0;
    size_t extensions_validated = 0;
};

/// Whether a wins over b when their output collides across schemas.
/// "oldest-wins" applies the object tie-break; "schema-precedence" ranks by
/// the configured kind order first and falls back to the tie-break.
[[nodiscard]] bool cross_schema_wins(const source::ObjectRef& a, const source::ObjectRef& b,
                                     const control::DagConfig& config);

/// Builds immutable graphs from a consistent cache view. Each processor fills
/// its own fragment; the assembler merges them, resolves collisions between
/// schemas, orders routes and prunes everything unreferenced.
///
/// build() either returns a complete snapshot or throws; a defect in a
/// processor never yields a partially assembled graph.
class Builder {
public:
    /// Builder with the HTTPProxy, Ingress and Gateway API processors
    explicit Builder(quill::Logger* logger = nullptr);

    /// Builder with an explicit processor set (in run order)
    Builder(std::vector<std::unique_ptr<Processor>> processors, quill::Logger* logger);

    Builder(const Builder&) = delete;
    Builder& operator=(const Builder&) = delete;
    Builder(Builder&&) = default;
    Builder& operator=(Builder&&) = default;

    [[nodiscard]] BuildResult build(const source::ObjectCache& cache,
                                    const control::Config& config, uint64_t sequence);

    [[nodiscard]] size_t processor_count() const noexcept { return processors_.size(); }

private:
    std::vector<std::unique_ptr<Processor>> processors_;
    quill::Logger* logger_ = nullptr;
};

/// Merge a processor fragment into the assembled graph. Collisions with
/// content already present are resolved with cross_schema_wins and appended
/// to merged.collisions.
void merge_fragment(Dag& merged, Dag fragment, const control::DagConfig& config);

/// Drop empty virtual hosts and listeners, then clusters and secrets nothing
/// references
void prune(Dag& dag);

}  // namespace lattice::dag
