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


// Lattice DAG JSON - Header
// Deterministic rendering of a snapshot for the CLI and tests

#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include <vector>

#include "dag.hpp"
#include "status.hpp"

namespace lattice::dag {

/// Listeners, virtual hosts and clusters in name order, routes in final
/// order. Secrets are listed by name and usage; key material is never
/// rendered.
[[nodiscard]] nlohmann::json to_json(const Dag& dag);

/// {"sequence": n, "snapshot": {...}, "statuses": [...]}
[[nodiscard]] nlohmann::json to_json(const Dag& dag, const std::vector<ObjectStatus>& statuses);

[[nodiscard]] nlohmann::json to_json(const Route& route);

}  // namespace lattice::dag
