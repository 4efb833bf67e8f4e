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

// Lattice Route Sorter - Header

#pragma once

#include <vector>

#include "dag.hpp"

namespace lattice::dag {

/// Route precedence. Exact paths come before regexes, regexes before prefixes.
/// Within a kind the longer value wins, then the lexicographically smaller.
/// At an equal path, routes with a method match (Gateway API) come first, then
/// routes with more header predicates, then more query predicates.
[[nodiscard]] bool route_less(const Route& a, const Route& b);

/// Stable sort of a virtual host's routes by route_less
void sort_routes(std::vector<Route>& routes);

/// Sort every virtual host of every listener unless the host disables sorting
void sort_dag(Dag& dag);

}  // namespace lattice::dag
