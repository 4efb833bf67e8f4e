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

// Lattice Route Sorter - Implementation

#include "sorter.hpp"

#include <algorithm>

namespace lattice::dag {

namespace {

int kind_rank(PathMatchKind kind) noexcept {
    switch (kind) {
        case PathMatchKind::Exact:
            return 0;
        case PathMatchKind::Regex:
            return 1;
        case PathMatchKind::Prefix:
            return 2;
    }
    return 3;
}

template <typename T>
bool more_predicates_first(const std::vector<T>& a, const std::vector<T>& b, int& verdict) {
    if (a.size() != b.size()) {
        verdict = a.size() > b.size() ? 1 : -1;
        return true;
    }
    for (size_t i = 0; i < a.size(); ++i) {
        auto sa = a[i].str();
        auto sb = b[i].str();
        if (sa != sb) {
            verdict = sa < sb ? 1 : -1;
            return true;
        }
    }
    return false;
}

}  // namespace

bool route_less(const Route& a, const Route& b) {
    const auto& pa = a.match.path;
    const auto& pb = b.match.path;

    if (pa.kind != pb.kind) {
        return kind_rank(pa.kind) < kind_rank(pb.kind);
    }
    if (pa.value.size() != pb.value.size()) {
        return pa.value.size() > pb.value.size();
    }
    if (pa.value != pb.value) {
        return pa.value < pb.value;
    }
    // Segment prefixes before string prefixes of the same value
    if (pa.prefix_type != pb.prefix_type) {
        return pa.prefix_type == PrefixMatchType::Segment;
    }

    if (a.method_priority || b.method_priority) {
        bool ma = !a.match.method.empty();
        bool mb = !b.match.method.empty();
        if (ma != mb) {
            return ma;
        }
    }

    int verdict = 0;
    if (more_predicates_first(a.match.headers, b.match.headers, verdict)) {
        return verdict > 0;
    }
    if (more_predicates_first(a.match.query_params, b.match.query_params, verdict)) {
        return verdict > 0;
    }
    return a.match.method < b.match.method;
}

void sort_routes(std::vector<Route>& routes) {
    std::stable_sort(routes.begin(), routes.end(), route_less);
}

void sort_dag(Dag& dag) {
    for (auto& [name, listener] : dag.listeners) {
        for (auto& [host, vhost] : listener.virtual_hosts) {
            if (!vhost.sorting_disabled) {
                sort_routes(vhost.routes);
            }
        }
    }
}

}  // namespace lattice::dag
