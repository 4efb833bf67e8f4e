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

// Lattice Source JSON - Header
// Decoding of object lists ({"items": [...]}) into the source object model

#pragma once

#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "objects.hpp"

namespace lattice::source {

/// Outcome of decoding an object list. Objects that fail to decode are
/// skipped and reported in errors; the rest are returned.
struct LoadResult {
    std::vector<Object> objects;
    std::vector<std::string> errors;

    [[nodiscard]] bool ok() const noexcept { return errors.empty(); }
};

/// Decode one object. Dispatches on "kind"; returns nullopt with error set
/// when the kind is unknown or a field has the wrong type.
[[nodiscard]] std::optional<Object> decode_object(const nlohmann::json& j, std::string& error);

/// Decode {"items": [...]} or a bare array
[[nodiscard]] LoadResult load_objects_from_json(std::string_view json);

[[nodiscard]] LoadResult load_objects_from_file(std::string_view path);

/// Standard base64 (padding required, embedded whitespace ignored)
[[nodiscard]] std::optional<std::string> base64_decode(std::string_view input);

/// RFC 3339 timestamp to seconds since the epoch
[[nodiscard]] std::optional<int64_t> parse_rfc3339(std::string_view value);

}  // namespace lattice::source
