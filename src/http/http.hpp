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

// Lattice HTTP - Header
// Request model used to evaluate compiled route matches

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace lattice::http {

/// HTTP methods
enum class Method : uint8_t {
    GET,
    POST,
    PUT,
    DELETE,
    HEAD,
    OPTIONS,
    PATCH,
    CONNECT,
    TRACE,
    UNKNOWN
};

/// Request as seen by route matching. Header and query lookups return the
/// first occurrence; header names compare case-insensitively.
struct Request {
    Method method = Method::GET;
    std::string authority;
    std::string path;  // Without query string
    std::vector<std::pair<std::string, std::string>> headers;
    std::vector<std::pair<std::string, std::string>> query;

    /// Build from a request target ("/path?a=b"); query values are percent-decoded
    [[nodiscard]] static Request from_target(Method method, std::string_view authority,
                                             std::string_view target);

    [[nodiscard]] std::optional<std::string_view> header(std::string_view name) const noexcept;
    [[nodiscard]] std::optional<std::string_view> query_param(std::string_view name) const noexcept;
};

[[nodiscard]] std::string_view to_string(Method method) noexcept;

/// Parse method string (case-sensitive, as on the wire)
[[nodiscard]] Method parse_method(std::string_view str) noexcept;

/// Redirect status codes a route may answer with
[[nodiscard]] constexpr bool is_redirect_status(uint32_t code) noexcept {
    return code == 301 || code == 302 || code == 303 || code == 307 || code == 308;
}

namespace url {

// URL decode a string (percent-decoding)
// Returns nullopt if invalid encoding (e.g., incomplete % sequence)
[[nodiscard]] std::optional<std::string> decode(std::string_view str);

}  // namespace url

}  // namespace lattice::http
