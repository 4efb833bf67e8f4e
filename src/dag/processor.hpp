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


// Lattice Processor - Header
// Common interface of the per-schema graph producers

#pragma once

#include <optional>
#include <string>
#include <string_view>

#include <quill/Logger.h>

#include "../control/config.hpp"
#include "../source/cache.hpp"
#include "conditions.hpp"
#include "dag.hpp"
#include "extensions.hpp"
#include "secrets.hpp"
#include "status.hpp"

namespace lattice::dag {

/// Everything a processor reads or reports into during one build
struct BuildContext {
    const source::ObjectCache& cache;
    const control::Config& config;
    StatusCache& status;
    SecretResolver& secrets;
    ExtensionResolver& extensions;
    RegexLimits regex_limits;
    quill::Logger* logger = nullptr;
};

/// A processor walks one schema family and emits a graph fragment plus the
/// status of every object it touched. Fragments are merged by the assembler.
class Processor {
public:
    virtual ~Processor() = default;

    [[nodiscard]] virtual std::string_view name() const noexcept = 0;

    virtual void run(BuildContext& ctx, Dag& fragment) = 0;
};

/// Regex limits from configuration
[[nodiscard]] RegexLimits regex_limits_from(const control::DagConfig& config) noexcept;

/// Resolve a backend service port (by number, or by name when port is 0).
/// Fails when the service or port is missing, the port is not TCP, or the
/// service is ExternalName and those are disabled.
[[nodiscard]] std::optional<Service> lookup_service(const source::ObjectCache& cache,
                                                    const source::NamespacedName& name,
                                                    int32_t port, std::string_view port_name,
                                                    bool enable_external_name,
                                                    std::string& error);

/// Upstream protocol of a service port: appProtocol first, then the
/// projectcontour.io/upstream-protocol.<proto> annotations. Empty = HTTP/1.1.
[[nodiscard]] std::string upstream_protocol(const source::ObjectCache& cache,
                                            const Service& service);

/// Lower-case, and valid as a DNS-1123 subdomain with an optional leading "*."
[[nodiscard]] bool valid_hostname(std::string_view hostname);

/// Literal IPv4 or IPv6 address
[[nodiscard]] bool is_ip_address(std::string_view host);

}  // namespace lattice::dag
