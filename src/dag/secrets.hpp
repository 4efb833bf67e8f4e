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


// Lattice Secret Resolver - Header
// Lazy, memoized validation of secrets referenced during a build

#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

#include "../source/cache.hpp"
#include "dag.hpp"

namespace lattice::dag {

enum class SecretUsage : uint8_t {
    Tls,  // Serving keypair
    Ca,   // CA bundle for client or upstream validation
    Crl,  // Certificate revocation list
};

[[nodiscard]] std::string_view to_string(SecretUsage usage) noexcept;

/// Validates a secret only when something references it. Each (usage, secret)
/// pair is validated at most once per build; valid secrets are registered in
/// the fragment under a key that the graph uses to refer to them.
class SecretResolver {
public:
    explicit SecretResolver(const source::ObjectCache& cache) : cache_(cache) {}

    SecretResolver(const SecretResolver&) = delete;
    SecretResolver& operator=(const SecretResolver&) = delete;

    /// Resolve a secret for use from target_ns. Cross-namespace use needs a
    /// TLSCertificateDelegation (DelegationNotPermitted); a missing secret is
    /// NotFound; a present but malformed one reports the shape error.
    /// On success key receives the Dag::secrets key.
    [[nodiscard]] std::error_code resolve(const source::NamespacedName& name, SecretUsage usage,
                                          std::string_view target_ns, Dag& fragment,
                                          std::string& key);

    /// Resolve a secret named by configuration; no delegation check
    [[nodiscard]] std::error_code resolve_trusted(const source::NamespacedName& name,
                                                  SecretUsage usage, Dag& fragment,
                                                  std::string& key);

    /// Number of validations actually performed
    [[nodiscard]] size_t validated_count() const noexcept { return validated_; }

private:
    const source::ObjectCache& cache_;
    std::map<std::pair<SecretUsage, source::NamespacedName>, std::error_code> results_;
    size_t validated_ = 0;
};

/// Key of a validated secret in Dag::secrets
[[nodiscard]] std::string secret_key(const source::NamespacedName& name, SecretUsage usage);

}  // namespace lattice::dag
