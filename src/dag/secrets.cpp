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


// Lattice Secret Resolver - Implementation

#include "secrets.hpp"

namespace lattice::dag {

std::string_view to_string(SecretUsage usage) noexcept {
    switch (usage) {
        case SecretUsage::Tls:
            return "tls";
        case SecretUsage::Ca:
            return "ca";
        case SecretUsage::Crl:
            return "crl";
    }
    return "unknown";
}

std::string secret_key(const source::NamespacedName& name, SecretUsage usage) {
    if (usage == SecretUsage::Tls) {
        return name.str();
    }
    return name.str() + "/" + std::string(to_string(usage));
}

std::error_code SecretResolver::resolve(const source::NamespacedName& name, SecretUsage usage,
                                        std::string_view target_ns, Dag& fragment,
                                        std::string& key) {
    if (!cache_.delegation_permitted(name, target_ns)) {
        return core::SecretError::DelegationNotPermitted;
    }
    return resolve_trusted(name, usage, fragment, key);
}

std::error_code SecretResolver::resolve_trusted(const source::NamespacedName& name,
                                                SecretUsage usage, Dag& fragment,
                                                std::string& key) {
    const auto* secret = cache_.get<source::Secret>(name);
    if (!secret) {
        return core::SecretError::NotFound;
    }

    auto [it, inserted] = results_.try_emplace({usage, name});
    if (inserted) {
        ++validated_;
        switch (usage) {
            case SecretUsage::Tls:
                it->second = core::validate_tls_secret(secret->type, secret->data);
                break;
            case SecretUsage::Ca:
                it->second = core::validate_ca_secret(secret->type, secret->data);
                break;
            case SecretUsage::Crl:
                it->second = core::validate_crl_secret(secret->type, secret->data);
                break;
        }
    }
    if (it->second) {
        return it->second;
    }

    key = secret_key(name, usage);
    fragment.secrets.try_emplace(key, Secret{name, std::string(to_string(usage)), secret->data});
    return {};
}

}  // namespace lattice::dag
