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

// Lattice Status - Implementation

#include "status.hpp"

#include <algorithm>
#include <utility>

#include <fmt/format.h>

namespace lattice::dag {

namespace {

constexpr std::string_view kValidCondition = "Valid";

void merge_sub_condition(std::vector<SubCondition>& list, std::string_view type,
                         std::string_view reason, std::string_view message) {
    for (auto& sc : list) {
        if (sc.type != type) {
            continue;
        }
        if (sc.reason != reason) {
            sc.reason = "MultipleReasons";
        }
        // Repeated visits of one object report the same problem once
        if (sc.message != message && sc.message.find(message) == std::string::npos) {
            sc.message += ", ";
            sc.message += message;
        }
        return;
    }
    list.push_back(SubCondition{std::string(type), std::string(reason), std::string(message)});
}

bool is_gateway_route(source::Kind kind) noexcept {
    return kind == source::Kind::HTTPRoute || kind == source::Kind::GRPCRoute ||
           kind == source::Kind::TLSRoute || kind == source::Kind::TCPRoute;
}

nlohmann::json condition_json(const Condition& c) {
    return nlohmann::json{{"type", c.type},
                          {"status", c.status},
                          {"reason", c.reason},
                          {"message", c.message},
                          {"observedGeneration", c.observed_generation}};
}

nlohmann::json sub_conditions_json(const std::vector<SubCondition>& list) {
    auto out = nlohmann::json::array();
    for (const auto& sc : list) {
        out.push_back({{"type", sc.type},
                       {"status", kConditionTrue},
                       {"reason", sc.reason},
                       {"message", sc.message}});
    }
    return out;
}

}  // namespace

// ============================
// ObjectStatus
// ============================

void ObjectStatus::add_error(std::string_view type, std::string_view reason,
                             std::string_view message) {
    merge_sub_condition(errors, type, reason, message);
}

void ObjectStatus::add_warning(std::string_view type, std::string_view reason,
                               std::string_view message) {
    merge_sub_condition(warnings, type, reason, message);
}

bool ObjectStatus::has_error(std::string_view type) const {
    return std::any_of(errors.begin(), errors.end(),
                       [type](const SubCondition& sc) { return sc.type == type; });
}

void ObjectStatus::set_condition(std::string_view type, std::string_view status,
                                 std::string_view reason, std::string_view message) {
    Condition cond{std::string(type), std::string(status), std::string(reason),
                   std::string(message), object.generation};
    for (auto& c : conditions) {
        if (c.type == type) {
            c = std::move(cond);
            return;
        }
    }
    conditions.push_back(std::move(cond));
}

void ObjectStatus::add_condition(std::string_view type, std::string_view status,
                                 std::string_view reason, std::string_view message) {
    for (auto& c : conditions) {
        if (c.type != type) {
            continue;
        }
        c.status = status;
        c.reason = reason;
        if (c.message.find(message) == std::string::npos) {
            c.message += ", ";
            c.message += message;
        }
        return;
    }
    set_condition(type, status, reason, message);
}

const Condition* ObjectStatus::find_condition(std::string_view type) const {
    for (const auto& c : conditions) {
        if (c.type == type) {
            return &c;
        }
    }
    return nullptr;
}

ParentStatus& ObjectStatus::parent(const source::NamespacedName& gateway,
                                   std::string_view section_name,
                                   std::string_view controller_name) {
    for (auto& p : parents) {
        if (p.gateway == gateway && p.section_name == section_name) {
            return p;
        }
    }
    parents.push_back(ParentStatus{gateway, std::string(section_name),
                                   std::string(controller_name), {}});
    return parents.back();
}

ListenerStatus& ObjectStatus::listener(std::string_view name) {
    for (auto& l : listeners) {
        if (l.name == name) {
            return l;
        }
    }
    listeners.push_back(ListenerStatus{std::string(name), 0, {}, {}});
    return listeners.back();
}

// ============================
// StatusCache
// ============================

ObjectStatus& StatusCache::at(const source::ObjectRef& ref) {
    auto [it, inserted] = statuses_.try_emplace(ref);
    if (inserted) {
        it->second.object = ref;
    }
    return it->second;
}

const ObjectStatus* StatusCache::find(const source::ObjectRef& ref) const {
    auto it = statuses_.find(ref);
    return it == statuses_.end() ? nullptr : &it->second;
}

bool StatusCache::contains(const source::ObjectRef& ref) const {
    return statuses_.contains(ref);
}

void StatusCache::orphan(const source::ObjectRef& ref) {
    at(ref).add_error(kOrphanedError, kOrphanedError, kOrphanedMessage);
}

void StatusCache::record_conflict(const source::ObjectRef& loser, const source::ObjectRef& winner,
                                  bool full, std::string_view detail) {
    auto& status = at(loser);
    std::string loser_kind(source::to_string(loser.kind));
    std::string winner_kind(source::to_string(winner.kind));

    if (is_gateway_route(loser.kind)) {
        for (auto& parent : status.parents) {
            Condition cond;
            if (full) {
                cond = Condition{"Accepted", std::string(kConditionFalse), "RuleMatchConflict",
                                 fmt::format("{}'s Match has conflict with other {}'s Match: {} "
                                             "(winner {})",
                                             loser_kind, winner_kind, detail, winner.str()),
                                 loser.generation};
            } else {
                cond = Condition{"PartiallyInvalid", std::string(kConditionTrue),
                                 "RuleMatchPartiallyConflict",
                                 fmt::format("Dropped Rule: some of {}'s rule(s) has(ve) been "
                                             "dropped because of conflict against other {}'s "
                                             "rule(s): {} (winner {})",
                                             loser_kind, winner_kind, detail, winner.str()),
                                 loser.generation};
            }
            auto it = std::find_if(parent.conditions.begin(), parent.conditions.end(),
                                   [&](const Condition& c) { return c.type == cond.type; });
            if (it == parent.conditions.end()) {
                parent.conditions.push_back(std::move(cond));
            } else if (it->reason == cond.reason) {
                // Same conflict reported again
                continue;
            } else {
                if (it->status == cond.status) {
                    cond.message = it->message + ", " + cond.message;
                }
                *it = std::move(cond);
            }
        }
        return;
    }

    std::string message = fmt::format("{} (winner {})", detail, winner.str());
    switch (loser.kind) {
        case source::Kind::HTTPProxy:
            if (full) {
                status.add_error(kRouteError, "RouteConflict", message);
            } else {
                status.add_warning(kRouteError, "RouteConflict", message);
            }
            break;
        case source::Kind::Ingress:
            status.add_condition("Conflicted", kConditionTrue, "RouteConflict", message);
            if (full) {
                status.set_condition("Accepted", kConditionFalse, "RouteConflict",
                                     "every rule conflicts with another object");
            } else {
                status.set_condition("PartiallyInvalid", kConditionTrue, "RouteConflict",
                                     "some rules were dropped because of conflicts");
            }
            break;
        default:
            status.add_condition("Conflicted", kConditionTrue, "RouteConflict", message);
            break;
    }
}

std::vector<ObjectStatus> StatusCache::finalize() const {
    std::vector<ObjectStatus> out;
    out.reserve(statuses_.size());

    for (const auto& [ref, entry] : statuses_) {
        ObjectStatus status = entry;
        if (ref.kind == source::Kind::HTTPProxy) {
            if (status.has_errors()) {
                status.set_condition(kValidCondition, kConditionFalse, "ErrorPresent",
                                     "At least one error present, see Errors for details");
                if (status.has_error(kOrphanedError)) {
                    status.current_status = "orphaned";
                    status.description = std::string(kOrphanedMessage);
                } else {
                    status.current_status = "invalid";
                    status.description = "At least one error present, see Errors for details";
                }
            } else {
                status.set_condition(kValidCondition, kConditionTrue, "Valid", "Valid HTTPProxy");
                status.current_status = "valid";
                status.description = "Valid HTTPProxy";
            }
        } else if (ref.kind == source::Kind::ExtensionService) {
            if (status.has_errors()) {
                status.set_condition(kValidCondition, kConditionFalse, "ErrorPresent",
                                     "At least one error present, see Errors for details");
            } else {
                status.set_condition(kValidCondition, kConditionTrue, "Valid",
                                     "Valid ExtensionService");
            }
        }
        out.push_back(std::move(status));
    }
    return out;
}

nlohmann::json to_json(const ObjectStatus& status) {
    nlohmann::json j;
    j["kind"] = std::string(source::to_string(status.object.kind));
    j["namespace"] = status.object.name.ns;
    j["name"] = status.object.name.name;
    j["generation"] = status.object.generation;

    auto conditions = nlohmann::json::array();
    for (const auto& c : status.conditions) {
        auto cj = condition_json(c);
        if (c.type == kValidCondition && (status.object.kind == source::Kind::HTTPProxy ||
                                          status.object.kind == source::Kind::ExtensionService)) {
            cj["errors"] = sub_conditions_json(status.errors);
            cj["warnings"] = sub_conditions_json(status.warnings);
        }
        conditions.push_back(std::move(cj));
    }
    j["conditions"] = std::move(conditions);

    if (!status.current_status.empty()) {
        j["currentStatus"] = status.current_status;
        j["description"] = status.description;
    }

    if (!status.parents.empty()) {
        auto parents = nlohmann::json::array();
        for (const auto& p : status.parents) {
            auto pc = nlohmann::json::array();
            for (const auto& c : p.conditions) {
                pc.push_back(condition_json(c));
            }
            parents.push_back({{"parentRef",
                                {{"namespace", p.gateway.ns},
                                 {"name", p.gateway.name},
                                 {"sectionName", p.section_name}}},
                               {"controllerName", p.controller_name},
                               {"conditions", std::move(pc)}});
        }
        j["parents"] = std::move(parents);
    }

    if (!status.listeners.empty()) {
        auto listeners = nlohmann::json::array();
        for (const auto& l : status.listeners) {
            auto lc = nlohmann::json::array();
            for (const auto& c : l.conditions) {
                lc.push_back(condition_json(c));
            }
            listeners.push_back({{"name", l.name},
                                 {"attachedRoutes", l.attached_routes},
                                 {"supportedKinds", l.supported_kinds},
                                 {"conditions", std::move(lc)}});
        }
        j["listeners"] = std::move(listeners);
    }
    return j;
}

}  // namespace lattice::dag
