// Lattice Status Tests

#include <catch2/catch_test_macros.hpp>
#include <string>

#include "../../src/dag/status.hpp"

using namespace lattice;
using namespace lattice::dag;
using source::Kind;
using source::ObjectRef;

namespace {

ObjectRef proxy_ref(std::string name, int64_t created = 100) {
    return ObjectRef{Kind::HTTPProxy, {"default", std::move(name)}, 2, created};
}

}  // namespace

TEST_CASE("Sub-conditions merge by type", "[dag][status]") {
    ObjectStatus status;
    status.add_error(kRouteError, "InvalidPath", "path a is invalid");
    status.add_error(kRouteError, "InvalidPath", "path b is invalid");
    status.add_error(kRouteError, "InvalidPath", "path a is invalid");
    REQUIRE(status.errors.size() == 1);
    REQUIRE(status.errors.front().message == "path a is invalid, path b is invalid");
    REQUIRE(status.errors.front().reason == "InvalidPath");

    status.add_error(kRouteError, "OtherReason", "another problem");
    REQUIRE(status.errors.front().reason == "MultipleReasons");

    status.add_error(kTlsError, "SecretNotValid", "bad secret");
    REQUIRE(status.errors.size() == 2);
    REQUIRE(status.has_error(kTlsError));
}

TEST_CASE("Conditions set and add", "[dag][status]") {
    ObjectStatus status;
    status.object = ObjectRef{Kind::Ingress, {"default", "web"}, 4, 0};

    status.set_condition("Accepted", kConditionTrue, "Accepted", "ok");
    status.set_condition("Accepted", kConditionFalse, "Invalid", "broken");
    REQUIRE(status.conditions.size() == 1);
    REQUIRE(status.find_condition("Accepted")->status == "False");
    REQUIRE(status.find_condition("Accepted")->observed_generation == 4);

    status.add_condition("Conflicted", kConditionTrue, "RouteConflict", "first");
    status.add_condition("Conflicted", kConditionTrue, "RouteConflict", "second");
    REQUIRE(status.find_condition("Conflicted")->message == "first, second");
}

TEST_CASE("Finalize derives the HTTPProxy valid condition", "[dag][status]") {
    StatusCache cache;
    cache.at(proxy_ref("good"));
    cache.at(proxy_ref("bad")).add_error(kSpecError, "NothingDefined", "nothing defined");
    cache.orphan(proxy_ref("child"));

    auto statuses = cache.finalize();
    REQUIRE(statuses.size() == 3);

    for (const auto& s : statuses) {
        const auto* valid = s.find_condition("Valid");
        REQUIRE(valid != nullptr);
        if (s.object.name.name == "good") {
            REQUIRE(s.current_status == "valid");
            REQUIRE(valid->status == "True");
        } else if (s.object.name.name == "bad") {
            REQUIRE(s.current_status == "invalid");
            REQUIRE(valid->status == "False");
        } else {
            REQUIRE(s.current_status == "orphaned");
            REQUIRE(s.description == kOrphanedMessage);
        }
    }
}

TEST_CASE("Conflict attribution", "[dag][status][conflict]") {
    StatusCache cache;
    auto winner = proxy_ref("winner", 50);

    SECTION("HTTPProxy full loss is an error") {
        auto loser = proxy_ref("loser");
        cache.record_conflict(loser, winner, true, "route prefix:/ on host a is already claimed");
        const auto* status = cache.find(loser);
        REQUIRE(status->has_error(kRouteError));
        REQUIRE(status->errors.front().reason == "RouteConflict");
        REQUIRE(status->errors.front().message.find("HTTPProxy default/winner") !=
                std::string::npos);
    }

    SECTION("HTTPProxy partial loss is a warning") {
        auto loser = proxy_ref("loser");
        cache.record_conflict(loser, winner, false, "detail");
        const auto* status = cache.find(loser);
        REQUIRE_FALSE(status->has_errors());
        REQUIRE(status->warnings.size() == 1);
    }

    SECTION("Ingress loss sets Conflicted and Accepted") {
        ObjectRef loser{Kind::Ingress, {"default", "web"}, 1, 200};
        cache.record_conflict(loser, winner, true, "detail");
        const auto* status = cache.find(loser);
        REQUIRE(status->find_condition("Conflicted")->status == "True");
        REQUIRE(status->find_condition("Accepted")->status == "False");
    }

    SECTION("Gateway routes report per parent") {
        ObjectRef loser{Kind::HTTPRoute, {"apps", "r"}, 3, 200};
        auto& status = cache.at(loser);
        status.parent({"infra", "gw"}, "", "example.com/controller")
            .conditions.push_back(Condition{"Accepted", "True", "Accepted", "ok", 3});

        cache.record_conflict(loser, winner, false, "detail");
        const auto& parent = cache.find(loser)->parents.front();
        REQUIRE(parent.conditions.size() == 2);
        REQUIRE(parent.conditions[1].type == "PartiallyInvalid");
        REQUIRE(parent.conditions[1].reason == "RuleMatchPartiallyConflict");
        REQUIRE(parent.conditions[1].message.find("(winner HTTPProxy default/winner)") !=
                std::string::npos);

        cache.record_conflict(loser, winner, true, "detail");
        const auto& accepted = cache.find(loser)->parents.front().conditions.front();
        REQUIRE(accepted.status == "False");
        REQUIRE(accepted.reason == "RuleMatchConflict");
        // Status changed, so the earlier message is not kept
        REQUIRE(accepted.message ==
                "HTTPRoute's Match has conflict with other HTTPProxy's Match: detail "
                "(winner HTTPProxy default/winner)");
    }
}

TEST_CASE("Status equality includes generation", "[dag][status]") {
    ObjectStatus a;
    a.object = proxy_ref("x");
    ObjectStatus b = a;
    REQUIRE(a == b);
    b.object.generation = 9;
    REQUIRE_FALSE(a == b);
}

TEST_CASE("Status JSON rendering", "[dag][status][json]") {
    StatusCache cache;
    cache.at(proxy_ref("bad")).add_error(kTlsError, "SecretNotValid", "bad secret");
    auto statuses = cache.finalize();

    auto j = to_json(statuses.front());
    REQUIRE(j["kind"] == "HTTPProxy");
    REQUIRE(j["namespace"] == "default");
    REQUIRE(j["currentStatus"] == "invalid");
    REQUIRE(j["conditions"][0]["type"] == "Valid");
    REQUIRE(j["conditions"][0]["errors"][0]["type"] == "TLSError");
    REQUIRE(j["conditions"][0]["observedGeneration"] == 2);
}
