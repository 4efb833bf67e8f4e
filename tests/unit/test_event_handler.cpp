// Lattice Event Handler Tests

#include <catch2/catch_test_macros.hpp>
#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "../../src/runtime/event_handler.hpp"
#include "test_helpers.hpp"

using namespace lattice;
using namespace lattice::testing;
using namespace std::chrono_literals;
using source::Kind;

namespace {

std::shared_ptr<const control::Config> fast_config(uint32_t holdoff_ms = 20,
                                                   uint32_t max_holdoff_ms = 10000) {
    auto config = std::make_shared<control::Config>(test_config());
    config->rebuild.holdoff_delay_ms = holdoff_ms;
    config->rebuild.holdoff_max_delay_ms = max_holdoff_ms;
    return config;
}

source::HTTPProxy web_proxy() {
    auto root = root_proxy("default", "web", "example.com");
    root.routes.push_back(proxy_route("/", "web"));
    root.metadata.resource_version = "1";
    return root;
}

class CollectingSink : public runtime::StatusSink {
public:
    std::error_code write(const dag::ObjectStatus& status) override {
        std::lock_guard lock(mutex_);
        statuses_.push_back(status);
        return {};
    }

    std::vector<dag::ObjectStatus> statuses() {
        std::lock_guard lock(mutex_);
        return statuses_;
    }

private:
    std::mutex mutex_;
    std::vector<dag::ObjectStatus> statuses_;
};

}  // namespace

TEST_CASE("No build before the cache is synced", "[runtime][events]") {
    runtime::EventHandler handler(fast_config());
    handler.start();

    handler.on_add(web_proxy());
    handler.on_add(service("default", "web"));
    REQUIRE_FALSE(handler.wait_for_sequence(1, 200ms));
    REQUIRE_FALSE(handler.has_built_initial());

    handler.mark_synced();
    REQUIRE(handler.wait_for_sequence(1, 2s));
    REQUIRE(handler.has_built_initial());

    auto snapshot = handler.current();
    REQUIRE(snapshot->select_route("http-80", request("example.com", "/")) != nullptr);

    handler.stop();
}

TEST_CASE("An empty initial listing still builds", "[runtime][events]") {
    runtime::EventHandler handler(fast_config());
    handler.start();

    handler.mark_synced();
    REQUIRE(handler.wait_for_sequence(1, 2s));
    REQUIRE(handler.current()->listeners.empty());

    handler.stop();
}

TEST_CASE("Bursts of changes coalesce into one rebuild", "[runtime][events]") {
    runtime::EventHandler handler(fast_config(50));
    std::atomic<int> observed{0};
    handler.set_observer([&observed](const dag::Snapshot&) { ++observed; });
    handler.start();

    handler.mark_synced();
    REQUIRE(handler.wait_for_sequence(1, 2s));

    handler.on_add(service("default", "web"));
    handler.on_add(web_proxy());
    for (int i = 0; i < 5; ++i) {
        handler.on_add(service("default", "extra-" + std::to_string(i)));
    }
    REQUIRE(handler.wait_for_sequence(2, 2s));
    REQUIRE_FALSE(handler.wait_for_sequence(3, 200ms));
    REQUIRE(handler.sequence() == 2);
    REQUIRE(observed == 2);
    REQUIRE(handler.current()->sequence == 2);

    handler.stop();
}

TEST_CASE("Events that change nothing do not rebuild", "[runtime][events]") {
    runtime::EventHandler handler(fast_config());
    handler.start();

    handler.on_add(web_proxy());
    handler.mark_synced();
    REQUIRE(handler.wait_for_sequence(1, 2s));

    // Same resource version
    handler.on_add(web_proxy());
    REQUIRE_FALSE(handler.wait_for_sequence(2, 200ms));

    // Removing an unknown object
    handler.on_remove(Kind::HTTPProxy, {"default", "absent"});
    REQUIRE_FALSE(handler.wait_for_sequence(2, 200ms));

    handler.stop();
}

TEST_CASE("Removals and replacements rebuild", "[runtime][events]") {
    runtime::EventHandler handler(fast_config());
    handler.start();

    handler.on_add(web_proxy());
    handler.on_add(service("default", "web"));
    handler.mark_synced();
    REQUIRE(handler.wait_for_sequence(1, 2s));
    REQUIRE(handler.current()->route_count() == 1);

    handler.on_remove(Kind::HTTPProxy, {"default", "web"});
    REQUIRE(handler.wait_for_sequence(2, 2s));
    REQUIRE(handler.current()->route_count() == 0);

    handler.on_replace_all({source::Object(web_proxy()), source::Object(service("default", "web"))});
    REQUIRE(handler.wait_for_sequence(3, 2s));
    REQUIRE(handler.current()->route_count() == 1);

    handler.stop();
}

TEST_CASE("New configuration triggers a rebuild", "[runtime][events]") {
    runtime::EventHandler handler(fast_config());
    handler.start();

    handler.on_add(web_proxy());
    handler.on_add(service("default", "web"));
    handler.mark_synced();
    REQUIRE(handler.wait_for_sequence(1, 2s));

    auto restricted = std::make_shared<control::Config>(*fast_config());
    restricted->dag.root_namespaces = {"ingress"};
    handler.on_config(restricted);
    REQUIRE(handler.wait_for_sequence(2, 2s));
    REQUIRE(handler.current()->listeners.empty());
    REQUIRE(handler.failed_builds() == 0);

    handler.stop();
}

TEST_CASE("Statuses flow to the writer after each build", "[runtime][events]") {
    auto sink = std::make_shared<CollectingSink>();
    runtime::StatusWriter writer(sink, control::StatusConfig{});
    writer.start();

    runtime::EventHandler handler(fast_config());
    handler.set_status_writer(&writer);
    handler.start();

    handler.on_add(web_proxy());
    handler.on_add(service("default", "web"));
    handler.mark_synced();
    REQUIRE(handler.wait_for_sequence(1, 2s));
    REQUIRE(writer.wait_idle(2s));

    auto statuses = sink->statuses();
    REQUIRE(statuses.size() == 1);
    REQUIRE(statuses.front().object.kind == Kind::HTTPProxy);
    REQUIRE(statuses.front().current_status == "valid");

    handler.stop();
    writer.stop();
}
