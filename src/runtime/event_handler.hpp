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


// Lattice Event Handler - Header
// Debounced rebuild loop: applies cache events, rebuilds and publishes snapshots

#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>
#include <vector>

#include <quill/Logger.h>

#include "../control/config.hpp"
#include "../dag/builder.hpp"
#include "../source/cache.hpp"
#include "status_writer.hpp"

namespace lattice::runtime {

/// Receives every successfully built snapshot
using SnapshotObserver = std::function<void(const dag::Snapshot&)>;

/// Owns the object cache and the single rebuild thread.
///
/// Events are queued by any thread and applied to the cache on the rebuild
/// thread, so builds always read a consistent view. A change schedules a
/// rebuild holdoff_delay_ms later; further changes push it back, unless
/// holdoff_max_delay_ms has passed since the previous rebuild, in which case it
/// runs immediately. Events arriving during a build are applied afterwards and
/// coalesce into the next one. No build runs before mark_synced() has been
/// processed.
class EventHandler {
public:
    EventHandler(std::shared_ptr<const control::Config> config, quill::Logger* logger = nullptr);
    ~EventHandler();

    // Non-copyable, non-movable (owns thread)
    EventHandler(const EventHandler&) = delete;
    EventHandler& operator=(const EventHandler&) = delete;
    EventHandler(EventHandler&&) = delete;
    EventHandler& operator=(EventHandler&&) = delete;

    void set_observer(SnapshotObserver observer);
    void set_status_writer(StatusWriter* writer);

    void start();
    void stop();

    // Event sources
    void on_add(source::Object object);
    void on_remove(source::Kind kind, source::NamespacedName name);
    void on_replace_all(std::vector<source::Object> objects);
    void mark_synced();

    /// New configuration; always triggers a rebuild
    void on_config(std::shared_ptr<const control::Config> config);

    /// Latest published snapshot; null before the first successful build
    [[nodiscard]] dag::Snapshot current() const { return snapshot_.load(); }

    /// Number of completed builds (successful or not)
    [[nodiscard]] uint64_t sequence() const noexcept { return sequence_.load(); }
    [[nodiscard]] uint64_t failed_builds() const noexcept { return failed_builds_.load(); }
    [[nodiscard]] bool has_built_initial() const noexcept { return current() != nullptr; }

    /// Block until sequence() >= target
    [[nodiscard]] bool wait_for_sequence(uint64_t target, std::chrono::milliseconds timeout);

private:
    enum class OpType { Add, Remove, ReplaceAll, Synced, Config };

    struct Op {
        OpType type = OpType::Add;
        std::vector<source::Object> objects;
        source::Kind kind = source::Kind::Unknown;
        source::NamespacedName name;
        std::shared_ptr<const control::Config> config;
    };

    void enqueue(Op op);
    void event_loop();

    /// Apply one event to the cache; true when the view changed
    bool apply(Op& op);

    void rebuild(uint64_t outstanding);

    std::shared_ptr<const control::Config> config_;
    quill::Logger* logger_;
    source::ObjectCache cache_;
    dag::Builder builder_;
    SnapshotObserver observer_;
    StatusWriter* status_writer_ = nullptr;

    std::mutex mutex_;
    std::condition_variable cv_;
    std::condition_variable sequence_cv_;
    std::deque<Op> ops_;

    std::atomic<dag::Snapshot> snapshot_;
    std::atomic<uint64_t> sequence_{0};
    std::atomic<uint64_t> failed_builds_{0};

    std::unique_ptr<std::thread> thread_;
    std::atomic<bool> running_{false};
};

}  // namespace lattice::runtime
