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


// Lattice Event Handler - Implementation

#include "event_handler.hpp"

#include <exception>
#include <utility>

#include "../core/logging.hpp"

namespace lattice::runtime {

EventHandler::EventHandler(std::shared_ptr<const control::Config> config, quill::Logger* logger)
    : config_(std::move(config)),
      logger_(logger ? logger : logging::get_current_logger()),
      cache_(config_->dag.watched_namespaces),
      builder_(logger_) {}

EventHandler::~EventHandler() {
    stop();
}

void EventHandler::set_observer(SnapshotObserver observer) {
    observer_ = std::move(observer);
}

void EventHandler::set_status_writer(StatusWriter* writer) {
    status_writer_ = writer;
}

void EventHandler::start() {
    if (running_.exchange(true)) {
        return;  // Already running
    }
    LOG_INFO(logger_, "Started event handler");
    thread_ = std::make_unique<std::thread>(&EventHandler::event_loop, this);
}

void EventHandler::stop() {
    {
        std::lock_guard lock(mutex_);
        if (!running_.exchange(false)) {
            return;  // Not running
        }
    }
    cv_.notify_all();
    if (thread_ && thread_->joinable()) {
        thread_->join();
    }
    sequence_cv_.notify_all();
    LOG_INFO(logger_, "Stopped event handler");
}

void EventHandler::on_add(source::Object object) {
    Op op;
    op.type = OpType::Add;
    op.objects.push_back(std::move(object));
    enqueue(std::move(op));
}

void EventHandler::on_remove(source::Kind kind, source::NamespacedName name) {
    Op op;
    op.type = OpType::Remove;
    op.kind = kind;
    op.name = std::move(name);
    enqueue(std::move(op));
}

void EventHandler::on_replace_all(std::vector<source::Object> objects) {
    Op op;
    op.type = OpType::ReplaceAll;
    op.objects = std::move(objects);
    enqueue(std::move(op));
}

void EventHandler::mark_synced() {
    Op op;
    op.type = OpType::Synced;
    enqueue(std::move(op));
}

void EventHandler::on_config(std::shared_ptr<const control::Config> config) {
    Op op;
    op.type = OpType::Config;
    op.config = std::move(config);
    enqueue(std::move(op));
}

bool EventHandler::wait_for_sequence(uint64_t target, std::chrono::milliseconds timeout) {
    std::unique_lock lock(mutex_);
    return sequence_cv_.wait_for(lock, timeout, [this, target] {
        return sequence_.load() >= target || !running_;
    }) && sequence_.load() >= target;
}

void EventHandler::enqueue(Op op) {
    {
        std::lock_guard lock(mutex_);
        ops_.push_back(std::move(op));
    }
    cv_.notify_all();
}

bool EventHandler::apply(Op& op) {
    switch (op.type) {
        case OpType::Add: {
            bool changed = false;
            for (auto& object : op.objects) {
                changed = cache_.insert(std::move(object)) || changed;
            }
            return changed;
        }
        case OpType::Remove:
            return cache_.remove(op.kind, op.name);
        case OpType::ReplaceAll:
            return cache_.replace_all(std::move(op.objects));
        case OpType::Synced:
            // The initial listing has been applied; build even if it was empty
            cache_.mark_synced();
            return true;
        case OpType::Config:
            if (op.config) {
                config_ = std::move(op.config);
            }
            return true;
    }
    return false;
}

void EventHandler::event_loop() {
    using clock = std::chrono::steady_clock;

    std::optional<clock::time_point> deadline;
    auto last_rebuild = clock::now();  // Lets the holdoff batch the initial listing
    uint64_t outstanding = 0;

    while (running_) {
        std::deque<Op> ops;
        {
            std::unique_lock lock(mutex_);
            auto ready = [this] { return !running_ || !ops_.empty(); };
            if (deadline) {
                cv_.wait_until(lock, *deadline, ready);
            } else {
                cv_.wait(lock, ready);
            }
            if (!running_) {
                break;
            }
            ops.swap(ops_);
        }

        for (auto& op : ops) {
            if (!apply(op)) {
                continue;
            }
            ++outstanding;
            const auto& holdoff = config_->rebuild;
            auto delay = std::chrono::milliseconds(holdoff.holdoff_delay_ms);
            auto max_delay = std::chrono::milliseconds(holdoff.holdoff_max_delay_ms);
            if (clock::now() - last_rebuild > max_delay) {
                delay = std::chrono::milliseconds(0);
            }
            deadline = clock::now() + delay;
        }

        if (!deadline || clock::now() < *deadline) {
            continue;
        }
        if (!cache_.synced()) {
            LOG_INFO(logger_, "Skipping rebuild as the cache is not synced");
            deadline = clock::now() + std::chrono::milliseconds(config_->rebuild.holdoff_delay_ms);
            continue;
        }

        deadline.reset();
        rebuild(outstanding);
        outstanding = 0;
        last_rebuild = clock::now();
    }
}

void EventHandler::rebuild(uint64_t outstanding) {
    auto start = std::chrono::steady_clock::now();
    uint64_t sequence = sequence_.load() + 1;

    try {
        auto result = builder_.build(cache_, *config_, sequence);
        snapshot_.store(result.snapshot);
        if (observer_) {
            observer_(result.snapshot);
        }
        if (status_writer_) {
            status_writer_->submit(std::move(result.statuses));
        }
    } catch (const std::exception& e) {
        ++failed_builds_;
        LOG_ERROR(logger_, "Rebuild {} failed, previous snapshot stays in service: {}", sequence,
                  e.what());
    }

    {
        std::lock_guard lock(mutex_);
        sequence_.store(sequence);
    }
    sequence_cv_.notify_all();

    auto elapsed = std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::steady_clock::now() - start);
    LOG_REBUILD(logger_, sequence, outstanding, elapsed.count());
}

}  // namespace lattice::runtime
