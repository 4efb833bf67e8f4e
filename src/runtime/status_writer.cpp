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


// Lattice Status Writer - Implementation

#include "status_writer.hpp"

#include <algorithm>
#include <cerrno>
#include <filesystem>
#include <fstream>
#include <utility>

#include <fmt/format.h>

#include "../core/logging.hpp"

namespace lattice::runtime {

// ============================
// Sinks
// ============================

FileStatusSink::FileStatusSink(std::string directory) : directory_(std::move(directory)) {}

std::string FileStatusSink::path_for(const source::ObjectRef& ref) const {
    auto ns = ref.name.ns.empty() ? std::string("_cluster") : ref.name.ns;
    return fmt::format("{}/{}_{}_{}.json", directory_, source::to_string(ref.kind), ns,
                       ref.name.name);
}

std::error_code FileStatusSink::write(const dag::ObjectStatus& status) {
    std::error_code ec;
    std::filesystem::create_directories(directory_, ec);
    if (ec) {
        return ec;
    }

    auto path = path_for(status.object);
    auto tmp = path + ".tmp";
    {
        std::ofstream out(tmp, std::ios::trunc);
        if (!out.is_open()) {
            return {errno != 0 ? errno : EIO, std::generic_category()};
        }
        out << dag::to_json(status).dump(2) << '\n';
        out.flush();
        if (!out) {
            return std::make_error_code(std::errc::io_error);
        }
    }
    std::filesystem::rename(tmp, path, ec);
    return ec;
}

std::error_code LogStatusSink::write(const dag::ObjectStatus& status) {
    if (logger_) {
        LOG_DEBUG(logger_, "Status {}: {}", status.object.str(), dag::to_json(status).dump());
    }
    return {};
}

// ============================
// Writer
// ============================

StatusWriter::StatusWriter(std::shared_ptr<StatusSink> sink, control::StatusConfig config,
                           quill::Logger* logger)
    : sink_(std::move(sink)), config_(std::move(config)), logger_(logger) {}

StatusWriter::~StatusWriter() {
    stop();
}

void StatusWriter::start() {
    if (running_.exchange(true)) {
        return;  // Already running
    }
    thread_ = std::make_unique<std::thread>(&StatusWriter::write_loop, this);
}

void StatusWriter::stop() {
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
    idle_cv_.notify_all();
}

void StatusWriter::submit(std::vector<dag::ObjectStatus> statuses) {
    {
        std::lock_guard lock(mutex_);
        submitted_.clear();
        for (const auto& status : statuses) {
            submitted_.insert(status.object);
        }
        std::erase_if(written_status_,
                      [this](const auto& entry) { return !submitted_.contains(entry.first); });

        auto now = std::chrono::steady_clock::now();
        for (auto& status : statuses) {
            auto key = status.object;
            auto written = written_status_.find(key);
            if (written != written_status_.end() && written->second == status) {
                pending_.erase(key);
                continue;
            }
            pending_.insert_or_assign(key, Pending{std::move(status), 0, now});
        }
    }
    cv_.notify_all();
}

size_t StatusWriter::remembered() {
    std::lock_guard lock(mutex_);
    return written_status_.size();
}

bool StatusWriter::wait_idle(std::chrono::milliseconds timeout) {
    std::unique_lock lock(mutex_);
    return idle_cv_.wait_for(lock, timeout,
                             [this] { return pending_.empty() && in_flight_ == 0; });
}

std::chrono::milliseconds StatusWriter::backoff(uint32_t attempt) const noexcept {
    uint64_t delay = std::max<uint32_t>(config_.initial_backoff_ms, 1);
    for (uint32_t i = 1; i < attempt && delay < config_.max_backoff_ms; ++i) {
        delay *= 2;
    }
    return std::chrono::milliseconds(std::min<uint64_t>(delay, config_.max_backoff_ms));
}

void StatusWriter::write_loop() {
    std::unique_lock lock(mutex_);
    while (running_) {
        auto now = std::chrono::steady_clock::now();
        auto next = std::chrono::steady_clock::time_point::max();
        std::vector<Pending> due;
        for (auto it = pending_.begin(); it != pending_.end();) {
            if (it->second.due <= now) {
                due.push_back(std::move(it->second));
                it = pending_.erase(it);
            } else {
                next = std::min(next, it->second.due);
                ++it;
            }
        }

        if (due.empty()) {
            if (pending_.empty() && in_flight_ == 0) {
                idle_cv_.notify_all();
            }
            if (next == std::chrono::steady_clock::time_point::max()) {
                cv_.wait(lock, [this] { return !running_ || !pending_.empty(); });
            } else {
                cv_.wait_until(lock, next);
            }
            continue;
        }

        in_flight_ += due.size();
        lock.unlock();
        for (auto& item : due) {
            auto ec = sink_->write(item.status);

            std::lock_guard guard(mutex_);
            --in_flight_;
            auto key = item.status.object;
            if (!ec) {
                if (submitted_.contains(key)) {
                    written_status_.insert_or_assign(key, std::move(item.status));
                }
                ++written_;
            } else if (pending_.contains(key)) {
                // Superseded by a newer build while the write was in flight
            } else if (item.attempts >= config_.max_retries) {
                ++dropped_;
                if (logger_) {
                    LOG_ERROR(logger_, "Status write for {} failed after {} retries: {}",
                              key.str(), item.attempts, ec.message());
                }
            } else {
                ++item.attempts;
                ++retries_;
                auto delay = backoff(item.attempts);
                if (logger_) {
                    LOG_WARNING(logger_, "Status write for {} failed: {}, retry {} in {}ms",
                                key.str(), ec.message(), item.attempts, delay.count());
                }
                item.due = std::chrono::steady_clock::now() + delay;
                pending_.emplace(key, std::move(item));
            }
        }
        lock.lock();
    }
}

}  // namespace lattice::runtime
