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


// Lattice Status Writer - Header
// Asynchronous, retried delivery of object statuses after each build

#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <map>
#include <set>
#include <memory>
#include <mutex>
#include <string>
#include <system_error>
#include <thread>
#include <vector>

#include <quill/Logger.h>

#include "../control/config.hpp"
#include "../dag/status.hpp"

namespace lattice::runtime {

/// Destination of status updates
class StatusSink {
public:
    virtual ~StatusSink() = default;

    /// Upsert the status of one object
    [[nodiscard]] virtual std::error_code write(const dag::ObjectStatus& status) = 0;
};

/// Writes <dir>/<Kind>_<namespace>_<name>.json, replacing the file atomically
class FileStatusSink : public StatusSink {
public:
    explicit FileStatusSink(std::string directory);

    [[nodiscard]] std::error_code write(const dag::ObjectStatus& status) override;

    [[nodiscard]] std::string path_for(const source::ObjectRef& ref) const;

private:
    std::string directory_;
};

/// Logs each status at debug level; used when no output directory is configured
class LogStatusSink : public StatusSink {
public:
    explicit LogStatusSink(quill::Logger* logger) : logger_(logger) {}

    [[nodiscard]] std::error_code write(const dag::ObjectStatus& status) override;

private:
    quill::Logger* logger_;
};

/// Background writer. Statuses are keyed by object identity: a later
/// submission replaces a pending one for the same object, including one that
/// is waiting to be retried. Failed writes back off exponentially from
/// initial_backoff_ms up to max_backoff_ms and are dropped after max_retries.
/// Unchanged statuses are not rewritten.
class StatusWriter {
public:
    StatusWriter(std::shared_ptr<StatusSink> sink, control::StatusConfig config,
                 quill::Logger* logger = nullptr);
    ~StatusWriter();

    // Non-copyable, non-movable (owns thread)
    StatusWriter(const StatusWriter&) = delete;
    StatusWriter& operator=(const StatusWriter&) = delete;
    StatusWriter(StatusWriter&&) = delete;
    StatusWriter& operator=(StatusWriter&&) = delete;

    void start();
    void stop();

    /// Queue the statuses of one build; never blocks on the sink. Objects
    /// missing from the batch are forgotten and rewritten if they come back.
    void submit(std::vector<dag::ObjectStatus> statuses);

    /// Wait until nothing is pending or in flight
    [[nodiscard]] bool wait_idle(std::chrono::milliseconds timeout);

    [[nodiscard]] uint64_t written() const noexcept { return written_.load(); }

    /// Objects whose last written status is remembered
    [[nodiscard]] size_t remembered();
    [[nodiscard]] uint64_t retries() const noexcept { return retries_.load(); }
    [[nodiscard]] uint64_t dropped() const noexcept { return dropped_.load(); }

    /// Delay before retry number attempt (1-based)
    [[nodiscard]] std::chrono::milliseconds backoff(uint32_t attempt) const noexcept;

private:
    struct Pending {
        dag::ObjectStatus status;
        uint32_t attempts = 0;
        std::chrono::steady_clock::time_point due;
    };

    void write_loop();

    std::shared_ptr<StatusSink> sink_;
    control::StatusConfig config_;
    quill::Logger* logger_;

    std::mutex mutex_;
    std::condition_variable cv_;
    std::condition_variable idle_cv_;
    std::map<source::ObjectRef, Pending> pending_;
    std::map<source::ObjectRef, dag::ObjectStatus> written_status_;
    std::set<source::ObjectRef> submitted_;  // Objects of the latest batch
    size_t in_flight_ = 0;

    std::atomic<uint64_t> written_{0};
    std::atomic<uint64_t> retries_{0};
    std::atomic<uint64_t> dropped_{0};

    std::unique_ptr<std::thread> thread_;
    std::atomic<bool> running_{false};
};

}  // namespace lattice::runtime
