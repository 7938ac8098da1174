//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ExecutionScheduler.h
// Purpose: Bounded worker pool that runs capability handlers with timeouts and cooperative cancellation
//==========================================================================================================

#pragma once

#include <chrono>
#include <cstddef>
#include <exception>
#include <functional>
#include <memory>
#include <optional>
#include <stop_token>
#include <string>

#include "mcprt/JSONRPCTypes.h"

namespace mcprt {

enum class ExecutionOutcome {
    Completed,
    Failed,     // handler threw
    TimedOut,
    Cancelled
};

inline const char* toString(ExecutionOutcome o) {
    switch (o) {
        case ExecutionOutcome::Completed: return "Completed";
        case ExecutionOutcome::Failed: return "Failed";
        case ExecutionOutcome::TimedOut: return "TimedOut";
        case ExecutionOutcome::Cancelled: return "Cancelled";
    }
    return "Unknown";
}

struct ExecutionResult {
    ExecutionOutcome outcome{ExecutionOutcome::Completed};
    std::optional<JSONValue> value;  // set when Completed
    std::string message;             // failure/cancel reason otherwise
    std::exception_ptr error;        // what the job threw, when Failed
};

struct SubmitOptions {
    // Zero disables the deadline
    std::chrono::milliseconds timeout{0};
    // Calls sharing a serial key never overlap (non-reentrant capabilities)
    std::optional<std::string> serialKey;
};

//==========================================================================================================
// ExecutionScheduler
// Purpose: Runs jobs off the read loop on a fixed-size Boost.Asio thread pool.
// Notes:
//   - Every submitted call completes exactly once: Completed, Failed, TimedOut, or Cancelled.
//   - Timeout and Cancel stop waiting and signal the job's stop_token; a running job is never preempted.
//   - After Shutdown() no completion callback runs and none is in progress.
//==========================================================================================================
class ExecutionScheduler {
public:
    using Job = std::function<JSONValue(std::stop_token)>;
    using CompletionHandler = std::function<void(ExecutionResult)>;

    explicit ExecutionScheduler(std::size_t maxConcurrency);
    ~ExecutionScheduler();

    ExecutionScheduler(const ExecutionScheduler&) = delete;
    ExecutionScheduler& operator=(const ExecutionScheduler&) = delete;

    //==========================================================================================================
    // Submit
    // Purpose: Queues a job under a unique key (the request id).
    // Args:
    //   key: Identifies the call for Cancel(); must not be in flight already.
    //   job: Work to run; its return value becomes the result, an exception makes the call Failed.
    //   options: Timeout and serialization settings.
    //   onComplete: Invoked exactly once, from a worker or timer thread.
    // Returns:
    //   false (and onComplete is not invoked) when the scheduler is shut down or the key is in flight.
    //==========================================================================================================
    bool Submit(const std::string& key, Job job, SubmitOptions options, CompletionHandler onComplete);

    //==========================================================================================================
    // Cancel
    // Purpose: Signals the call's stop_token and completes it as Cancelled.
    // Returns:
    //   true when a pending call was cancelled; false when the key is unknown or already completed.
    //==========================================================================================================
    bool Cancel(const std::string& key, const std::string& reason);

    //==========================================================================================================
    // Drain
    // Purpose: Waits until every submitted call has completed or the timeout elapses.
    // Returns:
    //   true when nothing is in flight.
    //==========================================================================================================
    bool Drain(std::chrono::milliseconds timeout);

    //==========================================================================================================
    // Shutdown
    // Purpose: Rejects new work, stops delivering completions, signals all stop tokens, and stops the pool.
    //          Workers still inside a handler after abandonAfter are abandoned instead of joined.
    //==========================================================================================================
    void Shutdown(std::chrono::milliseconds abandonAfter = std::chrono::milliseconds(500));

    std::size_t InFlight() const;
    std::size_t MaxConcurrency() const;

private:
    class Impl;
    std::shared_ptr<Impl> pImpl;
};

} // namespace mcprt
