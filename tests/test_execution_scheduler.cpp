//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_execution_scheduler.cpp
// Purpose: Worker pool execution, deadlines, cancellation, serialization, and shutdown
//==========================================================================================================

#include <gtest/gtest.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <future>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "mcprt/ExecutionScheduler.h"

using namespace mcprt;
using namespace std::chrono_literals;

namespace {
// Blocks until the token is signalled or the safety limit passes
void waitForStop(std::stop_token st, std::chrono::milliseconds limit = 5000ms) {
    const auto deadline = std::chrono::steady_clock::now() + limit;
    while (!st.stop_requested() && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(2ms);
    }
}

struct Outcome {
    std::shared_ptr<std::promise<ExecutionResult>> promise = std::make_shared<std::promise<ExecutionResult>>();
    std::future<ExecutionResult> future = promise->get_future();

    ExecutionScheduler::CompletionHandler handler() {
        auto p = promise;
        return [p](ExecutionResult r) { p->set_value(std::move(r)); };
    }
};
} // namespace

TEST(ExecutionScheduler, CompletesWithJobValue) {
    ExecutionScheduler s(2);
    Outcome o;
    ASSERT_TRUE(s.Submit("a", [](std::stop_token) { return JSONValue(static_cast<int64_t>(7)); }, SubmitOptions{}, o.handler()));
    ASSERT_EQ(o.future.wait_for(2s), std::future_status::ready);
    ExecutionResult r = o.future.get();
    EXPECT_EQ(r.outcome, ExecutionOutcome::Completed);
    ASSERT_TRUE(r.value.has_value());
    EXPECT_EQ(r.value.value(), JSONValue(static_cast<int64_t>(7)));
    EXPECT_TRUE(s.Drain(1s));
    EXPECT_EQ(s.InFlight(), 0u);
}

TEST(ExecutionScheduler, TimeoutSignalsStopToken) {
    ExecutionScheduler s(1);
    Outcome o;
    auto observed = std::make_shared<std::atomic<bool>>(false);
    SubmitOptions opts;
    opts.timeout = 50ms;
    ASSERT_TRUE(s.Submit("slow", [observed](std::stop_token st) {
        waitForStop(st);
        observed->store(st.stop_requested());
        return JSONValue{};
    }, opts, o.handler()));
    ASSERT_EQ(o.future.wait_for(2s), std::future_status::ready);
    EXPECT_EQ(o.future.get().outcome, ExecutionOutcome::TimedOut);
    EXPECT_TRUE(s.Drain(1s));
    // Worker sees the signal shortly after the deadline fires
    const auto deadline = std::chrono::steady_clock::now() + 1s;
    while (!observed->load() && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(5ms);
    }
    EXPECT_TRUE(observed->load());
}

TEST(ExecutionScheduler, CancelCompletesOnceWithReason) {
    ExecutionScheduler s(1);
    auto calls = std::make_shared<std::atomic<int>>(0);
    auto promise = std::make_shared<std::promise<ExecutionResult>>();
    auto fut = promise->get_future();
    auto started = std::make_shared<std::promise<void>>();
    auto startedFut = started->get_future();

    ASSERT_TRUE(s.Submit("c1", [started](std::stop_token st) {
        started->set_value();
        waitForStop(st);
        // Late value after cancellation must be discarded
        return JSONValue("late");
    }, SubmitOptions{}, [calls, promise](ExecutionResult r) {
        if (calls->fetch_add(1) == 0) {
            promise->set_value(std::move(r));
        }
    }));
    ASSERT_EQ(startedFut.wait_for(2s), std::future_status::ready);
    EXPECT_TRUE(s.Cancel("c1", "user abort"));
    ASSERT_EQ(fut.wait_for(2s), std::future_status::ready);
    ExecutionResult r = fut.get();
    EXPECT_EQ(r.outcome, ExecutionOutcome::Cancelled);
    EXPECT_EQ(r.message, "user abort");

    std::this_thread::sleep_for(100ms);
    EXPECT_EQ(calls->load(), 1);
    EXPECT_FALSE(s.Cancel("c1", "again"));
    EXPECT_FALSE(s.Cancel("unknown", "nothing"));
}

TEST(ExecutionScheduler, DuplicateKeyRejectedWhileInFlight) {
    ExecutionScheduler s(1);
    Outcome first;
    ASSERT_TRUE(s.Submit("k", [](std::stop_token st) { waitForStop(st); return JSONValue{}; }, SubmitOptions{}, first.handler()));
    EXPECT_FALSE(s.Submit("k", [](std::stop_token) { return JSONValue{}; }, SubmitOptions{}, [](ExecutionResult) {}));
    EXPECT_TRUE(s.Cancel("k", "done"));
    ASSERT_EQ(first.future.wait_for(2s), std::future_status::ready);
    EXPECT_TRUE(s.Drain(1s));

    // Key is reusable once the call completed
    Outcome second;
    EXPECT_TRUE(s.Submit("k", [](std::stop_token) { return JSONValue(true); }, SubmitOptions{}, second.handler()));
    ASSERT_EQ(second.future.wait_for(2s), std::future_status::ready);
}

TEST(ExecutionScheduler, HandlerExceptionIsFailedWithExceptionPtr) {
    ExecutionScheduler s(1);
    Outcome o;
    ASSERT_TRUE(s.Submit("boom", [](std::stop_token) -> JSONValue { throw std::runtime_error("kaput"); },
                         SubmitOptions{}, o.handler()));
    ASSERT_EQ(o.future.wait_for(2s), std::future_status::ready);
    ExecutionResult r = o.future.get();
    EXPECT_EQ(r.outcome, ExecutionOutcome::Failed);
    EXPECT_EQ(r.message, "kaput");
    ASSERT_TRUE(r.error != nullptr);
    EXPECT_THROW(std::rethrow_exception(r.error), std::runtime_error);
}

TEST(ExecutionScheduler, IndependentJobsRunConcurrently) {
    ExecutionScheduler s(4);
    auto running = std::make_shared<std::atomic<int>>(0);
    auto peak = std::make_shared<std::atomic<int>>(0);
    std::vector<Outcome> outcomes(4);
    for (int i = 0; i < 4; ++i) {
        ASSERT_TRUE(s.Submit("p" + std::to_string(i), [running, peak](std::stop_token) {
            const int now = running->fetch_add(1) + 1;
            int prev = peak->load();
            while (now > prev && !peak->compare_exchange_weak(prev, now)) {}
            // Hold the worker until all four have started (bounded)
            const auto deadline = std::chrono::steady_clock::now() + 2s;
            while (peak->load() < 4 && std::chrono::steady_clock::now() < deadline) {
                std::this_thread::sleep_for(1ms);
            }
            running->fetch_sub(1);
            return JSONValue{};
        }, SubmitOptions{}, outcomes[static_cast<std::size_t>(i)].handler()));
    }
    for (auto& o : outcomes) {
        ASSERT_EQ(o.future.wait_for(5s), std::future_status::ready);
    }
    EXPECT_EQ(peak->load(), 4);
}

TEST(ExecutionScheduler, SerialKeyPreventsOverlap) {
    ExecutionScheduler s(4);
    auto running = std::make_shared<std::atomic<int>>(0);
    auto overlap = std::make_shared<std::atomic<bool>>(false);
    std::vector<Outcome> outcomes(5);
    SubmitOptions opts;
    opts.serialKey = "tool:write";
    for (int i = 0; i < 5; ++i) {
        ASSERT_TRUE(s.Submit("w" + std::to_string(i), [running, overlap](std::stop_token) {
            if (running->fetch_add(1) != 0) {
                overlap->store(true);
            }
            std::this_thread::sleep_for(10ms);
            running->fetch_sub(1);
            return JSONValue{};
        }, opts, outcomes[static_cast<std::size_t>(i)].handler()));
    }
    for (auto& o : outcomes) {
        ASSERT_EQ(o.future.wait_for(5s), std::future_status::ready);
        EXPECT_EQ(o.future.get().outcome, ExecutionOutcome::Completed);
    }
    EXPECT_FALSE(overlap->load());
}

TEST(ExecutionScheduler, DrainTimesOutWhileBusy) {
    ExecutionScheduler s(1);
    Outcome o;
    ASSERT_TRUE(s.Submit("busy", [](std::stop_token st) { waitForStop(st); return JSONValue{}; }, SubmitOptions{}, o.handler()));
    EXPECT_FALSE(s.Drain(50ms));
    EXPECT_EQ(s.InFlight(), 1u);
    EXPECT_TRUE(s.Cancel("busy", "test over"));
    EXPECT_TRUE(s.Drain(1s));
}

TEST(ExecutionScheduler, ShutdownRejectsWorkAndDropsPendingCompletions) {
    ExecutionScheduler s(1);
    auto delivered = std::make_shared<std::atomic<int>>(0);
    auto started = std::make_shared<std::promise<void>>();
    auto startedFut = started->get_future();
    ASSERT_TRUE(s.Submit("pending", [started](std::stop_token st) {
        started->set_value();
        waitForStop(st);
        return JSONValue{};
    }, SubmitOptions{}, [delivered](ExecutionResult) { delivered->fetch_add(1); }));
    ASSERT_EQ(startedFut.wait_for(2s), std::future_status::ready);

    s.Shutdown(1000ms);
    EXPECT_EQ(delivered->load(), 0);
    EXPECT_EQ(s.InFlight(), 0u);
    EXPECT_FALSE(s.Submit("after", [](std::stop_token) { return JSONValue{}; }, SubmitOptions{}, [](ExecutionResult) {}));
    // Second shutdown is a no-op
    s.Shutdown();
}
