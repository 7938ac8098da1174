//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ExecutionScheduler.cpp
// Purpose: Boost.Asio thread_pool/strand/steady_timer based handler execution
//==========================================================================================================

#include "mcprt/ExecutionScheduler.h"

#include <atomic>
#include <condition_variable>
#include <mutex>
#include <shared_mutex>
#include <thread>
#include <unordered_map>

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/strand.hpp>
#include <boost/asio/thread_pool.hpp>

#include "logging/Logger.h"

namespace mcprt {

namespace asio = boost::asio;

class ExecutionScheduler::Impl : public std::enable_shared_from_this<ExecutionScheduler::Impl> {
public:
    using PoolStrand = asio::strand<asio::thread_pool::executor_type>;

    struct Call {
        std::string key;
        std::stop_source stop;
        std::atomic<bool> done{false};
        CompletionHandler onComplete;
        std::unique_ptr<asio::steady_timer> timer;
    };

    const std::size_t maxConcurrency;
    std::unique_ptr<asio::thread_pool> pool;

    asio::io_context timerCtx;
    std::optional<asio::executor_work_guard<asio::io_context::executor_type>> timerWork;
    std::thread timerThread;

    // Guards calls, strands, and inFlight
    mutable std::mutex mutex;
    std::condition_variable cvIdle;
    std::unordered_map<std::string, std::shared_ptr<Call>> calls;
    std::unordered_map<std::string, std::shared_ptr<PoolStrand>> strands;
    std::size_t inFlight{0};

    // Shared for completion delivery, exclusive for Shutdown
    std::shared_mutex deliveryMutex;
    bool closed{false};
    std::atomic<bool> stopping{false};
    std::atomic<std::size_t> activeHandlers{0};
    bool shutDown{false};

    explicit Impl(std::size_t n)
        : maxConcurrency(n == 0 ? 1 : n),
          pool(std::make_unique<asio::thread_pool>(n == 0 ? 1 : n)) {
        timerWork.emplace(asio::make_work_guard(timerCtx));
        timerThread = std::thread([this]() { timerCtx.run(); });
    }

    ~Impl() {
        shutdown(std::chrono::milliseconds(0));
    }

    // Completes a call exactly once; later attempts are no-ops.
    void complete(const std::shared_ptr<Call>& call, ExecutionResult result) {
        if (call->done.exchange(true)) {
            return;
        }
        {
            std::lock_guard<std::mutex> lk(mutex);
            auto it = calls.find(call->key);
            if (it != calls.end() && it->second == call) {
                calls.erase(it);
            }
        }
        // Timer objects are only touched from the timer thread
        std::weak_ptr<Call> weak = call;
        asio::post(timerCtx, [weak]() {
            if (auto c = weak.lock()) {
                if (c->timer) {
                    c->timer->cancel();
                }
            }
        });

        CompletionHandler handler = std::move(call->onComplete);
        {
            std::shared_lock<std::shared_mutex> lk(deliveryMutex);
            if (!closed && handler) {
                handler(std::move(result));
            } else if (closed) {
                LOG_DEBUG("ExecutionScheduler: dropping {} completion for '{}' after shutdown", toString(result.outcome), call->key);
            }
        }
        {
            std::lock_guard<std::mutex> lk(mutex);
            if (inFlight > 0) {
                --inFlight;
            }
        }
        cvIdle.notify_all();
    }

    void run(const std::shared_ptr<Call>& call, const Job& job) {
        if (call->done.load() || stopping.load()) {
            return;
        }
        ++activeHandlers;
        ExecutionResult result;
        try {
            result.value = job(call->stop.get_token());
            result.outcome = ExecutionOutcome::Completed;
        } catch (const std::exception& e) {
            result.outcome = ExecutionOutcome::Failed;
            result.message = e.what();
            result.error = std::current_exception();
        } catch (...) {
            LOG_ERROR("ExecutionScheduler: handler for '{}' threw a non-std exception", call->key);
            result.outcome = ExecutionOutcome::Failed;
            result.message = "Handler failed with an unknown exception";
            result.error = std::current_exception();
        }
        --activeHandlers;
        if (call->done.load()) {
            LOG_DEBUG("ExecutionScheduler: late {} result for '{}' discarded", toString(result.outcome), call->key);
            return;
        }
        complete(call, std::move(result));
    }

    void shutdown(std::chrono::milliseconds abandonAfter) {
        {
            std::unique_lock<std::shared_mutex> lk(deliveryMutex);
            if (shutDown) {
                return;
            }
            shutDown = true;
            closed = true;
        }
        stopping = true;

        std::vector<std::shared_ptr<Call>> pending;
        {
            std::lock_guard<std::mutex> lk(mutex);
            for (auto& kv : calls) {
                pending.push_back(kv.second);
            }
        }
        for (auto& c : pending) {
            c->stop.request_stop();
            complete(c, ExecutionResult{ExecutionOutcome::Cancelled, std::nullopt, "Scheduler shut down", nullptr});
        }

        timerWork.reset();
        timerCtx.stop();
        if (timerThread.joinable()) {
            if (timerThread.get_id() == std::this_thread::get_id()) {
                timerThread.detach();
            } else {
                timerThread.join();
            }
        }

        const auto deadline = std::chrono::steady_clock::now() + abandonAfter;
        while (activeHandlers.load() > 0 && std::chrono::steady_clock::now() < deadline) {
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }
        if (!pool) {
            return;
        }
        pool->stop();
        if (activeHandlers.load() == 0) {
            pool->join();
            pool.reset();
        } else {
            // Handlers ignoring their stop_token cannot be preempted; leave their threads behind
            LOG_WARN("ExecutionScheduler: abandoning {} handler(s) still running at shutdown", activeHandlers.load());
            (void)pool.release();
        }
    }
};

ExecutionScheduler::ExecutionScheduler(std::size_t maxConcurrency)
    : pImpl(std::make_shared<Impl>(maxConcurrency)) {
    LOG_DEBUG("ExecutionScheduler: started with {} worker(s)", pImpl->maxConcurrency);
}

ExecutionScheduler::~ExecutionScheduler() {
    Shutdown(std::chrono::milliseconds(0));
}

bool ExecutionScheduler::Submit(const std::string& key, Job job, SubmitOptions options, CompletionHandler onComplete) {
    FUNC_SCOPE();
    auto call = std::make_shared<Impl::Call>();
    call->key = key;
    call->onComplete = std::move(onComplete);

    std::shared_ptr<Impl::PoolStrand> strand;
    {
        std::shared_lock<std::shared_mutex> dl(pImpl->deliveryMutex);
        if (pImpl->closed) {
            LOG_DEBUG("ExecutionScheduler: rejecting '{}' after shutdown", key);
            return false;
        }
        std::lock_guard<std::mutex> lk(pImpl->mutex);
        if (pImpl->calls.count(key) != 0) {
            LOG_WARN("ExecutionScheduler: key '{}' already in flight", key);
            return false;
        }
        pImpl->calls.emplace(key, call);
        ++pImpl->inFlight;
        if (options.serialKey.has_value()) {
            auto& s = pImpl->strands[options.serialKey.value()];
            if (!s) {
                s = std::make_shared<Impl::PoolStrand>(asio::make_strand(pImpl->pool->get_executor()));
            }
            strand = s;
        }
    }

    if (options.timeout.count() > 0) {
        call->timer = std::make_unique<asio::steady_timer>(pImpl->timerCtx);
        std::weak_ptr<Impl::Call> weak = call;
        std::weak_ptr<Impl> self = pImpl;
        const auto timeout = options.timeout;
        // Arm on the timer thread so the timer object is never shared across threads
        asio::post(pImpl->timerCtx, [weak, self, timeout]() {
            auto c = weak.lock();
            if (!c || c->done.load() || !c->timer) {
                return;
            }
            c->timer->expires_after(timeout);
            c->timer->async_wait([weak, self, timeout](const boost::system::error_code& ec) {
                if (ec) {
                    return;
                }
                auto c2 = weak.lock();
                auto impl = self.lock();
                if (!c2 || !impl || c2->done.load()) {
                    return;
                }
                LOG_WARN("ExecutionScheduler: '{}' timed out after {} ms", c2->key, static_cast<long long>(timeout.count()));
                c2->stop.request_stop();
                impl->complete(c2, ExecutionResult{ExecutionOutcome::TimedOut, std::nullopt,
                                                   "Request timed out after " + std::to_string(timeout.count()) + " ms", nullptr});
            });
        });
    }

    auto self = pImpl;
    auto task = [self, call, job = std::move(job)]() mutable {
        self->run(call, job);
        call.reset();
    };
    if (strand) {
        asio::post(*strand, std::move(task));
    } else {
        asio::post(*pImpl->pool, std::move(task));
    }
    return true;
}

bool ExecutionScheduler::Cancel(const std::string& key, const std::string& reason) {
    FUNC_SCOPE();
    std::shared_ptr<Impl::Call> call;
    {
        std::lock_guard<std::mutex> lk(pImpl->mutex);
        auto it = pImpl->calls.find(key);
        if (it == pImpl->calls.end()) {
            return false;
        }
        call = it->second;
    }
    if (call->done.load()) {
        return false;
    }
    LOG_INFO("ExecutionScheduler: cancelling '{}' ({})", key, reason);
    call->stop.request_stop();
    pImpl->complete(call, ExecutionResult{ExecutionOutcome::Cancelled, std::nullopt, reason, nullptr});
    return true;
}

bool ExecutionScheduler::Drain(std::chrono::milliseconds timeout) {
    FUNC_SCOPE();
    std::unique_lock<std::mutex> lk(pImpl->mutex);
    return pImpl->cvIdle.wait_for(lk, timeout, [&]{ return pImpl->inFlight == 0; });
}

void ExecutionScheduler::Shutdown(std::chrono::milliseconds abandonAfter) {
    FUNC_SCOPE();
    pImpl->shutdown(abandonAfter);
}

std::size_t ExecutionScheduler::InFlight() const {
    std::lock_guard<std::mutex> lk(pImpl->mutex);
    return pImpl->inFlight;
}

std::size_t ExecutionScheduler::MaxConcurrency() const {
    return pImpl->maxConcurrency;
}

} // namespace mcprt
