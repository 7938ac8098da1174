//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: InMemoryTransport.cpp
// Purpose: In-memory frame transport implementation
//==========================================================================================================

#include "mcprt/InMemoryTransport.hpp"

#include <atomic>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <string>

#include "logging/Logger.h"

namespace mcprt {

class InMemoryTransport::Impl {
public:
    std::atomic<bool> connected{false};
    std::string sessionId;
    ITransport::ErrorHandler errorHandler;

    std::mutex mutex;
    std::condition_variable cv;
    std::deque<std::string> inbound;
    // No more frames will arrive (peer closed its write side, or we closed)
    bool inputDone{false};
    bool writeClosed{false};

    std::weak_ptr<Impl> peer;

    void deliver(std::string frame) {
        {
            std::lock_guard<std::mutex> lk(mutex);
            if (inputDone) {
                return;
            }
            inbound.emplace_back(std::move(frame));
        }
        cv.notify_one();
    }

    void endInput() {
        {
            std::lock_guard<std::mutex> lk(mutex);
            inputDone = true;
        }
        cv.notify_all();
    }

    void closeWrite() {
        {
            std::lock_guard<std::mutex> lk(mutex);
            if (writeClosed) {
                return;
            }
            writeClosed = true;
        }
        if (auto p = peer.lock()) {
            p->endInput();
        }
    }
};

InMemoryTransport::InMemoryTransport() : pImpl(std::make_shared<Impl>()) {
    FUNC_SCOPE();
}

InMemoryTransport::~InMemoryTransport() {
    FUNC_SCOPE();
    pImpl->closeWrite();
    pImpl->endInput();
}

std::pair<std::unique_ptr<InMemoryTransport>, std::unique_ptr<InMemoryTransport>> InMemoryTransport::CreatePair() {
    FUNC_SCOPE();
    auto left = std::make_unique<InMemoryTransport>();
    auto right = std::make_unique<InMemoryTransport>();
    left->pImpl->peer = right->pImpl;
    right->pImpl->peer = left->pImpl;
    static std::atomic<unsigned int> counter{0u};
    const unsigned int n = ++counter;
    left->pImpl->sessionId = "memory-" + std::to_string(n) + "-a";
    right->pImpl->sessionId = "memory-" + std::to_string(n) + "-b";
    return {std::move(left), std::move(right)};
}

std::future<void> InMemoryTransport::Start() {
    FUNC_SCOPE();
    pImpl->connected = true;
    std::promise<void> promise; promise.set_value(); return promise.get_future();
}

std::future<void> InMemoryTransport::Close() {
    FUNC_SCOPE();
    pImpl->connected = false;
    pImpl->closeWrite();
    pImpl->endInput();
    std::promise<void> promise; promise.set_value(); return promise.get_future();
}

bool InMemoryTransport::IsConnected() const {
    return pImpl->connected.load();
}

std::string InMemoryTransport::GetSessionId() const {
    return pImpl->sessionId;
}

std::optional<std::string> InMemoryTransport::Receive() {
    std::unique_lock<std::mutex> lk(pImpl->mutex);
    pImpl->cv.wait(lk, [&]{ return !pImpl->inbound.empty() || pImpl->inputDone; });
    if (pImpl->inbound.empty()) {
        return std::nullopt;
    }
    std::string frame = std::move(pImpl->inbound.front());
    pImpl->inbound.pop_front();
    return frame;
}

std::optional<std::string> InMemoryTransport::ReceiveFor(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lk(pImpl->mutex);
    pImpl->cv.wait_for(lk, timeout, [&]{ return !pImpl->inbound.empty() || pImpl->inputDone; });
    if (pImpl->inbound.empty()) {
        return std::nullopt;
    }
    std::string frame = std::move(pImpl->inbound.front());
    pImpl->inbound.pop_front();
    return frame;
}

bool InMemoryTransport::Send(const std::string& frame) {
    FUNC_SCOPE();
    {
        std::lock_guard<std::mutex> lk(pImpl->mutex);
        if (pImpl->writeClosed) {
            LOG_DEBUG("InMemoryTransport: Send after close ignored ({} bytes)", frame.size());
            return false;
        }
    }
    auto peer = pImpl->peer.lock();
    if (!peer) {
        if (pImpl->errorHandler) {
            pImpl->errorHandler("InMemoryTransport: peer is gone");
        }
        return false;
    }
    peer->deliver(frame);
    return true;
}

void InMemoryTransport::CloseWrite() {
    FUNC_SCOPE();
    pImpl->closeWrite();
}

bool InMemoryTransport::InputEnded() const {
    std::lock_guard<std::mutex> lk(pImpl->mutex);
    return pImpl->inputDone && pImpl->inbound.empty();
}

void InMemoryTransport::SetErrorHandler(ErrorHandler handler) {
    FUNC_SCOPE();
    pImpl->errorHandler = std::move(handler);
}

} // namespace mcprt
