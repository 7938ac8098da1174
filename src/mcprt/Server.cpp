//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Server.cpp
// Purpose: Server facade and read loop
//==========================================================================================================

#include "mcprt/Server.h"

#include <atomic>
#include <condition_variable>
#include <mutex>
#include <stdexcept>
#include <thread>

#include "logging/Logger.h"
#include "mcprt/Dispatcher.h"
#include "mcprt/ExecutionScheduler.h"

namespace mcprt {

class Server::Impl {
public:
    const ServerOptions options;
    CapabilityRegistry registry;
    ExecutionScheduler scheduler;
    SessionState session;
    std::unique_ptr<Dispatcher> dispatcher;

    std::mutex transportMutex;
    std::unique_ptr<ITransport> transport;
    std::mutex closeMutex;
    bool transportClosed{false};

    std::mutex errorMutex;
    std::function<void(const std::string&)> errorHandler;

    // Drains and closes the session after shutdown begins
    std::mutex closerMutex;
    std::thread closerThread;

    std::thread runThread;
    std::atomic<bool> running{false};
    bool started{false};
    std::mutex runMutex;
    std::condition_variable cvRun;
    bool runFinished{false};

    explicit Impl(ServerOptions o)
        : options(std::move(o)),
          scheduler(options.maxConcurrency) {
        dispatcher = std::make_unique<Dispatcher>(options, registry, scheduler, session,
            [this](const std::string& frame) { return send(frame); });
        dispatcher->SetShutdownListener([this]() { startCloser(); });
    }

    ~Impl() {
        session.EndInput();
        dispatcher->FinishShutdown();
        joinCloser();
        if (runThread.joinable()) {
            runThread.join();
        }
    }

    bool send(const std::string& frame) {
        std::lock_guard<std::mutex> lk(transportMutex);
        if (!transport) {
            LOG_WARN("Server: no transport; dropping frame ({} bytes)", frame.size());
            return false;
        }
        return transport->Send(frame);
    }

    void reportError(const std::string& err) {
        LOG_ERROR("Server: transport error: {}", err);
        std::function<void(const std::string&)> handler;
        {
            std::lock_guard<std::mutex> lk(errorMutex);
            handler = errorHandler;
        }
        if (handler) {
            handler(err);
        }
    }

    // Serialized and idempotent; the closer thread and the read loop may both get here
    void closeTransport() {
        std::lock_guard<std::mutex> cl(closeMutex);
        if (transportClosed) {
            return;
        }
        ITransport* t = nullptr;
        {
            std::lock_guard<std::mutex> lk(transportMutex);
            t = transport.get();
        }
        if (t != nullptr) {
            t->Close().get();
            transportClosed = true;
        }
    }

    void startCloser() {
        std::lock_guard<std::mutex> lk(closerMutex);
        if (closerThread.joinable()) {
            return;
        }
        closerThread = std::thread([this]() {
            dispatcher->FinishShutdown();
            // Wakes the read loop blocked in Receive()
            closeTransport();
        });
    }

    void joinCloser() {
        std::thread t;
        {
            std::lock_guard<std::mutex> lk(closerMutex);
            t = std::move(closerThread);
        }
        if (t.joinable()) {
            t.join();
        }
    }

    void claim(std::unique_ptr<ITransport> t) {
        if (!t) {
            throw std::invalid_argument("Server: transport is null");
        }
        std::lock_guard<std::mutex> lk(runMutex);
        if (started) {
            throw std::logic_error("Server: already running or already ran");
        }
        started = true;
        t->SetErrorHandler([this](const std::string& err) { reportError(err); });
        std::lock_guard<std::mutex> tl(transportMutex);
        transport = std::move(t);
    }

    void runLoop(std::promise<void>* startedPromise) {
        ITransport* t = nullptr;
        {
            std::lock_guard<std::mutex> lk(transportMutex);
            t = transport.get();
        }
        t->Start().get();
        running = true;
        LOG_INFO("Server: {} {} serving on {}", options.serverName, options.serverVersion, t->GetSessionId());
        if (startedPromise != nullptr) {
            startedPromise->set_value();
        }

        while (auto frame = t->Receive()) {
            dispatcher->HandleFrame(frame.value());
            if (session.Phase() == SessionPhase::Closed) {
                break;
            }
        }
        LOG_INFO("Server: input ended in phase {}", toString(session.Phase()));
        session.EndInput();

        dispatcher->FinishShutdown();
        joinCloser();
        closeTransport();
        running = false;
        {
            std::lock_guard<std::mutex> lk(runMutex);
            runFinished = true;
        }
        cvRun.notify_all();
        LOG_INFO("Server: stopped");
    }
};

Server::Server(ServerOptions options) : pImpl(std::make_unique<Impl>(std::move(options))) {
    FUNC_SCOPE();
}

Server::~Server() {
    FUNC_SCOPE();
}

void Server::RegisterTool(const Tool& tool, ToolHandler handler) {
    FUNC_SCOPE();
    pImpl->registry.Register(Capability::FromTool(tool, std::move(handler)));
    LOG_DEBUG("Server: registered tool {}", tool.name);
}

void Server::RegisterResource(const Resource& resource, ResourceHandler handler) {
    FUNC_SCOPE();
    pImpl->registry.Register(Capability::FromResource(resource, std::move(handler)));
    LOG_DEBUG("Server: registered resource {}", resource.uri);
}

void Server::RegisterPrompt(const Prompt& prompt, PromptHandler handler) {
    FUNC_SCOPE();
    pImpl->registry.Register(Capability::FromPrompt(prompt, std::move(handler)));
    LOG_DEBUG("Server: registered prompt {}", prompt.name);
}

void Server::Run(std::unique_ptr<ITransport> transport) {
    FUNC_SCOPE();
    pImpl->claim(std::move(transport));
    pImpl->runLoop(nullptr);
}

std::future<void> Server::Start(std::unique_ptr<ITransport> transport) {
    FUNC_SCOPE();
    pImpl->claim(std::move(transport));
    auto promise = std::make_shared<std::promise<void>>();
    auto fut = promise->get_future();
    pImpl->runThread = std::thread([this, promise]() { pImpl->runLoop(promise.get()); });
    return fut;
}

std::future<void> Server::Stop() {
    FUNC_SCOPE();
    bool hasLoop = false;
    {
        std::lock_guard<std::mutex> lk(pImpl->runMutex);
        hasLoop = pImpl->started;
    }
    // The application is stopping; do not hold the session open for late client requests
    pImpl->session.EndInput();
    if (!hasLoop) {
        pImpl->dispatcher->FinishShutdown();
        std::promise<void> p; p.set_value(); return p.get_future();
    }
    pImpl->dispatcher->BeginShutdown("stop requested");
    Impl* impl = pImpl.get();
    return std::async(std::launch::async, [impl]() {
        std::unique_lock<std::mutex> lk(impl->runMutex);
        impl->cvRun.wait(lk, [impl]{ return impl->runFinished; });
    });
}

bool Server::IsRunning() const {
    return pImpl->running.load();
}

SessionPhase Server::Phase() const {
    return pImpl->session.Phase();
}

const ServerOptions& Server::Options() const {
    return pImpl->options;
}

const CapabilityRegistry& Server::Registry() const {
    return pImpl->registry;
}

void Server::SetErrorHandler(std::function<void(const std::string&)> handler) {
    FUNC_SCOPE();
    std::lock_guard<std::mutex> lk(pImpl->errorMutex);
    pImpl->errorHandler = std::move(handler);
}

} // namespace mcprt
