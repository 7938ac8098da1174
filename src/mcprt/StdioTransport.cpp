//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: StdioTransport.cpp
// Purpose: Newline-delimited stdio transport implementation (POSIX poll + self-pipe wakeups)
//==========================================================================================================

#include <unistd.h>
#include <fcntl.h>
#include <poll.h>
#include <errno.h>
#include <cstring>

#include <algorithm>
#include <array>
#include <cctype>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <future>
#include <mutex>
#include <optional>
#include <random>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "logging/Logger.h"
#include "mcprt/Config.h"
#include "mcprt/StdioTransport.hpp"

namespace mcprt {

class StdioTransport::Impl {
public:
    int inFd;
    int outFd;
    std::atomic<bool> connected{false};
    std::atomic<bool> readerExited{false};
    std::atomic<bool> writerExited{false};
    std::atomic<bool> stopWriter{false};
    std::string sessionId;
    ITransport::ErrorHandler errorHandler;
    std::thread readerThread;
    std::thread writerThread;

    // Inbound frames produced by the reader, consumed by Receive()
    std::mutex readMutex;
    std::condition_variable cvRead;
    std::deque<std::string> inbound;
    bool inputDone{false};

    std::mutex writeMutex; // protects writeQueue and queuedBytes
    std::condition_variable cvWrite;
    std::deque<std::string> writeQueue;
    std::size_t queuedBytes{0};

    int wakePipe[2]{-1, -1};

    std::size_t maxFrameBytes{4 * 1024 * 1024}; // 4 MiB default cap
    std::size_t writeQueueMaxBytes{2 * 1024 * 1024}; // 2 MiB default cap
    std::chrono::milliseconds idleReadTimeout{0}; // 0 = disabled
    std::chrono::milliseconds writeTimeout{0}; // 0 = disabled
    std::chrono::milliseconds flushTimeout{2000};
    std::chrono::steady_clock::time_point lastReadTs{std::chrono::steady_clock::now()};

    Impl(int in, int out) : inFd(in), outFd(out) {
        std::random_device rd;
        std::mt19937 gen(rd());
        std::uniform_int_distribution<> dis(1000, 9999);
        sessionId = "stdio-" + std::to_string(dis(gen));

        if (::pipe(wakePipe) != 0) {
            LOG_ERROR("StdioTransport: failed to create self-pipe (errno={} msg={})", errno, ::strerror(errno));
            wakePipe[0] = wakePipe[1] = -1;
        } else {
            for (int fd : wakePipe) {
                int fl = ::fcntl(fd, F_GETFL, 0);
                if (fl >= 0) {
                    (void)::fcntl(fd, F_SETFL, fl | O_NONBLOCK);
                }
                (void)::fcntl(fd, F_SETFD, FD_CLOEXEC);
            }
        }
    }

    ~Impl() {
        connected = false;
        stopWriter = true;
        wakeReader();
        cvWrite.notify_all();
        if (readerThread.joinable()) {
            readerThread.join();
        }
        if (writerThread.joinable()) {
            writerThread.join();
        }
        if (wakePipe[0] >= 0) { ::close(wakePipe[0]); wakePipe[0] = -1; }
        if (wakePipe[1] >= 0) { ::close(wakePipe[1]); wakePipe[1] = -1; }
    }

    void wakeReader() {
        if (wakePipe[1] >= 0) {
            char b = 'x';
            ssize_t wr;
            do {
                wr = ::write(wakePipe[1], &b, 1);
            } while (wr < 0 && errno == EINTR);
            if (wr < 0 && errno != EAGAIN && errno != EWOULDBLOCK) {
                LOG_WARN("StdioTransport: wake pipe write failed (errno={} msg={})", errno, ::strerror(errno));
            }
        }
    }

    void reportError(const std::string& msg) {
        if (errorHandler) {
            errorHandler(msg);
        }
    }

    // Fatal condition: stop accepting input and release any Receive() waiter.
    void disconnect() {
        connected = false;
        wakeReader();
        cvWrite.notify_all();
        finishInbound();
    }

    void finishInbound() {
        {
            std::lock_guard<std::mutex> lk(readMutex);
            inputDone = true;
        }
        cvRead.notify_all();
    }

    void pushFrame(std::string frame) {
        {
            std::lock_guard<std::mutex> lk(readMutex);
            inbound.emplace_back(std::move(frame));
        }
        cvRead.notify_one();
    }

    void drainFrames(std::string& buffer) {
        std::size_t pos = 0;
        while (connected) {
            std::size_t nl = buffer.find('\n', pos);
            if (nl == std::string::npos) {
                break;
            }
            std::string line = buffer.substr(pos, nl - pos);
            pos = nl + 1;
            if (!line.empty() && line.back() == '\r') {
                line.pop_back();
            }
            if (line.size() > maxFrameBytes) {
                LOG_ERROR("StdioTransport: frame of {} bytes exceeds max {}", line.size(), maxFrameBytes);
                buffer.erase(0, pos);
                reportError("StdioTransport: frame exceeds maximum size");
                disconnect();
                return;
            }
            bool blank = std::all_of(line.begin(), line.end(), [](unsigned char c){ return std::isspace(c) != 0; });
            if (blank) {
                continue;
            }
            pushFrame(std::move(line));
        }
        buffer.erase(0, pos);
        if (connected && buffer.size() > maxFrameBytes) {
            LOG_ERROR("StdioTransport: unterminated frame of {} bytes exceeds max {}", buffer.size(), maxFrameBytes);
            buffer.clear();
            reportError("StdioTransport: frame exceeds maximum size");
            disconnect();
        }
    }

    void finishInput(std::string& buffer) {
        bool blank = std::all_of(buffer.begin(), buffer.end(), [](unsigned char c){ return std::isspace(c) != 0; });
        if (!blank) {
            LOG_WARN("StdioTransport: discarding unterminated frame of {} bytes at end of input", buffer.size());
            reportError("StdioTransport: unterminated frame at end of input");
        }
        buffer.clear();
        finishInbound();
    }

    void startReader() {
        readerThread = std::thread([this]() {
            std::string buffer;
            std::vector<char> tmp(64 * 1024);
            constexpr int waitTimeoutMs = 100;
            lastReadTs = std::chrono::steady_clock::now();
            bool eof = false;

            while (connected) {
                ssize_t n = -1;
                pollfd pfds[2];
                nfds_t nfds = 1;
                pfds[0].fd = inFd; pfds[0].events = POLLIN; pfds[0].revents = 0;
                if (wakePipe[0] >= 0) { pfds[1].fd = wakePipe[0]; pfds[1].events = POLLIN; pfds[1].revents = 0; nfds = 2; }
                int rc = ::poll(pfds, nfds, waitTimeoutMs);
                if (rc < 0) {
                    if (errno == EINTR) {
                        continue;
                    }
                    LOG_ERROR("StdioTransport: poll failed (errno={} msg={})", errno, ::strerror(errno));
                    reportError("StdioTransport: poll failed");
                    break;
                }
                if (rc > 0) {
                    if (nfds == 2 && (pfds[1].revents & POLLIN)) {
                        std::array<char, 64> b{};
                        ssize_t r;
                        do { r = ::read(pfds[1].fd, b.data(), b.size()); } while (r > 0 || (r < 0 && errno == EINTR));
                        if (!connected) {
                            break;
                        }
                    }
                    if (pfds[0].revents & (POLLIN | POLLHUP | POLLERR)) {
                        do { n = ::read(inFd, tmp.data(), tmp.size()); } while (n < 0 && errno == EINTR);
                        if (n > 0) {
                            buffer.append(tmp.data(), tmp.data() + n);
                            lastReadTs = std::chrono::steady_clock::now();
                            drainFrames(buffer);
                        } else if (n == 0) {
                            LOG_INFO("StdioTransport: EOF on input");
                            eof = true;
                            break;
                        } else if (errno != EAGAIN && errno != EWOULDBLOCK) {
                            LOG_ERROR("StdioTransport: read error (errno={} msg={})", errno, ::strerror(errno));
                            reportError("StdioTransport: read error");
                            break;
                        }
                    }
                }

                // Idle read timeout check
                if (idleReadTimeout.count() > 0) {
                    auto now = std::chrono::steady_clock::now();
                    if (now - lastReadTs >= idleReadTimeout) {
                        LOG_ERROR("StdioTransport: idle read timeout ({} ms)", static_cast<long long>(idleReadTimeout.count()));
                        reportError("StdioTransport: idle read timeout");
                        break;
                    }
                }
            }
            if (eof) {
                finishInput(buffer);
            } else {
                finishInbound();
            }
            // Input is finished; the writer keeps draining queued frames until Close()
            connected = false;
            readerExited.store(true);
        });
    }

    bool enqueueFrame(const std::string& payload) {
        if (payload.find('\n') != std::string::npos) {
            LOG_ERROR("StdioTransport: refusing frame with embedded newline ({} bytes)", payload.size());
            return false;
        }
        std::string frame;
        frame.reserve(payload.size() + 1);
        frame.append(payload);
        frame.push_back('\n');
        {
            std::unique_lock<std::mutex> lk(writeMutex);
            if (stopWriter) {
                return false;
            }
            if (queuedBytes + frame.size() > writeQueueMaxBytes) {
                LOG_ERROR("StdioTransport: write queue overflow (queued={} add={} max={})", queuedBytes, frame.size(), writeQueueMaxBytes);
                lk.unlock();
                reportError("StdioTransport: write queue overflow");
                disconnect();
                return false;
            }
            queuedBytes += frame.size();
            writeQueue.emplace_back(std::move(frame));
        }
        cvWrite.notify_one();
        return true;
    }

    void startWriter() {
        writerThread = std::thread([this]() {
            writerExited.store(false);
            int flags = ::fcntl(outFd, F_GETFL, 0);
            if (flags >= 0) { (void)::fcntl(outFd, F_SETFL, flags | O_NONBLOCK); }
            bool failed = false;
            while (!failed) {
                std::string frame;
                {
                    std::unique_lock<std::mutex> lk(writeMutex);
                    cvWrite.wait_for(lk, std::chrono::milliseconds(50), [&]{ return stopWriter.load() || !writeQueue.empty(); });
                    if (writeQueue.empty()) {
                        if (stopWriter) {
                            break;
                        }
                        continue;
                    }
                    frame = std::move(writeQueue.front());
                    writeQueue.pop_front();
                }

                std::size_t total = 0;
                auto start = std::chrono::steady_clock::now();
                while (total < frame.size()) {
                    ssize_t w = ::write(outFd, frame.data() + total, frame.size() - total);
                    if (w > 0) {
                        total += static_cast<std::size_t>(w);
                    } else if (w < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
                        if (writeTimeout.count() > 0 && (std::chrono::steady_clock::now() - start) >= writeTimeout) {
                            LOG_ERROR("StdioTransport: write timeout ({} ms)", static_cast<long long>(writeTimeout.count()));
                            reportError("StdioTransport: write timeout");
                            failed = true; break;
                        }
                        pollfd pfd{outFd, POLLOUT, 0};
                        (void)::poll(&pfd, 1, 5);
                    } else if (w < 0 && errno == EINTR) {
                        continue;
                    } else {
                        LOG_ERROR("StdioTransport: write error (errno={} msg={})", errno, ::strerror(errno));
                        reportError("StdioTransport: write error");
                        failed = true; break;
                    }
                }
                {
                    std::lock_guard<std::mutex> lk(writeMutex);
                    queuedBytes = (queuedBytes >= frame.size()) ? queuedBytes - frame.size() : 0;
                }
                cvWrite.notify_all();
            }
            if (failed) {
                {
                    std::lock_guard<std::mutex> lk(writeMutex);
                    stopWriter = true;
                    writeQueue.clear();
                    queuedBytes = 0;
                }
                disconnect();
            }
            writerExited.store(true);
            cvWrite.notify_all();
        });
    }
};

StdioTransport::StdioTransport() : pImpl(std::make_unique<Impl>(STDIN_FILENO, STDOUT_FILENO)) {
    FUNC_SCOPE();
}

StdioTransport::StdioTransport(int inFd, int outFd) : pImpl(std::make_unique<Impl>(inFd, outFd)) {
    FUNC_SCOPE();
}

StdioTransport::~StdioTransport() {
    FUNC_SCOPE();
}

std::future<void> StdioTransport::Start() {
    FUNC_SCOPE();
    if (!pImpl->connected.exchange(true)) {
        pImpl->readerExited = false;
        pImpl->stopWriter = false;
        pImpl->startReader();
        pImpl->startWriter();
        LOG_DEBUG("StdioTransport: started (session={})", pImpl->sessionId);
    }
    std::promise<void> promise; promise.set_value(); return promise.get_future();
}

std::future<void> StdioTransport::Close() {
    FUNC_SCOPE();
    pImpl->connected = false;
    pImpl->wakeReader();
    if (pImpl->readerThread.joinable()) {
        pImpl->readerThread.join();
    }
    pImpl->finishInbound();

    // Give queued responses a bounded chance to reach the peer
    {
        std::unique_lock<std::mutex> lk(pImpl->writeMutex);
        const auto deadline = std::chrono::steady_clock::now() + pImpl->flushTimeout;
        bool flushed = pImpl->cvWrite.wait_until(lk, deadline, [&]{
            return pImpl->queuedBytes == 0 || pImpl->writerExited.load() || !pImpl->writerThread.joinable();
        });
        if (!flushed) {
            LOG_WARN("StdioTransport: flush timeout; dropping {} queued bytes", pImpl->queuedBytes);
            pImpl->writeQueue.clear();
            pImpl->queuedBytes = 0;
        }
        pImpl->stopWriter = true;
    }
    pImpl->cvWrite.notify_all();
    if (pImpl->writerThread.joinable()) {
        pImpl->writerThread.join();
    }
    std::promise<void> promise; promise.set_value(); return promise.get_future();
}

bool StdioTransport::IsConnected() const { FUNC_SCOPE(); return pImpl->connected; }
std::string StdioTransport::GetSessionId() const { FUNC_SCOPE(); return pImpl->sessionId; }

std::optional<std::string> StdioTransport::Receive() {
    std::unique_lock<std::mutex> lk(pImpl->readMutex);
    pImpl->cvRead.wait(lk, [&]{ return !pImpl->inbound.empty() || pImpl->inputDone; });
    if (pImpl->inbound.empty()) {
        return std::nullopt;
    }
    std::string frame = std::move(pImpl->inbound.front());
    pImpl->inbound.pop_front();
    return frame;
}

bool StdioTransport::Send(const std::string& frame) {
    FUNC_SCOPE();
    LOG_DEBUG("StdioTransport: sending frame ({} bytes)", frame.size());
    return pImpl->enqueueFrame(frame);
}

void StdioTransport::SetErrorHandler(ErrorHandler handler) { FUNC_SCOPE(); pImpl->errorHandler = std::move(handler); }

void StdioTransport::SetMaxFrameBytes(std::size_t maxBytes) {
    FUNC_SCOPE();
    if (maxBytes == 0) { maxBytes = 1; }
    pImpl->maxFrameBytes = maxBytes;
}

void StdioTransport::SetIdleReadTimeoutMs(uint64_t timeoutMs) {
    FUNC_SCOPE();
    pImpl->idleReadTimeout = ClampDurationMs(timeoutMs, "idle_read_timeout_ms");
}

void StdioTransport::SetWriteQueueMaxBytes(std::size_t maxBytes) {
    FUNC_SCOPE();
    if (maxBytes == 0) { maxBytes = 1; }
    pImpl->writeQueueMaxBytes = maxBytes;
}

void StdioTransport::SetWriteTimeoutMs(uint64_t timeoutMs) {
    FUNC_SCOPE();
    pImpl->writeTimeout = ClampDurationMs(timeoutMs, "write_timeout_ms");
}

void StdioTransport::SetFlushTimeoutMs(uint64_t timeoutMs) {
    FUNC_SCOPE();
    pImpl->flushTimeout = ClampDurationMs(timeoutMs, "flush_timeout_ms");
}

std::unique_ptr<ITransport> StdioTransportFactory::CreateTransport(const std::string& config) {
    auto t = std::make_unique<StdioTransport>();
    auto parseUint = [](const std::string& s, uint64_t& out) -> bool {
        if (s.empty() || s[0] == '-') return false;
        try { out = static_cast<uint64_t>(std::stoull(s)); return true; } catch (const std::logic_error&) { return false; }
    };
    // Parse key=value pairs separated by ';' or whitespace
    std::string token;
    for (std::size_t i = 0; i < config.size();) {
        while (i < config.size() && (config[i] == ';' || config[i] == ' ' || config[i] == '\t')) ++i;
        if (i >= config.size()) break;
        std::size_t start = i;
        while (i < config.size() && config[i] != ';' && config[i] != ' ' && config[i] != '\t') ++i;
        token = config.substr(start, i - start);
        auto eq = token.find('=');
        if (eq == std::string::npos) {
            LOG_WARN("StdioTransportFactory: ignoring malformed config token '{}'", token);
            continue;
        }
        auto key = token.substr(0, eq);
        auto val = token.substr(eq + 1);
        uint64_t v = 0;
        if (!parseUint(val, v)) {
            LOG_WARN("StdioTransportFactory: ignoring non-numeric value for {}: '{}'", key, val);
            continue;
        }
        if (key == "max_frame_bytes") {
            t->SetMaxFrameBytes(static_cast<std::size_t>(v));
        } else if (key == "idle_read_timeout_ms") {
            t->SetIdleReadTimeoutMs(v);
        } else if (key == "write_timeout_ms") {
            t->SetWriteTimeoutMs(v);
        } else if (key == "write_queue_max_bytes") {
            t->SetWriteQueueMaxBytes(static_cast<std::size_t>(v));
        } else if (key == "flush_timeout_ms") {
            t->SetFlushTimeoutMs(v);
        } else {
            LOG_DEBUG("StdioTransportFactory: unknown config key '{}'", key);
        }
    }
    return t;
}

//////////////////////////////////////////// Test hooks ////////////////////////////////////////////
void StdioTransportTestHooks::drainFrames(StdioTransport& t, std::string& buffer) {
    t.pImpl->drainFrames(buffer);
}

void StdioTransportTestHooks::finishInput(StdioTransport& t, std::string& buffer) {
    t.pImpl->finishInput(buffer);
}

void StdioTransportTestHooks::setConnected(StdioTransport& t, bool v) {
    t.pImpl->connected = v;
}

bool StdioTransportTestHooks::isConnected(const StdioTransport& t) {
    return t.pImpl->connected.load();
}

std::size_t StdioTransportTestHooks::maxFrameBytes(const StdioTransport& t) {
    return t.pImpl->maxFrameBytes;
}

std::size_t StdioTransportTestHooks::writeQueueMaxBytes(const StdioTransport& t) {
    return t.pImpl->writeQueueMaxBytes;
}

} // namespace mcprt
