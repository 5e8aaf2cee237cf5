/*
 * loopback_transport.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "loopback_transport.hpp"

#include <chrono>
#include <thread>

namespace bmtl::messaging {

void LoopbackTransport::setWill(const OutboundMessage& will) {
    std::lock_guard lock(mutex_);
    will_ = will;
}

bool LoopbackTransport::connect() {
    std::lock_guard lock(mutex_);
    ++connectAttempts_;
    if (failConnects_ > 0) {
        --failConnects_;
        return false;
    }
    connected_ = true;
    // A new session starts without subscriptions.
    subscriptions_.clear();
    return true;
}

void LoopbackTransport::disconnect() {
    std::lock_guard lock(mutex_);
    connected_ = false;
}

bool LoopbackTransport::isConnected() const {
    std::lock_guard lock(mutex_);
    return connected_;
}

bool LoopbackTransport::subscribe(const std::string& topic, int) {
    std::lock_guard lock(mutex_);
    if (!connected_) {
        return false;
    }
    subscriptions_.insert(topic);
    return true;
}

bool LoopbackTransport::publish(const OutboundMessage& message) {
    std::lock_guard lock(mutex_);
    if (!connected_) {
        return false;
    }
    published_.push_back(message);
    return true;
}

void LoopbackTransport::setMessageHandler(MessageHandler handler) {
    std::lock_guard lock(mutex_);
    handler_ = std::move(handler);
}

void LoopbackTransport::poll(int timeoutMs) {
    std::deque<InboundMessage> batch;
    MessageHandler handler;
    {
        std::lock_guard lock(mutex_);
        if (connected_) {
            for (auto& message : inbound_) {
                if (subscriptions_.contains(message.topic)) {
                    batch.push_back(std::move(message));
                }
            }
            inbound_.clear();
        }
        handler = handler_;
    }

    if (batch.empty()) {
        if (timeoutMs > 0) {
            std::this_thread::sleep_for(std::chrono::milliseconds{timeoutMs});
        }
        return;
    }
    if (handler) {
        for (const auto& message : batch) {
            handler(message);
        }
    }
}

void LoopbackTransport::inject(InboundMessage message) {
    std::lock_guard lock(mutex_);
    inbound_.push_back(std::move(message));
}

void LoopbackTransport::simulateConnectionLoss() {
    std::lock_guard lock(mutex_);
    if (connected_ && will_) {
        published_.push_back(*will_);
    }
    connected_ = false;
}

void LoopbackTransport::failNextConnects(int count) {
    std::lock_guard lock(mutex_);
    failConnects_ = count;
}

std::vector<OutboundMessage> LoopbackTransport::published() const {
    std::lock_guard lock(mutex_);
    return published_;
}

std::set<std::string> LoopbackTransport::subscriptions() const {
    std::lock_guard lock(mutex_);
    return subscriptions_;
}

std::optional<OutboundMessage> LoopbackTransport::will() const {
    std::lock_guard lock(mutex_);
    return will_;
}

int LoopbackTransport::connectAttempts() const {
    std::lock_guard lock(mutex_);
    return connectAttempts_;
}

}  // namespace bmtl::messaging
