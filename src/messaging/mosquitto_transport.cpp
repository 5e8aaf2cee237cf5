/*
 * mosquitto_transport.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "mosquitto_transport.hpp"

#include <mosquitto.h>
#include <spdlog/spdlog.h>

#include <mutex>
#include <stdexcept>

namespace bmtl::messaging {

namespace {

std::once_flag g_libraryInit;

void initLibrary() {
    std::call_once(g_libraryInit, [] {
        mosquitto_lib_init();
        int major = 0;
        int minor = 0;
        int revision = 0;
        mosquitto_lib_version(&major, &minor, &revision);
        spdlog::debug("libmosquitto {}.{}.{}", major, minor, revision);
    });
}

}  // namespace

MosquittoTransport::MosquittoTransport(MosquittoOptions options)
    : options_(std::move(options)) {
    initLibrary();
    // Persistent session: subscriptions survive a reconnect on the broker side.
    client_ = mosquitto_new(options_.clientId.empty() ? nullptr
                                                      : options_.clientId.c_str(),
                            options_.clientId.empty(), this);
    if (client_ == nullptr) {
        throw std::runtime_error("mosquitto_new failed");
    }
    mosquitto_connect_callback_set(client_, &MosquittoTransport::onConnect);
    mosquitto_disconnect_callback_set(client_, &MosquittoTransport::onDisconnect);
    mosquitto_message_callback_set(client_, &MosquittoTransport::onMessage);
}

MosquittoTransport::~MosquittoTransport() {
    if (connected_) {
        mosquitto_disconnect(client_);
    }
    mosquitto_destroy(client_);
}

void MosquittoTransport::setWill(const OutboundMessage& will) {
    will_ = will;
    optionsApplied_ = false;
}

bool MosquittoTransport::applySessionOptions() {
    if (optionsApplied_) {
        return true;
    }

    int rc = MOSQ_ERR_SUCCESS;
    if (!options_.username.empty()) {
        rc = mosquitto_username_pw_set(
            client_, options_.username.c_str(),
            options_.password.empty() ? nullptr : options_.password.c_str());
        if (rc != MOSQ_ERR_SUCCESS) {
            spdlog::error("Cannot set broker credentials: {}", mosquitto_strerror(rc));
            return false;
        }
    }

    if (options_.useTls) {
        rc = mosquitto_tls_set(
            client_, options_.caFile.empty() ? nullptr : options_.caFile.c_str(),
            options_.caFile.empty() ? options_.caPath.c_str() : nullptr, nullptr,
            nullptr, nullptr);
        if (rc != MOSQ_ERR_SUCCESS) {
            spdlog::error("Cannot enable TLS: {}", mosquitto_strerror(rc));
            return false;
        }
    }

    if (will_) {
        rc = mosquitto_will_set(client_, will_->topic.c_str(),
                                static_cast<int>(will_->payload.size()),
                                will_->payload.data(), will_->deliveryLevel,
                                will_->retain);
        if (rc != MOSQ_ERR_SUCCESS) {
            spdlog::error("Cannot register last will: {}", mosquitto_strerror(rc));
            return false;
        }
    }

    optionsApplied_ = true;
    return true;
}

bool MosquittoTransport::connect() {
    if (!applySessionOptions()) {
        return false;
    }

    connected_ = false;
    connackCode_.reset();
    int rc = mosquitto_connect(client_, options_.host.c_str(), options_.port,
                               options_.keepaliveSeconds);
    if (rc != MOSQ_ERR_SUCCESS) {
        spdlog::warn("Connect to {}:{} failed: {}", options_.host, options_.port,
                     rc == MOSQ_ERR_ERRNO ? "socket error" : mosquitto_strerror(rc));
        return false;
    }

    auto deadline = std::chrono::steady_clock::now() + options_.connackTimeout;
    while (!connackCode_ && std::chrono::steady_clock::now() < deadline) {
        if (!runLoop(100)) {
            break;
        }
    }

    if (!connackCode_) {
        spdlog::warn("No CONNACK from {}:{}", options_.host, options_.port);
        mosquitto_disconnect(client_);
        return false;
    }
    if (*connackCode_ != 0) {
        spdlog::warn("Broker refused session: {}", mosquitto_connack_string(*connackCode_));
        return false;
    }

    spdlog::info("Connected to broker {}:{} as {}", options_.host, options_.port,
                 options_.clientId);
    return connected_;
}

void MosquittoTransport::disconnect() {
    if (!connected_) {
        return;
    }
    // Flush queued publications before the DISCONNECT packet.
    runLoop(100);
    mosquitto_disconnect(client_);
    runLoop(100);
    connected_ = false;
}

bool MosquittoTransport::isConnected() const {
    return connected_;
}

bool MosquittoTransport::subscribe(const std::string& topic, int deliveryLevel) {
    if (!connected_) {
        return false;
    }
    int rc = mosquitto_subscribe(client_, nullptr, topic.c_str(), deliveryLevel);
    if (rc != MOSQ_ERR_SUCCESS) {
        spdlog::error("Subscribe to {} failed: {}", topic, mosquitto_strerror(rc));
        return false;
    }
    return true;
}

bool MosquittoTransport::publish(const OutboundMessage& message) {
    if (!connected_) {
        return false;
    }
    int rc = mosquitto_publish(client_, nullptr, message.topic.c_str(),
                               static_cast<int>(message.payload.size()),
                               message.payload.data(), message.deliveryLevel,
                               message.retain);
    if (rc != MOSQ_ERR_SUCCESS) {
        spdlog::error("Publish to {} failed: {}", message.topic, mosquitto_strerror(rc));
        if (rc == MOSQ_ERR_NO_CONN || rc == MOSQ_ERR_CONN_LOST) {
            connected_ = false;
        }
        return false;
    }
    return true;
}

void MosquittoTransport::setMessageHandler(MessageHandler handler) {
    handler_ = std::move(handler);
}

void MosquittoTransport::poll(int timeoutMs) {
    if (!connected_) {
        return;
    }
    runLoop(timeoutMs);
}

bool MosquittoTransport::runLoop(int timeoutMs) {
    int rc = mosquitto_loop(client_, timeoutMs, 1);
    if (rc == MOSQ_ERR_SUCCESS) {
        return true;
    }
    if (connected_) {
        spdlog::warn("Broker session lost: {}",
                     rc == MOSQ_ERR_ERRNO ? "socket error" : mosquitto_strerror(rc));
    }
    connected_ = false;
    return false;
}

void MosquittoTransport::onConnect(struct mosquitto* /*client*/, void* self, int rc) {
    auto* transport = static_cast<MosquittoTransport*>(self);
    transport->connackCode_ = rc;
    transport->connected_ = rc == 0;
}

void MosquittoTransport::onDisconnect(struct mosquitto* /*client*/, void* self, int rc) {
    auto* transport = static_cast<MosquittoTransport*>(self);
    if (rc != 0) {
        spdlog::warn("Unexpected disconnect from broker ({})", rc);
    }
    transport->connected_ = false;
}

void MosquittoTransport::onMessage(struct mosquitto* /*client*/, void* self,
                                   const struct mosquitto_message* message) {
    auto* transport = static_cast<MosquittoTransport*>(self);
    if (!transport->handler_ || message == nullptr || message->topic == nullptr) {
        return;
    }
    InboundMessage inbound;
    inbound.topic = message->topic;
    if (message->payloadlen > 0) {
        inbound.payload.assign(static_cast<const char*>(message->payload),
                               static_cast<size_t>(message->payloadlen));
    }
    transport->handler_(inbound);
}

}  // namespace bmtl::messaging
