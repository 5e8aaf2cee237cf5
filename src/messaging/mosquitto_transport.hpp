/*
 * mosquitto_transport.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12-06

Description: MQTT session on top of libmosquitto

**************************************************/

#ifndef BMTL_MESSAGING_MOSQUITTO_TRANSPORT_HPP
#define BMTL_MESSAGING_MOSQUITTO_TRANSPORT_HPP

#include <chrono>
#include <optional>
#include <string>

#include "transport.hpp"

struct mosquitto;
struct mosquitto_message;

namespace bmtl::messaging {

struct MosquittoOptions {
    std::string host{"localhost"};
    int port{1883};
    std::string clientId;
    std::string username;
    std::string password;
    bool useTls{false};
    std::string caFile;                           ///< Empty: system CA path
    std::string caPath{"/etc/ssl/certs"};
    int keepaliveSeconds{60};
    std::chrono::milliseconds connackTimeout{5000};
};

/**
 * @brief MessagingTransport backed by a libmosquitto client
 *
 * The network loop is driven from poll() on the caller's thread, so the
 * message handler never runs concurrently with the messaging daemon.
 * connect() returns only after the broker has acknowledged the session.
 */
class MosquittoTransport : public MessagingTransport {
public:
    explicit MosquittoTransport(MosquittoOptions options);
    ~MosquittoTransport() override;

    MosquittoTransport(const MosquittoTransport&) = delete;
    MosquittoTransport& operator=(const MosquittoTransport&) = delete;

    void setWill(const OutboundMessage& will) override;
    bool connect() override;
    void disconnect() override;
    [[nodiscard]] bool isConnected() const override;
    bool subscribe(const std::string& topic, int deliveryLevel) override;
    bool publish(const OutboundMessage& message) override;
    void setMessageHandler(MessageHandler handler) override;
    void poll(int timeoutMs) override;

private:
    static void onConnect(struct mosquitto* client, void* self, int rc);
    static void onDisconnect(struct mosquitto* client, void* self, int rc);
    static void onMessage(struct mosquitto* client, void* self,
                          const struct mosquitto_message* message);

    bool applySessionOptions();
    bool runLoop(int timeoutMs);

    MosquittoOptions options_;
    struct mosquitto* client_{nullptr};
    std::optional<OutboundMessage> will_;
    bool optionsApplied_{false};
    bool connected_{false};
    std::optional<int> connackCode_;
    MessageHandler handler_;
};

}  // namespace bmtl::messaging

#endif  // BMTL_MESSAGING_MOSQUITTO_TRANSPORT_HPP
