/*
 * loopback_transport.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#ifndef BMTL_MESSAGING_LOOPBACK_TRANSPORT_HPP
#define BMTL_MESSAGING_LOOPBACK_TRANSPORT_HPP

#include <deque>
#include <mutex>
#include <optional>
#include <set>
#include <vector>

#include "transport.hpp"

namespace bmtl::messaging {

/**
 * @brief In-memory transport for tests and dry runs
 *
 * Messages injected with inject() are delivered on the next poll() when
 * their topic is subscribed. Publications are recorded.
 */
class LoopbackTransport : public MessagingTransport {
public:
    void setWill(const OutboundMessage& will) override;
    bool connect() override;
    void disconnect() override;
    [[nodiscard]] bool isConnected() const override;
    bool subscribe(const std::string& topic, int deliveryLevel) override;
    bool publish(const OutboundMessage& message) override;
    void setMessageHandler(MessageHandler handler) override;
    void poll(int timeoutMs) override;

    void inject(InboundMessage message);

    /// Drop the session as a broker would; publishes the will.
    void simulateConnectionLoss();

    /// Make the next @p count connect() calls fail
    void failNextConnects(int count);

    [[nodiscard]] std::vector<OutboundMessage> published() const;
    [[nodiscard]] std::set<std::string> subscriptions() const;
    [[nodiscard]] std::optional<OutboundMessage> will() const;
    [[nodiscard]] int connectAttempts() const;

private:
    mutable std::mutex mutex_;
    bool connected_{false};
    int failConnects_{0};
    int connectAttempts_{0};
    std::optional<OutboundMessage> will_;
    std::set<std::string> subscriptions_;
    std::deque<InboundMessage> inbound_;
    std::vector<OutboundMessage> published_;
    MessageHandler handler_;
};

}  // namespace bmtl::messaging

#endif  // BMTL_MESSAGING_LOOPBACK_TRANSPORT_HPP
