/*
 * transport.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12-06

Description: Narrow publish/subscribe client interface

**************************************************/

#ifndef BMTL_MESSAGING_TRANSPORT_HPP
#define BMTL_MESSAGING_TRANSPORT_HPP

#include <functional>
#include <string>

namespace bmtl::messaging {

struct InboundMessage {
    std::string topic;
    std::string payload;
};

struct OutboundMessage {
    std::string topic;
    std::string payload;
    int deliveryLevel{1};
    bool retain{false};

    bool operator==(const OutboundMessage&) const = default;
};

/**
 * @brief Publish/subscribe session owned by the messaging process
 *
 * connect() is retried by the caller with backoff. The message handler is
 * invoked from poll() on the caller's thread.
 */
class MessagingTransport {
public:
    using MessageHandler = std::function<void(const InboundMessage&)>;

    virtual ~MessagingTransport() = default;

    /// Message the broker publishes if the session is lost
    virtual void setWill(const OutboundMessage& will) = 0;

    virtual bool connect() = 0;
    virtual void disconnect() = 0;
    [[nodiscard]] virtual bool isConnected() const = 0;

    virtual bool subscribe(const std::string& topic, int deliveryLevel) = 0;
    virtual bool publish(const OutboundMessage& message) = 0;

    virtual void setMessageHandler(MessageHandler handler) = 0;

    /**
     * @brief Deliver pending inbound messages, waiting at most @p timeoutMs
     */
    virtual void poll(int timeoutMs) = 0;
};

}  // namespace bmtl::messaging

#endif  // BMTL_MESSAGING_TRANSPORT_HPP
