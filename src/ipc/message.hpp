/*
 * message.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/**
 * @file message.hpp
 * @brief Framed IPC messages
 * @date 2024
 * @version 1.0.0
 *
 * Every frame is a 16-byte big-endian header (magic, version, type,
 * payload size, sequence id, flags) followed by a MessagePack payload.
 */

#ifndef BMTL_IPC_MESSAGE_HPP
#define BMTL_IPC_MESSAGE_HPP

#include <nlohmann/json.hpp>

#include <span>
#include <vector>

#include "message_types.hpp"

namespace bmtl::ipc {

using json = nlohmann::json;

/**
 * @brief Message header structure
 */
struct MessageHeader {
    static constexpr uint32_t MAGIC = ProtocolConstants::MAGIC;
    static constexpr uint8_t VERSION = ProtocolConstants::VERSION;
    static constexpr size_t SIZE = ProtocolConstants::HEADER_SIZE;

    uint32_t magic{MAGIC};     ///< Magic number for validation
    uint8_t version{VERSION};  ///< Protocol version
    MessageType type{MessageType::Heartbeat};
    uint32_t payloadSize{0};   ///< Size of payload in bytes
    uint32_t sequenceId{0};    ///< Message sequence number
    uint8_t flags{0};          ///< Message flags
    uint8_t reserved{0};       ///< Reserved for future use

    [[nodiscard]] std::vector<uint8_t> serialize() const;

    /**
     * @brief Deserialize header from bytes
     *
     * Rejects a wrong magic, an unknown version and payloads above
     * ProtocolConstants::MAX_PAYLOAD_SIZE.
     */
    [[nodiscard]] static IPCResult<MessageHeader> deserialize(
        std::span<const uint8_t> data);

    [[nodiscard]] bool isValid() const noexcept;
};

/**
 * @brief IPC Message structure
 */
struct Message {
    MessageHeader header;
    std::vector<uint8_t> payload;

    /**
     * @brief Create a message with a MessagePack-encoded JSON payload
     */
    [[nodiscard]] static IPCResult<Message> create(MessageType type,
                                                   const json& payload,
                                                   uint32_t sequenceId = 0);

    /**
     * @brief Create a message without payload (control messages)
     */
    [[nodiscard]] static Message control(MessageType type,
                                         uint32_t sequenceId = 0);

    [[nodiscard]] IPCResult<json> getPayloadAsJson() const;

    /**
     * @brief Serialize the entire message (header + payload)
     */
    [[nodiscard]] std::vector<uint8_t> serialize() const;

    [[nodiscard]] static IPCResult<Message> deserialize(
        std::span<const uint8_t> data);
};

}  // namespace bmtl::ipc

#endif  // BMTL_IPC_MESSAGE_HPP
