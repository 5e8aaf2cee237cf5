/*
 * message_types.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/**
 * @file message_types.hpp
 * @brief IPC Message type definitions
 * @date 2024
 * @version 1.1.0
 */

#ifndef BMTL_IPC_MESSAGE_TYPES_HPP
#define BMTL_IPC_MESSAGE_TYPES_HPP

#include <cstddef>
#include <cstdint>
#include <expected>
#include <string_view>

namespace bmtl::ipc {

/**
 * @brief IPC error codes
 */
enum class IPCError {
    Success = 0,
    MessageTooLarge,
    SerializationFailed,
    DeserializationFailed,
    Timeout,
    PipeError,
    InvalidMessage,
    ChannelClosed,
    UnknownError
};

[[nodiscard]] constexpr std::string_view ipcErrorToString(IPCError error) noexcept {
    switch (error) {
        case IPCError::Success: return "Success";
        case IPCError::MessageTooLarge: return "Message too large";
        case IPCError::SerializationFailed: return "Serialization failed";
        case IPCError::DeserializationFailed: return "Deserialization failed";
        case IPCError::Timeout: return "Timeout";
        case IPCError::PipeError: return "Pipe error";
        case IPCError::InvalidMessage: return "Invalid message";
        case IPCError::ChannelClosed: return "Channel closed";
        case IPCError::UnknownError: return "Unknown error";
    }
    return "Unknown error";
}

/**
 * @brief Result type for IPC operations
 */
template<typename T>
using IPCResult = std::expected<T, IPCError>;

/**
 * @brief Message types carried by the agent's queues
 */
enum class MessageType : uint8_t {
    // Control messages (0x01-0x0F)
    Shutdown = 0x03,     ///< Sentinel: the consumer loop exits
    Heartbeat = 0x05,    ///< Liveness ping, ignored by consumers

    // Queue payloads (0x10-0x1F)
    Task = 0x10,         ///< Messaging -> worker command
    Response = 0x11      ///< Worker -> messaging publication
};

[[nodiscard]] constexpr std::string_view messageTypeName(MessageType type) noexcept {
    switch (type) {
        case MessageType::Shutdown: return "Shutdown";
        case MessageType::Heartbeat: return "Heartbeat";
        case MessageType::Task: return "Task";
        case MessageType::Response: return "Response";
    }
    return "Unknown";
}

[[nodiscard]] constexpr bool isControlMessage(MessageType type) noexcept {
    return static_cast<uint8_t>(type) >= 0x01 &&
           static_cast<uint8_t>(type) <= 0x0F;
}

/**
 * @brief Protocol constants
 */
struct ProtocolConstants {
    static constexpr uint32_t MAGIC = 0x424D544C;  // "BMTL"
    static constexpr uint8_t VERSION = 1;
    static constexpr size_t HEADER_SIZE = 16;
    static constexpr size_t MAX_PAYLOAD_SIZE = 4 * 1024 * 1024;  // 4MB
};

}  // namespace bmtl::ipc

#endif  // BMTL_IPC_MESSAGE_TYPES_HPP
