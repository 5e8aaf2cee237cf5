/*
 * message.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "message.hpp"

#include <spdlog/spdlog.h>

namespace bmtl::ipc {

namespace {

void putU32(std::vector<uint8_t>& data, size_t& offset, uint32_t value) {
    data[offset++] = static_cast<uint8_t>((value >> 24) & 0xFF);
    data[offset++] = static_cast<uint8_t>((value >> 16) & 0xFF);
    data[offset++] = static_cast<uint8_t>((value >> 8) & 0xFF);
    data[offset++] = static_cast<uint8_t>(value & 0xFF);
}

uint32_t getU32(std::span<const uint8_t> data, size_t& offset) {
    uint32_t value = (static_cast<uint32_t>(data[offset]) << 24) |
                     (static_cast<uint32_t>(data[offset + 1]) << 16) |
                     (static_cast<uint32_t>(data[offset + 2]) << 8) |
                     static_cast<uint32_t>(data[offset + 3]);
    offset += 4;
    return value;
}

}  // namespace

// ============================================================================
// MessageHeader Implementation
// ============================================================================

std::vector<uint8_t> MessageHeader::serialize() const {
    std::vector<uint8_t> data(SIZE);
    size_t offset = 0;

    putU32(data, offset, magic);
    data[offset++] = version;
    data[offset++] = static_cast<uint8_t>(type);
    putU32(data, offset, payloadSize);
    putU32(data, offset, sequenceId);
    data[offset++] = flags;
    data[offset++] = reserved;

    return data;
}

IPCResult<MessageHeader> MessageHeader::deserialize(std::span<const uint8_t> data) {
    if (data.size() < SIZE) {
        return std::unexpected(IPCError::InvalidMessage);
    }

    MessageHeader header;
    size_t offset = 0;

    header.magic = getU32(data, offset);
    if (header.magic != MAGIC) {
        return std::unexpected(IPCError::InvalidMessage);
    }

    header.version = data[offset++];
    if (header.version != VERSION) {
        spdlog::error("Unsupported IPC protocol version {}", header.version);
        return std::unexpected(IPCError::InvalidMessage);
    }

    header.type = static_cast<MessageType>(data[offset++]);
    header.payloadSize = getU32(data, offset);
    if (header.payloadSize > ProtocolConstants::MAX_PAYLOAD_SIZE) {
        return std::unexpected(IPCError::MessageTooLarge);
    }

    header.sequenceId = getU32(data, offset);
    header.flags = data[offset++];
    header.reserved = data[offset++];

    return header;
}

bool MessageHeader::isValid() const noexcept {
    return magic == MAGIC && version == VERSION;
}

// ============================================================================
// Message Implementation
// ============================================================================

IPCResult<Message> Message::create(MessageType type, const json& payload,
                                   uint32_t sequenceId) {
    Message msg;
    msg.header.type = type;
    msg.header.sequenceId = sequenceId;
    try {
        msg.payload = json::to_msgpack(payload);
    } catch (const json::exception& e) {
        spdlog::error("Failed to encode {} payload: {}", messageTypeName(type),
                      e.what());
        return std::unexpected(IPCError::SerializationFailed);
    }
    if (msg.payload.size() > ProtocolConstants::MAX_PAYLOAD_SIZE) {
        return std::unexpected(IPCError::MessageTooLarge);
    }
    msg.header.payloadSize = static_cast<uint32_t>(msg.payload.size());
    return msg;
}

Message Message::control(MessageType type, uint32_t sequenceId) {
    Message msg;
    msg.header.type = type;
    msg.header.sequenceId = sequenceId;
    return msg;
}

IPCResult<json> Message::getPayloadAsJson() const {
    if (payload.empty()) {
        return json::object();
    }
    try {
        return json::from_msgpack(payload);
    } catch (const json::exception& e) {
        spdlog::error("MessagePack decode error: {}", e.what());
        return std::unexpected(IPCError::DeserializationFailed);
    }
}

std::vector<uint8_t> Message::serialize() const {
    auto headerData = header.serialize();
    std::vector<uint8_t> result;
    result.reserve(headerData.size() + payload.size());
    result.insert(result.end(), headerData.begin(), headerData.end());
    result.insert(result.end(), payload.begin(), payload.end());
    return result;
}

IPCResult<Message> Message::deserialize(std::span<const uint8_t> data) {
    auto headerResult = MessageHeader::deserialize(data);
    if (!headerResult) {
        return std::unexpected(headerResult.error());
    }

    Message msg;
    msg.header = *headerResult;

    size_t expectedSize = MessageHeader::SIZE + msg.header.payloadSize;
    if (data.size() < expectedSize) {
        return std::unexpected(IPCError::InvalidMessage);
    }

    msg.payload.assign(data.begin() + MessageHeader::SIZE,
                       data.begin() + expectedSize);

    return msg;
}

}  // namespace bmtl::ipc
