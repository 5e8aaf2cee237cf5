/*
 * channel.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/**
 * @file channel.hpp
 * @brief Pipe channel carrying framed messages between the agent processes
 * @date 2024
 * @version 1.1.0
 */

#ifndef BMTL_IPC_CHANNEL_HPP
#define BMTL_IPC_CHANNEL_HPP

#include <chrono>
#include <cstdint>
#include <memory>

#include "message_types.hpp"

namespace bmtl::ipc {

struct Message;

/**
 * @brief Unidirectional pipe channel
 *
 * Created before fork(); afterwards the producer keeps only the write end
 * and the consumer only the read end. Sends from several threads of one
 * process are serialized so frames never interleave.
 */
class PipeChannel {
public:
    PipeChannel();
    ~PipeChannel();

    PipeChannel(const PipeChannel&) = delete;
    PipeChannel& operator=(const PipeChannel&) = delete;

    PipeChannel(PipeChannel&& other) noexcept;
    PipeChannel& operator=(PipeChannel&& other) noexcept;

    /**
     * @brief Create the pipe
     *
     * Must be called before any send/receive operations.
     */
    [[nodiscard]] IPCResult<void> create();

    void close();

    [[nodiscard]] bool isOpen() const noexcept;

    /**
     * @brief Send a message
     *
     * Blocks only while the pipe buffer is full.
     *
     * @return ChannelClosed when the read end is gone
     */
    [[nodiscard]] IPCResult<void> send(const Message& message);

    /**
     * @brief Receive a message with timeout
     *
     * A signal arriving while waiting is reported as Timeout so callers can
     * re-check their stop flag.
     *
     * @return The message, Timeout, or ChannelClosed once the write end is
     *         closed and the pipe is drained
     */
    [[nodiscard]] IPCResult<Message> receive(
        std::chrono::milliseconds timeout = std::chrono::milliseconds{5000});

    [[nodiscard]] bool hasData() const;

    [[nodiscard]] int getReadFd() const noexcept;
    [[nodiscard]] int getWriteFd() const noexcept;

    /**
     * @brief Close the read end (producer side after fork)
     */
    void closeRead();

    /**
     * @brief Close the write end (consumer side after fork)
     */
    void closeWrite();

    [[nodiscard]] uint32_t nextSequenceId();

private:
    class Impl;
    std::unique_ptr<Impl> pImpl_;
};

}  // namespace bmtl::ipc

#endif  // BMTL_IPC_CHANNEL_HPP
