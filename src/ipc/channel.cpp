/*
 * channel.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "channel.hpp"
#include "message.hpp"

#include <spdlog/spdlog.h>

#include <atomic>
#include <cerrno>
#include <cstring>
#include <mutex>
#include <vector>

#include <fcntl.h>
#include <poll.h>
#include <unistd.h>

namespace bmtl::ipc {

// ============================================================================
// PipeChannel::Impl Implementation
// ============================================================================

class PipeChannel::Impl {
public:
    Impl() = default;

    ~Impl() {
        close();
    }

    IPCResult<void> create() {
        close();
        int fds[2];
        if (::pipe2(fds, O_CLOEXEC) != 0) {
            spdlog::error("Failed to create pipe: {}", std::strerror(errno));
            return std::unexpected(IPCError::PipeError);
        }
        readFd_ = fds[0];
        writeFd_ = fds[1];
        return {};
    }

    void close() {
        closeRead();
        closeWrite();
    }

    bool isOpen() const noexcept {
        return readFd_ >= 0 || writeFd_ >= 0;
    }

    IPCResult<void> send(const Message& message) {
        if (writeFd_ < 0) {
            return std::unexpected(IPCError::ChannelClosed);
        }

        auto data = message.serialize();

        std::lock_guard<std::mutex> lock(writeMutex_);

        size_t totalWritten = 0;
        while (totalWritten < data.size()) {
            auto written = ::write(writeFd_, data.data() + totalWritten,
                                   data.size() - totalWritten);
            if (written < 0) {
                if (errno == EINTR) {
                    continue;
                }
                if (errno == EPIPE) {
                    return std::unexpected(IPCError::ChannelClosed);
                }
                spdlog::error("Write failed: {}", std::strerror(errno));
                return std::unexpected(IPCError::PipeError);
            }
            totalWritten += static_cast<size_t>(written);
        }

        return {};
    }

    IPCResult<Message> receive(std::chrono::milliseconds timeout) {
        if (readFd_ < 0) {
            return std::unexpected(IPCError::ChannelClosed);
        }

        struct pollfd pfd;
        pfd.fd = readFd_;
        pfd.events = POLLIN;
        pfd.revents = 0;

        int ret = ::poll(&pfd, 1, static_cast<int>(timeout.count()));
        if (ret == 0) {
            return std::unexpected(IPCError::Timeout);
        }
        if (ret < 0) {
            if (errno == EINTR) {
                return std::unexpected(IPCError::Timeout);
            }
            return std::unexpected(IPCError::PipeError);
        }

        // Once the header has started arriving the rest of the frame
        // follows, so the remaining reads block.
        std::vector<uint8_t> headerData(MessageHeader::SIZE);
        if (auto r = readExact(headerData.data(), headerData.size()); !r) {
            return std::unexpected(r.error());
        }

        auto headerResult = MessageHeader::deserialize(headerData);
        if (!headerResult) {
            return std::unexpected(headerResult.error());
        }

        std::vector<uint8_t> payload(headerResult->payloadSize);
        if (!payload.empty()) {
            if (auto r = readExact(payload.data(), payload.size()); !r) {
                return std::unexpected(r.error());
            }
        }

        Message msg;
        msg.header = *headerResult;
        msg.payload = std::move(payload);

        return msg;
    }

    bool hasData() const {
        struct pollfd pfd;
        pfd.fd = readFd_;
        pfd.events = POLLIN;
        pfd.revents = 0;
        return readFd_ >= 0 && ::poll(&pfd, 1, 0) > 0;
    }

    int getReadFd() const noexcept { return readFd_; }
    int getWriteFd() const noexcept { return writeFd_; }

    void closeRead() {
        if (readFd_ >= 0) {
            ::close(readFd_);
            readFd_ = -1;
        }
    }

    void closeWrite() {
        if (writeFd_ >= 0) {
            ::close(writeFd_);
            writeFd_ = -1;
        }
    }

    uint32_t nextSequenceId() {
        return sequenceId_++;
    }

private:
    IPCResult<void> readExact(uint8_t* buffer, size_t size) {
        size_t total = 0;
        while (total < size) {
            auto bytesRead = ::read(readFd_, buffer + total, size - total);
            if (bytesRead < 0) {
                if (errno == EINTR) {
                    continue;
                }
                return std::unexpected(IPCError::PipeError);
            }
            if (bytesRead == 0) {
                return std::unexpected(IPCError::ChannelClosed);
            }
            total += static_cast<size_t>(bytesRead);
        }
        return {};
    }

    int readFd_{-1};
    int writeFd_{-1};
    std::atomic<uint32_t> sequenceId_{0};
    std::mutex writeMutex_;
};

// ============================================================================
// PipeChannel Implementation
// ============================================================================

PipeChannel::PipeChannel() : pImpl_(std::make_unique<Impl>()) {}
PipeChannel::~PipeChannel() = default;

PipeChannel::PipeChannel(PipeChannel&& other) noexcept = default;
PipeChannel& PipeChannel::operator=(PipeChannel&& other) noexcept = default;

IPCResult<void> PipeChannel::create() { return pImpl_->create(); }
void PipeChannel::close() { pImpl_->close(); }
bool PipeChannel::isOpen() const noexcept { return pImpl_->isOpen(); }
IPCResult<void> PipeChannel::send(const Message& message) { return pImpl_->send(message); }
IPCResult<Message> PipeChannel::receive(std::chrono::milliseconds timeout) {
    return pImpl_->receive(timeout);
}
bool PipeChannel::hasData() const { return pImpl_->hasData(); }
int PipeChannel::getReadFd() const noexcept { return pImpl_->getReadFd(); }
int PipeChannel::getWriteFd() const noexcept { return pImpl_->getWriteFd(); }
void PipeChannel::closeRead() { pImpl_->closeRead(); }
void PipeChannel::closeWrite() { pImpl_->closeWrite(); }
uint32_t PipeChannel::nextSequenceId() { return pImpl_->nextSequenceId(); }

}  // namespace bmtl::ipc
