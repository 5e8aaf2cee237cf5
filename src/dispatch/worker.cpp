/*
 * worker.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "worker.hpp"

#include <spdlog/spdlog.h>

namespace bmtl::dispatch {

using namespace std::chrono_literals;

Worker::Worker(ipc::TaskQueue& tasks, ipc::ResponseQueue& responses,
               const CommandRouter& router)
    : tasks_(tasks), responses_(responses), router_(router) {}

bool Worker::publish(const ipc::Response& response) {
    std::lock_guard lock(publishMutex_);
    auto pushed = responses_.push(response);
    if (!pushed) {
        spdlog::error("Cannot hand response for {} to the messaging process: {}",
                      response.topic, ipc::ipcErrorToString(pushed.error()));
        return false;
    }
    return true;
}

ResponseSink Worker::sink() {
    return [this](ipc::Response response) { publish(response); };
}

bool Worker::step(std::chrono::milliseconds timeout) {
    auto next = tasks_.pop(timeout);
    if (!next) {
        switch (next.error()) {
            case ipc::IPCError::Timeout:
                return true;
            case ipc::IPCError::ChannelClosed:
                spdlog::warn("Task queue closed by the messaging process");
                return false;
            default:
                spdlog::error("Task queue failed: {}", ipc::ipcErrorToString(next.error()));
                return false;
        }
    }
    if (!next->has_value()) {
        spdlog::info("Shutdown requested by the messaging process");
        return false;
    }

    const auto& task = **next;
    spdlog::debug("Processing task {}", task.command);
    if (auto response = router_.dispatch(task)) {
        publish(*response);
    }
    ++processed_;
    return true;
}

int Worker::run(const std::atomic<bool>& stop) {
    spdlog::info("Worker loop started");
    while (!stop.load()) {
        if (!step(1s)) {
            break;
        }
    }

    std::lock_guard lock(publishMutex_);
    if (auto sent = responses_.pushSentinel(); !sent) {
        spdlog::debug("Response queue already closed: {}",
                      ipc::ipcErrorToString(sent.error()));
    }
    spdlog::info("Worker loop stopped after {} tasks", processed_.load());
    return 0;
}

}  // namespace bmtl::dispatch
