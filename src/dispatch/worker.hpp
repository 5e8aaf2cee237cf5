/*
 * worker.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#ifndef BMTL_DISPATCH_WORKER_HPP
#define BMTL_DISPATCH_WORKER_HPP

#include <atomic>
#include <chrono>
#include <cstddef>
#include <mutex>

#include "command_router.hpp"
#include "device_handlers.hpp"
#include "ipc/task_queue.hpp"

namespace bmtl::dispatch {

/**
 * @brief Task loop of the worker process
 *
 * Takes tasks one at a time from the task queue, dispatches them through
 * the router and hands the replies to the response queue. Ends on the
 * shutdown sentinel, when the messaging process goes away or when the stop
 * flag is raised; the response queue sentinel is pushed on the way out.
 */
class Worker {
public:
    Worker(ipc::TaskQueue& tasks, ipc::ResponseQueue& responses,
           const CommandRouter& router);

    /**
     * @brief Queue a response; safe to call from any thread
     */
    bool publish(const ipc::Response& response);

    /**
     * @brief A sink bound to publish(), for handlers reporting later
     */
    [[nodiscard]] ResponseSink sink();

    /**
     * @brief Handle at most one task
     *
     * @return false once the loop should end
     */
    bool step(std::chrono::milliseconds timeout);

    int run(const std::atomic<bool>& stop);

    [[nodiscard]] std::size_t processed() const noexcept { return processed_; }

private:
    ipc::TaskQueue& tasks_;
    ipc::ResponseQueue& responses_;
    const CommandRouter& router_;
    std::mutex publishMutex_;
    std::atomic<std::size_t> processed_{0};
};

}  // namespace bmtl::dispatch

#endif  // BMTL_DISPATCH_WORKER_HPP
