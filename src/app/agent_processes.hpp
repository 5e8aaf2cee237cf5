/*
 * agent_processes.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12-08

Description: Entry points of the two agent processes

**************************************************/

#ifndef BMTL_APP_AGENT_PROCESSES_HPP
#define BMTL_APP_AGENT_PROCESSES_HPP

#include <atomic>

#include "config/agent_config.hpp"
#include "ipc/task_queue.hpp"
#include "store/config_store.hpp"

namespace bmtl::app {

/**
 * @brief Run the worker: camera, scheduler, update manager and handlers
 *
 * Expects the task queue set up as consumer and the response queue as
 * producer.
 *
 * @return Process exit code
 */
int runWorker(config::AgentConfig& config, store::ConfigStore& store,
              ipc::TaskQueue& tasks, ipc::ResponseQueue& responses,
              const std::atomic<bool>& stop);

/**
 * @brief Run the messaging daemon on the configured transport
 *
 * Expects the task queue set up as producer and the response queue as
 * consumer.
 */
int runMessaging(const config::AgentConfig& config, ipc::TaskQueue& tasks,
                 ipc::ResponseQueue& responses, const std::atomic<bool>& stop);

}  // namespace bmtl::app

#endif  // BMTL_APP_AGENT_PROCESSES_HPP
