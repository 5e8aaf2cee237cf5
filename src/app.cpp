/*
 * app.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12-08

Description: bmtl-agent entry point. Loads the configuration, then forks
into the messaging process (parent) and the worker process (child).

**************************************************/

#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <atomic>
#include <csignal>
#include <cerrno>
#include <cstring>
#include <string>
#include <vector>

#include <spdlog/spdlog.h>

#include "atom/utils/argsview.hpp"

#include "app/agent_processes.hpp"
#include "config/agent_config.hpp"
#include "ipc/task_queue.hpp"
#include "logging/logging_manager.hpp"
#include "store/config_store.hpp"
#include "store/exception.hpp"
#include "system/host_info.hpp"

using namespace std::string_literals;

namespace {

std::atomic<bool> g_stopRequested{false};

extern "C" void onTerminate(int /*signal*/) { g_stopRequested.store(true); }

void installSignalHandlers() {
    struct sigaction action {};
    action.sa_handler = onTerminate;
    sigemptyset(&action.sa_mask);
    sigaction(SIGTERM, &action, nullptr);
    sigaction(SIGINT, &action, nullptr);

    // A vanished peer shows up as EPIPE on the queue instead.
    std::signal(SIGPIPE, SIG_IGN);
}

void initLogging(const bmtl::config::AgentConfig& config, const std::string& role) {
    auto& manager = bmtl::logging::LoggingManager::getInstance();
    manager.shutdown();
    manager.initialize(bmtl::logging::LoggingConfig::forProcess(config.logging, role),
                       role);
}

int waitForWorker(pid_t worker) {
    int status = 0;
    while (waitpid(worker, &status, 0) < 0) {
        if (errno != EINTR) {
            spdlog::error("waitpid failed: {}", std::strerror(errno));
            return 1;
        }
    }
    if (WIFEXITED(status)) {
        spdlog::info("Worker exited with code {}", WEXITSTATUS(status));
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
        spdlog::error("Worker killed by signal {}", WTERMSIG(status));
    }
    return 1;
}

}  // namespace

int main(int argc, char* argv[]) {
    // Step 1: Console logging until the configuration is known
    bmtl::logging::LoggingManager::getInstance().initialize(
        bmtl::logging::LoggingConfig::createDefault(), "main");

    // Step 2: Command line
    atom::utils::ArgumentParser program("bmtl-agent"s);
    program.addArgument("config", atom::utils::ArgumentParser::ArgType::STRING,
                        false, std::string(bmtl::config::DEFAULT_CONFIG_PATH),
                        "Path to the config file", {"c"});
    program.addArgument("log-level",
                        atom::utils::ArgumentParser::ArgType::STRING, false,
                        ""s, "Log level (trace/debug/info/warn/error)", {"l"});
    program.addArgument("debug", atom::utils::ArgumentParser::ArgType::BOOLEAN,
                        false, false, "Enable debug logging", {"d"});
    program.addDescription("Time-lapse camera device agent");

    std::vector<std::string> args(argv, argv + argc);
    program.parse(argc, args);

    // Step 3: Configuration, then environment and command line overrides
    bmtl::config::AgentConfig config;
    try {
        auto configPath = program.get<std::string>("config").value_or(
            std::string(bmtl::config::DEFAULT_CONFIG_PATH));
        config = bmtl::config::AgentConfig::load(configPath);
        config.applyEnvironment();
        config.resolveDeviceId(bmtl::system::hostname());

        config.applyLogOverrides(program.get<std::string>("log-level"),
                                 program.get<bool>("debug").value_or(false));
    } catch (const std::exception& e) {
        spdlog::critical("Failed to load configuration: {}", e.what());
        return 1;
    }

    // Step 4: Document store and the two queues, shared across fork()
    std::unique_ptr<bmtl::store::ConfigStore> store;
    try {
        store = std::make_unique<bmtl::store::ConfigStore>(bmtl::store::StoreDirectories{
            config.store.persistentDir, config.store.runtimeDir});
    } catch (const bmtl::store::StoreException& e) {
        spdlog::critical("Cannot open the document store: {}", e.what());
        return 1;
    }

    bmtl::ipc::TaskQueue tasks;
    bmtl::ipc::ResponseQueue responses;
    if (!tasks.create() || !responses.create()) {
        spdlog::critical("Cannot create the process queues");
        return 1;
    }

    installSignalHandlers();
    spdlog::info("Starting agent for device {} ({})", config.device.id,
                 config.moduleId());

    // Step 5: Split into worker and messaging processes
    pid_t worker = fork();
    if (worker < 0) {
        spdlog::critical("fork failed: {}", std::strerror(errno));
        return 1;
    }

    if (worker == 0) {
        initLogging(config, "worker");
        tasks.setupConsumer();
        responses.setupProducer();
        int code = bmtl::app::runWorker(config, *store, tasks, responses,
                                        g_stopRequested);
        bmtl::logging::LoggingManager::getInstance().shutdown();
        _exit(code);
    }

    initLogging(config, "messaging");
    tasks.setupProducer();
    responses.setupConsumer();
    int code = bmtl::app::runMessaging(config, tasks, responses, g_stopRequested);

    // The daemon pushed the shutdown sentinel; closing our end unblocks a
    // worker still waiting on a full pipe.
    tasks.channel().close();
    int workerCode = waitForWorker(worker);

    bmtl::logging::LoggingManager::getInstance().shutdown();
    return code != 0 ? code : workerCode;
}
