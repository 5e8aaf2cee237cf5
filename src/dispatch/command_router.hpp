/*
 * command_router.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12-07

Description: Lookup table from worker command to handler

**************************************************/

#ifndef BMTL_DISPATCH_COMMAND_ROUTER_HPP
#define BMTL_DISPATCH_COMMAND_ROUTER_HPP

#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "ipc/task.hpp"
#include "response_builder.hpp"

namespace bmtl::dispatch {

/**
 * @brief Handles one command
 *
 * Returns the body to publish on the command's response topic, or
 * std::nullopt when the handler publishes on its own.
 */
using Handler = std::function<std::optional<json>(const Request&)>;

struct Route {
    std::string responseType;  ///< response_type of failure replies
    Handler handler;
    bool retain{false};        ///< Publish the reply as retained
};

/**
 * @brief Dispatches tasks through a fixed command table
 *
 * Unknown commands are logged and dropped. Exceptions escaping a handler
 * become a `{success:false, message, errors}` reply; they never reach the
 * worker loop.
 */
class CommandRouter {
public:
    void add(std::string command, Route route);

    [[nodiscard]] bool handles(std::string_view command) const;

    [[nodiscard]] std::vector<std::string> commands() const;

    [[nodiscard]] std::optional<ipc::Response> dispatch(const ipc::Task& task) const;

    /**
     * @brief Parse a task into a request
     *
     * @return std::nullopt when the payload is not valid JSON
     */
    [[nodiscard]] static std::optional<Request> parse(const ipc::Task& task);

private:
    std::map<std::string, Route, std::less<>> routes_;
};

}  // namespace bmtl::dispatch

#endif  // BMTL_DISPATCH_COMMAND_ROUTER_HPP
