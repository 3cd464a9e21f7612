#include "metamcp/client_session.hpp"
#include "metamcp/error.hpp"
#include "metamcp/log.hpp"
#include "metamcp/transport/stdio_transport.hpp"

#include <algorithm>

namespace metamcp {

ClientSession::ClientSession(WorkerSupervisor& supervisor, Options opts)
    : supervisor_(supervisor), client_(ToolClient::Options{opts.request_timeout}) {
    supervisor_.ensure_started();
    try {
        // The supervisor keeps ownership of the pipe ends
        client_.connect(std::make_unique<StdioTransport>(
            supervisor_.worker_stdout_fd(), supervisor_.worker_stdin_fd(), false));
    } catch (...) {
        close();
        throw;
    }
}

ClientSession::ClientSession(WorkerSupervisor& supervisor)
    : ClientSession(supervisor, Options{}) {
}

ClientSession::~ClientSession() {
    close();
}

void ClientSession::close() noexcept {
    client_.disconnect();
    try {
        supervisor_.stop();
    } catch (const std::exception& e) {
        log::logger()->error("Failed to stop worker: {}", e.what());
    }
}

std::optional<CallToolResult> ClientSession::call(const std::string& name,
                                                  const nlohmann::json& arguments) {
    auto tools = client_.list_tools();
    bool available = std::any_of(tools.begin(), tools.end(),
                                 [&name](const ToolDefinition& t) { return t.name == name; });
    if (!available) {
        log::logger()->info("Tool {} not offered by worker", name);
        return std::nullopt;
    }
    return client_.call_tool(name, arguments);
}

} // namespace metamcp
