#include "metamcp/dispatcher.hpp"
#include "metamcp/error.hpp"
#include "metamcp/log.hpp"
#include "metamcp/tools.hpp"

namespace metamcp {

namespace {

CallToolResult text_result(const nlohmann::ordered_json& body) {
    CallToolResult result;
    result.content.push_back(TextContent{to_display_text(body)});
    return result;
}

CallToolResult error_result(const std::string& message) {
    return text_result(nlohmann::ordered_json{{"status", "error"}, {"message", message}});
}

} // anonymous namespace

ToolDispatcher::ToolDispatcher(IToolExecutor& executor, const SessionPathResolver& sessions,
                               Options opts)
    : executor_(executor), sessions_(sessions), opts_(opts) {
    register_handlers();
}

ToolDispatcher::ToolDispatcher(IToolExecutor& executor, const SessionPathResolver& sessions)
    : ToolDispatcher(executor, sessions, Options{}) {
}

std::optional<JsonRpcMessage> ToolDispatcher::dispatch(const JsonRpcMessage& msg) {
    return router_.dispatch(msg);
}

void ToolDispatcher::register_handlers() {
    router_.on_request("tools/list", [](const nlohmann::json&) -> HandlerResult {
        return nlohmann::json{{"tools", tool_registry()}};
    });

    router_.on_request("tools/call", [this](const nlohmann::json& params) -> HandlerResult {
        if (!params.is_object() || !params.contains("name") || !params.at("name").is_string()) {
            return JsonRpcError{error::InvalidParams, "Parameter 'name' must be a string", std::nullopt};
        }
        std::string name = params.at("name").get<std::string>();
        if (!parse_tool_name(name)) {
            return JsonRpcError{error::MethodNotFound, "Unknown tool: " + name, std::nullopt};
        }

        nlohmann::json arguments = params.value("arguments", nlohmann::json::object());
        if (arguments.is_null()) arguments = nlohmann::json::object();
        if (!arguments.is_object()) {
            return JsonRpcError{error::InvalidParams, "Parameter 'arguments' must be an object",
                                std::nullopt};
        }
        return nlohmann::json(call_tool(name, arguments));
    });
}

std::shared_ptr<std::mutex> ToolDispatcher::session_lock(const std::string& session_id) {
    std::lock_guard<std::mutex> lock(session_locks_mutex_);
    auto& slot = session_locks_[session_id];
    if (!slot) slot = std::make_shared<std::mutex>();
    return slot;
}

void ToolDispatcher::release_session_lock(const std::string& session_id) {
    std::lock_guard<std::mutex> lock(session_locks_mutex_);
    auto it = session_locks_.find(session_id);
    if (it != session_locks_.end() && it->second.use_count() == 1) {
        session_locks_.erase(it);
    }
}

std::size_t ToolDispatcher::tracked_sessions() {
    std::lock_guard<std::mutex> lock(session_locks_mutex_);
    return session_locks_.size();
}

CallToolResult ToolDispatcher::call_tool(const std::string& name, const nlohmann::json& arguments) {
    auto started = std::chrono::steady_clock::now();
    auto elapsed_ms = [&started] {
        return std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - started).count();
    };

    std::string session_id;
    if (arguments.is_object() && arguments.contains("session_id")
        && arguments.at("session_id").is_string()) {
        session_id = arguments.at("session_id").get<std::string>();
    }

    try {
        auto tool = parse_tool_name(name);
        if (!tool) throw ValidationError("Unknown tool: " + name);
        validate_arguments(*tool, arguments);

        std::filesystem::path working_dir = session_id.empty()
            ? std::filesystem::current_path()
            : sessions_.resolve(session_id);

        nlohmann::ordered_json output;
        if (session_id.empty()) {
            output = executor_.execute(name, arguments, working_dir, opts_.call_timeout);
        } else {
            // Drops the map entry once the last caller for this session is done.
            struct Release {
                ToolDispatcher& self;
                const std::string& id;
                std::shared_ptr<std::mutex>& guard;
                ~Release() {
                    guard.reset();
                    self.release_session_lock(id);
                }
            };
            auto guard = session_lock(session_id);
            Release release{*this, session_id, guard};
            std::lock_guard<std::mutex> lock(*guard);
            output = executor_.execute(name, arguments, working_dir, opts_.call_timeout);
        }

        auto result = text_result(output);
        log::logger()->info("Tool {} completed{}{} in {} ms", name,
                            session_id.empty() ? "" : " for session ", session_id, elapsed_ms());
        return result;
    } catch (const McpError& e) {
        log::logger()->warn("Tool {} failed{}{} after {} ms: {}", name,
                            session_id.empty() ? "" : " for session ", session_id,
                            elapsed_ms(), e.what());
        return error_result(e.what());
    } catch (const nlohmann::json::exception& e) {
        log::logger()->error("Tool {} returned unusable output{}{}: {}", name,
                             session_id.empty() ? "" : " for session ", session_id, e.what());
        return error_result(message::EngineFailed);
    }
}

} // namespace metamcp
