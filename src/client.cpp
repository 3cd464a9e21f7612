#include "metamcp/client.hpp"
#include "metamcp/error.hpp"
#include "metamcp/log.hpp"

#include <atomic>
#include <future>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>

namespace metamcp {

struct ToolClient::Impl {
    Options opts;

    std::unique_ptr<ITransport> transport;
    std::thread transport_thread;
    std::atomic<bool> connected{false};

    // request id key -> promise
    std::mutex pending_mutex;
    std::unordered_map<std::string, std::promise<JsonRpcResponse>> pending_responses;
    int64_t next_id{1};

    explicit Impl(Options o) : opts(o) {}

    void on_message(JsonRpcMessage msg) {
        auto* resp = std::get_if<JsonRpcResponse>(&msg);
        if (!resp) {
            log::logger()->debug("Client ignoring non-response message");
            return;
        }
        std::lock_guard<std::mutex> lock(pending_mutex);
        auto it = pending_responses.find(request_id_key(resp->id));
        if (it == pending_responses.end()) {
            log::logger()->debug("Client dropping response for unknown id {}",
                                 request_id_key(resp->id));
            return;
        }
        it->second.set_value(std::move(*resp));
        pending_responses.erase(it);
    }

    void fail_pending(const std::string& reason) {
        std::lock_guard<std::mutex> lock(pending_mutex);
        for (auto& [key, promise] : pending_responses) {
            promise.set_exception(std::make_exception_ptr(McpTransportError(reason)));
        }
        pending_responses.clear();
    }

    JsonRpcResponse send_request(const std::string& method, std::optional<nlohmann::json> params) {
        if (!connected) {
            throw McpTransportError("Not connected");
        }

        int64_t id;
        std::future<JsonRpcResponse> fut;
        {
            std::lock_guard<std::mutex> lock(pending_mutex);
            id = next_id++;
            fut = pending_responses[request_id_key(RequestId{id})].get_future();
        }

        JsonRpcRequest req;
        req.id = RequestId{id};
        req.method = method;
        req.params = std::move(params);
        transport->send(req);

        if (fut.wait_for(opts.request_timeout) == std::future_status::timeout) {
            std::lock_guard<std::mutex> lock(pending_mutex);
            pending_responses.erase(request_id_key(RequestId{id}));
            throw McpTimeoutError("Request timed out: " + method);
        }

        auto resp = fut.get();
        if (resp.error) throw McpProtocolError(resp.error->code, resp.error->message);
        if (!resp.result) throw McpProtocolError(error::InternalError, "Response without result");
        return resp;
    }

    void do_connect(std::unique_ptr<ITransport> t) {
        transport = std::move(t);
        connected = true;

        transport_thread = std::thread([this]() {
            try {
                transport->start([this](JsonRpcMessage msg) {
                    on_message(std::move(msg));
                });
            } catch (const McpError& e) {
                log::logger()->error("Client transport failed: {}", e.what());
            }
            connected = false;
            fail_pending("Connection closed");
        });
    }
};

ToolClient::ToolClient()
    : ToolClient(Options{}) {}

ToolClient::ToolClient(Options opts)
    : impl_(std::make_unique<Impl>(opts)) {}

ToolClient::~ToolClient() {
    disconnect();
}

void ToolClient::connect(std::unique_ptr<ITransport> transport) {
    if (impl_->transport) {
        throw McpTransportError("Already connected");
    }
    impl_->do_connect(std::move(transport));
}

void ToolClient::disconnect() {
    if (impl_->transport) {
        impl_->transport->shutdown();
    }
    if (impl_->transport_thread.joinable()) {
        impl_->transport_thread.join();
    }
    impl_->connected = false;
    impl_->transport.reset();
}

std::vector<ToolDefinition> ToolClient::list_tools() {
    auto resp = impl_->send_request("tools/list", std::nullopt);
    return resp.result->at("tools").get<std::vector<ToolDefinition>>();
}

CallToolResult ToolClient::call_tool(const std::string& name, const nlohmann::json& arguments) {
    nlohmann::json params = {{"name", name}, {"arguments", arguments}};
    auto resp = impl_->send_request("tools/call", std::move(params));
    return resp.result->get<CallToolResult>();
}

bool ToolClient::is_connected() const noexcept {
    return impl_->connected;
}

} // namespace metamcp
