#include "metamcp/http_frontend.hpp"
#include "metamcp/codec.hpp"
#include "metamcp/error.hpp"
#include "metamcp/log.hpp"
#include "metamcp/version.hpp"

#include <httplib.h>

#include <algorithm>

namespace metamcp {

namespace {

constexpr const char* kJsonType = "application/json";

std::string error_body(int code, const std::string& message) {
    nlohmann::json err = {
        {"jsonrpc", std::string(JSONRPC_VERSION)},
        {"id", nullptr},
        {"error", {{"code", code}, {"message", message}}}
    };
    return err.dump();
}

} // anonymous namespace

HttpFrontend::HttpFrontend(ToolDispatcher& dispatcher, Options opts)
    : dispatcher_(dispatcher)
    , opts_(std::move(opts))
    , server_(std::make_unique<httplib::Server>()) {
    setup_routes();
}

HttpFrontend::~HttpFrontend() {
    stop();
}

bool HttpFrontend::validate_origin(const std::string& origin) const {
    if (opts_.allowed_origins.empty()) return true;
    return std::find(opts_.allowed_origins.begin(), opts_.allowed_origins.end(), origin)
           != opts_.allowed_origins.end();
}

void HttpFrontend::setup_routes() {
    server_->Post(opts_.mcp_path, [this](const httplib::Request& req, httplib::Response& res) {
        // DNS rebinding protection
        auto origin = req.get_header_value("Origin");
        if (!origin.empty() && !validate_origin(origin)) {
            res.status = 403;
            res.set_content("{\"error\":\"Invalid origin\"}", kJsonType);
            return;
        }

        JsonRpcMessage msg;
        try {
            msg = Codec::parse(req.body);
        } catch (const McpParseError& e) {
            log::logger()->warn("Rejecting HTTP body ({}): {}", e.what(), log::excerpt(req.body));
            res.status = 400;
            res.set_content(error_body(error::ParseError, e.what()), kJsonType);
            return;
        }

        if (std::holds_alternative<JsonRpcResponse>(msg)) {
            res.status = 400;
            res.set_content(error_body(error::InvalidRequest, "Expected a request"), kJsonType);
            return;
        }

        auto response = dispatcher_.dispatch(msg);
        if (!response) {
            res.status = 202;
            return;
        }
        res.set_content(Codec::serialize(*response), kJsonType);
    });

    server_->Get("/health", [](const httplib::Request&, httplib::Response& res) {
        nlohmann::json body = {
            {"status", "ok"},
            {"server", std::string(SERVER_NAME)},
            {"version", std::string(LIBRARY_VERSION)}
        };
        res.set_content(body.dump(), kJsonType);
    });

    server_->set_logger([](const httplib::Request& req, const httplib::Response& res) {
        log::logger()->info("HTTP {} {} -> {}", req.method, req.path, res.status);
    });
}

uint16_t HttpFrontend::bind() {
    if (bound_) return bound_port_;

    int port = opts_.port;
    if (opts_.port == 0) {
        port = server_->bind_to_any_port(opts_.host);
        if (port < 0) {
            throw McpTransportError("Failed to bind HTTP server on " + opts_.host);
        }
    } else if (!server_->bind_to_port(opts_.host, opts_.port)) {
        throw McpTransportError("Failed to bind HTTP server on " + opts_.host + ":"
                                + std::to_string(opts_.port));
    }
    bound_port_ = static_cast<uint16_t>(port);
    bound_ = true;
    return bound_port_;
}

void HttpFrontend::listen() {
    bind();
    log::logger()->info("HTTP front-end listening on {}:{}{}", opts_.host, bound_port_,
                        opts_.mcp_path);
    if (!server_->listen_after_bind()) {
        throw McpTransportError("HTTP server stopped with an error");
    }
}

void HttpFrontend::stop() {
    if (server_->is_running()) {
        server_->stop();
    }
}

bool HttpFrontend::is_running() const {
    return server_->is_running();
}

} // namespace metamcp
