#include "metamcp/server.hpp"
#include "metamcp/error.hpp"
#include "metamcp/log.hpp"
#include "metamcp/transport/stdio_transport.hpp"

namespace metamcp {

ToolServer::Options ToolServer::options_from(const Config& cfg) {
    Options opts;
    opts.sessions_root = cfg.sessions_dir.empty() ? SessionPathResolver::default_root()
                                                  : cfg.sessions_dir;
    opts.supervisor.engine = cfg.engine_command();
    opts.supervisor.worker = cfg.worker_command();
    opts.dispatcher.call_timeout = cfg.timeout;
    return opts;
}

ToolServer::ToolServer(Options opts)
    : opts_(std::move(opts)),
      sessions_(opts_.sessions_root),
      supervisor_(opts_.supervisor),
      dispatcher_(supervisor_, sessions_, opts_.dispatcher) {
}

ToolServer::ToolServer(const Config& cfg)
    : ToolServer(options_from(cfg)) {
}

ToolServer::~ToolServer() {
    shutdown();
}

void ToolServer::serve(std::unique_ptr<ITransport> transport) {
    {
        std::lock_guard<std::mutex> lock(transport_mutex_);
        transport_ = transport.get();
    }
    running_ = true;

    const auto& engine = opts_.supervisor.engine;
    log::logger()->info("Serving tools: sessions root {}, engine {} ({} args), timeout {} ms",
                        sessions_.root().string(), engine.program, engine.args.size(),
                        opts_.dispatcher.call_timeout.count());

    auto* t = transport.get();
    t->start([this, t](JsonRpcMessage msg) {
        auto response = dispatcher_.dispatch(msg);
        if (!response) return;
        try {
            t->send(*response);
        } catch (const McpTransportError& e) {
            log::logger()->warn("Dropping response: {}", e.what());
        }
    });

    running_ = false;
    {
        std::lock_guard<std::mutex> lock(transport_mutex_);
        transport_ = nullptr;
    }
    log::logger()->info("Transport closed, server stopping");
    // Destroying the transport flushes queued responses
}

void ToolServer::serve_stdio() {
    serve(std::make_unique<StdioTransport>());
}

void ToolServer::shutdown() {
    running_ = false;
    std::lock_guard<std::mutex> lock(transport_mutex_);
    if (transport_) {
        transport_->shutdown();
    }
}

bool ToolServer::is_running() const {
    return running_;
}

} // namespace metamcp
