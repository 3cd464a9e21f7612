/// HTTP front-end: POST /mcp with a JSON-RPC request, GET /health.
/// Usage: metamcp-http [--host HOST] [--port PORT] [--sessions-dir DIR] [...]

#include <metamcp/metamcp.hpp>
#include <metamcp/http_frontend.hpp>

#include <iostream>

int main(int argc, char* argv[]) {
    metamcp::Config cfg;
    try {
        cfg = metamcp::Config::from_environment();
        auto positional = cfg.apply_arguments(argc, argv);
        if (!positional.empty()) {
            throw std::invalid_argument("Unexpected argument: " + positional.front());
        }
    } catch (const std::invalid_argument& e) {
        std::cerr << argv[0] << ": " << e.what() << "\n";
        return 2;
    }
    metamcp::log::set_level(cfg.log_level);

    try {
        metamcp::ToolServer server(cfg);

        metamcp::HttpFrontend::Options http_opts;
        http_opts.host = cfg.http_host;
        http_opts.port = cfg.http_port;
        metamcp::HttpFrontend http(server.dispatcher(), http_opts);
        http.bind();

        metamcp::ShutdownSignals signals([&http](int) { http.stop(); });
        http.listen();
    } catch (const std::exception& e) {
        metamcp::log::logger()->critical("HTTP front-end failed: {}", e.what());
        return 1;
    }
    return 0;
}
