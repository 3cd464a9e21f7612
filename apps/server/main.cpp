/// Tool host over stdin/stdout. One JSON-RPC request per line in, one
/// response per line out; logs go to stderr.
/// Usage: metamcp-server [--sessions-dir DIR] [--engine PROG] [--engine-script PATH]
///                       [--engine-args FLAGS] [--timeout-ms N] [--log-level LEVEL]

#include <metamcp/metamcp.hpp>

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
        // Before serve_stdio() starts the transport threads
        metamcp::ShutdownSignals signals([&server](int) { server.shutdown(); });
        server.serve_stdio();
    } catch (const std::exception& e) {
        metamcp::log::logger()->critical("Server failed: {}", e.what());
        return 1;
    }
    return 0;
}
