/// One-shot tool call: start a worker, check the tool is offered, call it
/// once, print the result text and stop the worker.
/// Usage: metamcp-call [options] <tool> [json-arguments]
/// Example: metamcp-call health_check '{"detailed": true}'

#include <metamcp/metamcp.hpp>

#include <signal.h>

#include <iostream>

int main(int argc, char* argv[]) {
    metamcp::Config cfg;
    std::string tool;
    nlohmann::json arguments = nlohmann::json::object();
    try {
        cfg = metamcp::Config::from_environment();
        auto positional = cfg.apply_arguments(argc, argv);
        if (positional.empty() || positional.size() > 2) {
            std::cerr << "Usage: " << argv[0] << " [options] <tool> [json-arguments]\n";
            return 2;
        }
        tool = positional[0];
        if (positional.size() == 2) {
            arguments = nlohmann::json::parse(positional[1]);
            if (!arguments.is_object()) {
                throw std::invalid_argument("Arguments must be a JSON object");
            }
        }
    } catch (const nlohmann::json::parse_error& e) {
        std::cerr << argv[0] << ": invalid JSON arguments: " << e.what() << "\n";
        return 2;
    } catch (const std::invalid_argument& e) {
        std::cerr << argv[0] << ": " << e.what() << "\n";
        return 2;
    }
    metamcp::log::set_level(cfg.log_level);
    ::signal(SIGPIPE, SIG_IGN);

    // The worker reads the same settings from its environment
    cfg.export_environment();

    metamcp::WorkerSupervisor::Options sup_opts;
    sup_opts.worker = cfg.worker_command();
    sup_opts.engine = cfg.engine_command();
    metamcp::WorkerSupervisor supervisor(sup_opts);

    try {
        metamcp::ClientSession::Options session_opts;
        // Leave headroom for the worker's own engine timeout
        session_opts.request_timeout = cfg.timeout + std::chrono::seconds(5);
        metamcp::ClientSession session(supervisor, session_opts);

        auto result = session.call(tool, arguments);
        if (!result) {
            std::cerr << "Tool " << tool << " not available\n";
            return 1;
        }
        for (const auto& content : result->content) {
            std::cout << content.text << "\n";
        }
    } catch (const metamcp::McpError& e) {
        std::cerr << argv[0] << ": " << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        metamcp::log::logger()->critical("Call failed: {}", e.what());
        return 1;
    }
    return 0;
}
