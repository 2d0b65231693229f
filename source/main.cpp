// simpilot - iOS Simulator Model Context Protocol Server
// Entry point: stdio MCP server loop.
//
// Reads JSON-RPC 2.0 messages from stdin, dispatches them, writes responses to stdout.
// Long-running tool calls run on worker threads so that a cancel request can
// be read and answered while a build is in progress.
// Logs go to stderr; stdout carries only protocol frames.

#include <nlohmann/json.hpp>
#include <csignal>
#include <string>

#include "mcp/mcp_dispatch.hpp"
#include "mcp/mcp_stdio.hpp"
#include "mcp/mcp_workers.hpp"
#include "orchestrator/orchestrator.hpp"
#include "protocol/json_rpc.hpp"
#include "tool_handlers/tool_handlers.hpp"
#include "utils/debug_log.hpp"

using json = nlohmann::json;

// Global flag for graceful shutdown.
static volatile std::sig_atomic_t shutdown_requested = 0;

static void signal_handler(int signal_number) {
    (void)signal_number;
    shutdown_requested = 1;
}

static void serve_message(const json &message) {
    json response = mcp_dispatch::dispatch_message(message);
    if (!response.is_null()) {
        mcp_stdio::write_message(response.dump(-1, ' ', false, json::error_handler_t::replace));
    }
}

int main() {
    debug_log::info(std::string("simpilot - iOS Simulator MCP Server, build ") + __DATE__ + " " + __TIME__);

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);
    // A client that disconnects mid-write must not kill the server.
    std::signal(SIGPIPE, SIG_IGN);

    // Reads the environment once, before any worker thread exists.
    orchestrator_state::OrchestratorState &state = orchestrator::default_state();
    tool_handlers::register_all_tools();

    debug_log::info("Server started. Waiting for MCP messages on stdin.");

    mcp_workers::WorkerSet workers;

    while (!shutdown_requested) {
        std::string raw_message = mcp_stdio::read_message();
        if (raw_message.empty()) {
            debug_log::info("EOF on stdin. Shutting down.");
            break;
        }

        workers.reap_finished();

        json parsed_message = json::parse(raw_message, nullptr, false);
        if (parsed_message.is_discarded()) {
            debug_log::info("Failed to parse incoming JSON message.");
            mcp_stdio::write_message(json_rpc::build_parse_error_response().dump());
            continue;
        }

        if (mcp_dispatch::is_long_running_call(parsed_message)) {
            workers.launch([parsed_message]() { serve_message(parsed_message); });
            continue;
        }
        serve_message(parsed_message);
    }

    if (orchestrator::cancel_active_task(state)) {
        debug_log::info("Cancelled the task still running at shutdown.");
    }
    workers.join_all();
    debug_log::info("Server shut down.");

    return 0;
}
