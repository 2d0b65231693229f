// Tests for the MCP surface: stdio framing, JSON-RPC dispatch, tool
// registration and argument validation, result serialization, and the
// environment configuration.

#include "config/config.hpp"
#include "mcp/mcp_dispatch.hpp"
#include "mcp/mcp_stdio.hpp"
#include "mcp/mcp_tools.hpp"
#include "mcp/mcp_workers.hpp"
#include "orchestrator/orchestrator.hpp"
#include "protocol/json_rpc.hpp"
#include "test_support.hpp"
#include "tool_handlers/tool_handlers.hpp"
#include "utils/utf8_sanitize.hpp"

#include <atomic>
#include <chrono>
#include <iostream>
#include <sstream>
#include <thread>

namespace test_protocol {

using json = nlohmann::json;
using test_support::check;
using test_support::check_equal;

static json call_tool(const std::string &name, const json &arguments) {
    json request;
    request["jsonrpc"] = "2.0";
    request["id"] = 7;
    request["method"] = "tools/call";
    request["params"]["name"] = name;
    request["params"]["arguments"] = arguments;
    return mcp_dispatch::dispatch_message(request);
}

// Parses content[0].text of a tools/call response.
static json tool_payload(const json &response) {
    return json::parse(response["result"]["content"][0]["text"].get<std::string>());
}

static bool test_stdio_framing() {
    std::istringstream input("  \n{\"a\": \"}{\\\"\", \"b\": {\"c\": 1}}\n{\"second\": true}");
    std::string first = mcp_stdio::read_message(input);
    std::string second = mcp_stdio::read_message(input);
    std::string third = mcp_stdio::read_message(input);

    bool ok = check(json::parse(first)["b"]["c"] == 1, "braces inside strings do not end a message");
    ok &= check(json::parse(second)["second"] == true, "back-to-back messages framed separately");
    ok &= check(third.empty(), "EOF yields an empty message");
    return ok;
}

static bool test_initialize_and_notifications() {
    json initialize = {{"jsonrpc", "2.0"}, {"id", 1}, {"method", "initialize"}, {"params", json::object()}};
    json response = mcp_dispatch::dispatch_message(initialize);
    bool ok = check_equal(response["result"]["serverInfo"]["name"].get<std::string>(), "simpilot", "server name");
    ok &= check(response["result"]["capabilities"].contains("tools"), "tools capability advertised");

    json notification = {{"jsonrpc", "2.0"}, {"method", "notifications/initialized"}};
    ok &= check(mcp_dispatch::dispatch_message(notification).is_null(), "notifications get no response");

    json unknown = {{"jsonrpc", "2.0"}, {"id", 2}, {"method", "resources/list"}};
    ok &= check(mcp_dispatch::dispatch_message(unknown)["error"]["code"] == json_rpc::METHOD_NOT_FOUND,
                "unknown method rejected");
    ok &= check(json_rpc::build_parse_error_response()["error"]["code"] == json_rpc::PARSE_ERROR,
                "parse error response code");
    return ok;
}

static bool test_tool_registry() {
    json list_request = {{"jsonrpc", "2.0"}, {"id", 3}, {"method", "tools/list"}};
    json tools = mcp_dispatch::dispatch_message(list_request)["result"]["tools"];
    bool ok = check_equal(static_cast<long>(tools.size()), 7L, "seven tools listed");

    bool build_schema_ok = false;
    for (const auto &tool : tools) {
        if (tool["name"] == "build_and_run") {
            build_schema_ok = tool["inputSchema"]["required"] == json::array({"root_path", "udid"}) &&
                              tool["inputSchema"]["properties"]["scheme"]["type"] == "string";
        }
    }
    ok &= check(build_schema_ok, "build_and_run schema requires root_path and udid, scheme optional");

    json build_call = {{"jsonrpc", "2.0"}, {"id", 4}, {"method", "tools/call"},
                       {"params", {{"name", "build_and_run"}, {"arguments", json::object()}}}};
    json cancel_call = {{"jsonrpc", "2.0"}, {"id", 5}, {"method", "tools/call"},
                        {"params", {{"name", "cancel_active_task"}}}};
    ok &= check(mcp_dispatch::is_long_running_call(build_call), "build_and_run served off the reader thread");
    ok &= check(!mcp_dispatch::is_long_running_call(cancel_call), "cancel_active_task answered inline");
    return ok;
}

static bool test_missing_arguments() {
    json response = call_tool("build_and_run", {{"udid", "SIM-UDID-1"}});
    json payload = tool_payload(response);
    bool ok = check(response["result"]["isError"] == true, "missing root_path is an error result");
    ok &= check_equal(payload["stage"].get<std::string>(), "validation", "missing root_path is stage validation");

    json wrong_type = tool_payload(call_tool("boot_and_focus", {{"udid", 42}}));
    ok &= check_equal(wrong_type["stage"].get<std::string>(), "validation", "non-string udid rejected");

    json unknown = call_tool("take_screenshot", json::object());
    ok &= check(unknown["result"]["isError"] == true, "unknown tool is an error result");

    json missing_name = {{"jsonrpc", "2.0"}, {"id", 6}, {"method", "tools/call"}, {"params", json::object()}};
    ok &= check(mcp_dispatch::dispatch_message(missing_name)["error"]["code"] == json_rpc::INVALID_PARAMS,
                "tools/call without a name rejected");
    return ok;
}

static bool test_arguments_are_trimmed() {
    json arguments = {{"root_path", "  /Users/dev/MyApp \n"}, {"udid", "\t"}, {"count", 3}};
    bool ok = check_equal(json_rpc::string_argument(arguments, "root_path"), "/Users/dev/MyApp",
                          "surrounding whitespace stripped");
    ok &= check_equal(json_rpc::string_argument(arguments, "udid"), "", "whitespace-only value reads as empty");
    ok &= check_equal(json_rpc::string_argument(arguments, "count"), "", "non-string value reads as empty");

    json blank_udid = tool_payload(call_tool("boot_and_focus", {{"udid", "   "}}));
    ok &= check_equal(blank_udid["stage"].get<std::string>(), "validation", "blank udid rejected");
    json blank_path = tool_payload(call_tool("build_and_run", {{"root_path", " "}, {"udid", "SIM-UDID-1"}}));
    ok &= check_equal(blank_path["stage"].get<std::string>(), "validation", "blank root_path rejected");
    return ok;
}

static bool test_finished_workers_are_reaped() {
    mcp_workers::WorkerSet workers;
    std::atomic<int> completed{0};
    for (int index = 0; index < 3; ++index) {
        workers.launch([&completed]() { completed++; });
    }

    auto start = std::chrono::steady_clock::now();
    while (completed.load() < 3 && std::chrono::steady_clock::now() - start < std::chrono::seconds(5)) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    // The counter is bumped before the finished flag; give the flags a moment.
    size_t joined = 0;
    while (workers.size() > 0 && std::chrono::steady_clock::now() - start < std::chrono::seconds(5)) {
        joined += workers.reap_finished();
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    bool ok = check_equal(static_cast<long>(joined), 3L, "every finished worker joined");
    ok &= check_equal(static_cast<long>(workers.size()), 0L, "no finished worker kept");

    std::atomic<bool> release{false};
    workers.launch([&release]() {
        while (!release.load()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }
    });
    ok &= check_equal(static_cast<long>(workers.reap_finished()), 0L, "running worker left alone");
    ok &= check_equal(static_cast<long>(workers.size()), 1L, "running worker still tracked");
    release.store(true);
    workers.join_all();
    ok &= check_equal(static_cast<long>(workers.size()), 0L, "join_all empties the set");
    return ok;
}

static bool test_result_serialization() {
    simulator_types::DeviceListResult devices;
    devices.success = true;
    simulator_types::Device device;
    device.name = "iPhone 15";
    device.udid = "U1";
    device.state = "Booted";
    device.is_phone_family = true;
    device.model_number = 15;
    devices.devices.push_back(device);
    devices.best_udid = "U1";
    json device_json = orchestrator::to_json(devices);
    bool ok = check(device_json["ok"] == true && device_json["bestUdid"] == "U1", "device list shape");
    ok &= check(device_json["devices"][0]["modelNumber"] == 15, "device fields serialized");

    simulator_types::DeviceListResult empty;
    empty.success = true;
    ok &= check(orchestrator::to_json(empty)["bestUdid"].is_null(), "no devices gives a null bestUdid");

    build_pipeline::PipelineResult failed;
    failed.stage = "build";
    failed.error_message = "error: bad byte \xFF here";
    failed.has_details = true;
    failed.details.stderr_text = "\xC3";
    failed.details.log_path = "/tmp/failures/1/build.log";
    failed.stage_timings.emplace_back("build", 12);
    json failure_json = orchestrator::to_json(failed);
    ok &= check(failure_json["ok"] == false && failure_json["stage"] == "build", "failure shape");
    ok &= check(failure_json["details"]["logPath"] == "/tmp/failures/1/build.log", "log path exposed");
    ok &= check(failure_json["timings"]["build"] == 12, "timings exposed");

    bool dumped = false;
    try {
        json tool_result = json_rpc::build_payload_result(failure_json);
        dumped = tool_result["isError"] == true && !failure_json.dump().empty();
    } catch (const json::exception &error) {
        std::cout << "  (dump threw: " << error.what() << ")" << std::endl;
    }
    ok &= check(dumped, "invalid bytes in tool output never break serialization");
    return ok;
}

static bool test_utf8_sanitize() {
    bool ok = check_equal(utf8_sanitize::sanitize(std::string("plain ascii")), "plain ascii", "ASCII untouched");
    ok &= check_equal(utf8_sanitize::sanitize(std::string("caf\xC3\xA9")), "caf\xC3\xA9", "valid UTF-8 untouched");
    ok &= check_equal(utf8_sanitize::sanitize(std::string("a\xFF" "b")), "a\xEF\xBF\xBD" "b", "stray byte replaced");
    ok &= check(!utf8_sanitize::is_valid("\xC0\xAF"), "overlong form rejected");
    ok &= check(!utf8_sanitize::is_valid("\xED\xA0\x80"), "surrogate rejected");
    ok &= check(!utf8_sanitize::is_valid("\xE2\x82"), "truncated tail rejected");
    return ok;
}

static bool test_configuration() {
    bool ok = check(config::parse_flag("1") && config::parse_flag("TRUE") && config::parse_flag("Yes"),
                    "truthy flags recognised");
    ok &= check(!config::parse_flag("") && !config::parse_flag("0") && !config::parse_flag("no"),
                "other values are false");

    config::Config defaults;
    ok &= check_equal(defaults.plistbuddy_path, "/usr/libexec/PlistBuddy", "PlistBuddy default path");
    ok &= check(!config::default_work_root().empty(), "default work root under the temp directory");
    return ok;
}

bool run_all_tests() {
    tool_handlers::register_all_tools();

    bool all_passed = true;
    all_passed &= test_stdio_framing();
    all_passed &= test_initialize_and_notifications();
    all_passed &= test_tool_registry();
    all_passed &= test_missing_arguments();
    all_passed &= test_arguments_are_trimmed();
    all_passed &= test_finished_workers_are_reaped();
    all_passed &= test_result_serialization();
    all_passed &= test_utf8_sanitize();
    all_passed &= test_configuration();
    return all_passed;
}

} // namespace test_protocol
