#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include "tool.hpp"
#include "config.hpp"
#include "supervisor.hpp"
#include "tools/leaf_configs.hpp"
#include "tools/traffic_capture.hpp"
#include "tools/tool_util.hpp"
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <unistd.h>

using namespace perouter;
using Catch::Matchers::ContainsSubstring;
using Catch::Matchers::StartsWith;
using namespace std::chrono_literals;

static CommandSpec sh(const std::string& script, const std::string& name = "") {
    CommandSpec spec;
    spec.program = "/bin/sh";
    spec.args = {"-c", script, "sh"};
    spec.display_name = name;
    return spec;
}

static CaptureOptions fast_options() {
    CaptureOptions options;
    options.observation_timeout = 2000ms;
    options.stop_timeout = 2000ms;
    options.release_timeout = 2000ms;
    return options;
}

static std::string make_temp_dir() {
    auto path = std::filesystem::temp_directory_path() / "perouter_tools_XXXXXX";
    std::string tmpl = path.string();
    char* result = mkdtemp(tmpl.data());
    return result ? std::string(result) : "";
}

// Reports its output directory argument and filter, then waits to be stopped
static const char* kCaptureScript =
    "echo \"dir=$1 filter=${CAPTURE_FILTER:-none}\"; exec sleep 30";

// ── Argument helpers ────────────────────────────────────────────

TEST_CASE("parse_tool_json: empty and null become an empty object", "[tools]") {
    nlohmann::json args;
    REQUIRE_FALSE(parse_tool_json("", args).has_value());
    REQUIRE(args.is_object());
    REQUIRE_FALSE(parse_tool_json("null", args).has_value());
    REQUIRE(args.is_object());
}

TEST_CASE("parse_tool_json: rejects non-objects and bad JSON", "[tools]") {
    nlohmann::json args;
    auto err = parse_tool_json("[1]", args);
    REQUIRE(err.has_value());
    REQUIRE(err->output == "Arguments must be a JSON object");

    err = parse_tool_json("{oops", args);
    REQUIRE(err.has_value());
    REQUIRE_THAT(err->output, StartsWith("Failed to parse arguments"));
}

TEST_CASE("optional_string: absent, null, string, wrong type", "[tools]") {
    auto args = nlohmann::json::parse(R"({"a":"x","b":null,"c":5})");
    std::string out = "unchanged";

    REQUIRE_FALSE(optional_string(args, "missing", out).has_value());
    REQUIRE(out == "unchanged");
    REQUIRE_FALSE(optional_string(args, "b", out).has_value());
    REQUIRE(out == "unchanged");
    REQUIRE_FALSE(optional_string(args, "a", out).has_value());
    REQUIRE(out == "x");

    auto err = optional_string(args, "c", out);
    REQUIRE(err.has_value());
    REQUIRE_FALSE(err->success);
    REQUIRE(err->output == "Parameter must be a string: c");
}

// ── extract_leaf_configs ────────────────────────────────────────

TEST_CASE("LeafConfigsTool: returns script output on success", "[tools]") {
    LeafConfigsTool tool(sh("echo 'Saved configs to leaf-configs-1'; echo done 1>&2",
                            "extract-leaf-configs.sh"));
    auto result = tool.execute("{}", ToolContext{"1"});
    REQUIRE(result.success);
    REQUIRE_THAT(result.output, ContainsSubstring("Saved configs to leaf-configs-1"));
    REQUIRE_THAT(result.output, ContainsSubstring("done"));
}

TEST_CASE("LeafConfigsTool: failure carries status and output", "[tools]") {
    LeafConfigsTool tool(sh("echo 'no clab topology'; exit 2", "extract-leaf-configs.sh"));
    auto result = tool.execute("{}", ToolContext{"2"});
    REQUIRE_FALSE(result.success);
    REQUIRE(result.output ==
            "Error executing extract-leaf-configs.sh: exit status 2\nOutput: no clab topology\n");
}

TEST_CASE("LeafConfigsTool: missing script is a tool error", "[tools]") {
    CommandSpec spec;
    spec.program = "/nonexistent/perouter-shell";
    spec.display_name = "extract-leaf-configs.sh";
    LeafConfigsTool tool(spec);
    auto result = tool.execute("", ToolContext{"3"});
    REQUIRE_FALSE(result.success);
    REQUIRE_THAT(result.output, StartsWith("Error executing extract-leaf-configs.sh: "));
}

TEST_CASE("LeafConfigsTool: ignores unrelated arguments", "[tools]") {
    LeafConfigsTool tool(sh("echo ok"));
    auto result = tool.execute(R"({"unexpected":true})", ToolContext{"4"});
    REQUIRE(result.success);
    REQUIRE(result.output == "ok\n");
}

// ── start_traffic_capture ───────────────────────────────────────

TEST_CASE("StartCaptureTool: passes output dir and filter to the script", "[tools]") {
    CaptureSupervisor supervisor(fast_options());
    StartCaptureTool tool(supervisor, sh(kCaptureScript, "capture-traffic.sh"), "/tmp/caps");

    auto result = tool.execute(R"({"output_dir":" /tmp/run1 ","capture_filter":" arp or icmp "})",
                               ToolContext{"11"});
    REQUIRE(result.success);
    REQUIRE_THAT(result.output, StartsWith(
        "Traffic capture started successfully and is running in the background "
        "(Request ID: 11)."));
    REQUIRE_THAT(result.output, ContainsSubstring("Output directory: /tmp/run1\n"));
    REQUIRE_THAT(result.output, ContainsSubstring(
        "Initial output:\ndir=/tmp/run1 filter=arp or icmp\n"));
    REQUIRE_THAT(result.output, ContainsSubstring("Use the stop_traffic_capture tool"));
    REQUIRE(supervisor.is_active("11"));

    supervisor.stop_all();
}

TEST_CASE("StartCaptureTool: blank arguments use defaults", "[tools]") {
    CaptureSupervisor supervisor(fast_options());
    StartCaptureTool tool(supervisor, sh(kCaptureScript), "/tmp/caps");

    auto result = tool.execute(R"({"output_dir":"   ","capture_filter":""})", ToolContext{"12"});
    REQUIRE(result.success);
    REQUIRE_THAT(result.output, ContainsSubstring("Output directory: /tmp/caps/capture_"));
    REQUIRE_THAT(result.output, ContainsSubstring("filter=none"));

    supervisor.stop_all();
}

TEST_CASE("StartCaptureTool: silent script reports the timeout", "[tools]") {
    auto options = fast_options();
    options.observation_timeout = 1000ms;
    CaptureSupervisor supervisor(options);
    StartCaptureTool tool(supervisor, sh("exec sleep 30"), "/tmp/caps");

    auto result = tool.execute("{}", ToolContext{"13"});
    REQUIRE(result.success);
    REQUIRE_THAT(result.output, ContainsSubstring(
        "Initial output:\nCapture process started (waiting for initial output timed out after 1s)"));
    REQUIRE(supervisor.is_active("13"));

    supervisor.stop_all();
}

TEST_CASE("StartCaptureTool: script exiting without output", "[tools]") {
    CaptureSupervisor supervisor(fast_options());
    StartCaptureTool tool(supervisor, sh("exit 0"), "/tmp/caps");

    auto result = tool.execute("{}", ToolContext{"14"});
    REQUIRE(result.success);
    REQUIRE_THAT(result.output, ContainsSubstring(
        "Initial output:\nCapture started (no initial output yet)"));

    supervisor.stop_all();
}

TEST_CASE("StartCaptureTool: wrong argument type is a tool error", "[tools]") {
    CaptureSupervisor supervisor(fast_options());
    StartCaptureTool tool(supervisor, sh(kCaptureScript), "/tmp/caps");

    auto result = tool.execute(R"({"output_dir":17})", ToolContext{"15"});
    REQUIRE_FALSE(result.success);
    REQUIRE(result.output == "Parameter must be a string: output_dir");
    REQUIRE(supervisor.active_count() == 0);
}

TEST_CASE("StartCaptureTool: spawn failure is a tool error", "[tools]") {
    CaptureSupervisor supervisor(fast_options());
    CommandSpec spec;
    spec.program = "/nonexistent/perouter-shell";
    spec.display_name = "capture-traffic.sh";
    StartCaptureTool tool(supervisor, spec, "/tmp/caps");

    auto result = tool.execute("{}", ToolContext{"16"});
    REQUIRE_FALSE(result.success);
    REQUIRE_THAT(result.output, StartsWith("Error starting capture-traffic.sh: "));
    REQUIRE(supervisor.active_count() == 0);
}

// ── stop_traffic_capture ────────────────────────────────────────

TEST_CASE("StopCaptureTool: nothing running", "[tools]") {
    CaptureSupervisor supervisor(fast_options());
    StopCaptureTool tool(supervisor);

    auto result = tool.execute("{}", ToolContext{"20"});
    REQUIRE(result.success);
    REQUIRE(result.output ==
            "No active traffic captures found.");
}

TEST_CASE("StopCaptureTool: stops running captures", "[tools]") {
    CaptureSupervisor supervisor(fast_options());
    StartCaptureTool start(supervisor, sh(kCaptureScript), "/tmp/caps");
    StopCaptureTool stop(supervisor);

    REQUIRE(start.execute("{}", ToolContext{"21"}).success);
    REQUIRE(start.execute("{}", ToolContext{"22"}).success);

    auto result = stop.execute("not even json", ToolContext{"23"});
    REQUIRE(result.success);
    REQUIRE_THAT(result.output, StartsWith("Successfully stopped 2 traffic capture(s)."));
    REQUIRE_THAT(result.output, ContainsSubstring("Check the output directory"));
    REQUIRE(supervisor.active_count() == 0);
}

TEST_CASE("format_stop_report: mentions force killed captures", "[tools]") {
    StopReport report;
    report.found = 2;
    report.signaled = 2;
    report.force_killed = 1;
    report.timed_out = true;

    auto text = format_stop_report(report, 15000ms);
    REQUIRE_THAT(text, StartsWith("Successfully stopped 2 traffic capture(s).\n\n"));
    REQUIRE_THAT(text, ContainsSubstring(
        "1 capture(s) did not exit within 15s and were force killed."));
}

// ── Built-in set ────────────────────────────────────────────────

TEST_CASE("create_builtin_tools: three tools backed by the scripts dir", "[tools]") {
    std::string dir = make_temp_dir();
    REQUIRE_FALSE(dir.empty());
    {
        std::ofstream f(dir + "/extract-leaf-configs.sh");
        f << "echo \"leaf configs from $0\"\n";
    }

    Config config;
    config.scripts_dir = dir;
    config.shell = "/bin/sh";
    CaptureSupervisor supervisor(fast_options());
    auto tools = create_builtin_tools(config, supervisor);

    REQUIRE(tools.size() == 3);
    REQUIRE(tools[0]->tool_name() == "extract_leaf_configs");
    REQUIRE(tools[1]->tool_name() == "start_traffic_capture");
    REQUIRE(tools[2]->tool_name() == "stop_traffic_capture");

    auto result = tools[0]->execute("{}", ToolContext{"30"});
    REQUIRE(result.success);
    REQUIRE(result.output == "leaf configs from " + dir + "/extract-leaf-configs.sh\n");

    for (const auto& tool : tools) {
        auto schema = nlohmann::json::parse(tool->parameters_json());
        REQUIRE(schema["type"] == "object");
        REQUIRE_FALSE(tool->description().empty());
    }

    std::filesystem::remove_all(dir);
}
