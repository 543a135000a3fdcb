#include "traffic_capture.hpp"
#include "tool_util.hpp"
#include "../util.hpp"

namespace perouter {

static std::string whole_seconds(std::chrono::milliseconds ms) {
    return std::to_string(std::chrono::duration_cast<std::chrono::seconds>(ms).count()) + "s";
}

ToolResult StartCaptureTool::execute(const std::string& args_json, const ToolContext& ctx) {
    nlohmann::json args;
    if (auto err = parse_tool_json(args_json, args)) return *err;

    std::string output_dir;
    std::string capture_filter;
    if (auto err = optional_string(args, "output_dir", output_dir)) return *err;
    if (auto err = optional_string(args, "capture_filter", capture_filter)) return *err;

    output_dir = trim(output_dir);
    if (output_dir.empty()) {
        output_dir = join_path(output_root_, "capture_" + compact_timestamp());
    }

    CommandSpec spec = command_;
    spec.args.push_back(output_dir);
    capture_filter = trim(capture_filter);
    if (!capture_filter.empty()) {
        spec.env.emplace_back("CAPTURE_FILTER", capture_filter);
    }

    StartOutcome outcome = supervisor_.start(ctx.call_id, spec);

    std::string initial_output;
    switch (outcome.kind) {
        case StartOutcome::Kind::Failed:
            return ToolResult{false, outcome.text};
        case StartOutcome::Kind::Cancelled:
            return ToolResult{true, "Traffic capture was cancelled before starting."};
        case StartOutcome::Kind::Output:
            initial_output = outcome.text;
            break;
        case StartOutcome::Kind::NoOutput:
            initial_output = "Capture started (no initial output yet)";
            break;
        case StartOutcome::Kind::TimedOut:
            initial_output = "Capture process started (waiting for initial output timed out after " +
                             whole_seconds(supervisor_.options().observation_timeout) + ")";
            break;
    }

    return ToolResult{true,
        "Traffic capture started successfully and is running in the background "
        "(Request ID: " + ctx.call_id + ").\n\n"
        "Output directory: " + output_dir + "\n\n"
        "Initial output:\n" + initial_output + "\n\n"
        "The capture will continue running. Use the stop_traffic_capture tool to "
        "stop all captures and retrieve the files."};
}

std::string StartCaptureTool::description() const {
    return "Starts capturing network traffic from Kubernetes cluster nodes and spine router "
           "using tshark. This operation starts in the background and returns immediately. "
           "Use stop_traffic_capture to stop the capture and retrieve files. Automatically "
           "installs tshark on nodes if needed.";
}

std::string StartCaptureTool::parameters_json() const {
    return R"({"type":"object","properties":{"output_dir":{"type":"string","description":"Directory where capture files will be saved. Optional, defaults to './captures/capture_<timestamp>'."},"capture_filter":{"type":"string","description":"Tshark capture filter (e.g., 'arp or icmp'). Optional, defaults to capturing all traffic."}},"required":[]})";
}

std::string format_stop_report(const StopReport& report, std::chrono::milliseconds timeout) {
    if (report.found == 0) {
        return "No active traffic captures found.";
    }

    std::string text = "Successfully stopped " + std::to_string(report.signaled) +
                       " traffic capture(s).";

    text += "\n\nThe cleanup process has:\n"
            "- Terminated all tshark processes in containers\n"
            "- Copied pcap files from containers to the host\n\n"
            "Check the output directory for the capture files.";
    if (report.timed_out) {
        text += "\n\n" + std::to_string(report.force_killed) +
                " capture(s) did not exit within " + whole_seconds(timeout) +
                " and were force killed.";
    }
    return text;
}

// Takes no arguments; whatever is passed is ignored so stop always succeeds
ToolResult StopCaptureTool::execute(const std::string& /*args_json*/, const ToolContext& /*ctx*/) {
    StopReport report = supervisor_.stop_all();
    return ToolResult{true, format_stop_report(report, supervisor_.options().stop_timeout)};
}

std::string StopCaptureTool::description() const {
    return "Stops all running traffic captures, retrieves the pcap files from containers, "
           "and saves them to the host directory. This will gracefully terminate all tshark "
           "processes and copy the capture files.";
}

std::string StopCaptureTool::parameters_json() const {
    return R"({"type":"object","properties":{}})";
}

} // namespace perouter
