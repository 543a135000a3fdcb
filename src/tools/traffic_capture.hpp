#pragma once
#include "../tool.hpp"
#include "../process.hpp"
#include "../supervisor.hpp"

namespace perouter {

// Starts the capture script in the background and reports its first line
class StartCaptureTool : public Tool {
public:
    StartCaptureTool(CaptureSupervisor& supervisor, CommandSpec command,
                     std::string output_root)
        : supervisor_(supervisor), command_(std::move(command)),
          output_root_(std::move(output_root)) {}

    ToolResult execute(const std::string& args_json, const ToolContext& ctx) override;
    std::string tool_name() const override { return "start_traffic_capture"; }
    std::string description() const override;
    std::string parameters_json() const override;

private:
    CaptureSupervisor& supervisor_;
    CommandSpec command_;
    std::string output_root_;
};

// Stops every running capture
class StopCaptureTool : public Tool {
public:
    explicit StopCaptureTool(CaptureSupervisor& supervisor) : supervisor_(supervisor) {}

    ToolResult execute(const std::string& args_json, const ToolContext& ctx) override;
    std::string tool_name() const override { return "stop_traffic_capture"; }
    std::string description() const override;
    std::string parameters_json() const override;

private:
    CaptureSupervisor& supervisor_;
};

// Response text for a stop report
std::string format_stop_report(const StopReport& report, std::chrono::milliseconds timeout);

} // namespace perouter
