#pragma once
#include <string>
#include <memory>
#include <vector>

namespace perouter {

struct Config;
class CaptureSupervisor;

struct ToolSpec {
    std::string name;
    std::string description;
    std::string parameters_json; // JSON schema for parameters
};

struct ToolResult {
    bool success;
    std::string output;
};

struct ToolContext {
    // Invocation identifier of the tools/call request
    std::string call_id;
};

class Tool {
public:
    virtual ~Tool() = default;
    virtual ToolResult execute(const std::string& args_json, const ToolContext& ctx) = 0;
    virtual std::string tool_name() const = 0;
    virtual std::string description() const = 0;
    virtual std::string parameters_json() const = 0;

    ToolSpec spec() const {
        return ToolSpec{tool_name(), description(), parameters_json()};
    }
};

// Create all built-in tools. Capture tools keep a reference to supervisor.
std::vector<std::unique_ptr<Tool>> create_builtin_tools(const Config& config,
                                                        CaptureSupervisor& supervisor);

} // namespace perouter
