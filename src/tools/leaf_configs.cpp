#include "leaf_configs.hpp"
#include "tool_util.hpp"

namespace perouter {

ToolResult LeafConfigsTool::execute(const std::string& args_json, const ToolContext& /*ctx*/) {
    nlohmann::json args;
    if (auto err = parse_tool_json(args_json, args)) return *err;

    CommandResult result;
    try {
        result = run_command(command_);
    } catch (const std::exception& e) {
        return ToolResult{false, "Error executing " + command_.name() + ": " + e.what()};
    }

    if (!exited_successfully(result.status)) {
        return ToolResult{false, "Error executing " + command_.name() + ": " +
                                 describe_status(result.status) +
                                 "\nOutput: " + result.output};
    }
    return ToolResult{true, result.output};
}

std::string LeafConfigsTool::description() const {
    return "Extracts FRR running configurations from all leaf nodes in the CLAB topology. "
           "The configurations are saved to a timestamped directory.";
}

std::string LeafConfigsTool::parameters_json() const {
    return R"({"type":"object","properties":{}})";
}

} // namespace perouter
