#include "tool.hpp"
#include "config.hpp"
#include "tools/leaf_configs.hpp"
#include "tools/traffic_capture.hpp"

namespace perouter {

static CommandSpec script_command(const Config& config, const std::string& script) {
    CommandSpec spec;
    spec.program = config.shell;
    spec.args = {config.script_path(script)};
    spec.display_name = script;
    return spec;
}

std::vector<std::unique_ptr<Tool>> create_builtin_tools(const Config& config,
                                                        CaptureSupervisor& supervisor) {
    std::vector<std::unique_ptr<Tool>> tools;
    tools.push_back(std::make_unique<LeafConfigsTool>(
        script_command(config, "extract-leaf-configs.sh")));
    tools.push_back(std::make_unique<StartCaptureTool>(
        supervisor, script_command(config, "capture-traffic.sh"),
        config.capture.output_root));
    tools.push_back(std::make_unique<StopCaptureTool>(supervisor));
    return tools;
}

} // namespace perouter
