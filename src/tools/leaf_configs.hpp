#pragma once
#include "../tool.hpp"
#include "../process.hpp"

namespace perouter {

// Runs the leaf config extraction script to completion
class LeafConfigsTool : public Tool {
public:
    explicit LeafConfigsTool(CommandSpec command) : command_(std::move(command)) {}

    ToolResult execute(const std::string& args_json, const ToolContext& ctx) override;
    std::string tool_name() const override { return "extract_leaf_configs"; }
    std::string description() const override;
    std::string parameters_json() const override;

private:
    CommandSpec command_;
};

} // namespace perouter
