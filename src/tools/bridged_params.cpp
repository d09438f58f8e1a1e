#include "tools/bridged_params.hpp"

namespace trustgate::tools {

using core::errors::ErrorCategory;
using core::errors::GateError;

core::errors::Result<nlohmann::json> normalize_bridged_params(const nlohmann::json& params) {
    if (params.is_null()) {
        return nlohmann::json::object();
    }
    if (!params.is_object()) {
        return GateError{ErrorCategory::Validation,
                         "Bridged tool parameters must be a JSON object.",
                         "invalid_params"};
    }
    return params;
}

std::string describe_bridged_invocation(const protocol::ToolDescriptor& tool,
                                        const nlohmann::json& params) {
    return tool.server_id + "." + tool.server_tool_id + " " + params.dump();
}

}  // namespace trustgate::tools
