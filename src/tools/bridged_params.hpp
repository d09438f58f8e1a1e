#pragma once

#include <string>
#include <nlohmann/json.hpp>
#include "core/errors/gate_errors.hpp"
#include "protocol/tool_contract.hpp"

namespace trustgate::tools {

// Bridged tools accept any JSON object; null is treated as an empty object.
core::errors::Result<nlohmann::json> normalize_bridged_params(const nlohmann::json& params);

// "<server>.<tool> {compact json}"
std::string describe_bridged_invocation(const protocol::ToolDescriptor& tool,
                                        const nlohmann::json& params);

}  // namespace trustgate::tools
