#pragma once
#include "protocol/gate_request.hpp"
#include "core/errors/gate_errors.hpp"

namespace trustgate::app::cli {
    trustgate::core::errors::Result<trustgate::protocol::GateRequest> parse_and_validate(int argc, char* argv[]);
}
