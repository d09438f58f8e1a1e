#pragma once
#include <string>
#include <random>
#include <sstream>

namespace trustgate::core::config {

    // Generates an 8-character hex ID, e.g. "inv-3fa9c01e"
    inline std::string generate_id(const std::string& prefix) {
        static thread_local std::mt19937 gen(std::random_device{}());
        std::uniform_int_distribution<> dis(0, 15);

        std::stringstream ss;
        ss << prefix << "-";
        for (int i = 0; i < 8; ++i) {
            ss << std::hex << dis(gen);
        }
        return ss.str();
    }

    inline std::string generate_session_id() { return generate_id("session"); }

    inline std::string generate_invocation_id() { return generate_id("inv"); }

} // namespace trustgate::core::config
