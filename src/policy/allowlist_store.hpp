#pragma once

#include <cstddef>
#include <mutex>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>
#include "protocol/tool_contract.hpp"

namespace trustgate::policy {

struct AllowlistKey {
    protocol::ToolKind kind;
    std::string scope;
};

// Shell tools have one granularity: the command root.
AllowlistKey shell_root_key(const std::string& command_root);

// Bridged tools have two: the whole server, or one tool on one server.
AllowlistKey bridged_server_key(const std::string& server_id);
AllowlistKey bridged_tool_key(const std::string& server_id, const std::string& tool_id);

// Server ids must not contain the '.' that joins "server.tool", otherwise a
// tool scope on one server would equal the server scope of another.
bool is_valid_server_id(const std::string& server_id);

// Session-scoped set of "always allow" decisions. Entries are only ever added.
// Owned by the session and passed by reference to the gate and to pending
// confirmation requests; it must outlive both.
class AllowlistStore {
public:
    bool is_allowed(protocol::ToolKind kind, const std::string& scope) const;
    bool is_allowed(const AllowlistKey& key) const;

    void allow(protocol::ToolKind kind, const std::string& scope);
    void allow(const AllowlistKey& key);

    std::vector<std::string> entries(protocol::ToolKind kind) const;
    std::size_t size() const;

private:
    mutable std::mutex mutex_;
    std::unordered_map<protocol::ToolKind, std::unordered_set<std::string>> scopes_;
};

}  // namespace trustgate::policy
