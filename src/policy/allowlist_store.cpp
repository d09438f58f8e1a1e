#include "policy/allowlist_store.hpp"

#include <algorithm>
#include "core/logging/logger.hpp"

namespace trustgate::policy {

using protocol::ToolKind;

AllowlistKey shell_root_key(const std::string& command_root) {
    return AllowlistKey{ToolKind::Shell, command_root};
}

AllowlistKey bridged_server_key(const std::string& server_id) {
    return AllowlistKey{ToolKind::Bridged, server_id};
}

AllowlistKey bridged_tool_key(const std::string& server_id, const std::string& tool_id) {
    return AllowlistKey{ToolKind::Bridged, server_id + "." + tool_id};
}

bool is_valid_server_id(const std::string& server_id) {
    return !server_id.empty() && server_id.find('.') == std::string::npos;
}

bool AllowlistStore::is_allowed(const ToolKind kind, const std::string& scope) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = scopes_.find(kind);
    if (it == scopes_.end()) {
        return false;
    }
    return it->second.count(scope) > 0;
}

bool AllowlistStore::is_allowed(const AllowlistKey& key) const {
    return is_allowed(key.kind, key.scope);
}

void AllowlistStore::allow(const ToolKind kind, const std::string& scope) {
    bool inserted = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        inserted = scopes_[kind].insert(scope).second;
    }
    if (inserted) {
        LOG_INFO("AllowlistStore: always allow " + protocol::to_string(kind) +
                 " scope '" + scope + "'");
    }
}

void AllowlistStore::allow(const AllowlistKey& key) {
    allow(key.kind, key.scope);
}

std::vector<std::string> AllowlistStore::entries(const ToolKind kind) const {
    std::vector<std::string> out;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = scopes_.find(kind);
        if (it != scopes_.end()) {
            out.assign(it->second.begin(), it->second.end());
        }
    }
    std::sort(out.begin(), out.end());
    return out;
}

std::size_t AllowlistStore::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::size_t total = 0;
    for (const auto& entry : scopes_) {
        total += entry.second.size();
    }
    return total;
}

}  // namespace trustgate::policy
