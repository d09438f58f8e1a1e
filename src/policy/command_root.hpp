#pragma once

#include <string>
#include <string_view>

namespace trustgate::policy {

// Canonical leading-binary token of a shell command line, used as the shell
// allowlist key. Only the segment before the first `&&`, `||`, `;` or `|` is
// considered, and path-qualified binaries collapse to their basename:
//   "git status && echo done"    -> "git"
//   "/usr/bin/python3 script.py" -> "python3"
// Returns an empty string when no root can be found.
std::string extract_command_root(std::string_view command_line);

}  // namespace trustgate::policy
