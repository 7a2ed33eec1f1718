#pragma once

#include <iosfwd>

namespace modgraph::tools {

// Exit codes of the modgraph_policy tool.
constexpr int kExitOk = 0;
constexpr int kExitUsage = 1;
constexpr int kExitInvalidPolicy = 2;

// Runs `modgraph_policy` with the given arguments. The policy and its cache
// key go to `out`; usage errors and warning or error diagnostics go to `err`.
// A mode whose reference has no Node policy is reported as a usage error.
int run_policy_cli(int argc, const char* const* argv, std::ostream& out, std::ostream& err);

}  // namespace modgraph::tools
