#ifndef MODGRAPH_CORE_CONFIG_H
#define MODGRAPH_CORE_CONFIG_H

#include <array>
#include <string_view>

namespace modgraph::core::config {

inline constexpr const char kVersionString[] = "modgraph 0.3.0";

// Node.js module resolution
inline constexpr std::array<std::string_view, 3> kNodeExtensions = {".js", ".json", ".node"};
inline constexpr std::string_view kNodeModulesDirectory = "node_modules";
inline constexpr std::string_view kDefaultIndexFile = "index";
inline constexpr std::string_view kMainField = "main";
inline constexpr std::string_view kNodeCondition = "node";
inline constexpr std::string_view kRequireCondition = "require";
inline constexpr std::string_view kImportCondition = "import";

// Default file-system name for paths built without an explicit one.
inline constexpr std::string_view kProjectFileSystem = "project";

// Diagnostic module name of the validator
inline constexpr std::string_view kResolveModule = "resolve";

}  // namespace modgraph::core::config

#endif  // MODGRAPH_CORE_CONFIG_H
