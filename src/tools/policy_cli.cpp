#include <modgraph/tools/policy_cli.h>

#include <modgraph/core/config.h>
#include <modgraph/core/diagnostics.h>
#include <modgraph/fs/file_system_path.h>
#include <modgraph/reference/reference_type.h>
#include <modgraph/resolve/node.h>
#include <modgraph/support/cache_key.h>

#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace modgraph::tools {

namespace {

namespace config = core::config;
using reference::EcmaScriptModulesSubType;
using reference::ReferenceType;

constexpr const char kProgramName[] = "modgraph_policy";
constexpr std::string_view kFsPrefix = "--fs=";
constexpr std::string_view kExtensionsPrefix = "--extensions=";

void print_usage(std::ostream& stream) {
  stream << "usage: " << kProgramName
         << " <mode> <root-path> [--fs=NAME] [--extensions=.A,.B]\n"
         << "modes: cjs esm require import dynamic-import css url typescript entry runtime\n";
}

bool is_help_flag(std::string_view text) {
  return text == "-h" || text == "--help";
}

bool is_version_flag(std::string_view text) {
  return text == "-V" || text == "--version";
}

bool starts_with(std::string_view value, std::string_view prefix) {
  return value.size() >= prefix.size() &&
         value.compare(0, prefix.size(), prefix) == 0;
}

// Comma-separated; an empty list clears the extensions.
std::vector<std::string> split_extensions(std::string_view list) {
  std::vector<std::string> result;
  while (!list.empty()) {
    const std::size_t comma = list.find(',');
    result.emplace_back(list.substr(0, comma));
    if (comma == std::string_view::npos) {
      break;
    }
    list.remove_prefix(comma + 1);
  }
  return result;
}

// Maps a mode to the reference a bundler would classify the request as.
std::optional<ReferenceType> reference_for_mode(std::string_view mode) {
  if (mode == "cjs" || mode == "require") {
    return ReferenceType::common_js();
  }
  if (mode == "esm") {
    return ReferenceType::ecmascript_modules();
  }
  if (mode == "import") {
    return ReferenceType::ecmascript_modules(EcmaScriptModulesSubType::Kind::Import);
  }
  if (mode == "dynamic-import") {
    return ReferenceType::ecmascript_modules(EcmaScriptModulesSubType::Kind::DynamicImport);
  }
  if (mode == "css") {
    return ReferenceType::css();
  }
  if (mode == "url") {
    return ReferenceType::url();
  }
  if (mode == "typescript") {
    return ReferenceType::typescript();
  }
  if (mode == "entry") {
    return ReferenceType::entry();
  }
  if (mode == "runtime") {
    return ReferenceType::runtime();
  }
  return std::nullopt;
}

}  // namespace

int run_policy_cli(int argc, const char* const* argv, std::ostream& out, std::ostream& err) {
  if (argc == 2 && is_help_flag(argv[1])) {
    print_usage(out);
    return kExitOk;
  }
  if (argc == 2 && is_version_flag(argv[1])) {
    out << config::kVersionString << "\n";
    return kExitOk;
  }
  if (argc < 3 || argc > 5) {
    print_usage(err);
    return kExitUsage;
  }

  std::string file_system(config::kProjectFileSystem);
  std::optional<std::vector<std::string>> extensions;
  for (int i = 3; i < argc; ++i) {
    const std::string_view flag(argv[i]);
    if (starts_with(flag, kFsPrefix) && flag.size() > kFsPrefix.size()) {
      file_system = std::string(flag.substr(kFsPrefix.size()));
    } else if (starts_with(flag, kExtensionsPrefix)) {
      extensions = split_extensions(flag.substr(kExtensionsPrefix.size()));
    } else {
      err << "error: invalid option: " << flag << "\n";
      print_usage(err);
      return kExitUsage;
    }
  }

  const std::optional<ReferenceType> reference = reference_for_mode(argv[1]);
  if (!reference) {
    err << "error: unknown mode: " << argv[1] << "\n";
    print_usage(err);
    return kExitUsage;
  }

  const fs::FileSystemPath root(file_system, argv[2]);
  std::optional<resolve::ResolveOptions> options =
      resolve::node_resolve_options_for(*reference, root);
  if (!options) {
    err << "error: " << reference->to_string() << " has no Node policy\n";
    return kExitUsage;
  }
  if (extensions) {
    options->extensions = std::move(*extensions);
  }

  core::DiagnosticEmitter emitter;
  emitter.set_min_severity(core::Severity::Warning);
  emitter.add_observer([&err](const core::DiagnosticEvent& event) {
    err << core::format_diagnostic(event) << "\n";
  });

  out << "# " << reference->to_string() << " (" << reference->subtype_label() << ")\n";
  out << resolve::describe_resolve_options(*options);
  out << "cache_key: " << support::cache_key(*options) << "\n";

  if (!resolve::validate_resolve_options(*options, emitter)) {
    return kExitInvalidPolicy;
  }
  return kExitOk;
}

}  // namespace modgraph::tools
