#pragma once
#include <modgraph/fs/file_system_path.h>
#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace modgraph::core {
class DiagnosticEmitter;
}

namespace modgraph::support {
class KeyWriter;
}

namespace modgraph::resolve {

// State of a condition while matching a conditional exports/imports field.
enum class ConditionValue : std::uint8_t {
    Set,
    Unset,
    Unknown,
};

const char* condition_value_name(ConditionValue value);

// Ordered by condition name.
using ResolutionConditions = std::map<std::string, ConditionValue>;

// Where bare module requests are looked up.
struct ResolveModules {
    enum Type : std::uint8_t {
        Nested,  // directories named `names`, searched upward from `path`
        Path,    // the directory `path` itself
    };
    Type type = Nested;
    fs::FileSystemPath path;
    std::vector<std::string> names;
    std::vector<std::string> excluded_extensions;  // Path only

    static ResolveModules nested(fs::FileSystemPath root, std::vector<std::string> names);
    static ResolveModules in_directory(fs::FileSystemPath dir,
                                       std::vector<std::string> excluded_extensions = {});

    friend bool operator==(const ResolveModules& a, const ResolveModules& b);
    friend bool operator!=(const ResolveModules& a, const ResolveModules& b) { return !(a == b); }
};

// How a request that lands on a package directory enters the package.
struct ResolveIntoPackage {
    enum Type : std::uint8_t {
        ExportsField,  // "exports" matched under `conditions`
        MainField,     // a plain entry field such as "main"
    };
    Type type = ExportsField;
    ResolutionConditions conditions;
    ConditionValue unspecified_conditions = ConditionValue::Unset;
    std::string field;  // MainField only

    static ResolveIntoPackage exports_field(ResolutionConditions conditions,
                                            ConditionValue unspecified_conditions);
    static ResolveIntoPackage main_field(std::string field);

    friend bool operator==(const ResolveIntoPackage& a, const ResolveIntoPackage& b);
    friend bool operator!=(const ResolveIntoPackage& a, const ResolveIntoPackage& b) {
        return !(a == b);
    }
};

// How requests issued from inside a package are remapped.
struct ResolveInPackage {
    enum Type : std::uint8_t {
        AliasField,    // e.g. "browser"
        ImportsField,  // "#specifier" self-references matched under `conditions`
    };
    Type type = ImportsField;
    ResolutionConditions conditions;
    ConditionValue unspecified_conditions = ConditionValue::Unset;
    std::string field;  // AliasField only

    static ResolveInPackage alias_field(std::string field);
    static ResolveInPackage imports_field(ResolutionConditions conditions,
                                          ConditionValue unspecified_conditions);

    friend bool operator==(const ResolveInPackage& a, const ResolveInPackage& b);
    friend bool operator!=(const ResolveInPackage& a, const ResolveInPackage& b) {
        return !(a == b);
    }
};

// Configuration handed to the file-system resolver. Every field has a
// default; builders only set what their module system needs.
struct ResolveOptions {
    // Requests must name the file extension.
    bool fully_specified = false;
    // Bare requests are tried as relative paths first.
    bool prefer_relative = false;
    // Tried in order for extension-less requests.
    std::vector<std::string> extensions;
    std::vector<ResolveModules> modules;
    std::vector<ResolveIntoPackage> into_package;
    std::vector<ResolveInPackage> in_package;
    // Base names tried when a request resolves to a directory.
    std::vector<std::string> default_files;
    bool enable_typescript_with_output_extension = false;
    bool loose_errors = false;
    bool parse_data_uris = false;

    void write_key(support::KeyWriter& writer) const;

    friend bool operator==(const ResolveOptions& a, const ResolveOptions& b);
    friend bool operator!=(const ResolveOptions& a, const ResolveOptions& b) { return !(a == b); }
};

// Deterministic multi-line rendering, one field per line.
std::string describe_resolve_options(const ResolveOptions& options);

// Reports structural problems as diagnostics under `stage`. Returns false if
// an error was emitted.
bool validate_resolve_options(const ResolveOptions& options,
                              core::DiagnosticEmitter& emitter,
                              const std::string& stage = "validate");

} // namespace modgraph::resolve
