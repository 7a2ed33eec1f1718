#include <modgraph/resolve/options.h>
#include <modgraph/core/config.h>
#include <modgraph/core/diagnostics.h>
#include <modgraph/support/key_writer.h>
#include <set>
#include <sstream>

namespace modgraph::resolve {

namespace {

void write_conditions(support::KeyWriter& writer, const ResolutionConditions& conditions) {
    writer.write_u32(static_cast<uint32_t>(conditions.size()));
    for (const auto& [name, value] : conditions) {
        writer.write_string(name);
        writer.write_u8(static_cast<uint8_t>(value));
    }
}

std::string format_conditions(const ResolutionConditions& conditions,
                              ConditionValue unspecified) {
    std::ostringstream oss;
    oss << "{";
    bool first = true;
    for (const auto& [name, value] : conditions) {
        if (!first) oss << ", ";
        first = false;
        oss << name << ": " << condition_value_name(value);
    }
    oss << "} unspecified=" << condition_value_name(unspecified);
    return oss.str();
}

std::string format_list(const std::vector<std::string>& values) {
    std::string out = "[";
    for (size_t i = 0; i < values.size(); ++i) {
        if (i > 0) out += ", ";
        out += "\"" + values[i] + "\"";
    }
    out += "]";
    return out;
}

} // namespace

const char* condition_value_name(ConditionValue value) {
    switch (value) {
        case ConditionValue::Set:     return "set";
        case ConditionValue::Unset:   return "unset";
        case ConditionValue::Unknown: return "unknown";
    }
    return "unknown";
}

// ---------------------------------------------------------------------------
// Strategy factories
// ---------------------------------------------------------------------------

ResolveModules ResolveModules::nested(fs::FileSystemPath root, std::vector<std::string> names) {
    return ResolveModules{Nested, std::move(root), std::move(names), {}};
}

ResolveModules ResolveModules::in_directory(fs::FileSystemPath dir,
                                            std::vector<std::string> excluded_extensions) {
    return ResolveModules{Path, std::move(dir), {}, std::move(excluded_extensions)};
}

ResolveIntoPackage ResolveIntoPackage::exports_field(ResolutionConditions conditions,
                                                     ConditionValue unspecified_conditions) {
    return ResolveIntoPackage{ExportsField, std::move(conditions), unspecified_conditions, {}};
}

ResolveIntoPackage ResolveIntoPackage::main_field(std::string field) {
    return ResolveIntoPackage{MainField, {}, ConditionValue::Unset, std::move(field)};
}

ResolveInPackage ResolveInPackage::alias_field(std::string field) {
    return ResolveInPackage{AliasField, {}, ConditionValue::Unset, std::move(field)};
}

ResolveInPackage ResolveInPackage::imports_field(ResolutionConditions conditions,
                                                 ConditionValue unspecified_conditions) {
    return ResolveInPackage{ImportsField, std::move(conditions), unspecified_conditions, {}};
}

bool operator==(const ResolveModules& a, const ResolveModules& b) {
    return a.type == b.type && a.path == b.path && a.names == b.names &&
           a.excluded_extensions == b.excluded_extensions;
}

bool operator==(const ResolveIntoPackage& a, const ResolveIntoPackage& b) {
    return a.type == b.type && a.conditions == b.conditions &&
           a.unspecified_conditions == b.unspecified_conditions && a.field == b.field;
}

bool operator==(const ResolveInPackage& a, const ResolveInPackage& b) {
    return a.type == b.type && a.conditions == b.conditions &&
           a.unspecified_conditions == b.unspecified_conditions && a.field == b.field;
}

bool operator==(const ResolveOptions& a, const ResolveOptions& b) {
    return a.fully_specified == b.fully_specified &&
           a.prefer_relative == b.prefer_relative &&
           a.extensions == b.extensions &&
           a.modules == b.modules &&
           a.into_package == b.into_package &&
           a.in_package == b.in_package &&
           a.default_files == b.default_files &&
           a.enable_typescript_with_output_extension == b.enable_typescript_with_output_extension &&
           a.loose_errors == b.loose_errors &&
           a.parse_data_uris == b.parse_data_uris;
}

// ---------------------------------------------------------------------------
// Keys
// ---------------------------------------------------------------------------

void ResolveOptions::write_key(support::KeyWriter& writer) const {
    writer.write_bool(fully_specified);
    writer.write_bool(prefer_relative);
    writer.write_strings(extensions);

    writer.write_u32(static_cast<uint32_t>(modules.size()));
    for (const auto& m : modules) {
        writer.write_u8(m.type);
        writer.write_string(m.path.file_system());
        writer.write_string(m.path.path());
        writer.write_strings(m.names);
        writer.write_strings(m.excluded_extensions);
    }

    writer.write_u32(static_cast<uint32_t>(into_package.size()));
    for (const auto& p : into_package) {
        writer.write_u8(p.type);
        write_conditions(writer, p.conditions);
        writer.write_u8(static_cast<uint8_t>(p.unspecified_conditions));
        writer.write_string(p.field);
    }

    writer.write_u32(static_cast<uint32_t>(in_package.size()));
    for (const auto& p : in_package) {
        writer.write_u8(p.type);
        write_conditions(writer, p.conditions);
        writer.write_u8(static_cast<uint8_t>(p.unspecified_conditions));
        writer.write_string(p.field);
    }

    writer.write_strings(default_files);
    writer.write_bool(enable_typescript_with_output_extension);
    writer.write_bool(loose_errors);
    writer.write_bool(parse_data_uris);
}

// ---------------------------------------------------------------------------
// Description
// ---------------------------------------------------------------------------

std::string describe_resolve_options(const ResolveOptions& options) {
    std::ostringstream oss;
    oss << "fully_specified: " << (options.fully_specified ? "true" : "false") << "\n";
    oss << "prefer_relative: " << (options.prefer_relative ? "true" : "false") << "\n";
    oss << "extensions: " << format_list(options.extensions) << "\n";

    oss << "modules:\n";
    for (const auto& m : options.modules) {
        if (m.type == ResolveModules::Nested) {
            oss << "  nested " << format_list(m.names) << " from " << m.path << "\n";
        } else {
            oss << "  path " << m.path;
            if (!m.excluded_extensions.empty()) {
                oss << " excluding " << format_list(m.excluded_extensions);
            }
            oss << "\n";
        }
    }

    oss << "into_package:\n";
    for (const auto& p : options.into_package) {
        if (p.type == ResolveIntoPackage::ExportsField) {
            oss << "  exports " << format_conditions(p.conditions, p.unspecified_conditions) << "\n";
        } else {
            oss << "  field \"" << p.field << "\"\n";
        }
    }

    oss << "in_package:\n";
    for (const auto& p : options.in_package) {
        if (p.type == ResolveInPackage::ImportsField) {
            oss << "  imports " << format_conditions(p.conditions, p.unspecified_conditions) << "\n";
        } else {
            oss << "  alias \"" << p.field << "\"\n";
        }
    }

    oss << "default_files: " << format_list(options.default_files) << "\n";
    oss << "enable_typescript_with_output_extension: "
        << (options.enable_typescript_with_output_extension ? "true" : "false") << "\n";
    oss << "loose_errors: " << (options.loose_errors ? "true" : "false") << "\n";
    oss << "parse_data_uris: " << (options.parse_data_uris ? "true" : "false") << "\n";
    return oss.str();
}

// ---------------------------------------------------------------------------
// Validation
// ---------------------------------------------------------------------------

bool validate_resolve_options(const ResolveOptions& options,
                              core::DiagnosticEmitter& emitter,
                              const std::string& stage) {
    const std::string module(core::config::kResolveModule);
    bool ok = true;
    auto error = [&](const std::string& message) {
        emitter.emit(core::Severity::Error, module, stage, message);
        ok = false;
    };

    std::set<std::string> seen_extensions;
    for (const auto& ext : options.extensions) {
        if (ext.size() < 2 || ext[0] != '.') {
            error("extension \"" + ext + "\" must start with '.' and name a suffix");
        }
        if (!seen_extensions.insert(ext).second) {
            error("extension \"" + ext + "\" is listed more than once");
        }
    }
    if (options.extensions.empty() && !options.fully_specified) {
        emitter.emit(core::Severity::Warning, module, stage,
                     "no extensions to probe for extension-less requests");
    }

    for (const auto& file : options.default_files) {
        if (file.empty()) {
            error("default file names must not be empty");
        }
    }

    for (const auto& m : options.modules) {
        if (m.type == ResolveModules::Nested && m.names.empty()) {
            error("nested module lookup from " + m.path.to_string() +
                  " has no directory names");
        }
    }

    for (const auto& p : options.into_package) {
        if (p.type == ResolveIntoPackage::ExportsField && p.conditions.empty()) {
            error("exports field strategy has no conditions");
        }
        if (p.type == ResolveIntoPackage::MainField && p.field.empty()) {
            error("main field strategy has an empty field name");
        }
    }

    for (const auto& p : options.in_package) {
        if (p.type == ResolveInPackage::ImportsField && p.conditions.empty()) {
            error("imports field strategy has no conditions");
        }
        if (p.type == ResolveInPackage::AliasField && p.field.empty()) {
            error("alias field strategy has an empty field name");
        }
    }

    emitter.emit(core::Severity::Info, module, stage,
                 std::to_string(options.extensions.size()) + " extensions, " +
                 std::to_string(options.modules.size()) + " module lookups, " +
                 std::to_string(options.into_package.size()) + " package entry strategies" +
                 (options.fully_specified ? ", fully specified" : ""));
    return ok;
}

} // namespace modgraph::resolve
