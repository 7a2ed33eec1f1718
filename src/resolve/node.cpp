#include <modgraph/resolve/node.h>
#include <modgraph/core/config.h>

namespace modgraph::resolve {

namespace {

namespace config = core::config;

ResolveOptions node_resolve_options(const fs::FileSystemPath& root,
                                    std::string_view module_condition,
                                    bool fully_specified) {
    ResolutionConditions conditions = {
        {std::string(config::kNodeCondition), ConditionValue::Set},
        {std::string(module_condition), ConditionValue::Set},
    };

    ResolveOptions options;
    options.fully_specified = fully_specified;
    options.extensions.assign(config::kNodeExtensions.begin(), config::kNodeExtensions.end());
    options.modules.push_back(ResolveModules::nested(
        root, {std::string(config::kNodeModulesDirectory)}));
    options.into_package.push_back(
        ResolveIntoPackage::exports_field(conditions, ConditionValue::Unset));
    options.into_package.push_back(
        ResolveIntoPackage::main_field(std::string(config::kMainField)));
    options.in_package.push_back(
        ResolveInPackage::imports_field(std::move(conditions), ConditionValue::Unset));
    options.default_files.emplace_back(config::kDefaultIndexFile);
    return options;
}

} // namespace

ResolveOptions node_cjs_resolve_options(const fs::FileSystemPath& root) {
    return node_resolve_options(root, config::kRequireCondition, false);
}

ResolveOptions node_esm_resolve_options(const fs::FileSystemPath& root) {
    return node_resolve_options(root, config::kImportCondition, true);
}

std::optional<ResolveOptions> node_resolve_options_for(const reference::ReferenceType& type,
                                                       const fs::FileSystemPath& root) {
    switch (type.kind()) {
        case reference::ReferenceType::Kind::CommonJs:
            return node_cjs_resolve_options(root);
        case reference::ReferenceType::Kind::EcmaScriptModules:
            return node_esm_resolve_options(root);
        default:
            return std::nullopt;
    }
}

} // namespace modgraph::resolve
