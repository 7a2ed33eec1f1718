#include <modgraph/resolve/node.h>

#include <gtest/gtest.h>
#include <string>
#include <vector>

using modgraph::fs::FileSystemPath;
using modgraph::reference::CssSubType;
using modgraph::reference::EcmaScriptModulesSubType;
using modgraph::reference::ReferenceType;
using modgraph::reference::UrlKind;
using modgraph::resolve::ConditionValue;
using modgraph::resolve::node_cjs_resolve_options;
using modgraph::resolve::node_esm_resolve_options;
using modgraph::resolve::node_resolve_options_for;
using modgraph::resolve::ResolutionConditions;
using modgraph::resolve::ResolveInPackage;
using modgraph::resolve::ResolveIntoPackage;
using modgraph::resolve::ResolveModules;
using modgraph::resolve::ResolveOptions;

namespace {

using Strings = std::vector<std::string>;

FileSystemPath project_root() {
    return FileSystemPath("project", "apps/web");
}

} // namespace

TEST(NodeResolveTest, CjsExtensions) {
    auto options = node_cjs_resolve_options(project_root());
    EXPECT_EQ(options.extensions, (Strings{".js", ".json", ".node"}));
}

TEST(NodeResolveTest, EsmExtensions) {
    auto options = node_esm_resolve_options(project_root());
    EXPECT_EQ(options.extensions, (Strings{".js", ".json", ".node"}));
}

TEST(NodeResolveTest, FullySpecified) {
    EXPECT_FALSE(node_cjs_resolve_options(project_root()).fully_specified);
    EXPECT_TRUE(node_esm_resolve_options(project_root()).fully_specified);
}

TEST(NodeResolveTest, DefaultFiles) {
    EXPECT_EQ(node_cjs_resolve_options(project_root()).default_files, (Strings{"index"}));
    EXPECT_EQ(node_esm_resolve_options(project_root()).default_files, (Strings{"index"}));
}

TEST(NodeResolveTest, ModulesSearchNodeModulesFromRoot) {
    auto root = project_root();
    for (const auto& options : {node_cjs_resolve_options(root), node_esm_resolve_options(root)}) {
        ASSERT_EQ(options.modules.size(), 1u);
        EXPECT_EQ(options.modules[0].type, ResolveModules::Nested);
        EXPECT_EQ(options.modules[0].path, root);
        EXPECT_EQ(options.modules[0].names, (Strings{"node_modules"}));
    }
}

TEST(NodeResolveTest, CjsPackageEntryPrecedence) {
    auto options = node_cjs_resolve_options(project_root());
    ResolutionConditions expected{{"node", ConditionValue::Set}, {"require", ConditionValue::Set}};

    ASSERT_EQ(options.into_package.size(), 2u);
    EXPECT_EQ(options.into_package[0].type, ResolveIntoPackage::ExportsField);
    EXPECT_EQ(options.into_package[0].conditions, expected);
    EXPECT_EQ(options.into_package[0].unspecified_conditions, ConditionValue::Unset);
    EXPECT_EQ(options.into_package[1].type, ResolveIntoPackage::MainField);
    EXPECT_EQ(options.into_package[1].field, "main");

    ASSERT_EQ(options.in_package.size(), 1u);
    EXPECT_EQ(options.in_package[0].type, ResolveInPackage::ImportsField);
    EXPECT_EQ(options.in_package[0].conditions, expected);
    EXPECT_EQ(options.in_package[0].unspecified_conditions, ConditionValue::Unset);
}

TEST(NodeResolveTest, EsmPackageEntryPrecedence) {
    auto options = node_esm_resolve_options(project_root());
    ResolutionConditions expected{{"node", ConditionValue::Set}, {"import", ConditionValue::Set}};

    ASSERT_EQ(options.into_package.size(), 2u);
    EXPECT_EQ(options.into_package[0],
              ResolveIntoPackage::exports_field(expected, ConditionValue::Unset));
    EXPECT_EQ(options.into_package[1], ResolveIntoPackage::main_field("main"));
    ASSERT_EQ(options.in_package.size(), 1u);
    EXPECT_EQ(options.in_package[0],
              ResolveInPackage::imports_field(expected, ConditionValue::Unset));
    EXPECT_EQ(options.into_package[0].conditions.count("require"), 0u);
}

TEST(NodeResolveTest, UnsetFieldsKeepDefaults) {
    ResolveOptions defaults;
    for (const auto& options :
         {node_cjs_resolve_options(project_root()), node_esm_resolve_options(project_root())}) {
        EXPECT_EQ(options.prefer_relative, defaults.prefer_relative);
        EXPECT_EQ(options.enable_typescript_with_output_extension,
                  defaults.enable_typescript_with_output_extension);
        EXPECT_EQ(options.loose_errors, defaults.loose_errors);
        EXPECT_EQ(options.parse_data_uris, defaults.parse_data_uris);
    }
}

TEST(NodeResolveTest, PoliciesDifferOnlyInConditionAndFullySpecified) {
    auto cjs = node_cjs_resolve_options(project_root());
    auto esm = node_esm_resolve_options(project_root());
    EXPECT_NE(cjs, esm);

    esm.fully_specified = false;
    ResolutionConditions cjs_conditions{{"node", ConditionValue::Set},
                                        {"require", ConditionValue::Set}};
    esm.into_package[0].conditions = cjs_conditions;
    esm.in_package[0].conditions = cjs_conditions;
    EXPECT_EQ(cjs, esm);
}

TEST(NodeResolveTest, DeterministicForSameRoot) {
    EXPECT_EQ(node_cjs_resolve_options(project_root()), node_cjs_resolve_options(project_root()));
    EXPECT_EQ(node_esm_resolve_options(project_root()), node_esm_resolve_options(project_root()));
    EXPECT_NE(node_cjs_resolve_options(project_root()),
              node_cjs_resolve_options(FileSystemPath("project", "apps/docs")));
}

TEST(NodeResolveTest, OptionsForReferenceType) {
    auto root = project_root();
    EXPECT_EQ(node_resolve_options_for(ReferenceType::common_js(), root),
              node_cjs_resolve_options(root));
    EXPECT_EQ(node_resolve_options_for(
                  ReferenceType::ecmascript_modules(EcmaScriptModulesSubType::Kind::DynamicImport),
                  root),
              node_esm_resolve_options(root));
    EXPECT_EQ(node_resolve_options_for(ReferenceType::ecmascript_modules(), root),
              node_esm_resolve_options(root));

    EXPECT_FALSE(node_resolve_options_for(ReferenceType::css(CssSubType::at_import()), root));
    EXPECT_FALSE(node_resolve_options_for(ReferenceType::url(UrlKind::EcmaScriptNewUrl), root));
    EXPECT_FALSE(node_resolve_options_for(ReferenceType::undefined(), root));
    EXPECT_FALSE(node_resolve_options_for(ReferenceType::custom(1), root));
}
