#include <modgraph/tools/policy_cli.h>

#include <modgraph/core/config.h>

#include <gtest/gtest.h>
#include <sstream>
#include <string>
#include <vector>

using modgraph::tools::kExitInvalidPolicy;
using modgraph::tools::kExitOk;
using modgraph::tools::kExitUsage;
using modgraph::tools::run_policy_cli;

namespace {

struct CliResult {
    int exit_code = -1;
    std::string out;
    std::string err;
};

CliResult run(std::vector<std::string> args) {
    std::vector<const char*> argv{"modgraph_policy"};
    for (const auto& arg : args) {
        argv.push_back(arg.c_str());
    }
    std::ostringstream out;
    std::ostringstream err;
    CliResult result;
    result.exit_code = run_policy_cli(static_cast<int>(argv.size()), argv.data(), out, err);
    result.out = out.str();
    result.err = err.str();
    return result;
}

bool contains(const std::string& text, const std::string& needle) {
    return text.find(needle) != std::string::npos;
}

}  // namespace

TEST(PolicyCliTest, HelpAndVersion) {
    auto help = run({"--help"});
    EXPECT_EQ(help.exit_code, kExitOk);
    EXPECT_TRUE(contains(help.out, "usage: modgraph_policy"));

    auto version = run({"--version"});
    EXPECT_EQ(version.exit_code, kExitOk);
    EXPECT_EQ(version.out, std::string(modgraph::core::config::kVersionString) + "\n");
}

TEST(PolicyCliTest, CommonJsPolicy) {
    auto result = run({"cjs", "apps/web"});
    EXPECT_EQ(result.exit_code, kExitOk);
    EXPECT_TRUE(contains(result.out, "# commonjs (Undefined)"));
    EXPECT_TRUE(contains(result.out, "project/apps/web"));
    EXPECT_TRUE(contains(result.out, "require: set"));
    EXPECT_TRUE(contains(result.out, "cache_key: "));
    EXPECT_TRUE(result.err.empty());
}

TEST(PolicyCliTest, EsmPolicyOnCustomFileSystem) {
    auto result = run({"dynamic-import", "src", "--fs=output"});
    EXPECT_EQ(result.exit_code, kExitOk);
    EXPECT_TRUE(contains(result.out, "# EcmaScript Modules (DynamicImport)"));
    EXPECT_TRUE(contains(result.out, "output/src"));
    EXPECT_TRUE(contains(result.out, "import: set"));
    EXPECT_TRUE(result.err.empty());
}

TEST(PolicyCliTest, SameArgumentsGiveSameCacheKey) {
    EXPECT_EQ(run({"require", "app"}).out, run({"require", "app"}).out);
    EXPECT_NE(run({"cjs", "app"}).out, run({"esm", "app"}).out);
}

TEST(PolicyCliTest, UsageErrors) {
    auto missing = run({"cjs"});
    EXPECT_EQ(missing.exit_code, kExitUsage);
    EXPECT_TRUE(contains(missing.err, "usage:"));
    EXPECT_TRUE(missing.out.empty());

    auto unknown = run({"wasm", "app"});
    EXPECT_EQ(unknown.exit_code, kExitUsage);
    EXPECT_TRUE(contains(unknown.err, "unknown mode: wasm"));

    auto bad_option = run({"cjs", "app", "--verbose"});
    EXPECT_EQ(bad_option.exit_code, kExitUsage);
    EXPECT_TRUE(contains(bad_option.err, "invalid option: --verbose"));

    auto empty_fs = run({"cjs", "app", "--fs="});
    EXPECT_EQ(empty_fs.exit_code, kExitUsage);
}

TEST(PolicyCliTest, ReferenceWithoutNodePolicy) {
    for (const char* mode : {"css", "url", "typescript", "entry", "runtime"}) {
        auto result = run({mode, "app"});
        EXPECT_EQ(result.exit_code, kExitUsage) << mode;
        EXPECT_TRUE(contains(result.err, "has no Node policy")) << mode;
        EXPECT_FALSE(contains(result.err, "unknown mode")) << mode;
        EXPECT_TRUE(result.out.empty()) << mode;
    }
}

TEST(PolicyCliTest, ExtensionOverride) {
    auto result = run({"cjs", "app", "--extensions=.mjs,.cjs"});
    EXPECT_EQ(result.exit_code, kExitOk);
    EXPECT_TRUE(contains(result.out, ".mjs"));
    EXPECT_TRUE(contains(result.out, ".cjs"));
    EXPECT_FALSE(contains(result.out, ".node"));
}

TEST(PolicyCliTest, InvalidExtensionsFailValidation) {
    auto result = run({"cjs", "app", "--extensions=js,.json,.json"});
    EXPECT_EQ(result.exit_code, kExitInvalidPolicy);
    EXPECT_TRUE(contains(result.err, "[error] resolve/validate: extension \"js\""));
    EXPECT_TRUE(contains(result.err, "listed more than once"));
    EXPECT_TRUE(contains(result.out, "cache_key: "));
}

TEST(PolicyCliTest, EmptyExtensionsWarnOnlyWhenNotFullySpecified) {
    auto cjs = run({"cjs", "app", "--extensions="});
    EXPECT_EQ(cjs.exit_code, kExitOk);
    EXPECT_TRUE(contains(cjs.err, "[warning] resolve/validate: no extensions"));

    auto esm = run({"esm", "app", "--extensions="});
    EXPECT_EQ(esm.exit_code, kExitOk);
    EXPECT_TRUE(esm.err.empty());
}
