#include <modgraph/support/cache_key.h>
#include <modgraph/support/key_writer.h>
#include <modgraph/resolve/node.h>

#include "test_modules.h"

#include <gtest/gtest.h>
#include <set>
#include <string>
#include <vector>

using modgraph::fs::FileSystemPath;
using modgraph::module::InnerAssets;
using modgraph::reference::CssSubType;
using modgraph::reference::EcmaScriptModulesSubType;
using modgraph::reference::ImportContext;
using modgraph::reference::ReferenceType;
using modgraph::resolve::node_cjs_resolve_options;
using modgraph::resolve::node_esm_resolve_options;
using modgraph::support::cache_key;
using modgraph::support::KeyWriter;
using modgraph::support::sha256_hex;
using modgraph::testing::make_module;

namespace {

using Values = std::vector<std::string>;

} // namespace

// ------------------------------------------------------------------
// KeyWriter
// ------------------------------------------------------------------

TEST(KeyWriterTest, BigEndianIntegers) {
    KeyWriter w;
    w.write_u8(0xAB);
    w.write_u32(0x01020304);
    w.write_bool(true);
    EXPECT_EQ(w.data(), (std::vector<uint8_t>{0xAB, 0x01, 0x02, 0x03, 0x04, 0x01}));
}

TEST(KeyWriterTest, StringsAreLengthPrefixed) {
    KeyWriter w;
    w.write_string("ab");
    EXPECT_EQ(w.data(), (std::vector<uint8_t>{0, 0, 0, 2, 'a', 'b'}));
    EXPECT_EQ(w.view().size(), 6u);
}

TEST(KeyWriterTest, SequenceBoundariesAreUnambiguous) {
    KeyWriter joined;
    joined.write_strings({"ab", "c"});
    KeyWriter split;
    split.write_strings({"a", "bc"});
    EXPECT_NE(joined.data(), split.data());
}

// ------------------------------------------------------------------
// SHA-256
// ------------------------------------------------------------------

TEST(CacheKeyTest, Sha256KnownVectors) {
    EXPECT_EQ(sha256_hex(""),
              "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
    EXPECT_EQ(sha256_hex("abc"),
              "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

// ------------------------------------------------------------------
// Value keys
// ------------------------------------------------------------------

TEST(CacheKeyTest, ReferenceTypeKeysFollowEquality) {
    auto ctx_a = std::make_shared<const ImportContext>(Values{"base"}, Values{}, Values{});
    auto ctx_b = std::make_shared<const ImportContext>(Values{"base"}, Values{}, Values{});
    auto a = ReferenceType::css(CssSubType::at_import(ctx_a));
    auto b = ReferenceType::css(CssSubType::at_import(ctx_b));
    EXPECT_EQ(cache_key(a), cache_key(b));
    EXPECT_EQ(cache_key(a).size(), 64u);

    std::set<std::string> keys{
        cache_key(ReferenceType::common_js()),
        cache_key(ReferenceType::ecmascript_modules()),
        cache_key(ReferenceType::ecmascript_modules(EcmaScriptModulesSubType::Kind::Import)),
        cache_key(ReferenceType::css()),
        cache_key(ReferenceType::css(CssSubType::at_import())),
        cache_key(a),
        cache_key(ReferenceType::runtime()),
        cache_key(ReferenceType::internal(nullptr)),
        cache_key(ReferenceType::custom(1)),
        cache_key(ReferenceType::custom(2)),
        cache_key(ReferenceType::undefined()),
    };
    EXPECT_EQ(keys.size(), 11u);
}

TEST(CacheKeyTest, ImportContextKeyReflectsOrder) {
    ImportContext ab = ImportContext().add(std::string("a"), std::nullopt, std::nullopt)
                                      .add(std::string("b"), std::nullopt, std::nullopt);
    ImportContext ba = ImportContext().add(std::string("b"), std::nullopt, std::nullopt)
                                      .add(std::string("a"), std::nullopt, std::nullopt);
    ImportContext ab_direct(Values{"a", "b"}, Values{}, Values{});
    EXPECT_EQ(cache_key(ab), cache_key(ab_direct));
    EXPECT_NE(cache_key(ab), cache_key(ba));
}

TEST(CacheKeyTest, InnerAssetsKeyUsesModuleIdents) {
    InnerAssets a{{"A", make_module("m/a.js")}};
    InnerAssets same{{"A", make_module("m/a.js")}};
    InnerAssets other{{"A", make_module("m/b.js")}};
    EXPECT_EQ(cache_key(a), cache_key(same));
    EXPECT_NE(cache_key(a), cache_key(other));
    EXPECT_EQ(cache_key(*InnerAssets::empty()), cache_key(InnerAssets()));
}

TEST(CacheKeyTest, ResolveOptionsKeys) {
    auto root = FileSystemPath("project", "app");
    EXPECT_EQ(cache_key(node_cjs_resolve_options(root)), cache_key(node_cjs_resolve_options(root)));
    EXPECT_NE(cache_key(node_cjs_resolve_options(root)), cache_key(node_esm_resolve_options(root)));
    EXPECT_NE(cache_key(node_cjs_resolve_options(root)),
              cache_key(node_cjs_resolve_options(FileSystemPath("other", "app"))));
}
