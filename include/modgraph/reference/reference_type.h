#pragma once
#include <modgraph/module/inner_assets.h>
#include <modgraph/module/module.h>
#include <modgraph/reference/import_context.h>
#include <cstdint>
#include <functional>
#include <optional>
#include <ostream>
#include <stdexcept>
#include <string>
#include <variant>

namespace modgraph::support {
class KeyWriter;
}

namespace modgraph::reference {

// Opaque tag of a Custom(u8) reference type or subtype. Reserved for
// plugin-defined types; matching and display on it are not supported yet.
struct CustomTypeTag {
    std::uint8_t id = 0;

    friend bool operator==(CustomTypeTag a, CustomTypeTag b) { return a.id == b.id; }
    friend bool operator!=(CustomTypeTag a, CustomTypeTag b) { return a.id != b.id; }
    friend bool operator<(CustomTypeTag a, CustomTypeTag b) { return a.id < b.id; }
};

class UnsupportedCustomType : public std::runtime_error {
public:
    UnsupportedCustomType(CustomTypeTag tag, const std::string& operation);
    CustomTypeTag tag() const { return tag_; }

private:
    CustomTypeTag tag_;
};

// ---------------------------------------------------------------------------
// Subtype families
// ---------------------------------------------------------------------------

enum class CommonJsKind : std::uint8_t { Custom, Undefined };

enum class UrlKind : std::uint8_t { EcmaScriptNewUrl, CssUrl, Custom, Undefined };

enum class TypeScriptKind : std::uint8_t { Custom, Undefined };

enum class EntryKind : std::uint8_t {
    Web,
    Page,
    PagesApi,
    AppPage,
    AppRoute,
    AppClientComponent,
    Middleware,
    Instrumentation,
    Runtime,
    Custom,
    Undefined,
};

// Subtype family without payload besides the Custom tag.
template <typename KindT>
class SubType {
public:
    using Kind = KindT;

    SubType() = default;
    SubType(Kind kind) : kind_(kind) {}

    static SubType custom(std::uint8_t id) {
        SubType sub(Kind::Custom);
        sub.custom_ = id;
        return sub;
    }

    Kind kind() const { return kind_; }
    std::uint8_t custom_id() const { return custom_; }
    bool is_undefined() const { return kind_ == Kind::Undefined; }

    friend bool operator==(const SubType& a, const SubType& b) {
        return a.kind_ == b.kind_ && a.custom_ == b.custom_;
    }
    friend bool operator!=(const SubType& a, const SubType& b) { return !(a == b); }
    friend bool operator<(const SubType& a, const SubType& b) {
        if (a.kind_ != b.kind_) return a.kind_ < b.kind_;
        return a.custom_ < b.custom_;
    }

private:
    Kind kind_ = Kind::Undefined;
    std::uint8_t custom_ = 0;
};

using CommonJsSubType = SubType<CommonJsKind>;
using UrlSubType = SubType<UrlKind>;
using TypeScriptSubType = SubType<TypeScriptKind>;
using EntrySubType = SubType<EntryKind>;

class EcmaScriptModulesSubType {
public:
    enum class Kind : std::uint8_t { ImportPart, Import, DynamicImport, Custom, Undefined };

    EcmaScriptModulesSubType() = default;
    // ImportPart needs a part; use import_part().
    EcmaScriptModulesSubType(Kind kind);

    static EcmaScriptModulesSubType import_part(module::ModulePartRef part);
    static EcmaScriptModulesSubType custom(std::uint8_t id);

    Kind kind() const { return kind_; }
    const module::ModulePartRef& part() const { return part_; }
    std::uint8_t custom_id() const { return custom_; }
    bool is_undefined() const { return kind_ == Kind::Undefined; }

    friend bool operator==(const EcmaScriptModulesSubType& a, const EcmaScriptModulesSubType& b);
    friend bool operator!=(const EcmaScriptModulesSubType& a, const EcmaScriptModulesSubType& b) {
        return !(a == b);
    }
    friend bool operator<(const EcmaScriptModulesSubType& a, const EcmaScriptModulesSubType& b);

private:
    Kind kind_ = Kind::Undefined;
    module::ModulePartRef part_;
    std::uint8_t custom_ = 0;
};

class CssSubType {
public:
    enum class Kind : std::uint8_t {
        AtImport,
        Compose,
        // Reference from any asset to a CSS-parseable asset: the boundary
        // between non-CSS and CSS assets.
        Internal,
        Custom,
        Undefined,
    };

    CssSubType() = default;
    CssSubType(Kind kind) : kind_(kind) {}

    // The context is optional; null means the import carried no conditions.
    static CssSubType at_import(ImportContextRef context = nullptr);
    static CssSubType custom(std::uint8_t id);

    Kind kind() const { return kind_; }
    const ImportContextRef& context() const { return context_; }
    std::uint8_t custom_id() const { return custom_; }
    bool is_undefined() const { return kind_ == Kind::Undefined; }

    friend bool operator==(const CssSubType& a, const CssSubType& b);
    friend bool operator!=(const CssSubType& a, const CssSubType& b) { return !(a == b); }
    friend bool operator<(const CssSubType& a, const CssSubType& b);

private:
    Kind kind_ = Kind::Undefined;
    ImportContextRef context_;
    std::uint8_t custom_ = 0;
};

const char* subtype_name(CommonJsKind kind);
const char* subtype_name(EcmaScriptModulesSubType::Kind kind);
const char* subtype_name(CssSubType::Kind kind);
const char* subtype_name(UrlKind kind);
const char* subtype_name(TypeScriptKind kind);
const char* subtype_name(EntryKind kind);

// ---------------------------------------------------------------------------
// ReferenceType
// ---------------------------------------------------------------------------

// Why a module reference exists. Rule matching branches on it through
// includes().
class ReferenceType {
public:
    enum class Kind : std::uint8_t {
        CommonJs,
        EcmaScriptModules,
        Css,
        Url,
        TypeScript,
        Entry,
        Runtime,
        Internal,
        Custom,
        Undefined,
    };

    ReferenceType() = default;

    static ReferenceType common_js(CommonJsSubType sub = {});
    static ReferenceType ecmascript_modules(EcmaScriptModulesSubType sub = {});
    static ReferenceType css(CssSubType sub = {});
    static ReferenceType url(UrlSubType sub = {});
    static ReferenceType typescript(TypeScriptSubType sub = {});
    static ReferenceType entry(EntrySubType sub = {});
    static ReferenceType runtime();
    // A null table is replaced by InnerAssets::empty().
    static ReferenceType internal(module::InnerAssetsRef assets);
    static ReferenceType custom(std::uint8_t id);
    static ReferenceType undefined();

    Kind kind() const { return kind_; }

    // Subtype accessors return nullptr for other kinds.
    const CommonJsSubType* as_common_js() const;
    const EcmaScriptModulesSubType* as_ecmascript_modules() const;
    const CssSubType* as_css() const;
    const UrlSubType* as_url() const;
    const TypeScriptSubType* as_typescript() const;
    const EntrySubType* as_entry() const;
    module::InnerAssetsRef inner_assets() const;
    std::optional<CustomTypeTag> custom_tag() const;

    // Does this constraint accept a reference classified as `other`?
    // Throws UnsupportedCustomType when this is a top-level Custom that is
    // not identical to `other`.
    bool includes(const ReferenceType& other) const;

    // Internal references only match rules that opt into internal assets.
    bool is_internal() const;

    // Short label of the top-level kind. Throws UnsupportedCustomType for
    // Custom.
    std::string to_string() const;

    // Name of the subtype kind ("AtImport", "Custom(3)", ...), empty for
    // kinds without a subtype. Payloads are never rendered.
    std::string subtype_label() const;

    void write_key(support::KeyWriter& writer) const;

    friend bool operator==(const ReferenceType& a, const ReferenceType& b);
    friend bool operator!=(const ReferenceType& a, const ReferenceType& b) { return !(a == b); }
    friend bool operator<(const ReferenceType& a, const ReferenceType& b);

private:
    using Payload = std::variant<std::monostate,
                                 CommonJsSubType,
                                 EcmaScriptModulesSubType,
                                 CssSubType,
                                 UrlSubType,
                                 TypeScriptSubType,
                                 EntrySubType,
                                 module::InnerAssetsRef,
                                 CustomTypeTag>;

    ReferenceType(Kind kind, Payload payload) : kind_(kind), payload_(std::move(payload)) {}

    friend int compare(const ReferenceType& a, const ReferenceType& b);

    Kind kind_ = Kind::Undefined;
    Payload payload_;
};

int compare(const ReferenceType& a, const ReferenceType& b);

std::ostream& operator<<(std::ostream& os, const ReferenceType& type);

} // namespace modgraph::reference

template <>
struct std::hash<modgraph::reference::ReferenceType> {
    std::size_t operator()(const modgraph::reference::ReferenceType& type) const;
};
