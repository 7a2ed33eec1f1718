#include <modgraph/reference/reference_type.h>
#include <modgraph/support/key_writer.h>
#include <string_view>

namespace modgraph::reference {

namespace {

template <typename T>
int three_way(const T& a, const T& b) {
    if (a < b) return -1;
    if (b < a) return 1;
    return 0;
}

// Null handles sort before any value.
template <typename T>
int compare_refs(const std::shared_ptr<const T>& a, const std::shared_ptr<const T>& b) {
    if (a == b) return 0;
    if (!a) return -1;
    if (!b) return 1;
    return three_way(*a, *b);
}

// ---------------------------------------------------------------------------
// Subsumption within a kind. `self` and `other` are already known to be
// different values of the same kind.
// ---------------------------------------------------------------------------

template <typename Sub>
bool subtype_accepts(const Sub& self, const Sub& /*other*/) {
    return self.is_undefined();
}

bool subtype_accepts(const CssSubType& self, const CssSubType& other) {
    // Any pair of @import references is treated as identical for matching;
    // the import context does not take part.
    if (self.kind() == CssSubType::Kind::AtImport) {
        return other.kind() == CssSubType::Kind::AtImport;
    }
    return self.is_undefined();
}

template <typename Sub>
std::string custom_or_name(const Sub& sub) {
    if (sub.kind() == Sub::Kind::Custom) {
        return "Custom(" + std::to_string(sub.custom_id()) + ")";
    }
    return subtype_name(sub.kind());
}

template <typename Sub>
void write_simple_subtype(support::KeyWriter& writer, const Sub& sub) {
    writer.write_u8(static_cast<uint8_t>(sub.kind()));
    writer.write_u8(sub.custom_id());
}

void write_module_part(support::KeyWriter& writer, const module::ModulePartRef& part) {
    if (!part) {
        writer.write_absent();
        return;
    }
    writer.write_present();
    writer.write_u8(static_cast<uint8_t>(part->kind()));
    writer.write_string(part->name());
    writer.write_u32(part->index());
}

} // namespace

UnsupportedCustomType::UnsupportedCustomType(CustomTypeTag tag, const std::string& operation)
    : std::runtime_error("unsupported custom reference type " + std::to_string(tag.id) +
                         ": " + operation + " is not implemented for custom types"),
      tag_(tag) {}

// ---------------------------------------------------------------------------
// EcmaScriptModulesSubType
// ---------------------------------------------------------------------------

EcmaScriptModulesSubType::EcmaScriptModulesSubType(Kind kind) : kind_(kind) {
    if (kind == Kind::ImportPart) {
        throw std::invalid_argument("EcmaScriptModulesSubType: ImportPart requires a module part");
    }
}

EcmaScriptModulesSubType EcmaScriptModulesSubType::import_part(module::ModulePartRef part) {
    if (!part) {
        throw std::invalid_argument("EcmaScriptModulesSubType: null module part");
    }
    EcmaScriptModulesSubType sub;
    sub.kind_ = Kind::ImportPart;
    sub.part_ = std::move(part);
    return sub;
}

EcmaScriptModulesSubType EcmaScriptModulesSubType::custom(std::uint8_t id) {
    EcmaScriptModulesSubType sub(Kind::Custom);
    sub.custom_ = id;
    return sub;
}

bool operator==(const EcmaScriptModulesSubType& a, const EcmaScriptModulesSubType& b) {
    return a.kind_ == b.kind_ && a.custom_ == b.custom_ && compare_refs(a.part_, b.part_) == 0;
}

bool operator<(const EcmaScriptModulesSubType& a, const EcmaScriptModulesSubType& b) {
    if (a.kind_ != b.kind_) return a.kind_ < b.kind_;
    if (a.custom_ != b.custom_) return a.custom_ < b.custom_;
    return compare_refs(a.part_, b.part_) < 0;
}

// ---------------------------------------------------------------------------
// CssSubType
// ---------------------------------------------------------------------------

CssSubType CssSubType::at_import(ImportContextRef context) {
    CssSubType sub(Kind::AtImport);
    sub.context_ = std::move(context);
    return sub;
}

CssSubType CssSubType::custom(std::uint8_t id) {
    CssSubType sub(Kind::Custom);
    sub.custom_ = id;
    return sub;
}

bool operator==(const CssSubType& a, const CssSubType& b) {
    return a.kind_ == b.kind_ && a.custom_ == b.custom_ &&
           compare_refs(a.context_, b.context_) == 0;
}

bool operator<(const CssSubType& a, const CssSubType& b) {
    if (a.kind_ != b.kind_) return a.kind_ < b.kind_;
    if (a.custom_ != b.custom_) return a.custom_ < b.custom_;
    return compare_refs(a.context_, b.context_) < 0;
}

// ---------------------------------------------------------------------------
// Subtype names
// ---------------------------------------------------------------------------

const char* subtype_name(CommonJsKind kind) {
    switch (kind) {
        case CommonJsKind::Custom:    return "Custom";
        case CommonJsKind::Undefined: return "Undefined";
    }
    return "unknown";
}

const char* subtype_name(EcmaScriptModulesSubType::Kind kind) {
    using Kind = EcmaScriptModulesSubType::Kind;
    switch (kind) {
        case Kind::ImportPart:    return "ImportPart";
        case Kind::Import:        return "Import";
        case Kind::DynamicImport: return "DynamicImport";
        case Kind::Custom:        return "Custom";
        case Kind::Undefined:     return "Undefined";
    }
    return "unknown";
}

const char* subtype_name(CssSubType::Kind kind) {
    using Kind = CssSubType::Kind;
    switch (kind) {
        case Kind::AtImport:  return "AtImport";
        case Kind::Compose:   return "Compose";
        case Kind::Internal:  return "Internal";
        case Kind::Custom:    return "Custom";
        case Kind::Undefined: return "Undefined";
    }
    return "unknown";
}

const char* subtype_name(UrlKind kind) {
    switch (kind) {
        case UrlKind::EcmaScriptNewUrl: return "EcmaScriptNewUrl";
        case UrlKind::CssUrl:           return "CssUrl";
        case UrlKind::Custom:           return "Custom";
        case UrlKind::Undefined:        return "Undefined";
    }
    return "unknown";
}

const char* subtype_name(TypeScriptKind kind) {
    switch (kind) {
        case TypeScriptKind::Custom:    return "Custom";
        case TypeScriptKind::Undefined: return "Undefined";
    }
    return "unknown";
}

const char* subtype_name(EntryKind kind) {
    switch (kind) {
        case EntryKind::Web:                return "Web";
        case EntryKind::Page:               return "Page";
        case EntryKind::PagesApi:           return "PagesApi";
        case EntryKind::AppPage:            return "AppPage";
        case EntryKind::AppRoute:           return "AppRoute";
        case EntryKind::AppClientComponent: return "AppClientComponent";
        case EntryKind::Middleware:         return "Middleware";
        case EntryKind::Instrumentation:    return "Instrumentation";
        case EntryKind::Runtime:            return "Runtime";
        case EntryKind::Custom:             return "Custom";
        case EntryKind::Undefined:          return "Undefined";
    }
    return "unknown";
}

// ---------------------------------------------------------------------------
// ReferenceType construction and access
// ---------------------------------------------------------------------------

ReferenceType ReferenceType::common_js(CommonJsSubType sub) {
    return ReferenceType(Kind::CommonJs, sub);
}

ReferenceType ReferenceType::ecmascript_modules(EcmaScriptModulesSubType sub) {
    return ReferenceType(Kind::EcmaScriptModules, std::move(sub));
}

ReferenceType ReferenceType::css(CssSubType sub) {
    return ReferenceType(Kind::Css, std::move(sub));
}

ReferenceType ReferenceType::url(UrlSubType sub) {
    return ReferenceType(Kind::Url, sub);
}

ReferenceType ReferenceType::typescript(TypeScriptSubType sub) {
    return ReferenceType(Kind::TypeScript, sub);
}

ReferenceType ReferenceType::entry(EntrySubType sub) {
    return ReferenceType(Kind::Entry, sub);
}

ReferenceType ReferenceType::runtime() {
    return ReferenceType(Kind::Runtime, std::monostate{});
}

ReferenceType ReferenceType::internal(module::InnerAssetsRef assets) {
    if (!assets) {
        assets = module::InnerAssets::empty();
    }
    return ReferenceType(Kind::Internal, std::move(assets));
}

ReferenceType ReferenceType::custom(std::uint8_t id) {
    return ReferenceType(Kind::Custom, CustomTypeTag{id});
}

ReferenceType ReferenceType::undefined() {
    return ReferenceType();
}

const CommonJsSubType* ReferenceType::as_common_js() const {
    return std::get_if<CommonJsSubType>(&payload_);
}

const EcmaScriptModulesSubType* ReferenceType::as_ecmascript_modules() const {
    return std::get_if<EcmaScriptModulesSubType>(&payload_);
}

const CssSubType* ReferenceType::as_css() const {
    return std::get_if<CssSubType>(&payload_);
}

const UrlSubType* ReferenceType::as_url() const {
    return std::get_if<UrlSubType>(&payload_);
}

const TypeScriptSubType* ReferenceType::as_typescript() const {
    return std::get_if<TypeScriptSubType>(&payload_);
}

const EntrySubType* ReferenceType::as_entry() const {
    return std::get_if<EntrySubType>(&payload_);
}

module::InnerAssetsRef ReferenceType::inner_assets() const {
    if (const auto* assets = std::get_if<module::InnerAssetsRef>(&payload_)) {
        return *assets;
    }
    return nullptr;
}

std::optional<CustomTypeTag> ReferenceType::custom_tag() const {
    if (const auto* tag = std::get_if<CustomTypeTag>(&payload_)) {
        return *tag;
    }
    return std::nullopt;
}

// ---------------------------------------------------------------------------
// Matching
// ---------------------------------------------------------------------------

bool ReferenceType::includes(const ReferenceType& other) const {
    if (*this == other) {
        return true;
    }

    switch (kind_) {
        case Kind::Undefined:
            return true;
        case Kind::Custom:
            throw UnsupportedCustomType(*custom_tag(), "includes");
        default:
            break;
    }

    if (kind_ != other.kind_) {
        return false;
    }

    switch (kind_) {
        case Kind::CommonJs:
            return subtype_accepts(*as_common_js(), *other.as_common_js());
        case Kind::EcmaScriptModules:
            return subtype_accepts(*as_ecmascript_modules(), *other.as_ecmascript_modules());
        case Kind::Css:
            return subtype_accepts(*as_css(), *other.as_css());
        case Kind::Url:
            return subtype_accepts(*as_url(), *other.as_url());
        case Kind::TypeScript:
            return subtype_accepts(*as_typescript(), *other.as_typescript());
        case Kind::Entry:
            return subtype_accepts(*as_entry(), *other.as_entry());
        case Kind::Runtime:
        case Kind::Internal:
            // Internal matches regardless of the inner-asset table.
            return true;
        case Kind::Custom:
        case Kind::Undefined:
            break;
    }
    return false;
}

bool ReferenceType::is_internal() const {
    switch (kind_) {
        case Kind::Internal:
        case Kind::Runtime:
            return true;
        case Kind::Css:
            return as_css()->kind() == CssSubType::Kind::Internal;
        default:
            return false;
    }
}

// ---------------------------------------------------------------------------
// Display
// ---------------------------------------------------------------------------

std::string ReferenceType::to_string() const {
    switch (kind_) {
        case Kind::CommonJs:
            return "commonjs";
        case Kind::EcmaScriptModules:
            if (as_ecmascript_modules()->kind() == EcmaScriptModulesSubType::Kind::ImportPart) {
                return "EcmaScript Modules (part)";
            }
            return "EcmaScript Modules";
        case Kind::Css:        return "css";
        case Kind::Url:        return "url";
        case Kind::TypeScript: return "typescript";
        case Kind::Entry:      return "entry";
        case Kind::Runtime:    return "runtime";
        case Kind::Internal:   return "internal";
        case Kind::Custom:
            throw UnsupportedCustomType(*custom_tag(), "display");
        case Kind::Undefined:  return "undefined";
    }
    return "unknown";
}

std::string ReferenceType::subtype_label() const {
    switch (kind_) {
        case Kind::CommonJs:          return custom_or_name(*as_common_js());
        case Kind::EcmaScriptModules: return custom_or_name(*as_ecmascript_modules());
        case Kind::Css:               return custom_or_name(*as_css());
        case Kind::Url:               return custom_or_name(*as_url());
        case Kind::TypeScript:        return custom_or_name(*as_typescript());
        case Kind::Entry:             return custom_or_name(*as_entry());
        default:
            return {};
    }
}

std::ostream& operator<<(std::ostream& os, const ReferenceType& type) {
    return os << type.to_string();
}

// ---------------------------------------------------------------------------
// Equality, ordering, keys
// ---------------------------------------------------------------------------

int compare(const ReferenceType& a, const ReferenceType& b) {
    if (a.kind_ != b.kind_) {
        return a.kind_ < b.kind_ ? -1 : 1;
    }
    switch (a.kind_) {
        case ReferenceType::Kind::CommonJs:
            return three_way(*a.as_common_js(), *b.as_common_js());
        case ReferenceType::Kind::EcmaScriptModules:
            return three_way(*a.as_ecmascript_modules(), *b.as_ecmascript_modules());
        case ReferenceType::Kind::Css:
            return three_way(*a.as_css(), *b.as_css());
        case ReferenceType::Kind::Url:
            return three_way(*a.as_url(), *b.as_url());
        case ReferenceType::Kind::TypeScript:
            return three_way(*a.as_typescript(), *b.as_typescript());
        case ReferenceType::Kind::Entry:
            return three_way(*a.as_entry(), *b.as_entry());
        case ReferenceType::Kind::Internal:
            return compare_refs(a.inner_assets(), b.inner_assets());
        case ReferenceType::Kind::Custom:
            return three_way(*a.custom_tag(), *b.custom_tag());
        case ReferenceType::Kind::Runtime:
        case ReferenceType::Kind::Undefined:
            return 0;
    }
    return 0;
}

bool operator==(const ReferenceType& a, const ReferenceType& b) {
    return compare(a, b) == 0;
}

bool operator<(const ReferenceType& a, const ReferenceType& b) {
    return compare(a, b) < 0;
}

void ReferenceType::write_key(support::KeyWriter& writer) const {
    writer.write_u8(static_cast<uint8_t>(kind_));
    switch (kind_) {
        case Kind::CommonJs:
            write_simple_subtype(writer, *as_common_js());
            break;
        case Kind::EcmaScriptModules: {
            const auto& sub = *as_ecmascript_modules();
            write_simple_subtype(writer, sub);
            write_module_part(writer, sub.part());
            break;
        }
        case Kind::Css: {
            const auto& sub = *as_css();
            write_simple_subtype(writer, sub);
            if (sub.context()) {
                writer.write_present();
                sub.context()->write_key(writer);
            } else {
                writer.write_absent();
            }
            break;
        }
        case Kind::Url:
            write_simple_subtype(writer, *as_url());
            break;
        case Kind::TypeScript:
            write_simple_subtype(writer, *as_typescript());
            break;
        case Kind::Entry:
            write_simple_subtype(writer, *as_entry());
            break;
        case Kind::Internal:
            inner_assets()->write_key(writer);
            break;
        case Kind::Custom:
            writer.write_u8(custom_tag()->id);
            break;
        case Kind::Runtime:
        case Kind::Undefined:
            break;
    }
}

} // namespace modgraph::reference

std::size_t std::hash<modgraph::reference::ReferenceType>::operator()(
        const modgraph::reference::ReferenceType& type) const {
    modgraph::support::KeyWriter writer;
    type.write_key(writer);
    return std::hash<std::string_view>{}(writer.view());
}
