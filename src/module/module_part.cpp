#include <modgraph/module/module.h>

namespace modgraph::module {

ModulePart ModulePart::export_name(std::string name) {
    ModulePart part(Kind::Export);
    part.name_ = std::move(name);
    return part;
}

ModulePart ModulePart::internal(std::uint32_t index) {
    ModulePart part(Kind::Internal);
    part.index_ = index;
    return part;
}

std::string ModulePart::to_string() const {
    switch (kind_) {
        case Kind::Evaluation: return "module evaluation";
        case Kind::Exports:    return "exports";
        case Kind::Export:     return "export " + name_;
        case Kind::Internal:   return "internal part " + std::to_string(index_);
        case Kind::Facade:     return "facade";
    }
    return "unknown";
}

bool operator<(const ModulePart& a, const ModulePart& b) {
    if (a.kind_ != b.kind_) return a.kind_ < b.kind_;
    if (a.name_ != b.name_) return a.name_ < b.name_;
    return a.index_ < b.index_;
}

} // namespace modgraph::module
