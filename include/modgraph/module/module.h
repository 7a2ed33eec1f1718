#pragma once
#include <cstdint>
#include <memory>
#include <string>

namespace modgraph::module {

// A resolved module owned by the module graph. modgraph only needs a stable
// identity for comparison and cache keys.
class Module {
public:
    virtual ~Module() = default;

    // Stable, unique identifier, e.g. "project/src/a.js [client]".
    virtual std::string ident() const = 0;
};

using ModuleRef = std::shared_ptr<const Module>;

// Selects a fragment of a module for fine-grained ES module imports.
class ModulePart {
public:
    enum class Kind : std::uint8_t {
        Evaluation,   // side effects of the module body
        Exports,      // the namespace object
        Export,       // a single named export
        Internal,     // an internal part, by index
        Facade,       // re-export facade of the module
    };

    static ModulePart evaluation() { return ModulePart(Kind::Evaluation); }
    static ModulePart exports() { return ModulePart(Kind::Exports); }
    static ModulePart export_name(std::string name);
    static ModulePart internal(std::uint32_t index);
    static ModulePart facade() { return ModulePart(Kind::Facade); }

    Kind kind() const { return kind_; }
    const std::string& name() const { return name_; }
    std::uint32_t index() const { return index_; }

    std::string to_string() const;

    friend bool operator==(const ModulePart& a, const ModulePart& b) {
        return a.kind_ == b.kind_ && a.name_ == b.name_ && a.index_ == b.index_;
    }
    friend bool operator!=(const ModulePart& a, const ModulePart& b) { return !(a == b); }
    friend bool operator<(const ModulePart& a, const ModulePart& b);

private:
    explicit ModulePart(Kind kind) : kind_(kind) {}

    Kind kind_;
    std::string name_;
    std::uint32_t index_ = 0;
};

using ModulePartRef = std::shared_ptr<const ModulePart>;

} // namespace modgraph::module
