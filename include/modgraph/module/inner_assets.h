#pragma once
#include <modgraph/module/module.h>
#include <initializer_list>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace modgraph::support {
class KeyWriter;
}

namespace modgraph::module {

// Named references to inner assets. A module uses them to alias some of its
// requests to already created modules. Names are usually UPPER_CASE.
//
// Keys are unique and iterate in insertion order. Instances are immutable;
// with() returns a new table.
class InnerAssets {
public:
    using Entry = std::pair<std::string, ModuleRef>;
    using iterator = std::vector<Entry>::const_iterator;

    InnerAssets() = default;
    // A repeated key replaces the earlier value but keeps its position.
    explicit InnerAssets(std::vector<Entry> entries);
    InnerAssets(std::initializer_list<Entry> entries);

    // Shared empty table; every call returns the same instance.
    static const std::shared_ptr<const InnerAssets>& empty();

    InnerAssets with(const std::string& name, ModuleRef module) const;

    ModuleRef get(const std::string& name) const;
    const ModuleRef& at(const std::string& name) const;
    bool contains(const std::string& name) const;
    std::vector<std::string> keys() const;

    size_t size() const { return entries_.size(); }
    bool is_empty() const { return entries_.empty(); }

    iterator begin() const { return entries_.begin(); }
    iterator end() const { return entries_.end(); }

    // Writes names and module idents in order.
    void write_key(support::KeyWriter& writer) const;

    friend bool operator==(const InnerAssets& a, const InnerAssets& b);
    friend bool operator!=(const InnerAssets& a, const InnerAssets& b) { return !(a == b); }
    friend bool operator<(const InnerAssets& a, const InnerAssets& b);

private:
    std::vector<Entry> entries_;

    void insert_or_replace(std::string name, ModuleRef module);
    std::vector<Entry>::const_iterator find(const std::string& name) const;
};

using InnerAssetsRef = std::shared_ptr<const InnerAssets>;

// Identity comparison of module handles by ident(); null sorts first.
bool same_module(const ModuleRef& a, const ModuleRef& b);
int compare_modules(const ModuleRef& a, const ModuleRef& b);

} // namespace modgraph::module
