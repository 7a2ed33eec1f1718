#include <modgraph/module/inner_assets.h>
#include <modgraph/support/key_writer.h>
#include <algorithm>
#include <stdexcept>

namespace modgraph::module {

bool same_module(const ModuleRef& a, const ModuleRef& b) {
    return compare_modules(a, b) == 0;
}

int compare_modules(const ModuleRef& a, const ModuleRef& b) {
    if (a == b) return 0;
    if (!a) return -1;
    if (!b) return 1;
    return a->ident().compare(b->ident());
}

InnerAssets::InnerAssets(std::vector<Entry> entries) {
    entries_.reserve(entries.size());
    for (auto& entry : entries) {
        insert_or_replace(std::move(entry.first), std::move(entry.second));
    }
}

InnerAssets::InnerAssets(std::initializer_list<Entry> entries) {
    entries_.reserve(entries.size());
    for (const auto& entry : entries) {
        insert_or_replace(entry.first, entry.second);
    }
}

const std::shared_ptr<const InnerAssets>& InnerAssets::empty() {
    static const std::shared_ptr<const InnerAssets> instance =
        std::make_shared<const InnerAssets>();
    return instance;
}

InnerAssets InnerAssets::with(const std::string& name, ModuleRef module) const {
    InnerAssets result = *this;
    result.insert_or_replace(name, std::move(module));
    return result;
}

void InnerAssets::insert_or_replace(std::string name, ModuleRef module) {
    if (!module) {
        throw std::invalid_argument("InnerAssets: null module for '" + name + "'");
    }
    auto it = std::find_if(entries_.begin(), entries_.end(),
                           [&](const Entry& e) { return e.first == name; });
    if (it != entries_.end()) {
        it->second = std::move(module);
        return;
    }
    entries_.emplace_back(std::move(name), std::move(module));
}

std::vector<InnerAssets::Entry>::const_iterator InnerAssets::find(const std::string& name) const {
    return std::find_if(entries_.begin(), entries_.end(),
                        [&](const Entry& e) { return e.first == name; });
}

ModuleRef InnerAssets::get(const std::string& name) const {
    auto it = find(name);
    if (it != entries_.end()) {
        return it->second;
    }
    return nullptr;
}

const ModuleRef& InnerAssets::at(const std::string& name) const {
    auto it = find(name);
    if (it == entries_.end()) {
        throw std::out_of_range("InnerAssets: no inner asset named '" + name + "'");
    }
    return it->second;
}

bool InnerAssets::contains(const std::string& name) const {
    return find(name) != entries_.end();
}

std::vector<std::string> InnerAssets::keys() const {
    std::vector<std::string> result;
    result.reserve(entries_.size());
    for (const auto& entry : entries_) {
        result.push_back(entry.first);
    }
    return result;
}

void InnerAssets::write_key(support::KeyWriter& writer) const {
    writer.write_u32(static_cast<uint32_t>(entries_.size()));
    for (const auto& entry : entries_) {
        writer.write_string(entry.first);
        writer.write_string(entry.second->ident());
    }
}

bool operator==(const InnerAssets& a, const InnerAssets& b) {
    if (a.entries_.size() != b.entries_.size()) return false;
    for (size_t i = 0; i < a.entries_.size(); ++i) {
        if (a.entries_[i].first != b.entries_[i].first) return false;
        if (!same_module(a.entries_[i].second, b.entries_[i].second)) return false;
    }
    return true;
}

bool operator<(const InnerAssets& a, const InnerAssets& b) {
    size_t n = std::min(a.entries_.size(), b.entries_.size());
    for (size_t i = 0; i < n; ++i) {
        int c = a.entries_[i].first.compare(b.entries_[i].first);
        if (c != 0) return c < 0;
        c = compare_modules(a.entries_[i].second, b.entries_[i].second);
        if (c != 0) return c < 0;
    }
    return a.entries_.size() < b.entries_.size();
}

} // namespace modgraph::module
