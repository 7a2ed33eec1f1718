#pragma once
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace modgraph::support {
class KeyWriter;
}

namespace modgraph::reference {

// The conditions a single CSS @import statement carries, unmerged.
// @import url("a.css") layer(base) supports(display: grid) screen;
struct ImportAttributes {
    std::optional<std::string> layer;
    std::optional<std::string> supports;
    std::optional<std::string> media;

    friend bool operator==(const ImportAttributes& a, const ImportAttributes& b) {
        return a.layer == b.layer && a.supports == b.supports && a.media == b.media;
    }
    friend bool operator!=(const ImportAttributes& a, const ImportAttributes& b) {
        return !(a == b);
    }
};

// Conditions accumulated along a chain of nested @import statements.
//
// Each family is kept in arrival order without duplicates. Order is part of
// the value: it reflects the left-to-right nesting of the imports. Instances
// are immutable; add() returns a new context and shares the families it did
// not touch with the receiver.
class ImportContext {
public:
    using Values = std::vector<std::string>;

    ImportContext();
    // Takes the sequences as given; no deduplication happens here.
    ImportContext(Values layers, Values supports, Values media);

    static const std::shared_ptr<const ImportContext>& empty();

    const Values& layers() const { return *layers_; }
    const Values& supports() const { return *supports_; }
    const Values& media() const { return *media_; }
    bool is_empty() const;

    ImportContext add(const std::optional<std::string>& layer,
                      const std::optional<std::string>& supports,
                      const std::optional<std::string>& media) const;
    ImportContext add(const ImportAttributes& attributes) const;

    // True when both contexts hold the same storage for the family.
    bool shares_layers_with(const ImportContext& other) const { return layers_ == other.layers_; }
    bool shares_supports_with(const ImportContext& other) const { return supports_ == other.supports_; }
    bool shares_media_with(const ImportContext& other) const { return media_ == other.media_; }

    void write_key(support::KeyWriter& writer) const;

    friend bool operator==(const ImportContext& a, const ImportContext& b);
    friend bool operator!=(const ImportContext& a, const ImportContext& b) { return !(a == b); }
    friend bool operator<(const ImportContext& a, const ImportContext& b);

private:
    using Family = std::shared_ptr<const Values>;
    struct Shared {};

    ImportContext(Shared, Family layers, Family supports, Family media);

    static Family append_unique(const Family& family, const std::optional<std::string>& value);

    Family layers_;
    Family supports_;
    Family media_;
};

using ImportContextRef = std::shared_ptr<const ImportContext>;

} // namespace modgraph::reference

template <>
struct std::hash<modgraph::reference::ImportContext> {
    std::size_t operator()(const modgraph::reference::ImportContext& context) const;
};
