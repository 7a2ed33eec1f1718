#include <modgraph/reference/import_context.h>
#include <modgraph/support/key_writer.h>
#include <algorithm>
#include <string_view>

namespace modgraph::reference {

namespace {

const std::shared_ptr<const ImportContext::Values>& empty_values() {
    static const auto instance = std::make_shared<const ImportContext::Values>();
    return instance;
}

} // namespace

ImportContext::ImportContext()
    : layers_(empty_values()), supports_(empty_values()), media_(empty_values()) {}

ImportContext::ImportContext(Values layers, Values supports, Values media)
    : layers_(std::make_shared<const Values>(std::move(layers))),
      supports_(std::make_shared<const Values>(std::move(supports))),
      media_(std::make_shared<const Values>(std::move(media))) {}

ImportContext::ImportContext(Shared, Family layers, Family supports, Family media)
    : layers_(std::move(layers)), supports_(std::move(supports)), media_(std::move(media)) {}

const std::shared_ptr<const ImportContext>& ImportContext::empty() {
    static const std::shared_ptr<const ImportContext> instance =
        std::make_shared<const ImportContext>();
    return instance;
}

bool ImportContext::is_empty() const {
    return layers_->empty() && supports_->empty() && media_->empty();
}

ImportContext::Family ImportContext::append_unique(const Family& family,
                                                   const std::optional<std::string>& value) {
    if (!value) return family;
    if (std::find(family->begin(), family->end(), *value) != family->end()) {
        return family;
    }
    auto grown = std::make_shared<Values>(*family);
    grown->push_back(*value);
    return grown;
}

ImportContext ImportContext::add(const std::optional<std::string>& layer,
                                 const std::optional<std::string>& supports,
                                 const std::optional<std::string>& media) const {
    return ImportContext(Shared{},
                         append_unique(layers_, layer),
                         append_unique(supports_, supports),
                         append_unique(media_, media));
}

ImportContext ImportContext::add(const ImportAttributes& attributes) const {
    return add(attributes.layer, attributes.supports, attributes.media);
}

void ImportContext::write_key(support::KeyWriter& writer) const {
    writer.write_strings(*layers_);
    writer.write_strings(*supports_);
    writer.write_strings(*media_);
}

bool operator==(const ImportContext& a, const ImportContext& b) {
    return a.layers() == b.layers() && a.supports() == b.supports() && a.media() == b.media();
}

bool operator<(const ImportContext& a, const ImportContext& b) {
    if (a.layers() != b.layers()) return a.layers() < b.layers();
    if (a.supports() != b.supports()) return a.supports() < b.supports();
    return a.media() < b.media();
}

} // namespace modgraph::reference

std::size_t std::hash<modgraph::reference::ImportContext>::operator()(
        const modgraph::reference::ImportContext& context) const {
    modgraph::support::KeyWriter writer;
    context.write_key(writer);
    return std::hash<std::string_view>{}(writer.view());
}
