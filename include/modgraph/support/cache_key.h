#pragma once
#include <modgraph/module/inner_assets.h>
#include <modgraph/reference/import_context.h>
#include <modgraph/reference/reference_type.h>
#include <modgraph/resolve/options.h>
#include <string>
#include <string_view>

namespace modgraph::support {

// Lowercase hex SHA-256 of the bytes.
std::string sha256_hex(std::string_view bytes);

// Content keys for a content-addressed cache: equal values give equal keys.
std::string cache_key(const reference::ReferenceType& type);
std::string cache_key(const reference::ImportContext& context);
std::string cache_key(const module::InnerAssets& assets);
std::string cache_key(const resolve::ResolveOptions& options);

} // namespace modgraph::support
