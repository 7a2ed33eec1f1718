#pragma once
#include <modgraph/fs/file_system_path.h>
#include <modgraph/reference/reference_type.h>
#include <modgraph/resolve/options.h>
#include <optional>

namespace modgraph::resolve {

// Node.js resolution for require(): conditions {node, require}, tries
// .js/.json/.node, walks node_modules upward from `root`, enters packages
// through "exports" then "main".
ResolveOptions node_cjs_resolve_options(const fs::FileSystemPath& root);

// Same as the CommonJS policy with the "import" condition instead of
// "require"; requests must be fully specified.
ResolveOptions node_esm_resolve_options(const fs::FileSystemPath& root);

// Picks the Node policy a reference implies: ESM for EcmaScriptModules,
// CommonJS for CommonJs, nothing for other kinds.
std::optional<ResolveOptions> node_resolve_options_for(const reference::ReferenceType& type,
                                                       const fs::FileSystemPath& root);

} // namespace modgraph::resolve
