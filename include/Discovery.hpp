// include/Discovery.hpp
#pragma once
#include <cstddef>
#include <string>
#include <vector>

class EvictionStore;
class MetaStore;

namespace Discovery {
constexpr std::size_t kDefaultCap = 500;

// Scan a rendered page snapshot for image, background-image and audio
// references. Lossy: only what is in the snapshot is found.
std::vector<std::string> from_document(const std::string& html, const std::string& page_url);

// Cached keys (most recent first) + fresh urls, deduplicated, capped, persisted.
bool record(MetaStore& meta, const EvictionStore& store,
            const std::vector<std::string>& urls, std::size_t cap = kDefaultCap);

// Persisted list; absent or corrupt data gives an empty list.
std::vector<std::string> load(const MetaStore& meta);

// Resolve href against base (absolute, protocol-relative, root-relative, relative).
std::string resolve_url(const std::string& base, const std::string& href);
}
