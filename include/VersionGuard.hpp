// include/VersionGuard.hpp
#pragma once
#include <string>

class MetaStore;

enum class VersionStatus { Unchanged, Changed };

namespace VersionGuard {
// Compare build_id with the persisted one; on mismatch drop persisted
// discovery data and stats, then record build_id. First run and an empty
// build_id both report Unchanged.
VersionStatus check(MetaStore& meta, const std::string& build_id);

// SHA-256 (hex) of a bundle file; empty string if it cannot be read.
std::string build_id_from_bundle(const std::string& path);

const char* to_string(VersionStatus s);
}
