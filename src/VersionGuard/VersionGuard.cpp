#include "VersionGuard.hpp"
#include "MetaStore.hpp"
#include "Logger.hpp"

#include <fstream>
#include <memory>
#include <vector>
#include <openssl/evp.h>


namespace VersionGuard {

// Desc: compare build identifier with the persisted one and invalidate on change
// In: MetaStore& meta, const std::string& build_id
// Out: VersionStatus
VersionStatus check(MetaStore& meta, const std::string& build_id) {
    if (build_id.empty()) {
        Logger::warn("VersionGuard", "no build id supplied, version guard disabled");
        return VersionStatus::Unchanged;
    }

    const auto last = meta.get(MetaStore::kBuildVersionKey);

    // first-time init
    if (!last || last->empty()) {
        if (!meta.put(MetaStore::kBuildVersionKey, build_id)) {
            Logger::warn("VersionGuard", "could not persist build id");
        }
        Logger::info("VersionGuard", "first run, build " + build_id);
        return VersionStatus::Unchanged;
    }

    if (*last == build_id) {
        #ifdef DEBUG
        Logger::info("VersionGuard", "no change, build " + build_id);
        #endif
        return VersionStatus::Unchanged;
    }

    // changed: old discovery list may name assets that no longer exist
    const bool in_tx = meta.begin();
    bool ok = true;
    ok = meta.erase(MetaStore::kDiscoveredAssetsKey) && ok;
    ok = meta.erase(MetaStore::kCacheStatsKey) && ok;
    ok = meta.put(MetaStore::kBuildVersionKey, build_id) && ok;
    if (in_tx) {
        if (ok) {
            if (!meta.commit()) meta.rollback();
        } else {
            meta.rollback();
        }
    }
    if (!ok) {
        Logger::warn("VersionGuard", "persisted metadata could not be fully reset");
    }

    Logger::info("VersionGuard", "build changed " + *last + " -> " + build_id + ", discovery data invalidated");
    return VersionStatus::Changed;
}


// Desc: hash an application bundle into a build identifier
// In: const std::string& path
// Out: std::string (64 hex chars, or empty on failure)
std::string build_id_from_bundle(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        Logger::warn("VersionGuard", "cannot read bundle: " + path);
        return {};
    }

    std::unique_ptr<EVP_MD_CTX, void(*)(EVP_MD_CTX*)> ctx(EVP_MD_CTX_new(), EVP_MD_CTX_free);
    if (!ctx || EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
        Logger::error("VersionGuard", "EVP sha256 init failed");
        return {};
    }

    std::vector<char> buf(64 * 1024);
    while (in) {
        in.read(buf.data(), static_cast<std::streamsize>(buf.size()));
        const std::streamsize n = in.gcount();
        if (n > 0 && EVP_DigestUpdate(ctx.get(), buf.data(), static_cast<size_t>(n)) != 1) {
            Logger::error("VersionGuard", "EVP sha256 update failed");
            return {};
        }
    }

    unsigned char out[EVP_MAX_MD_SIZE];
    unsigned int len = 0;
    if (EVP_DigestFinal_ex(ctx.get(), out, &len) != 1) {
        Logger::error("VersionGuard", "EVP sha256 final failed");
        return {};
    }

    static const char* hex = "0123456789abcdef";
    std::string h(static_cast<size_t>(len) * 2, '0');
    for (unsigned int i = 0; i < len; i++) {
        h[2*i]   = hex[(out[i]>>4) & 0xF];
        h[2*i+1] = hex[out[i] & 0xF];
    }
    return h;
}

const char* to_string(VersionStatus s) {
    return s == VersionStatus::Changed ? "changed" : "unchanged";
}

}
