#include "Discovery.hpp"
#include "EvictionStore.hpp"
#include "HttpTypes.hpp"
#include "Logger.hpp"
#include "MetaStore.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>
#include <unordered_set>
#include <nlohmann/json.hpp>
using nlohmann::json;


// Desc: split "scheme://host[:port]" off an absolute URL
// In: const std::string& url
// Out: std::string (origin, empty if url is not absolute)
static std::string origin_of(const std::string& url) {
    auto scheme_end = url.find("://");
    if (scheme_end == std::string::npos) return {};
    auto path_start = url.find_first_of("/?#", scheme_end + 3);
    return path_start == std::string::npos ? url : url.substr(0, path_start);
}

// Desc: remove "." and ".." segments from an absolute path
// In: const std::string& path
// Out: std::string
static std::string remove_dot_segments(const std::string& path) {
    std::vector<std::string> out;
    std::stringstream ss(path);
    std::string seg;
    while (std::getline(ss, seg, '/')) {
        if (seg == ".") continue;
        if (seg == "..") { if (!out.empty()) out.pop_back(); continue; }
        out.push_back(seg);
    }
    std::string joined;
    for (size_t i = 0; i < out.size(); ++i) {
        if (i) joined += '/';
        joined += out[i];
    }
    if (joined.empty() || joined[0] != '/') joined.insert(joined.begin(), '/');
    if (!path.empty() && path.back() == '/' && joined.back() != '/') joined += '/';
    return joined;
}

// Desc: true if s starts with "scheme:" (ALPHA *( ALPHA / DIGIT / "+" / "-" / "." ) ":")
static bool has_scheme(const std::string& s) {
    if (s.empty() || !std::isalpha(static_cast<unsigned char>(s[0]))) return false;
    for (size_t i = 1; i < s.size(); ++i) {
        const unsigned char c = static_cast<unsigned char>(s[i]);
        if (c == ':') return true;
        if (!std::isalnum(c) && c != '+' && c != '-' && c != '.') return false;
    }
    return false;
}


namespace Discovery {

std::string resolve_url(const std::string& base, const std::string& href_raw) {
    std::string href = href_raw;
    auto not_space = [](unsigned char c){ return !std::isspace(c); };
    href.erase(href.begin(), std::find_if(href.begin(), href.end(), not_space));
    href.erase(std::find_if(href.rbegin(), href.rend(), not_space).base(), href.end());
    if (href.empty()) return {};

    if (has_scheme(href)) {
        const std::string lower = [&]{ std::string s = href.substr(0, 11);
                                       for (char& c : s) c = (char)std::tolower((unsigned char)c);
                                       return s; }();
        if (lower.rfind("data:", 0) == 0 || lower.rfind("blob:", 0) == 0 ||
            lower.rfind("javascript:", 0) == 0) {
            return {};
        }
        return canonical_url(href);
    }

    const std::string origin = origin_of(base);
    if (origin.empty()) return canonical_url(href);

    if (href.rfind("//", 0) == 0) {
        return canonical_url(base.substr(0, base.find("://") + 1) + href);
    }

    std::string rest = href;
    std::string suffix;
    auto q = rest.find_first_of("?#");
    if (q != std::string::npos) { suffix = rest.substr(q); rest = rest.substr(0, q); }

    std::string path;
    if (!rest.empty() && rest[0] == '/') {
        path = rest;
    } else {
        std::string base_path = base.substr(origin.size());
        auto cut = base_path.find_first_of("?#");
        if (cut != std::string::npos) base_path = base_path.substr(0, cut);
        auto slash = base_path.rfind('/');
        std::string dir = (slash == std::string::npos) ? "/" : base_path.substr(0, slash + 1);
        path = dir + rest;
    }
    return canonical_url(origin + remove_dot_segments(path) + suffix);
}


// Desc: find the next "<name" tag opening at or after from
// In: const std::string& lower (lowercased document), const std::string& name, size_t from
// Out: size_t (offset of '<', npos if none)
static size_t find_tag(const std::string& lower, const std::string& name, size_t from) {
    const std::string open = "<" + name;
    for (size_t p = lower.find(open, from); p != std::string::npos; p = lower.find(open, p + 1)) {
        const size_t after = p + open.size();
        if (after >= lower.size()) return std::string::npos;
        const unsigned char c = static_cast<unsigned char>(lower[after]);
        if (std::isspace(c) || c == '>' || c == '/') return p;
    }
    return std::string::npos;
}

// Desc: end of the tag starting at start (one past '>', document end if unterminated)
static size_t tag_end(const std::string& lower, size_t start) {
    const size_t gt = lower.find('>', start);
    return gt == std::string::npos ? lower.size() : gt + 1;
}

// Desc: quoted value of attribute name inside the tag text [b, e)
// In: html, lower (same length, lowercased), b, e, const std::string& name
// Out: std::string (empty if absent or unquoted)
static std::string attr_value(const std::string& html, const std::string& lower,
                              size_t b, size_t e, const std::string& name) {
    for (size_t p = lower.find(name, b); p != std::string::npos && p < e; p = lower.find(name, p + 1)) {
        const unsigned char prev = static_cast<unsigned char>(lower[p - 1]);
        if (std::isalnum(prev) || prev == '-' || prev == '_') continue;
        size_t q = p + name.size();
        while (q < e && std::isspace(static_cast<unsigned char>(lower[q]))) ++q;
        if (q >= e || lower[q] != '=') continue;
        ++q;
        while (q < e && std::isspace(static_cast<unsigned char>(lower[q]))) ++q;
        if (q >= e || (lower[q] != '"' && lower[q] != '\'')) continue;
        const size_t close = lower.find(lower[q], q + 1);
        if (close == std::string::npos || close >= e) return {};
        return html.substr(q + 1, close - q - 1);
    }
    return {};
}


// Desc: collect image, background-image and audio URLs from an HTML snapshot
// In: const std::string& html, const std::string& page_url
// Out: std::vector<std::string> (deduplicated, first-seen order)
std::vector<std::string> from_document(const std::string& html, const std::string& page_url) {
    const size_t npos = std::string::npos;
    std::string lower = html;
    for (char& c : lower) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));

    std::vector<std::string> found;
    std::unordered_set<std::string> seen;
    auto add = [&](const std::string& href) {
        std::string url = resolve_url(page_url, href);
        if (url.empty()) return;
        if (seen.insert(url).second) found.push_back(std::move(url));
    };

    // <img src> and every srcset candidate
    for (size_t p = find_tag(lower, "img", 0); p != npos; p = find_tag(lower, "img", p + 1)) {
        const size_t e = tag_end(lower, p);
        const std::string src = attr_value(html, lower, p, e, "src");
        if (!src.empty()) add(src);
        const std::string srcset = attr_value(html, lower, p, e, "srcset");
        if (!srcset.empty()) {
            std::stringstream ss(srcset);
            std::string candidate;
            while (std::getline(ss, candidate, ',')) {
                std::stringstream cs(candidate);
                std::string url;
                cs >> url;
                if (!url.empty()) add(url);
            }
        }
    }

    // inline background-image declarations: url(...) before the declaration ends
    static const std::string bg = "background";
    for (size_t p = lower.find(bg); p != npos; p = lower.find(bg, p + 1)) {
        size_t q = p + bg.size();
        if (lower.compare(q, 6, "-image") == 0) q += 6;
        while (q < lower.size() && std::isspace(static_cast<unsigned char>(lower[q]))) ++q;
        if (q >= lower.size() || lower[q] != ':') continue;
        const size_t stop = lower.find_first_of(";\"'>", q);
        const auto limit = lower.begin() + static_cast<std::ptrdiff_t>(stop == npos ? lower.size() : stop);
        static const std::string url_open = "url(";
        const auto u = std::search(lower.begin() + static_cast<std::ptrdiff_t>(q), limit,
                                   url_open.begin(), url_open.end());
        if (u == limit) continue;
        size_t v = static_cast<size_t>(u - lower.begin()) + url_open.size();
        while (v < lower.size() && std::isspace(static_cast<unsigned char>(lower[v]))) ++v;
        if (lower.compare(v, 6, "&quot;") == 0) v += 6;
        else if (v < lower.size() && (lower[v] == '"' || lower[v] == '\'')) ++v;
        const size_t vend = lower.find_first_of("\"')&", v);
        if (vend == npos || vend == v) continue;
        add(html.substr(v, vend - v));
    }

    // <audio src> and <source> children up to </audio>, or the next <audio> when unclosed
    for (size_t p = find_tag(lower, "audio", 0); p != npos; ) {
        const size_t open_end = tag_end(lower, p);
        const std::string src = attr_value(html, lower, p, open_end, "src");
        if (!src.empty()) add(src);

        const size_t next = find_tag(lower, "audio", open_end);
        size_t block_end = lower.find("</audio", open_end);
        if (block_end == npos || (next != npos && next < block_end)) {
            block_end = next == npos ? lower.size() : next;
        }
        for (size_t s = find_tag(lower, "source", open_end); s != npos && s < block_end;
             s = find_tag(lower, "source", s + 1)) {
            const std::string ssrc = attr_value(html, lower, s, tag_end(lower, s), "src");
            if (!ssrc.empty()) add(ssrc);
        }
        p = next;
    }

    #ifdef DEBUG
    Logger::info("Discovery", "found " + std::to_string(found.size()) + " assets in page");
    #endif
    return found;
}


// Desc: merge cached keys with fresh URLs and persist the capped list
// In: MetaStore& meta, const EvictionStore& store, urls, size_t cap
// Out: bool (false if the write was skipped)
bool record(MetaStore& meta, const EvictionStore& store,
            const std::vector<std::string>& urls, std::size_t cap) {
    std::vector<std::string> merged;
    std::unordered_set<std::string> seen;

    // keys() is LRU first; most recently used assets are the most valuable
    std::vector<std::string> cached = store.keys();
    for (auto it = cached.rbegin(); it != cached.rend() && merged.size() < cap; ++it) {
        if (seen.insert(*it).second) merged.push_back(*it);
    }
    for (const auto& u : urls) {
        if (merged.size() >= cap) break;
        const std::string key = canonical_url(u);
        if (key.empty()) continue;
        if (seen.insert(key).second) merged.push_back(key);
    }

    // page text is not guaranteed to be UTF-8; invalid bytes become U+FFFD
    const json j = merged;
    if (!meta.put(MetaStore::kDiscoveredAssetsKey,
                  j.dump(-1, ' ', false, json::error_handler_t::replace))) {
        Logger::warn("Discovery", "could not persist discovered assets");
        return false;
    }
    Logger::info("Discovery", "recorded " + std::to_string(merged.size()) + " assets");
    return true;
}


std::vector<std::string> load(const MetaStore& meta) {
    const auto raw = meta.get(MetaStore::kDiscoveredAssetsKey);
    if (!raw) return {};

    std::vector<std::string> out;
    try {
        const json j = json::parse(*raw);
        if (!j.is_array()) {
            Logger::warn("Discovery", "persisted asset list is not an array, ignoring");
            return {};
        }
        for (const auto& v : j) {
            if (v.is_string()) out.push_back(v.get<std::string>());
        }
    } catch (const json::exception& e) {
        Logger::warn("Discovery", std::string("persisted asset list is corrupt: ") + e.what());
        return {};
    }
    return out;
}

}
