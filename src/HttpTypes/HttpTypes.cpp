#include "HttpTypes.hpp"

#include <cctype>
#include <limits>


// Desc: strip the fragment so "a.png#x" and "a.png" share one cache slot
// In: const std::string& url
// Out: std::string
std::string canonical_url(const std::string& url) {
    auto pos = url.find('#');
    if (pos == std::string::npos) return url;
    return url.substr(0, pos);
}


// Desc: byte size used for budget accounting
// In: const HttpResponse& resp
// Out: uint64_t (Content-Length when declared and sane, else measured)
std::uint64_t estimate_size(const HttpResponse& resp) {
    std::uint64_t measured = resp.body.size();
    for (const auto& [name, value] : resp.headers) {
        measured += name.size() + value.size();
    }

    auto it = resp.headers.find("content-length");
    if (it == resp.headers.end() || it->second.empty()) return measured;

    std::uint64_t declared = 0;
    for (unsigned char c : it->second) {
        if (!std::isdigit(c)) return measured;
        const auto digit = static_cast<std::uint64_t>(c - '0');
        if (declared > (std::numeric_limits<std::uint64_t>::max() - digit) / 10) return measured;
        declared = declared * 10 + digit;
    }
    // A declared length smaller than what we actually hold is not trusted.
    return declared >= resp.body.size() ? declared : measured;
}
