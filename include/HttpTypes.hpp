// include/HttpTypes.hpp
#pragma once
#include <cstdint>
#include <map>
#include <stdexcept>
#include <string>

struct HttpRequest {
    std::string method = "GET";
    std::string url;
    std::map<std::string, std::string> headers;
    std::string body;
};

// Bodies are read in full by the fetcher, so a copy is an independent clone.
struct HttpResponse {
    int status = 0;
    std::map<std::string, std::string> headers;  // lowercase names
    std::string body;

    bool ok() const { return status >= 200 && status < 300; }
};

// Transport-level failure (resolve, connect, TLS, timeout).
class FetchError : public std::runtime_error {
public:
    explicit FetchError(const std::string& what) : std::runtime_error(what) {}
};

// The outbound request function. Call sites hold a Fetcher& so the
// caching layer can be slotted in front of the network one.
class Fetcher {
public:
    virtual ~Fetcher() = default;
    virtual HttpResponse fetch(const HttpRequest& req) = 0;
};

std::string canonical_url(const std::string& url);
std::uint64_t estimate_size(const HttpResponse& resp);
