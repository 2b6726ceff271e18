// include/CurlFetcher.hpp
#pragma once
#include "HttpTypes.hpp"

// Network request function on libcurl. One easy handle per call, so it is
// safe to use from several prewarm workers at once.
class CurlFetcher : public Fetcher {
public:
    explicit CurlFetcher(long timeout_sec = 30) : timeout_sec_(timeout_sec) {}

    HttpResponse fetch(const HttpRequest& req) override;

    // curl_global_init / cleanup; call once from main.
    static bool global_init();
    static void global_cleanup();

private:
    long timeout_sec_;
};
