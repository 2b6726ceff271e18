#include "CurlFetcher.hpp"

#include <algorithm>
#include <cctype>
#include <memory>
#include <curl/curl.h>


// Desc: libcurl body callback appending into a std::string
// In: char* data, size_t size, size_t nmemb, void* userp
// Out: size_t (bytes consumed)
static size_t on_body(char* data, size_t size, size_t nmemb, void* userp) {
    auto* out = static_cast<std::string*>(userp);
    out->append(data, size * nmemb);
    return size * nmemb;
}

// Desc: libcurl header callback; keeps the last response's headers only
// In: char* data, size_t size, size_t nitems, void* userp
// Out: size_t
static size_t on_header(char* data, size_t size, size_t nitems, void* userp) {
    auto* headers = static_cast<std::map<std::string, std::string>*>(userp);
    const size_t len = size * nitems;
    std::string line(data, len);

    // A new status line starts a new header block (redirects).
    if (line.rfind("HTTP/", 0) == 0) {
        headers->clear();
        return len;
    }

    auto colon = line.find(':');
    if (colon == std::string::npos) return len;

    std::string name = line.substr(0, colon);
    std::string value = line.substr(colon + 1);
    for (char& c : name) c = (char)std::tolower((unsigned char)c);
    auto not_space = [](unsigned char c){ return !std::isspace(c); };
    value.erase(value.begin(), std::find_if(value.begin(), value.end(), not_space));
    value.erase(std::find_if(value.rbegin(), value.rend(), not_space).base(), value.end());
    (*headers)[name] = value;
    return len;
}


bool CurlFetcher::global_init() {
    return curl_global_init(CURL_GLOBAL_DEFAULT) == CURLE_OK;
}

void CurlFetcher::global_cleanup() {
    curl_global_cleanup();
}


// Desc: perform one blocking HTTP request
// In: const HttpRequest& req
// Out: HttpResponse; throws FetchError on transport failure
HttpResponse CurlFetcher::fetch(const HttpRequest& req) {
    std::unique_ptr<CURL, void(*)(CURL*)> curl(curl_easy_init(), curl_easy_cleanup);
    if (!curl) throw FetchError("curl_easy_init failed");

    HttpResponse resp;
    std::unique_ptr<curl_slist, void(*)(curl_slist*)> hdrs(nullptr, curl_slist_free_all);
    for (const auto& [name, value] : req.headers) {
        const std::string line = name + ": " + value;
        curl_slist* next = curl_slist_append(hdrs.get(), line.c_str());
        if (!next) throw FetchError("curl_slist_append failed");
        (void)hdrs.release();
        hdrs.reset(next);
    }

    CURL* h = curl.get();
    curl_easy_setopt(h, CURLOPT_URL, req.url.c_str());
    curl_easy_setopt(h, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(h, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(h, CURLOPT_TIMEOUT, timeout_sec_);
    curl_easy_setopt(h, CURLOPT_WRITEFUNCTION, on_body);
    curl_easy_setopt(h, CURLOPT_WRITEDATA, &resp.body);
    curl_easy_setopt(h, CURLOPT_HEADERFUNCTION, on_header);
    curl_easy_setopt(h, CURLOPT_HEADERDATA, &resp.headers);
    if (hdrs) curl_easy_setopt(h, CURLOPT_HTTPHEADER, hdrs.get());

    if (req.method == "HEAD") {
        curl_easy_setopt(h, CURLOPT_NOBODY, 1L);
    } else if (req.method != "GET") {
        curl_easy_setopt(h, CURLOPT_CUSTOMREQUEST, req.method.c_str());
    }
    if (!req.body.empty()) {
        curl_easy_setopt(h, CURLOPT_POSTFIELDS, req.body.data());
        curl_easy_setopt(h, CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(req.body.size()));
    }

    const CURLcode rc = curl_easy_perform(h);
    if (rc != CURLE_OK) {
        throw FetchError(req.url + ": " + curl_easy_strerror(rc));
    }

    long status = 0;
    curl_easy_getinfo(h, CURLINFO_RESPONSE_CODE, &status);
    resp.status = static_cast<int>(status);
    return resp;
}
