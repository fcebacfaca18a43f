#pragma once

#include <curl/curl.h>
#include <exception>
#include <functional>
#include <stdexcept>
#include <string>

namespace usync::util {

void ensureCurlGlobalInit();

class CurlEasy {
public:
    CurlEasy() : h_(curl_easy_init()) {
        if (!h_) throw std::runtime_error("curl_easy_init failed");
        curl_easy_setopt(h_, CURLOPT_NOPROGRESS, 1L);
        curl_easy_setopt(h_, CURLOPT_FOLLOWLOCATION, 1L);
        curl_easy_setopt(h_, CURLOPT_FAILONERROR, 0L);
    }
    ~CurlEasy() { curl_easy_cleanup(h_); }

    CurlEasy(const CurlEasy&) = delete;
    CurlEasy& operator=(const CurlEasy&) = delete;

    operator CURL*()       { return h_; }
    operator const CURL*() const { return h_; }

private:
    CURL* h_;
};

struct HttpResponse {
    CURLcode curl  = CURLE_OK;
    long     http  = 0;
    std::string error;         // curl's error buffer when curl != CURLE_OK
    bool ok() const { return curl == CURLE_OK && http < 400; }
};

// Receives body bytes as they arrive; throwing aborts the transfer
using BodySink = std::function<void(const char*, size_t)>;

// GET url, streaming the body into sink. Bodies of error responses are discarded.
template <class SetupFn>
HttpResponse performCurl(const std::string& url, const BodySink& sink, SetupFn&& setup) {
    ensureCurlGlobalInit();
    CurlEasy h;

    struct Ctx {
        CURL* handle;
        const BodySink* sink;
        std::exception_ptr failure;
    } ctx{h, &sink, nullptr};

    char errBuf[CURL_ERROR_SIZE] = {0};

    curl_easy_setopt(h, CURLOPT_URL, url.c_str());
    curl_easy_setopt(h, CURLOPT_ERRORBUFFER, errBuf);
    curl_easy_setopt(h, CURLOPT_WRITEFUNCTION, +[](char* p, size_t s, size_t n, void* ud) -> size_t {
        auto* c = static_cast<Ctx*>(ud);
        long code = 0;
        curl_easy_getinfo(c->handle, CURLINFO_RESPONSE_CODE, &code);
        if (code >= 400) return s * n;
        try {
            (*c->sink)(p, s * n);
        } catch (const std::exception&) {
            c->failure = std::current_exception();
            return 0; // aborts with CURLE_WRITE_ERROR
        }
        return s * n;
    });
    curl_easy_setopt(h, CURLOPT_WRITEDATA, &ctx);

    setup(h);

    HttpResponse r;
    r.curl = curl_easy_perform(h);
    if (ctx.failure) std::rethrow_exception(ctx.failure);
    curl_easy_getinfo(h, CURLINFO_RESPONSE_CODE, &r.http);
    if (r.curl != CURLE_OK) r.error = errBuf[0] ? errBuf : curl_easy_strerror(r.curl);
    return r;
}

inline HttpResponse performCurl(const std::string& url, const BodySink& sink) {
    return performCurl(url, sink, [](CURL*) {});
}

}
