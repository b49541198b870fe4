// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 Niels Martignène <niels.martignene@protonmail.com>

#include "lib/native/base/base.hh"
#include "http.hh"

#if defined(_WIN32)
    #if !defined(NOMINMAX)
        #define NOMINMAX
    #endif
    #if !defined(WIN32_LEAN_AND_MEAN)
        #define WIN32_LEAN_AND_MEAN
    #endif
#else
    #include <fcntl.h>
#endif
#include <curl/curl.h>

namespace LM {

// Control plane answers are tiny, anything bigger is garbage
static const Size MaxResponseSize = Kibibytes(64);

class CurlClient: public lm_HttpClient {
    std::mutex connections_mutex;
    HeapArray<CURL *> connections;

public:
    ~CurlClient();

    int Perform(lm_HttpMethod method, const char *url, Span<const char> body,
                HeapArray<uint8_t> *out_body) override;

private:
    CURL *ReserveConnection();
    void ReleaseConnection(CURL *curl);
};

static bool ResetConnection(CURL *curl)
{
    curl_easy_reset(curl);

    bool success = true;

    // The control plane lives on the loopback interface, proxies would only get in the way
    success &= !curl_easy_setopt(curl, CURLOPT_NOPROXY, "*");
    success &= !curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, 10000L);
    success &= !curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, 60000L);
    success &= !curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

#if !defined(_WIN32)
    // curl_easy_setopt is variadic, the + forces the conversion to a C function pointer
    success &= !curl_easy_setopt(curl, CURLOPT_SOCKOPTFUNCTION, +[](void *, curl_socket_t fd, curlsocktype) {
        fcntl(fd, F_SETFD, FD_CLOEXEC);
        return (int)CURL_SOCKOPT_OK;
    });
#endif

    if (!success) {
        LogError("Failed to set libcurl options");
        return false;
    }

    return true;
}

CurlClient::~CurlClient()
{
    for (CURL *curl: connections) {
        curl_easy_cleanup(curl);
    }
}

int CurlClient::Perform(lm_HttpMethod method, const char *url, Span<const char> body,
                        HeapArray<uint8_t> *out_body)
{
    CURL *curl = ReserveConnection();
    if (!curl)
        return -1;
    LM_DEFER { ReleaseConnection(curl); };

    curl_slist *headers = nullptr;
    LM_DEFER { curl_slist_free_all(headers); };

    struct WriteContext {
        HeapArray<uint8_t> *out;
        bool overflow;
    };
    WriteContext ctx = { out_body, false };

    bool success = true;

    success &= !curl_easy_setopt(curl, CURLOPT_URL, url);

    switch (method) {
        case lm_HttpMethod::Get: { success &= !curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L); } break;
        case lm_HttpMethod::Post: { success &= !curl_easy_setopt(curl, CURLOPT_POST, 1L); } break;

        // Body carrying PUT and DELETE requests go through POSTFIELDS with a custom verb
        case lm_HttpMethod::Put:
        case lm_HttpMethod::Delete: {
            success &= !curl_easy_setopt(curl, CURLOPT_CUSTOMREQUEST, lm_HttpMethodNames[(int)method]);
        } break;
    }

    if (method != lm_HttpMethod::Get) {
        success &= !curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body.len ? body.ptr : "");
        success &= !curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE_LARGE, (curl_off_t)body.len);

        if (body.len) {
            headers = curl_slist_append(headers, "Content-Type: application/json");
            if (!headers)
                LM_BAD_ALLOC();
        }
    }
    success &= !curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);

    success &= !curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, +[](char *ptr, size_t, size_t nmemb, void *udata) {
        WriteContext *ctx = (WriteContext *)udata;

        if (ctx->out->len + (Size)nmemb > MaxResponseSize) {
            ctx->overflow = true;
            return (size_t)0;
        }

        Span<const uint8_t> buf = MakeSpan((const uint8_t *)ptr, (Size)nmemb);
        ctx->out->Append(buf);

        return nmemb;
    });
    success &= !curl_easy_setopt(curl, CURLOPT_WRITEDATA, &ctx);

    if (!success) {
        LogError("Failed to set libcurl options");
        return -1;
    }

    CURLcode res = curl_easy_perform(curl);
    LogDebug("Curl: %1 %2", lm_HttpMethodNames[(int)method], url);

    if (ctx.overflow) {
        LogError("Response from '%1' exceeds %2 bytes", url, MaxResponseSize);
        return -1;
    }
    if (res != CURLE_OK) {
        LogError("Failed to perform %1 call: %2", lm_HttpMethodNames[(int)method], curl_easy_strerror(res));
        return -res;
    }

    long status = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status);

    return (int)status;
}

CURL *CurlClient::ReserveConnection()
{
    // Reuse existing connection
    {
        std::lock_guard<std::mutex> lock(connections_mutex);

        if (connections.len) {
            CURL *curl = connections.ptr[--connections.len];
            return curl;
        }
    }

    CURL *curl = curl_easy_init();
    if (!curl)
        LM_BAD_ALLOC();

    if (!ResetConnection(curl)) {
        curl_easy_cleanup(curl);
        return nullptr;
    }

    return curl;
}

void CurlClient::ReleaseConnection(CURL *curl)
{
    if (!ResetConnection(curl)) {
        curl_easy_cleanup(curl);
        return;
    }

    std::lock_guard<std::mutex> lock(connections_mutex);
    connections.Append(curl);
}

std::unique_ptr<lm_HttpClient> lm_CreateCurlClient()
{
    std::unique_ptr<lm_HttpClient> http = std::make_unique<CurlClient>();
    return http;
}

static Span<const char> GetUrlPart(CURLU *h, CURLUPart part, Allocator *alloc)
{
    char *buf = nullptr;

    CURLUcode ret = curl_url_get(h, part, &buf, 0);
    if (ret == CURLUE_OUT_OF_MEMORY)
        LM_BAD_ALLOC();
    LM_DEFER { curl_free(buf); };

    if (!buf || !buf[0])
        return {};

    return DuplicateString(buf, alloc);
}

bool lm_CheckHttpAddress(const char *address)
{
    CURLU *h = curl_url();
    if (!h)
        LM_BAD_ALLOC();
    LM_DEFER { curl_url_cleanup(h); };

    if (curl_url_set(h, CURLUPART_URL, address, 0) != CURLUE_OK) {
        LogError("Malformed session address '%1'", address);
        return false;
    }

    BlockAllocator temp_alloc;

    Span<const char> scheme = GetUrlPart(h, CURLUPART_SCHEME, &temp_alloc);
    Span<const char> host = GetUrlPart(h, CURLUPART_HOST, &temp_alloc);

    if (scheme != "http" && scheme != "https") {
        LogError("Unsupported scheme in session address '%1'", address);
        return false;
    }
    if (!host.len) {
        LogError("Missing host in session address '%1'", address);
        return false;
    }

    return true;
}

LM_INIT(curl)
{
    LM_CRITICAL(!curl_global_init(CURL_GLOBAL_ALL), "Failed to initialize libcurl");
}

LM_EXIT(curl)
{
    curl_global_cleanup();
}

}
