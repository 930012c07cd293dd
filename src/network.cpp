#include <memory>
#include <mutex>
#include <type_traits>

#include <curl/curl.h>

#include <featureprobe/api.hpp>
#include <featureprobe/logging.hpp>

#include "network.hpp"

namespace fp {

static std::once_flag curlInitFlag;

std::string
userAgent()
{
    return std::string("CPP/") + FP_SDK_VERSION;
}

std::vector<std::pair<std::string, std::string>>
sharedHeaders(const std::string &serverSdkKey)
{
    return {
        {"Authorization", serverSdkKey},
        {"Content-Type", "application/json"},
        {"User-Agent", userAgent()}
    };
}

static size_t
onBody(char *const buffer, const size_t size, const size_t itemcount, void *const context)
{
    const size_t total = size * itemcount;
    static_cast<std::string *>(context)->append(buffer, total);
    return total;
}

static_assert(std::is_same<decltype(&onBody), curl_write_callback>::value,
    "CURLOPT_WRITEFUNCTION signature");

static int
onProgress(void *const context, curl_off_t, curl_off_t, curl_off_t, curl_off_t)
{
    const auto *const cancel = static_cast<const std::atomic<bool> *>(context);
    return cancel && cancel->load() ? 1 : 0;
}

static_assert(std::is_same<decltype(&onProgress), curl_xferinfo_callback>::value,
    "CURLOPT_XFERINFOFUNCTION signature");

struct CurlDeleter {
    void operator()(CURL *const curl) const { curl_easy_cleanup(curl); }
};

struct HeaderListDeleter {
    void operator()(struct curl_slist *const list) const { curl_slist_free_all(list); }
};

CurlHttpClient::CurlHttpClient()
{
    std::call_once(curlInitFlag, []() {
        if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
            FP_LOG(LogLevel::Critical, "curl_global_init failed");
        }
    });
}

HttpResponse
CurlHttpClient::get(const HttpRequest &request)
{
    return perform(request, false);
}

HttpResponse
CurlHttpClient::post(const HttpRequest &request)
{
    return perform(request, true);
}

HttpResponse
CurlHttpClient::perform(const HttpRequest &request, const bool isPost)
{
    HttpResponse response;
    std::unique_ptr<CURL, CurlDeleter> curl(curl_easy_init());
    std::unique_ptr<struct curl_slist, HeaderListDeleter> headers;

    if (!curl) {
        response.error = "curl_easy_init failed";
        return response;
    }

    for (const auto &header : request.headers) {
        const std::string line = header.first + ": " + header.second;
        struct curl_slist *const appended = curl_slist_append(headers.get(), line.c_str());
        if (!appended) {
            response.error = "curl_slist_append failed";
            return response;
        }
        headers.release();
        headers.reset(appended);
    }

    CURL *const handle = curl.get();

    if (curl_easy_setopt(handle, CURLOPT_URL, request.url.c_str()) != CURLE_OK ||
        curl_easy_setopt(handle, CURLOPT_HTTPHEADER, headers.get()) != CURLE_OK ||
        curl_easy_setopt(handle, CURLOPT_NOSIGNAL, 1L) != CURLE_OK ||
        curl_easy_setopt(handle, CURLOPT_WRITEFUNCTION, onBody) != CURLE_OK ||
        curl_easy_setopt(handle, CURLOPT_WRITEDATA, &response.body) != CURLE_OK ||
        curl_easy_setopt(handle, CURLOPT_NOPROGRESS, 0L) != CURLE_OK ||
        curl_easy_setopt(handle, CURLOPT_XFERINFOFUNCTION, onProgress) != CURLE_OK ||
        curl_easy_setopt(handle, CURLOPT_XFERINFODATA,
            static_cast<void *>(const_cast<std::atomic<bool> *>(request.cancel))) != CURLE_OK)
    {
        response.error = "failed to configure request";
        return response;
    }

    if (request.timeout.count() > 0 &&
        curl_easy_setopt(handle, CURLOPT_TIMEOUT_MS, static_cast<long>(request.timeout.count())) != CURLE_OK)
    {
        response.error = "failed to set timeout";
        return response;
    }

    if (isPost) {
        if (curl_easy_setopt(handle, CURLOPT_POSTFIELDSIZE, static_cast<long>(request.body.size())) != CURLE_OK ||
            curl_easy_setopt(handle, CURLOPT_POSTFIELDS, request.body.c_str()) != CURLE_OK)
        {
            response.error = "failed to set request body";
            return response;
        }
    }

    const CURLcode result = curl_easy_perform(handle);
    if (result != CURLE_OK) {
        response.error = curl_easy_strerror(result);
        return response;
    }

    if (curl_easy_getinfo(handle, CURLINFO_RESPONSE_CODE, &response.status) != CURLE_OK) {
        response.error = "failed to read response code";
    }

    return response;
}

std::shared_ptr<HttpClient>
makeCurlHttpClient()
{
    return std::make_shared<CurlHttpClient>();
}

} // namespace fp
