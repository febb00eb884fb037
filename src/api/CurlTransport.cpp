#include "api/ApiException.h"
#include "api/HttpTransport.h"

#include <curl/curl.h>
#include <memory>

namespace {
    constexpr auto USER_AGENT{"parkwait/1.0"};

    size_t appendBody(char *data, size_t size, size_t count, void *userdata) {
        auto *body = static_cast<std::string *>(userdata);
        body->append(data, size * count);
        return size * count;
    }

    struct EasyDeleter {
        void operator()(CURL *handle) const { curl_easy_cleanup(handle); }
    };
}

CurlGlobal::CurlGlobal() {
    if (curl_global_init(CURL_GLOBAL_ALL) != CURLE_OK) {
        throw api_exception("curl_global_init failed");
    }
}

CurlGlobal::~CurlGlobal() {
    curl_global_cleanup();
}

CurlTransport::CurlTransport(long timeoutSeconds) : timeoutSeconds_{timeoutSeconds} {
}

HttpResponse CurlTransport::get(const std::string &url) {
    std::unique_ptr<CURL, EasyDeleter> handle(curl_easy_init());
    if (!handle) {
        throw api_exception("curl_easy_init failed");
    }

    HttpResponse response;
    CURL *curl = handle.get();
    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, timeoutSeconds_);
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_USERAGENT, USER_AGENT);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, appendBody);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response.body);

    const CURLcode rc = curl_easy_perform(curl);
    if (rc != CURLE_OK) {
        if (rc == CURLE_OPERATION_TIMEDOUT) {
            throw api_exception("Timeout fetching " + url);
        }
        throw api_exception(std::string("Request error: ") + curl_easy_strerror(rc));
    }
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &response.status);
    return response;
}
