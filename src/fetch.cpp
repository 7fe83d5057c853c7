#include "fetch.hpp"

#include <memory>
#include <mutex>

#include <curl/curl.h>

#include "config.hpp"
#include "guard.hpp"

namespace ptndle::fetch {

namespace {
    struct CurlDeleter {
        void operator()(CURL* handle) const noexcept { curl_easy_cleanup(handle); }
    };
    using CurlHandle = std::unique_ptr<CURL, CurlDeleter>;

    void initGlobal() {
        static std::once_flag flag;
        static CURLcode status = CURLE_OK;
        std::call_once(flag, []() { status = curl_global_init(CURL_GLOBAL_DEFAULT); });
        guard::runtimeGuard<guard::FetchError>(status == CURLE_OK, "curl_global_init failed: {}", curl_easy_strerror(status));
    }

    // Appends each received chunk to the std::string passed as userp
    size_t writeCallback(char* contents, size_t size, size_t nmemb, void* userp) {
        const size_t realSize = size * nmemb;
        auto* body = static_cast<std::string*>(userp);
        try {
            body->append(contents, realSize);
        } catch (const std::bad_alloc&) {
            return 0;  // Signals an error to curl, aborting the transfer
        }
        return realSize;
    }
}  // namespace

std::string fetchUrl(const std::string& url) {
    initGlobal();

    CurlHandle curl{curl_easy_init()};
    if (!curl) guard::formatError<guard::FetchError>("failed to create a curl handle");

    std::string body;
    char errorBuffer[CURL_ERROR_SIZE] = {};
    curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, writeCallback);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, static_cast<void*>(&body));
    curl_easy_setopt(curl.get(), CURLOPT_ERRORBUFFER, errorBuffer);
    curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_FAILONERROR, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT, config::FETCH_TIMEOUT_SECONDS);
    curl_easy_setopt(curl.get(), CURLOPT_USERAGENT, "ptndle-cli");

    const CURLcode res = curl_easy_perform(curl.get());
    if (res != CURLE_OK) {
        guard::formatError<guard::FetchError>("{} ({})", curl_easy_strerror(res), static_cast<const char*>(errorBuffer));
    }
    return body;
}

}  // namespace ptndle::fetch
