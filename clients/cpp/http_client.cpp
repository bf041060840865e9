/**
 * @file http_client.cpp
 * @brief libcurl implementation of HttpClient
 */

#include "http_client.hpp"

#include <curl/curl.h>

#include <mutex>

namespace lsquota {

static size_t write_callback(void* contents, size_t size, size_t nmemb, void* userp) {
    ((std::string*)userp)->append((char*)contents, size * nmemb);
    return size * nmemb;
}

static void global_init() {
    static std::once_flag once;
    std::call_once(once, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
    // curl_global_cleanup is never called: static destructor order is not
    // guaranteed relative to clients still alive at exit
}

// PIMPL implementation
class CurlHttpClient::Impl {
public:
    CURL* curl = nullptr;
    long timeout_ms;

    explicit Impl(std::chrono::milliseconds timeout)
        : timeout_ms(static_cast<long>(timeout.count())) {
        global_init();
    }

    ~Impl() {
        close();
    }

    void open() {
        if (curl) return;
        curl = curl_easy_init();
        if (!curl) {
            throw HttpException("Failed to initialize CURL");
        }
    }

    void close() {
        if (curl) {
            curl_easy_cleanup(curl);
            curl = nullptr;
        }
    }

    HttpResponse http_post(const std::string& url, const std::string& body,
                           const HttpHeaders& extra_headers) {
        open();

        HttpResponse response;

        curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
        curl_easy_setopt(curl, CURLOPT_POST, 1L);
        curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body.c_str());
        curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));
        curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
        curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response.data);
        curl_easy_setopt(curl, CURLOPT_HTTP_VERSION, (long)CURL_HTTP_VERSION_2TLS);
        curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, 0L);
        curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, 0L);
        curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, timeout_ms);
        curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

        struct curl_slist* headers = nullptr;
        for (const auto& header : extra_headers) {
            std::string line = header.first + ": " + header.second;
            headers = curl_slist_append(headers, line.c_str());
        }
        curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);

        CURLcode res = curl_easy_perform(curl);
        curl_easy_setopt(curl, CURLOPT_HTTPHEADER, static_cast<struct curl_slist*>(nullptr));
        curl_slist_free_all(headers);

        if (res != CURLE_OK) {
            throw HttpException(std::string("CURL error: ") + curl_easy_strerror(res));
        }

        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &response.http_code);
        return response;
    }
};

CurlHttpClient::CurlHttpClient(std::chrono::milliseconds timeout)
    : pimpl_(std::make_unique<Impl>(timeout)) {}

CurlHttpClient::~CurlHttpClient() = default;

HttpResponse CurlHttpClient::post(const std::string& url, const std::string& body,
                                  const HttpHeaders& headers) {
    return pimpl_->http_post(url, body, headers);
}

void CurlHttpClient::close() {
    pimpl_->close();
}

HttpClientFactory curl_client_factory(std::chrono::milliseconds timeout) {
    return [timeout]() -> std::unique_ptr<HttpClient> {
        return std::make_unique<CurlHttpClient>(timeout);
    };
}

} // namespace lsquota
