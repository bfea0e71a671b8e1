// EN: Implementation of the HttpClient class over curl_easy.
// FR: Implémentation de la classe HttpClient sur curl_easy.

#include "infrastructure/networking/http_client.hpp"

#include <chrono>
#include <memory>
#include <mutex>
#include <stdexcept>

#include <curl/curl.h>

namespace OBF {

namespace {

// EN: Callback for writing response body.
// FR: Callback pour écrire le corps de la réponse.
size_t writeCallback(void* contents, size_t size, size_t nmemb, void* userp) {
    auto* body = static_cast<std::string*>(userp);
    const size_t total = size * nmemb;
    body->append(static_cast<char*>(contents), total);
    return total;
}

// EN: Callback for parsing response headers.
// FR: Callback pour parser les headers de la réponse.
size_t headerCallback(char* buffer, size_t size, size_t nitems, void* userdata) {
    const size_t total = size * nitems;
    auto* headers = static_cast<std::map<std::string, std::string>*>(userdata);
    std::string line(buffer, total);
    auto pos = line.find(':');
    if (pos != std::string::npos) {
        std::string key = line.substr(0, pos);
        std::string value = line.substr(pos + 1);
        key.erase(key.find_last_not_of(" \r\n") + 1);
        value.erase(0, value.find_first_not_of(" \r\n"));
        value.erase(value.find_last_not_of(" \r\n") + 1);
        headers->insert({key, value});
    }
    return total;
}

struct CurlDeleter {
    void operator()(CURL* curl) const { curl_easy_cleanup(curl); }
};

struct SlistDeleter {
    void operator()(curl_slist* list) const { curl_slist_free_all(list); }
};

std::once_flag curl_init_flag;

} // namespace

// EN: Constructor. Initializes timeouts and CURL once per process.
// FR: Constructeur. Initialise les timeouts et CURL une fois par processus.
HttpClient::HttpClient(long connect_timeout_ms, long request_timeout_ms)
    : connect_timeout_ms_(connect_timeout_ms), request_timeout_ms_(request_timeout_ms) {
    std::call_once(curl_init_flag, []() { curl_global_init(CURL_GLOBAL_ALL); });
}

HttpResponse HttpClient::get(const std::string& url, const std::map<std::string, std::string>& headers) const {
    return perform("GET", url, nullptr, headers);
}

HttpResponse HttpClient::head(const std::string& url, const std::map<std::string, std::string>& headers) const {
    return perform("HEAD", url, nullptr, headers);
}

HttpResponse HttpClient::post(const std::string& url, const std::string& body,
                              const std::map<std::string, std::string>& headers) const {
    return perform("POST", url, &body, headers);
}

HttpResponse HttpClient::perform(const std::string& method, const std::string& url, const std::string* body,
                                 const std::map<std::string, std::string>& headers) const {
    std::unique_ptr<CURL, CurlDeleter> curl(curl_easy_init());
    if (!curl) {
        throw std::runtime_error("CURL init failed");
    }

    HttpResponse response;
    curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT_MS, connect_timeout_ms_);
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT_MS, request_timeout_ms_);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, writeCallback);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &response.body);
    curl_easy_setopt(curl.get(), CURLOPT_HEADERFUNCTION, headerCallback);
    curl_easy_setopt(curl.get(), CURLOPT_HEADERDATA, &response.headers);

    if (method == "HEAD") {
        curl_easy_setopt(curl.get(), CURLOPT_NOBODY, 1L);
    } else if (method == "POST" && body) {
        curl_easy_setopt(curl.get(), CURLOPT_POST, 1L);
        curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, body->c_str());
        curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE, static_cast<long>(body->size()));
    }

    curl_slist* raw_list = nullptr;
    for (const auto& [key, value] : headers) {
        const std::string line = key + ": " + value;
        raw_list = curl_slist_append(raw_list, line.c_str());
    }
    std::unique_ptr<curl_slist, SlistDeleter> header_list(raw_list);
    curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, header_list.get());

    char error_buffer[CURL_ERROR_SIZE] = {0};
    curl_easy_setopt(curl.get(), CURLOPT_ERRORBUFFER, error_buffer);

    const auto start = std::chrono::steady_clock::now();
    const CURLcode res = curl_easy_perform(curl.get());
    const auto end = std::chrono::steady_clock::now();
    response.elapsed_ms = static_cast<long>(
        std::chrono::duration_cast<std::chrono::milliseconds>(end - start).count());

    if (res != CURLE_OK) {
        throw std::runtime_error(method + " " + url + ": " +
                                 (error_buffer[0] ? std::string(error_buffer) : curl_easy_strerror(res)));
    }
    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &response.status);
    return response;
}

} // namespace OBF
