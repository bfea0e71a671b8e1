// EN: Minimal libcurl client used for dependency health checks and webhook notifications.
// FR: Client libcurl minimal utilisé pour les contrôles de santé des dépendances et les notifications webhook.

#pragma once

#include <map>
#include <string>

namespace OBF {

// EN: Structure representing an HTTP response.
// FR: Structure représentant une réponse HTTP.
struct HttpResponse {
    long status = 0;
    std::map<std::string, std::string> headers;
    std::string body;
    long elapsed_ms = 0;

    bool isSuccess() const { return status >= 200 && status < 300; }
};

// EN: Blocking HTTP client with per-request timeouts. Throws std::runtime_error on transport failure.
// FR: Client HTTP bloquant avec timeouts par requête. Lève std::runtime_error en cas d'échec de transport.
class HttpClient {
public:
    HttpClient(long connect_timeout_ms, long request_timeout_ms);

    // EN: Performs a GET request.
    // FR: Effectue une requête GET.
    HttpResponse get(const std::string& url, const std::map<std::string, std::string>& headers = {}) const;

    // EN: Performs a HEAD request.
    // FR: Effectue une requête HEAD.
    HttpResponse head(const std::string& url, const std::map<std::string, std::string>& headers = {}) const;

    // EN: Performs a POST request with the given body.
    // FR: Effectue une requête POST avec le corps donné.
    HttpResponse post(const std::string& url, const std::string& body,
                      const std::map<std::string, std::string>& headers = {}) const;

private:
    HttpResponse perform(const std::string& method, const std::string& url, const std::string* body,
                         const std::map<std::string, std::string>& headers) const;

    long connect_timeout_ms_;
    long request_timeout_ms_;
};

} // namespace OBF
