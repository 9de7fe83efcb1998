#pragma once

#include <curl/curl.h>
#include <map>
#include <mutex>
#include <string>

namespace quantsim {
namespace network {

struct HttpResponse {
    int status_code = 0;    // 0 for non-HTTP schemes such as file://
    std::string body;
    std::map<std::string, std::string> headers;
};

// Blocking GET over libcurl. One handle per client, guarded by a mutex.
class HttpClient {
public:
    HttpClient();
    ~HttpClient();

    HttpClient(const HttpClient&) = delete;
    HttpClient& operator=(const HttpClient&) = delete;

    // Throws std::runtime_error on transport failure
    HttpResponse get(const std::string& url);

    void setTimeoutSeconds(long seconds) { timeout_seconds_ = seconds; }

private:
    CURL* curl_;
    std::mutex mutex_;
    long timeout_seconds_ = 30;

    static size_t writeCallback(void* contents, size_t size, size_t nmemb, void* userp);
    static size_t headerCallback(char* buffer, size_t size, size_t nitems, void* userdata);
};

} // namespace network
} // namespace quantsim
