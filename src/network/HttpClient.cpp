#include "network/HttpClient.h"
#include "common/Logger.h"

#include <stdexcept>

namespace quantsim {
namespace network {

namespace {
std::string trimHeader(const std::string& s) {
    const auto begin = s.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) return "";
    const auto end = s.find_last_not_of(" \t\r\n");
    return s.substr(begin, end - begin + 1);
}
}

HttpClient::HttpClient() {
    curl_global_init(CURL_GLOBAL_ALL);
    curl_ = curl_easy_init();

    if (!curl_) {
        curl_global_cleanup();
        throw std::runtime_error("Failed to initialize CURL");
    }
}

HttpClient::~HttpClient() {
    if (curl_) {
        curl_easy_cleanup(curl_);
    }
    curl_global_cleanup();
}

HttpResponse HttpClient::get(const std::string& url) {
    std::lock_guard<std::mutex> lock(mutex_);

    HttpResponse response;
    std::string response_body;
    std::map<std::string, std::string> response_headers;

    curl_easy_reset(curl_);
    curl_easy_setopt(curl_, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl_, CURLOPT_WRITEFUNCTION, writeCallback);
    curl_easy_setopt(curl_, CURLOPT_WRITEDATA, &response_body);
    curl_easy_setopt(curl_, CURLOPT_HEADERFUNCTION, headerCallback);
    curl_easy_setopt(curl_, CURLOPT_HEADERDATA, &response_headers);
    curl_easy_setopt(curl_, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl_, CURLOPT_TIMEOUT, timeout_seconds_);

    const CURLcode res = curl_easy_perform(curl_);
    if (res != CURLE_OK) {
        throw std::runtime_error("CURL error: " + std::string(curl_easy_strerror(res)));
    }

    long http_code = 0;
    curl_easy_getinfo(curl_, CURLINFO_RESPONSE_CODE, &http_code);

    response.status_code = static_cast<int>(http_code);
    response.body = std::move(response_body);
    response.headers = std::move(response_headers);

    LOG_DEBUG("GET {} -> status {}, {} bytes", url, response.status_code, response.body.size());
    return response;
}

size_t HttpClient::writeCallback(void* contents, size_t size, size_t nmemb, void* userp) {
    const size_t total_size = size * nmemb;
    auto* response_body = static_cast<std::string*>(userp);
    response_body->append(static_cast<char*>(contents), total_size);
    return total_size;
}

size_t HttpClient::headerCallback(char* buffer, size_t size, size_t nitems, void* userdata) {
    const size_t total_size = size * nitems;
    const std::string header_line(buffer, total_size);

    const size_t colon_pos = header_line.find(':');
    if (colon_pos != std::string::npos) {
        auto* headers = static_cast<std::map<std::string, std::string>*>(userdata);
        (*headers)[trimHeader(header_line.substr(0, colon_pos))] =
            trimHeader(header_line.substr(colon_pos + 1));
    }
    return total_size;
}

} // namespace network
} // namespace quantsim
