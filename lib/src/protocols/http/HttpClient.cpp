#include "HttpClient.h"
#include <curl/curl.h>
#include <algorithm>
#include <cctype>
#include <stdexcept>

// libcurl write callback - accumulates response body
static size_t WriteCallback(void* contents, size_t size, size_t nmemb, void* userp) {
    size_t total_size = size * nmemb;
    auto* buffer = static_cast<std::vector<uint8_t>*>(userp);
    const auto* bytes = static_cast<const uint8_t*>(contents);
    buffer->insert(buffer->end(), bytes, bytes + total_size);
    return total_size;
}

// libcurl header callback - captures response headers, keys lowercased
static size_t HeaderCallback(char* buffer, size_t size, size_t nitems, void* userp) {
    size_t total_size = size * nitems;
    auto* headers = static_cast<std::map<std::string, std::string>*>(userp);

    std::string header_line(buffer, total_size);
    while (!header_line.empty() &&
           (header_line.back() == '\r' || header_line.back() == '\n')) {
        header_line.pop_back();
    }

    size_t colon_pos = header_line.find(':');
    if (colon_pos == std::string::npos) {
        return total_size;
    }

    std::string key = header_line.substr(0, colon_pos);
    std::transform(key.begin(), key.end(), key.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    std::string value = header_line.substr(colon_pos + 1);
    size_t first = value.find_first_not_of(" \t");
    value = (first == std::string::npos) ? "" : value.substr(first);

    (*headers)[key] = value;
    return total_size;
}

std::string HttpClient::Response::ContentType() const {
    auto it = headers.find("content-type");
    if (it != headers.end() && !it->second.empty()) {
        std::string type = it->second.substr(0, it->second.find(';'));
        std::transform(type.begin(), type.end(), type.begin(),
                       [](unsigned char c) { return std::tolower(c); });
        return type;
    }
    return DetectContentType(body);
}

HttpClient::HttpClient(const Config& config, LogCallback log_callback)
    : config_(config), log_callback_(std::move(log_callback)) {

    curl_handle_ = curl_easy_init();
    if (!curl_handle_) {
        throw std::runtime_error("Failed to initialize libcurl");
    }
}

HttpClient::~HttpClient() {
    if (curl_handle_) {
        curl_easy_cleanup(static_cast<CURL*>(curl_handle_));
    }
}

HttpClient::Response HttpClient::Get(const std::string& url) {
    std::lock_guard<std::mutex> lock(curl_mutex_);

    Response response;
    CURL* curl = static_cast<CURL*>(curl_handle_);

    curl_easy_reset(curl);
    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, WriteCallback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response.body);
    curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, HeaderCallback);
    curl_easy_setopt(curl, CURLOPT_HEADERDATA, &response.headers);
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_USERAGENT, config_.user_agent.c_str());
    curl_easy_setopt(curl, CURLOPT_MAXFILESIZE, config_.max_body_bytes);

    long timeout_ms = config_.timeout_ms > 0 ? config_.timeout_ms : 30000;
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, timeout_ms);

    CURLcode res = curl_easy_perform(curl);
    if (res != CURLE_OK) {
        response.error = curl_easy_strerror(res);
        response.body.clear();
        Log("libcurl error: " + response.error + " (" + url + ")");
        return response;
    }

    long http_code = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &http_code);
    response.status_code = static_cast<int>(http_code);

    Log("HTTP " + std::to_string(http_code) + " (" +
        std::to_string(response.body.size()) + " bytes) from " + url);
    return response;
}

std::string HttpClient::DetectContentType(const std::vector<uint8_t>& data) {
    if (data.size() < 4) {
        return "application/octet-stream";
    }

    // JPEG magic bytes (0xFF 0xD8)
    if (data[0] == 0xFF && data[1] == 0xD8) {
        return "image/jpeg";
    }

    // PNG magic bytes
    if (data[0] == 0x89 && data[1] == 'P' && data[2] == 'N' && data[3] == 'G') {
        return "image/png";
    }

    return "application/octet-stream";
}

void HttpClient::Log(const std::string& message) {
    if (log_callback_) {
        log_callback_("[HttpClient] " + message);
    }
}
