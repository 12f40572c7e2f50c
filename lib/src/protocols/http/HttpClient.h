#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <vector>

/**
 * HttpClient
 *
 * Small libcurl wrapper used to pull cover art for tagging.
 *
 * Features:
 * - Thread-safe curl handle management (one reused handle, guarded by a mutex)
 * - Redirect following and a hard request timeout
 * - Content-type detection from magic bytes when the server sends none
 */
class HttpClient {
public:
    using LogCallback = std::function<void(const std::string& message)>;

    struct Config {
        int timeout_ms = 30000;                  // whole-request timeout
        long max_body_bytes = 16 * 1024 * 1024;  // artwork larger than this is refused
        std::string user_agent = "PodSync/1.0";
    };

    struct Response {
        int status_code = 0;                     // 0 when the transfer itself failed
        std::string error;                       // curl error text, empty on transfer success
        std::vector<uint8_t> body;
        std::map<std::string, std::string> headers;

        bool ok() const { return error.empty() && status_code >= 200 && status_code < 300; }
        std::string ContentType() const;
    };

    /**
     * Constructor
     * @param config Request settings
     * @param log_callback Optional log sink
     * @throws std::runtime_error if libcurl cannot be initialized
     */
    explicit HttpClient(const Config& config, LogCallback log_callback = nullptr);

    /**
     * Destructor - cleanup libcurl resources
     */
    ~HttpClient();

    // Non-copyable
    HttpClient(const HttpClient&) = delete;
    HttpClient& operator=(const HttpClient&) = delete;

    /**
     * Perform HTTP GET request
     * @param url Full URL to request
     * @return Response; check ok() before using the body
     */
    Response Get(const std::string& url);

    /**
     * Detect content type from response data
     * @param data Response body
     * @return "image/jpeg", "image/png" or "application/octet-stream"
     */
    static std::string DetectContentType(const std::vector<uint8_t>& data);

    const Config& GetConfig() const { return config_; }

private:
    void Log(const std::string& message);

    Config config_;
    LogCallback log_callback_;

    // libcurl handle (reused across requests)
    void* curl_handle_ = nullptr;  // CURL*
    std::mutex curl_mutex_;
};
