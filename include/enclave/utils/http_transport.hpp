/**
 * @file http_transport.hpp
 * @brief Minimal HTTP client seam with a libcurl implementation
 *
 * The remote sandbox backend and the host-side web tools talk HTTP through
 * the HttpTransport interface so tests can substitute a scripted fake.
 * CurlHttpTransport polls HttpRequest::should_abort from libcurl's progress
 * callback; an aborted transfer returns immediately with aborted = true.
 *
 * @date 2026
 */

#pragma once

#include <chrono>
#include <functional>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>

namespace enclave {
namespace utils {

/**
 * @struct MultipartFile
 * @brief Single file part of a multipart/form-data upload
 */
struct MultipartFile {
    std::string field_name{"file"};
    std::string file_name;
    std::string content;
};

/**
 * @struct HttpRequest
 */
struct HttpRequest {
    std::string method{"GET"};                          ///< GET, POST, DELETE, ...
    std::string url;
    std::map<std::string, std::string> headers;
    std::string body;                                   ///< Raw body (ignored when upload is set)
    std::optional<MultipartFile> upload;                ///< multipart/form-data body
    std::chrono::milliseconds timeout{30000};           ///< Whole-transfer timeout
    std::function<bool()> should_abort;                 ///< Polled during the transfer
};

/**
 * @struct HttpResponse
 */
struct HttpResponse {
    long status{0};
    std::string body;
    bool aborted{false};                                ///< should_abort fired

    bool Ok() const { return !aborted && status >= 200 && status < 300; }
};

/**
 * @class TransportError
 * @brief Connection, TLS or timeout failure (no HTTP status available)
 */
class TransportError : public std::runtime_error {
public:
    explicit TransportError(const std::string& message, bool timed_out = false)
        : std::runtime_error(message), timed_out_(timed_out) {}

    bool TimedOut() const { return timed_out_; }

private:
    bool timed_out_;
};

/**
 * @class HttpTransport
 * @brief Synchronous request/response interface
 */
class HttpTransport {
public:
    virtual ~HttpTransport() = default;

    /**
     * @brief Perform one request
     * @throws TransportError when no response could be obtained
     */
    virtual HttpResponse Send(const HttpRequest& request) = 0;
};

/**
 * @class CurlHttpTransport
 * @brief libcurl easy-interface implementation
 *
 * **Usage Example**:
 * @code
 * CurlHttpTransport http;
 * HttpRequest request;
 * request.method = "POST";
 * request.url = "https://api.tavily.com/search";
 * request.headers["Content-Type"] = "application/json";
 * request.body = payload.dump();
 *
 * auto response = http.Send(request);
 * @endcode
 *
 * Each Send() uses its own easy handle, so one instance may be shared by
 * concurrent runs.
 */
class CurlHttpTransport : public HttpTransport {
public:
    CurlHttpTransport();

    HttpResponse Send(const HttpRequest& request) override;
};

} // namespace utils
} // namespace enclave
