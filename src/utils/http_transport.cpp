/**
 * @file http_transport.cpp
 * @brief libcurl-backed HttpTransport
 *
 * @date 2026
 */

#include "enclave/utils/http_transport.hpp"

#include <curl/curl.h>
#include <spdlog/spdlog.h>

#include <memory>
#include <mutex>

namespace enclave {
namespace utils {

namespace {

struct CurlEasyDeleter {
    void operator()(CURL* handle) const { curl_easy_cleanup(handle); }
};

struct CurlSlistDeleter {
    void operator()(curl_slist* list) const { curl_slist_free_all(list); }
};

struct CurlMimeDeleter {
    void operator()(curl_mime* mime) const { curl_mime_free(mime); }
};

using CurlHandle = std::unique_ptr<CURL, CurlEasyDeleter>;
using CurlHeaders = std::unique_ptr<curl_slist, CurlSlistDeleter>;
using CurlMime = std::unique_ptr<curl_mime, CurlMimeDeleter>;

size_t WriteCallback(char* data, size_t size, size_t nmemb, void* userp) {
    auto* out = static_cast<std::string*>(userp);
    out->append(data, size * nmemb);
    return size * nmemb;
}

struct ProgressState {
    const std::function<bool()>* should_abort{nullptr};
    bool aborted{false};
};

int ProgressCallback(void* clientp, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    auto* state = static_cast<ProgressState*>(clientp);
    if (state->should_abort != nullptr && *state->should_abort && (*state->should_abort)()) {
        state->aborted = true;
        return 1;  // non-zero aborts the transfer
    }
    return 0;
}

void GlobalInit() {
    static std::once_flag once;
    std::call_once(once, []() {
        curl_global_init(CURL_GLOBAL_ALL);
    });
}

} // anonymous namespace

CurlHttpTransport::CurlHttpTransport() {
    GlobalInit();
}

HttpResponse CurlHttpTransport::Send(const HttpRequest& request) {
    CurlHandle curl(curl_easy_init());
    if (!curl) {
        throw TransportError("curl_easy_init failed");
    }

    HttpResponse response;
    ProgressState progress;
    progress.should_abort = &request.should_abort;

    curl_slist* raw_headers = nullptr;
    for (const auto& [name, value] : request.headers) {
        std::string line = name + ": " + value;
        curl_slist* appended = curl_slist_append(raw_headers, line.c_str());
        if (appended == nullptr) {
            curl_slist_free_all(raw_headers);
            throw TransportError("curl_slist_append failed");
        }
        raw_headers = appended;
    }
    CurlHeaders headers(raw_headers);

    CURL* h = curl.get();
    curl_easy_setopt(h, CURLOPT_URL, request.url.c_str());
    curl_easy_setopt(h, CURLOPT_HTTPHEADER, headers.get());
    curl_easy_setopt(h, CURLOPT_WRITEFUNCTION, WriteCallback);
    curl_easy_setopt(h, CURLOPT_WRITEDATA, &response.body);
    curl_easy_setopt(h, CURLOPT_TIMEOUT_MS, static_cast<long>(request.timeout.count()));
    curl_easy_setopt(h, CURLOPT_CONNECTTIMEOUT_MS, 15000L);
    curl_easy_setopt(h, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(h, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(h, CURLOPT_NOPROGRESS, 0L);
    curl_easy_setopt(h, CURLOPT_XFERINFOFUNCTION, ProgressCallback);
    curl_easy_setopt(h, CURLOPT_XFERINFODATA, &progress);

    CurlMime mime;
    if (request.upload.has_value()) {
        mime.reset(curl_mime_init(h));
        curl_mimepart* part = curl_mime_addpart(mime.get());
        curl_mime_name(part, request.upload->field_name.c_str());
        curl_mime_filename(part, request.upload->file_name.c_str());
        curl_mime_data(part, request.upload->content.data(), request.upload->content.size());
        curl_easy_setopt(h, CURLOPT_MIMEPOST, mime.get());
    } else if (request.method == "POST" || request.method == "PUT" || request.method == "PATCH") {
        curl_easy_setopt(h, CURLOPT_POSTFIELDS, request.body.data());
        curl_easy_setopt(h, CURLOPT_POSTFIELDSIZE, static_cast<long>(request.body.size()));
    }

    if (request.method != "GET" && request.method != "POST") {
        curl_easy_setopt(h, CURLOPT_CUSTOMREQUEST, request.method.c_str());
    }

    spdlog::debug("HTTP {} {}", request.method, request.url);

    CURLcode res = curl_easy_perform(h);

    if (progress.aborted) {
        response.aborted = true;
        return response;
    }
    if (res != CURLE_OK) {
        throw TransportError(std::string("HTTP ") + request.method + " " + request.url +
                             " failed: " + curl_easy_strerror(res),
                             res == CURLE_OPERATION_TIMEDOUT);
    }

    curl_easy_getinfo(h, CURLINFO_RESPONSE_CODE, &response.status);
    spdlog::debug("HTTP {} -> {}", request.url, response.status);

    return response;
}

} // namespace utils
} // namespace enclave
