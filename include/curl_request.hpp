#pragma once

#include "cancellation.hpp"
#include <curl/curl.h>
#include <chrono>
#include <map>
#include <stdexcept>
#include <string>
#include <vector>

struct HttpRequest {
    std::string url;
    std::vector<std::string> headers;
    std::string body;
};

struct HttpResponse {
    long status = 0;
    std::string body;
    // Header names are lowercased.
    std::map<std::string, std::string> headers;
};

// Network-level failure: no HTTP status was received.
class TransportError : public std::runtime_error {
public:
    TransportError(const std::string& message, bool timed_out)
        : std::runtime_error(message), timed_out_(timed_out) {}
    bool timed_out() const { return timed_out_; }

private:
    bool timed_out_;
};

class HttpTransport {
public:
    virtual ~HttpTransport() = default;
    // Throws TransportError, or CancelledError when interrupted mid-transfer.
    virtual HttpResponse post(const HttpRequest& request, std::chrono::milliseconds timeout) = 0;
};

// Process-wide libcurl setup, released when the guard goes out of scope.
class CurlGlobal {
public:
    CurlGlobal() {
        CURLcode res = curl_global_init(CURL_GLOBAL_DEFAULT);
        if (res != CURLE_OK) {
            throw std::runtime_error("Failed to initialize libcurl: " + std::string(curl_easy_strerror(res)));
        }
    }

    ~CurlGlobal() {
        curl_global_cleanup();
    }

    CurlGlobal(const CurlGlobal&) = delete;
    CurlGlobal& operator=(const CurlGlobal&) = delete;
};

class CurlRequest {
private:
    CURL* handle;
    curl_slist* headers;

public:
    CurlRequest() : handle(nullptr), headers(nullptr) {
        handle = curl_easy_init();
        if (!handle) {
            throw std::runtime_error("Failed to initialize CURL");
        }
    }

    ~CurlRequest() {
        if (handle) {
            curl_easy_cleanup(handle);
        }
        if (headers) {
            curl_slist_free_all(headers);
        }
    }

    CurlRequest(const CurlRequest&) = delete;
    CurlRequest& operator=(const CurlRequest&) = delete;

    void set_url(const std::string& url) {
        curl_easy_setopt(handle, CURLOPT_URL, url.c_str());
    }

    // The data is not copied; it must outlive perform().
    void set_postfields(const std::string& data) {
        curl_easy_setopt(handle, CURLOPT_POSTFIELDSIZE, static_cast<long>(data.size()));
        curl_easy_setopt(handle, CURLOPT_POSTFIELDS, data.c_str());
    }

    void add_header(const std::string& header) {
        headers = curl_slist_append(headers, header.c_str());
    }

    void set_timeout(std::chrono::milliseconds timeout) {
        curl_easy_setopt(handle, CURLOPT_TIMEOUT_MS, static_cast<long>(timeout.count()));
    }

    void set_write_callback(size_t (*callback)(char*, size_t, size_t, void*), void* userdata) {
        curl_easy_setopt(handle, CURLOPT_WRITEFUNCTION, callback);
        curl_easy_setopt(handle, CURLOPT_WRITEDATA, userdata);
    }

    void set_header_callback(size_t (*callback)(char*, size_t, size_t, void*), void* userdata) {
        curl_easy_setopt(handle, CURLOPT_HEADERFUNCTION, callback);
        curl_easy_setopt(handle, CURLOPT_HEADERDATA, userdata);
    }

    void set_progress_callback(int (*callback)(void*, curl_off_t, curl_off_t, curl_off_t, curl_off_t), void* userdata) {
        curl_easy_setopt(handle, CURLOPT_NOPROGRESS, 0L);
        curl_easy_setopt(handle, CURLOPT_XFERINFOFUNCTION, callback);
        curl_easy_setopt(handle, CURLOPT_XFERINFODATA, userdata);
    }

    CURLcode perform() {
        if (headers) {
            curl_easy_setopt(handle, CURLOPT_HTTPHEADER, headers);
        }
        return curl_easy_perform(handle);
    }

    long response_code() const {
        long code = 0;
        curl_easy_getinfo(handle, CURLINFO_RESPONSE_CODE, &code);
        return code;
    }
};

class CurlTransport : public HttpTransport {
public:
    explicit CurlTransport(const CancellationToken& cancel) : cancel_(cancel) {}
    HttpResponse post(const HttpRequest& request, std::chrono::milliseconds timeout) override;

private:
    const CancellationToken& cancel_;
};
