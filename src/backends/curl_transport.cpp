#include "curl_request.hpp"
#include "errors.hpp"
#include <algorithm>
#include <cctype>

namespace {

size_t write_body(char* contents, size_t size, size_t nmemb, void* userp) {
    static_cast<std::string*>(userp)->append(contents, size * nmemb);
    return size * nmemb;
}

size_t write_header(char* contents, size_t size, size_t nmemb, void* userp) {
    auto* headers = static_cast<std::map<std::string, std::string>*>(userp);
    std::string line(contents, size * nmemb);
    size_t colon = line.find(':');
    if (colon != std::string::npos) {
        std::string name = line.substr(0, colon);
        std::transform(name.begin(), name.end(), name.begin(), [](unsigned char c) { return std::tolower(c); });
        std::string value = line.substr(colon + 1);
        size_t start = value.find_first_not_of(" \t");
        size_t end = value.find_last_not_of(" \t\r\n");
        (*headers)[name] = (start == std::string::npos) ? "" : value.substr(start, end - start + 1);
    } else if (line.compare(0, 5, "HTTP/") == 0) {
        // a new status line (redirect or 100-continue) starts a fresh header block
        headers->clear();
    }
    return size * nmemb;
}

int check_cancelled(void* userp, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    return static_cast<const CancellationToken*>(userp)->cancelled() ? 1 : 0;
}

} // namespace

HttpResponse CurlTransport::post(const HttpRequest& request, std::chrono::milliseconds timeout) {
    CurlRequest curl;
    HttpResponse response;

    curl.set_url(request.url);
    for (const auto& header : request.headers) {
        curl.add_header(header);
    }
    curl.set_postfields(request.body);
    curl.set_timeout(timeout);
    curl.set_write_callback(write_body, &response.body);
    curl.set_header_callback(write_header, &response.headers);
    curl.set_progress_callback(check_cancelled, const_cast<CancellationToken*>(&cancel_));

    CURLcode res = curl.perform();
    if (res == CURLE_ABORTED_BY_CALLBACK) {
        throw CancelledError();
    }
    if (res != CURLE_OK) {
        throw TransportError("libcurl error: " + std::string(curl_easy_strerror(res)), res == CURLE_OPERATION_TIMEDOUT);
    }
    response.status = curl.response_code();
    return response;
}
