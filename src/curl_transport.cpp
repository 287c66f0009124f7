#include "curl_transport.hpp"
#include <curl/curl.h>
#include <iostream>
#include <memory>

namespace talkpaste {

namespace {

size_t write_callback(void* contents, size_t size, size_t nmemb, void* userp) {
    const size_t total = size * nmemb;
    auto* buffer = static_cast<std::string*>(userp);
    buffer->append(static_cast<const char*>(contents), total);
    return total;
}

const CurlGlobalGuard curl_guard;

} // namespace

CurlGlobalGuard::CurlGlobalGuard() {
    CURLcode rc = curl_global_init(CURL_GLOBAL_DEFAULT);
    ok_ = (rc == CURLE_OK);
    if (!ok_) {
        std::cerr << "curl_global_init failed: " << curl_easy_strerror(rc) << std::endl;
    }
}

CurlGlobalGuard::~CurlGlobalGuard() {
    if (ok_) {
        curl_global_cleanup();
    }
}

TransportError CurlTransport::classify(int curl_code) {
    switch (curl_code) {
        case CURLE_OK:
            return TransportError::Ok;
        case CURLE_OPERATION_TIMEDOUT:
            return TransportError::Timeout;
        case CURLE_COULDNT_RESOLVE_PROXY:
        case CURLE_COULDNT_RESOLVE_HOST:
        case CURLE_COULDNT_CONNECT:
        case CURLE_GOT_NOTHING:
        case CURLE_SEND_ERROR:
        case CURLE_RECV_ERROR:
        case CURLE_SSL_CONNECT_ERROR:
        case CURLE_PARTIAL_FILE:
            return TransportError::Network;
        default:
            return TransportError::Internal;
    }
}

HttpResponse CurlTransport::send(const HttpRequest& request) {
    HttpResponse response;

    std::unique_ptr<CURL, decltype(&curl_easy_cleanup)> curl(curl_easy_init(), curl_easy_cleanup);
    if (!curl || !curl_guard.ok()) {
        response.error = TransportError::Internal;
        response.error_message = "curl_init_failed";
        return response;
    }

    std::unique_ptr<curl_slist, decltype(&curl_slist_free_all)> headers(nullptr, curl_slist_free_all);
    for (const auto& line : request.headers) {
        curl_slist* appended = curl_slist_append(headers.get(), line.c_str());
        if (!appended) {
            response.error = TransportError::Internal;
            response.error_message = "curl_slist_append failed";
            return response;
        }
        headers.release();
        headers.reset(appended);
    }

    std::unique_ptr<curl_mime, decltype(&curl_mime_free)> mime(nullptr, curl_mime_free);
    if (!request.fields.empty()) {
        mime.reset(curl_mime_init(curl.get()));
        for (const auto& field : request.fields) {
            curl_mimepart* part = curl_mime_addpart(mime.get());
            curl_mime_name(part, field.name.c_str());
            // Values are copied by libcurl; binary data is length-delimited
            curl_mime_data(part, field.value.data(), field.value.size());
            if (field.is_file) {
                curl_mime_filename(part, field.filename.c_str());
                if (!field.content_type.empty()) {
                    curl_mime_type(part, field.content_type.c_str());
                }
            }
        }
        curl_easy_setopt(curl.get(), CURLOPT_MIMEPOST, mime.get());
    } else {
        curl_easy_setopt(curl.get(), CURLOPT_HTTPGET, 1L);
    }

    curl_easy_setopt(curl.get(), CURLOPT_URL, request.url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headers.get());
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &response.body);
    curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT, request.connect_timeout_sec);
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT, request.timeout_sec);
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);

    const CURLcode rc = curl_easy_perform(curl.get());
    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &response.status);

    if (rc != CURLE_OK) {
        response.error = classify(rc);
        response.error_message = std::string("curl_error:") + curl_easy_strerror(rc);
    }

    return response;
}

} // namespace talkpaste
