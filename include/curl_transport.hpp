#pragma once

#include "http_transport.hpp"

namespace talkpaste {

// RAII wrapper for curl_global_init/cleanup (one static instance per process)
class CurlGlobalGuard {
public:
    CurlGlobalGuard();
    ~CurlGlobalGuard();

    CurlGlobalGuard(const CurlGlobalGuard&) = delete;
    CurlGlobalGuard& operator=(const CurlGlobalGuard&) = delete;

    bool ok() const { return ok_; }

private:
    bool ok_ = false;
};

// libcurl implementation of HttpTransport. Each send() uses a fresh easy
// handle, so one instance may be shared across sessions.
class CurlTransport : public HttpTransport {
public:
    HttpResponse send(const HttpRequest& request) override;

    // Map a CURLcode to a transport error class
    static TransportError classify(int curl_code);
};

} // namespace talkpaste
