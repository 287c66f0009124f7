#pragma once

#include <string>
#include <vector>
#include <cstdint>

namespace talkpaste {

// One part of a multipart/form-data body
struct MultipartField {
    std::string name;
    std::string value;          // Text value, or the raw bytes when is_file
    bool is_file = false;
    std::string filename;       // For file parts
    std::string content_type;   // For file parts
};

struct HttpRequest {
    std::string url;
    std::vector<std::string> headers;   // "Name: value" lines
    std::vector<MultipartField> fields; // Empty means GET
    long connect_timeout_sec = 10;
    long timeout_sec = 30;
};

// Transport-level failure classes; Ok means an HTTP status was received
enum class TransportError {
    Ok,
    Timeout,
    Network,        // Resolve/connect/send/recv/TLS failure
    Internal        // Client could not build the request
};

struct HttpResponse {
    TransportError error = TransportError::Ok;
    long status = 0;
    std::string body;
    std::string error_message;
};

// Seam between the transcription client and the network
class HttpTransport {
public:
    virtual ~HttpTransport() = default;

    // POST request.fields as multipart/form-data (GET when there are no fields)
    virtual HttpResponse send(const HttpRequest& request) = 0;
};

} // namespace talkpaste
