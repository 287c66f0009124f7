#include "transcriber.hpp"
#include "vocabulary.hpp"
#include <nlohmann/json.hpp>
#include <iostream>
#include <sstream>
#include <chrono>
#include <algorithm>
#include <utility>

namespace talkpaste {

namespace {

std::string format_temperature(float t) {
    std::ostringstream oss;
    oss << t;
    return oss.str();
}

} // namespace

const char* transcription_error_name(TranscriptionError error) {
    switch (error) {
        case TranscriptionError::None: return "none";
        case TranscriptionError::AuthFailure: return "auth failure";
        case TranscriptionError::RateLimited: return "rate limited";
        case TranscriptionError::NetworkTimeout: return "network timeout";
        case TranscriptionError::PayloadTooLarge: return "payload too large";
        case TranscriptionError::ServerError: return "server error";
    }
    return "unknown";
}

TranscriptionRequest::TranscriptionRequest(std::vector<uint8_t> wav, const RecognitionParams& params)
    : audio_(std::move(wav))
    , model_(params.model)
    , language_(params.language)
    , temperature_(std::min(1.0f, std::max(0.0f, params.temperature)))
    , prompt_(truncate_utf8(params.prompt, MAX_PROMPT_BYTES))
    , response_format_(params.response_format.empty() ? "json" : params.response_format) {
}

std::vector<MultipartField> TranscriptionRequest::to_fields() const {
    std::vector<MultipartField> fields;

    MultipartField file;
    file.name = "file";
    file.value.assign(audio_.begin(), audio_.end());
    file.is_file = true;
    file.filename = "voice.wav";
    file.content_type = "audio/wav";
    fields.push_back(std::move(file));

    fields.push_back({"model", model_, false, "", ""});
    if (!language_.empty()) {
        fields.push_back({"language", language_, false, "", ""});
    }
    fields.push_back({"temperature", format_temperature(temperature_), false, "", ""});
    fields.push_back({"response_format", response_format_, false, "", ""});
    if (!prompt_.empty()) {
        fields.push_back({"prompt", prompt_, false, "", ""});
    }
    return fields;
}

Transcriber::Transcriber(std::shared_ptr<HttpTransport> transport, const std::string& base_url)
    : transport_(std::move(transport))
    , base_url_(base_url) {
    while (!base_url_.empty() && base_url_.back() == '/') {
        base_url_.pop_back();
    }
    endpoint_ = base_url_ + "/audio/transcriptions";
}

TranscriptionError Transcriber::classify(const HttpResponse& response) {
    switch (response.error) {
        case TransportError::Ok:
            break;
        case TransportError::Timeout:
        case TransportError::Network:
            return TranscriptionError::NetworkTimeout;
        case TransportError::Internal:
            return TranscriptionError::ServerError;
    }

    const long status = response.status;
    if (status >= 200 && status < 300) return TranscriptionError::None;
    if (status == 401 || status == 403) return TranscriptionError::AuthFailure;
    if (status == 429) return TranscriptionError::RateLimited;
    if (status == 413) return TranscriptionError::PayloadTooLarge;
    if (status == 408 || status == 504) return TranscriptionError::NetworkTimeout;
    return TranscriptionError::ServerError;
}

std::string Transcriber::parse_response_text(const std::string& body, const std::string& response_format) {
    if (response_format == "text" || response_format == "srt" || response_format == "vtt") {
        return body;
    }

    // json / verbose_json: structured parse, no manual unescaping
    nlohmann::json doc = nlohmann::json::parse(body, nullptr, false);
    if (doc.is_discarded() || !doc.is_object()) {
        return "";
    }
    auto it = doc.find("text");
    if (it == doc.end() || !it->is_string()) {
        return "";
    }
    return it->get<std::string>();
}

TranscriptionResult Transcriber::transcribe(std::vector<uint8_t> wav) {
    TranscriptionResult result;

    if (api_key_.empty()) {
        result.error = TranscriptionError::AuthFailure;
        result.detail = "API key is not configured";
        return result;
    }

    if (wav.size() > MAX_UPLOAD_BYTES) {
        result.error = TranscriptionError::PayloadTooLarge;
        result.detail = "recording is " + std::to_string(wav.size()) + " bytes, limit is " +
                        std::to_string(MAX_UPLOAD_BYTES);
        return result;
    }

    const TranscriptionRequest request(std::move(wav), params_);

    HttpRequest http;
    http.url = endpoint_;
    http.headers.push_back("Authorization: Bearer " + api_key_);
    http.fields = request.to_fields();
    http.connect_timeout_sec = connect_timeout_sec_;
    http.timeout_sec = timeout_sec_;

    auto start_time = std::chrono::steady_clock::now();
    HttpResponse response = transport_->send(http);
    auto end_time = std::chrono::steady_clock::now();

    result.duration_ms = std::chrono::duration_cast<std::chrono::milliseconds>(end_time - start_time).count();
    result.http_status = response.status;
    result.error = classify(response);

    if (!result.success()) {
        if (response.error != TransportError::Ok) {
            result.detail = response.error_message;
        } else {
            result.detail = "HTTP " + std::to_string(response.status);
            if (!response.body.empty()) {
                result.detail += ": " + response.body.substr(0, 200);
            }
        }
        std::cerr << "Transcription failed (" << transcription_error_name(result.error) << "): "
                  << result.detail << std::endl;
        return result;
    }

    result.text = parse_response_text(response.body, request.response_format());

    std::cout << "Transcription took " << result.duration_ms << "ms: \"" << result.text << "\"" << std::endl;
    return result;
}

TranscriptionResult Transcriber::verify_credentials() {
    TranscriptionResult result;

    if (api_key_.empty()) {
        result.error = TranscriptionError::AuthFailure;
        result.detail = "API key is not configured";
        return result;
    }

    HttpRequest http;
    http.url = base_url_ + "/models";
    http.headers.push_back("Authorization: Bearer " + api_key_);
    http.connect_timeout_sec = connect_timeout_sec_;
    http.timeout_sec = timeout_sec_;

    HttpResponse response = transport_->send(http);
    result.http_status = response.status;
    result.error = classify(response);
    if (!result.success()) {
        result.detail = response.error != TransportError::Ok
            ? response.error_message
            : "HTTP " + std::to_string(response.status);
    }
    return result;
}

} // namespace talkpaste
