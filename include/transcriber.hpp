#pragma once

#include <string>
#include <vector>
#include <memory>
#include <cstdint>
#include "http_transport.hpp"

namespace talkpaste {

// Failure kinds reported by the transcription client
enum class TranscriptionError {
    None,
    AuthFailure,        // 401/403, or no credential configured
    RateLimited,        // 429
    NetworkTimeout,     // Transport failure or deadline exceeded
    PayloadTooLarge,    // 413, or WAV above the provider ceiling
    ServerError         // Any other non-2xx, or a request we could not build
};

const char* transcription_error_name(TranscriptionError error);

// Provider upload ceiling (25 MiB, ~13.6 minutes of 16kHz mono 16-bit audio)
constexpr size_t MAX_UPLOAD_BYTES = 25u * 1024u * 1024u;

// Upper bound for the vocabulary prompt, in bytes
constexpr size_t MAX_PROMPT_BYTES = 896;

// Recognition parameters shared by every request
struct RecognitionParams {
    std::string model = "whisper-1";
    std::string language;
    float temperature = 0.0f;
    std::string prompt;
    std::string response_format = "json";
};

// Immutable upload description. Temperature is clamped to [0, 1] and the
// prompt cut to MAX_PROMPT_BYTES on a UTF-8 boundary at construction.
class TranscriptionRequest {
public:
    TranscriptionRequest(std::vector<uint8_t> wav, const RecognitionParams& params);

    const std::vector<uint8_t>& audio() const { return audio_; }
    const std::string& model() const { return model_; }
    const std::string& language() const { return language_; }
    float temperature() const { return temperature_; }
    const std::string& prompt() const { return prompt_; }
    const std::string& response_format() const { return response_format_; }

    // Multipart fields in upload order: file, model, language, temperature, response_format, prompt
    std::vector<MultipartField> to_fields() const;

private:
    std::vector<uint8_t> audio_;
    std::string model_;
    std::string language_;
    float temperature_;
    std::string prompt_;
    std::string response_format_;
};

struct TranscriptionResult {
    std::string text;           // Raw provider text, may be empty
    TranscriptionError error = TranscriptionError::None;
    long http_status = 0;
    int64_t duration_ms = 0;
    std::string detail;         // Diagnostic message for failures

    bool success() const { return error == TranscriptionError::None; }
};

class Transcriber {
public:
    Transcriber(std::shared_ptr<HttpTransport> transport, const std::string& base_url);
    virtual ~Transcriber() = default;

    // Upload one recording. Single attempt, no retries.
    virtual TranscriptionResult transcribe(std::vector<uint8_t> wav);

    // Check the credential against GET <base>/models
    TranscriptionResult verify_credentials();

    // Settings
    void set_api_key(const std::string& key) { api_key_ = key; }
    void set_params(const RecognitionParams& params) { params_ = params; }
    const RecognitionParams& params() const { return params_; }
    void set_timeouts(long connect_timeout_sec, long timeout_sec) {
        connect_timeout_sec_ = connect_timeout_sec;
        timeout_sec_ = timeout_sec;
    }

    const std::string& endpoint() const { return endpoint_; }

    // Extract the result text from a 2xx body for the given response format
    static std::string parse_response_text(const std::string& body, const std::string& response_format);

    // Map a transport/HTTP outcome to a failure kind (None for 2xx)
    static TranscriptionError classify(const HttpResponse& response);

private:
    std::shared_ptr<HttpTransport> transport_;
    std::string base_url_;
    std::string endpoint_;
    std::string api_key_;
    RecognitionParams params_;
    long connect_timeout_sec_ = 10;
    long timeout_sec_ = 30;
};

} // namespace talkpaste
