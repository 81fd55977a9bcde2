#pragma once

#include <stdexcept>
#include <string>

namespace lyricvid {

enum class ErrorCode {
    ImageDecode,
    EncoderLoad,
    EncoderInvocation,
    Cancelled
};

inline const char* error_code_name(ErrorCode code) {
    switch (code) {
        case ErrorCode::ImageDecode: return "ImageDecodeError";
        case ErrorCode::EncoderLoad: return "EncoderLoadError";
        case ErrorCode::EncoderInvocation: return "EncoderInvocationError";
        case ErrorCode::Cancelled: return "Cancelled";
    }
    return "Unknown";
}

/**
 * Fatal pipeline failure.
 *
 * Timestamp, duration-probe and cleanup problems are recovered where they
 * happen and never reach this type.
 */
class PipelineError : public std::runtime_error {
public:
    PipelineError(ErrorCode code, const std::string& message)
        : std::runtime_error(std::string(error_code_name(code)) + ": " + message)
        , code_(code)
    {
    }

    ErrorCode code() const { return code_; }

private:
    ErrorCode code_;
};

} // namespace lyricvid
