#include "core/errors.hpp"

namespace core {

const char* error_code_name(ErrorCode code) {
    switch (code) {
    case ErrorCode::MediaNotFound:     return "MediaNotFoundError";
    case ErrorCode::UnsupportedFormat: return "UnsupportedFormatError";
    case ErrorCode::ProbeTimeout:      return "ProbeTimeoutError";
    case ErrorCode::ToolFailure:       return "ToolError";
    case ErrorCode::Transcription:     return "TranscriptionError";
    case ErrorCode::Translation:       return "TranslationError";
    case ErrorCode::Synthesis:         return "SynthesisError";
    case ErrorCode::Reconstruction:    return "ReconstructionError";
    case ErrorCode::Mixing:            return "MixingError";
    case ErrorCode::Config:            return "ConfigError";
    }
    return "Error";
}

std::string Error::describe() const {
    std::string out = error_code_name(code);
    if (!stage.empty()) out += " [" + stage + "]";
    if (!message.empty()) out += ": " + message;
    return out;
}

Error make_error(ErrorCode code, std::string stage, std::string message) {
    Error e;
    e.code = code;
    e.stage = std::move(stage);
    e.message = std::move(message);
    return e;
}

} // namespace core
