#pragma once
#include <stdexcept>
#include <string>
#include <utility>

namespace core {

enum class ErrorCode {
    MediaNotFound,
    UnsupportedFormat,
    ProbeTimeout,
    ToolFailure,
    Transcription,
    Translation,
    Synthesis,
    Reconstruction,
    Mixing,
    Config
};

const char* error_code_name(ErrorCode code);

struct Error {
    ErrorCode code = ErrorCode::ToolFailure;
    std::string stage;    // pipeline stage, e.g. "probe", "synthesis"
    std::string message;  // safe to show to end users (no paths, no keys)

    std::string describe() const;
};

Error make_error(ErrorCode code, std::string stage, std::string message);

// Exception form of Error, for failures that abort a stage.
class PipelineError : public std::runtime_error {
public:
    explicit PipelineError(Error err)
        : std::runtime_error(err.describe()), error_(std::move(err)) {}
    const Error& error() const { return error_; }
    ErrorCode code() const { return error_.code; }

private:
    Error error_;
};

class MediaNotFoundError : public PipelineError {
public:
    explicit MediaNotFoundError(const std::string& msg) : PipelineError(make_error(ErrorCode::MediaNotFound, "probe", msg)) {}
};

class UnsupportedFormatError : public PipelineError {
public:
    explicit UnsupportedFormatError(const std::string& msg) : PipelineError(make_error(ErrorCode::UnsupportedFormat, "probe", msg)) {}
};

class ProbeTimeoutError : public PipelineError {
public:
    explicit ProbeTimeoutError(const std::string& msg) : PipelineError(make_error(ErrorCode::ProbeTimeout, "probe", msg)) {}
};

class ToolError : public PipelineError {
public:
    explicit ToolError(const std::string& msg) : PipelineError(make_error(ErrorCode::ToolFailure, "audio-tool", msg)) {}
};

class TranscriptionError : public PipelineError {
public:
    explicit TranscriptionError(const std::string& msg) : PipelineError(make_error(ErrorCode::Transcription, "transcription", msg)) {}
};

class TranslationError : public PipelineError {
public:
    explicit TranslationError(const std::string& msg) : PipelineError(make_error(ErrorCode::Translation, "translation", msg)) {}
};

class SynthesisError : public PipelineError {
public:
    explicit SynthesisError(const std::string& msg) : PipelineError(make_error(ErrorCode::Synthesis, "synthesis", msg)) {}
};

class ReconstructionError : public PipelineError {
public:
    explicit ReconstructionError(const std::string& msg) : PipelineError(make_error(ErrorCode::Reconstruction, "reconstruction", msg)) {}
};

class MixingError : public PipelineError {
public:
    explicit MixingError(const std::string& msg) : PipelineError(make_error(ErrorCode::Mixing, "mixing", msg)) {}
};

} // namespace core
