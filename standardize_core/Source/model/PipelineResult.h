#pragma once

#include <juce_core/juce_core.h>

namespace standardize_core {

/**
 * Category of a failed pipeline call.
 *
 * Configuration and overwrite failures are detected before any I/O touches
 * the input. The remaining kinds carry the delegated library's message as-is.
 */
enum class ErrorKind {
    None,
    ConfigurationError,
    OverwriteRefused,
    DecodeError,
    EncodeError,
    MeteringError,
};

inline const char* errorKindToString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None:
            return "none";
        case ErrorKind::ConfigurationError:
            return "configuration error";
        case ErrorKind::OverwriteRefused:
            return "overwrite refused";
        case ErrorKind::DecodeError:
            return "decode error";
        case ErrorKind::EncodeError:
            return "encode error";
        case ErrorKind::MeteringError:
            return "metering error";
    }
    return "unknown";
}

/**
 * Outcome of a pipeline operation, in the style of juce::Result with an
 * added error category so callers can tell validation failures from media
 * failures without parsing the message.
 */
class PipelineResult {
  public:
    static PipelineResult ok() noexcept {
        return PipelineResult();
    }

    static PipelineResult fail(ErrorKind kind, const juce::String& errorMessage) {
        jassert(kind != ErrorKind::None);
        return PipelineResult(kind, errorMessage.isEmpty() ? juce::String("Unknown error") : errorMessage);
    }

    bool wasOk() const noexcept {
        return kind_ == ErrorKind::None;
    }

    bool failed() const noexcept {
        return kind_ != ErrorKind::None;
    }

    explicit operator bool() const noexcept {
        return wasOk();
    }

    ErrorKind getKind() const noexcept {
        return kind_;
    }

    const juce::String& getErrorMessage() const noexcept {
        return errorMessage_;
    }

    /** Message prefixed with the category, for log lines. */
    juce::String describe() const {
        if (wasOk())
            return "ok";
        return juce::String(errorKindToString(kind_)) + ": " + errorMessage_;
    }

  private:
    PipelineResult() = default;
    PipelineResult(ErrorKind kind, const juce::String& message) : kind_(kind), errorMessage_(message) {}

    ErrorKind kind_ = ErrorKind::None;
    juce::String errorMessage_;
};

} // namespace standardize_core
