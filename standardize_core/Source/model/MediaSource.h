#pragma once

#include <juce_core/juce_core.h>
#include <functional>
#include <memory>
#include <variant>

namespace standardize_core {

/** Input given as a filesystem path. */
struct PathSource {
    juce::File file;
};

/** Input given as an already-open stream. The pipeline takes ownership. */
struct StreamSource {
    std::unique_ptr<juce::InputStream> stream;
};

using InputSource = std::variant<PathSource, StreamSource>;

/** Output written to a filesystem path; the format follows the extension. */
struct PathTarget {
    juce::File file;
};

/** Output appended to a caller-owned stream. */
struct StreamTarget {
    std::reference_wrapper<juce::OutputStream> stream;
};

using OutputTarget = std::variant<PathTarget, StreamTarget>;

/**
 * An input source resolved once at the start of a run.
 *
 * Stream input is drained into an owned memory block so the decoder and
 * the bitrate analyzer can each read it independently (and concurrently).
 * Downstream code never inspects the original InputSource again.
 */
class SourceMedia {
  public:
    static SourceMedia fromFile(const juce::File& file);
    static SourceMedia fromData(juce::MemoryBlock data, const juce::String& description = "<stream>");

    /**
     * Drain a stream into memory.
     * @return false if the stream yields no data
     */
    static bool readStream(juce::InputStream& stream, SourceMedia& result);

    bool isFile() const noexcept {
        return data_ == nullptr;
    }

    const juce::File& getFile() const noexcept {
        return file_;
    }

    /** Owned bytes of a stream source (nullptr for file sources). */
    const juce::MemoryBlock* getData() const noexcept {
        return data_.get();
    }

    /** Fresh stream positioned at the start of the media, or nullptr if unreadable. */
    std::unique_ptr<juce::InputStream> createInputStream() const;

    /** File path or stream description for error messages. */
    juce::String describe() const;

  private:
    juce::File file_;
    std::shared_ptr<const juce::MemoryBlock> data_;
    juce::String description_;
};

} // namespace standardize_core
