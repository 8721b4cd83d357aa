#include "MediaSource.h"

namespace standardize_core {

SourceMedia SourceMedia::fromFile(const juce::File& file) {
    SourceMedia media;
    media.file_ = file;
    media.description_ = file.getFullPathName();
    return media;
}

SourceMedia SourceMedia::fromData(juce::MemoryBlock data, const juce::String& description) {
    SourceMedia media;
    media.data_ = std::make_shared<const juce::MemoryBlock>(std::move(data));
    media.description_ = description;
    return media;
}

bool SourceMedia::readStream(juce::InputStream& stream, SourceMedia& result) {
    juce::MemoryBlock data;
    stream.readIntoMemoryBlock(data);
    if (data.isEmpty())
        return false;

    result = fromData(std::move(data));
    return true;
}

std::unique_ptr<juce::InputStream> SourceMedia::createInputStream() const {
    if (data_ != nullptr)
        return std::make_unique<juce::MemoryInputStream>(*data_, false);

    return file_.createInputStream();
}

juce::String SourceMedia::describe() const {
    return description_;
}

} // namespace standardize_core
