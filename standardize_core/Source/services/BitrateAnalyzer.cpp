#include "BitrateAnalyzer.h"
#include <algorithm>
#include <cmath>
#include <cstdio>
#include <cstring>
#include <limits>
#include <memory>
#include <numeric>

extern "C" {
#include <libavformat/avformat.h>
#include <libavutil/avutil.h>
#include <libavutil/error.h>
#include <libavutil/mem.h>
}

namespace standardize_core {
namespace Services {

namespace {
constexpr int kIoBufferSize = 32768;

juce::String avErrorToString(int errorCode) {
    char buffer[AV_ERROR_MAX_STRING_SIZE] = {0};
    av_strerror(errorCode, buffer, sizeof(buffer));
    return juce::String(buffer);
}

/** Read cursor over an in-memory source, driven by libavformat's custom IO. */
struct MemoryReader {
    const uint8_t* data = nullptr;
    int64_t size = 0;
    int64_t position = 0;

    static int read(void* opaque, uint8_t* buffer, int bufferSize) {
        auto* reader = static_cast<MemoryReader*>(opaque);
        const auto remaining = reader->size - reader->position;
        if (remaining <= 0)
            return AVERROR_EOF;

        const auto count = static_cast<int>(std::min<int64_t>(remaining, bufferSize));
        std::memcpy(buffer, reader->data + reader->position, static_cast<size_t>(count));
        reader->position += count;
        return count;
    }

    static int64_t seek(void* opaque, int64_t offset, int whence) {
        auto* reader = static_cast<MemoryReader*>(opaque);
        whence &= ~AVSEEK_FORCE;

        if (whence == AVSEEK_SIZE)
            return reader->size;

        int64_t target = 0;
        switch (whence) {
            case SEEK_SET:
                target = offset;
                break;
            case SEEK_CUR:
                target = reader->position + offset;
                break;
            case SEEK_END:
                target = reader->size + offset;
                break;
            default:
                return AVERROR(EINVAL);
        }

        if (target < 0 || target > reader->size)
            return AVERROR(EINVAL);

        reader->position = target;
        return target;
    }
};

struct FormatContextDeleter {
    void operator()(AVFormatContext* context) const noexcept {
        avformat_close_input(&context);
    }
};

struct IoContextDeleter {
    void operator()(AVIOContext* context) const noexcept {
        if (context != nullptr) {
            av_freep(&context->buffer);
            avio_context_free(&context);
        }
    }
};

struct PacketDeleter {
    void operator()(AVPacket* packet) const noexcept {
        av_packet_free(&packet);
    }
};

using FormatContextPtr = std::unique_ptr<AVFormatContext, FormatContextDeleter>;
using IoContextPtr = std::unique_ptr<AVIOContext, IoContextDeleter>;
using PacketPtr = std::unique_ptr<AVPacket, PacketDeleter>;

PipelineResult decodeError(const SourceMedia& source, const juce::String& what) {
    return PipelineResult::fail(ErrorKind::DecodeError, what + " (" + source.describe() + ")");
}
} // namespace

FFmpegBitrateAnalyzer::FFmpegBitrateAnalyzer(double windowSeconds) : windowSeconds_(windowSeconds) {
    jassert(windowSeconds > 0.0);
}

PipelineResult FFmpegBitrateAnalyzer::analyze(const SourceMedia& source, BitrateStats& stats) {
    MemoryReader memoryReader;
    IoContextPtr ioContext;
    AVFormatContext* rawContext = nullptr;

    if (source.isFile()) {
        const auto path = source.getFile().getFullPathName();
        if (const int err = avformat_open_input(&rawContext, path.toRawUTF8(), nullptr, nullptr); err < 0)
            return decodeError(source, "avformat_open_input failed: " + avErrorToString(err));
    } else {
        const auto* data = source.getData();
        memoryReader.data = static_cast<const uint8_t*>(data->getData());
        memoryReader.size = static_cast<int64_t>(data->getSize());

        auto* ioBuffer = static_cast<unsigned char*>(av_malloc(kIoBufferSize));
        if (ioBuffer == nullptr)
            return decodeError(source, "av_malloc failed");

        ioContext.reset(avio_alloc_context(ioBuffer, kIoBufferSize, 0, &memoryReader,
                                           &MemoryReader::read, nullptr, &MemoryReader::seek));
        if (ioContext == nullptr) {
            av_free(ioBuffer);
            return decodeError(source, "avio_alloc_context failed");
        }

        rawContext = avformat_alloc_context();
        if (rawContext == nullptr)
            return decodeError(source, "avformat_alloc_context failed");

        rawContext->pb = ioContext.get();
        rawContext->flags |= AVFMT_FLAG_CUSTOM_IO;

        // On failure avformat_open_input frees the context itself.
        if (const int err = avformat_open_input(&rawContext, nullptr, nullptr, nullptr); err < 0)
            return decodeError(source, "avformat_open_input failed: " + avErrorToString(err));
    }

    FormatContextPtr formatContext(rawContext);

    if (const int err = avformat_find_stream_info(formatContext.get(), nullptr); err < 0)
        return decodeError(source, "avformat_find_stream_info failed: " + avErrorToString(err));

    const int streamIndex = av_find_best_stream(formatContext.get(), AVMEDIA_TYPE_AUDIO, -1, -1, nullptr, 0);
    if (streamIndex < 0)
        return decodeError(source, "no audio stream: " + avErrorToString(streamIndex));

    const AVStream* stream = formatContext->streams[streamIndex];
    const double timeBase = av_q2d(stream->time_base);

    PacketPtr packet(av_packet_alloc());
    if (packet == nullptr)
        return decodeError(source, "av_packet_alloc failed");

    std::vector<PacketInfo> packets;
    double runningTime = 0.0;

    int readResult = 0;
    while ((readResult = av_read_frame(formatContext.get(), packet.get())) >= 0) {
        if (packet->stream_index == streamIndex) {
            PacketInfo info;
            const int64_t timestamp = packet->pts != AV_NOPTS_VALUE ? packet->pts : packet->dts;
            info.timeSeconds = timestamp != AV_NOPTS_VALUE ? timestamp * timeBase : runningTime;
            info.durationSeconds = packet->duration > 0 ? packet->duration * timeBase : 0.0;
            info.sizeBytes = packet->size;

            runningTime = info.timeSeconds + info.durationSeconds;
            packets.push_back(info);
        }
        av_packet_unref(packet.get());
    }

    if (readResult != AVERROR_EOF)
        return decodeError(source, "av_read_frame failed: " + avErrorToString(readResult));

    if (packets.empty())
        return decodeError(source, "audio stream contains no packets");

    stats = aggregate(packets, windowSeconds_);

    DBG("Bitrate of " + source.describe() + ": avg " + juce::String(stats.averageBitrateKbps, 1) + " kbps, max "
        + juce::String(stats.maxBitrateKbps, 1) + " kbps over " + juce::String(stats.bitratePerWindowKbps.size())
        + " windows");

    return PipelineResult::ok();
}

BitrateStats FFmpegBitrateAnalyzer::aggregate(const std::vector<PacketInfo>& packets, double windowSeconds) {
    BitrateStats stats;
    stats.windowSeconds = windowSeconds;
    stats.numPackets = static_cast<int>(packets.size());

    if (packets.empty() || windowSeconds <= 0.0)
        return stats;

    auto sorted = packets;
    std::stable_sort(sorted.begin(), sorted.end(),
                     [](const PacketInfo& a, const PacketInfo& b) { return a.timeSeconds < b.timeSeconds; });

    const double start = sorted.front().timeSeconds;
    double end = start;
    double totalBits = 0.0;
    for (const auto& p : sorted) {
        end = std::max(end, p.timeSeconds + p.durationSeconds);
        totalBits += p.sizeBytes * 8.0;
    }

    // Packets without durations collapse onto instants; count them as one window.
    double duration = end - start;
    if (duration <= 0.0)
        duration = windowSeconds;
    stats.durationSeconds = duration;

    const auto numWindows = static_cast<size_t>(std::max(1.0, std::ceil(duration / windowSeconds - 1e-9)));
    std::vector<double> windowBits(numWindows, 0.0);

    for (const auto& p : sorted) {
        const auto index = static_cast<size_t>(std::max(0.0, std::floor((p.timeSeconds - start) / windowSeconds)));
        windowBits[std::min(index, numWindows - 1)] += p.sizeBytes * 8.0;
    }

    stats.bitratePerWindowKbps.reserve(numWindows);
    for (size_t i = 0; i < numWindows; ++i) {
        double span = windowSeconds;
        if (i == numWindows - 1) {
            const double remainder = duration - static_cast<double>(numWindows - 1) * windowSeconds;
            if (remainder > 0.0)
                span = remainder;
        }
        stats.bitratePerWindowKbps.push_back(windowBits[i] / span / 1000.0);
    }

    const auto [minIt, maxIt] = std::minmax_element(stats.bitratePerWindowKbps.begin(), stats.bitratePerWindowKbps.end());
    stats.minBitrateKbps = *minIt;
    stats.maxBitrateKbps = *maxIt;
    stats.averageOverWindowsKbps =
        std::accumulate(stats.bitratePerWindowKbps.begin(), stats.bitratePerWindowKbps.end(), 0.0)
        / static_cast<double>(numWindows);
    stats.averageBitrateKbps = totalBits / duration / 1000.0;

    return stats;
}

} // namespace Services
} // namespace standardize_core
