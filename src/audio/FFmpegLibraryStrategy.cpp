/**
 * FFmpegLibraryStrategy.cpp - Container-aware decode from memory
 *
 * Demuxes with libavformat through a custom AVIOContext over the input
 * bytes, decodes the best audio stream with libavcodec and converts every
 * frame to packed float with libswresample (rate and channels untouched).
 */

#include "lts/audio/DecodeStrategies.hpp"

#include <algorithm>
#include <cstring>

extern "C" {
#include <libavcodec/avcodec.h>
#include <libavformat/avformat.h>
#include <libavutil/channel_layout.h>
#include <libavutil/error.h>
#include <libavutil/mem.h>
#include <libswresample/swresample.h>
}

namespace lts::audio {

namespace {

constexpr int IO_BUFFER_SIZE = 32 * 1024;

std::string avError(int code) {
    char buf[AV_ERROR_MAX_STRING_SIZE] = {0};
    av_strerror(code, buf, sizeof(buf));
    return buf;
}

struct MemoryReader {
    const uint8_t* data;
    size_t size;
    size_t pos = 0;

    static int read(void* opaque, uint8_t* buf, int buf_size) {
        auto* self = static_cast<MemoryReader*>(opaque);
        size_t remaining = self->size - self->pos;
        if (remaining == 0) {
            return AVERROR_EOF;
        }
        size_t n = std::min(remaining, static_cast<size_t>(buf_size));
        std::memcpy(buf, self->data + self->pos, n);
        self->pos += n;
        return static_cast<int>(n);
    }

    static int64_t seek(void* opaque, int64_t offset, int whence) {
        auto* self = static_cast<MemoryReader*>(opaque);
        if (whence == AVSEEK_SIZE) {
            return static_cast<int64_t>(self->size);
        }
        int64_t base = 0;
        switch (whence & ~AVSEEK_FORCE) {
            case SEEK_SET: base = 0; break;
            case SEEK_CUR: base = static_cast<int64_t>(self->pos); break;
            case SEEK_END: base = static_cast<int64_t>(self->size); break;
            default: return AVERROR(EINVAL);
        }
        int64_t target = base + offset;
        if (target < 0 || target > static_cast<int64_t>(self->size)) {
            return AVERROR(EINVAL);
        }
        self->pos = static_cast<size_t>(target);
        return target;
    }
};

// Owns every libav object of one decode call
struct DecodeContext {
    AVIOContext* io = nullptr;
    AVFormatContext* format = nullptr;
    AVCodecContext* codec = nullptr;
    SwrContext* swr = nullptr;
    AVPacket* packet = nullptr;
    AVFrame* frame = nullptr;

    ~DecodeContext() {
        av_frame_free(&frame);
        av_packet_free(&packet);
        swr_free(&swr);
        avcodec_free_context(&codec);
        avformat_close_input(&format);
        if (io) {
            av_freep(&io->buffer);
            avio_context_free(&io);
        }
    }
};

bool convertFrame(DecodeContext& ctx, RawAudio& audio, std::string& error) {
    AVFrame* frame = ctx.frame;

    if (!ctx.swr) {
        int ret = swr_alloc_set_opts2(&ctx.swr,
                                      &frame->ch_layout, AV_SAMPLE_FMT_FLT, frame->sample_rate,
                                      &frame->ch_layout, static_cast<AVSampleFormat>(frame->format),
                                      frame->sample_rate, 0, nullptr);
        if (ret < 0 || swr_init(ctx.swr) < 0) {
            error = "swr init failed";
            return false;
        }
        audio.channels = frame->ch_layout.nb_channels;
        audio.sample_rate = frame->sample_rate;
    }

    if (frame->ch_layout.nb_channels != audio.channels || frame->sample_rate != audio.sample_rate) {
        error = "stream parameters changed mid-stream";
        return false;
    }

    const int capacity = swr_get_out_samples(ctx.swr, frame->nb_samples);
    if (capacity <= 0) {
        return true;
    }

    size_t offset = audio.interleaved.size();
    audio.interleaved.resize(offset + static_cast<size_t>(capacity) * audio.channels);
    uint8_t* out = reinterpret_cast<uint8_t*>(audio.interleaved.data() + offset);

    int converted = swr_convert(ctx.swr, &out, capacity,
                                const_cast<const uint8_t**>(frame->extended_data),
                                frame->nb_samples);
    if (converted < 0) {
        error = "swr_convert failed: " + avError(converted);
        return false;
    }
    audio.interleaved.resize(offset + static_cast<size_t>(converted) * audio.channels);
    return true;
}

bool drainDecoder(DecodeContext& ctx, RawAudio& audio, std::string& error) {
    while (true) {
        int ret = avcodec_receive_frame(ctx.codec, ctx.frame);
        if (ret == AVERROR(EAGAIN) || ret == AVERROR_EOF) {
            return true;
        }
        if (ret < 0) {
            error = "decode failed: " + avError(ret);
            return false;
        }
        bool ok = convertFrame(ctx, audio, error);
        av_frame_unref(ctx.frame);
        if (!ok) return false;
    }
}

} // anonymous namespace

StrategyResult FFmpegLibraryStrategy::decode(const std::vector<uint8_t>& bytes,
                                             const std::string& format) const {
    if (bytes.empty()) {
        return StrategyResult::failure("no input");
    }

    DecodeContext ctx;
    MemoryReader reader{bytes.data(), bytes.size()};

    auto* io_buffer = static_cast<uint8_t*>(av_malloc(IO_BUFFER_SIZE));
    if (!io_buffer) {
        return StrategyResult::failure("out of memory");
    }
    ctx.io = avio_alloc_context(io_buffer, IO_BUFFER_SIZE, 0, &reader,
                                &MemoryReader::read, nullptr, &MemoryReader::seek);
    if (!ctx.io) {
        av_free(io_buffer);
        return StrategyResult::failure("avio_alloc_context failed");
    }

    ctx.format = avformat_alloc_context();
    if (!ctx.format) {
        return StrategyResult::failure("avformat_alloc_context failed");
    }
    ctx.format->pb = ctx.io;
    ctx.format->flags |= AVFMT_FLAG_CUSTOM_IO;

    // Declared format is only a hint; fall back to probing
    const AVInputFormat* hint = format.empty() ? nullptr : av_find_input_format(format.c_str());

    int ret = avformat_open_input(&ctx.format, nullptr, hint, nullptr);
    if (ret < 0 && hint) {
        if (avio_seek(ctx.io, 0, SEEK_SET) < 0) {
            return StrategyResult::failure("open input: " + avError(ret));
        }
        ctx.format = avformat_alloc_context();
        if (!ctx.format) {
            return StrategyResult::failure("avformat_alloc_context failed");
        }
        ctx.format->pb = ctx.io;
        ctx.format->flags |= AVFMT_FLAG_CUSTOM_IO;
        ret = avformat_open_input(&ctx.format, nullptr, nullptr, nullptr);
    }
    if (ret < 0) {
        return StrategyResult::failure("open input: " + avError(ret));
    }

    ret = avformat_find_stream_info(ctx.format, nullptr);
    if (ret < 0) {
        return StrategyResult::failure("stream info: " + avError(ret));
    }

    const AVCodec* codec = nullptr;
    int stream_index = av_find_best_stream(ctx.format, AVMEDIA_TYPE_AUDIO, -1, -1, &codec, 0);
    if (stream_index < 0 || !codec) {
        return StrategyResult::failure("no audio stream");
    }

    ctx.codec = avcodec_alloc_context3(codec);
    if (!ctx.codec) {
        return StrategyResult::failure("avcodec_alloc_context3 failed");
    }
    ret = avcodec_parameters_to_context(ctx.codec, ctx.format->streams[stream_index]->codecpar);
    if (ret < 0) {
        return StrategyResult::failure("codec parameters: " + avError(ret));
    }
    ret = avcodec_open2(ctx.codec, codec, nullptr);
    if (ret < 0) {
        return StrategyResult::failure("open codec: " + avError(ret));
    }

    ctx.packet = av_packet_alloc();
    ctx.frame = av_frame_alloc();
    if (!ctx.packet || !ctx.frame) {
        return StrategyResult::failure("out of memory");
    }

    RawAudio audio;
    std::string error;

    // A read error ends the stream early; keep whatever decoded so far
    while (av_read_frame(ctx.format, ctx.packet) >= 0) {
        if (ctx.packet->stream_index == stream_index) {
            int send = avcodec_send_packet(ctx.codec, ctx.packet);
            // Truncated streaming fragments commonly end in a damaged packet
            if (send < 0 && send != AVERROR(EAGAIN)) {
                av_packet_unref(ctx.packet);
                break;
            }
            if (!drainDecoder(ctx, audio, error)) {
                av_packet_unref(ctx.packet);
                return StrategyResult::failure(error);
            }
        }
        av_packet_unref(ctx.packet);
    }

    ret = avcodec_send_packet(ctx.codec, nullptr);
    if (ret < 0 && ret != AVERROR_EOF) {
        return StrategyResult::failure("flush decoder: " + avError(ret));
    }
    if (!drainDecoder(ctx, audio, error)) {
        return StrategyResult::failure(error);
    }

    if (audio.sample_rate <= 0) {
        return StrategyResult::failure("no decodable audio frames");
    }

    return StrategyResult::success(std::move(audio));
}

} // namespace lts::audio
