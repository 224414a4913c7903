/**
 * SndfileStrategy.cpp - Read the bytes directly as a PCM container
 *
 * Uses libsndfile virtual I/O so nothing touches the filesystem.
 */

#include "lts/audio/DecodeStrategies.hpp"

#include <algorithm>
#include <cstring>

#include <sndfile.h>

namespace lts::audio {

namespace {

struct VirtualBuffer {
    const uint8_t* data;
    sf_count_t size;
    sf_count_t pos = 0;
};

sf_count_t vioLength(void* user) {
    return static_cast<VirtualBuffer*>(user)->size;
}

sf_count_t vioSeek(sf_count_t offset, int whence, void* user) {
    auto* buf = static_cast<VirtualBuffer*>(user);
    sf_count_t target = 0;
    switch (whence) {
        case SEEK_SET: target = offset; break;
        case SEEK_CUR: target = buf->pos + offset; break;
        case SEEK_END: target = buf->size + offset; break;
        default: return -1;
    }
    buf->pos = std::clamp<sf_count_t>(target, 0, buf->size);
    return buf->pos;
}

sf_count_t vioRead(void* ptr, sf_count_t count, void* user) {
    auto* buf = static_cast<VirtualBuffer*>(user);
    sf_count_t n = std::min(count, buf->size - buf->pos);
    if (n <= 0) return 0;
    std::memcpy(ptr, buf->data + buf->pos, static_cast<size_t>(n));
    buf->pos += n;
    return n;
}

sf_count_t vioWrite(const void*, sf_count_t, void*) {
    return 0;
}

sf_count_t vioTell(void* user) {
    return static_cast<VirtualBuffer*>(user)->pos;
}

} // anonymous namespace

StrategyResult SndfileStrategy::decode(const std::vector<uint8_t>& bytes,
                                       const std::string& /*format*/) const {
    if (bytes.empty()) {
        return StrategyResult::failure("no input");
    }

    VirtualBuffer buffer{bytes.data(), static_cast<sf_count_t>(bytes.size())};
    SF_VIRTUAL_IO vio{vioLength, vioSeek, vioRead, vioWrite, vioTell};

    SF_INFO info{};
    SNDFILE* snd = sf_open_virtual(&vio, SFM_READ, &info, &buffer);
    if (!snd) {
        return StrategyResult::failure(sf_strerror(nullptr));
    }

    if (info.channels <= 0 || info.samplerate <= 0) {
        sf_close(snd);
        return StrategyResult::failure("invalid channel count or sample rate");
    }

    RawAudio audio;
    audio.channels = info.channels;
    audio.sample_rate = info.samplerate;
    audio.interleaved.resize(static_cast<size_t>(info.frames) * info.channels);

    sf_count_t read = sf_readf_float(snd, audio.interleaved.data(), info.frames);
    sf_close(snd);

    if (read < 0) {
        return StrategyResult::failure("failed to read samples");
    }
    audio.interleaved.resize(static_cast<size_t>(read) * info.channels);

    return StrategyResult::success(std::move(audio));
}

} // namespace lts::audio
