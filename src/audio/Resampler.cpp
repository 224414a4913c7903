/**
 * Resampler.cpp - libswresample wrapper for mono float audio
 */

#include "lts/audio/Resampler.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>

extern "C" {
#include <libavutil/channel_layout.h>
#include <libavutil/opt.h>
#include <libavutil/samplefmt.h>
#include <libswresample/swresample.h>
}

namespace lts::audio {

int64_t Resampler::outputLength(size_t frames, int in_rate, int out_rate) {
    if (in_rate <= 0 || out_rate <= 0) {
        return 0;
    }
    return static_cast<int64_t>(frames) * out_rate / in_rate;
}

bool Resampler::resample(const std::vector<float>& in, int in_rate, int out_rate,
                         std::vector<float>& out) {
    const int64_t expected = outputLength(in.size(), in_rate, out_rate);
    if (expected <= 0) {
        return false;
    }

    if (in_rate == out_rate) {
        out = in;
        return true;
    }

    AVChannelLayout mono;
    av_channel_layout_default(&mono, 1);

    SwrContext* swr = nullptr;
    int ret = swr_alloc_set_opts2(&swr,
                                  &mono, AV_SAMPLE_FMT_FLT, out_rate,
                                  &mono, AV_SAMPLE_FMT_FLT, in_rate,
                                  0, nullptr);
    if (ret < 0 || !swr || swr_init(swr) < 0) {
        std::cerr << "[Resampler] Failed to create context for "
                  << in_rate << "Hz -> " << out_rate << "Hz" << std::endl;
        swr_free(&swr);
        return false;
    }

    // Room for the converted input plus whatever the filter still holds
    const int capacity = swr_get_out_samples(swr, static_cast<int>(in.size())) + 256;
    std::vector<float> buffer(static_cast<size_t>(std::max(capacity, 1)));

    const uint8_t* in_ptr = reinterpret_cast<const uint8_t*>(in.data());
    uint8_t* out_ptr = reinterpret_cast<uint8_t*>(buffer.data());

    int produced = swr_convert(swr, &out_ptr, capacity, &in_ptr, static_cast<int>(in.size()));
    if (produced < 0) {
        std::cerr << "[Resampler] swr_convert failed: " << produced << std::endl;
        swr_free(&swr);
        return false;
    }

    // Drain the filter delay
    while (produced < capacity) {
        uint8_t* tail_ptr = reinterpret_cast<uint8_t*>(buffer.data() + produced);
        int flushed = swr_convert(swr, &tail_ptr, capacity - produced, nullptr, 0);
        if (flushed <= 0) break;
        produced += flushed;
    }
    swr_free(&swr);

    buffer.resize(static_cast<size_t>(produced));
    buffer.resize(static_cast<size_t>(expected), 0.0f);
    out = std::move(buffer);
    return true;
}

std::vector<float> Resampler::downmix(const std::vector<float>& interleaved, int channels) {
    if (channels <= 1) {
        return interleaved;
    }

    const size_t frames = interleaved.size() / static_cast<size_t>(channels);
    std::vector<float> mono(frames);
    for (size_t i = 0; i < frames; ++i) {
        float sum = 0.0f;
        for (int ch = 0; ch < channels; ++ch) {
            sum += interleaved[i * channels + ch];
        }
        mono[i] = sum / static_cast<float>(channels);
    }
    return mono;
}

std::vector<int16_t> Resampler::toInt16(const std::vector<float>& samples) {
    std::vector<int16_t> out(samples.size());
    for (size_t i = 0; i < samples.size(); ++i) {
        float sample = std::clamp(samples[i], -1.0f, 1.0f);
        out[i] = static_cast<int16_t>(std::lround(sample * 32767.0f));
    }
    return out;
}

std::vector<float> Resampler::toFloat(const std::vector<int16_t>& samples) {
    std::vector<float> out(samples.size());
    for (size_t i = 0; i < samples.size(); ++i) {
        out[i] = static_cast<float>(samples[i]) / 32768.0f;
    }
    return out;
}

} // namespace lts::audio
