/**
 * AudioDecoder.cpp - Fallback chain and canonical normalization
 */

#include "lts/audio/AudioDecoder.hpp"
#include "lts/audio/DecodeStrategies.hpp"
#include "lts/audio/Resampler.hpp"

#include <iostream>

namespace lts::audio {

namespace {

DecodeResult fail(DecodeErrorKind kind, std::string detail) {
    DecodeResult result;
    result.error = DecodeError{kind, std::move(detail)};
    return result;
}

} // anonymous namespace

AudioDecoder::AudioDecoder(std::vector<std::unique_ptr<DecodeStrategy>> strategies,
                           size_t min_input_bytes)
    : strategies_(std::move(strategies))
    , min_input_bytes_(min_input_bytes) {
}

AudioDecoder::~AudioDecoder() = default;

std::shared_ptr<AudioDecoder> AudioDecoder::createDefault(const DecoderConfig& config) {
    std::vector<std::unique_ptr<DecodeStrategy>> chain;

    if (config.enable_library) {
        chain.push_back(std::make_unique<FFmpegLibraryStrategy>());
    }
    if (config.enable_process) {
        chain.push_back(std::make_unique<FFmpegProcessStrategy>(
            config.ffmpeg_path, config.ffmpeg_timeout_ms, config.temp_dir));
    }
    if (config.enable_direct) {
        chain.push_back(std::make_unique<SndfileStrategy>());
    }

    auto decoder = std::make_shared<AudioDecoder>(std::move(chain), config.min_input_bytes);

    std::cout << "[AudioDecoder] Strategies:";
    for (const auto& name : decoder->strategyNames()) {
        std::cout << " " << name;
    }
    std::cout << std::endl;

    return decoder;
}

std::vector<std::string> AudioDecoder::strategyNames() const {
    std::vector<std::string> names;
    names.reserve(strategies_.size());
    for (const auto& strategy : strategies_) {
        names.push_back(strategy->name());
    }
    return names;
}

DecodeResult AudioDecoder::decode(const std::vector<uint8_t>& bytes, const std::string& format) const {
    // Small fragments are routine in streaming mode; fail before any work
    if (bytes.size() < min_input_bytes_) {
        return fail(DecodeErrorKind::TooSmall,
                    std::to_string(bytes.size()) + " bytes, need at least " +
                    std::to_string(min_input_bytes_));
    }

    if (strategies_.empty()) {
        return fail(DecodeErrorKind::AllStrategiesFailed, "no strategies configured");
    }

    StrategyResult decoded;
    std::string winner;
    for (const auto& strategy : strategies_) {
        StrategyResult attempt = strategy->decode(bytes, format);
        if (attempt.ok) {
            decoded = std::move(attempt);
            winner = strategy->name();
            break;
        }
        std::cout << "[AudioDecoder] " << strategy->name() << " failed: " << attempt.error << std::endl;
        decoded = std::move(attempt);
        winner.clear();
    }

    if (!decoded.ok) {
        // Report the last failure
        return fail(DecodeErrorKind::AllStrategiesFailed, decoded.error);
    }

    RawAudio& raw = decoded.audio;
    if (raw.frames() == 0) {
        return fail(DecodeErrorKind::EmptyOutput, winner + " produced no samples");
    }

    std::vector<float> mono = Resampler::downmix(raw.interleaved, raw.channels);

    std::vector<float> resampled;
    if (!Resampler::resample(mono, raw.sample_rate, CANONICAL_SAMPLE_RATE, resampled)) {
        return fail(DecodeErrorKind::ResampleInvalid,
                    std::to_string(mono.size()) + " samples at " +
                    std::to_string(raw.sample_rate) + "Hz");
    }

    DecodeResult result;
    result.pcm.samples = Resampler::toInt16(resampled);
    result.pcm.sample_rate = CANONICAL_SAMPLE_RATE;
    result.strategy = winner;

    if (result.pcm.empty()) {
        return fail(DecodeErrorKind::EmptyOutput, winner + " produced no samples");
    }

    return result;
}

} // namespace lts::audio
