/**
 * DecodeStrategy.hpp - One link of the decoder fallback chain
 */

#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace lts::audio {

/**
 * Decoded audio at its native rate and channel count, interleaved float
 * in [-1, 1]. Normalization to canonical PCM happens in AudioDecoder.
 */
struct RawAudio {
    std::vector<float> interleaved;
    int channels = 1;
    int sample_rate = 0;

    size_t frames() const {
        return channels > 0 ? interleaved.size() / static_cast<size_t>(channels) : 0;
    }
};

struct StrategyResult {
    bool ok = false;
    RawAudio audio;
    std::string error;

    static StrategyResult success(RawAudio audio) {
        StrategyResult r;
        r.ok = true;
        r.audio = std::move(audio);
        return r;
    }

    static StrategyResult failure(std::string error) {
        StrategyResult r;
        r.error = std::move(error);
        return r;
    }
};

class DecodeStrategy {
public:
    virtual ~DecodeStrategy() = default;

    virtual std::string name() const = 0;

    /**
     * Decode a complete in-memory blob.
     * @param format Declared container format ("webm", "wav", ...), a hint only
     */
    virtual StrategyResult decode(const std::vector<uint8_t>& bytes,
                                  const std::string& format) const = 0;
};

} // namespace lts::audio
