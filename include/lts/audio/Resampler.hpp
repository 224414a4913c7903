/**
 * Resampler.hpp - Band-limited mono resampling via libswresample
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

namespace lts::audio {

class Resampler {
public:
    /**
     * Output length for a given input length: floor(frames * out / in).
     * Zero or negative means the conversion is not representable.
     */
    static int64_t outputLength(size_t frames, int in_rate, int out_rate);

    /**
     * Resample mono float audio. The result has exactly outputLength() samples.
     * @return false if the rates are invalid, the output length is not
     *         positive, or libswresample fails
     */
    static bool resample(const std::vector<float>& in, int in_rate, int out_rate,
                         std::vector<float>& out);

    /** Average all channels of interleaved audio into one. */
    static std::vector<float> downmix(const std::vector<float>& interleaved, int channels);

    static std::vector<int16_t> toInt16(const std::vector<float>& samples);
    static std::vector<float> toFloat(const std::vector<int16_t>& samples);
};

} // namespace lts::audio
