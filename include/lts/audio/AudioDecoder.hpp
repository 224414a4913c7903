/**
 * AudioDecoder.hpp - Compressed audio blob -> canonical PCM
 *
 * Tries an ordered list of strategies; the first success is downmixed to
 * mono, resampled to 48 kHz and converted to 16-bit.
 */

#pragma once

#include "lts/audio/DecodeStrategy.hpp"
#include "lts/core/Errors.hpp"
#include "lts/core/Types.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace lts::audio {

struct DecoderConfig {
    size_t min_input_bytes = 100;
    std::string ffmpeg_path = "ffmpeg";
    int ffmpeg_timeout_ms = 15000;
    std::string temp_dir = "/tmp";
    bool enable_library = true;
    bool enable_process = true;
    bool enable_direct = true;
};

struct DecodeResult {
    PcmBuffer pcm;
    std::optional<DecodeError> error;
    std::string strategy;  // Name of the strategy that succeeded

    bool ok() const { return !error.has_value(); }
};

class AudioDecoder {
public:
    AudioDecoder(std::vector<std::unique_ptr<DecodeStrategy>> strategies,
                 size_t min_input_bytes = 100);
    ~AudioDecoder();

    AudioDecoder(const AudioDecoder&) = delete;
    AudioDecoder& operator=(const AudioDecoder&) = delete;

    /**
     * Build the standard chain: ffmpeg library, ffmpeg process, sndfile.
     */
    static std::shared_ptr<AudioDecoder> createDefault(const DecoderConfig& config);

    /**
     * Decode a blob to canonical PCM. Never throws.
     * @param format Declared container format, passed to strategies as a hint
     */
    DecodeResult decode(const std::vector<uint8_t>& bytes, const std::string& format) const;

    std::vector<std::string> strategyNames() const;
    size_t minInputBytes() const { return min_input_bytes_; }

private:
    std::vector<std::unique_ptr<DecodeStrategy>> strategies_;
    size_t min_input_bytes_;
};

} // namespace lts::audio
