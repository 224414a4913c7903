/**
 * DecodeStrategies.hpp - Concrete decoder fallback strategies
 *
 * Order used by AudioDecoder::createDefault():
 *   1. FFmpegLibraryStrategy  - libavformat/libavcodec from memory
 *   2. FFmpegProcessStrategy  - external ffmpeg tool with a hard timeout
 *   3. SndfileStrategy        - bytes read directly as a PCM container
 */

#pragma once

#include "lts/audio/DecodeStrategy.hpp"

#include <string>

namespace lts::audio {

class FFmpegLibraryStrategy : public DecodeStrategy {
public:
    std::string name() const override { return "ffmpeg-library"; }
    StrategyResult decode(const std::vector<uint8_t>& bytes,
                          const std::string& format) const override;
};

class SndfileStrategy : public DecodeStrategy {
public:
    std::string name() const override { return "sndfile"; }
    StrategyResult decode(const std::vector<uint8_t>& bytes,
                          const std::string& format) const override;
};

class FFmpegProcessStrategy : public DecodeStrategy {
public:
    FFmpegProcessStrategy(std::string ffmpeg_path, int timeout_ms, std::string temp_dir);

    std::string name() const override { return "ffmpeg-process"; }
    StrategyResult decode(const std::vector<uint8_t>& bytes,
                          const std::string& format) const override;

private:
    std::string ffmpeg_path_;
    int timeout_ms_;
    std::string temp_dir_;
    SndfileStrategy wav_reader_;
};

} // namespace lts::audio
