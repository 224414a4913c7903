/**
 * WhisperEngine.hpp - TranscriptionEngine backed by whisper.cpp
 */

#pragma once

#include "lts/stt/TranscriptionEngine.hpp"

#include <memory>
#include <string>

namespace lts::stt {

struct WhisperConfig {
    std::string model_path = "models/whisper/ggml-base.bin";
    std::string language = "en";
    int n_threads = 4;
    bool use_gpu = true;
};

class WhisperEngine : public TranscriptionEngine {
public:
    explicit WhisperEngine(const WhisperConfig& config);
    ~WhisperEngine() override;

    WhisperEngine(const WhisperEngine&) = delete;
    WhisperEngine& operator=(const WhisperEngine&) = delete;

    std::string transcribe(const PcmBuffer& pcm) override;
    bool isReady() const override;
    std::string getModelInfo() const override;

    /** Sample rate whisper expects internally. */
    static constexpr int getSampleRate() { return 16000; }

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace lts::stt
