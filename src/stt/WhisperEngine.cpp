/**
 * WhisperEngine.cpp - Speech-to-Text Engine using whisper.cpp
 *
 * Model is loaded once at startup and stays resident. Canonical 48 kHz PCM
 * is resampled to 16 kHz float before inference. The whisper context is not
 * reentrant, so calls are serialized.
 */

#include "lts/stt/WhisperEngine.hpp"
#include "lts/audio/Resampler.hpp"

#include <chrono>
#include <iostream>
#include <mutex>
#include <string>
#include <vector>

#include "whisper.h"

namespace lts::stt {

struct WhisperEngine::Impl {
    WhisperConfig config;

    whisper_context* ctx = nullptr;
    whisper_full_params params;
    std::mutex ctx_mutex;

    explicit Impl(const WhisperConfig& cfg) : config(cfg) {
        struct whisper_context_params cparams = whisper_context_default_params();
        cparams.use_gpu = config.use_gpu;
        ctx = whisper_init_from_file_with_params(config.model_path.c_str(), cparams);

        if (!ctx) {
            std::cerr << "[WhisperEngine] Failed to load model: " << config.model_path << std::endl;
            return;
        }

        // Greedy decoding, each call independent of the previous one
        params = whisper_full_default_params(WHISPER_SAMPLING_GREEDY);
        params.language = config.language.c_str();
        params.n_threads = config.n_threads;
        params.print_progress = false;
        params.print_timestamps = false;
        params.print_realtime = false;
        params.print_special = false;
        params.translate = false;
        params.single_segment = false;
        params.no_context = true;

        std::cout << "[WhisperEngine] Model loaded: " << config.model_path << std::endl;
        std::cout << "[WhisperEngine] Language: " << config.language
                  << ", Threads: " << config.n_threads << std::endl;
    }

    ~Impl() {
        if (ctx) {
            whisper_free(ctx);
            ctx = nullptr;
        }
    }
};

WhisperEngine::WhisperEngine(const WhisperConfig& config)
    : impl_(std::make_unique<Impl>(config)) {
}

WhisperEngine::~WhisperEngine() = default;

std::string WhisperEngine::transcribe(const PcmBuffer& pcm) {
    if (!impl_->ctx) {
        throw TranscriptionError("model not loaded");
    }
    if (pcm.empty()) {
        return "";
    }

    std::vector<float> audio;
    if (!audio::Resampler::resample(audio::Resampler::toFloat(pcm.samples),
                                    pcm.sample_rate, getSampleRate(), audio)) {
        throw TranscriptionError("cannot resample " + std::to_string(pcm.size()) +
                                 " samples to " + std::to_string(getSampleRate()) + "Hz");
    }

    std::lock_guard<std::mutex> lock(impl_->ctx_mutex);

    auto start = std::chrono::steady_clock::now();
    int result = whisper_full(impl_->ctx, impl_->params, audio.data(), static_cast<int>(audio.size()));
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start).count();

    if (result != 0) {
        std::cerr << "[WhisperEngine] Transcription failed: " << result << std::endl;
        throw TranscriptionError("whisper_full returned " + std::to_string(result));
    }

    std::string text;
    const int n_segments = whisper_full_n_segments(impl_->ctx);

    for (int i = 0; i < n_segments; ++i) {
        const char* segment_text = whisper_full_get_segment_text(impl_->ctx, i);
        if (segment_text) {
            text += segment_text;
        }
    }

    std::cout << "[WhisperEngine] " << pcm.durationMs() << "ms of audio in " << elapsed << "ms" << std::endl;
    return text;
}

bool WhisperEngine::isReady() const {
    return impl_ && impl_->ctx != nullptr;
}

std::string WhisperEngine::getModelInfo() const {
    if (!isReady()) {
        return "Model not loaded";
    }
    return "whisper (" + impl_->config.model_path + ")";
}

} // namespace lts::stt
