/**
 * Types.hpp - Shared audio and result types
 */

#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace lts {

// Canonical PCM handed to the transcription engine
constexpr int CANONICAL_SAMPLE_RATE = 48000;

/**
 * One raw chunk of compressed audio as received from the transport.
 * Immutable once created; shared between the session and a chunk task.
 */
struct AudioFragment {
    uint64_t sequence = 0;
    std::string format = "webm";
    int sample_rate = CANONICAL_SAMPLE_RATE;
    std::vector<uint8_t> bytes;
};

using FragmentPtr = std::shared_ptr<const AudioFragment>;

/**
 * Mono 16-bit PCM at CANONICAL_SAMPLE_RATE.
 */
struct PcmBuffer {
    std::vector<int16_t> samples;
    int sample_rate = CANONICAL_SAMPLE_RATE;

    bool empty() const { return samples.empty(); }
    size_t size() const { return samples.size(); }

    int durationMs() const {
        return sample_rate > 0
            ? static_cast<int>(samples.size() * 1000 / static_cast<size_t>(sample_rate))
            : 0;
    }
};

struct TranscriptionResult {
    std::string text;
    bool is_final = false;
    std::optional<uint64_t> chunk;  // Set for partial results only
};

} // namespace lts
