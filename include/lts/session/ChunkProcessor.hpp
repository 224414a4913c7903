/**
 * ChunkProcessor.hpp - Best-effort transcription of a single fragment
 */

#pragma once

#include "lts/audio/AudioDecoder.hpp"
#include "lts/core/Types.hpp"
#include "lts/stt/TranscriptionEngine.hpp"

#include <memory>
#include <optional>
#include <string>

namespace lts::session {

class ChunkProcessor {
public:
    ChunkProcessor(std::shared_ptr<audio::AudioDecoder> decoder,
                   std::shared_ptr<stt::TranscriptionEngine> engine,
                   size_t min_chunk_bytes);

    /**
     * Fragments at or below the threshold are never processed; most are
     * not decodable on their own.
     */
    bool shouldProcess(const AudioFragment& fragment) const;

    /**
     * Decode and transcribe one fragment. Failures are logged and swallowed.
     * @return a partial result, or nullopt on failure or empty text
     */
    std::optional<TranscriptionResult> process(const AudioFragment& fragment) const noexcept;

    size_t minChunkBytes() const { return min_chunk_bytes_; }

private:
    std::shared_ptr<audio::AudioDecoder> decoder_;
    std::shared_ptr<stt::TranscriptionEngine> engine_;
    size_t min_chunk_bytes_;
};

/** Strip leading and trailing whitespace. */
std::string trim(const std::string& text);

} // namespace lts::session
