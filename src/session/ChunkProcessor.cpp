/**
 * ChunkProcessor.cpp - Partial transcription of one fragment
 *
 * Runs on a worker thread. Individual fragments are rarely valid
 * containers until enough data accumulates, so failures here are the
 * normal case and never reach the client.
 */

#include "lts/session/ChunkProcessor.hpp"

#include <cctype>
#include <exception>
#include <iostream>

namespace lts::session {

std::string trim(const std::string& text) {
    size_t begin = 0;
    size_t end = text.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(text[begin]))) ++begin;
    while (end > begin && std::isspace(static_cast<unsigned char>(text[end - 1]))) --end;
    return text.substr(begin, end - begin);
}

ChunkProcessor::ChunkProcessor(std::shared_ptr<audio::AudioDecoder> decoder,
                               std::shared_ptr<stt::TranscriptionEngine> engine,
                               size_t min_chunk_bytes)
    : decoder_(std::move(decoder))
    , engine_(std::move(engine))
    , min_chunk_bytes_(min_chunk_bytes) {
}

bool ChunkProcessor::shouldProcess(const AudioFragment& fragment) const {
    return fragment.bytes.size() > min_chunk_bytes_;
}

std::optional<TranscriptionResult> ChunkProcessor::process(const AudioFragment& fragment) const noexcept {
    try {
        audio::DecodeResult decoded = decoder_->decode(fragment.bytes, fragment.format);

        if (!decoded.ok()) {
            const DecodeError& error = *decoded.error;
            if (isExpectedForPartial(error.kind)) {
                std::cout << "[ChunkProcessor] Chunk " << fragment.sequence
                          << " not decodable yet (" << toString(error.kind) << ")" << std::endl;
            } else {
                std::cerr << "[ChunkProcessor] Chunk " << fragment.sequence
                          << " decode error: " << error.message() << std::endl;
            }
            return std::nullopt;
        }

        std::string text = trim(engine_->transcribe(decoded.pcm));
        if (text.empty()) {
            return std::nullopt;
        }

        TranscriptionResult result;
        result.text = std::move(text);
        result.is_final = false;
        result.chunk = fragment.sequence;
        return result;

    } catch (const stt::TranscriptionError& e) {
        std::cerr << "[ChunkProcessor] Chunk " << fragment.sequence
                  << " transcription failed: " << e.what() << std::endl;
    } catch (const std::exception& e) {
        std::cerr << "[ChunkProcessor] Chunk " << fragment.sequence
                  << " failed: " << e.what() << std::endl;
    }
    return std::nullopt;
}

} // namespace lts::session
