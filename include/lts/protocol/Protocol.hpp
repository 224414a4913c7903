/**
 * Protocol.hpp - JSON frames exchanged with clients
 *
 * WebSocket inbound:  audio_chunk, end
 * WebSocket outbound: received, transcription, processing, error
 * HTTP:               one-shot transcribe request/response
 */

#pragma once

#include "lts/core/Types.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace lts::protocol {

enum class MessageType {
    AudioChunk,
    End
};

struct InboundMessage {
    MessageType type = MessageType::End;
    std::vector<uint8_t> audio;  // Decoded payload (audio_chunk only)
    std::string format = "webm";
    int sample_rate = CANONICAL_SAMPLE_RATE;
};

struct ParseResult {
    std::optional<InboundMessage> message;
    std::string error;  // Set when message is empty

    bool ok() const { return message.has_value(); }
};

/**
 * Parse one inbound text frame. Never throws.
 */
ParseResult parseInbound(const std::string& frame);

std::string makeReceived(uint64_t chunk);
std::string makeTranscription(const TranscriptionResult& result);
std::string makeProcessing(const std::string& message);
std::string makeError(const std::string& error);

// --- One-shot HTTP ---

struct TranscribeRequest {
    std::vector<uint8_t> audio;
    int sample_rate = CANONICAL_SAMPLE_RATE;
    std::string format = "wav";
};

struct TranscribeRequestResult {
    std::optional<TranscribeRequest> request;
    std::string error;

    bool ok() const { return request.has_value(); }
};

TranscribeRequestResult parseTranscribeRequest(const std::string& body);

std::string makeTranscribeSuccess(const std::string& text);
std::string makeTranscribeFailure(const std::string& error);

} // namespace lts::protocol
