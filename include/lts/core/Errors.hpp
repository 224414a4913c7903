/**
 * Errors.hpp - Error taxonomy shared by the decoder and the session layer
 *
 * Errors are plain values decided where they happen; callers branch on the
 * kind, never on the message text.
 */

#pragma once

#include <string>

namespace lts {

enum class DecodeErrorKind {
    TooSmall,             // Input under the minimum byte threshold
    ResampleInvalid,      // Computed output length is not positive
    EmptyOutput,          // A strategy succeeded but produced no samples
    AllStrategiesFailed
};

struct DecodeError {
    DecodeErrorKind kind = DecodeErrorKind::AllStrategiesFailed;
    std::string detail;

    std::string message() const;
};

enum class SessionErrorKind {
    EmptyAudio,       // End of stream with no fragments
    EngineNotReady,   // Session opened without an initialized engine
    Protocol,         // Malformed inbound message
    FinalPassFailed   // Decode or transcription failed during finalization
};

struct SessionError {
    SessionErrorKind kind = SessionErrorKind::Protocol;
    std::string message;
};

const char* toString(DecodeErrorKind kind);
const char* toString(SessionErrorKind kind);

/**
 * True for failures that are the normal steady state of a live stream
 * (fragments that are not yet a decodable container on their own).
 */
bool isExpectedForPartial(DecodeErrorKind kind);

} // namespace lts
