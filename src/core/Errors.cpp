/**
 * Errors.cpp - Error kind names and classification
 */

#include "lts/core/Errors.hpp"

namespace lts {

const char* toString(DecodeErrorKind kind) {
    switch (kind) {
        case DecodeErrorKind::TooSmall:            return "too_small";
        case DecodeErrorKind::ResampleInvalid:     return "resample_invalid";
        case DecodeErrorKind::EmptyOutput:         return "empty_output";
        case DecodeErrorKind::AllStrategiesFailed: return "all_strategies_failed";
    }
    return "unknown";
}

const char* toString(SessionErrorKind kind) {
    switch (kind) {
        case SessionErrorKind::EmptyAudio:      return "empty_audio";
        case SessionErrorKind::EngineNotReady:  return "engine_not_ready";
        case SessionErrorKind::Protocol:        return "protocol";
        case SessionErrorKind::FinalPassFailed: return "final_pass_failed";
    }
    return "unknown";
}

std::string DecodeError::message() const {
    std::string msg = toString(kind);
    if (!detail.empty()) {
        msg += ": " + detail;
    }
    return msg;
}

bool isExpectedForPartial(DecodeErrorKind kind) {
    switch (kind) {
        case DecodeErrorKind::TooSmall:
        case DecodeErrorKind::EmptyOutput:
        case DecodeErrorKind::AllStrategiesFailed:
            return true;
        case DecodeErrorKind::ResampleInvalid:
            return false;
    }
    return false;
}

} // namespace lts
