/**
 * SessionReconciler.hpp - Authoritative transcription over all fragments
 */

#pragma once

#include "lts/audio/AudioDecoder.hpp"
#include "lts/core/Errors.hpp"
#include "lts/core/Types.hpp"
#include "lts/stt/TranscriptionEngine.hpp"

#include <memory>
#include <optional>
#include <vector>

namespace lts::session {

struct ReconcileResult {
    std::optional<TranscriptionResult> result;
    std::optional<SessionError> error;

    bool ok() const { return result.has_value(); }
};

class SessionReconciler {
public:
    SessionReconciler(std::shared_ptr<audio::AudioDecoder> decoder,
                      std::shared_ptr<stt::TranscriptionEngine> engine);

    /**
     * Concatenate, decode and transcribe every fragment of a session.
     * Must only be called once no chunk task of the session is running.
     */
    ReconcileResult reconcile(std::vector<FragmentPtr> fragments) const;

    /** Payloads joined in ascending sequence order. */
    static std::vector<uint8_t> concatenate(std::vector<FragmentPtr> fragments);

private:
    std::shared_ptr<audio::AudioDecoder> decoder_;
    std::shared_ptr<stt::TranscriptionEngine> engine_;
};

} // namespace lts::session
