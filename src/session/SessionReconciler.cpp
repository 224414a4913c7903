/**
 * SessionReconciler.cpp - Final pass over the whole stream
 *
 * The concatenated stream is usually a valid container even when the
 * individual fragments were not. Failures here are reported to the client.
 */

#include "lts/session/SessionReconciler.hpp"
#include "lts/session/ChunkProcessor.hpp"

#include <algorithm>
#include <exception>
#include <iostream>

namespace lts::session {

namespace {

ReconcileResult failure(SessionErrorKind kind, std::string message) {
    ReconcileResult r;
    r.error = SessionError{kind, std::move(message)};
    return r;
}

} // anonymous namespace

SessionReconciler::SessionReconciler(std::shared_ptr<audio::AudioDecoder> decoder,
                                     std::shared_ptr<stt::TranscriptionEngine> engine)
    : decoder_(std::move(decoder))
    , engine_(std::move(engine)) {
}

std::vector<uint8_t> SessionReconciler::concatenate(std::vector<FragmentPtr> fragments) {
    std::stable_sort(fragments.begin(), fragments.end(),
                     [](const FragmentPtr& a, const FragmentPtr& b) {
                         return a->sequence < b->sequence;
                     });

    size_t total = 0;
    for (const auto& fragment : fragments) {
        total += fragment->bytes.size();
    }

    std::vector<uint8_t> stream;
    stream.reserve(total);
    for (const auto& fragment : fragments) {
        stream.insert(stream.end(), fragment->bytes.begin(), fragment->bytes.end());
    }
    return stream;
}

ReconcileResult SessionReconciler::reconcile(std::vector<FragmentPtr> fragments) const {
    if (fragments.empty()) {
        return failure(SessionErrorKind::EmptyAudio, "No audio data received");
    }

    const std::string format = fragments.front()->format;
    std::vector<uint8_t> stream = concatenate(std::move(fragments));

    if (stream.empty()) {
        return failure(SessionErrorKind::EmptyAudio, "No audio data received");
    }

    std::cout << "[SessionReconciler] Final pass over " << stream.size() << " bytes" << std::endl;

    audio::DecodeResult decoded = decoder_->decode(stream, format);
    if (!decoded.ok()) {
        std::cerr << "[SessionReconciler] Decode failed: " << decoded.error->message() << std::endl;
        return failure(SessionErrorKind::FinalPassFailed,
                       "Audio processing failed: " + decoded.error->message());
    }

    try {
        TranscriptionResult result;
        result.text = trim(engine_->transcribe(decoded.pcm));
        result.is_final = true;

        ReconcileResult r;
        r.result = std::move(result);
        return r;
    } catch (const std::exception& e) {
        std::cerr << "[SessionReconciler] Transcription failed: " << e.what() << std::endl;
        return failure(SessionErrorKind::FinalPassFailed,
                       std::string("Audio processing failed: ") + e.what());
    }
}

} // namespace lts::session
