/**
 * TranscriptionEngine.hpp - Speech-to-text collaborator interface
 *
 * One instance per process, created at startup and shared by every session.
 * Implementations must tolerate concurrent transcribe() calls.
 */

#pragma once

#include "lts/core/Types.hpp"

#include <stdexcept>
#include <string>

namespace lts::stt {

class TranscriptionError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class TranscriptionEngine {
public:
    virtual ~TranscriptionEngine() = default;

    /**
     * Transcribe canonical PCM. Blocks for as long as inference takes.
     * @throws TranscriptionError if the engine fails
     */
    virtual std::string transcribe(const PcmBuffer& pcm) = 0;

    virtual bool isReady() const = 0;

    virtual std::string getModelInfo() const = 0;
};

} // namespace lts::stt
