#pragma once

#include "core/types.h"
#include <functional>
#include <memory>

namespace voxlink {

namespace audio {
class IAudioAdapter; // Forward declaration
}

using SpeakingListener = std::function<void(AgentSpeakingState prev, AgentSpeakingState next)>;

/**
 * @brief Playback gate and agent speaking state
 *
 * Every inbound agent audio chunk passes through forward_chunk(). The gate
 * flag and the flush happen under the same lock as forwarding, so once
 * interrupt_agent() returns no chunk already received or still arriving
 * reaches the playback queue until allow_agent().
 *
 * Microphone capture is never gated here.
 */
class InterruptionCoordinator {
public:
    InterruptionCoordinator();
    ~InterruptionCoordinator();

    // Set audio adapter (must be called before audio flows; may be null in tests)
    void set_audio_adapter(audio::IAudioAdapter* adapter);

    void set_speaking_listener(SpeakingListener listener);

    /**
     * @brief Close the gate and flush queued playback before returning
     *
     * Speaking becomes Interrupted; Idle stays Idle.
     */
    void interrupt_agent();

    /**
     * @brief Reopen the gate for subsequent chunks; Interrupted becomes Idle
     *
     * Audio dropped while closed is not replayed.
     */
    void allow_agent();

    /**
     * @brief Forward one agent audio chunk to playback if the gate is open
     * @return True if enqueued
     */
    bool forward_chunk(const Bytes& chunk);

    // Agent started an utterance
    void on_audio_start();

    // Agent finished an utterance; only Speaking returns to Idle
    void on_audio_stop();

    /**
     * @brief Drop queued playback without touching the gate (used on stop)
     */
    void flush();

    /**
     * @brief New connection: gate open, Idle, counters cleared
     */
    void reset();

    bool is_audio_allowed() const;
    AgentSpeakingState speaking_state() const;
    uint64_t dropped_chunks() const;

private:
    class Impl;
    std::unique_ptr<Impl> pimpl_;
};

} // namespace voxlink
