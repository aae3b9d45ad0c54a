#pragma once

#include "core/config.h"
#include "core/scheduler.h"
#include "core/types.h"
#include "errors.h"
#include "events.h"
#include "transport/transport_interface.h"
#include <memory>
#include <optional>
#include <string>

namespace voxlink {

namespace audio {
class IAudioAdapter; // Forward declaration
}

/**
 * @brief Real-time voice streaming client
 *
 * Owns one streaming connection, the frame router and the interruption
 * coordinator. Audio devices stay with the caller behind IAudioAdapter.
 *
 * Send-type operations (send_audio, option updates, injected messages)
 * require the Ready state and return NotReady otherwise, including after
 * a fatal error until the next start().
 */
class VoiceClient {
public:
    /**
     * @param transport Socket implementation (owned)
     * @param scheduler Timer service for the settings grace period and keepalive (owned)
     * @param audio Audio adapter (not owned, may be null; must outlive the client)
     */
    VoiceClient(std::unique_ptr<transport::ITransport> transport,
                std::unique_ptr<IScheduler> scheduler,
                audio::IAudioAdapter* audio);
    ~VoiceClient();

    VoiceClient(const VoiceClient&) = delete;
    VoiceClient& operator=(const VoiceClient&) = delete;

    // --- lifecycle ---

    /**
     * @brief Connect with the given configuration
     *
     * ConfigError if neither option record is present (no socket is opened);
     * AlreadyConnecting while a previous start() is still in flight; success
     * without side effects when already Ready.
     */
    VoidResult start(const ConnectionConfig& config);

    /**
     * @brief Close the connection, stop capture and flush playback. Safe from any state.
     */
    void stop();

    // --- option updates ---

    /**
     * @brief Replace the agent options of a running session
     * @return true if settings were resent, false if the value was unchanged
     */
    Result<bool> update_agent_options(const AgentOptions& options);

    /**
     * @brief Replace the transcription options of a running session
     */
    Result<bool> update_transcription_options(const TranscriptionOptions& options);

    // --- interruption ---

    /**
     * @brief Stop agent playback now; later agent audio is dropped until allow_agent()
     */
    void interrupt_agent();

    /**
     * @brief Let subsequent agent audio play again
     */
    void allow_agent();

    // --- upstream ---

    VoidResult send_audio(const Bytes& chunk);

    /**
     * @brief Start or stop microphone capture through the audio adapter
     */
    VoidResult set_microphone_enabled(bool enabled);

    /**
     * @brief When set, capture starts on Ready and stops when leaving Ready (default true)
     */
    void set_auto_start_capture(bool enabled);

    VoidResult inject_user_message(const std::string& content);
    VoidResult inject_agent_message(const std::string& content);

    /**
     * @brief Replace the agent prompt in place (UpdatePrompt)
     */
    VoidResult update_instructions(const std::string& prompt);

    /**
     * @brief Switch the agent voice in place (UpdateSpeak)
     */
    VoidResult update_speak(const std::string& voice);

    /**
     * @brief Answer a FunctionCallRequest
     */
    VoidResult send_function_call_response(const std::string& id,
                                           const std::string& name,
                                           const std::string& content);

    // --- events ---

    SubscriptionId subscribe(ClientCallbacks callbacks);
    void unsubscribe(SubscriptionId id);

    // --- observers ---

    ConnectionState state() const;
    std::optional<Mode> mode() const;
    AgentSpeakingState agent_speaking_state() const;
    bool is_audio_allowed() const;
    bool is_microphone_enabled() const;
    Readiness readiness() const;

private:
    class Impl;
    std::unique_ptr<Impl> pimpl_;
};

} // namespace voxlink
