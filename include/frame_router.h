#pragma once

#include "core/types.h"
#include "errors.h"
#include "transport/transport_interface.h"
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace voxlink {

class EventBus;
class InterruptionCoordinator;

/**
 * @brief Classification of one inbound frame
 */
enum class FrameKind {
    ControlAck,
    TranscriptResult,
    AgentTextResult,
    AgentAudioChunk,
    AgentAudioStart,
    AgentAudioStop,
    VadEvent,
    ErrorFrame,
    AgentThinking,
    FunctionCallRequest,
    Unknown
};

inline const char* frame_kind_to_string(FrameKind kind) {
    switch (kind) {
        case FrameKind::ControlAck: return "control_ack";
        case FrameKind::TranscriptResult: return "transcript_result";
        case FrameKind::AgentTextResult: return "agent_text_result";
        case FrameKind::AgentAudioChunk: return "agent_audio_chunk";
        case FrameKind::AgentAudioStart: return "agent_audio_start";
        case FrameKind::AgentAudioStop: return "agent_audio_stop";
        case FrameKind::VadEvent: return "vad_event";
        case FrameKind::ErrorFrame: return "error_frame";
        case FrameKind::AgentThinking: return "agent_thinking";
        case FrameKind::FunctionCallRequest: return "function_call_request";
        case FrameKind::Unknown: return "unknown";
    }
    return "unknown";
}

/**
 * @brief Classify by frame type and the JSON "type" discriminant
 *
 * Kinds the mode cannot produce (transcripts outside a transcription mode,
 * agent kinds outside an agent mode) come back as Unknown.
 *
 * @param message_type Value of "type" for text frames; ignored for binary
 */
FrameKind classify_frame(Mode mode, transport::FrameType frame_type, const std::string& message_type);

/**
 * @brief Demultiplexes inbound traffic for one connection at a time
 *
 * Must be driven from a single thread per connection (the connection
 * manager calls route() under its lock, in arrival order).
 */
class FrameRouter {
public:
    FrameRouter(InterruptionCoordinator& coordinator, EventBus& events);
    ~FrameRouter();

    FrameRouter(const FrameRouter&) = delete;
    FrameRouter& operator=(const FrameRouter&) = delete;

    /**
     * @brief Start routing for a new connection; clears readiness and counters
     * @param fatal_error_codes Error codes that end the connection
     */
    void begin_connection(Mode mode, const std::vector<std::string>& fatal_error_codes);

    /**
     * @brief Called when the service acknowledges settings
     */
    void set_settings_ack_handler(std::function<void()> handler);

    /**
     * @brief Called after a fatal error frame has been reported
     */
    void set_fatal_error_handler(std::function<void(const Error&)> handler);

    /**
     * @brief Classify and dispatch one frame
     * @return The kind the frame was handled as
     */
    FrameKind route(const transport::Frame& frame);

    Readiness readiness() const;
    uint64_t unknown_frames() const;

private:
    class Impl;
    std::unique_ptr<Impl> pimpl_;
};

} // namespace voxlink
