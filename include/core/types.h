#pragma once

/**
 * @file types.h
 * @brief Core type definitions for the VoxLink streaming client
 *
 * Connection, mode and speaking-state enumerations plus the payload
 * records carried by caller-facing events.
 */

#include <cstdint>
#include <vector>
#include <string>
#include <chrono>
#include <functional>

namespace voxlink {

// =============================================================================
// Byte / Audio Types
// =============================================================================

/// Opaque encoded audio or frame payload
using Bytes = std::vector<uint8_t>;

/// Raw audio sample (16-bit signed PCM)
using Sample = int16_t;

// =============================================================================
// Timing Types
// =============================================================================

using Clock = std::chrono::steady_clock;
using TimePoint = Clock::time_point;
using Duration = std::chrono::milliseconds;

/// Milliseconds since the steady clock epoch (for logging)
inline int64_t now_ms() {
    return std::chrono::duration_cast<Duration>(
        Clock::now().time_since_epoch()).count();
}

// =============================================================================
// Session Enumerations
// =============================================================================

/**
 * @brief Which capabilities a connection carries
 *
 * Derived once per connection from which option records are present.
 */
enum class Mode {
    TranscriptionOnly,
    AgentOnly,
    Dual
};

/**
 * @brief Lifecycle of the single streaming connection
 */
enum class ConnectionState {
    Idle,          ///< Never started
    Connecting,    ///< Transport open requested
    Open,          ///< Transport acknowledged, settings not yet sent
    SettingsSent,  ///< Settings transmitted, waiting for acknowledgement
    Ready,         ///< Streaming in both directions
    Closing,       ///< stop() in progress
    Closed,        ///< Stopped by the caller
    Errored        ///< Transport failure or fatal upstream error
};

/**
 * @brief Whether the agent is currently producing speech
 */
enum class AgentSpeakingState {
    Idle,
    Speaking,
    Interrupted
};

const char* to_string(Mode mode);
const char* to_string(ConnectionState state);
const char* to_string(AgentSpeakingState state);

inline bool mode_includes_agent(Mode mode) {
    return mode == Mode::AgentOnly || mode == Mode::Dual;
}

inline bool mode_includes_transcription(Mode mode) {
    return mode == Mode::TranscriptionOnly || mode == Mode::Dual;
}

// =============================================================================
// Event Payloads
// =============================================================================

/// One transcription result (interim or final)
struct TranscriptResult {
    std::string text;
    float confidence = 0.0f;
    bool is_final = false;
    bool speech_final = false;
    double start_s = 0.0;
    double duration_s = 0.0;
};

/// One conversational turn reported by the agent
struct AgentText {
    std::string role;     ///< "user" or "assistant"
    std::string content;
};

enum class VadEventKind {
    SpeechStarted,
    SpeechStopped,
    UtteranceEnd
};

const char* to_string(VadEventKind kind);

struct VadEvent {
    VadEventKind kind = VadEventKind::SpeechStarted;
    double timestamp_s = 0.0;
    float confidence = 0.0f;
};

/// Single function the agent asks the caller to run
struct FunctionCall {
    std::string id;
    std::string name;
    std::string arguments;   ///< JSON text as sent by the service
    bool client_side = true;
};

struct FunctionCallRequest {
    std::vector<FunctionCall> functions;
};

/// Per-connection acknowledgement tracking
struct Readiness {
    bool welcome_received = false;
    bool settings_applied = false;
};

// =============================================================================
// Callback Types
// =============================================================================

/// Capture chunk callback (audio thread)
using AudioChunkCallback = std::function<void(const Bytes&)>;

} // namespace voxlink
