/**
 * @file types.cpp
 * @brief String conversions for core enumerations
 */

#include "core/types.h"

namespace voxlink {

const char* to_string(Mode mode) {
    switch (mode) {
        case Mode::TranscriptionOnly: return "transcription_only";
        case Mode::AgentOnly: return "agent_only";
        case Mode::Dual: return "dual";
    }
    return "unknown";
}

const char* to_string(ConnectionState state) {
    switch (state) {
        case ConnectionState::Idle: return "idle";
        case ConnectionState::Connecting: return "connecting";
        case ConnectionState::Open: return "open";
        case ConnectionState::SettingsSent: return "settings_sent";
        case ConnectionState::Ready: return "ready";
        case ConnectionState::Closing: return "closing";
        case ConnectionState::Closed: return "closed";
        case ConnectionState::Errored: return "errored";
    }
    return "unknown";
}

const char* to_string(AgentSpeakingState state) {
    switch (state) {
        case AgentSpeakingState::Idle: return "idle";
        case AgentSpeakingState::Speaking: return "speaking";
        case AgentSpeakingState::Interrupted: return "interrupted";
    }
    return "unknown";
}

const char* to_string(VadEventKind kind) {
    switch (kind) {
        case VadEventKind::SpeechStarted: return "speech_started";
        case VadEventKind::SpeechStopped: return "speech_stopped";
        case VadEventKind::UtteranceEnd: return "utterance_end";
    }
    return "unknown";
}

} // namespace voxlink
