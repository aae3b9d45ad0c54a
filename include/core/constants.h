#pragma once

/**
 * @file constants.h
 * @brief Protocol and audio constants
 *
 * Defaults for everything the config file can override live here.
 */

namespace voxlink {
namespace constants {

// =============================================================================
// Protocol
// =============================================================================

namespace protocol {
    /// Endpoint used when the config names none and the mode carries the agent
    constexpr const char* DEFAULT_AGENT_ENDPOINT = "wss://agent.deepgram.com/v1/agent/converse";

    /// Endpoint used when the config names none in transcription-only mode
    constexpr const char* DEFAULT_TRANSCRIPTION_ENDPOINT = "wss://api.deepgram.com/v1/listen";

    /// Legacy key prefix stripped before authenticating
    constexpr const char* LEGACY_KEY_PREFIX = "dgkey_";

    /// Time after sending settings before the connection is considered Ready
    /// without an explicit acknowledgement (ms). 0 waits for the ack.
    constexpr int SETTINGS_ACK_GRACE_MS = 1500;

    /// Interval between KeepAlive control messages (ms). 0 disables.
    constexpr int KEEPALIVE_INTERVAL_MS = 5000;

    /// TCP/TLS connect timeout applied by the transport (ms)
    constexpr int CONNECT_TIMEOUT_MS = 10000;

    /// Reader thread poll interval (ms); bounds close() latency
    constexpr int POLL_INTERVAL_MS = 50;

    /// Receive buffer for one curl_ws_recv call
    constexpr int RECV_BUFFER_BYTES = 64 * 1024;

    /// Upstream error code that acknowledges a duplicate settings message
    constexpr const char* SETTINGS_ALREADY_APPLIED = "SETTINGS_ALREADY_APPLIED";
}

// =============================================================================
// Audio
// =============================================================================

namespace audio {
    /// Microphone capture rate sent upstream (Hz)
    constexpr int INPUT_SAMPLE_RATE = 16000;

    /// Agent speech rate received from upstream (Hz)
    constexpr int OUTPUT_SAMPLE_RATE = 24000;

    /// Capture chunk duration (ms)
    constexpr int CHUNK_MS = 20;

    constexpr const char* ENCODING = "linear16";
}

// =============================================================================
// Session defaults
// =============================================================================

namespace defaults {
    constexpr const char* LANGUAGE = "en";
    constexpr const char* TRANSCRIPTION_MODEL = "nova-2";
    constexpr const char* LISTEN_MODEL = "nova-2";
    constexpr const char* THINK_PROVIDER = "open_ai";
    constexpr const char* THINK_MODEL = "gpt-4o-mini";
    constexpr const char* INSTRUCTIONS = "You are a helpful voice assistant.";
    constexpr const char* SPEAK_PROVIDER = "deepgram";
    constexpr const char* VOICE = "aura-asteria-en";
}

} // namespace constants
} // namespace voxlink
