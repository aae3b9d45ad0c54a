#pragma once

/**
 * @file config.h
 * @brief Client configuration
 *
 * Supports:
 * - JSON file loading
 * - Environment variable overrides (VOXLINK_API_KEY, VOXLINK_ENDPOINT, VOXLINK_DEBUG)
 * - Default values
 * - Validation
 *
 * Option records compare by value; the connection manager relies on that to
 * decide whether an update needs a settings resend.
 */

#include "errors.h"
#include "core/constants.h"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>
#include <optional>

namespace voxlink {
namespace config {

// =============================================================================
// Option Records
// =============================================================================

/**
 * @brief Speech-to-text stream options
 */
struct TranscriptionOptions {
    std::string model = constants::defaults::TRANSCRIPTION_MODEL;
    std::string language = constants::defaults::LANGUAGE;
    std::string encoding = constants::audio::ENCODING;
    int sample_rate = constants::audio::INPUT_SAMPLE_RATE;
    int channels = 1;
    bool interim_results = true;
    bool punctuate = true;
    bool smart_format = true;
    bool vad_events = true;
    std::optional<int> utterance_end_ms;
    std::optional<int> endpointing_ms;
    std::vector<std::string> keyterms;
};

bool operator==(const TranscriptionOptions& a, const TranscriptionOptions& b);
bool operator!=(const TranscriptionOptions& a, const TranscriptionOptions& b);

/// One prior conversation turn replayed to the agent on connect
struct HistoryMessage {
    std::string role;
    std::string content;
};

bool operator==(const HistoryMessage& a, const HistoryMessage& b);

/**
 * @brief Conversational agent options
 */
struct AgentOptions {
    std::string language = constants::defaults::LANGUAGE;
    std::string listen_model = constants::defaults::LISTEN_MODEL;
    std::string think_provider = constants::defaults::THINK_PROVIDER;
    std::string think_model = constants::defaults::THINK_MODEL;
    std::string think_endpoint_url;
    std::string think_api_key;
    std::optional<double> think_temperature;
    std::string instructions = constants::defaults::INSTRUCTIONS;
    std::string speak_provider = constants::defaults::SPEAK_PROVIDER;
    std::string voice = constants::defaults::VOICE;
    std::string greeting;
    nlohmann::json functions = nlohmann::json::array();
    std::vector<HistoryMessage> context;
    bool vad_enabled = true;
};

bool operator==(const AgentOptions& a, const AgentOptions& b);
bool operator!=(const AgentOptions& a, const AgentOptions& b);

// =============================================================================
// Shared Connection Fields
// =============================================================================

struct Credentials {
    std::string api_key;
    std::string auth_scheme = "token";   ///< "token" or "bearer"
};

struct FeatureFlags {
    bool experimental = false;
    bool mip_opt_out = false;
};

struct AudioFormat {
    std::string input_encoding = constants::audio::ENCODING;
    int input_sample_rate = constants::audio::INPUT_SAMPLE_RATE;
    std::string output_encoding = constants::audio::ENCODING;
    int output_sample_rate = constants::audio::OUTPUT_SAMPLE_RATE;
};

/**
 * @brief Timers and upstream error classification
 */
struct ProtocolConfig {
    int settings_ack_grace_ms = constants::protocol::SETTINGS_ACK_GRACE_MS;
    int keepalive_interval_ms = constants::protocol::KEEPALIVE_INTERVAL_MS;
    int connect_timeout_ms = constants::protocol::CONNECT_TIMEOUT_MS;
    std::vector<std::string> fatal_error_codes = {
        "INVALID_SETTINGS",
        "UNPARSABLE_CLIENT_MESSAGE",
        "UNAUTHORIZED",
        "FAILED_TO_LISTEN",
        "FAILED_TO_THINK",
        "FAILED_TO_SPEAK"
    };
};

/**
 * @brief Everything needed to open and configure one streaming connection
 *
 * At least one of transcription / agent must be present.
 */
struct ConnectionConfig {
    std::optional<TranscriptionOptions> transcription;
    std::optional<AgentOptions> agent;

    std::string endpoint;   ///< Empty = default for the resolved mode
    Credentials credentials;
    bool debug = false;
    FeatureFlags features;
    AudioFormat audio_format;
    ProtocolConfig protocol;
};

// =============================================================================
// Command-line Client Configuration
// =============================================================================

struct DeviceConfig {
    std::string input_device = "default";
    std::string output_device = "default";
};

struct LogConfig {
    std::string level = "info";
    std::string file;   ///< Empty = console only
};

/**
 * @brief Complete configuration for the command-line client
 */
struct ClientConfig {
    ConnectionConfig connection;
    DeviceConfig devices;
    LogConfig log;
    bool auto_start_capture = true;

    /**
     * @brief Load configuration from JSON file
     * @param path Path to JSON config file ("~/" is expanded)
     * @return Loaded config or IOError / ParseError / ConfigError
     */
    static Result<ClientConfig> load(const std::string& path);

    /**
     * @brief Parse configuration from an in-memory JSON document
     */
    static Result<ClientConfig> from_json(const nlohmann::json& j);

    /**
     * @brief Save configuration to JSON file
     */
    VoidResult save(const std::string& path) const;

    nlohmann::json to_json() const;

    /**
     * @brief Apply VOXLINK_* environment variables on top of loaded values
     */
    void apply_env_overrides();

    /**
     * @brief Validate configuration
     * @return Error message if invalid, empty if valid
     */
    std::string validate() const;
};

/**
 * @brief Strip surrounding whitespace and the legacy "dgkey_" prefix
 */
std::string normalize_api_key(const std::string& key);

/**
 * @brief Expand a leading "~/" using $HOME
 */
std::string expand_user_path(const std::string& path);

} // namespace config

using config::ConnectionConfig;
using config::TranscriptionOptions;
using config::AgentOptions;
using config::ClientConfig;

} // namespace voxlink
