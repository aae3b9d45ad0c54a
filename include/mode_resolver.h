#pragma once

#include "core/config.h"
#include "core/types.h"
#include "errors.h"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace voxlink {

/**
 * @brief Copies of the option records last transmitted on this connection
 *
 * captured is false until the first settings message goes out; an uncaptured
 * snapshot never triggers a resend.
 */
struct OptionsSnapshot {
    bool captured = false;
    std::optional<TranscriptionOptions> transcription;
    std::optional<AgentOptions> agent;

    void capture(const ConnectionConfig& config);
    void clear();
};

/**
 * @brief Derive the connection mode from which option records are present
 *
 * Both present -> Dual, agent only -> AgentOnly, transcription only ->
 * TranscriptionOnly, neither -> ConfigError.
 */
Result<Mode> resolve_mode(const ConnectionConfig& config);

/**
 * @brief Build the settings document for one connection
 *
 * Pure function of (mode, config). Records the mode does not carry are
 * omitted, never emitted as null.
 */
nlohmann::json build_settings(Mode mode, const ConnectionConfig& config);

/**
 * @brief Serialized settings message; identical inputs give identical bytes
 */
std::string build_settings_message(Mode mode, const ConnectionConfig& config);

/**
 * @brief True iff settings must be retransmitted for new_config
 *
 * Compares by value only the records the active mode carries. Returns false
 * when the snapshot was never captured.
 */
bool should_resend_settings(const OptionsSnapshot& snapshot, Mode mode,
                            const ConnectionConfig& new_config);

/**
 * @brief Default endpoint for a mode when the config names none
 */
std::string endpoint_for(Mode mode, const ConnectionConfig& config);

/**
 * @brief Parse "transcription_only", "agent_only" or "dual"
 */
std::optional<Mode> parse_mode(const std::string& name);

} // namespace voxlink
