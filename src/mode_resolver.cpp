#include "mode_resolver.h"
#include "logger.h"

using json = nlohmann::json;

namespace voxlink {

void OptionsSnapshot::capture(const ConnectionConfig& config) {
    transcription = config.transcription;
    agent = config.agent;
    captured = true;
}

void OptionsSnapshot::clear() {
    transcription.reset();
    agent.reset();
    captured = false;
}

Result<Mode> resolve_mode(const ConnectionConfig& config) {
    if (config.transcription && config.agent) {
        return Mode::Dual;
    }
    if (config.agent) {
        return Mode::AgentOnly;
    }
    if (config.transcription) {
        return Mode::TranscriptionOnly;
    }
    return make_config_error("Neither transcription nor agent options were provided");
}

namespace {

json transcription_record(const TranscriptionOptions& t) {
    json j = {
        {"model", t.model},
        {"language", t.language},
        {"encoding", t.encoding},
        {"sample_rate", t.sample_rate},
        {"channels", t.channels},
        {"interim_results", t.interim_results},
        {"punctuate", t.punctuate},
        {"smart_format", t.smart_format},
        {"vad_events", t.vad_events}
    };
    if (t.utterance_end_ms) {
        j["utterance_end_ms"] = *t.utterance_end_ms;
    }
    if (t.endpointing_ms) {
        j["endpointing"] = *t.endpointing_ms;
    }
    if (!t.keyterms.empty()) {
        j["keyterms"] = t.keyterms;
    }
    return j;
}

json agent_record(const AgentOptions& a, const std::optional<TranscriptionOptions>& transcription) {
    json think_provider = {
        {"type", a.think_provider},
        {"model", a.think_model}
    };
    if (a.think_temperature) {
        think_provider["temperature"] = *a.think_temperature;
    }

    json think = {
        {"provider", think_provider},
        {"prompt", a.instructions}
    };
    // A custom think endpoint is only usable with its own key
    if (!a.think_endpoint_url.empty() && !a.think_api_key.empty()) {
        think["endpoint"] = {
            {"url", a.think_endpoint_url},
            {"headers", {{"authorization", "bearer " + a.think_api_key}}}
        };
    }
    if (a.functions.is_array() && !a.functions.empty()) {
        think["functions"] = a.functions;
    }

    json vad = {{"enabled", a.vad_enabled}};
    if (transcription && transcription->utterance_end_ms) {
        vad["utterance_end_ms"] = *transcription->utterance_end_ms;
    }

    json j = {
        {"language", a.language},
        {"listen", {{"provider", {{"type", "deepgram"}, {"model", a.listen_model}}}}},
        {"think", think},
        {"speak", {{"provider", {{"type", a.speak_provider}, {"model", a.voice}}}}},
        {"vad", vad}
    };
    if (!a.greeting.empty()) {
        j["greeting"] = a.greeting;
    }
    if (!a.context.empty()) {
        json messages = json::array();
        for (const auto& m : a.context) {
            messages.push_back({{"type", "History"}, {"role", m.role}, {"content", m.content}});
        }
        j["context"] = {{"messages", messages}};
    }
    return j;
}

} // anonymous namespace

json build_settings(Mode mode, const ConnectionConfig& config) {
    const auto& fmt = config.audio_format;

    json audio = {
        {"input", {{"encoding", fmt.input_encoding}, {"sample_rate", fmt.input_sample_rate}}}
    };
    if (mode_includes_agent(mode)) {
        audio["output"] = {{"encoding", fmt.output_encoding}, {"sample_rate", fmt.output_sample_rate}};
    }

    json settings = {
        {"type", "Settings"},
        {"mode", to_string(mode)},
        {"audio", audio},
        {"features", {
            {"experimental", config.features.experimental},
            {"mip_opt_out", config.features.mip_opt_out}
        }}
    };

    if (mode_includes_transcription(mode) && config.transcription) {
        settings["transcription"] = transcription_record(*config.transcription);
    }
    if (mode_includes_agent(mode) && config.agent) {
        const std::optional<TranscriptionOptions> tuning =
            mode == Mode::Dual ? config.transcription : std::optional<TranscriptionOptions>();
        settings["agent"] = agent_record(*config.agent, tuning);
    }
    return settings;
}

std::string build_settings_message(Mode mode, const ConnectionConfig& config) {
    // nlohmann::json objects keep keys sorted, so dump() is stable
    return build_settings(mode, config).dump();
}

bool should_resend_settings(const OptionsSnapshot& snapshot, Mode mode,
                            const ConnectionConfig& new_config) {
    if (!snapshot.captured) {
        LOG_SETTINGS("No settings sent yet on this connection; resend not needed");
        return false;
    }

    bool changed = false;
    if (mode_includes_transcription(mode) && snapshot.transcription != new_config.transcription) {
        changed = true;
    }
    if (mode_includes_agent(mode) && snapshot.agent != new_config.agent) {
        changed = true;
    }
    return changed;
}

std::string endpoint_for(Mode mode, const ConnectionConfig& config) {
    if (!config.endpoint.empty()) {
        return config.endpoint;
    }
    if (mode == Mode::TranscriptionOnly) {
        return constants::protocol::DEFAULT_TRANSCRIPTION_ENDPOINT;
    }
    return constants::protocol::DEFAULT_AGENT_ENDPOINT;
}

std::optional<Mode> parse_mode(const std::string& name) {
    if (name == "transcription_only") return Mode::TranscriptionOnly;
    if (name == "agent_only") return Mode::AgentOnly;
    if (name == "dual") return Mode::Dual;
    return std::nullopt;
}

} // namespace voxlink
