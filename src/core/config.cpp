/**
 * @file config.cpp
 * @brief Configuration loading, saving and validation
 */

#include "core/config.h"
#include "logger.h"
#include <fstream>
#include <sstream>
#include <cstdlib>

using json = nlohmann::json;

namespace voxlink {
namespace config {

// =============================================================================
// Value Comparison
// =============================================================================

bool operator==(const TranscriptionOptions& a, const TranscriptionOptions& b) {
    return a.model == b.model &&
           a.language == b.language &&
           a.encoding == b.encoding &&
           a.sample_rate == b.sample_rate &&
           a.channels == b.channels &&
           a.interim_results == b.interim_results &&
           a.punctuate == b.punctuate &&
           a.smart_format == b.smart_format &&
           a.vad_events == b.vad_events &&
           a.utterance_end_ms == b.utterance_end_ms &&
           a.endpointing_ms == b.endpointing_ms &&
           a.keyterms == b.keyterms;
}

bool operator!=(const TranscriptionOptions& a, const TranscriptionOptions& b) {
    return !(a == b);
}

bool operator==(const HistoryMessage& a, const HistoryMessage& b) {
    return a.role == b.role && a.content == b.content;
}

bool operator==(const AgentOptions& a, const AgentOptions& b) {
    return a.language == b.language &&
           a.listen_model == b.listen_model &&
           a.think_provider == b.think_provider &&
           a.think_model == b.think_model &&
           a.think_endpoint_url == b.think_endpoint_url &&
           a.think_api_key == b.think_api_key &&
           a.think_temperature == b.think_temperature &&
           a.instructions == b.instructions &&
           a.speak_provider == b.speak_provider &&
           a.voice == b.voice &&
           a.greeting == b.greeting &&
           a.functions == b.functions &&
           a.context == b.context &&
           a.vad_enabled == b.vad_enabled;
}

bool operator!=(const AgentOptions& a, const AgentOptions& b) {
    return !(a == b);
}

// =============================================================================
// JSON Serialization Helpers
// =============================================================================

namespace {

template<typename T>
T get_or_default(const json& j, const std::string& key, const T& default_val) {
    if (j.contains(key) && !j[key].is_null()) {
        return j[key].get<T>();
    }
    return default_val;
}

template<typename T>
std::vector<T> get_array_or_default(const json& j, const std::string& key,
                                    const std::vector<T>& default_val) {
    if (j.contains(key) && j[key].is_array()) {
        return j[key].get<std::vector<T>>();
    }
    return default_val;
}

template<typename T>
std::optional<T> get_optional(const json& j, const std::string& key) {
    if (j.contains(key) && !j[key].is_null()) {
        return j[key].get<T>();
    }
    return std::nullopt;
}

template<typename T>
void put_optional(json& j, const std::string& key, const std::optional<T>& value) {
    if (value) {
        j[key] = *value;
    }
}

TranscriptionOptions parse_transcription_options(const json& t) {
    TranscriptionOptions options;
    options.model = get_or_default(t, "model", options.model);
    options.language = get_or_default(t, "language", options.language);
    options.encoding = get_or_default(t, "encoding", options.encoding);
    options.sample_rate = get_or_default(t, "sample_rate", options.sample_rate);
    options.channels = get_or_default(t, "channels", options.channels);
    options.interim_results = get_or_default(t, "interim_results", options.interim_results);
    options.punctuate = get_or_default(t, "punctuate", options.punctuate);
    options.smart_format = get_or_default(t, "smart_format", options.smart_format);
    options.vad_events = get_or_default(t, "vad_events", options.vad_events);
    options.utterance_end_ms = get_optional<int>(t, "utterance_end_ms");
    options.endpointing_ms = get_optional<int>(t, "endpointing_ms");
    options.keyterms = get_array_or_default<std::string>(t, "keyterms", options.keyterms);
    return options;
}

AgentOptions parse_agent_options(const json& a) {
    AgentOptions options;
    options.language = get_or_default(a, "language", options.language);
    options.listen_model = get_or_default(a, "listen_model", options.listen_model);
    options.think_provider = get_or_default(a, "think_provider", options.think_provider);
    options.think_model = get_or_default(a, "think_model", options.think_model);
    options.think_endpoint_url = get_or_default(a, "think_endpoint_url", options.think_endpoint_url);
    options.think_api_key = get_or_default(a, "think_api_key", options.think_api_key);
    options.think_temperature = get_optional<double>(a, "think_temperature");
    options.instructions = get_or_default(a, "instructions", options.instructions);
    options.speak_provider = get_or_default(a, "speak_provider", options.speak_provider);
    options.voice = get_or_default(a, "voice", options.voice);
    options.greeting = get_or_default(a, "greeting", options.greeting);
    if (a.contains("functions") && a["functions"].is_array()) {
        options.functions = a["functions"];
    }
    if (a.contains("context") && a["context"].is_array()) {
        for (const auto& m : a["context"]) {
            HistoryMessage msg;
            msg.role = get_or_default<std::string>(m, "role", "user");
            msg.content = get_or_default<std::string>(m, "content", "");
            options.context.push_back(msg);
        }
    }
    options.vad_enabled = get_or_default(a, "vad_enabled", options.vad_enabled);
    return options;
}

void parse_connection_section(const json& j, ConnectionConfig& config) {
    if (!j.contains("connection")) return;

    const auto& c = j["connection"];
    config.endpoint = get_or_default(c, "endpoint", config.endpoint);
    config.credentials.api_key = get_or_default(c, "api_key", config.credentials.api_key);
    config.credentials.auth_scheme = get_or_default(c, "auth_scheme", config.credentials.auth_scheme);
    config.debug = get_or_default(c, "debug", config.debug);

    if (c.contains("features")) {
        const auto& f = c["features"];
        config.features.experimental = get_or_default(f, "experimental", config.features.experimental);
        config.features.mip_opt_out = get_or_default(f, "mip_opt_out", config.features.mip_opt_out);
    }

    if (c.contains("audio_format")) {
        const auto& a = c["audio_format"];
        auto& fmt = config.audio_format;
        fmt.input_encoding = get_or_default(a, "input_encoding", fmt.input_encoding);
        fmt.input_sample_rate = get_or_default(a, "input_sample_rate", fmt.input_sample_rate);
        fmt.output_encoding = get_or_default(a, "output_encoding", fmt.output_encoding);
        fmt.output_sample_rate = get_or_default(a, "output_sample_rate", fmt.output_sample_rate);
    }
}

ProtocolConfig parse_protocol_config(const json& j) {
    ProtocolConfig config;
    if (!j.contains("protocol")) return config;

    const auto& p = j["protocol"];
    config.settings_ack_grace_ms = get_or_default(p, "settings_ack_grace_ms", config.settings_ack_grace_ms);
    config.keepalive_interval_ms = get_or_default(p, "keepalive_interval_ms", config.keepalive_interval_ms);
    config.connect_timeout_ms = get_or_default(p, "connect_timeout_ms", config.connect_timeout_ms);
    config.fatal_error_codes = get_array_or_default<std::string>(p, "fatal_error_codes", config.fatal_error_codes);
    return config;
}

json transcription_options_to_json(const TranscriptionOptions& options) {
    json j = {
        {"model", options.model},
        {"language", options.language},
        {"encoding", options.encoding},
        {"sample_rate", options.sample_rate},
        {"channels", options.channels},
        {"interim_results", options.interim_results},
        {"punctuate", options.punctuate},
        {"smart_format", options.smart_format},
        {"vad_events", options.vad_events},
        {"keyterms", options.keyterms}
    };
    put_optional(j, "utterance_end_ms", options.utterance_end_ms);
    put_optional(j, "endpointing_ms", options.endpointing_ms);
    return j;
}

json agent_options_to_json(const AgentOptions& options) {
    json context = json::array();
    for (const auto& m : options.context) {
        context.push_back({{"role", m.role}, {"content", m.content}});
    }
    json j = {
        {"language", options.language},
        {"listen_model", options.listen_model},
        {"think_provider", options.think_provider},
        {"think_model", options.think_model},
        {"think_endpoint_url", options.think_endpoint_url},
        {"think_api_key", options.think_api_key},
        {"instructions", options.instructions},
        {"speak_provider", options.speak_provider},
        {"voice", options.voice},
        {"greeting", options.greeting},
        {"functions", options.functions},
        {"context", context},
        {"vad_enabled", options.vad_enabled}
    };
    put_optional(j, "think_temperature", options.think_temperature);
    return j;
}

json connection_section_to_json(const ConnectionConfig& config) {
    return {
        {"endpoint", config.endpoint},
        {"api_key", config.credentials.api_key},
        {"auth_scheme", config.credentials.auth_scheme},
        {"debug", config.debug},
        {"features", {
            {"experimental", config.features.experimental},
            {"mip_opt_out", config.features.mip_opt_out}
        }},
        {"audio_format", {
            {"input_encoding", config.audio_format.input_encoding},
            {"input_sample_rate", config.audio_format.input_sample_rate},
            {"output_encoding", config.audio_format.output_encoding},
            {"output_sample_rate", config.audio_format.output_sample_rate}
        }}
    };
}

json protocol_config_to_json(const ProtocolConfig& config) {
    return {
        {"settings_ack_grace_ms", config.settings_ack_grace_ms},
        {"keepalive_interval_ms", config.keepalive_interval_ms},
        {"connect_timeout_ms", config.connect_timeout_ms},
        {"fatal_error_codes", config.fatal_error_codes}
    };
}

bool env_flag(const char* value) {
    std::string v = value;
    return v == "1" || v == "true" || v == "yes" || v == "on";
}

} // anonymous namespace

// =============================================================================
// Helpers
// =============================================================================

std::string normalize_api_key(const std::string& key) {
    const char* ws = " \t\r\n";
    size_t first = key.find_first_not_of(ws);
    if (first == std::string::npos) {
        return "";
    }
    size_t last = key.find_last_not_of(ws);
    std::string trimmed = key.substr(first, last - first + 1);

    const std::string prefix = constants::protocol::LEGACY_KEY_PREFIX;
    if (trimmed.compare(0, prefix.size(), prefix) == 0) {
        return trimmed.substr(prefix.size());
    }
    return trimmed;
}

std::string expand_user_path(const std::string& path) {
    if (path.size() >= 2 && path[0] == '~' && path[1] == '/') {
        const char* home = std::getenv("HOME");
        if (home) {
            return std::string(home) + path.substr(1);
        }
    }
    return path;
}

// =============================================================================
// ClientConfig Implementation
// =============================================================================

Result<ClientConfig> ClientConfig::from_json(const json& j) {
    try {
        ClientConfig config;

        parse_connection_section(j, config.connection);
        if (j.contains("transcription") && j["transcription"].is_object()) {
            config.connection.transcription = parse_transcription_options(j["transcription"]);
        }
        if (j.contains("agent") && j["agent"].is_object()) {
            config.connection.agent = parse_agent_options(j["agent"]);
        }
        config.connection.protocol = parse_protocol_config(j);

        if (j.contains("devices")) {
            const auto& d = j["devices"];
            config.devices.input_device = get_or_default(d, "input_device", config.devices.input_device);
            config.devices.output_device = get_or_default(d, "output_device", config.devices.output_device);
        }
        if (j.contains("log")) {
            const auto& l = j["log"];
            config.log.level = get_or_default(l, "level", config.log.level);
            config.log.file = expand_user_path(get_or_default(l, "file", config.log.file));
        }
        config.auto_start_capture = get_or_default(j, "auto_start_capture", config.auto_start_capture);
        return config;

    } catch (const json::exception& e) {
        return make_parse_error(std::string("Invalid config value: ") + e.what());
    }
}

Result<ClientConfig> ClientConfig::load(const std::string& path) {
    std::string resolved = expand_user_path(path);
    std::ifstream file(resolved);
    if (!file.is_open()) {
        return make_io_error("Failed to open config file: " + resolved);
    }

    json j;
    try {
        j = json::parse(file);
    } catch (const json::exception& e) {
        return make_parse_error(std::string("JSON parse error: ") + e.what());
    }

    auto parsed = from_json(j);
    if (!parsed) {
        return parsed;
    }

    ClientConfig config = std::move(parsed.value());
    config.apply_env_overrides();

    std::string validation_error = config.validate();
    if (!validation_error.empty()) {
        return make_config_error("Config validation failed: " + validation_error);
    }

    Logger::info("Configuration loaded from: " + resolved);
    return config;
}

json ClientConfig::to_json() const {
    json j;
    j["connection"] = connection_section_to_json(connection);
    if (connection.transcription) {
        j["transcription"] = transcription_options_to_json(*connection.transcription);
    }
    if (connection.agent) {
        j["agent"] = agent_options_to_json(*connection.agent);
    }
    j["protocol"] = protocol_config_to_json(connection.protocol);
    j["devices"] = {
        {"input_device", devices.input_device},
        {"output_device", devices.output_device}
    };
    j["log"] = {
        {"level", log.level},
        {"file", log.file}
    };
    j["auto_start_capture"] = auto_start_capture;
    return j;
}

VoidResult ClientConfig::save(const std::string& path) const {
    std::string resolved = expand_user_path(path);
    std::ofstream file(resolved);
    if (!file.is_open()) {
        return make_io_error("Failed to open file for writing: " + resolved);
    }

    file << to_json().dump(2);
    if (!file.good()) {
        return make_io_error("Failed to write config file: " + resolved);
    }
    Logger::info("Configuration saved to: " + resolved);
    return VoidResult();
}

void ClientConfig::apply_env_overrides() {
    if (const char* key = std::getenv("VOXLINK_API_KEY")) {
        connection.credentials.api_key = key;
    }
    if (const char* endpoint = std::getenv("VOXLINK_ENDPOINT")) {
        connection.endpoint = endpoint;
    }
    if (const char* debug = std::getenv("VOXLINK_DEBUG")) {
        connection.debug = env_flag(debug);
    }
}

std::string ClientConfig::validate() const {
    std::ostringstream errors;

    if (!connection.transcription && !connection.agent) {
        errors << "at least one of transcription or agent is required; ";
    }

    const auto& scheme = connection.credentials.auth_scheme;
    if (scheme != "token" && scheme != "bearer") {
        errors << "connection.auth_scheme must be \"token\" or \"bearer\"; ";
    }

    const auto& fmt = connection.audio_format;
    if (fmt.input_sample_rate <= 0 || fmt.output_sample_rate <= 0) {
        errors << "audio_format sample rates must be positive; ";
    }

    if (connection.transcription && connection.transcription->channels <= 0) {
        errors << "transcription.channels must be positive; ";
    }

    if (connection.agent && !connection.agent->functions.is_array()) {
        errors << "agent.functions must be an array; ";
    }

    const auto& p = connection.protocol;
    if (p.settings_ack_grace_ms < 0) {
        errors << "protocol.settings_ack_grace_ms must be >= 0; ";
    }
    if (p.keepalive_interval_ms < 0) {
        errors << "protocol.keepalive_interval_ms must be >= 0; ";
    }
    if (p.connect_timeout_ms <= 0) {
        errors << "protocol.connect_timeout_ms must be positive; ";
    }

    return errors.str();
}

} // namespace config
} // namespace voxlink
