/**
 * Configuration parsing, validation and environment overrides.
 *
 * Run from build dir: ./test_config
 * Writes a scratch file under /tmp.
 */

#include "core/config.h"
#include "logger.h"
#include <cstdlib>
#include <cstdio>
#include <fstream>
#include <iostream>
#include <string>
#include <unistd.h>

using namespace voxlink;
using namespace voxlink::config;
using json = nlohmann::json;

static int failed = 0;

#define ASSERT(cond) do { if (!(cond)) { std::cerr << "FAIL: " << #cond << " (line " << __LINE__ << ")\n"; failed++; } } while(0)

int main() {
    unsetenv("VOXLINK_API_KEY");
    unsetenv("VOXLINK_ENDPOINT");
    unsetenv("VOXLINK_DEBUG");

    // --- normalize_api_key ---
    ASSERT(normalize_api_key("dgkey_abc") == "abc");
    ASSERT(normalize_api_key("  abc \n") == "abc");
    ASSERT(normalize_api_key(" dgkey_xyz ") == "xyz");
    ASSERT(normalize_api_key("   ").empty());
    ASSERT(normalize_api_key("key_dgkey_") == "key_dgkey_");

    // --- expand_user_path ---
    setenv("HOME", "/home/tester", 1);
    ASSERT(expand_user_path("~/voxlink.json") == "/home/tester/voxlink.json");
    ASSERT(expand_user_path("/etc/voxlink.json") == "/etc/voxlink.json");
    ASSERT(expand_user_path("~other/x") == "~other/x");

    // --- defaults from an empty document ---
    {
        auto r = ClientConfig::from_json(json::object());
        ASSERT(r.is_ok());
        const ClientConfig& c = r.value();
        ASSERT(!c.connection.transcription.has_value());
        ASSERT(!c.connection.agent.has_value());
        ASSERT(c.connection.credentials.auth_scheme == "token");
        ASSERT(c.connection.protocol.settings_ack_grace_ms == constants::protocol::SETTINGS_ACK_GRACE_MS);
        ASSERT(c.connection.protocol.fatal_error_codes.size() == 6);
        ASSERT(c.devices.input_device == "default");
        ASSERT(c.auto_start_capture);
        // No option records is the one thing validation always rejects
        ASSERT(!c.validate().empty());
    }

    // --- full document ---
    {
        json j = {
            {"connection", {
                {"endpoint", "ws://localhost:9000/agent"},
                {"api_key", "dgkey_k1"},
                {"auth_scheme", "bearer"},
                {"debug", true},
                {"features", {{"mip_opt_out", true}}},
                {"audio_format", {{"output_sample_rate", 16000}}}
            }},
            {"transcription", {{"model", "nova-3"}, {"utterance_end_ms", 1000}, {"keyterms", {"voxlink"}}}},
            {"agent", {
                {"voice", "aura-luna-en"},
                {"think_temperature", 0.3},
                {"functions", json::array({{{"name", "get_time"}}})},
                {"context", json::array({{{"role", "assistant"}, {"content", "Welcome back"}}})}
            }},
            {"protocol", {{"settings_ack_grace_ms", 0}, {"fatal_error_codes", {"UNAUTHORIZED"}}}},
            {"devices", {{"input_device", "2"}}},
            {"log", {{"level", "debug"}, {"file", "~/voxlink.log"}}},
            {"auto_start_capture", false}
        };

        auto r = ClientConfig::from_json(j);
        ASSERT(r.is_ok());
        const ClientConfig& c = r.value();
        ASSERT(c.validate().empty());
        ASSERT(c.connection.endpoint == "ws://localhost:9000/agent");
        ASSERT(c.connection.credentials.api_key == "dgkey_k1");
        ASSERT(c.connection.credentials.auth_scheme == "bearer");
        ASSERT(c.connection.debug);
        ASSERT(c.connection.features.mip_opt_out);
        ASSERT(!c.connection.features.experimental);
        ASSERT(c.connection.audio_format.output_sample_rate == 16000);
        ASSERT(c.connection.audio_format.input_sample_rate == constants::audio::INPUT_SAMPLE_RATE);
        ASSERT(c.connection.transcription.has_value());
        ASSERT(c.connection.transcription->model == "nova-3");
        ASSERT(c.connection.transcription->utterance_end_ms == 1000);
        ASSERT(!c.connection.transcription->endpointing_ms.has_value());
        ASSERT(c.connection.transcription->keyterms.size() == 1);
        ASSERT(c.connection.agent.has_value());
        ASSERT(c.connection.agent->voice == "aura-luna-en");
        ASSERT(c.connection.agent->think_temperature == 0.3);
        ASSERT(c.connection.agent->functions.size() == 1);
        ASSERT(c.connection.agent->context.size() == 1);
        ASSERT(c.connection.agent->context[0].role == "assistant");
        ASSERT(c.connection.protocol.settings_ack_grace_ms == 0);
        ASSERT(c.connection.protocol.fatal_error_codes.size() == 1);
        ASSERT(c.devices.input_device == "2");
        ASSERT(c.devices.output_device == "default");
        ASSERT(c.log.level == "debug");
        ASSERT(c.log.file == "/home/tester/voxlink.log");
        ASSERT(!c.auto_start_capture);

        // to_json / from_json preserve the option records by value
        auto again = ClientConfig::from_json(c.to_json());
        ASSERT(again.is_ok());
        ASSERT(*again.value().connection.agent == *c.connection.agent);
        ASSERT(*again.value().connection.transcription == *c.connection.transcription);
    }

    // --- wrong value types are a ParseError ---
    {
        json j = {{"transcription", {{"sample_rate", "fast"}}}};
        auto r = ClientConfig::from_json(j);
        ASSERT(r.is_error());
        ASSERT(r.error().type == ErrorType::ParseError);
    }

    // --- validation ---
    {
        ClientConfig c;
        c.connection.agent = AgentOptions{};
        ASSERT(c.validate().empty());

        c.connection.credentials.auth_scheme = "basic";
        ASSERT(c.validate().find("auth_scheme") != std::string::npos);
        c.connection.credentials.auth_scheme = "token";

        c.connection.protocol.connect_timeout_ms = 0;
        ASSERT(c.validate().find("connect_timeout_ms") != std::string::npos);
        c.connection.protocol.connect_timeout_ms = 1000;

        c.connection.protocol.settings_ack_grace_ms = -1;
        ASSERT(!c.validate().empty());
        c.connection.protocol.settings_ack_grace_ms = 0;

        c.connection.agent->functions = json::object();
        ASSERT(c.validate().find("functions") != std::string::npos);
        c.connection.agent->functions = json::array();

        c.connection.audio_format.input_sample_rate = 0;
        ASSERT(!c.validate().empty());
        c.connection.audio_format.input_sample_rate = 16000;
        ASSERT(c.validate().empty());
    }

    // --- load: missing file, bad JSON, invalid config, env overrides ---
    {
        auto missing = ClientConfig::load("/nonexistent/voxlink.json");
        ASSERT(missing.is_error());
        ASSERT(missing.error().type == ErrorType::IOError);

        std::string path = "/tmp/voxlink_test_config_" + std::to_string(getpid()) + ".json";

        {
            std::ofstream out(path);
            out << "{ \"agent\": ";
        }
        auto broken = ClientConfig::load(path);
        ASSERT(broken.is_error());
        ASSERT(broken.error().type == ErrorType::ParseError);

        {
            std::ofstream out(path);
            out << json{{"connection", {{"api_key", "abc"}}}}.dump();
        }
        auto invalid = ClientConfig::load(path);
        ASSERT(invalid.is_error());
        ASSERT(invalid.error().type == ErrorType::ConfigError);

        ClientConfig saved;
        saved.connection.transcription = TranscriptionOptions{};
        saved.connection.credentials.api_key = "from-file";
        ASSERT(saved.save(path).is_ok());

        setenv("VOXLINK_API_KEY", "from-env", 1);
        setenv("VOXLINK_ENDPOINT", "ws://override/listen", 1);
        setenv("VOXLINK_DEBUG", "1", 1);
        auto loaded = ClientConfig::load(path);
        ASSERT(loaded.is_ok());
        ASSERT(loaded.value().connection.credentials.api_key == "from-env");
        ASSERT(loaded.value().connection.endpoint == "ws://override/listen");
        ASSERT(loaded.value().connection.debug);
        ASSERT(loaded.value().connection.transcription.has_value());
        ASSERT(!loaded.value().connection.agent.has_value());
        unsetenv("VOXLINK_API_KEY");
        unsetenv("VOXLINK_ENDPOINT");
        unsetenv("VOXLINK_DEBUG");

        std::remove(path.c_str());
    }

    // --- log level names ---
    ASSERT(Logger::parse_level("DEBUG") == LogLevel::DEBUG);
    ASSERT(Logger::parse_level("warning") == LogLevel::WARN);
    ASSERT(Logger::parse_level("error") == LogLevel::ERROR);
    ASSERT(Logger::parse_level("verbose") == LogLevel::INFO);

    if (failed) {
        std::cerr << failed << " assertion(s) failed.\n";
        return 1;
    }
    std::cout << "All config tests passed.\n";
    return 0;
}
