/**
 * Mode resolution, settings payload construction and resend decisions.
 * Asserts:
 * - Mode follows which option records are present; neither is a ConfigError.
 * - Settings carry only the records the mode includes, never null placeholders.
 * - Identical inputs give byte-identical settings.
 * - Resend is decided by value against the captured snapshot.
 *
 * Run from build dir: ./test_mode_resolver
 */

#include "core/config.h"
#include "mode_resolver.h"
#include <iostream>
#include <string>

using namespace voxlink;
using json = nlohmann::json;

static int failed = 0;

#define ASSERT(cond) do { if (!(cond)) { std::cerr << "FAIL: " << #cond << " (line " << __LINE__ << ")\n"; failed++; } } while(0)

int main() {
    // --- resolve_mode ---
    {
        ConnectionConfig none;
        auto r = resolve_mode(none);
        ASSERT(r.is_error());
        ASSERT(r.error().type == ErrorType::ConfigError);

        ConnectionConfig agent_only;
        agent_only.agent = AgentOptions{};
        ASSERT(resolve_mode(agent_only).is_ok());
        ASSERT(resolve_mode(agent_only).value() == Mode::AgentOnly);

        ConnectionConfig stt_only;
        stt_only.transcription = TranscriptionOptions{};
        ASSERT(resolve_mode(stt_only).value() == Mode::TranscriptionOnly);

        ConnectionConfig dual;
        dual.agent = AgentOptions{};
        dual.transcription = TranscriptionOptions{};
        ASSERT(resolve_mode(dual).value() == Mode::Dual);
    }

    // --- parse_mode / to_string ---
    ASSERT(parse_mode("dual") == Mode::Dual);
    ASSERT(parse_mode("agent_only") == Mode::AgentOnly);
    ASSERT(parse_mode("transcription_only") == Mode::TranscriptionOnly);
    ASSERT(!parse_mode("both").has_value());
    ASSERT(std::string(to_string(Mode::AgentOnly)) == "agent_only");

    // --- agent-only settings omit transcription ---
    {
        ConnectionConfig config;
        AgentOptions agent;
        agent.voice = "x";
        config.agent = agent;

        json settings = build_settings(Mode::AgentOnly, config);
        ASSERT(settings["type"] == "Settings");
        ASSERT(settings["mode"] == "agent_only");
        ASSERT(!settings.contains("transcription"));
        ASSERT(settings.contains("agent"));
        ASSERT(settings["agent"]["speak"]["provider"]["model"] == "x");
        ASSERT(settings["agent"]["vad"]["enabled"] == true);
        ASSERT(settings["audio"].contains("output"));
        ASSERT(!settings["agent"].contains("greeting"));
        ASSERT(!settings["agent"].contains("context"));
        ASSERT(!settings["agent"]["think"].contains("functions"));
        ASSERT(!settings["agent"]["think"].contains("endpoint"));
    }

    // --- transcription-only settings omit agent and audio output ---
    {
        ConnectionConfig config;
        TranscriptionOptions t;
        t.model = "nova-3";
        t.utterance_end_ms = 1000;
        t.keyterms = {"voxlink"};
        config.transcription = t;

        json settings = build_settings(Mode::TranscriptionOnly, config);
        ASSERT(settings["mode"] == "transcription_only");
        ASSERT(!settings.contains("agent"));
        ASSERT(!settings["audio"].contains("output"));
        ASSERT(settings["transcription"]["model"] == "nova-3");
        ASSERT(settings["transcription"]["utterance_end_ms"] == 1000);
        ASSERT(settings["transcription"]["keyterms"].size() == 1);
        ASSERT(!settings["transcription"].contains("endpointing"));
    }

    // --- dual settings carry both records and VAD tuning ---
    {
        ConnectionConfig config;
        TranscriptionOptions t;
        t.utterance_end_ms = 1200;
        config.transcription = t;
        AgentOptions a;
        a.greeting = "hello";
        a.think_temperature = 0.5;
        a.think_endpoint_url = "https://llm.example.com/v1";
        a.think_api_key = "secret";
        a.functions = json::array({{{"name", "get_time"}, {"description", "Current time"}}});
        a.context.push_back({"user", "earlier question"});
        config.agent = a;
        config.features.mip_opt_out = true;

        json settings = build_settings(Mode::Dual, config);
        ASSERT(settings["mode"] == "dual");
        ASSERT(settings.contains("transcription"));
        ASSERT(settings.contains("agent"));
        ASSERT(settings["features"]["mip_opt_out"] == true);
        ASSERT(settings["agent"]["vad"]["utterance_end_ms"] == 1200);
        ASSERT(settings["agent"]["greeting"] == "hello");
        ASSERT(settings["agent"]["think"]["provider"]["temperature"] == 0.5);
        ASSERT(settings["agent"]["think"]["endpoint"]["url"] == "https://llm.example.com/v1");
        ASSERT(settings["agent"]["think"]["endpoint"]["headers"]["authorization"] == "bearer secret");
        ASSERT(settings["agent"]["think"]["functions"].size() == 1);
        ASSERT(settings["agent"]["context"]["messages"][0]["type"] == "History");
        ASSERT(settings["agent"]["context"]["messages"][0]["content"] == "earlier question");

        // A record the mode does not carry is left out even if configured
        json agent_view = build_settings(Mode::AgentOnly, config);
        ASSERT(!agent_view.contains("transcription"));
        ASSERT(!agent_view["agent"]["vad"].contains("utterance_end_ms"));
    }

    // --- determinism ---
    {
        ConnectionConfig a;
        a.agent = AgentOptions{};
        a.agent->instructions = "Be brief.";
        a.transcription = TranscriptionOptions{};
        ConnectionConfig b = a;

        ASSERT(build_settings_message(Mode::Dual, a) == build_settings_message(Mode::Dual, b));
        ASSERT(build_settings_message(Mode::Dual, a) == build_settings_message(Mode::Dual, a));

        b.agent->instructions = "Be verbose.";
        ASSERT(build_settings_message(Mode::Dual, a) != build_settings_message(Mode::Dual, b));
    }

    // --- should_resend_settings ---
    {
        ConnectionConfig config;
        config.agent = AgentOptions{};
        config.agent->voice = "x";
        config.transcription = TranscriptionOptions{};

        OptionsSnapshot snapshot;
        ConnectionConfig changed = config;
        changed.agent->voice = "y";

        // Nothing sent yet: never a resend
        ASSERT(!should_resend_settings(snapshot, Mode::Dual, changed));

        snapshot.capture(config);
        ASSERT(snapshot.captured);
        ASSERT(!should_resend_settings(snapshot, Mode::Dual, config));

        // Structurally equal copy is not a change
        ConnectionConfig copy = config;
        ASSERT(!should_resend_settings(snapshot, Mode::Dual, copy));

        ASSERT(should_resend_settings(snapshot, Mode::Dual, changed));
        ASSERT(should_resend_settings(snapshot, Mode::AgentOnly, changed));
        // Transcription-only connection ignores agent edits
        ASSERT(!should_resend_settings(snapshot, Mode::TranscriptionOnly, changed));

        ConnectionConfig stt_changed = config;
        stt_changed.transcription->language = "de";
        ASSERT(should_resend_settings(snapshot, Mode::Dual, stt_changed));
        ASSERT(!should_resend_settings(snapshot, Mode::AgentOnly, stt_changed));

        // Context edits count as a change
        ConnectionConfig context_changed = config;
        context_changed.agent->context.push_back({"assistant", "hi"});
        ASSERT(should_resend_settings(snapshot, Mode::Dual, context_changed));

        snapshot.clear();
        ASSERT(!snapshot.captured);
        ASSERT(!should_resend_settings(snapshot, Mode::Dual, changed));
    }

    // --- endpoint_for ---
    {
        ConnectionConfig config;
        ASSERT(endpoint_for(Mode::TranscriptionOnly, config) == constants::protocol::DEFAULT_TRANSCRIPTION_ENDPOINT);
        ASSERT(endpoint_for(Mode::AgentOnly, config) == constants::protocol::DEFAULT_AGENT_ENDPOINT);
        ASSERT(endpoint_for(Mode::Dual, config) == constants::protocol::DEFAULT_AGENT_ENDPOINT);
        config.endpoint = "ws://localhost:8080/stream";
        ASSERT(endpoint_for(Mode::Dual, config) == "ws://localhost:8080/stream");
    }

    if (failed) {
        std::cerr << failed << " assertion(s) failed.\n";
        return 1;
    }
    std::cout << "All mode resolver tests passed.\n";
    return 0;
}
