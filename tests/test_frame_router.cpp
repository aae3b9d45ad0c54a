/**
 * Frame classification and dispatch.
 * Asserts:
 * - Every recognized discriminant maps to one kind; anything else is Unknown.
 * - Transcript frames outside a transcription mode and agent frames outside an
 *   agent mode are treated as Unknown and dropped.
 * - Malformed frames raise a non-fatal ProtocolError and never throw.
 * - Payload fields reach the caller events intact.
 * - AgentAudioStart/Stop accounting never double-counts Speaking.
 *
 * Run from build dir: ./test_frame_router
 */

#include "events.h"
#include "frame_router.h"
#include "interruption_coordinator.h"
#include "test_fakes.h"
#include <iostream>
#include <string>
#include <vector>

using namespace voxlink;
using namespace voxlink::testing;
using json = nlohmann::json;

static int failed = 0;

#define ASSERT(cond) do { if (!(cond)) { std::cerr << "FAIL: " << #cond << " (line " << __LINE__ << ")\n"; failed++; } } while(0)

namespace {

struct Recorder {
    std::vector<TranscriptResult> transcripts;
    std::vector<AgentText> agent_texts;
    std::vector<VadEvent> vad;
    std::vector<Error> errors;
    std::vector<std::string> acks;
    std::vector<std::string> thinking;
    std::vector<FunctionCallRequest> function_calls;

    ClientCallbacks callbacks() {
        ClientCallbacks cb;
        cb.on_transcript = [this](const TranscriptResult& r) { transcripts.push_back(r); };
        cb.on_agent_text = [this](const AgentText& t) { agent_texts.push_back(t); };
        cb.on_vad = [this](const VadEvent& e) { vad.push_back(e); };
        cb.on_error = [this](const Error& e) { errors.push_back(e); };
        cb.on_control_ack = [this](const std::string& type) { acks.push_back(type); };
        cb.on_agent_thinking = [this](const std::string& c) { thinking.push_back(c); };
        cb.on_function_call_request = [this](const FunctionCallRequest& r) { function_calls.push_back(r); };
        return cb;
    }
};

transport::Frame text(const json& j) {
    return transport::Frame::make_text(j.dump());
}

const std::vector<std::string> kFatalCodes = {"INVALID_SETTINGS", "FAILED_TO_SPEAK"};

} // anonymous namespace

int main() {
    // --- classify_frame ---
    {
        using transport::FrameType;
        ASSERT(classify_frame(Mode::Dual, FrameType::Text, "Welcome") == FrameKind::ControlAck);
        ASSERT(classify_frame(Mode::Dual, FrameType::Text, "SettingsApplied") == FrameKind::ControlAck);
        ASSERT(classify_frame(Mode::Dual, FrameType::Text, "Results") == FrameKind::TranscriptResult);
        ASSERT(classify_frame(Mode::Dual, FrameType::Text, "ConversationText") == FrameKind::AgentTextResult);
        ASSERT(classify_frame(Mode::Dual, FrameType::Text, "AgentStartedSpeaking") == FrameKind::AgentAudioStart);
        ASSERT(classify_frame(Mode::Dual, FrameType::Text, "AgentAudioDone") == FrameKind::AgentAudioStop);
        ASSERT(classify_frame(Mode::Dual, FrameType::Text, "UserStartedSpeaking") == FrameKind::VadEvent);
        ASSERT(classify_frame(Mode::Dual, FrameType::Text, "UtteranceEnd") == FrameKind::VadEvent);
        ASSERT(classify_frame(Mode::Dual, FrameType::Text, "Error") == FrameKind::ErrorFrame);
        ASSERT(classify_frame(Mode::Dual, FrameType::Text, "Warning") == FrameKind::ErrorFrame);
        ASSERT(classify_frame(Mode::Dual, FrameType::Text, "AgentThinking") == FrameKind::AgentThinking);
        ASSERT(classify_frame(Mode::Dual, FrameType::Text, "FunctionCallRequest") == FrameKind::FunctionCallRequest);
        ASSERT(classify_frame(Mode::Dual, FrameType::Binary, "") == FrameKind::AgentAudioChunk);
        ASSERT(classify_frame(Mode::Dual, FrameType::Text, "SomethingFromTheFuture") == FrameKind::Unknown);
        ASSERT(classify_frame(Mode::Dual, FrameType::Text, "") == FrameKind::Unknown);

        // Capability filter
        ASSERT(classify_frame(Mode::AgentOnly, FrameType::Text, "Results") == FrameKind::Unknown);
        ASSERT(classify_frame(Mode::TranscriptionOnly, FrameType::Text, "ConversationText") == FrameKind::Unknown);
        ASSERT(classify_frame(Mode::TranscriptionOnly, FrameType::Text, "AgentStartedSpeaking") == FrameKind::Unknown);
        ASSERT(classify_frame(Mode::TranscriptionOnly, FrameType::Binary, "") == FrameKind::Unknown);
        ASSERT(classify_frame(Mode::TranscriptionOnly, FrameType::Text, "FunctionCallRequest") == FrameKind::Unknown);
        // VAD and errors are shared by both capabilities
        ASSERT(classify_frame(Mode::TranscriptionOnly, FrameType::Text, "SpeechStarted") == FrameKind::VadEvent);
        ASSERT(classify_frame(Mode::AgentOnly, FrameType::Text, "Error") == FrameKind::ErrorFrame);
    }

    // --- transcript payload ---
    {
        EventBus events;
        InterruptionCoordinator coordinator;
        FrameRouter router(coordinator, events);
        Recorder rec;
        events.subscribe(rec.callbacks());
        router.begin_connection(Mode::TranscriptionOnly, kFatalCodes);

        json results = {
            {"type", "Results"},
            {"is_final", true},
            {"speech_final", false},
            {"start", 1.5},
            {"duration", 0.75},
            {"channel", {{"alternatives", json::array({
                {{"transcript", "hello world"}, {"confidence", 0.93}},
                {{"transcript", "yellow world"}, {"confidence", 0.4}}
            })}}}
        };
        ASSERT(router.route(text(results)) == FrameKind::TranscriptResult);
        ASSERT(rec.transcripts.size() == 1);
        ASSERT(rec.transcripts[0].text == "hello world");
        ASSERT(rec.transcripts[0].is_final);
        ASSERT(!rec.transcripts[0].speech_final);
        ASSERT(rec.transcripts[0].confidence > 0.92f && rec.transcripts[0].confidence < 0.94f);
        ASSERT(rec.transcripts[0].start_s == 1.5);

        // Missing alternatives still yields an (empty) result rather than a crash
        ASSERT(router.route(text({{"type", "Results"}})) == FrameKind::TranscriptResult);
        ASSERT(rec.transcripts.size() == 2);
        ASSERT(rec.transcripts[1].text.empty());

        // Agent traffic on a transcription-only connection is dropped
        ASSERT(router.route(text({{"type", "ConversationText"}, {"role", "assistant"}, {"content", "hi"}})) ==
               FrameKind::Unknown);
        ASSERT(rec.agent_texts.empty());
        ASSERT(router.unknown_frames() == 1);
    }

    // --- transcript in AgentOnly is Unknown ---
    {
        EventBus events;
        InterruptionCoordinator coordinator;
        FrameRouter router(coordinator, events);
        Recorder rec;
        events.subscribe(rec.callbacks());
        router.begin_connection(Mode::AgentOnly, kFatalCodes);

        ASSERT(router.route(text({{"type", "Results"}, {"is_final", true}})) == FrameKind::Unknown);
        ASSERT(rec.transcripts.empty());
        ASSERT(router.unknown_frames() == 1);
        ASSERT(rec.errors.empty());
    }

    // --- agent payloads ---
    {
        EventBus events;
        InterruptionCoordinator coordinator;
        FakeAudioAdapter audio;
        coordinator.set_audio_adapter(&audio);
        FrameRouter router(coordinator, events);
        Recorder rec;
        events.subscribe(rec.callbacks());
        router.begin_connection(Mode::AgentOnly, kFatalCodes);

        router.route(text({{"type", "ConversationText"}, {"role", "user"}, {"content", "what time is it"}}));
        ASSERT(rec.agent_texts.size() == 1);
        ASSERT(rec.agent_texts[0].role == "user");
        ASSERT(rec.agent_texts[0].content == "what time is it");

        router.route(text({{"type", "AgentThinking"}, {"content", "checking the clock"}}));
        ASSERT(rec.thinking.size() == 1 && rec.thinking[0] == "checking the clock");

        json call_request = {
            {"type", "FunctionCallRequest"},
            {"functions", json::array({
                {{"id", "fc_1"}, {"name", "get_time"}, {"arguments", "{\"tz\":\"UTC\"}"}, {"client_side", true}},
                {{"id", "fc_2"}, {"name", "lookup"}, {"arguments", {{"q", "x"}}}, {"client_side", false}}
            })}
        };
        ASSERT(router.route(text(call_request)) == FrameKind::FunctionCallRequest);
        ASSERT(rec.function_calls.size() == 1);
        ASSERT(rec.function_calls[0].functions.size() == 2);
        ASSERT(rec.function_calls[0].functions[0].id == "fc_1");
        ASSERT(rec.function_calls[0].functions[0].arguments == "{\"tz\":\"UTC\"}");
        ASSERT(rec.function_calls[0].functions[1].arguments == "{\"q\":\"x\"}");
        ASSERT(!rec.function_calls[0].functions[1].client_side);

        ASSERT(router.route(transport::Frame::make_binary(Bytes{1, 2, 3, 4})) == FrameKind::AgentAudioChunk);
        ASSERT(audio.enqueued.size() == 1);
    }

    // --- VAD events ---
    {
        EventBus events;
        InterruptionCoordinator coordinator;
        FakeAudioAdapter audio;
        coordinator.set_audio_adapter(&audio);
        FrameRouter router(coordinator, events);
        Recorder rec;
        events.subscribe(rec.callbacks());
        router.begin_connection(Mode::Dual, kFatalCodes);

        router.route(text({{"type", "UserStartedSpeaking"}, {"timestamp", 2.0}}));
        router.route(text({{"type", "UtteranceEnd"}, {"last_word_end", 3.25}}));
        router.route(text({{"type", "VADEvent"}, {"speech_detected", false}, {"timestamp", 4.0}}));
        ASSERT(rec.vad.size() == 3);
        ASSERT(rec.vad[0].kind == VadEventKind::SpeechStarted);
        ASSERT(rec.vad[0].timestamp_s == 2.0);
        ASSERT(rec.vad[1].kind == VadEventKind::UtteranceEnd);
        ASSERT(rec.vad[1].timestamp_s == 3.25);
        ASSERT(rec.vad[2].kind == VadEventKind::SpeechStopped);

        // VAD never gates agent audio
        ASSERT(coordinator.is_audio_allowed());
        router.route(transport::Frame::make_binary(Bytes{9, 9}));
        ASSERT(audio.enqueued.size() == 1);
    }

    // --- control acks and readiness ---
    {
        EventBus events;
        InterruptionCoordinator coordinator;
        FrameRouter router(coordinator, events);
        Recorder rec;
        events.subscribe(rec.callbacks());
        int acks = 0;
        router.set_settings_ack_handler([&acks] { acks++; });
        router.begin_connection(Mode::Dual, kFatalCodes);

        ASSERT(!router.readiness().welcome_received);
        router.route(text({{"type", "Welcome"}, {"request_id", "abc"}}));
        ASSERT(router.readiness().welcome_received);
        ASSERT(!router.readiness().settings_applied);
        ASSERT(acks == 0);

        router.route(text({{"type", "SettingsApplied"}}));
        ASSERT(router.readiness().settings_applied);
        ASSERT(acks == 1);

        router.route(text({{"type", "PromptUpdated"}}));
        ASSERT(acks == 1);
        ASSERT(rec.acks.size() == 3);
        ASSERT(rec.acks[2] == "PromptUpdated");

        // Duplicate-settings error is an acknowledgement, not an error
        router.route(text({{"type", "Error"}, {"code", "SETTINGS_ALREADY_APPLIED"}}));
        ASSERT(acks == 2);
        ASSERT(rec.errors.empty());

        router.begin_connection(Mode::Dual, kFatalCodes);
        ASSERT(!router.readiness().welcome_received);
        ASSERT(!router.readiness().settings_applied);
    }

    // --- error frames ---
    {
        EventBus events;
        InterruptionCoordinator coordinator;
        FrameRouter router(coordinator, events);
        Recorder rec;
        events.subscribe(rec.callbacks());
        std::vector<Error> fatal;
        router.set_fatal_error_handler([&fatal](const Error& e) { fatal.push_back(e); });
        router.begin_connection(Mode::Dual, kFatalCodes);

        router.route(text({{"type", "Warning"}, {"code", "INVALID_SETTINGS"}, {"description", "odd"}}));
        ASSERT(rec.errors.size() == 1);
        ASSERT(!rec.errors[0].fatal);
        ASSERT(fatal.empty());

        router.route(text({{"type", "Error"}, {"code", "THROTTLED"}, {"message", "slow down"}}));
        ASSERT(rec.errors.size() == 2);
        ASSERT(rec.errors[1].message == "slow down");
        ASSERT(!rec.errors[1].fatal);
        ASSERT(fatal.empty());

        router.route(text({{"type", "Error"}, {"code", "FAILED_TO_SPEAK"}, {"description", "tts down"}}));
        ASSERT(rec.errors.size() == 3);
        ASSERT(rec.errors[2].type == ErrorType::UpstreamError);
        ASSERT(rec.errors[2].fatal);
        ASSERT(fatal.size() == 1);
        ASSERT(fatal[0].code == "FAILED_TO_SPEAK");
    }

    // --- malformed and unknown frames never throw ---
    {
        EventBus events;
        InterruptionCoordinator coordinator;
        FrameRouter router(coordinator, events);
        Recorder rec;
        events.subscribe(rec.callbacks());
        router.begin_connection(Mode::Dual, kFatalCodes);

        ASSERT(router.route(transport::Frame::make_text("{not json")) == FrameKind::Unknown);
        ASSERT(rec.errors.size() == 1);
        ASSERT(rec.errors[0].type == ErrorType::ProtocolError);
        ASSERT(!rec.errors[0].fatal);

        ASSERT(router.route(transport::Frame::make_text("[1,2,3]")) == FrameKind::Unknown);
        ASSERT(rec.errors.size() == 2);

        ASSERT(router.route(text({{"type", "History"}, {"role", "user"}})) == FrameKind::Unknown);
        ASSERT(router.route(text({{"no_type", 1}})) == FrameKind::Unknown);
        ASSERT(router.route(text({{"type", 42}})) == FrameKind::Unknown);
        ASSERT(router.unknown_frames() == 3);
        // Unknown frames are not errors
        ASSERT(rec.errors.size() == 2);
    }

    // --- speaking accounting: starts minus stops, clamped at 0 ---
    {
        EventBus events;
        InterruptionCoordinator coordinator;
        FrameRouter router(coordinator, events);
        int speaking_reports = 0;
        int idle_reports = 0;
        coordinator.set_speaking_listener([&](AgentSpeakingState, AgentSpeakingState next) {
            if (next == AgentSpeakingState::Speaking) speaking_reports++;
            if (next == AgentSpeakingState::Idle) idle_reports++;
        });
        router.begin_connection(Mode::AgentOnly, kFatalCodes);

        const json start = {{"type", "AgentStartedSpeaking"}};
        const json stop = {{"type", "AgentAudioDone"}};

        router.route(text(stop));              // stop with nothing playing: ignored
        ASSERT(speaking_reports == 0 && idle_reports == 0);
        router.route(text(start));
        router.route(text(start));             // double start: one report
        ASSERT(speaking_reports == 1);
        ASSERT(coordinator.speaking_state() == AgentSpeakingState::Speaking);
        router.route(text(stop));
        router.route(text(stop));              // double stop: one report
        ASSERT(idle_reports == 1);
        ASSERT(coordinator.speaking_state() == AgentSpeakingState::Idle);
        router.route(text(start));
        ASSERT(speaking_reports == 2);

        // Stop while Interrupted leaves the state alone
        coordinator.interrupt_agent();
        router.route(text(stop));
        ASSERT(coordinator.speaking_state() == AgentSpeakingState::Interrupted);
        ASSERT(idle_reports == 1);
    }

    if (failed) {
        std::cerr << failed << " assertion(s) failed.\n";
        return 1;
    }
    std::cout << "All frame router tests passed.\n";
    return 0;
}
