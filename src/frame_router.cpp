#include "frame_router.h"
#include "core/constants.h"
#include "events.h"
#include "interruption_coordinator.h"
#include "logger.h"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <mutex>

using json = nlohmann::json;

namespace voxlink {

namespace {

FrameKind classify_type(const std::string& type) {
    if (type == "Welcome" || type == "SettingsApplied" ||
        type == "PromptUpdated" || type == "SpeakUpdated") {
        return FrameKind::ControlAck;
    }
    if (type == "Results" || type == "Transcript") return FrameKind::TranscriptResult;
    if (type == "ConversationText") return FrameKind::AgentTextResult;
    if (type == "AgentStartedSpeaking") return FrameKind::AgentAudioStart;
    if (type == "AgentAudioDone") return FrameKind::AgentAudioStop;
    if (type == "UserStartedSpeaking" || type == "SpeechStarted" ||
        type == "UserStoppedSpeaking" || type == "UtteranceEnd" ||
        type == "VADEvent") {
        return FrameKind::VadEvent;
    }
    if (type == "Error" || type == "Warning") return FrameKind::ErrorFrame;
    if (type == "AgentThinking") return FrameKind::AgentThinking;
    if (type == "FunctionCallRequest") return FrameKind::FunctionCallRequest;
    return FrameKind::Unknown;
}

bool is_agent_kind(FrameKind kind) {
    return kind == FrameKind::AgentTextResult ||
           kind == FrameKind::AgentAudioChunk ||
           kind == FrameKind::AgentAudioStart ||
           kind == FrameKind::AgentAudioStop ||
           kind == FrameKind::AgentThinking ||
           kind == FrameKind::FunctionCallRequest;
}

std::string string_field(const json& j, const char* key) {
    auto it = j.find(key);
    if (it != j.end() && it->is_string()) {
        return it->get<std::string>();
    }
    return "";
}

template<typename T>
T number_field(const json& j, const char* key, T fallback) {
    auto it = j.find(key);
    if (it != j.end() && it->is_number()) {
        return it->get<T>();
    }
    return fallback;
}

bool bool_field(const json& j, const char* key, bool fallback) {
    auto it = j.find(key);
    if (it != j.end() && it->is_boolean()) {
        return it->get<bool>();
    }
    return fallback;
}

TranscriptResult parse_transcript(const json& msg) {
    TranscriptResult result;
    result.is_final = bool_field(msg, "is_final", false);
    result.speech_final = bool_field(msg, "speech_final", false);
    result.start_s = number_field<double>(msg, "start", 0.0);
    result.duration_s = number_field<double>(msg, "duration", 0.0);

    auto channel = msg.find("channel");
    if (channel != msg.end() && channel->is_object()) {
        auto alternatives = channel->find("alternatives");
        if (alternatives != channel->end() && alternatives->is_array() && !alternatives->empty()) {
            const json& best = (*alternatives)[0];
            result.text = string_field(best, "transcript");
            result.confidence = number_field<float>(best, "confidence", 0.0f);
        }
    }
    return result;
}

VadEvent parse_vad(const std::string& type, const json& msg) {
    VadEvent event;
    if (type == "UserStartedSpeaking" || type == "SpeechStarted") {
        event.kind = VadEventKind::SpeechStarted;
        event.timestamp_s = number_field<double>(msg, "timestamp", 0.0);
    } else if (type == "UserStoppedSpeaking") {
        event.kind = VadEventKind::SpeechStopped;
        event.timestamp_s = number_field<double>(msg, "timestamp", 0.0);
    } else if (type == "UtteranceEnd") {
        event.kind = VadEventKind::UtteranceEnd;
        event.timestamp_s = number_field<double>(msg, "last_word_end", 0.0);
    } else {
        event.kind = bool_field(msg, "speech_detected", false)
            ? VadEventKind::SpeechStarted : VadEventKind::SpeechStopped;
        event.timestamp_s = number_field<double>(msg, "timestamp", 0.0);
        event.confidence = number_field<float>(msg, "confidence", 0.0f);
    }
    return event;
}

FunctionCallRequest parse_function_calls(const json& msg) {
    FunctionCallRequest request;
    auto functions = msg.find("functions");
    if (functions == msg.end() || !functions->is_array()) {
        return request;
    }
    for (const auto& f : *functions) {
        if (!f.is_object()) continue;
        FunctionCall call;
        call.id = string_field(f, "id");
        call.name = string_field(f, "name");
        auto args = f.find("arguments");
        if (args != f.end()) {
            call.arguments = args->is_string() ? args->get<std::string>() : args->dump();
        }
        call.client_side = bool_field(f, "client_side", true);
        request.functions.push_back(call);
    }
    return request;
}

} // anonymous namespace

FrameKind classify_frame(Mode mode, transport::FrameType frame_type, const std::string& message_type) {
    FrameKind kind = frame_type == transport::FrameType::Binary
        ? FrameKind::AgentAudioChunk
        : classify_type(message_type);

    if (kind == FrameKind::TranscriptResult && !mode_includes_transcription(mode)) {
        return FrameKind::Unknown;
    }
    if (is_agent_kind(kind) && !mode_includes_agent(mode)) {
        return FrameKind::Unknown;
    }
    return kind;
}

class FrameRouter::Impl {
public:
    Impl(InterruptionCoordinator& coordinator, EventBus& events)
        : coordinator_(coordinator), events_(events), mode_(Mode::Dual), unknown_frames_(0) {}

    void begin_connection(Mode mode, const std::vector<std::string>& fatal_error_codes) {
        std::lock_guard<std::mutex> lock(mutex_);
        mode_ = mode;
        fatal_error_codes_ = fatal_error_codes;
        readiness_ = Readiness{};
        unknown_frames_ = 0;
    }

    void set_settings_ack_handler(std::function<void()> handler) {
        settings_ack_handler_ = std::move(handler);
    }

    void set_fatal_error_handler(std::function<void(const Error&)> handler) {
        fatal_error_handler_ = std::move(handler);
    }

    FrameKind route(const transport::Frame& frame) {
        Mode mode;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            mode = mode_;
        }

        if (frame.type == transport::FrameType::Binary) {
            FrameKind kind = classify_frame(mode, frame.type, "");
            if (kind == FrameKind::Unknown) {
                drop_unknown("binary frame (" + std::to_string(frame.data.size()) + " bytes)");
                return kind;
            }
            coordinator_.forward_chunk(frame.data);
            return kind;
        }

        json msg;
        try {
            msg = json::parse(frame.text);
        } catch (const json::exception& e) {
            Logger::warn(std::string("[Router] Malformed frame dropped: ") + e.what());
            events_.emit_error(make_protocol_error(std::string("Malformed frame: ") + e.what()));
            return FrameKind::Unknown;
        }
        if (!msg.is_object()) {
            events_.emit_error(make_protocol_error("Frame is not a JSON object"));
            return FrameKind::Unknown;
        }

        std::string type = string_field(msg, "type");
        FrameKind kind = classify_frame(mode, frame.type, type);
        LOG_ROUTER(std::string(frame_kind_to_string(kind)) + " <- " + (type.empty() ? "(no type)" : type));

        switch (kind) {
            case FrameKind::ControlAck:
                handle_control_ack(type);
                break;

            case FrameKind::TranscriptResult:
                events_.emit_transcript(parse_transcript(msg));
                break;

            case FrameKind::AgentTextResult: {
                AgentText text;
                text.role = string_field(msg, "role");
                text.content = string_field(msg, "content");
                events_.emit_agent_text(text);
                break;
            }

            case FrameKind::AgentAudioStart:
                coordinator_.on_audio_start();
                break;

            case FrameKind::AgentAudioStop:
                coordinator_.on_audio_stop();
                break;

            case FrameKind::VadEvent:
                events_.emit_vad(parse_vad(type, msg));
                break;

            case FrameKind::ErrorFrame:
                handle_error_frame(type, msg);
                break;

            case FrameKind::AgentThinking:
                events_.emit_agent_thinking(string_field(msg, "content"));
                break;

            case FrameKind::FunctionCallRequest:
                events_.emit_function_call_request(parse_function_calls(msg));
                break;

            case FrameKind::AgentAudioChunk:
                break;

            case FrameKind::Unknown:
                drop_unknown(type.empty() ? "frame without type" : "\"" + type + "\"");
                break;
        }
        return kind;
    }

    Readiness readiness() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return readiness_;
    }

    uint64_t unknown_frames() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return unknown_frames_;
    }

private:
    void handle_control_ack(const std::string& type) {
        bool settings_ack = false;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (type == "Welcome") {
                readiness_.welcome_received = true;
            } else if (type == "SettingsApplied") {
                readiness_.settings_applied = true;
                settings_ack = true;
            }
        }
        events_.emit_control_ack(type);
        if (settings_ack && settings_ack_handler_) {
            settings_ack_handler_();
        }
    }

    void handle_error_frame(const std::string& type, const json& msg) {
        std::string code = string_field(msg, "code");
        std::string description = string_field(msg, "description");
        if (description.empty()) {
            description = string_field(msg, "message");
        }

        if (code == constants::protocol::SETTINGS_ALREADY_APPLIED) {
            LOG_SETTINGS("Service reports settings already applied; treating as acknowledgement");
            handle_control_ack("SettingsApplied");
            return;
        }

        bool fatal = false;
        if (type == "Error") {
            std::lock_guard<std::mutex> lock(mutex_);
            fatal = bool_field(msg, "fatal", false) ||
                    std::find(fatal_error_codes_.begin(), fatal_error_codes_.end(), code) !=
                        fatal_error_codes_.end();
        }

        Error error = make_upstream_error(description.empty() ? type : description, code, fatal);
        if (fatal) {
            Logger::error("[Router] Fatal upstream error " + code + ": " + error.message);
        } else {
            Logger::warn("[Router] Upstream " + type + " " + code + ": " + error.message);
        }

        events_.emit_error(error);
        if (fatal && fatal_error_handler_) {
            fatal_error_handler_(error);
        }
    }

    void drop_unknown(const std::string& what) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            ++unknown_frames_;
        }
        Logger::warn("[Router] Dropping unrecognized " + what);
    }

    InterruptionCoordinator& coordinator_;
    EventBus& events_;

    mutable std::mutex mutex_;
    Mode mode_;
    std::vector<std::string> fatal_error_codes_;
    Readiness readiness_;
    uint64_t unknown_frames_;

    std::function<void()> settings_ack_handler_;
    std::function<void(const Error&)> fatal_error_handler_;
};

FrameRouter::FrameRouter(InterruptionCoordinator& coordinator, EventBus& events)
    : pimpl_(std::make_unique<Impl>(coordinator, events)) {}

FrameRouter::~FrameRouter() = default;

void FrameRouter::begin_connection(Mode mode, const std::vector<std::string>& fatal_error_codes) {
    pimpl_->begin_connection(mode, fatal_error_codes);
}

void FrameRouter::set_settings_ack_handler(std::function<void()> handler) {
    pimpl_->set_settings_ack_handler(std::move(handler));
}

void FrameRouter::set_fatal_error_handler(std::function<void(const Error&)> handler) {
    pimpl_->set_fatal_error_handler(std::move(handler));
}

FrameKind FrameRouter::route(const transport::Frame& frame) {
    return pimpl_->route(frame);
}

Readiness FrameRouter::readiness() const {
    return pimpl_->readiness();
}

uint64_t FrameRouter::unknown_frames() const {
    return pimpl_->unknown_frames();
}

} // namespace voxlink
