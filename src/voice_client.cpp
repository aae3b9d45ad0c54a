#include "voice_client.h"
#include "audio/audio_adapter.h"
#include "connection_manager.h"
#include "frame_router.h"
#include "interruption_coordinator.h"
#include "logger.h"
#include <atomic>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace voxlink {

class VoiceClient::Impl {
public:
    Impl(std::unique_ptr<transport::ITransport> transport,
         std::unique_ptr<IScheduler> scheduler,
         audio::IAudioAdapter* audio)
        : audio_(audio),
          router_(coordinator_, events_),
          manager_(std::move(transport), std::move(scheduler), events_, coordinator_, router_),
          auto_start_capture_(true),
          microphone_enabled_(false) {
        coordinator_.set_audio_adapter(audio_);
        coordinator_.set_speaking_listener([this](AgentSpeakingState prev, AgentSpeakingState next) {
            events_.emit_agent_speaking_changed(prev, next);
        });

        ClientCallbacks internal;
        internal.on_state_changed = [this](ConnectionState prev, ConnectionState next) {
            on_state_changed(prev, next);
        };
        internal_subscription_ = events_.subscribe(std::move(internal));
    }

    ~Impl() {
        stop();
        events_.unsubscribe(internal_subscription_);
    }

    VoidResult start(const ConnectionConfig& config) {
        if (config.debug) {
            Logger::set_level(LogLevel::DEBUG);
        }
        return manager_.start(config);
    }

    void stop() {
        stop_capture();
        manager_.stop();
    }

    Result<bool> update_agent_options(const AgentOptions& options) {
        if (manager_.state() != ConnectionState::Ready) {
            return make_not_ready_error("Options can only be updated while Ready");
        }
        auto mode = manager_.mode();
        if (mode && !mode_includes_agent(*mode)) {
            return make_config_error(std::string("Agent options cannot be applied in ") + to_string(*mode) +
                                     " mode; start a new connection instead");
        }
        ConnectionConfig next = manager_.config();
        next.agent = options;
        return manager_.update_options(next);
    }

    Result<bool> update_transcription_options(const TranscriptionOptions& options) {
        if (manager_.state() != ConnectionState::Ready) {
            return make_not_ready_error("Options can only be updated while Ready");
        }
        auto mode = manager_.mode();
        if (mode && !mode_includes_transcription(*mode)) {
            return make_config_error(std::string("Transcription options cannot be applied in ") +
                                     to_string(*mode) + " mode; start a new connection instead");
        }
        ConnectionConfig next = manager_.config();
        next.transcription = options;
        return manager_.update_options(next);
    }

    void interrupt_agent() {
        coordinator_.interrupt_agent();
    }

    void allow_agent() {
        coordinator_.allow_agent();
    }

    VoidResult send_audio(const Bytes& chunk) {
        return manager_.send_audio(chunk);
    }

    VoidResult set_microphone_enabled(bool enabled) {
        if (enabled) {
            if (manager_.state() != ConnectionState::Ready) {
                return make_not_ready_error("Microphone can only be enabled while Ready");
            }
            return start_capture();
        }
        stop_capture();
        return VoidResult();
    }

    void set_auto_start_capture(bool enabled) {
        auto_start_capture_ = enabled;
    }

    VoidResult inject_user_message(const std::string& content) {
        if (auto err = require_agent_mode("InjectUserMessage")) {
            return err;
        }
        return manager_.send_control({{"type", "InjectUserMessage"}, {"content", content}});
    }

    VoidResult inject_agent_message(const std::string& content) {
        if (auto err = require_agent_mode("InjectAgentMessage")) {
            return err;
        }
        return manager_.send_control({{"type", "InjectAgentMessage"}, {"content", content}});
    }

    VoidResult update_instructions(const std::string& prompt) {
        if (auto err = require_agent_mode("UpdatePrompt")) {
            return err;
        }
        return manager_.send_control({{"type", "UpdatePrompt"}, {"prompt", prompt}});
    }

    VoidResult update_speak(const std::string& voice) {
        if (auto err = require_agent_mode("UpdateSpeak")) {
            return err;
        }
        std::string provider = constants::defaults::SPEAK_PROVIDER;
        auto current = manager_.config();
        if (current.agent) {
            provider = current.agent->speak_provider;
        }
        json message = {
            {"type", "UpdateSpeak"},
            {"speak", {{"provider", {{"type", provider}, {"model", voice}}}}}
        };
        return manager_.send_control(message);
    }

    VoidResult send_function_call_response(const std::string& id, const std::string& name,
                                           const std::string& content) {
        if (auto err = require_agent_mode("FunctionCallResponse")) {
            return err;
        }
        return manager_.send_control({
            {"type", "FunctionCallResponse"},
            {"id", id},
            {"name", name},
            {"content", content}
        });
    }

    SubscriptionId subscribe(ClientCallbacks callbacks) {
        return events_.subscribe(std::move(callbacks));
    }

    void unsubscribe(SubscriptionId id) {
        if (id == internal_subscription_) {
            return;
        }
        events_.unsubscribe(id);
    }

    ConnectionState state() const { return manager_.state(); }
    std::optional<Mode> mode() const { return manager_.mode(); }
    AgentSpeakingState agent_speaking_state() const { return coordinator_.speaking_state(); }
    bool is_audio_allowed() const { return coordinator_.is_audio_allowed(); }
    bool is_microphone_enabled() const { return microphone_enabled_.load(); }
    Readiness readiness() const { return router_.readiness(); }

private:
    // Empty error when the operation may proceed
    // State is checked first: after Errored or Closed every send is NotReady
    Error require_agent_mode(const char* operation) const {
        if (manager_.state() != ConnectionState::Ready) {
            return make_not_ready_error(std::string(operation) + " requires a ready connection");
        }
        auto mode = manager_.mode();
        if (mode && !mode_includes_agent(*mode)) {
            return make_config_error(std::string(operation) + " requires an agent connection");
        }
        return Error();
    }

    void on_state_changed(ConnectionState prev, ConnectionState next) {
        if (next == ConnectionState::Ready && auto_start_capture_) {
            VoidResult started = start_capture();
            if (!started && audio_) {
                Logger::warn("Capture did not start: " + started.error().message);
            }
        } else if (prev == ConnectionState::Ready) {
            stop_capture();
        }
    }

    VoidResult start_capture() {
        if (!audio_) {
            return make_io_error("No audio adapter configured");
        }
        if (microphone_enabled_) {
            return VoidResult();
        }
        VoidResult started = audio_->start_capture([this](const Bytes& chunk) {
            VoidResult sent = manager_.send_audio(chunk);
            if (!sent && sent.error().type != ErrorType::NotReady) {
                LOG_AUDIO("Capture chunk not sent: " + sent.error().message);
            }
        });
        if (!started) {
            return started;
        }
        microphone_enabled_ = true;
        events_.emit_microphone_changed(true);
        return VoidResult();
    }

    void stop_capture() {
        if (!microphone_enabled_.exchange(false)) {
            return;
        }
        if (audio_) {
            audio_->stop_capture();
        }
        events_.emit_microphone_changed(false);
    }

    audio::IAudioAdapter* audio_;
    EventBus events_;
    InterruptionCoordinator coordinator_;
    FrameRouter router_;
    ConnectionManager manager_;
    SubscriptionId internal_subscription_ = 0;
    std::atomic<bool> auto_start_capture_;
    std::atomic<bool> microphone_enabled_;
};

VoiceClient::VoiceClient(std::unique_ptr<transport::ITransport> transport,
                         std::unique_ptr<IScheduler> scheduler,
                         audio::IAudioAdapter* audio)
    : pimpl_(std::make_unique<Impl>(std::move(transport), std::move(scheduler), audio)) {}

VoiceClient::~VoiceClient() = default;

VoidResult VoiceClient::start(const ConnectionConfig& config) {
    return pimpl_->start(config);
}

void VoiceClient::stop() {
    pimpl_->stop();
}

Result<bool> VoiceClient::update_agent_options(const AgentOptions& options) {
    return pimpl_->update_agent_options(options);
}

Result<bool> VoiceClient::update_transcription_options(const TranscriptionOptions& options) {
    return pimpl_->update_transcription_options(options);
}

void VoiceClient::interrupt_agent() {
    pimpl_->interrupt_agent();
}

void VoiceClient::allow_agent() {
    pimpl_->allow_agent();
}

VoidResult VoiceClient::send_audio(const Bytes& chunk) {
    return pimpl_->send_audio(chunk);
}

VoidResult VoiceClient::set_microphone_enabled(bool enabled) {
    return pimpl_->set_microphone_enabled(enabled);
}

void VoiceClient::set_auto_start_capture(bool enabled) {
    pimpl_->set_auto_start_capture(enabled);
}

VoidResult VoiceClient::inject_user_message(const std::string& content) {
    return pimpl_->inject_user_message(content);
}

VoidResult VoiceClient::inject_agent_message(const std::string& content) {
    return pimpl_->inject_agent_message(content);
}

VoidResult VoiceClient::update_instructions(const std::string& prompt) {
    return pimpl_->update_instructions(prompt);
}

VoidResult VoiceClient::update_speak(const std::string& voice) {
    return pimpl_->update_speak(voice);
}

VoidResult VoiceClient::send_function_call_response(const std::string& id,
                                                    const std::string& name,
                                                    const std::string& content) {
    return pimpl_->send_function_call_response(id, name, content);
}

SubscriptionId VoiceClient::subscribe(ClientCallbacks callbacks) {
    return pimpl_->subscribe(std::move(callbacks));
}

void VoiceClient::unsubscribe(SubscriptionId id) {
    pimpl_->unsubscribe(id);
}

ConnectionState VoiceClient::state() const {
    return pimpl_->state();
}

std::optional<Mode> VoiceClient::mode() const {
    return pimpl_->mode();
}

AgentSpeakingState VoiceClient::agent_speaking_state() const {
    return pimpl_->agent_speaking_state();
}

bool VoiceClient::is_audio_allowed() const {
    return pimpl_->is_audio_allowed();
}

bool VoiceClient::is_microphone_enabled() const {
    return pimpl_->is_microphone_enabled();
}

Readiness VoiceClient::readiness() const {
    return pimpl_->readiness();
}

} // namespace voxlink
