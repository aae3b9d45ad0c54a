#include "events.h"
#include "logger.h"
#include <algorithm>
#include <exception>

namespace voxlink {

SubscriptionId EventBus::subscribe(ClientCallbacks callbacks) {
    std::lock_guard<std::mutex> lock(mutex_);
    SubscriptionId id = next_id_++;
    entries_.emplace_back(id, std::make_shared<const ClientCallbacks>(std::move(callbacks)));
    return id;
}

void EventBus::unsubscribe(SubscriptionId id) {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.erase(std::remove_if(entries_.begin(), entries_.end(),
                                  [id](const Entry& e) { return e.first == id; }),
                   entries_.end());
}

size_t EventBus::subscriber_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

template<typename Handler, typename... Args>
void EventBus::emit(Handler ClientCallbacks::*member, const char* event_name, const Args&... args) {
    std::vector<Entry> snapshot;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        snapshot = entries_;
    }

    for (const auto& entry : snapshot) {
        const Handler& handler = (*entry.second).*member;
        if (!handler) {
            continue;
        }
        // A throwing handler must not take down the transport thread
        try {
            handler(args...);
        } catch (const std::exception& e) {
            Logger::error(std::string("Event handler for ") + event_name +
                          " threw: " + e.what());
        } catch (...) {
            Logger::error(std::string("Event handler for ") + event_name +
                          " threw a non-standard exception");
        }
    }
}

void EventBus::emit_state_changed(ConnectionState prev, ConnectionState next) {
    emit(&ClientCallbacks::on_state_changed, "state_changed", prev, next);
}

void EventBus::emit_mode_resolved(Mode mode) {
    emit(&ClientCallbacks::on_mode_resolved, "mode_resolved", mode);
}

void EventBus::emit_transcript(const TranscriptResult& result) {
    emit(&ClientCallbacks::on_transcript, "transcript", result);
}

void EventBus::emit_agent_text(const AgentText& text) {
    emit(&ClientCallbacks::on_agent_text, "agent_text", text);
}

void EventBus::emit_agent_speaking_changed(AgentSpeakingState prev, AgentSpeakingState next) {
    emit(&ClientCallbacks::on_agent_speaking_changed, "agent_speaking_changed", prev, next);
}

void EventBus::emit_vad(const VadEvent& event) {
    emit(&ClientCallbacks::on_vad, "vad", event);
}

void EventBus::emit_error(const Error& error) {
    emit(&ClientCallbacks::on_error, "error", error);
}

void EventBus::emit_agent_thinking(const std::string& content) {
    emit(&ClientCallbacks::on_agent_thinking, "agent_thinking", content);
}

void EventBus::emit_function_call_request(const FunctionCallRequest& request) {
    emit(&ClientCallbacks::on_function_call_request, "function_call_request", request);
}

void EventBus::emit_control_ack(const std::string& type) {
    emit(&ClientCallbacks::on_control_ack, "control_ack", type);
}

void EventBus::emit_microphone_changed(bool enabled) {
    emit(&ClientCallbacks::on_microphone_changed, "microphone_changed", enabled);
}

} // namespace voxlink
