#pragma once

/**
 * @file events.h
 * @brief Caller-facing event subscriptions
 */

#include "core/types.h"
#include "errors.h"
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace voxlink {

/**
 * @brief Handlers for client events; unset members are skipped
 *
 * Handlers run on the thread that produced the event (usually the transport
 * reader thread) and may call back into VoiceClient.
 */
struct ClientCallbacks {
    std::function<void(ConnectionState prev, ConnectionState next)> on_state_changed;
    std::function<void(Mode)> on_mode_resolved;
    std::function<void(const TranscriptResult&)> on_transcript;
    std::function<void(const AgentText&)> on_agent_text;
    std::function<void(AgentSpeakingState prev, AgentSpeakingState next)> on_agent_speaking_changed;
    std::function<void(const VadEvent&)> on_vad;
    std::function<void(const Error&)> on_error;
    std::function<void(const std::string& content)> on_agent_thinking;
    std::function<void(const FunctionCallRequest&)> on_function_call_request;
    std::function<void(const std::string& type)> on_control_ack;
    std::function<void(bool enabled)> on_microphone_changed;
};

using SubscriptionId = uint64_t;

/**
 * @brief Explicit subscription list
 *
 * Emission walks a snapshot of the list, so handlers may subscribe or
 * unsubscribe while an event is being delivered.
 */
class EventBus {
public:
    SubscriptionId subscribe(ClientCallbacks callbacks);
    void unsubscribe(SubscriptionId id);
    size_t subscriber_count() const;

    void emit_state_changed(ConnectionState prev, ConnectionState next);
    void emit_mode_resolved(Mode mode);
    void emit_transcript(const TranscriptResult& result);
    void emit_agent_text(const AgentText& text);
    void emit_agent_speaking_changed(AgentSpeakingState prev, AgentSpeakingState next);
    void emit_vad(const VadEvent& event);
    void emit_error(const Error& error);
    void emit_agent_thinking(const std::string& content);
    void emit_function_call_request(const FunctionCallRequest& request);
    void emit_control_ack(const std::string& type);
    void emit_microphone_changed(bool enabled);

private:
    using Entry = std::pair<SubscriptionId, std::shared_ptr<const ClientCallbacks>>;

    template<typename Handler, typename... Args>
    void emit(Handler ClientCallbacks::*member, const char* event_name, const Args&... args);

    mutable std::mutex mutex_;
    std::vector<Entry> entries_;
    SubscriptionId next_id_ = 1;
};

} // namespace voxlink
