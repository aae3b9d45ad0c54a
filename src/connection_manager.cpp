#include "connection_manager.h"
#include "events.h"
#include "frame_router.h"
#include "interruption_coordinator.h"
#include "logger.h"
#include <functional>
#include <mutex>
#include <vector>

using json = nlohmann::json;

namespace voxlink {

class ConnectionManager::Impl {
public:
    Impl(std::unique_ptr<transport::ITransport> transport,
         std::unique_ptr<IScheduler> scheduler,
         EventBus& events,
         InterruptionCoordinator& coordinator,
         FrameRouter& router)
        : transport_(std::move(transport)), scheduler_(std::move(scheduler)),
          events_(events), coordinator_(coordinator), router_(router),
          generation_(0), ack_timer_(0), keepalive_timer_(0) {
        // Every transition happens under mutex_; the event goes out after it is released
        state_machine_.set_listener([this](ConnectionState prev, ConnectionState next) {
            pending_events_.push_back([this, prev, next] { events_.emit_state_changed(prev, next); });
        });
        router_.set_settings_ack_handler([this] { on_settings_acknowledged(); });
        router_.set_fatal_error_handler([this](const Error& error) { on_fatal_frame(error); });
    }

    ~Impl() {
        stop();
        // Join the timer thread before the members its tasks touch go away
        scheduler_.reset();
    }

    VoidResult start(const ConnectionConfig& config) {
        std::unique_lock<std::mutex> lock(mutex_);

        auto mode_result = resolve_mode(config);
        if (!mode_result) {
            Logger::error("[Conn] start rejected: " + mode_result.error().message);
            return mode_result.error();
        }

        ConnectionState current = state_machine_.get_state();
        if (state_machine_.is_connecting() || current == ConnectionState::Closing) {
            LOG_CONN(std::string("start ignored; connection already ") + to_string(current));
            return make_already_connecting_error();
        }
        if (current == ConnectionState::Ready) {
            LOG_CONN("start ignored; connection already ready");
            return VoidResult();
        }

        // Fresh connection: nothing from the previous one survives
        ++generation_;
        cancel_timers();
        config_ = config;
        mode_ = mode_result.value();
        snapshot_.clear();
        coordinator_.reset();
        router_.begin_connection(*mode_, config.protocol.fatal_error_codes);

        const Mode mode = *mode_;
        LOG_CONN(std::string("Mode resolved: ") + to_string(mode));
        pending_events_.push_back([this, mode] { events_.emit_mode_resolved(mode); });

        state_machine_.transition_to(ConnectionState::Connecting);

        const uint64_t generation = generation_;
        const std::string url = endpoint_for(mode, config_);
        const auto headers = ConnectionManager::auth_headers(config_.credentials);

        transport::Callbacks callbacks;
        callbacks.on_open = [this, generation] { on_transport_open(generation); };
        callbacks.on_message = [this, generation](const transport::Frame& frame) {
            on_transport_message(generation, frame);
        };
        callbacks.on_close = [this, generation](const transport::CloseInfo& info) {
            on_transport_close(generation, info);
        };

        // Connecting is reported before the transport can report open
        dispatch_pending(lock);
        LOG_CONN("Opening " + url);
        VoidResult opened = transport_->open(url, headers, std::move(callbacks));
        lock.lock();

        if (generation != generation_) {
            // stop() ran while the transport was opening
            bool close_now = !state_machine_.is_active();
            dispatch_pending(lock);
            if (close_now) {
                transport_->close();
            }
            return VoidResult();
        }
        if (!opened) {
            Error error = make_transport_error("Failed to open transport: " + opened.error().message);
            fail_connection(error, true);
            dispatch_pending(lock);
            return error;
        }
        return VoidResult();
    }

    void stop() {
        std::unique_lock<std::mutex> lock(mutex_);

        ConnectionState current = state_machine_.get_state();
        if (current == ConnectionState::Idle ||
            current == ConnectionState::Closed ||
            current == ConnectionState::Closing) {
            return;
        }

        if (current == ConnectionState::Ready && mode_ && mode_includes_transcription(*mode_)) {
            VoidResult sent = transport_->send_text(json{{"type", "CloseStream"}}.dump());
            if (!sent) {
                Logger::warn("[Conn] CloseStream not sent: " + sent.error().message);
            }
        }

        state_machine_.transition_to(ConnectionState::Closing);
        ++generation_;
        cancel_timers();
        snapshot_.clear();

        dispatch_pending(lock);
        // Joins the reader thread: a frame already being routed finishes first
        transport_->close();
        coordinator_.flush();
        lock.lock();

        state_machine_.transition_to(ConnectionState::Closed);
        dispatch_pending(lock);
    }

    Result<bool> update_options(const ConnectionConfig& new_config) {
        std::lock_guard<std::mutex> lock(mutex_);

        if (state_machine_.get_state() != ConnectionState::Ready || !mode_) {
            return make_not_ready_error("Options can only be updated while Ready");
        }

        auto new_mode = resolve_mode(new_config);
        if (!new_mode || new_mode.value() != *mode_) {
            return make_config_error("Option update would change the connection mode; stop() and start() instead");
        }

        if (!should_resend_settings(snapshot_, *mode_, new_config)) {
            LOG_SETTINGS("Options unchanged; no resend");
            return false;
        }

        ConnectionConfig merged = config_;
        merged.transcription = new_config.transcription;
        merged.agent = new_config.agent;

        VoidResult sent = transport_->send_text(build_settings_message(*mode_, merged));
        if (!sent) {
            return make_transport_error("Failed to resend settings: " + sent.error().message);
        }

        config_ = merged;
        snapshot_.capture(config_);
        LOG_SETTINGS(std::string("Settings resent for mode ") + to_string(*mode_));
        return true;
    }

    VoidResult send_control(const json& message) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_machine_.get_state() != ConnectionState::Ready) {
            return make_not_ready_error();
        }
        VoidResult sent = transport_->send_text(message.dump());
        if (!sent) {
            return make_transport_error(sent.error().message);
        }
        return VoidResult();
    }

    VoidResult send_audio(const Bytes& chunk) {
        if (state_machine_.get_state() != ConnectionState::Ready) {
            return make_not_ready_error();
        }
        VoidResult sent = transport_->send_binary(chunk);
        if (!sent) {
            return make_transport_error(sent.error().message);
        }
        return VoidResult();
    }

    ConnectionState state() const {
        return state_machine_.get_state();
    }

    std::optional<Mode> mode() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return mode_;
    }

    ConnectionConfig config() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return config_;
    }

    OptionsSnapshot snapshot() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return snapshot_;
    }

private:
    using PendingEvent = std::function<void()>;

    // Caller holds mutex_
    std::vector<PendingEvent> take_pending() {
        std::vector<PendingEvent> events;
        events.swap(pending_events_);
        return events;
    }

    static void run(const std::vector<PendingEvent>& events) {
        for (const auto& event : events) {
            event();
        }
    }

    // Releases lock, then runs the events queued while it was held
    void dispatch_pending(std::unique_lock<std::mutex>& lock) {
        std::vector<PendingEvent> events = take_pending();
        lock.unlock();
        run(events);
    }

    // ---- transport callbacks (transport thread) ----

    void on_transport_open(uint64_t generation) {
        std::unique_lock<std::mutex> lock(mutex_);
        if (generation != generation_ || !mode_) {
            return;
        }
        if (!state_machine_.transition_to(ConnectionState::Open)) {
            return;
        }

        VoidResult sent = transport_->send_text(build_settings_message(*mode_, config_));
        if (!sent) {
            bool close_now = fail_connection(
                make_transport_error("Failed to send settings: " + sent.error().message), false);
            std::vector<PendingEvent> events = take_pending();
            lock.unlock();
            if (close_now) {
                transport_->close();
            }
            run(events);
            return;
        }
        snapshot_.capture(config_);
        LOG_SETTINGS(std::string("Settings sent for mode ") + to_string(*mode_));

        state_machine_.transition_to(ConnectionState::SettingsSent);
        arm_ack_timer(generation);
        arm_keepalive(generation);
        dispatch_pending(lock);
    }

    void on_transport_message(uint64_t generation, const transport::Frame& frame) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (generation != generation_) {
                return;
            }
            ConnectionState current = state_machine_.get_state();
            if (current != ConnectionState::Open &&
                current != ConnectionState::SettingsSent &&
                current != ConnectionState::Ready) {
                return;
            }
        }

        // Outside the lock: the router emits caller events directly
        router_.route(frame);
    }

    void on_transport_close(uint64_t generation, const transport::CloseInfo& info) {
        std::unique_lock<std::mutex> lock(mutex_);
        if (generation != generation_) {
            return;
        }
        std::string message = "Socket closed (code " + std::to_string(info.code) + ")";
        if (!info.reason.empty()) {
            message += ": " + info.reason;
        }
        fail_connection(make_transport_error(message), true);
        dispatch_pending(lock);
    }

    void on_settings_acknowledged() {
        std::unique_lock<std::mutex> lock(mutex_);
        if (state_machine_.get_state() != ConnectionState::SettingsSent) {
            return;
        }
        cancel_ack_timer();
        LOG_SETTINGS("Settings acknowledged");
        state_machine_.transition_to(ConnectionState::Ready);
        dispatch_pending(lock);
    }

    // The router has already emitted the error event for this frame
    void on_fatal_frame(const Error& error) {
        std::unique_lock<std::mutex> lock(mutex_);
        bool close_now = fail_connection(error, false, false);
        std::vector<PendingEvent> events = take_pending();
        lock.unlock();
        // Transport thread: close() detaches rather than joins itself
        if (close_now) {
            transport_->close();
        }
        run(events);
    }

    // ---- timers (scheduler thread) ----

    void arm_ack_timer(uint64_t generation) {
        int grace_ms = config_.protocol.settings_ack_grace_ms;
        if (grace_ms <= 0) {
            return;
        }
        ack_timer_ = scheduler_->schedule_after(grace_ms, [this, generation] {
            on_ack_timeout(generation);
        });
    }

    void on_ack_timeout(uint64_t generation) {
        std::unique_lock<std::mutex> lock(mutex_);
        if (generation != generation_) {
            return;
        }
        ack_timer_ = 0;
        if (state_machine_.get_state() == ConnectionState::SettingsSent) {
            LOG_SETTINGS("No acknowledgement within " +
                         std::to_string(config_.protocol.settings_ack_grace_ms) + " ms; assuming applied");
            state_machine_.transition_to(ConnectionState::Ready);
        }
        dispatch_pending(lock);
    }

    void arm_keepalive(uint64_t generation) {
        int interval_ms = config_.protocol.keepalive_interval_ms;
        if (interval_ms <= 0) {
            return;
        }
        keepalive_timer_ = scheduler_->schedule_after(interval_ms, [this, generation] {
            on_keepalive(generation);
        });
    }

    void on_keepalive(uint64_t generation) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (generation != generation_) {
            return;
        }
        keepalive_timer_ = 0;
        ConnectionState current = state_machine_.get_state();
        if (current != ConnectionState::SettingsSent && current != ConnectionState::Ready) {
            return;
        }
        VoidResult sent = transport_->send_text(json{{"type", "KeepAlive"}}.dump());
        if (!sent) {
            Logger::warn("[Conn] KeepAlive not sent: " + sent.error().message);
        }
        arm_keepalive(generation);
    }

    void cancel_ack_timer() {
        if (ack_timer_ != 0) {
            scheduler_->cancel(ack_timer_);
            ack_timer_ = 0;
        }
    }

    void cancel_timers() {
        cancel_ack_timer();
        if (keepalive_timer_ != 0) {
            scheduler_->cancel(keepalive_timer_);
            keepalive_timer_ = 0;
        }
    }

    /**
     * Caller holds mutex_ and dispatches afterwards.
     * @return true if the caller must close the transport once unlocked
     */
    bool fail_connection(Error error, bool transport_already_closed, bool report = true) {
        error.fatal = true;
        if (!state_machine_.is_active()) {
            return false;
        }
        Logger::error("[Conn] " + error.message);
        cancel_timers();
        ++generation_;
        if (report) {
            pending_events_.push_back([this, error] { events_.emit_error(error); });
        }
        state_machine_.transition_to(ConnectionState::Errored);
        return !transport_already_closed;
    }

    std::unique_ptr<transport::ITransport> transport_;
    std::unique_ptr<IScheduler> scheduler_;
    EventBus& events_;
    InterruptionCoordinator& coordinator_;
    FrameRouter& router_;
    ConnectionStateMachine state_machine_;

    mutable std::mutex mutex_;
    ConnectionConfig config_;
    std::optional<Mode> mode_;
    OptionsSnapshot snapshot_;
    uint64_t generation_;
    TimerId ack_timer_;
    TimerId keepalive_timer_;
    std::vector<PendingEvent> pending_events_;
};

ConnectionManager::ConnectionManager(std::unique_ptr<transport::ITransport> transport,
                                     std::unique_ptr<IScheduler> scheduler,
                                     EventBus& events,
                                     InterruptionCoordinator& coordinator,
                                     FrameRouter& router)
    : pimpl_(std::make_unique<Impl>(std::move(transport), std::move(scheduler),
                                    events, coordinator, router)) {}

ConnectionManager::~ConnectionManager() = default;

VoidResult ConnectionManager::start(const ConnectionConfig& config) {
    return pimpl_->start(config);
}

void ConnectionManager::stop() {
    pimpl_->stop();
}

Result<bool> ConnectionManager::update_options(const ConnectionConfig& new_config) {
    return pimpl_->update_options(new_config);
}

VoidResult ConnectionManager::send_control(const json& message) {
    return pimpl_->send_control(message);
}

VoidResult ConnectionManager::send_audio(const Bytes& chunk) {
    return pimpl_->send_audio(chunk);
}

ConnectionState ConnectionManager::state() const {
    return pimpl_->state();
}

std::optional<Mode> ConnectionManager::mode() const {
    return pimpl_->mode();
}

ConnectionConfig ConnectionManager::config() const {
    return pimpl_->config();
}

OptionsSnapshot ConnectionManager::snapshot() const {
    return pimpl_->snapshot();
}

std::vector<std::string> ConnectionManager::auth_headers(const config::Credentials& credentials) {
    std::vector<std::string> headers;
    std::string key = config::normalize_api_key(credentials.api_key);
    if (key.empty()) {
        return headers;
    }
    const char* scheme = credentials.auth_scheme == "bearer" ? "Bearer" : "Token";
    headers.push_back(std::string("Authorization: ") + scheme + " " + key);
    return headers;
}

} // namespace voxlink
