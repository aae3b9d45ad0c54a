#include "connection_state_machine.h"
#include "logger.h"
#include <mutex>

namespace voxlink {

class ConnectionStateMachine::Impl {
public:
    Impl() : state_(ConnectionState::Idle) {}

    ConnectionState get_state() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return state_;
    }

    bool transition_to(ConnectionState next) {
        ConnectionState prev;
        StateListener listener;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            prev = state_;
            if (!ConnectionStateMachine::is_allowed(prev, next)) {
                LOG_DEBUG(std::string("Rejected transition ") + to_string(prev) + " -> " + to_string(next));
                return false;
            }
            state_ = next;
            listener = listener_;
        }

        LOG_CONN(std::string(to_string(prev)) + " -> " + to_string(next));
        if (listener) {
            listener(prev, next);
        }
        return true;
    }

    void set_listener(StateListener listener) {
        std::lock_guard<std::mutex> lock(mutex_);
        listener_ = std::move(listener);
    }

private:
    mutable std::mutex mutex_;
    ConnectionState state_;
    StateListener listener_;
};

bool ConnectionStateMachine::is_allowed(ConnectionState from, ConnectionState to) {
    switch (to) {
        case ConnectionState::Connecting:
            return from == ConnectionState::Idle ||
                   from == ConnectionState::Closed ||
                   from == ConnectionState::Errored;

        case ConnectionState::Open:
            return from == ConnectionState::Connecting;

        case ConnectionState::SettingsSent:
            return from == ConnectionState::Open;

        case ConnectionState::Ready:
            return from == ConnectionState::SettingsSent;

        case ConnectionState::Closing:
            return from != ConnectionState::Idle &&
                   from != ConnectionState::Closing &&
                   from != ConnectionState::Closed;

        case ConnectionState::Closed:
            return from == ConnectionState::Closing;

        case ConnectionState::Errored:
            return from == ConnectionState::Connecting ||
                   from == ConnectionState::Open ||
                   from == ConnectionState::SettingsSent ||
                   from == ConnectionState::Ready;

        case ConnectionState::Idle:
            return false;
    }
    return false;
}

ConnectionStateMachine::ConnectionStateMachine() : pimpl_(std::make_unique<Impl>()) {}
ConnectionStateMachine::~ConnectionStateMachine() = default;

ConnectionState ConnectionStateMachine::get_state() const {
    return pimpl_->get_state();
}

bool ConnectionStateMachine::transition_to(ConnectionState next) {
    return pimpl_->transition_to(next);
}

void ConnectionStateMachine::set_listener(StateListener listener) {
    pimpl_->set_listener(std::move(listener));
}

bool ConnectionStateMachine::is_connecting() const {
    ConnectionState s = get_state();
    return s == ConnectionState::Connecting ||
           s == ConnectionState::Open ||
           s == ConnectionState::SettingsSent;
}

bool ConnectionStateMachine::is_active() const {
    ConnectionState s = get_state();
    return s == ConnectionState::Connecting ||
           s == ConnectionState::Open ||
           s == ConnectionState::SettingsSent ||
           s == ConnectionState::Ready;
}

} // namespace voxlink
