#pragma once

#include "core/types.h"
#include <memory>
#include <functional>

namespace voxlink {

/// Called after every applied transition with (previous, next)
using StateListener = std::function<void(ConnectionState, ConnectionState)>;

/**
 * @brief Validated lifecycle of one streaming connection
 *
 * Allowed transitions:
 * - Idle / Closed / Errored -> Connecting   (start)
 * - Connecting -> Open                      (transport acknowledged)
 * - Open -> SettingsSent                    (settings transmitted)
 * - SettingsSent -> Ready                   (ack frame or grace timer)
 * - Connecting / Open / SettingsSent / Ready / Errored -> Closing   (stop)
 * - Closing -> Closed
 * - Connecting / Open / SettingsSent / Ready -> Errored   (transport close, fatal error)
 *
 * Anything else is rejected and leaves the state untouched. The listener runs
 * on the thread that requested the transition, after the state is updated.
 */
class ConnectionStateMachine {
public:
    ConnectionStateMachine();
    ~ConnectionStateMachine();

    ConnectionStateMachine(const ConnectionStateMachine&) = delete;
    ConnectionStateMachine& operator=(const ConnectionStateMachine&) = delete;

    /**
     * @brief Get current state (safe from any thread)
     */
    ConnectionState get_state() const;

    /**
     * @brief Apply a transition if the table allows it
     * @return True if applied and reported, false if rejected
     */
    bool transition_to(ConnectionState next);

    /**
     * @brief Register the single transition listener (replaces any previous one)
     */
    void set_listener(StateListener listener);

    /**
     * @brief True while a connection attempt is in flight (Connecting, Open, SettingsSent)
     */
    bool is_connecting() const;

    /**
     * @brief True from Connecting through Ready
     */
    bool is_active() const;

    static bool is_allowed(ConnectionState from, ConnectionState to);

private:
    class Impl;
    std::unique_ptr<Impl> pimpl_;
};

} // namespace voxlink
