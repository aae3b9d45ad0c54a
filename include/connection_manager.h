#pragma once

#include "connection_state_machine.h"
#include "core/config.h"
#include "core/scheduler.h"
#include "errors.h"
#include "mode_resolver.h"
#include "transport/transport_interface.h"
#include <nlohmann/json.hpp>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace voxlink {

class EventBus;
class FrameRouter;
class InterruptionCoordinator;

/**
 * @brief Owns the single streaming connection of a client
 *
 * Lifecycle:
 * - start(): resolve mode, reset per-connection state, Idle -> Connecting, open transport
 * - transport open: Connecting -> Open, send settings, capture snapshot, Open -> SettingsSent
 * - SettingsApplied (or grace timer): SettingsSent -> Ready
 * - transport close / fatal error frame: -> Errored (never reconnects)
 * - stop(): -> Closing -> Closed
 *
 * Transport callbacks carry the generation of the connection that produced
 * them; callbacks from an earlier connection are ignored.
 *
 * The transport is never opened or closed while the internal lock is held:
 * close() joins the transport thread, which may itself be waiting for it.
 * State, mode and error events are queued under the lock and emitted by the
 * same thread after it is released, so any callback may call back in.
 * Frames are routed outside the lock.
 */
class ConnectionManager {
public:
    ConnectionManager(std::unique_ptr<transport::ITransport> transport,
                      std::unique_ptr<IScheduler> scheduler,
                      EventBus& events,
                      InterruptionCoordinator& coordinator,
                      FrameRouter& router);
    ~ConnectionManager();

    ConnectionManager(const ConnectionManager&) = delete;
    ConnectionManager& operator=(const ConnectionManager&) = delete;

    /**
     * @brief Begin a connection
     * @return ConfigError (no option records), AlreadyConnecting (attempt in
     *         flight), TransportError (open refused). Ready is a no-op success.
     */
    VoidResult start(const ConnectionConfig& config);

    /**
     * @brief Close the connection from any state; Idle and Closed are no-ops
     */
    void stop();

    /**
     * @brief Resend settings if the active mode's option records changed
     * @return true if a settings message was sent, false if values were unchanged;
     *         NotReady outside Ready, ConfigError if the update would change mode
     */
    Result<bool> update_options(const ConnectionConfig& new_config);

    /**
     * @brief Send a JSON control message (Ready only)
     */
    VoidResult send_control(const nlohmann::json& message);

    /**
     * @brief Send a capture chunk (Ready only). Does not take the connection lock.
     */
    VoidResult send_audio(const Bytes& chunk);

    ConnectionState state() const;
    std::optional<Mode> mode() const;
    ConnectionConfig config() const;
    OptionsSnapshot snapshot() const;

    /**
     * @brief Upgrade headers for the configured credentials
     */
    static std::vector<std::string> auth_headers(const config::Credentials& credentials);

private:
    class Impl;
    std::unique_ptr<Impl> pimpl_;
};

} // namespace voxlink
