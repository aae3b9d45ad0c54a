#pragma once

/**
 * @file transport_interface.h
 * @brief Message-oriented bidirectional socket
 *
 * The connection manager talks to the network only through this interface.
 */

#include "core/types.h"
#include "errors.h"
#include <functional>
#include <string>
#include <vector>

namespace voxlink {
namespace transport {

enum class FrameType {
    Text,
    Binary
};

/**
 * @brief One complete inbound message (fragments already joined)
 */
struct Frame {
    FrameType type = FrameType::Text;
    std::string text;   ///< Payload when type == Text
    Bytes data;         ///< Payload when type == Binary

    static Frame make_text(std::string payload) {
        Frame f;
        f.type = FrameType::Text;
        f.text = std::move(payload);
        return f;
    }

    static Frame make_binary(Bytes payload) {
        Frame f;
        f.type = FrameType::Binary;
        f.data = std::move(payload);
        return f;
    }
};

struct CloseInfo {
    int code = 1006;        ///< WebSocket close code; 1006 = abnormal
    std::string reason;
};

/**
 * @brief Callbacks for one open() call
 *
 * Delivered on the transport's own thread, one at a time, in arrival order.
 * on_close fires only for closes the caller did not request.
 */
struct Callbacks {
    std::function<void()> on_open;
    std::function<void(const Frame&)> on_message;
    std::function<void(const CloseInfo&)> on_close;
};

/**
 * @brief Abstract transport
 */
class ITransport {
public:
    virtual ~ITransport() = default;

    /**
     * @brief Begin connecting; completion is reported through callbacks.on_open
     * @param url Endpoint URL (ws:// or wss://)
     * @param headers Extra HTTP upgrade headers ("Name: value")
     * @return Error only for failures detected before any I/O
     */
    virtual VoidResult open(const std::string& url,
                            const std::vector<std::string>& headers,
                            Callbacks callbacks) = 0;

    virtual VoidResult send_text(const std::string& payload) = 0;

    virtual VoidResult send_binary(const Bytes& payload) = 0;

    /**
     * @brief Close the socket or abort a pending open. Safe to call from a callback.
     */
    virtual void close() = 0;

    virtual bool is_open() const = 0;
};

} // namespace transport
} // namespace voxlink
