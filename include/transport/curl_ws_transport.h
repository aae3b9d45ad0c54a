#pragma once

#include "transport/transport_interface.h"
#include <memory>

namespace voxlink {
namespace transport {

/**
 * @brief WebSocket transport on libcurl's ws API
 *
 * open() starts a reader thread that performs the upgrade (CONNECT_ONLY=2),
 * then polls the socket and assembles fragmented messages. Sends and receives
 * share one easy handle and are serialized by a mutex.
 */
class CurlWebSocketTransport : public ITransport {
public:
    /**
     * @param connect_timeout_ms TCP/TLS connect and upgrade timeout
     */
    explicit CurlWebSocketTransport(int connect_timeout_ms);
    ~CurlWebSocketTransport() override;

    CurlWebSocketTransport(const CurlWebSocketTransport&) = delete;
    CurlWebSocketTransport& operator=(const CurlWebSocketTransport&) = delete;

    VoidResult open(const std::string& url,
                    const std::vector<std::string>& headers,
                    Callbacks callbacks) override;
    VoidResult send_text(const std::string& payload) override;
    VoidResult send_binary(const Bytes& payload) override;
    void close() override;
    bool is_open() const override;

private:
    class Impl;
    std::unique_ptr<Impl> pimpl_;
};

} // namespace transport
} // namespace voxlink
