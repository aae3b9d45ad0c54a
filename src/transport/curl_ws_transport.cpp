#include "transport/curl_ws_transport.h"
#include "core/constants.h"
#include "logger.h"
#include <curl/curl.h>
#include <curl/websockets.h>
#include <poll.h>
#include <atomic>
#include <chrono>
#include <mutex>
#include <thread>
#include <vector>

namespace voxlink {
namespace transport {

namespace {

constexpr int SEND_RETRY_LIMIT = 50;

// Aborts curl_easy_perform() while the upgrade is still in flight
int abort_on_stop(void* clientp, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    auto* stop = static_cast<std::atomic<bool>*>(clientp);
    return stop->load() ? 1 : 0;
}

CloseInfo parse_close_payload(const std::vector<uint8_t>& payload) {
    CloseInfo info;
    if (payload.size() >= 2) {
        info.code = (payload[0] << 8) | payload[1];
        info.reason.assign(payload.begin() + 2, payload.end());
    } else {
        info.code = 1005;
    }
    return info;
}

} // anonymous namespace

class CurlWebSocketTransport::Impl {
public:
    explicit Impl(int connect_timeout_ms)
        : connect_timeout_ms_(connect_timeout_ms), curl_(nullptr),
          open_(false), stop_(false) {
        curl_global_init(CURL_GLOBAL_DEFAULT);
    }

    ~Impl() {
        close();
        reap_reader();
        curl_global_cleanup();
    }

    VoidResult open(const std::string& url, const std::vector<std::string>& headers,
                    Callbacks callbacks) {
        if (url.empty()) {
            return make_transport_error("Empty endpoint URL");
        }
        if (reader_thread_.joinable() && reader_thread_.get_id() == std::this_thread::get_id()) {
            return make_transport_error("open() called from the transport's own callback");
        }

        close();
        reap_reader();

        std::lock_guard<std::mutex> lock(curl_mutex_);
        curl_ = curl_easy_init();
        if (!curl_) {
            return make_transport_error("Failed to initialize CURL");
        }

        curl_slist* header_list = nullptr;
        for (const auto& h : headers) {
            header_list = curl_slist_append(header_list, h.c_str());
        }

        stop_ = false;
        open_ = false;
        callbacks_ = std::move(callbacks);

        curl_easy_setopt(curl_, CURLOPT_URL, url.c_str());
        curl_easy_setopt(curl_, CURLOPT_HTTPHEADER, header_list);
        curl_easy_setopt(curl_, CURLOPT_CONNECT_ONLY, 2L);
        curl_easy_setopt(curl_, CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(connect_timeout_ms_));
        curl_easy_setopt(curl_, CURLOPT_NOSIGNAL, 1L);
        curl_easy_setopt(curl_, CURLOPT_NOPROGRESS, 0L);
        curl_easy_setopt(curl_, CURLOPT_XFERINFOFUNCTION, abort_on_stop);
        curl_easy_setopt(curl_, CURLOPT_XFERINFODATA, &stop_);

        LOG_WS("Connecting to " + url);
        reader_thread_ = std::thread(&Impl::reader_loop, this, header_list);
        return VoidResult();
    }

    VoidResult send_text(const std::string& payload) {
        return send_frame(payload.data(), payload.size(), CURLWS_TEXT);
    }

    VoidResult send_binary(const Bytes& payload) {
        return send_frame(payload.data(), payload.size(), CURLWS_BINARY);
    }

    void close() {
        if (stop_.exchange(true)) {
            return;
        }

        {
            std::lock_guard<std::mutex> lock(curl_mutex_);
            if (open_ && curl_) {
                // Normal closure, status 1000
                const unsigned char payload[2] = {0x03, 0xE8};
                size_t sent = 0;
                CURLcode rc = curl_ws_send(curl_, payload, sizeof(payload), &sent, 0, CURLWS_CLOSE);
                if (rc != CURLE_OK) {
                    LOG_WS(std::string("Close frame not sent: ") + curl_easy_strerror(rc));
                }
            }
            open_ = false;
        }

        // The reader exits on its own when close() runs inside one of its callbacks
        if (reader_thread_.joinable() && reader_thread_.get_id() != std::this_thread::get_id()) {
            reader_thread_.join();
        }
    }

    bool is_open() const {
        return open_.load();
    }

private:
    VoidResult send_frame(const void* data, size_t size, unsigned int flags) {
        std::lock_guard<std::mutex> lock(curl_mutex_);
        if (!open_ || !curl_) {
            return make_transport_error("Socket is not open");
        }

        for (int attempt = 0; attempt < SEND_RETRY_LIMIT; ++attempt) {
            size_t sent = 0;
            CURLcode rc = curl_ws_send(curl_, data, size, &sent, 0, flags);
            if (rc == CURLE_OK) {
                if (sent != size) {
                    return make_transport_error("Short WebSocket send: " + std::to_string(sent) +
                                                " of " + std::to_string(size) + " bytes");
                }
                return VoidResult();
            }
            if (rc != CURLE_AGAIN) {
                return make_transport_error(std::string("WebSocket send failed: ") + curl_easy_strerror(rc));
            }
            wait_socket(POLLOUT, constants::protocol::POLL_INTERVAL_MS);
        }
        return make_transport_error("WebSocket send timed out");
    }

    // Caller holds curl_mutex_
    void wait_socket(short events, int timeout_ms) {
        curl_socket_t sockfd = CURL_SOCKET_BAD;
        if (curl_easy_getinfo(curl_, CURLINFO_ACTIVESOCKET, &sockfd) != CURLE_OK ||
            sockfd == CURL_SOCKET_BAD) {
            return;
        }
        pollfd pfd{};
        pfd.fd = sockfd;
        pfd.events = events;
        ::poll(&pfd, 1, timeout_ms);
    }

    void reader_loop(curl_slist* header_list) {
        CURLcode rc = curl_easy_perform(curl_);
        if (rc != CURLE_OK) {
            bool requested = stop_.load();
            std::string reason = std::string("Connect failed: ") + curl_easy_strerror(rc);
            teardown(header_list);
            if (!requested) {
                Logger::error("[WS] " + reason);
                emit_close(CloseInfo{1006, reason});
            }
            return;
        }

        long http_code = 0;
        curl_easy_getinfo(curl_, CURLINFO_RESPONSE_CODE, &http_code);
        LOG_WS("Upgrade complete (HTTP " + std::to_string(http_code) + ")");

        curl_socket_t sockfd = CURL_SOCKET_BAD;
        curl_easy_getinfo(curl_, CURLINFO_ACTIVESOCKET, &sockfd);

        open_ = true;
        if (!stop_ && callbacks_.on_open) {
            callbacks_.on_open();
        }

        std::vector<uint8_t> buffer(constants::protocol::RECV_BUFFER_BYTES);
        std::vector<uint8_t> message;
        int message_flags = 0;
        std::vector<Frame> ready;
        CloseInfo close_info;
        bool remote_closed = false;

        while (!stop_) {
            if (sockfd != CURL_SOCKET_BAD) {
                pollfd pfd{};
                pfd.fd = sockfd;
                pfd.events = POLLIN;
                ::poll(&pfd, 1, constants::protocol::POLL_INTERVAL_MS);
            } else {
                std::this_thread::sleep_for(std::chrono::milliseconds(constants::protocol::POLL_INTERVAL_MS));
            }

            // TLS may hold decoded bytes the socket no longer signals; drain every pass
            {
                std::lock_guard<std::mutex> lock(curl_mutex_);
                while (!stop_) {
                    size_t received = 0;
                    const curl_ws_frame* meta = nullptr;
                    rc = curl_ws_recv(curl_, buffer.data(), buffer.size(), &received, &meta);
                    if (rc == CURLE_AGAIN) {
                        break;
                    }
                    if (rc != CURLE_OK || !meta) {
                        close_info = CloseInfo{1006, std::string("Receive failed: ") + curl_easy_strerror(rc)};
                        remote_closed = true;
                        break;
                    }

                    if (message.empty()) {
                        message_flags = meta->flags;
                    }
                    message.insert(message.end(), buffer.begin(), buffer.begin() + received);

                    bool complete = meta->bytesleft == 0 && !(meta->flags & CURLWS_CONT);
                    if (!complete) {
                        continue;
                    }

                    if (message_flags & CURLWS_CLOSE) {
                        close_info = parse_close_payload(message);
                        remote_closed = true;
                        message.clear();
                        break;
                    }
                    if (message_flags & CURLWS_TEXT) {
                        ready.push_back(Frame::make_text(std::string(message.begin(), message.end())));
                    } else if (message_flags & CURLWS_BINARY) {
                        ready.push_back(Frame::make_binary(Bytes(message.begin(), message.end())));
                    }
                    // Pings are answered by libcurl
                    message.clear();
                }
            }

            for (const auto& frame : ready) {
                if (stop_) break;
                if (callbacks_.on_message) {
                    callbacks_.on_message(frame);
                }
            }
            ready.clear();

            if (remote_closed) {
                break;
            }
        }

        bool requested = stop_.load();
        teardown(header_list);
        if (remote_closed && !requested) {
            LOG_WS("Socket closed by peer: code=" + std::to_string(close_info.code) +
                   " reason=" + close_info.reason);
            emit_close(close_info);
        }
    }

    void teardown(curl_slist* header_list) {
        std::lock_guard<std::mutex> lock(curl_mutex_);
        open_ = false;
        if (curl_) {
            curl_easy_cleanup(curl_);
            curl_ = nullptr;
        }
        curl_slist_free_all(header_list);
    }

    void emit_close(const CloseInfo& info) {
        stop_ = true;
        if (callbacks_.on_close) {
            callbacks_.on_close(info);
        }
    }

    void reap_reader() {
        if (reader_thread_.joinable()) {
            if (reader_thread_.get_id() == std::this_thread::get_id()) {
                reader_thread_.detach();
            } else {
                reader_thread_.join();
            }
        }
    }

    int connect_timeout_ms_;
    CURL* curl_;
    std::mutex curl_mutex_;
    std::atomic<bool> open_;
    std::atomic<bool> stop_;
    Callbacks callbacks_;
    std::thread reader_thread_;
};

CurlWebSocketTransport::CurlWebSocketTransport(int connect_timeout_ms)
    : pimpl_(std::make_unique<Impl>(connect_timeout_ms)) {}

CurlWebSocketTransport::~CurlWebSocketTransport() = default;

VoidResult CurlWebSocketTransport::open(const std::string& url,
                                        const std::vector<std::string>& headers,
                                        Callbacks callbacks) {
    return pimpl_->open(url, headers, std::move(callbacks));
}

VoidResult CurlWebSocketTransport::send_text(const std::string& payload) {
    return pimpl_->send_text(payload);
}

VoidResult CurlWebSocketTransport::send_binary(const Bytes& payload) {
    return pimpl_->send_binary(payload);
}

void CurlWebSocketTransport::close() {
    pimpl_->close();
}

bool CurlWebSocketTransport::is_open() const {
    return pimpl_->is_open();
}

} // namespace transport
} // namespace voxlink
