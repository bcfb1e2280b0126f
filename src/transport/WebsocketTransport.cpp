/**
 * WebsocketTransport.cpp - Boost.Beast WebSocket client
 *
 * All socket work runs on one strand of the caller's io_context. Writes go
 * through a single ordered queue so control and audio never interleave
 * mid-frame; only audio entries are ever evicted.
 */

#include "xvc/transport/WebsocketTransport.hpp"

#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/asio/strand.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/beast/websocket/ssl.hpp>

#include <openssl/err.h>
#include <openssl/ssl.h>

#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <iostream>
#include <list>
#include <mutex>

namespace asio = boost::asio;
namespace beast = boost::beast;
namespace websocket = beast::websocket;
namespace ssl = asio::ssl;
using tcp = asio::ip::tcp;

namespace xvc::transport {

std::optional<WebsocketUrl> parseWebsocketUrl(const std::string& url) {
    WebsocketUrl out;
    std::string rest;

    if (url.rfind("wss://", 0) == 0) {
        out.secure = true;
        rest = url.substr(6);
    } else if (url.rfind("ws://", 0) == 0) {
        rest = url.substr(5);
    } else {
        return std::nullopt;
    }

    size_t slash = rest.find('/');
    std::string authority = rest.substr(0, slash);
    if (slash != std::string::npos) {
        out.target = rest.substr(slash);
    }

    size_t colon = authority.rfind(':');
    if (colon != std::string::npos) {
        out.host = authority.substr(0, colon);
        out.port = authority.substr(colon + 1);
    } else {
        out.host = authority;
        out.port = out.secure ? "443" : "80";
    }

    if (out.host.empty() || out.port.empty()) return std::nullopt;
    if (!std::all_of(out.port.begin(), out.port.end(), [](unsigned char c) { return std::isdigit(c); })) {
        return std::nullopt;
    }
    return out;
}

namespace {

using PlainWs = websocket::stream<beast::tcp_stream>;
using TlsWs = websocket::stream<beast::ssl_stream<beast::tcp_stream>>;

// One connection attempt. Completion handlers hold it alive and compare
// their generation against the transport's before touching shared state.
template <class Ws>
struct Connection {
    Ws ws;
    beast::flat_buffer buffer;
    uint64_t gen;

    template <class... Args>
    explicit Connection(uint64_t g, Args&&... args) : ws(std::forward<Args>(args)...), gen(g) {}
};

struct Outgoing {
    bool text = true;
    std::string data;
};

} // namespace

struct WebsocketTransport::Impl : std::enable_shared_from_this<WebsocketTransport::Impl> {
    asio::strand<asio::io_context::executor_type> strand;
    WebsocketOptions options;
    std::optional<WebsocketUrl> url;
    ssl::context tls{ssl::context::tlsv12_client};
    tcp::resolver resolver;

    // Strand-only state
    std::shared_ptr<Connection<PlainWs>> plain;
    std::shared_ptr<Connection<TlsWs>> secure;
    uint64_t gen = 0;
    bool connecting = false;
    bool closing = false;
    bool reported = false;
    std::list<Outgoing> outbox;
    size_t queuedAudio = 0;
    bool writing = false;
    uint64_t droppedAudio = 0;
    uint32_t recvSeq = 0;
    std::string sessionId;

    std::atomic<bool> connected{false};

    std::mutex handlerMutex;
    ControlHandler controlHandler;
    AudioHandler audioHandler;
    DisconnectHandler disconnectHandler;
    ConnectedHandler connectedHandler;

    Impl(asio::io_context& io, WebsocketOptions opts)
        : strand(asio::make_strand(io))
        , options(std::move(opts))
        , url(parseWebsocketUrl(options.url))
        , resolver(strand) {
        beast::error_code ec;
        tls.set_default_verify_paths(ec);
        if (ec) {
            std::cerr << "[WebSocket] No default CA paths: " << ec.message() << std::endl;
        }
        tls.set_verify_mode(options.verify_peer ? ssl::verify_peer : ssl::verify_none);

        if (!url) {
            std::cerr << "[WebSocket] Invalid URL: " << options.url << std::endl;
        }
    }

    template <class F>
    void withConnection(F&& f) {
        if (secure) {
            f(secure);
        } else if (plain) {
            f(plain);
        }
    }

    // Connect

    void doConnect() {
        if (connecting || connected) return;

        ++gen;
        reported = false;
        closing = false;
        outbox.clear();
        queuedAudio = 0;
        writing = false;
        recvSeq = 0;
        sessionId.clear();
        plain.reset();
        secure.reset();

        if (!url) {
            report("invalid URL " + options.url);
            return;
        }

        connecting = true;
        if (url->secure) {
            secure = std::make_shared<Connection<TlsWs>>(gen, strand, tls);
        } else {
            plain = std::make_shared<Connection<PlainWs>>(gen, strand);
        }

        std::cout << "[WebSocket] Connecting to " << options.url << std::endl;

        auto self = shared_from_this();
        uint64_t id = gen;
        resolver.async_resolve(url->host, url->port,
            [self, id](beast::error_code ec, tcp::resolver::results_type results) {
                if (id != self->gen) return;
                if (ec) {
                    self->fail("resolve", ec);
                    return;
                }
                self->withConnection([&](auto conn) { self->connectTcp(conn, results); });
            });
    }

    template <class Conn>
    void connectTcp(std::shared_ptr<Conn> conn, const tcp::resolver::results_type& results) {
        auto self = shared_from_this();
        beast::get_lowest_layer(conn->ws).expires_after(std::chrono::seconds(10));
        beast::get_lowest_layer(conn->ws).async_connect(results,
            [self, conn](beast::error_code ec, tcp::endpoint) {
                if (conn->gen != self->gen) return;
                if (ec) {
                    self->fail("connect", ec);
                    return;
                }
                self->secureLayer(conn);
            });
    }

    void secureLayer(std::shared_ptr<Connection<PlainWs>> conn) {
        upgrade(conn);
    }

    void secureLayer(std::shared_ptr<Connection<TlsWs>> conn) {
        if (!SSL_set_tlsext_host_name(conn->ws.next_layer().native_handle(), url->host.c_str())) {
            beast::error_code ec(static_cast<int>(::ERR_get_error()), asio::error::get_ssl_category());
            fail("sni", ec);
            return;
        }
        if (options.verify_peer) {
            conn->ws.next_layer().set_verify_callback(ssl::host_name_verification(url->host));
        }

        auto self = shared_from_this();
        conn->ws.next_layer().async_handshake(ssl::stream_base::client,
            [self, conn](beast::error_code ec) {
                if (conn->gen != self->gen) return;
                if (ec) {
                    self->fail("tls handshake", ec);
                    return;
                }
                self->upgrade(conn);
            });
    }

    template <class Conn>
    void upgrade(std::shared_ptr<Conn> conn) {
        beast::get_lowest_layer(conn->ws).expires_never();
        conn->ws.set_option(websocket::stream_base::timeout::suggested(beast::role_type::client));

        std::string token = options.access_token;
        protocol::Identity identity = options.identity;
        conn->ws.set_option(websocket::stream_base::decorator([token, identity](websocket::request_type& req) {
            req.set(beast::http::field::authorization, "Bearer " + token);
            req.set("Protocol-Version", "1");
            req.set("Device-Id", identity.device_id);
            req.set("Client-Id", identity.client_id);
        }));

        auto self = shared_from_this();
        conn->ws.async_handshake(url->host + ":" + url->port, url->target,
            [self, conn](beast::error_code ec) {
                if (conn->gen != self->gen) return;
                if (ec) {
                    self->fail("handshake", ec);
                    return;
                }

                self->connecting = false;
                self->connected = true;
                std::cout << "[WebSocket] Connected" << std::endl;

                self->read(conn);

                ConnectedHandler handler;
                {
                    std::lock_guard<std::mutex> lock(self->handlerMutex);
                    handler = self->connectedHandler;
                }
                if (handler) handler();
                self->writeNext(conn);
            });
    }

    // Read

    template <class Conn>
    void read(std::shared_ptr<Conn> conn) {
        auto self = shared_from_this();
        conn->ws.async_read(conn->buffer, [self, conn](beast::error_code ec, size_t) {
            if (conn->gen != self->gen) return;
            if (ec == websocket::error::closed) {
                self->report("closed by peer");
                return;
            }
            if (ec) {
                self->fail("read", ec);
                return;
            }
            self->deliver(conn);
            conn->buffer.consume(conn->buffer.size());
            self->read(conn);
        });
    }

    template <class Conn>
    void deliver(const std::shared_ptr<Conn>& conn) {
        if (conn->ws.got_text()) {
            auto message = protocol::parse(beast::buffers_to_string(conn->buffer.data()));
            if (!message) return;

            protocol::MessageType type = protocol::typeOf(*message);
            if (type == protocol::MessageType::Hello || type == protocol::MessageType::HelloAck) {
                std::string id = protocol::sessionIdOf(*message);
                if (!id.empty()) sessionId = id;
            }

            ControlHandler handler;
            {
                std::lock_guard<std::mutex> lock(handlerMutex);
                handler = controlHandler;
            }
            if (handler) handler(*message);
            return;
        }

        auto bytes = conn->buffer.cdata();
        const auto* data = static_cast<const uint8_t*>(bytes.data());

        audio::AudioFrame frame;
        frame.session_id = sessionId;
        frame.sequence = ++recvSeq;
        frame.payload.assign(data, data + bytes.size());

        AudioHandler handler;
        {
            std::lock_guard<std::mutex> lock(handlerMutex);
            handler = audioHandler;
        }
        if (handler) handler(std::move(frame));
    }

    // Write

    void enqueue(Outgoing item, bool audio) {
        if (!connected) return;

        if (audio) {
            if (queuedAudio >= options.max_queued_audio) {
                dropOldestAudio();
            }
            ++queuedAudio;
        }
        outbox.push_back(std::move(item));
        withConnection([&](auto conn) { writeNext(conn); });
    }

    void dropOldestAudio() {
        auto it = outbox.begin();
        if (writing && it != outbox.end()) ++it;  // front is on the wire

        it = std::find_if(it, outbox.end(), [](const Outgoing& o) { return !o.text; });
        if (it == outbox.end()) return;

        outbox.erase(it);
        --queuedAudio;
        if (droppedAudio++ % 50 == 0) {
            std::cerr << "[WebSocket] Write queue full, dropped audio (" << droppedAudio << " total)" << std::endl;
        }
    }

    template <class Conn>
    void writeNext(std::shared_ptr<Conn> conn) {
        if (writing || outbox.empty() || !connected) return;

        writing = true;
        Outgoing& item = outbox.front();
        conn->ws.text(item.text);

        auto self = shared_from_this();
        conn->ws.async_write(asio::buffer(item.data), [self, conn](beast::error_code ec, size_t) {
            if (conn->gen != self->gen) return;
            self->writing = false;
            if (ec) {
                self->fail("write", ec);
                return;
            }
            if (!self->outbox.front().text) --self->queuedAudio;
            self->outbox.pop_front();
            self->writeNext(conn);
        });
    }

    // Teardown

    void doDisconnect() {
        closing = true;
        ++gen;
        connecting = false;
        connected = false;
        resolver.cancel();

        bool wasWriting = writing;
        withConnection([&](auto conn) {
            if (!wasWriting && conn->ws.is_open()) {
                conn->ws.async_close(websocket::close_code::normal, [conn](beast::error_code ec) {
                    if (ec && ec != asio::error::operation_aborted) {
                        std::cerr << "[WebSocket] Close: " << ec.message() << std::endl;
                    }
                });
            } else {
                beast::get_lowest_layer(conn->ws).close();
            }
        });

        plain.reset();
        secure.reset();
        outbox.clear();
        queuedAudio = 0;
        writing = false;
        std::cout << "[WebSocket] Disconnected" << std::endl;
    }

    void fail(const std::string& what, const beast::error_code& ec) {
        if (closing) return;
        report(what + ": " + ec.message());
    }

    // Ends the current connection and reports it once.
    void report(const std::string& reason) {
        ++gen;
        connecting = false;
        connected = false;
        withConnection([](auto conn) { beast::get_lowest_layer(conn->ws).close(); });
        plain.reset();
        secure.reset();
        outbox.clear();
        queuedAudio = 0;
        writing = false;

        if (reported) return;
        reported = true;

        std::cerr << "[WebSocket] Connection lost: " << reason << std::endl;
        DisconnectHandler handler;
        {
            std::lock_guard<std::mutex> lock(handlerMutex);
            handler = disconnectHandler;
        }
        if (handler) handler(reason);
    }
};

WebsocketTransport::WebsocketTransport(asio::io_context& io, WebsocketOptions options)
    : impl_(std::make_shared<Impl>(io, std::move(options))) {
}

WebsocketTransport::~WebsocketTransport() {
    {
        std::lock_guard<std::mutex> lock(impl_->handlerMutex);
        impl_->controlHandler = nullptr;
        impl_->audioHandler = nullptr;
        impl_->disconnectHandler = nullptr;
        impl_->connectedHandler = nullptr;
    }
    disconnect();
}

void WebsocketTransport::connect() {
    auto impl = impl_;
    asio::post(impl->strand, [impl]() { impl->doConnect(); });
}

void WebsocketTransport::disconnect() {
    auto impl = impl_;
    asio::post(impl->strand, [impl]() { impl->doDisconnect(); });
}

bool WebsocketTransport::isConnected() const {
    return impl_->connected;
}

bool WebsocketTransport::sendControlMessage(const nlohmann::json& message) {
    if (!impl_->connected) return false;

    auto impl = impl_;
    Outgoing item{true, message.dump()};
    asio::post(impl->strand, [impl, item = std::move(item)]() mutable { impl->enqueue(std::move(item), false); });
    return true;
}

bool WebsocketTransport::sendAudioFrame(const audio::AudioFrame& frame) {
    if (!impl_->connected) return false;

    auto impl = impl_;
    Outgoing item{false, std::string(frame.payload.begin(), frame.payload.end())};
    asio::post(impl->strand, [impl, item = std::move(item)]() mutable { impl->enqueue(std::move(item), true); });
    return true;
}

void WebsocketTransport::onControlMessage(ControlHandler handler) {
    std::lock_guard<std::mutex> lock(impl_->handlerMutex);
    impl_->controlHandler = std::move(handler);
}

void WebsocketTransport::onAudioFrame(AudioHandler handler) {
    std::lock_guard<std::mutex> lock(impl_->handlerMutex);
    impl_->audioHandler = std::move(handler);
}

void WebsocketTransport::onDisconnect(DisconnectHandler handler) {
    std::lock_guard<std::mutex> lock(impl_->handlerMutex);
    impl_->disconnectHandler = std::move(handler);
}

void WebsocketTransport::onConnected(ConnectedHandler handler) {
    std::lock_guard<std::mutex> lock(impl_->handlerMutex);
    impl_->connectedHandler = std::move(handler);
}

void WebsocketTransport::setCredentials(const Credentials& credentials) {
    if (credentials.access_token.empty()) return;

    auto impl = impl_;
    asio::post(impl->strand, [impl, token = credentials.access_token]() {
        impl->options.access_token = token;
        std::cout << "[WebSocket] Using server-issued access token" << std::endl;
    });
}

} // namespace xvc::transport
