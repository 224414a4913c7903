/**
 * WebSocketServer.cpp - Beast listener and per-connection transport
 *
 * Outbound frames can come from any thread (partials are produced on the
 * worker pool), so every write is posted to the connection's strand and
 * queued; frames go out in the order they were sent.
 */

#include "lts/server/WebSocketServer.hpp"

#include <boost/asio/dispatch.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/strand.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/version.hpp>
#include <boost/beast/websocket.hpp>

#include <algorithm>
#include <atomic>
#include <deque>
#include <iostream>
#include <thread>
#include <vector>

namespace lts::server {

namespace beast = boost::beast;
namespace websocket = boost::beast::websocket;
namespace net = boost::asio;
using tcp = boost::asio::ip::tcp;

namespace {

void fail(beast::error_code ec, const char* what) {
    std::cerr << "[WebSocketServer] " << what << ": " << ec.message() << std::endl;
}

bool isDisconnect(beast::error_code ec) {
    return ec == websocket::error::closed
        || ec == net::error::eof
        || ec == net::error::connection_reset
        || ec == net::error::operation_aborted
        || ec == beast::error::timeout;
}

class Connection : public std::enable_shared_from_this<Connection> {
public:
    Connection(tcp::socket&& socket, std::shared_ptr<session::StreamSession> session)
        : ws_(std::move(socket))
        , session_(std::move(session)) {
    }

    void run() {
        net::dispatch(ws_.get_executor(),
                      beast::bind_front_handler(&Connection::onRun, shared_from_this()));
    }

    // Thread-safe
    void send(std::string frame) {
        net::post(ws_.get_executor(),
                  [self = shared_from_this(), frame = std::move(frame)]() mutable {
                      self->enqueue(std::move(frame));
                  });
    }

    // Thread-safe; closes once every queued frame is written
    void closeAfterFlush() {
        net::post(ws_.get_executor(), [self = shared_from_this()]() {
            self->close_after_flush_ = true;
            if (self->outbox_.empty()) {
                self->doClose();
            }
        });
    }

private:
    void onRun() {
        ws_.set_option(websocket::stream_base::timeout::suggested(beast::role_type::server));
        ws_.set_option(websocket::stream_base::decorator([](websocket::response_type& res) {
            res.set(beast::http::field::server, "lts-server");
        }));
        ws_.async_accept(beast::bind_front_handler(&Connection::onAccept, shared_from_this()));
    }

    void onAccept(beast::error_code ec) {
        if (ec) {
            return fail(ec, "accept");
        }

        std::weak_ptr<Connection> weak = shared_from_this();
        session_->setCallbacks({
            .onSend = [weak](const std::string& frame) {
                if (auto self = weak.lock()) {
                    self->send(frame);
                }
            },
            .onStateChange = [weak](session::SessionState state) {
                if (state != session::SessionState::Closed) return;
                if (auto self = weak.lock()) {
                    self->closeAfterFlush();
                }
            }
        });

        std::cout << "[WebSocketServer] " << session_->id() << " connected" << std::endl;

        if (!session_->open()) {
            return;
        }
        doRead();
    }

    void doRead() {
        ws_.async_read(buffer_, beast::bind_front_handler(&Connection::onRead, shared_from_this()));
    }

    // A read stays outstanding until the session is Closed. It keeps the
    // connection alive while the final pass runs and reports a disconnect
    // in any state.
    void onRead(beast::error_code ec, std::size_t bytes_transferred) {
        if (ec) {
            // Our own close completes the pending read with error::closed
            if (session_->state() == session::SessionState::Closed) {
                return;
            }
            if (!isDisconnect(ec)) {
                fail(ec, "read");
            }
            session_->abandon();
            return;
        }

        // Frames after "end" are ignored by the session
        if (ws_.got_text()) {
            session_->handleMessage(beast::buffers_to_string(buffer_.data()));
        } else {
            session_->handleBinary(bytes_transferred);
        }
        buffer_.consume(buffer_.size());

        if (session_->state() != session::SessionState::Closed) {
            doRead();
        }
    }

    void enqueue(std::string frame) {
        if (closing_) return;

        outbox_.push_back(std::move(frame));
        if (outbox_.size() == 1) {
            doWrite();
        }
    }

    void doWrite() {
        ws_.text(true);
        ws_.async_write(net::buffer(outbox_.front()),
                        beast::bind_front_handler(&Connection::onWrite, shared_from_this()));
    }

    void onWrite(beast::error_code ec, std::size_t /*bytes_transferred*/) {
        if (ec) {
            if (!isDisconnect(ec)) {
                fail(ec, "write");
            }
            outbox_.clear();
            session_->abandon();
            return;
        }

        outbox_.pop_front();
        if (!outbox_.empty()) {
            doWrite();
        } else if (close_after_flush_) {
            doClose();
        }
    }

    void doClose() {
        if (closing_) return;
        closing_ = true;

        ws_.async_close(websocket::close_code::normal,
                        [self = shared_from_this()](beast::error_code ec) {
                            if (ec && !isDisconnect(ec)) {
                                fail(ec, "close");
                            }
                            std::cout << "[WebSocketServer] " << self->session_->id() << " closed" << std::endl;
                        });
    }

    websocket::stream<beast::tcp_stream> ws_;
    beast::flat_buffer buffer_;
    std::shared_ptr<session::StreamSession> session_;

    // Touched only on the connection strand
    std::deque<std::string> outbox_;
    bool close_after_flush_ = false;
    bool closing_ = false;
};

} // anonymous namespace

struct WebSocketServer::Impl {
    std::shared_ptr<stt::TranscriptionEngine> engine;
    std::shared_ptr<audio::AudioDecoder> decoder;
    boost::asio::thread_pool& workers;
    session::SessionConfig session_config;
    WebSocketConfig config;

    net::io_context ioc;
    tcp::acceptor acceptor;
    std::vector<std::thread> io_threads;
    std::atomic<bool> running{false};
    int bound_port = 0;

    Impl(std::shared_ptr<stt::TranscriptionEngine> eng,
         std::shared_ptr<audio::AudioDecoder> dec,
         boost::asio::thread_pool& pool,
         session::SessionConfig session_cfg,
         WebSocketConfig cfg)
        : engine(std::move(eng))
        , decoder(std::move(dec))
        , workers(pool)
        , session_config(std::move(session_cfg))
        , config(std::move(cfg))
        , ioc(std::max(1, config.io_threads))
        , acceptor(ioc) {
    }

    bool listen() {
        beast::error_code ec;
        auto address = net::ip::make_address(config.host, ec);
        if (ec) { fail(ec, "address"); return false; }

        tcp::endpoint endpoint(address, static_cast<unsigned short>(config.port));

        acceptor.open(endpoint.protocol(), ec);
        if (ec) { fail(ec, "open"); return false; }
        acceptor.set_option(net::socket_base::reuse_address(true), ec);
        if (ec) { fail(ec, "set_option"); return false; }
        acceptor.bind(endpoint, ec);
        if (ec) { fail(ec, "bind"); return false; }
        acceptor.listen(net::socket_base::max_listen_connections, ec);
        if (ec) { fail(ec, "listen"); return false; }

        bound_port = acceptor.local_endpoint().port();
        return true;
    }

    void doAccept() {
        acceptor.async_accept(net::make_strand(ioc), [this](beast::error_code ec, tcp::socket socket) {
            if (ec == net::error::operation_aborted) {
                return;
            }
            if (ec) {
                fail(ec, "accept");
            } else {
                auto session = session::StreamSession::create(engine, decoder, workers, session_config);
                std::make_shared<Connection>(std::move(socket), std::move(session))->run();
            }
            if (acceptor.is_open()) {
                doAccept();
            }
        });
    }
};

WebSocketServer::WebSocketServer(std::shared_ptr<stt::TranscriptionEngine> engine,
                                 std::shared_ptr<audio::AudioDecoder> decoder,
                                 boost::asio::thread_pool& workers,
                                 session::SessionConfig session_config,
                                 WebSocketConfig config)
    : impl_(std::make_unique<Impl>(std::move(engine), std::move(decoder), workers,
                                   std::move(session_config), std::move(config))) {
}

WebSocketServer::~WebSocketServer() {
    stop();
}

bool WebSocketServer::start() {
    if (impl_->running) return true;

    if (!impl_->listen()) {
        return false;
    }

    impl_->doAccept();
    impl_->running = true;

    const int n_threads = std::max(1, impl_->config.io_threads);
    for (int i = 0; i < n_threads; ++i) {
        impl_->io_threads.emplace_back([this]() { impl_->ioc.run(); });
    }

    std::cout << "[WebSocketServer] Listening on ws://" << impl_->config.host << ":"
              << impl_->bound_port << " (" << n_threads << " io thread(s))" << std::endl;
    return true;
}

void WebSocketServer::stop() {
    if (!impl_->running.exchange(false)) return;

    impl_->ioc.stop();

    for (auto& t : impl_->io_threads) {
        if (t.joinable()) t.join();
    }
    impl_->io_threads.clear();

    beast::error_code ec;
    impl_->acceptor.close(ec);

    std::cout << "[WebSocketServer] Stopped" << std::endl;
}

bool WebSocketServer::isRunning() const {
    return impl_->running;
}

int WebSocketServer::port() const {
    return impl_->bound_port;
}

} // namespace lts::server
