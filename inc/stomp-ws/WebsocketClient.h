#ifndef STOMP_WS_WEBSOCKET_CLIENT_H
#define STOMP_WS_WEBSOCKET_CLIENT_H

#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/asio/ssl/host_name_verification.hpp>
#include <boost/beast.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/system/error_code.hpp>

#include <openssl/ssl.h>

#include <spdlog/spdlog.h>

#include <chrono>
#include <deque>
#include <functional>
#include <string>
#include <type_traits>
#include <utility>

namespace StompWs {

/*! \brief Client to connect to a Websocket server, in plain text or over TLS.
 *
 *  All operations run on a strand of the I/O context. `Send` and `Close` can
 *  be called from any thread; outgoing messages are queued and written one at
 *  a time.
 *
 *  \tparam Resolver        The class to resolve the URL to an IP address. It
 *                          must support the same interface of
 *                          boost::asio::ip::tcp::resolver.
 *  \tparam WebsocketStream The Websocket stream class. It must support the
 *                          same interface of boost::beast::websocket::stream.
 *                          The connection uses TLS when the next layer of the
 *                          stream is an SSL stream.
 */
template <
    typename Resolver,
    typename WebsocketStream
>
class WebsocketClient {
public:
    /*! \brief True if the Websocket stream runs over TLS.
     */
    static constexpr bool kUsesTls {std::is_base_of_v<
        boost::asio::ssl::stream_base,
        typename WebsocketStream::next_layer_type
    >};

    /*! \brief Construct a Websocket client.
     *
     *  \note This constructor does not initiate a connection.
     *
     *  \param url      The host name of the server.
     *  \param endpoint The endpoint on the server to connect to.
     *                  Example: broker.example.com:61614/<endpoint>
     *  \param port     The port on the server.
     *  \param ioc      The io_context object. The user takes care of calling
     *                  ioc.run().
     *  \param ctx      The TLS context to setup a TLS socket stream. Unused
     *                  for plain-text streams.
     */
    WebsocketClient(
        const std::string& url,
        const std::string& endpoint,
        const std::string& port,
        boost::asio::io_context& ioc,
        boost::asio::ssl::context& ctx
    ) : url_ {url},
        endpoint_ {endpoint},
        port_ {port},
        resolver_ {boost::asio::make_strand(ioc)},
        ws_ {MakeStream(ioc, ctx)}
    {
        spdlog::info("WebsocketClient: New {} client for {}:{}{}",
                     kUsesTls ? "wss" : "ws", url_, port_, endpoint_);
    }

    /*! \brief Destructor.
     */
    ~WebsocketClient() = default;

    /*! \brief Connect to the server.
     *
     *  \param onConnect     Called when the connection fails or succeeds.
     *  \param onMessage     Called only when a message is successfully
     *                       received. The message is an rvalue reference;
     *                       ownership is passed to the receiver.
     *  \param onDisconnect  Called when the connection is closed by the server
     *                       or due to a connection error. It is not called
     *                       after a `Close`.
     */
    void Connect(
        std::function<void (boost::system::error_code)> onConnect = nullptr,
        std::function<void (boost::system::error_code,
                            std::string&&)> onMessage = nullptr,
        std::function<void (boost::system::error_code)> onDisconnect = nullptr
    )
    {
        boost::asio::post(
            ws_.get_executor(),
            [this, onConnect, onMessage, onDisconnect]() {
                // Save the user callbacks for later use.
                onConnect_ = onConnect;
                onMessage_ = onMessage;
                onDisconnect_ = onDisconnect;

                // Resolve, then connect, then the TLS and Websocket
                // handshakes.
                closed_ = false;
                spdlog::info("WebsocketClient: Resolving {}:{}", url_, port_);
                resolver_.async_resolve(url_, port_,
                    [this](auto ec, auto results) {
                        boost::asio::post(
                            ws_.get_executor(),
                            [this, ec, results]() {
                                OnResolved(ec, results);
                            }
                        );
                    }
                );
            }
        );
    }

    /*! \brief Send a text message to the Websocket server.
     *
     *  \param message The message to send. It is copied into the outgoing
     *                 queue.
     *  \param onSend  Called when a message is sent successfully or if it
     *                 failed to send. Fails with operation_aborted when the
     *                 connection is down.
     */
    void Send(
        const std::string& message,
        std::function<void (boost::system::error_code)> onSend = nullptr
    )
    {
        boost::asio::post(
            ws_.get_executor(),
            [this, message, onSend]() {
                if (!connected_) {
                    spdlog::error("WebsocketClient: Cannot send message: "
                                  "Not connected");
                    if (onSend) {
                        onSend(boost::asio::error::operation_aborted);
                    }
                    return;
                }
                outbox_.push_back({message, onSend});
                if (outbox_.size() == 1) {
                    WriteNextMessage();
                }
            }
        );
    }

    /*! \brief Close the Websocket connection.
     *
     *  \param onClose Called when the connection is closed, successfully or
     *                 not.
     */
    void Close(
        std::function<void (boost::system::error_code)> onClose = nullptr
    )
    {
        boost::asio::post(
            ws_.get_executor(),
            [this, onClose]() {
                spdlog::info("WebsocketClient: Closing connection");
                closed_ = true;
                connected_ = false;
                CloseStream(onClose);
            }
        );
    }

private:
    struct OutgoingMessage {
        std::string message {};
        std::function<void (boost::system::error_code)> onSend {nullptr};
    };

    std::string url_ {};
    std::string endpoint_ {};
    std::string port_ {};

    // We leave these uninitialized because they do not support a default
    // constructor.
    Resolver resolver_;
    WebsocketStream ws_;

    boost::beast::flat_buffer rBuffer_ {};

    // Only one async_write can be outstanding on a Websocket stream.
    std::deque<OutgoingMessage> outbox_ {};

    bool closed_ {true};
    bool connected_ {false};

    std::function<void (boost::system::error_code)> onConnect_ {nullptr};
    std::function<void (boost::system::error_code,
                        std::string&&)> onMessage_ {nullptr};
    std::function<void (boost::system::error_code)> onDisconnect_ {nullptr};

    static WebsocketStream MakeStream(
        boost::asio::io_context& ioc,
        boost::asio::ssl::context& ctx
    )
    {
        if constexpr (kUsesTls) {
            return WebsocketStream {boost::asio::make_strand(ioc), ctx};
        } else {
            return WebsocketStream {boost::asio::make_strand(ioc)};
        }
    }

    void CloseStream(
        std::function<void (boost::system::error_code)> onClose
    )
    {
        ws_.async_close(
            boost::beast::websocket::close_code::normal,
            [onClose](auto ec) {
                if (ec) {
                    spdlog::error("WebsocketClient: Could not close "
                                  "connection: {}", ec.message());
                }
                if (onClose) {
                    onClose(ec);
                }
            }
        );
    }

    void FailConnect(
        const char* step,
        const boost::system::error_code& ec
    )
    {
        spdlog::error("WebsocketClient: {} failed: {}", step, ec.message());
        if (onConnect_) {
            onConnect_(ec);
        }
    }

    void OnResolved(
        const boost::system::error_code& ec,
        boost::asio::ip::tcp::resolver::results_type results
    )
    {
        if (ec || results.empty()) {
            FailConnect("Name resolution",
                        ec ? ec : boost::asio::error::host_not_found);
            return;
        }
        auto endpoint {results.begin()->endpoint()};
        spdlog::info("WebsocketClient: {} resolved to {}",
                     url_, endpoint.address().to_string());

        // Bound the TCP connect only. The TCP stream is the lowest layer:
        // Websocket -> [TLS ->] TCP.
        auto& tcp {boost::beast::get_lowest_layer(ws_)};
        tcp.expires_after(std::chrono::seconds(5));
        tcp.async_connect(endpoint,
            [this](auto ec) {
                OnTcpConnected(ec);
            }
        );
    }

    void OnTcpConnected(
        const boost::system::error_code& ec
    )
    {
        if (ec) {
            FailConnect("TCP connect", ec);
            return;
        }
        spdlog::info("WebsocketClient: TCP connection established");

        // From here on the Websocket layer watches the connection: it pings
        // after 5 s of silence and drops it after 10 s without an answer.
        boost::beast::get_lowest_layer(ws_).expires_never();
        auto timeouts {boost::beast::websocket::stream_base::timeout::suggested(
            boost::beast::role_type::client
        )};
        timeouts.idle_timeout = std::chrono::seconds(10);
        timeouts.keep_alive_pings = true;
        ws_.set_option(timeouts);

        if constexpr (kUsesTls) {
            // SNI, then certificate host name checks.
            auto& tls {ws_.next_layer()};
            SSL_set_tlsext_host_name(tls.native_handle(), url_.c_str());
            tls.set_verify_callback(
                boost::asio::ssl::host_name_verification(url_)
            );
            tls.async_handshake(
                boost::asio::ssl::stream_base::client,
                [this](auto ec) {
                    OnTlsHandshakeDone(ec);
                }
            );
        } else {
            StartWebsocketHandshake();
        }
    }

    void OnTlsHandshakeDone(
        const boost::system::error_code& ec
    )
    {
        if (ec) {
            FailConnect("TLS handshake", ec);
            return;
        }
        StartWebsocketHandshake();
    }

    void StartWebsocketHandshake()
    {
        spdlog::info("WebsocketClient: Upgrading to Websocket on {}",
                     endpoint_);
        ws_.async_handshake(url_, endpoint_,
            [this](auto ec) {
                OnWebsocketHandshakeDone(ec);
            }
        );
    }

    void OnWebsocketHandshakeDone(
        const boost::system::error_code& ec
    )
    {
        if (ec) {
            FailConnect("Websocket handshake", ec);
            return;
        }

        // Close() may have been called while we were connecting.
        if (closed_) {
            spdlog::info("WebsocketClient: Closed while connecting");
            CloseStream(nullptr);
            if (onConnect_) {
                onConnect_(boost::asio::error::operation_aborted);
            }
            return;
        }
        spdlog::info("WebsocketClient: Connected to {}:{}{}",
                     url_, port_, endpoint_);

        // STOMP frames are exchanged as text messages.
        ws_.text(true);
        connected_ = true;
        ListenToIncomingMessage();

        // Runs on the Websocket strand.
        if (onConnect_) {
            onConnect_(ec);
        }
    }

    void ListenToIncomingMessage()
    {
        // One read in flight at a time; the next one starts after the message
        // is handed over.
        ws_.async_read(rBuffer_,
            [this](auto ec, auto nBytes) {
                if (ec) {
                    OnReadFailed(ec);
                    return;
                }
                OnRead(nBytes);
                ListenToIncomingMessage();
            }
        );
    }

    void OnRead(
        size_t nBytes
    )
    {
        spdlog::debug("WebsocketClient: Received {}-byte message", nBytes);

        // Text and binary messages are both forwarded as bytes.
        std::string message {boost::beast::buffers_to_string(rBuffer_.data())};
        rBuffer_.consume(rBuffer_.size());
        if (onMessage_) {
            onMessage_({}, std::move(message));
        }
    }

    void OnReadFailed(
        const boost::system::error_code& ec
    )
    {
        spdlog::info("WebsocketClient: Stopped listening to incoming "
                     "messages: {}", ec.message());
        connected_ = false;
        if (onDisconnect_ && !closed_) {
            closed_ = true;
            onDisconnect_(ec);
        }
    }

    void WriteNextMessage()
    {
        ws_.async_write(boost::asio::buffer(outbox_.front().message),
            [this](auto ec, auto nBytes) {
                OnWrite(ec, nBytes);
            }
        );
    }

    void OnWrite(
        const boost::system::error_code& ec,
        size_t nBytes
    )
    {
        auto onSend {std::move(outbox_.front().onSend)};
        outbox_.pop_front();
        if (ec) {
            spdlog::error("WebsocketClient: Could not send message: {}",
                          ec.message());
        } else {
            spdlog::debug("WebsocketClient: Sent {}-byte message", nBytes);
        }
        if (onSend) {
            onSend(ec);
        }
        if (!outbox_.empty()) {
            WriteNextMessage();
        }
    }
};

/*! \brief Websocket client over TLS (wss://).
 */
using BoostWebsocketClient = WebsocketClient<
    boost::asio::ip::tcp::resolver,
    boost::beast::websocket::stream<
        boost::beast::ssl_stream<boost::beast::tcp_stream>
    >
>;

/*! \brief Websocket client in plain text (ws://).
 */
using BoostPlainWebsocketClient = WebsocketClient<
    boost::asio::ip::tcp::resolver,
    boost::beast::websocket::stream<boost::beast::tcp_stream>
>;

} // namespace StompWs

#endif // STOMP_WS_WEBSOCKET_CLIENT_H
