#ifndef STOMP_WS_STOMP_CLIENT_H
#define STOMP_WS_STOMP_CLIENT_H

#include <stomp-ws/HeartbeatScheduler.h>
#include <stomp-ws/StompFrame.h>
#include <stomp-ws/StompSession.h>
#include <stomp-ws/SubscriptionRegistry.h>

#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>

#include <spdlog/spdlog.h>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <exception>
#include <filesystem>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <thread>
#include <utility>

namespace StompWs {

/*! \brief Configuration of a STOMP client.
 */
struct StompClientConfig {
    std::string host {};
    std::string port {"61614"};
    bool useTls {true};
    bool useSockJs {false};
    bool insecure {false};
    std::filesystem::path caCertFile {};
    StompCredentials credentials {};
    std::chrono::milliseconds heartbeatInterval {10000};

    // Zero waits forever.
    std::chrono::milliseconds connectTimeout {10000};
    std::chrono::milliseconds disconnectTimeout {2000};

    bool ackMessages {true};
};

/*! \brief Build the Websocket URL: `scheme://host:port[/websocket]`.
 *
 *  The scheme is `wss` with TLS, `ws` otherwise. The `/websocket` suffix is
 *  only added in SockJS mode.
 */
std::string MakeWebsocketUrl(const StompClientConfig& config);

/*! \brief Websocket handshake target: `/websocket` in SockJS mode, `/`
 *         otherwise.
 */
std::string MakeWebsocketEndpoint(const StompClientConfig& config);

/*! \brief Build the TLS context for the configured trust policy.
 *
 *  In insecure mode certificates are not verified. Otherwise the peer is
 *  verified against `caCertFile`, or the system default paths when empty.
 */
boost::asio::ssl::context MakeTlsContext(const StompClientConfig& config);

/*! \brief Generate a subscription ID: `sub-<unix seconds>-<8 hex chars>`.
 */
std::string GenerateSubscriptionId();

/*! \brief STOMP client for application code.
 *
 *  The client owns its I/O context and runs it on a dedicated thread. All
 *  methods are blocking or return immediately; user handlers run on the I/O
 *  thread.
 *
 *  \tparam WsClient    Websocket client class. This type must have the same
 *                      interface of WebsocketClient.
 */
template <typename WsClient>
class StompClient {
public:
    /*! \brief Construct a STOMP client.
     *
     *  \note This constructor does not initiate a connection.
     *
     *  \param config   Connection parameters and credentials. They do not
     *                  change for the lifetime of the client.
     *  \param onError  Optional handler for the conditions reported by the
     *                  session: broker errors, lost connection, unparseable
     *                  frames, unrouted messages.
     */
    explicit StompClient(
        const StompClientConfig& config,
        std::function<void (StompClientError, std::string&&)> onError = nullptr
    ) : config_ {config},
        work_ {boost::asio::make_work_guard(ioc_)},
        ctx_ {MakeTlsContext(config)},
        session_ {MakeSessionConfig(config), registry_, ioc_, ctx_},
        heartbeat_ {session_, ioc_, config.heartbeatInterval},
        onError_ {onError}
    {
        spdlog::info("StompClient: Creating STOMP client for {}",
                     session_.GetUrl());
        thread_ = std::thread([this]() {
            RunIoContext();
        });
    }

    /*! \brief Destructor. Disconnects and stops the I/O thread.
     */
    ~StompClient()
    {
        Disconnect();
        heartbeat_.Stop();
        work_.reset();
        ioc_.stop();
        if (thread_.joinable()) {
            thread_.join();
        }
    }

    /*! \brief The copy constructor is deleted.
     */
    StompClient(const StompClient& other) = delete;

    /*! \brief The copy assignment operator is deleted.
     */
    StompClient& operator=(const StompClient& other) = delete;

    /*! \brief Connect to the STOMP server.
     *
     *  Blocks until the server accepts or rejects the connection, the
     *  connection drops, or the connect timeout expires.
     *
     *  \returns true if the session is Active.
     */
    bool Connect()
    {
        spdlog::info("StompClient: Connecting to {}", session_.GetUrl());
        heartbeat_.Start();
        auto error {session_.Open(
            [this](auto state, auto reason) {
                OnStateChange(state, reason);
            },
            [this](auto ec, auto&& description) {
                OnError(ec, std::move(description));
            }
        )};
        if (error != StompClientError::kOk) {
            spdlog::error("StompClient: Could not open session: {}",
                          ToString(error));
            return session_.GetState() == SessionState::kActive;
        }

        // Wait until the session leaves the Connecting state.
        auto isSettled {[this]() {
            return session_.GetState() != SessionState::kConnecting;
        }};
        std::unique_lock<std::mutex> lock {mutex_};
        if (config_.connectTimeout.count() > 0) {
            auto settled {stateChanged_.wait_for(
                lock,
                config_.connectTimeout,
                isSettled
            )};
            if (!settled) {
                lock.unlock();
                spdlog::error("StompClient: Connection timed out after {} ms",
                              config_.connectTimeout.count());
                session_.Abort(StompClientError::kConnectTimeout);
            }
        } else {
            stateChanged_.wait(lock, isSettled);
        }

        connected_ = session_.GetState() == SessionState::kActive;
        if (connected_) {
            spdlog::info("StompClient: Connected to {}", session_.GetUrl());
        } else {
            spdlog::error("StompClient: Could not connect to {}: Session is {}",
                          session_.GetUrl(), ToString(session_.GetState()));
        }
        return connected_;
    }

    /*! \brief Subscribe to a STOMP destination.
     *
     *  A later subscription to the same destination replaces this one.
     *
     *  \returns The subscription ID, or an empty string if the client is not
     *           connected.
     *
     *  \param destination  The subscription topic or queue.
     *  \param onMessage    Called with the body of every MESSAGE frame
     *                      received on the destination.
     */
    std::string Subscribe(
        const std::string& destination,
        MessageHandler onMessage
    )
    {
        if (session_.GetState() != SessionState::kActive) {
            spdlog::error("StompClient: Cannot subscribe to {}: Not connected",
                          destination);
            return "";
        }
        spdlog::info("StompClient: Subscribing to {}", destination);
        Subscription subscription {
            destination,
            GenerateSubscriptionId(),
            "client",
            std::move(onMessage),
        };
        auto subscriptionId {subscription.id};
        auto replaced {registry_.Register(std::move(subscription))};
        if (replaced) {
            spdlog::info("StompClient: Replacing subscription {} on {}",
                         replaced->id, destination);
        }

        StompFrame frame {
            StompCommand::kSubscribe,
            {
                {StompHeader::kId, subscriptionId},
                {StompHeader::kAck, "client"},
                {StompHeader::kDestination, destination},
            }
        };
        auto error {session_.Transmit(frame)};
        if (error != StompClientError::kOk) {
            spdlog::error("StompClient: Could not subscribe to {}: {}",
                          destination, ToString(error));
            registry_.Unregister(destination);
            if (replaced) {
                registry_.Register(std::move(*replaced));
            }
            return "";
        }
        return subscriptionId;
    }

    /*! \brief Remove the subscription on a destination.
     *
     *  \returns kUnknownSubscription if there is no subscription on the
     *           destination.
     */
    StompClientError Unsubscribe(
        const std::string& destination
    )
    {
        if (session_.GetState() != SessionState::kActive) {
            spdlog::error("StompClient: Cannot unsubscribe from {}: "
                          "Not connected", destination);
            return StompClientError::kNotConnected;
        }
        auto subscription {registry_.Unregister(destination)};
        if (!subscription) {
            spdlog::warn("StompClient: No subscription on {}", destination);
            return StompClientError::kUnknownSubscription;
        }
        spdlog::info("StompClient: Unsubscribing from {}", destination);
        StompFrame frame {
            StompCommand::kUnsubscribe,
            {
                {StompHeader::kId, subscription->id},
            }
        };
        return session_.Transmit(frame);
    }

    /*! \brief Send a message to a STOMP destination.
     *
     *  \returns kNotConnected if the client is not connected. Nothing is
     *           queued in that case.
     */
    StompClientError Send(
        const std::string& destination,
        const std::string& message
    )
    {
        spdlog::info("StompClient: Sending message to {}", destination);
        StompFrame frame {
            StompCommand::kSend,
            {
                {StompHeader::kDestination, destination},
                {StompHeader::kContentLength, std::to_string(message.size())},
            },
            message
        };
        return session_.Transmit(frame);
    }

    /*! \brief Disconnect from the STOMP server.
     *
     *  Does nothing unless the client is connected. Blocks until the Websocket
     *  connection is closed or the disconnect timeout expires.
     */
    void Disconnect()
    {
        if (!connected_.exchange(false)) {
            return;
        }
        spdlog::info("StompClient: Disconnecting from {}", session_.GetUrl());
        auto closed {std::make_shared<std::promise<StompClientError>>()};
        auto future {closed->get_future()};
        auto error {session_.Disconnect(
            [closed](auto ec) {
                closed->set_value(ec);
            }
        )};
        if (error != StompClientError::kOk) {
            spdlog::info("StompClient: Session already closed: {}",
                         ToString(error));
            return;
        }
        auto status {future.wait_for(config_.disconnectTimeout)};
        if (status != std::future_status::ready) {
            spdlog::warn("StompClient: Timed out waiting for the connection "
                         "to close");
            return;
        }
        auto closeError {future.get()};
        if (closeError != StompClientError::kOk) {
            spdlog::warn("StompClient: Could not close connection: {}",
                         ToString(closeError));
        }
    }

    /*! \brief Check if the client is connected and the session Active.
     */
    bool IsConnected() const
    {
        return connected_ && session_.GetState() == SessionState::kActive;
    }

    /*! \brief Get the session state.
     */
    SessionState GetState() const
    {
        return session_.GetState();
    }

    /*! \brief Get the Websocket URL.
     */
    const std::string& GetUrl() const
    {
        return session_.GetUrl();
    }

    /*! \brief Number of MESSAGE frames dropped for lack of a subscription.
     */
    size_t GetUnroutedMessageCount() const
    {
        return session_.GetUnroutedMessageCount();
    }

    /*! \brief Number of heartbeats sent so far.
     */
    size_t GetHeartbeatCount() const
    {
        return heartbeat_.GetSentCount();
    }

private:
    StompClientConfig config_ {};

    // We maintain our own instance of the I/O context. The work guard keeps
    // the I/O thread alive while we are not connected.
    boost::asio::io_context ioc_ {};
    boost::asio::executor_work_guard<
        boost::asio::io_context::executor_type
    > work_;
    boost::asio::ssl::context ctx_;

    SubscriptionRegistry registry_ {};
    StompSession<WsClient> session_;
    HeartbeatScheduler<StompSession<WsClient>> heartbeat_;

    std::function<void (StompClientError, std::string&&)> onError_ {nullptr};

    std::atomic<bool> connected_ {false};
    std::mutex mutex_ {};
    std::condition_variable stateChanged_ {};

    std::thread thread_ {};

    static StompSessionConfig MakeSessionConfig(
        const StompClientConfig& config
    )
    {
        StompSessionConfig sessionConfig {};
        sessionConfig.host = config.host;
        sessionConfig.port = config.port;
        sessionConfig.endpoint = MakeWebsocketEndpoint(config);
        sessionConfig.url = MakeWebsocketUrl(config);
        sessionConfig.credentials = config.credentials;
        sessionConfig.ackMessages = config.ackMessages;
        return sessionConfig;
    }

    void RunIoContext()
    {
        // An exception thrown by a handler must not stop the I/O thread.
        while (true) {
            try {
                ioc_.run();
                break;
            } catch (const std::exception& e) {
                spdlog::error("StompClient: Exception in I/O thread: {}",
                              e.what());
            }
        }
    }

    void OnStateChange(
        SessionState state,
        StompClientError reason
    )
    {
        spdlog::debug("StompClient: Session is {} ({})",
                      ToString(state), ToString(reason));
        if (state == SessionState::kClosed || state == SessionState::kFailed) {
            connected_ = false;
        }
        {
            std::lock_guard<std::mutex> lock {mutex_};
        }
        stateChanged_.notify_all();
    }

    void OnError(
        StompClientError error,
        std::string&& description
    )
    {
        if (onError_) {
            onError_(error, std::move(description));
        }
    }
};

} // namespace StompWs

#endif // STOMP_WS_STOMP_CLIENT_H
