#ifndef STOMP_WS_STOMP_SESSION_H
#define STOMP_WS_STOMP_SESSION_H

#include <stomp-ws/StompFrame.h>
#include <stomp-ws/SubscriptionRegistry.h>

#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>

#include <spdlog/spdlog.h>

#include <atomic>
#include <exception>
#include <functional>
#include <initializer_list>
#include <optional>
#include <ostream>
#include <string>
#include <utility>

namespace StompWs {

/*! \brief State of a STOMP session.
 */
enum class SessionState {
    kDisconnected,
    kConnecting,
    kActive,
    kClosed,
    kFailed,
};

/*! \brief Print operator for the `SessionState` class.
 */
std::ostream& operator<<(std::ostream& os, const SessionState& state);

/*! \brief Convert `SessionState` to string.
 */
std::string ToString(const SessionState& state);

/*! \brief Error codes for the STOMP session and client.
 */
enum class StompClientError {
    kOk = 0,
    kUndefinedError,
    kBrokerError,
    kConnectionLost,
    kConnectTimeout,
    kCouldNotCloseWebsocketConnection,
    kCouldNotConnectToWebsocketServer,
    kCouldNotParseMessageAsStompFrame,
    kNotConnected,
    kSessionAlreadyOpened,
    kUnknownSubscription,
    kUnroutedMessage,
};

/*! \brief Print operator for the `StompClientError` class.
 */
std::ostream& operator<<(std::ostream& os, const StompClientError& error);

/*! \brief Convert `StompClientError` to string.
 */
std::string ToString(const StompClientError& error);

/*! \brief STOMP login credentials. Both fields are optional.
 */
struct StompCredentials {
    std::optional<std::string> username {};
    std::optional<std::string> passcode {};
};

/*! \brief Parameters of a STOMP session.
 */
struct StompSessionConfig {
    std::string host {};
    std::string port {};
    std::string endpoint {"/"};
    std::string url {};
    StompCredentials credentials {};
    bool ackMessages {true};
};

/*! \brief Protocol versions offered in the CONNECT frame.
 */
inline const std::string kStompAcceptVersion {"1.0,1.1"};

/*! \brief Heart-beat offer in the CONNECT frame, in ms.
 *
 *  The offer does not follow the client send interval.
 */
inline const std::string kStompHeartBeat {"10000,10000"};

/*! \brief One STOMP connection over one Websocket connection.
 *
 *  The session drives the connection state machine:
 *
 *      Disconnected --Open()--> Connecting
 *      Connecting --CONNECTED--> Active
 *      Connecting|Active --ERROR--> Failed
 *      Active --Disconnect()--> Closed
 *      Connecting|Active|Failed --transport closed--> Closed
 *      Connecting --Abort()--> Failed, then Closed once the Websocket closes
 *
 *  A session is used once. Inbound frames are decoded on the Websocket
 *  strand; user handlers run on a separate strand. The public methods can be
 *  called from any thread.
 *
 *  \tparam WsClient    Websocket client class. This type must have the same
 *                      interface of WebsocketClient.
 */
template <typename WsClient>
class StompSession {
public:
    /*! \brief Construct a STOMP session.
     *
     *  \note This constructor does not initiate a connection.
     *
     *  \param config   Session parameters. `url` is sent as the CONNECT host
     *                  header.
     *  \param registry Subscriptions used to route MESSAGE frames. The
     *                  registry must outlive the session.
     *  \param ioc      The io_context object. The user takes care of calling
     *                  ioc.run().
     *  \param ctx      The TLS context to setup a TLS socket stream.
     */
    StompSession(
        const StompSessionConfig& config,
        SubscriptionRegistry& registry,
        boost::asio::io_context& ioc,
        boost::asio::ssl::context& ctx
    ) : context_ {boost::asio::make_strand(ioc)},
        config_ {config},
        registry_ {registry},
        ws_ {config.host, config.endpoint, config.port, ioc, ctx}
    {
        spdlog::info("StompSession: Creating STOMP session for {}",
                     config_.url);
    }

    /*! \brief The copy constructor is deleted.
     */
    StompSession(const StompSession& other) = delete;

    /*! \brief The copy assignment operator is deleted.
     */
    StompSession& operator=(const StompSession& other) = delete;

    /*! \brief Open the Websocket connection and start the STOMP handshake.
     *
     *  \param onStateChange Called on every state transition with the new
     *                       state and the reason for it.
     *  \param onError       Called for every reported, non-fatal or fatal,
     *                       condition: broker errors, lost connection,
     *                       unparseable frames, unrouted messages.
     *
     *  \returns kSessionAlreadyOpened if the session is not Disconnected.
     *
     *  All handlers run in a separate I/O execution context from the Websocket
     *  one.
     */
    StompClientError Open(
        std::function<void (SessionState, StompClientError)> onStateChange =
            nullptr,
        std::function<void (StompClientError, std::string&&)> onError =
            nullptr
    )
    {
        auto expected {SessionState::kDisconnected};
        if (!state_.compare_exchange_strong(expected,
                                            SessionState::kConnecting)) {
            spdlog::error("StompSession: Cannot open a session in state {}",
                          ToString(expected));
            return StompClientError::kSessionAlreadyOpened;
        }
        onStateChange_ = onStateChange;
        onError_ = onError;
        NotifyStateChange(SessionState::kConnecting, StompClientError::kOk);

        spdlog::info("StompSession: Connecting to {}", config_.url);
        ws_.Connect(
            [this](auto ec) {
                OnWsConnect(ec);
            },
            [this](auto ec, auto&& msg) {
                OnWsMessage(ec, std::move(msg));
            },
            [this](auto ec) {
                OnWsDisconnect(ec);
            }
        );
        return StompClientError::kOk;
    }

    /*! \brief Encode and send a frame.
     *
     *  \returns kNotConnected, without sending anything, unless the session is
     *           Active.
     *
     *  \param frame        The frame to send.
     *  \param onTransmit   Called when the frame has been written to the
     *                      Websocket, or with kConnectionLost if the write
     *                      failed.
     */
    StompClientError Transmit(
        const StompFrame& frame,
        std::function<void (StompClientError)> onTransmit = nullptr
    )
    {
        if (state_ != SessionState::kActive) {
            spdlog::error("StompSession: Cannot send {}: Session is {}",
                          frame.GetCommandString(), ToString(state_.load()));
            return StompClientError::kNotConnected;
        }
        spdlog::debug("StompSession: Sending {}", frame.GetCommandString());
        Write(frame.ToString(), onTransmit);
        return StompClientError::kOk;
    }

    /*! \brief Send a heartbeat: a single end-of-line, no command.
     *
     *  \returns kNotConnected unless the session is Active.
     */
    StompClientError SendHeartbeat(
        std::function<void (StompClientError)> onSent = nullptr
    )
    {
        if (state_ != SessionState::kActive) {
            return StompClientError::kNotConnected;
        }
        spdlog::debug("StompSession: Sending heartbeat");
        Write(StompFrame::MakeHeartbeat().ToString(), onSent);
        return StompClientError::kOk;
    }

    /*! \brief Send a DISCONNECT frame and close the Websocket connection.
     *
     *  The session moves to Closed immediately. A failure to send the
     *  DISCONNECT frame is only logged.
     *
     *  \returns kNotConnected, doing nothing, unless the session is Active.
     *
     *  \param onDisconnect Called when the Websocket connection is closed.
     */
    StompClientError Disconnect(
        std::function<void (StompClientError)> onDisconnect = nullptr
    )
    {
        if (!TransitionFrom({SessionState::kActive}, SessionState::kClosed,
                            StompClientError::kOk)) {
            return StompClientError::kNotConnected;
        }
        spdlog::info("StompSession: Disconnecting from {}", config_.url);
        StompFrame frame {StompCommand::kDisconnect, {}};
        ws_.Send(
            frame.ToString(),
            [this, onDisconnect](auto ec) {
                if (ec) {
                    spdlog::warn("StompSession: Could not send DISCONNECT: {}",
                                 ec.message());
                }
                ws_.Close(
                    [this, onDisconnect](auto ec) {
                        OnWsClose(ec, onDisconnect);
                    }
                );
            }
        );
        return StompClientError::kOk;
    }

    /*! \brief Give up on a session that is still Connecting.
     *
     *  The session moves to Failed with the given reason and the Websocket
     *  connection is closed. The session is Closed when the close completes.
     *
     *  \returns false if the session was not Connecting.
     */
    bool Abort(
        StompClientError reason
    )
    {
        if (!TransitionFrom({SessionState::kConnecting}, SessionState::kFailed,
                            reason)) {
            return false;
        }
        spdlog::error("StompSession: Aborting connection to {}: {}",
                      config_.url, ToString(reason));
        ReportError(reason, "Connection aborted");
        ws_.Close(
            [this, reason](auto ec) {
                if (ec) {
                    spdlog::warn("StompSession: Could not close Websocket "
                                 "connection: {}", ec.message());
                }
                TransitionFrom({SessionState::kFailed}, SessionState::kClosed,
                               reason);
            }
        );
        return true;
    }

    /*! \brief Get the current session state.
     */
    SessionState GetState() const
    {
        return state_;
    }

    /*! \brief Get the Websocket URL of the session.
     */
    const std::string& GetUrl() const
    {
        return config_.url;
    }

    /*! \brief Number of MESSAGE frames dropped because no subscription
     *         matched their destination.
     */
    size_t GetUnroutedMessageCount() const
    {
        return unroutedMessages_;
    }

private:
    // This strand handles all the user handlers. These operations are
    // decoupled from the Websocket operations.
    // We leave it uninitialized because it does not support a default
    // constructor.
    boost::asio::strand<boost::asio::io_context::executor_type> context_;

    StompSessionConfig config_ {};

    SubscriptionRegistry& registry_;

    // We leave this uninitialized because it does not support a default
    // constructor.
    WsClient ws_;

    std::atomic<SessionState> state_ {SessionState::kDisconnected};
    std::atomic<size_t> unroutedMessages_ {0};

    std::function<void (SessionState, StompClientError)> onStateChange_ {
        nullptr
    };
    std::function<void (StompClientError, std::string&&)> onError_ {nullptr};

    // Move to `to` if the current state is one of `from`.
    bool TransitionFrom(
        std::initializer_list<SessionState> from,
        SessionState to,
        StompClientError reason
    )
    {
        auto current {state_.load()};
        while (true) {
            bool allowed {false};
            for (const auto& state: from) {
                allowed |= state == current;
            }
            if (!allowed) {
                return false;
            }
            if (state_.compare_exchange_weak(current, to)) {
                break;
            }
        }
        spdlog::info("StompSession: {} -> {} ({})",
                     ToString(current), ToString(to), ToString(reason));
        NotifyStateChange(to, reason);
        return true;
    }

    void NotifyStateChange(
        SessionState state,
        StompClientError reason
    )
    {
        if (onStateChange_) {
            boost::asio::post(
                context_,
                [onStateChange = onStateChange_, state, reason]() {
                    onStateChange(state, reason);
                }
            );
        }
    }

    void ReportError(
        StompClientError error,
        std::string description
    )
    {
        if (onError_) {
            boost::asio::post(
                context_,
                [
                    onError = onError_,
                    error,
                    description = std::move(description)
                ]() mutable {
                    onError(error, std::move(description));
                }
            );
        }
    }

    void Write(
        const std::string& plain,
        std::function<void (StompClientError)> onWritten
    )
    {
        ws_.Send(
            plain,
            [this, onWritten](auto ec) {
                auto error {ec ? StompClientError::kConnectionLost :
                                 StompClientError::kOk};
                if (ec) {
                    spdlog::error("StompSession: Could not send frame: {}",
                                  ec.message());
                    ReportError(error, ec.message());
                }
                if (onWritten) {
                    boost::asio::post(
                        context_,
                        [onWritten, error]() {
                            onWritten(error);
                        }
                    );
                }
            }
        );
    }

    void OnWsConnect(
        boost::system::error_code ec
    )
    {
        using Error = StompClientError;

        // We cannot continue if the connection was not established correctly.
        if (ec) {
            spdlog::error("StompSession: Could not connect to server: {}",
                          ec.message());
            auto state {state_.load()};
            if (state != SessionState::kConnecting &&
                    state != SessionState::kFailed) {
                return;
            }
            ReportError(Error::kCouldNotConnectToWebsocketServer,
                        ec.message());
            TransitionFrom({SessionState::kConnecting, SessionState::kFailed},
                           SessionState::kClosed,
                           Error::kCouldNotConnectToWebsocketServer);
            return;
        }

        // The session may have been aborted while the Websocket was opening.
        if (state_ != SessionState::kConnecting) {
            return;
        }

        // Assemble and send the CONNECT frame.
        StompHeaders headers {
            {ToString(StompHeader::kHost), config_.url},
            {ToString(StompHeader::kAcceptVersion), kStompAcceptVersion},
            {ToString(StompHeader::kHeartBeat), kStompHeartBeat},
        };
        const auto& credentials {config_.credentials};
        if (credentials.username) {
            headers.emplace_back(ToString(StompHeader::kLogin),
                                 *credentials.username);
        }
        if (credentials.passcode) {
            headers.emplace_back(ToString(StompHeader::kPasscode),
                                 *credentials.passcode);
        }
        StompFrame frame {ToString(StompCommand::kConnect), std::move(headers)};
        ws_.Send(
            frame.ToString(),
            [this](auto ec) {
                OnWsSendConnect(ec);
            }
        );
    }

    void OnWsSendConnect(
        boost::system::error_code ec
    )
    {
        // If we got here, it only means that we correctly sent the CONNECT
        // frame, not that we are authenticated. OnWsMessage is the function
        // that handles the response from the server.
        if (ec) {
            spdlog::error("StompSession: Could not send CONNECT frame: {}",
                          ec.message());
            ReportError(StompClientError::kConnectionLost, ec.message());
            TransitionFrom({SessionState::kConnecting}, SessionState::kFailed,
                           StompClientError::kConnectionLost);
        }
    }

    void OnWsMessage(
        boost::system::error_code ec,
        std::string&& msg
    )
    {
        // Parse the message.
        StompError error {};
        StompFrame frame {error, msg};
        if (error != StompError::kOk) {
            spdlog::error(
                "StompSession: Could not parse message as STOMP frame: {}",
                ToString(error)
            );
            ReportError(StompClientError::kCouldNotParseMessageAsStompFrame,
                        ToString(error));
            return;
        }
        if (frame.IsHeartbeat()) {
            spdlog::debug("StompSession: Received heartbeat");
            return;
        }

        // Decide what to do based on the STOMP command.
        spdlog::debug("StompSession: Received {}", frame.GetCommandString());
        switch (frame.GetCommand()) {
            case StompCommand::kConnected: {
                HandleConnected(std::move(frame));
                break;
            }
            case StompCommand::kError: {
                HandleError(std::move(frame));
                break;
            }
            case StompCommand::kMessage: {
                HandleSubscriptionMessage(std::move(frame));
                break;
            }
            default: {
                spdlog::debug("StompSession: Ignoring STOMP command: {}",
                              frame.GetCommandString());
                break;
            }
        }
    }

    void OnWsDisconnect(
        boost::system::error_code ec
    )
    {
        spdlog::info("StompSession: Websocket connection disconnected: {}",
                     ec.message());
        auto closed {TransitionFrom(
            {
                SessionState::kConnecting,
                SessionState::kActive,
                SessionState::kFailed,
            },
            SessionState::kClosed,
            StompClientError::kConnectionLost
        )};
        if (closed) {
            ReportError(StompClientError::kConnectionLost, ec.message());
        }
    }

    void OnWsClose(
        boost::system::error_code ec,
        std::function<void (StompClientError)> onDisconnect
    )
    {
        if (ec) {
            spdlog::warn("StompSession: Could not close Websocket connection: "
                         "{}", ec.message());
        } else {
            spdlog::info("StompSession: Disconnected from {}", config_.url);
        }
        if (onDisconnect) {
            auto error {ec ?
                StompClientError::kCouldNotCloseWebsocketConnection :
                StompClientError::kOk
            };
            boost::asio::post(
                context_,
                [onDisconnect, error]() {
                    onDisconnect(error);
                }
            );
        }
    }

    void HandleConnected(
        StompFrame&& frame
    )
    {
        if (!TransitionFrom({SessionState::kConnecting}, SessionState::kActive,
                            StompClientError::kOk)) {
            spdlog::warn("StompSession: Ignoring CONNECTED in state {}",
                         ToString(state_.load()));
            return;
        }
        spdlog::info("StompSession: Connected to STOMP server (version: {}, "
                     "heart-beat: {})",
                     frame.GetHeaderValue(StompHeader::kVersion),
                     frame.GetHeaderValue(StompHeader::kHeartBeat));
    }

    void HandleError(
        StompFrame&& frame
    )
    {
        std::string description {
            frame.HasHeader(StompHeader::kMessage) ?
                frame.GetHeaderValue(StompHeader::kMessage) :
                "Unknown error"
        };
        spdlog::error("StompSession: The STOMP server returned an error: {}",
                      description);
        const auto& body {frame.GetBody()};
        if (body && !body->empty()) {
            spdlog::error("StompSession: Details: {}", *body);
            description += ": " + *body;
        }
        ReportError(StompClientError::kBrokerError, std::move(description));

        // The broker closes the connection after an ERROR frame. The session
        // stays Failed until OnWsDisconnect sees it.
        TransitionFrom(
            {SessionState::kConnecting, SessionState::kActive},
            SessionState::kFailed,
            StompClientError::kBrokerError
        );
    }

    void HandleSubscriptionMessage(
        StompFrame&& frame
    )
    {
        // Find the subscription.
        const auto& destination {
            frame.GetHeaderValue(StompHeader::kDestination)
        };
        auto subscription {registry_.Resolve(destination)};
        if (!subscription) {
            ++unroutedMessages_;
            spdlog::warn("StompSession: No subscription for destination {}",
                         destination);
            ReportError(StompClientError::kUnroutedMessage,
                        std::string(destination));
            return;
        }

        // Acknowledge the message once the user handler returns.
        std::optional<StompFrame> ack {};
        if (config_.ackMessages && subscription->ackMode == "client" &&
                frame.HasHeader(StompHeader::kMessageId)) {
            auto subscriptionId {frame.HasHeader(StompHeader::kSubscription) ?
                frame.GetHeaderValue(StompHeader::kSubscription) :
                subscription->id
            };
            ack = StompFrame {
                StompCommand::kAck,
                {
                    {
                        StompHeader::kMessageId,
                        frame.GetHeaderValue(StompHeader::kMessageId)
                    },
                    {StompHeader::kSubscription, subscriptionId},
                }
            };
        }

        // Send the message to the user handler.
        boost::asio::post(
            context_,
            [
                this,
                destination = std::string(destination),
                onMessage = std::move(subscription->onMessage),
                body = frame.GetBody(),
                ack = std::move(ack)
            ]() mutable {
                if (onMessage) {
                    try {
                        onMessage(std::move(body));
                    } catch (const std::exception& e) {
                        spdlog::error("StompSession: Message handler for {} "
                                      "threw: {}", destination, e.what());
                    }
                }
                if (ack) {
                    auto error {Transmit(*ack)};
                    if (error != StompClientError::kOk) {
                        spdlog::warn("StompSession: Could not acknowledge "
                                     "message on {}: {}", destination,
                                     ToString(error));
                    }
                }
            }
        );
    }
};

} // namespace StompWs

#endif // STOMP_WS_STOMP_SESSION_H
