#include <stomp-ws/env.h>
#include <stomp-ws/Payload.h>
#include <stomp-ws/StompClient.h>
#include <stomp-ws/WebsocketClient.h>

#include <boost/asio.hpp>

#include <spdlog/spdlog.h>

#include <atomic>
#include <chrono>
#include <csignal>
#include <exception>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

using StompWs::BoostPlainWebsocketClient;
using StompWs::BoostWebsocketClient;
using StompWs::FormatPayload;
using StompWs::GetEnvFlag;
using StompWs::GetEnvVar;
using StompWs::GetOptionalEnvVar;
using StompWs::MakeJsonPayload;
using StompWs::StompClient;
using StompWs::StompClientConfig;
using StompWs::StompClientError;

namespace {

struct CliOptions {
    std::string topic {};
    std::optional<std::string> send {};
    bool json {false};
    std::chrono::milliseconds timeout {0};
};

// Fulfilled once, by a fatal session error or by a termination signal.
class StopSignal {
public:
    void Set(const std::string& reason)
    {
        std::call_once(once_, [this, &reason]() {
            spdlog::info("Stopping: {}", reason);
            promise_.set_value();
        });
    }

    std::future<void> GetFuture()
    {
        return promise_.get_future();
    }

private:
    std::once_flag once_ {};
    std::promise<void> promise_ {};
};

template <typename WsClient>
int Run(
    const StompClientConfig& config,
    const CliOptions& options
)
{
    auto stop {std::make_shared<StopSignal>()};
    auto stopped {stop->GetFuture()};
    auto failed {std::make_shared<std::atomic<bool>>(false)};

    StompClient<WsClient> client {
        config,
        [stop, failed](auto error, auto&& description) {
            spdlog::error("Client error: {}: {}",
                          StompWs::ToString(error), description);
            if (error == StompClientError::kBrokerError) {
                *failed = true;
            }
            if (error == StompClientError::kConnectionLost ||
                    error == StompClientError::kBrokerError) {
                stop->Set(StompWs::ToString(error));
            }
        }
    };
    spdlog::info("Will connect to {} (sockjs: {})",
                 client.GetUrl(), config.useSockJs);

    if (!client.Connect()) {
        spdlog::error("Failed to connect to STOMP server");
        return -1;
    }
    spdlog::info("Successfully connected to STOMP server");

    // Send mode: send one message and exit.
    if (options.send) {
        auto payload {*options.send};
        if (options.json) {
            payload = MakeJsonPayload(payload).dump();
            spdlog::info("Converted input to JSON format");
        }
        auto error {client.Send(options.topic, payload)};
        if (error != StompClientError::kOk) {
            spdlog::error("Could not send message to {}: {}",
                          options.topic, StompWs::ToString(error));
            return -2;
        }
        spdlog::info("Message sent to {}", options.topic);
        spdlog::info("Payload: {}", payload);

        // Give the broker some time to receive the message.
        stopped.wait_for(std::chrono::seconds(1));
        return 0;
    }

    // Listen mode.
    auto subscriptionId {client.Subscribe(
        options.topic,
        [](auto&& message) {
            spdlog::info("Message received");
            spdlog::info("Payload: {}", FormatPayload(message));
        }
    )};
    if (subscriptionId.empty()) {
        spdlog::error("Could not subscribe to {}", options.topic);
        return -2;
    }
    spdlog::info("Subscribed to {} ({}). Waiting for messages",
                 options.topic, subscriptionId);

    // Termination signals are handled on a separate I/O context, so that they
    // never block the client I/O thread.
    boost::asio::io_context signalIoc {};
    boost::asio::signal_set signals {signalIoc, SIGINT, SIGTERM};
    signals.async_wait(
        [stop](auto ec, auto signalNumber) {
            if (!ec) {
                stop->Set("Received signal " + std::to_string(signalNumber));
            }
        }
    );
    std::thread signalThread {[&signalIoc]() {
        signalIoc.run();
    }};

    if (options.timeout.count() > 0) {
        stopped.wait_for(options.timeout);
    } else {
        stopped.wait();
    }

    signals.cancel();
    signalIoc.stop();
    signalThread.join();

    client.Disconnect();
    spdlog::info("STOMP client shutdown complete");
    return *failed ? -3 : 0;
}

} // namespace

int main()
{
    try {
        // Logging
        auto logLevel {GetEnvVar("STOMP_WS_LOG_LEVEL", "info")};
        if (GetEnvFlag("STOMP_WS_DEBUG")) {
            logLevel = "debug";
        }
        spdlog::set_level(spdlog::level::from_str(logLevel));

        // Client configuration
        StompClientConfig config {};
        config.host = GetEnvVar("STOMP_WS_HOST");
        config.port = GetEnvVar("STOMP_WS_PORT", "61614");
        config.useTls = GetEnvFlag("STOMP_WS_SSL");
        config.useSockJs = GetEnvFlag("STOMP_WS_SOCKJS");
        config.insecure = GetEnvFlag("STOMP_WS_INSECURE");
        config.caCertFile = GetEnvVar("STOMP_WS_CACERT_PATH", "");
        config.credentials.username = GetOptionalEnvVar("STOMP_WS_USERNAME");
        config.credentials.passcode = GetOptionalEnvVar("STOMP_WS_PASSWORD");
        config.heartbeatInterval = std::chrono::seconds(
            std::stoi(GetEnvVar("STOMP_WS_HEARTBEAT_S", "10"))
        );

        CliOptions options {};
        options.topic = GetEnvVar("STOMP_WS_TOPIC");
        options.send = GetOptionalEnvVar("STOMP_WS_SEND");
        options.json = GetEnvFlag("STOMP_WS_JSON");

        // Optional run timeout
        // Default: 0ms = run indefinitely
        options.timeout = std::chrono::milliseconds(
            std::stoi(GetEnvVar("STOMP_WS_TIMEOUT_MS", "0"))
        );

        if (config.useTls && config.insecure) {
            spdlog::warn("SSL certificate verification is disabled. Only use "
                         "this for testing");
        }
        if (config.useTls) {
            return Run<BoostWebsocketClient>(config, options);
        }
        return Run<BoostPlainWebsocketClient>(config, options);
    } catch (const std::exception& e) {
        spdlog::error("Error: {}", e.what());
        return -1;
    }
}
