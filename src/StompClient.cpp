#include <stomp-ws/StompClient.h>

#include <boost/asio/ssl.hpp>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>

#include <spdlog/spdlog.h>

#include <chrono>
#include <string>

using StompWs::StompClientConfig;

std::string StompWs::MakeWebsocketUrl(const StompClientConfig& config)
{
    std::string url {config.useTls ? "wss://" : "ws://"};
    url += config.host + ":" + config.port;
    if (config.useSockJs) {
        url += "/websocket";
    }
    return url;
}

std::string StompWs::MakeWebsocketEndpoint(const StompClientConfig& config)
{
    return config.useSockJs ? "/websocket" : "/";
}

boost::asio::ssl::context StompWs::MakeTlsContext(
    const StompClientConfig& config
)
{
    boost::asio::ssl::context ctx {boost::asio::ssl::context::tlsv12_client};
    if (!config.useTls) {
        return ctx;
    }
    if (config.insecure) {
        spdlog::warn("StompClient: TLS certificate verification is disabled");
        ctx.set_verify_mode(boost::asio::ssl::verify_none);
        return ctx;
    }
    ctx.set_verify_mode(boost::asio::ssl::verify_peer);
    boost::system::error_code ec {};
    if (!config.caCertFile.empty()) {
        ctx.load_verify_file(config.caCertFile.string(), ec);
        if (!ec) {
            return ctx;
        }
        spdlog::warn("StompClient: Could not load CA certificate file {}: {}. "
                     "Using the system default paths",
                     config.caCertFile.string(), ec.message());
    }
    ctx.set_default_verify_paths(ec);
    if (ec) {
        spdlog::error("StompClient: Could not load the system CA "
                      "certificates: {}", ec.message());
    }
    return ctx;
}

std::string StompWs::GenerateSubscriptionId()
{
    // The generator is not thread safe.
    thread_local boost::uuids::random_generator generator {};
    auto seconds {std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()
    ).count()};
    auto uuid {boost::uuids::to_string(generator())};
    return "sub-" + std::to_string(seconds) + "-" + uuid.substr(0, 8);
}
