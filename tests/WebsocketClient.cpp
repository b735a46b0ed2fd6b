#include "BoostMock.h"

#include <stomp-ws/WebsocketClient.h>

#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/test/unit_test.hpp>

#include <chrono>
#include <optional>
#include <string>
#include <vector>

using StompWs::MockPlainWebsocketStream;
using StompWs::MockResolver;
using StompWs::MockTcpStream;
using StompWs::MockTlsStream;
using StompWs::MockTlsWebsocketStream;
using StompWs::TestPlainWebsocketClient;
using StompWs::TestWebsocketClient;

// Re-initialize all mock properties before a test
struct WebsocketClientTestFixture {
    WebsocketClientTestFixture()
    {
        MockResolver::resolveEc = {};
        MockTcpStream::connectEc = {};
        MockTlsStream::handshakeEc = {};
        MockTlsWebsocketStream::handshakeEc = {};
        MockTlsWebsocketStream::readEc = {};
        MockTlsWebsocketStream::readBuffer = "";
        MockTlsWebsocketStream::writeEc = {};
        MockTlsWebsocketStream::writtenMessages.clear();
        MockTlsWebsocketStream::closeEc = {};
        MockPlainWebsocketStream::handshakeEc = {};
        MockPlainWebsocketStream::readEc = {};
        MockPlainWebsocketStream::readBuffer = "";
        MockPlainWebsocketStream::writeEc = {};
        MockPlainWebsocketStream::writtenMessages.clear();
        MockPlainWebsocketStream::closeEc = {};
    }

    // We use the mock client so we don't really connect to the target.
    const std::string url {"broker.example.com"};
    const std::string endpoint {"/"};
    const std::string port {"61614"};

    boost::asio::ssl::context ctx {boost::asio::ssl::context::tlsv12_client};
    boost::asio::io_context ioc {};

    // Connect, close on success and return the error passed to onConnect.
    template <typename Client>
    std::optional<boost::system::error_code> RunConnect(Client& client)
    {
        std::optional<boost::system::error_code> result {};
        client.Connect([&result, &client](auto ec) {
            result = ec;
            if (!ec) {
                client.Close();
            }
        });
        ioc.run();
        return result;
    }
};

// Use this to set a timeout on tests that may hang or suffer from a slow
// connection.
using timeout = boost::unit_test::timeout;

BOOST_AUTO_TEST_SUITE(stomp_ws);

BOOST_AUTO_TEST_SUITE(class_WebsocketClient);

BOOST_AUTO_TEST_CASE(uses_tls)
{
    BOOST_CHECK(TestWebsocketClient::kUsesTls);
    BOOST_CHECK(!TestPlainWebsocketClient::kUsesTls);
    BOOST_CHECK(StompWs::BoostWebsocketClient::kUsesTls);
    BOOST_CHECK(!StompWs::BoostPlainWebsocketClient::kUsesTls);
}

BOOST_FIXTURE_TEST_SUITE(Connect, WebsocketClientTestFixture);

BOOST_AUTO_TEST_CASE(fail_resolve, *timeout {1})
{
    MockResolver::resolveEc = boost::asio::error::host_not_found;
    TestWebsocketClient client {url, endpoint, port, ioc, ctx};
    auto ec {RunConnect(client)};
    BOOST_REQUIRE(ec);
    BOOST_CHECK_EQUAL(*ec, boost::asio::error::host_not_found);
}

BOOST_AUTO_TEST_CASE(fail_socket_connect, *timeout {1})
{
    MockTcpStream::connectEc = boost::asio::error::connection_refused;
    TestWebsocketClient client {url, endpoint, port, ioc, ctx};
    auto ec {RunConnect(client)};
    BOOST_REQUIRE(ec);
    BOOST_CHECK_EQUAL(*ec, boost::asio::error::connection_refused);
}

BOOST_AUTO_TEST_CASE(fail_tls_handshake, *timeout {1})
{
    MockTlsStream::handshakeEc = boost::asio::ssl::error::stream_truncated;
    TestWebsocketClient client {url, endpoint, port, ioc, ctx};
    auto ec {RunConnect(client)};
    BOOST_REQUIRE(ec);
    BOOST_CHECK_EQUAL(*ec, boost::asio::ssl::error::stream_truncated);
}

BOOST_AUTO_TEST_CASE(fail_websocket_handshake, *timeout {1})
{
    using error = boost::beast::websocket::error;
    MockTlsWebsocketStream::handshakeEc = error::upgrade_declined;
    TestWebsocketClient client {url, endpoint, port, ioc, ctx};
    auto ec {RunConnect(client)};
    BOOST_REQUIRE(ec);
    BOOST_CHECK(*ec == error::upgrade_declined);
}

BOOST_AUTO_TEST_CASE(successful, *timeout {1})
{
    TestWebsocketClient client {url, endpoint, port, ioc, ctx};
    auto ec {RunConnect(client)};
    BOOST_REQUIRE(ec);
    BOOST_CHECK(!*ec);
}

BOOST_AUTO_TEST_CASE(successful_plain_text, *timeout {1})
{
    // The TLS layer is not used without TLS.
    MockTlsStream::handshakeEc = boost::asio::ssl::error::stream_truncated;
    TestPlainWebsocketClient client {url, endpoint, port, ioc, ctx};
    auto ec {RunConnect(client)};
    BOOST_REQUIRE(ec);
    BOOST_CHECK(!*ec);
}

BOOST_AUTO_TEST_CASE(successful_no_connecthandler, *timeout {1})
{
    // Because in this test we do not use the onConnect handler, we need to
    // close the connection after some time.
    TestWebsocketClient client {url, endpoint, port, ioc, ctx};
    bool didTimeout {false};
    boost::asio::steady_timer timer(ioc);
    timer.expires_after(std::chrono::milliseconds(250));
    timer.async_wait([&didTimeout, &client](auto ec) {
        didTimeout = true;
        BOOST_CHECK(!ec);
        client.Close();
    });
    client.Connect();
    ioc.run();
    BOOST_CHECK(didTimeout);
}

BOOST_AUTO_TEST_CASE(close_during_connect, *timeout {1})
{
    TestWebsocketClient client {url, endpoint, port, ioc, ctx};
    bool calledOnConnect {false};
    bool calledOnClose {false};
    client.Connect(
        [&calledOnConnect](auto ec) {
            calledOnConnect = true;
            BOOST_CHECK_EQUAL(ec, boost::asio::error::operation_aborted);
        },
        nullptr,
        [](auto ec) {
            BOOST_CHECK(false);
        }
    );

    // The stream is not open yet, so the close itself aborts.
    client.Close([&calledOnClose](auto ec) {
        calledOnClose = true;
        BOOST_CHECK_EQUAL(ec, boost::asio::error::operation_aborted);
    });
    ioc.run();
    BOOST_CHECK(calledOnConnect);
    BOOST_CHECK(calledOnClose);
}

BOOST_AUTO_TEST_SUITE_END(); // Connect

BOOST_FIXTURE_TEST_SUITE(onMessage, WebsocketClientTestFixture);

BOOST_AUTO_TEST_CASE(one_message, *timeout {1})
{
    const std::string message {"MESSAGE\ndestination:/topic/x\n\nhello"};
    MockTlsWebsocketStream::readBuffer = message;

    TestWebsocketClient client {url, endpoint, port, ioc, ctx};
    bool calledOnMessage {false};
    auto onMessage {[&calledOnMessage, &message, &client](auto ec, auto msg) {
        calledOnMessage = true;
        BOOST_CHECK(!ec);
        BOOST_CHECK_EQUAL(msg, message);
        client.Close();
    }};
    client.Connect(nullptr, onMessage);
    ioc.run();
    BOOST_CHECK(calledOnMessage);
}

BOOST_AUTO_TEST_CASE(two_messages, *timeout {1})
{
    const std::string message1 {"first message"};
    const std::string message2 {"second message"};
    MockTlsWebsocketStream::readBuffer = message1;

    TestWebsocketClient client {url, endpoint, port, ioc, ctx};
    std::vector<std::string> received {};
    auto onMessage {[&received, &message2, &client](auto ec, auto msg) {
        BOOST_CHECK(!ec);
        received.push_back(msg);
        if (received.size() == 1) {
            // The previous read consumed the buffer.
            MockTlsWebsocketStream::readBuffer = message2;
        } else {
            client.Close();
        }
    }};
    client.Connect(nullptr, onMessage);
    ioc.run();
    BOOST_REQUIRE_EQUAL(received.size(), 2);
    BOOST_CHECK_EQUAL(received[0], message1);
    BOOST_CHECK_EQUAL(received[1], message2);
}

BOOST_AUTO_TEST_CASE(fail, *timeout {1})
{
    using error = boost::beast::websocket::error;
    MockTlsWebsocketStream::readBuffer = "some message";
    MockTlsWebsocketStream::readEc = error::closed;

    TestWebsocketClient client {url, endpoint, port, ioc, ctx};
    bool calledOnMessage {false};
    bool calledOnDisconnect {false};
    auto onMessage {[&calledOnMessage](auto ec, auto msg) {
        // A failed read is not a message.
        calledOnMessage = true;
    }};
    auto onDisconnect {[&calledOnDisconnect](auto ec) {
        calledOnDisconnect = true;
        BOOST_CHECK(ec == error::closed);
    }};
    client.Connect(nullptr, onMessage, onDisconnect);
    ioc.run();
    BOOST_CHECK(!calledOnMessage);
    BOOST_CHECK(calledOnDisconnect);
}

BOOST_AUTO_TEST_CASE(no_handler, *timeout {1})
{
    MockTlsWebsocketStream::readBuffer = "some message";

    TestWebsocketClient client {url, endpoint, port, ioc, ctx};
    boost::asio::steady_timer timer(ioc);
    timer.expires_after(std::chrono::milliseconds(100));
    timer.async_wait([&client](auto ec) {
        client.Close();
    });
    client.Connect();
    ioc.run();

    // The message was read and dropped.
    BOOST_CHECK(MockTlsWebsocketStream::readBuffer.empty());
}

BOOST_AUTO_TEST_SUITE_END(); // onMessage

BOOST_FIXTURE_TEST_SUITE(Send, WebsocketClientTestFixture);

BOOST_AUTO_TEST_CASE(send_before_connect, *timeout {1})
{
    TestWebsocketClient client {url, endpoint, port, ioc, ctx};
    bool calledOnSend {false};
    auto onSend {[&calledOnSend](auto ec) {
        calledOnSend = true;
        BOOST_CHECK_EQUAL(ec, boost::asio::error::operation_aborted);
    }};
    client.Send("SEND\ndestination:/topic/x\n\nabc", onSend);
    ioc.run();
    BOOST_CHECK(calledOnSend);
    BOOST_CHECK(MockTlsWebsocketStream::writtenMessages.empty());
}

BOOST_AUTO_TEST_CASE(one_message, *timeout {1})
{
    const std::string message {"SEND\ndestination:/topic/x\n\nabc"};

    TestWebsocketClient client {url, endpoint, port, ioc, ctx};
    bool calledOnSend {false};
    auto onSend {[&calledOnSend, &client](auto ec) {
        calledOnSend = true;
        BOOST_CHECK(!ec);
        client.Close();
    }};
    client.Connect([&client, &message, &onSend](auto ec) {
        BOOST_REQUIRE(!ec);
        client.Send(message, onSend);
    });
    ioc.run();
    BOOST_CHECK(calledOnSend);
    BOOST_REQUIRE_EQUAL(MockTlsWebsocketStream::writtenMessages.size(), 1);
    BOOST_CHECK_EQUAL(MockTlsWebsocketStream::writtenMessages[0], message);
}

BOOST_AUTO_TEST_CASE(queued_messages, *timeout {1})
{
    const std::vector<std::string> messages {"first", "second", "third"};

    TestWebsocketClient client {url, endpoint, port, ioc, ctx};
    std::vector<std::string> sent {};
    client.Connect([&client, &messages, &sent](auto ec) {
        BOOST_REQUIRE(!ec);

        // Sends issued back to back are written one at a time, in order.
        for (const auto& message: messages) {
            client.Send(message, [&client, &sent, message](auto ec) {
                BOOST_CHECK(!ec);
                sent.push_back(message);
                if (sent.size() == 3) {
                    client.Close();
                }
            });
        }
    });
    ioc.run();
    BOOST_CHECK(sent == messages);
    BOOST_CHECK(MockTlsWebsocketStream::writtenMessages == messages);
}

BOOST_AUTO_TEST_CASE(fail, *timeout {1})
{
    using error = boost::beast::websocket::error;
    MockTlsWebsocketStream::writeEc = error::bad_data_frame;

    TestWebsocketClient client {url, endpoint, port, ioc, ctx};
    bool calledOnSend {false};
    auto onSend {[&calledOnSend, &client](auto ec) {
        calledOnSend = true;
        BOOST_CHECK(ec == error::bad_data_frame);
        client.Close();
    }};
    client.Connect([&client, &onSend](auto ec) {
        BOOST_REQUIRE(!ec);
        client.Send("some message", onSend);
    });
    ioc.run();
    BOOST_CHECK(calledOnSend);
    BOOST_CHECK(MockTlsWebsocketStream::writtenMessages.empty());
}

BOOST_AUTO_TEST_CASE(send_after_close, *timeout {1})
{
    TestWebsocketClient client {url, endpoint, port, ioc, ctx};
    bool calledOnSend {false};
    client.Connect([&client, &calledOnSend](auto ec) {
        BOOST_REQUIRE(!ec);
        client.Close();
        client.Send("some message", [&calledOnSend](auto ec) {
            calledOnSend = true;
            BOOST_CHECK_EQUAL(ec, boost::asio::error::operation_aborted);
        });
    });
    ioc.run();
    BOOST_CHECK(calledOnSend);
}

BOOST_AUTO_TEST_SUITE_END(); // Send

BOOST_FIXTURE_TEST_SUITE(Close, WebsocketClientTestFixture);

BOOST_AUTO_TEST_CASE(close, *timeout {1})
{
    TestWebsocketClient client {url, endpoint, port, ioc, ctx};
    bool calledOnConnect {false};
    bool calledOnClose {false};
    auto onClose {[&calledOnClose](auto ec) {
        calledOnClose = true;
        BOOST_CHECK(!ec);
    }};
    auto onConnect {[&calledOnConnect, &client, &onClose](auto ec) {
        calledOnConnect = true;
        BOOST_REQUIRE(!ec);
        client.Close(onClose);
    }};
    client.Connect(onConnect);
    ioc.run();
    BOOST_CHECK(calledOnConnect);
    BOOST_CHECK(calledOnClose);
}

BOOST_AUTO_TEST_CASE(close_before_connect, *timeout {1})
{
    TestWebsocketClient client {url, endpoint, port, ioc, ctx};
    bool calledOnClose {false};
    auto onClose {[&calledOnClose](auto ec) {
        calledOnClose = true;
        BOOST_CHECK_EQUAL(ec, boost::asio::error::operation_aborted);
    }};
    client.Close(onClose);
    ioc.run();
    BOOST_CHECK(calledOnClose);
}

BOOST_AUTO_TEST_CASE(close_no_disconnect, *timeout {1})
{
    TestWebsocketClient client {url, endpoint, port, ioc, ctx};
    bool calledOnConnect {false};
    bool calledOnClose {false};
    auto onClose {[&calledOnClose](auto ec) {
        calledOnClose = true;
        BOOST_CHECK(!ec);
    }};
    auto onConnect {[&calledOnConnect, &client, &onClose](auto ec) {
        calledOnConnect = true;
        BOOST_REQUIRE(!ec);
        client.Close(onClose);
    }};
    auto onDisconnect {[](auto ec) {
        // onDisconnect is never called when the user ends the connection.
        BOOST_CHECK(false);
    }};
    client.Connect(onConnect, nullptr, onDisconnect);
    ioc.run();
    BOOST_CHECK(calledOnConnect);
    BOOST_CHECK(calledOnClose);
}

BOOST_AUTO_TEST_CASE(close_fail, *timeout {1})
{
    using error = boost::beast::websocket::error;
    MockTlsWebsocketStream::closeEc = error::closed;

    TestWebsocketClient client {url, endpoint, port, ioc, ctx};
    bool calledOnClose {false};
    client.Connect([&client, &calledOnClose](auto ec) {
        BOOST_REQUIRE(!ec);
        client.Close([&calledOnClose](auto ec) {
            calledOnClose = true;
            BOOST_CHECK(ec == error::closed);

            // Let the next close succeed.
            MockTlsWebsocketStream::closeEc = {};
        });
    });

    // The failed close leaves the mock read loop running: close again.
    boost::asio::steady_timer timer(ioc);
    timer.expires_after(std::chrono::milliseconds(100));
    timer.async_wait([&client](auto ec) {
        client.Close();
    });
    ioc.run();
    BOOST_CHECK(calledOnClose);
}

BOOST_AUTO_TEST_SUITE_END(); // Close

BOOST_AUTO_TEST_SUITE_END(); // class_WebsocketClient

BOOST_AUTO_TEST_SUITE_END(); // stomp_ws
