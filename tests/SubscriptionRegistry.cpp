#include <stomp-ws/SubscriptionRegistry.h>

#include <boost/test/unit_test.hpp>

#include <atomic>
#include <optional>
#include <string>
#include <thread>
#include <vector>

using StompWs::Subscription;
using StompWs::SubscriptionRegistry;

BOOST_AUTO_TEST_SUITE(stomp_ws);

BOOST_AUTO_TEST_SUITE(class_SubscriptionRegistry);

BOOST_AUTO_TEST_CASE(register_and_resolve)
{
    SubscriptionRegistry registry {};
    std::string received {};
    auto replaced {registry.Register({
        "/topic/x",
        "sub-1",
        "client",
        [&received](auto&& body) {
            received = body.value_or("");
        },
    })};
    BOOST_CHECK(!replaced);
    BOOST_CHECK_EQUAL(registry.Size(), 1);

    auto subscription {registry.Resolve("/topic/x")};
    BOOST_REQUIRE(subscription);
    BOOST_CHECK_EQUAL(subscription->destination, "/topic/x");
    BOOST_CHECK_EQUAL(subscription->id, "sub-1");
    BOOST_CHECK_EQUAL(subscription->ackMode, "client");
    BOOST_REQUIRE(subscription->onMessage);
    subscription->onMessage("hello");
    BOOST_CHECK_EQUAL(received, "hello");
}

BOOST_AUTO_TEST_CASE(resolve_unknown)
{
    SubscriptionRegistry registry {};
    registry.Register({"/topic/x", "sub-1"});
    BOOST_CHECK(!registry.Resolve("/topic/y"));
}

BOOST_AUTO_TEST_CASE(last_writer_wins)
{
    SubscriptionRegistry registry {};
    int firstCalls {0};
    int secondCalls {0};
    registry.Register({
        "/topic/x",
        "sub-1",
        "client",
        [&firstCalls](auto&& body) {
            ++firstCalls;
        },
    });
    auto replaced {registry.Register({
        "/topic/x",
        "sub-2",
        "client",
        [&secondCalls](auto&& body) {
            ++secondCalls;
        },
    })};
    BOOST_REQUIRE(replaced);
    BOOST_CHECK_EQUAL(replaced->id, "sub-1");
    BOOST_CHECK_EQUAL(registry.Size(), 1);

    auto subscription {registry.Resolve("/topic/x")};
    BOOST_REQUIRE(subscription);
    BOOST_CHECK_EQUAL(subscription->id, "sub-2");
    subscription->onMessage(std::nullopt);
    BOOST_CHECK_EQUAL(firstCalls, 0);
    BOOST_CHECK_EQUAL(secondCalls, 1);
}

BOOST_AUTO_TEST_CASE(unregister)
{
    SubscriptionRegistry registry {};
    registry.Register({"/topic/x", "sub-1"});
    registry.Register({"/topic/y", "sub-2"});

    auto removed {registry.Unregister("/topic/x")};
    BOOST_REQUIRE(removed);
    BOOST_CHECK_EQUAL(removed->id, "sub-1");
    BOOST_CHECK(!registry.Resolve("/topic/x"));
    BOOST_CHECK(registry.Resolve("/topic/y"));
    BOOST_CHECK_EQUAL(registry.Size(), 1);

    BOOST_CHECK(!registry.Unregister("/topic/x"));
}

BOOST_AUTO_TEST_CASE(clear)
{
    SubscriptionRegistry registry {};
    registry.Register({"/topic/x", "sub-1"});
    registry.Register({"/topic/y", "sub-2"});
    registry.Clear();
    BOOST_CHECK_EQUAL(registry.Size(), 0);
    BOOST_CHECK(!registry.Resolve("/topic/y"));
}

BOOST_AUTO_TEST_CASE(concurrent_access)
{
    SubscriptionRegistry registry {};
    const int nThreads {4};
    const int nDestinations {100};
    std::atomic<int> misses {0};
    std::vector<std::thread> threads {};
    for (int thread {0}; thread < nThreads; ++thread) {
        threads.emplace_back([&registry, &misses, thread, nDestinations]() {
            for (int idx {0}; idx < nDestinations; ++idx) {
                auto destination {"/topic/" + std::to_string(idx)};
                registry.Register({
                    destination,
                    "sub-" + std::to_string(thread),
                });
                if (!registry.Resolve(destination)) {
                    ++misses;
                }
            }
        });
    }
    for (auto& thread: threads) {
        thread.join();
    }
    BOOST_CHECK_EQUAL(misses.load(), 0);
    BOOST_CHECK_EQUAL(registry.Size(), nDestinations);
}

BOOST_AUTO_TEST_SUITE_END(); // class_SubscriptionRegistry

BOOST_AUTO_TEST_SUITE_END(); // stomp_ws
