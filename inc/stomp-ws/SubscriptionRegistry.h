#ifndef STOMP_WS_SUBSCRIPTION_REGISTRY_H
#define STOMP_WS_SUBSCRIPTION_REGISTRY_H

#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace StompWs {

/*! \brief Handler for the messages received on a subscription.
 *
 *  The body is absent when the MESSAGE frame carried none. Ownership of the
 *  body is passed to the receiver.
 */
using MessageHandler = std::function<void (std::optional<std::string>&&)>;

/*! \brief A subscription to a STOMP destination.
 */
struct Subscription {
    std::string destination {};
    std::string id {};
    std::string ackMode {"client"};
    MessageHandler onMessage {nullptr};
};

/*! \brief Map from a destination to its only subscription.
 *
 *  Registering a destination twice replaces the previous subscription. All
 *  methods are thread-safe. Lookups return copies so the handler can be called
 *  without holding the registry lock.
 */
class SubscriptionRegistry {
public:
    /*! \brief Default constructor.
     */
    SubscriptionRegistry() = default;

    /*! \brief The copy constructor is deleted.
     */
    SubscriptionRegistry(const SubscriptionRegistry& other) = delete;

    /*! \brief The copy assignment operator is deleted.
     */
    SubscriptionRegistry& operator=(const SubscriptionRegistry& other) = delete;

    /*! \brief Add a subscription, replacing the one on the same destination.
     *
     *  \returns The replaced subscription, if there was one.
     */
    std::optional<Subscription> Register(Subscription subscription);

    /*! \brief Find the subscription for a destination.
     */
    std::optional<Subscription> Resolve(const std::string& destination) const;

    /*! \brief Remove the subscription for a destination.
     *
     *  \returns The removed subscription, if there was one.
     */
    std::optional<Subscription> Unregister(const std::string& destination);

    /*! \brief Number of registered destinations.
     */
    size_t Size() const;

    /*! \brief Remove all subscriptions.
     */
    void Clear();

private:
    mutable std::mutex mutex_ {};
    std::unordered_map<std::string, Subscription> subscriptions_ {};
};

} // namespace StompWs

#endif // STOMP_WS_SUBSCRIPTION_REGISTRY_H
