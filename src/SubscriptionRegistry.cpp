#include <stomp-ws/SubscriptionRegistry.h>

#include <mutex>
#include <optional>
#include <string>
#include <utility>

using StompWs::Subscription;
using StompWs::SubscriptionRegistry;

std::optional<Subscription> SubscriptionRegistry::Register(
    Subscription subscription
)
{
    std::lock_guard<std::mutex> lock {mutex_};
    std::optional<Subscription> replaced {};
    auto subscriptionIt {subscriptions_.find(subscription.destination)};
    if (subscriptionIt != subscriptions_.end()) {
        replaced = std::move(subscriptionIt->second);
        subscriptions_.erase(subscriptionIt);
    }
    auto destination {subscription.destination};
    subscriptions_.emplace(std::move(destination), std::move(subscription));
    return replaced;
}

std::optional<Subscription> SubscriptionRegistry::Resolve(
    const std::string& destination
) const
{
    std::lock_guard<std::mutex> lock {mutex_};
    auto subscriptionIt {subscriptions_.find(destination)};
    if (subscriptionIt == subscriptions_.end()) {
        return std::nullopt;
    }
    return subscriptionIt->second;
}

std::optional<Subscription> SubscriptionRegistry::Unregister(
    const std::string& destination
)
{
    std::lock_guard<std::mutex> lock {mutex_};
    auto subscriptionIt {subscriptions_.find(destination)};
    if (subscriptionIt == subscriptions_.end()) {
        return std::nullopt;
    }
    auto removed {std::move(subscriptionIt->second)};
    subscriptions_.erase(subscriptionIt);
    return removed;
}

size_t SubscriptionRegistry::Size() const
{
    std::lock_guard<std::mutex> lock {mutex_};
    return subscriptions_.size();
}

void SubscriptionRegistry::Clear()
{
    std::lock_guard<std::mutex> lock {mutex_};
    subscriptions_.clear();
}
