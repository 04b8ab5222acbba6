#pragma once
#include <slidetrack/core/Error.hpp>

#include <parallel_hashmap/phmap.h>

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string_view>
#include <typeindex>
#include <vector>

namespace ST {

using SubscriptionId = std::uint64_t;

/**
 * Synchronous, type-keyed publish/subscribe.
 *
 * Payload types expose a `static constexpr std::string_view kName`. Emission
 * walks a snapshot of the subscriber list, so handlers may subscribe or
 * unsubscribe while an event is being delivered; a handler removed during a
 * dispatch is not invoked afterwards. A handler that throws a std::exception
 * is logged and recorded, and delivery continues with the next subscriber.
 */
class EventBus {
public:
    EventBus() = default;
    EventBus(EventBus const&)                    = delete;
    auto operator=(EventBus const&) -> EventBus& = delete;

    template <typename Event>
    auto on(std::function<void(Event const&)> handler) -> SubscriptionId {
        return this->subscribe(std::type_index(typeid(Event)),
                               [handler = std::move(handler)](void const* payload) {
                                   handler(*static_cast<Event const*>(payload));
                               });
    }

    // Returns false when the id is unknown or already removed.
    auto off(SubscriptionId id) -> bool;

    // Returns true when at least one subscriber was registered for the event.
    template <typename Event>
    auto emit(Event const& event) -> bool {
        return this->dispatch(std::type_index(typeid(Event)), Event::kName, &event);
    }

    template <typename Event>
    [[nodiscard]] auto subscriberCount() const -> std::size_t {
        return this->countFor(std::type_index(typeid(Event)));
    }

    auto clear() -> void;

    [[nodiscard]] auto failureCount() const -> std::uint64_t { return failures_; }
    [[nodiscard]] auto lastFailure() const -> std::optional<Error> const& { return lastFailure_; }

private:
    struct Subscriber {
        SubscriptionId                   id = 0;
        std::function<void(void const*)> handler;
        bool                             active = true;
    };
    using SubscriberList = std::vector<std::shared_ptr<Subscriber>>;

    auto subscribe(std::type_index type, std::function<void(void const*)> handler) -> SubscriptionId;
    auto dispatch(std::type_index type, std::string_view eventName, void const* payload) -> bool;
    auto countFor(std::type_index type) const -> std::size_t;
    auto recordFailure(std::string_view eventName, std::string_view what) -> void;

    phmap::flat_hash_map<std::type_index, SubscriberList> subscribers_;
    phmap::flat_hash_map<SubscriptionId, std::type_index> owners_;
    SubscriptionId                                        nextId_   = 1;
    std::uint64_t                                         failures_ = 0;
    std::optional<Error>                                  lastFailure_;
};

} // namespace ST
