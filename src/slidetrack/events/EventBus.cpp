#include <slidetrack/events/EventBus.hpp>

#include "log/TaggedLogger.hpp"

#include <algorithm>
#include <exception>
#include <string>

namespace ST {

auto EventBus::subscribe(std::type_index type, std::function<void(void const*)> handler) -> SubscriptionId {
    auto id         = nextId_++;
    auto subscriber = std::make_shared<Subscriber>();
    subscriber->id      = id;
    subscriber->handler = std::move(handler);
    subscribers_[type].push_back(std::move(subscriber));
    owners_.insert_or_assign(id, type);
    return id;
}

auto EventBus::off(SubscriptionId id) -> bool {
    auto owner = owners_.find(id);
    if (owner == owners_.end()) {
        return false;
    }
    auto list = subscribers_.find(owner->second);
    owners_.erase(owner);
    if (list == subscribers_.end()) {
        return false;
    }
    auto& entries = list->second;
    auto  it      = std::ranges::find_if(entries, [id](auto const& entry) { return entry->id == id; });
    if (it == entries.end()) {
        return false;
    }
    (*it)->active = false;
    entries.erase(it);
    if (entries.empty()) {
        subscribers_.erase(list);
    }
    return true;
}

auto EventBus::dispatch(std::type_index type, std::string_view eventName, void const* payload) -> bool {
    auto list = subscribers_.find(type);
    if (list == subscribers_.end() || list->second.empty()) {
        return false;
    }
    // Handlers may mutate the table; deliver to the subscribers present at emit time.
    SubscriberList snapshot = list->second;
    for (auto const& subscriber : snapshot) {
        if (!subscriber->active) {
            continue;
        }
        try {
            subscriber->handler(payload);
        } catch (std::exception const& ex) {
            this->recordFailure(eventName, ex.what());
        } catch (...) {
            this->recordFailure(eventName, "unknown exception");
        }
    }
    return true;
}

auto EventBus::countFor(std::type_index type) const -> std::size_t {
    auto list = subscribers_.find(type);
    return list == subscribers_.end() ? 0 : list->second.size();
}

auto EventBus::clear() -> void {
    for (auto& [type, entries] : subscribers_) {
        for (auto& entry : entries) {
            entry->active = false;
        }
    }
    subscribers_.clear();
    owners_.clear();
}

auto EventBus::recordFailure(std::string_view eventName, std::string_view what) -> void {
    ++failures_;
    std::string message{eventName};
    message.append(": ");
    message.append(what);
    st_log("Subscriber failed while handling " + message, "EventBus", "ERROR");
    lastFailure_.emplace(Error::Code::SubscriberFailed, std::move(message));
}

} // namespace ST
