#include <slidetrack/render/EffectManager.hpp>

#include <slidetrack/events/Events.hpp>

#include "log/TaggedLogger.hpp"

namespace ST {

EffectManager::EffectManager(ReactiveStore& store, std::shared_ptr<EventBus> bus, EffectRegistry const& registry)
    : store_(store)
    , bus_(std::move(bus))
    , registry_(registry) {
    if (!bus_) {
        throw ConfigurationError("EffectManager requires an event bus");
    }
    if (auto loaded = this->loadEffect(store_.getOptions().effect); !loaded) {
        throw ConfigurationError("no render effect available: " + describeError(loaded.error()));
    }
    optionsSubscription_ = bus_->on<Events::OptionsChanged>([this](Events::OptionsChanged const& change) {
        if (change.current.effect == requestedName_) {
            return;
        }
        if (auto loaded = this->loadEffect(change.current.effect); !loaded) {
            st_log("Effect switch failed: " + describeError(loaded.error()), "EffectManager", "ERROR");
        }
    });
}

EffectManager::~EffectManager() {
    bus_->off(optionsSubscription_);
}

auto EffectManager::loadEffect(std::string_view name) -> Expected<void> {
    requestedName_    = std::string{name};
    auto resolvedName = requestedName_;
    auto created      = registry_.create(resolvedName);
    if (!created) {
        st_log("Effect '" + resolvedName + "' is not registered, falling back to carousel", "EffectManager");
        resolvedName = std::string{kFallbackEffect};
        created      = registry_.create(resolvedName);
        if (!created) {
            return std::unexpected(created.error());
        }
    }

    auto previousName = std::move(currentName_);
    if (current_) {
        current_.reset();
        bus_->emit(Events::EffectDestroyed{.name = previousName});
    }
    current_     = std::move(*created);
    currentName_ = resolvedName;

    bus_->emit(Events::EffectLoaded{.name = currentName_});
    bus_->emit(Events::EffectChanged{.previousName = previousName, .currentName = currentName_});
    return {};
}

auto EffectManager::rules() const -> EffectRules {
    return current_ ? current_->rules() : EffectRules{};
}

} // namespace ST
