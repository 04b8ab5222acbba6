#pragma once
#include <slidetrack/core/Error.hpp>
#include <slidetrack/events/EventBus.hpp>
#include <slidetrack/render/EffectRegistry.hpp>
#include <slidetrack/render/RenderEffect.hpp>
#include <slidetrack/store/ReactiveStore.hpp>

#include <memory>
#include <string>
#include <string_view>

namespace ST {

/**
 * Keeps the effect named in `Options::effect` loaded.
 *
 * Unknown names fall back to "carousel". Throws ConfigurationError at
 * construction when neither the configured effect nor the fallback can be
 * created, or when the bus is missing.
 */
class EffectManager {
public:
    EffectManager(ReactiveStore& store, std::shared_ptr<EventBus> bus, EffectRegistry const& registry);
    ~EffectManager();

    EffectManager(EffectManager const&)                    = delete;
    auto operator=(EffectManager const&) -> EffectManager& = delete;

    // Loads `name`, or the fallback when it is not registered. Errors only when
    // nothing could be loaded; the previous effect then stays active.
    auto loadEffect(std::string_view name) -> Expected<void>;

    [[nodiscard]] auto current() const -> RenderEffect* { return current_.get(); }
    [[nodiscard]] auto currentName() const -> std::string const& { return currentName_; }
    [[nodiscard]] auto rules() const -> EffectRules;

private:
    ReactiveStore&                store_;
    std::shared_ptr<EventBus>     bus_;
    EffectRegistry const&         registry_;
    std::unique_ptr<RenderEffect> current_;
    std::string                   currentName_;
    std::string                   requestedName_;
    SubscriptionId                optionsSubscription_ = 0;
};

} // namespace ST
