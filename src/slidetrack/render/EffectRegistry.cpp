#include <slidetrack/render/EffectRegistry.hpp>

#include <slidetrack/render/CarouselEffect.hpp>

#include <algorithm>

namespace ST {

namespace {

auto make_error(Error::Code code, std::string message) -> Error {
    return Error{code, std::move(message)};
}

} // namespace

auto EffectRegistry::WithDefaults() -> EffectRegistry {
    EffectRegistry registry;
    registry.add(std::string{kFallbackEffect}, [] { return std::make_unique<CarouselEffect>(); });
    return registry;
}

auto EffectRegistry::add(std::string name, EffectFactory factory) -> bool {
    return factories_.insert_or_assign(std::move(name), std::move(factory)).second;
}

auto EffectRegistry::remove(std::string_view name) -> bool {
    auto it = factories_.find(std::string{name});
    if (it == factories_.end()) {
        return false;
    }
    factories_.erase(it);
    return true;
}

auto EffectRegistry::contains(std::string_view name) const -> bool {
    return factories_.find(std::string{name}) != factories_.end();
}

auto EffectRegistry::create(std::string_view name) const -> Expected<std::unique_ptr<RenderEffect>> {
    auto it = factories_.find(std::string{name});
    if (it == factories_.end() || !it->second) {
        return std::unexpected(make_error(Error::Code::NoSuchEffect, "effect '" + std::string{name} + "' is not registered"));
    }
    auto effect = it->second();
    if (!effect) {
        return std::unexpected(make_error(Error::Code::NoSuchEffect, "factory for '" + std::string{name} + "' produced no effect"));
    }
    return effect;
}

auto EffectRegistry::names() const -> std::vector<std::string> {
    std::vector<std::string> result;
    result.reserve(factories_.size());
    for (auto const& [name, factory] : factories_) {
        result.push_back(name);
    }
    std::ranges::sort(result);
    return result;
}

} // namespace ST
