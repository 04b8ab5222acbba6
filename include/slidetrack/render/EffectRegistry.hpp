#pragma once
#include <slidetrack/core/Error.hpp>
#include <slidetrack/render/RenderEffect.hpp>

#include <parallel_hashmap/phmap.h>

#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace ST {

using EffectFactory = std::function<std::unique_ptr<RenderEffect>()>;

inline constexpr std::string_view kFallbackEffect = "carousel";

// Named render-effect factories. Passed by reference to whoever needs it.
class EffectRegistry {
public:
    // A registry holding the built-in "carousel" effect.
    [[nodiscard]] static auto WithDefaults() -> EffectRegistry;

    // Returns false when an existing registration was replaced.
    auto add(std::string name, EffectFactory factory) -> bool;
    auto remove(std::string_view name) -> bool;

    [[nodiscard]] auto contains(std::string_view name) const -> bool;
    [[nodiscard]] auto create(std::string_view name) const -> Expected<std::unique_ptr<RenderEffect>>;
    [[nodiscard]] auto names() const -> std::vector<std::string>;

private:
    phmap::flat_hash_map<std::string, EffectFactory> factories_;
};

} // namespace ST
