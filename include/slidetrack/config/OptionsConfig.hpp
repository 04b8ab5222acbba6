#pragma once
#include <slidetrack/core/Error.hpp>
#include <slidetrack/render/Frame.hpp>
#include <slidetrack/store/StateSlices.hpp>

#include <nlohmann/json.hpp>

#include <filesystem>
#include <string_view>

namespace ST::Config {

/**
 * Reads an options object such as
 *
 *   { "loop": true, "slidesPerView": 2, "effect": "carousel",
 *     "animation": { "attraction": 0.03, "friction": 0.3 } }
 *
 * Only the keys present are set in the returned patch. Unknown keys, values of
 * the wrong type and values that would fail `validateOptions` are rejected.
 */
[[nodiscard]] auto ParseOptions(nlohmann::json const& json) -> Expected<OptionsPatch>;
[[nodiscard]] auto ParseOptionsText(std::string_view text) -> Expected<OptionsPatch>;
[[nodiscard]] auto LoadOptionsFile(std::filesystem::path const& path) -> Expected<OptionsPatch>;

[[nodiscard]] auto ToJson(Options const& options) -> nlohmann::json;
// Trace record for one rendered frame.
[[nodiscard]] auto ToJson(Frame const& frame) -> nlohmann::json;

} // namespace ST::Config
