#include <slidetrack/config/OptionsConfig.hpp>

#include "log/TaggedLogger.hpp"

#include <cstdint>
#include <fstream>
#include <limits>
#include <optional>
#include <string>

namespace ST::Config {

namespace {

using json = nlohmann::json;

auto make_error(Error::Code code, std::string message) -> Error {
    return Error{code, std::move(message)};
}

auto wrong_type(std::string_view key, std::string_view expected) -> Error {
    return make_error(Error::Code::InvalidType, std::string(key) + " must be " + std::string(expected));
}

auto read_bool(json const& value, std::string_view key, std::optional<bool>& out) -> std::optional<Error> {
    if (!value.is_boolean()) {
        return wrong_type(key, "a boolean");
    }
    out = value.get<bool>();
    return std::nullopt;
}

auto read_int(json const& value, std::string_view key, std::optional<int>& out) -> std::optional<Error> {
    if (!value.is_number_integer()) {
        return wrong_type(key, "an integer");
    }
    auto const outOfRange = value.is_number_unsigned()
                                    ? value.get<std::uint64_t>() > static_cast<std::uint64_t>(std::numeric_limits<int>::max())
                                    : value.get<std::int64_t>() < std::numeric_limits<int>::min()
                                              || value.get<std::int64_t>() > std::numeric_limits<int>::max();
    if (outOfRange) {
        return make_error(Error::Code::OutOfBounds, std::string(key) + " does not fit in an int");
    }
    out = value.get<int>();
    return std::nullopt;
}

auto read_number(json const& value, std::string_view key, std::optional<double>& out) -> std::optional<Error> {
    if (!value.is_number()) {
        return wrong_type(key, "a number");
    }
    out = value.get<double>();
    return std::nullopt;
}

auto read_string(json const& value, std::string_view key, std::optional<std::string>& out) -> std::optional<Error> {
    if (!value.is_string()) {
        return wrong_type(key, "a string");
    }
    out = value.get<std::string>();
    return std::nullopt;
}

auto read_animation(json const& value, OptionsPatch& patch) -> std::optional<Error> {
    if (!value.is_object()) {
        return wrong_type("animation", "an object");
    }
    for (auto it = value.begin(); it != value.end(); ++it) {
        std::optional<Error> error;
        if (it.key() == "attraction") {
            error = read_number(it.value(), "animation.attraction", patch.attraction);
        } else if (it.key() == "friction") {
            error = read_number(it.value(), "animation.friction", patch.friction);
        } else {
            error = make_error(Error::Code::MalformedInput, "unknown key animation." + it.key());
        }
        if (error) {
            return error;
        }
    }
    return std::nullopt;
}

auto to_json(Widths const& widths) -> json {
    return json{
        {"viewport", widths.viewport},
        {"track", widths.track},
        {"slide", widths.slide},
        {"slideMin", widths.slideMin},
        {"gap", widths.gap},
        {"slideAndGap", widths.slideAndGap},
        {"paddingLeft", widths.paddingLeft},
        {"paddingRight", widths.paddingRight},
    };
}

auto to_json(RuntimeState const& state) -> json {
    return json{
        {"selectedIndex", state.selectedIndex},
        {"renderIndex", state.renderIndex},
        {"pageIndex", state.pageIndex},
        {"pageCount", state.pageCount},
        {"isDragging", state.isDragging},
        {"slideCount", state.slideCount},
    };
}

auto to_json(AnimationDescriptor const& animation) -> json {
    return json{
        {"type", std::string(animationTypeName(animation.type))},
        {"offset", animation.offset},
        {"delta", animation.delta},
        {"velocity", animation.velocity},
        {"progress", animation.progress},
        {"isRunning", animation.isRunning},
        {"direction", animation.direction},
    };
}

} // namespace

auto ParseOptions(json const& value) -> Expected<OptionsPatch> {
    if (!value.is_object()) {
        return std::unexpected(make_error(Error::Code::MalformedInput, "options must be a JSON object"));
    }

    OptionsPatch patch;
    for (auto it = value.begin(); it != value.end(); ++it) {
        auto const& key = it.key();
        auto const& v   = it.value();

        std::optional<Error> error;
        if (key == "loop") {
            error = read_bool(v, key, patch.loop);
        } else if (key == "slidesPerView") {
            error = read_int(v, key, patch.slidesPerView);
        } else if (key == "slidesPerMove") {
            error = read_int(v, key, patch.slidesPerMove);
        } else if (key == "centerSelectedSlide") {
            error = read_bool(v, key, patch.centerSelectedSlide);
        } else if (key == "goToSelectedSlide") {
            error = read_bool(v, key, patch.goToSelectedSlide);
        } else if (key == "dragThreshold") {
            error = read_number(v, key, patch.dragThreshold);
        } else if (key == "initialIndex") {
            error = read_int(v, key, patch.initialIndex);
        } else if (key == "effect") {
            error = read_string(v, key, patch.effect);
        } else if (key == "animation") {
            error = read_animation(v, patch);
        } else {
            error = make_error(Error::Code::MalformedInput, "unknown option " + key);
        }
        if (error) {
            st_log("Options rejected: " + describeError(*error), "Config", "ERROR");
            return std::unexpected(*error);
        }
    }

    if (auto valid = validateOptions(merge(Options{}, patch)); !valid) {
        return std::unexpected(valid.error());
    }
    return patch;
}

auto ParseOptionsText(std::string_view text) -> Expected<OptionsPatch> {
    auto parsed = json::parse(text, nullptr, false);
    if (parsed.is_discarded()) {
        return std::unexpected(make_error(Error::Code::MalformedInput, "options are not valid JSON"));
    }
    return ParseOptions(parsed);
}

auto LoadOptionsFile(std::filesystem::path const& path) -> Expected<OptionsPatch> {
    std::ifstream file(path);
    if (!file) {
        return std::unexpected(make_error(Error::Code::NotFound, "cannot open " + path.string()));
    }
    auto parsed = json::parse(file, nullptr, false);
    if (parsed.is_discarded()) {
        return std::unexpected(make_error(Error::Code::MalformedInput, path.string() + " is not valid JSON"));
    }
    st_log("Loading options from " + path.string(), "Config");
    return ParseOptions(parsed);
}

auto ToJson(Options const& options) -> json {
    return json{
        {"loop", options.loop},
        {"slidesPerView", options.slidesPerView},
        {"slidesPerMove", options.slidesPerMove},
        {"centerSelectedSlide", options.centerSelectedSlide},
        {"goToSelectedSlide", options.goToSelectedSlide},
        {"dragThreshold", options.dragThreshold},
        {"initialIndex", options.initialIndex},
        {"effect", options.effect},
        {"animation", json{{"attraction", options.attraction}, {"friction", options.friction}}},
    };
}

auto ToJson(Frame const& frame) -> json {
    auto slides = json::array();
    for (auto const& slide : frame.slides) {
        slides.push_back(json{
            {"logicalIndex", slide.logicalIndex},
            {"renderIndex", slide.renderIndex},
            {"trackPosition", slide.trackPosition},
            {"centerPoint", slide.centerPoint},
            {"selected", slide.selected},
        });
    }

    auto points = json::object();
    for (auto const& point : frame.transformPoints.points()) {
        points[point.name] = point.value;
    }

    return json{
        {"time", frame.time},
        {"options", ToJson(frame.options)},
        {"state", to_json(frame.state)},
        {"widths", to_json(frame.widths)},
        {"animation", to_json(frame.animation)},
        {"slides", std::move(slides)},
        {"transformPoints", std::move(points)},
    };
}

} // namespace ST::Config
