#include <slidetrack/Carousel.hpp>

#include <slidetrack/coords/CoordinateSystem.hpp>
#include <slidetrack/events/Events.hpp>

#include "log/TaggedLogger.hpp"

#include <algorithm>
#include <cmath>
#include <string>

namespace ST {

namespace {

auto make_error(Error::Code code, std::string message) -> Error {
    return Error{code, std::move(message)};
}

auto wrap(int value, int count) -> int {
    return ((value % count) + count) % count;
}

} // namespace

Carousel::Carousel(FrameHost& host, Clock const& clock, EffectRegistry const& registry, OptionsPatch const& options)
    : bus_(std::make_shared<EventBus>())
    , store_(bus_)
    , effects_(store_, bus_, registry)
    , track_(store_, bus_)
    , scheduler_(store_, track_, effects_, bus_, host, clock) {
    auto const initial = merge(store_.getOptions(), options);
    if (auto valid = validateOptions(initial); !valid) {
        if (valid.error().code == Error::Code::OutOfBounds) {
            throw RangeError(describeError(valid.error()));
        }
        throw ConfigurationError(describeError(valid.error()));
    }
    this->bindCoreEvents();
    store_.setOptions(options);
}

Carousel::~Carousel() {
    for (auto id : subscriptions_) {
        bus_->off(id);
    }
}

auto Carousel::bindCoreEvents() -> void {
    subscriptions_.push_back(bus_->on<Events::OptionsChanged>([this](Events::OptionsChanged const& change) {
        this->recomputeLayout(change.current);
        this->restoreIndex();
    }));
    subscriptions_.push_back(bus_->on<Events::PageStepRequested>([this](Events::PageStepRequested const& request) {
        auto const velocity = request.velocity.value_or(0.0);
        if (request.step > 0) {
            this->next(velocity);
        } else {
            this->prev(velocity);
        }
    }));
    subscriptions_.push_back(bus_->on<Events::SelectedIndexChanged>(
        [this](Events::SelectedIndexChanged const& change) { this->renderSelection(change.current); }));
}

auto Carousel::recomputeLayout(Options const& options) -> void {
    auto const rules   = effects_.rules();
    auto const count   = store_.getState().slideCount;
    auto const perView = std::clamp(options.slidesPerView, rules.minSlidesPerView, std::max(rules.minSlidesPerView, rules.maxSlidesPerView));

    auto widths = Track::computeWidths(layout_, count, perView);
    if (widths.slide > rules.maxSlideWidth) {
        widths = Track::computeWidths(Track::LayoutMetrics{layout_.viewport, layout_.gap, layout_.paddingLeft, layout_.paddingRight, layout_.slideMin, rules.maxSlideWidth},
                                      count,
                                      perView);
    }
    store_.setWidths(widths);
    store_.setTransformPoints(Coords::computeTransformPoints(widths, perView));

    auto effective          = options;
    effective.slidesPerView = perView;
    store_.setState(RuntimeStatePatch{.pageCount = Track::pageCount(count, effective)});
}

auto Carousel::restoreIndex() -> void {
    auto const state = store_.getState();
    if (state.slideCount <= 0) {
        return;
    }
    auto const index = std::clamp(state.renderIndex, 0, state.slideCount - 1);
    if (auto jumped = this->jumpToSlide(index); !jumped) {
        st_log("Could not restore slide " + std::to_string(index) + ": " + describeError(jumped.error()), "Carousel", "ERROR");
    }
}

auto Carousel::rebuildSlides(int count) -> void {
    auto const widths   = store_.getWidths();
    auto const selected = store_.getState().selectedIndex;

    std::vector<SlideDescriptor> slides;
    slides.reserve(static_cast<std::size_t>(count));
    for (int i = 0; i < count; ++i) {
        auto const trackPosition = Track::roundToHalf(i * widths.slideAndGap);
        slides.push_back(SlideDescriptor{
            .logicalIndex  = i,
            .renderIndex   = i,
            .trackPosition = trackPosition,
            .centerPoint   = Track::roundToHalf(trackPosition + widths.slide / 2.0),
            .selected      = i == selected,
        });
    }
    store_.setSlides(std::move(slides));
}

auto Carousel::setSlideCount(int count) -> void {
    count              = std::max(count, 0);
    auto const before  = store_.getState();
    auto const options = store_.getOptions();

    if (count > 0 && before.selectedIndex >= count) {
        store_.setState(RuntimeStatePatch{.selectedIndex = count - 1});
    }
    this->rebuildSlides(count);
    this->recomputeLayout(options);
    if (count == 0) {
        return;
    }

    if (before.slideCount == 0) {
        auto const initial = std::clamp(options.initialIndex, 0, count - 1);
        store_.setState(RuntimeStatePatch{.selectedIndex = initial});
        if (auto jumped = this->jumpToSlide(initial); !jumped) {
            st_log("Initial jump failed: " + describeError(jumped.error()), "Carousel", "ERROR");
        }
        return;
    }
    this->restoreIndex();
}

auto Carousel::addSlide(std::optional<int> at) -> Expected<void> {
    auto const state = store_.getState();
    auto const index = at.value_or(state.slideCount);
    if (index < 0 || index > state.slideCount) {
        return std::unexpected(make_error(Error::Code::OutOfBounds,
                                          "insert position " + std::to_string(index) + " is outside 0.." + std::to_string(state.slideCount)));
    }
    if (state.slideCount > 0 && index <= state.selectedIndex) {
        store_.setState(RuntimeStatePatch{.selectedIndex = state.selectedIndex + 1});
    }
    this->setSlideCount(state.slideCount + 1);
    return {};
}

auto Carousel::removeSlide(int index) -> Expected<void> {
    auto const state = store_.getState();
    if (index < 0 || index >= state.slideCount) {
        return std::unexpected(make_error(Error::Code::OutOfBounds,
                                          "slide " + std::to_string(index) + " does not exist"));
    }
    if (index < state.selectedIndex) {
        store_.setState(RuntimeStatePatch{.selectedIndex = state.selectedIndex - 1});
    }
    this->setSlideCount(state.slideCount - 1);
    return {};
}

auto Carousel::setLayout(Track::LayoutMetrics const& layout) -> void {
    layout_ = layout;
    this->recomputeLayout(store_.getOptions());
    this->restoreIndex();
}

auto Carousel::scheduleLayout(Track::LayoutMetrics const& layout) -> void {
    scheduler_.debounce("layout", kLayoutDebounce, [this, layout] { this->setLayout(layout); });
}

auto Carousel::next(double velocity) -> void {
    this->goToPage(store_.getState().pageIndex + 1, velocity);
}

auto Carousel::prev(double velocity) -> void {
    this->goToPage(store_.getState().pageIndex - 1, velocity);
}

auto Carousel::goToSlide(int index, double velocity) -> void {
    auto const count = store_.getState().slideCount;
    if (count <= 0) {
        return;
    }
    auto const loop = store_.getOptions().loop;
    if (index < 0) {
        index = loop ? wrap(index, count) : 0;
        if (!loop && velocity == 0.0) {
            velocity = kEdgeNudgeVelocity;
        }
    } else if (index >= count) {
        index = loop ? index % count : count - 1;
        if (!loop && velocity == 0.0) {
            velocity = -kEdgeNudgeVelocity;
        }
    }

    store_.setState(RuntimeStatePatch{.renderIndex = index, .pageIndex = Track::pageForSlide(index, store_.getOptions())});
    bus_->emit(Events::AnimationRequested{.index = index, .trackPosition = std::nullopt, .velocity = velocity, .type = AnimationType::Animated});
}

auto Carousel::jumpToSlide(int index) -> Expected<void> {
    auto const max = store_.getState().slideCount - 1;
    if (index < 0 || index > max) {
        st_log("Slide " + std::to_string(index) + " out of bounds", "Carousel", "ERROR");
        return std::unexpected(make_error(Error::Code::OutOfBounds,
                                          "slide index " + std::to_string(index) + " is out of bounds. valid range is 0 to " + std::to_string(max)));
    }
    store_.setState(RuntimeStatePatch{.renderIndex = index, .pageIndex = Track::pageForSlide(index, store_.getOptions())});
    bus_->emit(Events::AnimationRequested{.index = index, .trackPosition = std::nullopt, .velocity = 0.0, .type = AnimationType::Instant});
    return {};
}

auto Carousel::goToPage(int page, double velocity) -> void {
    auto const pageCount = store_.getState().pageCount;
    auto const options   = store_.getOptions();
    if (page < 0) {
        page = options.loop ? wrap(page, pageCount) : 0;
        if (!options.loop && velocity == 0.0) {
            velocity = kEdgeNudgeVelocity;
        }
    } else if (page >= pageCount) {
        page = options.loop ? 0 : pageCount - 1;
        if (!options.loop && velocity == 0.0) {
            velocity = -kEdgeNudgeVelocity;
        }
    }
    this->goToSlide(page * options.slidesPerMove, velocity);
}

auto Carousel::jumpToPage(int page) -> Expected<void> {
    auto const pageCount = store_.getState().pageCount;
    auto const options   = store_.getOptions();
    if (page < 0) {
        page = options.loop ? wrap(page, pageCount) : 0;
    } else if (page >= pageCount) {
        page = options.loop ? 0 : pageCount - 1;
    }
    return this->jumpToSlide(page * options.slidesPerMove);
}

auto Carousel::percentToTrackOffset(double percent) const -> double {
    percent              = std::clamp(percent, 0.0, 100.0);
    auto const pageCount = store_.getState().pageCount;
    if (pageCount <= 1) {
        return 0.0;
    }
    auto const lastPageSlide = (pageCount - 1) * store_.getOptions().slidesPerMove;
    return percent / 100.0 * track_.trackOffsetForIndex(lastPageSlide);
}

auto Carousel::requestTrackPosition(double percent) -> void {
    if (!std::isfinite(percent)) {
        st_log("Ignoring non-finite track position request", "Carousel", "ERROR");
        return;
    }
    bus_->emit(Events::AnimationRequested{
        .index         = std::nullopt,
        .trackPosition = this->percentToTrackOffset(percent),
        .velocity      = 0.0,
        .type          = AnimationType::Instant,
    });
}

auto Carousel::setSelectedIndex(int index) -> Expected<void> {
    auto const count = store_.getState().slideCount;
    if (index < 0 || index >= count) {
        return std::unexpected(make_error(Error::Code::OutOfBounds,
                                          "selected index " + std::to_string(index) + " is out of bounds (0-" + std::to_string(count - 1) + ")"));
    }
    store_.setState(RuntimeStatePatch{.selectedIndex = index});
    if (store_.getOptions().goToSelectedSlide) {
        this->goToSlide(index);
    }
    return {};
}

auto Carousel::updateOptions(OptionsPatch const& patch) -> Expected<void> {
    if (auto valid = validateOptions(merge(store_.getOptions(), patch)); !valid) {
        st_log("Rejected options: " + describeError(valid.error()), "Carousel", "ERROR");
        return std::unexpected(valid.error());
    }
    store_.setOptions(patch);
    return {};
}

auto Carousel::renderSelection(int selectedIndex) -> void {
    auto slides  = store_.getSlides();
    bool changed = false;
    for (auto& slide : slides) {
        auto const selected = slide.logicalIndex == selectedIndex;
        changed             = changed || slide.selected != selected;
        slide.selected      = selected;
    }
    if (changed) {
        store_.setSlides(std::move(slides));
    }
}

} // namespace ST
