// Headless carousel driven by a manual frame host. Each rendered frame is
// printed as one JSON line on stdout.
//
//   slidetrack_trace_example --slides 6 --per-view 2 --loop --goto 4
//   slidetrack_trace_example --options carousel.json --drag -260

#include "examples/cli/ExampleCli.hpp"

#include <slidetrack/Carousel.hpp>
#include <slidetrack/config/OptionsConfig.hpp>
#include <slidetrack/events/Events.hpp>
#include <slidetrack/render/CarouselEffect.hpp>

#include <chrono>
#include <iostream>
#include <memory>
#include <optional>
#include <string>

using namespace ST;

namespace {

struct CommandLineOptions {
    std::string           optionsFile;
    int                   slides    = 5;
    int                   perView   = 1;
    double                viewport  = 800.0;
    double                gap       = 20.0;
    double                padding   = 0.0;
    bool                  loop      = false;
    int                   maxFrames = 600;
    std::optional<int>    gotoIndex;
    std::optional<double> dragDelta;
};

// Carousel placement plus one JSON line per render.
class TraceEffect final : public RenderEffect {
public:
    [[nodiscard]] auto name() const -> std::string_view override { return "trace"; }
    [[nodiscard]] auto rules() const -> EffectRules override {
        EffectRules rules;
        rules.loopBuffer = Track::LoopBuffer{1, 1};
        return rules;
    }
    auto render(Frame const& frame, Coords::FrameHelpers const& helpers) -> void override {
        inner_.render(frame, helpers);
        auto line              = Config::ToJson(frame);
        line["trackTranslate"] = inner_.trackTranslation();
        std::cout << line.dump() << '\n';
    }

private:
    CarouselEffect inner_;
};

auto parse_command_line(int argc, char** argv) -> std::optional<CommandLineOptions> {
    CommandLineOptions opts;
    Examples::CLI::ExampleCli cli;
    cli.set_program_name("slidetrack_trace_example");
    cli.add_string("--options", {.on_value = [&](std::string_view path) { opts.optionsFile = std::string(path); }});
    cli.add_int("--slides", {.on_value = [&](int value) { opts.slides = value; }});
    cli.add_int("--per-view", {.on_value = [&](int value) { opts.perView = value; }});
    cli.add_double("--viewport", {.on_value = [&](double value) { opts.viewport = value; }});
    cli.add_double("--gap", {.on_value = [&](double value) { opts.gap = value; }});
    cli.add_double("--padding", {.on_value = [&](double value) { opts.padding = value; }});
    cli.add_flag("--loop", {.on_set = [&] { opts.loop = true; }});
    cli.add_int("--frames", {.on_value = [&](int value) { opts.maxFrames = value; }});
    cli.add_int("--goto", {.on_value = [&](int value) { opts.gotoIndex = value; }});
    cli.add_double("--drag", {.on_value = [&](double value) { opts.dragDelta = value; }});

    if (auto parsed = cli.parse(argc, argv); !parsed) {
        std::cerr << describeError(parsed.error()) << '\n' << cli.usage() << '\n';
        return std::nullopt;
    }
    return opts;
}

} // namespace

int main(int argc, char** argv) {
    auto cmd = parse_command_line(argc, argv);
    if (!cmd) {
        return 2;
    }

    OptionsPatch options;
    if (!cmd->optionsFile.empty()) {
        auto loaded = Config::LoadOptionsFile(cmd->optionsFile);
        if (!loaded) {
            std::cerr << "options: " << describeError(loaded.error()) << '\n';
            return 1;
        }
        options = *loaded;
    } else {
        options.loop          = cmd->loop;
        options.slidesPerView = cmd->perView;
    }
    if (!options.effect) {
        options.effect = "trace";
    }

    auto registry = EffectRegistry::WithDefaults();
    registry.add("trace", [] { return std::make_unique<TraceEffect>(); });

    ManualClock     clock;
    ManualFrameHost host;
    try {
        Carousel carousel(host, clock, registry, options);
        carousel.setLayout(Track::LayoutMetrics{
            .viewport     = cmd->viewport,
            .gap          = cmd->gap,
            .paddingLeft  = cmd->padding,
            .paddingRight = cmd->padding,
        });
        carousel.setSlideCount(cmd->slides);

        carousel.on<Events::MotionFinished>([](Events::MotionFinished const& finished) {
            std::cerr << "motion finished at " << finished.finalPosition << '\n';
        });
        carousel.on<Events::TrackShifted>([](Events::TrackShifted const& shifted) {
            std::cerr << "track rebased by " << shifted.rebaseDelta << '\n';
        });

        constexpr double kFrameMs = 1000.0 / 60.0;
        double           now      = 0.0;
        auto runFrames = [&] {
            std::size_t frames = 0;
            while (host.pendingCount() > 0 && frames < static_cast<std::size_t>(cmd->maxFrames)) {
                clock.advance(std::chrono::microseconds(static_cast<long>(kFrameMs * 1000.0)));
                now += kFrameMs;
                frames += host.runFrame(now);
            }
        };
        runFrames();

        if (cmd->gotoIndex) {
            carousel.goToSlide(*cmd->gotoIndex);
            runFrames();
        }
        if (cmd->dragDelta) {
            carousel.bus().emit(Events::DragStarted{});
            carousel.bus().emit(Events::DragMoved{.delta = *cmd->dragDelta});
            carousel.bus().emit(Events::DragEnded{.delta = *cmd->dragDelta, .velocity = std::nullopt});
            runFrames();
        }
        std::cerr << "rendered " << carousel.scheduler().framesRendered() << " frames, index " << carousel.getIndex() << '\n';
    } catch (std::exception const& ex) {
        std::cerr << "slidetrack_trace_example: " << ex.what() << '\n';
        return 1;
    }
    return 0;
}
