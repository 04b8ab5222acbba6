#pragma once
#include <slidetrack/core/Error.hpp>

#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace ST::Examples::CLI {

// Tiny `--name value` / `--name=value` parser shared by the examples.
class ExampleCli {
public:
    struct FlagOption {
        std::function<void()> on_set;
    };
    struct StringOption {
        std::function<void(std::string_view)> on_value;
    };
    struct IntOption {
        std::function<void(int)> on_value;
    };
    struct DoubleOption {
        std::function<void(double)> on_value;
    };

    void set_program_name(std::string_view name);

    void add_flag(std::string_view name, FlagOption option);
    void add_string(std::string_view name, StringOption option);
    void add_int(std::string_view name, IntOption option);
    void add_double(std::string_view name, DoubleOption option);

    // Stops at the first bad token. Unknown arguments are errors.
    [[nodiscard]] auto parse(int argc, char const* const* argv) -> Expected<void>;
    [[nodiscard]] auto usage() const -> std::string;

private:
    struct OptionEntry {
        std::string                                                   name;
        bool                                                          expects_value = false;
        std::function<void()>                                         flag_handler;
        std::function<std::optional<std::string>(std::string_view)> value_handler;
    };

    auto find_option(std::string_view name) -> OptionEntry*;

    std::vector<OptionEntry> options_;
    std::string              program_name_ = "example";
};

} // namespace ST::Examples::CLI
