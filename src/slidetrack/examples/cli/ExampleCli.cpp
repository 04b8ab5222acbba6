#include "ExampleCli.hpp"

#include <algorithm>
#include <charconv>
#include <cmath>

namespace ST::Examples::CLI {

namespace {

auto make_error(std::string message) -> Error {
    return Error{Error::Code::InvalidArgument, std::move(message)};
}

} // namespace

void ExampleCli::set_program_name(std::string_view name) {
    program_name_.assign(name.begin(), name.end());
}

void ExampleCli::add_flag(std::string_view name, FlagOption option) {
    OptionEntry entry;
    entry.name.assign(name.begin(), name.end());
    entry.flag_handler = std::move(option.on_set);
    options_.push_back(std::move(entry));
}

void ExampleCli::add_string(std::string_view name, StringOption option) {
    OptionEntry entry;
    entry.name.assign(name.begin(), name.end());
    entry.expects_value = true;
    entry.value_handler = [handler = std::move(option.on_value)](std::string_view token) -> std::optional<std::string> {
        handler(token);
        return std::nullopt;
    };
    options_.push_back(std::move(entry));
}

void ExampleCli::add_int(std::string_view name, IntOption option) {
    OptionEntry entry;
    entry.name.assign(name.begin(), name.end());
    entry.expects_value = true;
    entry.value_handler = [stored = entry.name, handler = std::move(option.on_value)](std::string_view token) -> std::optional<std::string> {
        int value   = 0;
        auto result = std::from_chars(token.data(), token.data() + token.size(), value);
        if (result.ec != std::errc{} || result.ptr != token.data() + token.size()) {
            return stored + " expects an integer";
        }
        handler(value);
        return std::nullopt;
    };
    options_.push_back(std::move(entry));
}

void ExampleCli::add_double(std::string_view name, DoubleOption option) {
    OptionEntry entry;
    entry.name.assign(name.begin(), name.end());
    entry.expects_value = true;
    entry.value_handler = [stored = entry.name, handler = std::move(option.on_value)](std::string_view token) -> std::optional<std::string> {
        double value = 0.0;
        auto result  = std::from_chars(token.data(), token.data() + token.size(), value);
        if (result.ec != std::errc{} || result.ptr != token.data() + token.size() || !std::isfinite(value)) {
            return stored + " expects a finite number";
        }
        handler(value);
        return std::nullopt;
    };
    options_.push_back(std::move(entry));
}

auto ExampleCli::parse(int argc, char const* const* argv) -> Expected<void> {
    for (int i = 1; i < argc; ++i) {
        std::string_view token{argv[i]};
        std::optional<std::string_view> attached;
        if (auto eq = token.find('='); eq != std::string_view::npos) {
            attached = token.substr(eq + 1);
            token    = token.substr(0, eq);
        }

        auto* entry = find_option(token);
        if (entry == nullptr) {
            return std::unexpected(make_error(program_name_ + ": unknown argument '" + std::string(argv[i]) + "'"));
        }
        if (!entry->expects_value) {
            if (attached) {
                return std::unexpected(make_error(program_name_ + ": " + entry->name + " does not take a value"));
            }
            entry->flag_handler();
            continue;
        }

        std::string_view value;
        if (attached) {
            value = *attached;
        } else if (i + 1 < argc) {
            value = argv[++i];
        } else {
            return std::unexpected(make_error(program_name_ + ": " + entry->name + " requires a value"));
        }
        if (auto error = entry->value_handler(value)) {
            return std::unexpected(make_error(program_name_ + ": " + *error));
        }
    }
    return {};
}

auto ExampleCli::usage() const -> std::string {
    std::string text = "usage: " + program_name_;
    for (auto const& option : options_) {
        text += " [" + option.name + (option.expects_value ? " <value>]" : "]");
    }
    return text;
}

auto ExampleCli::find_option(std::string_view name) -> OptionEntry* {
    auto it = std::ranges::find(options_, name, &OptionEntry::name);
    return it == options_.end() ? nullptr : &*it;
}

} // namespace ST::Examples::CLI
