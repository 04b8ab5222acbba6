#pragma once
#include <array>
#include <cstddef>
#include <expected>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

namespace ST {

struct Error {
    enum class Code {
        InvalidError = 0,
        UnknownError,
        InvalidArgument,
        OutOfBounds,
        NoSuchPoint,
        NoSuchEffect,
        MalformedInput,
        InvalidType,
        NotFound,
        NotSupported,
        SubscriberFailed
    };

    Error(Code c, std::string m)
        : code(c), message(std::move(m)) {}

    Code                       code;
    std::optional<std::string> message;
};

template <typename T>
using Expected = std::expected<T, Error>;

// Thrown when a component is wired with missing collaborators.
class ConfigurationError : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

// Thrown when a tuning coefficient leaves its admissible interval.
class RangeError : public std::out_of_range {
public:
    using std::out_of_range::out_of_range;
};

namespace detail {
// Indexed by Error::Code.
inline constexpr std::array<std::string_view, 11> kErrorLabels{
        "invalid_error",  "unknown_error",   "invalid_argument", "out_of_bounds", "no_such_point",    "no_such_effect",
        "malformed_input", "invalid_type",   "not_found",        "not_supported", "subscriber_failed",
};
} // namespace detail

[[nodiscard]] inline auto errorCodeToString(Error::Code code) -> std::string_view {
    auto const index = static_cast<std::size_t>(code);
    return index < detail::kErrorLabels.size() ? detail::kErrorLabels[index] : "unknown_error";
}

// "label" or "label:message".
[[nodiscard]] inline auto describeError(Error const& error) -> std::string {
    std::string out{errorCodeToString(error.code)};
    if (error.message && !error.message->empty()) {
        out += ':';
        out += *error.message;
    }
    return out;
}

} // namespace ST
