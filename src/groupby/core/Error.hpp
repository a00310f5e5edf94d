#pragma once
#include <array>
#include <cstddef>
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace GB {

struct Error {
    // Append new codes before Count and give them a label in errorCodeLabels.
    enum class Code {
        UnknownError = 0,
        NotFound,
        MissingKey,
        InvalidPath,
        TypeMismatch,
        IoError,
        // configuration and registration
        ConfigError,
        AlreadyRegistered,
        ExpressionError,
        // grouping callbacks
        CallbackError,
        InvalidYield,
        Count
    };

    explicit Error(Code c)
        : code(c) {}
    Error(Code c, std::string m)
        : code(c), message(std::move(m)) {}

    Code                       code;
    std::optional<std::string> message;
};

template <typename T>
using Expected = std::expected<T, Error>;

inline constexpr std::array<std::string_view, static_cast<std::size_t>(Error::Code::Count)> errorCodeLabels{
        "unknown_error",
        "not_found",
        "missing_key",
        "invalid_path",
        "type_mismatch",
        "io_error",
        "config_error",
        "already_registered",
        "expression_error",
        "callback_error",
        "invalid_yield",
};

[[nodiscard]] constexpr auto errorCodeToString(Error::Code code) -> std::string_view {
    auto const index = static_cast<std::size_t>(code);
    return index < errorCodeLabels.size() ? errorCodeLabels[index] : errorCodeLabels[0];
}

// "<label>" or "<label>: <message>"
[[nodiscard]] inline auto describeError(Error const& error) -> std::string {
    std::string description{errorCodeToString(error.code)};
    if (error.message && !error.message->empty())
        description.append(": ").append(*error.message);
    return description;
}

} // namespace GB
