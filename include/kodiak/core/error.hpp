#pragma once

#include <cstddef>
#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <string_view>

namespace kodiak {

enum class ErrorKind : std::uint8_t {
    /// Operation invoked against an incompatible series variant.
    WrongColumnType,
    /// Reduction over zero elements.
    EmptySeries,
    /// Text to numeric conversion failed; index and value identify the element.
    ParseFailure,
    /// Argument outside the operation's domain (e.g. percentile above 100).
    InvalidArgument,
};

[[nodiscard]] auto to_string(ErrorKind kind) -> std::string_view;

/// Recoverable, data-dependent failure returned to the caller.
struct SeriesError {
    ErrorKind kind = ErrorKind::InvalidArgument;
    std::string message;
    /// Set for ParseFailure: the lowest failing global index.
    std::optional<std::size_t> index;
    /// Set for ParseFailure: the text that failed to parse.
    std::string value;

    [[nodiscard]] auto format() const -> std::string;
};

/// Result type for fallible series operations.
template <typename T>
using Result = std::expected<T, SeriesError>;

[[nodiscard]] auto wrong_column_type(std::string_view operation, std::string_view expected)
    -> SeriesError;
[[nodiscard]] auto empty_series(std::string_view operation) -> SeriesError;
[[nodiscard]] auto parse_failure(std::size_t index, std::string value) -> SeriesError;
[[nodiscard]] auto invalid_argument(std::string message) -> SeriesError;

}  // namespace kodiak
