#include <kodiak/core/error.hpp>

#include <fmt/format.h>

namespace kodiak {

auto to_string(ErrorKind kind) -> std::string_view {
    switch (kind) {
        case ErrorKind::WrongColumnType:
            return "wrong column type";
        case ErrorKind::EmptySeries:
            return "empty series";
        case ErrorKind::ParseFailure:
            return "parse failure";
        case ErrorKind::InvalidArgument:
            return "invalid argument";
    }
    return "unknown error";
}

auto SeriesError::format() const -> std::string {
    if (index.has_value()) {
        return fmt::format("{}: {} (index {}, value \"{}\")", to_string(kind), message, *index,
                           value);
    }
    return fmt::format("{}: {}", to_string(kind), message);
}

auto wrong_column_type(std::string_view operation, std::string_view expected) -> SeriesError {
    return SeriesError{
        .kind = ErrorKind::WrongColumnType,
        .message = fmt::format("{} requires a {} series", operation, expected),
    };
}

auto empty_series(std::string_view operation) -> SeriesError {
    return SeriesError{
        .kind = ErrorKind::EmptySeries,
        .message = fmt::format("{} requires a non-empty series", operation),
    };
}

auto parse_failure(std::size_t index, std::string value) -> SeriesError {
    return SeriesError{
        .kind = ErrorKind::ParseFailure,
        .message = "value is not numeric",
        .index = index,
        .value = std::move(value),
    };
}

auto invalid_argument(std::string message) -> SeriesError {
    return SeriesError{.kind = ErrorKind::InvalidArgument, .message = std::move(message)};
}

}  // namespace kodiak
