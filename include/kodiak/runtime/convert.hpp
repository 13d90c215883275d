#pragma once

#include <kodiak/core/error.hpp>
#include <kodiak/core/series.hpp>
#include <kodiak/parallel/config.hpp>

#include <optional>
#include <string>
#include <string_view>

namespace kodiak::runtime {

using parallel::ExecConfig;

/// Parse the whole of `text` as a double: decimal or exponent notation,
/// `inf`, `nan`, with an optional leading sign. Returns nullopt for empty
/// text, surrounding whitespace or trailing characters.
[[nodiscard]] auto parse_number(std::string_view text) -> std::optional<double>;

/// Shortest plain decimal text that parses back to exactly `value`
/// (2.0 -> "2", 1e16 -> "10000000000000000"). Never uses exponent notation.
[[nodiscard]] auto format_number(double value) -> std::string;

/// Convert a textual series to numeric, all or nothing.
///
/// Every worker parses its chunk into a private buffer; the buffers are
/// installed only when all chunks succeed. On failure the series is left
/// unchanged and the error is a ParseFailure naming the lowest failing
/// index. A numeric series is left as is.
[[nodiscard]] auto to_numeric(Series& series, const ExecConfig& config = {}) -> Result<void>;

/// Convert a numeric series to text using format_number(). A textual series
/// is left as is.
void to_text(Series& series, const ExecConfig& config = {});

}  // namespace kodiak::runtime
