#pragma once

#include <kodiak/core/series.hpp>
#include <kodiak/parallel/config.hpp>

#include <string>
#include <string_view>

namespace kodiak::runtime {

using parallel::ExecConfig;

/// Replace every non-overlapping occurrence of `from` with `to` in each
/// element, in place. No-op on a numeric or empty series, or when `from`
/// is empty.
void replace(Series& series, std::string_view from, std::string_view to,
             const ExecConfig& config = {});

/// Like replace(), but only where `from` stands as a whole word (bounded
/// by \b on both sides). `from` and `to` are taken literally: `$1` or
/// `$name` in `to` is inserted as written, not expanded as a group
/// reference the way regex replacement templates usually are.
void replace_whole_word(Series& series, std::string_view from, std::string_view to,
                        const ExecConfig& config = {});

/// Escape regular-expression metacharacters so `text` matches literally.
[[nodiscard]] auto escape_regex(std::string_view text) -> std::string;

}  // namespace kodiak::runtime
