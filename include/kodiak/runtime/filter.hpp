#pragma once

#include <kodiak/core/series.hpp>
#include <kodiak/parallel/config.hpp>

#include <cstddef>
#include <functional>
#include <string>
#include <vector>

namespace kodiak::runtime {

using parallel::ExecConfig;

/// Ascending global row indexes.
using IndexSet = std::vector<std::size_t>;

using NumericPredicate = std::function<bool(double)>;
using TextPredicate = std::function<bool(const std::string&)>;

/// Keep the rows of a numeric series that satisfy `pred`.
///
/// Returns the matched indexes (positions before compaction) in ascending
/// order and leaves `series` holding only the matched values, in their
/// original relative order. The predicate is called concurrently from
/// several workers and must not mutate shared state.
///
/// Throws std::logic_error if `series` is textual; the series is untouched.
auto filter(Series& series, const NumericPredicate& pred, const ExecConfig& config = {})
    -> IndexSet;

/// Textual counterpart of filter(Series&, const NumericPredicate&).
///
/// Throws std::logic_error if `series` is numeric; the series is untouched.
auto filter(Series& series, const TextPredicate& pred, const ExecConfig& config = {})
    -> IndexSet;

/// Compact `series` down to the rows at `indexes` (ascending), building a
/// fresh sequence and swapping it in. Lets a table apply one filter result
/// to sibling columns.
///
/// Throws std::out_of_range if an index is past the end; the series is
/// untouched.
void take(Series& series, const IndexSet& indexes);

}  // namespace kodiak::runtime
