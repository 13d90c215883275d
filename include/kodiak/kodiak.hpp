#pragma once

/// Convenience umbrella header for the Kodiak library.

#include <kodiak/core/column.hpp>
#include <kodiak/core/error.hpp>
#include <kodiak/core/series.hpp>
#include <kodiak/parallel/config.hpp>
#include <kodiak/parallel/fan_out.hpp>
#include <kodiak/parallel/partition.hpp>
#include <kodiak/runtime/convert.hpp>
#include <kodiak/runtime/filter.hpp>
#include <kodiak/runtime/order_stats.hpp>
#include <kodiak/runtime/query.hpp>
#include <kodiak/runtime/reduce.hpp>
#include <kodiak/runtime/text.hpp>
