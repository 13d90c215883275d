#include <kodiak/runtime/reduce.hpp>

#include <cmath>
#include <limits>
#include <string_view>

namespace kodiak::runtime {

namespace {

/// Numeric view of `series`, or the error every reduction reports.
auto numeric_values(const Series& series, std::string_view operation)
    -> Result<std::span<const double>> {
    const auto* column = series.get_if_float();
    if (column == nullptr) {
        return std::unexpected(wrong_column_type(operation, "float"));
    }
    if (column->empty()) {
        return std::unexpected(empty_series(operation));
    }
    return column->span();
}

auto add(double acc, double value) -> double {
    return acc + value;
}

auto sum_of(std::span<const double> values, const ExecConfig& config) -> double {
    return reduce(values, 0.0, add, config);
}

auto variance_of(std::span<const double> values, double mean, const ExecConfig& config)
    -> double {
    double squared = map_reduce(
        values, 0.0,
        [mean](double acc, double value) {
            double diff = value - mean;
            return acc + diff * diff;
        },
        add, config);
    return squared / static_cast<double>(values.size());
}

}  // namespace

auto sum(const Series& series, const ExecConfig& config) -> Result<double> {
    auto values = numeric_values(series, "sum");
    if (!values) {
        return std::unexpected(values.error());
    }
    return sum_of(*values, config);
}

auto product(const Series& series, const ExecConfig& config) -> Result<double> {
    auto values = numeric_values(series, "product");
    if (!values) {
        return std::unexpected(values.error());
    }
    return reduce(*values, 1.0, [](double acc, double value) { return acc * value; }, config);
}

auto min(const Series& series, const ExecConfig& config) -> Result<double> {
    auto values = numeric_values(series, "min");
    if (!values) {
        return std::unexpected(values.error());
    }
    // NaN never compares less, so NaN elements are skipped.
    return reduce(
        *values, std::numeric_limits<double>::infinity(),
        [](double acc, double value) { return value < acc ? value : acc; }, config);
}

auto max(const Series& series, const ExecConfig& config) -> Result<double> {
    auto values = numeric_values(series, "max");
    if (!values) {
        return std::unexpected(values.error());
    }
    return reduce(
        *values, -std::numeric_limits<double>::infinity(),
        [](double acc, double value) { return value > acc ? value : acc; }, config);
}

auto mean(const Series& series, const ExecConfig& config) -> Result<double> {
    auto values = numeric_values(series, "mean");
    if (!values) {
        return std::unexpected(values.error());
    }
    return sum_of(*values, config) / static_cast<double>(values->size());
}

auto variance(const Series& series, const ExecConfig& config) -> Result<double> {
    auto values = numeric_values(series, "variance");
    if (!values) {
        return std::unexpected(values.error());
    }
    double mu = sum_of(*values, config) / static_cast<double>(values->size());
    return variance_of(*values, mu, config);
}

auto variance(const Series& series, double mean, const ExecConfig& config) -> Result<double> {
    auto values = numeric_values(series, "variance");
    if (!values) {
        return std::unexpected(values.error());
    }
    return variance_of(*values, mean, config);
}

auto std_dev(const Series& series, const ExecConfig& config) -> Result<double> {
    auto var = variance(series, config);
    if (!var) {
        return std::unexpected(var.error());
    }
    return std::sqrt(*var);
}

}  // namespace kodiak::runtime
