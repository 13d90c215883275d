#include <kodiak/core/series.hpp>

namespace kodiak {

// Explicit instantiations for the two element types a Series can hold.
template class Column<double>;
template class Column<std::string>;

auto to_string(SeriesKind kind) -> std::string_view {
    switch (kind) {
        case SeriesKind::Float:
            return "float";
        case SeriesKind::String:
            return "string";
    }
    return "unknown";
}

auto Series::floats(std::vector<double> values, std::string name) -> Series {
    return Series{FloatColumn{std::move(values)}, std::move(name)};
}

auto Series::strings(std::vector<std::string> values, std::string name) -> Series {
    return Series{StringColumn{std::move(values)}, std::move(name)};
}

auto Series::size() const noexcept -> std::size_t {
    return std::visit([](const auto& column) { return column.size(); }, data_);
}

}  // namespace kodiak
