#pragma once

#include <kodiak/core/column.hpp>

#include <cstdint>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace kodiak {

enum class SeriesKind : std::uint8_t {
    Float,
    String,
};

[[nodiscard]] auto to_string(SeriesKind kind) -> std::string_view;

/// A single homogeneous column: either numeric or textual.
///
/// Exactly one representation is active at a time. Mutating operations
/// build a complete replacement sequence and install it with assign(),
/// which discards the previous sequence only after the swap.
class Series {
   public:
    using FloatColumn = Column<double>;
    using StringColumn = Column<std::string>;

    Series() = default;

    explicit Series(FloatColumn values, std::string name = {})
        : name_(std::move(name)), data_(std::move(values)) {}

    explicit Series(StringColumn values, std::string name = {})
        : name_(std::move(name)), data_(std::move(values)) {}

    [[nodiscard]] static auto floats(std::vector<double> values, std::string name = {}) -> Series;
    [[nodiscard]] static auto strings(std::vector<std::string> values, std::string name = {})
        -> Series;

    [[nodiscard]] auto kind() const noexcept -> SeriesKind {
        return std::holds_alternative<FloatColumn>(data_) ? SeriesKind::Float
                                                          : SeriesKind::String;
    }
    [[nodiscard]] auto is_float() const noexcept -> bool { return kind() == SeriesKind::Float; }
    [[nodiscard]] auto is_string() const noexcept -> bool { return kind() == SeriesKind::String; }

    /// Length of the active sequence.
    [[nodiscard]] auto size() const noexcept -> std::size_t;
    [[nodiscard]] auto empty() const noexcept -> bool { return size() == 0; }

    [[nodiscard]] auto name() const noexcept -> const std::string& { return name_; }

    /// Active numeric column. Throws std::bad_variant_access on a textual series.
    [[nodiscard]] auto float_column() const -> const FloatColumn& {
        return std::get<FloatColumn>(data_);
    }
    [[nodiscard]] auto float_column() -> FloatColumn& { return std::get<FloatColumn>(data_); }

    /// Active textual column. Throws std::bad_variant_access on a numeric series.
    [[nodiscard]] auto string_column() const -> const StringColumn& {
        return std::get<StringColumn>(data_);
    }
    [[nodiscard]] auto string_column() -> StringColumn& { return std::get<StringColumn>(data_); }

    [[nodiscard]] auto get_if_float() const noexcept -> const FloatColumn* {
        return std::get_if<FloatColumn>(&data_);
    }
    [[nodiscard]] auto get_if_string() const noexcept -> const StringColumn* {
        return std::get_if<StringColumn>(&data_);
    }

    /// Replace the backing sequence; the tag follows the column type.
    void assign(FloatColumn values) { data_ = std::move(values); }
    void assign(StringColumn values) { data_ = std::move(values); }

    auto operator==(const Series&) const -> bool = default;

   private:
    std::string name_;
    std::variant<FloatColumn, StringColumn> data_;
};

}  // namespace kodiak
