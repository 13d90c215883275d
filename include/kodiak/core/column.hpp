#pragma once

#include <concepts>
#include <cstddef>
#include <initializer_list>
#include <span>
#include <utility>
#include <vector>

namespace kodiak {

/// Concept constraining valid column element types.
template <typename T>
concept ColumnElement = std::regular<T> && std::totally_ordered<T>;

/// A typed, owning columnar storage container.
///
/// Column<T> owns a contiguous vector of homogeneously typed values and
/// exposes span-based access so parallel workers can address disjoint
/// index ranges of the same buffer without copying.
template <typename T>
class Column {
   public:
    using value_type = T;
    using size_type = std::size_t;

    static_assert(ColumnElement<T>,
                  "Column<T> requires T to satisfy ColumnElement (regular + totally ordered).");

    Column() = default;

    explicit Column(std::vector<T> data) : data_(std::move(data)) {}

    Column(std::initializer_list<T> init) : data_(init) {}

    /// Number of elements.
    [[nodiscard]] auto size() const noexcept -> size_type { return data_.size(); }

    /// Whether the column is empty.
    [[nodiscard]] auto empty() const noexcept -> bool { return data_.empty(); }

    /// Immutable element access (bounds-checked).
    [[nodiscard]] auto at(size_type idx) const -> const T& { return data_.at(idx); }

    /// Unchecked element access.
    [[nodiscard]] auto operator[](size_type idx) const noexcept -> const T& { return data_[idx]; }

    /// Unchecked mutable element access.
    [[nodiscard]] auto operator[](size_type idx) noexcept -> T& { return data_[idx]; }

    /// Zero-copy immutable view of the underlying data.
    [[nodiscard]] auto span() const noexcept -> std::span<const T> { return data_; }

    /// Raw data access.
    [[nodiscard]] auto data() const noexcept -> const T* { return data_.data(); }

    /// Copy of the elements at the given positions, in the order given.
    [[nodiscard]] auto gather(std::span<const std::size_t> positions) const -> Column<T> {
        std::vector<T> result;
        result.reserve(positions.size());
        for (auto pos : positions) {
            result.push_back(data_.at(pos));
        }
        return Column<T>{std::move(result)};
    }

    auto operator==(const Column&) const -> bool = default;

    // Iterator support
    [[nodiscard]] auto begin() const noexcept { return data_.cbegin(); }
    [[nodiscard]] auto end() const noexcept { return data_.cend(); }

   private:
    std::vector<T> data_;
};

}  // namespace kodiak
