// ort_bridge/ndarray.hpp
// Minimal shaped containers used as extraction results
//
// - ArrayView<T>: non-owning, row-major, shaped window over contiguous data
// - Array<T>:     owning counterpart (used for decoded strings)
//
// Only what extraction needs: shape, rank, flat and multi-index access,
// iteration. No reshaping or slicing arithmetic.

#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <limits>
#include <span>
#include <stdexcept>
#include <type_traits>
#include <utility>
#include <vector>

#include "ort_bridge/error.hpp"
#include "ort_bridge/format.hpp"

namespace ort_bridge {

using Shape = std::vector<std::int64_t>;

// ============================================================================
// Helpers
// ============================================================================

namespace detail {

/// Checked multiplication for size calculations - throws on overflow
[[nodiscard]] inline std::size_t checked_mul(std::size_t a, std::size_t b,
                                             const char* context = "size calculation") {
    if (a == 0 || b == 0) return 0;
    if (b > std::numeric_limits<std::size_t>::max() / a) {
        throw Error::InvalidArgument(context, format(
            "integer overflow: {} * {} exceeds size_t max", a, b));
    }
    return a * b;
}

/// Number of elements described by a shape. The empty shape is a scalar (1).
/// @throws Error (InvalidArgument) on a negative dimension or overflow
[[nodiscard]] inline std::size_t checked_product(std::span<const std::int64_t> dims,
                                                 const char* context = "shape calculation") {
    std::size_t result = 1;
    for (auto d : dims) {
        if (d < 0) {
            throw Error::InvalidArgument(context, format("negative dimension {}", d));
        }
        result = checked_mul(result, static_cast<std::size_t>(d), context);
    }
    return result;
}

/// Row-major flat offset of a multi-index.
[[nodiscard]] inline std::size_t flat_index(const Shape& shape,
                                            std::span<const std::size_t> index) {
    if (index.size() != shape.size()) {
        throw std::out_of_range(format(
            "index has rank {} but array has rank {}", index.size(), shape.size()));
    }
    std::size_t offset = 0;
    for (std::size_t axis = 0; axis < shape.size(); ++axis) {
        const auto extent = static_cast<std::size_t>(shape[axis]);
        if (index[axis] >= extent) {
            throw std::out_of_range(format(
                "index {} out of range for axis {} of extent {}", index[axis], axis, extent));
        }
        offset = offset * extent + index[axis];
    }
    return offset;
}

} // namespace detail

// ============================================================================
// ArrayView - shaped, non-owning
// ============================================================================

template<class T>
class ArrayView {
public:
    using element_type = T;
    using value_type = std::remove_cv_t<T>;
    using size_type = std::size_t;
    using pointer = T*;
    using reference = T&;
    using iterator = pointer;

    ArrayView() = default;

    /// @throws Error (ShapeMismatch) if the shape does not cover `data` exactly
    ArrayView(Shape shape, std::span<T> data)
        : shape_(std::move(shape))
        , span_(data)
    {
        const std::size_t expected = detail::checked_product(shape_, "ArrayView");
        if (expected != span_.size()) {
            throw Error::ShapeMismatch("ArrayView", expected, span_.size());
        }
    }

    [[nodiscard]] const Shape& shape() const noexcept { return shape_; }
    [[nodiscard]] std::size_t rank() const noexcept { return shape_.size(); }
    [[nodiscard]] size_type size() const noexcept { return span_.size(); }
    [[nodiscard]] bool empty() const noexcept { return span_.empty(); }
    [[nodiscard]] pointer data() const noexcept { return span_.data(); }

    /// Flat (row-major) access
    [[nodiscard]] reference operator[](size_type i) const noexcept { return span_[i]; }

    [[nodiscard]] reference at(size_type i) const {
        if (i >= size()) {
            throw std::out_of_range("ArrayView::at: index out of range");
        }
        return span_[i];
    }

    /// Multi-index access, one index per axis
    template<class... Idx>
    [[nodiscard]] reference operator()(Idx... idx) const {
        const std::array<std::size_t, sizeof...(Idx)> index{static_cast<std::size_t>(idx)...};
        return span_[detail::flat_index(shape_, index)];
    }

    [[nodiscard]] reference at(std::initializer_list<std::size_t> index) const {
        return span_[detail::flat_index(shape_, std::span<const std::size_t>(index.begin(), index.size()))];
    }

    [[nodiscard]] iterator begin() const noexcept { return span_.data(); }
    [[nodiscard]] iterator end() const noexcept { return span_.data() + span_.size(); }

    /// Copy the elements out (row-major)
    [[nodiscard]] std::vector<value_type> to_vector() const {
        return std::vector<value_type>(begin(), end());
    }

private:
    Shape shape_;
    std::span<T> span_;
};

// ============================================================================
// Array - shaped, owning
// ============================================================================

template<class T>
class Array {
public:
    using value_type = T;
    using size_type = std::size_t;
    using const_iterator = typename std::vector<T>::const_iterator;

    Array() = default;

    /// @throws Error (ShapeMismatch) if the shape does not cover `values` exactly
    [[nodiscard]] static Array from_shape_vec(Shape shape, std::vector<T> values) {
        const std::size_t expected = detail::checked_product(shape, "Array::from_shape_vec");
        if (expected != values.size()) {
            throw Error::ShapeMismatch("Array::from_shape_vec", expected, values.size());
        }
        Array a;
        a.shape_ = std::move(shape);
        a.values_ = std::move(values);
        return a;
    }

    [[nodiscard]] const Shape& shape() const noexcept { return shape_; }
    [[nodiscard]] std::size_t rank() const noexcept { return shape_.size(); }
    [[nodiscard]] size_type size() const noexcept { return values_.size(); }
    [[nodiscard]] bool empty() const noexcept { return values_.empty(); }

    [[nodiscard]] const T& operator[](size_type i) const noexcept { return values_[i]; }
    [[nodiscard]] const T& at(size_type i) const { return values_.at(i); }

    template<class... Idx>
    [[nodiscard]] const T& operator()(Idx... idx) const {
        const std::array<std::size_t, sizeof...(Idx)> index{static_cast<std::size_t>(idx)...};
        return values_[detail::flat_index(shape_, index)];
    }

    [[nodiscard]] const T& at(std::initializer_list<std::size_t> index) const {
        return values_[detail::flat_index(shape_, std::span<const std::size_t>(index.begin(), index.size()))];
    }

    [[nodiscard]] const_iterator begin() const noexcept { return values_.begin(); }
    [[nodiscard]] const_iterator end() const noexcept { return values_.end(); }

    [[nodiscard]] ArrayView<const T> view() const {
        return ArrayView<const T>(shape_, std::span<const T>(values_));
    }

    [[nodiscard]] const std::vector<T>& values() const noexcept { return values_; }

    /// Give up the elements (row-major); leaves this array empty
    [[nodiscard]] std::vector<T> into_vector() && {
        shape_ = Shape{0};
        return std::move(values_);
    }

private:
    Shape shape_;
    std::vector<T> values_;
};

} // namespace ort_bridge
