// ort_bridge/extract.hpp
// Output extraction: OrtValue -> typed, shaped data
//
// Two paths, chosen by element type at compile time:
//
// - Numeric (extract_primitive): one GetTensorMutableData call, then a
//   BorrowedView over the runtime's own buffer. No copy. The view holds a
//   TensorHandle, so the buffer lives at least as long as the view.
//
// - String (extract_strings): ORT stores string tensors as one byte arena
//   plus an offset table. Query the arena length, fill arena and offsets in
//   one call, close the last string with the total length, slice, validate
//   UTF-8. The result owns its strings and no longer needs the handle.
//
// TensorData<T> is the tagged result. Its alternatives can only be built
// here.

#pragma once

#include <concepts>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

#include <onnxruntime_c_api.h>

#include "ort_bridge/element_type.hpp"
#include "ort_bridge/error.hpp"
#include "ort_bridge/format.hpp"
#include "ort_bridge/log.hpp"
#include "ort_bridge/ndarray.hpp"
#include "ort_bridge/status.hpp"
#include "ort_bridge/tensor_handle.hpp"
#include "ort_bridge/utf8.hpp"

namespace ort_bridge {

/// Element types that can be read back out of a runtime tensor.
template<class T>
concept Extractable = TensorScalar<T> || std::same_as<T, std::string>;

namespace detail { struct Extractor; }

// ============================================================================
// BorrowedView - zero-copy window into a runtime tensor
// ============================================================================

template<TensorScalar T>
class BorrowedView {
public:
    using value_type = T;
    using iterator = const T*;

    [[nodiscard]] const Shape& shape() const noexcept { return array_.shape(); }
    [[nodiscard]] std::size_t rank() const noexcept { return array_.rank(); }
    [[nodiscard]] std::size_t size() const noexcept { return array_.size(); }
    [[nodiscard]] bool empty() const noexcept { return array_.empty(); }
    [[nodiscard]] const T* data() const noexcept { return array_.data(); }

    [[nodiscard]] const T& operator[](std::size_t i) const noexcept { return array_[i]; }
    [[nodiscard]] const T& at(std::size_t i) const { return array_.at(i); }

    template<class... Idx>
    [[nodiscard]] const T& operator()(Idx... idx) const { return array_(idx...); }

    [[nodiscard]] iterator begin() const noexcept { return array_.begin(); }
    [[nodiscard]] iterator end() const noexcept { return array_.end(); }

    /// The shaped view. Valid while this BorrowedView (or a copy) lives.
    [[nodiscard]] const ArrayView<const T>& array() const noexcept { return array_; }

    /// The tensor this view keeps alive
    [[nodiscard]] const TensorHandle& handle() const noexcept { return handle_; }

    [[nodiscard]] std::vector<T> to_vector() const { return array_.to_vector(); }

private:
    friend struct detail::Extractor;

    BorrowedView(TensorHandle handle, ArrayView<const T> array) noexcept
        : handle_(std::move(handle))
        , array_(std::move(array))
    {}

    TensorHandle handle_;  // destroyed after array_
    ArrayView<const T> array_;
};

// ============================================================================
// TensorData - borrowed view | owned strings
// ============================================================================

namespace detail {

template<class T>
struct borrowed_alternative { using type = std::monostate; };

template<TensorScalar T>
struct borrowed_alternative<T> { using type = BorrowedView<T>; };

} // namespace detail

template<Extractable T>
class TensorData {
public:
    using borrowed_type = typename detail::borrowed_alternative<T>::type;
    using owned_type = Array<T>;

    [[nodiscard]] bool is_borrowed() const noexcept { return data_.index() == 0; }
    [[nodiscard]] bool is_owned() const noexcept { return data_.index() == 1; }

    /// @throws std::bad_variant_access if this holds owned data
    [[nodiscard]] const borrowed_type& borrowed() const
        requires TensorScalar<T>
    {
        return std::get<0>(data_);
    }

    /// @throws std::bad_variant_access if this holds a borrowed view
    [[nodiscard]] const owned_type& owned() const { return std::get<1>(data_); }

    /// Shaped view of either alternative. Valid while this TensorData lives,
    /// so it cannot be taken from a temporary.
    [[nodiscard]] ArrayView<const T> view() const& {
        if constexpr (TensorScalar<T>) {
            if (is_borrowed()) return borrowed().array();
        }
        return owned().view();
    }
    ArrayView<const T> view() const&& = delete;

    [[nodiscard]] const Shape& shape() const {
        if constexpr (TensorScalar<T>) {
            if (is_borrowed()) return borrowed().shape();
        }
        return owned().shape();
    }

    [[nodiscard]] std::size_t size() const {
        if constexpr (TensorScalar<T>) {
            if (is_borrowed()) return borrowed().size();
        }
        return owned().size();
    }

private:
    friend struct detail::Extractor;

    explicit TensorData(std::variant<borrowed_type, owned_type> data) noexcept
        : data_(std::move(data)) {}

    std::variant<borrowed_type, owned_type> data_;
};

// ============================================================================
// Extraction protocol
// ============================================================================

namespace detail {

struct Extractor {
    static void require_handle_(const TensorHandle& handle, const char* fn) {
        if (!handle) {
            throw Error::InvalidArgument(fn, "empty TensorHandle");
        }
    }

    template<TensorScalar T>
    [[nodiscard]] static TensorData<T> primitive(Shape shape, TensorHandle handle) {
        require_handle_(handle, "extract_primitive");
        const OrtApi& api = handle.api();

        const std::size_t count = checked_product(shape, "extract_primitive");

        void* raw = nullptr;
        check_status(api, api.GetTensorMutableData(handle.get(), &raw), "GetTensorMutableData");
        // An empty tensor may legitimately have no buffer.
        if (raw == nullptr && count != 0) {
            log_error("GetTensorMutableData reported success with a null data pointer");
            throw ContractViolation("GetTensorMutableData",
                                    "reported success but returned a null data pointer");
        }

        if (log_enabled(VerbosityLevel::Debug)) {
            log_debug(format("borrowing {} x {} from tensor {}",
                             count, element_type_name(element_type_v<T>),
                             static_cast<const void*>(handle.get())));
        }

        ArrayView<const T> array(std::move(shape),
                                 std::span<const T>(static_cast<const T*>(raw), count));
        return TensorData<T>(BorrowedView<T>(std::move(handle), std::move(array)));
    }

    [[nodiscard]] static TensorData<std::string> strings(Shape shape,
                                                         std::size_t element_count,
                                                         const TensorHandle& handle) {
        require_handle_(handle, "extract_strings");
        const OrtApi& api = handle.api();

        const std::size_t shape_count = checked_product(shape, "extract_strings");
        if (shape_count != element_count) {
            throw Error::ShapeMismatch("extract_strings", shape_count, element_count);
        }

        // Phase 1: total bytes of all strings, no terminators
        std::size_t total_length = 0;
        check_status(api, api.GetStringTensorDataLength(handle.get(), &total_length),
                     "GetStringTensorDataLength");

        // Phase 2: exactly total_length bytes, plus one offset slot past the
        // end so every string (including the last) is [offsets[i], offsets[i+1]).
        if (element_count == static_cast<std::size_t>(-1)) {
            throw Error::InvalidArgument("extract_strings", "element count too large");
        }
        std::string content(total_length, '\0');
        std::vector<std::size_t> offsets(element_count + 1, 0);

        check_status(api,
                     api.GetStringTensorContent(handle.get(), content.data(), total_length,
                                                offsets.data(), element_count),
                     "GetStringTensorContent");

        // The runtime fills element_count slots; the sentinel must be untouched.
        if (offsets[element_count] != 0) {
            log_error("GetStringTensorContent wrote past the offset capacity it was given");
            throw ContractViolation("GetStringTensorContent",
                                    format("wrote offset slot {} beyond its capacity",
                                           element_count));
        }
        offsets[element_count] = total_length;

        if (log_enabled(VerbosityLevel::Debug)) {
            log_debug(format("decoding {} strings ({} bytes) from tensor {}",
                             element_count, total_length,
                             static_cast<const void*>(handle.get())));
        }

        const std::string_view arena(content);
        std::vector<std::string> values;
        values.reserve(element_count);

        for (std::size_t i = 0; i < element_count; ++i) {
            const std::size_t start = offsets[i];
            const std::size_t next = offsets[i + 1];
            if (start > next || next > total_length) {
                log_error("GetStringTensorContent returned offsets outside the byte buffer");
                throw ContractViolation("GetStringTensorContent",
                                        format("string {} spans [{}, {}) of a {}-byte buffer",
                                               i, start, next, total_length));
            }

            const std::string_view slice = arena.substr(start, next - start);
            if (const auto bad = validate_utf8(slice)) {
                throw Error::Utf8("extract_strings", i, start + bad->offset, bad->reason);
            }
            values.emplace_back(slice);
        }

        return TensorData<std::string>(
            Array<std::string>::from_shape_vec(std::move(shape), std::move(values)));
    }
};

} // namespace detail

/// Borrow the numeric buffer of `handle` as a `shape`d view. No copy.
/// @throws Error (NativeCall "GetTensorMutableData") if the runtime fails
/// @throws ContractViolation if the runtime returns a null buffer for a
///         non-empty tensor
template<TensorScalar T>
[[nodiscard]] TensorData<T> extract_primitive(Shape shape, TensorHandle handle) {
    return detail::Extractor::primitive<T>(std::move(shape), std::move(handle));
}

/// Copy and decode the `element_count` strings of `handle` into a `shape`d
/// array. All or nothing: one bad string fails the whole extraction.
/// @throws Error (NativeCall "GetStringTensorDataLength" / "GetStringTensorContent")
/// @throws Error (Utf8Decode) naming the string index and byte offset
/// @throws Error (ShapeMismatch) if shape and element_count disagree
/// @throws ContractViolation if the returned offsets do not fit the buffer
[[nodiscard]] inline TensorData<std::string> extract_strings(Shape shape,
                                                             std::size_t element_count,
                                                             const TensorHandle& handle) {
    return detail::Extractor::strings(std::move(shape), element_count, handle);
}

/// Dispatch on T: numbers borrow, std::string copies.
template<Extractable T>
[[nodiscard]] TensorData<T> extract_data(Shape shape,
                                         std::size_t element_count,
                                         TensorHandle handle) {
    if constexpr (TensorScalar<T>) {
        const std::size_t shape_count = detail::checked_product(shape, "extract_data");
        if (shape_count != element_count) {
            throw Error::ShapeMismatch("extract_data", shape_count, element_count);
        }
        return extract_primitive<T>(std::move(shape), std::move(handle));
    } else {
        return extract_strings(std::move(shape), element_count, handle);
    }
}

} // namespace ort_bridge
