// ort_bridge/owned_tensor.hpp
// Result containers handed back to callers
//
// - OwnedTensor<T>: statically typed. The caller already knows the element
//   type and shape (e.g. from model metadata) and extracts directly.
// - DynTensor: dynamically typed. Built from a bare OrtValue*, it asks the
//   runtime for element type and shape, then hands out OwnedTensor<T> for
//   the one T that matches.
//
// Both keep the TensorHandle alive for as long as any numeric view of the
// data exists.

#pragma once

#include <climits>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

#include <onnxruntime_c_api.h>

#include "ort_bridge/detail/ort_ptr.hpp"
#include "ort_bridge/element_type.hpp"
#include "ort_bridge/error.hpp"
#include "ort_bridge/extract.hpp"
#include "ort_bridge/format.hpp"
#include "ort_bridge/log.hpp"
#include "ort_bridge/ndarray.hpp"
#include "ort_bridge/status.hpp"
#include "ort_bridge/tensor_handle.hpp"

namespace ort_bridge {

// ============================================================================
// OwnedTensor - statically typed result
// ============================================================================

template<Extractable T>
class OwnedTensor {
public:
    using value_type = T;

    explicit OwnedTensor(TensorData<T> data) noexcept : data_(std::move(data)) {}

    /// Extract `handle` as T. See extract_data() for what can be thrown.
    [[nodiscard]] static OwnedTensor extract(Shape shape,
                                             std::size_t element_count,
                                             TensorHandle handle) {
        return OwnedTensor(extract_data<T>(std::move(shape), element_count, std::move(handle)));
    }

    [[nodiscard]] static constexpr ElementType element_type() noexcept { return element_type_v<T>; }

    [[nodiscard]] const TensorData<T>& data() const noexcept { return data_; }
    [[nodiscard]] bool is_borrowed() const noexcept { return data_.is_borrowed(); }
    [[nodiscard]] const Shape& shape() const { return data_.shape(); }
    [[nodiscard]] std::size_t size() const { return data_.size(); }

    /// Shaped view of the elements. Valid while this OwnedTensor lives, so
    /// it cannot be taken from a temporary.
    [[nodiscard]] ArrayView<const T> view() const& { return data_.view(); }
    ArrayView<const T> view() const&& = delete;

    /// The decoded strings
    [[nodiscard]] const Array<std::string>& strings() const
        requires std::same_as<T, std::string>
    {
        return data_.owned();
    }

    /// The tensor a numeric view borrows from
    [[nodiscard]] const TensorHandle& handle() const
        requires TensorScalar<T>
    {
        return data_.borrowed().handle();
    }

    [[nodiscard]] std::vector<T> to_vector() const { return view().to_vector(); }

private:
    TensorData<T> data_;
};

// ============================================================================
// DynTensor - dynamically typed result
// ============================================================================

class DynTensor {
public:
    /// Take ownership of `value` and describe it. The value is owned from the
    /// moment of the call: if describing it fails, it is released.
    /// @throws Error (NativeCall) if a type/shape query fails
    /// @throws Error (UnsupportedType) for bool, float16, ... tensors
    [[nodiscard]] static DynTensor from_value(const OrtApi& api, OrtValue* value) {
        return from_handle(TensorHandle::adopt(api, value));
    }

    /// Describe an already adopted tensor.
    [[nodiscard]] static DynTensor from_handle(TensorHandle handle) {
        if (!handle) {
            throw Error::InvalidArgument("DynTensor::from_handle", "empty TensorHandle");
        }
        const OrtApi& api = handle.api();

        OrtTensorTypeAndShapeInfo* raw_info = nullptr;
        check_status(api, api.GetTensorTypeAndShape(handle.get(), &raw_info),
                     "GetTensorTypeAndShape");
        auto info = detail::own_type_info(api, raw_info);

        ONNXTensorElementDataType native = ONNX_TENSOR_ELEMENT_DATA_TYPE_UNDEFINED;
        check_status(api, api.GetTensorElementType(info.get(), &native), "GetTensorElementType");

        std::size_t rank = 0;
        check_status(api, api.GetDimensionsCount(info.get(), &rank), "GetDimensionsCount");

        Shape shape(rank);
        check_status(api, api.GetDimensions(info.get(), shape.data(), rank), "GetDimensions");

        std::size_t count = 0;
        check_status(api, api.GetTensorShapeElementCount(info.get(), &count),
                     "GetTensorShapeElementCount");
        info.reset();

        const ElementType type = require_supported(native, "DynTensor::from_handle");

        if (log_enabled(VerbosityLevel::Debug)) {
            log_debug(detail::format("tensor {}: {} rank {} with {} elements",
                                     static_cast<const void*>(handle.get()),
                                     element_type_name(type), rank, count));
        }
        return DynTensor(std::move(handle), type, std::move(shape), count);
    }

    /// Number of elements in an ORT sequence value.
    /// @throws Error (InvalidArgument) if `sequence` is not a sequence
    [[nodiscard]] static std::size_t sequence_length(const TensorHandle& sequence) {
        require_sequence_(sequence, "DynTensor::sequence_length");
        const OrtApi& api = sequence.api();

        std::size_t n = 0;
        check_status(api, api.GetValueCount(sequence.get(), &n), "GetValueCount");
        return n;
    }

    /// Tensor `index` of an ORT sequence value. The element keeps the
    /// sequence alive; each is released once, the sequence after its last
    /// element.
    [[nodiscard]] static DynTensor from_sequence_element(const TensorHandle& sequence,
                                                         std::size_t index) {
        const std::size_t n = sequence_length(sequence);
        if (index >= n || index > static_cast<std::size_t>(INT_MAX)) {
            throw Error::InvalidArgument("DynTensor::from_sequence_element",
                detail::format("index {} out of range for a sequence of {}", index, n));
        }
        const OrtApi& api = sequence.api();

        OrtAllocator* allocator = nullptr;
        check_status(api, api.GetAllocatorWithDefaultOptions(&allocator),
                     "GetAllocatorWithDefaultOptions");

        OrtValue* element = nullptr;
        check_status(api,
                     api.GetValue(sequence.get(), static_cast<int>(index), allocator, &element),
                     "GetValue");

        return from_handle(TensorHandle::adopt_element(api, element, sequence));
    }

    [[nodiscard]] ElementType element_type() const noexcept { return type_; }
    [[nodiscard]] const Shape& shape() const noexcept { return shape_; }
    [[nodiscard]] std::size_t rank() const noexcept { return shape_.size(); }
    [[nodiscard]] std::size_t element_count() const noexcept { return element_count_; }
    [[nodiscard]] const TensorHandle& handle() const noexcept { return handle_; }

    template<Extractable T>
    [[nodiscard]] bool holds() const noexcept { return element_type_v<T> == type_; }

    /// Extract as T. Numeric T borrows (the result shares this tensor's
    /// handle); std::string copies.
    /// @throws Error (TypeMismatch) if T is not the tensor's element type
    template<Extractable T>
    [[nodiscard]] OwnedTensor<T> try_extract() const {
        if (!holds<T>()) {
            throw Error::TypeMismatch("DynTensor::try_extract",
                                      element_type_name(element_type_v<T>),
                                      element_type_name(type_));
        }
        return OwnedTensor<T>::extract(shape_, element_count_, handle_);
    }

private:
    DynTensor(TensorHandle handle, ElementType type, Shape shape, std::size_t count) noexcept
        : handle_(std::move(handle))
        , type_(type)
        , shape_(std::move(shape))
        , element_count_(count)
    {}

    static void require_sequence_(const TensorHandle& sequence, const char* fn) {
        if (!sequence) {
            throw Error::InvalidArgument(fn, "empty TensorHandle");
        }
        const OrtApi& api = sequence.api();
        ONNXType kind = ONNX_TYPE_UNKNOWN;
        check_status(api, api.GetValueType(sequence.get(), &kind), "GetValueType");
        if (kind != ONNX_TYPE_SEQUENCE) {
            throw Error::InvalidArgument(fn,
                detail::format("value is not a sequence (ONNXType {})", static_cast<int>(kind)));
        }
    }

    TensorHandle handle_;
    ElementType type_;
    Shape shape_;
    std::size_t element_count_;
};

} // namespace ort_bridge
