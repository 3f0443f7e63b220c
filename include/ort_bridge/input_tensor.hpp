// ort_bridge/input_tensor.hpp
// Runtime tensors built from caller data, for feeding a session
//
// Numeric data is not copied: the InputTensor takes the caller's vector and
// the OrtValue aliases its storage (CreateTensorWithDataAsOrtValue). The
// vector is kept in a heap block of its own, so moving the InputTensor never
// moves the bytes the runtime points at.
//
// String data is copied into a runtime-allocated string tensor
// (CreateTensorAsOrtValue + FillStringTensor). ORT takes C strings there, so
// a value containing a NUL byte cannot be represented and is rejected.
//
// Release order on destruction: OrtValue, then OrtMemoryInfo, then the
// caller's buffer.

#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <ranges>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <onnxruntime_c_api.h>

#include "ort_bridge/detail/ort_ptr.hpp"
#include "ort_bridge/element_type.hpp"
#include "ort_bridge/error.hpp"
#include "ort_bridge/format.hpp"
#include "ort_bridge/log.hpp"
#include "ort_bridge/ndarray.hpp"
#include "ort_bridge/status.hpp"

namespace ort_bridge {

/// Ranges whose elements are text (std::string, std::string_view, const char*).
template<class R>
concept TextRange = std::ranges::input_range<R> && TextLike<std::ranges::range_value_t<R>>;

class InputTensor {
public:
    InputTensor() = default;

    // Non-copyable
    InputTensor(const InputTensor&) = delete;
    InputTensor& operator=(const InputTensor&) = delete;

    // Movable
    InputTensor(InputTensor&& other) noexcept
        : buffer_(std::move(other.buffer_))
        , memory_info_(std::move(other.memory_info_))
        , value_(std::move(other.value_))
        , shape_(std::move(other.shape_))
        , type_(other.type_)
        , size_(std::exchange(other.size_, 0))
    {
        other.shape_.clear();
    }

    InputTensor& operator=(InputTensor&& other) noexcept {
        if (this != &other) {
            reset();
            buffer_ = std::move(other.buffer_);
            memory_info_ = std::move(other.memory_info_);
            value_ = std::move(other.value_);
            shape_ = std::move(other.shape_);
            type_ = other.type_;
            size_ = std::exchange(other.size_, 0);
            other.shape_.clear();
        }
        return *this;
    }

    ~InputTensor() = default;

    /// Release the tensor now (value, memory info, buffer, in that order).
    void reset() noexcept {
        value_.reset();
        memory_info_.reset();
        buffer_.reset();
        shape_.clear();
        size_ = 0;
    }

    /// Wrap `values` as a CPU tensor of `shape` without copying.
    /// @throws Error (InvalidArgument) on a negative dimension or overflow
    /// @throws Error (ShapeMismatch) if shape does not cover values exactly
    /// @throws Error (NativeCall) if the runtime refuses the tensor
    template<TensorScalar T>
    [[nodiscard]] static InputTensor from_array(const OrtApi& api,
                                                Shape shape,
                                                std::vector<T> values) {
        const std::size_t count = detail::checked_product(shape, "InputTensor::from_array");
        if (count != values.size()) {
            throw Error::ShapeMismatch("InputTensor::from_array", count, values.size());
        }
        const std::size_t bytes = detail::checked_mul(count, sizeof(T), "InputTensor::from_array");

        auto storage = std::make_shared<std::vector<T>>(std::move(values));

        OrtMemoryInfo* raw_info = nullptr;
        check_status(api, api.CreateCpuMemoryInfo(OrtArenaAllocator, OrtMemTypeDefault, &raw_info),
                     "CreateCpuMemoryInfo");
        auto memory_info = detail::own_memory_info(api, raw_info);

        OrtValue* raw_value = nullptr;
        check_status(api,
                     api.CreateTensorWithDataAsOrtValue(memory_info.get(), storage->data(), bytes,
                                                        shape.data(), shape.size(),
                                                        to_native(element_type_v<T>), &raw_value),
                     "CreateTensorWithDataAsOrtValue");

        InputTensor t;
        t.buffer_ = std::move(storage);
        t.memory_info_ = std::move(memory_info);
        t.value_ = detail::own_value(api, raw_value);
        t.shape_ = std::move(shape);
        t.type_ = element_type_v<T>;
        t.size_ = count;
        t.log_created_();
        return t;
    }

    /// Copy text `values` into a runtime string tensor of `shape`.
    /// @throws Error (InvalidArgument) on a negative dimension, overflow, or
    ///         a value containing a NUL byte
    /// @throws Error (ShapeMismatch) if shape does not cover values exactly
    /// @throws Error (NativeCall) if the runtime refuses the tensor
    template<TextRange R>
    [[nodiscard]] static InputTensor from_strings(const OrtApi& api,
                                                  Shape shape,
                                                  const R& values) {
        const std::size_t count = detail::checked_product(shape, "InputTensor::from_strings");

        std::vector<std::string> copies;
        if constexpr (std::ranges::sized_range<R>) {
            copies.reserve(std::ranges::size(values));
        }
        for (const auto& v : values) {
            const std::string_view bytes = *try_utf8_bytes(v);
            if (bytes.find('\0') != std::string_view::npos) {
                throw Error::InvalidArgument("InputTensor::from_strings",
                    detail::format("string {} contains a NUL byte", copies.size()));
            }
            copies.emplace_back(bytes);
        }
        if (count != copies.size()) {
            throw Error::ShapeMismatch("InputTensor::from_strings", count, copies.size());
        }

        std::vector<const char*> c_strings;
        c_strings.reserve(copies.size());
        for (const auto& s : copies) {
            c_strings.push_back(s.c_str());
        }

        OrtAllocator* allocator = nullptr;
        check_status(api, api.GetAllocatorWithDefaultOptions(&allocator),
                     "GetAllocatorWithDefaultOptions");

        OrtValue* raw_value = nullptr;
        check_status(api,
                     api.CreateTensorAsOrtValue(allocator, shape.data(), shape.size(),
                                                ONNX_TENSOR_ELEMENT_DATA_TYPE_STRING, &raw_value),
                     "CreateTensorAsOrtValue");
        auto value = detail::own_value(api, raw_value);

        check_status(api, api.FillStringTensor(value.get(), c_strings.data(), c_strings.size()),
                     "FillStringTensor");

        InputTensor t;
        t.value_ = std::move(value);
        t.shape_ = std::move(shape);
        t.type_ = ElementType::String;
        t.size_ = count;
        t.log_created_();
        return t;
    }

    /// The runtime tensor, still owned by this object. Null once moved from.
    [[nodiscard]] OrtValue* get() const noexcept { return value_.get(); }
    [[nodiscard]] bool valid() const noexcept { return value_ != nullptr; }

    [[nodiscard]] const Shape& shape() const noexcept { return shape_; }
    [[nodiscard]] ElementType element_type() const noexcept { return type_; }
    [[nodiscard]] std::size_t size() const noexcept { return size_; }

private:
    void log_created_() const {
        if (log_enabled(VerbosityLevel::Debug)) {
            log_debug(detail::format("input tensor {}: {} x {}{}",
                                     static_cast<const void*>(value_.get()), size_,
                                     element_type_name(type_),
                                     buffer_ ? " (caller buffer)" : ""));
        }
    }

    // Declaration order is release order, reversed.
    std::shared_ptr<void> buffer_;
    detail::MemoryInfoPtr memory_info_;
    detail::ValuePtr value_;
    Shape shape_;
    ElementType type_{ElementType::Float32};
    std::size_t size_{0};
};

} // namespace ort_bridge
