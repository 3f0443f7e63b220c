// ort_bridge/element_type.hpp
// Element type registry and C++ type -> element type mapping
//
// ElementType is the closed set of tensor element kinds the bridge can move
// across the ABI. Every kind has exactly one ONNXTensorElementDataType and
// the mapping is a bijection on this subset. Native kinds outside it (bool,
// float16, bfloat16, complex, float8, int4) are rejected, never coerced.
//
// Two disjoint families of C++ types map onto it:
// - TensorScalar: fixed-width numbers, one specialization each
// - TextLike:     anything string-shaped, always ElementType::String

#pragma once

#include <array>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <source_location>
#include <string>
#include <string_view>
#include <type_traits>

#include <onnxruntime_c_api.h>

#include "ort_bridge/error.hpp"

namespace ort_bridge {

// ============================================================================
// ElementType - the registry
// ============================================================================

enum class ElementType {
    Float32 = ONNX_TENSOR_ELEMENT_DATA_TYPE_FLOAT,
    Uint8   = ONNX_TENSOR_ELEMENT_DATA_TYPE_UINT8,
    Int8    = ONNX_TENSOR_ELEMENT_DATA_TYPE_INT8,
    Uint16  = ONNX_TENSOR_ELEMENT_DATA_TYPE_UINT16,
    Int16   = ONNX_TENSOR_ELEMENT_DATA_TYPE_INT16,
    Int32   = ONNX_TENSOR_ELEMENT_DATA_TYPE_INT32,
    Int64   = ONNX_TENSOR_ELEMENT_DATA_TYPE_INT64,
    String  = ONNX_TENSOR_ELEMENT_DATA_TYPE_STRING,
    Float64 = ONNX_TENSOR_ELEMENT_DATA_TYPE_DOUBLE,
    Uint32  = ONNX_TENSOR_ELEMENT_DATA_TYPE_UINT32,
    Uint64  = ONNX_TENSOR_ELEMENT_DATA_TYPE_UINT64,
};

inline constexpr std::array<ElementType, 11> all_element_types{
    ElementType::Float32, ElementType::Uint8,  ElementType::Int8,
    ElementType::Uint16,  ElementType::Int16,  ElementType::Int32,
    ElementType::Int64,   ElementType::String, ElementType::Float64,
    ElementType::Uint32,  ElementType::Uint64,
};

/// Native enumeration value for a supported element type.
[[nodiscard]] constexpr ONNXTensorElementDataType to_native(ElementType type) noexcept {
    switch (type) {
        case ElementType::Float32: return ONNX_TENSOR_ELEMENT_DATA_TYPE_FLOAT;
        case ElementType::Uint8:   return ONNX_TENSOR_ELEMENT_DATA_TYPE_UINT8;
        case ElementType::Int8:    return ONNX_TENSOR_ELEMENT_DATA_TYPE_INT8;
        case ElementType::Uint16:  return ONNX_TENSOR_ELEMENT_DATA_TYPE_UINT16;
        case ElementType::Int16:   return ONNX_TENSOR_ELEMENT_DATA_TYPE_INT16;
        case ElementType::Int32:   return ONNX_TENSOR_ELEMENT_DATA_TYPE_INT32;
        case ElementType::Int64:   return ONNX_TENSOR_ELEMENT_DATA_TYPE_INT64;
        case ElementType::String:  return ONNX_TENSOR_ELEMENT_DATA_TYPE_STRING;
        case ElementType::Float64: return ONNX_TENSOR_ELEMENT_DATA_TYPE_DOUBLE;
        case ElementType::Uint32:  return ONNX_TENSOR_ELEMENT_DATA_TYPE_UINT32;
        case ElementType::Uint64:  return ONNX_TENSOR_ELEMENT_DATA_TYPE_UINT64;
    }
    return ONNX_TENSOR_ELEMENT_DATA_TYPE_UNDEFINED;
}

/// Supported element type for a native enumeration value, or nullopt.
/// Keep this switch and to_native() in lockstep.
[[nodiscard]] constexpr std::optional<ElementType>
from_native(ONNXTensorElementDataType native) noexcept {
    switch (native) {
        case ONNX_TENSOR_ELEMENT_DATA_TYPE_FLOAT:  return ElementType::Float32;
        case ONNX_TENSOR_ELEMENT_DATA_TYPE_UINT8:  return ElementType::Uint8;
        case ONNX_TENSOR_ELEMENT_DATA_TYPE_INT8:   return ElementType::Int8;
        case ONNX_TENSOR_ELEMENT_DATA_TYPE_UINT16: return ElementType::Uint16;
        case ONNX_TENSOR_ELEMENT_DATA_TYPE_INT16:  return ElementType::Int16;
        case ONNX_TENSOR_ELEMENT_DATA_TYPE_INT32:  return ElementType::Int32;
        case ONNX_TENSOR_ELEMENT_DATA_TYPE_INT64:  return ElementType::Int64;
        case ONNX_TENSOR_ELEMENT_DATA_TYPE_STRING: return ElementType::String;
        case ONNX_TENSOR_ELEMENT_DATA_TYPE_DOUBLE: return ElementType::Float64;
        case ONNX_TENSOR_ELEMENT_DATA_TYPE_UINT32: return ElementType::Uint32;
        case ONNX_TENSOR_ELEMENT_DATA_TYPE_UINT64: return ElementType::Uint64;
        default:                                   return std::nullopt;
    }
}

/// Get human-readable name for an ElementType
[[nodiscard]] constexpr const char* element_type_name(ElementType type) noexcept {
    switch (type) {
        case ElementType::Float32: return "float32";
        case ElementType::Uint8:   return "uint8";
        case ElementType::Int8:    return "int8";
        case ElementType::Uint16:  return "uint16";
        case ElementType::Int16:   return "int16";
        case ElementType::Int32:   return "int32";
        case ElementType::Int64:   return "int64";
        case ElementType::String:  return "string";
        case ElementType::Float64: return "float64";
        case ElementType::Uint32:  return "uint32";
        case ElementType::Uint64:  return "uint64";
    }
    return "unknown";
}

/// Get human-readable name for any native element type, supported or not
[[nodiscard]] constexpr const char* native_type_name(ONNXTensorElementDataType native) noexcept {
    switch (native) {
        case ONNX_TENSOR_ELEMENT_DATA_TYPE_UNDEFINED:  return "undefined";
        case ONNX_TENSOR_ELEMENT_DATA_TYPE_BOOL:       return "bool";
        case ONNX_TENSOR_ELEMENT_DATA_TYPE_FLOAT16:    return "float16";
        case ONNX_TENSOR_ELEMENT_DATA_TYPE_COMPLEX64:  return "complex64";
        case ONNX_TENSOR_ELEMENT_DATA_TYPE_COMPLEX128: return "complex128";
        case ONNX_TENSOR_ELEMENT_DATA_TYPE_BFLOAT16:   return "bfloat16";
        default: break;
    }
    if (const auto t = from_native(native)) {
        return element_type_name(*t);
    }
    return "unknown";
}

/// Size of one element in bytes; 0 for variable-length String
[[nodiscard]] constexpr std::size_t element_size(ElementType type) noexcept {
    switch (type) {
        case ElementType::Uint8:
        case ElementType::Int8:    return 1;
        case ElementType::Uint16:
        case ElementType::Int16:   return 2;
        case ElementType::Float32:
        case ElementType::Int32:
        case ElementType::Uint32:  return 4;
        case ElementType::Float64:
        case ElementType::Int64:
        case ElementType::Uint64:  return 8;
        case ElementType::String:  return 0;
    }
    return 0;
}

/// from_native() for callers that cannot continue without a supported type.
/// @throws Error (UnsupportedType)
[[nodiscard]] inline ElementType require_supported(
    ONNXTensorElementDataType native,
    std::string_view context = "require_supported",
    std::source_location loc = std::source_location::current())
{
    if (const auto t = from_native(native)) {
        return *t;
    }
    throw Error::UnsupportedType(context, native_type_name(native), static_cast<int>(native), loc);
}

// ============================================================================
// Type mapping: C++ type -> ElementType
// ============================================================================

/// Text family. A C++ type is textual when it decays to one of these.
template<class T>
concept TextLike =
    std::same_as<std::decay_t<T>, std::string>      ||
    std::same_as<std::decay_t<T>, std::string_view> ||
    std::same_as<std::decay_t<T>, const char*>      ||
    std::same_as<std::decay_t<T>, char*>;

/// Primary template: no mapping. Unsupported types (bool, char, void,
/// std::complex, ...) stay here and fail every concept below.
template<class T>
struct element_traits {};

/// Numeric family, one line per scalar type.
#define ORT_BRIDGE_NUMERIC_ELEMENT(CppType, Kind)                                   \
    static_assert(!TextLike<CppType>, #CppType " cannot be both numeric and text"); \
    template<>                                                                      \
    struct element_traits<CppType> {                                                \
        static constexpr ElementType type = ElementType::Kind;                      \
        static constexpr bool is_numeric = true;                                    \
    };

ORT_BRIDGE_NUMERIC_ELEMENT(float,         Float32)
ORT_BRIDGE_NUMERIC_ELEMENT(std::uint8_t,  Uint8)
ORT_BRIDGE_NUMERIC_ELEMENT(std::int8_t,   Int8)
ORT_BRIDGE_NUMERIC_ELEMENT(std::uint16_t, Uint16)
ORT_BRIDGE_NUMERIC_ELEMENT(std::int16_t,  Int16)
ORT_BRIDGE_NUMERIC_ELEMENT(std::int32_t,  Int32)
ORT_BRIDGE_NUMERIC_ELEMENT(std::int64_t,  Int64)
ORT_BRIDGE_NUMERIC_ELEMENT(double,        Float64)
ORT_BRIDGE_NUMERIC_ELEMENT(std::uint32_t, Uint32)
ORT_BRIDGE_NUMERIC_ELEMENT(std::uint64_t, Uint64)

#undef ORT_BRIDGE_NUMERIC_ELEMENT

/// Text family: every TextLike type maps to String.
template<TextLike T>
struct element_traits<T> {
    static constexpr ElementType type = ElementType::String;
    static constexpr bool is_numeric = false;
};

template<class T>
concept TensorScalar = requires {
    { element_traits<T>::type } -> std::convertible_to<ElementType>;
} && element_traits<T>::is_numeric;

template<class T>
concept TensorElement = TensorScalar<T> || TextLike<T>;

/// Get the ElementType for a C++ element type
template<TensorElement T>
[[nodiscard]] constexpr ElementType element_type_of() noexcept {
    return element_traits<T>::type;
}

/// Variable template for convenience
template<TensorElement T>
inline constexpr ElementType element_type_v = element_type_of<T>();

// ============================================================================
// Text capability probe
// ============================================================================

/// Numbers are never text.
template<TensorScalar T>
[[nodiscard]] constexpr std::optional<std::string_view> try_utf8_bytes(const T&) noexcept {
    return std::nullopt;
}

/// Text always yields its bytes. A null C string yields an empty view.
template<TextLike T>
[[nodiscard]] constexpr std::optional<std::string_view> try_utf8_bytes(const T& value) noexcept {
    if constexpr (std::is_pointer_v<T>) {
        if (value == nullptr) return std::string_view{};
    }
    return std::string_view(value);
}

// The two families must never overlap.
static_assert(!TensorScalar<std::string> && TextLike<std::string>);
static_assert(!TensorScalar<std::string_view> && TextLike<std::string_view>);
static_assert(!TensorScalar<const char*> && TextLike<const char*>);
static_assert(TensorScalar<float> && !TextLike<float>);
static_assert(TensorScalar<std::uint8_t> && !TextLike<std::uint8_t>);
static_assert(!TensorElement<bool>);
static_assert(!TensorElement<char>);

} // namespace ort_bridge
