// ort_bridge/error.hpp
// Structured exception types for ort_bridge
//
// - Error: recoverable failures. Either an OrtStatus reported by the runtime
//   (source Runtime) or a check made by the bridge itself (source Bridge).
//   Derives from std::runtime_error so callers can catch it generically.
// - ContractViolation: the runtime broke its own contract (e.g. a successful
//   call that produced a null buffer). Deliberately NOT an Error.

#pragma once

#include <cstddef>
#include <source_location>
#include <stdexcept>
#include <string>
#include <string_view>

#include <onnxruntime_c_api.h>

#include "ort_bridge/codes.hpp"
#include "ort_bridge/format.hpp"

namespace ort_bridge {

enum class ErrorSource {
    Runtime,
    Bridge,
};

enum class ErrorKind {
    NativeCall,       // an OrtApi entry point returned a non-OK status
    UnsupportedType,  // element type outside the supported registry
    TypeMismatch,     // requested C++ type does not match the tensor
    Utf8Decode,       // string tensor content is not valid UTF-8
    ShapeMismatch,    // shape product disagrees with element count
    InvalidArgument,  // caller passed something unusable
};

[[nodiscard]] constexpr const char* kind_to_string(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::NativeCall:      return "native call";
        case ErrorKind::UnsupportedType: return "unsupported type";
        case ErrorKind::TypeMismatch:    return "type mismatch";
        case ErrorKind::Utf8Decode:      return "utf-8 decode";
        case ErrorKind::ShapeMismatch:   return "shape mismatch";
        case ErrorKind::InvalidArgument: return "invalid argument";
    }
    return "unknown";
}

class Error : public std::runtime_error {
public:
    static constexpr std::size_t npos = static_cast<std::size_t>(-1);

    Error(
        ErrorSource source,
        ErrorKind kind,
        OrtErrorCode code,
        std::string_view context,
        std::string_view message,
        std::size_t index = npos,
        std::size_t byte_offset = npos,
        std::source_location loc = std::source_location::current())
        : std::runtime_error(build_what_(source, code, context, message, loc))
        , source_(source)
        , kind_(kind)
        , code_(code)
        , context_(context)
        , index_(index)
        , byte_offset_(byte_offset)
        , loc_(loc)
    {}

    [[nodiscard]] ErrorSource source() const noexcept { return source_; }
    [[nodiscard]] ErrorKind kind() const noexcept { return kind_; }
    [[nodiscard]] OrtErrorCode code() const noexcept { return code_; }
    [[nodiscard]] const char* code_name() const noexcept { return code_to_string(code_); }

    /// Name of the failing native call, or the bridge operation.
    [[nodiscard]] std::string_view context() const noexcept { return context_; }

    /// Element index the error refers to, or npos.
    [[nodiscard]] std::size_t index() const noexcept { return index_; }

    /// Byte offset into string content the error refers to, or npos.
    [[nodiscard]] std::size_t byte_offset() const noexcept { return byte_offset_; }

    [[nodiscard]] std::source_location location() const noexcept { return loc_; }

    // Convenience factories

    /// Non-OK status returned by the OrtApi entry point `call`.
    [[nodiscard]] static Error Runtime(
        OrtErrorCode code,
        std::string_view call,
        std::string_view message,
        std::source_location loc = std::source_location::current())
    {
        return Error(ErrorSource::Runtime, ErrorKind::NativeCall, code, call, message,
                     npos, npos, loc);
    }

    [[nodiscard]] static Error Bridge(
        ErrorKind kind,
        std::string_view context,
        std::string_view message,
        std::source_location loc = std::source_location::current())
    {
        return Error(ErrorSource::Bridge, kind, ORT_INVALID_ARGUMENT, context, message,
                     npos, npos, loc);
    }

    [[nodiscard]] static Error UnsupportedType(
        std::string_view context,
        std::string_view native_name,
        int native_value,
        std::source_location loc = std::source_location::current())
    {
        return Error(ErrorSource::Bridge, ErrorKind::UnsupportedType, ORT_NOT_IMPLEMENTED,
                     context,
                     detail::format("element type {} ({}) is not supported",
                                    native_name, native_value),
                     npos, npos, loc);
    }

    [[nodiscard]] static Error TypeMismatch(
        std::string_view context,
        std::string_view requested,
        std::string_view actual,
        std::source_location loc = std::source_location::current())
    {
        return Error(ErrorSource::Bridge, ErrorKind::TypeMismatch, ORT_INVALID_ARGUMENT,
                     context,
                     detail::format("requested {} but tensor holds {}", requested, actual),
                     npos, npos, loc);
    }

    [[nodiscard]] static Error Utf8(
        std::string_view context,
        std::size_t index,
        std::size_t byte_offset,
        std::string_view reason,
        std::source_location loc = std::source_location::current())
    {
        return Error(ErrorSource::Bridge, ErrorKind::Utf8Decode, ORT_FAIL, context,
                     detail::format("string {} is not valid UTF-8 at byte {}: {}",
                                    index, byte_offset, reason),
                     index, byte_offset, loc);
    }

    [[nodiscard]] static Error ShapeMismatch(
        std::string_view context,
        std::size_t shape_elements,
        std::size_t actual_elements,
        std::source_location loc = std::source_location::current())
    {
        return Error(ErrorSource::Bridge, ErrorKind::ShapeMismatch, ORT_INVALID_ARGUMENT,
                     context,
                     detail::format("shape requires {} elements, got {}",
                                    shape_elements, actual_elements),
                     npos, npos, loc);
    }

    [[nodiscard]] static Error InvalidArgument(
        std::string_view context,
        std::string_view message,
        std::source_location loc = std::source_location::current())
    {
        return Bridge(ErrorKind::InvalidArgument, context, message, loc);
    }

private:
    ErrorSource source_{ErrorSource::Bridge};
    ErrorKind kind_{ErrorKind::InvalidArgument};
    OrtErrorCode code_{ORT_FAIL};
    std::string context_;
    std::size_t index_{npos};
    std::size_t byte_offset_{npos};
    std::source_location loc_{};

    static std::string build_what_(
        ErrorSource source,
        OrtErrorCode code,
        std::string_view context,
        std::string_view message,
        const std::source_location& loc)
    {
        const char* prefix = (source == ErrorSource::Runtime) ? "ORT" : "BRIDGE";

        if (context.empty()) {
            return detail::format(
                "[{}_{}] at {}:{} in {}: {}",
                prefix, code_to_string(code),
                loc.file_name(), loc.line(), loc.function_name(), message);
        }

        return detail::format(
            "[{}_{}] {} at {}:{} in {}: {}",
            prefix, code_to_string(code), context,
            loc.file_name(), loc.line(), loc.function_name(), message);
    }
};

/// The runtime reported success but left the bridge looking at memory whose
/// layout is unknown. There is no recovery; callers should let it propagate.
class ContractViolation : public std::logic_error {
public:
    ContractViolation(
        std::string_view call,
        std::string_view message,
        std::source_location loc = std::source_location::current())
        : std::logic_error(detail::format(
              "runtime contract violated by {} at {}:{}: {}",
              call, loc.file_name(), loc.line(), message))
        , call_(call)
    {}

    [[nodiscard]] std::string_view call() const noexcept { return call_; }

private:
    std::string call_;
};

} // namespace ort_bridge
