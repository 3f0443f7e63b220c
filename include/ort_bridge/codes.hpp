// ort_bridge/codes.hpp
// Shared helpers for ONNX Runtime status codes
//
// Centralizes OrtErrorCode -> string mapping so Error and Status agree.

#pragma once

#include <onnxruntime_c_api.h>

namespace ort_bridge {

/// Convert an OrtErrorCode to a stable string name.
///
/// Codes added by runtimes newer than this header map to "UNKNOWN_CODE".
[[nodiscard]] constexpr const char* code_to_string(OrtErrorCode code) noexcept {
    switch (code) {
        case ORT_OK:                return "OK";
        case ORT_FAIL:              return "FAIL";
        case ORT_INVALID_ARGUMENT:  return "INVALID_ARGUMENT";
        case ORT_NO_SUCHFILE:       return "NO_SUCHFILE";
        case ORT_NO_MODEL:          return "NO_MODEL";
        case ORT_ENGINE_ERROR:      return "ENGINE_ERROR";
        case ORT_RUNTIME_EXCEPTION: return "RUNTIME_EXCEPTION";
        case ORT_INVALID_PROTOBUF:  return "INVALID_PROTOBUF";
        case ORT_MODEL_LOADED:      return "MODEL_LOADED";
        case ORT_NOT_IMPLEMENTED:   return "NOT_IMPLEMENTED";
        case ORT_INVALID_GRAPH:     return "INVALID_GRAPH";
        case ORT_EP_FAIL:           return "EP_FAIL";
        default:                    return "UNKNOWN_CODE";
    }
}

} // namespace ort_bridge
