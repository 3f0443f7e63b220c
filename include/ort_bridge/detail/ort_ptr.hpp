// ort_bridge/detail/ort_ptr.hpp
// Internal helpers for owning raw ORT objects with unique_ptr.
//
// Release entry points live in the OrtApi table, so unlike a plain C API the
// deleters carry the table they were created with.

#pragma once

#include <memory>

#include <onnxruntime_c_api.h>

namespace ort_bridge::detail {

struct ValueDeleter {
    const OrtApi* api{nullptr};
    void operator()(OrtValue* v) const noexcept {
        if (v) api->ReleaseValue(v);
    }
};

struct MemoryInfoDeleter {
    const OrtApi* api{nullptr};
    void operator()(OrtMemoryInfo* m) const noexcept {
        if (m) api->ReleaseMemoryInfo(m);
    }
};

struct TypeInfoDeleter {
    const OrtApi* api{nullptr};
    void operator()(OrtTensorTypeAndShapeInfo* info) const noexcept {
        if (info) api->ReleaseTensorTypeAndShapeInfo(info);
    }
};

using ValuePtr = std::unique_ptr<OrtValue, ValueDeleter>;
using MemoryInfoPtr = std::unique_ptr<OrtMemoryInfo, MemoryInfoDeleter>;
using TypeInfoPtr = std::unique_ptr<OrtTensorTypeAndShapeInfo, TypeInfoDeleter>;

[[nodiscard]] inline ValuePtr own_value(const OrtApi& api, OrtValue* v) noexcept {
    return ValuePtr(v, ValueDeleter{&api});
}

[[nodiscard]] inline MemoryInfoPtr own_memory_info(const OrtApi& api, OrtMemoryInfo* m) noexcept {
    return MemoryInfoPtr(m, MemoryInfoDeleter{&api});
}

[[nodiscard]] inline TypeInfoPtr own_type_info(const OrtApi& api,
                                              OrtTensorTypeAndShapeInfo* info) noexcept {
    return TypeInfoPtr(info, TypeInfoDeleter{&api});
}

} // namespace ort_bridge::detail
