// tests/fake_runtime.cpp
// Fake ONNX Runtime entry points. See fake_runtime.hpp.

#include "fake_runtime.hpp"

#include <cstddef>
#include <cstdint>
#include <cstring>
#include <map>
#include <memory>
#include <string>
#include <utility>
#include <vector>

// ============================================================================
// Opaque ORT types, defined here the way the real runtime defines them
// privately.
// ============================================================================

struct OrtStatus {
    OrtErrorCode code{ORT_OK};
    std::string message;
};

struct OrtValue {
    ONNXType kind{ONNX_TYPE_TENSOR};
    ONNXTensorElementDataType dtype{ONNX_TENSOR_ELEMENT_DATA_TYPE_FLOAT};
    std::vector<std::int64_t> dims;

    std::vector<std::byte> storage;   // numeric data owned by the value
    void* external{nullptr};          // numeric data owned by the caller
    bool is_external{false};

    std::vector<std::string> strings;  // string tensors

    std::vector<OrtValue*> elements;  // sequences (owned by the pool)

    int released{0};
};

struct OrtMemoryInfo {
    OrtAllocatorType allocator_type{OrtDeviceAllocator};
    OrtMemType mem_type{OrtMemTypeDefault};
};

struct OrtTensorTypeAndShapeInfo {
    ONNXTensorElementDataType dtype{ONNX_TENSOR_ELEMENT_DATA_TYPE_UNDEFINED};
    std::vector<std::int64_t> dims;
};

namespace {

// ----------------------------------------------------------------------------
// State
// ----------------------------------------------------------------------------

struct Injected {
    OrtErrorCode code;
    std::string message;
};

struct State {
    std::vector<std::unique_ptr<OrtValue>> values;
    std::map<std::string, Injected> injected;

    bool null_data{false};
    fake::OffsetCorruption corruption{fake::OffsetCorruption::None};

    int values_released{0};
    int elements_created{0};
    int statuses_created{0};
    int statuses_released{0};
    int memory_infos_created{0};
    int memory_infos_released{0};
    int type_infos_created{0};
    int type_infos_released{0};

    OrtValue* last_created{nullptr};
};

State& state() {
    static State s;
    return s;
}

OrtStatus* make_status(OrtErrorCode code, const char* msg) {
    ++state().statuses_created;
    return new OrtStatus{code, msg ? msg : ""};
}

/// Returns the injected failure for `call`, once.
OrtStatus* take_injected(const char* call) {
    auto& inj = state().injected;
    const auto it = inj.find(call);
    if (it == inj.end()) return nullptr;
    OrtStatus* st = make_status(it->second.code, it->second.message.c_str());
    inj.erase(it);
    return st;
}

OrtValue* new_value() {
    auto& s = state();
    s.values.push_back(std::make_unique<OrtValue>());
    return s.values.back().get();
}

std::size_t dtype_size(ONNXTensorElementDataType t) {
    switch (t) {
        case ONNX_TENSOR_ELEMENT_DATA_TYPE_BOOL:
        case ONNX_TENSOR_ELEMENT_DATA_TYPE_UINT8:
        case ONNX_TENSOR_ELEMENT_DATA_TYPE_INT8:       return 1;
        case ONNX_TENSOR_ELEMENT_DATA_TYPE_FLOAT16:
        case ONNX_TENSOR_ELEMENT_DATA_TYPE_BFLOAT16:
        case ONNX_TENSOR_ELEMENT_DATA_TYPE_UINT16:
        case ONNX_TENSOR_ELEMENT_DATA_TYPE_INT16:      return 2;
        case ONNX_TENSOR_ELEMENT_DATA_TYPE_FLOAT:
        case ONNX_TENSOR_ELEMENT_DATA_TYPE_INT32:
        case ONNX_TENSOR_ELEMENT_DATA_TYPE_UINT32:     return 4;
        case ONNX_TENSOR_ELEMENT_DATA_TYPE_DOUBLE:
        case ONNX_TENSOR_ELEMENT_DATA_TYPE_INT64:
        case ONNX_TENSOR_ELEMENT_DATA_TYPE_UINT64:
        case ONNX_TENSOR_ELEMENT_DATA_TYPE_COMPLEX64:  return 8;
        case ONNX_TENSOR_ELEMENT_DATA_TYPE_COMPLEX128: return 16;
        default:                                       return 0;
    }
}

std::size_t element_count(const std::vector<std::int64_t>& dims) {
    std::size_t n = 1;
    for (const auto d : dims) {
        if (d < 0) return 0;
        n *= static_cast<std::size_t>(d);
    }
    return n;
}

OrtValue* clone(const OrtValue* src) {
    OrtValue* v = new_value();
    v->kind = src->kind;
    v->dtype = src->dtype;
    v->dims = src->dims;
    v->strings = src->strings;
    if (src->is_external) {
        const auto* p = static_cast<const std::byte*>(src->external);
        v->storage.assign(p, p + element_count(src->dims) * dtype_size(src->dtype));
    } else {
        v->storage = src->storage;
    }
    for (const OrtValue* e : src->elements) {
        v->elements.push_back(clone(e));
    }
    return v;
}

// ----------------------------------------------------------------------------
// Status
// ----------------------------------------------------------------------------

OrtStatus* ORT_API_CALL CreateStatus(OrtErrorCode code, const char* msg) noexcept {
    return make_status(code, msg);
}

OrtErrorCode ORT_API_CALL GetErrorCode(const OrtStatus* st) noexcept {
    return st ? st->code : ORT_OK;
}

const char* ORT_API_CALL GetErrorMessage(const OrtStatus* st) noexcept {
    return st ? st->message.c_str() : "";
}

void ORT_API_CALL ReleaseStatus(OrtStatus* st) noexcept {
    if (!st) return;
    ++state().statuses_released;
    delete st;
}

// ----------------------------------------------------------------------------
// Values
// ----------------------------------------------------------------------------

void ORT_API_CALL ReleaseValue(OrtValue* v) noexcept {
    if (!v) return;
    ++v->released;
    ++state().values_released;
}

OrtStatus* ORT_API_CALL GetValueType(const OrtValue* v, ONNXType* out) noexcept {
    if (auto* st = take_injected("GetValueType")) return st;
    *out = v->kind;
    return nullptr;
}

OrtStatus* ORT_API_CALL GetValueCount(const OrtValue* v, std::size_t* out) noexcept {
    if (auto* st = take_injected("GetValueCount")) return st;
    if (v->kind != ONNX_TYPE_SEQUENCE) {
        return make_status(ORT_INVALID_ARGUMENT, "GetValueCount: not a sequence or map");
    }
    *out = v->elements.size();
    return nullptr;
}

OrtStatus* ORT_API_CALL GetValue(const OrtValue* v, int index, OrtAllocator*,
                                 OrtValue** out) noexcept {
    if (auto* st = take_injected("GetValue")) return st;
    if (v->kind != ONNX_TYPE_SEQUENCE) {
        return make_status(ORT_INVALID_ARGUMENT, "GetValue: not a sequence");
    }
    if (index < 0 || static_cast<std::size_t>(index) >= v->elements.size()) {
        return make_status(ORT_INVALID_ARGUMENT, "GetValue: index out of range");
    }
    *out = clone(v->elements[static_cast<std::size_t>(index)]);
    ++state().elements_created;
    return nullptr;
}

OrtStatus* ORT_API_CALL GetTensorMutableData(OrtValue* v, void** out) noexcept {
    if (auto* st = take_injected("GetTensorMutableData")) return st;
    if (v->kind != ONNX_TYPE_TENSOR) {
        return make_status(ORT_INVALID_ARGUMENT, "GetTensorMutableData: not a tensor");
    }
    if (state().null_data) {
        *out = nullptr;
        return nullptr;
    }
    *out = v->is_external ? v->external : static_cast<void*>(v->storage.data());
    return nullptr;
}

// ----------------------------------------------------------------------------
// Strings
// ----------------------------------------------------------------------------

OrtStatus* ORT_API_CALL GetStringTensorDataLength(const OrtValue* v, std::size_t* len) noexcept {
    if (auto* st = take_injected("GetStringTensorDataLength")) return st;
    if (v->dtype != ONNX_TENSOR_ELEMENT_DATA_TYPE_STRING) {
        return make_status(ORT_INVALID_ARGUMENT, "GetStringTensorDataLength: not a string tensor");
    }
    std::size_t total = 0;
    for (const auto& s : v->strings) total += s.size();
    *len = total;
    return nullptr;
}

OrtStatus* ORT_API_CALL GetStringTensorContent(const OrtValue* v, void* s, std::size_t s_len,
                                               std::size_t* offsets,
                                               std::size_t offsets_len) noexcept {
    if (auto* st = take_injected("GetStringTensorContent")) return st;
    if (v->dtype != ONNX_TENSOR_ELEMENT_DATA_TYPE_STRING) {
        return make_status(ORT_INVALID_ARGUMENT, "GetStringTensorContent: not a string tensor");
    }
    if (offsets_len != v->strings.size()) {
        return make_status(ORT_INVALID_ARGUMENT, "GetStringTensorContent: offsets_len mismatch");
    }
    std::size_t total = 0;
    for (const auto& str : v->strings) total += str.size();
    if (s_len < total) {
        return make_status(ORT_INVALID_ARGUMENT, "GetStringTensorContent: buffer too small");
    }

    auto* out = static_cast<char*>(s);
    std::size_t pos = 0;
    for (std::size_t i = 0; i < v->strings.size(); ++i) {
        offsets[i] = pos;
        if (!v->strings[i].empty()) {
            std::memcpy(out + pos, v->strings[i].data(), v->strings[i].size());
        }
        pos += v->strings[i].size();
    }

    const std::size_t n = offsets_len;
    switch (state().corruption) {
        case fake::OffsetCorruption::None:
            break;
        case fake::OffsetCorruption::WriteSentinel:
            offsets[n] = total;
            break;
        case fake::OffsetCorruption::Decreasing:
            if (n >= 2) offsets[0] = offsets[1] + 1;
            break;
        case fake::OffsetCorruption::PastEnd:
            if (n >= 1) offsets[n - 1] = total + 5;
            break;
    }
    return nullptr;
}

OrtStatus* ORT_API_CALL FillStringTensor(OrtValue* v, const char* const* s,
                                         std::size_t s_len) noexcept {
    if (auto* st = take_injected("FillStringTensor")) return st;
    if (v->dtype != ONNX_TENSOR_ELEMENT_DATA_TYPE_STRING) {
        return make_status(ORT_INVALID_ARGUMENT, "FillStringTensor: not a string tensor");
    }
    if (s_len != v->strings.size()) {
        return make_status(ORT_INVALID_ARGUMENT, "FillStringTensor: length mismatch");
    }
    for (std::size_t i = 0; i < s_len; ++i) {
        v->strings[i] = s[i];
    }
    return nullptr;
}

// ----------------------------------------------------------------------------
// Type and shape
// ----------------------------------------------------------------------------

OrtStatus* ORT_API_CALL GetTensorTypeAndShape(const OrtValue* v,
                                              OrtTensorTypeAndShapeInfo** out) noexcept {
    if (auto* st = take_injected("GetTensorTypeAndShape")) return st;
    if (v->kind != ONNX_TYPE_TENSOR) {
        return make_status(ORT_INVALID_ARGUMENT, "GetTensorTypeAndShape: not a tensor");
    }
    ++state().type_infos_created;
    *out = new OrtTensorTypeAndShapeInfo{v->dtype, v->dims};
    return nullptr;
}

void ORT_API_CALL ReleaseTensorTypeAndShapeInfo(OrtTensorTypeAndShapeInfo* info) noexcept {
    if (!info) return;
    ++state().type_infos_released;
    delete info;
}

OrtStatus* ORT_API_CALL GetTensorElementType(const OrtTensorTypeAndShapeInfo* info,
                                             ONNXTensorElementDataType* out) noexcept {
    if (auto* st = take_injected("GetTensorElementType")) return st;
    *out = info->dtype;
    return nullptr;
}

OrtStatus* ORT_API_CALL GetDimensionsCount(const OrtTensorTypeAndShapeInfo* info,
                                           std::size_t* out) noexcept {
    if (auto* st = take_injected("GetDimensionsCount")) return st;
    *out = info->dims.size();
    return nullptr;
}

OrtStatus* ORT_API_CALL GetDimensions(const OrtTensorTypeAndShapeInfo* info,
                                      std::int64_t* dim_values,
                                      std::size_t dim_values_length) noexcept {
    if (auto* st = take_injected("GetDimensions")) return st;
    for (std::size_t i = 0; i < dim_values_length && i < info->dims.size(); ++i) {
        dim_values[i] = info->dims[i];
    }
    return nullptr;
}

OrtStatus* ORT_API_CALL GetTensorShapeElementCount(const OrtTensorTypeAndShapeInfo* info,
                                                   std::size_t* out) noexcept {
    if (auto* st = take_injected("GetTensorShapeElementCount")) return st;
    *out = element_count(info->dims);
    return nullptr;
}

// ----------------------------------------------------------------------------
// Creation
// ----------------------------------------------------------------------------

OrtStatus* ORT_API_CALL CreateCpuMemoryInfo(OrtAllocatorType type, OrtMemType mem_type,
                                            OrtMemoryInfo** out) noexcept {
    if (auto* st = take_injected("CreateCpuMemoryInfo")) return st;
    ++state().memory_infos_created;
    *out = new OrtMemoryInfo{type, mem_type};
    return nullptr;
}

void ORT_API_CALL ReleaseMemoryInfo(OrtMemoryInfo* info) noexcept {
    if (!info) return;
    ++state().memory_infos_released;
    delete info;
}

OrtStatus* ORT_API_CALL GetAllocatorWithDefaultOptions(OrtAllocator** out) noexcept {
    if (auto* st = take_injected("GetAllocatorWithDefaultOptions")) return st;
    static OrtAllocator allocator{};
    *out = &allocator;
    return nullptr;
}

OrtStatus* ORT_API_CALL CreateTensorWithDataAsOrtValue(const OrtMemoryInfo* info, void* p_data,
                                                       std::size_t p_data_len,
                                                       const std::int64_t* shape,
                                                       std::size_t shape_len,
                                                       ONNXTensorElementDataType type,
                                                       OrtValue** out) noexcept {
    if (auto* st = take_injected("CreateTensorWithDataAsOrtValue")) return st;
    if (!info) {
        return make_status(ORT_INVALID_ARGUMENT, "CreateTensorWithDataAsOrtValue: null info");
    }
    std::vector<std::int64_t> dims(shape, shape + shape_len);
    if (element_count(dims) * dtype_size(type) != p_data_len) {
        return make_status(ORT_INVALID_ARGUMENT,
                           "CreateTensorWithDataAsOrtValue: buffer size does not match shape");
    }
    OrtValue* v = new_value();
    v->dtype = type;
    v->dims = std::move(dims);
    v->external = p_data;
    v->is_external = true;
    state().last_created = v;
    *out = v;
    return nullptr;
}

OrtStatus* ORT_API_CALL CreateTensorAsOrtValue(OrtAllocator* allocator, const std::int64_t* shape,
                                               std::size_t shape_len,
                                               ONNXTensorElementDataType type,
                                               OrtValue** out) noexcept {
    if (auto* st = take_injected("CreateTensorAsOrtValue")) return st;
    if (!allocator) {
        return make_status(ORT_INVALID_ARGUMENT, "CreateTensorAsOrtValue: null allocator");
    }
    OrtValue* v = new_value();
    v->dtype = type;
    v->dims.assign(shape, shape + shape_len);
    const std::size_t n = element_count(v->dims);
    if (type == ONNX_TENSOR_ELEMENT_DATA_TYPE_STRING) {
        v->strings.resize(n);
    } else {
        v->storage.resize(n * dtype_size(type));
    }
    state().last_created = v;
    *out = v;
    return nullptr;
}

const OrtApi& build_table() {
    static OrtApi table = [] {
        OrtApi t{};
        t.CreateStatus = &CreateStatus;
        t.GetErrorCode = &GetErrorCode;
        t.GetErrorMessage = &GetErrorMessage;
        t.ReleaseStatus = &ReleaseStatus;

        t.ReleaseValue = &ReleaseValue;
        t.GetValueType = &GetValueType;
        t.GetValueCount = &GetValueCount;
        t.GetValue = &GetValue;
        t.GetTensorMutableData = &GetTensorMutableData;

        t.GetStringTensorDataLength = &GetStringTensorDataLength;
        t.GetStringTensorContent = &GetStringTensorContent;
        t.FillStringTensor = &FillStringTensor;

        t.GetTensorTypeAndShape = &GetTensorTypeAndShape;
        t.ReleaseTensorTypeAndShapeInfo = &ReleaseTensorTypeAndShapeInfo;
        t.GetTensorElementType = &GetTensorElementType;
        t.GetDimensionsCount = &GetDimensionsCount;
        t.GetDimensions = &GetDimensions;
        t.GetTensorShapeElementCount = &GetTensorShapeElementCount;

        t.CreateCpuMemoryInfo = &CreateCpuMemoryInfo;
        t.ReleaseMemoryInfo = &ReleaseMemoryInfo;
        t.GetAllocatorWithDefaultOptions = &GetAllocatorWithDefaultOptions;
        t.CreateTensorWithDataAsOrtValue = &CreateTensorWithDataAsOrtValue;
        t.CreateTensorAsOrtValue = &CreateTensorAsOrtValue;
        return t;
    }();
    return table;
}

} // namespace

namespace fake {

const OrtApi& api() { return build_table(); }

void reset() {
    auto& s = state();
    s.values.clear();
    s.injected.clear();
    s.null_data = false;
    s.corruption = OffsetCorruption::None;
    s.values_released = 0;
    s.elements_created = 0;
    s.statuses_created = 0;
    s.statuses_released = 0;
    s.memory_infos_created = 0;
    s.memory_infos_released = 0;
    s.type_infos_created = 0;
    s.type_infos_released = 0;
    s.last_created = nullptr;
}

void inject_error(const char* call, OrtErrorCode code, const char* message) {
    state().injected[call] = Injected{code, message ? message : ""};
}

void set_null_data(bool on) { state().null_data = on; }

void set_offset_corruption(OffsetCorruption mode) { state().corruption = mode; }

OrtValue* make_raw_tensor(ONNXTensorElementDataType type,
                          std::vector<std::int64_t> dims,
                          const void* bytes,
                          std::size_t byte_len) {
    OrtValue* v = new_value();
    v->dtype = type;
    v->dims = std::move(dims);
    const auto* p = static_cast<const std::byte*>(bytes);
    v->storage.assign(p, p + byte_len);
    return v;
}

OrtValue* make_string_tensor(std::vector<std::int64_t> dims, std::vector<std::string> values) {
    OrtValue* v = new_value();
    v->dtype = ONNX_TENSOR_ELEMENT_DATA_TYPE_STRING;
    v->dims = std::move(dims);
    v->strings = std::move(values);
    return v;
}

OrtValue* make_sequence(const std::vector<OrtValue*>& elements) {
    OrtValue* v = new_value();
    v->kind = ONNX_TYPE_SEQUENCE;
    v->dtype = ONNX_TENSOR_ELEMENT_DATA_TYPE_UNDEFINED;
    for (const OrtValue* e : elements) {
        v->elements.push_back(clone(e));
    }
    return v;
}

int release_count(const OrtValue* value) { return value ? value->released : 0; }
int values_created() { return static_cast<int>(state().values.size()); }
int values_released() { return state().values_released; }
int elements_created() { return state().elements_created; }

int statuses_live() { return state().statuses_created - state().statuses_released; }
int memory_infos_live() { return state().memory_infos_created - state().memory_infos_released; }
int memory_infos_released() { return state().memory_infos_released; }
int type_infos_live() { return state().type_infos_created - state().type_infos_released; }

OrtValue* last_created() { return state().last_created; }

const void* data_of(const OrtValue* value) {
    if (value->is_external) return value->external;
    return value->storage.empty() ? nullptr : value->storage.data();
}

std::vector<std::int64_t> dims_of(const OrtValue* value) { return value->dims; }
ONNXTensorElementDataType dtype_of(const OrtValue* value) { return value->dtype; }
std::vector<std::string> strings_of(const OrtValue* value) { return value->strings; }

} // namespace fake
