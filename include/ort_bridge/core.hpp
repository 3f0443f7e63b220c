// ort_bridge/core.hpp
// Umbrella header for the ONNX Runtime tensor bridge
//
// Moves typed C++ arrays into OrtValue tensors and reads OrtValue outputs
// back as typed, shaped data. Sessions and environments are the caller's
// business; the bridge only needs the OrtApi table.

#pragma once

#include "ort_bridge/error.hpp"          // Structured exception types
#include "ort_bridge/log.hpp"            // Verbosity-controlled diagnostics
#include "ort_bridge/api.hpp"            // default_api()
#include "ort_bridge/status.hpp"
#include "ort_bridge/element_type.hpp"
#include "ort_bridge/ndarray.hpp"
#include "ort_bridge/utf8.hpp"
#include "ort_bridge/tensor_handle.hpp"
#include "ort_bridge/extract.hpp"
#include "ort_bridge/owned_tensor.hpp"
#include "ort_bridge/input_tensor.hpp"

// ============================================================================
// ONNX Runtime Tensor Bridge - Quick Reference
// ============================================================================
//
// CORE CLASSES:
// ─────────────────────────────────────────────────────────────────────────────
//   ort_bridge::ElementType      - Supported element kinds (bijective with ONNX)
//   ort_bridge::InputTensor      - OrtValue built from caller data (move-only)
//   ort_bridge::TensorHandle     - Shared ownership of a runtime OrtValue*
//   ort_bridge::TensorData<T>    - Extraction result: borrowed view | owned strings
//   ort_bridge::OwnedTensor<T>   - Statically typed output
//   ort_bridge::DynTensor        - Output described by the runtime, typed on demand
//   ort_bridge::ArrayView<T>     - Shaped, non-owning, row-major view
//   ort_bridge::Array<T>         - Shaped, owning counterpart
//   ort_bridge::Status           - RAII wrapper for OrtStatus*
//   ort_bridge::Error            - Recoverable failure (runtime or bridge)
//   ort_bridge::ContractViolation- Runtime broke its own contract (logic_error)
//
// FEEDING A SESSION:
// ─────────────────────────────────────────────────────────────────────────────
//   const OrtApi& api = ort_bridge::default_api();
//
//   auto image = ort_bridge::InputTensor::from_array<float>(
//       api, {1, 3, 224, 224}, std::move(pixels));       // no copy
//
//   std::vector<std::string> words{"hello", "world"};
//   auto text = ort_bridge::InputTensor::from_strings(api, {2}, words);
//
//   OrtValue* inputs[] = {image.get(), text.get()};      // still owned here
//
// READING OUTPUTS:
// ─────────────────────────────────────────────────────────────────────────────
//   // Unknown type: ask the runtime
//   auto out = ort_bridge::DynTensor::from_value(api, outputs[0]);  // owns it
//   if (out.holds<float>()) {
//       auto scores = out.try_extract<float>();          // borrowed, zero-copy
//       float top = scores.view()(0, 3);
//   }
//
//   // Known type and shape: extract directly
//   auto handle = ort_bridge::TensorHandle::adopt(api, outputs[1]);
//   auto labels = ort_bridge::extract_strings({2}, 2, handle);   // copied, UTF-8 checked
//
//   // Sequence outputs
//   auto seq = ort_bridge::TensorHandle::adopt(api, outputs[2]);
//   for (std::size_t i = 0; i < ort_bridge::DynTensor::sequence_length(seq); ++i) {
//       auto element = ort_bridge::DynTensor::from_sequence_element(seq, i);
//   }
//
// LIFETIMES:
// ─────────────────────────────────────────────────────────────────────────────
//   Every borrowed view holds a TensorHandle copy; the runtime buffer is
//   released (ReleaseValue, exactly once) after the last view or handle is
//   gone, from whichever thread drops it.
//   Extracted strings own their bytes and do not keep the tensor alive.
//
//   view() returns a plain ArrayView that holds no handle. Keep the
//   OwnedTensor it came from in a named variable; view() on a temporary
//   does not compile:
//       auto v = out.try_extract<float>().view();    // error: deleted
//       auto t = out.try_extract<float>();           // ok
//       auto v = t.view();                           // valid while t lives
//
// ERRORS:
// ─────────────────────────────────────────────────────────────────────────────
//   try {
//       auto t = dyn.try_extract<std::int64_t>();
//   } catch (const ort_bridge::Error& e) {
//       e.kind();      // NativeCall, TypeMismatch, Utf8Decode, ...
//       e.context();   // "GetStringTensorContent", "DynTensor::try_extract", ...
//       e.index();     // offending string for Utf8Decode
//   }
//
// DIAGNOSTICS:
// ─────────────────────────────────────────────────────────────────────────────
//   ORT_BRIDGE_VERBOSITY=debug ./app       // or 0-4
//   ort_bridge::set_verbosity(ort_bridge::VerbosityLevel::Trace);
//   -DORT_BRIDGE_DISABLE_LOGGING            // compile logging out
//
// ============================================================================
