// ort_bridge/api.hpp
// Access to the ONNX Runtime function table.
//
// Every bridge operation takes `const OrtApi&` explicitly instead of
// reaching for a global. Production code passes default_api(); tests pass
// a table of their own.

#pragma once

#include <onnxruntime_c_api.h>

#include "ort_bridge/error.hpp"
#include "ort_bridge/format.hpp"

namespace ort_bridge {

/// The OrtApi table of the linked runtime, for the header version we were
/// compiled against. Resolved once.
/// @throws Error if the runtime is older than the headers
[[nodiscard]] inline const OrtApi& default_api() {
    static const OrtApi* api = OrtGetApiBase()->GetApi(ORT_API_VERSION);
    if (!api) {
        throw Error::Bridge(ErrorKind::NativeCall, "OrtGetApiBase",
            detail::format("runtime {} does not provide API version {}",
                           OrtGetApiBase()->GetVersionString(), ORT_API_VERSION));
    }
    return *api;
}

} // namespace ort_bridge
