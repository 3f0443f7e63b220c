// compile_fail_input_bool.cpp
// This file should FAIL to compile.
// Tests that bool is rejected by the TensorScalar concept.
// (std::vector<bool> has no contiguous buffer to hand to the runtime)
//
// Expected error: constraint not satisfied / no matching function

#include "ort_bridge/input_tensor.hpp"

#include <vector>

int main(int, char** argv) {
    const OrtApi& api = *reinterpret_cast<const OrtApi*>(argv);
    // bool is not a TensorScalar type - this should fail to compile
    auto t = ort_bridge::InputTensor::from_array<bool>(api, {2}, std::vector<bool>{true, false});
    (void)t;
    return 0;
}
