// compile_fail_extract_string_primitive.cpp
// This file should FAIL to compile.
// Tests that strings cannot take the zero-copy numeric path.
// (runtime string tensors have no contiguous element buffer)
//
// Expected error: constraint not satisfied / no matching function

#include "ort_bridge/extract.hpp"

#include <string>

int main() {
    ort_bridge::TensorHandle handle;
    // std::string is not a TensorScalar - this should fail to compile
    auto data = ort_bridge::extract_primitive<std::string>(ort_bridge::Shape{1}, handle);
    (void)data;
    return 0;
}
