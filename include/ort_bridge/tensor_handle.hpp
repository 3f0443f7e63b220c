// ort_bridge/tensor_handle.hpp
// Shared ownership of runtime-allocated OrtValue pointers
//
// A TensorHandle is the only owner of an OrtValue the runtime handed us.
// Copies share one TensorHolder through std::shared_ptr (atomic count), so
// ReleaseValue fires exactly once, from whichever thread drops the last
// reference. Borrowed extraction views keep a TensorHandle copy; the buffer
// they point into cannot be released under them.
//
// A tensor taken out of a container value (an ORT sequence) keeps a share of
// the container's holder. The container is released once, after its last
// element and its own handle are gone, however many elements were taken.

#pragma once

#include <cstddef>
#include <exception>
#include <memory>
#include <utility>

#include <onnxruntime_c_api.h>

#include "ort_bridge/error.hpp"
#include "ort_bridge/format.hpp"
#include "ort_bridge/log.hpp"

namespace ort_bridge {

// ============================================================================
// TensorHolder - the owned pointers
// ============================================================================

class TensorHolder {
public:
    TensorHolder(const OrtApi& api,
                 OrtValue* tensor,
                 std::shared_ptr<TensorHolder> container = nullptr) noexcept
        : api_(&api)
        , tensor_(tensor)
        , container_(std::move(container))
    {}

    /// Releases the tensor; the container share (if any) drops afterwards.
    ~TensorHolder() {
        if (tensor_) api_->ReleaseValue(tensor_);
        if (log_enabled(VerbosityLevel::Trace)) {
            // A failed trace line must not escape the destructor.
            try {
                log_trace(detail::format("released tensor {}", static_cast<const void*>(tensor_)));
            } catch (const std::exception&) {
            }
        }
    }

    // Non-copyable, non-movable: shared only through shared_ptr
    TensorHolder(const TensorHolder&) = delete;
    TensorHolder& operator=(const TensorHolder&) = delete;
    TensorHolder(TensorHolder&&) = delete;
    TensorHolder& operator=(TensorHolder&&) = delete;

    [[nodiscard]] OrtValue* tensor() const noexcept { return tensor_; }
    [[nodiscard]] OrtValue* container() const noexcept {
        return container_ ? container_->tensor() : nullptr;
    }
    [[nodiscard]] const OrtApi& api() const noexcept { return *api_; }

private:
    const OrtApi* api_;
    OrtValue* tensor_;
    std::shared_ptr<TensorHolder> container_;
};

// ============================================================================
// TensorHandle - reference-counted alias of a TensorHolder
// ============================================================================

class TensorHandle {
public:
    /// Empty handle (owns nothing)
    TensorHandle() = default;

    /// Take ownership of a tensor returned by the runtime.
    /// @throws Error (InvalidArgument) on nullptr; nothing is adopted then
    [[nodiscard]] static TensorHandle adopt(const OrtApi& api, OrtValue* tensor) {
        if (!tensor) {
            throw Error::InvalidArgument("TensorHandle::adopt", "null OrtValue*");
        }
        return make_(api, tensor, nullptr);
    }

    /// Take ownership of a tensor extracted from `container` (e.g. by
    /// OrtApi::GetValue). The container stays alive at least as long as the
    /// element; it is released by whichever handle drops last.
    [[nodiscard]] static TensorHandle adopt_element(const OrtApi& api,
                                                    OrtValue* tensor,
                                                    const TensorHandle& container) {
        if (!tensor) {
            throw Error::InvalidArgument("TensorHandle::adopt_element", "null OrtValue*");
        }
        if (!container) {
            api.ReleaseValue(tensor);
            throw Error::InvalidArgument("TensorHandle::adopt_element", "empty container handle");
        }
        return make_(api, tensor, container.holder_);
    }

    [[nodiscard]] OrtValue* get() const noexcept {
        return holder_ ? holder_->tensor() : nullptr;
    }

    [[nodiscard]] OrtValue* container() const noexcept {
        return holder_ ? holder_->container() : nullptr;
    }

    /// Table the tensor was adopted with. Precondition: valid().
    [[nodiscard]] const OrtApi& api() const noexcept { return holder_->api(); }

    [[nodiscard]] bool valid() const noexcept { return holder_ != nullptr; }
    [[nodiscard]] explicit operator bool() const noexcept { return valid(); }

    /// Number of handles (including views) sharing this tensor
    [[nodiscard]] long use_count() const noexcept { return holder_.use_count(); }

    /// Drop this reference; releases the tensor if it was the last one
    void reset() noexcept { holder_.reset(); }

    friend bool operator==(const TensorHandle& a, const TensorHandle& b) noexcept {
        return a.holder_ == b.holder_;
    }

private:
    explicit TensorHandle(std::shared_ptr<TensorHolder> holder) noexcept
        : holder_(std::move(holder)) {}

    // If the holder cannot be allocated the tensor is released here, so
    // adopt() owns it from the moment it is called.
    [[nodiscard]] static TensorHandle make_(const OrtApi& api,
                                            OrtValue* tensor,
                                            std::shared_ptr<TensorHolder> container) {
        std::shared_ptr<TensorHolder> holder;
        try {
            holder = std::make_shared<TensorHolder>(api, tensor, std::move(container));
        } catch (...) {
            api.ReleaseValue(tensor);
            throw;
        }
        if (log_enabled(VerbosityLevel::Trace)) {
            log_trace(detail::format("adopted tensor {}{}",
                static_cast<const void*>(tensor),
                holder->container() ? " (container element)" : ""));
        }
        return TensorHandle(std::move(holder));
    }

    std::shared_ptr<TensorHolder> holder_;
};

} // namespace ort_bridge
