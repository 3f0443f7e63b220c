// ort_bridge/status.hpp
// RAII ownership of OrtStatus* and translation to ort_bridge::Error
//
// ORT signals success with a null OrtStatus*. A non-null status is owned by
// the caller and must be released through the same table that produced it.

#pragma once

#include <source_location>
#include <string>
#include <string_view>
#include <utility>

#include <onnxruntime_c_api.h>

#include "ort_bridge/codes.hpp"
#include "ort_bridge/error.hpp"

namespace ort_bridge {

// ============================================================================
// Status - RAII wrapper for OrtStatus*
// ============================================================================

class Status {
public:
    /// OK status (no OrtStatus object)
    explicit Status(const OrtApi& api) noexcept : api_(&api) {}

    /// Adopt a status returned by an OrtApi entry point (nullptr == OK)
    Status(const OrtApi& api, OrtStatus* st) noexcept : api_(&api), st_(st) {}

    ~Status() { reset(); }

    // Non-copyable
    Status(const Status&) = delete;
    Status& operator=(const Status&) = delete;

    // Movable
    Status(Status&& other) noexcept
        : api_(other.api_)
        , st_(std::exchange(other.st_, nullptr))
    {}

    Status& operator=(Status&& other) noexcept {
        if (this != &other) {
            reset();
            api_ = other.api_;
            st_ = std::exchange(other.st_, nullptr);
        }
        return *this;
    }

    // ─────────────────────────────────────────────────────────────────
    // Accessors
    // ─────────────────────────────────────────────────────────────────

    [[nodiscard]] OrtStatus* get() const noexcept { return st_; }
    [[nodiscard]] bool ok() const noexcept { return st_ == nullptr; }
    [[nodiscard]] explicit operator bool() const noexcept { return ok(); }

    [[nodiscard]] OrtErrorCode code() const noexcept {
        return st_ ? api_->GetErrorCode(st_) : ORT_OK;
    }

    [[nodiscard]] const char* code_name() const noexcept { return code_to_string(code()); }

    [[nodiscard]] std::string message() const {
        if (!st_) return {};
        const char* msg = api_->GetErrorMessage(st_);
        return msg ? std::string(msg) : std::string{};
    }

    void reset() noexcept {
        if (st_) {
            api_->ReleaseStatus(st_);
            st_ = nullptr;
        }
    }

    // ─────────────────────────────────────────────────────────────────
    // Error handling
    // ─────────────────────────────────────────────────────────────────

    /// Throw Error::Runtime naming `call` if this status is not OK.
    /// The OrtStatus is released before the exception leaves.
    void throw_if_error(
        std::string_view call,
        std::source_location loc = std::source_location::current())
    {
        if (ok()) return;

        const OrtErrorCode c = code();
        std::string msg = message();
        reset();
        throw Error::Runtime(c, call, msg, loc);
    }

private:
    const OrtApi* api_{nullptr};
    OrtStatus* st_{nullptr};
};

// ============================================================================
// Free function helpers
// ============================================================================

/// Consume the status returned by an OrtApi call.
///
///     check_status(api, api.GetTensorMutableData(v, &p), "GetTensorMutableData");
inline void check_status(
    const OrtApi& api,
    OrtStatus* st,
    std::string_view call,
    std::source_location loc = std::source_location::current())
{
    Status(api, st).throw_if_error(call, loc);
}

} // namespace ort_bridge
