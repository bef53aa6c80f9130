#pragma once

#include <tl/expected.hpp>

#include <string>
#include <string_view>

namespace billguard {

/// Backend-neutral store failure codes. Backends translate their own error
/// codes into these; callers never see sqlite3 result codes.
enum class StoreErrorCode {
    ConstraintViolation,
    Busy,          ///< Lock contention outlasted the busy timeout
    IoError,
    Internal
};

[[nodiscard]] constexpr std::string_view to_string(StoreErrorCode code) noexcept {
    switch (code) {
        case StoreErrorCode::ConstraintViolation: return "ConstraintViolation";
        case StoreErrorCode::Busy:                return "Busy";
        case StoreErrorCode::IoError:             return "IoError";
        case StoreErrorCode::Internal:            return "Internal";
    }
    return "Unknown";
}

struct StoreError {
    StoreErrorCode code;
    std::string message;

    [[nodiscard]] static StoreError constraint_violation(std::string msg) {
        return {StoreErrorCode::ConstraintViolation, std::move(msg)};
    }

    [[nodiscard]] static StoreError busy(std::string msg) {
        return {StoreErrorCode::Busy, std::move(msg)};
    }

    [[nodiscard]] static StoreError io_error(std::string msg) {
        return {StoreErrorCode::IoError, std::move(msg)};
    }

    [[nodiscard]] static StoreError internal(std::string msg) {
        return {StoreErrorCode::Internal, std::move(msg)};
    }
};

template <typename T>
using StoreResult = tl::expected<T, StoreError>;

}  // namespace billguard
