#pragma once
/**
 * @file error.hpp
 * @brief Error taxonomy and the Result alias shared by every vpcctl layer.
 * @details Nothing in the orchestration path throws; failures travel as
 *          vpcctl::Error inside vpcctl_detail::expected.
 */

#include <cstdint>
#include <string>
#include <string_view>
#include <utility>

#include "vpcctl/compat/expected.hpp"

namespace vpcctl {

/** @enum ErrorCode
 *  @brief Failure classes reported by stores, primitives and lifecycle managers.
 */
enum class ErrorCode : std::uint8_t {
    NotFound = 1,              ///< Referenced VPC/subnet/peering/file absent
    AlreadyExists,             ///< Duplicate creation attempt
    ValidationFailure,         ///< Malformed input or violated precondition
    PrimitiveExecutionFailure, ///< The network primitive layer reported failure
    Conflict,                  ///< Optimistic write lost (revision mismatch)
    PersistenceFailure         ///< Topology file could not be read/written/decoded
};

/** @struct Error
 *  @brief Error code plus a human-readable message for the command boundary.
 */
struct Error {
    ErrorCode   code{ErrorCode::ValidationFailure};
    std::string message;

    bool operator==(const Error&) const = default;
};

/// Result type returned by every fallible operation.
template <class T>
using Result = vpcctl_detail::expected<T, Error>;

/// Build the unexpected branch of a Result.
inline vpcctl_detail::unexpected<Error> fail(ErrorCode code, std::string message) {
    return vpcctl_detail::unexpected<Error>(Error{code, std::move(message)});
}

/// Re-wrap an existing error (used when forwarding a failure across types).
inline vpcctl_detail::unexpected<Error> fail(Error e) {
    return vpcctl_detail::unexpected<Error>(std::move(e));
}

/// Stable label for logs and CLI output, e.g. "not-found".
std::string_view to_string(ErrorCode code) noexcept;

/** @enum Disposition
 *  @brief Outcome of a call made under the soft-failure policy.
 *  - Applied:    the call succeeded.
 *  - SoftFailed: the call failed, was logged, and the caller carried on.
 */
enum class Disposition : std::uint8_t { Applied, SoftFailed };

} // namespace vpcctl
