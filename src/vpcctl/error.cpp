/**
 * @file error.cpp
 * @brief ErrorCode labels.
 */
#include "vpcctl/error.hpp"

namespace vpcctl {

std::string_view to_string(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::NotFound:                  return "not-found";
        case ErrorCode::AlreadyExists:             return "already-exists";
        case ErrorCode::ValidationFailure:         return "validation-failure";
        case ErrorCode::PrimitiveExecutionFailure: return "primitive-failure";
        case ErrorCode::Conflict:                  return "conflict";
        case ErrorCode::PersistenceFailure:        return "persistence-failure";
    }
    return "unknown";
}

} // namespace vpcctl
