#pragma once

/// @file auth_result.hpp
/// @brief AuthResult<T> alias used by every fallible operation.

#include "csa/core/result.hpp"
#include "csa/foundation/auth_error.hpp"

namespace csa::foundation {

/// Result type specialized with AuthError.
///
/// Example:
/// @code
///   AuthResult<std::string> subjectOf(const SessionToken& token) {
///       if (token.subjectId.empty()) {
///           return AuthResult<std::string>::err(
///               AuthError(ErrorCode::MalformedToken, "empty subject"));
///       }
///       return AuthResult<std::string>::ok(token.subjectId);
///   }
/// @endcode
template <typename T>
using AuthResult = csa::Result<T, AuthError>;

}  // namespace csa::foundation
