#pragma once

/// @file csa.hpp
/// @brief Umbrella header for the credential and session-token authority.

#include "csa/version.hpp"
#include "csa/core/result.hpp"

#include "csa/foundation/auth_error.hpp"
#include "csa/foundation/auth_logger.hpp"
#include "csa/foundation/auth_result.hpp"
#include "csa/foundation/clock.hpp"
#include "csa/foundation/config_manager.hpp"
#include "csa/foundation/error_code.hpp"
#include "csa/foundation/job_scheduler.hpp"
#include "csa/foundation/request_context.hpp"

#include "csa/auth/auth_config_loader.hpp"
#include "csa/auth/auth_session_coordinator.hpp"
#include "csa/auth/auth_types.hpp"
#include "csa/auth/csrf_guard.hpp"
#include "csa/auth/password_hasher.hpp"
#include "csa/auth/rate_limiter.hpp"
#include "csa/auth/revocation_set.hpp"
#include "csa/auth/revocation_store.hpp"
#include "csa/auth/token_authority.hpp"
#include "csa/auth/user_store.hpp"
