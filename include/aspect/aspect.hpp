#pragma once

/**
 * Aspect C++ Interception Library
 *
 * Main include file - includes all public headers.
 */

// Error types
#include "errors.hpp"

// Ambient services
#include "logging.hpp"
#include "config.hpp"
#include "helpers.hpp"

// Suspension and cancellation
#include "cancellation.hpp"
#include "deferred.hpp"

// Call model and interceptor contract
#include "descriptor.hpp"
#include "context.hpp"
#include "interceptor.hpp"
#include "registration.hpp"

// Chain execution and proxies
#include "chain.hpp"
#include "proxy.hpp"
#include "macros.hpp"
#include "builder.hpp"

// Repository capability
#include "repository.hpp"

// Reference interceptors
#include "history/history_recorder.hpp"
#include "history/user_context.hpp"
#include "history/history_interceptor.hpp"
#include "interceptors/logging_interceptor.hpp"
