/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#pragma once
#include <cerrno>
#include <exception>
#include <seastar/http/reply.hh>
#include <seastar/util/bool_class.hh>
#include <system_error>

namespace utils::http {

using retryable = seastar::bool_class<struct is_retryable>;

// Throttling, timeouts and server side errors
retryable from_http_code(seastar::http::reply::status_type http_code);

// Connection level faults (reset, refused, timed out, ...)
retryable from_system_error(const std::system_error& system_error);

// Walks the chain of nested exceptions and classifies the first one which
// is a system error or an unexpected HTTP status. Anything else is not
// retryable.
retryable classify_exception(std::exception_ptr eptr);

} // namespace utils::http
