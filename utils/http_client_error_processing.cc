/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#include "http_client_error_processing.hh"
#include <seastar/http/exception.hh>

namespace utils::http {

retryable from_http_code(seastar::http::reply::status_type http_code) {
    auto code = static_cast<int>(http_code);
    // 408 Request Timeout, 429 Too Many Requests, all of 5xx
    if (code == 408 || code == 429 || code >= 500) {
        return retryable::yes;
    }
    return retryable::no;
}

retryable from_system_error(const std::system_error& system_error) {
    switch (system_error.code().value()) {
    case ECONNRESET:
    case ECONNREFUSED:
    case ECONNABORTED:
    case ETIMEDOUT:
    case EPIPE:
    case EHOSTUNREACH:
    case ENETUNREACH:
    case EAGAIN:
        return retryable::yes;
    default:
        return retryable::no;
    }
}

retryable classify_exception(std::exception_ptr eptr) {
    while (eptr) {
        try {
            std::rethrow_exception(eptr);
        } catch (const std::system_error& e) {
            return from_system_error(e);
        } catch (const seastar::httpd::unexpected_status_error& e) {
            return from_http_code(e.status());
        } catch (const std::exception& e) {
            try {
                std::rethrow_if_nested(e);
            } catch (...) {
                eptr = std::current_exception();
                continue;
            }
            return retryable::no;
        } catch (...) {
            return retryable::no;
        }
    }
    return retryable::no;
}

} // namespace utils::http
