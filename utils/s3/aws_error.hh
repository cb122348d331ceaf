/*
 * Copyright (C) 2024-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#pragma once

#include "utils/http_client_error_processing.hh"
#include <fmt/format.h>
#include <optional>
#include <seastar/core/sstring.hh>
#include <string>
#include <string_view>
#include <unordered_map>

namespace aws {

using retryable = utils::http::retryable;

enum class aws_error_type : uint8_t {
    OK,
    UNKNOWN,
    // S3 error codes
    INTERNAL_FAILURE,
    SERVICE_UNAVAILABLE,
    SLOW_DOWN,
    THROTTLING,
    REQUEST_TIMEOUT,
    ACCESS_DENIED,
    INVALID_ACCESS_KEY_ID,
    SIGNATURE_DOES_NOT_MATCH,
    EXPIRED_TOKEN,
    NO_SUCH_BUCKET,
    NO_SUCH_KEY,
    NO_SUCH_UPLOAD,
    INVALID_PART,
    INVALID_PART_ORDER,
    ENTITY_TOO_SMALL,
    INVALID_ACTION,
    // Replies without an error document
    HTTP_NOT_FOUND,
    HTTP_FORBIDDEN,
    HTTP_UNAUTHORIZED,
    HTTP_OTHER,
    // Transport
    NETWORK_CONNECTION,
};

class aws_error {
    aws_error_type _type = aws_error_type::OK;
    std::string _message;
    retryable _is_retryable = retryable::no;

public:
    aws_error() = default;
    aws_error(aws_error_type error_type, retryable is_retryable);
    aws_error(aws_error_type error_type, std::string message, retryable is_retryable);

    aws_error_type get_error_type() const noexcept { return _type; }
    const std::string& get_error_message() const noexcept { return _message; }
    retryable is_retryable() const noexcept { return _is_retryable; }

    // Parses an S3 <Error> document. Returns disengaged optional if the body
    // isn't one.
    static std::optional<aws_error> parse(seastar::sstring&& body);
    static aws_error from_http_code(seastar::http::reply::status_type http_code);
    static aws_error from_system_error(const std::system_error& system_error);
};

using aws_errors = std::unordered_map<std::string_view, const aws_error>;
// S3 error codes this client knows how to classify
extern const aws_errors aws_error_map;

class aws_exception : public std::exception {
    aws_error _error;

public:
    explicit aws_exception(aws_error&& error) noexcept : _error(std::move(error)) {}

    const char* what() const noexcept override { return _error.get_error_message().c_str(); }
    const aws_error& error() const noexcept { return _error; }
};

} // namespace aws

template <>
struct fmt::formatter<aws::aws_error_type> : fmt::formatter<std::string_view> {
    auto format(aws::aws_error_type type, fmt::format_context& ctx) const -> decltype(ctx.out());
};
