/*
 * Copyright (C) 2024-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#include "aws_error.hh"
#include "utils/s3/utils/client_utils.hh"

namespace aws {

aws_error::aws_error(aws_error_type error_type, retryable is_retryable)
    : _type(error_type)
    , _is_retryable(is_retryable)
{}

aws_error::aws_error(aws_error_type error_type, std::string message, retryable is_retryable)
    : _type(error_type)
    , _message(std::move(message))
    , _is_retryable(is_retryable)
{}

std::optional<aws_error> aws_error::parse(seastar::sstring&& body) {
    if (body.empty()) {
        return std::nullopt;
    }

    auto doc = std::make_unique<rapidxml::xml_document<>>();
    try {
        doc->parse<0>(body.data());
    } catch (const rapidxml::parse_error&) {
        return std::nullopt;
    }

    auto* error_node = doc->first_node("Error");
    if (!error_node) {
        // Some endpoints wrap it as <ErrorResponse><Error>...</Error></ErrorResponse>
        auto* wrapper = doc->first_node("ErrorResponse");
        error_node = wrapper ? wrapper->first_node("Error") : nullptr;
    }
    if (!error_node) {
        return std::nullopt;
    }

    auto* code_node = error_node->first_node("Code");
    auto* message_node = error_node->first_node("Message");
    std::string code = code_node ? code_node->value() : "";
    std::string message = message_node ? message_node->value() : "";

    if (auto it = aws_error_map.find(code); it != aws_error_map.end()) {
        return aws_error(it->second.get_error_type(), fmt::format("{}: {}", code, message), it->second.is_retryable());
    }
    return aws_error(aws_error_type::UNKNOWN, fmt::format("{}: {}", code, message), retryable::no);
}

aws_error aws_error::from_http_code(seastar::http::reply::status_type http_code) {
    auto message = fmt::format("HTTP status {}", static_cast<int>(http_code));
    switch (static_cast<int>(http_code)) {
    case 401:
        return aws_error(aws_error_type::HTTP_UNAUTHORIZED, std::move(message), retryable::no);
    case 403:
        return aws_error(aws_error_type::HTTP_FORBIDDEN, std::move(message), retryable::no);
    case 404:
        return aws_error(aws_error_type::HTTP_NOT_FOUND, std::move(message), retryable::no);
    default:
        return aws_error(aws_error_type::HTTP_OTHER, std::move(message), utils::http::from_http_code(http_code));
    }
}

aws_error aws_error::from_system_error(const std::system_error& system_error) {
    return aws_error(aws_error_type::NETWORK_CONNECTION, system_error.what(), utils::http::from_system_error(system_error));
}

const aws_errors aws_error_map{
    {"InternalError", aws_error(aws_error_type::INTERNAL_FAILURE, retryable::yes)},
    {"ServiceUnavailable", aws_error(aws_error_type::SERVICE_UNAVAILABLE, retryable::yes)},
    {"SlowDown", aws_error(aws_error_type::SLOW_DOWN, retryable::yes)},
    {"Throttling", aws_error(aws_error_type::THROTTLING, retryable::yes)},
    {"ThrottlingException", aws_error(aws_error_type::THROTTLING, retryable::yes)},
    {"RequestTimeout", aws_error(aws_error_type::REQUEST_TIMEOUT, retryable::yes)},
    {"AccessDenied", aws_error(aws_error_type::ACCESS_DENIED, retryable::no)},
    {"InvalidAccessKeyId", aws_error(aws_error_type::INVALID_ACCESS_KEY_ID, retryable::no)},
    {"SignatureDoesNotMatch", aws_error(aws_error_type::SIGNATURE_DOES_NOT_MATCH, retryable::no)},
    {"ExpiredToken", aws_error(aws_error_type::EXPIRED_TOKEN, retryable::no)},
    {"NoSuchBucket", aws_error(aws_error_type::NO_SUCH_BUCKET, retryable::no)},
    {"NoSuchKey", aws_error(aws_error_type::NO_SUCH_KEY, retryable::no)},
    {"NoSuchUpload", aws_error(aws_error_type::NO_SUCH_UPLOAD, retryable::no)},
    {"InvalidPart", aws_error(aws_error_type::INVALID_PART, retryable::no)},
    {"InvalidPartOrder", aws_error(aws_error_type::INVALID_PART_ORDER, retryable::no)},
    {"EntityTooSmall", aws_error(aws_error_type::ENTITY_TOO_SMALL, retryable::no)},
    {"InvalidAction", aws_error(aws_error_type::INVALID_ACTION, retryable::no)},
};

} // namespace aws

auto fmt::formatter<aws::aws_error_type>::format(aws::aws_error_type type, fmt::format_context& ctx) const -> decltype(ctx.out()) {
    using enum aws::aws_error_type;
    std::string_view name = "UNKNOWN";
    switch (type) {
    case OK: name = "OK"; break;
    case UNKNOWN: name = "UNKNOWN"; break;
    case INTERNAL_FAILURE: name = "INTERNAL_FAILURE"; break;
    case SERVICE_UNAVAILABLE: name = "SERVICE_UNAVAILABLE"; break;
    case SLOW_DOWN: name = "SLOW_DOWN"; break;
    case THROTTLING: name = "THROTTLING"; break;
    case REQUEST_TIMEOUT: name = "REQUEST_TIMEOUT"; break;
    case ACCESS_DENIED: name = "ACCESS_DENIED"; break;
    case INVALID_ACCESS_KEY_ID: name = "INVALID_ACCESS_KEY_ID"; break;
    case SIGNATURE_DOES_NOT_MATCH: name = "SIGNATURE_DOES_NOT_MATCH"; break;
    case EXPIRED_TOKEN: name = "EXPIRED_TOKEN"; break;
    case NO_SUCH_BUCKET: name = "NO_SUCH_BUCKET"; break;
    case NO_SUCH_KEY: name = "NO_SUCH_KEY"; break;
    case NO_SUCH_UPLOAD: name = "NO_SUCH_UPLOAD"; break;
    case INVALID_PART: name = "INVALID_PART"; break;
    case INVALID_PART_ORDER: name = "INVALID_PART_ORDER"; break;
    case ENTITY_TOO_SMALL: name = "ENTITY_TOO_SMALL"; break;
    case INVALID_ACTION: name = "INVALID_ACTION"; break;
    case HTTP_NOT_FOUND: name = "HTTP_NOT_FOUND"; break;
    case HTTP_FORBIDDEN: name = "HTTP_FORBIDDEN"; break;
    case HTTP_UNAUTHORIZED: name = "HTTP_UNAUTHORIZED"; break;
    case HTTP_OTHER: name = "HTTP_OTHER"; break;
    case NETWORK_CONNECTION: name = "NETWORK_CONNECTION"; break;
    }
    return fmt::formatter<std::string_view>::format(name, ctx);
}
