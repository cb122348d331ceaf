/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#pragma once

#include "utils/s3/client.hh"
#include "utils/s3/client_helpers/multipart_upload.hh"
#include <optional>
#include <string>
#include <string_view>

namespace YAML {
class Node;
}

namespace destination {

struct s3_credentials {
    std::string access_key;
    std::string secret_key;
    std::string region;
};

// Configuration of an S3 destination, e.g.
//
//   {"bucket": "b", "credentials": {"accessKey": "...", "secretKey": "...", "region": "us-east-1"}}
//
// optionally with "endpoint", "partSize", "maxPartsInFlight" and
// "maxConnections".
struct s3_config {
    std::string bucket;
    s3_credentials credentials;
    std::optional<std::string> endpoint;
    size_t part_size = s3::upload_options{}.part_size;
    unsigned max_parts_in_flight = s3::upload_options{}.max_parts_in_flight;
    std::optional<unsigned> max_connections;

    // https://s3.{region}.amazonaws.com unless an endpoint is configured
    std::string endpoint_url() const;
    s3::upload_options upload_opts() const;
    s3::endpoint_config_ptr make_endpoint_config() const;

    static s3_config decode(const YAML::Node& node);
    // Throws malformed_configuration
    static s3_config parse(std::string_view text);
    // Encodes the configuration with the credentials redacted
    std::string to_sanitized_string() const;
};

s3_config parse_config(std::string_view text);

// The configuration with its credentials redacted, or an empty object if
// the text can't be decoded
std::string sanitize_config(std::string_view text);

// Throws invalid_configuration if the configuration can't be used
void validate_config(const s3_config& cfg, const std::string& sanitized);

} // namespace destination
