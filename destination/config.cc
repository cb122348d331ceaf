/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#include "config.hh"
#include "errors.hh"
#include "utils/http.hh"
#include <yaml-cpp/yaml.h>

using namespace std::string_literals;

namespace destination {

std::string s3_config::endpoint_url() const {
    return endpoint.value_or(fmt::format("https://s3.{}.amazonaws.com", credentials.region));
}

s3::upload_options s3_config::upload_opts() const {
    return s3::upload_options{
        .part_size = part_size,
        .max_parts_in_flight = max_parts_in_flight,
    };
}

s3::endpoint_config_ptr s3_config::make_endpoint_config() const {
    auto url = utils::http::parse_simple_url(endpoint_url());
    auto cfg = seastar::make_lw_shared<s3::endpoint_config>();
    cfg->host = url.host;
    cfg->port = url.port;
    cfg->use_https = url.is_https();
    cfg->max_connections = max_connections;
    return cfg;
}

s3_config s3_config::decode(const YAML::Node& node) {
    if (!node.IsMap()) {
        throw std::invalid_argument("configuration is not an object");
    }
    auto creds = node["credentials"];
    if (!creds || !creds.IsMap()) {
        throw std::invalid_argument("missing credentials");
    }

    auto get_opt = [](auto& node, const std::string& key, auto def) {
        auto tmp = node[key];
        return tmp ? tmp.template as<std::decay_t<decltype(def)>>() : def;
    };

    s3_config cfg;
    cfg.bucket = node["bucket"].as<std::string>();
    cfg.credentials.access_key = creds["accessKey"].as<std::string>();
    cfg.credentials.secret_key = creds["secretKey"].as<std::string>();
    cfg.credentials.region = creds["region"].as<std::string>();
    if (auto ep = node["endpoint"]) {
        cfg.endpoint = ep.as<std::string>();
    }
    cfg.part_size = get_opt(node, "partSize", cfg.part_size);
    cfg.max_parts_in_flight = get_opt(node, "maxPartsInFlight", cfg.max_parts_in_flight);
    if (auto mc = node["maxConnections"]) {
        cfg.max_connections = mc.as<unsigned>();
    }
    return cfg;
}

s3_config s3_config::parse(std::string_view text) {
    try {
        return decode(YAML::Load(std::string(text)));
    } catch (const YAML::Exception& e) {
        throw malformed_configuration(s3_type, sanitize_config(text), fmt::format("Malformed configuration: {}", e.what()));
    } catch (const std::invalid_argument& e) {
        throw malformed_configuration(s3_type, sanitize_config(text), fmt::format("Malformed configuration: {}", e.what()));
    }
}

std::string s3_config::to_sanitized_string() const {
    const auto redacted = "<REDACTED>"s;

    YAML::Emitter out;
    out.SetMapFormat(YAML::Flow);
    out.SetStringFormat(YAML::DoubleQuoted);
    out << YAML::BeginMap;
    out << YAML::Key << "bucket" << YAML::Value << bucket;
    out << YAML::Key << "credentials" << YAML::Value << YAML::BeginMap
        << YAML::Key << "accessKey" << YAML::Value << redacted
        << YAML::Key << "secretKey" << YAML::Value << redacted
        << YAML::Key << "region" << YAML::Value << redacted
        << YAML::EndMap;
    if (endpoint) {
        out << YAML::Key << "endpoint" << YAML::Value << *endpoint;
    }
    out << YAML::Key << "partSize" << YAML::Value << part_size;
    out << YAML::Key << "maxPartsInFlight" << YAML::Value << max_parts_in_flight;
    if (max_connections) {
        out << YAML::Key << "maxConnections" << YAML::Value << *max_connections;
    }
    out << YAML::EndMap;
    return out.c_str();
}

s3_config parse_config(std::string_view text) {
    return s3_config::parse(text);
}

std::string sanitize_config(std::string_view text) {
    try {
        return s3_config::decode(YAML::Load(std::string(text))).to_sanitized_string();
    } catch (const YAML::Exception&) {
        return "{}";
    } catch (const std::invalid_argument&) {
        return "{}";
    }
}

void validate_config(const s3_config& cfg, const std::string& sanitized) {
    auto invalid = [&] (std::string reason) {
        return invalid_configuration(s3_type, sanitized, std::move(reason));
    };

    if (cfg.bucket.empty()) {
        throw invalid("Bucket name is empty");
    }
    if (cfg.part_size < s3::aws_minimum_part_size) {
        throw invalid(fmt::format("Part size {} is below the minimum of {} bytes", cfg.part_size, s3::aws_minimum_part_size));
    }
    if (cfg.max_parts_in_flight == 0) {
        throw invalid("At least one part must be allowed in flight");
    }
    if (cfg.max_connections && *cfg.max_connections == 0) {
        throw invalid("At least one connection must be allowed");
    }
    try {
        utils::http::parse_simple_url(cfg.endpoint_url());
    } catch (const std::invalid_argument& e) {
        throw invalid(fmt::format("Invalid endpoint: {}", e.what()));
    }
}

} // namespace destination
