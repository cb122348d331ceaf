/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#pragma once

#include <fmt/format.h>
#include <stdexcept>
#include <string>
#include <string_view>

namespace destination {

struct destination_type {
    std::string_view name;
    unsigned version;

    bool operator==(const destination_type&) const = default;
};

inline constexpr destination_type s3_type{"s3", 1};

// Base of all the errors a destination can fail to initialize with. The
// configuration it carries is the sanitized one, credentials never end up in
// an error.
class destination_error : public std::runtime_error {
    destination_type _type;
    std::string _sanitized_config;
public:
    destination_error(destination_type type, std::string sanitized_config, const std::string& message);

    const destination_type& type() const noexcept { return _type; }
    const std::string& sanitized_config() const noexcept { return _sanitized_config; }
};

// The configuration couldn't be decoded
class malformed_configuration : public destination_error {
public:
    using destination_error::destination_error;
};

// The configuration was decoded, but cannot be used, e.g. the bucket it
// names doesn't exist
class invalid_configuration : public destination_error {
public:
    using destination_error::destination_error;
};

class access_denied : public destination_error {
public:
    using destination_error::destination_error;
};

} // namespace destination

template <>
struct fmt::formatter<destination::destination_type> : fmt::formatter<std::string_view> {
    auto format(const destination::destination_type& t, fmt::format_context& ctx) const {
        return fmt::format_to(ctx.out(), "{} v{}", t.name, t.version);
    }
};
