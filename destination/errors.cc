/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#include "errors.hh"

namespace destination {

destination_error::destination_error(destination_type type, std::string sanitized_config, const std::string& message)
    : std::runtime_error(message)
    , _type(type)
    , _sanitized_config(std::move(sanitized_config))
{}

} // namespace destination
