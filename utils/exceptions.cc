/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#include "utils/exceptions.hh"

#include <fmt/format.h>

storage_io_error::storage_io_error(std::error_code c, std::string s)
    : _code(std::move(c))
    , _what(fmt::format("{}: {}", s, _code.message()))
{}

storage_io_error::storage_io_error(int err, std::string s)
    : storage_io_error(std::error_code(err, std::system_category()), std::move(s))
{}
