/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#pragma once

#include <exception>
#include <string>
#include <system_error>

// Failure of a remote storage request, classified by an errno value
// (ENOENT, EACCES, EIO, ...) so that callers don't need to know the store.
class storage_io_error : public std::exception {
private:
    std::error_code _code;
    std::string _what;
public:
    storage_io_error(std::error_code c, std::string s);
    storage_io_error(int err, std::string s);

    virtual const char* what() const noexcept override {
        return _what.c_str();
    }

    const std::error_code& code() const noexcept { return _code; }
};
