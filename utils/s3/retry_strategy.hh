/*
 * Copyright (C) 2024-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#pragma once
#include <chrono>
#include <cstdint>
#include "utils/s3/aws_error.hh"

namespace aws {

class retry_strategy {
public:
    virtual ~retry_strategy() = default;
    // Returns true if the error can be retried given the error and the number of times already tried.
    [[nodiscard]] virtual retryable should_retry(const aws_error& error, unsigned attempted_retries) const = 0;

    // Calculates the time the client should wait before attempting another request based on the error and attempted_retries count.
    [[nodiscard]] virtual std::chrono::milliseconds delay_before_retry(const aws_error& error, unsigned attempted_retries) const = 0;

    [[nodiscard]] virtual unsigned get_max_retries() const = 0;
};

// Exponential backoff: no delay for the first retry, then
// 2^attempt * scale_factor milliseconds.
class default_retry_strategy : public retry_strategy {
    unsigned _max_retries;
    unsigned _scale_factor;

public:
    explicit default_retry_strategy(unsigned max_retries = 10, unsigned scale_factor = 25);

    [[nodiscard]] retryable should_retry(const aws_error& error, unsigned attempted_retries) const override;

    [[nodiscard]] std::chrono::milliseconds delay_before_retry(const aws_error& error, unsigned attempted_retries) const override;

    [[nodiscard]] unsigned get_max_retries() const override { return _max_retries; }
};

} // namespace aws
