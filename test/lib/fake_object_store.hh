/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#pragma once

#include "utils/s3/object_store.hh"
#include <chrono>
#include <functional>
#include <map>
#include <optional>
#include <stdexcept>

namespace tests {

// Raised by fake_object_store for the calls it's told to fail
class injected_store_error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// In-memory object_store which records every call made to it and can be
// told to fail or to delay some of them
class fake_object_store : public s3::object_store {
public:
    struct uploaded_part {
        unsigned part_number;
        seastar::sstring data;
    };

    // What happened so far
    unsigned begin_calls = 0;
    unsigned complete_calls = 0;
    unsigned abort_calls = 0;
    unsigned put_calls = 0;
    unsigned head_calls = 0;
    unsigned close_calls = 0;
    // Parts in the order the store acknowledged them
    std::vector<uploaded_part> acked_parts;
    std::vector<unsigned> failed_parts;
    std::vector<s3::part_descriptor> completed_parts;
    std::vector<seastar::sstring> aborted_ids;
    std::optional<seastar::sstring> put_payload;
    // Objects that were completed, by name
    std::map<seastar::sstring, seastar::sstring> objects;
    unsigned max_parts_in_flight = 0;

    // What should happen next
    bool fail_begin = false;
    bool fail_complete = false;
    bool fail_abort = false;
    bool fail_put = false;
    std::optional<unsigned> fail_part;
    std::function<std::chrono::milliseconds(unsigned)> part_delay;
    s3::bucket_status head_status;

    virtual seastar::future<seastar::sstring> begin_multipart_upload(seastar::sstring object_name, seastar::abort_source* as = nullptr) override;
    virtual seastar::future<seastar::sstring> upload_part(seastar::sstring object_name, seastar::sstring upload_id, unsigned part_number, s3::part_data data, seastar::abort_source* as = nullptr) override;
    virtual seastar::future<> complete_multipart_upload(seastar::sstring object_name, seastar::sstring upload_id, std::vector<s3::part_descriptor> parts, seastar::abort_source* as = nullptr) override;
    virtual seastar::future<> abort_multipart_upload(seastar::sstring object_name, seastar::sstring upload_id) override;
    virtual seastar::future<> put_object(seastar::sstring object_name, s3::part_data data, seastar::abort_source* as = nullptr) override;
    virtual seastar::future<s3::bucket_status> head_bucket(seastar::sstring bucket, seastar::abort_source* as = nullptr) override;
    virtual seastar::future<> close() override;

    // Sizes of the acknowledged parts, ordered by part number
    std::vector<size_t> part_sizes() const;

private:
    std::map<unsigned, seastar::sstring> _parts;
    unsigned _in_flight = 0;
    unsigned _next_upload_id = 1;
};

} // namespace tests
