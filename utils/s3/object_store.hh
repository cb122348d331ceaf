/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#pragma once

#include <fmt/format.h>
#include <seastar/core/abort_source.hh>
#include <seastar/core/future.hh>
#include <seastar/core/sstring.hh>
#include <seastar/core/temporary_buffer.hh>
#include <vector>

namespace s3 {

// "Each part must be at least 5 MB in size, except the last part."
// https://docs.aws.amazon.com/AmazonS3/latest/API/API_UploadPart.html
static constexpr size_t aws_minimum_part_size = 5 * 1024 * 1024;
// "Part numbers can be any number from 1 to 10,000, inclusive."
static constexpr unsigned aws_maximum_parts_in_upload = 10'000;

// Bytes of a part (or of a whole small object) kept as the fragments
// they were received in.
class part_data {
    std::vector<seastar::temporary_buffer<char>> _bufs;
    size_t _size = 0;
public:
    part_data() = default;
    part_data(part_data&&) noexcept = default;
    part_data& operator=(part_data&&) noexcept = default;

    void put(seastar::temporary_buffer<char> buf) {
        _size += buf.size();
        _bufs.push_back(std::move(buf));
    }

    size_t size() const noexcept { return _size; }
    bool empty() const noexcept { return _size == 0; }
    const std::vector<seastar::temporary_buffer<char>>& buffers() const noexcept { return _bufs; }
};

// The store's acknowledgment of a stored part. The etag is opaque and is
// required to reference the part when completing the upload.
struct part_descriptor {
    unsigned part_number;
    seastar::sstring etag;
};

struct bucket_status {
    enum class kind {
        ok,
        not_found,
        no_access,
        not_ok,
    };

    kind status = kind::ok;
    // Store provided description, set for not_ok
    seastar::sstring message;
};

// Capabilities of a remote object store that are needed to materialize an
// object with the multipart upload protocol. Methods can be invoked
// concurrently, except that a single upload id is only ever completed or
// aborted once.
//
// Failures are reported with exceptional futures. Retrying transient
// faults, if any, is up to the implementation.
class object_store {
public:
    virtual ~object_store() = default;

    // Returns the upload id of the new multipart upload for the object
    virtual seastar::future<seastar::sstring> begin_multipart_upload(seastar::sstring object_name, seastar::abort_source* as = nullptr) = 0;

    // Returns the etag of the uploaded part
    virtual seastar::future<seastar::sstring> upload_part(seastar::sstring object_name, seastar::sstring upload_id, unsigned part_number, part_data data, seastar::abort_source* as = nullptr) = 0;

    // Parts must be listed in increasing part_number order
    virtual seastar::future<> complete_multipart_upload(seastar::sstring object_name, seastar::sstring upload_id, std::vector<part_descriptor> parts, seastar::abort_source* as = nullptr) = 0;

    virtual seastar::future<> abort_multipart_upload(seastar::sstring object_name, seastar::sstring upload_id) = 0;

    // Single-shot upload, used for objects that are smaller than one part
    virtual seastar::future<> put_object(seastar::sstring object_name, part_data data, seastar::abort_source* as = nullptr) = 0;

    virtual seastar::future<bucket_status> head_bucket(seastar::sstring bucket, seastar::abort_source* as = nullptr) = 0;

    // Releases connections and any other resources. No other method may be
    // called afterwards.
    virtual seastar::future<> close() = 0;
};

} // namespace s3

template <>
struct fmt::formatter<s3::bucket_status> : fmt::formatter<std::string_view> {
    auto format(const s3::bucket_status& st, fmt::format_context& ctx) const {
        switch (st.status) {
        case s3::bucket_status::kind::ok:
            return fmt::format_to(ctx.out(), "ok");
        case s3::bucket_status::kind::not_found:
            return fmt::format_to(ctx.out(), "not found");
        case s3::bucket_status::kind::no_access:
            return fmt::format_to(ctx.out(), "no access");
        case s3::bucket_status::kind::not_ok:
            break;
        }
        return fmt::format_to(ctx.out(), "not ok ({})", st.message);
    }
};
