/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#pragma once

#include "config.hh"
#include "errors.hh"
#include "utils/s3/object_store.hh"
#include <memory>
#include <seastar/core/iostream.hh>
#include <seastar/core/shared_ptr.hh>
#include <seastar/util/noncopyable_function.hh>

namespace destination {

using store_factory = seastar::noncopyable_function<seastar::shared_ptr<s3::object_store>(const s3_config&)>;

// Connects to the endpoint the configuration names, requests are unsigned
seastar::shared_ptr<s3::object_store> make_s3_client(const s3_config& cfg);

// Throws the initialization error the status stands for, if any
void report_bucket_status(const s3::bucket_status& status, const std::string& sanitized_config);

// Probes the bucket before anything is uploaded to it
seastar::future<> check_bucket_liveness(s3::object_store& store, const std::string& bucket, const std::string& sanitized_config, seastar::abort_source* as = nullptr);

// Write target backed by one bucket. Owns the store client, which is
// released by close().
class s3_destination {
    s3_config _cfg;
    std::string _sanitized_config;
    seastar::shared_ptr<s3::object_store> _store;

    struct private_tag {};

public:
    s3_destination(s3_config cfg, std::string sanitized_config, seastar::shared_ptr<s3::object_store> store, private_tag);

    // Parses and validates the configuration, creates the store and checks
    // that the bucket is reachable. The store is closed if any of it fails.
    static seastar::future<std::unique_ptr<s3_destination>> make(std::string config, store_factory factory = make_s3_client, seastar::abort_source* as = nullptr);

    static constexpr destination_type type() noexcept { return s3_type; }
    const s3_config& config() const noexcept { return _cfg; }
    const std::string& sanitized_config() const noexcept { return _sanitized_config; }

    // Everything put into the sink becomes the object named key, once the
    // sink is flushed
    seastar::data_sink make_upload_sink(seastar::sstring key, seastar::abort_source* as = nullptr);

    // Stores the whole input stream as the object named key
    seastar::future<> upload(seastar::sstring key, seastar::input_stream<char>& in, seastar::abort_source* as = nullptr);

    seastar::future<> close();
};

} // namespace destination
