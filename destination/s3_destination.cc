/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#include "s3_destination.hh"
#include "utils/log.hh"
#include "utils/s3/client.hh"
#include "utils/s3/client_helpers/stream_upload.hh"
#include "utils/s3/client_helpers/upload_sink.hh"
#include <seastar/core/coroutine.hh>
#include <seastar/coroutine/exception.hh>

using namespace seastar;

namespace destination {

static logging::logger dlog("s3_destination");

// The credentials are carried in s3_config but no request_signer is set up,
// requests go out unauthenticated.
shared_ptr<s3::object_store> make_s3_client(const s3_config& cfg) {
    return s3::client::make(cfg.make_endpoint_config(), cfg.bucket);
}

void report_bucket_status(const s3::bucket_status& status, const std::string& sanitized_config) {
    switch (status.status) {
    case s3::bucket_status::kind::ok:
        return;
    case s3::bucket_status::kind::not_found:
        throw invalid_configuration(s3_type, sanitized_config, "Bucket does not exist");
    case s3::bucket_status::kind::no_access:
        throw access_denied(s3_type, sanitized_config, "Access denied");
    case s3::bucket_status::kind::not_ok:
        throw invalid_configuration(s3_type, sanitized_config, status.message);
    }
}

future<> check_bucket_liveness(s3::object_store& store, const std::string& bucket, const std::string& sanitized_config, abort_source* as) {
    auto status = co_await store.head_bucket(bucket, as);
    dlog.debug("Bucket {} is {}", bucket, status);
    report_bucket_status(status, sanitized_config);
}

s3_destination::s3_destination(s3_config cfg, std::string sanitized_config, shared_ptr<s3::object_store> store, private_tag)
    : _cfg(std::move(cfg))
    , _sanitized_config(std::move(sanitized_config))
    , _store(std::move(store))
{}

future<std::unique_ptr<s3_destination>> s3_destination::make(std::string config, store_factory factory, abort_source* as) {
    auto sanitized = sanitize_config(config);
    auto cfg = parse_config(config);
    validate_config(cfg, sanitized);

    auto store = factory(cfg);
    std::exception_ptr ex;
    try {
        co_await check_bucket_liveness(*store, cfg.bucket, sanitized, as);
    } catch (...) {
        ex = std::current_exception();
    }
    if (ex) {
        dlog.warn("Cannot use bucket {}: {}", cfg.bucket, ex);
        co_await store->close();
        co_await coroutine::return_exception_ptr(std::move(ex));
    }

    dlog.info("Destination {} ready, endpoint {}", cfg.bucket, cfg.endpoint_url());
    co_return std::make_unique<s3_destination>(std::move(cfg), std::move(sanitized), std::move(store), private_tag{});
}

data_sink s3_destination::make_upload_sink(sstring key, abort_source* as) {
    return data_sink(std::make_unique<s3::upload_sink>(_store, std::move(key), _cfg.upload_opts(), as));
}

future<> s3_destination::upload(sstring key, input_stream<char>& in, abort_source* as) {
    s3::stream_upload up(_store, std::move(key), in, _cfg.upload_opts(), as);
    co_await up.upload();
}

future<> s3_destination::close() {
    return _store->close();
}

} // namespace destination
