/*
 * Copyright (C) 2022-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#pragma once

#include "object_store.hh"
#include "retry_strategy.hh"
#include "retryable_http_client.hh"
#include <chrono>
#include <optional>
#include <seastar/core/metrics_registration.hh>
#include <seastar/core/shared_ptr.hh>
#include <seastar/http/request.hh>
#include <seastar/util/noncopyable_function.hh>

namespace s3 {

using s3_clock = std::chrono::steady_clock;

struct endpoint_config {
    seastar::sstring host;
    unsigned port = 443;
    bool use_https = true;
    std::optional<unsigned> max_connections;
};

using endpoint_config_ptr = seastar::lw_shared_ptr<endpoint_config>;

// Called on every request right before it's sent, e.g. to add
// authorization headers. Requests go out unsigned if there's none.
using request_signer = seastar::noncopyable_function<seastar::future<>(seastar::http::request&)>;

// object_store backed by the S3 REST API. Objects are addressed path-style,
// i.e. as /{bucket}/{key} on the endpoint host.
class client : public object_store, public seastar::enable_shared_from_this<client> {
    struct io_stats {
        uint64_t ops = 0;
        uint64_t bytes = 0;
        std::chrono::duration<double> duration = std::chrono::duration<double>(0);

        void update(uint64_t len, std::chrono::duration<double> lat) {
            ops++;
            bytes += len;
            duration += lat;
        }
    };

    endpoint_config_ptr _cfg;
    seastar::sstring _bucket;
    request_signer _signer;
    std::unique_ptr<aws::retry_strategy> _retry_strategy;
    aws::retryable_http_client _http;
    io_stats _write_stats;
    seastar::metrics::metric_groups _metrics;

    struct private_tag {};

    seastar::sstring object_path(const seastar::sstring& object_name) const;
    void register_metrics();
    seastar::future<> make_request(seastar::http::request req,
                                   seastar::http::experimental::client::reply_handler handle,
                                   std::optional<seastar::http::reply::status_type> expected = std::nullopt,
                                   seastar::abort_source* as = nullptr);

public:
    client(endpoint_config_ptr cfg, seastar::sstring bucket, request_signer signer, private_tag, std::unique_ptr<aws::retry_strategy> rs = nullptr);

    static seastar::shared_ptr<client> make(endpoint_config_ptr cfg, seastar::sstring bucket, request_signer signer = {}, std::unique_ptr<aws::retry_strategy> rs = nullptr);

    virtual seastar::future<seastar::sstring> begin_multipart_upload(seastar::sstring object_name, seastar::abort_source* as = nullptr) override;
    virtual seastar::future<seastar::sstring> upload_part(seastar::sstring object_name, seastar::sstring upload_id, unsigned part_number, part_data data, seastar::abort_source* as = nullptr) override;
    virtual seastar::future<> complete_multipart_upload(seastar::sstring object_name, seastar::sstring upload_id, std::vector<part_descriptor> parts, seastar::abort_source* as = nullptr) override;
    virtual seastar::future<> abort_multipart_upload(seastar::sstring object_name, seastar::sstring upload_id) override;
    virtual seastar::future<> put_object(seastar::sstring object_name, part_data data, seastar::abort_source* as = nullptr) override;
    // Never fails. Transport and unexpected store faults are reported as
    // not_ok with a description.
    virtual seastar::future<bucket_status> head_bucket(seastar::sstring bucket, seastar::abort_source* as = nullptr) override;
    virtual seastar::future<> close() override;
};

} // namespace s3
