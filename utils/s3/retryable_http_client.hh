/*
 * Copyright (C) 2025-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#pragma once

#include "retry_strategy.hh"
#include "utils/exceptions.hh"
#include <seastar/core/abort_source.hh>
#include <seastar/http/client.hh>

namespace aws {

// Translates whatever a request failed with into an errno-classified
// storage_io_error (ENOENT, EACCES or EIO)
storage_io_error map_s3_client_exception(std::exception_ptr ex);

// HTTP client which turns S3 error replies into aws_exception and repeats
// requests as long as the retry strategy allows it. Requests (including
// their body writers) must therefore be replayable.
class retryable_http_client {
public:
    retryable_http_client(std::unique_ptr<seastar::http::experimental::connection_factory>&& factory,
                          unsigned max_conn,
                          const retry_strategy& retry_strategy);

    seastar::future<> make_request(seastar::http::request req,
                                   seastar::http::experimental::client::reply_handler handle,
                                   std::optional<seastar::http::reply::status_type> expected = std::nullopt,
                                   seastar::abort_source* as = nullptr);
    seastar::future<> close();

    seastar::http::experimental::client& get_http_client() { return http; }

private:
    seastar::future<> do_retryable_request(seastar::http::request req,
                                           seastar::http::experimental::client::reply_handler handler,
                                           seastar::abort_source* as);

    seastar::http::experimental::client http;
    const retry_strategy& _retry_strategy;
};

} // namespace aws
