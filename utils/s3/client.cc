/*
 * Copyright (C) 2022-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#include <fmt/format.h>
#include <exception>
#include <memory>
#include <seastar/core/coroutine.hh>
#include <seastar/core/iostream.hh>
#include <seastar/core/metrics.hh>
#include <seastar/coroutine/exception.hh>
#include <seastar/http/request.hh>
#include <seastar/http/url.hh>
#include <seastar/util/short_streams.hh>
#include "utils/exceptions.hh"
#include "utils/http.hh"
#include "utils/log.hh"
#include "utils/s3/client.hh"
#include "utils/s3/utils/client_utils.hh"

using namespace seastar;

namespace s3 {

extern logging::logger s3l;

static future<> ignore_reply(const http::reply& rep, input_stream<char>&& in_) {
    auto in = std::move(in_);
    co_await util::skip_entire_stream(in);
}

// Writes the part without consuming it, the body may be sent more than
// once if the request is retried
static future<> write_part_data(const part_data& data, output_stream<char>&& out_) {
    auto out = std::move(out_);
    std::exception_ptr ex;
    try {
        for (const auto& buf : data.buffers()) {
            co_await out.write(buf.get(), buf.size());
        }
        co_await out.flush();
    } catch (...) {
        ex = std::current_exception();
    }
    co_await out.close();
    if (ex) {
        co_await coroutine::return_exception_ptr(std::move(ex));
    }
}

client::client(endpoint_config_ptr cfg, sstring bucket, request_signer signer, private_tag, std::unique_ptr<aws::retry_strategy> rs)
        : _cfg(std::move(cfg))
        , _bucket(std::move(bucket))
        , _signer(std::move(signer))
        , _retry_strategy(rs ? std::move(rs) : std::make_unique<aws::default_retry_strategy>())
        , _http(std::make_unique<utils::http::dns_connection_factory>(_cfg->host, _cfg->port, _cfg->use_https, s3l),
                _cfg->max_connections.value_or(1), *_retry_strategy) {
    register_metrics();
}

shared_ptr<client> client::make(endpoint_config_ptr cfg, sstring bucket, request_signer signer, std::unique_ptr<aws::retry_strategy> rs) {
    return seastar::make_shared<client>(std::move(cfg), std::move(bucket), std::move(signer), private_tag{}, std::move(rs));
}

void client::register_metrics() {
    namespace sm = seastar::metrics;
    auto ep_label = sm::label("endpoint")(_cfg->host);
    auto bucket_label = sm::label("bucket")(_bucket);
    _metrics.add_group("s3", {
        sm::make_gauge("nr_connections", [this] { return _http.get_http_client().connections_nr(); },
                sm::description("Total number of connections"), {ep_label, bucket_label}),
        sm::make_gauge("nr_active_connections", [this] { return _http.get_http_client().connections_nr() - _http.get_http_client().idle_connections_nr(); },
                sm::description("Total number of connections with running requests"), {ep_label, bucket_label}),
        sm::make_counter("total_new_connections", [this] { return _http.get_http_client().total_new_connections_nr(); },
                sm::description("Total number of new connections created so far"), {ep_label, bucket_label}),
        sm::make_counter("total_write_requests", [this] { return _write_stats.ops; },
                sm::description("Total number of object write requests"), {ep_label, bucket_label}),
        sm::make_counter("total_write_bytes", [this] { return _write_stats.bytes; },
                sm::description("Total number of bytes written to objects"), {ep_label, bucket_label}),
        sm::make_counter("total_write_latency_sec", [this] { return _write_stats.duration.count(); },
                sm::description("Total time spend writing data to objects"), {ep_label, bucket_label}),
    });
}

// Each '/'-separated segment of the key is percent-encoded, so that keys
// with '?', '#', '%' or spaces address the object and not a query.
sstring client::object_path(const sstring& object_name) const {
    sstring path = format("/{}", _bucket);
    std::string_view key = object_name;
    while (true) {
        auto pos = key.find('/');
        path += "/";
        path += http::internal::url_encode(key.substr(0, pos));
        if (pos == std::string_view::npos) {
            break;
        }
        key.remove_prefix(pos + 1);
    }
    return path;
}

future<> client::make_request(http::request req, http::experimental::client::reply_handler handle, std::optional<http::reply::status_type> expected, seastar::abort_source* as) {
    if (_signer) {
        co_await _signer(req);
    }
    co_await _http.make_request(std::move(req), std::move(handle), expected, as);
}

future<sstring> client::begin_multipart_upload(sstring object_name, seastar::abort_source* as) {
    auto path = object_path(object_name);
    s3l.trace("POST uploads {}", path);
    auto req = http::request::make("POST", _cfg->host, path);
    req.query_parameters["uploads"] = "";
    sstring upload_id;
    co_await make_request(std::move(req), [&upload_id] (const http::reply& rep, input_stream<char>&& in_) -> future<> {
        auto in = std::move(in_);
        auto body = co_await util::read_entire_stream_contiguous(in);
        upload_id = parse_multipart_upload_id(body);
        if (upload_id.empty()) {
            co_await coroutine::return_exception(std::runtime_error("cannot parse multipart upload id"));
        }
    }, http::reply::status_type::ok, as);
    co_return upload_id;
}

future<sstring> client::upload_part(sstring object_name, sstring upload_id, unsigned part_number, part_data data, seastar::abort_source* as) {
    auto path = object_path(object_name);
    s3l.trace("PUT part {} {} bytes (upload id {})", part_number, data.size(), upload_id);
    auto req = http::request::make("PUT", _cfg->host, path);
    auto len = data.size();
    req.query_parameters.emplace("partNumber", to_sstring(part_number));
    req.query_parameters.emplace("uploadId", std::move(upload_id));
    req.write_body("bin", len, [data = std::move(data)] (output_stream<char>&& out) {
        return write_part_data(data, std::move(out));
    });
    sstring etag;
    co_await make_request(std::move(req), [this, &etag, len, start = s3_clock::now()] (const http::reply& rep, input_stream<char>&& in) {
        etag = rep.get_header("ETag");
        _write_stats.update(len, s3_clock::now() - start);
        return ignore_reply(rep, std::move(in));
    }, http::reply::status_type::ok, as);
    if (etag.empty()) {
        co_await coroutine::return_exception(storage_io_error(EIO, format("no ETag for part {} of {}", part_number, path)));
    }
    co_return etag;
}

future<> client::complete_multipart_upload(sstring object_name, sstring upload_id, std::vector<part_descriptor> parts, seastar::abort_source* as) {
    auto path = object_path(object_name);
    unsigned body_len = prepare_multipart_upload_parts(parts);
    if (body_len == 0) {
        co_await coroutine::return_exception(storage_io_error(EIO, format("cannot complete upload {} of {}, some parts have no etag", upload_id, path)));
    }
    s3l.trace("POST upload completion {} parts (upload id {})", parts.size(), upload_id);
    auto req = http::request::make("POST", _cfg->host, path);
    req.query_parameters.emplace("uploadId", std::move(upload_id));
    req.write_body("xml", body_len, [parts = std::move(parts)] (output_stream<char>&& out) -> future<> {
        return dump_multipart_upload_parts(std::move(out), parts);
    });
    // If this request fails, the caller aborts the upload
    co_await make_request(std::move(req), [] (const http::reply& rep, input_stream<char>&& in_) -> future<> {
        auto in = std::move(in_);
        auto body = co_await util::read_entire_stream_contiguous(in);
        // S3 may reply 200 and carry the failure in the body
        auto error = aws::aws_error::parse(std::move(body));
        if (error && error->get_error_type() != aws::aws_error_type::OK) {
            co_await coroutine::return_exception(aws::aws_exception(std::move(*error)));
        }
    }, http::reply::status_type::ok, as);
}

future<> client::abort_multipart_upload(sstring object_name, sstring upload_id) {
    auto path = object_path(object_name);
    s3l.trace("DELETE upload {}", upload_id);
    auto req = http::request::make("DELETE", _cfg->host, path);
    req.query_parameters.emplace("uploadId", std::move(upload_id));
    co_await make_request(std::move(req), ignore_reply, http::reply::status_type::no_content);
}

future<> client::put_object(sstring object_name, part_data data, seastar::abort_source* as) {
    auto path = object_path(object_name);
    s3l.trace("PUT {} ({} bytes)", path, data.size());
    auto req = http::request::make("PUT", _cfg->host, path);
    auto len = data.size();
    req.write_body("bin", len, [data = std::move(data)] (output_stream<char>&& out) {
        return write_part_data(data, std::move(out));
    });
    co_await make_request(std::move(req), [this, len, start = s3_clock::now()] (const http::reply& rep, input_stream<char>&& in) {
        _write_stats.update(len, s3_clock::now() - start);
        return ignore_reply(rep, std::move(in));
    }, http::reply::status_type::ok, as);
}

future<bucket_status> client::head_bucket(sstring bucket, seastar::abort_source* as) {
    s3l.trace("HEAD bucket {}", bucket);
    auto req = http::request::make("HEAD", _cfg->host, format("/{}", bucket));
    std::exception_ptr ex;
    try {
        co_await make_request(std::move(req), [] (const http::reply& rep, input_stream<char>&& in_) {
            return make_ready_future<>(); // it's HEAD with no body
        }, http::reply::status_type::ok, as);
        co_return bucket_status{};
    } catch (const storage_io_error& e) {
        switch (e.code().value()) {
        case ENOENT:
            co_return bucket_status{bucket_status::kind::not_found, e.what()};
        case EACCES:
            co_return bucket_status{bucket_status::kind::no_access, e.what()};
        default:
            co_return bucket_status{bucket_status::kind::not_ok, e.what()};
        }
    } catch (const abort_requested_exception&) {
        ex = std::current_exception();
    } catch (...) {
        co_return bucket_status{bucket_status::kind::not_ok, sstring(fmt::format("{}", std::current_exception()))};
    }
    co_return coroutine::exception(std::move(ex));
}

future<> client::close() {
    _metrics.clear();
    co_await _http.close();
}

} // namespace s3
