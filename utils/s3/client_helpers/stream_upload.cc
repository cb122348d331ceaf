/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#include "stream_upload.hh"
#include "utils/log.hh"
#include <seastar/core/coroutine.hh>
#include <seastar/coroutine/exception.hh>

using namespace seastar;

namespace s3 {

extern logging::logger s3l;

stream_upload::stream_upload(shared_ptr<object_store> store, sstring object_name, input_stream<char>& in, upload_options opts, abort_source* as)
    : multipart_upload(std::move(store), std::move(object_name), opts, as)
    , _in(in)
    , _source(_in, opts.part_size)
{}

future<> stream_upload::do_upload() {
    auto first = co_await _source.next();
    if (!first || first->data.size() < _source.part_size()) {
        // The stream ended before a whole part was collected
        s3l.trace("Stream of {} fits one PUT ({} bytes)", _object_name, first ? first->data.size() : 0);
        co_return co_await put_object(first ? std::move(first->data) : part_data{});
    }

    co_await upload_part(std::move(*first));
    while (auto p = co_await _source.next()) {
        co_await upload_part(std::move(*p));
    }
    co_await finalize_upload();
}

future<> stream_upload::upload() {
    std::exception_ptr ex;
    try {
        co_await do_upload();
    } catch (...) {
        ex = std::current_exception();
    }
    if (ex) {
        if (!is_terminal()) {
            // The input stream broke or got cancelled
            s3l.warn("upload of {} interrupted: {}", _object_name, ex);
            if (!_failure) {
                _failure = ex;
            }
            co_await abort_upload();
        }
        co_return coroutine::exception(std::move(ex));
    }
}

} // namespace s3
