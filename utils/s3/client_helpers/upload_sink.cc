/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#include "upload_sink.hh"
#include "utils/log.hh"
#include <seastar/core/coroutine.hh>
#include <seastar/coroutine/exception.hh>

using namespace seastar;

namespace s3 {

extern logging::logger s3l;

future<> upload_sink::maybe_flush() {
    while (auto p = _chunker.pop_part()) {
        co_await upload_part(std::move(*p));
    }
}

future<> upload_sink::put(temporary_buffer<char> buf) {
    _chunker.put(std::move(buf));
    co_await maybe_flush();
}

future<> upload_sink::put(std::vector<temporary_buffer<char>> data) {
    for (auto&& buf : data) {
        _chunker.put(std::move(buf));
    }
    co_await maybe_flush();
}

future<> upload_sink::flush() {
    // output_stream::close() flushes once more after the user's flush()
    if (_state == state::completed) {
        co_return;
    }
    if (_state == state::aborted) {
        co_return coroutine::exception(_failure ? _failure : std::make_exception_ptr(std::runtime_error(format("upload of {} was aborted", _object_name))));
    }

    auto last = _chunker.finish();
    if (!upload_started() && _state == state::uninitiated) {
        // This is handy for small objects that are uploaded via the sink. It makes
        // upload happen in one REST call, instead of three (create + PUT + wrap-up)
        s3l.trace("Sink fallback to plain PUT for {}", _object_name);
        co_return co_await put_object(last ? std::move(last->data) : part_data{});
    }

    if (last) {
        co_await upload_part(std::move(*last));
    }
    co_await finalize_upload();
}

} // namespace s3
