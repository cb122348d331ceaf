/*
 * Copyright (C) 2025-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#include "multipart_upload.hh"
#include "utils/exceptions.hh"
#include "utils/log.hh"
#include <seastar/core/coroutine.hh>
#include <seastar/core/on_internal_error.hh>
#include <seastar/coroutine/exception.hh>
#include <seastar/util/backtrace.hh>

using namespace seastar;

namespace s3 {

logging::logger s3l("s3");

multipart_upload::multipart_upload(shared_ptr<object_store> store, sstring object_name, upload_options opts, abort_source* as)
    : _store(std::move(store))
    , _object_name(std::move(object_name))
    , _flush_slots(std::max(opts.max_parts_in_flight, 1u))
    , _as(as)
{}

bool multipart_upload::upload_started() const noexcept {
    return !_upload_id.empty();
}

future<> multipart_upload::start_upload() {
    s3l.trace("POST uploads {}", _object_name);
    try {
        _upload_id = co_await _store->begin_multipart_upload(_object_name, _as);
    } catch (...) {
        _failure = std::current_exception();
        _state = state::aborted;
        throw;
    }
    if (_upload_id.empty()) {
        _failure = std::make_exception_ptr(storage_io_error(EIO, format("cannot initiate upload for {}", _object_name)));
        _state = state::aborted;
        co_return coroutine::exception(_failure);
    }
    _state = state::active;
    s3l.trace("created uploads for {} -> id = {}", _object_name, _upload_id);
}

future<> multipart_upload::upload_part(part p) {
    if (_failure) {
        co_await abort_upload();
        co_return coroutine::exception(_failure);
    }
    if (_state != state::uninitiated && _state != state::active) {
        throw_with_backtrace<std::logic_error>(format("cannot upload part {} of {}, upload is {}", p.number, _object_name, _state));
    }
    if (p.number != _parts.size() + 1) {
        on_internal_error(s3l, format("part {} of {} is out of order, {} parts were uploaded so far", p.number, _object_name, _parts.size()));
    }
    if (p.number > aws_maximum_parts_in_upload) {
        _failure = std::make_exception_ptr(storage_io_error(EFBIG, format("{} needs more than {} parts", _object_name, aws_maximum_parts_in_upload)));
        co_await abort_upload();
        co_return coroutine::exception(_failure);
    }

    if (!upload_started()) {
        co_await start_upload();
    }

    auto units = co_await get_units(_flush_slots, 1);
    if (_failure) {
        // Some part in flight failed while we waited for the slot
        co_await abort_upload();
        co_return coroutine::exception(_failure);
    }

    auto number = p.number;
    s3l.trace("PUT part {} {} bytes in {} buffers (upload id {})", number, p.data.size(), p.data.buffers().size(), _upload_id);
    _parts.push_back(part_descriptor{number, ""});

    // Upload in the background, finalize_upload() or abort_upload() collect
    // it through the gate. Failure is remembered and reported by the next
    // call into the upload.
    auto gh = _bg_flushes.hold();
    std::ignore = futurize_invoke([this, number, data = std::move(p.data)] () mutable {
        return _store->upload_part(_object_name, _upload_id, number, std::move(data), _as);
    }).then([this, number] (sstring etag) {
        if (etag.empty()) {
            throw storage_io_error(EIO, format("no etag for part {} of {}", number, _object_name));
        }
        s3l.trace("uploaded {} part data -> etag = {} (upload id {})", number, etag, _upload_id);
        _parts[number - 1].etag = std::move(etag);
    }).handle_exception([this, number] (std::exception_ptr ex) {
        s3l.warn("couldn't upload part {} of {}: {} (upload id {})", number, _object_name, ex, _upload_id);
        if (!_failure) {
            _failure = std::move(ex);
        }
    }).finally([gh = std::move(gh), units = std::move(units)] {});
}

future<> multipart_upload::finalize_upload() {
    s3l.trace("wait for {} parts to complete (upload id {})", _parts.size(), _upload_id);
    if (!_bg_flushes.is_closed()) {
        co_await _bg_flushes.close();
    }
    if (_failure) {
        co_await abort_upload();
        co_return coroutine::exception(_failure);
    }
    if (_state != state::active) {
        throw_with_backtrace<std::logic_error>(format("cannot complete {}, upload is {}", _object_name, _state));
    }
    for (const auto& pd : _parts) {
        if (pd.etag.empty()) {
            on_internal_error(s3l, format("part {} of {} has no etag (upload id {})", pd.part_number, _object_name, _upload_id));
        }
    }

    s3l.trace("POST upload completion {} parts (upload id {})", _parts.size(), _upload_id);
    std::exception_ptr ex;
    try {
        co_await _store->complete_multipart_upload(_object_name, _upload_id, _parts, _as);
    } catch (...) {
        ex = std::current_exception();
    }
    if (ex) {
        s3l.warn("couldn't complete upload of {}: {} (upload id {})", _object_name, ex, _upload_id);
        co_await abort_upload();
        co_return coroutine::exception(std::move(ex));
    }
    _upload_id = {};
    _state = state::completed;
}

future<> multipart_upload::put_object(part_data data) {
    if (_state != state::uninitiated) {
        throw_with_backtrace<std::logic_error>(format("cannot PUT {}, upload is {}", _object_name, _state));
    }
    s3l.trace("PUT {} ({} bytes)", _object_name, data.size());
    try {
        co_await _store->put_object(_object_name, std::move(data), _as);
    } catch (...) {
        _failure = std::current_exception();
        _state = state::aborted;
        throw;
    }
    _state = state::completed;
}

future<> multipart_upload::abort_upload() {
    // Parts in flight still refer to this upload
    if (!_bg_flushes.is_closed()) {
        co_await _bg_flushes.close();
    }
    if (!upload_started()) {
        if (_state == state::uninitiated) {
            _state = state::aborted;
        }
        co_return;
    }

    _state = state::aborting;
    auto upload_id = std::exchange(_upload_id, {});
    s3l.trace("DELETE upload {}", upload_id);
    try {
        co_await _store->abort_multipart_upload(_object_name, upload_id);
    } catch (...) {
        s3l.warn("couldn't abort upload {} of {}: {}", upload_id, _object_name, std::current_exception());
    }
    _state = state::aborted;
}

} // namespace s3
