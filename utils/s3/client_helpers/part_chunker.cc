/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#include "part_chunker.hh"
#include <seastar/core/coroutine.hh>
#include <seastar/util/backtrace.hh>
#include <stdexcept>

using namespace seastar;

namespace s3 {

part_chunker::part_chunker(size_t part_size)
    : _part_size(part_size)
{
    if (_part_size == 0) {
        throw std::invalid_argument("part size must be positive");
    }
}

void part_chunker::put(temporary_buffer<char> buf) {
    if (_finished) {
        throw_with_backtrace<std::logic_error>("put() after the end of stream");
    }
    while (!buf.empty()) {
        auto to_take = std::min(_part_size - _pending.size(), buf.size());
        if (to_take == buf.size()) {
            _pending.put(std::move(buf));
        } else {
            _pending.put(buf.share(0, to_take));
            buf.trim_front(to_take);
        }
        if (_pending.size() == _part_size) {
            _ready.push_back(part{_next_number++, std::exchange(_pending, {})});
        }
    }
}

std::optional<part> part_chunker::pop_part() {
    if (_ready.empty()) {
        return std::nullopt;
    }
    auto p = std::move(_ready.front());
    _ready.pop_front();
    return p;
}

std::optional<part> part_chunker::finish() {
    _finished = true;
    if (_pending.empty()) {
        return std::nullopt;
    }
    return part{_next_number++, std::exchange(_pending, {})};
}

part_source::part_source(input_stream<char>& in, size_t part_size)
    : _in(in)
    , _chunker(part_size)
{}

future<std::optional<part>> part_source::next() {
    while (!_chunker.has_part()) {
        if (_eof) {
            co_return std::nullopt;
        }
        auto buf = co_await _in.read();
        if (buf.empty()) {
            _eof = true;
            co_return _chunker.finish();
        }
        _chunker.put(std::move(buf));
    }
    co_return _chunker.pop_part();
}

} // namespace s3
