/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#pragma once

#include "utils/s3/object_store.hh"
#include <deque>
#include <optional>
#include <seastar/core/iostream.hh>

namespace s3 {

struct part {
    unsigned number;
    part_data data;
};

// Cuts a stream of arbitrarily sized fragments into parts of exactly
// part_size bytes, numbered from 1 in the order they are produced. Only the
// part returned by finish() may be shorter. Fragments are split by sharing,
// bytes are never copied.
class part_chunker {
    const size_t _part_size;
    part_data _pending;
    std::deque<part> _ready;
    unsigned _next_number = 1;
    bool _finished = false;

public:
    explicit part_chunker(size_t part_size);

    void put(seastar::temporary_buffer<char> buf);

    bool has_part() const noexcept {
        return !_ready.empty();
    }

    std::optional<part> pop_part();

    // Signals the end of the stream. Returns the trailing part if there are
    // buffered bytes left, never an empty one.
    std::optional<part> finish();

    size_t part_size() const noexcept {
        return _part_size;
    }

    // Bytes received but not yet cut into a part
    size_t buffered() const noexcept {
        return _pending.size();
    }

    // Number of parts produced so far, including ones not popped yet
    unsigned parts_count() const noexcept {
        return _next_number - 1;
    }
};

// Lazy, single-pass sequence of parts read from an input stream. The stream
// is only read when no complete part is available.
class part_source {
    seastar::input_stream<char>& _in;
    part_chunker _chunker;
    bool _eof = false;

public:
    part_source(seastar::input_stream<char>& in, size_t part_size);

    // Returns disengaged optional once the stream is exhausted
    seastar::future<std::optional<part>> next();

    size_t part_size() const noexcept {
        return _chunker.part_size();
    }
};

} // namespace s3
