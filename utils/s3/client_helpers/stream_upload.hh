/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#pragma once

#include "multipart_upload.hh"

namespace s3 {

// Reads the input stream to its end and stores everything as one object.
// Unlike upload_sink, the stream is pulled part by part, so no more than
// max_parts_in_flight + 1 parts are held in memory at any time.
//
// A failure of the input stream is handled like a failed part: the upload
// is aborted before the error is propagated.
class stream_upload : private multipart_upload {
    seastar::input_stream<char>& _in;
    part_source _source;

    seastar::future<> do_upload();

public:
    stream_upload(seastar::shared_ptr<object_store> store,
                  seastar::sstring object_name,
                  seastar::input_stream<char>& in,
                  upload_options opts = {},
                  seastar::abort_source* as = nullptr);

    seastar::future<> upload();

    using multipart_upload::get_state;
    using multipart_upload::parts_count;
};

} // namespace s3
