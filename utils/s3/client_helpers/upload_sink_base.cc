/*
 * Copyright (C) 2025-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#include "upload_sink_base.hh"
#include "utils/log.hh"
#include <seastar/core/coroutine.hh>

namespace s3 {

extern logging::logger s3l;

seastar::future<> upload_sink_base::close() {
    if (upload_started()) {
        s3l.warn("closing incomplete multipart upload of {} -> aborting", _object_name);
        co_await abort_upload();
    } else {
        s3l.trace("closing upload of {} ({})", _object_name, _state);
        if (_state == state::uninitiated) {
            // Nothing was sent, the object is never going to be created
            _state = state::aborted;
        }
    }
}

} // namespace s3
