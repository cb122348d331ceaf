/*
 * Copyright (C) 2025-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#pragma once

#include "part_chunker.hh"
#include "utils/s3/object_store.hh"
#include <seastar/core/gate.hh>
#include <seastar/core/semaphore.hh>
#include <seastar/core/shared_ptr.hh>

namespace s3 {

struct upload_options {
    size_t part_size = 10 * 1024 * 1024;
    // How many parts may be in flight at the same time. Parts are always
    // numbered and completed in the order they were produced.
    unsigned max_parts_in_flight = 1;
};

// One object being materialized in the store. Parts are handed over in
// order, uploaded in the background and their etags collected into
// per-part slots. Whatever happens, the upload ends up either completed or
// aborted, and the store is asked to abort at most once.
class multipart_upload {
public:
    enum class state {
        uninitiated,
        active,
        aborting,
        completed,
        aborted,
    };

protected:
    seastar::shared_ptr<object_store> _store;
    seastar::sstring _object_name;
    seastar::sstring _upload_id;
    // Slot i describes part i+1. The etag is empty until the store
    // acknowledges the part.
    std::vector<part_descriptor> _parts;
    seastar::gate _bg_flushes;
    seastar::semaphore _flush_slots;
    // First failure of a background part upload
    std::exception_ptr _failure;
    state _state = state::uninitiated;
    seastar::abort_source* _as;

    seastar::future<> start_upload();
    seastar::future<> upload_part(part p);
    // Waits for the parts in flight and completes the upload. On any
    // failure the upload is aborted and the original error is rethrown.
    seastar::future<> finalize_upload();
    // Single PUT, for objects that didn't make up a whole part
    seastar::future<> put_object(part_data data);
    // Best effort, never throws. No-op unless the upload is in progress.
    seastar::future<> abort_upload();

    bool is_terminal() const noexcept {
        return _state == state::completed || _state == state::aborted;
    }

public:
    multipart_upload(seastar::shared_ptr<object_store> store, seastar::sstring object_name, upload_options opts, seastar::abort_source* as);

    bool upload_started() const noexcept;

    state get_state() const noexcept {
        return _state;
    }

    unsigned parts_count() const noexcept {
        return _parts.size();
    }

    const seastar::sstring& object_name() const noexcept {
        return _object_name;
    }
};

} // namespace s3

template <>
struct fmt::formatter<s3::multipart_upload::state> : fmt::formatter<std::string_view> {
    auto format(s3::multipart_upload::state st, fmt::format_context& ctx) const {
        std::string_view name = "unknown";
        switch (st) {
        case s3::multipart_upload::state::uninitiated: name = "uninitiated"; break;
        case s3::multipart_upload::state::active: name = "active"; break;
        case s3::multipart_upload::state::aborting: name = "aborting"; break;
        case s3::multipart_upload::state::completed: name = "completed"; break;
        case s3::multipart_upload::state::aborted: name = "aborted"; break;
        }
        return fmt::formatter<std::string_view>::format(name, ctx);
    }
};
