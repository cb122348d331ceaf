/*
 * Copyright (C) 2025-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#pragma once

#include "upload_sink_base.hh"

namespace s3 {

// Data sink that writes everything put into it as a single object. Parts
// are sent as soon as they fill up, flush() marks the end of the object.
class upload_sink final : public upload_sink_base {
    part_chunker _chunker;

    seastar::future<> maybe_flush();

public:
    upload_sink(seastar::shared_ptr<object_store> store, seastar::sstring object_name, upload_options opts = {}, seastar::abort_source* as = nullptr)
        : upload_sink_base(std::move(store), std::move(object_name), opts, as)
        , _chunker(opts.part_size)
    {}

    virtual seastar::future<> put(seastar::temporary_buffer<char> buf) override;
    virtual seastar::future<> put(std::vector<seastar::temporary_buffer<char>> data) override;
    virtual seastar::future<> flush() override;
};

} // namespace s3
