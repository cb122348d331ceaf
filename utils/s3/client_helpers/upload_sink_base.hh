/*
 * Copyright (C) 2025-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#pragma once

#include "multipart_upload.hh"
#include <seastar/core/iostream.hh>
#include <seastar/net/packet.hh>
#include <seastar/util/backtrace.hh>

namespace s3 {

class upload_sink_base : public multipart_upload, public seastar::data_sink_impl {
public:
    upload_sink_base(seastar::shared_ptr<object_store> store, seastar::sstring object_name, upload_options opts, seastar::abort_source* as)
        : multipart_upload(std::move(store), std::move(object_name), opts, as)
    {
    }

    virtual seastar::future<> put(seastar::net::packet) override {
        seastar::throw_with_backtrace<std::runtime_error>("s3 put(net::packet) unsupported");
    }

    // Aborts the upload if it was started and never completed
    virtual seastar::future<> close() override;

    virtual size_t buffer_size() const noexcept override {
        return 128 * 1024;
    }
};

} // namespace s3
