/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#include <chrono>
#include <seastar/core/abort_source.hh>
#include <seastar/core/app-template.hh>
#include <seastar/core/coroutine.hh>
#include <seastar/core/fstream.hh>
#include <seastar/core/seastar.hh>
#include <seastar/util/file.hh>
#include "destination/s3_destination.hh"
#include "utils/log.hh"

using namespace seastar;

static logging::logger ulog("s3_upload");

int main(int argc, char** argv) {
    namespace bpo = boost::program_options;
    app_template app;
    app.add_options()
        ("config", bpo::value<sstring>()->required(), "destination configuration file (JSON or YAML)")
        ("key", bpo::value<sstring>()->required(), "name of the object to create")
        ("input", bpo::value<sstring>()->required(), "file to upload")
        ("sink", "write the file through an upload sink instead of streaming it")
    ;

    return app.run(argc, argv, [&app] () -> future<int> {
        auto& opts = app.configuration();
        auto key = opts["key"].as<sstring>();
        auto input = opts["input"].as<sstring>();
        auto use_sink = opts.contains("sink");

        auto text = co_await util::read_entire_file_contiguous(std::filesystem::path(opts["config"].as<sstring>().c_str()));
        std::unique_ptr<destination::s3_destination> dest;
        try {
            dest = co_await destination::s3_destination::make(std::move(text));
        } catch (const destination::destination_error& e) {
            ulog.error("Cannot initialize {} destination {}: {}", e.type(), e.sanitized_config(), e.what());
            co_return 1;
        }

        auto start = std::chrono::steady_clock::now();
        uint64_t size = 0;
        std::exception_ptr ex;
        try {
            auto f = co_await open_file_dma(input, open_flags::ro);
            size = co_await f.size();
            auto in = make_file_input_stream(std::move(f));
            try {
                if (use_sink) {
                    // close() flushes, which completes the upload, unless
                    // the abort source makes the remaining requests fail
                    abort_source as;
                    auto out = output_stream<char>(dest->make_upload_sink(key, &as));
                    std::exception_ptr copy_ex;
                    try {
                        co_await copy(in, out);
                    } catch (...) {
                        copy_ex = std::current_exception();
                        as.request_abort();
                    }
                    try {
                        co_await out.close();
                    } catch (...) {
                        if (!copy_ex) {
                            copy_ex = std::current_exception();
                        }
                    }
                    if (copy_ex) {
                        std::rethrow_exception(copy_ex);
                    }
                } else {
                    co_await dest->upload(key, in);
                }
            } catch (...) {
                ex = std::current_exception();
            }
            co_await in.close();
        } catch (...) {
            ex = std::current_exception();
        }
        co_await dest->close();
        if (ex) {
            ulog.error("Upload of {} to {} failed: {}", input, key, ex);
            co_return 1;
        }

        auto time = std::chrono::duration_cast<std::chrono::duration<double>>(std::chrono::steady_clock::now() - start);
        ulog.info("Uploaded {} bytes to {}/{} in {:.3f}s", size, dest->config().bucket, key, time.count());
        co_return 0;
    });
}
