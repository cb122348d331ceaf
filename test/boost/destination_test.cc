/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#include "destination/s3_destination.hh"
#include "test/lib/fake_object_store.hh"
#include "test/lib/stream_utils.hh"
#include <seastar/core/units.hh>
#include <seastar/testing/test_case.hh>
#include <seastar/testing/thread_test_case.hh>
#include <seastar/util/closeable.hh>

using namespace seastar;

static const std::string valid_config = R"({
    "bucket": "pipeline-output",
    "credentials": {"accessKey": "AKIAEXAMPLE", "secretKey": "s3cr3t-k3y", "region": "eu-west-1"}
})";

static bool leaks_credentials(const std::string& s) {
    return s.find("AKIAEXAMPLE") != std::string::npos
        || s.find("s3cr3t-k3y") != std::string::npos
        || s.find("eu-west-1") != std::string::npos;
}

static auto message_is(std::string_view msg) {
    return [msg] (const std::exception& e) { return std::string_view(e.what()) == msg; };
}

static destination::store_factory factory_of(shared_ptr<tests::fake_object_store> store) {
    return [store] (const destination::s3_config&) -> shared_ptr<s3::object_store> { return store; };
}

SEASTAR_THREAD_TEST_CASE(test_parse_config) {
    auto cfg = destination::parse_config(valid_config);
    BOOST_REQUIRE_EQUAL(cfg.bucket, "pipeline-output");
    BOOST_REQUIRE_EQUAL(cfg.credentials.access_key, "AKIAEXAMPLE");
    BOOST_REQUIRE_EQUAL(cfg.credentials.secret_key, "s3cr3t-k3y");
    BOOST_REQUIRE_EQUAL(cfg.credentials.region, "eu-west-1");
    BOOST_REQUIRE(!cfg.endpoint);
    BOOST_REQUIRE_EQUAL(cfg.part_size, 10_MiB);
    BOOST_REQUIRE_EQUAL(cfg.max_parts_in_flight, 1);
    BOOST_REQUIRE(!cfg.max_connections);
    BOOST_REQUIRE_EQUAL(cfg.endpoint_url(), "https://s3.eu-west-1.amazonaws.com");

    auto ep = cfg.make_endpoint_config();
    BOOST_REQUIRE_EQUAL(ep->host, "s3.eu-west-1.amazonaws.com");
    BOOST_REQUIRE_EQUAL(ep->port, 443);
    BOOST_REQUIRE(ep->use_https);
}

SEASTAR_THREAD_TEST_CASE(test_parse_config_optional_fields) {
    auto cfg = destination::parse_config(R"(
bucket: b
credentials:
  accessKey: a
  secretKey: s
  region: r
endpoint: http://127.0.0.1:9000
partSize: 6291456
maxPartsInFlight: 4
maxConnections: 8
)");
    BOOST_REQUIRE_EQUAL(cfg.part_size, 6_MiB);
    BOOST_REQUIRE_EQUAL(cfg.max_parts_in_flight, 4);
    BOOST_REQUIRE_EQUAL(*cfg.max_connections, 8);
    BOOST_REQUIRE_EQUAL(cfg.endpoint_url(), "http://127.0.0.1:9000");

    auto opts = cfg.upload_opts();
    BOOST_REQUIRE_EQUAL(opts.part_size, 6_MiB);
    BOOST_REQUIRE_EQUAL(opts.max_parts_in_flight, 4);

    auto ep = cfg.make_endpoint_config();
    BOOST_REQUIRE_EQUAL(ep->host, "127.0.0.1");
    BOOST_REQUIRE_EQUAL(ep->port, 9000);
    BOOST_REQUIRE(!ep->use_https);
    BOOST_REQUIRE_EQUAL(*ep->max_connections, 8);
}

SEASTAR_THREAD_TEST_CASE(test_parse_malformed_config) {
    for (std::string text : {
            std::string("not: [valid"),
            std::string("[1, 2]"),
            std::string(R"({"bucket": "b"})"),
            std::string(R"({"credentials": {"accessKey": "AKIAEXAMPLE", "secretKey": "s3cr3t-k3y", "region": "eu-west-1"}})"),
            std::string(R"({"bucket": "b", "credentials": {"accessKey": "AKIAEXAMPLE", "region": "eu-west-1"}})"),
            std::string(R"({"bucket": "b", "credentials": {"accessKey": "AKIAEXAMPLE", "secretKey": "s3cr3t-k3y", "region": "eu-west-1"}, "partSize": "big"})"),
    }) {
        BOOST_REQUIRE_EXCEPTION(destination::parse_config(text), destination::malformed_configuration, [] (const destination::malformed_configuration& e) {
            return e.type() == destination::s3_type && !leaks_credentials(e.sanitized_config()) && !leaks_credentials(e.what());
        });
    }
}

SEASTAR_THREAD_TEST_CASE(test_sanitize_config) {
    auto sanitized = destination::sanitize_config(valid_config);
    BOOST_REQUIRE(!leaks_credentials(sanitized));
    BOOST_REQUIRE_NE(sanitized.find("<REDACTED>"), std::string::npos);

    // The sanitized form is itself a valid configuration
    auto cfg = destination::parse_config(sanitized);
    BOOST_REQUIRE_EQUAL(cfg.bucket, "pipeline-output");
    BOOST_REQUIRE_EQUAL(cfg.credentials.access_key, "<REDACTED>");
    BOOST_REQUIRE_EQUAL(cfg.credentials.secret_key, "<REDACTED>");
    BOOST_REQUIRE_EQUAL(cfg.credentials.region, "<REDACTED>");

    BOOST_REQUIRE_EQUAL(destination::sanitize_config(R"({"bucket": "b", "credentials": {"secretKey": "s3cr3t-k3y"}})"), "{}");
    BOOST_REQUIRE_EQUAL(destination::sanitize_config("{{{"), "{}");
}

SEASTAR_THREAD_TEST_CASE(test_validate_config) {
    auto cfg = destination::parse_config(valid_config);
    auto sanitized = destination::sanitize_config(valid_config);
    BOOST_REQUIRE_NO_THROW(destination::validate_config(cfg, sanitized));

    auto small_parts = cfg;
    small_parts.part_size = 5_MiB - 1;
    BOOST_REQUIRE_THROW(destination::validate_config(small_parts, sanitized), destination::invalid_configuration);

    auto no_parts = cfg;
    no_parts.max_parts_in_flight = 0;
    BOOST_REQUIRE_THROW(destination::validate_config(no_parts, sanitized), destination::invalid_configuration);

    auto no_connections = cfg;
    no_connections.max_connections = 0;
    BOOST_REQUIRE_THROW(destination::validate_config(no_connections, sanitized), destination::invalid_configuration);

    auto bad_endpoint = cfg;
    bad_endpoint.endpoint = "localhost";
    BOOST_REQUIRE_THROW(destination::validate_config(bad_endpoint, sanitized), destination::invalid_configuration);
}

SEASTAR_THREAD_TEST_CASE(test_report_bucket_status) {
    const std::string sanitized = "{}";
    BOOST_REQUIRE_NO_THROW(destination::report_bucket_status(s3::bucket_status{}, sanitized));
    BOOST_REQUIRE_EXCEPTION(destination::report_bucket_status({s3::bucket_status::kind::not_found, ""}, sanitized),
                            destination::invalid_configuration, message_is("Bucket does not exist"));
    BOOST_REQUIRE_EXCEPTION(destination::report_bucket_status({s3::bucket_status::kind::no_access, ""}, sanitized),
                            destination::access_denied, message_is("Access denied"));
    BOOST_REQUIRE_EXCEPTION(destination::report_bucket_status({s3::bucket_status::kind::not_ok, "connection refused"}, sanitized),
                            destination::invalid_configuration, message_is("connection refused"));
}

SEASTAR_THREAD_TEST_CASE(test_make_destination) {
    auto store = make_shared<tests::fake_object_store>();
    auto dest = destination::s3_destination::make(valid_config, factory_of(store)).get();
    auto close_dest = deferred_close(*dest);

    BOOST_REQUIRE_EQUAL(store->head_calls, 1);
    BOOST_REQUIRE(dest->type() == destination::s3_type);
    BOOST_REQUIRE_EQUAL(dest->config().bucket, "pipeline-output");
    BOOST_REQUIRE(!leaks_credentials(dest->sanitized_config()));
    BOOST_REQUIRE_EQUAL(store->close_calls, 0);
}

SEASTAR_THREAD_TEST_CASE(test_make_destination_missing_bucket) {
    auto store = make_shared<tests::fake_object_store>();
    store->head_status = {s3::bucket_status::kind::not_found, "NoSuchBucket"};

    BOOST_REQUIRE_EXCEPTION(destination::s3_destination::make(valid_config, factory_of(store)).get(),
                            destination::invalid_configuration, [] (const destination::invalid_configuration& e) {
        return std::string_view(e.what()) == "Bucket does not exist" && !leaks_credentials(e.sanitized_config());
    });
    BOOST_REQUIRE_EQUAL(store->close_calls, 1);
    BOOST_REQUIRE_EQUAL(store->begin_calls, 0);
    BOOST_REQUIRE_EQUAL(store->put_calls, 0);
}

SEASTAR_THREAD_TEST_CASE(test_make_destination_access_denied) {
    auto store = make_shared<tests::fake_object_store>();
    store->head_status = {s3::bucket_status::kind::no_access, ""};

    BOOST_REQUIRE_EXCEPTION(destination::s3_destination::make(valid_config, factory_of(store)).get(),
                            destination::access_denied, message_is("Access denied"));
    BOOST_REQUIRE_EQUAL(store->close_calls, 1);
}

SEASTAR_THREAD_TEST_CASE(test_make_destination_store_fault) {
    auto store = make_shared<tests::fake_object_store>();
    store->head_status = {s3::bucket_status::kind::not_ok, "S3 request failed with (503)"};

    BOOST_REQUIRE_EXCEPTION(destination::s3_destination::make(valid_config, factory_of(store)).get(),
                            destination::invalid_configuration, message_is("S3 request failed with (503)"));
    BOOST_REQUIRE_EQUAL(store->close_calls, 1);
}

SEASTAR_THREAD_TEST_CASE(test_make_destination_bad_config_creates_no_store) {
    bool created = false;
    auto factory = [&created] (const destination::s3_config&) -> shared_ptr<s3::object_store> {
        created = true;
        return make_shared<tests::fake_object_store>();
    };

    BOOST_REQUIRE_THROW(destination::s3_destination::make("{]", factory).get(), destination::malformed_configuration);
    auto small_parts = R"({"bucket": "b", "partSize": 1024, "credentials": {"accessKey": "a", "secretKey": "s", "region": "r"}})";
    BOOST_REQUIRE_THROW(destination::s3_destination::make(small_parts, factory).get(), destination::invalid_configuration);
    BOOST_REQUIRE(!created);
}

SEASTAR_THREAD_TEST_CASE(test_destination_uploads) {
    auto store = make_shared<tests::fake_object_store>();
    auto dest = destination::s3_destination::make(valid_config, factory_of(store)).get();
    auto close_dest = deferred_close(*dest);

    auto in = tests::make_patterned_input_stream(25_MiB, 128_KiB);
    auto close_in = deferred_close(in);
    dest->upload("streamed", in).get();
    BOOST_REQUIRE(store->part_sizes() == std::vector<size_t>({10_MiB, 10_MiB, 5_MiB}));
    BOOST_REQUIRE(store->objects.at("streamed") == tests::pattern_bytes(0, 25_MiB));

    {
        auto out = output_stream<char>(dest->make_upload_sink("sunk"));
        auto close_out = deferred_close(out);
        out.write("hello").get();
        out.flush().get();
    }
    BOOST_REQUIRE_EQUAL(store->objects.at("sunk"), "hello");
    BOOST_REQUIRE_EQUAL(store->put_calls, 1);
}
