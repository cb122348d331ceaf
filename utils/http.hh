/*
 * Copyright (C) 2025-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#pragma once

#include "utils/log.hh"
#include <seastar/core/semaphore.hh>
#include <seastar/core/shared_ptr.hh>
#include <seastar/http/client.hh>
#include <seastar/net/inet_address.hh>
#include <seastar/net/tls.hh>
#include <string>
#include <vector>

namespace utils::http {

using namespace seastar;

future<shared_ptr<tls::certificate_credentials>> system_trust_credentials();

struct url_info {
    std::string scheme;
    std::string host;
    std::string path;
    uint16_t port;

    bool is_https() const;
};

url_info parse_simple_url(std::string_view uri);

// Resolves the host on first use and spreads new connections over all the
// addresses it resolved to. HTTPS connections verify the peer against the
// system trust store unless other credentials are given.
class dns_connection_factory : public seastar::http::experimental::connection_factory {
    std::string _host;
    int _port;
    bool _use_https;
    logging::logger& _logger;
    shared_ptr<tls::certificate_credentials> _creds;
    std::vector<net::inet_address> _addr_list;
    size_t _addr_pos = 0;
    bool _initialized = false;
    semaphore _init_semaphore{1};

    future<> init();
    future<net::inet_address> get_address();
    future<connected_socket> connect();

public:
    dns_connection_factory(std::string host, int port, bool use_https, logging::logger& logger, shared_ptr<tls::certificate_credentials> certs = {});

    virtual future<connected_socket> make(abort_source*) override;
};

} // namespace utils::http
