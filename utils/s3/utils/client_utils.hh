/*
 * Copyright (C) 2025-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#pragma once
#if __has_include(<rapidxml.h>)
#include <rapidxml.h>
#else
#include <rapidxml/rapidxml.hpp>
#endif
#include "utils/s3/object_store.hh"
#include <seastar/core/iostream.hh>
#include <seastar/core/sstring.hh>

namespace s3 {

seastar::sstring parse_multipart_upload_id(seastar::sstring& body);
// Returns the length of the CompleteMultipartUpload body, or 0 if some part
// has no etag
unsigned prepare_multipart_upload_parts(const std::vector<part_descriptor>& parts);
seastar::future<> dump_multipart_upload_parts(seastar::output_stream<char> out, const std::vector<part_descriptor>& parts);
rapidxml::xml_node<>* first_node_of(rapidxml::xml_node<>* root, std::initializer_list<std::string_view> names);

} // namespace s3
