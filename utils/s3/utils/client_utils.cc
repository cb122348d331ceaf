/*
 * Copyright (C) 2025-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#include "client_utils.hh"
#include "utils/log.hh"
#include <seastar/core/coroutine.hh>
#include <seastar/coroutine/exception.hh>

static constexpr std::string_view multipart_upload_complete_header = "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\r\n"
                                                                     "<CompleteMultipartUpload xmlns=\"http://s3.amazonaws.com/doc/2006-03-01/\">";

static constexpr std::string_view multipart_upload_complete_entry = "<Part><ETag>{}</ETag><PartNumber>{}</PartNumber></Part>";

static constexpr std::string_view multipart_upload_complete_trailer = "</CompleteMultipartUpload>";

namespace s3 {

using namespace seastar;
extern logging::logger s3l;

sstring parse_multipart_upload_id(sstring& body) {
    auto doc = std::make_unique<rapidxml::xml_document<>>();
    try {
        doc->parse<0>(body.data());
    } catch (const rapidxml::parse_error& e) {
        s3l.warn("cannot parse initiate multipart upload response: {}", e.what());
        // The caller is supposed to check the upload-id to be empty
        // and handle the error the way it prefers
        return "";
    }
    try {
        return first_node_of(doc.get(), {"InitiateMultipartUploadResult", "UploadId"})->value();
    } catch (const std::runtime_error& e) {
        s3l.warn("unexpected initiate multipart upload response: {}", e.what());
        return "";
    }
}

unsigned prepare_multipart_upload_parts(const std::vector<part_descriptor>& parts) {
    unsigned ret = multipart_upload_complete_header.size();

    for (auto& p : parts) {
        if (p.etag.empty()) {
            return 0;
        }
        // length of the format string - four braces + length of the etag + length of the number
        ret += multipart_upload_complete_entry.size() - 4 + p.etag.size() + fmt::formatted_size("{}", p.part_number);
    }
    ret += multipart_upload_complete_trailer.size();
    return ret;
}

future<> dump_multipart_upload_parts(output_stream<char> out, const std::vector<part_descriptor>& parts) {
    std::exception_ptr ex;
    try {
        co_await out.write(multipart_upload_complete_header.data(), multipart_upload_complete_header.size());

        for (auto& p : parts) {
            auto entry = fmt::format(fmt::runtime(multipart_upload_complete_entry), p.etag, p.part_number);
            co_await out.write(entry.data(), entry.size());
        }
        co_await out.write(multipart_upload_complete_trailer.data(), multipart_upload_complete_trailer.size());
        co_await out.flush();
    } catch (...) {
        ex = std::current_exception();
    }
    co_await out.close();
    if (ex) {
        co_await coroutine::return_exception_ptr(std::move(ex));
    }
}

rapidxml::xml_node<>* first_node_of(rapidxml::xml_node<>* root,
                                           std::initializer_list<std::string_view> names) {
    if (!root) {
        throw std::runtime_error("no document to search in");
    }
    auto* node = root;
    for (auto name : names) {
        node = node->first_node(name.data(), name.size());
        if (!node) {
            throw std::runtime_error(fmt::format("'{}' is not found", name));
        }
    }
    return node;
}

} // namespace s3
