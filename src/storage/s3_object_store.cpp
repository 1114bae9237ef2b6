#include "fmp/storage/s3_object_store.hpp"

#include "fmp/core/hash.hpp"

#include <boost/asio/connect.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <openssl/ssl.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <regex>
#include <sstream>

namespace fmp::storage {

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
namespace ssl = net::ssl;
using tcp = net::ip::tcp;

namespace s3xml {

namespace {

std::string decode_entities(std::string text) {
    static const std::pair<const char*, const char*> entities[] = {
        {"&quot;", "\""}, {"&apos;", "'"}, {"&lt;", "<"}, {"&gt;", ">"}, {"&#34;", "\""}, {"&amp;", "&"},
    };
    for (const auto& [from, to] : entities) {
        const std::string needle(from);
        std::size_t pos = 0;
        while ((pos = text.find(needle, pos)) != std::string::npos) {
            text.replace(pos, needle.size(), to);
            pos += std::char_traits<char>::length(to);
        }
    }
    return text;
}

} // namespace

std::optional<std::string> element(const std::string& xml, const std::string& tag) {
    const std::regex re("<" + tag + ">([^<]*)</" + tag + ">");
    std::smatch match;
    if (std::regex_search(xml, match, re)) {
        return decode_entities(match[1].str());
    }
    return std::nullopt;
}

std::vector<std::string> blocks(const std::string& xml, const std::string& tag) {
    std::vector<std::string> out;
    const std::string open = "<" + tag + ">";
    const std::string close = "</" + tag + ">";
    std::size_t pos = 0;
    while ((pos = xml.find(open, pos)) != std::string::npos) {
        const auto start = pos + open.size();
        const auto end = xml.find(close, start);
        if (end == std::string::npos) {
            break;
        }
        out.push_back(xml.substr(start, end - start));
        pos = end + close.size();
    }
    return out;
}

std::string escape(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        switch (c) {
            case '&': out += "&amp;"; break;
            case '<': out += "&lt;"; break;
            case '>': out += "&gt;"; break;
            case '"': out += "&quot;"; break;
            default: out += c;
        }
    }
    return out;
}

} // namespace s3xml

namespace {

const char* kEmptyPayloadHash = "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855";

std::string checksum_header_value(const std::string& hex) {
    const auto raw = crypto::hex_decode(hex);
    return crypto::base64_encode(raw.data(), raw.size());
}

std::string checksum_to_hex(const std::string& base64) {
    const auto raw = crypto::base64_decode(base64);
    if (raw.size() != crypto::kSha256Size) {
        return {};
    }
    return crypto::to_hex(raw.data(), raw.size());
}

Error error_from_response(const S3ObjectStore::Response& response, const std::string& what) {
    const auto code = s3xml::element(response.body, "Code").value_or("HTTP " + std::to_string(response.status));
    const auto message = s3xml::element(response.body, "Message").value_or("");
    if (response.status == 404) {
        return make_error(ErrorCode::NotFound, what + ": " + code);
    }
    return make_error(ErrorCode::BackendIOError, what + " failed: " + code + (message.empty() ? "" : " " + message));
}

template<typename Stream>
void exchange(Stream& stream,
              http::request<http::string_body>& request,
              S3ObjectStore::Response& out,
              bool head_request,
              beast::error_code& ec) {
    http::write(stream, request, ec);
    if (ec) {
        return;
    }

    beast::flat_buffer buffer;
    http::response_parser<http::string_body> parser;
    parser.body_limit(64 * 1024 * 1024);
    parser.skip(head_request);
    http::read(stream, buffer, parser, ec);
    if (ec) {
        return;
    }

    auto response = parser.release();
    out.status = response.result_int();
    for (const auto& field : response) {
        std::string name(field.name_string());
        std::transform(name.begin(), name.end(), name.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        out.headers[name] = std::string(field.value());
    }
    out.body = std::move(response.body());
}

} // namespace

S3ObjectStore::S3ObjectStore(S3Settings settings, std::shared_ptr<const Clock> clock)
    : settings_(std::move(settings)), clock_(std::move(clock)) {
    std::string rest = settings_.endpoint;
    if (rest.rfind("https://", 0) == 0) {
        tls_ = true;
        rest = rest.substr(8);
    } else if (rest.rfind("http://", 0) == 0) {
        tls_ = false;
        rest = rest.substr(7);
    }
    if (const auto slash = rest.find('/'); slash != std::string::npos) {
        rest = rest.substr(0, slash);
    }

    host_header_ = rest;
    if (const auto colon = rest.rfind(':'); colon != std::string::npos) {
        host_ = rest.substr(0, colon);
        port_ = rest.substr(colon + 1);
    } else {
        host_ = rest;
        port_ = tls_ ? "443" : "80";
    }

    spdlog::info("[S3ObjectStore] endpoint={}://{} bucket={} region={}",
                 tls_ ? "https" : "http", host_header_, settings_.bucket, settings_.credentials.region);
}

std::string S3ObjectStore::object_path(const std::string& key) const {
    return "/" + settings_.bucket + "/" + key;
}

Result<S3ObjectStore::Response> S3ObjectStore::send(const std::string& method,
                                                    const std::string& path,
                                                    const sigv4::QueryParams& query,
                                                    std::map<std::string, std::string> headers,
                                                    const std::string& body,
                                                    const std::string& payload_hash) {
    const auto now = clock_->now();
    headers["host"] = host_header_;
    headers["x-amz-date"] = sigv4::amz_date(now);
    headers["x-amz-content-sha256"] = payload_hash;
    const std::string authorization =
        sigv4::authorization_header(method, path, query, headers, payload_hash, settings_.credentials, now);

    std::string target = sigv4::uri_encode(path, false);
    const std::string query_string = sigv4::canonical_query(query);
    if (!query_string.empty()) {
        target += "?" + query_string;
    }

    http::request<http::string_body> request{http::string_to_verb(method), target, 11};
    for (const auto& [name, value] : headers) {
        request.set(name, value);
    }
    request.set(http::field::authorization, authorization);
    request.set(http::field::user_agent, "fmp-s3/1.0");
    request.body() = body;
    request.prepare_payload();

    Response response;
    beast::error_code ec;
    net::io_context ioc;
    tcp::resolver resolver(ioc);
    const auto endpoints = resolver.resolve(host_, port_, ec);
    if (ec) {
        return Fail<Response>(ErrorCode::BackendIOError, "Resolve " + host_ + " failed: " + ec.message());
    }

    const bool head_request = method == "HEAD";
    if (tls_) {
        ssl::context ctx(ssl::context::tls_client);
        ctx.set_default_verify_paths();
        ctx.set_verify_mode(ssl::verify_peer);

        beast::ssl_stream<beast::tcp_stream> stream(ioc, ctx);
        if (!SSL_set_tlsext_host_name(stream.native_handle(), host_.c_str())) {
            return Fail<Response>(ErrorCode::BackendIOError, "Failed to set SNI host name");
        }
        stream.set_verify_callback(ssl::host_name_verification(host_));

        beast::get_lowest_layer(stream).expires_after(settings_.timeout);
        beast::get_lowest_layer(stream).connect(endpoints, ec);
        if (!ec) {
            stream.handshake(ssl::stream_base::client, ec);
        }
        if (!ec) {
            exchange(stream, request, response, head_request, ec);
        }
        if (ec) {
            return Fail<Response>(ErrorCode::BackendIOError, method + " " + path + ": " + ec.message());
        }
        beast::error_code shutdown_ec;
        stream.shutdown(shutdown_ec);
        if (shutdown_ec && shutdown_ec != net::error::eof && shutdown_ec != ssl::error::stream_truncated) {
            spdlog::debug("[S3ObjectStore] tls shutdown: {}", shutdown_ec.message());
        }
    } else {
        beast::tcp_stream stream(ioc);
        stream.expires_after(settings_.timeout);
        stream.connect(endpoints, ec);
        if (!ec) {
            exchange(stream, request, response, head_request, ec);
        }
        if (ec) {
            return Fail<Response>(ErrorCode::BackendIOError, method + " " + path + ": " + ec.message());
        }
        beast::error_code shutdown_ec;
        stream.socket().shutdown(tcp::socket::shutdown_both, shutdown_ec);
    }

    spdlog::debug("[S3ObjectStore] {} {} -> {}", method, target, response.status);
    return Ok(std::move(response));
}

Result<std::string> S3ObjectStore::create_multipart_upload(const std::string& key,
                                                           const std::string& content_type) {
    std::map<std::string, std::string> headers;
    if (!content_type.empty()) {
        headers["content-type"] = content_type;
    }
    headers["x-amz-checksum-algorithm"] = "SHA256";

    auto sent = send("POST", object_path(key), {{"uploads", ""}}, headers, "", kEmptyPayloadHash);
    if (sent.is_error()) {
        return Err<std::string>(sent.error());
    }
    const auto& response = sent.value();
    if (response.status != 200) {
        return Err<std::string>(error_from_response(response, "CreateMultipartUpload"));
    }
    auto upload_id = s3xml::element(response.body, "UploadId");
    if (!upload_id || upload_id->empty()) {
        return Fail<std::string>(ErrorCode::BackendIOError, "CreateMultipartUpload response without UploadId");
    }
    return Ok(*upload_id);
}

Result<std::optional<std::string>> S3ObjectStore::find_multipart_upload(const std::string& key) {
    auto sent = send("GET", "/" + settings_.bucket, {{"uploads", ""}, {"prefix", key}}, {}, "", kEmptyPayloadHash);
    if (sent.is_error()) {
        return Err<std::optional<std::string>>(sent.error());
    }
    const auto& response = sent.value();
    if (response.status != 200) {
        return Err<std::optional<std::string>>(error_from_response(response, "ListMultipartUploads"));
    }
    for (const auto& upload : s3xml::blocks(response.body, "Upload")) {
        if (s3xml::element(upload, "Key") == key) {
            return Ok(s3xml::element(upload, "UploadId"));
        }
    }
    return Ok(std::optional<std::string>());
}

Result<std::string> S3ObjectStore::upload_part(const std::string& key,
                                               const std::string& upload_id,
                                               std::uint32_t part_number,
                                               const std::vector<std::uint8_t>& bytes,
                                               const std::string& checksum_sha256) {
    std::map<std::string, std::string> headers;
    headers["x-amz-checksum-sha256"] = checksum_header_value(checksum_sha256);

    const std::string body(bytes.begin(), bytes.end());
    auto sent = send("PUT", object_path(key),
                     {{"partNumber", std::to_string(part_number)}, {"uploadId", upload_id}},
                     headers, body, checksum_sha256);
    if (sent.is_error()) {
        return Err<std::string>(sent.error());
    }
    const auto& response = sent.value();
    if (response.status != 200) {
        return Err<std::string>(error_from_response(response, "UploadPart " + std::to_string(part_number)));
    }
    auto etag = response.headers.find("etag");
    if (etag == response.headers.end() || etag->second.empty()) {
        return Fail<std::string>(ErrorCode::BackendIOError, "UploadPart response without ETag");
    }
    return Ok(etag->second);
}

Result<std::vector<PartInfo>> S3ObjectStore::list_parts(const std::string& key, const std::string& upload_id) {
    std::vector<PartInfo> parts;
    std::string marker;

    while (true) {
        sigv4::QueryParams query = {{"uploadId", upload_id}};
        if (!marker.empty()) {
            query.emplace_back("part-number-marker", marker);
        }
        auto sent = send("GET", object_path(key), query, {}, "", kEmptyPayloadHash);
        if (sent.is_error()) {
            return Err<std::vector<PartInfo>>(sent.error());
        }
        const auto& response = sent.value();
        if (response.status != 200) {
            return Err<std::vector<PartInfo>>(error_from_response(response, "ListParts"));
        }

        for (const auto& block : s3xml::blocks(response.body, "Part")) {
            PartInfo info;
            info.part_number = static_cast<std::uint32_t>(std::stoul(s3xml::element(block, "PartNumber").value_or("0")));
            info.etag = s3xml::element(block, "ETag").value_or("");
            info.size = std::stoull(s3xml::element(block, "Size").value_or("0"));
            info.checksum_sha256 = checksum_to_hex(s3xml::element(block, "ChecksumSHA256").value_or(""));
            parts.push_back(std::move(info));
        }

        if (s3xml::element(response.body, "IsTruncated").value_or("false") != "true") {
            break;
        }
        const auto next = s3xml::element(response.body, "NextPartNumberMarker").value_or("");
        if (next.empty() || next == marker) {
            break;
        }
        marker = next;
    }
    return Ok(parts);
}

Result<void> S3ObjectStore::complete_multipart_upload(const std::string& key,
                                                      const std::string& upload_id,
                                                      const std::vector<CompletedPart>& parts) {
    std::ostringstream xml;
    xml << "<CompleteMultipartUpload xmlns=\"http://s3.amazonaws.com/doc/2006-03-01/\">";
    for (const auto& part : parts) {
        xml << "<Part><PartNumber>" << part.part_number << "</PartNumber>"
            << "<ETag>" << s3xml::escape(part.etag) << "</ETag>";
        if (!part.checksum_sha256.empty()) {
            xml << "<ChecksumSHA256>" << checksum_header_value(part.checksum_sha256) << "</ChecksumSHA256>";
        }
        xml << "</Part>";
    }
    xml << "</CompleteMultipartUpload>";
    const std::string body = xml.str();

    std::map<std::string, std::string> headers;
    headers["content-type"] = "application/xml";
    auto sent = send("POST", object_path(key), {{"uploadId", upload_id}}, headers, body, crypto::sha256_hex(body));
    if (sent.is_error()) {
        return Err<void>(sent.error());
    }
    const auto& response = sent.value();
    // S3 can report a failed complete inside a 200 body
    if (response.status != 200 || s3xml::element(response.body, "Code").has_value()) {
        return Err<void>(error_from_response(response, "CompleteMultipartUpload"));
    }
    return Ok();
}

Result<void> S3ObjectStore::abort_multipart_upload(const std::string& key, const std::string& upload_id) {
    auto sent = send("DELETE", object_path(key), {{"uploadId", upload_id}}, {}, "", kEmptyPayloadHash);
    if (sent.is_error()) {
        return Err<void>(sent.error());
    }
    const auto& response = sent.value();
    if (response.status == 204 || response.status == 200 || response.status == 404) {
        return Ok();
    }
    return Err<void>(error_from_response(response, "AbortMultipartUpload"));
}

Result<bool> S3ObjectStore::object_exists(const std::string& key) {
    auto sent = send("HEAD", object_path(key), {}, {}, "", kEmptyPayloadHash);
    if (sent.is_error()) {
        return Err<bool>(sent.error());
    }
    const auto status = sent.value().status;
    if (status == 200) {
        return Ok(true);
    }
    if (status == 404) {
        return Ok(false);
    }
    return Fail<bool>(ErrorCode::BackendIOError, "HeadObject returned " + std::to_string(status));
}

Result<void> S3ObjectStore::delete_object(const std::string& key) {
    auto sent = send("DELETE", object_path(key), {}, {}, "", kEmptyPayloadHash);
    if (sent.is_error()) {
        return Err<void>(sent.error());
    }
    const auto& response = sent.value();
    if (response.status == 204 || response.status == 200 || response.status == 404) {
        return Ok();
    }
    return Err<void>(error_from_response(response, "DeleteObject"));
}

Result<PresignedUrl> S3ObjectStore::presign_get(const std::string& key, std::chrono::seconds ttl) {
    const auto now = clock_->now();
    const std::string path = object_path(key);

    PresignedUrl presigned;
    presigned.expires_at = now + ttl;
    presigned.url = std::string(tls_ ? "https://" : "http://") + host_header_ + sigv4::uri_encode(path, false) + "?" +
                    sigv4::presigned_query("GET", host_header_, path, settings_.credentials, now, ttl);
    return Ok(presigned);
}

} // namespace fmp::storage
