#include "fmp/storage/sigv4.hpp"

#include "fmp/core/hash.hpp"

#include <algorithm>
#include <ctime>
#include <sstream>

namespace fmp::storage::sigv4 {

namespace {

std::string format_utc(Timestamp when, const char* format) {
    const std::time_t t = std::chrono::system_clock::to_time_t(when);
    std::tm tm{};
    gmtime_r(&t, &tm);
    char buffer[32];
    const auto len = std::strftime(buffer, sizeof(buffer), format, &tm);
    return std::string(buffer, len);
}

std::string trim(const std::string& value) {
    const auto begin = value.find_first_not_of(" \t");
    if (begin == std::string::npos) {
        return {};
    }
    const auto end = value.find_last_not_of(" \t");
    return value.substr(begin, end - begin + 1);
}

std::vector<std::uint8_t> to_bytes(const std::string& s) {
    return std::vector<std::uint8_t>(s.begin(), s.end());
}

std::vector<std::uint8_t> signing_key(const Credentials& creds, const std::string& date) {
    auto k_date = crypto::hmac_sha256(to_bytes("AWS4" + creds.secret_key), date);
    auto k_region = crypto::hmac_sha256(k_date, creds.region);
    auto k_service = crypto::hmac_sha256(k_region, creds.service);
    return crypto::hmac_sha256(k_service, "aws4_request");
}

std::string credential_scope(const Credentials& creds, const std::string& date) {
    return date + "/" + creds.region + "/" + creds.service + "/aws4_request";
}

std::string signature(const std::string& canonical_request,
                      const Credentials& creds,
                      Timestamp when) {
    const std::string date = date_stamp(when);

    std::ostringstream string_to_sign;
    string_to_sign << kAlgorithm << "\n"
                   << amz_date(when) << "\n"
                   << credential_scope(creds, date) << "\n"
                   << crypto::sha256_hex(canonical_request);

    const auto sig = crypto::hmac_sha256(signing_key(creds, date), string_to_sign.str());
    return crypto::to_hex(sig.data(), sig.size());
}

} // namespace

std::string uri_encode(const std::string& value, bool encode_slash) {
    static const char* hex = "0123456789ABCDEF";
    std::string out;
    out.reserve(value.size() * 3);
    for (unsigned char c : value) {
        const bool unreserved = (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') ||
                                (c >= '0' && c <= '9') || c == '-' || c == '_' || c == '.' || c == '~';
        if (unreserved || (c == '/' && !encode_slash)) {
            out.push_back(static_cast<char>(c));
        } else {
            out.push_back('%');
            out.push_back(hex[c >> 4]);
            out.push_back(hex[c & 0x0F]);
        }
    }
    return out;
}

std::string amz_date(Timestamp when) {
    return format_utc(when, "%Y%m%dT%H%M%SZ");
}

std::string date_stamp(Timestamp when) {
    return format_utc(when, "%Y%m%d");
}

std::string canonical_query(const QueryParams& params) {
    std::vector<std::pair<std::string, std::string>> encoded;
    encoded.reserve(params.size());
    for (const auto& [key, value] : params) {
        encoded.emplace_back(uri_encode(key), uri_encode(value));
    }
    std::sort(encoded.begin(), encoded.end());

    std::string out;
    for (const auto& [key, value] : encoded) {
        if (!out.empty()) {
            out += '&';
        }
        out += key;
        out += '=';
        out += value;
    }
    return out;
}

std::string authorization_header(const std::string& method,
                                 const std::string& path,
                                 const QueryParams& query,
                                 const std::map<std::string, std::string>& headers,
                                 const std::string& payload_hash,
                                 const Credentials& creds,
                                 Timestamp when) {
    // std::map already orders lowercase names the way SigV4 wants
    std::string canonical_headers;
    std::string signed_headers;
    for (const auto& [name, value] : headers) {
        canonical_headers += name + ":" + trim(value) + "\n";
        if (!signed_headers.empty()) {
            signed_headers += ';';
        }
        signed_headers += name;
    }

    std::ostringstream canonical_request;
    canonical_request << method << "\n"
                      << uri_encode(path, false) << "\n"
                      << canonical_query(query) << "\n"
                      << canonical_headers << "\n"
                      << signed_headers << "\n"
                      << payload_hash;

    std::ostringstream header;
    header << kAlgorithm
           << " Credential=" << creds.access_key << "/" << credential_scope(creds, date_stamp(when))
           << ",SignedHeaders=" << signed_headers
           << ",Signature=" << signature(canonical_request.str(), creds, when);
    return header.str();
}

std::string presigned_query(const std::string& method,
                            const std::string& host,
                            const std::string& path,
                            const Credentials& creds,
                            Timestamp when,
                            std::chrono::seconds expires) {
    QueryParams params = {
        {"X-Amz-Algorithm", kAlgorithm},
        {"X-Amz-Credential", creds.access_key + "/" + credential_scope(creds, date_stamp(when))},
        {"X-Amz-Date", amz_date(when)},
        {"X-Amz-Expires", std::to_string(expires.count())},
        {"X-Amz-SignedHeaders", "host"},
    };
    const std::string query = canonical_query(params);

    std::ostringstream canonical_request;
    canonical_request << method << "\n"
                      << uri_encode(path, false) << "\n"
                      << query << "\n"
                      << "host:" << host << "\n"
                      << "\n"
                      << "host\n"
                      << kUnsignedPayload;

    return query + "&X-Amz-Signature=" + signature(canonical_request.str(), creds, when);
}

} // namespace fmp::storage::sigv4
