#pragma once

/**
 * @file sigv4.hpp
 * @brief AWS Signature Version 4 for S3-compatible endpoints
 *
 * Header signing for API calls made by the S3 client, and query signing for
 * the download URLs handed to browsers.
 */

#include "fmp/core/clock.hpp"

#include <chrono>
#include <map>
#include <string>
#include <utility>
#include <vector>

namespace fmp::storage::sigv4 {

inline constexpr const char* kAlgorithm = "AWS4-HMAC-SHA256";
inline constexpr const char* kUnsignedPayload = "UNSIGNED-PAYLOAD";

struct Credentials {
    std::string access_key;
    std::string secret_key;
    std::string region = "us-east-1";
    std::string service = "s3";
};

using QueryParams = std::vector<std::pair<std::string, std::string>>;

/**
 * @brief RFC 3986 percent-encoding as SigV4 requires it
 *
 * Unreserved characters pass through. '/' is kept when encode_slash is
 * false, which is how object key paths are encoded.
 */
std::string uri_encode(const std::string& value, bool encode_slash = true);

/// "20130524T000000Z"
std::string amz_date(Timestamp when);

/// "20130524"
std::string date_stamp(Timestamp when);

/// Sorted, encoded "a=1&b=2"; a key with an empty value renders as "key="
std::string canonical_query(const QueryParams& params);

/**
 * @brief Authorization header value for a request
 *
 * `headers` maps lowercase names to values and must already contain host,
 * x-amz-date and x-amz-content-sha256. Every entry is signed.
 */
std::string authorization_header(const std::string& method,
                                 const std::string& path,
                                 const QueryParams& query,
                                 const std::map<std::string, std::string>& headers,
                                 const std::string& payload_hash,
                                 const Credentials& creds,
                                 Timestamp when);

/**
 * @brief Complete query string (including X-Amz-Signature) for a presigned request
 *
 * Only the host header is signed and the payload is UNSIGNED-PAYLOAD.
 */
std::string presigned_query(const std::string& method,
                            const std::string& host,
                            const std::string& path,
                            const Credentials& creds,
                            Timestamp when,
                            std::chrono::seconds expires);

} // namespace fmp::storage::sigv4
