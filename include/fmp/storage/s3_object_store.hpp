#pragma once

#include "fmp/storage/object_store.hpp"
#include "fmp/storage/sigv4.hpp"

#include <map>
#include <memory>

namespace fmp::storage {

struct S3Settings {
    std::string endpoint;   ///< "https://s3.eu-west-1.amazonaws.com", "http://127.0.0.1:9000"
    std::string bucket;
    sigv4::Credentials credentials;
    std::chrono::seconds timeout{30};
};

/**
 * @brief S3-compatible client over Boost.Beast
 *
 * Path-style addressing (/bucket/key) so MinIO and other self-hosted stores
 * work without wildcard DNS. One connection per call; the upload engine
 * already parallelises across sessions.
 */
class S3ObjectStore final : public ObjectStore {
public:
    S3ObjectStore(S3Settings settings, std::shared_ptr<const Clock> clock);

    Result<std::string> create_multipart_upload(const std::string& key,
                                                const std::string& content_type) override;

    Result<std::optional<std::string>> find_multipart_upload(const std::string& key) override;

    Result<std::string> upload_part(const std::string& key,
                                    const std::string& upload_id,
                                    std::uint32_t part_number,
                                    const std::vector<std::uint8_t>& bytes,
                                    const std::string& checksum_sha256) override;

    Result<std::vector<PartInfo>> list_parts(const std::string& key,
                                             const std::string& upload_id) override;

    Result<void> complete_multipart_upload(const std::string& key,
                                           const std::string& upload_id,
                                           const std::vector<CompletedPart>& parts) override;

    Result<void> abort_multipart_upload(const std::string& key,
                                        const std::string& upload_id) override;

    Result<bool> object_exists(const std::string& key) override;

    Result<void> delete_object(const std::string& key) override;

    Result<PresignedUrl> presign_get(const std::string& key, std::chrono::seconds ttl) override;

    struct Response {
        unsigned status = 0;
        std::map<std::string, std::string> headers;   // lowercase names
        std::string body;
    };

private:
    Result<Response> send(const std::string& method,
                          const std::string& path,
                          const sigv4::QueryParams& query,
                          std::map<std::string, std::string> headers,
                          const std::string& body,
                          const std::string& payload_hash);

    std::string object_path(const std::string& key) const;

    S3Settings settings_;
    std::shared_ptr<const Clock> clock_;

    bool tls_ = true;
    std::string host_;
    std::string port_;
    std::string host_header_;   // host[:port] as signed
};

namespace s3xml {

/// Text of the first <tag>...</tag>, entity-decoded
std::optional<std::string> element(const std::string& xml, const std::string& tag);

/// Raw inner text of every <tag>...</tag> block
std::vector<std::string> blocks(const std::string& xml, const std::string& tag);

std::string escape(const std::string& text);

} // namespace s3xml

} // namespace fmp::storage
