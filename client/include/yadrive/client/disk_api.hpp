#pragma once

#include <cstddef>
#include <cstdint>
#include <istream>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "yadrive/client/logger.hpp"
#include "yadrive/http.hpp"
#include "yadrive/result.hpp"

namespace yadrive::client
{

    enum class ExistenceState : std::uint8_t
    {
        Exists,
        NotFound
    };

    // Typed wrappers for the resources endpoint. Statuses are returned untouched;
    // callers decide which ones are benign.
    class DiskApi
    {
    public:
        DiskApi(http::Client &transport, std::string endpoint, std::string authorization, Logger logger,
                std::size_t chunk_size = 64 * 1024);

        http::Response metadata(const std::string &path);
        http::Response metadata_page(const std::string &path, std::size_t limit, std::size_t offset);
        http::Response create_directory(const std::string &path);
        http::Response remove(const std::string &path, bool permanently);
        http::Response request_upload_url(const std::string &path);
        http::Response upload_content(const std::string &href, std::istream &body, std::uint64_t size,
                                      http::UploadProgress on_upload);
        http::Response upload_from_url(const std::string &path, const std::string &source_url);
        http::Response download(const std::string &link, http::DataSink sink);

        // Metadata query reduced to 200 -> Exists, 404 -> NotFound; anything else is an error.
        Result<ExistenceState> probe(const std::string &path);

        const std::string &endpoint() const noexcept { return endpoint_; }
        std::size_t chunk_size() const noexcept { return chunk_size_; }

    private:
        http::Response send(http::Request request, bool authorize);

        http::Client &transport_;
        std::string endpoint_;
        std::string authorization_;
        Logger logger_;
        std::size_t chunk_size_;
    };

    std::optional<nlohmann::json> parse_body(const http::Response &response);

    // Builds an Error from a non-success response, preferring the server's own message.
    Error error_from_response(const http::Response &response, ErrorCode kind);

} // namespace yadrive::client
