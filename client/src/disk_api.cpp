#include "yadrive/client/disk_api.hpp"

#include <utility>

namespace yadrive::client
{

    DiskApi::DiskApi(http::Client &transport, std::string endpoint, std::string authorization, Logger logger,
                     std::size_t chunk_size)
        : transport_(transport),
          endpoint_(std::move(endpoint)),
          authorization_(std::move(authorization)),
          logger_(std::move(logger)),
          chunk_size_(chunk_size)
    {
        while (!endpoint_.empty() && endpoint_.back() == '/')
        {
            endpoint_.pop_back();
        }
    }

    http::Response DiskApi::metadata(const std::string &path)
    {
        return send(http::Request{.method = http::Method::Get, .url = endpoint_, .query = {{"path", path}}}, true);
    }

    http::Response DiskApi::metadata_page(const std::string &path, std::size_t limit, std::size_t offset)
    {
        return send(http::Request{
                        .method = http::Method::Get,
                        .url = endpoint_,
                        .query = {{"path", path}, {"limit", std::to_string(limit)}, {"offset", std::to_string(offset)}},
                    },
                    true);
    }

    http::Response DiskApi::create_directory(const std::string &path)
    {
        return send(http::Request{.method = http::Method::Put, .url = endpoint_, .query = {{"path", path}}}, true);
    }

    http::Response DiskApi::remove(const std::string &path, bool permanently)
    {
        http::Request request{.method = http::Method::Delete, .url = endpoint_, .query = {{"path", path}}};
        if (permanently)
        {
            request.query.emplace_back("permanently", "true");
        }
        return send(std::move(request), true);
    }

    http::Response DiskApi::request_upload_url(const std::string &path)
    {
        return send(http::Request{.method = http::Method::Get, .url = endpoint_ + "/upload", .query = {{"path", path}}},
                    true);
    }

    http::Response DiskApi::upload_content(const std::string &href, std::istream &body, std::uint64_t size,
                                           http::UploadProgress on_upload)
    {
        return send(http::Request{
                        .method = http::Method::Put,
                        .url = href,
                        .body = &body,
                        .body_size = size,
                        .chunk_size = chunk_size_,
                        .on_upload = std::move(on_upload),
                    },
                    false);
    }

    http::Response DiskApi::upload_from_url(const std::string &path, const std::string &source_url)
    {
        return send(http::Request{
                        .method = http::Method::Post,
                        .url = endpoint_ + "/upload",
                        .query = {{"path", path}, {"url", source_url}},
                    },
                    true);
    }

    http::Response DiskApi::download(const std::string &link, http::DataSink sink)
    {
        return send(http::Request{
                        .method = http::Method::Get,
                        .url = link,
                        .chunk_size = chunk_size_,
                        .on_data = std::move(sink),
                    },
                    false);
    }

    Result<ExistenceState> DiskApi::probe(const std::string &path)
    {
        const auto response = metadata(path);
        if (response.ok())
        {
            return ExistenceState::Exists;
        }
        if (response.transport_ok() && response.status == 404)
        {
            return ExistenceState::NotFound;
        }
        return error_from_response(response, ErrorCode::TransferFailure);
    }

    http::Response DiskApi::send(http::Request request, bool authorize)
    {
        request.headers.push_back("Accept: application/json");
        if (authorize)
        {
            request.headers.push_back("Authorization: " + authorization_);
        }
        const auto path = http::query_value(request, "path").value_or(request.url);
        auto response = transport_.perform(request);
        if (!response.transport_ok())
        {
            logger_.log("http", http::to_string(request.method), ' ', path, " transport_error=", response.transport_error);
        }
        else
        {
            logger_.log("http", http::to_string(request.method), ' ', path, " status=", response.status);
        }
        return response;
    }

    std::optional<nlohmann::json> parse_body(const http::Response &response)
    {
        if (response.body.empty())
        {
            return std::nullopt;
        }
        auto json = nlohmann::json::parse(response.body, nullptr, false);
        if (json.is_discarded())
        {
            return std::nullopt;
        }
        return json;
    }

    Error error_from_response(const http::Response &response, ErrorCode kind)
    {
        if (!response.transport_ok())
        {
            return make_error(ErrorCode::TransportError, response.status, response.transport_error);
        }
        std::string message = response.body;
        if (const auto json = parse_body(response); json && json->is_object())
        {
            if (const auto it = json->find("message"); it != json->end() && it->is_string())
            {
                message = it->get<std::string>();
            }
            else if (const auto desc = json->find("description"); desc != json->end() && desc->is_string())
            {
                message = desc->get<std::string>();
            }
        }
        return make_error(kind, response.status, std::move(message));
    }

} // namespace yadrive::client
